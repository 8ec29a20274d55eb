#include "application/ChangelogRenderer.hpp"
#include <iomanip>
#include <sstream>
#include "infrastructure/JsonCodec.hpp"

namespace chlog::application {

using namespace chlog::domain;

namespace {

const std::string kRule(60, '=');
const char* kNoChanges = "No unreleased changes\n";

std::string Trim(const std::string& line) {
    const char* ws = " \t\r\n";
    auto start = line.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = line.find_last_not_of(ws);
    return line.substr(start, end - start + 1);
}

} // namespace

std::optional<OutputFormat> OutputFormatFromString(const std::string& name) {
    if (name == "pretty") return OutputFormat::Pretty;
    if (name == "json") return OutputFormat::Json;
    if (name == "markdown") return OutputFormat::Markdown;
    return std::nullopt;
}

std::string ChangelogRenderer::RenderPending(const PendingChangeSet& changes, OutputFormat format) {
    switch (format) {
        case OutputFormat::Json: return ToStructured(changes);
        case OutputFormat::Markdown: return ToMarkdown(changes);
        case OutputFormat::Pretty:
        default: return ToPretty(changes);
    }
}

std::string ChangelogRenderer::ToPretty(const PendingChangeSet& changes) {
    if (changes.isEmpty()) return kNoChanges;

    std::stringstream ss;
    ss << kRule << "\n";
    ss << "UNRELEASED CHANGES (" << changes.getTotalChanges() << "):\n";
    ss << kRule << "\n";

    // Numbers are global indexes, the ones `remove --index` takes.
    std::size_t number = 1;
    for (ChangeCategory category : AllCategories()) {
        const auto& entries = changes.entriesOf(category);
        if (entries.empty()) continue;
        ss << "\n### " << CategoryTitle(category) << "\n";
        for (const auto& entry : entries) {
            ss << "  " << number++ << ". " << entry.description;
            if (entry.author) ss << " @" << *entry.author;
            ss << "\n";
        }
    }
    ss << kRule << "\n";
    return ss.str();
}

std::string ChangelogRenderer::ToMarkdown(const PendingChangeSet& changes) {
    if (changes.isEmpty()) return kNoChanges;

    std::stringstream ss;
    for (ChangeCategory category : AllCategories()) {
        const auto& entries = changes.entriesOf(category);
        if (entries.empty()) continue;
        ss << "### " << CategoryTitle(category) << "\n";
        for (const auto& entry : entries) {
            ss << "- " << entry.description;
            if (entry.author) ss << " (" << *entry.author << ")";
            ss << "\n";
        }
        ss << "\n";
    }
    return ss.str();
}

std::string ChangelogRenderer::ToStructured(const PendingChangeSet& changes) {
    return infrastructure::JsonCodec::PendingToJson(changes).dump(2) + "\n";
}

std::string ChangelogRenderer::RenderStats(const ChangeStats& stats) {
    if (stats.total == 0) return kNoChanges;

    const std::string rule(40, '-');
    std::stringstream ss;
    ss << "Unreleased changes statistics:\n" << rule << "\n";
    for (const auto& [category, count] : stats.perCategory) {
        ss << "  " << std::left << std::setw(12) << CategoryToString(category)
           << ": " << std::right << std::setw(3) << count << "\n";
    }
    ss << rule << "\n";
    ss << "  " << std::left << std::setw(12) << "Total" << ": " << std::right << std::setw(3) << stats.total << "\n";

    if (!stats.perAuthor.empty()) {
        ss << "\nAuthors:\n";
        for (const auto& [author, count] : stats.perAuthor) {
            ss << "  " << std::left << std::setw(20) << author
               << ": " << std::right << std::setw(3) << count << "\n";
        }
    }
    return ss.str();
}

std::string ChangelogRenderer::InitialDocument(const std::string& projectName) {
    std::stringstream ss;
    ss << "# Changelog - " << projectName << "\n\n";
    ss << "All notable changes to this project will be documented in this file.\n\n";
    ss << "The format is based on [Keep a Changelog](https://keepachangelog.com/),\n";
    ss << "and this project adheres to [Semantic Versioning](https://semver.org/).\n\n";
    ss << kUnreleasedMarker << "\n";
    return ss.str();
}

std::string ChangelogRenderer::FallbackDocument() {
    return std::string("# Changelog\n\n") + kUnreleasedMarker + "\n";
}

std::string ChangelogRenderer::ReleaseBlock(const std::string& version,
                                            const std::string& date,
                                            const std::string& notes,
                                            const PendingChangeSet::CategoryMap& changes) {
    std::stringstream ss;
    ss << "\n## [" << version << "] - " << date << "\n";
    if (!notes.empty()) {
        ss << "\n" << notes << "\n";
    }
    for (ChangeCategory category : AllCategories()) {
        auto it = changes.find(category);
        if (it == changes.end() || it->second.empty()) continue;
        ss << "\n### " << CategoryTitle(category) << "\n";
        for (const auto& entry : it->second) {
            ss << "- " << entry.description;
            if (entry.author) ss << " (" << *entry.author << ")";
            ss << "\n";
        }
    }
    return ss.str();
}

std::string ChangelogRenderer::InsertRelease(const std::string& document, const std::string& block) {
    std::size_t lineStart = 0;
    while (lineStart < document.size()) {
        std::size_t newline = document.find('\n', lineStart);
        std::size_t lineEnd = newline == std::string::npos ? document.size() : newline;

        if (Trim(document.substr(lineStart, lineEnd - lineStart)) == kUnreleasedMarker) {
            if (newline == std::string::npos) {
                return document + "\n" + block;
            }
            return document.substr(0, newline + 1) + block + document.substr(newline + 1);
        }
        if (newline == std::string::npos) break;
        lineStart = newline + 1;
    }

    std::string result = document;
    if (!result.empty() && result.back() != '\n') result += "\n";
    return result + block;
}

} // namespace chlog::application
