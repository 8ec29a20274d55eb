#undef NDEBUG
#include <cassert>
#include <iostream>

#include "application/ChangelogRenderer.hpp"
#include "application/ChangelogService.hpp"
#include "infrastructure/JsonCodec.hpp"

using namespace chlog::application;
using namespace chlog::domain;

namespace {

ChangeEntry Entry(const std::string& id, const std::string& description, const std::string& author = "") {
    ChangeEntry entry;
    entry.id = id;
    entry.description = description;
    entry.timestamp = "2026-01-01T10:00:00.000000";
    if (!author.empty()) entry.author = author;
    return entry;
}

std::size_t Count(const std::string& text, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) ++count;
    return count;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ChangelogRenderer Test..." << std::endl;

    auto set = PendingChangeSet::CreateEmpty("demo", "t0");
    set.append(ChangeCategory::Fixed, Entry("3", "Fix crash on startup", "Ana"));
    set.append(ChangeCategory::Added, Entry("1", "Dark mode"));
    set.append(ChangeCategory::Added, Entry("2", "Export to PDF", "Bo"));

    // Release block layout
    std::string block = ChangelogRenderer::ReleaseBlock("1.2.0", "2026-10-19", "First stable", set.getChanges());
    assert(block ==
        "\n## [1.2.0] - 2026-10-19\n"
        "\nFirst stable\n"
        "\n### Added\n"
        "- Dark mode\n"
        "- Export to PDF (Bo)\n"
        "\n### Fixed\n"
        "- Fix crash on startup (Ana)\n");

    std::string noNotes = ChangelogRenderer::ReleaseBlock("v2.0.0", "2026-10-19", "", set.getChanges());
    assert(noNotes.rfind("\n## [v2.0.0] - 2026-10-19\n\n### Added\n", 0) == 0);

    // Insertion right below the Unreleased marker, above older releases
    std::string document = ChangelogRenderer::InitialDocument("demo");
    assert(Count(document, "## [Unreleased]") == 1);
    assert(document.find("# Changelog - demo\n") == 0);

    std::string first = ChangelogRenderer::InsertRelease(document,
        ChangelogRenderer::ReleaseBlock("1.0.0", "2026-01-01", "", set.getChanges()));
    std::string second = ChangelogRenderer::InsertRelease(first, block);
    auto unreleased = second.find("## [Unreleased]\n");
    auto newer = second.find("## [1.2.0]");
    auto older = second.find("## [1.0.0]");
    assert(unreleased != std::string::npos && unreleased < newer && newer < older);
    assert(second.find("## [", unreleased + 1) == newer);
    assert(Count(second, "## [Unreleased]") == 1);
    assert(second.substr(0, unreleased) == document.substr(0, unreleased));

    // Only the first marker is used; marker with trailing spaces still matches
    std::string twice = "## [Unreleased]  \nnotes\n## [Unreleased]\n";
    std::string inserted = ChangelogRenderer::InsertRelease(twice, "\n## [X]\n");
    assert(inserted == "## [Unreleased]  \n\n## [X]\nnotes\n## [Unreleased]\n");

    // Marker on the last line without newline
    assert(ChangelogRenderer::InsertRelease("## [Unreleased]", "\n## [X]\n") == "## [Unreleased]\n\n## [X]\n");

    // No marker: append
    assert(ChangelogRenderer::InsertRelease("# Notes\nplain text", "\n## [X]\n") == "# Notes\nplain text\n\n## [X]\n");
    assert(ChangelogRenderer::InsertRelease("", "\n## [X]\n") == "\n## [X]\n");

    // Markdown view
    std::string markdown = ChangelogRenderer::ToMarkdown(set);
    assert(markdown ==
        "### Added\n"
        "- Dark mode\n"
        "- Export to PDF (Bo)\n"
        "\n"
        "### Fixed\n"
        "- Fix crash on startup (Ana)\n"
        "\n");

    // Pretty view numbers entries globally
    std::string pretty = ChangelogRenderer::ToPretty(set);
    assert(pretty.find("UNRELEASED CHANGES (3):") != std::string::npos);
    assert(pretty.find("  1. Dark mode\n") != std::string::npos);
    assert(pretty.find("  2. Export to PDF @Bo\n") != std::string::npos);
    assert(pretty.find("  3. Fix crash on startup @Ana\n") != std::string::npos);
    assert(pretty.find("### Deprecated") == std::string::npos);

    auto empty = PendingChangeSet::CreateEmpty("demo", "t0");
    assert(ChangelogRenderer::ToPretty(empty) == "No unreleased changes\n");
    assert(ChangelogRenderer::ToMarkdown(empty) == "No unreleased changes\n");

    // Structured view is the stored document
    auto parsed = chlog::infrastructure::json::parse(ChangelogRenderer::RenderPending(set, OutputFormat::Json));
    assert(parsed["project"] == "demo");
    assert(parsed["metadata"]["total_changes"] == 3);
    assert(parsed["changes"]["fixed"][0]["author"] == "Ana");
    assert(parsed["changes"]["added"][0]["author"].is_null());

    assert(OutputFormatFromString("markdown") == OutputFormat::Markdown);
    assert(!OutputFormatFromString("xml"));

    // Stats
    set.append(ChangeCategory::Security, Entry("4", "Patch CVE", "Bo"));
    auto stats = ChangelogService::ComputeStats(set);
    assert(stats.total == 4);
    assert(stats.perCategory.size() == 3);
    assert(stats.perCategory[0].first == ChangeCategory::Added && stats.perCategory[0].second == 2);
    assert(stats.perAuthor.size() == 2);
    assert(stats.perAuthor[0].first == "Bo" && stats.perAuthor[0].second == 2);
    assert(stats.perAuthor[1].first == "Ana" && stats.perAuthor[1].second == 1);

    std::string statsText = ChangelogRenderer::RenderStats(stats);
    assert(statsText.find("added") != std::string::npos);
    assert(statsText.find("deprecated") == std::string::npos);
    assert(statsText.find("Authors:") != std::string::npos);
    assert(ChangelogRenderer::RenderStats(ChangeStats{}) == "No unreleased changes\n");

    std::cout << "[PASS] ChangelogRenderer Test." << std::endl;
    return 0;
}
