/**
 * @file ChangelogService.cpp
 * @brief Implementation of ChangelogService.
 */

#include "application/ChangelogService.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include "domain/ChangelogErrors.hpp"
#include "infrastructure/TimeUtils.hpp"

namespace chlog::application {

using namespace chlog::domain;
using infrastructure::TimeUtils;

ChangelogService::ChangelogService(std::shared_ptr<ChangelogRepository> repository,
                                   std::shared_ptr<infrastructure::ConfigStore> config)
    : m_repository(std::move(repository)), m_config(std::move(config)) {}

std::string ChangelogService::projectName() const {
    return m_config->config().project.name;
}

void ChangelogService::init(const std::optional<std::string>& name) {
    if (name && !name->empty()) {
        m_config->updateProject("name", *name);
    }
    m_repository->writeChangelog(ChangelogRenderer::InitialDocument(projectName()));
    m_repository->resetPending(projectName());
}

std::string ChangelogService::uniqueId(const PendingChangeSet& changes) {
    std::string base = TimeUtils::MakeChangeId(std::chrono::system_clock::now());
    std::string id = base;
    for (int n = 2; changes.containsId(id); ++n) {
        id = base + "_" + std::to_string(n);
    }
    return id;
}

ChangeEntry ChangelogService::add(const std::string& category,
                                  const std::string& description,
                                  const std::optional<std::string>& author) {
    auto parsed = CategoryFromString(category);
    if (!parsed) {
        throw InvalidCategoryError("Unsupported change type: " + category + " (valid types: " + CategoryList() + ")");
    }
    if (description.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw InvalidValueError("Change description must not be empty");
    }

    PendingChangeSet changes = m_repository->loadPending(projectName());

    ChangeEntry entry;
    entry.id = uniqueId(changes);
    entry.description = description;
    entry.timestamp = TimeUtils::NowIso();
    if (author && !author->empty()) entry.author = *author;

    ChangeEntry stored = changes.append(*parsed, std::move(entry));
    m_repository->savePending(changes);
    return stored;
}

PendingChangeSet ChangelogService::list() {
    return m_repository->loadPending(projectName());
}

RemovalResult ChangelogService::remove(const RemovalQuery& query, RemovalPrompt& prompt) {
    PendingChangeSet changes = m_repository->loadPending(projectName());

    RemovalResult result;
    result.candidates = ChangeSelector::Select(changes, query);
    if (result.candidates.empty()) {
        throw NoMatchError("No changes found to remove");
    }

    std::vector<ChangeCandidate> targets;
    if (result.candidates.size() == 1) {
        if (prompt.confirmSingle(result.candidates.front())) {
            targets = result.candidates;
        }
    } else {
        RemovalDecision decision = prompt.chooseMany(result.candidates);
        if (decision.kind == RemovalDecision::Kind::All) {
            targets = result.candidates;
        } else if (decision.kind == RemovalDecision::Kind::Subset) {
            for (std::size_t pick : decision.picks) {
                if (pick < result.candidates.size()) targets.push_back(result.candidates[pick]);
            }
        }
    }

    if (targets.empty()) {
        result.aborted = true;
        return result;
    }

    result.removed = changes.removeEntries(targets);
    m_repository->savePending(changes);
    return result;
}

ChangeStats ChangelogService::stats() {
    return ComputeStats(list());
}

ChangeStats ChangelogService::ComputeStats(const PendingChangeSet& changes) {
    ChangeStats stats;
    std::map<std::string, std::size_t> authors;
    for (ChangeCategory category : AllCategories()) {
        const auto& entries = changes.entriesOf(category);
        if (entries.empty()) continue;
        stats.perCategory.emplace_back(category, entries.size());
        stats.total += entries.size();
        for (const auto& entry : entries) {
            if (entry.author) authors[*entry.author]++;
        }
    }

    stats.perAuthor.assign(authors.begin(), authors.end());
    // Map order gives the name tie-break.
    std::stable_sort(stats.perAuthor.begin(), stats.perAuthor.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });
    return stats;
}

} // namespace chlog::application
