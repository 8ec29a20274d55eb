/**
 * @file ChangelogService.hpp
 * @brief Application Service for project bootstrap and the pending changes (add, list, remove, stats).
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/ChangelogRenderer.hpp"
#include "application/RemovalPrompt.hpp"
#include "domain/ChangeSelector.hpp"
#include "domain/ChangelogRepository.hpp"
#include "infrastructure/ConfigStore.hpp"

namespace chlog::application {

/**
 * @struct RemovalResult
 * @brief Outcome of a remove call that found candidates.
 */
struct RemovalResult {
    std::vector<domain::ChangeCandidate> candidates; ///< Everything the filters matched.
    std::size_t removed = 0;
    bool aborted = false; ///< The user declined; nothing was written.
};

class ChangelogService {
public:
    ChangelogService(std::shared_ptr<domain::ChangelogRepository> repository,
                     std::shared_ptr<infrastructure::ConfigStore> config);

    /**
     * @brief Writes the starting changelog document and an empty pending store.
     * @param projectName Stored as project.name when given.
     */
    void init(const std::optional<std::string>& projectName);

    /**
     * @brief Records a new pending change.
     * @throws domain::InvalidCategoryError for an unknown category.
     * @throws domain::InvalidValueError for an empty description.
     * @return The stored entry.
     */
    domain::ChangeEntry add(const std::string& category,
                            const std::string& description,
                            const std::optional<std::string>& author = std::nullopt);

    /** @brief The full pending document. Reinitializes a missing or corrupt store. */
    domain::PendingChangeSet list();

    /**
     * @brief Removes pending changes matching @p query after asking @p prompt.
     * @throws domain::NoMatchError when nothing matches.
     */
    RemovalResult remove(const domain::RemovalQuery& query, RemovalPrompt& prompt);

    /** @brief Per-category and per-author counts. */
    ChangeStats stats();

    /** @brief Computes stats over an already loaded document. */
    static ChangeStats ComputeStats(const domain::PendingChangeSet& changes);

private:
    std::string projectName() const;
    static std::string uniqueId(const domain::PendingChangeSet& changes);

    std::shared_ptr<domain::ChangelogRepository> m_repository;
    std::shared_ptr<infrastructure::ConfigStore> m_config;
};

} // namespace chlog::application
