/**
 * @file FileChangelogRepository.hpp
 * @brief Filesystem-based implementation of the ChangelogRepository.
 */

#pragma once
#include "domain/ChangelogRepository.hpp"
#include "infrastructure/ConfigStore.hpp"
#include <filesystem>
#include <string>

namespace chlog::infrastructure {

/**
 * @class FileChangelogRepository
 * @brief Stores pending changes and release records as JSON and the changelog as markdown.
 */
class FileChangelogRepository : public domain::ChangelogRepository {
public:
    /**
     * @brief Resolves every location from the project configuration.
     * @param config Source of paths and of the auto_backup flag.
     */
    explicit FileChangelogRepository(const ConfigStore& config);

    /**
     * @param changelogPath Markdown document (CHANGELOG.md).
     * @param unreleasedPath Pending store (unreleased.json).
     * @param releasesDir Directory for release_<version>.json files.
     * @param backupDir Directory for timestamped changelog copies.
     * @param autoBackup Copy the changelog into @p backupDir before each rewrite.
     */
    FileChangelogRepository(const std::filesystem::path& changelogPath,
                            const std::filesystem::path& unreleasedPath,
                            const std::filesystem::path& releasesDir,
                            const std::filesystem::path& backupDir,
                            bool autoBackup);

    /** @brief Self-healing read. @see domain::ChangelogRepository::loadPending */
    domain::PendingChangeSet loadPending(const std::string& projectName) override;

    /** @see domain::ChangelogRepository::savePending */
    void savePending(domain::PendingChangeSet& changes) override;

    /** @see domain::ChangelogRepository::resetPending */
    domain::PendingChangeSet resetPending(const std::string& projectName) override;

    /** @brief Looks for release_<version>.json. @see domain::ChangelogRepository::hasRelease */
    bool hasRelease(const std::string& normalizedVersion) override;

    /** @brief Writes release_<version>.json. @see domain::ChangelogRepository::saveRelease */
    std::string saveRelease(const domain::ReleaseRecord& release) override;

    /** @see domain::ChangelogRepository::readChangelog */
    std::optional<std::string> readChangelog() override;

    /** @brief Backs up the previous document when enabled, then overwrites it. */
    void writeChangelog(const std::string& content) override;

    std::string changelogLocation() const override { return m_changelogPath.string(); }
    std::string pendingLocation() const override { return m_unreleasedPath.string(); }

    /** @brief Path of the record file for a normalized version. */
    std::filesystem::path releaseFile(const std::string& normalizedVersion) const;

private:
    void backupChangelog();

    std::filesystem::path m_changelogPath;  ///< Markdown document.
    std::filesystem::path m_unreleasedPath; ///< Pending store.
    std::filesystem::path m_releasesDir;    ///< Release records.
    std::filesystem::path m_backupDir;      ///< Changelog backups.
    bool m_autoBackup;
};

} // namespace chlog::infrastructure
