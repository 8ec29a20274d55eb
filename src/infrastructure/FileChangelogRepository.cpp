/**
 * @file FileChangelogRepository.cpp
 * @brief Implementation of the FileChangelogRepository class.
 */
#include "infrastructure/FileChangelogRepository.hpp"
#include <iostream>
#include "domain/ChangelogErrors.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/JsonCodec.hpp"
#include "infrastructure/TimeUtils.hpp"

namespace fs = std::filesystem;

namespace chlog::infrastructure {

FileChangelogRepository::FileChangelogRepository(const ConfigStore& config)
    : FileChangelogRepository(config.resolvePath("changelog"),
                              config.resolvePath("unreleased"),
                              config.resolvePath("releases"),
                              config.configDir() / "backups",
                              config.config().settings.autoBackup) {}

FileChangelogRepository::FileChangelogRepository(const fs::path& changelogPath,
                                                 const fs::path& unreleasedPath,
                                                 const fs::path& releasesDir,
                                                 const fs::path& backupDir,
                                                 bool autoBackup)
    : m_changelogPath(changelogPath), m_unreleasedPath(unreleasedPath),
      m_releasesDir(releasesDir), m_backupDir(backupDir), m_autoBackup(autoBackup) {
    if (m_unreleasedPath.has_parent_path() && !fs::exists(m_unreleasedPath.parent_path())) {
        fs::create_directories(m_unreleasedPath.parent_path());
    }
    if (!fs::exists(m_releasesDir)) fs::create_directories(m_releasesDir);
}

domain::PendingChangeSet FileChangelogRepository::loadPending(const std::string& projectName) {
    if (!fs::exists(m_unreleasedPath)) {
        return resetPending(projectName);
    }

    try {
        return JsonCodec::PendingFromJson(JsonCodec::Parse(AtomicFileWriter::Read(m_unreleasedPath)));
    } catch (const domain::ConfigCorruptError& e) {
        std::cerr << "[FileChangelogRepository] Error reading " << m_unreleasedPath.string()
                  << " (" << e.what() << "), creating a new file" << std::endl;
        return resetPending(projectName);
    }
}

void FileChangelogRepository::savePending(domain::PendingChangeSet& changes) {
    changes.setLastModified(TimeUtils::NowIso());
    AtomicFileWriter::Write(m_unreleasedPath, JsonCodec::PendingToJson(changes).dump(2) + "\n");
}

domain::PendingChangeSet FileChangelogRepository::resetPending(const std::string& projectName) {
    auto empty = domain::PendingChangeSet::CreateEmpty(projectName, TimeUtils::NowIso());
    AtomicFileWriter::Write(m_unreleasedPath, JsonCodec::PendingToJson(empty).dump(2) + "\n");
    return empty;
}

fs::path FileChangelogRepository::releaseFile(const std::string& normalizedVersion) const {
    return m_releasesDir / ("release_" + normalizedVersion + ".json");
}

bool FileChangelogRepository::hasRelease(const std::string& normalizedVersion) {
    return fs::exists(releaseFile(normalizedVersion));
}

std::string FileChangelogRepository::saveRelease(const domain::ReleaseRecord& release) {
    fs::path outPath = releaseFile(domain::NormalizeVersion(release.version));
    AtomicFileWriter::Write(outPath, JsonCodec::ReleaseToJson(release).dump(2) + "\n");
    return outPath.string();
}

std::optional<std::string> FileChangelogRepository::readChangelog() {
    if (!fs::exists(m_changelogPath)) return std::nullopt;
    return AtomicFileWriter::Read(m_changelogPath);
}

void FileChangelogRepository::writeChangelog(const std::string& content) {
    if (m_autoBackup && fs::exists(m_changelogPath)) {
        backupChangelog();
    }
    AtomicFileWriter::Write(m_changelogPath, content);
}

void FileChangelogRepository::backupChangelog() {
    try {
        std::string stamp = TimeUtils::FormatNow("_%Y%m%d_%H%M%S");
        std::string backupName = m_changelogPath.stem().string() + stamp + m_changelogPath.extension().string();
        if (!fs::exists(m_backupDir)) fs::create_directories(m_backupDir);
        fs::copy_file(m_changelogPath, m_backupDir / backupName, fs::copy_options::overwrite_existing);
    } catch (const fs::filesystem_error& e) {
        // A failed backup does not block the rewrite.
        std::cerr << "[FileChangelogRepository] Backup failed: " << e.what() << std::endl;
    }
}

} // namespace chlog::infrastructure
