/**
 * @file ReleaseService.cpp
 * @brief Implementation of ReleaseService.
 */

#include "application/ReleaseService.hpp"
#include <iostream>
#include "application/ChangelogRenderer.hpp"
#include "domain/ChangelogErrors.hpp"
#include "domain/ReleaseRecord.hpp"
#include "infrastructure/TimeUtils.hpp"

namespace chlog::application {

using namespace chlog::domain;
using infrastructure::TimeUtils;

ReleaseService::ReleaseService(std::shared_ptr<ChangelogRepository> repository,
                               std::shared_ptr<infrastructure::ConfigStore> config,
                               std::shared_ptr<VcsTagger> tagger)
    : m_repository(std::move(repository)), m_config(std::move(config)), m_tagger(std::move(tagger)) {}

ReleaseSummary ReleaseService::release(const std::string& version, const std::string& notes, bool tagVcs) {
    if (version.empty() || NormalizeVersion(version).empty()) {
        throw InvalidValueError("Release version must not be empty");
    }
    // The version names the release record file.
    const std::string fileVersion = NormalizeVersion(version);
    if (version.find_first_of("/\\") != std::string::npos || fileVersion == "." || fileVersion == "..") {
        throw InvalidValueError("Invalid release version: " + version);
    }

    const auto& settings = m_config->config().settings;
    const std::string projectName = m_config->config().project.name;
    const std::string cleanVersion = NormalizeVersion(version);

    PendingChangeSet pending = m_repository->loadPending(projectName);
    if (pending.isEmpty()) {
        throw NoPendingChangesError("No unreleased changes to release. Use: chlog add <type> <description>");
    }
    if (m_repository->hasRelease(cleanVersion)) {
        throw ReleaseExistsError("Release " + version + " is already recorded; the pending changes were left untouched");
    }

    ReleaseRecord record;
    record.version = version;
    record.date = TimeUtils::FormatNow(settings.dateFormat);
    record.timestamp = TimeUtils::NowIso();
    record.releaseNotes = notes;
    record.changes = pending.getChanges();
    record.totalChanges = pending.getTotalChanges();

    ReleaseSummary summary;
    summary.version = version;
    summary.date = record.date;
    summary.time = TimeUtils::FormatNow(settings.timeFormat);
    summary.totalChanges = record.totalChanges;
    summary.releaseFile = m_repository->saveRelease(record);

    std::string document = m_repository->readChangelog().value_or(ChangelogRenderer::FallbackDocument());
    std::string block = ChangelogRenderer::ReleaseBlock(version, record.date, notes, record.changes);
    m_repository->writeChangelog(ChangelogRenderer::InsertRelease(document, block));

    m_repository->resetPending(projectName);
    m_config->updateProject("version", cleanVersion);

    if (tagVcs || settings.gitIntegration) {
        std::string message = "Release " + version;
        if (!notes.empty()) message += ": " + notes;
        try {
            if (!m_tagger) throw VcsTagError("no version control integration configured");
            m_tagger->createTag(version, message);
            summary.tagged = true;
        } catch (const VcsTagError& e) {
            std::cerr << "[ReleaseService] Tagging " << version << " failed: " << e.what() << std::endl;
            summary.warning = std::string("Could not create git tag: ") + e.what();
        }
    }

    return summary;
}

} // namespace chlog::application
