/**
 * @file ReleaseService.hpp
 * @brief Application Service that turns the pending changes into a release.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "domain/ChangelogRepository.hpp"
#include "domain/VcsTagger.hpp"
#include "infrastructure/ConfigStore.hpp"

namespace chlog::application {

/**
 * @struct ReleaseSummary
 * @brief What a successful release produced.
 */
struct ReleaseSummary {
    std::string version;      ///< As supplied.
    std::string date;
    std::string time;         ///< Formatted with settings.time_format.
    std::size_t totalChanges = 0;
    std::string releaseFile;  ///< Location of the release record.
    bool tagged = false;      ///< A version-control tag was created.
    std::optional<std::string> warning; ///< Set when tagging was requested but failed.
};

/**
 * @class ReleaseService
 * @brief Freezes pending changes into a release record and the changelog document.
 */
class ReleaseService {
public:
    /**
     * @param tagger May be null; tagging requests then produce a warning.
     */
    ReleaseService(std::shared_ptr<domain::ChangelogRepository> repository,
                   std::shared_ptr<infrastructure::ConfigStore> config,
                   std::shared_ptr<domain::VcsTagger> tagger);

    /**
     * @brief Releases every pending change under @p version.
     *
     * Writes the release record, inserts the section into the changelog,
     * empties the pending store and records the version in the config.
     * Tagging runs when @p tagVcs is set or git_integration is on; its
     * failure only produces a warning.
     *
     * @throws domain::NoPendingChangesError if nothing is pending (nothing written).
     * @throws domain::ReleaseExistsError if the version was already released (nothing written).
     */
    ReleaseSummary release(const std::string& version, const std::string& notes = "", bool tagVcs = false);

private:
    std::shared_ptr<domain::ChangelogRepository> m_repository;
    std::shared_ptr<infrastructure::ConfigStore> m_config;
    std::shared_ptr<domain::VcsTagger> m_tagger;
};

} // namespace chlog::application
