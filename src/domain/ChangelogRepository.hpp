/**
 * @file ChangelogRepository.hpp
 * @brief Interface for persistence of pending changes, release records and the changelog document.
 */

#pragma once

#include <optional>
#include <string>
#include "PendingChangeSet.hpp"
#include "ReleaseRecord.hpp"

namespace chlog::domain {

/**
 * @class ChangelogRepository
 * @brief Abstract interface for the three persistent artifacts of a project.
 */
class ChangelogRepository {
public:
    virtual ~ChangelogRepository() = default;

    /**
     * @brief Loads the pending change set.
     *
     * A missing or corrupt file is replaced by an empty document, which is
     * persisted before being returned.
     * @param projectName Name stored in a reinitialized document.
     */
    virtual PendingChangeSet loadPending(const std::string& projectName) = 0;

    /**
     * @brief Overwrites the pending store. Refreshes last_modified on @p changes.
     */
    virtual void savePending(PendingChangeSet& changes) = 0;

    /**
     * @brief Replaces the pending store with an empty document.
     * @return The document that was written.
     */
    virtual PendingChangeSet resetPending(const std::string& projectName) = 0;

    /**
     * @brief Checks whether a release record exists for a normalized version.
     */
    virtual bool hasRelease(const std::string& normalizedVersion) = 0;

    /**
     * @brief Writes a new release record.
     * @return Location of the written record.
     */
    virtual std::string saveRelease(const ReleaseRecord& release) = 0;

    /** @brief Reads the changelog document, if it exists. */
    virtual std::optional<std::string> readChangelog() = 0;

    /** @brief Overwrites the changelog document. */
    virtual void writeChangelog(const std::string& content) = 0;

    /** @brief Location of the changelog document, for messages. */
    virtual std::string changelogLocation() const = 0;

    /** @brief Location of the pending store, for messages. */
    virtual std::string pendingLocation() const = 0;
};

} // namespace chlog::domain
