/**
 * @file ReleaseRecord.hpp
 * @brief Immutable snapshot of the changes shipped in one release.
 */

#pragma once

#include <string>
#include "PendingChangeSet.hpp"

namespace chlog::domain {

/**
 * @struct ReleaseRecord
 * @brief Written once per release and never modified afterwards.
 */
struct ReleaseRecord {
    std::string version;      ///< Display form, as supplied ("v2.0.0" keeps its prefix).
    std::string date;         ///< Calendar date, formatted with settings.date_format.
    std::string timestamp;    ///< Release instant (ISO-8601).
    std::string releaseNotes; ///< Free text, possibly empty.
    PendingChangeSet::CategoryMap changes; ///< Deep copy of the pending changes.
    std::size_t totalChanges = 0;
};

/**
 * @brief Strips a single leading 'v' for use in file names.
 */
inline std::string NormalizeVersion(const std::string& version) {
    if (!version.empty() && version[0] == 'v') {
        return version.substr(1);
    }
    return version;
}

} // namespace chlog::domain
