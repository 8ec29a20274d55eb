/**
 * @file ChangeEntry.hpp
 * @brief Domain entity representing a single recorded change.
 */

#pragma once

#include <string>
#include <optional>

namespace chlog::domain {

/**
 * @struct ChangeEntry
 * @brief One line of the changelog, waiting to be released.
 */
struct ChangeEntry {
    std::string id;                    ///< Unique id, derived from a microsecond timestamp.
    std::string description;           ///< What changed. Never empty.
    std::string timestamp;             ///< Creation instant (ISO-8601).
    std::optional<std::string> author; ///< Who made the change, if known.
    std::string status = "pending";    ///< Lifecycle status. Only "pending" exists today.
};

inline bool operator==(const ChangeEntry& lhs, const ChangeEntry& rhs) {
    return lhs.id == rhs.id && lhs.description == rhs.description &&
           lhs.timestamp == rhs.timestamp && lhs.author == rhs.author &&
           lhs.status == rhs.status;
}

} // namespace chlog::domain
