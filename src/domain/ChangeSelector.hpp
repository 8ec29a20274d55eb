/**
 * @file ChangeSelector.hpp
 * @brief Pure selection logic for removing pending changes.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "PendingChangeSet.hpp"

namespace chlog::domain {

/**
 * @struct RemovalQuery
 * @brief Filters for picking entries to remove. Every filter given must agree.
 */
struct RemovalQuery {
    std::optional<ChangeCategory> category; ///< Restrict to one category.
    std::optional<std::string> pattern;     ///< Case-insensitive substring of the description.
    std::optional<long long> index;         ///< 1-based global index.
};

/**
 * @class ChangeSelector
 * @brief Resolves removal filters against a pending change set.
 */
class ChangeSelector {
public:
    /**
     * @brief Returns the entries matching the query, in global order.
     */
    static std::vector<ChangeCandidate> Select(const PendingChangeSet& changes, const RemovalQuery& query);

    /**
     * @brief Parses a hand-picked list such as "1, 3" into 0-based candidate positions.
     *
     * Tokens that are not numbers or fall outside [1, count] are skipped.
     * Duplicates are dropped; the result is sorted.
     */
    static std::vector<std::size_t> ParsePicks(const std::string& input, std::size_t count);

    /** @brief Lowercase copy (ASCII). */
    static std::string ToLower(const std::string& text);
};

} // namespace chlog::domain
