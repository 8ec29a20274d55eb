/**
 * @file ChangeCategory.hpp
 * @brief Value Object defining the fixed kinds of change a changelog tracks.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace chlog::domain {

/**
 * @enum ChangeCategory
 * @brief Closed set of change categories, declared in changelog order.
 */
enum class ChangeCategory {
    Added,      ///< New features.
    Changed,    ///< Changes in existing functionality.
    Deprecated, ///< Soon-to-be removed features.
    Removed,    ///< Features removed in this release.
    Fixed,      ///< Bug fixes.
    Security    ///< Vulnerability fixes.
};

/**
 * @brief All categories in the order they are rendered and indexed.
 */
inline const std::vector<ChangeCategory>& AllCategories() {
    static const std::vector<ChangeCategory> categories = {
        ChangeCategory::Added,
        ChangeCategory::Changed,
        ChangeCategory::Deprecated,
        ChangeCategory::Removed,
        ChangeCategory::Fixed,
        ChangeCategory::Security
    };
    return categories;
}

/**
 * @brief Storage key used in JSON files and on the command line.
 */
inline std::string CategoryToString(ChangeCategory category) {
    switch (category) {
        case ChangeCategory::Added: return "added";
        case ChangeCategory::Changed: return "changed";
        case ChangeCategory::Deprecated: return "deprecated";
        case ChangeCategory::Removed: return "removed";
        case ChangeCategory::Fixed: return "fixed";
        case ChangeCategory::Security: return "security";
        default: return "unknown";
    }
}

/**
 * @brief Parses a storage key. Matching is exact (lowercase).
 * @return The category, or nullopt for anything outside the closed set.
 */
inline std::optional<ChangeCategory> CategoryFromString(const std::string& key) {
    for (ChangeCategory category : AllCategories()) {
        if (CategoryToString(category) == key) return category;
    }
    return std::nullopt;
}

/**
 * @brief Capitalized name used for markdown section headings ("Added").
 */
inline std::string CategoryTitle(ChangeCategory category) {
    std::string title = CategoryToString(category);
    if (!title.empty()) {
        title[0] = static_cast<char>(title[0] - 'a' + 'A');
    }
    return title;
}

/**
 * @brief Comma-separated list of valid keys, for error messages.
 */
inline std::string CategoryList() {
    std::string list;
    for (ChangeCategory category : AllCategories()) {
        if (!list.empty()) list += ", ";
        list += CategoryToString(category);
    }
    return list;
}

} // namespace chlog::domain
