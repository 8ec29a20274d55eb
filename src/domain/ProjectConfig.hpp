/**
 * @file ProjectConfig.hpp
 * @brief Project-scoped settings record (config.json).
 */

#pragma once

#include <string>

namespace chlog::domain {

/**
 * @struct ProjectConfig
 * @brief Project metadata, relative file locations and behavioral flags.
 */
struct ProjectConfig {
    struct Project {
        std::string name;
        std::string version = "0.0.0";
        std::string author;
        std::string license = "MIT";
    };

    /// Paths relative to the project root.
    struct Paths {
        std::string changelog = "CHANGELOG.md";
        std::string unreleased = ".changelog/unreleased.json";
        std::string releases = ".changelog/releases";
    };

    struct Settings {
        bool autoBackup = true;             ///< Copy CHANGELOG.md aside before rewriting it.
        std::string dateFormat = "%Y-%m-%d"; ///< strftime format for release dates.
        std::string timeFormat = "%H:%M:%S"; ///< strftime format for console timestamps.
        bool gitIntegration = false;        ///< Tag every release, even without --tag.
    };

    Project project;
    Paths paths;
    Settings settings;

    /** @brief Default record for a project called @p name. */
    static ProjectConfig Defaults(const std::string& name) {
        ProjectConfig config;
        config.project.name = name;
        return config;
    }
};

} // namespace chlog::domain
