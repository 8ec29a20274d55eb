/**
 * @file ConfigStore.hpp
 * @brief Loads, creates and updates the project configuration (.changelog/config.json).
 */

#pragma once

#include <filesystem>
#include <string>
#include <variant>
#include "domain/ProjectConfig.hpp"

namespace chlog::infrastructure {

/// Typed value for a settings update, after command-line coercion.
using SettingValue = std::variant<bool, long long, std::string>;

/**
 * @class ConfigStore
 * @brief Owns the single configuration file of a project root.
 *
 * The file is created with defaults on first access. A corrupt file is
 * treated like a missing one and overwritten with defaults.
 */
class ConfigStore {
public:
    /**
     * @brief Opens (and if needed creates) the configuration of @p projectRoot.
     */
    explicit ConfigStore(std::filesystem::path projectRoot);

    const domain::ProjectConfig& config() const { return m_config; }
    const std::filesystem::path& projectRoot() const { return m_projectRoot; }
    std::filesystem::path configDir() const { return m_projectRoot / ".changelog"; }
    std::filesystem::path configFile() const { return configDir() / "config.json"; }

    /** @brief Re-reads the file; falls back to defaults on missing or corrupt files. */
    void load();

    /** @brief Writes the whole record back. */
    void save() const;

    /**
     * @brief Absolute path for "changelog", "unreleased" or "releases".
     * @throws domain::UnknownKeyError for any other key.
     */
    std::filesystem::path resolvePath(const std::string& key) const;

    /** @throws domain::UnknownKeyError if @p key is not a path key. */
    void updatePath(const std::string& key, const std::string& relativePath);

    /**
     * @throws domain::UnknownKeyError if @p key is not a setting.
     * @throws domain::InvalidValueError if the value type does not fit the setting.
     */
    void updateSetting(const std::string& key, const SettingValue& value);

    /** @throws domain::UnknownKeyError if @p key is not a project field. */
    void updateProject(const std::string& key, const std::string& value);

    /**
     * @brief Applies "section.key = value" from the command line.
     *
     * A key without a dot addresses the project section. Settings values
     * "true"/"false" (any case) become booleans and all-digit values integers.
     * @return The value as stored, for display.
     */
    std::string update(const std::string& dottedKey, const std::string& rawValue);

    /** @brief Command-line coercion used by update(). */
    static SettingValue CoerceSettingValue(const std::string& rawValue);

    /**
     * @brief Walks up from @p start to the first directory holding .changelog/config.json.
     * @return That directory, or @p start if none is found.
     */
    static std::filesystem::path DiscoverProjectRoot(const std::filesystem::path& start);

    /**
     * @brief Maps the --config argument to a project root.
     *
     * A directory is the root itself; ".../<root>/.changelog/config.json"
     * yields <root>; any other file yields its parent directory.
     */
    static std::filesystem::path RootFromConfigArgument(const std::filesystem::path& argument);

private:
    void resetToDefaults();

    std::filesystem::path m_projectRoot;
    domain::ProjectConfig m_config;
};

} // namespace chlog::infrastructure
