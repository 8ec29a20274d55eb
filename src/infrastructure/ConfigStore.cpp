/**
 * @file ConfigStore.cpp
 * @brief Implementation of ConfigStore.
 */

#include "infrastructure/ConfigStore.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include "domain/ChangelogErrors.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/JsonCodec.hpp"

namespace fs = std::filesystem;

namespace chlog::infrastructure {

using domain::InvalidValueError;
using domain::UnknownKeyError;

namespace {

std::string RootName(const fs::path& root) {
    std::string name = root.filename().string();
    if (name.empty() && root.has_parent_path()) {
        name = root.parent_path().filename().string();
    }
    return name.empty() ? std::string("project") : name;
}

std::string ValueToText(const SettingValue& value) {
    if (std::holds_alternative<bool>(value)) return std::get<bool>(value) ? "true" : "false";
    if (std::holds_alternative<long long>(value)) return std::to_string(std::get<long long>(value));
    return std::get<std::string>(value);
}

} // namespace

ConfigStore::ConfigStore(fs::path projectRoot)
    : m_projectRoot(fs::absolute(projectRoot).lexically_normal()) {
    if (!fs::exists(configDir())) fs::create_directories(configDir());
    load();
}

void ConfigStore::load() {
    const auto defaults = domain::ProjectConfig::Defaults(RootName(m_projectRoot));
    if (!fs::exists(configFile())) {
        resetToDefaults();
        return;
    }

    try {
        m_config = JsonCodec::ConfigFromJson(JsonCodec::Parse(AtomicFileWriter::Read(configFile())), defaults);
    } catch (const domain::ConfigCorruptError& e) {
        std::cerr << "[ConfigStore] Error reading " << configFile().string() << " (" << e.what()
                  << "), resetting to defaults" << std::endl;
        resetToDefaults();
    }
}

void ConfigStore::resetToDefaults() {
    m_config = domain::ProjectConfig::Defaults(RootName(m_projectRoot));
    save();
}

void ConfigStore::save() const {
    AtomicFileWriter::Write(configFile(), JsonCodec::ConfigToJson(m_config).dump(2) + "\n");
}

fs::path ConfigStore::resolvePath(const std::string& key) const {
    if (key == "changelog") return m_projectRoot / m_config.paths.changelog;
    if (key == "unreleased") return m_projectRoot / m_config.paths.unreleased;
    if (key == "releases") return m_projectRoot / m_config.paths.releases;
    throw UnknownKeyError("Unknown path key: " + key);
}

void ConfigStore::updatePath(const std::string& key, const std::string& relativePath) {
    if (key == "changelog") m_config.paths.changelog = relativePath;
    else if (key == "unreleased") m_config.paths.unreleased = relativePath;
    else if (key == "releases") m_config.paths.releases = relativePath;
    else throw UnknownKeyError("Unknown path key: " + key);
    save();
}

void ConfigStore::updateSetting(const std::string& key, const SettingValue& value) {
    auto& settings = m_config.settings;
    if (key == "auto_backup" || key == "git_integration") {
        if (!std::holds_alternative<bool>(value)) {
            throw InvalidValueError("Setting " + key + " expects true or false, got '" + ValueToText(value) + "'");
        }
        (key == "auto_backup" ? settings.autoBackup : settings.gitIntegration) = std::get<bool>(value);
    } else if (key == "date_format") {
        settings.dateFormat = ValueToText(value);
    } else if (key == "time_format") {
        settings.timeFormat = ValueToText(value);
    } else {
        throw UnknownKeyError("Unknown setting: " + key);
    }
    save();
}

void ConfigStore::updateProject(const std::string& key, const std::string& value) {
    auto& project = m_config.project;
    if (key == "name") project.name = value;
    else if (key == "version") project.version = value;
    else if (key == "author") project.author = value;
    else if (key == "license") project.license = value;
    else throw UnknownKeyError("Unknown project field: " + key);
    save();
}

std::string ConfigStore::update(const std::string& dottedKey, const std::string& rawValue) {
    std::string section = "project";
    std::string key = dottedKey;
    auto dot = dottedKey.find('.');
    if (dot != std::string::npos) {
        section = dottedKey.substr(0, dot);
        key = dottedKey.substr(dot + 1);
    }

    if (section == "paths") {
        updatePath(key, rawValue);
        return rawValue;
    }
    if (section == "settings") {
        SettingValue value = CoerceSettingValue(rawValue);
        updateSetting(key, value);
        return ValueToText(value);
    }
    if (section == "project") {
        updateProject(key, rawValue);
        return rawValue;
    }
    throw UnknownKeyError("Unknown section: " + section);
}

SettingValue ConfigStore::CoerceSettingValue(const std::string& rawValue) {
    std::string lower = rawValue;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return std::tolower(c); });
    if (lower == "true") return true;
    if (lower == "false") return false;

    bool allDigits = !rawValue.empty() && rawValue.size() <= 18 &&
        std::all_of(rawValue.begin(), rawValue.end(), [](unsigned char c){ return std::isdigit(c); });
    if (allDigits) return std::stoll(rawValue);
    return rawValue;
}

fs::path ConfigStore::DiscoverProjectRoot(const fs::path& start) {
    fs::path current = fs::absolute(start).lexically_normal();
    while (true) {
        std::error_code ec;
        if (fs::exists(current / ".changelog" / "config.json", ec)) {
            return current;
        }
        if (!current.has_parent_path() || current.parent_path() == current) break;
        current = current.parent_path();
    }
    return fs::absolute(start).lexically_normal();
}

fs::path ConfigStore::RootFromConfigArgument(const fs::path& argument) {
    fs::path path = fs::absolute(argument).lexically_normal();
    if (fs::is_directory(path)) {
        return path;
    }
    fs::path parent = path.parent_path();
    if (parent.filename() == ".changelog") {
        return parent.parent_path();
    }
    return parent;
}

} // namespace chlog::infrastructure
