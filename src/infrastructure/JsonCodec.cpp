/**
 * @file JsonCodec.cpp
 * @brief Implementation of JsonCodec.
 */

#include "infrastructure/JsonCodec.hpp"
#include <iostream>
#include "domain/ChangelogErrors.hpp"

namespace chlog::infrastructure {

using namespace chlog::domain;

namespace {

PendingChangeSet::CategoryMap ChangesFromJson(const json& j, std::size_t* total) {
    if (!j.is_object()) {
        throw ConfigCorruptError("'changes' must be an object");
    }
    PendingChangeSet::CategoryMap changes;
    std::size_t count = 0;
    for (auto it = j.begin(); it != j.end(); ++it) {
        auto category = CategoryFromString(it.key());
        if (!category) {
            std::cerr << "[JsonCodec] Ignoring unknown category '" << it.key() << "'" << std::endl;
            continue;
        }
        if (!it.value().is_array()) {
            throw ConfigCorruptError("Category '" + it.key() + "' must be a list");
        }
        auto& list = changes[*category];
        for (const auto& item : it.value()) {
            list.push_back(JsonCodec::EntryFromJson(item));
            ++count;
        }
    }
    if (total) *total = count;
    return changes;
}

} // namespace

json JsonCodec::EntryToJson(const ChangeEntry& entry) {
    json j;
    j["id"] = entry.id;
    j["description"] = entry.description;
    j["timestamp"] = entry.timestamp;
    j["author"] = entry.author ? json(*entry.author) : json(nullptr);
    j["status"] = entry.status;
    return j;
}

ChangeEntry JsonCodec::EntryFromJson(const json& j) {
    try {
        ChangeEntry entry;
        entry.id = j.at("id").get<std::string>();
        entry.description = j.at("description").get<std::string>();
        entry.timestamp = j.value("timestamp", "");
        if (j.contains("author") && j["author"].is_string() && !j["author"].get<std::string>().empty()) {
            entry.author = j["author"].get<std::string>();
        }
        entry.status = j.value("status", "pending");
        return entry;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigCorruptError(std::string("Malformed change entry: ") + e.what());
    }
}

json JsonCodec::ChangesToJson(const PendingChangeSet::CategoryMap& changes) {
    json j = json::object();
    for (ChangeCategory category : AllCategories()) {
        auto it = changes.find(category);
        if (it == changes.end()) continue;
        json list = json::array();
        for (const auto& entry : it->second) {
            list.push_back(EntryToJson(entry));
        }
        j[CategoryToString(category)] = list;
    }
    return j;
}

json JsonCodec::PendingToJson(const PendingChangeSet& changes) {
    json j;
    j["project"] = changes.getProject();
    j["created"] = changes.getCreated();
    j["last_modified"] = changes.getLastModified();
    j["changes"] = ChangesToJson(changes.getChanges());
    j["metadata"] = {{"total_changes", changes.getTotalChanges()}};
    return j;
}

PendingChangeSet JsonCodec::PendingFromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigCorruptError("Pending store is not a JSON object");
    }
    try {
        PendingChangeSet set;
        set.setProject(j.value("project", ""));
        set.setCreated(j.value("created", ""));
        set.setLastModified(j.value("last_modified", ""));

        // metadata.total_changes is derived; the stored value is not trusted.
        auto changes = ChangesFromJson(j.at("changes"), nullptr);
        for (auto& [category, entries] : changes) {
            set.declareCategory(category);
            for (auto& entry : entries) {
                set.append(category, std::move(entry));
            }
        }
        return set;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigCorruptError(std::string("Malformed pending store: ") + e.what());
    }
}

json JsonCodec::ReleaseToJson(const ReleaseRecord& release) {
    json j;
    j["version"] = release.version;
    j["date"] = release.date;
    j["timestamp"] = release.timestamp;
    j["release_notes"] = release.releaseNotes;
    j["changes"] = ChangesToJson(release.changes);
    j["metadata"] = {{"total_changes", release.totalChanges}};
    return j;
}

ReleaseRecord JsonCodec::ReleaseFromJson(const json& j) {
    try {
        ReleaseRecord release;
        release.version = j.at("version").get<std::string>();
        release.date = j.value("date", "");
        release.timestamp = j.value("timestamp", "");
        release.releaseNotes = j.value("release_notes", "");
        release.changes = ChangesFromJson(j.at("changes"), &release.totalChanges);
        return release;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigCorruptError(std::string("Malformed release record: ") + e.what());
    }
}

json JsonCodec::ConfigToJson(const ProjectConfig& config) {
    json j;
    j["project"] = {
        {"name", config.project.name},
        {"version", config.project.version},
        {"author", config.project.author},
        {"license", config.project.license}
    };
    j["paths"] = {
        {"changelog", config.paths.changelog},
        {"unreleased", config.paths.unreleased},
        {"releases", config.paths.releases}
    };
    j["settings"] = {
        {"auto_backup", config.settings.autoBackup},
        {"date_format", config.settings.dateFormat},
        {"time_format", config.settings.timeFormat},
        {"git_integration", config.settings.gitIntegration}
    };
    return j;
}

ProjectConfig JsonCodec::ConfigFromJson(const json& j, const ProjectConfig& defaults) {
    if (!j.is_object()) {
        throw ConfigCorruptError("Configuration is not a JSON object");
    }
    try {
        ProjectConfig config = defaults;
        static const json empty = json::object();

        const json& project = j.contains("project") ? j.at("project") : empty;
        config.project.name = project.value("name", defaults.project.name);
        config.project.version = project.value("version", defaults.project.version);
        config.project.author = project.value("author", defaults.project.author);
        config.project.license = project.value("license", defaults.project.license);

        const json& paths = j.contains("paths") ? j.at("paths") : empty;
        config.paths.changelog = paths.value("changelog", defaults.paths.changelog);
        config.paths.unreleased = paths.value("unreleased", defaults.paths.unreleased);
        config.paths.releases = paths.value("releases", defaults.paths.releases);

        const json& settings = j.contains("settings") ? j.at("settings") : empty;
        config.settings.autoBackup = settings.value("auto_backup", defaults.settings.autoBackup);
        config.settings.dateFormat = settings.value("date_format", defaults.settings.dateFormat);
        config.settings.timeFormat = settings.value("time_format", defaults.settings.timeFormat);
        config.settings.gitIntegration = settings.value("git_integration", defaults.settings.gitIntegration);
        return config;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigCorruptError(std::string("Malformed configuration: ") + e.what());
    }
}

json JsonCodec::Parse(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigCorruptError(std::string("Invalid JSON: ") + e.what());
    }
}

} // namespace chlog::infrastructure
