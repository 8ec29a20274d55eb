#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "domain/ChangelogErrors.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/ConfigStore.hpp"
#include "infrastructure/JsonCodec.hpp"

namespace fs = std::filesystem;
using namespace chlog::infrastructure;
using namespace chlog::domain;

int main() {
    std::cout << "[Test] Starting ConfigStore Test..." << std::endl;

    fs::path testDir = fs::temp_directory_path() / "chlog_config_store_test";
    if (fs::exists(testDir)) fs::remove_all(testDir);
    fs::path root = testDir / "demo-app";
    fs::create_directories(root);

    // 1. First access creates the defaults
    {
        ConfigStore store(root);
        assert(fs::exists(store.configFile()));
        const auto& config = store.config();
        assert(config.project.name == "demo-app");
        assert(config.project.version == "0.0.0");
        assert(config.project.license == "MIT");
        assert(config.paths.changelog == "CHANGELOG.md");
        assert(config.settings.autoBackup);
        assert(!config.settings.gitIntegration);
        assert(config.settings.dateFormat == "%Y-%m-%d");

        assert(store.resolvePath("changelog") == store.projectRoot() / "CHANGELOG.md");
        assert(store.resolvePath("unreleased") == store.projectRoot() / ".changelog" / "unreleased.json");
        bool threw = false;
        try { store.resolvePath("backups"); } catch (const UnknownKeyError&) { threw = true; }
        assert(threw);
    }

    // 2. Updates persist and are coerced for settings only
    {
        ConfigStore store(root);
        assert(store.update("settings.auto_backup", "FALSE") == "false");
        assert(store.update("project.version", "007") == "007");
        assert(store.update("author", "Ana") == "Ana");
        assert(store.update("paths.changelog", "docs/CHANGES.md") == "docs/CHANGES.md");
        store.update("settings.date_format", "%d/%m/%Y");

        bool threw = false;
        try { store.update("settings.git_integration", "yes"); } catch (const InvalidValueError&) { threw = true; }
        assert(threw);
        threw = false;
        try { store.update("settings.colour", "true"); } catch (const UnknownKeyError&) { threw = true; }
        assert(threw);
        threw = false;
        try { store.update("metrics.enabled", "true"); } catch (const UnknownKeyError&) { threw = true; }
        assert(threw);
    }
    {
        ConfigStore reopened(root);
        const auto& config = reopened.config();
        assert(!config.settings.autoBackup);
        assert(config.project.version == "007");
        assert(config.project.author == "Ana");
        assert(config.paths.changelog == "docs/CHANGES.md");
        assert(config.settings.dateFormat == "%d/%m/%Y");
        assert(!config.settings.gitIntegration);
    }

    assert(std::get<bool>(ConfigStore::CoerceSettingValue("True")));
    assert(std::get<long long>(ConfigStore::CoerceSettingValue("42")) == 42);
    assert(std::get<std::string>(ConfigStore::CoerceSettingValue("4.2")) == "4.2");
    assert(std::get<std::string>(ConfigStore::CoerceSettingValue("")).empty());

    // 3. Missing fields are filled from defaults
    {
        AtomicFileWriter::Write(root / ".changelog" / "config.json", "{\"project\": {\"name\": \"partial\"}}");
        ConfigStore store(root);
        assert(store.config().project.name == "partial");
        assert(store.config().project.version == "0.0.0");
        assert(store.config().paths.releases == ".changelog/releases");
        assert(store.config().settings.autoBackup);
    }

    // 4. A corrupt file is replaced with defaults
    {
        AtomicFileWriter::Write(root / ".changelog" / "config.json", "{ not json");
        ConfigStore store(root);
        assert(store.config().project.name == "demo-app");
        auto onDisk = JsonCodec::Parse(AtomicFileWriter::Read(store.configFile()));
        assert(onDisk["project"]["name"] == "demo-app");
        assert(onDisk["settings"]["auto_backup"] == true);
    }

    // 5. Project root discovery
    {
        fs::path nested = root / "src" / "deep";
        fs::create_directories(nested);
        assert(ConfigStore::DiscoverProjectRoot(nested) == fs::absolute(root).lexically_normal());

        fs::path loose = testDir / "elsewhere";
        fs::create_directories(loose);
        assert(ConfigStore::DiscoverProjectRoot(loose) == fs::absolute(loose).lexically_normal());
    }

    // 6. --config argument mapping
    {
        fs::path absRoot = fs::absolute(root).lexically_normal();
        assert(ConfigStore::RootFromConfigArgument(root) == absRoot);
        assert(ConfigStore::RootFromConfigArgument(root / ".changelog" / "config.json") == absRoot);
        assert(ConfigStore::RootFromConfigArgument(root / "chlog.json") == absRoot);
    }

    fs::remove_all(testDir);
    std::cout << "[PASS] ConfigStore Test." << std::endl;
    return 0;
}
