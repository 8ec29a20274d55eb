#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>

#include "application/ChangelogService.hpp"
#include "application/ReleaseService.hpp"
#include "domain/ChangelogErrors.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/FileChangelogRepository.hpp"
#include "infrastructure/GitTagger.hpp"
#include "infrastructure/JsonCodec.hpp"

namespace fs = std::filesystem;
using namespace chlog::application;
using namespace chlog::domain;
using namespace chlog::infrastructure;

namespace {

class RecordingTagger : public VcsTagger {
public:
    bool fail = false;
    std::vector<std::pair<std::string, std::string>> tags;

    void createTag(const std::string& tag, const std::string& message) override {
        if (fail) throw VcsTagError("fatal: not a git repository");
        tags.emplace_back(tag, message);
    }
};

struct Fixture {
    std::shared_ptr<ConfigStore> config;
    std::shared_ptr<FileChangelogRepository> repository;
    std::shared_ptr<RecordingTagger> tagger;
    std::unique_ptr<ChangelogService> changes;
    std::unique_ptr<ReleaseService> releases;

    explicit Fixture(const fs::path& root) {
        config = std::make_shared<ConfigStore>(root);
        repository = std::make_shared<FileChangelogRepository>(*config);
        tagger = std::make_shared<RecordingTagger>();
        changes = std::make_unique<ChangelogService>(repository, config);
        releases = std::make_unique<ReleaseService>(repository, config, tagger);
    }

    std::string changelog() const { return repository->readChangelog().value_or(""); }
};

std::size_t BackupCount(const fs::path& dir) {
    if (!fs::exists(dir)) return 0;
    std::size_t count = 0;
    for (const auto& item : fs::directory_iterator(dir)) {
        if (item.path().filename().string().rfind("CHANGELOG_", 0) == 0) ++count;
    }
    return count;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ReleaseService Test..." << std::endl;

    fs::path testDir = fs::temp_directory_path() / "chlog_release_service_test";
    if (fs::exists(testDir)) fs::remove_all(testDir);
    fs::create_directories(testDir);

    // 1. Nothing pending: rejected, nothing written
    {
        Fixture f(testDir);
        f.changes->init(std::string("Demo"));
        std::string before = f.changelog();
        bool threw = false;
        try { f.releases->release("1.0.0"); } catch (const NoPendingChangesError&) { threw = true; }
        assert(threw);
        assert(f.changelog() == before);
        assert(!fs::exists(f.repository->releaseFile("1.0.0")));
    }

    // 2. Release moves pending changes into the document and a record
    {
        Fixture f(testDir);
        f.changes->add("added", "Dark mode", std::string("Ana"));
        f.changes->add("fixed", "Fix crash on startup");

        auto summary = f.releases->release("1.2.0", "First stable");
        assert(summary.version == "1.2.0");
        assert(summary.totalChanges == 2);
        assert(!summary.tagged && !summary.warning);
        assert(f.tagger->tags.empty());
        assert(fs::path(summary.releaseFile) == f.repository->releaseFile("1.2.0"));

        std::string document = f.changelog();
        auto marker = document.find("## [Unreleased]\n");
        auto heading = document.find("## [1.2.0] - " + summary.date);
        assert(marker != std::string::npos && heading != std::string::npos);
        assert(document.find("## [", marker + 1) == heading);
        assert(document.find("\nFirst stable\n") != std::string::npos);
        assert(document.find("- Dark mode (Ana)\n") != std::string::npos);
        assert(document.find("### Fixed\n- Fix crash on startup\n") != std::string::npos);

        auto record = JsonCodec::ReleaseFromJson(JsonCodec::Parse(AtomicFileWriter::Read(summary.releaseFile)));
        assert(record.version == "1.2.0");
        assert(record.releaseNotes == "First stable");
        assert(record.totalChanges == 2);
        assert(record.changes.at(ChangeCategory::Added)[0].description == "Dark mode");

        assert(f.changes->list().isEmpty());
        assert(f.config->config().project.version == "1.2.0");
        assert(BackupCount(f.config->configDir() / "backups") >= 1);
    }

    // 3. Leading 'v' is kept for display and dropped for the file name
    {
        Fixture f(testDir);
        f.changes->add("changed", "New API");
        auto summary = f.releases->release("v2.0.0", "Major release", true);
        assert(fs::exists(f.repository->releaseFile("2.0.0")));
        assert(fs::path(summary.releaseFile).filename() == "release_2.0.0.json");

        std::string document = f.changelog();
        auto newer = document.find("## [v2.0.0]");
        auto older = document.find("## [1.2.0]");
        assert(newer != std::string::npos && newer < older);

        assert(summary.tagged);
        assert(f.tagger->tags.size() == 1);
        assert(f.tagger->tags[0].first == "v2.0.0");
        assert(f.tagger->tags[0].second == "Release v2.0.0: Major release");
        assert(f.config->config().project.version == "2.0.0");
    }

    // 4. A version that already has a record is refused and pending stays
    {
        Fixture f(testDir);
        f.changes->add("fixed", "Late fix");
        std::string before = f.changelog();
        bool threw = false;
        try { f.releases->release("2.0.0"); } catch (const ReleaseExistsError&) { threw = true; }
        assert(threw);
        assert(f.changes->list().getTotalChanges() == 1);
        assert(f.changelog() == before);
    }

    // 5. Tagging failure is only a warning
    {
        Fixture f(testDir);
        f.config->update("settings.git_integration", "true");
        f.tagger->fail = true;
        auto summary = f.releases->release("2.0.1");
        assert(!summary.tagged);
        assert(summary.warning && summary.warning->find("not a git repository") != std::string::npos);
        assert(f.changes->list().isEmpty());
        assert(fs::exists(f.repository->releaseFile("2.0.1")));
        assert(f.changelog().find("## [2.0.1]") != std::string::npos);
    }

    // 6. Missing changelog falls back to a minimal document; no backup when disabled
    {
        fs::path root = testDir / "bare";
        fs::create_directories(root);
        Fixture f(root);
        f.config->update("settings.auto_backup", "false");
        Fixture fresh(root);
        fresh.changes->add("security", "Patch CVE");
        fresh.releases->release("0.1.0");
        std::string document = fresh.changelog();
        assert(document.rfind("# Changelog\n\n## [Unreleased]\n", 0) == 0);
        assert(document.find("## [0.1.0]") != std::string::npos);

        fresh.changes->add("fixed", "Another");
        fresh.releases->release("0.1.1");
        assert(BackupCount(fresh.config->configDir() / "backups") == 0);
    }

    // 6b. Versions that would escape the releases directory are refused
    {
        fs::path root = testDir / "escape";
        fs::create_directories(root);
        Fixture f(root);
        f.changes->init(std::string("Escape"));
        f.changes->add("added", "Kept");
        std::string before = f.changelog();
        for (const std::string bad : {"../../../../outside", "..", "v..", "1.0/evil", "1.0\\evil"}) {
            bool threw = false;
            try { f.releases->release(bad); } catch (const InvalidValueError&) { threw = true; }
            assert(threw);
        }
        assert(f.changelog() == before);
        assert(f.changes->list().getTotalChanges() == 1);
        assert(!fs::exists(root / "outside.json"));
        assert(!fs::exists(testDir / "outside.json"));
        assert(fs::is_empty(f.config->resolvePath("releases")));

        // Dots inside a version are fine
        auto summary = f.releases->release("1.0.0-rc..1");
        assert(fs::exists(f.repository->releaseFile("1.0.0-rc..1")));
        assert(summary.totalChanges == 1);
    }

    // 6c. A long date format still produces a date
    {
        fs::path root = testDir / "long-format";
        fs::create_directories(root);
        Fixture f(root);
        std::string longFormat(300, '=');
        longFormat += "%Y";
        f.config->update("settings.date_format", longFormat);
        f.changes->add("fixed", "Something");
        auto summary = f.releases->release("3.0.0");
        assert(summary.date.size() == 304);
        assert(f.changelog().find("## [3.0.0] - " + summary.date + "\n") != std::string::npos);
    }

    // 7. Without git the tagger reports the failure
    {
        GitTagger git((testDir / "no-such-dir").string(), "chlog-git-that-does-not-exist");
        bool threw = false;
        try { git.createTag("v0.0.1", "Release"); } catch (const VcsTagError&) { threw = true; }
        assert(threw);
#if !defined(_WIN32)
        assert(GitTagger::QuoteArgument("it's") == "'it'\\''s'");
#endif
    }

    fs::remove_all(testDir);
    std::cout << "[PASS] ReleaseService Test." << std::endl;
    return 0;
}
