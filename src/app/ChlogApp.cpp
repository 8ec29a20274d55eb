/**
 * @file ChlogApp.cpp
 * @brief Implementation of ChlogApp.
 */

#include "app/ChlogApp.hpp"
#include <memory>
#include "app/ConsolePrompt.hpp"
#include "application/ChangelogRenderer.hpp"
#include "domain/ChangelogErrors.hpp"
#include "infrastructure/FileChangelogRepository.hpp"
#include "infrastructure/GitTagger.hpp"

namespace fs = std::filesystem;

namespace chlog::app {

using namespace chlog::application;

namespace {
const std::string kRule(60, '=');
}

ChlogApp::ChlogApp(std::istream& in, std::ostream& out, std::ostream& err)
    : m_in(in), m_out(out), m_err(err) {}

int ChlogApp::Run(const std::vector<std::string>& args, const fs::path& workingDir) {
    try {
        CommandLine cl = CommandLine::Parse(args);
        if (cl.help) {
            m_out << CommandLine::Usage();
            return 0;
        }
        Dispatch(cl, workingDir);
        return 0;
    } catch (const UsageError& e) {
        m_err << "Error: " << e.what() << "\n\n" << CommandLine::Usage();
        return 1;
    } catch (const domain::ChangelogError& e) {
        // Expected outcomes are reported, not fatal.
        m_err << "Error: " << e.what() << std::endl;
        return 0;
    } catch (const std::exception& e) {
        m_err << "Error: " << e.what() << std::endl;
        return 1;
    }
}

AppServices ChlogApp::BuildServices(const fs::path& projectRoot) {
    AppServices services;
    services.config = std::make_shared<infrastructure::ConfigStore>(projectRoot);
    services.repository = std::make_shared<infrastructure::FileChangelogRepository>(*services.config);
    auto tagger = std::make_shared<infrastructure::GitTagger>(services.config->projectRoot().string());

    services.changelogService = std::make_unique<ChangelogService>(services.repository, services.config);
    services.releaseService = std::make_unique<ReleaseService>(services.repository, services.config, tagger);
    return services;
}

void ChlogApp::Dispatch(const CommandLine& cl, const fs::path& workingDir) {
    fs::path root;
    if (cl.configPath) {
        fs::path argument(*cl.configPath);
        if (argument.is_relative()) argument = workingDir / argument;
        root = infrastructure::ConfigStore::RootFromConfigArgument(argument);
    } else if (cl.command == "init") {
        root = workingDir;
    } else {
        root = infrastructure::ConfigStore::DiscoverProjectRoot(workingDir);
    }

    AppServices services = BuildServices(root);

    if (cl.command == "init") CmdInit(services, cl);
    else if (cl.command == "add") CmdAdd(services, cl);
    else if (cl.command == "show") CmdShow(services, cl);
    else if (cl.command == "release") CmdRelease(services, cl);
    else if (cl.command == "remove") CmdRemove(services, cl);
    else if (cl.command == "stats") CmdStats(services);
    else if (cl.command == "config") CmdConfig(services, cl);
}

void ChlogApp::CmdInit(AppServices& services, const CommandLine& cl) {
    services.changelogService->init(cl.option("name"));
    m_out << "Changelog project initialized\n"
          << "  Project: " << services.config->config().project.name << "\n"
          << "  CHANGELOG: " << services.repository->changelogLocation() << "\n"
          << "  Config: " << services.config->configFile().string() << "\n"
          << "  Unreleased: " << services.repository->pendingLocation() << "\n";
}

void ChlogApp::CmdAdd(AppServices& services, const CommandLine& cl) {
    auto entry = services.changelogService->add(cl.positionals[0], cl.positionals[1], cl.option("author"));
    m_out << "Change added: [" << cl.positionals[0] << "] " << entry.description << "\n";
    if (entry.author) {
        m_out << "  Author: " << *entry.author << "\n";
    }
}

void ChlogApp::CmdShow(AppServices& services, const CommandLine& cl) {
    if (cl.hasFlag("all")) {
        if (auto document = services.repository->readChangelog()) {
            m_out << kRule << "\n" << "ALL CHANGES (from CHANGELOG.md):\n" << kRule << "\n"
                  << *document;
            if (!document->empty() && document->back() != '\n') m_out << "\n";
            m_out << kRule << "\n";
        }
    }
    auto format = OutputFormatFromString(cl.option("format").value_or("pretty")).value_or(OutputFormat::Pretty);
    m_out << ChangelogRenderer::RenderPending(services.changelogService->list(), format);
}

void ChlogApp::CmdRelease(AppServices& services, const CommandLine& cl) {
    auto summary = services.releaseService->release(cl.positionals[0], cl.option("notes").value_or(""), cl.hasFlag("tag"));
    if (summary.tagged) {
        m_out << "Git tag created: " << summary.version << "\n";
    }
    if (summary.warning) {
        m_err << "Warning: " << *summary.warning << std::endl;
    }
    m_out << "Release " << summary.version << " created\n"
          << "  Date: " << summary.date << " " << summary.time << "\n"
          << "  Changes: " << summary.totalChanges << "\n"
          << "  Release file: " << summary.releaseFile << "\n";
}

void ChlogApp::CmdRemove(AppServices& services, const CommandLine& cl) {
    domain::RemovalQuery query;
    if (auto type = cl.option("type")) {
        query.category = domain::CategoryFromString(*type);
        if (!query.category) {
            throw domain::InvalidCategoryError("Unsupported change type: " + *type +
                                               " (valid types: " + domain::CategoryList() + ")");
        }
    }
    query.pattern = cl.option("pattern");
    if (auto index = cl.option("index")) {
        query.index = std::stoll(*index);
    }

    ConsolePrompt prompt(m_in, m_out);
    auto result = services.changelogService->remove(query, prompt);
    if (!result.aborted) {
        m_out << "Removed " << result.removed << " change(s)\n";
    }
}

void ChlogApp::CmdStats(AppServices& services) {
    m_out << ChangelogRenderer::RenderStats(services.changelogService->stats());
}

void ChlogApp::CmdConfig(AppServices& services, const CommandLine& cl) {
    auto& store = *services.config;
    if (cl.positionals[0] == "update") {
        std::string stored = store.update(cl.positionals[1], cl.positionals[2]);
        m_out << "Configuration updated: " << cl.positionals[1] << " = " << stored << "\n";
        return;
    }

    const auto& config = store.config();
    m_out << "Current configuration:\n" << kRule << "\n"
          << "Project: " << config.project.name << "\n"
          << "Version: " << config.project.version << "\n"
          << "Author: " << config.project.author << "\n"
          << "License: " << config.project.license << "\n"
          << "\nPaths:\n"
          << "  CHANGELOG: " << store.resolvePath("changelog").string() << "\n"
          << "  Unreleased: " << store.resolvePath("unreleased").string() << "\n"
          << "  Releases: " << store.resolvePath("releases").string() << "\n"
          << "\nSettings:\n"
          << "  auto_backup: " << (config.settings.autoBackup ? "true" : "false") << "\n"
          << "  date_format: " << config.settings.dateFormat << "\n"
          << "  time_format: " << config.settings.timeFormat << "\n"
          << "  git_integration: " << (config.settings.gitIntegration ? "true" : "false") << "\n"
          << kRule << "\n";
}

} // namespace chlog::app
