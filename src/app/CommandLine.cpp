#include "app/CommandLine.hpp"

namespace chlog::app {

namespace {

struct CommandSpec {
    std::set<std::string> valueOptions;
    std::set<std::string> flagOptions;
    std::size_t minPositionals;
    std::size_t maxPositionals;
};

const std::map<std::string, CommandSpec>& Commands() {
    static const std::map<std::string, CommandSpec> commands = {
        {"init",    {{"name"}, {}, 0, 0}},
        {"add",     {{"author"}, {}, 2, 2}},
        {"show",    {{"format"}, {"all"}, 0, 0}},
        {"release", {{"notes"}, {"tag"}, 1, 1}},
        {"remove",  {{"type", "pattern", "index"}, {}, 0, 0}},
        {"stats",   {{}, {}, 0, 0}},
        {"config",  {{}, {}, 1, 3}},
    };
    return commands;
}

} // namespace

std::optional<std::string> CommandLine::option(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end()) return std::nullopt;
    return it->second;
}

CommandLine CommandLine::Parse(const std::vector<std::string>& args) {
    CommandLine cl;
    const CommandSpec* spec = nullptr;
    bool onlyPositionals = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (onlyPositionals || arg.empty() || arg[0] != '-' || arg == "-") {
            if (cl.command.empty()) {
                auto it = Commands().find(arg);
                if (it == Commands().end()) throw UsageError("Unknown command: " + arg);
                cl.command = arg;
                spec = &it->second;
            } else {
                cl.positionals.push_back(arg);
            }
            continue;
        }

        if (arg == "--") {
            onlyPositionals = true;
            continue;
        }
        if (arg == "-h" || arg == "--help") {
            cl.help = true;
            continue;
        }

        std::string name;
        std::optional<std::string> inlineValue;
        if (arg == "-c") {
            name = "config";
        } else if (arg.rfind("--", 0) == 0) {
            name = arg.substr(2);
            auto eq = name.find('=');
            if (eq != std::string::npos) {
                inlineValue = name.substr(eq + 1);
                name = name.substr(0, eq);
            }
        } else {
            throw UsageError("Unknown option: " + arg);
        }

        bool isGlobal = (name == "config");
        bool takesValue = isGlobal || (spec && spec->valueOptions.count(name));
        bool isFlag = spec && spec->flagOptions.count(name);

        if (takesValue) {
            std::string value;
            if (inlineValue) {
                value = *inlineValue;
            } else if (i + 1 < args.size()) {
                value = args[++i];
            } else {
                throw UsageError("Option --" + name + " expects a value");
            }
            if (isGlobal) cl.configPath = value;
            else cl.options[name] = value;
        } else if (isFlag && !inlineValue) {
            cl.flags.insert(name);
        } else {
            throw UsageError("Unknown option: " + arg + (cl.command.empty() ? "" : " for '" + cl.command + "'"));
        }
    }

    if (cl.command.empty()) {
        cl.help = true;
        return cl;
    }
    if (cl.help) return cl;

    if (cl.positionals.size() < spec->minPositionals || cl.positionals.size() > spec->maxPositionals) {
        throw UsageError("Wrong number of arguments for '" + cl.command + "'");
    }
    if (cl.command == "config") {
        const std::string& sub = cl.positionals[0];
        bool valid = (sub == "show" && cl.positionals.size() == 1) ||
                     (sub == "update" && cl.positionals.size() == 3);
        if (!valid) throw UsageError("Usage: chlog config show | chlog config update <section.key> <value>");
    }
    if (auto format = cl.option("format")) {
        if (*format != "pretty" && *format != "json" && *format != "markdown") {
            throw UsageError("Invalid --format: " + *format + " (choose pretty, json or markdown)");
        }
    }
    if (auto index = cl.option("index")) {
        try {
            std::size_t used = 0;
            std::stoll(*index, &used);
            if (used != index->size()) throw UsageError("");
        } catch (const std::exception&) {
            throw UsageError("--index expects an integer, got '" + *index + "'");
        }
    }
    return cl;
}

std::string CommandLine::Usage() {
    return
        "usage: chlog [--config PATH] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  init [--name NAME]                         Create CHANGELOG.md and an empty pending store\n"
        "  add <type> <description> [--author A]      Record a change (added, changed, deprecated,\n"
        "                                             removed, fixed, security)\n"
        "  show [--all] [--format pretty|json|markdown]\n"
        "                                             Show pending changes (--all prints CHANGELOG.md first)\n"
        "  release <version> [--notes N] [--tag]      Release all pending changes\n"
        "  remove [--type T] [--pattern TEXT] [--index N]\n"
        "                                             Remove pending changes\n"
        "  stats                                      Counts per type and author\n"
        "  config show                                Print the configuration\n"
        "  config update <section.key> <value>        Change a configuration value\n"
        "\n"
        "Examples:\n"
        "  chlog init --name \"My Project\"\n"
        "  chlog add fixed \"Fix crash on startup\" --author Ana\n"
        "  chlog release v2.0.0 --notes \"Major release\" --tag\n"
        "  chlog remove --index 3\n"
        "  chlog config update settings.auto_backup false\n";
}

} // namespace chlog::app
