/**
 * @file CommandLine.hpp
 * @brief Parsing of the chlog command line.
 */

#pragma once

#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace chlog::app {

/**
 * @class UsageError
 * @brief The command line does not describe a valid invocation.
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct CommandLine
 * @brief A parsed invocation: command, positionals, options and flags.
 */
struct CommandLine {
    std::string command;                        ///< init, add, show, release, remove, stats, config.
    std::vector<std::string> positionals;       ///< Arguments after the command.
    std::map<std::string, std::string> options; ///< Long option name (without dashes) -> value.
    std::set<std::string> flags;                ///< Boolean options that were given.
    std::optional<std::string> configPath;      ///< Global --config / -c.
    bool help = false;                          ///< --help / -h, or no command at all.

    std::optional<std::string> option(const std::string& name) const;
    bool hasFlag(const std::string& name) const { return flags.count(name) > 0; }

    /**
     * @brief Parses arguments (without the program name).
     * @throws UsageError for unknown commands or options, missing values and wrong arity.
     */
    static CommandLine Parse(const std::vector<std::string>& args);

    /** @brief Help text listing every command. */
    static std::string Usage();
};

} // namespace chlog::app
