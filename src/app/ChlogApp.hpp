/**
 * @file ChlogApp.hpp
 * @brief Main application class for chlog.
 */

#pragma once

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include "app/CommandLine.hpp"
#include "application/AppServices.hpp"

namespace chlog::app {

/**
 * @class ChlogApp
 * @brief Maps one command-line invocation to the application services and prints the outcome.
 */
class ChlogApp {
public:
    ChlogApp(std::istream& in = std::cin, std::ostream& out = std::cout, std::ostream& err = std::cerr);

    /**
     * @brief Runs one command.
     * @param args Arguments without the program name.
     * @param workingDir Directory used for project discovery.
     * @return Exit code: 0 on success and reported errors, 1 on failures.
     */
    int Run(const std::vector<std::string>& args,
            const std::filesystem::path& workingDir = std::filesystem::current_path());

private:
    /**
     * @brief Wires config, repository and services for a project root.
     */
    application::AppServices BuildServices(const std::filesystem::path& projectRoot);

    void Dispatch(const CommandLine& cl, const std::filesystem::path& workingDir);

    void CmdInit(application::AppServices& services, const CommandLine& cl);
    void CmdAdd(application::AppServices& services, const CommandLine& cl);
    void CmdShow(application::AppServices& services, const CommandLine& cl);
    void CmdRelease(application::AppServices& services, const CommandLine& cl);
    void CmdRemove(application::AppServices& services, const CommandLine& cl);
    void CmdStats(application::AppServices& services);
    void CmdConfig(application::AppServices& services, const CommandLine& cl);

    std::istream& m_in;
    std::ostream& m_out;
    std::ostream& m_err;
};

} // namespace chlog::app
