/**
 * @file CommandLine.hpp
 * @brief Argument parsing for the dealflow_supervisor host.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/SupervisorError.hpp"

namespace dealflow::app {

struct CommandLineOptions {
    std::string configPath = "config/supervisor.json";
    std::string statePath;
    int ticks = 1;
    bool showHelp = false;
};

/**
 * @brief Parses the arguments after the program name.
 * @return Options, or a ConfigurationError naming the bad argument. A missing
 *         state path is an error unless help was requested.
 */
domain::Result<CommandLineOptions> ParseCommandLine(const std::vector<std::string>& args);

void PrintUsage(const std::string& program);

} // namespace dealflow::app
