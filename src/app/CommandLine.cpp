/**
 * @file CommandLine.cpp
 * @brief Implementation of the host's argument parsing.
 */

#include "app/CommandLine.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>

namespace dealflow::app {

using domain::ErrorKind;
using domain::SupervisorFault;

namespace {

std::optional<int> ParsePositive(const std::string& text) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size() || value < 1) return std::nullopt;
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

domain::Result<CommandLineOptions> ParseCommandLine(const std::vector<std::string>& args) {
    CommandLineOptions options;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else if (arg == "--config" || arg == "--ticks") {
            if (i + 1 >= args.size()) {
                return SupervisorFault{ErrorKind::ConfigurationError, arg + " needs a value"};
            }
            const std::string& value = args[++i];
            if (arg == "--config") {
                options.configPath = value;
                continue;
            }
            auto ticks = ParsePositive(value);
            if (!ticks) {
                return SupervisorFault{ErrorKind::ConfigurationError,
                    "--ticks needs a positive integer, got '" + value + "'"};
            }
            options.ticks = *ticks;
        } else if (arg.rfind("--", 0) == 0) {
            return SupervisorFault{ErrorKind::ConfigurationError, "unknown option " + arg};
        } else {
            options.statePath = arg;
        }
    }
    if (options.statePath.empty() && !options.showHelp) {
        return SupervisorFault{ErrorKind::ConfigurationError, "no state file given"};
    }
    return options;
}

void PrintUsage(const std::string& program) {
    std::cerr << "Usage: " << program << " [--config supervisor.json] [--ticks N] state.json" << std::endl;
}

} // namespace dealflow::app
