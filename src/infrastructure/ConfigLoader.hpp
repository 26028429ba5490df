/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving supervisor configuration (supervisor.json).
 *
 * Keeps JSON parsing of tunables in one place. Any malformed value is reported as a
 * ConfigurationError instead of being silently replaced by a default.
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "domain/SupervisorConfig.hpp"
#include "domain/SupervisorError.hpp"

namespace dealflow::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads a supervisor configuration file.
     * @param path Path to the JSON file.
     * @return Defaults when the file does not exist, otherwise the parsed configuration.
     * @throws domain::SupervisorException (ConfigurationError) on malformed content.
     */
    static domain::SupervisorConfig LoadSupervisorConfig(const std::string& path);

    /**
     * @brief Applies the keys present in @p j on top of the defaults.
     * @throws domain::SupervisorException (ConfigurationError) on wrong types or ranges.
     */
    static domain::SupervisorConfig LoadFromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::SupervisorConfig& config);

    /** @brief Writes the configuration, pretty-printed. */
    static void SaveSupervisorConfig(const std::string& path, const domain::SupervisorConfig& config);
};

} // namespace dealflow::infrastructure
