/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>

#include "domain/SupervisorError.hpp"

namespace dealflow::infrastructure {

using json = nlohmann::json;
using domain::ErrorKind;
using domain::SupervisorException;

namespace {

[[noreturn]] void Fail(const std::string& message) {
    std::cerr << "[ConfigLoader] " << message << std::endl;
    throw SupervisorException(ErrorKind::ConfigurationError, message);
}

double RequireUnitInterval(const json& j, const char* key) {
    if (!j[key].is_number()) Fail(std::string(key) + " must be a number");
    double value = j[key].get<double>();
    if (value < 0.0 || value > 1.0) Fail(std::string(key) + " must lie in [0, 1]");
    return value;
}

int RequireInt(const json& j, const char* key, int minValue) {
    if (!j[key].is_number_integer()) Fail(std::string(key) + " must be an integer");
    int value = j[key].get<int>();
    if (value < minValue) Fail(std::string(key) + " must be >= " + std::to_string(minValue));
    return value;
}

void ApplyRuleOverrides(const json& rules, domain::SupervisorConfig& config) {
    if (!rules.is_array()) Fail("rules must be an array");

    std::set<std::string> seen;
    for (const auto& entry : rules) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            Fail("every rule needs a string 'name'");
        }
        const std::string name = entry["name"].get<std::string>();
        if (!domain::RuleKindFromName(name)) Fail("unknown rule: " + name);
        if (!seen.insert(name).second) Fail("duplicate rule: " + name);

        auto it = std::find_if(config.rules.begin(), config.rules.end(),
            [&](const domain::DecisionRule& r) { return r.name == name; });

        if (entry.contains("priority")) {
            if (!entry["priority"].is_number_integer()) Fail("rule " + name + ": priority must be an integer");
            it->priority = entry["priority"].get<int>();
        }
        if (entry.contains("confidence")) {
            it->confidence = RequireUnitInterval(entry, "confidence");
        }
        if (entry.contains("enabled")) {
            if (!entry["enabled"].is_boolean()) Fail("rule " + name + ": enabled must be a boolean");
            it->enabled = entry["enabled"].get<bool>();
        }
    }
}

} // namespace

domain::SupervisorConfig ConfigLoader::LoadFromJson(const json& j) {
    domain::SupervisorConfig config;
    if (j.is_null()) return config;
    if (!j.is_object()) Fail("configuration root must be an object");

    if (j.contains("confidence_threshold")) {
        config.confidenceThreshold = RequireUnitInterval(j, "confidence_threshold");
    }
    if (j.contains("low_water_mark")) {
        config.lowWaterMark = RequireInt(j, "low_water_mark", 0);
    }
    if (j.contains("stall_threshold_seconds")) {
        config.stallThreshold = std::chrono::seconds(RequireInt(j, "stall_threshold_seconds", 1));
    }
    if (j.contains("in_flight_statuses")) {
        const auto& statuses = j["in_flight_statuses"];
        if (!statuses.is_array()) Fail("in_flight_statuses must be an array");
        config.inFlightStatuses.clear();
        for (const auto& s : statuses) {
            if (!s.is_string()) Fail("in_flight_statuses must contain strings");
            config.inFlightStatuses.insert(s.get<std::string>());
        }
    }
    if (j.contains("recommendation_window")) {
        config.recommendationWindow = RequireInt(j, "recommendation_window", 1);
    }
    if (j.contains("recommendation_repeat_threshold")) {
        config.recommendationRepeatThreshold = RequireInt(j, "recommendation_repeat_threshold", 1);
    }
    if (config.recommendationRepeatThreshold > config.recommendationWindow) {
        Fail("recommendation_repeat_threshold cannot exceed recommendation_window");
    }
    if (j.contains("agent_priorities")) {
        const auto& priorities = j["agent_priorities"];
        if (!priorities.is_object()) Fail("agent_priorities must be an object");
        config.agentPriorities.clear();
        for (auto it = priorities.begin(); it != priorities.end(); ++it) {
            if (!it.value().is_number_integer()) Fail("agent_priorities." + it.key() + " must be an integer");
            config.agentPriorities[it.key()] = it.value().get<int>();
        }
    }
    if (j.contains("rules")) {
        ApplyRuleOverrides(j["rules"], config);
    }
    if (j.contains("verbose")) {
        if (!j["verbose"].is_boolean()) Fail("verbose must be a boolean");
        config.verbose = j["verbose"].get<bool>();
    }
    return config;
}

domain::SupervisorConfig ConfigLoader::LoadSupervisorConfig(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        std::cout << "[ConfigLoader] " << path << " not found, using defaults." << std::endl;
        return domain::SupervisorConfig{};
    }

    json j;
    try {
        std::ifstream f(path);
        f >> j;
    } catch (const json::exception& e) {
        Fail("Error reading " + path + ": " + e.what());
    }
    return LoadFromJson(j);
}

json ConfigLoader::ToJson(const domain::SupervisorConfig& config) {
    json rules = json::array();
    for (const auto& rule : config.rules) {
        rules.push_back({
            {"name", rule.name},
            {"priority", rule.priority},
            {"confidence", rule.confidence},
            {"enabled", rule.enabled}
        });
    }

    return {
        {"confidence_threshold", config.confidenceThreshold},
        {"low_water_mark", config.lowWaterMark},
        {"stall_threshold_seconds", config.stallThreshold.count()},
        {"in_flight_statuses", config.inFlightStatuses},
        {"recommendation_window", config.recommendationWindow},
        {"recommendation_repeat_threshold", config.recommendationRepeatThreshold},
        {"agent_priorities", config.agentPriorities},
        {"rules", rules},
        {"verbose", config.verbose}
    };
}

void ConfigLoader::SaveSupervisorConfig(const std::string& path, const domain::SupervisorConfig& config) {
    std::ofstream f(path);
    if (!f) {
        Fail("Cannot open " + path + " for writing");
    }
    f << ToJson(config).dump(4);
}

} // namespace dealflow::infrastructure
