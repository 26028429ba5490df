/**
 * @file WorkflowCoordination.hpp
 * @brief Coordination plans and the per-workflow coordination record.
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "domain/AgentState.hpp"

namespace dealflow::domain {

/**
 * @enum CoordinationMode
 * @brief Shape of a plan. Parallel declares intent only; execution belongs to the host.
 */
enum class CoordinationMode {
    Sequential,
    Parallel
};

inline std::string CoordinationModeToString(CoordinationMode mode) {
    return mode == CoordinationMode::Parallel ? "parallel" : "sequential";
}

inline std::optional<CoordinationMode> CoordinationModeFromString(const std::string& value) {
    if (value == "sequential") return CoordinationMode::Sequential;
    if (value == "parallel") return CoordinationMode::Parallel;
    return std::nullopt;
}

struct CoordinationStep {
    int step = 0;
    std::string agent;
    std::optional<std::string> dependsOn;
    std::chrono::seconds estimatedDuration{60};
};

struct CoordinationPlan {
    std::string coordinationId;
    std::string workflowId;
    std::vector<std::string> agents;
    CoordinationMode mode = CoordinationMode::Sequential;
    TimePoint createdAt = Clock::now();
    std::vector<CoordinationStep> steps;
};

/**
 * @struct WorkflowCoordination
 * @brief Live coordination state of one workflow. Archived, never erased.
 */
struct WorkflowCoordination {
    std::string workflowId;
    std::set<std::string> activeAgents;
    std::map<std::string, std::string> pendingTasks; // agent -> task
    std::vector<std::string> completedTasks;
    std::vector<std::string> failedTasks;
    std::vector<CoordinationStep> steps;
    std::string coordinationId;
    std::optional<TimePoint> lastCoordination;
    bool archived = false;
};

} // namespace dealflow::domain
