/**
 * @file WorkerAgent.hpp
 * @brief Contract every worker agent exposes to the supervisor.
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/AgentState.hpp"

namespace dealflow::domain {

/**
 * @struct AgentTaskResult
 * @brief Outcome of one agent task. `data` is set on success, `error` otherwise.
 */
struct AgentTaskResult {
    bool success = false;
    nlohmann::json data = nlohmann::json::object();
    std::string error;
    double confidenceScore = 0.0;
    double executionTime = 0.0; // seconds
};

/**
 * @class WorkerAgent
 * @brief Abstract interface for agents the supervisor routes work to.
 *
 * The supervisor depends on this shape only, never on what an agent does inside.
 */
class WorkerAgent {
public:
    virtual ~WorkerAgent() = default;

    /** @brief Name the decision rules route to ("scout", "analyst", ...). */
    virtual std::string name() const = 0;

    /** @brief Tasks this agent accepts. */
    virtual std::vector<std::string> availableTasks() const = 0;

    /**
     * @brief Runs a task against a snapshot of the workflow state.
     * @param task Task name, usually the decision's action.
     * @param data Task parameters.
     * @param state Read-only snapshot; changes are reported through the result.
     */
    virtual AgentTaskResult executeTask(const std::string& task,
                                        const nlohmann::json& data,
                                        const AgentState& state) = 0;
};

} // namespace dealflow::domain
