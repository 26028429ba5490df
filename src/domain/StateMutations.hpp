/**
 * @file StateMutations.hpp
 * @brief Accessor operations through which the workflow state aggregate is changed.
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "domain/AgentState.hpp"

namespace dealflow::domain {

class StateMutations {
public:
    /** @brief Appends an agent message stamped with the current time. */
    static void AddAgentMessage(AgentState& state,
                                const std::string& agentType,
                                const std::string& message,
                                int priority = 1,
                                nlohmann::json data = nlohmann::json::object());

    /** @brief Stages the next agent to run and records why. */
    static void SetNextAction(AgentState& state, const std::string& agent, const std::string& reasoning);

    /** @brief Inserts or replaces a deal by id. */
    static void UpsertDeal(AgentState& state, const Deal& deal);

    static void ClaimResource(AgentState& state, const std::string& agent, const std::string& resource);
    static void ReleaseResource(AgentState& state, const std::string& agent, const std::string& resource);

    static void ProposeAction(AgentState& state, const std::string& agent,
                              const std::string& subject, const std::string& action);

    /** @brief Marks an agent running and optionally records the task it was given. */
    static void ActivateAgent(AgentState& state, const std::string& agent, const std::string& task = "");
    static void DeactivateAgent(AgentState& state, const std::string& agent);

    /** @brief Number of messages at or above the error priority (4). */
    static int CountErrorMessages(const AgentState& state);

    static constexpr int kErrorPriority = 4;
};

} // namespace dealflow::domain
