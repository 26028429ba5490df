/**
 * @file SupervisorDecision.hpp
 * @brief The supervisor's selected next action and the draft rules produce.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/AgentState.hpp"

namespace dealflow::domain {

/**
 * @enum DecisionType
 * @brief What the supervisor decided to do this tick.
 */
enum class DecisionType {
    RouteToAgent,
    EscalateToHuman,
    EndWorkflow,
    ContinueWorkflow,
    ResolveConflict,
    CoordinateAgents
};

inline std::string DecisionTypeToString(DecisionType type) {
    switch (type) {
        case DecisionType::RouteToAgent: return "route_to_agent";
        case DecisionType::EscalateToHuman: return "escalate_to_human";
        case DecisionType::EndWorkflow: return "end_workflow";
        case DecisionType::ContinueWorkflow: return "continue_workflow";
        case DecisionType::ResolveConflict: return "resolve_conflict";
        case DecisionType::CoordinateAgents: return "coordinate_agents";
    }
    return "continue_workflow";
}

inline std::optional<DecisionType> DecisionTypeFromString(const std::string& value) {
    if (value == "route_to_agent") return DecisionType::RouteToAgent;
    if (value == "escalate_to_human") return DecisionType::EscalateToHuman;
    if (value == "end_workflow") return DecisionType::EndWorkflow;
    if (value == "continue_workflow") return DecisionType::ContinueWorkflow;
    if (value == "resolve_conflict") return DecisionType::ResolveConflict;
    if (value == "coordinate_agents") return DecisionType::CoordinateAgents;
    return std::nullopt;
}

/**
 * @enum Priority
 * @brief Urgency attached to a decision. Ordered, so comparisons are meaningful.
 */
enum class Priority {
    Low,
    Medium,
    High,
    Critical
};

inline std::string PriorityToString(Priority priority) {
    switch (priority) {
        case Priority::Low: return "low";
        case Priority::Medium: return "medium";
        case Priority::High: return "high";
        case Priority::Critical: return "critical";
    }
    return "medium";
}

inline std::optional<Priority> PriorityFromString(const std::string& value) {
    if (value == "low") return Priority::Low;
    if (value == "medium") return Priority::Medium;
    if (value == "high") return Priority::High;
    if (value == "critical") return Priority::Critical;
    return std::nullopt;
}

/**
 * @struct DecisionDraft
 * @brief A rule's proposal before it is stamped with an id and timestamp.
 */
struct DecisionDraft {
    DecisionType decisionType = DecisionType::ContinueWorkflow;
    std::optional<std::string> targetAgent;
    std::vector<std::string> targetAgents;
    std::string action;
    std::string reasoning;
    Priority priority = Priority::Medium;
    double confidence = 1.0;
    nlohmann::json parameters = nlohmann::json::object();
};

/**
 * @struct SupervisorDecision
 * @brief A stamped decision. After creation only the execution fields change.
 */
struct SupervisorDecision {
    std::string id;
    std::string workflowId;
    DecisionType decisionType = DecisionType::ContinueWorkflow;
    std::optional<std::string> targetAgent;
    std::vector<std::string> targetAgents;
    std::string action;
    std::string reasoning;
    Priority priority = Priority::Medium;
    double confidence = 1.0;
    nlohmann::json parameters = nlohmann::json::object();

    bool executed = false;
    nlohmann::json executionResult; // null until executed
    TimePoint createdAt = Clock::now();
    std::optional<TimePoint> executedAt;

    void markExecuted(nlohmann::json result) {
        executed = true;
        executionResult = std::move(result);
        executedAt = Clock::now();
    }
};

} // namespace dealflow::domain
