/**
 * @file AgentState.hpp
 * @brief Workflow state aggregate shared between the supervisor and worker agents.
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace dealflow::domain {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @enum WorkflowStatus
 * @brief Lifecycle of one end-to-end pipeline run.
 */
enum class WorkflowStatus {
    Idle,
    Running,
    Paused,
    Error,
    Completed
};

inline std::string WorkflowStatusToString(WorkflowStatus status) {
    switch (status) {
        case WorkflowStatus::Idle: return "idle";
        case WorkflowStatus::Running: return "running";
        case WorkflowStatus::Paused: return "paused";
        case WorkflowStatus::Error: return "error";
        case WorkflowStatus::Completed: return "completed";
    }
    return "idle";
}

inline std::optional<WorkflowStatus> WorkflowStatusFromString(const std::string& value) {
    if (value == "idle") return WorkflowStatus::Idle;
    if (value == "running") return WorkflowStatus::Running;
    if (value == "paused") return WorkflowStatus::Paused;
    if (value == "error") return WorkflowStatus::Error;
    if (value == "completed") return WorkflowStatus::Completed;
    return std::nullopt;
}

/// Deal status names the supervisor reasons about. Other values pass through untouched.
namespace deal_status {
inline constexpr const char* Discovered = "discovered";
inline constexpr const char* Analyzing = "analyzing";
inline constexpr const char* Approved = "approved";
inline constexpr const char* Rejected = "rejected";
inline constexpr const char* Closed = "closed";
} // namespace deal_status

/**
 * @struct Deal
 * @brief The unit of business work flowing through pipeline stages.
 */
struct Deal {
    std::string id;
    std::string status = deal_status::Discovered;
    bool analyzed = false;
    bool outreachInitiated = false;
    TimePoint lastUpdated = Clock::now();
    std::optional<std::string> assignedTo;

    bool isClosed() const { return status == deal_status::Closed; }
};

struct Negotiation {
    std::string id;
    std::string dealId;
    std::string status;
};

/**
 * @struct AgentMessage
 * @brief A note appended to the workflow by an agent. Priority runs 1 (low) to 5 (critical).
 */
struct AgentMessage {
    std::string message;
    int priority = 1;
    std::string agentType;
    TimePoint timestamp = Clock::now();
    nlohmann::json data = nlohmann::json::object();
};

/// An agent's claim on a shared resource (a deal, a phone line, a budget).
struct ResourceClaim {
    std::string agent;
    std::string resource;
    TimePoint claimedAt = Clock::now();
};

/// An agent's proposed next action for a subject (usually a deal id).
struct ActionProposal {
    std::string agent;
    std::string subject;
    std::string action;
    TimePoint proposedAt = Clock::now();
};

/**
 * @struct AgentState
 * @brief Aggregate read and written on every supervisor tick.
 *
 * Mutations from outside the supervisor go through StateMutations or
 * application::WorkflowStateStore so that writers to one workflow are serialised.
 */
struct AgentState {
    std::string workflowId;
    WorkflowStatus workflowStatus = WorkflowStatus::Idle;
    std::string currentStep;
    std::optional<std::string> nextAction;

    std::vector<Deal> currentDeals;
    std::vector<Negotiation> activeNegotiations;
    std::set<std::string> activeAgents;
    std::vector<AgentMessage> agentMessages;

    std::map<std::string, std::string> pendingTasks; // agent -> task
    std::vector<ResourceClaim> resourceClaims;
    std::vector<ActionProposal> proposals;

    // Coordination outputs
    std::vector<std::string> parallelAgents;
    std::vector<std::string> agentQueue;
    std::string coordinationMode;

    // Escalation / completion markers
    bool humanApprovalRequired = false;
    std::string escalationReason;
    std::string completionReason;

    // Opaque pass-through
    nlohmann::json marketConditions = nlohmann::json::object();
    nlohmann::json investmentCriteria = nlohmann::json::object();
};

} // namespace dealflow::domain
