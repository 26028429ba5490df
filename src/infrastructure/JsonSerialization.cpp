/**
 * @file JsonSerialization.cpp
 * @brief Implementation of the JSON adapters.
 */

#include "infrastructure/JsonSerialization.hpp"

#include <stdexcept>

namespace dealflow::infrastructure {

long long ToEpochMillis(const domain::TimePoint& tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

domain::TimePoint FromEpochMillis(long long ms) {
    return domain::TimePoint(std::chrono::milliseconds(ms));
}

} // namespace dealflow::infrastructure

namespace dealflow::domain {

using json = nlohmann::json;
using infrastructure::FromEpochMillis;
using infrastructure::ToEpochMillis;

namespace {

json OptionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> ReadOptionalString(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}

TimePoint ReadTimestamp(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return Clock::now();
    return FromEpochMillis(j[key].get<long long>());
}

} // namespace

void to_json(json& j, const Deal& deal) {
    j = {
        {"id", deal.id},
        {"status", deal.status},
        {"analyzed", deal.analyzed},
        {"outreach_initiated", deal.outreachInitiated},
        {"last_updated", ToEpochMillis(deal.lastUpdated)},
        {"assigned_to", OptionalString(deal.assignedTo)}
    };
}

void from_json(const json& j, Deal& deal) {
    deal.id = j.at("id").get<std::string>();
    deal.status = j.value("status", std::string(deal_status::Discovered));
    deal.analyzed = j.value("analyzed", false);
    deal.outreachInitiated = j.value("outreach_initiated", false);
    deal.lastUpdated = ReadTimestamp(j, "last_updated");
    deal.assignedTo = ReadOptionalString(j, "assigned_to");
}

void to_json(json& j, const Negotiation& negotiation) {
    j = {{"id", negotiation.id}, {"deal_id", negotiation.dealId}, {"status", negotiation.status}};
}

void from_json(const json& j, Negotiation& negotiation) {
    negotiation.id = j.value("id", std::string());
    negotiation.dealId = j.value("deal_id", std::string());
    negotiation.status = j.value("status", std::string());
}

void to_json(json& j, const AgentMessage& message) {
    j = {
        {"message", message.message},
        {"priority", message.priority},
        {"agent_type", message.agentType},
        {"timestamp", ToEpochMillis(message.timestamp)},
        {"data", message.data}
    };
}

void from_json(const json& j, AgentMessage& message) {
    message.message = j.value("message", std::string());
    message.priority = j.value("priority", 1);
    message.agentType = j.value("agent_type", std::string());
    message.timestamp = ReadTimestamp(j, "timestamp");
    message.data = j.value("data", json::object());
}

void to_json(json& j, const ResourceClaim& claim) {
    j = {{"agent", claim.agent}, {"resource", claim.resource}, {"claimed_at", ToEpochMillis(claim.claimedAt)}};
}

void from_json(const json& j, ResourceClaim& claim) {
    claim.agent = j.at("agent").get<std::string>();
    claim.resource = j.at("resource").get<std::string>();
    claim.claimedAt = ReadTimestamp(j, "claimed_at");
}

void to_json(json& j, const ActionProposal& proposal) {
    j = {
        {"agent", proposal.agent},
        {"subject", proposal.subject},
        {"action", proposal.action},
        {"proposed_at", ToEpochMillis(proposal.proposedAt)}
    };
}

void from_json(const json& j, ActionProposal& proposal) {
    proposal.agent = j.at("agent").get<std::string>();
    proposal.subject = j.at("subject").get<std::string>();
    proposal.action = j.at("action").get<std::string>();
    proposal.proposedAt = ReadTimestamp(j, "proposed_at");
}

void to_json(json& j, const AgentState& state) {
    j = {
        {"workflow_id", state.workflowId},
        {"workflow_status", WorkflowStatusToString(state.workflowStatus)},
        {"current_step", state.currentStep},
        {"next_action", OptionalString(state.nextAction)},
        {"current_deals", state.currentDeals},
        {"active_negotiations", state.activeNegotiations},
        {"active_agents", state.activeAgents},
        {"agent_messages", state.agentMessages},
        {"pending_tasks", state.pendingTasks},
        {"resource_claims", state.resourceClaims},
        {"proposals", state.proposals},
        {"parallel_agents", state.parallelAgents},
        {"agent_queue", state.agentQueue},
        {"coordination_mode", state.coordinationMode},
        {"human_approval_required", state.humanApprovalRequired},
        {"escalation_reason", state.escalationReason},
        {"completion_reason", state.completionReason},
        {"market_conditions", state.marketConditions},
        {"investment_criteria", state.investmentCriteria}
    };
}

void from_json(const json& j, AgentState& state) {
    state.workflowId = j.value("workflow_id", std::string());

    const std::string status = j.value("workflow_status", std::string("idle"));
    auto parsed = WorkflowStatusFromString(status);
    if (!parsed) {
        throw std::invalid_argument("Unknown workflow_status: " + status);
    }
    state.workflowStatus = *parsed;

    state.currentStep = j.value("current_step", std::string());
    state.nextAction = ReadOptionalString(j, "next_action");
    state.currentDeals = j.value("current_deals", std::vector<Deal>{});
    state.activeNegotiations = j.value("active_negotiations", std::vector<Negotiation>{});
    state.activeAgents = j.value("active_agents", std::set<std::string>{});
    state.agentMessages = j.value("agent_messages", std::vector<AgentMessage>{});
    state.pendingTasks = j.value("pending_tasks", std::map<std::string, std::string>{});
    state.resourceClaims = j.value("resource_claims", std::vector<ResourceClaim>{});
    state.proposals = j.value("proposals", std::vector<ActionProposal>{});
    state.parallelAgents = j.value("parallel_agents", std::vector<std::string>{});
    state.agentQueue = j.value("agent_queue", std::vector<std::string>{});
    state.coordinationMode = j.value("coordination_mode", std::string());
    state.humanApprovalRequired = j.value("human_approval_required", false);
    state.escalationReason = j.value("escalation_reason", std::string());
    state.completionReason = j.value("completion_reason", std::string());
    state.marketConditions = j.value("market_conditions", json::object());
    state.investmentCriteria = j.value("investment_criteria", json::object());
}

void to_json(json& j, const SupervisorDecision& decision) {
    j = {
        {"id", decision.id},
        {"workflow_id", decision.workflowId},
        {"decision_type", DecisionTypeToString(decision.decisionType)},
        {"target_agent", OptionalString(decision.targetAgent)},
        {"target_agents", decision.targetAgents},
        {"action", decision.action},
        {"reasoning", decision.reasoning},
        {"priority", PriorityToString(decision.priority)},
        {"confidence", decision.confidence},
        {"parameters", decision.parameters},
        {"executed", decision.executed},
        {"execution_result", decision.executionResult},
        {"created_at", ToEpochMillis(decision.createdAt)},
        {"executed_at", decision.executedAt ? json(ToEpochMillis(*decision.executedAt)) : json(nullptr)}
    };
}

void to_json(json& j, const SystemHealth& health) {
    j = {{"status", HealthStatusToString(health.status)}, {"issues", health.issues}};
}

void from_json(const json& j, SystemHealth& health) {
    const std::string status = j.value("status", std::string("healthy"));
    auto parsed = HealthStatusFromString(status);
    if (!parsed) {
        throw std::invalid_argument("Unknown health status: " + status);
    }
    health.status = *parsed;
    health.issues = j.value("issues", std::vector<std::string>{});
}

void to_json(json& j, const SituationAnalysis& analysis) {
    j = {
        {"workflow_status", WorkflowStatusToString(analysis.workflowStatus)},
        {"active_agents", analysis.activeAgents},
        {"current_deals", analysis.currentDeals},
        {"pending_negotiations", analysis.pendingNegotiations},
        {"system_health", analysis.systemHealth},
        {"resource_utilization", {
            {"active_workflows", analysis.resourceUtilization.activeWorkflows},
            {"active_agents", analysis.resourceUtilization.activeAgents},
            {"pending_tasks", analysis.resourceUtilization.pendingTasks},
            {"claimed_resources", analysis.resourceUtilization.claimedResources}
        }},
        {"bottlenecks", analysis.bottlenecks},
        {"opportunities", analysis.opportunities}
    };
}

void to_json(json& j, const CoordinationStep& step) {
    j = {
        {"step", step.step},
        {"agent", step.agent},
        {"depends_on", OptionalString(step.dependsOn)},
        {"estimated_duration", step.estimatedDuration.count()}
    };
}

void to_json(json& j, const CoordinationPlan& plan) {
    j = {
        {"coordination_id", plan.coordinationId},
        {"workflow_id", plan.workflowId},
        {"agents", plan.agents},
        {"type", CoordinationModeToString(plan.mode)},
        {"created_at", ToEpochMillis(plan.createdAt)},
        {"steps", plan.steps}
    };
}

void to_json(json& j, const WorkflowCoordination& coordination) {
    j = {
        {"workflow_id", coordination.workflowId},
        {"active_agents", coordination.activeAgents},
        {"pending_tasks", coordination.pendingTasks},
        {"completed_tasks", coordination.completedTasks},
        {"failed_tasks", coordination.failedTasks},
        {"steps", coordination.steps},
        {"coordination_id", coordination.coordinationId},
        {"last_coordination", coordination.lastCoordination
            ? json(ToEpochMillis(*coordination.lastCoordination)) : json(nullptr)},
        {"archived", coordination.archived}
    };
}

void to_json(json& j, const ConflictResolution& conflict) {
    j = {
        {"conflict_id", conflict.conflictId},
        {"conflicting_agents", conflict.conflictingAgents},
        {"conflict_type", conflict.conflictType},
        {"subject", conflict.subject},
        {"description", conflict.description},
        {"resolution_strategy", conflict.resolutionStrategy},
        {"resolved", conflict.isResolved()},
        {"actions_taken", conflict.actionsTaken},
        {"winning_agent", OptionalString(conflict.winningAgent)},
        {"detected_at", ToEpochMillis(conflict.detectedAt)},
        {"resolved_at", conflict.resolvedAt ? json(ToEpochMillis(*conflict.resolvedAt)) : json(nullptr)}
    };
}

void to_json(json& j, const ResolutionOutcome& outcome) {
    j = {
        {"conflict_id", outcome.conflictId},
        {"resolved", outcome.resolved},
        {"strategy", outcome.strategy},
        {"actions_taken", outcome.actionsTaken},
        {"winning_agent", OptionalString(outcome.winningAgent)}
    };
}

void to_json(json& j, const Recommendation& recommendation) {
    j = {
        {"type", recommendation.type},
        {"description", recommendation.description},
        {"priority", recommendation.priority}
    };
}

void to_json(json& j, const AgentMetrics& metrics) {
    j = {
        {"tasks_completed", metrics.tasksCompleted},
        {"tasks_failed", metrics.tasksFailed},
        {"average_execution_time", metrics.averageExecutionTime},
        {"average_confidence", metrics.averageConfidence}
    };
}

void to_json(json& j, const PerformanceMonitoring& monitoring) {
    j = {
        {"system_health", monitoring.systemHealth},
        {"bottlenecks", monitoring.bottlenecks},
        {"opportunities", monitoring.opportunities},
        {"recommendations", monitoring.recommendations},
        {"agent_metrics", monitoring.agentMetrics},
        {"last_monitoring_update", monitoring.lastMonitoringUpdate
            ? json(ToEpochMillis(*monitoring.lastMonitoringUpdate)) : json(nullptr)}
    };
}

void to_json(json& j, const AgentTaskResult& result) {
    j = {
        {"success", result.success},
        {"confidence_score", result.confidenceScore},
        {"execution_time", result.executionTime}
    };
    if (result.success) {
        j["data"] = result.data;
    } else {
        j["error"] = result.error;
    }
}

} // namespace dealflow::domain
