/**
 * @file Supervisor.cpp
 * @brief Implementation of the Supervisor façade.
 */

#include "application/Supervisor.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <type_traits>

#include "domain/StateMutations.hpp"
#include "infrastructure/JsonSerialization.hpp"

namespace dealflow::application {

using json = nlohmann::json;
using namespace dealflow::domain;

namespace {

constexpr const char* kAgentName = "supervisor";
constexpr int kSupervisorMessagePriority = 3;
constexpr const char* kAwaitHumanAction = "await_human_response";

std::string Normalize(const std::string& input) {
    auto begin = std::find_if_not(input.begin(), input.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    std::string out;
    if (begin >= end) return out;
    out.reserve(static_cast<size_t>(end - begin));
    for (auto it = begin; it != end; ++it) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*it))));
    }
    return out;
}

} // namespace

json HumanResponse::toJson() const {
    json j = {{"status", status}};
    if (!action.empty()) j["action"] = action;
    if (!message.empty()) j["message"] = message;
    return j;
}

Supervisor::Supervisor(SupervisorConfig config)
    : m_config(std::move(config)),
      m_decisionEngine(m_config),
      m_conflictResolver(m_config.agentPriorities, m_config.verbose),
      m_performanceMonitor(m_config) {}

void Supervisor::initialize() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_config.verbose) {
        std::cout << "[Supervisor] Initializing orchestration subsystems..." << std::endl;
    }
    m_decisionEngine.initialize();
}

std::vector<std::string> Supervisor::availableTasks() {
    return {
        "make_routing_decision",
        "coordinate_agents",
        "resolve_conflict",
        "monitor_performance",
        "escalate_to_human"
    };
}

// --- Situation analysis ---

SituationAnalysis Supervisor::analyzeSituation(const AgentState& state) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return analyzeLocked(state);
}

SituationAnalysis Supervisor::analyzeLocked(const AgentState& state) const {
    SituationAnalysis analysis;
    analysis.workflowStatus = state.workflowStatus;
    analysis.activeAgents = state.activeAgents;
    analysis.currentDeals = static_cast<int>(state.currentDeals.size());
    analysis.pendingNegotiations = static_cast<int>(state.activeNegotiations.size());
    analysis.systemHealth = m_performanceMonitor.assessSystemHealth(state);

    analysis.resourceUtilization.activeWorkflows = state.workflowStatus == WorkflowStatus::Running ? 1 : 0;
    analysis.resourceUtilization.activeAgents = static_cast<int>(state.activeAgents.size());
    analysis.resourceUtilization.pendingTasks = static_cast<int>(state.pendingTasks.size());
    analysis.resourceUtilization.claimedResources = static_cast<int>(state.resourceClaims.size());

    analysis.bottlenecks = m_performanceMonitor.identifyBottlenecks(state);
    analysis.opportunities = m_performanceMonitor.identifyOpportunities(state);
    return analysis;
}

// --- Decision path ---

SupervisorDecision Supervisor::faultToEscalation(const SupervisorFault& fault, const std::string& workflowId) const {
    DecisionDraft draft;
    draft.decisionType = DecisionType::EscalateToHuman;
    draft.action = "human_escalation";
    draft.priority = Priority::Critical;
    draft.confidence = 1.0;
    draft.reasoning = "Supervisor could not decide automatically (" + fault.describe() +
                      "); human review required";
    draft.parameters = {{"error_kind", ErrorKindToString(fault.kind)}, {"error", fault.message}};
    return DecisionEngine::Stamp(draft, workflowId);
}

SupervisorDecision Supervisor::holdForHuman(const SupervisorDecision& held) const {
    DecisionDraft draft;
    draft.decisionType = DecisionType::ContinueWorkflow;
    draft.action = kAwaitHumanAction;
    draft.priority = Priority::Medium;
    draft.confidence = 1.0;
    draft.reasoning = "Awaiting human response; routing to " + held.targetAgent.value_or("agent") + " suspended";
    draft.parameters = {{"held_decision_id", held.id}};
    return DecisionEngine::Stamp(draft, held.workflowId);
}

SupervisorDecision Supervisor::decideLocked(const AgentState& state, const SituationAnalysis& analysis) {
    auto result = m_decisionEngine.makeDecision(state, analysis);

    SupervisorDecision decision = std::visit([&](auto&& value) -> SupervisorDecision {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, SupervisorFault>) {
            std::cerr << "[Supervisor] Decision engine fault: " << value.describe() << std::endl;
            return faultToEscalation(value, state.workflowId);
        } else {
            return value;
        }
    }, result);

    if (decision.decisionType == DecisionType::RouteToAgent && awaitingLocked(state.workflowId)) {
        return holdForHuman(decision);
    }
    return decision;
}

void Supervisor::enqueueEscalationLocked(const SupervisorDecision& decision, bool operatorRequest) {
    // Automatic escalations keep one pending entry per workflow and reason, so a
    // repeating critical condition does not grow the operator's queue every tick.
    bool duplicate = !operatorRequest &&
        std::any_of(m_pendingHumanDecisions.begin(), m_pendingHumanDecisions.end(),
            [&](const SupervisorDecision& d) {
                return d.workflowId == decision.workflowId && d.reasoning == decision.reasoning;
            });
    if (!duplicate) {
        m_pendingHumanDecisions.push_back(decision);
    }
    m_humanApprovalRequired = true;
}

void Supervisor::clearStagedWork(AgentState& state) {
    state.nextAction.reset();
    state.agentQueue.clear();
    state.parallelAgents.clear();
}

void Supervisor::executeDecisionLocked(SupervisorDecision& decision, AgentState& state, bool operatorRequest) {
    json result = {{"status", "success"}};

    switch (decision.decisionType) {
        case DecisionType::RouteToAgent:
            StateMutations::SetNextAction(state, *decision.targetAgent, decision.reasoning);
            if (m_config.verbose) {
                std::cout << "[Supervisor] Routed workflow " << state.workflowId << " to "
                          << *decision.targetAgent << std::endl;
            }
            break;

        case DecisionType::CoordinateAgents: {
            const std::string mode = decision.parameters.value("coordination_type", std::string("sequential"));
            auto plan = m_coordinationManager.createCoordinationPlan(decision.targetAgents, mode, state);
            if (IsOk(plan)) {
                m_coordinationManager.applyPlan(Value(plan), state);
                result["coordination_id"] = Value(plan).coordinationId;
                result["coordination_plan"] = Value(plan);
            } else {
                result = {{"status", "failed"}, {"error", Fault(plan).describe()}};
            }
            break;
        }

        case DecisionType::EscalateToHuman:
            clearStagedWork(state);
            state.humanApprovalRequired = true;
            state.escalationReason = decision.reasoning;
            enqueueEscalationLocked(decision, operatorRequest);
            std::cerr << "[Supervisor] Escalated to human: " << decision.reasoning << std::endl;
            break;

        case DecisionType::EndWorkflow:
            state.workflowStatus = WorkflowStatus::Completed;
            state.nextAction = "end";
            state.completionReason = decision.reasoning;
            if (m_config.verbose) {
                std::cout << "[Supervisor] Workflow completed: " << decision.reasoning << std::endl;
            }
            break;

        case DecisionType::ContinueWorkflow:
            // A hold must not leave an earlier hand-off for an executor to pick up.
            if (decision.action == kAwaitHumanAction) clearStagedWork(state);
            break;

        case DecisionType::ResolveConflict:
            break;
    }

    decision.markExecuted(result);
    m_decisionHistory.push_back(decision);
    m_performanceMonitor.recordDecision(decision);
}

void Supervisor::handleConflictsLocked(AgentState& state) {
    auto conflicts = m_conflictResolver.detectConflicts(state);
    for (const auto& conflict : conflicts) {
        auto outcome = m_conflictResolver.resolveTracked(conflict.conflictId, state);
        if (IsOk(outcome)) continue;

        SupervisorDecision escalation = faultToEscalation(Fault(outcome), state.workflowId);
        escalation.parameters["conflict_id"] = conflict.conflictId;
        executeDecisionLocked(escalation, state);
    }
}

AgentState Supervisor::processState(AgentState state) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_config.verbose) {
        std::cout << "[Supervisor] Processing workflow " << state.workflowId << "..." << std::endl;
    }

    SituationAnalysis analysis = analyzeLocked(state);
    SupervisorDecision decision = decideLocked(state, analysis);
    executeDecisionLocked(decision, state);

    m_coordinationManager.updateCoordination(state);
    handleConflictsLocked(state);

    StateMutations::AddAgentMessage(state, kAgentName,
        "Strategic decision: " + decision.action + ". Reasoning: " + decision.reasoning,
        kSupervisorMessagePriority,
        {
            {"decision_id", decision.id},
            {"decision_type", DecisionTypeToString(decision.decisionType)},
            {"confidence", decision.confidence},
            {"target_agent", decision.targetAgent ? json(*decision.targetAgent) : json(nullptr)}
        });

    m_performanceMonitor.updateMonitoringData(state);
    m_performanceMonitor.generateRecommendations();

    state.humanApprovalRequired = awaitingLocked(state.workflowId);
    return state;
}

// --- Task dispatch ---

Result<json> Supervisor::executeTask(const std::string& task, const json& data, AgentState& state) {
    std::lock_guard<std::mutex> lock(m_mutex);

    try {
        if (task == "make_routing_decision") return routingDecisionTask(state);
        if (task == "coordinate_agents") return coordinateAgentsTask(data, state);
        if (task == "resolve_conflict") return resolveConflictTask(data, state);
        if (task == "monitor_performance") return monitorPerformanceTask(state);
        if (task == "escalate_to_human") return escalateTask(data, state);
    } catch (const json::exception& e) {
        std::cerr << "[Supervisor] Malformed data for task " << task << ": " << e.what() << std::endl;
        return SupervisorFault{ErrorKind::InvalidDecision, "malformed data for task " + task + ": " + e.what()};
    }

    std::cerr << "[Supervisor] Unknown task: " << task << std::endl;
    return SupervisorFault{ErrorKind::UnknownTask, "unknown task: " + task};
}

json Supervisor::routingDecisionTask(AgentState& state) {
    SituationAnalysis analysis = analyzeLocked(state);
    SupervisorDecision decision = decideLocked(state, analysis);

    // Escalations take effect immediately; routing is only proposed to the caller.
    if (decision.decisionType == DecisionType::EscalateToHuman) {
        executeDecisionLocked(decision, state);
    }
    return {{"decision", decision}, {"analysis", analysis}};
}

Result<json> Supervisor::coordinateAgentsTask(const json& data, AgentState& state) {
    const auto agents = data.value("agents", std::vector<std::string>{});
    const std::string mode = data.value("coordination_type", std::string("sequential"));

    if (!data.value("apply", false) || agents.empty()) {
        auto plan = m_coordinationManager.createCoordinationPlan(agents, mode, state);
        if (!IsOk(plan)) return Fault(plan);
        return json{{"coordination_plan", Value(plan)}};
    }

    if (!CoordinationModeFromString(mode)) {
        return SupervisorFault{ErrorKind::InvalidDecision, "unsupported coordination type: " + mode};
    }

    DecisionDraft draft;
    draft.decisionType = DecisionType::CoordinateAgents;
    draft.targetAgents = agents;
    draft.action = "coordinate_agents";
    draft.reasoning = "Coordinating " + std::to_string(agents.size()) + " agents (" + mode + ")";
    draft.priority = Priority::Medium;
    draft.parameters = {{"coordination_type", mode}};

    SupervisorDecision decision = DecisionEngine::Stamp(draft, state.workflowId);
    executeDecisionLocked(decision, state);
    if (decision.executionResult.value("status", std::string()) != "success") {
        return SupervisorFault{ErrorKind::InvalidDecision, decision.executionResult.value("error", std::string())};
    }
    return json{
        {"coordination_plan", decision.executionResult["coordination_plan"]},
        {"decision_id", decision.id}
    };
}

Result<json> Supervisor::resolveConflictTask(const json& data, AgentState& state) {
    const json conflictData = data.value("conflict_data", json::object());

    ConflictResolution conflict;
    conflict.conflictingAgents = conflictData.value("agents", std::vector<std::string>{});
    conflict.conflictType = conflictData.value("type", std::string("unknown"));
    conflict.subject = conflictData.value("subject", std::string());
    conflict.description = conflictData.value("description", std::string());
    conflict.resolutionStrategy = "supervisor_mediation";

    if (conflict.conflictingAgents.size() < 2) {
        return SupervisorFault{ErrorKind::InvalidDecision, "a conflict needs at least two agents"};
    }

    const std::string conflictId = m_conflictResolver.track(std::move(conflict)).conflictId;
    auto outcome = m_conflictResolver.resolveTracked(conflictId, state);
    if (!IsOk(outcome)) {
        SupervisorDecision escalation = faultToEscalation(Fault(outcome), state.workflowId);
        escalation.parameters["conflict_id"] = conflictId;
        executeDecisionLocked(escalation, state);
        return Fault(outcome);
    }
    return json{{"resolution_result", Value(outcome)}};
}

json Supervisor::monitorPerformanceTask(const AgentState& state) {
    m_performanceMonitor.updateMonitoringData(state);
    auto recommendations = m_performanceMonitor.generateRecommendations();
    return {
        {"performance_data", m_performanceMonitor.snapshot()},
        {"recommendations", recommendations}
    };
}

json Supervisor::escalateTask(const json& data, AgentState& state) {
    DecisionDraft draft;
    draft.decisionType = DecisionType::EscalateToHuman;
    draft.action = "escalate_to_human";
    draft.reasoning = data.value("reason", std::string("Manual escalation requested"));
    draft.priority = Priority::High;
    draft.parameters = {{"context", data.value("context", json::object())}};

    SupervisorDecision decision = DecisionEngine::Stamp(draft, state.workflowId);
    executeDecisionLocked(decision, state, true);
    return {{"escalation_id", decision.id}, {"status", "escalated"}};
}

// --- Human escalation state machine ---

SupervisorDecision Supervisor::escalateToHuman(const std::string& reason, const json& context,
                                               const std::string& workflowId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    DecisionDraft draft;
    draft.decisionType = DecisionType::EscalateToHuman;
    draft.action = "escalate_to_human";
    draft.reasoning = reason;
    draft.priority = Priority::High;
    draft.parameters = {{"context", context}};

    SupervisorDecision decision = DecisionEngine::Stamp(draft, workflowId);
    enqueueEscalationLocked(decision, true);
    decision.markExecuted({{"status", "success"}});
    m_decisionHistory.push_back(decision);
    m_performanceMonitor.recordDecision(decision);

    std::cerr << "[Supervisor] Escalated to human: " << reason << std::endl;
    return decision;
}

HumanResponse Supervisor::answerLocked(const std::string& response) {
    const std::string answer = Normalize(response);
    if (answer != "approve" && answer != "reject") {
        return {"clarification_needed", "", "Please respond with approve/reject"};
    }

    const bool approved = answer == "approve";
    for (const auto& pending : m_pendingHumanDecisions) {
        auto it = std::find_if(m_decisionHistory.begin(), m_decisionHistory.end(),
            [&](const SupervisorDecision& d) { return d.id == pending.id; });
        if (it != m_decisionHistory.end()) {
            it->parameters["human_approved"] = approved;
        }
    }
    m_pendingHumanDecisions.clear();
    m_humanApprovalRequired = false;

    if (m_config.verbose) {
        std::cout << "[Supervisor] Human response: " << answer << std::endl;
    }
    return approved ? HumanResponse{"approved", "continue", ""} : HumanResponse{"rejected", "abort", ""};
}

HumanResponse Supervisor::handleHumanResponse(const std::string& response) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return answerLocked(response);
}

HumanResponse Supervisor::handleHumanResponse(const std::string& response, AgentState& state) {
    std::lock_guard<std::mutex> lock(m_mutex);
    HumanResponse answer = answerLocked(response);
    if (answer.status != "clarification_needed") {
        state.humanApprovalRequired = false;
        state.escalationReason.clear();
    }
    return answer;
}

bool Supervisor::awaitingLocked(const std::string& workflowId) const {
    if (!m_humanApprovalRequired) return false;
    return std::any_of(m_pendingHumanDecisions.begin(), m_pendingHumanDecisions.end(),
        [&](const SupervisorDecision& d) { return d.workflowId == workflowId || d.workflowId.empty(); });
}

bool Supervisor::isAwaitingHuman() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_humanApprovalRequired;
}

bool Supervisor::isAwaitingHuman(const std::string& workflowId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return awaitingLocked(workflowId);
}

std::vector<SupervisorDecision> Supervisor::pendingHumanDecisions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pendingHumanDecisions;
}

// --- Host feedback & read access ---

void Supervisor::recordAgentResult(const std::string& workflowId, const std::string& agent,
                                   const AgentTaskResult& result) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_performanceMonitor.recordAgentResult(agent, result);
    m_coordinationManager.recordTaskOutcome(workflowId, agent, result.success);
    if (!result.success) {
        std::cerr << "[Supervisor] Agent " << agent << " failed: " << result.error << std::endl;
    }
}

std::vector<SupervisorDecision> Supervisor::decisionHistory(size_t limit) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t first = m_decisionHistory.size() > limit ? m_decisionHistory.size() - limit : 0;
    return {m_decisionHistory.begin() + static_cast<std::ptrdiff_t>(first), m_decisionHistory.end()};
}

size_t Supervisor::decisionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_decisionHistory.size();
}

PerformanceMonitoring Supervisor::monitoringSnapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_performanceMonitor.snapshot();
}

json Supervisor::performanceSummary() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return {
        {"monitoring_data", m_performanceMonitor.snapshot()},
        {"decision_count", m_decisionHistory.size()},
        {"active_conflicts", m_conflictResolver.unresolvedCount()},
        {"workflow_coordinations", m_coordinationManager.coordinationCount()},
        {"pending_human_decisions", m_pendingHumanDecisions.size()}
    };
}

std::optional<WorkflowCoordination> Supervisor::coordination(const std::string& workflowId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_coordinationManager.getCoordination(workflowId);
}

std::vector<ConflictResolution> Supervisor::activeConflicts() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_conflictResolver.activeConflicts();
}

void Supervisor::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_decisionHistory.clear();
    m_pendingHumanDecisions.clear();
    m_humanApprovalRequired = false;
    m_coordinationManager.reset();
    m_conflictResolver.reset();
    m_performanceMonitor.reset();
}

} // namespace dealflow::application
