#include <cassert>
#include <iostream>

#include "application/Supervisor.hpp"
#include "domain/StateMutations.hpp"

using json = nlohmann::json;
using namespace dealflow::domain;
using dealflow::application::Supervisor;

namespace {

SupervisorConfig QuietConfig() {
    SupervisorConfig config;
    config.verbose = false;
    return config;
}

AgentState FreshWorkflow(const std::string& id) {
    AgentState state;
    state.workflowId = id;
    state.workflowStatus = WorkflowStatus::Running;
    return state;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Supervisor Test..." << std::endl;

    Supervisor supervisor(QuietConfig());
    supervisor.initialize();

    // One tick on an empty pipeline routes to the scout and records a message.
    {
        AgentState state = supervisor.processState(FreshWorkflow("wf-1"));
        assert(state.nextAction && *state.nextAction == "scout");
        assert(state.currentStep == "scout");
        assert(!state.agentMessages.empty());
        const auto& last = state.agentMessages.back();
        assert(last.agentType == "supervisor");
        assert(last.priority == 3);
        assert(last.message.rfind("Strategic decision: scout", 0) == 0);
        assert(last.data["decision_type"] == "route_to_agent");

        auto history = supervisor.decisionHistory();
        assert(history.size() == 1);
        assert(history[0].executed);
        assert(history[0].executedAt.has_value());
        assert(!state.humanApprovalRequired);
        assert(supervisor.coordination("wf-1").has_value());
        std::cout << "[PASS] Tick routes and records the decision." << std::endl;
    }

    // Every deal closed: the workflow completes and its coordination is archived.
    {
        AgentState state = FreshWorkflow("wf-2");
        Deal closed;
        closed.id = "d1";
        closed.status = deal_status::Closed;
        StateMutations::UpsertDeal(state, closed);
        state = supervisor.processState(state);
        assert(state.workflowStatus == WorkflowStatus::Completed);
        assert(state.nextAction && *state.nextAction == "end");
        assert(!state.completionReason.empty());
        assert(supervisor.coordination("wf-2")->archived);
        std::cout << "[PASS] Closed pipeline completes the workflow." << std::endl;
    }

    // Task dispatch.
    {
        AgentState state = FreshWorkflow("wf-3");
        auto routing = supervisor.executeTask("make_routing_decision", json::object(), state);
        assert(IsOk(routing));
        assert(Value(routing)["decision"]["target_agent"] == "scout");
        assert(Value(routing).contains("analysis"));

        auto plan = supervisor.executeTask("coordinate_agents",
            {{"agents", {"scout", "analyst"}}, {"coordination_type", "sequential"}, {"apply", true}}, state);
        assert(IsOk(plan));
        assert(Value(plan)["coordination_plan"]["steps"].size() == 2);
        assert(Value(plan).contains("decision_id"));
        assert((state.agentQueue == std::vector<std::string>{"analyst"}));
        auto coordinated = supervisor.decisionHistory(1).front();
        assert(coordinated.decisionType == DecisionType::CoordinateAgents);
        assert(coordinated.id == Value(plan)["decision_id"]);
        assert(coordinated.executionResult["coordination_id"] == Value(plan)["coordination_plan"]["coordination_id"]);

        auto badPlan = supervisor.executeTask("coordinate_agents",
            {{"agents", {"scout"}}, {"coordination_type", "swarm"}}, state);
        assert(!IsOk(badPlan) && Fault(badPlan).kind == ErrorKind::InvalidDecision);

        auto monitoring = supervisor.executeTask("monitor_performance", json::object(), state);
        assert(IsOk(monitoring));
        assert(Value(monitoring).contains("performance_data"));
        assert(Value(monitoring)["recommendations"].is_array());

        auto resolved = supervisor.executeTask("resolve_conflict",
            {{"conflict_data", {{"agents", {"scout", "negotiator"}}, {"type", "decision_conflict"}, {"subject", "d9"}}}},
            state);
        assert(IsOk(resolved));
        assert(Value(resolved)["resolution_result"]["winning_agent"] == "negotiator");

        auto unknown = supervisor.executeTask("brew_coffee", json::object(), state);
        assert(!IsOk(unknown));
        assert(Fault(unknown).kind == ErrorKind::UnknownTask);

        auto malformed = supervisor.executeTask("coordinate_agents", {{"agents", 42}}, state);
        assert(!IsOk(malformed) && Fault(malformed).kind == ErrorKind::InvalidDecision);

        assert(Supervisor::availableTasks().size() == 5);
        std::cout << "[PASS] Supervisor tasks dispatch and unknown tasks fault." << std::endl;
    }

    // Human escalation: approve, reject, clarification.
    {
        supervisor.reset();
        assert(supervisor.decisionCount() == 0);

        auto escalation = supervisor.escalateToHuman("Offer exceeds budget", {{"deal_id", "d5"}}, "wf-4");
        assert(escalation.decisionType == DecisionType::EscalateToHuman);
        assert(supervisor.isAwaitingHuman());
        assert(supervisor.isAwaitingHuman("wf-4"));
        assert(!supervisor.isAwaitingHuman("wf-other"));
        assert(supervisor.pendingHumanDecisions().size() == 1);

        auto unclear = supervisor.handleHumanResponse("maybe later");
        assert(unclear.status == "clarification_needed");
        assert(unclear.message == "Please respond with approve/reject");
        assert(supervisor.isAwaitingHuman());

        AgentState state = FreshWorkflow("wf-4");
        state.humanApprovalRequired = true;
        auto approved = supervisor.handleHumanResponse("  Approve ", state);
        assert(approved.status == "approved");
        assert(approved.action == "continue");
        assert(supervisor.pendingHumanDecisions().empty());
        assert(!supervisor.isAwaitingHuman());
        assert(!state.humanApprovalRequired);
        assert(supervisor.decisionHistory().back().parameters["human_approved"] == true);

        supervisor.escalateToHuman("Seller counter-offer", json::object(), "wf-4");
        auto rejected = supervisor.handleHumanResponse("reject");
        assert(rejected.status == "rejected");
        assert(rejected.action == "abort");
        assert(!supervisor.isAwaitingHuman());
        std::cout << "[PASS] Human escalation state machine." << std::endl;
    }

    // A pending escalation holds routing for its workflow only.
    {
        supervisor.reset();
        AgentState routed = supervisor.processState(FreshWorkflow("wf-5"));
        assert(routed.nextAction && *routed.nextAction == "scout");
        auto staged = supervisor.executeTask("coordinate_agents",
            {{"agents", {"scout", "analyst"}}, {"coordination_type", "sequential"}, {"apply", true}}, routed);
        assert(IsOk(staged));
        assert(!routed.agentQueue.empty());

        supervisor.escalateToHuman("Manual review", json::object(), "wf-5");

        AgentState held = supervisor.processState(routed);
        assert(!held.nextAction);
        assert(held.agentQueue.empty());
        assert(held.humanApprovalRequired);
        assert(supervisor.decisionHistory().back().decisionType == DecisionType::ContinueWorkflow);

        held = supervisor.processState(held);
        assert(!held.nextAction);

        AgentState other = supervisor.processState(FreshWorkflow("wf-6"));
        assert(other.nextAction && *other.nextAction == "scout");
        assert(!other.humanApprovalRequired);

        supervisor.handleHumanResponse("approve", held);
        AgentState resumed = supervisor.processState(held);
        assert(resumed.nextAction && *resumed.nextAction == "scout");
        std::cout << "[PASS] Routing is held only for the escalated workflow." << std::endl;
    }

    // An escalation clears any staged hand-off.
    {
        supervisor.reset();
        AgentState state = supervisor.processState(FreshWorkflow("wf-9"));
        assert(state.nextAction);
        auto result = supervisor.executeTask("escalate_to_human", {{"reason", "Title issue"}}, state);
        assert(IsOk(result));
        assert(!state.nextAction);
        assert(state.agentQueue.empty());
        assert(state.humanApprovalRequired);
        std::cout << "[PASS] Escalation clears staged work." << std::endl;
    }

    // Explicit escalations are queued even when the reason repeats.
    {
        supervisor.reset();
        auto first = supervisor.escalateToHuman("Offer exceeds budget", {{"deal_id", "d1"}}, "wf-10");
        auto second = supervisor.escalateToHuman("Offer exceeds budget", {{"deal_id", "d2"}}, "wf-10");
        auto pending = supervisor.pendingHumanDecisions();
        assert(pending.size() == 2);
        assert(pending[0].id == first.id);
        assert(pending[1].id == second.id);
        supervisor.handleHumanResponse("reject");
        assert(supervisor.pendingHumanDecisions().empty());
        std::cout << "[PASS] Repeated operator escalations are all queued." << std::endl;
    }

    // An engine that cannot decide escalates instead of routing.
    {
        Supervisor uninitialized(QuietConfig());
        AgentState state = uninitialized.processState(FreshWorkflow("wf-11"));
        auto decision = uninitialized.decisionHistory().back();
        assert(decision.decisionType == DecisionType::EscalateToHuman);
        assert(decision.priority == Priority::Critical);
        assert(decision.parameters["error_kind"] == "ConfigurationError");
        assert(state.humanApprovalRequired);
        assert(!state.nextAction);

        state = uninitialized.processState(state);
        assert(!state.nextAction);
        assert(uninitialized.pendingHumanDecisions().size() == 1);
        std::cout << "[PASS] Engine fault becomes a critical escalation." << std::endl;
    }

    // Critical health escalates once per reason, not once per tick.
    {
        supervisor.reset();
        AgentState failing = FreshWorkflow("wf-7");
        failing.workflowStatus = WorkflowStatus::Error;
        failing = supervisor.processState(failing);
        assert(failing.humanApprovalRequired);
        assert(!failing.escalationReason.empty());
        failing = supervisor.processState(failing);
        assert(supervisor.pendingHumanDecisions().size() == 1);
        assert(supervisor.decisionHistory().back().priority == Priority::Critical);
        std::cout << "[PASS] Critical workflow escalates once." << std::endl;
    }

    // An unhandled conflict type escalates instead of failing silently.
    {
        supervisor.reset();
        AgentState state = FreshWorkflow("wf-8");
        auto result = supervisor.executeTask("resolve_conflict",
            {{"conflict_data", {{"agents", {"scout", "analyst"}}, {"type", "budget_conflict"}}}}, state);
        assert(!IsOk(result));
        assert(Fault(result).kind == ErrorKind::UnhandledConflictType);
        assert(state.humanApprovalRequired);
        assert(supervisor.isAwaitingHuman("wf-8"));
        assert(supervisor.activeConflicts().size() == 1);

        auto summary = supervisor.performanceSummary();
        assert(summary["pending_human_decisions"] == 1);
        assert(summary["active_conflicts"] == 1);
        std::cout << "[PASS] Unhandled conflict escalates to human." << std::endl;
    }

    // Agent feedback reaches the monitor.
    {
        AgentTaskResult result;
        result.success = true;
        result.executionTime = 1.5;
        result.confidenceScore = 0.8;
        supervisor.recordAgentResult("wf-8", "analyst", result);
        assert(supervisor.monitoringSnapshot().agentMetrics.at("analyst").tasksCompleted == 1);
        std::cout << "[PASS] Agent results update metrics." << std::endl;
    }

    // History is returned newest last and capped by the limit.
    {
        supervisor.reset();
        for (int i = 0; i < 12; ++i) {
            supervisor.processState(FreshWorkflow("wf-h" + std::to_string(i)));
        }
        assert(supervisor.decisionCount() == 12);
        assert(supervisor.decisionHistory().size() == 10);
        assert(supervisor.decisionHistory(3).size() == 3);
        assert(supervisor.decisionHistory(3).back().workflowId == "wf-h11");
        std::cout << "[PASS] Decision history limit." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
