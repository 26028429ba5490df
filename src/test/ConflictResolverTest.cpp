#include <cassert>
#include <iostream>

#include "application/ConflictResolver.hpp"
#include "domain/StateMutations.hpp"
#include "domain/SupervisorConfig.hpp"

using namespace dealflow::domain;
using dealflow::application::ConflictResolver;

namespace {

AgentState ContendedState() {
    AgentState state;
    state.workflowId = "wf-conflict";
    Deal deal;
    deal.id = "deal-7";
    deal.status = deal_status::Approved;
    StateMutations::UpsertDeal(state, deal);
    StateMutations::ActivateAgent(state, "scout");
    StateMutations::ActivateAgent(state, "analyst");
    StateMutations::ClaimResource(state, "scout", "deal-7");
    StateMutations::ClaimResource(state, "analyst", "deal-7");
    return state;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConflictResolver Test..." << std::endl;

    SupervisorConfig config;
    ConflictResolver resolver(config.agentPriorities, false);

    // A clean state has no conflicts.
    {
        AgentState clean;
        StateMutations::ActivateAgent(clean, "scout");
        StateMutations::ClaimResource(clean, "scout", "deal-1");
        assert(resolver.detectConflicts(clean).empty());
        assert(resolver.unresolvedCount() == 0);
        std::cout << "[PASS] Clean state yields no conflicts." << std::endl;
    }

    // Shared claim is detected once, however often we look.
    AgentState state = ContendedState();
    {
        auto first = resolver.detectConflicts(state);
        auto again = resolver.detectConflicts(state);
        assert(first.size() == 1);
        assert(again.size() == 1);
        assert(first[0].conflictId == again[0].conflictId);
        assert(first[0].conflictType == conflict_type::Resource);
        assert(first[0].subject == "deal-7");
        assert(resolver.unresolvedCount() == 1);
        std::cout << "[PASS] Resource conflict detected without duplicates." << std::endl;
    }

    // Priority-based arbitration: the analyst outranks the scout.
    {
        auto conflictId = resolver.activeConflicts().front().conflictId;
        auto outcome = resolver.resolveTracked(conflictId, state);
        assert(IsOk(outcome));
        assert(Value(outcome).resolved);
        assert(Value(outcome).strategy == "priority_based");
        assert(*Value(outcome).winningAgent == "analyst");
        assert((Value(outcome).actionsTaken == std::vector<std::string>{"Reallocated resources"}));
        assert(state.resourceClaims.size() == 1);
        assert(state.resourceClaims.front().agent == "analyst");
        assert(state.currentDeals.front().assignedTo == std::optional<std::string>("analyst"));
        assert(resolver.unresolvedCount() == 0);

        // Resolving again changes nothing and reports the same outcome.
        AgentState before = state;
        auto repeat = resolver.resolveTracked(conflictId, state);
        assert(IsOk(repeat));
        assert(Value(repeat).actionsTaken == Value(outcome).actionsTaken);
        assert(Value(repeat).winningAgent == Value(outcome).winningAgent);
        assert(state.resourceClaims.size() == before.resourceClaims.size());
        std::cout << "[PASS] Resource conflict resolved once, idempotently." << std::endl;
    }

    // Contradictory proposals on one deal.
    {
        AgentState proposals;
        StateMutations::ActivateAgent(proposals, "negotiator");
        StateMutations::ActivateAgent(proposals, "scout");
        StateMutations::ProposeAction(proposals, "negotiator", "deal-9", "make_offer");
        StateMutations::ProposeAction(proposals, "scout", "deal-9", "drop");
        auto conflicts = resolver.detectConflicts(proposals);
        assert(conflicts.size() == 1);
        assert(conflicts[0].conflictType == conflict_type::Decision);

        auto outcome = resolver.resolveConflict(conflicts[0], proposals);
        assert(IsOk(outcome));
        assert(*Value(outcome).winningAgent == "negotiator");
        assert(proposals.proposals.size() == 1);
        assert(proposals.proposals.front().action == "make_offer");
        assert(resolver.unresolvedCount() == 0);
        std::cout << "[PASS] Decision conflict resolved by agent rank." << std::endl;
    }

    // Inactive agents do not contend.
    {
        AgentState idle = ContendedState();
        StateMutations::DeactivateAgent(idle, "scout");
        ConflictResolver fresh(config.agentPriorities, false);
        assert(fresh.detectConflicts(idle).empty());
        std::cout << "[PASS] Inactive agents are ignored." << std::endl;
    }

    // Conflict kinds without a strategy are reported and stay open.
    {
        ConflictResolution conflict;
        conflict.conflictingAgents = {"scout", "analyst"};
        conflict.conflictType = "budget_conflict";
        conflict.subject = "q3";
        auto& tracked = resolver.track(conflict);
        auto outcome = resolver.resolveConflict(tracked, state);
        assert(!IsOk(outcome));
        assert(Fault(outcome).kind == ErrorKind::UnhandledConflictType);
        assert(!tracked.isResolved());
        assert(resolver.unresolvedCount() == 1);
        std::cout << "[PASS] Unhandled conflict type yields a fault." << std::endl;
    }

    // Unknown agents rank 0; ties keep the first listed.
    {
        assert(resolver.rankOf("stranger") == 0);
        ConflictResolver flat({}, false);
        AgentState tie;
        StateMutations::ActivateAgent(tie, "alpha");
        StateMutations::ActivateAgent(tie, "beta");
        StateMutations::ClaimResource(tie, "beta", "line-1");
        StateMutations::ClaimResource(tie, "alpha", "line-1");
        auto conflicts = flat.detectConflicts(tie);
        auto outcome = flat.resolveConflict(conflicts.front(), tie);
        assert(*Value(outcome).winningAgent == "beta");
        std::cout << "[PASS] Ties go to the first claimant." << std::endl;
    }

    resolver.reset();
    assert(resolver.activeConflicts().empty());

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
