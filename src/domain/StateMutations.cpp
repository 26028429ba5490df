/**
 * @file StateMutations.cpp
 * @brief Implementation of StateMutations.
 */

#include "domain/StateMutations.hpp"

#include <algorithm>

namespace dealflow::domain {

void StateMutations::AddAgentMessage(AgentState& state,
                                     const std::string& agentType,
                                     const std::string& message,
                                     int priority,
                                     nlohmann::json data) {
    AgentMessage msg;
    msg.agentType = agentType;
    msg.message = message;
    msg.priority = std::clamp(priority, 1, 5);
    msg.timestamp = Clock::now();
    msg.data = std::move(data);
    state.agentMessages.push_back(std::move(msg));
}

void StateMutations::SetNextAction(AgentState& state, const std::string& agent, const std::string& reasoning) {
    state.nextAction = agent;
    state.currentStep = agent;
    AddAgentMessage(state, "supervisor", "Next action: " + agent + " (" + reasoning + ")", 2);
}

void StateMutations::UpsertDeal(AgentState& state, const Deal& deal) {
    auto it = std::find_if(state.currentDeals.begin(), state.currentDeals.end(),
        [&](const Deal& d) { return d.id == deal.id; });
    if (it != state.currentDeals.end()) {
        *it = deal;
    } else {
        state.currentDeals.push_back(deal);
    }
}

void StateMutations::ClaimResource(AgentState& state, const std::string& agent, const std::string& resource) {
    bool alreadyClaimed = std::any_of(state.resourceClaims.begin(), state.resourceClaims.end(),
        [&](const ResourceClaim& c) { return c.agent == agent && c.resource == resource; });
    if (alreadyClaimed) return;

    ResourceClaim claim;
    claim.agent = agent;
    claim.resource = resource;
    claim.claimedAt = Clock::now();
    state.resourceClaims.push_back(claim);
}

void StateMutations::ReleaseResource(AgentState& state, const std::string& agent, const std::string& resource) {
    state.resourceClaims.erase(
        std::remove_if(state.resourceClaims.begin(), state.resourceClaims.end(),
            [&](const ResourceClaim& c) { return c.agent == agent && c.resource == resource; }),
        state.resourceClaims.end());
}

void StateMutations::ProposeAction(AgentState& state, const std::string& agent,
                                   const std::string& subject, const std::string& action) {
    // One live proposal per agent and subject; a newer one replaces the older.
    auto it = std::find_if(state.proposals.begin(), state.proposals.end(),
        [&](const ActionProposal& p) { return p.agent == agent && p.subject == subject; });

    ActionProposal proposal{agent, subject, action, Clock::now()};
    if (it != state.proposals.end()) {
        *it = proposal;
    } else {
        state.proposals.push_back(proposal);
    }
}

void StateMutations::ActivateAgent(AgentState& state, const std::string& agent, const std::string& task) {
    state.activeAgents.insert(agent);
    if (!task.empty()) {
        state.pendingTasks[agent] = task;
    }
}

void StateMutations::DeactivateAgent(AgentState& state, const std::string& agent) {
    state.activeAgents.erase(agent);
    state.pendingTasks.erase(agent);
}

int StateMutations::CountErrorMessages(const AgentState& state) {
    return static_cast<int>(std::count_if(state.agentMessages.begin(), state.agentMessages.end(),
        [](const AgentMessage& m) { return m.priority >= kErrorPriority; }));
}

} // namespace dealflow::domain
