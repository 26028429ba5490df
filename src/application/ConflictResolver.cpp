/**
 * @file ConflictResolver.cpp
 * @brief Implementation of ConflictResolver.
 */

#include "application/ConflictResolver.hpp"

#include <algorithm>
#include <iostream>
#include <set>

#include "infrastructure/IdGenerator.hpp"

namespace dealflow::application {

using namespace dealflow::domain;

namespace {

constexpr const char* kPriorityBased = "priority_based";

std::string JoinAgents(const std::vector<std::string>& agents) {
    std::string out;
    for (const auto& agent : agents) {
        if (!out.empty()) out += ", ";
        out += agent;
    }
    return out;
}

} // namespace

ConflictResolver::ConflictResolver(std::map<std::string, int> agentPriorities, bool verbose)
    : m_agentPriorities(std::move(agentPriorities)), m_verbose(verbose) {}

int ConflictResolver::rankOf(const std::string& agent) const {
    auto it = m_agentPriorities.find(agent);
    return it == m_agentPriorities.end() ? 0 : it->second;
}

std::string ConflictResolver::pickWinner(const std::vector<std::string>& agents) const {
    std::string winner;
    int best = 0;
    for (const auto& agent : agents) {
        int rank = rankOf(agent);
        if (winner.empty() || rank > best) {
            winner = agent;
            best = rank;
        }
    }
    return winner;
}

std::string ConflictResolver::signatureOf(const ConflictResolution& conflict) const {
    auto agents = conflict.conflictingAgents;
    std::sort(agents.begin(), agents.end());
    return conflict.conflictType + "|" + conflict.subject + "|" + JoinAgents(agents);
}

void ConflictResolver::upsertDetected(ConflictResolution candidate, std::vector<ConflictResolution>& out) {
    const std::string signature = signatureOf(candidate);
    auto open = m_openBySignature.find(signature);
    if (open != m_openBySignature.end()) {
        out.push_back(m_conflicts.at(open->second));
        return;
    }
    out.push_back(track(std::move(candidate)));
}

ConflictResolution& ConflictResolver::track(ConflictResolution conflict) {
    if (conflict.conflictId.empty()) {
        conflict.conflictId = infrastructure::IdGenerator::Generate("conf-");
    }
    const std::string id = conflict.conflictId;
    if (!conflict.isResolved()) {
        m_openBySignature[signatureOf(conflict)] = id;
    }
    auto [it, inserted] = m_conflicts.insert_or_assign(id, std::move(conflict));
    (void)inserted;
    return it->second;
}

std::vector<ConflictResolution> ConflictResolver::detectConflicts(const AgentState& state) {
    std::vector<ConflictResolution> found;

    // Resource contention: two or more distinct active agents holding the same resource.
    std::map<std::string, std::vector<std::string>> claimants;
    for (const auto& claim : state.resourceClaims) {
        if (state.activeAgents.count(claim.agent) == 0) continue;
        auto& agents = claimants[claim.resource];
        if (std::find(agents.begin(), agents.end(), claim.agent) == agents.end()) {
            agents.push_back(claim.agent);
        }
    }
    for (const auto& [resource, agents] : claimants) {
        if (agents.size() < 2) continue;
        ConflictResolution conflict;
        conflict.conflictingAgents = agents;
        conflict.conflictType = conflict_type::Resource;
        conflict.subject = resource;
        conflict.description = "Agents " + JoinAgents(agents) + " claim resource " + resource;
        conflict.resolutionStrategy = kPriorityBased;
        upsertDetected(std::move(conflict), found);
    }

    // Contradictory proposals: active agents wanting different actions on one subject.
    std::map<std::string, std::vector<const ActionProposal*>> bySubject;
    for (const auto& proposal : state.proposals) {
        if (state.activeAgents.count(proposal.agent) == 0) continue;
        bySubject[proposal.subject].push_back(&proposal);
    }
    for (const auto& [subject, proposals] : bySubject) {
        std::set<std::string> actions;
        std::vector<std::string> agents;
        for (const auto* p : proposals) {
            actions.insert(p->action);
            if (std::find(agents.begin(), agents.end(), p->agent) == agents.end()) {
                agents.push_back(p->agent);
            }
        }
        if (actions.size() < 2 || agents.size() < 2) continue;

        ConflictResolution conflict;
        conflict.conflictingAgents = agents;
        conflict.conflictType = conflict_type::Decision;
        conflict.subject = subject;
        conflict.description = "Agents " + JoinAgents(agents) + " propose different actions for " + subject;
        conflict.resolutionStrategy = kPriorityBased;
        upsertDetected(std::move(conflict), found);
    }

    return found;
}

Result<ResolutionOutcome> ConflictResolver::resolveConflict(ConflictResolution& conflict, AgentState& state) {
    ResolutionOutcome outcome;
    outcome.conflictId = conflict.conflictId;

    if (conflict.isResolved()) {
        outcome.resolved = true;
        outcome.strategy = conflict.resolutionStrategy;
        outcome.actionsTaken = conflict.actionsTaken;
        outcome.winningAgent = conflict.winningAgent;
        return outcome;
    }

    if (conflict.conflictType != conflict_type::Resource && conflict.conflictType != conflict_type::Decision) {
        std::cerr << "[ConflictResolver] No strategy for conflict type '" << conflict.conflictType
                  << "' (" << conflict.conflictId << ")" << std::endl;
        return SupervisorFault{ErrorKind::UnhandledConflictType,
            "no resolution strategy for conflict type '" + conflict.conflictType + "'"};
    }

    const std::string winner = pickWinner(conflict.conflictingAgents);
    std::vector<std::string> actions;

    if (conflict.conflictType == conflict_type::Resource) {
        state.resourceClaims.erase(
            std::remove_if(state.resourceClaims.begin(), state.resourceClaims.end(),
                [&](const ResourceClaim& c) {
                    return c.resource == conflict.subject && c.agent != winner &&
                           std::find(conflict.conflictingAgents.begin(), conflict.conflictingAgents.end(),
                                     c.agent) != conflict.conflictingAgents.end();
                }),
            state.resourceClaims.end());
        for (auto& deal : state.currentDeals) {
            if (deal.id == conflict.subject) deal.assignedTo = winner;
        }
        actions.push_back("Reallocated resources");
    } else {
        state.proposals.erase(
            std::remove_if(state.proposals.begin(), state.proposals.end(),
                [&](const ActionProposal& p) {
                    return p.subject == conflict.subject && p.agent != winner;
                }),
            state.proposals.end());
        actions.push_back("Applied priority-based resolution");
    }

    m_openBySignature.erase(signatureOf(conflict));
    conflict.markResolved(kPriorityBased, actions, winner);

    // Keep the tracked copy in step when the caller resolved a copy.
    auto tracked = m_conflicts.find(conflict.conflictId);
    if (tracked != m_conflicts.end() && &tracked->second != &conflict) {
        tracked->second = conflict;
    }

    if (m_verbose) {
        std::cout << "[ConflictResolver] Resolved " << conflict.conflictType << " on '" << conflict.subject
                  << "' in favour of " << winner << std::endl;
    }

    outcome.resolved = true;
    outcome.strategy = conflict.resolutionStrategy;
    outcome.actionsTaken = conflict.actionsTaken;
    outcome.winningAgent = conflict.winningAgent;
    return outcome;
}

Result<ResolutionOutcome> ConflictResolver::resolveTracked(const std::string& conflictId, AgentState& state) {
    auto it = m_conflicts.find(conflictId);
    if (it == m_conflicts.end()) {
        return SupervisorFault{ErrorKind::InvalidDecision, "unknown conflict id: " + conflictId};
    }
    return resolveConflict(it->second, state);
}

std::vector<ConflictResolution> ConflictResolver::activeConflicts() const {
    std::vector<ConflictResolution> out;
    for (const auto& [id, conflict] : m_conflicts) {
        if (!conflict.isResolved()) out.push_back(conflict);
    }
    return out;
}

size_t ConflictResolver::unresolvedCount() const {
    return static_cast<size_t>(std::count_if(m_conflicts.begin(), m_conflicts.end(),
        [](const auto& entry) { return !entry.second.isResolved(); }));
}

void ConflictResolver::reset() {
    m_conflicts.clear();
    m_openBySignature.clear();
}

} // namespace dealflow::application
