/**
 * @file ConflictResolver.hpp
 * @brief Detects and arbitrates conflicting claims and proposals between agents.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "domain/AgentState.hpp"
#include "domain/ConflictResolution.hpp"
#include "domain/SupervisorError.hpp"

namespace dealflow::application {

/**
 * @class ConflictResolver
 * @brief Tracks conflicts until they are resolved; nothing expires on its own.
 */
class ConflictResolver {
public:
    /** @param agentPriorities Rank per agent; higher wins. Unknown agents rank 0. */
    explicit ConflictResolver(std::map<std::string, int> agentPriorities, bool verbose = true);

    /**
     * @brief Scans the state for contention among active agents.
     *
     * A clean state yields an empty list. A conflict already tracked and still
     * unresolved is returned again instead of being duplicated.
     */
    std::vector<domain::ConflictResolution> detectConflicts(const domain::AgentState& state);

    /**
     * @brief Arbitrates one conflict with the priority-based strategy.
     *
     * Resolving an already resolved record returns its stored actions and touches
     * nothing. Conflict kinds without a strategy yield UnhandledConflictType and the
     * record stays unresolved.
     */
    domain::Result<domain::ResolutionOutcome> resolveConflict(domain::ConflictResolution& conflict,
                                                             domain::AgentState& state);

    /** @brief Resolves a tracked conflict by id. */
    domain::Result<domain::ResolutionOutcome> resolveTracked(const std::string& conflictId,
                                                            domain::AgentState& state);

    /** @brief Registers a conflict reported from outside (e.g. via a task request). */
    domain::ConflictResolution& track(domain::ConflictResolution conflict);

    std::vector<domain::ConflictResolution> activeConflicts() const;
    size_t unresolvedCount() const;

    int rankOf(const std::string& agent) const;

    void reset();

private:
    /** @brief Highest-ranked agent; ties keep the earliest listed. */
    std::string pickWinner(const std::vector<std::string>& agents) const;
    std::string signatureOf(const domain::ConflictResolution& conflict) const;
    void upsertDetected(domain::ConflictResolution candidate, std::vector<domain::ConflictResolution>& out);

    std::map<std::string, int> m_agentPriorities;
    bool m_verbose;
    std::map<std::string, domain::ConflictResolution> m_conflicts;      // conflictId -> record
    std::map<std::string, std::string> m_openBySignature;               // signature -> conflictId
};

} // namespace dealflow::application
