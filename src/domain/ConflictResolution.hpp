/**
 * @file ConflictResolution.hpp
 * @brief Record of a detected conflict between agents and how it was arbitrated.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/AgentState.hpp"

namespace dealflow::domain {

/// Conflict kinds the resolver has strategies for. Callers may name others.
namespace conflict_type {
inline constexpr const char* Resource = "resource_conflict";
inline constexpr const char* Decision = "decision_conflict";
} // namespace conflict_type

/**
 * @struct ConflictResolution
 * @brief A conflict and its outcome. `resolved` moves from false to true once.
 */
struct ConflictResolution {
    std::string conflictId;
    std::vector<std::string> conflictingAgents;
    std::string conflictType;
    std::string subject; ///< Contended resource or deal id.
    std::string description;
    std::string resolutionStrategy;
    std::vector<std::string> actionsTaken;
    std::optional<std::string> winningAgent;
    TimePoint detectedAt = Clock::now();
    std::optional<TimePoint> resolvedAt;

    bool isResolved() const { return m_resolved; }

    /** @brief Terminal transition. Later calls leave the first outcome untouched. */
    void markResolved(std::string strategy, std::vector<std::string> actions, std::optional<std::string> winner) {
        if (m_resolved) return;
        m_resolved = true;
        resolutionStrategy = std::move(strategy);
        actionsTaken = std::move(actions);
        winningAgent = std::move(winner);
        resolvedAt = Clock::now();
    }

private:
    bool m_resolved = false;
};

/**
 * @struct ResolutionOutcome
 * @brief What a resolve call reports back to its caller.
 */
struct ResolutionOutcome {
    std::string conflictId;
    bool resolved = false;
    std::string strategy;
    std::vector<std::string> actionsTaken;
    std::optional<std::string> winningAgent;
};

} // namespace dealflow::domain
