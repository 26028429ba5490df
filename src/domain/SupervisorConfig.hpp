/**
 * @file SupervisorConfig.hpp
 * @brief Tunables for the supervisor and its subsystems.
 */

#pragma once

#include <chrono>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "domain/AgentState.hpp"
#include "domain/DecisionRule.hpp"

namespace dealflow::domain {

struct SupervisorConfig {
    /// Drafts below this confidence are skipped.
    double confidenceThreshold = 0.8;

    /// Below this many deals the pipeline needs sourcing.
    int lowWaterMark = 5;

    /// A deal in an in-flight status untouched for this long is a bottleneck.
    std::chrono::seconds stallThreshold{300};
    std::set<std::string> inFlightStatuses{deal_status::Analyzing};

    /// Routing concentration check: >= repeatThreshold of the last window decisions.
    int recommendationWindow = 6;
    int recommendationRepeatThreshold = 5;

    /// Agent rank used by priority-based conflict resolution. Unknown agents rank 0.
    std::map<std::string, int> agentPriorities{
        {"analyst", 3},
        {"negotiator", 2},
        {"scout", 1},
    };

    std::vector<DecisionRule> rules = DefaultRuleCatalog();

    /// Informational log lines; warnings are always written.
    bool verbose = true;
};

} // namespace dealflow::domain
