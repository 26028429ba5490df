/**
 * @file DecisionRule.hpp
 * @brief Tagged entries of the decision rule catalog.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace dealflow::domain {

/**
 * @enum RuleKind
 * @brief Tag selecting the predicate a rule evaluates.
 */
enum class RuleKind {
    EscalateToHuman,   ///< System health critical.
    RouteToAnalyst,    ///< Open deals waiting for analysis.
    RouteToNegotiator, ///< Approved deals without outreach.
    EndWorkflow,       ///< Every deal closed, nothing negotiating.
    RouteToScout       ///< Pipeline below the low-water mark.
};

inline std::string RuleKindToName(RuleKind kind) {
    switch (kind) {
        case RuleKind::EscalateToHuman: return "escalate_to_human";
        case RuleKind::RouteToAnalyst: return "route_to_analyst";
        case RuleKind::RouteToNegotiator: return "route_to_negotiator";
        case RuleKind::EndWorkflow: return "end_workflow";
        case RuleKind::RouteToScout: return "route_to_scout";
    }
    return "unknown";
}

inline std::optional<RuleKind> RuleKindFromName(const std::string& name) {
    if (name == "escalate_to_human") return RuleKind::EscalateToHuman;
    if (name == "route_to_analyst") return RuleKind::RouteToAnalyst;
    if (name == "route_to_negotiator") return RuleKind::RouteToNegotiator;
    if (name == "end_workflow") return RuleKind::EndWorkflow;
    if (name == "route_to_scout") return RuleKind::RouteToScout;
    return std::nullopt;
}

/**
 * @struct DecisionRule
 * @brief One catalog entry. Higher priority is evaluated earlier.
 */
struct DecisionRule {
    RuleKind kind;
    std::string name;
    int priority = 0;
    double confidence = 1.0;
    bool enabled = true;
};

/** @brief The catalog shipped with the engine when no configuration overrides it. */
inline std::vector<DecisionRule> DefaultRuleCatalog() {
    return {
        {RuleKind::EscalateToHuman, "escalate_to_human", 100, 1.0, true},
        {RuleKind::RouteToAnalyst, "route_to_analyst", 80, 0.95, true},
        {RuleKind::RouteToNegotiator, "route_to_negotiator", 70, 0.92, true},
        {RuleKind::EndWorkflow, "end_workflow", 60, 0.85, true},
        {RuleKind::RouteToScout, "route_to_scout", 50, 0.90, true},
    };
}

} // namespace dealflow::domain
