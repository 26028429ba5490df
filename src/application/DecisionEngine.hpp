/**
 * @file DecisionEngine.hpp
 * @brief Evaluates the decision rule catalog against the current workflow.
 */

#pragma once

#include <optional>
#include <vector>

#include "domain/AgentState.hpp"
#include "domain/DecisionRule.hpp"
#include "domain/SituationAnalysis.hpp"
#include "domain/SupervisorConfig.hpp"
#include "domain/SupervisorDecision.hpp"
#include "domain/SupervisorError.hpp"

namespace dealflow::application {

/**
 * @class DecisionEngine
 * @brief Pure rule evaluator: same state and analysis, same decision (ids aside).
 *
 * Rules run in descending priority with escalate_to_human pinned first. The first
 * draft at or above the confidence threshold wins; otherwise the default scout
 * routing at 0.5 confidence is returned.
 */
class DecisionEngine {
public:
    explicit DecisionEngine(const domain::SupervisorConfig& config);

    /**
     * @brief Builds the ordered catalog from configuration.
     * @throws domain::SupervisorException (ConfigurationError) for an unusable catalog.
     */
    void initialize();

    bool isInitialized() const { return m_initialized; }

    /**
     * @brief Selects the decision for this tick.
     * @return The decision, or a fault (ConfigurationError before initialize(),
     *         InvalidDecision when a rule produces an inconsistent draft).
     */
    domain::Result<domain::SupervisorDecision> makeDecision(const domain::AgentState& state,
                                                           const domain::SituationAnalysis& analysis) const;

    /** @brief Evaluates a single rule. Exposed for tests and diagnostics. */
    std::optional<domain::DecisionDraft> evaluate(const domain::DecisionRule& rule,
                                                  const domain::AgentState& state,
                                                  const domain::SituationAnalysis& analysis) const;

    /** @brief Rules in evaluation order. Empty until initialize(). */
    const std::vector<domain::DecisionRule>& rules() const { return m_rules; }

    double confidenceThreshold() const { return m_config.confidenceThreshold; }

    static domain::DecisionDraft DefaultDraft();

    /** @brief Checks confidence range and the fields each decision type needs. */
    static std::optional<domain::SupervisorFault> Validate(const domain::DecisionDraft& draft);

    /** @brief Stamps a draft with an id, workflow and creation time. */
    static domain::SupervisorDecision Stamp(const domain::DecisionDraft& draft, const std::string& workflowId);

private:
    domain::SupervisorConfig m_config;
    std::vector<domain::DecisionRule> m_rules;
    bool m_initialized = false;
};

} // namespace dealflow::application
