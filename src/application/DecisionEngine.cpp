/**
 * @file DecisionEngine.cpp
 * @brief Implementation of DecisionEngine.
 */

#include "application/DecisionEngine.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <sstream>

#include "infrastructure/IdGenerator.hpp"

namespace dealflow::application {

using namespace dealflow::domain;

namespace {

std::string JoinIssues(const std::vector<std::string>& issues) {
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < issues.size(); ++i) {
        if (i > 0) out << ", ";
        out << issues[i];
    }
    out << "]";
    return out.str();
}

bool NeedsAnalysis(const Deal& deal) {
    return !deal.analyzed && !deal.isClosed();
}

bool ReadyForOutreach(const Deal& deal) {
    return deal.status == deal_status::Approved && !deal.outreachInitiated;
}

} // namespace

DecisionEngine::DecisionEngine(const SupervisorConfig& config)
    : m_config(config) {}

void DecisionEngine::initialize() {
    if (m_config.confidenceThreshold < 0.0 || m_config.confidenceThreshold > 1.0) {
        throw SupervisorException(ErrorKind::ConfigurationError, "confidence threshold outside [0, 1]");
    }

    std::set<std::string> names;
    std::vector<DecisionRule> rules;
    for (const auto& rule : m_config.rules) {
        if (RuleKindToName(rule.kind) != rule.name) {
            throw SupervisorException(ErrorKind::ConfigurationError,
                "rule name '" + rule.name + "' does not match its kind");
        }
        if (!names.insert(rule.name).second) {
            throw SupervisorException(ErrorKind::ConfigurationError, "duplicate rule: " + rule.name);
        }
        if (rule.confidence < 0.0 || rule.confidence > 1.0) {
            throw SupervisorException(ErrorKind::ConfigurationError,
                "rule " + rule.name + " has confidence outside [0, 1]");
        }
        if (rule.enabled) rules.push_back(rule);
    }

    // Human escalation must stay reachable: a critical fault preempts all routing.
    auto escalate = std::find_if(rules.begin(), rules.end(),
        [](const DecisionRule& r) { return r.kind == RuleKind::EscalateToHuman; });
    if (escalate == rules.end()) {
        throw SupervisorException(ErrorKind::ConfigurationError, "escalate_to_human cannot be disabled");
    }
    // A critical system must escalate whatever the threshold.
    if (escalate->confidence != 1.0) {
        throw SupervisorException(ErrorKind::ConfigurationError,
            "escalate_to_human confidence must be 1.0, got " + std::to_string(escalate->confidence));
    }

    std::stable_sort(rules.begin(), rules.end(),
        [](const DecisionRule& a, const DecisionRule& b) { return a.priority > b.priority; });
    std::stable_partition(rules.begin(), rules.end(),
        [](const DecisionRule& r) { return r.kind == RuleKind::EscalateToHuman; });

    m_rules = std::move(rules);
    m_initialized = true;

    if (m_config.verbose) {
        std::cout << "[DecisionEngine] Loaded " << m_rules.size() << " rules, threshold "
                  << m_config.confidenceThreshold << std::endl;
    }
}

std::optional<DecisionDraft> DecisionEngine::evaluate(const DecisionRule& rule,
                                                      const AgentState& state,
                                                      const SituationAnalysis& analysis) const {
    DecisionDraft draft;
    draft.confidence = rule.confidence;

    switch (rule.kind) {
        case RuleKind::EscalateToHuman: {
            if (analysis.systemHealth.status != HealthStatus::Critical) return std::nullopt;
            draft.decisionType = DecisionType::EscalateToHuman;
            draft.action = "human_escalation";
            draft.priority = Priority::Critical;
            draft.reasoning = "System health critical: " + JoinIssues(analysis.systemHealth.issues);
            return draft;
        }
        case RuleKind::RouteToAnalyst: {
            auto pending = std::count_if(state.currentDeals.begin(), state.currentDeals.end(), NeedsAnalysis);
            if (pending == 0) return std::nullopt;
            draft.decisionType = DecisionType::RouteToAgent;
            draft.targetAgent = "analyst";
            draft.action = "analyze";
            draft.priority = Priority::High;
            draft.reasoning = "Found " + std::to_string(pending) + " unanalyzed deals requiring analysis";
            return draft;
        }
        case RuleKind::RouteToNegotiator: {
            auto ready = std::count_if(state.currentDeals.begin(), state.currentDeals.end(), ReadyForOutreach);
            if (ready == 0) return std::nullopt;
            draft.decisionType = DecisionType::RouteToAgent;
            draft.targetAgent = "negotiator";
            draft.action = "negotiate";
            draft.priority = Priority::High;
            draft.reasoning = "Found " + std::to_string(ready) + " approved deals ready for outreach";
            return draft;
        }
        case RuleKind::EndWorkflow: {
            const auto& deals = state.currentDeals;
            bool allClosed = !deals.empty() &&
                std::all_of(deals.begin(), deals.end(), [](const Deal& d) { return d.isClosed(); });
            if (!allClosed || !state.activeNegotiations.empty()) return std::nullopt;
            draft.decisionType = DecisionType::EndWorkflow;
            draft.action = "end";
            draft.priority = Priority::Medium;
            draft.reasoning = "Workflow objectives met: " + std::to_string(deals.size()) + " deals closed";
            return draft;
        }
        case RuleKind::RouteToScout: {
            if (analysis.currentDeals >= m_config.lowWaterMark) return std::nullopt;
            draft.decisionType = DecisionType::RouteToAgent;
            draft.targetAgent = "scout";
            draft.action = "scout";
            draft.priority = Priority::Medium;
            draft.reasoning = "Pipeline has only " + std::to_string(analysis.currentDeals) +
                              " deals, need to scout for more";
            return draft;
        }
    }
    return std::nullopt;
}

Result<SupervisorDecision> DecisionEngine::makeDecision(const AgentState& state,
                                                        const SituationAnalysis& analysis) const {
    if (!m_initialized) {
        return SupervisorFault{ErrorKind::ConfigurationError, "decision engine used before initialize()"};
    }

    for (const auto& rule : m_rules) {
        auto draft = evaluate(rule, state, analysis);
        if (!draft) continue;

        if (auto fault = Validate(*draft)) {
            fault->message = "rule " + rule.name + ": " + fault->message;
            return *fault;
        }
        if (draft->confidence >= m_config.confidenceThreshold) {
            return Stamp(*draft, state.workflowId);
        }
    }

    return Stamp(DefaultDraft(), state.workflowId);
}

DecisionDraft DecisionEngine::DefaultDraft() {
    DecisionDraft draft;
    draft.decisionType = DecisionType::RouteToAgent;
    draft.targetAgent = "scout";
    draft.action = "scout";
    draft.reasoning = "Default action: continue scouting for deals";
    draft.priority = Priority::Medium;
    draft.confidence = 0.5;
    return draft;
}

std::optional<SupervisorFault> DecisionEngine::Validate(const DecisionDraft& draft) {
    if (draft.confidence < 0.0 || draft.confidence > 1.0) {
        return SupervisorFault{ErrorKind::InvalidDecision,
            "confidence " + std::to_string(draft.confidence) + " outside [0, 1]"};
    }
    if (draft.action.empty()) {
        return SupervisorFault{ErrorKind::InvalidDecision, "decision has no action"};
    }
    switch (draft.decisionType) {
        case DecisionType::RouteToAgent:
            if (!draft.targetAgent || draft.targetAgent->empty()) {
                return SupervisorFault{ErrorKind::InvalidDecision, "route_to_agent without target agent"};
            }
            break;
        case DecisionType::CoordinateAgents:
            if (draft.targetAgents.empty()) {
                return SupervisorFault{ErrorKind::InvalidDecision, "coordinate_agents without target agents"};
            }
            break;
        case DecisionType::EscalateToHuman:
            if (draft.reasoning.empty()) {
                return SupervisorFault{ErrorKind::InvalidDecision, "escalation without reasoning"};
            }
            break;
        default:
            break;
    }
    return std::nullopt;
}

SupervisorDecision DecisionEngine::Stamp(const DecisionDraft& draft, const std::string& workflowId) {
    SupervisorDecision decision;
    decision.id = infrastructure::IdGenerator::Generate("dec-");
    decision.workflowId = workflowId;
    decision.decisionType = draft.decisionType;
    decision.targetAgent = draft.targetAgent;
    decision.targetAgents = draft.targetAgents;
    decision.action = draft.action;
    decision.reasoning = draft.reasoning;
    decision.priority = draft.priority;
    decision.confidence = draft.confidence;
    decision.parameters = draft.parameters;
    decision.createdAt = Clock::now();
    return decision;
}

} // namespace dealflow::application
