/**
 * @file Supervisor.hpp
 * @brief Façade that runs one supervisor tick and exposes task dispatch and human escalation.
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/ConflictResolver.hpp"
#include "application/CoordinationManager.hpp"
#include "application/DecisionEngine.hpp"
#include "application/PerformanceMonitor.hpp"
#include "domain/AgentState.hpp"
#include "domain/SituationAnalysis.hpp"
#include "domain/SupervisorConfig.hpp"
#include "domain/SupervisorDecision.hpp"
#include "domain/SupervisorError.hpp"
#include "domain/WorkerAgent.hpp"

namespace dealflow::application {

/**
 * @struct HumanResponse
 * @brief Answer to an operator's reply. `action` is empty while clarification is needed.
 */
struct HumanResponse {
    std::string status;  ///< "approved", "rejected", "clarification_needed"
    std::string action;  ///< "continue", "abort"
    std::string message;

    nlohmann::json toJson() const;
};

/**
 * @class Supervisor
 * @brief Orchestrates the decision engine, coordination manager, conflict resolver and
 *        performance monitor for the workflows handed to it.
 *
 * Every public call holds the instance mutex for its whole duration, so one tick is a
 * single read-analyze-decide-write pass. All mutable history lives in this instance;
 * call reset() between independent runs.
 */
class Supervisor {
public:
    explicit Supervisor(domain::SupervisorConfig config = {});

    /**
     * @brief Loads the rule catalog.
     * @throws domain::SupervisorException (ConfigurationError) on a bad catalog.
     */
    void initialize();

    /**
     * @brief Runs one tick: analyse, decide, apply, coordinate, arbitrate, record.
     *
     * Faults from the engine or resolver become CRITICAL escalations. While the
     * workflow awaits a human answer, routing decisions are held.
     */
    domain::AgentState processState(domain::AgentState state);

    /**
     * @brief Runs a named supervisor task.
     * @return JSON task result, or UnknownTask for names outside availableTasks().
     */
    domain::Result<nlohmann::json> executeTask(const std::string& task,
                                               const nlohmann::json& data,
                                               domain::AgentState& state);

    static std::vector<std::string> availableTasks();

    /** @brief Builds the situation summary the decision rules evaluate against. */
    domain::SituationAnalysis analyzeSituation(const domain::AgentState& state) const;

    // Human escalation
    domain::SupervisorDecision escalateToHuman(const std::string& reason,
                                               const nlohmann::json& context,
                                               const std::string& workflowId = "");
    HumanResponse handleHumanResponse(const std::string& response);
    /** @brief As above, and clears the escalation markers on @p state when answered. */
    HumanResponse handleHumanResponse(const std::string& response, domain::AgentState& state);

    bool isAwaitingHuman() const;
    bool isAwaitingHuman(const std::string& workflowId) const;
    std::vector<domain::SupervisorDecision> pendingHumanDecisions() const;

    // Host feedback
    void recordAgentResult(const std::string& workflowId, const std::string& agent,
                           const domain::AgentTaskResult& result);

    // Read access
    std::vector<domain::SupervisorDecision> decisionHistory(size_t limit = 10) const;
    size_t decisionCount() const;
    domain::PerformanceMonitoring monitoringSnapshot() const;
    nlohmann::json performanceSummary() const;
    std::optional<domain::WorkflowCoordination> coordination(const std::string& workflowId) const;
    std::vector<domain::ConflictResolution> activeConflicts() const;
    const domain::SupervisorConfig& config() const { return m_config; }

    /** @brief Drops history, escalations, coordination and conflicts. Rules stay loaded. */
    void reset();

private:
    domain::SituationAnalysis analyzeLocked(const domain::AgentState& state) const;
    domain::SupervisorDecision decideLocked(const domain::AgentState& state,
                                            const domain::SituationAnalysis& analysis);
    domain::SupervisorDecision faultToEscalation(const domain::SupervisorFault& fault,
                                                 const std::string& workflowId) const;
    domain::SupervisorDecision holdForHuman(const domain::SupervisorDecision& held) const;
    /** @param operatorRequest Explicit escalations are always queued; automatic ones are deduplicated. */
    void executeDecisionLocked(domain::SupervisorDecision& decision, domain::AgentState& state,
                               bool operatorRequest = false);
    void enqueueEscalationLocked(const domain::SupervisorDecision& decision, bool operatorRequest);
    static void clearStagedWork(domain::AgentState& state);
    void handleConflictsLocked(domain::AgentState& state);
    bool awaitingLocked(const std::string& workflowId) const;
    HumanResponse answerLocked(const std::string& response);

    nlohmann::json routingDecisionTask(domain::AgentState& state);
    domain::Result<nlohmann::json> coordinateAgentsTask(const nlohmann::json& data, domain::AgentState& state);
    domain::Result<nlohmann::json> resolveConflictTask(const nlohmann::json& data, domain::AgentState& state);
    nlohmann::json monitorPerformanceTask(const domain::AgentState& state);
    nlohmann::json escalateTask(const nlohmann::json& data, domain::AgentState& state);

    domain::SupervisorConfig m_config;
    DecisionEngine m_decisionEngine;
    CoordinationManager m_coordinationManager;
    ConflictResolver m_conflictResolver;
    PerformanceMonitor m_performanceMonitor;

    std::vector<domain::SupervisorDecision> m_decisionHistory;
    std::vector<domain::SupervisorDecision> m_pendingHumanDecisions;
    bool m_humanApprovalRequired = false;

    mutable std::mutex m_mutex;
};

} // namespace dealflow::application
