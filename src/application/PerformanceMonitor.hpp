/**
 * @file PerformanceMonitor.hpp
 * @brief Derives health, bottlenecks, opportunities and recommendations.
 */

#pragma once

#include <deque>
#include <string>
#include <vector>

#include "domain/AgentState.hpp"
#include "domain/PerformanceMonitoring.hpp"
#include "domain/SupervisorConfig.hpp"
#include "domain/SupervisorDecision.hpp"
#include "domain/WorkerAgent.hpp"

namespace dealflow::application {

/**
 * @class PerformanceMonitor
 * @brief Owns the supervisor's PerformanceMonitoring record and a bounded decision window.
 */
class PerformanceMonitor {
public:
    explicit PerformanceMonitor(const domain::SupervisorConfig& config);

    /** @brief Refreshes health, bottlenecks, opportunities and the update timestamp. */
    void updateMonitoringData(const domain::AgentState& state);

    /**
     * @brief Worst-of health for one pass: error workflow is critical, any message of
     *        priority >= 4 is degraded, otherwise healthy.
     */
    domain::SystemHealth assessSystemHealth(const domain::AgentState& state) const;

    /** @brief Deals sitting in an in-flight status longer than the stall threshold. */
    std::vector<std::string> identifyBottlenecks(const domain::AgentState& state,
                                                 domain::TimePoint now = domain::Clock::now()) const;

    /** @brief Approved deals nobody has reached out on yet. */
    std::vector<std::string> identifyOpportunities(const domain::AgentState& state) const;

    /** @brief Pushes a decision into the bounded window used for oscillation checks. */
    void recordDecision(const domain::SupervisorDecision& decision);

    /** @brief Folds an agent task result into that agent's running metrics. */
    void recordAgentResult(const std::string& agent, const domain::AgentTaskResult& result);

    /** @brief Builds recommendations from the decision window and agent metrics. */
    std::vector<domain::Recommendation> generateRecommendations();

    domain::PerformanceMonitoring snapshot() const { return m_monitoring; }
    const std::deque<domain::SupervisorDecision>& recentDecisions() const { return m_recent; }

    void reset();

private:
    domain::SupervisorConfig m_config;
    domain::PerformanceMonitoring m_monitoring;
    std::deque<domain::SupervisorDecision> m_recent;
};

} // namespace dealflow::application
