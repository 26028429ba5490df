/**
 * @file PerformanceMonitor.cpp
 * @brief Implementation of PerformanceMonitor.
 */

#include "application/PerformanceMonitor.hpp"

#include <algorithm>
#include <map>

#include "domain/StateMutations.hpp"

namespace dealflow::application {

using namespace dealflow::domain;

namespace {

constexpr size_t kIssueMessagesKept = 5;
constexpr int kMinTasksForReliability = 3;

} // namespace

PerformanceMonitor::PerformanceMonitor(const SupervisorConfig& config)
    : m_config(config) {}

SystemHealth PerformanceMonitor::assessSystemHealth(const AgentState& state) const {
    SystemHealth health;

    std::vector<const AgentMessage*> errors;
    for (const auto& msg : state.agentMessages) {
        if (msg.priority >= StateMutations::kErrorPriority) errors.push_back(&msg);
    }
    size_t first = errors.size() > kIssueMessagesKept ? errors.size() - kIssueMessagesKept : 0;
    for (size_t i = first; i < errors.size(); ++i) {
        health.escalate(HealthStatus::Degraded, errors[i]->message);
    }

    if (state.workflowStatus == WorkflowStatus::Error) {
        health.escalate(HealthStatus::Critical, "Workflow in error state");
    }
    return health;
}

std::vector<std::string> PerformanceMonitor::identifyBottlenecks(const AgentState& state, TimePoint now) const {
    std::vector<std::string> bottlenecks;
    for (const auto& deal : state.currentDeals) {
        if (m_config.inFlightStatuses.count(deal.status) == 0) continue;
        if (now - deal.lastUpdated > m_config.stallThreshold) {
            bottlenecks.push_back("Analysis bottleneck: deal " + deal.id + " stalled");
        }
    }
    return bottlenecks;
}

std::vector<std::string> PerformanceMonitor::identifyOpportunities(const AgentState& state) const {
    std::vector<std::string> opportunities;
    for (const auto& deal : state.currentDeals) {
        if (deal.status == deal_status::Approved && !deal.outreachInitiated) {
            opportunities.push_back("Outreach opportunity: deal " + deal.id + " ready for contact");
        }
    }
    return opportunities;
}

void PerformanceMonitor::updateMonitoringData(const AgentState& state) {
    m_monitoring.systemHealth = assessSystemHealth(state);
    m_monitoring.bottlenecks = identifyBottlenecks(state);
    m_monitoring.opportunities = identifyOpportunities(state);
    m_monitoring.lastMonitoringUpdate = Clock::now();
}

void PerformanceMonitor::recordDecision(const SupervisorDecision& decision) {
    m_recent.push_back(decision);
    while (m_recent.size() > static_cast<size_t>(m_config.recommendationWindow)) {
        m_recent.pop_front();
    }
}

void PerformanceMonitor::recordAgentResult(const std::string& agent, const AgentTaskResult& result) {
    auto& metrics = m_monitoring.agentMetrics[agent];
    const int previous = metrics.totalTasks();

    if (result.success) {
        ++metrics.tasksCompleted;
    } else {
        ++metrics.tasksFailed;
    }

    const double n = static_cast<double>(previous + 1);
    metrics.averageExecutionTime += (result.executionTime - metrics.averageExecutionTime) / n;
    metrics.averageConfidence += (result.confidenceScore - metrics.averageConfidence) / n;
}

std::vector<Recommendation> PerformanceMonitor::generateRecommendations() {
    std::vector<Recommendation> recommendations;

    std::map<std::string, int> routed;
    for (const auto& decision : m_recent) {
        if (decision.targetAgent) ++routed[*decision.targetAgent];
    }
    for (const auto& [agent, count] : routed) {
        if (count >= m_config.recommendationRepeatThreshold) {
            recommendations.push_back({
                "optimization",
                "Routing concentrated on " + agent + " (" + std::to_string(count) + " of last " +
                    std::to_string(m_recent.size()) + " decisions); review decision rule thresholds",
                "medium"
            });
        }
    }

    for (const auto& [agent, metrics] : m_monitoring.agentMetrics) {
        if (metrics.totalTasks() < kMinTasksForReliability) continue;
        if (metrics.tasksFailed * 2 > metrics.totalTasks()) {
            recommendations.push_back({
                "reliability",
                "Agent " + agent + " failed " + std::to_string(metrics.tasksFailed) + " of " +
                    std::to_string(metrics.totalTasks()) + " tasks; check its inputs and dependencies",
                "high"
            });
        }
    }

    m_monitoring.recommendations = recommendations;
    return recommendations;
}

void PerformanceMonitor::reset() {
    // Agent metrics describe the agents, not the run; they survive a reset.
    auto metrics = std::move(m_monitoring.agentMetrics);
    m_monitoring = PerformanceMonitoring{};
    m_monitoring.agentMetrics = std::move(metrics);
    m_recent.clear();
}

} // namespace dealflow::application
