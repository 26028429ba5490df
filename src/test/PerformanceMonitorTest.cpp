#include <cassert>
#include <chrono>
#include <iostream>

#include "application/DecisionEngine.hpp"
#include "application/PerformanceMonitor.hpp"
#include "domain/StateMutations.hpp"

using namespace dealflow::domain;
using dealflow::application::DecisionEngine;
using dealflow::application::PerformanceMonitor;

namespace {

SupervisorDecision RouteTo(const std::string& agent) {
    DecisionDraft draft = DecisionEngine::DefaultDraft();
    draft.targetAgent = agent;
    draft.action = agent;
    return DecisionEngine::Stamp(draft, "wf-perf");
}

AgentTaskResult TaskResult(bool success, double seconds, double confidence) {
    AgentTaskResult result;
    result.success = success;
    result.executionTime = seconds;
    result.confidenceScore = confidence;
    if (!success) result.error = "timeout";
    return result;
}

} // namespace

int main() {
    std::cout << "[Test] Starting PerformanceMonitor Test..." << std::endl;

    SupervisorConfig config;
    config.verbose = false;
    PerformanceMonitor monitor(config);

    // Health is the worst level seen in one pass.
    {
        AgentState state;
        assert(monitor.assessSystemHealth(state).status == HealthStatus::Healthy);

        StateMutations::AddAgentMessage(state, "analyst", "valuation service slow", 4);
        auto degraded = monitor.assessSystemHealth(state);
        assert(degraded.status == HealthStatus::Degraded);
        assert(degraded.issues.size() == 1);

        state.workflowStatus = WorkflowStatus::Error;
        auto critical = monitor.assessSystemHealth(state);
        assert(critical.status == HealthStatus::Critical);
        assert(critical.issues.size() == 2);
        std::cout << "[PASS] Health takes the worst condition." << std::endl;
    }

    // A deal stuck in analysis for ten minutes is a bottleneck.
    {
        AgentState state;
        Deal stuck;
        stuck.id = "deal-42";
        stuck.status = deal_status::Analyzing;
        stuck.lastUpdated = Clock::now() - std::chrono::minutes(10);
        Deal fresh;
        fresh.id = "deal-43";
        fresh.status = deal_status::Analyzing;
        StateMutations::UpsertDeal(state, stuck);
        StateMutations::UpsertDeal(state, fresh);

        auto bottlenecks = monitor.identifyBottlenecks(state);
        assert(bottlenecks.size() == 1);
        assert(bottlenecks[0].find("deal-42") != std::string::npos);
        std::cout << "[PASS] Stalled analysis is reported." << std::endl;
    }

    // Approved deals without outreach are opportunities.
    {
        AgentState state;
        Deal ready;
        ready.id = "deal-50";
        ready.status = deal_status::Approved;
        Deal contacted = ready;
        contacted.id = "deal-51";
        contacted.outreachInitiated = true;
        StateMutations::UpsertDeal(state, ready);
        StateMutations::UpsertDeal(state, contacted);

        auto opportunities = monitor.identifyOpportunities(state);
        assert(opportunities.size() == 1);
        assert(opportunities[0].find("deal-50") != std::string::npos);

        monitor.updateMonitoringData(state);
        auto snapshot = monitor.snapshot();
        assert(snapshot.lastMonitoringUpdate.has_value());
        assert(snapshot.opportunities.size() == 1);
        std::cout << "[PASS] Outreach opportunities are reported." << std::endl;
    }

    // Five of the last six decisions on one agent trigger a recommendation.
    {
        for (int i = 0; i < 4; ++i) monitor.recordDecision(RouteTo("scout"));
        monitor.recordDecision(RouteTo("analyst"));
        assert(monitor.generateRecommendations().empty());

        monitor.recordDecision(RouteTo("scout"));
        auto recommendations = monitor.generateRecommendations();
        assert(recommendations.size() == 1);
        assert(recommendations[0].type == "optimization");
        assert(recommendations[0].description.find("scout") != std::string::npos);
        assert(monitor.recentDecisions().size() == 6);

        monitor.recordDecision(RouteTo("analyst"));
        monitor.recordDecision(RouteTo("analyst"));
        assert(monitor.recentDecisions().size() == 6);
        assert(monitor.generateRecommendations().empty());
        std::cout << "[PASS] Routing concentration recommendation uses a bounded window." << std::endl;
    }

    // Agent metrics keep running averages; a mostly failing agent is flagged.
    {
        monitor.recordAgentResult("negotiator", TaskResult(true, 2.0, 0.9));
        monitor.recordAgentResult("negotiator", TaskResult(false, 4.0, 0.0));
        monitor.recordAgentResult("negotiator", TaskResult(false, 6.0, 0.0));

        auto metrics = monitor.snapshot().agentMetrics.at("negotiator");
        assert(metrics.tasksCompleted == 1);
        assert(metrics.tasksFailed == 2);
        assert(metrics.averageExecutionTime > 3.99 && metrics.averageExecutionTime < 4.01);

        auto recommendations = monitor.generateRecommendations();
        assert(recommendations.size() == 1);
        assert(recommendations[0].type == "reliability");
        assert(recommendations[0].priority == "high");
        std::cout << "[PASS] Failing agent gets a reliability recommendation." << std::endl;
    }

    // Reset clears the run but keeps agent metrics.
    {
        monitor.reset();
        assert(monitor.recentDecisions().empty());
        assert(!monitor.snapshot().lastMonitoringUpdate);
        assert(monitor.snapshot().agentMetrics.count("negotiator") == 1);
        std::cout << "[PASS] Reset keeps agent metrics." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
