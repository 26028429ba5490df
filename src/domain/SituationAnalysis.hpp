/**
 * @file SituationAnalysis.hpp
 * @brief Summary of the workflow the decision rules evaluate against.
 */

#pragma once

#include <set>
#include <string>
#include <vector>

#include "domain/AgentState.hpp"
#include "domain/PerformanceMonitoring.hpp"

namespace dealflow::domain {

struct ResourceUtilization {
    int activeWorkflows = 0;
    int activeAgents = 0;
    int pendingTasks = 0;
    int claimedResources = 0;
};

struct SituationAnalysis {
    WorkflowStatus workflowStatus = WorkflowStatus::Idle;
    std::set<std::string> activeAgents;
    int currentDeals = 0;
    int pendingNegotiations = 0;
    SystemHealth systemHealth;
    ResourceUtilization resourceUtilization;
    std::vector<std::string> bottlenecks;
    std::vector<std::string> opportunities;
};

} // namespace dealflow::domain
