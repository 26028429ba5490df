/**
 * @file CoordinationManager.cpp
 * @brief Implementation of CoordinationManager.
 */

#include "application/CoordinationManager.hpp"

#include <algorithm>

#include "infrastructure/IdGenerator.hpp"

namespace dealflow::application {

using namespace dealflow::domain;

Result<CoordinationPlan> CoordinationManager::createCoordinationPlan(const std::vector<std::string>& agents,
                                                                    const std::string& mode,
                                                                    const AgentState& state) const {
    auto parsedMode = CoordinationModeFromString(mode);
    if (!parsedMode) {
        return SupervisorFault{ErrorKind::InvalidDecision, "unsupported coordination type: " + mode};
    }

    CoordinationPlan plan;
    plan.coordinationId = infrastructure::IdGenerator::Generate("coord-");
    plan.workflowId = state.workflowId;
    plan.agents = agents;
    plan.mode = *parsedMode;
    plan.createdAt = Clock::now();

    for (size_t i = 0; i < agents.size(); ++i) {
        CoordinationStep step;
        step.step = static_cast<int>(i) + 1;
        step.agent = agents[i];
        if (plan.mode == CoordinationMode::Sequential && i > 0) {
            step.dependsOn = agents[i - 1];
        }
        plan.steps.push_back(step);
    }
    return plan;
}

WorkflowCoordination& CoordinationManager::upsert(const std::string& workflowId) {
    auto it = m_coordinations.find(workflowId);
    if (it == m_coordinations.end()) {
        WorkflowCoordination coordination;
        coordination.workflowId = workflowId;
        it = m_coordinations.emplace(workflowId, std::move(coordination)).first;
    }
    return it->second;
}

void CoordinationManager::updateCoordination(const AgentState& state) {
    if (state.workflowId.empty()) return;

    auto& coordination = upsert(state.workflowId);
    coordination.activeAgents = state.activeAgents;

    for (const auto& [agent, task] : state.pendingTasks) {
        coordination.pendingTasks[agent] = task;
    }
    // Keep pending work only for agents the workflow still considers running.
    for (auto it = coordination.pendingTasks.begin(); it != coordination.pendingTasks.end();) {
        if (coordination.activeAgents.count(it->first) == 0) {
            it = coordination.pendingTasks.erase(it);
        } else {
            ++it;
        }
    }

    coordination.lastCoordination = Clock::now();
    if (state.workflowStatus == WorkflowStatus::Completed) {
        coordination.archived = true;
    }
}

void CoordinationManager::applyPlan(const CoordinationPlan& plan, AgentState& state) {
    if (plan.mode == CoordinationMode::Parallel) {
        state.parallelAgents = plan.agents;
        state.agentQueue.clear();
        state.coordinationMode = "parallel";
    } else {
        state.parallelAgents.clear();
        state.coordinationMode = "sequential";
        if (!plan.agents.empty()) {
            state.nextAction = plan.agents.front();
            state.currentStep = plan.agents.front();
            state.agentQueue.assign(plan.agents.begin() + 1, plan.agents.end());
        }
    }

    if (plan.workflowId.empty()) return;
    auto& coordination = upsert(plan.workflowId);
    coordination.coordinationId = plan.coordinationId;
    coordination.steps = plan.steps;
    coordination.lastCoordination = Clock::now();
}

void CoordinationManager::recordTaskOutcome(const std::string& workflowId, const std::string& agent, bool success) {
    auto it = m_coordinations.find(workflowId);
    if (it == m_coordinations.end()) return;

    auto& coordination = it->second;
    auto task = coordination.pendingTasks.find(agent);
    if (task == coordination.pendingTasks.end()) return;

    const std::string label = agent + ":" + task->second;
    (success ? coordination.completedTasks : coordination.failedTasks).push_back(label);
    coordination.pendingTasks.erase(task);
}

std::optional<WorkflowCoordination> CoordinationManager::getCoordination(const std::string& workflowId) const {
    auto it = m_coordinations.find(workflowId);
    if (it == m_coordinations.end()) return std::nullopt;
    return it->second;
}

size_t CoordinationManager::activeCoordinationCount() const {
    return static_cast<size_t>(std::count_if(m_coordinations.begin(), m_coordinations.end(),
        [](const auto& entry) { return !entry.second.archived; }));
}

void CoordinationManager::reset() {
    m_coordinations.clear();
}

} // namespace dealflow::application
