/**
 * @file AgentTaskExecutor.cpp
 * @brief Implementation of AgentTaskExecutor.
 */

#include "application/AgentTaskExecutor.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

#include "application/Supervisor.hpp"

namespace dealflow::application {

using namespace dealflow::domain;

AgentTaskExecutor::AgentTaskExecutor(Supervisor& supervisor)
    : m_supervisor(supervisor) {}

AgentTaskExecutor::~AgentTaskExecutor() {
    waitForAll();
}

void AgentTaskExecutor::registerAgent(std::shared_ptr<WorkerAgent> agent) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string name = agent->name();
    m_agents[name] = std::move(agent);
}

bool AgentTaskExecutor::hasAgent(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_agents.count(name) > 0;
}

void AgentTaskExecutor::setCompletionCallback(CompletionCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_onComplete = std::move(callback);
}

std::vector<std::shared_ptr<AgentTaskStatus>> AgentTaskExecutor::dispatch(const SupervisorDecision& decision,
                                                                          const AgentState& snapshot) {
    std::vector<std::string> targets;
    if (decision.decisionType == DecisionType::RouteToAgent && decision.targetAgent) {
        targets.push_back(*decision.targetAgent);
    } else if (decision.decisionType == DecisionType::CoordinateAgents &&
               decision.parameters.value("coordination_type", std::string()) == "parallel") {
        targets = decision.targetAgents;
    } else if (decision.decisionType == DecisionType::CoordinateAgents && !decision.targetAgents.empty()) {
        // Sequential plans start with their first agent; the rest wait in the agent queue.
        targets.push_back(decision.targetAgents.front());
    }

    std::vector<std::shared_ptr<AgentTaskStatus>> started;
    for (const auto& target : targets) {
        std::shared_ptr<WorkerAgent> agent;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_agents.find(target);
            if (it != m_agents.end()) agent = it->second;
        }
        if (!agent) {
            std::cerr << "[AgentTaskExecutor] No agent registered as '" << target << "'" << std::endl;
            continue;
        }
        started.push_back(launch(agent, decision, snapshot));
    }
    return started;
}

std::shared_ptr<AgentTaskStatus> AgentTaskExecutor::launch(const std::shared_ptr<WorkerAgent>& agent,
                                                           const SupervisorDecision& decision,
                                                           const AgentState& snapshot) {
    auto status = std::make_shared<AgentTaskStatus>();
    status->id = m_nextId++;
    status->workflowId = decision.workflowId.empty() ? snapshot.workflowId : decision.workflowId;
    status->agent = agent->name();
    status->task = decision.action;

    std::lock_guard<std::mutex> lock(m_mutex);
    cleanupCompletedLocked();
    m_running.push_back({status, std::thread(&AgentTaskExecutor::run, this, agent, status,
                                             decision.parameters, snapshot)});
    return status;
}

void AgentTaskExecutor::run(std::shared_ptr<WorkerAgent> agent, std::shared_ptr<AgentTaskStatus> status,
                            nlohmann::json data, AgentState snapshot) {
    const auto start = std::chrono::steady_clock::now();
    AgentTaskResult result;
    try {
        result = agent->executeTask(status->task, data, snapshot);
    } catch (const std::exception& e) {
        result.success = false;
        result.error = e.what();
    } catch (...) {
        result.success = false;
        result.error = "Unknown error during task execution.";
    }
    if (result.executionTime <= 0.0) {
        result.executionTime = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    }

    status->result = result;
    status->failed = !result.success;
    status->errorMessage = result.error;

    m_supervisor.recordAgentResult(status->workflowId, status->agent, result);

    CompletionCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        callback = m_onComplete;
    }
    if (callback) callback(*status);

    status->isCompleted = true;
}

std::vector<std::shared_ptr<AgentTaskStatus>> AgentTaskExecutor::activeTasks() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::shared_ptr<AgentTaskStatus>> active;
    for (const auto& task : m_running) {
        if (!task.status->isCompleted.load()) active.push_back(task.status);
    }
    return active;
}

size_t AgentTaskExecutor::trackedTaskCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running.size();
}

void AgentTaskExecutor::cleanupCompletedLocked() {
    // A completed worker no longer touches m_mutex, so joining here cannot deadlock.
    for (auto& task : m_running) {
        if (task.status->isCompleted.load() && task.worker.joinable()) task.worker.join();
    }
    m_running.erase(
        std::remove_if(m_running.begin(), m_running.end(),
            [](const RunningTask& t) { return !t.worker.joinable(); }),
        m_running.end());
}

void AgentTaskExecutor::waitForAll() {
    std::vector<RunningTask> running;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        running.swap(m_running);
    }
    for (auto& task : running) {
        if (task.worker.joinable()) task.worker.join();
    }
}

} // namespace dealflow::application
