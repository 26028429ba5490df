/**
 * @file AgentTaskExecutor.hpp
 * @brief Runs routed agent tasks in the background and reports results to the supervisor.
 */

#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "domain/AgentState.hpp"
#include "domain/SupervisorDecision.hpp"
#include "domain/WorkerAgent.hpp"

namespace dealflow::application {

class Supervisor;

/**
 * @struct AgentTaskStatus
 * @brief Information about a running or completed agent task.
 */
struct AgentTaskStatus {
    int id = 0;
    std::string workflowId;
    std::string agent;
    std::string task;
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;
    domain::AgentTaskResult result; ///< Valid once isCompleted is true.
};

/**
 * @class AgentTaskExecutor
 * @brief Reference executor for decisions the supervisor hands back.
 *
 * The supervisor never waits on agents: dispatch() returns immediately and the
 * outcome reaches the supervisor through recordAgentResult() when the task ends.
 */
class AgentTaskExecutor {
public:
    using CompletionCallback = std::function<void(const AgentTaskStatus&)>;

    explicit AgentTaskExecutor(Supervisor& supervisor);
    ~AgentTaskExecutor();

    AgentTaskExecutor(const AgentTaskExecutor&) = delete;
    AgentTaskExecutor& operator=(const AgentTaskExecutor&) = delete;

    void registerAgent(std::shared_ptr<domain::WorkerAgent> agent);
    bool hasAgent(const std::string& name) const;

    /** @brief Invoked on the worker thread after each task finishes. */
    void setCompletionCallback(CompletionCallback callback);

    /**
     * @brief Starts the agent a routing or coordination decision names.
     * @param snapshot State copy the agent reads; the executor never writes it back.
     * @return One status per started task; empty when nothing was routable.
     */
    std::vector<std::shared_ptr<AgentTaskStatus>> dispatch(const domain::SupervisorDecision& decision,
                                                           const domain::AgentState& snapshot);

    /** @brief Returns snapshots of tasks that have not finished yet. */
    std::vector<std::shared_ptr<AgentTaskStatus>> activeTasks() const;

    /** @brief Tasks still held by the executor, finished or not. */
    size_t trackedTaskCount() const;

    /** @brief Blocks until every dispatched task has finished. */
    void waitForAll();

private:
    struct RunningTask {
        std::shared_ptr<AgentTaskStatus> status;
        std::thread worker;
    };

    /** @brief Joins and drops finished tasks. Caller holds m_mutex. */
    void cleanupCompletedLocked();

    std::shared_ptr<AgentTaskStatus> launch(const std::shared_ptr<domain::WorkerAgent>& agent,
                                            const domain::SupervisorDecision& decision,
                                            const domain::AgentState& snapshot);
    void run(std::shared_ptr<domain::WorkerAgent> agent, std::shared_ptr<AgentTaskStatus> status,
             nlohmann::json data, domain::AgentState snapshot);

    Supervisor& m_supervisor;
    std::map<std::string, std::shared_ptr<domain::WorkerAgent>> m_agents;
    CompletionCallback m_onComplete;

    std::atomic<int> m_nextId{0};
    std::vector<RunningTask> m_running;
    mutable std::mutex m_mutex;
};

} // namespace dealflow::application
