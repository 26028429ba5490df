/**
 * @file WorkflowStateStore.hpp
 * @brief Holds workflow states and serialises writers per workflow.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/AgentState.hpp"

namespace dealflow::application {

class Supervisor;

/**
 * @class WorkflowStateStore
 * @brief Single-writer access to each workflow's AgentState.
 *
 * Writers to the same workflow queue on that workflow's mutex; different workflows
 * proceed independently. No write is ever applied to a stale copy.
 */
class WorkflowStateStore {
public:
    /** @brief Registers or replaces a workflow state. */
    void put(domain::AgentState state);

    bool contains(const std::string& workflowId) const;

    /** @brief Copy of the current state, or nullopt for an unknown workflow. */
    std::optional<domain::AgentState> snapshot(const std::string& workflowId) const;

    /**
     * @brief Applies @p fn to the workflow's state while holding its lock.
     * @throws std::out_of_range for an unknown workflow.
     */
    template <typename F>
    auto mutate(const std::string& workflowId, F&& fn) {
        auto entry = find(workflowId);
        std::lock_guard<std::mutex> lock(entry->mutex);
        return fn(entry->state);
    }

    /** @brief Runs one supervisor tick on the stored state and keeps the result. */
    domain::AgentState tick(const std::string& workflowId, Supervisor& supervisor);

    std::vector<std::string> workflowIds() const;

    /** @brief Drops a finished workflow. */
    void erase(const std::string& workflowId);

private:
    struct Entry {
        std::mutex mutex;
        domain::AgentState state;
    };

    std::shared_ptr<Entry> find(const std::string& workflowId) const;

    mutable std::mutex m_entriesMutex;
    std::map<std::string, std::shared_ptr<Entry>> m_entries;
};

} // namespace dealflow::application
