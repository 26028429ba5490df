/**
 * @file WorkflowStateStore.cpp
 * @brief Implementation of WorkflowStateStore.
 */

#include "application/WorkflowStateStore.hpp"

#include "application/Supervisor.hpp"

namespace dealflow::application {

void WorkflowStateStore::put(domain::AgentState state) {
    if (state.workflowId.empty()) {
        throw std::invalid_argument("Workflow state needs a workflow id");
    }

    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(m_entriesMutex);
        auto& slot = m_entries[state.workflowId];
        if (!slot) slot = std::make_shared<Entry>();
        entry = slot;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->state = std::move(state);
}

bool WorkflowStateStore::contains(const std::string& workflowId) const {
    std::lock_guard<std::mutex> lock(m_entriesMutex);
    return m_entries.count(workflowId) > 0;
}

std::shared_ptr<WorkflowStateStore::Entry> WorkflowStateStore::find(const std::string& workflowId) const {
    std::lock_guard<std::mutex> lock(m_entriesMutex);
    auto it = m_entries.find(workflowId);
    if (it == m_entries.end()) {
        throw std::out_of_range("Workflow not found: " + workflowId);
    }
    return it->second;
}

std::optional<domain::AgentState> WorkflowStateStore::snapshot(const std::string& workflowId) const {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(m_entriesMutex);
        auto it = m_entries.find(workflowId);
        if (it == m_entries.end()) return std::nullopt;
        entry = it->second;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->state;
}

domain::AgentState WorkflowStateStore::tick(const std::string& workflowId, Supervisor& supervisor) {
    return mutate(workflowId, [&](domain::AgentState& state) {
        state = supervisor.processState(state);
        return state;
    });
}

std::vector<std::string> WorkflowStateStore::workflowIds() const {
    std::lock_guard<std::mutex> lock(m_entriesMutex);
    std::vector<std::string> ids;
    ids.reserve(m_entries.size());
    for (const auto& [id, entry] : m_entries) {
        ids.push_back(id);
    }
    return ids;
}

void WorkflowStateStore::erase(const std::string& workflowId) {
    std::lock_guard<std::mutex> lock(m_entriesMutex);
    m_entries.erase(workflowId);
}

} // namespace dealflow::application
