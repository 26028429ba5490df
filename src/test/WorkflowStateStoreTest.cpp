#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "application/Supervisor.hpp"
#include "application/WorkflowStateStore.hpp"
#include "domain/StateMutations.hpp"

using namespace dealflow::domain;
using dealflow::application::Supervisor;
using dealflow::application::WorkflowStateStore;

int main() {
    std::cout << "[Test] Starting WorkflowStateStore Concurrency Test..." << std::endl;

    SupervisorConfig config;
    config.verbose = false;
    Supervisor supervisor(config);
    supervisor.initialize();

    WorkflowStateStore store;
    for (const char* id : {"wf-a", "wf-b"}) {
        AgentState state;
        state.workflowId = id;
        state.workflowStatus = WorkflowStatus::Running;
        store.put(state);
    }
    assert(store.workflowIds().size() == 2);

    // Agents append messages while the supervisor ticks the same workflows.
    const int NUM_WRITERS = 8;
    const int MESSAGES_PER_WRITER = 25;
    constexpr int NUM_TICKS = 10;
    std::vector<std::thread> threads;
    std::atomic<int> ticks{0};

    for (int w = 0; w < NUM_WRITERS; ++w) {
        threads.emplace_back([&store, w]() {
            const std::string id = (w % 2 == 0) ? "wf-a" : "wf-b";
            for (int i = 0; i < MESSAGES_PER_WRITER; ++i) {
                store.mutate(id, [&](AgentState& state) {
                    StateMutations::AddAgentMessage(state, "agent-" + std::to_string(w),
                                                    "progress " + std::to_string(i));
                });
            }
        });
    }
    for (const char* id : {"wf-a", "wf-b"}) {
        threads.emplace_back([&store, &supervisor, &ticks, id]() {
            for (int i = 0; i < NUM_TICKS; ++i) {
                store.tick(id, supervisor);
                ticks++;
            }
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    // No write may be lost: every agent message and every supervisor message is present.
    for (const char* id : {"wf-a", "wf-b"}) {
        auto state = store.snapshot(id);
        assert(state.has_value());
        size_t agentMessages = 0;
        size_t supervisorMessages = 0;
        for (const auto& msg : state->agentMessages) {
            if (msg.agentType == "supervisor" && msg.message.rfind("Strategic decision:", 0) == 0) {
                ++supervisorMessages;
            } else if (msg.agentType.rfind("agent-", 0) == 0) {
                ++agentMessages;
            }
        }
        std::cout << "[Test] " << id << ": " << agentMessages << " agent messages, "
                  << supervisorMessages << " supervisor messages" << std::endl;
        assert(agentMessages == static_cast<size_t>(NUM_WRITERS / 2 * MESSAGES_PER_WRITER));
        assert(supervisorMessages == static_cast<size_t>(NUM_TICKS));
    }
    assert(ticks == 2 * NUM_TICKS);
    assert(supervisor.decisionCount() == static_cast<size_t>(2 * NUM_TICKS));
    std::cout << "[PASS] Concurrent writers and ticks lose no updates." << std::endl;

    // Unknown workflows.
    assert(!store.snapshot("wf-missing"));
    bool threw = false;
    try {
        store.mutate("wf-missing", [](AgentState&) {});
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    store.erase("wf-a");
    assert(!store.contains("wf-a"));
    assert(store.contains("wf-b"));
    std::cout << "[PASS] Unknown workflows are reported." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
