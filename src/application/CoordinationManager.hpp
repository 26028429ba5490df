/**
 * @file CoordinationManager.hpp
 * @brief Builds coordination plans and tracks one coordination record per workflow.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/AgentState.hpp"
#include "domain/SupervisorError.hpp"
#include "domain/WorkflowCoordination.hpp"

namespace dealflow::application {

class CoordinationManager {
public:
    CoordinationManager() = default;

    /**
     * @brief Declares an execution-order graph over @p agents.
     *
     * Sequential plans hand off strictly (step i depends on agent i-1); parallel plans
     * fan out with no dependencies. Agent capabilities are not checked here.
     * @param mode "sequential" or "parallel"; anything else is an InvalidDecision.
     */
    domain::Result<domain::CoordinationPlan> createCoordinationPlan(const std::vector<std::string>& agents,
                                                                   const std::string& mode,
                                                                   const domain::AgentState& state) const;

    /**
     * @brief Upserts the coordination record of the state's workflow.
     *
     * Idempotent: with unchanged state only the timestamp moves.
     */
    void updateCoordination(const domain::AgentState& state);

    /** @brief Writes a plan's hand-off into the state and remembers its steps. */
    void applyPlan(const domain::CoordinationPlan& plan, domain::AgentState& state);

    /** @brief Moves an agent's pending task to the completed or failed list. */
    void recordTaskOutcome(const std::string& workflowId, const std::string& agent, bool success);

    std::optional<domain::WorkflowCoordination> getCoordination(const std::string& workflowId) const;
    size_t coordinationCount() const { return m_coordinations.size(); }
    size_t activeCoordinationCount() const;

    void reset();

private:
    domain::WorkflowCoordination& upsert(const std::string& workflowId);

    std::map<std::string, domain::WorkflowCoordination> m_coordinations;
};

} // namespace dealflow::application
