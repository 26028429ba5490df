/**
 * @file JsonSerialization.hpp
 * @brief nlohmann::json adapters for the supervisor's domain records.
 *
 * Declared in the domain namespace so nlohmann finds them by ADL. Enums travel as
 * lower-case names, timestamps as epoch milliseconds.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "domain/AgentState.hpp"
#include "domain/ConflictResolution.hpp"
#include "domain/PerformanceMonitoring.hpp"
#include "domain/SituationAnalysis.hpp"
#include "domain/SupervisorDecision.hpp"
#include "domain/WorkerAgent.hpp"
#include "domain/WorkflowCoordination.hpp"

namespace dealflow::infrastructure {

long long ToEpochMillis(const domain::TimePoint& tp);
domain::TimePoint FromEpochMillis(long long ms);

} // namespace dealflow::infrastructure

namespace dealflow::domain {

void to_json(nlohmann::json& j, const Deal& deal);
void from_json(const nlohmann::json& j, Deal& deal);

void to_json(nlohmann::json& j, const Negotiation& negotiation);
void from_json(const nlohmann::json& j, Negotiation& negotiation);

void to_json(nlohmann::json& j, const AgentMessage& message);
void from_json(const nlohmann::json& j, AgentMessage& message);

void to_json(nlohmann::json& j, const ResourceClaim& claim);
void from_json(const nlohmann::json& j, ResourceClaim& claim);

void to_json(nlohmann::json& j, const ActionProposal& proposal);
void from_json(const nlohmann::json& j, ActionProposal& proposal);

void to_json(nlohmann::json& j, const AgentState& state);
void from_json(const nlohmann::json& j, AgentState& state);

void to_json(nlohmann::json& j, const SupervisorDecision& decision);

void to_json(nlohmann::json& j, const SystemHealth& health);
void from_json(const nlohmann::json& j, SystemHealth& health);

void to_json(nlohmann::json& j, const SituationAnalysis& analysis);

void to_json(nlohmann::json& j, const CoordinationStep& step);
void to_json(nlohmann::json& j, const CoordinationPlan& plan);
void to_json(nlohmann::json& j, const WorkflowCoordination& coordination);

void to_json(nlohmann::json& j, const ConflictResolution& conflict);
void to_json(nlohmann::json& j, const ResolutionOutcome& outcome);

void to_json(nlohmann::json& j, const Recommendation& recommendation);
void to_json(nlohmann::json& j, const AgentMetrics& metrics);
void to_json(nlohmann::json& j, const PerformanceMonitoring& monitoring);

void to_json(nlohmann::json& j, const AgentTaskResult& result);

} // namespace dealflow::domain
