/**
 * @file PerformanceMonitoring.hpp
 * @brief System health and performance records kept by the supervisor.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/AgentState.hpp"

namespace dealflow::domain {

/**
 * @enum HealthStatus
 * @brief Ordered health levels. A pass only ever moves towards Critical.
 */
enum class HealthStatus {
    Healthy,
    Degraded,
    Critical
};

inline std::string HealthStatusToString(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Critical: return "critical";
    }
    return "healthy";
}

inline std::optional<HealthStatus> HealthStatusFromString(const std::string& value) {
    if (value == "healthy") return HealthStatus::Healthy;
    if (value == "degraded") return HealthStatus::Degraded;
    if (value == "critical") return HealthStatus::Critical;
    return std::nullopt;
}

/** @brief Returns the worse of two health levels. */
inline HealthStatus WorstOf(HealthStatus a, HealthStatus b) {
    return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

struct SystemHealth {
    HealthStatus status = HealthStatus::Healthy;
    std::vector<std::string> issues;

    /** @brief Raises the status to at least @p level and records the issue. */
    void escalate(HealthStatus level, const std::string& issue) {
        status = WorstOf(status, level);
        issues.push_back(issue);
    }
};

struct Recommendation {
    std::string type;        ///< "optimization", "reliability"
    std::string description;
    std::string priority;    ///< "low", "medium", "high"
};

/**
 * @struct AgentMetrics
 * @brief Running totals of task results reported by one worker agent.
 */
struct AgentMetrics {
    int tasksCompleted = 0;
    int tasksFailed = 0;
    double averageExecutionTime = 0.0; // seconds
    double averageConfidence = 0.0;

    int totalTasks() const { return tasksCompleted + tasksFailed; }
};

/**
 * @struct PerformanceMonitoring
 * @brief Singleton-per-supervisor snapshot refreshed every tick.
 */
struct PerformanceMonitoring {
    SystemHealth systemHealth;
    std::vector<std::string> bottlenecks;
    std::vector<std::string> opportunities;
    std::vector<Recommendation> recommendations;
    std::map<std::string, AgentMetrics> agentMetrics;
    std::optional<TimePoint> lastMonitoringUpdate;
};

} // namespace dealflow::domain
