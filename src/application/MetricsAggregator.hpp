/**
 * @file MetricsAggregator.hpp
 * @brief Thread-safe accumulation of per-stage usage and timing.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include "domain/WorkflowStage.hpp"

namespace blogforge::application {

enum class ExecutorKind {
    Research,
    Writing,
    Critique
};

inline std::string ExecutorToString(ExecutorKind kind) {
    switch (kind) {
        case ExecutorKind::Research: return "research";
        case ExecutorKind::Writing: return "writing";
        case ExecutorKind::Critique: return "critique";
    }
    return "unknown";
}

/**
 * @struct StageInvocation
 * @brief One call of an executor, including all of its retry attempts.
 */
struct StageInvocation {
    ExecutorKind executor = ExecutorKind::Research;
    domain::WorkflowStage stage = domain::WorkflowStage::Researching;
    std::chrono::milliseconds elapsed{0};
    std::uint64_t usageUnits = 0;
    int attempts = 1;
    bool succeeded = true;
};

struct ExecutorUsage {
    int calls = 0;    ///< Invocations, retries excluded.
    int attempts = 0; ///< Invocations, retries included.
    int failures = 0; ///< Invocations that exhausted their budget or failed fatally.
    std::uint64_t usageUnits = 0;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @struct MetricsSnapshot
 * @brief Point-in-time copy of the aggregated metrics.
 */
struct MetricsSnapshot {
    std::map<ExecutorKind, ExecutorUsage> executors;
    std::map<domain::WorkflowStage, std::chrono::milliseconds> stageElapsed;
    int iterationCount = 0;
    int revisionCount = 0;    ///< Successful rewrites in the Revising stage.
    std::uint64_t usageUnits = 0;
    int apiCalls = 0;         ///< Attempts over all executors.
    int retries = 0;
    int failures = 0;

    int callsFor(ExecutorKind kind) const {
        auto it = executors.find(kind);
        return it == executors.end() ? 0 : it->second.calls;
    }

    std::chrono::milliseconds elapsedIn(domain::WorkflowStage stage) const {
        auto it = stageElapsed.find(stage);
        return it == stageElapsed.end() ? std::chrono::milliseconds{0} : it->second;
    }
};

/**
 * @class MetricsAggregator
 * @brief Accumulates StageInvocation records; every read is a consistent snapshot.
 */
class MetricsAggregator {
public:
    void record(const StageInvocation& invocation);

    void setIteration(int iteration);

    MetricsSnapshot snapshot() const;

    void reset();

private:
    mutable std::mutex m_mutex;
    MetricsSnapshot m_metrics;
};

} // namespace blogforge::application
