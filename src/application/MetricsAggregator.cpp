/**
 * @file MetricsAggregator.cpp
 * @brief Implementation of MetricsAggregator.
 */

#include "application/MetricsAggregator.hpp"

namespace blogforge::application {

void MetricsAggregator::record(const StageInvocation& invocation) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto& usage = m_metrics.executors[invocation.executor];
    usage.calls += 1;
    usage.attempts += invocation.attempts;
    usage.usageUnits += invocation.usageUnits;
    usage.elapsed += invocation.elapsed;
    if (!invocation.succeeded) {
        usage.failures += 1;
        m_metrics.failures += 1;
    }

    m_metrics.stageElapsed[invocation.stage] += invocation.elapsed;
    m_metrics.usageUnits += invocation.usageUnits;
    m_metrics.apiCalls += invocation.attempts;
    if (invocation.attempts > 1) {
        m_metrics.retries += invocation.attempts - 1;
    }

    if (invocation.succeeded &&
        invocation.executor == ExecutorKind::Writing &&
        invocation.stage == domain::WorkflowStage::Revising) {
        m_metrics.revisionCount += 1;
    }
}

void MetricsAggregator::setIteration(int iteration) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_metrics.iterationCount = iteration;
}

MetricsSnapshot MetricsAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_metrics;
}

void MetricsAggregator::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_metrics = MetricsSnapshot{};
}

} // namespace blogforge::application
