#undef NDEBUG
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "application/MetricsAggregator.hpp"

using namespace blogforge;
using application::ExecutorKind;
using application::MetricsAggregator;
using application::StageInvocation;
using domain::WorkflowStage;

namespace {

StageInvocation Invocation(ExecutorKind kind, WorkflowStage stage, int elapsedMs, std::uint64_t units,
                           int attempts = 1, bool succeeded = true) {
    StageInvocation invocation;
    invocation.executor = kind;
    invocation.stage = stage;
    invocation.elapsed = std::chrono::milliseconds(elapsedMs);
    invocation.usageUnits = units;
    invocation.attempts = attempts;
    invocation.succeeded = succeeded;
    return invocation;
}

void TestAccumulates() {
    MetricsAggregator metrics;
    metrics.record(Invocation(ExecutorKind::Research, WorkflowStage::Researching, 120, 300, 2));
    metrics.record(Invocation(ExecutorKind::Writing, WorkflowStage::Writing, 200, 500));
    metrics.record(Invocation(ExecutorKind::Critique, WorkflowStage::Critiquing, 80, 150));
    metrics.record(Invocation(ExecutorKind::Writing, WorkflowStage::Revising, 210, 520));
    metrics.record(Invocation(ExecutorKind::Critique, WorkflowStage::Critiquing, 90, 160, 3, false));
    metrics.setIteration(1);

    auto snapshot = metrics.snapshot();
    assert(snapshot.callsFor(ExecutorKind::Research) == 1);
    assert(snapshot.callsFor(ExecutorKind::Writing) == 2);
    assert(snapshot.callsFor(ExecutorKind::Critique) == 2);
    assert(snapshot.apiCalls == 2 + 1 + 1 + 1 + 3);
    assert(snapshot.retries == 1 + 2);
    assert(snapshot.failures == 1);
    assert(snapshot.executors[ExecutorKind::Critique].failures == 1);
    assert(snapshot.usageUnits == 300 + 500 + 150 + 520 + 160);
    assert(snapshot.revisionCount == 1);
    assert(snapshot.iterationCount == 1);
    assert(snapshot.elapsedIn(WorkflowStage::Critiquing).count() == 170);
    assert(snapshot.elapsedIn(WorkflowStage::Finalizing).count() == 0);
    assert(snapshot.executors[ExecutorKind::Writing].elapsed.count() == 410);
    std::cout << "[PASS] Invocations accumulate per executor and stage." << std::endl;
}

void TestFailedRevisionNotCounted() {
    MetricsAggregator metrics;
    metrics.record(Invocation(ExecutorKind::Writing, WorkflowStage::Revising, 10, 0, 3, false));
    auto snapshot = metrics.snapshot();
    assert(snapshot.revisionCount == 0);
    assert(snapshot.callsFor(ExecutorKind::Writing) == 1);
    std::cout << "[PASS] Failed revisions are not counted as revisions." << std::endl;
}

void TestReset() {
    MetricsAggregator metrics;
    metrics.record(Invocation(ExecutorKind::Research, WorkflowStage::Researching, 10, 10));
    metrics.reset();
    auto snapshot = metrics.snapshot();
    assert(snapshot.executors.empty());
    assert(snapshot.apiCalls == 0);
    assert(snapshot.usageUnits == 0);
    std::cout << "[PASS] Reset clears everything." << std::endl;
}

void TestConcurrentRecording() {
    MetricsAggregator metrics;
    const int kThreads = 8;
    const int kPerThread = 250;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&metrics] {
            for (int i = 0; i < kPerThread; ++i) {
                metrics.record(Invocation(ExecutorKind::Critique, WorkflowStage::Critiquing, 1, 2));
            }
        });
    }
    // Snapshots taken mid-flight stay internally consistent.
    for (int i = 0; i < 50; ++i) {
        auto snapshot = metrics.snapshot();
        assert(snapshot.usageUnits == static_cast<std::uint64_t>(snapshot.apiCalls) * 2);
    }
    for (auto& t : threads) t.join();

    auto snapshot = metrics.snapshot();
    assert(snapshot.apiCalls == kThreads * kPerThread);
    assert(snapshot.elapsedIn(WorkflowStage::Critiquing).count() == kThreads * kPerThread);
    std::cout << "[PASS] Concurrent recording loses nothing." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting MetricsAggregator Test..." << std::endl;
    TestAccumulates();
    TestFailedRevisionNotCounted();
    TestReset();
    TestConcurrentRecording();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
