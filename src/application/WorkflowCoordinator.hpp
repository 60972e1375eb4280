/**
 * @file WorkflowCoordinator.hpp
 * @brief State machine driving research, writing and the critique/revision loop.
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "application/MetricsAggregator.hpp"
#include "application/ProgressPublisher.hpp"
#include "application/ProgressTracker.hpp"
#include "application/StageInvoker.hpp"
#include "application/WorkflowErrors.hpp"
#include "application/WorkflowLimits.hpp"
#include "application/WorkflowResult.hpp"
#include "domain/Cancellation.hpp"
#include "domain/StageExecutors.hpp"

namespace blogforge::application {

/**
 * @struct StageExecutors
 * @brief The three collaborators a run needs. None may be null.
 */
struct StageExecutors {
    std::shared_ptr<domain::ResearchExecutor> research;
    std::shared_ptr<domain::WritingExecutor> writing;
    std::shared_ptr<domain::CritiqueExecutor> critique;
};

/**
 * @brief Supplies substitute research when the research stage failed.
 * @param topic The run's topic.
 * @param reason Message of the research failure.
 * @return Replacement research, or nullopt to fail the run.
 */
using ResearchFallback = std::function<std::optional<domain::ResearchResult>(const std::string& topic,
                                                                             const std::string& reason)>;

/**
 * @class WorkflowCoordinator
 * @brief Sequences the stages of one generation run.
 *
 * Research runs once, then an initial draft is written, then drafts are
 * critiqued and revised until the RevisionPolicy accepts, abandons, or the
 * iteration budget runs out. Every stage transition is published as progress
 * and every executor invocation is recorded in the metrics.
 *
 * Executor failures never escape run(): they produce a Failed result that keeps
 * the research, the current draft, the critique log and the metrics gathered so
 * far. Only invalid input throws (ValidationError).
 *
 * The publisher is closed when the run reaches a terminal stage, so an instance
 * serves a single run.
 */
class WorkflowCoordinator {
public:
    /**
     * @param publisher Receives progress events; may be null.
     * @param draftSink Notified of every draft; may be null.
     * @param researchFallback Used when research fails and degraded research is
     *                         allowed. Defaults to ContentFormatter::MakeDegradedResearch.
     */
    explicit WorkflowCoordinator(std::shared_ptr<ProgressPublisher> publisher,
                                 std::shared_ptr<domain::DraftSink> draftSink = nullptr,
                                 ResearchFallback researchFallback = nullptr);

    /**
     * @brief Runs the workflow to a terminal state.
     * @throws ValidationError if the topic, executors or limits are invalid.
     */
    WorkflowResult run(const std::string& topic,
                       const StageExecutors& executors,
                       const WorkflowLimits& limits,
                       const domain::CancellationToken& cancel = {});

    /** @brief Consistent snapshot of the current (or last) run's metrics. */
    MetricsSnapshot metrics() const;

    /** @brief Agent table and completion estimate of the current (or last) run. */
    std::optional<StatusSummary> status() const;

    /** @brief Throws ValidationError describing the first invalid input. */
    static void Validate(const std::string& topic, const StageExecutors& executors, const WorkflowLimits& limits);

private:
    struct RunState;
    struct StageFailure {
        std::string message;
        std::vector<domain::ResearchFinding> partialFindings;
        bool cancelled = false;
    };

    template <typename T>
    std::optional<domain::StageOutput<T>> invokeStage(RunState& state,
                                                      ExecutorKind kind,
                                                      const char* agent,
                                                      const std::string& task,
                                                      StageInvoker::Call<T> call,
                                                      StageFailure& failure);

    void enterStage(RunState& state, domain::WorkflowStage stage, const std::string& message,
                    std::map<std::string, std::string> metadata = {});
    void adoptDraft(RunState& state, domain::Draft draft);
    std::optional<domain::ResearchResult> degradeResearch(RunState& state, const StageFailure& failure);

    WorkflowResult finishCompleted(RunState& state);
    WorkflowResult finishFailed(RunState& state, const std::string& code, const std::string& message);
    WorkflowResult finishCancelled(RunState& state);
    WorkflowResult buildResult(RunState& state, WorkflowStatus status);

    std::shared_ptr<ProgressPublisher> m_publisher;
    std::shared_ptr<domain::DraftSink> m_draftSink;
    ResearchFallback m_researchFallback;
    MetricsAggregator m_metrics;

    mutable std::mutex m_trackerMutex;
    std::shared_ptr<ProgressTracker> m_tracker;
};

} // namespace blogforge::application
