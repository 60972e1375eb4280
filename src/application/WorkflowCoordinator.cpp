/**
 * @file WorkflowCoordinator.cpp
 * @brief Implementation of the WorkflowCoordinator class.
 */

#include "application/WorkflowCoordinator.hpp"
#include "application/ContentFormatter.hpp"
#include "application/RevisionPolicy.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace blogforge::application {

namespace {

std::string FormatScore(double score) {
    std::ostringstream ss;
    ss.precision(2);
    ss << std::fixed << score;
    return ss.str();
}

} // namespace

struct WorkflowCoordinator::RunState {
    RunState(const std::string& topicIn, const WorkflowLimits& limitsIn, domain::CancellationToken cancelIn)
        : topic(topicIn),
          limits(limitsIn),
          cancel(cancelIn),
          invoker(RetryPolicy::FromLimits(limitsIn), std::move(cancelIn)),
          startedAt(std::chrono::steady_clock::now()) {
        result.topic = topicIn;
    }

    std::string topic;
    WorkflowLimits limits;
    domain::CancellationToken cancel;
    StageInvoker invoker;
    std::shared_ptr<ProgressTracker> tracker;
    std::chrono::steady_clock::time_point startedAt;

    domain::WorkflowStage stage = domain::WorkflowStage::Initializing;
    std::optional<domain::Draft> currentDraft;
    int draftRevision = -1; ///< -1 until the initial draft exists.
    int iteration = 0;
    WorkflowResult result;
};

WorkflowCoordinator::WorkflowCoordinator(std::shared_ptr<ProgressPublisher> publisher,
                                         std::shared_ptr<domain::DraftSink> draftSink,
                                         ResearchFallback researchFallback)
    : m_publisher(std::move(publisher)),
      m_draftSink(std::move(draftSink)),
      m_researchFallback(std::move(researchFallback)) {
    if (!m_researchFallback) {
        m_researchFallback = [](const std::string& topic, const std::string& reason) {
            return std::optional<domain::ResearchResult>(ContentFormatter::MakeDegradedResearch(topic, reason));
        };
    }
}

void WorkflowCoordinator::Validate(const std::string& topic,
                                   const StageExecutors& executors,
                                   const WorkflowLimits& limits) {
    if (!domain::IsValidTopic(topic)) {
        throw ValidationError("Topic must not be empty");
    }
    if (!executors.research || !executors.writing || !executors.critique) {
        throw ValidationError("Research, writing and critique executors are all required");
    }
    if (auto violation = FindLimitsViolation(limits)) {
        throw ValidationError("Invalid workflow limits: " + *violation);
    }
}

template <typename T>
std::optional<domain::StageOutput<T>> WorkflowCoordinator::invokeStage(RunState& state,
                                                                       ExecutorKind kind,
                                                                       const char* agent,
                                                                       const std::string& task,
                                                                       StageInvoker::Call<T> call,
                                                                       StageFailure& failure) {
    failure = StageFailure{};
    state.tracker->updateAgent(agent, domain::AgentStatus::Working, task);

    StageInvocation invocation;
    invocation.executor = kind;
    invocation.stage = state.stage;

    InvocationReport report;
    try {
        auto output = state.invoker.invoke<T>(ExecutorToString(kind), std::move(call), report);
        invocation.elapsed = report.elapsed;
        invocation.attempts = report.attempts;
        invocation.usageUnits = output.usageUnits;
        m_metrics.record(invocation);
        state.tracker->updateAgent(agent, domain::AgentStatus::Completed, task + " done",
                                   {{"attempts", std::to_string(report.attempts)},
                                    {"elapsed_ms", std::to_string(report.elapsed.count())}});
        return output;
    } catch (const InvocationCancelled& e) {
        failure.cancelled = true;
        failure.message = e.what();
    } catch (const domain::StageError& e) {
        failure.message = e.what();
        failure.partialFindings = e.partialFindings();
    }

    invocation.elapsed = report.elapsed;
    invocation.attempts = std::max(report.attempts, 1);
    invocation.succeeded = false;
    m_metrics.record(invocation);

    if (failure.cancelled) {
        state.tracker->updateAgent(agent, domain::AgentStatus::Idle, "Cancelled");
    } else {
        std::cerr << "[WorkflowCoordinator] " << ExecutorToString(kind) << " failed after " << report.attempts
                  << " attempt(s): " << failure.message << std::endl;
        state.tracker->reportError(agent, failure.message);
    }
    return std::nullopt;
}

WorkflowResult WorkflowCoordinator::run(const std::string& topic,
                                        const StageExecutors& executors,
                                        const WorkflowLimits& limits,
                                        const domain::CancellationToken& cancel) {
    Validate(topic, executors, limits);

    RunState state(topic, limits, cancel);
    state.tracker = std::make_shared<ProgressTracker>(m_publisher, limits.maxIterations - 1);
    {
        std::lock_guard<std::mutex> lock(m_trackerMutex);
        m_tracker = state.tracker;
    }
    m_metrics.reset();

    std::cout << "[WorkflowCoordinator] Starting workflow for: " << topic << std::endl;
    enterStage(state, domain::WorkflowStage::Initializing, "Starting blog generation for: " + topic,
               {{"topic", topic}, {"max_iterations", std::to_string(limits.maxIterations)},
                {"quality_threshold", FormatScore(limits.qualityThreshold)}});

    // --- Research ---
    if (state.cancel.isCancelled()) {
        return finishCancelled(state);
    }
    enterStage(state, domain::WorkflowStage::Researching, "Researching topic: " + topic);

    StageFailure failure;
    auto researchOutput = invokeStage<domain::ResearchResult>(
        state, ExecutorKind::Research, agents::kResearch, "Gathering research",
        [executor = executors.research, topic](const domain::CancellationToken& token) {
            return executor->research(topic, token);
        },
        failure);

    if (researchOutput) {
        state.result.research = std::move(researchOutput->value);
    } else if (failure.cancelled) {
        return finishCancelled(state);
    } else {
        auto degraded = degradeResearch(state, failure);
        if (!degraded) {
            if (!failure.partialFindings.empty()) {
                domain::ResearchResult partial;
                partial.topic = topic;
                partial.findings = failure.partialFindings;
                state.result.research = std::move(partial);
            }
            return finishFailed(state, failure_codes::kResearchFailed, failure.message);
        }
        state.result.research = std::move(*degraded);
        state.result.degradedResearch = true;
    }
    auto research = std::make_shared<const domain::ResearchResult>(*state.result.research);

    // --- Initial draft ---
    if (state.cancel.isCancelled()) {
        return finishCancelled(state);
    }
    enterStage(state, domain::WorkflowStage::Writing, "Writing initial draft",
               {{"findings", std::to_string(research->findings.size())}});

    auto draftOutput = invokeStage<domain::Draft>(
        state, ExecutorKind::Writing, agents::kWriting, "Writing initial draft",
        [executor = executors.writing, topic, research](const domain::CancellationToken& token) {
            return executor->write(topic, *research, std::nullopt, std::nullopt, token);
        },
        failure);
    if (!draftOutput) {
        return failure.cancelled ? finishCancelled(state)
                                 : finishFailed(state, failure_codes::kWritingFailed, failure.message);
    }
    adoptDraft(state, std::move(draftOutput->value));

    // --- Critique / revision loop ---
    while (true) {
        if (state.cancel.isCancelled()) {
            return finishCancelled(state);
        }
        enterStage(state, domain::WorkflowStage::Critiquing,
                   "Critiquing draft (revision " + std::to_string(state.draftRevision) + ")",
                   {{"iteration", std::to_string(state.iteration)},
                    {"draft_revision", std::to_string(state.draftRevision)}});

        auto draft = std::make_shared<const domain::Draft>(*state.currentDraft);
        auto critiqueOutput = invokeStage<domain::Feedback>(
            state, ExecutorKind::Critique, agents::kCritique, "Reviewing draft",
            [executor = executors.critique, draft, research](const domain::CancellationToken& token) {
                return executor->critique(*draft, *research, token);
            },
            failure);
        if (!critiqueOutput) {
            return failure.cancelled ? finishCancelled(state)
                                     : finishFailed(state, failure_codes::kCritiqueFailed, failure.message);
        }

        domain::Feedback feedback = std::move(critiqueOutput->value);
        RevisionVerdict verdict = RevisionPolicy::decide(feedback, state.iteration, limits);

        CritiqueRecord record;
        record.iteration = state.iteration;
        record.draftRevision = state.draftRevision;
        record.feedback = feedback;
        record.verdict = verdict;
        state.result.critiques.push_back(record);
        if (std::isfinite(feedback.overallQuality)) {
            state.result.qualityScore = feedback.overallQuality;
        }

        std::cout << "[WorkflowCoordinator] Iteration " << state.iteration << ": quality "
                  << FormatScore(feedback.overallQuality) << ", decision " << DecisionToString(verdict.decision)
                  << " (" << verdict.reason << ")" << std::endl;
        state.tracker->updateAgent(agents::kOrchestrator, domain::AgentStatus::Working,
                                   "Decision: " + DecisionToString(verdict.decision) + " (" + verdict.reason + ")",
                                   {{"quality", FormatScore(feedback.overallQuality)},
                                    {"decision", DecisionToString(verdict.decision)},
                                    {"approval", domain::ApprovalToString(feedback.approval)},
                                    {"iteration", std::to_string(state.iteration)}});

        if (verdict.decision == RevisionDecision::Abandon) {
            return finishFailed(state, failure_codes::kPolicyAbandoned, verdict.reason);
        }
        if (verdict.decision == RevisionDecision::Accept) {
            state.result.qualityBestEffort = verdict.budgetExhausted &&
                                             feedback.approval != domain::ApprovalStatus::Approved &&
                                             feedback.overallQuality < limits.qualityThreshold;
            return finishCompleted(state);
        }

        // --- Revision ---
        if (state.cancel.isCancelled()) {
            return finishCancelled(state);
        }
        enterStage(state, domain::WorkflowStage::Revising,
                   "Revising draft based on feedback (cycle " + std::to_string(state.iteration + 1) + ")",
                   {{"iteration", std::to_string(state.iteration)}});

        auto instructions = ContentFormatter::FormatFeedbackForRevision(feedback);
        auto revisionOutput = invokeStage<domain::Draft>(
            state, ExecutorKind::Writing, agents::kWriting, "Revising draft",
            [executor = executors.writing, topic, research, draft, instructions](const domain::CancellationToken& token) {
                return executor->write(topic, *research, std::optional<domain::Draft>(*draft),
                                       std::optional<std::string>(instructions), token);
            },
            failure);
        if (!revisionOutput) {
            return failure.cancelled ? finishCancelled(state)
                                     : finishFailed(state, failure_codes::kWritingFailed, failure.message);
        }
        adoptDraft(state, std::move(revisionOutput->value));

        ++state.iteration;
        m_metrics.setIteration(state.iteration);
        state.tracker->setRevisionCount(state.iteration);
    }
}

void WorkflowCoordinator::enterStage(RunState& state,
                                     domain::WorkflowStage stage,
                                     const std::string& message,
                                     std::map<std::string, std::string> metadata) {
    state.stage = stage;
    state.result.stageEntries[stage] = std::chrono::system_clock::now();
    state.tracker->enterStage(stage, message, std::move(metadata));
}

void WorkflowCoordinator::adoptDraft(RunState& state, domain::Draft draft) {
    if (draft.wordCount <= 0) {
        draft.wordCount = domain::CountDraftWords(draft);
    }
    if (state.currentDraft && state.limits.retainDraftHistory) {
        state.result.draftHistory.push_back(*state.currentDraft);
    }
    state.currentDraft = std::move(draft);
    ++state.draftRevision;

    if (m_draftSink) {
        try {
            m_draftSink->onDraft(state.topic, state.draftRevision, *state.currentDraft);
        } catch (const std::exception& e) {
            std::cerr << "[WorkflowCoordinator] Draft sink rejected revision " << state.draftRevision << ": "
                      << e.what() << std::endl;
        }
    }
}

std::optional<domain::ResearchResult> WorkflowCoordinator::degradeResearch(RunState& state,
                                                                           const StageFailure& failure) {
    if (!state.limits.allowDegradedResearch) {
        return std::nullopt;
    }
    auto fallback = m_researchFallback(state.topic, failure.message);
    if (!fallback) {
        return std::nullopt;
    }
    if (fallback->findings.empty()) {
        fallback->findings = failure.partialFindings;
    }
    std::cerr << "[WorkflowCoordinator] Research failed, continuing with degraded research: " << failure.message
              << std::endl;
    state.tracker->updateAgent(agents::kOrchestrator, domain::AgentStatus::Working,
                               "Continuing with degraded research",
                               {{"degraded_research", "true"}, {"reason", failure.message}});
    return fallback;
}

WorkflowResult WorkflowCoordinator::finishCompleted(RunState& state) {
    enterStage(state, domain::WorkflowStage::Finalizing, "Finalizing blog post");
    auto result = buildResult(state, WorkflowStatus::Completed);

    std::map<std::string, std::string> metadata{
        {"iterations", std::to_string(result.iterationCount)},
        {"word_count", std::to_string(result.finalDraft->wordCount)},
    };
    if (result.qualityScore) {
        metadata["quality"] = FormatScore(*result.qualityScore);
    }
    if (result.qualityBestEffort) {
        metadata["best_effort"] = "true";
    }
    enterStage(state, domain::WorkflowStage::Completed, "Blog post completed: " + result.finalDraft->title,
               std::move(metadata));
    result.stageEntries = state.result.stageEntries;

    std::cout << "[WorkflowCoordinator] Completed after " << result.iterationCount << " revision(s) in "
              << result.elapsed.count() << " ms." << std::endl;
    if (m_publisher) {
        m_publisher->close();
    }
    return result;
}

WorkflowResult WorkflowCoordinator::finishFailed(RunState& state,
                                                 const std::string& code,
                                                 const std::string& message) {
    FailureInfo info;
    info.stage = state.stage;
    info.code = code;
    info.message = message;
    state.result.failure = info;

    state.tracker->reportError(agents::kOrchestrator, message);
    enterStage(state, domain::WorkflowStage::Failed, "Workflow failed: " + message,
               {{"failure_code", code}, {"failed_stage", domain::StageToString(info.stage)}});
    auto result = buildResult(state, WorkflowStatus::Failed);

    std::cerr << "[WorkflowCoordinator] Workflow failed in " << domain::StageToString(info.stage) << " (" << code
              << "): " << message << std::endl;
    if (m_publisher) {
        m_publisher->close();
    }
    return result;
}

WorkflowResult WorkflowCoordinator::finishCancelled(RunState& state) {
    return finishFailed(state, failure_codes::kCancelled, "Workflow cancelled");
}

WorkflowResult WorkflowCoordinator::buildResult(RunState& state, WorkflowStatus status) {
    WorkflowResult result = state.result;
    result.status = status;
    result.finalDraft = state.currentDraft;
    result.iterationCount = state.iteration;
    result.revisionCount = std::max(state.draftRevision, 0);
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - state.startedAt);
    result.metrics = m_metrics.snapshot();
    return result;
}

MetricsSnapshot WorkflowCoordinator::metrics() const {
    return m_metrics.snapshot();
}

std::optional<StatusSummary> WorkflowCoordinator::status() const {
    std::lock_guard<std::mutex> lock(m_trackerMutex);
    if (!m_tracker) {
        return std::nullopt;
    }
    return m_tracker->summary();
}

} // namespace blogforge::application
