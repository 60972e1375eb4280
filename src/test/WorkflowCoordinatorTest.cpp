#undef NDEBUG
#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <thread>

#include "application/WorkflowCoordinator.hpp"
#include "FakeExecutors.hpp"

using namespace blogforge;
using namespace blogforge::test;
using application::WorkflowCoordinator;
using application::WorkflowStatus;
using domain::ApprovalStatus;
using domain::Draft;
using domain::Feedback;
using domain::FeedbackSeverity;
using domain::ResearchResult;
using domain::WorkflowStage;
using namespace std::chrono_literals;

namespace {

const std::string kTopic = "Benefits of Intermittent Fasting";

class RecordingSink : public domain::DraftSink {
public:
    void onDraft(const std::string& topic, int revision, const Draft& draft) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        assert(topic == kTopic);
        m_revisions.push_back(revision);
        m_titles.push_back(draft.title);
    }

    std::vector<int> revisions() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_revisions;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<int> m_revisions;
    std::vector<std::string> m_titles;
};

void TestReviseThenApprove() {
    auto fakes = MakeFakes({Returns(MakeResearchWithFindings(kTopic, 5, 0.8))},
                           {Returns(MakeDraftOfLength("Draft v1", 600), 100),
                            Returns(MakeDraftOfLength("Draft v2", 650), 120)},
                           {Returns(MakeFeedback(6.5, ApprovalStatus::NeedsRevision, {FeedbackSeverity::Major})),
                            Returns(MakeFeedback(8.0, ApprovalStatus::Approved))});
    auto publisher = std::make_shared<application::ProgressPublisher>(256);
    auto subscription = publisher->subscribe();
    auto sink = std::make_shared<RecordingSink>();
    WorkflowCoordinator coordinator(publisher, sink);

    auto result = coordinator.run(kTopic, fakes.bundle(), FastLimits());

    assert(result.status == WorkflowStatus::Completed);
    assert(result.completed());
    assert(!result.failure);
    assert(result.qualityScore && *result.qualityScore == 8.0);
    assert(!result.qualityBestEffort);
    assert(result.revisionCount == 1);
    assert(result.iterationCount == 1);
    assert(result.finalDraft && result.finalDraft->title == "Draft v2");
    assert(result.finalDraft->wordCount == 650);
    assert(result.finalDraft->wordCount == domain::CountDraftWords(*result.finalDraft));
    assert(result.research && result.research->findings.size() == 5);
    assert(result.research->confidence == 0.8);
    assert(!result.degradedResearch);

    assert(fakes.research->calls() == 1);
    assert(fakes.writing->calls() == 2);
    assert(fakes.critique->calls() == 2);

    auto instructions = fakes.writing->instructions();
    assert(instructions[0].empty());
    assert(instructions[1].find("CRITICAL ISSUES TO ADDRESS:") != std::string::npos);
    assert(fakes.writing->priorTitles()[1] == "Draft v1");
    assert((fakes.writing->findingsSeen() == std::vector<std::size_t>{5, 5}));

    assert(result.critiques.size() == 2);
    assert(result.critiques[0].verdict.decision == application::RevisionDecision::Revise);
    assert(result.critiques[0].draftRevision == 0);
    assert(result.critiques[1].verdict.decision == application::RevisionDecision::Accept);
    assert(result.critiques[1].draftRevision == 1);

    assert(result.metrics.callsFor(application::ExecutorKind::Writing) == 2);
    assert(result.metrics.revisionCount == 1);
    assert(result.metrics.iterationCount == 1);
    assert(result.metrics.usageUnits == 10 + 100 + 120 + 10 + 10);
    assert(result.metrics.failures == 0);

    assert(result.stageEntries.count(WorkflowStage::Researching) == 1);
    assert(result.stageEntries.count(WorkflowStage::Revising) == 1);
    assert(result.stageEntries.count(WorkflowStage::Completed) == 1);
    assert(result.stageEntries.count(WorkflowStage::Failed) == 0);

    assert((sink->revisions() == std::vector<int>{0, 1}));

    // The run closes the publisher, so the sequence is finite.
    std::vector<application::ProgressEvent> events;
    while (auto event = subscription.next()) {
        events.push_back(*event);
    }
    assert(!events.empty());
    assert(events.back().stage == WorkflowStage::Completed);
    assert(events.back().percent == 100.0);
    for (std::size_t i = 1; i < events.size(); ++i) {
        assert(events[i].sequence > events[i - 1].sequence);
    }
    assert(publisher->isClosed());

    auto status = coordinator.status();
    assert(status && status->stage == WorkflowStage::Completed);
    std::cout << "[PASS] Revise then approve." << std::endl;
}

void TestIterationBudget() {
    auto fakes = MakeFakes({Returns(MakeResearch(kTopic))}, {Returns(MakeDraft("Draft"))},
                           {Returns(MakeFeedback(5.0, ApprovalStatus::NeedsRevision, {FeedbackSeverity::Major}))});
    auto limits = FastLimits(3);
    limits.retainDraftHistory = true;
    WorkflowCoordinator coordinator(std::make_shared<application::ProgressPublisher>());

    auto result = coordinator.run(kTopic, fakes.bundle(), limits);

    assert(result.completed());
    assert(fakes.critique->calls() == 3);
    assert(fakes.writing->calls() == 3);
    assert(result.critiques.size() == 3);
    assert(result.critiques.back().verdict.budgetExhausted);
    assert(result.qualityBestEffort);
    assert(*result.qualityScore == 5.0);
    assert(result.revisionCount == 2);
    assert(result.draftHistory.size() == 2);
    std::cout << "[PASS] Iteration budget bounds critiques and writes." << std::endl;
}

void TestApprovedFirstTime() {
    auto fakes = MakeFakes({Returns(MakeResearch(kTopic))}, {Returns(MakeDraft("Draft"))},
                           {Returns(MakeFeedback(9.0, ApprovalStatus::Approved))});
    WorkflowCoordinator coordinator(std::make_shared<application::ProgressPublisher>());

    auto result = coordinator.run(kTopic, fakes.bundle(), FastLimits());

    assert(result.completed());
    assert(fakes.writing->calls() == 1);
    assert(fakes.critique->calls() == 1);
    assert(result.revisionCount == 0);
    assert(result.iterationCount == 0);
    assert(result.stageEntries.count(WorkflowStage::Revising) == 0);
    assert(result.draftHistory.empty());
    std::cout << "[PASS] Approved first draft needs no revision." << std::endl;
}

void TestValidation() {
    auto fakes = MakeFakes({Returns(MakeResearch(kTopic))}, {Returns(MakeDraft("Draft"))},
                           {Returns(MakeFeedback(9.0, ApprovalStatus::Approved))});
    auto publisher = std::make_shared<application::ProgressPublisher>();
    WorkflowCoordinator coordinator(publisher);

    for (const std::string topic : {"", "   \t\n"}) {
        bool threw = false;
        try {
            coordinator.run(topic, fakes.bundle(), FastLimits());
        } catch (const application::ValidationError& e) {
            threw = true;
            assert(e.code() == application::failure_codes::kInvalidInput);
        }
        assert(threw);
    }

    bool badLimits = false;
    try {
        coordinator.run(kTopic, fakes.bundle(), FastLimits(0));
    } catch (const application::ValidationError&) {
        badLimits = true;
    }
    assert(badLimits);

    auto hugeBackoff = FastLimits();
    hugeBackoff.backoffCap = std::chrono::milliseconds(std::numeric_limits<std::int64_t>::max());
    auto hugeTimeout = FastLimits();
    hugeTimeout.stageTimeout = std::chrono::milliseconds(std::numeric_limits<std::int64_t>::max() / 2);
    for (const auto& limits : {hugeBackoff, hugeTimeout}) {
        assert(application::FindLimitsViolation(limits));
        bool rejected = false;
        try {
            coordinator.run(kTopic, fakes.bundle(), limits);
        } catch (const application::ValidationError&) {
            rejected = true;
        }
        assert(rejected);
    }

    bool missingExecutor = false;
    auto partial = fakes.bundle();
    partial.critique.reset();
    try {
        coordinator.run(kTopic, partial, FastLimits());
    } catch (const application::ValidationError&) {
        missingExecutor = true;
    }
    assert(missingExecutor);

    assert(fakes.research->calls() == 0);
    assert(fakes.writing->calls() == 0);
    assert(fakes.critique->calls() == 0);
    assert(publisher->publishedCount() == 0);
    std::cout << "[PASS] Invalid input is rejected before any executor runs." << std::endl;
}

void TestStalledObserverDoesNotBlock() {
    auto fakes = MakeFakes({Returns(MakeResearch(kTopic))}, {Returns(MakeDraft("Draft"))},
                           {Returns(MakeFeedback(5.0, ApprovalStatus::NeedsRevision, {FeedbackSeverity::Major}))});
    auto publisher = std::make_shared<application::ProgressPublisher>(1, application::OverflowPolicy::DropNewest);
    auto stalled = publisher->subscribe(); // never read while the run is in flight
    WorkflowCoordinator coordinator(publisher);

    auto result = coordinator.run(kTopic, fakes.bundle(), FastLimits(5));

    assert(result.completed());
    assert(fakes.critique->calls() == 5);
    assert(stalled.dropped() > 0);
    assert(stalled.dropped() + 1 == publisher->publishedCount());

    // Only the first event fits; it is kept and the sequence then ends.
    auto events = stalled.drain();
    assert(events.size() == 1);
    assert(events[0].sequence == 1);
    assert(stalled.finished());
    std::cout << "[PASS] An observer that never reads does not hold up the run." << std::endl;
}

void TestResearchFailure() {
    auto fakes = MakeFakes({FailsFatal<ResearchResult>("search backend down")}, {Returns(MakeDraft("Draft"))},
                           {Returns(MakeFeedback(9.0, ApprovalStatus::Approved))});
    WorkflowCoordinator coordinator(std::make_shared<application::ProgressPublisher>());

    auto result = coordinator.run(kTopic, fakes.bundle(), FastLimits());

    assert(result.status == WorkflowStatus::Failed);
    assert(result.failure->code == application::failure_codes::kResearchFailed);
    assert(result.failure->stage == WorkflowStage::Researching);
    assert(result.failure->message.find("search backend down") != std::string::npos);
    assert(!result.finalDraft);
    assert(fakes.writing->calls() == 0);
    assert(result.metrics.failures == 1);
    assert(result.stageEntries.count(WorkflowStage::Failed) == 1);
    std::cout << "[PASS] Research failure stops the workflow." << std::endl;
}

Step<ResearchResult> FailsWithPartialFindings() {
    return [](const domain::CancellationToken&) -> domain::StageOutput<ResearchResult> {
        domain::RetryableError error("search quota exceeded", "RATE_LIMITED");
        error.setPartialFindings({{"One finding made it through.", "", 0.7, "general"}});
        throw error;
    };
}

void TestResearchRetriesExhaustedKeepsPartial() {
    auto fakes = MakeFakes({FailsWithPartialFindings()}, {Returns(MakeDraft("Draft"))},
                           {Returns(MakeFeedback(9.0, ApprovalStatus::Approved))});
    WorkflowCoordinator coordinator(std::make_shared<application::ProgressPublisher>());

    auto limits = FastLimits();
    limits.maxRetries = 2;
    auto result = coordinator.run(kTopic, fakes.bundle(), limits);

    assert(!result.completed());
    assert(fakes.research->calls() == 3);
    assert(result.metrics.retries == 2);
    assert(result.failure->code == application::failure_codes::kResearchFailed);
    assert(result.research && result.research->findings.size() == 1);
    std::cout << "[PASS] Exhausted research retries keep partial findings." << std::endl;
}

void TestDegradedResearch() {
    auto fakes = MakeFakes({FailsWithPartialFindings()}, {Returns(MakeDraft("Draft"))},
                           {Returns(MakeFeedback(8.0, ApprovalStatus::Approved))});
    WorkflowCoordinator coordinator(std::make_shared<application::ProgressPublisher>());

    auto limits = FastLimits();
    limits.maxRetries = 0;
    limits.allowDegradedResearch = true;
    auto result = coordinator.run(kTopic, fakes.bundle(), limits);

    assert(result.completed());
    assert(result.degradedResearch);
    assert(result.research->confidence < 0.5);
    assert(fakes.writing->findingsSeen()[0] == 1);
    std::cout << "[PASS] Degraded research continues with partial findings." << std::endl;
}

void TestCustomFallbackDeclines() {
    auto fakes = MakeFakes({FailsFatal<ResearchResult>()}, {Returns(MakeDraft("Draft"))},
                           {Returns(MakeFeedback(8.0, ApprovalStatus::Approved))});
    WorkflowCoordinator coordinator(std::make_shared<application::ProgressPublisher>(), nullptr,
                                    [](const std::string&, const std::string&) {
                                        return std::optional<ResearchResult>();
                                    });
    auto limits = FastLimits();
    limits.allowDegradedResearch = true;
    auto result = coordinator.run(kTopic, fakes.bundle(), limits);

    assert(!result.completed());
    assert(result.failure->code == application::failure_codes::kResearchFailed);
    std::cout << "[PASS] A declining fallback fails the research stage." << std::endl;
}

void TestWritingFailure() {
    auto fakes = MakeFakes({Returns(MakeResearch(kTopic))}, {FailsFatal<Draft>("empty draft")},
                           {Returns(MakeFeedback(9.0, ApprovalStatus::Approved))});
    WorkflowCoordinator coordinator(std::make_shared<application::ProgressPublisher>());

    auto result = coordinator.run(kTopic, fakes.bundle(), FastLimits());

    assert(result.failure->code == application::failure_codes::kWritingFailed);
    assert(result.failure->stage == WorkflowStage::Writing);
    assert(result.research);
    assert(!result.finalDraft);
    assert(fakes.critique->calls() == 0);
    std::cout << "[PASS] Writing failure keeps the research." << std::endl;
}

void TestRevisionFailureKeepsBestDraft() {
    auto fakes = MakeFakes({Returns(MakeResearch(kTopic))},
                           {Returns(MakeDraft("Draft v1")), FailsFatal<Draft>("model refused")},
                           {Returns(MakeFeedback(4.0, ApprovalStatus::NeedsRevision))});
    WorkflowCoordinator coordinator(std::make_shared<application::ProgressPublisher>());

    auto result = coordinator.run(kTopic, fakes.bundle(), FastLimits());

    assert(result.failure->code == application::failure_codes::kWritingFailed);
    assert(result.failure->stage == WorkflowStage::Revising);
    assert(result.finalDraft && result.finalDraft->title == "Draft v1");
    assert(result.critiques.size() == 1);
    assert(*result.qualityScore == 4.0);
    std::cout << "[PASS] Revision failure keeps the last good draft." << std::endl;
}

void TestCritiqueFailure() {
    auto fakes = MakeFakes({Returns(MakeResearch(kTopic))}, {Returns(MakeDraft("Draft"))},
                           {FailsRetryable<Feedback>("critic unreachable")});
    WorkflowCoordinator coordinator(std::make_shared<application::ProgressPublisher>());

    auto result = coordinator.run(kTopic, fakes.bundle(), FastLimits());

    assert(result.failure->code == application::failure_codes::kCritiqueFailed);
    assert(result.failure->stage == WorkflowStage::Critiquing);
    assert(result.finalDraft);
    assert(fakes.critique->calls() == 3);
    auto status = coordinator.status();
    assert(status && status->stage == WorkflowStage::Failed);
    std::cout << "[PASS] Critique failure after retries." << std::endl;
}

void TestPolicyAbandon() {
    auto fakes = MakeFakes({Returns(MakeResearch(kTopic))}, {Returns(MakeDraft("Draft"))},
                           {Returns(MakeFeedback(std::numeric_limits<double>::quiet_NaN(),
                                                 ApprovalStatus::NeedsRevision))});
    WorkflowCoordinator coordinator(std::make_shared<application::ProgressPublisher>());

    auto result = coordinator.run(kTopic, fakes.bundle(), FastLimits());

    assert(result.failure->code == application::failure_codes::kPolicyAbandoned);
    assert(result.failure->stage == WorkflowStage::Critiquing);
    assert(!result.qualityScore);
    assert(result.finalDraft);
    assert(fakes.writing->calls() == 1);
    std::cout << "[PASS] Unusable critique score abandons the workflow." << std::endl;
}

void TestCancelledBeforeStart() {
    auto fakes = MakeFakes({Returns(MakeResearch(kTopic))}, {Returns(MakeDraft("Draft"))},
                           {Returns(MakeFeedback(9.0, ApprovalStatus::Approved))});
    WorkflowCoordinator coordinator(std::make_shared<application::ProgressPublisher>());
    domain::CancellationSource source;
    source.cancel();

    auto result = coordinator.run(kTopic, fakes.bundle(), FastLimits(), source.token());

    assert(result.failure->code == application::failure_codes::kCancelled);
    assert(fakes.research->calls() == 0);
    std::cout << "[PASS] Cancelled run makes no executor calls." << std::endl;
}

void TestCancelledMidRun() {
    auto fakes = MakeFakes({Returns(MakeResearch(kTopic))}, {Hangs<Draft>()},
                           {Returns(MakeFeedback(9.0, ApprovalStatus::Approved))});
    WorkflowCoordinator coordinator(std::make_shared<application::ProgressPublisher>());
    domain::CancellationSource source;
    auto limits = FastLimits();
    limits.stageTimeout = 0ms;

    std::thread canceller([&source] {
        std::this_thread::sleep_for(100ms);
        source.cancel();
    });
    auto result = coordinator.run(kTopic, fakes.bundle(), limits, source.token());
    canceller.join();

    assert(result.failure->code == application::failure_codes::kCancelled);
    assert(result.failure->stage == WorkflowStage::Writing);
    assert(fakes.critique->calls() == 0);
    assert(result.metrics.callsFor(application::ExecutorKind::Writing) == 1);
    std::cout << "[PASS] Cancellation during a stage stops the run." << std::endl;
}

void TestStageTimeout() {
    auto fakes = MakeFakes({Returns(MakeResearch(kTopic))}, {Hangs<Draft>()},
                           {Returns(MakeFeedback(9.0, ApprovalStatus::Approved))});
    WorkflowCoordinator coordinator(std::make_shared<application::ProgressPublisher>());
    auto limits = FastLimits();
    limits.stageTimeout = 50ms;
    limits.maxRetries = 1;

    auto result = coordinator.run(kTopic, fakes.bundle(), limits);

    assert(result.failure->code == application::failure_codes::kWritingFailed);
    assert(result.failure->message.find("timed out") != std::string::npos);
    assert(fakes.writing->calls() == 2);
    std::cout << "[PASS] Stage timeout fails after retries." << std::endl;
}

void TestCoordinatorReusable() {
    auto fakes = MakeFakes({Returns(MakeResearch(kTopic))}, {Returns(MakeDraft("Draft"))},
                           {Returns(MakeFeedback(9.0, ApprovalStatus::Approved))});
    WorkflowCoordinator coordinator(nullptr);
    auto first = coordinator.run(kTopic, fakes.bundle(), FastLimits());
    auto second = coordinator.run(kTopic, fakes.bundle(), FastLimits());
    assert(first.completed() && second.completed());
    // Metrics are per run.
    assert(second.metrics.callsFor(application::ExecutorKind::Research) == 1);
    std::cout << "[PASS] Coordinator runs without a publisher and resets metrics." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting WorkflowCoordinator Test..." << std::endl;
    TestReviseThenApprove();
    TestIterationBudget();
    TestApprovedFirstTime();
    TestValidation();
    TestStalledObserverDoesNotBlock();
    TestResearchFailure();
    TestResearchRetriesExhaustedKeepsPartial();
    TestDegradedResearch();
    TestCustomFallbackDeclines();
    TestWritingFailure();
    TestRevisionFailureKeepsBestDraft();
    TestCritiqueFailure();
    TestPolicyAbandon();
    TestCancelledBeforeStart();
    TestCancelledMidRun();
    TestStageTimeout();
    TestCoordinatorReusable();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
