#undef NDEBUG
#include <cassert>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <thread>

#include "ui/DashboardState.hpp"
#include "FakeExecutors.hpp"

using namespace blogforge;
using namespace blogforge::test;
using domain::ApprovalStatus;
using ui::DashboardState;

namespace {

void SetTopic(DashboardState& state, const char* topic) {
    std::snprintf(state.topicBuffer, sizeof(state.topicBuffer), "%s", topic);
}

/** @brief Polls like the render loop until the running job has been collected. */
bool PollUntilIdle(DashboardState& state) {
    for (int frame = 0; frame < 500; ++frame) {
        state.Poll();
        if (!state.IsGenerating() && state.LastResult()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

struct Fixture {
    FakeExecutors fakes;
    std::unique_ptr<DashboardState> state;
};

Fixture MakeDashboard() {
    Fixture fixture{MakeFakes({Returns(MakeResearch("topic"))}, {Returns(MakeDraft("Approved Post"))},
                              {Returns(MakeFeedback(9.0, ApprovalStatus::Approved)),
                               FailsFatal<domain::Feedback>("critic produced garbage")}),
                    nullptr};
    infrastructure::AppConfig config;
    config.workflow = FastLimits();
    config.output.archive = false;
    auto service = std::make_shared<application::BlogGenerationService>(fixture.fakes.bundle(), config.workflow);
    fixture.state = std::make_unique<DashboardState>(config);
    fixture.state->InjectServices(service, std::make_shared<application::AsyncTaskManager>(), nullptr);
    return fixture;
}

void TestRunShowsResult() {
    auto fixture = MakeDashboard();
    auto& state = *fixture.state;
    SetTopic(state, "Benefits of Intermittent Fasting");

    assert(state.StartGeneration());
    assert(PollUntilIdle(state));
    assert(state.LastResult()->completed());
    assert(state.LastError().empty());
    assert(state.RenderedPost().rfind("# Approved Post\n", 0) == 0);
    assert(!state.Events().empty());
    assert(state.Events().back().stage == domain::WorkflowStage::Completed);
    std::cout << "[PASS] A finished run is rendered." << std::endl;
}

void TestBlankTopicRejected() {
    auto fixture = MakeDashboard();
    auto& state = *fixture.state;
    SetTopic(state, "Benefits of Intermittent Fasting");
    assert(state.StartGeneration());
    assert(PollUntilIdle(state));

    SetTopic(state, "   ");
    assert(!state.StartGeneration());
    assert(!state.IsGenerating());
    assert(!state.LastError().empty());
    assert(fixture.fakes.research->calls() == 1);
    std::cout << "[PASS] A blank topic is rejected without starting a job." << std::endl;
}

void TestNewRunClearsPreviousResult() {
    auto fixture = MakeDashboard();
    auto& state = *fixture.state;
    SetTopic(state, "First topic");
    assert(state.StartGeneration());
    assert(PollUntilIdle(state));
    assert(state.LastResult()->completed());

    SetTopic(state, "Second topic");
    assert(state.StartGeneration());
    assert(!state.LastResult());
    assert(state.RenderedPost().empty());

    assert(PollUntilIdle(state));
    const auto& result = *state.LastResult();
    assert(!result.completed());
    assert(result.topic == "Second topic");
    assert(state.LastError().rfind(application::failure_codes::kCritiqueFailed, 0) == 0);
    std::cout << "[PASS] Starting a run discards the previous result." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting DashboardState Test..." << std::endl;
    TestRunShowsResult();
    TestBlankTopicRejected();
    TestNewRunClearsPreviousResult();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
