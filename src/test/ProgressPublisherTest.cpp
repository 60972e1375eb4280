#undef NDEBUG
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "application/ProgressPublisher.hpp"
#include "application/ProgressTracker.hpp"

using namespace blogforge;
using application::OverflowPolicy;
using application::ProgressEvent;
using application::ProgressPublisher;
using application::ProgressTracker;
using domain::WorkflowStage;

namespace {

ProgressEvent Event(const std::string& message) {
    ProgressEvent event;
    event.agent = "workflow";
    event.message = message;
    return event;
}

void TestPublishWithoutSubscribers() {
    ProgressPublisher publisher(4);
    for (int i = 0; i < 100; ++i) {
        publisher.publish(Event("event " + std::to_string(i)));
    }
    assert(publisher.publishedCount() == 100);
    assert(publisher.subscriberCount() == 0);
    std::cout << "[PASS] Publishing with no subscribers never blocks." << std::endl;
}

void TestFanOutInOrder() {
    ProgressPublisher publisher(16);
    auto first = publisher.subscribe();
    auto second = publisher.subscribe();
    assert(publisher.subscriberCount() == 2);

    for (int i = 0; i < 5; ++i) {
        publisher.publish(Event("step " + std::to_string(i)));
    }
    publisher.close();

    for (auto* sub : {&first, &second}) {
        std::uint64_t lastSequence = 0;
        int count = 0;
        while (auto event = sub->next()) {
            assert(event->sequence > lastSequence);
            assert(event->message == "step " + std::to_string(count));
            lastSequence = event->sequence;
            ++count;
        }
        assert(count == 5);
        assert(sub->finished());
    }
    std::cout << "[PASS] Every subscriber sees every event in order." << std::endl;
}

void TestDropOldest() {
    ProgressPublisher publisher(3, OverflowPolicy::DropOldest);
    auto sub = publisher.subscribe();
    for (int i = 0; i < 10; ++i) {
        publisher.publish(Event(std::to_string(i)));
    }
    auto events = sub.drain();
    assert(events.size() == 3);
    assert(events.front().message == "7");
    assert(events.back().message == "9");
    assert(sub.dropped() == 7);
    std::cout << "[PASS] DropOldest keeps the most recent events." << std::endl;
}

void TestDropNewest() {
    ProgressPublisher publisher(3, OverflowPolicy::DropNewest);
    auto sub = publisher.subscribe();
    for (int i = 0; i < 10; ++i) {
        publisher.publish(Event(std::to_string(i)));
    }
    auto events = sub.drain();
    assert(events.size() == 3);
    assert(events.front().message == "0");
    assert(events.back().message == "2");
    assert(sub.dropped() == 7);
    std::cout << "[PASS] DropNewest keeps the earliest events." << std::endl;
}

void TestUnsubscribe() {
    ProgressPublisher publisher(8);
    {
        auto sub = publisher.subscribe();
        publisher.publish(Event("seen"));
        sub.unsubscribe();
        assert(sub.finished());
        assert(!sub.next());
    }
    publisher.publish(Event("after"));
    assert(publisher.subscriberCount() == 0);
    std::cout << "[PASS] Unsubscribed observers stop receiving events." << std::endl;
}

void TestSubscribeAfterClose() {
    ProgressPublisher publisher;
    publisher.publish(Event("early"));
    publisher.close();
    publisher.publish(Event("ignored"));
    assert(publisher.publishedCount() == 1);

    auto late = publisher.subscribe();
    assert(late.finished());
    assert(!late.next(std::chrono::milliseconds(10)));
    std::cout << "[PASS] Closed publisher yields empty sequences." << std::endl;
}

void TestConsumerThread() {
    ProgressPublisher publisher(1024);
    auto sub = publisher.subscribe();
    int received = 0;
    std::thread consumer([&sub, &received] {
        while (sub.next()) {
            ++received;
        }
    });
    for (int i = 0; i < 500; ++i) {
        publisher.publish(Event("tick"));
    }
    publisher.close();
    consumer.join();
    assert(received == 500);
    std::cout << "[PASS] Blocking consumer ends when the publisher closes." << std::endl;
}

void TestTrackerPercentages() {
    auto publisher = std::make_shared<ProgressPublisher>(64);
    auto sub = publisher->subscribe();
    ProgressTracker tracker(publisher, 2);

    tracker.enterStage(WorkflowStage::Initializing, "start");
    assert(tracker.percent() == 5.0);
    tracker.enterStage(WorkflowStage::Researching, "research");
    assert(tracker.percent() == 20.0);
    tracker.enterStage(WorkflowStage::Writing, "write");
    assert(tracker.percent() == 40.0);
    tracker.enterStage(WorkflowStage::Critiquing, "critique");
    assert(tracker.percent() == 60.0);
    tracker.enterStage(WorkflowStage::Revising, "revise");
    assert(tracker.percent() == 80.0);
    tracker.setRevisionCount(1);
    tracker.enterStage(WorkflowStage::Revising, "revise again");
    assert(tracker.percent() == 90.0);
    tracker.setRevisionCount(5);
    tracker.enterStage(WorkflowStage::Revising, "revise late");
    assert(tracker.percent() == 95.0);
    tracker.enterStage(WorkflowStage::Failed, "boom");
    assert(tracker.percent() == 95.0);

    auto summary = tracker.summary();
    assert(summary.stage == WorkflowStage::Failed);
    assert(summary.revisionCount == 5);
    assert(summary.maxRevisions == 2);

    auto events = sub.drain();
    assert(!events.empty());
    assert(events.back().stage == WorkflowStage::Failed);
    assert(events.back().status == domain::AgentStatus::Error);
    assert(events.back().percent == 95.0);
    std::cout << "[PASS] Tracker percentages follow the stage map." << std::endl;
}

void TestTrackerAgents() {
    auto publisher = std::make_shared<ProgressPublisher>(64);
    ProgressTracker tracker(publisher, 2);
    tracker.updateAgent(application::agents::kResearch, domain::AgentStatus::Working, "Gathering");
    tracker.updateAgent(application::agents::kResearch, domain::AgentStatus::Completed, "Done");
    tracker.reportError(application::agents::kCritique, "timeout");

    auto summary = tracker.summary();
    bool sawResearch = false;
    bool sawCritique = false;
    for (const auto& agent : summary.agents) {
        if (agent.name == application::agents::kResearch) {
            sawResearch = true;
            assert(agent.status == domain::AgentStatus::Completed);
            assert(agent.duration().has_value());
        }
        if (agent.name == application::agents::kCritique) {
            sawCritique = true;
            assert(agent.status == domain::AgentStatus::Error);
            assert(agent.errorMessage == "timeout");
        }
    }
    assert(sawResearch && sawCritique);
    std::cout << "[PASS] Tracker keeps per-agent status." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ProgressPublisher Test..." << std::endl;
    TestPublishWithoutSubscribers();
    TestFanOutInOrder();
    TestDropOldest();
    TestDropNewest();
    TestUnsubscribe();
    TestSubscribeAfterClose();
    TestConsumerThread();
    TestTrackerPercentages();
    TestTrackerAgents();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
