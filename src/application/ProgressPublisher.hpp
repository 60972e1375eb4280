/**
 * @file ProgressPublisher.hpp
 * @brief Non-blocking broadcast of workflow progress events to any number of observers.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/WorkflowStage.hpp"

namespace blogforge::application {

/**
 * @struct ProgressEvent
 * @brief One observable step of a workflow.
 */
struct ProgressEvent {
    std::uint64_t sequence = 0; ///< Assigned by the publisher, starts at 1.
    std::chrono::system_clock::time_point timestamp;
    domain::WorkflowStage stage = domain::WorkflowStage::Initializing;
    std::string agent;          ///< "workflow", "research", "writing", "critique" or "orchestrator".
    domain::AgentStatus status = domain::AgentStatus::Idle;
    std::string message;
    double percent = 0.0;       ///< Estimated overall completion, 0-100.
    std::map<std::string, std::string> metadata;
};

/**
 * @enum OverflowPolicy
 * @brief What a full subscriber buffer does with a new event.
 */
enum class OverflowPolicy {
    DropOldest, ///< Evict the oldest buffered event to make room.
    DropNewest  ///< Discard the incoming event.
};

/**
 * @class ProgressChannel
 * @brief Bounded per-subscriber buffer. Pushing never waits for the consumer.
 */
class ProgressChannel {
public:
    ProgressChannel(std::size_t capacity, OverflowPolicy policy);

    void push(const ProgressEvent& event);
    void close();
    void detach();
    bool isDetached() const { return m_detached.load(); }

    /** @brief Blocks until an event is available or the channel ends. */
    std::optional<ProgressEvent> pop();
    /** @brief As pop(), but gives up after @p timeout. */
    std::optional<ProgressEvent> pop(std::chrono::milliseconds timeout);
    std::vector<ProgressEvent> drain();

    /** @brief Closed (or detached) and nothing left to read. */
    bool finished() const;
    std::size_t dropped() const;
    std::size_t buffered() const;

private:
    std::optional<ProgressEvent> takeFront();

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<ProgressEvent> m_buffer;
    const std::size_t m_capacity;
    const OverflowPolicy m_policy;
    std::size_t m_dropped = 0;
    bool m_closed = false;
    std::atomic<bool> m_detached{false};
};

/**
 * @class ProgressSubscription
 * @brief Lazy, finite sequence of events for one observer.
 *
 * The sequence ends once the publisher is closed and every buffered event has
 * been read. Destroying the subscription detaches it from the publisher.
 */
class ProgressSubscription {
public:
    explicit ProgressSubscription(std::shared_ptr<ProgressChannel> channel);
    ~ProgressSubscription();

    ProgressSubscription(ProgressSubscription&&) noexcept = default;
    ProgressSubscription& operator=(ProgressSubscription&& other) noexcept;
    ProgressSubscription(const ProgressSubscription&) = delete;
    ProgressSubscription& operator=(const ProgressSubscription&) = delete;

    /** @brief Next event; nullopt once the sequence has ended. */
    std::optional<ProgressEvent> next();
    /** @brief Next event; nullopt on timeout or once the sequence has ended. */
    std::optional<ProgressEvent> next(std::chrono::milliseconds timeout);
    /** @brief Every buffered event, without waiting. */
    std::vector<ProgressEvent> drain();

    bool finished() const;
    std::size_t dropped() const;

    /** @brief Leaves the broadcast; the sequence ends immediately. */
    void unsubscribe();

private:
    std::shared_ptr<ProgressChannel> m_channel;
};

/**
 * @class ProgressPublisher
 * @brief Fans events out to every live subscription.
 *
 * publish() only takes short internal locks and never waits on observers; a
 * slow observer loses events according to the overflow policy instead.
 */
class ProgressPublisher {
public:
    explicit ProgressPublisher(std::size_t capacity = 256, OverflowPolicy policy = OverflowPolicy::DropOldest);

    void publish(ProgressEvent event);

    ProgressSubscription subscribe();

    /** @brief Ends every subscription's sequence. Later events are ignored. */
    void close();

    bool isClosed() const;
    std::size_t subscriberCount() const;
    std::uint64_t publishedCount() const;
    std::size_t capacity() const { return m_capacity; }
    OverflowPolicy policy() const { return m_policy; }

private:
    void pruneDetached();

    mutable std::mutex m_mutex;
    std::vector<std::shared_ptr<ProgressChannel>> m_channels;
    const std::size_t m_capacity;
    const OverflowPolicy m_policy;
    std::uint64_t m_sequence = 0;
    bool m_closed = false;
};

} // namespace blogforge::application
