/**
 * @file ProgressPublisher.cpp
 * @brief Implementation of ProgressPublisher and its subscriptions.
 */

#include "application/ProgressPublisher.hpp"

#include <algorithm>

namespace blogforge::application {

// --- ProgressChannel ---

ProgressChannel::ProgressChannel(std::size_t capacity, OverflowPolicy policy)
    : m_capacity(capacity == 0 ? 1 : capacity), m_policy(policy) {}

void ProgressChannel::push(const ProgressEvent& event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed || m_detached.load()) {
            return;
        }
        if (m_buffer.size() >= m_capacity) {
            ++m_dropped;
            if (m_policy == OverflowPolicy::DropNewest) {
                return;
            }
            m_buffer.pop_front();
        }
        m_buffer.push_back(event);
    }
    m_cv.notify_one();
}

void ProgressChannel::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_cv.notify_all();
}

void ProgressChannel::detach() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_detached = true;
        m_buffer.clear();
    }
    m_cv.notify_all();
}

std::optional<ProgressEvent> ProgressChannel::takeFront() {
    if (m_buffer.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(m_buffer.front());
    m_buffer.pop_front();
    return event;
}

std::optional<ProgressEvent> ProgressChannel::pop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return !m_buffer.empty() || m_closed || m_detached.load(); });
    return takeFront();
}

std::optional<ProgressEvent> ProgressChannel::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, timeout, [this] { return !m_buffer.empty() || m_closed || m_detached.load(); });
    return takeFront();
}

std::vector<ProgressEvent> ProgressChannel::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ProgressEvent> events(std::make_move_iterator(m_buffer.begin()),
                                      std::make_move_iterator(m_buffer.end()));
    m_buffer.clear();
    return events;
}

bool ProgressChannel::finished() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return (m_closed || m_detached.load()) && m_buffer.empty();
}

std::size_t ProgressChannel::dropped() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

std::size_t ProgressChannel::buffered() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_buffer.size();
}

// --- ProgressSubscription ---

ProgressSubscription::ProgressSubscription(std::shared_ptr<ProgressChannel> channel)
    : m_channel(std::move(channel)) {}

ProgressSubscription::~ProgressSubscription() {
    unsubscribe();
}

ProgressSubscription& ProgressSubscription::operator=(ProgressSubscription&& other) noexcept {
    if (this != &other) {
        unsubscribe();
        m_channel = std::move(other.m_channel);
    }
    return *this;
}

std::optional<ProgressEvent> ProgressSubscription::next() {
    if (!m_channel) return std::nullopt;
    return m_channel->pop();
}

std::optional<ProgressEvent> ProgressSubscription::next(std::chrono::milliseconds timeout) {
    if (!m_channel) return std::nullopt;
    return m_channel->pop(timeout);
}

std::vector<ProgressEvent> ProgressSubscription::drain() {
    if (!m_channel) return {};
    return m_channel->drain();
}

bool ProgressSubscription::finished() const {
    return !m_channel || m_channel->finished();
}

std::size_t ProgressSubscription::dropped() const {
    return m_channel ? m_channel->dropped() : 0;
}

void ProgressSubscription::unsubscribe() {
    if (m_channel) {
        m_channel->detach();
    }
}

// --- ProgressPublisher ---

ProgressPublisher::ProgressPublisher(std::size_t capacity, OverflowPolicy policy)
    : m_capacity(capacity), m_policy(policy) {}

void ProgressPublisher::publish(ProgressEvent event) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) {
        return;
    }
    event.sequence = ++m_sequence;
    pruneDetached();
    for (const auto& channel : m_channels) {
        channel->push(event);
    }
}

ProgressSubscription ProgressPublisher::subscribe() {
    auto channel = std::make_shared<ProgressChannel>(m_capacity, m_policy);
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) {
        channel->close();
    } else {
        m_channels.push_back(channel);
    }
    return ProgressSubscription(channel);
}

void ProgressPublisher::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) {
        return;
    }
    m_closed = true;
    for (const auto& channel : m_channels) {
        channel->close();
    }
    m_channels.clear();
}

bool ProgressPublisher::isClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

std::size_t ProgressPublisher::subscriberCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<std::size_t>(std::count_if(m_channels.begin(), m_channels.end(),
                                                  [](const auto& channel) { return !channel->isDetached(); }));
}

std::uint64_t ProgressPublisher::publishedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sequence;
}

void ProgressPublisher::pruneDetached() {
    m_channels.erase(std::remove_if(m_channels.begin(), m_channels.end(),
                                    [](const auto& channel) { return channel->isDetached(); }),
                     m_channels.end());
}

} // namespace blogforge::application
