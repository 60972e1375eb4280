/**
 * @file Cancellation.cpp
 * @brief Implementation of CancellationToken and CancellationSource.
 */

#include "domain/Cancellation.hpp"

#include <algorithm>
#include <thread>

namespace blogforge::domain {

bool CancellationToken::isCancelled() const {
    return m_state && m_state->cancelled.load();
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    if (!m_state) {
        std::this_thread::sleep_for(duration);
        return false;
    }
    std::unique_lock<std::mutex> lock(m_state->mutex);
    return m_state->cv.wait_for(lock, duration, [this] { return m_state->cancelled.load(); });
}

CancellationSource::CancellationSource()
    : m_state(std::make_shared<CancellationToken::State>()) {}

CancellationSource::CancellationSource(const CancellationToken& parent)
    : m_state(std::make_shared<CancellationToken::State>()) {
    if (!parent.m_state) {
        return;
    }
    bool parentCancelled = false;
    {
        std::lock_guard<std::mutex> lock(parent.m_state->mutex);
        parentCancelled = parent.m_state->cancelled.load();
        if (!parentCancelled) {
            auto& siblings = parent.m_state->children;
            siblings.erase(std::remove_if(siblings.begin(), siblings.end(),
                                          [](const auto& weak) { return weak.expired(); }),
                           siblings.end());
            siblings.push_back(m_state);
        }
    }
    if (parentCancelled) {
        cancelState(m_state);
    }
}

void CancellationSource::cancel() {
    cancelState(m_state);
}

bool CancellationSource::isCancelled() const {
    return m_state->cancelled.load();
}

void CancellationSource::cancelState(const std::shared_ptr<CancellationToken::State>& state) {
    std::vector<std::weak_ptr<CancellationToken::State>> children;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->cancelled.exchange(true)) {
            return;
        }
        children.swap(state->children);
    }
    state->cv.notify_all();

    for (const auto& weakChild : children) {
        if (auto child = weakChild.lock()) {
            cancelState(child);
        }
    }
}

} // namespace blogforge::domain
