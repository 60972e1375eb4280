/**
 * @file Cancellation.hpp
 * @brief Cooperative cancellation shared between the coordinator and executors.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace blogforge::domain {

class CancellationSource;

/**
 * @class CancellationToken
 * @brief Read side of a cancellation signal. Cheap to copy.
 *
 * A default-constructed token is never cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancelled() const;

    /**
     * @brief Sleeps for up to @p duration, waking early on cancellation.
     * @return True if the token was cancelled.
     */
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    friend class CancellationSource;

    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
        std::vector<std::weak_ptr<State>> children;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : m_state(std::move(state)) {}

    std::shared_ptr<State> m_state;
};

/**
 * @class CancellationSource
 * @brief Write side of a cancellation signal.
 *
 * A source created from a parent token is cancelled whenever the parent is.
 */
class CancellationSource {
public:
    CancellationSource();
    explicit CancellationSource(const CancellationToken& parent);

    void cancel();
    bool isCancelled() const;
    CancellationToken token() const { return CancellationToken(m_state); }

private:
    static void cancelState(const std::shared_ptr<CancellationToken::State>& state);

    std::shared_ptr<CancellationToken::State> m_state;
};

} // namespace blogforge::domain
