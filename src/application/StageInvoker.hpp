/**
 * @file StageInvoker.hpp
 * @brief Retry, exponential backoff, timeout and cancellation around any executor call.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include "application/WorkflowLimits.hpp"
#include "domain/Cancellation.hpp"
#include "domain/StageErrors.hpp"
#include "domain/StageExecutors.hpp"

namespace blogforge::application {

/**
 * @struct RetryPolicy
 * @brief Per-invocation budget: retries, backoff and timeout.
 */
struct RetryPolicy {
    int maxRetries = 2;
    std::chrono::milliseconds stageTimeout{0}; ///< 0 means no deadline.
    std::chrono::milliseconds backoffBase{1000};
    std::chrono::milliseconds backoffCap{30000};

    static RetryPolicy FromLimits(const WorkflowLimits& limits) {
        RetryPolicy policy;
        policy.maxRetries = limits.maxRetries;
        policy.stageTimeout = limits.stageTimeout;
        policy.backoffBase = limits.backoffBase;
        policy.backoffCap = limits.backoffCap;
        return policy;
    }
};

/**
 * @class InvocationCancelled
 * @brief Raised when the workflow was cancelled before or during an invocation.
 */
class InvocationCancelled : public std::runtime_error {
public:
    explicit InvocationCancelled(const std::string& label)
        : std::runtime_error(label + " cancelled") {}
};

/**
 * @struct InvocationReport
 * @brief What an invocation cost, filled in on success and on failure.
 */
struct InvocationReport {
    int attempts = 0;
    std::chrono::milliseconds elapsed{0};
    std::string lastError;
};

/**
 * @class StageInvoker
 * @brief Runs executor calls on a worker thread under a RetryPolicy.
 *
 * RetryableError (including timeouts) is retried with
 * min(base * 2^retry, cap) delays, honouring a larger retry-after hint.
 * Exhaustion is rethrown as a FatalError with code RETRIES_EXHAUSTED that keeps
 * the last error's context and partial findings. FatalError is rethrown as is;
 * any other std::exception becomes a FatalError with code UNEXPECTED.
 */
class StageInvoker {
public:
    StageInvoker(RetryPolicy policy, domain::CancellationToken cancel)
        : m_policy(policy), m_cancel(std::move(cancel)) {}

    template <typename T>
    using Call = std::function<domain::StageOutput<T>(const domain::CancellationToken&)>;

    /**
     * @param label Name used in diagnostics ("research", "critique", ...).
     * @param call The executor call. Must capture its inputs by value: a timed-out
     *             attempt keeps running detached until the executor returns.
     * @param report Attempts and elapsed time, always filled in.
     */
    template <typename T>
    domain::StageOutput<T> invoke(const std::string& label, Call<T> call, InvocationReport& report) const {
        const auto started = std::chrono::steady_clock::now();
        auto stamp = [&report, started] {
            report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
        };

        int attempt = 0;
        while (true) {
            if (m_cancel.isCancelled()) {
                stamp();
                throw InvocationCancelled(label);
            }
            ++attempt;
            report.attempts = attempt;
            try {
                auto output = runAttempt<T>(label, call);
                stamp();
                return output;
            } catch (const domain::RetryableError& e) {
                report.lastError = e.what();
                if (attempt > m_policy.maxRetries) {
                    stamp();
                    throw exhausted(label, e, attempt);
                }
                auto delay = backoffDelay(attempt - 1);
                if (e.retryAfter() && *e.retryAfter() > delay) {
                    delay = *e.retryAfter();
                }
                std::cerr << "[StageInvoker] " << label << " attempt " << attempt << " failed: " << e.what()
                          << ". Retrying in " << delay.count() << " ms." << std::endl;
                if (m_cancel.waitFor(delay)) {
                    stamp();
                    throw InvocationCancelled(label);
                }
            } catch (const domain::FatalError& e) {
                report.lastError = e.what();
                stamp();
                throw;
            } catch (const InvocationCancelled&) {
                stamp();
                throw;
            } catch (const std::exception& e) {
                report.lastError = e.what();
                stamp();
                throw domain::FatalError(label + " failed unexpectedly: " + e.what(), "UNEXPECTED");
            }
        }
    }

    /** @brief Delay before retry number @p retryIndex (0-based). */
    std::chrono::milliseconds backoffDelay(int retryIndex) const;

    const RetryPolicy& policy() const { return m_policy; }

private:
    static constexpr std::chrono::milliseconds kPollInterval{20};

    template <typename T>
    domain::StageOutput<T> runAttempt(const std::string& label, const Call<T>& call) const {
        domain::CancellationSource attemptSource(m_cancel);
        auto task = std::make_shared<std::packaged_task<domain::StageOutput<T>()>>(
            [call, token = attemptSource.token()] { return call(token); });
        auto future = task->get_future();
        std::thread([task] { (*task)(); }).detach();

        const bool hasDeadline = m_policy.stageTimeout.count() > 0;
        const auto deadline = std::chrono::steady_clock::now() + m_policy.stageTimeout;
        while (true) {
            auto slice = kPollInterval;
            if (hasDeadline) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                slice = std::max(std::chrono::milliseconds{0}, std::min(slice, remaining));
            }
            if (future.wait_for(slice) == std::future_status::ready) {
                return future.get();
            }
            if (m_cancel.isCancelled()) {
                attemptSource.cancel();
                throw InvocationCancelled(label);
            }
            if (hasDeadline && std::chrono::steady_clock::now() >= deadline) {
                attemptSource.cancel();
                throw domain::RetryableError(label + " timed out after " +
                                                 std::to_string(m_policy.stageTimeout.count()) + " ms",
                                             "TIMEOUT");
            }
        }
    }

    static domain::FatalError exhausted(const std::string& label, const domain::RetryableError& last, int attempts);

    RetryPolicy m_policy;
    domain::CancellationToken m_cancel;
};

} // namespace blogforge::application
