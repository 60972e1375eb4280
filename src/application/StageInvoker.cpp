/**
 * @file StageInvoker.cpp
 * @brief Non-template parts of StageInvoker.
 */

#include "application/StageInvoker.hpp"

namespace blogforge::application {

std::chrono::milliseconds StageInvoker::backoffDelay(int retryIndex) const {
    auto delay = m_policy.backoffBase;
    for (int i = 0; i < retryIndex && delay < m_policy.backoffCap; ++i) {
        delay *= 2;
    }
    return std::min(delay, m_policy.backoffCap);
}

domain::FatalError StageInvoker::exhausted(const std::string& label,
                                           const domain::RetryableError& last,
                                           int attempts) {
    domain::FatalError error(label + " failed after " + std::to_string(attempts) + " attempts: " + last.what(),
                             "RETRIES_EXHAUSTED");
    for (const auto& entry : last.context()) {
        error.addContext(entry.first, entry.second);
    }
    error.addContext("last_error_code", last.code());
    error.setPartialFindings(last.partialFindings());
    return error;
}

} // namespace blogforge::application
