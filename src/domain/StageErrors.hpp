/**
 * @file StageErrors.hpp
 * @brief Failure types a stage executor may raise.
 *
 * Executors signal transient problems (network, timeout, rate limit) with
 * RetryableError and unusable output with FatalError. The coordinator decides
 * whether and how often to retry.
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "Content.hpp"

namespace blogforge::domain {

enum class ErrorSeverity {
    Low,
    Medium,
    High,
    Critical
};

inline std::string ErrorSeverityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::Low: return "low";
        case ErrorSeverity::Medium: return "medium";
        case ErrorSeverity::High: return "high";
        case ErrorSeverity::Critical: return "critical";
    }
    return "medium";
}

/**
 * @class StageError
 * @brief Base class of executor failures.
 */
class StageError : public std::runtime_error {
public:
    StageError(const std::string& message, std::string code, ErrorSeverity severity)
        : std::runtime_error(message), m_code(std::move(code)), m_severity(severity) {}

    const std::string& code() const { return m_code; }
    ErrorSeverity severity() const { return m_severity; }

    /** @brief Free-form diagnostic context (api name, status code, ...). */
    const std::map<std::string, std::string>& context() const { return m_context; }
    void addContext(const std::string& key, const std::string& value) { m_context[key] = value; }

    /** @brief Findings a research executor gathered before failing. */
    const std::vector<ResearchFinding>& partialFindings() const { return m_partialFindings; }
    void setPartialFindings(std::vector<ResearchFinding> findings) { m_partialFindings = std::move(findings); }

    virtual bool isRetryable() const = 0;

private:
    std::string m_code;
    ErrorSeverity m_severity;
    std::map<std::string, std::string> m_context;
    std::vector<ResearchFinding> m_partialFindings;
};

/**
 * @class RetryableError
 * @brief Transient failure; eligible for backoff retry.
 */
class RetryableError : public StageError {
public:
    explicit RetryableError(const std::string& message,
                            std::string code = "RETRYABLE",
                            std::optional<std::chrono::milliseconds> retryAfter = std::nullopt)
        : StageError(message, std::move(code), ErrorSeverity::Medium), m_retryAfter(retryAfter) {}

    /** @brief Server-provided minimum wait before the next attempt, if any. */
    std::optional<std::chrono::milliseconds> retryAfter() const { return m_retryAfter; }

    bool isRetryable() const override { return true; }

private:
    std::optional<std::chrono::milliseconds> m_retryAfter;
};

/**
 * @class FatalError
 * @brief Malformed or unusable output; never retried.
 */
class FatalError : public StageError {
public:
    explicit FatalError(const std::string& message,
                        std::string code = "FATAL",
                        ErrorSeverity severity = ErrorSeverity::High)
        : StageError(message, std::move(code), severity) {}

    bool isRetryable() const override { return false; }
};

} // namespace blogforge::domain
