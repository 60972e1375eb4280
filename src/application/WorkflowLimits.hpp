/**
 * @file WorkflowLimits.hpp
 * @brief Budgets and tuning knobs of a generation run.
 */

#pragma once

#include <chrono>
#include <cmath>
#include <optional>
#include <string>

namespace blogforge::application {

/**
 * @struct PolicyConfig
 * @brief Tuning of the revision decision heuristics.
 */
struct PolicyConfig {
    /** Revise when the score misses the threshold by more than this. */
    double reviseMargin = 0.5;
    /** Severity weights summed over feedback items (major items always trigger a revision). */
    double moderateWeight = 0.0;
    double minorWeight = 0.0;
    /** Revise when the weighted severity reaches this value. 0 disables the rule. */
    double severityReviseThreshold = 0.0;
};

/**
 * @struct WorkflowLimits
 * @brief Iteration, quality, time and retry budgets enforced by the coordinator.
 */
struct WorkflowLimits {
    int maxIterations = 3;           ///< Maximum critique cycles, >= 1.
    double qualityThreshold = 7.0;   ///< Acceptance score, in [0,10].
    std::chrono::milliseconds stageTimeout{300000}; ///< Per invocation. 0 disables.
    int maxRetries = 2;              ///< Retries after the first attempt of a stage.
    std::chrono::milliseconds backoffBase{1000};
    std::chrono::milliseconds backoffCap{30000};
    bool allowDegradedResearch = false; ///< Continue with fallback research when research fails.
    bool retainDraftHistory = false;    ///< Keep every draft version in the result.
    PolicyConfig policy;
};

/** @brief Upper bounds keeping deadline and backoff arithmetic in range. */
inline constexpr int kMaxIterationsLimit = 100;
inline constexpr int kMaxRetriesLimit = 100;
inline constexpr std::chrono::milliseconds kMaxStageTimeout = std::chrono::hours(24);
inline constexpr std::chrono::milliseconds kMaxBackoff = std::chrono::hours(1);

/**
 * @brief Checks the limits invariants.
 * @return A description of the first violation, or nullopt when valid.
 */
inline std::optional<std::string> FindLimitsViolation(const WorkflowLimits& limits) {
    if (limits.maxIterations < 1 || limits.maxIterations > kMaxIterationsLimit) {
        return "max_iterations must be within [1, " + std::to_string(kMaxIterationsLimit) + "]";
    }
    if (!std::isfinite(limits.qualityThreshold) || limits.qualityThreshold < 0.0 || limits.qualityThreshold > 10.0) {
        return "quality_threshold must be within [0, 10]";
    }
    if (limits.stageTimeout.count() < 0 || limits.stageTimeout > kMaxStageTimeout) {
        return "stage_timeout must be within [0, 24h]";
    }
    if (limits.maxRetries < 0 || limits.maxRetries > kMaxRetriesLimit) {
        return "max_retries must be within [0, " + std::to_string(kMaxRetriesLimit) + "]";
    }
    if (limits.backoffBase.count() < 0 || limits.backoffCap.count() < 0 ||
        limits.backoffBase > kMaxBackoff || limits.backoffCap > kMaxBackoff) {
        return "backoff delays must be within [0, 1h]";
    }
    if (limits.policy.reviseMargin < 0.0) {
        return "revise_margin must not be negative";
    }
    return std::nullopt;
}

} // namespace blogforge::application
