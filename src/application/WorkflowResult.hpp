/**
 * @file WorkflowResult.hpp
 * @brief Terminal report of a generation run.
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "application/MetricsAggregator.hpp"
#include "application/RevisionPolicy.hpp"
#include "domain/Content.hpp"
#include "domain/WorkflowStage.hpp"

namespace blogforge::application {

enum class WorkflowStatus {
    Completed,
    Failed
};

inline std::string WorkflowStatusToString(WorkflowStatus status) {
    return status == WorkflowStatus::Completed ? "completed" : "failed";
}

namespace failure_codes {
inline constexpr const char* kResearchFailed = "RESEARCH_FAILED";
inline constexpr const char* kWritingFailed = "WRITING_FAILED";
inline constexpr const char* kCritiqueFailed = "CRITIQUE_FAILED";
inline constexpr const char* kPolicyAbandoned = "POLICY_ABANDONED";
inline constexpr const char* kCancelled = "CANCELLED";
inline constexpr const char* kInvalidInput = "INVALID_INPUT";
} // namespace failure_codes

struct FailureInfo {
    domain::WorkflowStage stage = domain::WorkflowStage::Initializing; ///< Stage in which the run failed.
    std::string code;
    std::string message;
};

/**
 * @struct CritiqueRecord
 * @brief One critique and the decision it led to.
 */
struct CritiqueRecord {
    int iteration = 0;     ///< Revision cycle the critique happened in.
    int draftRevision = 0; ///< Revision of the draft that was evaluated (0 = initial).
    domain::Feedback feedback;
    RevisionVerdict verdict;
};

/**
 * @struct WorkflowResult
 * @brief Built only once the run reaches Completed or Failed.
 */
struct WorkflowResult {
    WorkflowStatus status = WorkflowStatus::Failed;
    std::string topic;
    std::optional<domain::Draft> finalDraft;       ///< Absent only when no draft was produced.
    std::optional<domain::ResearchResult> research; ///< May be partial or degraded.
    bool degradedResearch = false;
    int iterationCount = 0;
    int revisionCount = 0;
    std::chrono::milliseconds elapsed{0};
    std::optional<double> qualityScore;
    bool qualityBestEffort = false; ///< Accepted on exhausted budget below the threshold.
    std::optional<FailureInfo> failure;
    MetricsSnapshot metrics;
    std::vector<CritiqueRecord> critiques;
    std::vector<domain::Draft> draftHistory; ///< Superseded drafts, oldest first, when retained.
    std::map<domain::WorkflowStage, std::chrono::system_clock::time_point> stageEntries;

    bool completed() const { return status == WorkflowStatus::Completed; }
};

} // namespace blogforge::application
