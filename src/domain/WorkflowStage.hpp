/**
 * @file WorkflowStage.hpp
 * @brief Value Object defining the lifecycle stages of a generation workflow.
 */

#pragma once

#include <string>

namespace blogforge::domain {

/**
 * @enum WorkflowStage
 * @brief Current phase of a single generation run.
 */
enum class WorkflowStage {
    Initializing, ///< Input validation and setup.
    Researching,  ///< Gathering findings for the topic.
    Writing,      ///< Producing the initial draft.
    Critiquing,   ///< Scoring the current draft.
    Revising,     ///< Rewriting the draft with critique feedback.
    Finalizing,   ///< Assembling the result.
    Completed,    ///< Terminal: result available.
    Failed        ///< Terminal: partial result available.
};

/**
 * @enum AgentStatus
 * @brief Per-agent activity state reported to progress observers.
 */
enum class AgentStatus {
    Idle,
    Working,
    Completed,
    Error
};

/**
 * @brief Helper to convert stage to string for display/logging.
 */
inline std::string StageToString(WorkflowStage stage) {
    switch (stage) {
        case WorkflowStage::Initializing: return "initializing";
        case WorkflowStage::Researching: return "researching";
        case WorkflowStage::Writing: return "writing";
        case WorkflowStage::Critiquing: return "critiquing";
        case WorkflowStage::Revising: return "revising";
        case WorkflowStage::Finalizing: return "finalizing";
        case WorkflowStage::Completed: return "completed";
        case WorkflowStage::Failed: return "failed";
    }
    return "unknown";
}

inline std::string AgentStatusToString(AgentStatus status) {
    switch (status) {
        case AgentStatus::Idle: return "idle";
        case AgentStatus::Working: return "working";
        case AgentStatus::Completed: return "completed";
        case AgentStatus::Error: return "error";
    }
    return "idle";
}

inline bool IsTerminal(WorkflowStage stage) {
    return stage == WorkflowStage::Completed || stage == WorkflowStage::Failed;
}

} // namespace blogforge::domain
