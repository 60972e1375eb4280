/**
 * @file ProgressTracker.hpp
 * @brief Per-agent status table and completion estimate feeding the ProgressPublisher.
 */

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "application/ProgressPublisher.hpp"
#include "domain/WorkflowStage.hpp"

namespace blogforge::application {

namespace agents {
inline constexpr const char* kWorkflow = "workflow";
inline constexpr const char* kResearch = "research";
inline constexpr const char* kWriting = "writing";
inline constexpr const char* kCritique = "critique";
inline constexpr const char* kOrchestrator = "orchestrator";
} // namespace agents

/**
 * @struct AgentProgress
 * @brief Last known activity of one agent.
 */
struct AgentProgress {
    std::string name;
    domain::AgentStatus status = domain::AgentStatus::Idle;
    std::string currentTask;
    std::optional<std::chrono::steady_clock::time_point> startedAt;
    std::optional<std::chrono::steady_clock::time_point> endedAt;
    std::string errorMessage;

    /** @brief Time spent in the current (or last) working period. */
    std::optional<std::chrono::milliseconds> duration() const;
};

/**
 * @struct StatusSummary
 * @brief Snapshot for dashboards and console status lines.
 */
struct StatusSummary {
    domain::WorkflowStage stage = domain::WorkflowStage::Initializing;
    double percent = 0.0;
    int revisionCount = 0;
    int maxRevisions = 0;
    std::chrono::milliseconds elapsed{0};
    std::vector<AgentProgress> agents;
};

/**
 * @class ProgressTracker
 * @brief Turns stage transitions and agent updates into ProgressEvents.
 *
 * Completion estimates: initializing 5, researching 20, writing 40,
 * critiquing 60, revising 80 (+10 per completed revision, at most 95),
 * finalizing 95, completed 100. A failed run keeps its last estimate.
 */
class ProgressTracker {
public:
    /**
     * @param publisher Destination of the events; may be null.
     * @param maxRevisions Revision budget shown next to the revision count.
     */
    ProgressTracker(std::shared_ptr<ProgressPublisher> publisher, int maxRevisions);

    void enterStage(domain::WorkflowStage stage,
                    const std::string& message,
                    std::map<std::string, std::string> metadata = {});

    void updateAgent(const std::string& agent,
                     domain::AgentStatus status,
                     const std::string& task,
                     std::map<std::string, std::string> metadata = {});

    void setRevisionCount(int count);

    /** @brief Marks an agent as failed and publishes the error. */
    void reportError(const std::string& agent, const std::string& message);

    StatusSummary summary() const;

    domain::WorkflowStage stage() const;
    double percent() const;

private:
    double estimateLocked(domain::WorkflowStage stage) const;
    void publishLocked(const std::string& agent,
                       domain::AgentStatus status,
                       const std::string& message,
                       std::map<std::string, std::string> metadata);

    std::shared_ptr<ProgressPublisher> m_publisher;
    mutable std::mutex m_mutex;
    std::map<std::string, AgentProgress> m_agents;
    domain::WorkflowStage m_stage = domain::WorkflowStage::Initializing;
    double m_percent = 0.0;
    int m_revisionCount = 0;
    int m_maxRevisions = 0;
    std::chrono::steady_clock::time_point m_startedAt;
    std::optional<std::chrono::steady_clock::time_point> m_endedAt;
};

} // namespace blogforge::application
