/**
 * @file ProgressTracker.cpp
 * @brief Implementation of ProgressTracker.
 */

#include "application/ProgressTracker.hpp"

#include <algorithm>
#include <cctype>

namespace blogforge::application {

namespace {

std::string Capitalize(std::string text) {
    if (!text.empty()) {
        text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
    }
    return text;
}

} // namespace

std::optional<std::chrono::milliseconds> AgentProgress::duration() const {
    if (!startedAt) {
        return std::nullopt;
    }
    auto end = endedAt ? *endedAt : std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - *startedAt);
}

ProgressTracker::ProgressTracker(std::shared_ptr<ProgressPublisher> publisher, int maxRevisions)
    : m_publisher(std::move(publisher)),
      m_maxRevisions(maxRevisions),
      m_startedAt(std::chrono::steady_clock::now()) {
    for (const char* name : {agents::kResearch, agents::kWriting, agents::kCritique, agents::kOrchestrator}) {
        AgentProgress agent;
        agent.name = name;
        m_agents.emplace(name, agent);
    }
}

double ProgressTracker::estimateLocked(domain::WorkflowStage stage) const {
    switch (stage) {
        case domain::WorkflowStage::Initializing: return 5.0;
        case domain::WorkflowStage::Researching: return 20.0;
        case domain::WorkflowStage::Writing: return 40.0;
        case domain::WorkflowStage::Critiquing: return 60.0;
        case domain::WorkflowStage::Revising:
            return std::min(80.0 + std::min(m_revisionCount * 10.0, 30.0), 95.0);
        case domain::WorkflowStage::Finalizing: return 95.0;
        case domain::WorkflowStage::Completed: return 100.0;
        case domain::WorkflowStage::Failed: return m_percent;
    }
    return m_percent;
}

void ProgressTracker::enterStage(domain::WorkflowStage stage,
                                 const std::string& message,
                                 std::map<std::string, std::string> metadata) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stage = stage;
    m_percent = estimateLocked(stage);
    if (domain::IsTerminal(stage)) {
        m_endedAt = std::chrono::steady_clock::now();
    }

    auto status = domain::AgentStatus::Working;
    if (stage == domain::WorkflowStage::Completed) {
        status = domain::AgentStatus::Completed;
    } else if (stage == domain::WorkflowStage::Failed) {
        status = domain::AgentStatus::Error;
    }
    publishLocked(agents::kWorkflow, status,
                  message.empty() ? "Workflow stage: " + domain::StageToString(stage) : message,
                  std::move(metadata));
}

void ProgressTracker::updateAgent(const std::string& agent,
                                  domain::AgentStatus status,
                                  const std::string& task,
                                  std::map<std::string, std::string> metadata) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& progress = m_agents[agent];
    progress.name = agent;

    const auto now = std::chrono::steady_clock::now();
    if (status == domain::AgentStatus::Working && progress.status != domain::AgentStatus::Working) {
        progress.startedAt = now;
        progress.endedAt.reset();
    } else if ((status == domain::AgentStatus::Completed || status == domain::AgentStatus::Error) &&
               progress.status == domain::AgentStatus::Working) {
        progress.endedAt = now;
    }
    progress.status = status;
    progress.currentTask = task;

    metadata["agent_status"] = domain::AgentStatusToString(status);
    if (!task.empty()) {
        metadata["agent_task"] = task;
    }
    std::string message = Capitalize(agent) + " Agent: " + (task.empty() ? domain::AgentStatusToString(status) : task);
    publishLocked(agent, status, message, std::move(metadata));
}

void ProgressTracker::setRevisionCount(int count) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_revisionCount = count;
    std::map<std::string, std::string> metadata{
        {"revision_count", std::to_string(count)},
        {"max_revisions", std::to_string(m_maxRevisions)},
    };
    publishLocked(agents::kWorkflow, domain::AgentStatus::Working,
                  "Revision cycle " + std::to_string(count) + "/" + std::to_string(m_maxRevisions),
                  std::move(metadata));
}

void ProgressTracker::reportError(const std::string& agent, const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& progress = m_agents[agent];
    progress.name = agent;
    progress.status = domain::AgentStatus::Error;
    progress.errorMessage = message;
    progress.endedAt = std::chrono::steady_clock::now();
    publishLocked(agent, domain::AgentStatus::Error, "Error in " + agent + ": " + message, {{"error", message}});
}

StatusSummary ProgressTracker::summary() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    StatusSummary summary;
    summary.stage = m_stage;
    summary.percent = m_percent;
    summary.revisionCount = m_revisionCount;
    summary.maxRevisions = m_maxRevisions;
    auto end = m_endedAt ? *m_endedAt : std::chrono::steady_clock::now();
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - m_startedAt);
    for (const auto& entry : m_agents) {
        summary.agents.push_back(entry.second);
    }
    return summary;
}

domain::WorkflowStage ProgressTracker::stage() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stage;
}

double ProgressTracker::percent() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_percent;
}

void ProgressTracker::publishLocked(const std::string& agent,
                                    domain::AgentStatus status,
                                    const std::string& message,
                                    std::map<std::string, std::string> metadata) {
    if (!m_publisher) {
        return;
    }
    ProgressEvent event;
    event.timestamp = std::chrono::system_clock::now();
    event.stage = m_stage;
    event.agent = agent;
    event.status = status;
    event.message = message;
    event.percent = m_percent;
    event.metadata = std::move(metadata);
    m_publisher->publish(std::move(event));
}

} // namespace blogforge::application
