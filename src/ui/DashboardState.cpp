/**
 * @file DashboardState.cpp
 * @brief Implementation of DashboardState.
 */

#include "ui/DashboardState.hpp"
#include "application/ContentFormatter.hpp"

#include <iostream>

namespace blogforge::ui {

DashboardState::DashboardState(infrastructure::AppConfig config) : m_config(std::move(config)) {
    const auto& limits = m_config.workflow;
    form.maxIterations = limits.maxIterations;
    form.qualityThreshold = static_cast<float>(limits.qualityThreshold);
    form.maxRetries = limits.maxRetries;
    form.stageTimeoutSeconds = static_cast<int>(limits.stageTimeout.count() / 1000);
    form.allowDegradedResearch = limits.allowDegradedResearch;
    form.retainDraftHistory = limits.retainDraftHistory;
    form.archive = m_config.output.archive;
}

DashboardState::~DashboardState() {
    CancelGeneration();
}

void DashboardState::InjectServices(std::shared_ptr<application::BlogGenerationService> service,
                                    std::shared_ptr<application::AsyncTaskManager> taskManager,
                                    std::shared_ptr<infrastructure::DraftArchive> archive) {
    m_service = std::move(service);
    m_taskManager = std::move(taskManager);
    m_archive = std::move(archive);
}

application::WorkflowLimits DashboardState::BuildLimits() const {
    application::WorkflowLimits limits = m_config.workflow;
    limits.maxIterations = form.maxIterations;
    limits.qualityThreshold = form.qualityThreshold;
    limits.maxRetries = form.maxRetries;
    limits.stageTimeout = std::chrono::seconds(form.stageTimeoutSeconds);
    limits.allowDegradedResearch = form.allowDegradedResearch;
    limits.retainDraftHistory = form.retainDraftHistory;
    return limits;
}

bool DashboardState::IsGenerating() const {
    return m_task && !m_task->isCompleted.load();
}

bool DashboardState::StartGeneration() {
    if (!m_service || !m_taskManager || m_task) {
        return false;
    }

    const std::string topic = topicBuffer;
    const auto limits = BuildLimits();
    if (!domain::IsValidTopic(topic)) {
        m_lastError = "Enter a topic to generate a post.";
        return false;
    }
    if (auto violation = application::FindLimitsViolation(limits)) {
        m_lastError = *violation;
        return false;
    }

    m_lastError.clear();
    m_lastResult.reset();
    m_renderedPost.clear();
    m_events.clear();
    m_droppedEvents = 0;
    m_service->setDraftSink(form.archive ? m_archive : nullptr);
    m_subscription.emplace(m_service->subscribe());
    m_pending = std::make_shared<PendingRun>();

    auto service = m_service;
    auto archive = form.archive ? m_archive : nullptr;
    auto pending = m_pending;
    m_task = m_taskManager->SubmitTask(
        application::TaskType::Generation, "Generating: " + topic,
        [service, archive, pending, topic, limits](std::shared_ptr<application::TaskStatus> status) {
            auto result = service->run(topic, limits, status->Token());
            {
                std::lock_guard<std::mutex> lock(pending->mutex);
                pending->result = result;
            }
            if (archive) {
                archive->saveResult(result);
            }
        });
    std::cout << "[Dashboard] Generation started: " << topic << std::endl;
    return true;
}

void DashboardState::CancelGeneration() {
    if (m_task && !m_task->isCompleted.load()) {
        std::cout << "[Dashboard] Cancelling generation." << std::endl;
        m_task->RequestCancel();
    }
}

void DashboardState::Poll() {
    if (m_subscription) {
        for (auto& event : m_subscription->drain()) {
            AppendEvent(std::move(event));
        }
        m_droppedEvents = m_subscription->dropped();
    }
    if (m_service) {
        m_status = m_service->status();
    }
    if (m_task && m_task->isCompleted.load()) {
        FinishRun();
    }
}

void DashboardState::AppendEvent(application::ProgressEvent event) {
    m_events.push_back(std::move(event));
    while (m_events.size() > kMaxLogEvents) {
        m_events.pop_front();
    }
}

void DashboardState::FinishRun() {
    if (m_subscription) {
        for (auto& event : m_subscription->drain()) {
            AppendEvent(std::move(event));
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_pending->mutex);
        m_lastResult = std::move(m_pending->result);
    }
    if (m_task->failed.load()) {
        m_lastError = m_task->errorMessage;
    }
    if (m_lastResult && m_lastResult->finalDraft) {
        m_renderedPost = application::ContentFormatter::RenderMarkdown(*m_lastResult->finalDraft);
    } else {
        m_renderedPost.clear();
    }
    if (m_lastResult && m_lastResult->failure && !m_task->failed.load()) {
        m_lastError = m_lastResult->failure->code + ": " + m_lastResult->failure->message;
    }

    m_subscription.reset();
    m_pending.reset();
    m_task.reset();
}

} // namespace blogforge::ui
