/**
 * @file DashboardState.hpp
 * @brief State of the generation dashboard and its link to the background job.
 */

#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "application/AsyncTaskManager.hpp"
#include "application/BlogGenerationService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DraftArchive.hpp"

namespace blogforge::ui {

/**
 * @struct LimitsForm
 * @brief Editable copy of the workflow limits bound to the dashboard widgets.
 */
struct LimitsForm {
    int maxIterations = 3;
    float qualityThreshold = 7.0f;
    int maxRetries = 2;
    int stageTimeoutSeconds = 300;
    bool allowDegradedResearch = false;
    bool retainDraftHistory = false;
    bool archive = true;
};

/**
 * @struct UiFlags
 * @brief Window-level switches.
 */
struct UiFlags {
    bool emojiEnabled = false;
    bool requestExit = false;
    bool autoScrollLog = true;
    bool showDraftHistory = false;
};

/**
 * @class DashboardState
 * @brief Owns the services and everything the renderer displays.
 *
 * Generation runs on the AsyncTaskManager. The render thread calls Poll()
 * once per frame to drain progress events and pick up the finished result.
 */
class DashboardState {
public:
    static constexpr std::size_t kMaxLogEvents = 500;

    explicit DashboardState(infrastructure::AppConfig config);
    ~DashboardState();

    /** @brief Wires the generation service, the job runner and the optional archive. */
    void InjectServices(std::shared_ptr<application::BlogGenerationService> service,
                        std::shared_ptr<application::AsyncTaskManager> taskManager,
                        std::shared_ptr<infrastructure::DraftArchive> archive);

    /** @brief Starts a run for the topic in topicBuffer. Returns false when busy or not wired. */
    bool StartGeneration();
    void CancelGeneration();
    bool IsGenerating() const;

    /** @brief Drains progress events and collects a finished run. Call once per frame. */
    void Poll();

    application::WorkflowLimits BuildLimits() const;

    const infrastructure::AppConfig& Config() const { return m_config; }
    const std::deque<application::ProgressEvent>& Events() const { return m_events; }
    const std::optional<application::StatusSummary>& Status() const { return m_status; }
    const std::optional<application::WorkflowResult>& LastResult() const { return m_lastResult; }
    const std::string& RenderedPost() const { return m_renderedPost; }
    const std::string& LastError() const { return m_lastError; }
    std::size_t DroppedEvents() const { return m_droppedEvents; }

    char topicBuffer[256] = "";
    LimitsForm form;
    UiFlags ui;

private:
    struct PendingRun {
        std::mutex mutex;
        std::optional<application::WorkflowResult> result;
    };

    void AppendEvent(application::ProgressEvent event);
    void FinishRun();

    infrastructure::AppConfig m_config;
    std::shared_ptr<application::BlogGenerationService> m_service;
    std::shared_ptr<infrastructure::DraftArchive> m_archive;

    std::optional<application::ProgressSubscription> m_subscription;
    std::shared_ptr<application::TaskStatus> m_task;
    std::shared_ptr<PendingRun> m_pending;

    std::deque<application::ProgressEvent> m_events;
    std::size_t m_droppedEvents = 0;
    std::optional<application::StatusSummary> m_status;
    std::optional<application::WorkflowResult> m_lastResult;
    std::string m_renderedPost;
    std::string m_lastError;

    std::shared_ptr<application::AsyncTaskManager> m_taskManager;
};

} // namespace blogforge::ui
