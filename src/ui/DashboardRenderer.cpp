/**
 * @file DashboardRenderer.cpp
 * @brief Dear ImGui rendering of the generation dashboard.
 */

#include "ui/DashboardRenderer.hpp"

#include "imgui.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace blogforge::ui {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
    localtime_r(&tt, &tm);
    return tm;
}

ImVec4 StatusColor(domain::AgentStatus status) {
    switch (status) {
        case domain::AgentStatus::Working: return ImVec4(1.0f, 0.85f, 0.2f, 1.0f);
        case domain::AgentStatus::Completed: return ImVec4(0.4f, 0.9f, 0.4f, 1.0f);
        case domain::AgentStatus::Error: return ImVec4(1.0f, 0.35f, 0.35f, 1.0f);
        case domain::AgentStatus::Idle: break;
    }
    return ImVec4(0.6f, 0.6f, 0.6f, 1.0f);
}

const char* label(const DashboardState& state, const char* withEmoji, const char* plain) {
    return state.ui.emojiEnabled ? withEmoji : plain;
}

void DrawControls(DashboardState& state) {
    const bool generating = state.IsGenerating();

    ImGui::Text("Topic:");
    ImGui::SetNextItemWidth(-1);
    if (generating) ImGui::BeginDisabled();
    const bool submitted = ImGui::InputText("##topic", state.topicBuffer, sizeof(state.topicBuffer),
                                            ImGuiInputTextFlags_EnterReturnsTrue);

    if (ImGui::CollapsingHeader("Limits")) {
        ImGui::SliderInt("Max iterations", &state.form.maxIterations, 1, 10);
        ImGui::SliderFloat("Quality threshold", &state.form.qualityThreshold, 0.0f, 10.0f, "%.1f");
        ImGui::SliderInt("Max retries", &state.form.maxRetries, 0, 5);
        ImGui::SliderInt("Stage timeout (s)", &state.form.stageTimeoutSeconds, 0, 1800);
        ImGui::Checkbox("Allow degraded research", &state.form.allowDegradedResearch);
        ImGui::SameLine();
        ImGui::Checkbox("Keep draft history", &state.form.retainDraftHistory);
        ImGui::SameLine();
        ImGui::Checkbox("Archive to disk", &state.form.archive);
    }

    if (ImGui::Button(label(state, "✍️ Generate", "Generate"), ImVec2(150, 30)) || submitted) {
        state.StartGeneration();
    }
    if (generating) ImGui::EndDisabled();

    ImGui::SameLine();
    if (!generating) ImGui::BeginDisabled();
    if (ImGui::Button(label(state, "⛔ Cancel", "Cancel"), ImVec2(120, 30))) {
        state.CancelGeneration();
    }
    if (!generating) ImGui::EndDisabled();

    if (generating) {
        ImGui::SameLine();
        ImGui::TextColored(ImVec4(1, 1, 0, 1), "%s", label(state, "⏳ Working...", "Working..."));
    }
    if (!state.LastError().empty()) {
        ImGui::TextColored(ImVec4(1.0f, 0.35f, 0.35f, 1.0f), "%s", state.LastError().c_str());
    }
}

void DrawStatus(const DashboardState& state) {
    const auto& status = state.Status();
    if (!status) {
        ImGui::TextDisabled("No run yet.");
        return;
    }

    char overlay[64];
    std::snprintf(overlay, sizeof(overlay), "%s %.0f%%", domain::StageToString(status->stage).c_str(), status->percent);
    ImGui::ProgressBar(static_cast<float>(status->percent / 100.0), ImVec2(-1, 0), overlay);
    ImGui::Text("Revisions: %d / %d   Elapsed: %.1f s", status->revisionCount, status->maxRevisions,
                status->elapsed.count() / 1000.0);

    const ImGuiTableFlags tableFlags = ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg;
    if (ImGui::BeginTable("Agents", 4, tableFlags)) {
        ImGui::TableSetupColumn("Agent");
        ImGui::TableSetupColumn("Status");
        ImGui::TableSetupColumn("Task");
        ImGui::TableSetupColumn("Duration");
        ImGui::TableHeadersRow();
        for (const auto& agent : status->agents) {
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            ImGui::TextUnformatted(agent.name.c_str());
            ImGui::TableSetColumnIndex(1);
            ImGui::TextColored(StatusColor(agent.status), "%s", domain::AgentStatusToString(agent.status).c_str());
            ImGui::TableSetColumnIndex(2);
            ImGui::TextUnformatted(agent.errorMessage.empty() ? agent.currentTask.c_str() : agent.errorMessage.c_str());
            ImGui::TableSetColumnIndex(3);
            if (auto duration = agent.duration()) {
                ImGui::Text("%.1f s", duration->count() / 1000.0);
            }
        }
        ImGui::EndTable();
    }
}

void DrawEventLog(DashboardState& state) {
    ImGui::Text("Events:");
    if (state.DroppedEvents() > 0) {
        ImGui::SameLine();
        ImGui::TextDisabled("(%zu dropped)", state.DroppedEvents());
    }
    ImGui::SameLine();
    ImGui::Checkbox("Auto-scroll", &state.ui.autoScrollLog);

    ImGui::BeginChild("EventLog", ImVec2(0, 180), true);
    for (const auto& event : state.Events()) {
        std::tm tm = ToLocalTime(std::chrono::system_clock::to_time_t(event.timestamp));
        char stamp[16];
        std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &tm);
        const bool isError = event.status == domain::AgentStatus::Error;
        if (isError) ImGui::PushStyleColor(ImGuiCol_Text, StatusColor(event.status));
        ImGui::Text("[%s] %-12s %s (%.0f%%)", stamp, event.agent.c_str(), event.message.c_str(), event.percent);
        if (isError) ImGui::PopStyleColor();
    }
    if (state.ui.autoScrollLog && ImGui::GetScrollY() >= ImGui::GetScrollMaxY())
        ImGui::SetScrollHereY(1.0f);
    ImGui::EndChild();
}

void DrawMetrics(const application::WorkflowResult& result) {
    const auto& m = result.metrics;
    ImGui::Text("Status: %s", application::WorkflowStatusToString(result.status).c_str());
    if (result.qualityScore) {
        ImGui::SameLine();
        ImGui::Text("  Quality: %.1f/10%s", *result.qualityScore, result.qualityBestEffort ? " (best effort)" : "");
    }
    if (result.finalDraft) {
        ImGui::SameLine();
        ImGui::Text("  Words: %d", result.finalDraft->wordCount);
    }
    ImGui::Text("Revisions: %d  API calls: %d  Retries: %d  Failures: %d  Usage units: %llu", result.revisionCount,
                m.apiCalls, m.retries, m.failures, static_cast<unsigned long long>(m.usageUnits));
    for (const auto& [kind, usage] : m.executors) {
        ImGui::BulletText("%s: %d call(s), %.1f s", application::ExecutorToString(kind).c_str(), usage.calls,
                          usage.elapsed.count() / 1000.0);
    }
    if (result.degradedResearch) {
        ImGui::TextColored(ImVec4(1.0f, 0.85f, 0.2f, 1.0f), "Research was degraded.");
    }
}

void DrawCritiques(const application::WorkflowResult& result) {
    for (const auto& record : result.critiques) {
        std::string header = "Critique " + std::to_string(record.iteration + 1) + " (draft " +
                             std::to_string(record.draftRevision) + ")";
        if (ImGui::TreeNode(header.c_str())) {
            ImGui::Text("Quality %.1f, %s, decision: %s", record.feedback.overallQuality,
                        domain::ApprovalToString(record.feedback.approval).c_str(),
                        application::DecisionToString(record.verdict.decision).c_str());
            ImGui::TextWrapped("%s", record.feedback.summary.c_str());
            for (const auto& item : record.feedback.items) {
                ImGui::BulletText("[%s] %s: %s", domain::SeverityToString(item.severity).c_str(), item.section.c_str(),
                                  item.issue.c_str());
            }
            ImGui::TreePop();
        }
    }
}

} // namespace

void DrawUI(DashboardState& state) {
    state.Poll();

    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    const ImGuiWindowFlags windowFlags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                         ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_MenuBar;
    ImGui::Begin("BlogForge", nullptr, windowFlags);

    if (ImGui::BeginMenuBar()) {
        if (ImGui::BeginMenu("File")) {
            if (ImGui::MenuItem("Exit")) {
                state.ui.requestExit = true;
            }
            ImGui::EndMenu();
        }
        if (ImGui::BeginMenu("View")) {
            ImGui::MenuItem("Draft history", nullptr, &state.ui.showDraftHistory);
            ImGui::EndMenu();
        }
        ImGui::TextDisabled("  Model: %s @ %s:%d", state.Config().ollama.model.c_str(),
                            state.Config().ollama.host.c_str(), state.Config().ollama.port);
        ImGui::EndMenuBar();
    }

    DrawControls(state);
    ImGui::Separator();
    DrawStatus(state);
    ImGui::Separator();
    DrawEventLog(state);

    const auto& result = state.LastResult();
    if (result) {
        ImGui::Separator();
        ImGui::Text("%s", label(state, "📊 Last run", "Last run"));
        DrawMetrics(*result);
        DrawCritiques(*result);

        if (state.ui.showDraftHistory && !result->draftHistory.empty()) {
            if (ImGui::CollapsingHeader("Superseded drafts")) {
                for (std::size_t i = 0; i < result->draftHistory.size(); ++i) {
                    const auto& draft = result->draftHistory[i];
                    std::string header = "Draft " + std::to_string(i) + ": " + draft.title;
                    if (ImGui::TreeNode(header.c_str())) {
                        ImGui::TextWrapped("%s", draft.introduction.c_str());
                        ImGui::TreePop();
                    }
                }
            }
        }
    }

    if (!state.RenderedPost().empty()) {
        ImGui::Separator();
        ImGui::Text("%s", label(state, "📝 Post", "Post"));
        ImGui::BeginChild("Post", ImVec2(0, 0), true);
        ImGui::TextWrapped("%s", state.RenderedPost().c_str());
        ImGui::EndChild();
    }

    ImGui::End();
}

} // namespace blogforge::ui
