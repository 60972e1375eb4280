/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace blogforge::infrastructure {

using json = nlohmann::json;

namespace {

std::chrono::milliseconds Millis(const json& section, const char* key, std::chrono::milliseconds fallback) {
    return section.contains(key) ? std::chrono::milliseconds(section[key].get<long long>()) : fallback;
}

application::OverflowPolicy OverflowFromString(const std::string& value) {
    if (value == "drop_newest") return application::OverflowPolicy::DropNewest;
    if (value != "drop_oldest") {
        std::cerr << "[ConfigLoader] Unknown overflow policy '" << value << "', using drop_oldest." << std::endl;
    }
    return application::OverflowPolicy::DropOldest;
}

} // namespace

AppConfig ConfigLoader::FromJson(const json& j, AppConfig config) {
    if (j.contains("ollama")) {
        const auto& o = j["ollama"];
        config.ollama.host = o.value("host", config.ollama.host);
        config.ollama.port = o.value("port", config.ollama.port);
        config.ollama.model = o.value("model", config.ollama.model);
        config.ollama.readTimeoutSeconds = o.value("read_timeout_s", config.ollama.readTimeoutSeconds);
        config.ollama.autoSelectModel = o.value("auto_select_model", config.ollama.autoSelectModel);
    }

    if (j.contains("workflow")) {
        const auto& w = j["workflow"];
        auto& limits = config.workflow;
        limits.maxIterations = w.value("max_iterations", limits.maxIterations);
        limits.qualityThreshold = w.value("quality_threshold", limits.qualityThreshold);
        limits.stageTimeout = Millis(w, "stage_timeout_ms", limits.stageTimeout);
        limits.maxRetries = w.value("max_retries", limits.maxRetries);
        limits.backoffBase = Millis(w, "backoff_base_ms", limits.backoffBase);
        limits.backoffCap = Millis(w, "backoff_cap_ms", limits.backoffCap);
        limits.allowDegradedResearch = w.value("allow_degraded_research", limits.allowDegradedResearch);
        limits.retainDraftHistory = w.value("retain_draft_history", limits.retainDraftHistory);
    }

    if (j.contains("policy")) {
        const auto& p = j["policy"];
        auto& policy = config.workflow.policy;
        policy.reviseMargin = p.value("revise_margin", policy.reviseMargin);
        policy.moderateWeight = p.value("moderate_weight", policy.moderateWeight);
        policy.minorWeight = p.value("minor_weight", policy.minorWeight);
        policy.severityReviseThreshold = p.value("severity_revise_threshold", policy.severityReviseThreshold);
    }

    if (j.contains("progress")) {
        const auto& p = j["progress"];
        config.progress.bufferCapacity = p.value("buffer_capacity", config.progress.bufferCapacity);
        if (p.contains("overflow")) {
            config.progress.overflow = OverflowFromString(p["overflow"].get<std::string>());
        }
    }

    if (j.contains("output")) {
        const auto& o = j["output"];
        config.output.directory = o.value("directory", config.output.directory);
        config.output.archive = o.value("archive", config.output.archive);
    }

    config.videoDriver = j.value("video_driver", config.videoDriver);
    return config;
}

json ConfigLoader::ToJson(const AppConfig& config) {
    const auto& limits = config.workflow;
    json j{
        {"ollama", {
            {"host", config.ollama.host},
            {"port", config.ollama.port},
            {"model", config.ollama.model},
            {"read_timeout_s", config.ollama.readTimeoutSeconds},
            {"auto_select_model", config.ollama.autoSelectModel}
        }},
        {"workflow", {
            {"max_iterations", limits.maxIterations},
            {"quality_threshold", limits.qualityThreshold},
            {"stage_timeout_ms", limits.stageTimeout.count()},
            {"max_retries", limits.maxRetries},
            {"backoff_base_ms", limits.backoffBase.count()},
            {"backoff_cap_ms", limits.backoffCap.count()},
            {"allow_degraded_research", limits.allowDegradedResearch},
            {"retain_draft_history", limits.retainDraftHistory}
        }},
        {"policy", {
            {"revise_margin", limits.policy.reviseMargin},
            {"moderate_weight", limits.policy.moderateWeight},
            {"minor_weight", limits.policy.minorWeight},
            {"severity_revise_threshold", limits.policy.severityReviseThreshold}
        }},
        {"progress", {
            {"buffer_capacity", config.progress.bufferCapacity},
            {"overflow", config.progress.overflow == application::OverflowPolicy::DropNewest ? "drop_newest"
                                                                                             : "drop_oldest"}
        }},
        {"output", {
            {"directory", config.output.directory},
            {"archive", config.output.archive}
        }}
    };
    if (!config.videoDriver.empty()) {
        j["video_driver"] = config.videoDriver;
    }
    return j;
}

AppConfig ConfigLoader::Load(const std::string& path) {
    std::filesystem::path configPath(path);
    if (!std::filesystem::exists(configPath)) {
        std::cout << "[ConfigLoader] " << path << " not found, using defaults." << std::endl;
        return AppConfig{};
    }

    try {
        std::ifstream f(configPath);
        json j;
        f >> j;
        return FromJson(j);
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << ". Using defaults." << std::endl;
    }
    return AppConfig{};
}

bool ConfigLoader::Save(const std::string& path, const AppConfig& config) {
    std::filesystem::path configPath(path);
    json j = json::object();

    // Keep keys this version does not know about.
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const json::exception& e) {
            std::cerr << "[ConfigLoader] Existing " << path << " is unreadable (" << e.what()
                      << "), overwriting." << std::endl;
            j = json::object();
        }
    }
    j.merge_patch(ToJson(config));

    std::ofstream f(configPath);
    f << j.dump(4);
    if (!f) {
        std::cerr << "[ConfigLoader] Error writing " << path << std::endl;
        return false;
    }
    return true;
}

} // namespace blogforge::infrastructure
