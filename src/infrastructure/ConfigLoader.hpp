/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Every key is optional; anything absent keeps its default value.
 */

#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "application/ProgressPublisher.hpp"
#include "application/WorkflowLimits.hpp"

namespace blogforge::infrastructure {

struct OllamaSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string model = "qwen2.5:7b";
    int readTimeoutSeconds = 600;
    bool autoSelectModel = true; ///< Fall back to an installed model when @ref model is missing.
};

struct ProgressSettings {
    std::size_t bufferCapacity = 256;
    application::OverflowPolicy overflow = application::OverflowPolicy::DropOldest;
};

struct OutputSettings {
    std::string directory = "posts";
    bool archive = true;
};

/**
 * @struct AppConfig
 * @brief Everything settings.json can configure.
 */
struct AppConfig {
    OllamaSettings ollama;
    application::WorkflowLimits workflow;
    ProgressSettings progress;
    OutputSettings output;
    std::string videoDriver; ///< SDL video driver for the dashboard ("x11", "wayland"); empty for SDL's choice.
};

class ConfigLoader {
public:
    /** @brief Name of the settings file looked up in the working directory. */
    static constexpr const char* kDefaultFileName = "settings.json";

    /**
     * @brief Reads a settings file.
     * @return Defaults when the file is missing; defaults (with an error logged) when it is malformed.
     */
    static AppConfig Load(const std::string& path);

    /**
     * @brief Writes @p config as pretty-printed JSON, keeping unknown keys already in the file.
     * @return False when the file could not be written.
     */
    static bool Save(const std::string& path, const AppConfig& config);

    /** @brief Applies the keys present in @p j on top of @p base. Throws nlohmann::json::exception on type errors. */
    static AppConfig FromJson(const nlohmann::json& j, AppConfig base = {});
    static nlohmann::json ToJson(const AppConfig& config);
};

} // namespace blogforge::infrastructure
