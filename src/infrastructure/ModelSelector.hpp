/**
 * @file ModelSelector.hpp
 * @brief Picks the model the executors talk to from what the Ollama server offers.
 */

#pragma once
#include <string>
#include <vector>

namespace blogforge::infrastructure {

/**
 * @class ModelSelector
 * @brief Separates model selection policy from client I/O.
 */
class ModelSelector {
public:
    /**
     * @brief Chooses @p preferred when installed, else a model of the same family,
     * else the first match of the built-in priority list, else the first model.
     * @return @p preferred when nothing is installed.
     */
    static std::string SelectBest(const std::vector<std::string>& availableModels,
                                  const std::string& preferred = "qwen2.5:7b") {
        if (availableModels.empty()) {
            return preferred;
        }

        for (const auto& model : availableModels) {
            if (model == preferred) {
                return preferred;
            }
        }

        const std::string family = preferred.substr(0, preferred.find(':'));
        if (!family.empty()) {
            for (const auto& model : availableModels) {
                if (model.rfind(family + ":", 0) == 0 || model == family) {
                    return model;
                }
            }
        }

        static const std::vector<std::string> kPriorities = {
            "qwen2.5",
            "llama3.1",
            "llama3",
            "mistral",
            "gemma2",
            "gemma"
        };
        for (const auto& priority : kPriorities) {
            for (const auto& model : availableModels) {
                if (model.find(priority) != std::string::npos) {
                    return model;
                }
            }
        }

        return availableModels[0];
    }
};

} // namespace blogforge::infrastructure
