/**
 * @file OllamaStageExecutors.hpp
 * @brief Research, writing and critique executors backed by a local Ollama server.
 */

#pragma once

#include <memory>
#include <string>
#include "application/WorkflowCoordinator.hpp"
#include "domain/StageExecutors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace blogforge::infrastructure {

/**
 * @class OllamaResearchExecutor
 * @brief Asks the model for findings on a topic. No web search is involved.
 */
class OllamaResearchExecutor : public domain::ResearchExecutor {
public:
    OllamaResearchExecutor(std::shared_ptr<const OllamaClient> client, std::string model);

    domain::StageOutput<domain::ResearchResult> research(const std::string& topic,
                                                         const domain::CancellationToken& cancel) override;

private:
    std::shared_ptr<const OllamaClient> m_client;
    std::string m_model;
};

/**
 * @class OllamaWritingExecutor
 * @brief Writes the initial draft, or revises a draft when feedback is given.
 */
class OllamaWritingExecutor : public domain::WritingExecutor {
public:
    OllamaWritingExecutor(std::shared_ptr<const OllamaClient> client, std::string model);

    domain::StageOutput<domain::Draft> write(const std::string& topic,
                                             const domain::ResearchResult& research,
                                             const std::optional<domain::Draft>& priorDraft,
                                             const std::optional<std::string>& feedback,
                                             const domain::CancellationToken& cancel) override;

private:
    std::shared_ptr<const OllamaClient> m_client;
    std::string m_model;
};

/**
 * @class OllamaCritiqueExecutor
 * @brief Scores a draft; the approval threshold is stated in the prompt.
 */
class OllamaCritiqueExecutor : public domain::CritiqueExecutor {
public:
    OllamaCritiqueExecutor(std::shared_ptr<const OllamaClient> client, std::string model, double qualityThreshold);

    domain::StageOutput<domain::Feedback> critique(const domain::Draft& draft,
                                                   const domain::ResearchResult& research,
                                                   const domain::CancellationToken& cancel) override;

private:
    std::shared_ptr<const OllamaClient> m_client;
    std::string m_model;
    double m_qualityThreshold;
};

/**
 * @brief Builds the three executors sharing one client.
 *
 * When settings.autoSelectModel is set, the configured model is replaced by the
 * best installed one (see ModelSelector) if the server does not offer it.
 */
application::StageExecutors MakeOllamaExecutors(const OllamaSettings& settings, double qualityThreshold);

} // namespace blogforge::infrastructure
