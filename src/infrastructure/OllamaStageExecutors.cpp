/**
 * @file OllamaStageExecutors.cpp
 * @brief Implementation of the Ollama-backed stage executors.
 */

#include "infrastructure/OllamaStageExecutors.hpp"
#include "domain/StageErrors.hpp"
#include "infrastructure/ContentJson.hpp"
#include "infrastructure/ModelSelector.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <iostream>

namespace blogforge::infrastructure {

namespace {

void ThrowIfCancelled(const domain::CancellationToken& cancel, const std::string& stage) {
    if (cancel.isCancelled()) {
        throw domain::FatalError(stage + " request abandoned", "CANCELLED", domain::ErrorSeverity::Low);
    }
}

} // namespace

OllamaResearchExecutor::OllamaResearchExecutor(std::shared_ptr<const OllamaClient> client, std::string model)
    : m_client(std::move(client)), m_model(std::move(model)) {}

domain::StageOutput<domain::ResearchResult> OllamaResearchExecutor::research(const std::string& topic,
                                                                             const domain::CancellationToken& cancel) {
    ThrowIfCancelled(cancel, "research");
    std::cout << "[OllamaResearch] Researching '" << topic << "' with " << m_model << std::endl;
    auto response = m_client->generate(m_model, PromptCatalog::GetResearchSystemPrompt(),
                                       PromptCatalog::BuildResearchPrompt(topic), true);
    ThrowIfCancelled(cancel, "research");

    domain::StageOutput<domain::ResearchResult> output;
    output.value = ContentJson::ParseResearch(response.text, topic);
    output.usageUnits = response.usageUnits();
    return output;
}

OllamaWritingExecutor::OllamaWritingExecutor(std::shared_ptr<const OllamaClient> client, std::string model)
    : m_client(std::move(client)), m_model(std::move(model)) {}

domain::StageOutput<domain::Draft> OllamaWritingExecutor::write(const std::string& topic,
                                                                const domain::ResearchResult& research,
                                                                const std::optional<domain::Draft>& priorDraft,
                                                                const std::optional<std::string>& feedback,
                                                                const domain::CancellationToken& cancel) {
    ThrowIfCancelled(cancel, "writing");
    std::string prompt;
    if (priorDraft && feedback) {
        std::cout << "[OllamaWriting] Revising '" << priorDraft->title << "'" << std::endl;
        prompt = PromptCatalog::BuildRevisionPrompt(topic, research, *priorDraft, *feedback);
    } else {
        std::cout << "[OllamaWriting] Drafting '" << topic << "'" << std::endl;
        prompt = PromptCatalog::BuildDraftPrompt(topic, research);
    }

    auto response = m_client->generate(m_model, PromptCatalog::GetWritingSystemPrompt(), prompt, true);
    ThrowIfCancelled(cancel, "writing");

    domain::StageOutput<domain::Draft> output;
    output.value = ContentJson::ParseDraft(response.text);
    output.usageUnits = response.usageUnits();
    return output;
}

OllamaCritiqueExecutor::OllamaCritiqueExecutor(std::shared_ptr<const OllamaClient> client,
                                               std::string model,
                                               double qualityThreshold)
    : m_client(std::move(client)), m_model(std::move(model)), m_qualityThreshold(qualityThreshold) {}

domain::StageOutput<domain::Feedback> OllamaCritiqueExecutor::critique(const domain::Draft& draft,
                                                                       const domain::ResearchResult& research,
                                                                       const domain::CancellationToken& cancel) {
    ThrowIfCancelled(cancel, "critique");
    std::cout << "[OllamaCritique] Reviewing '" << draft.title << "' (" << draft.wordCount << " words)" << std::endl;
    auto response = m_client->generate(m_model, PromptCatalog::GetCritiqueSystemPrompt(),
                                       PromptCatalog::BuildCritiquePrompt(draft, research, m_qualityThreshold), true);
    ThrowIfCancelled(cancel, "critique");

    domain::StageOutput<domain::Feedback> output;
    output.value = ContentJson::ParseFeedback(response.text);
    output.usageUnits = response.usageUnits();
    return output;
}

application::StageExecutors MakeOllamaExecutors(const OllamaSettings& settings, double qualityThreshold) {
    auto client = std::make_shared<const OllamaClient>(settings.host, settings.port, settings.readTimeoutSeconds);

    std::string model = settings.model;
    if (settings.autoSelectModel) {
        auto available = client->getAvailableModels();
        model = ModelSelector::SelectBest(available, settings.model);
        if (model != settings.model) {
            std::cout << "[OllamaStageExecutors] Model " << settings.model << " not installed, using " << model
                      << std::endl;
        }
    }

    application::StageExecutors executors;
    executors.research = std::make_shared<OllamaResearchExecutor>(client, model);
    executors.writing = std::make_shared<OllamaWritingExecutor>(client, model);
    executors.critique = std::make_shared<OllamaCritiqueExecutor>(client, model, qualityThreshold);
    return executors;
}

} // namespace blogforge::infrastructure
