/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the system prompts and request templates of each stage.
 */

#pragma once

#include <string>
#include "domain/Content.hpp"

namespace blogforge::infrastructure {

class PromptCatalog {
public:
    static std::string GetResearchSystemPrompt();
    static std::string GetWritingSystemPrompt();
    static std::string GetCritiqueSystemPrompt();

    /** @brief Request for the research stage. */
    static std::string BuildResearchPrompt(const std::string& topic);

    /** @brief Request for the initial draft. */
    static std::string BuildDraftPrompt(const std::string& topic, const domain::ResearchResult& research);

    /** @brief Request for a revision of @p draft addressing @p feedback. */
    static std::string BuildRevisionPrompt(const std::string& topic,
                                           const domain::ResearchResult& research,
                                           const domain::Draft& draft,
                                           const std::string& feedback);

    /** @brief Request for a critique of @p draft. */
    static std::string BuildCritiquePrompt(const domain::Draft& draft,
                                           const domain::ResearchResult& research,
                                           double qualityThreshold);
};

} // namespace blogforge::infrastructure
