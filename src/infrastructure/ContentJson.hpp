/**
 * @file ContentJson.hpp
 * @brief nlohmann/json conversions for content types and strict parsing of model answers.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "application/WorkflowResult.hpp"
#include "domain/Content.hpp"

namespace blogforge::domain {

void to_json(nlohmann::json& j, const ResearchFinding& finding);
void from_json(const nlohmann::json& j, ResearchFinding& finding);
void to_json(nlohmann::json& j, const ResearchResult& research);
void from_json(const nlohmann::json& j, ResearchResult& research);
void to_json(nlohmann::json& j, const Draft& draft);
void from_json(const nlohmann::json& j, Draft& draft);
void to_json(nlohmann::json& j, const FeedbackItem& item);
void from_json(const nlohmann::json& j, FeedbackItem& item);
void to_json(nlohmann::json& j, const Feedback& feedback);
void from_json(const nlohmann::json& j, Feedback& feedback);

} // namespace blogforge::domain

namespace blogforge::infrastructure {

/**
 * @class ContentJson
 * @brief Validating decoders for executor answers.
 *
 * Every Parse* function accepts the raw model text (optionally wrapped in a
 * Markdown code fence or surrounded by prose), extracts the outermost JSON
 * object and throws domain::FatalError with code INVALID_OUTPUT when a required
 * key is missing, has the wrong type or is out of range.
 */
class ContentJson {
public:
    static domain::ResearchResult ParseResearch(const std::string& answer, const std::string& topic);
    static domain::Draft ParseDraft(const std::string& answer);
    static domain::Feedback ParseFeedback(const std::string& answer);

    /** @brief Returns the outermost {...} block of @p text. */
    static std::string ExtractJsonObject(const std::string& text);

    static nlohmann::json MetricsToJson(const application::MetricsSnapshot& metrics);
    static nlohmann::json ResultToJson(const application::WorkflowResult& result);
};

} // namespace blogforge::infrastructure
