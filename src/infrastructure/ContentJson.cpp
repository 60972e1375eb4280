/**
 * @file ContentJson.cpp
 * @brief Implementation of the content JSON codec.
 */

#include "infrastructure/ContentJson.hpp"
#include "domain/StageErrors.hpp"
#include <cmath>

namespace blogforge::domain {

using json = nlohmann::json;

namespace {

FeedbackSeverity SeverityFromString(const std::string& value) {
    if (value == "major") return FeedbackSeverity::Major;
    if (value == "moderate") return FeedbackSeverity::Moderate;
    return FeedbackSeverity::Minor;
}

} // namespace

void to_json(json& j, const ResearchFinding& finding) {
    j = json{{"fact", finding.fact},
             {"source_url", finding.sourceUrl},
             {"relevance_score", finding.relevanceScore},
             {"category", finding.category}};
}

void from_json(const json& j, ResearchFinding& finding) {
    finding.fact = j.at("fact").get<std::string>();
    finding.sourceUrl = j.value("source_url", "");
    finding.relevanceScore = j.value("relevance_score", 0.0);
    finding.category = j.value("category", "general");
}

void to_json(json& j, const ResearchResult& research) {
    j = json{{"topic", research.topic},
             {"findings", research.findings},
             {"summary", research.summary},
             {"confidence_level", research.confidence}};
}

void from_json(const json& j, ResearchResult& research) {
    research.topic = j.value("topic", "");
    research.findings = j.value("findings", std::vector<ResearchFinding>{});
    research.summary = j.value("summary", "");
    research.confidence = j.value("confidence_level", 0.0);
}

void to_json(json& j, const Draft& draft) {
    j = json{{"title", draft.title},
             {"introduction", draft.introduction},
             {"body_sections", draft.bodySections},
             {"conclusion", draft.conclusion},
             {"word_count", draft.wordCount}};
}

void from_json(const json& j, Draft& draft) {
    draft.title = j.at("title").get<std::string>();
    draft.introduction = j.value("introduction", "");
    draft.bodySections = j.value("body_sections", std::vector<std::string>{});
    draft.conclusion = j.value("conclusion", "");
    draft.wordCount = j.value("word_count", 0);
}

void to_json(json& j, const FeedbackItem& item) {
    j = json{{"section", item.section},
             {"issue", item.issue},
             {"suggestion", item.suggestion},
             {"severity", SeverityToString(item.severity)}};
}

void from_json(const json& j, FeedbackItem& item) {
    item.section = j.value("section", "");
    item.issue = j.value("issue", "");
    item.suggestion = j.value("suggestion", "");
    item.severity = SeverityFromString(j.value("severity", "minor"));
}

void to_json(json& j, const Feedback& feedback) {
    j = json{{"overall_quality", feedback.overallQuality},
             {"feedback_items", feedback.items},
             {"approval_status", ApprovalToString(feedback.approval)},
             {"summary_feedback", feedback.summary}};
}

void from_json(const json& j, Feedback& feedback) {
    feedback.overallQuality = j.at("overall_quality").get<double>();
    feedback.items = j.value("feedback_items", std::vector<FeedbackItem>{});
    feedback.approval = j.value("approval_status", "needs_revision") == "approved" ? ApprovalStatus::Approved
                                                                                   : ApprovalStatus::NeedsRevision;
    feedback.summary = j.value("summary_feedback", "");
}

} // namespace blogforge::domain

namespace blogforge::infrastructure {

using json = nlohmann::json;

namespace {

[[noreturn]] void Reject(const std::string& what, const std::string& detail) {
    domain::FatalError error("Invalid " + what + " output: " + detail, "INVALID_OUTPUT");
    error.addContext("output", what);
    throw error;
}

json ParseObject(const std::string& answer, const std::string& what) {
    try {
        return json::parse(ContentJson::ExtractJsonObject(answer));
    } catch (const json::parse_error& e) {
        Reject(what, std::string("not valid JSON (") + e.what() + ")");
    }
}

std::string RequireString(const json& obj, const char* key, const std::string& what, bool allowEmpty = false) {
    if (!obj.contains(key) || !obj[key].is_string()) {
        Reject(what, std::string("missing string '") + key + "'");
    }
    auto value = obj[key].get<std::string>();
    if (!allowEmpty && !domain::IsValidTopic(value)) {
        Reject(what, std::string("'") + key + "' is empty");
    }
    return value;
}

double RequireNumber(const json& obj, const char* key, double low, double high, const std::string& what) {
    if (!obj.contains(key) || !obj[key].is_number()) {
        Reject(what, std::string("missing number '") + key + "'");
    }
    double value = obj[key].get<double>();
    if (!std::isfinite(value) || value < low || value > high) {
        Reject(what, std::string("'") + key + "' out of range");
    }
    return value;
}

const json& RequireArray(const json& obj, const char* key, const std::string& what) {
    if (!obj.contains(key) || !obj[key].is_array()) {
        Reject(what, std::string("missing array '") + key + "'");
    }
    return obj[key];
}

std::string OptionalString(const json& obj, const char* key, const std::string& fallback) {
    return obj.contains(key) && obj[key].is_string() ? obj[key].get<std::string>() : fallback;
}

} // namespace

std::string ContentJson::ExtractJsonObject(const std::string& text) {
    auto first = text.find('{');
    auto last = text.rfind('}');
    if (first == std::string::npos || last == std::string::npos || last < first) {
        domain::FatalError error("Model answer contains no JSON object", "INVALID_OUTPUT");
        throw error;
    }
    return text.substr(first, last - first + 1);
}

domain::ResearchResult ContentJson::ParseResearch(const std::string& answer, const std::string& topic) {
    const std::string what = "research";
    json obj = ParseObject(answer, what);

    domain::ResearchResult research;
    research.topic = topic;
    for (const auto& entry : RequireArray(obj, "findings", what)) {
        if (!entry.is_object()) {
            Reject(what, "finding is not an object");
        }
        domain::ResearchFinding finding;
        finding.fact = RequireString(entry, "fact", what);
        finding.sourceUrl = OptionalString(entry, "source_url", "");
        finding.relevanceScore = RequireNumber(entry, "relevance_score", 0.0, 1.0, what);
        finding.category = OptionalString(entry, "category", "general");
        research.findings.push_back(std::move(finding));
    }
    research.summary = RequireString(obj, "summary", what, true);
    research.confidence = RequireNumber(obj, "confidence_level", 0.0, 1.0, what);
    return research;
}

domain::Draft ContentJson::ParseDraft(const std::string& answer) {
    const std::string what = "draft";
    json obj = ParseObject(answer, what);

    domain::Draft draft;
    draft.title = RequireString(obj, "title", what);
    draft.introduction = RequireString(obj, "introduction", what);
    for (const auto& section : RequireArray(obj, "body_sections", what)) {
        if (!section.is_string() || !domain::IsValidTopic(section.get<std::string>())) {
            Reject(what, "body section is not a non-empty string");
        }
        draft.bodySections.push_back(section.get<std::string>());
    }
    if (draft.bodySections.empty()) {
        Reject(what, "'body_sections' is empty");
    }
    draft.conclusion = RequireString(obj, "conclusion", what);
    draft.wordCount = domain::CountDraftWords(draft);
    return draft;
}

domain::Feedback ContentJson::ParseFeedback(const std::string& answer) {
    const std::string what = "critique";
    json obj = ParseObject(answer, what);

    domain::Feedback feedback;
    feedback.overallQuality = RequireNumber(obj, "overall_quality", 0.0, 10.0, what);
    for (const auto& entry : RequireArray(obj, "feedback_items", what)) {
        if (!entry.is_object()) {
            Reject(what, "feedback item is not an object");
        }
        domain::FeedbackItem item;
        item.section = OptionalString(entry, "section", "general");
        item.issue = RequireString(entry, "issue", what);
        item.suggestion = OptionalString(entry, "suggestion", "");
        const auto severity = RequireString(entry, "severity", what);
        if (severity == "major") {
            item.severity = domain::FeedbackSeverity::Major;
        } else if (severity == "moderate") {
            item.severity = domain::FeedbackSeverity::Moderate;
        } else if (severity == "minor") {
            item.severity = domain::FeedbackSeverity::Minor;
        } else {
            Reject(what, "unknown severity '" + severity + "'");
        }
        feedback.items.push_back(std::move(item));
    }

    const auto approval = RequireString(obj, "approval_status", what);
    if (approval == "approved") {
        feedback.approval = domain::ApprovalStatus::Approved;
    } else if (approval == "needs_revision") {
        feedback.approval = domain::ApprovalStatus::NeedsRevision;
    } else {
        Reject(what, "unknown approval_status '" + approval + "'");
    }
    feedback.summary = OptionalString(obj, "summary_feedback", "");
    return feedback;
}

json ContentJson::MetricsToJson(const application::MetricsSnapshot& metrics) {
    json executors = json::object();
    for (const auto& [kind, usage] : metrics.executors) {
        executors[application::ExecutorToString(kind)] = {
            {"calls", usage.calls},
            {"attempts", usage.attempts},
            {"failures", usage.failures},
            {"usage_units", usage.usageUnits},
            {"elapsed_ms", usage.elapsed.count()},
        };
    }
    json stages = json::object();
    for (const auto& [stage, elapsed] : metrics.stageElapsed) {
        stages[domain::StageToString(stage)] = elapsed.count();
    }
    return json{{"executors", executors},
                {"stage_elapsed_ms", stages},
                {"iteration_count", metrics.iterationCount},
                {"revision_count", metrics.revisionCount},
                {"usage_units", metrics.usageUnits},
                {"api_calls", metrics.apiCalls},
                {"retries", metrics.retries},
                {"failures", metrics.failures}};
}

json ContentJson::ResultToJson(const application::WorkflowResult& result) {
    json j = {
        {"status", application::WorkflowStatusToString(result.status)},
        {"topic", result.topic},
        {"iteration_count", result.iterationCount},
        {"revision_count", result.revisionCount},
        {"total_processing_time", result.elapsed.count() / 1000.0},
        {"quality_best_effort", result.qualityBestEffort},
        {"degraded_research", result.degradedResearch},
        {"metrics", MetricsToJson(result.metrics)},
    };
    j["final_post"] = result.finalDraft ? json(*result.finalDraft) : json(nullptr);
    j["research_data"] = result.research ? json(*result.research) : json(nullptr);
    j["quality_score"] = result.qualityScore ? json(*result.qualityScore) : json(nullptr);
    if (result.failure) {
        j["failure"] = {{"stage", domain::StageToString(result.failure->stage)},
                        {"code", result.failure->code},
                        {"message", result.failure->message}};
    }

    json critiques = json::array();
    for (const auto& record : result.critiques) {
        critiques.push_back({{"iteration", record.iteration},
                             {"draft_revision", record.draftRevision},
                             {"feedback", record.feedback},
                             {"decision", application::DecisionToString(record.verdict.decision)},
                             {"reason", record.verdict.reason}});
    }
    j["critiques"] = critiques;
    if (!result.draftHistory.empty()) {
        j["draft_history"] = result.draftHistory;
    }

    json entries = json::object();
    for (const auto& [stage, when] : result.stageEntries) {
        entries[domain::StageToString(stage)] =
            std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
    }
    j["stage_entries_ms"] = entries;
    return j;
}

} // namespace blogforge::infrastructure
