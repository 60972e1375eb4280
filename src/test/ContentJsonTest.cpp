#undef NDEBUG
#include <cassert>
#include <iostream>

#include "application/ContentFormatter.hpp"
#include "infrastructure/ContentJson.hpp"
#include "domain/StageErrors.hpp"
#include "FakeExecutors.hpp"

using namespace blogforge;
using infrastructure::ContentJson;
using json = nlohmann::json;

namespace {

template <typename F>
bool RejectsAsInvalidOutput(F&& parse) {
    try {
        parse();
    } catch (const domain::FatalError& e) {
        return e.code() == "INVALID_OUTPUT";
    }
    return false;
}

void TestParseResearchWithChatter() {
    const std::string answer = R"(Sure! Here is the research:
```json
{"findings": [{"fact": "16:8 fasting lowered fasting insulin.", "source_url": "https://example.org/a",
               "relevance_score": 0.9, "category": "study"},
              {"fact": "Adherence drops after 6 months.", "relevance_score": 0.4}],
 "summary": "Moderate evidence.", "confidence_level": 0.7}
```
Let me know if you need more.)";
    auto research = ContentJson::ParseResearch(answer, "Intermittent Fasting");
    assert(research.topic == "Intermittent Fasting");
    assert(research.findings.size() == 2);
    assert(research.findings[0].category == "study");
    assert(research.findings[1].sourceUrl.empty());
    assert(research.findings[1].category == "general");
    assert(research.confidence == 0.7);
    std::cout << "[PASS] Research JSON is extracted from surrounding text." << std::endl;
}

void TestRejectsBadResearch() {
    assert(RejectsAsInvalidOutput([] { ContentJson::ParseResearch("no json here", "t"); }));
    assert(RejectsAsInvalidOutput([] { ContentJson::ParseResearch("{\"findings\": [}", "t"); }));
    assert(RejectsAsInvalidOutput([] {
        ContentJson::ParseResearch(R"({"findings": [{"fact": "x", "relevance_score": 1.5}],
                                      "summary": "", "confidence_level": 0.5})", "t");
    }));
    assert(RejectsAsInvalidOutput([] {
        ContentJson::ParseResearch(R"({"findings": [], "summary": "s"})", "t");
    }));
    std::cout << "[PASS] Malformed research is rejected." << std::endl;
}

void TestParseDraftRecountsWords() {
    const std::string answer = R"({"title": "Fasting, Explained", "introduction": "Why people fast.",
        "body_sections": ["## Evidence\nTrials show modest benefits.", "## Risks\nNot for everyone."],
        "conclusion": "Talk to your doctor.", "word_count": 5000})";
    auto draft = ContentJson::ParseDraft(answer);
    assert(draft.title == "Fasting, Explained");
    assert(draft.bodySections.size() == 2);
    assert(draft.wordCount == domain::CountDraftWords(draft));
    assert(draft.wordCount < 100);
    assert(RejectsAsInvalidOutput([] {
        ContentJson::ParseDraft(R"({"title": "T", "introduction": "I", "body_sections": [], "conclusion": "C"})");
    }));
    assert(RejectsAsInvalidOutput([] {
        ContentJson::ParseDraft(R"({"title": " ", "introduction": "I", "body_sections": ["b"], "conclusion": "C"})");
    }));
    std::cout << "[PASS] Draft parsing validates sections and recounts words." << std::endl;
}

void TestParseFeedback() {
    const std::string answer = R"({"overall_quality": 6.5,
        "feedback_items": [{"section": "Introduction", "issue": "No hook", "suggestion": "Open with a statistic",
                            "severity": "major"},
                           {"issue": "Typos", "severity": "minor"}],
        "approval_status": "needs_revision", "summary_feedback": "Solid but flat."})";
    auto feedback = ContentJson::ParseFeedback(answer);
    assert(feedback.overallQuality == 6.5);
    assert(feedback.items.size() == 2);
    assert(feedback.items[0].severity == domain::FeedbackSeverity::Major);
    assert(feedback.items[1].section == "general");
    assert(feedback.approval == domain::ApprovalStatus::NeedsRevision);
    assert(feedback.hasSeverity(domain::FeedbackSeverity::Major));

    assert(RejectsAsInvalidOutput([] {
        ContentJson::ParseFeedback(R"({"overall_quality": 12, "feedback_items": [], "approval_status": "approved"})");
    }));
    assert(RejectsAsInvalidOutput([] {
        ContentJson::ParseFeedback(R"({"overall_quality": 7, "feedback_items": [], "approval_status": "maybe"})");
    }));
    assert(RejectsAsInvalidOutput([] {
        ContentJson::ParseFeedback(
            R"({"overall_quality": 7, "feedback_items": [{"issue": "x", "severity": "blocker"}], "approval_status": "approved"})");
    }));
    std::cout << "[PASS] Feedback parsing validates score, severity and approval." << std::endl;
}

void TestResultToJson() {
    application::WorkflowResult result;
    result.status = application::WorkflowStatus::Failed;
    result.topic = "Intermittent Fasting";
    result.finalDraft = test::MakeDraft("Draft v1");
    result.research = test::MakeResearch(result.topic);
    result.failure = application::FailureInfo{domain::WorkflowStage::Critiquing,
                                              application::failure_codes::kCritiqueFailed, "critic unreachable"};
    result.elapsed = std::chrono::milliseconds(1500);
    application::CritiqueRecord record;
    record.feedback = test::MakeFeedback(6.0, domain::ApprovalStatus::NeedsRevision, {domain::FeedbackSeverity::Major});
    record.verdict.decision = application::RevisionDecision::Revise;
    result.critiques.push_back(record);
    result.metrics.executors[application::ExecutorKind::Research].calls = 1;
    result.metrics.apiCalls = 3;

    json j = ContentJson::ResultToJson(result);
    assert(j["status"] == "failed");
    assert(j["total_processing_time"].get<double>() == 1.5);
    assert(j["final_post"]["title"] == "Draft v1");
    assert(j["research_data"]["findings"].size() == 2);
    assert(j["quality_score"].is_null());
    assert(j["failure"]["code"] == "CRITIQUE_FAILED");
    assert(j["failure"]["stage"] == domain::StageToString(domain::WorkflowStage::Critiquing));
    assert(j["critiques"][0]["feedback"]["feedback_items"][0]["severity"] == "major");
    assert(j["critiques"][0]["decision"] == application::DecisionToString(application::RevisionDecision::Revise));
    assert(j["metrics"]["executors"]["research"]["calls"] == 1);
    assert(j["metrics"]["api_calls"] == 3);
    assert(!j.contains("draft_history"));

    // Serialized content reads back through the model-output parsers.
    auto feedback = ContentJson::ParseFeedback(j["critiques"][0]["feedback"].dump());
    assert(feedback.items.size() == 1);
    auto draft = ContentJson::ParseDraft(j["final_post"].dump());
    assert(draft.title == "Draft v1");
    std::cout << "[PASS] Results serialize with stable field names." << std::endl;
}

void TestTruncationKeepsUtf8() {
    const std::string euro = "\xE2\x82\xAC";
    assert(domain::TruncateUtf8("ab" + euro, 3) == "ab");
    assert(domain::TruncateUtf8("ab" + euro, 5) == "ab" + euro);
    assert(domain::TruncateUtf8("abc", 10) == "abc");

    // A two-byte character straddling the 100-byte cut.
    const std::string reason = std::string(99, 'x') + "\xC3\xA9 server error";
    auto research = application::ContentFormatter::MakeDegradedResearch("Caf\xC3\xA9", reason);
    assert(research.summary.size() >= 99);
    assert(research.summary.compare(research.summary.size() - 99, 99, std::string(99, 'x')) == 0);

    json j = research;
    const std::string text = j.dump();
    assert(json::parse(text)["summary"] == research.summary);
    std::cout << "[PASS] Truncated text stays valid UTF-8." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ContentJson Test..." << std::endl;
    TestParseResearchWithChatter();
    TestRejectsBadResearch();
    TestParseDraftRecountsWords();
    TestParseFeedback();
    TestResultToJson();
    TestTruncationKeepsUtf8();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
