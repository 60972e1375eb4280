#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/ContentJson.hpp"
#include <iomanip>
#include <sstream>

namespace blogforge::infrastructure {

std::string PromptCatalog::GetResearchSystemPrompt() {
    return
        "You are a research specialist gathering comprehensive, factual information on a topic. "
        "Your findings will inform a high-quality blog post.\n\n"
        "Focus on:\n"
        "- Credible sources and recent information\n"
        "- Diverse perspectives and comprehensive coverage\n"
        "- Factual accuracy and source attribution\n"
        "- Relevance to the specific topic\n\n"
        "STRICT OUTPUT RULES:\n"
        "1. Answer with a single JSON object and nothing else. No code fences.\n"
        "2. Do not invent sources. If you do not know the URL, use an empty string.\n"
        "3. relevance_score and confidence_level are numbers between 0 and 1.\n\n"
        "REQUIRED SCHEMA:\n"
        "{\n"
        "  \"findings\": [\n"
        "    {\"fact\": \"...\", \"source_url\": \"...\", \"relevance_score\": 0.8,\n"
        "     \"category\": \"statistic | study | expert_opinion | benefit | risk | general\"}\n"
        "  ],\n"
        "  \"summary\": \"Brief summary of key insights\",\n"
        "  \"confidence_level\": 0.7\n"
        "}";
}

std::string PromptCatalog::GetWritingSystemPrompt() {
    return
        "You are a professional content writer creating engaging, well-structured blog posts. "
        "You transform research data into compelling, readable content.\n\n"
        "Focus on:\n"
        "- Clear, engaging writing that flows naturally\n"
        "- Introduction, body sections and conclusion\n"
        "- Incorporating the research findings seamlessly\n"
        "- A compelling title and smooth transitions\n\n"
        "STRICT OUTPUT RULES:\n"
        "1. Answer with a single JSON object and nothing else. No code fences.\n"
        "2. Each body section is a complete piece of prose, optionally starting with a heading line.\n"
        "3. Aim for 800 to 1200 words in total.\n\n"
        "REQUIRED SCHEMA:\n"
        "{\n"
        "  \"title\": \"...\",\n"
        "  \"introduction\": \"...\",\n"
        "  \"body_sections\": [\"...\", \"...\"],\n"
        "  \"conclusion\": \"...\"\n"
        "}";
}

std::string PromptCatalog::GetCritiqueSystemPrompt() {
    return
        "You are a professional editor evaluating blog posts for clarity, accuracy, structure and "
        "overall quality. Your feedback must be constructive and actionable.\n\n"
        "Focus on:\n"
        "- Clear communication and readability\n"
        "- Factual accuracy against the research provided\n"
        "- Structure and logical flow\n"
        "- Grammar, style and tone consistency\n"
        "- Engagement and reader value\n\n"
        "STRICT OUTPUT RULES:\n"
        "1. Answer with a single JSON object and nothing else. No code fences.\n"
        "2. overall_quality is a number between 0 and 10.\n"
        "3. severity is one of \"minor\", \"moderate\", \"major\". Use \"major\" only for problems "
        "that make the post misleading or unreadable.\n"
        "4. approval_status is \"approved\" or \"needs_revision\".\n\n"
        "REQUIRED SCHEMA:\n"
        "{\n"
        "  \"overall_quality\": 7.5,\n"
        "  \"feedback_items\": [\n"
        "    {\"section\": \"introduction\", \"issue\": \"...\", \"suggestion\": \"...\", \"severity\": \"moderate\"}\n"
        "  ],\n"
        "  \"approval_status\": \"needs_revision\",\n"
        "  \"summary_feedback\": \"...\"\n"
        "}";
}

std::string PromptCatalog::BuildResearchPrompt(const std::string& topic) {
    return "Research the topic: " + topic +
           ". Gather comprehensive information including facts, statistics, studies and expert opinions.";
}

std::string PromptCatalog::BuildDraftPrompt(const std::string& topic, const domain::ResearchResult& research) {
    std::ostringstream ss;
    ss << "Create a comprehensive blog post about: " << topic << "\n\n"
       << "The research includes " << research.findings.size() << " findings with a confidence level of "
       << std::fixed << std::setprecision(2) << research.confidence << ".\n"
       << "Research summary: " << research.summary << "\n\n"
       << "Research data:\n" << nlohmann::json(research).dump(2) << "\n\n"
       << "Ensure proper flow between introduction, body sections and conclusion.";
    return ss.str();
}

std::string PromptCatalog::BuildRevisionPrompt(const std::string& topic,
                                               const domain::ResearchResult& research,
                                               const domain::Draft& draft,
                                               const std::string& feedback) {
    std::ostringstream ss;
    ss << "Revise the following blog post about: " << topic << "\n\n"
       << "Current draft:\n" << nlohmann::json(draft).dump(2) << "\n\n"
       << "Editorial feedback to address:\n" << feedback << "\n\n"
       << "Research summary (for fact checking): " << research.summary << "\n\n"
       << "Address every critical issue and important improvement. Keep what already works. "
       << "Return the complete revised post in the required schema.";
    return ss.str();
}

std::string PromptCatalog::BuildCritiquePrompt(const domain::Draft& draft,
                                               const domain::ResearchResult& research,
                                               double qualityThreshold) {
    std::ostringstream ss;
    ss << "Provide a comprehensive critique of this blog post.\n\n"
       << "Title: " << draft.title << "\n"
       << "Word Count: " << draft.wordCount << "\n"
       << "Sections: Introduction + " << draft.bodySections.size() << " body sections + Conclusion\n\n"
       << "Post:\n" << nlohmann::json(draft).dump(2) << "\n\n"
       << "Research context:\n"
       << "- Topic: " << research.topic << "\n"
       << "- Research findings: " << nlohmann::json(research.findings).dump() << "\n"
       << "- Research confidence: " << std::fixed << std::setprecision(2) << research.confidence << "\n\n"
       << "Cross-reference claims with the research, check clarity and structure.\n"
       << "Quality threshold for approval: " << std::setprecision(1) << qualityThreshold << "/10";
    return ss.str();
}

} // namespace blogforge::infrastructure
