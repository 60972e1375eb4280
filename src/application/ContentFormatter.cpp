/**
 * @file ContentFormatter.cpp
 * @brief Implementation of ContentFormatter.
 */

#include "application/ContentFormatter.hpp"

#include <sstream>
#include <vector>

namespace blogforge::application {

namespace {

void AppendGroup(std::ostringstream& out,
                 const domain::Feedback& feedback,
                 domain::FeedbackSeverity severity,
                 const char* header,
                 std::size_t limit) {
    std::vector<const domain::FeedbackItem*> group;
    for (const auto& item : feedback.items) {
        if (item.severity == severity) {
            group.push_back(&item);
        }
    }
    if (group.empty()) {
        return;
    }
    out << "\n" << header << "\n";
    for (std::size_t i = 0; i < group.size() && i < limit; ++i) {
        out << "- " << group[i]->section << ": " << group[i]->issue << " -> " << group[i]->suggestion << "\n";
    }
}

} // namespace

std::string ContentFormatter::FormatFeedbackForRevision(const domain::Feedback& feedback) {
    std::ostringstream out;
    out << feedback.summary << "\n";
    AppendGroup(out, feedback, domain::FeedbackSeverity::Major, "CRITICAL ISSUES TO ADDRESS:", feedback.items.size());
    AppendGroup(out, feedback, domain::FeedbackSeverity::Moderate, "IMPORTANT IMPROVEMENTS:", feedback.items.size());
    AppendGroup(out, feedback, domain::FeedbackSeverity::Minor, "MINOR ENHANCEMENTS:", kMaxMinorItems);
    return out.str();
}

std::string ContentFormatter::RenderMarkdown(const domain::Draft& draft) {
    std::ostringstream out;
    out << "# " << draft.title << "\n\n";
    out << draft.introduction << "\n\n";
    for (const auto& section : draft.bodySections) {
        out << section << "\n\n";
    }
    out << draft.conclusion << "\n";
    return out.str();
}

domain::ResearchResult ContentFormatter::MakeDegradedResearch(const std::string& topic, const std::string& reason) {
    domain::ResearchResult research;
    research.topic = topic;
    research.summary = "Limited research available for " + topic +
                       " due to technical issues: " + domain::TruncateUtf8(reason, 100);
    research.confidence = 0.1;
    return research;
}

} // namespace blogforge::application
