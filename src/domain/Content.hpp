/**
 * @file Content.hpp
 * @brief Value objects exchanged between the workflow and its stage executors.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace blogforge::domain {

/**
 * @struct ResearchFinding
 * @brief A single fact gathered during research, with its attribution.
 */
struct ResearchFinding {
    std::string fact;            ///< The factual statement.
    std::string sourceUrl;       ///< Where the fact came from.
    double relevanceScore = 0.0; ///< Relevance to the topic, in [0,1].
    std::string category;        ///< statistic, study, expert_opinion, benefit, risk, general...
};

/**
 * @struct ResearchResult
 * @brief Output of the research stage. Read-only once handed to the coordinator.
 */
struct ResearchResult {
    std::string topic;
    std::vector<ResearchFinding> findings;
    std::string summary;
    double confidence = 0.0; ///< Confidence in the research quality, in [0,1].
};

/**
 * @struct Draft
 * @brief One version of the blog post. Revisions produce new values.
 */
struct Draft {
    std::string title;
    std::string introduction;
    std::vector<std::string> bodySections;
    std::string conclusion;
    int wordCount = 0; ///< Approximate word count.
};

enum class FeedbackSeverity {
    Minor,
    Moderate,
    Major
};

enum class ApprovalStatus {
    Approved,
    NeedsRevision
};

/**
 * @struct FeedbackItem
 * @brief A single critique remark targeted at one section of the draft.
 */
struct FeedbackItem {
    std::string section;
    std::string issue;
    std::string suggestion;
    FeedbackSeverity severity = FeedbackSeverity::Minor;
};

/**
 * @struct Feedback
 * @brief Output of one critique invocation.
 */
struct Feedback {
    double overallQuality = 0.0; ///< Quality score in [0,10].
    std::vector<FeedbackItem> items;
    ApprovalStatus approval = ApprovalStatus::NeedsRevision;
    std::string summary;

    bool hasSeverity(FeedbackSeverity severity) const {
        return std::any_of(items.begin(), items.end(),
                           [severity](const FeedbackItem& item) { return item.severity == severity; });
    }
};

inline std::string SeverityToString(FeedbackSeverity severity) {
    switch (severity) {
        case FeedbackSeverity::Minor: return "minor";
        case FeedbackSeverity::Moderate: return "moderate";
        case FeedbackSeverity::Major: return "major";
    }
    return "minor";
}

inline std::string ApprovalToString(ApprovalStatus status) {
    return status == ApprovalStatus::Approved ? "approved" : "needs_revision";
}

/** @brief Counts whitespace-separated words. */
inline int CountWords(const std::string& text) {
    std::istringstream ss(text);
    std::string word;
    int count = 0;
    while (ss >> word) {
        ++count;
    }
    return count;
}

/** @brief Word count over every textual part of a draft. */
inline int CountDraftWords(const Draft& draft) {
    int total = CountWords(draft.title) + CountWords(draft.introduction) + CountWords(draft.conclusion);
    for (const auto& section : draft.bodySections) {
        total += CountWords(section);
    }
    return total;
}

/** @brief A topic is valid when it contains at least one non-whitespace character. */
inline bool IsValidTopic(const std::string& topic) {
    return std::any_of(topic.begin(), topic.end(),
                       [](char ch) { return !std::isspace(static_cast<unsigned char>(ch)); });
}

/** @brief Cuts @p text to at most @p maxBytes without splitting a UTF-8 sequence. */
inline std::string TruncateUtf8(const std::string& text, std::size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return text;
    }
    std::size_t end = maxBytes;
    while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
        --end;
    }
    return text.substr(0, end);
}

} // namespace blogforge::domain
