/**
 * @file ContentFormatter.hpp
 * @brief Text renderings of content value objects.
 */

#pragma once

#include <cstddef>
#include <string>
#include "domain/Content.hpp"

namespace blogforge::application {

class ContentFormatter {
public:
    /** @brief At most this many minor items are forwarded to a revision. */
    static constexpr std::size_t kMaxMinorItems = 3;

    /**
     * @brief Turns a critique into revision instructions for the writing stage.
     *
     * Items are grouped major, moderate, then minor (minor items truncated to
     * kMaxMinorItems), each rendered as "- section: issue -> suggestion".
     */
    static std::string FormatFeedbackForRevision(const domain::Feedback& feedback);

    /** @brief Renders a draft as a Markdown document. */
    static std::string RenderMarkdown(const domain::Draft& draft);

    /**
     * @brief Minimal research used when research failed and degraded mode is enabled.
     */
    static domain::ResearchResult MakeDegradedResearch(const std::string& topic, const std::string& reason);
};

} // namespace blogforge::application
