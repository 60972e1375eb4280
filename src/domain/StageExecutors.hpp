/**
 * @file StageExecutors.hpp
 * @brief Capability interfaces implemented by the research, writing and critique collaborators.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "Cancellation.hpp"
#include "Content.hpp"

namespace blogforge::domain {

/**
 * @struct StageOutput
 * @brief Typed stage output plus the opaque usage units the executor consumed.
 */
template <typename T>
struct StageOutput {
    T value;
    std::uint64_t usageUnits = 0;
};

/**
 * @class ResearchExecutor
 * @brief Gathers findings for a topic.
 *
 * May throw RetryableError or FatalError. A FatalError may carry the findings
 * gathered before the failure (StageError::partialFindings).
 */
class ResearchExecutor {
public:
    virtual ~ResearchExecutor() = default;

    virtual StageOutput<ResearchResult> research(const std::string& topic,
                                                 const CancellationToken& cancel) = 0;
};

/**
 * @class WritingExecutor
 * @brief Produces the initial draft, or a revision when a prior draft and feedback are given.
 */
class WritingExecutor {
public:
    virtual ~WritingExecutor() = default;

    /**
     * @param topic The validated topic.
     * @param research Research the draft must be grounded on.
     * @param priorDraft Draft being revised; empty for the initial draft.
     * @param feedback Formatted critique for the prior draft; empty for the initial draft.
     * @param cancel Signalled when the invocation is abandoned.
     */
    virtual StageOutput<Draft> write(const std::string& topic,
                                     const ResearchResult& research,
                                     const std::optional<Draft>& priorDraft,
                                     const std::optional<std::string>& feedback,
                                     const CancellationToken& cancel) = 0;
};

/**
 * @class CritiqueExecutor
 * @brief Scores a draft against the research it was written from.
 */
class CritiqueExecutor {
public:
    virtual ~CritiqueExecutor() = default;

    virtual StageOutput<Feedback> critique(const Draft& draft,
                                           const ResearchResult& research,
                                           const CancellationToken& cancel) = 0;
};

/**
 * @class DraftSink
 * @brief Optional collaborator notified of every draft produced (crash recovery, audit).
 */
class DraftSink {
public:
    virtual ~DraftSink() = default;

    /** @param revision 0 for the initial draft, n for the n-th revision. */
    virtual void onDraft(const std::string& topic, int revision, const Draft& draft) = 0;
};

} // namespace blogforge::domain
