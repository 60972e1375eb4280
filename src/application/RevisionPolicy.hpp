/**
 * @file RevisionPolicy.hpp
 * @brief Decides, after each critique, whether the workflow revises, accepts or gives up.
 */

#pragma once

#include <string>
#include "application/WorkflowLimits.hpp"
#include "domain/Content.hpp"

namespace blogforge::application {

enum class RevisionDecision {
    Accept,
    Revise,
    Abandon
};

inline std::string DecisionToString(RevisionDecision decision) {
    switch (decision) {
        case RevisionDecision::Accept: return "accept";
        case RevisionDecision::Revise: return "revise";
        case RevisionDecision::Abandon: return "abandon";
    }
    return "accept";
}

/**
 * @struct RevisionVerdict
 * @brief A decision plus the human-readable rule that produced it.
 */
struct RevisionVerdict {
    RevisionDecision decision = RevisionDecision::Accept;
    std::string reason;
    bool budgetExhausted = false; ///< Accepted only because no iterations remain.
};

/**
 * @class RevisionPolicy
 * @brief Pure decision function over (feedback, iteration, limits).
 *
 * Rules in order: unusable score abandons; exhausted iteration budget, explicit
 * approval and a score at or above the threshold accept; a major item, a
 * weighted severity at or above the configured threshold, or a score below the
 * threshold by more than the revise margin revise; anything else accepts.
 */
class RevisionPolicy {
public:
    /**
     * @param feedback Critique of the current draft.
     * @param iteration 0-based number of completed revision cycles.
     * @param limits Budgets and policy tuning.
     */
    static RevisionVerdict decide(const domain::Feedback& feedback,
                                  int iteration,
                                  const WorkflowLimits& limits);

    /** @brief Sum of the configured severity weights over the feedback items. */
    static double weightedSeverity(const domain::Feedback& feedback, const PolicyConfig& config);
};

} // namespace blogforge::application
