/**
 * @file RevisionPolicy.cpp
 * @brief Implementation of RevisionPolicy.
 */

#include "application/RevisionPolicy.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace blogforge::application {

namespace {

std::string FormatScore(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value;
    return ss.str();
}

RevisionVerdict Verdict(RevisionDecision decision, std::string reason, bool budgetExhausted = false) {
    RevisionVerdict verdict;
    verdict.decision = decision;
    verdict.reason = std::move(reason);
    verdict.budgetExhausted = budgetExhausted;
    return verdict;
}

} // namespace

double RevisionPolicy::weightedSeverity(const domain::Feedback& feedback, const PolicyConfig& config) {
    double total = 0.0;
    for (const auto& item : feedback.items) {
        if (item.severity == domain::FeedbackSeverity::Moderate) {
            total += config.moderateWeight;
        } else if (item.severity == domain::FeedbackSeverity::Minor) {
            total += config.minorWeight;
        }
    }
    return total;
}

RevisionVerdict RevisionPolicy::decide(const domain::Feedback& feedback,
                                       int iteration,
                                       const WorkflowLimits& limits) {
    const double quality = feedback.overallQuality;
    if (!std::isfinite(quality) || quality < 0.0 || quality > 10.0) {
        return Verdict(RevisionDecision::Abandon, "Critique returned an unusable quality score.");
    }

    if (iteration + 1 >= limits.maxIterations) {
        return Verdict(RevisionDecision::Accept,
                       "Maximum iterations (" + std::to_string(limits.maxIterations) + ") reached.",
                       true);
    }

    if (feedback.approval == domain::ApprovalStatus::Approved) {
        return Verdict(RevisionDecision::Accept, "Draft approved by critique.");
    }

    if (quality >= limits.qualityThreshold) {
        return Verdict(RevisionDecision::Accept,
                       "Quality score (" + FormatScore(quality) + ") meets threshold (" +
                           FormatScore(limits.qualityThreshold) + ").");
    }

    if (feedback.hasSeverity(domain::FeedbackSeverity::Major)) {
        return Verdict(RevisionDecision::Revise, "Major issues found in critique.");
    }

    const PolicyConfig& config = limits.policy;
    if (config.severityReviseThreshold > 0.0 &&
        weightedSeverity(feedback, config) >= config.severityReviseThreshold) {
        return Verdict(RevisionDecision::Revise, "Accumulated moderate/minor issues warrant a revision.");
    }

    if (limits.qualityThreshold - quality > config.reviseMargin) {
        return Verdict(RevisionDecision::Revise,
                       "Quality score (" + FormatScore(quality) + ") below threshold (" +
                           FormatScore(limits.qualityThreshold) + ").");
    }

    return Verdict(RevisionDecision::Accept,
                   "Quality acceptable (" + FormatScore(quality) + ") despite minor issues.");
}

} // namespace blogforge::application
