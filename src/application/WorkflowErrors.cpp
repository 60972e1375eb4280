/**
 * @file WorkflowErrors.cpp
 * @brief Mapping of failed results to exceptions.
 */

#include "application/WorkflowErrors.hpp"

namespace blogforge::application {

void ThrowForFailedResult(WorkflowResult result) {
    FailureInfo failure = result.failure ? *result.failure
                                         : FailureInfo{domain::WorkflowStage::Failed, "UNKNOWN", "Workflow failed"};
    auto partial = std::make_shared<const WorkflowResult>(std::move(result));

    if (failure.code == failure_codes::kResearchFailed) {
        throw ResearchError(failure.code, failure.message, failure.stage, partial);
    }
    if (failure.code == failure_codes::kWritingFailed) {
        throw WritingError(failure.code, failure.message, failure.stage, partial);
    }
    if (failure.code == failure_codes::kCritiqueFailed || failure.code == failure_codes::kPolicyAbandoned) {
        throw CritiqueError(failure.code, failure.message, failure.stage, partial);
    }
    if (failure.code == failure_codes::kCancelled) {
        throw CancelledError(failure.code, failure.message, failure.stage, partial);
    }
    throw WorkflowError(failure.code, failure.message, failure.stage, partial);
}

} // namespace blogforge::application
