/**
 * @file WorkflowErrors.hpp
 * @brief Exceptions raised by the generation entry point.
 */

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include "application/WorkflowResult.hpp"

namespace blogforge::application {

/**
 * @class WorkflowError
 * @brief A run that did not complete. Carries whatever the run produced.
 */
class WorkflowError : public std::runtime_error {
public:
    WorkflowError(std::string code,
                  const std::string& message,
                  domain::WorkflowStage stage,
                  std::shared_ptr<const WorkflowResult> partial = nullptr)
        : std::runtime_error(message), m_code(std::move(code)), m_stage(stage), m_partial(std::move(partial)) {}

    const std::string& code() const { return m_code; }
    domain::WorkflowStage stage() const { return m_stage; }

    /** @brief Partial result; null for input validation failures. */
    const std::shared_ptr<const WorkflowResult>& partialResult() const { return m_partial; }

private:
    std::string m_code;
    domain::WorkflowStage m_stage;
    std::shared_ptr<const WorkflowResult> m_partial;
};

class ValidationError : public WorkflowError {
public:
    explicit ValidationError(const std::string& message)
        : WorkflowError(failure_codes::kInvalidInput, message, domain::WorkflowStage::Initializing) {}
};

class ResearchError : public WorkflowError {
public:
    using WorkflowError::WorkflowError;
};

class WritingError : public WorkflowError {
public:
    using WorkflowError::WorkflowError;
};

class CritiqueError : public WorkflowError {
public:
    using WorkflowError::WorkflowError;
};

class CancelledError : public WorkflowError {
public:
    using WorkflowError::WorkflowError;
};

/**
 * @brief Throws the WorkflowError subclass matching a failed result.
 *
 * POLICY_ABANDONED is reported as a CritiqueError since the critique output was unusable.
 */
[[noreturn]] void ThrowForFailedResult(WorkflowResult result);

} // namespace blogforge::application
