/**
 * @file BlogGenerationService.hpp
 * @brief Entry point turning a topic into a finished blog post.
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "application/ProgressPublisher.hpp"
#include "application/WorkflowCoordinator.hpp"
#include "application/WorkflowErrors.hpp"
#include "application/WorkflowLimits.hpp"
#include "application/WorkflowResult.hpp"

namespace blogforge::application {

/**
 * @class BlogGenerationService
 * @brief Runs one WorkflowCoordinator per call and exposes progress to observers.
 *
 * Subscriptions taken before or during a run observe that run; each run gets
 * a fresh publisher once the previous one has been closed. Runs on one service
 * are serialized.
 */
class BlogGenerationService {
public:
    BlogGenerationService(StageExecutors executors,
                          WorkflowLimits defaultLimits = {},
                          std::size_t progressCapacity = 256,
                          OverflowPolicy overflow = OverflowPolicy::DropOldest);

    /**
     * @brief Generates a post with the default limits.
     * @throws ValidationError, ResearchError, WritingError, CritiqueError, CancelledError.
     */
    WorkflowResult generate(const std::string& topic);

    /**
     * @brief Generates a post.
     * @return The completed result.
     * @throws ValidationError before any executor runs when the input is invalid.
     * @throws WorkflowError subclass carrying the partial result when the run failed.
     */
    WorkflowResult generate(const std::string& topic,
                            const WorkflowLimits& limits,
                            const domain::CancellationToken& cancel = {});

    /**
     * @brief Like generate(), but returns failed results instead of throwing.
     * @throws ValidationError when the input is invalid.
     */
    WorkflowResult run(const std::string& topic,
                       const WorkflowLimits& limits,
                       const domain::CancellationToken& cancel = {});

    /** @brief Observes the current run, or the next one when idle. */
    ProgressSubscription subscribe();

    /** @brief Status of the current (or last) run; nullopt before the first run. */
    std::optional<StatusSummary> status() const;

    void setDraftSink(std::shared_ptr<domain::DraftSink> sink);
    void setResearchFallback(ResearchFallback fallback);

    const WorkflowLimits& defaultLimits() const { return m_defaultLimits; }

private:
    std::shared_ptr<ProgressPublisher> currentPublisher() const;
    void rotatePublisher();

    StageExecutors m_executors;
    WorkflowLimits m_defaultLimits;
    std::size_t m_progressCapacity;
    OverflowPolicy m_overflow;
    std::shared_ptr<domain::DraftSink> m_draftSink;
    ResearchFallback m_researchFallback;

    std::mutex m_runMutex;
    mutable std::mutex m_stateMutex;
    std::shared_ptr<ProgressPublisher> m_publisher;
    std::shared_ptr<WorkflowCoordinator> m_coordinator;
};

} // namespace blogforge::application
