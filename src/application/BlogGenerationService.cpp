/**
 * @file BlogGenerationService.cpp
 * @brief Implementation of the BlogGenerationService class.
 */

#include "application/BlogGenerationService.hpp"

#include <iostream>

namespace blogforge::application {

BlogGenerationService::BlogGenerationService(StageExecutors executors,
                                             WorkflowLimits defaultLimits,
                                             std::size_t progressCapacity,
                                             OverflowPolicy overflow)
    : m_executors(std::move(executors)),
      m_defaultLimits(defaultLimits),
      m_progressCapacity(progressCapacity),
      m_overflow(overflow),
      m_publisher(std::make_shared<ProgressPublisher>(progressCapacity, overflow)) {}

WorkflowResult BlogGenerationService::generate(const std::string& topic) {
    return generate(topic, m_defaultLimits);
}

WorkflowResult BlogGenerationService::generate(const std::string& topic,
                                               const WorkflowLimits& limits,
                                               const domain::CancellationToken& cancel) {
    WorkflowResult result = run(topic, limits, cancel);
    if (!result.completed()) {
        ThrowForFailedResult(std::move(result));
    }
    return result;
}

WorkflowResult BlogGenerationService::run(const std::string& topic,
                                          const WorkflowLimits& limits,
                                          const domain::CancellationToken& cancel) {
    std::lock_guard<std::mutex> runLock(m_runMutex);

    std::shared_ptr<WorkflowCoordinator> coordinator;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        coordinator = std::make_shared<WorkflowCoordinator>(m_publisher, m_draftSink, m_researchFallback);
        m_coordinator = coordinator;
    }

    try {
        WorkflowResult result = coordinator->run(topic, m_executors, limits, cancel);
        rotatePublisher();
        return result;
    } catch (const ValidationError& e) {
        std::cerr << "[BlogGenerationService] Rejected request: " << e.what() << std::endl;
        currentPublisher()->close();
        rotatePublisher();
        throw;
    }
}

ProgressSubscription BlogGenerationService::subscribe() {
    return currentPublisher()->subscribe();
}

std::optional<StatusSummary> BlogGenerationService::status() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (!m_coordinator) {
        return std::nullopt;
    }
    return m_coordinator->status();
}

void BlogGenerationService::setDraftSink(std::shared_ptr<domain::DraftSink> sink) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_draftSink = std::move(sink);
}

void BlogGenerationService::setResearchFallback(ResearchFallback fallback) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_researchFallback = std::move(fallback);
}

std::shared_ptr<ProgressPublisher> BlogGenerationService::currentPublisher() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_publisher;
}

void BlogGenerationService::rotatePublisher() {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_publisher = std::make_shared<ProgressPublisher>(m_progressCapacity, m_overflow);
}

} // namespace blogforge::application
