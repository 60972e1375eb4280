/**
 * @file DraftArchive.hpp
 * @brief Draft sink persisting every draft and the final result to disk.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include "application/WorkflowResult.hpp"
#include "domain/StageExecutors.hpp"

namespace blogforge::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::filesystem::path filename;
    std::string content;
};

/**
 * @class DraftArchive
 * @brief Writes <root>/<topic-slug>/draft-<n>.json, result.json and post.md.
 *
 * All writes pass through a single background thread and land atomically
 * (temp file, then rename), so a crash never leaves a truncated artifact.
 * onDraft() only queues work and never blocks the workflow on disk I/O.
 */
class DraftArchive : public domain::DraftSink {
public:
    explicit DraftArchive(std::filesystem::path root);
    ~DraftArchive() override;

    DraftArchive(const DraftArchive&) = delete;
    DraftArchive& operator=(const DraftArchive&) = delete;

    void onDraft(const std::string& topic, int revision, const domain::Draft& draft) override;

    /** @brief Queues result.json and, when a draft exists, post.md. */
    void saveResult(const application::WorkflowResult& result);

    /** @brief Blocks until every queued write has been performed. */
    void flush();

    /** @brief Stops the worker thread after processing all pending writes. */
    void stop();

    std::filesystem::path directoryFor(const std::string& topic) const;
    std::size_t failedWrites() const { return m_failedWrites.load(); }

    /** @brief Lowercase ASCII slug of a topic, "post" when nothing usable remains. */
    static std::string Slugify(const std::string& topic);

private:
    void enqueue(SaveTask task);
    void workerLoop();
    bool performAtomicWrite(const SaveTask& task);

    std::filesystem::path m_root;

    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;

    std::thread m_worker;
    bool m_running = true;
    bool m_workerDone = false;
    std::atomic<std::size_t> m_failedWrites{0};
};

} // namespace blogforge::infrastructure
