/**
 * @file DraftArchive.cpp
 * @brief Implementation of DraftArchive.
 */

#include "infrastructure/DraftArchive.hpp"
#include "application/ContentFormatter.hpp"
#include "infrastructure/ContentJson.hpp"
#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>

namespace blogforge::infrastructure {

namespace fs = std::filesystem;

namespace {
constexpr std::size_t kMaxSlugLength = 60;

// Model output is not guaranteed to be valid UTF-8; bad bytes become U+FFFD.
std::string DumpJson(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}
}

DraftArchive::DraftArchive(fs::path root) : m_root(std::move(root)) {
    m_worker = std::thread(&DraftArchive::workerLoop, this);
}

DraftArchive::~DraftArchive() {
    stop();
}

std::string DraftArchive::Slugify(const std::string& topic) {
    std::string slug;
    bool pendingDash = false;
    for (char ch : topic) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) && c < 128) {
            if (pendingDash && !slug.empty()) {
                slug.push_back('-');
            }
            pendingDash = false;
            slug.push_back(static_cast<char>(std::tolower(c)));
            if (slug.size() >= kMaxSlugLength) {
                break;
            }
        } else {
            pendingDash = true;
        }
    }
    return slug.empty() ? "post" : slug;
}

fs::path DraftArchive::directoryFor(const std::string& topic) const {
    return m_root / Slugify(topic);
}

void DraftArchive::onDraft(const std::string& topic, int revision, const domain::Draft& draft) {
    nlohmann::json j = draft;
    j["revision"] = revision;
    enqueue(SaveTask{directoryFor(topic) / ("draft-" + std::to_string(revision) + ".json"), DumpJson(j)});
}

void DraftArchive::saveResult(const application::WorkflowResult& result) {
    const auto dir = directoryFor(result.topic);
    enqueue(SaveTask{dir / "result.json", DumpJson(ContentJson::ResultToJson(result))});
    if (result.finalDraft) {
        enqueue(SaveTask{dir / "post.md", application::ContentFormatter::RenderMarkdown(*result.finalDraft)});
    }
}

void DraftArchive::enqueue(SaveTask task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[DraftArchive] Archive stopped, dropping " << task.filename << std::endl;
            return;
        }
        m_queue.push(std::move(task));
    }
    m_cv.notify_one();
}

void DraftArchive::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] { return (m_queue.empty() && !m_busy) || m_workerDone; });
}

void DraftArchive::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void DraftArchive::workerLoop() {
    while (true) {
        SaveTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_queue.empty() || !m_running; });

            if (m_queue.empty()) {
                if (!m_running) {
                    m_workerDone = true;
                    m_idleCv.notify_all();
                    return;
                }
                continue;
            }

            task = std::move(m_queue.front());
            m_queue.pop();
            m_busy = true;
        }

        if (!performAtomicWrite(task)) {
            ++m_failedWrites;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
        }
        m_idleCv.notify_all();
    }
}

bool DraftArchive::performAtomicWrite(const SaveTask& task) {
    const fs::path& finalPath = task.filename;
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            std::cerr << "[DraftArchive] Error creating " << finalPath.parent_path() << ": " << ec.message()
                      << std::endl;
            return false;
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            std::cerr << "[DraftArchive] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << task.content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[DraftArchive] Write failed: " << tempPath << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[DraftArchive] Rename to " << finalPath << " failed: " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

} // namespace blogforge::infrastructure
