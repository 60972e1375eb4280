#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "application/BlogGenerationService.hpp"
#include "infrastructure/DraftArchive.hpp"
#include "FakeExecutors.hpp"

using namespace blogforge;
using namespace blogforge::test;
using infrastructure::DraftArchive;

namespace {

const std::string kTestRoot = "test_archive_root";

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void TestSlugify() {
    assert(DraftArchive::Slugify("Benefits of Intermittent Fasting") == "benefits-of-intermittent-fasting");
    assert(DraftArchive::Slugify("  C++ & Rust: a comparison!! ") == "c-rust-a-comparison");
    assert(DraftArchive::Slugify("???") == "post");
    assert(DraftArchive::Slugify(std::string(200, 'a')).size() == 60);
    std::cout << "[PASS] Topics map to filesystem-safe slugs." << std::endl;
}

void TestArchivesWorkflow() {
    const std::string topic = "Benefits of Intermittent Fasting";
    auto archive = std::make_shared<DraftArchive>(kTestRoot);

    auto fakes = MakeFakes({Returns(MakeResearch(topic))}, {Returns(MakeDraft("Draft v1")), Returns(MakeDraft("Draft v2"))},
                           {Returns(MakeFeedback(5.0, domain::ApprovalStatus::NeedsRevision)),
                            Returns(MakeFeedback(8.0, domain::ApprovalStatus::Approved))});
    application::BlogGenerationService service(fakes.bundle(), FastLimits());
    service.setDraftSink(archive);

    auto result = service.generate(topic);
    archive->saveResult(result);
    archive->flush();

    const auto dir = archive->directoryFor(topic);
    assert(std::filesystem::exists(dir / "draft-0.json"));
    assert(std::filesystem::exists(dir / "draft-1.json"));
    assert(!std::filesystem::exists(dir / "draft-2.json"));

    auto draft1 = nlohmann::json::parse(ReadFile(dir / "draft-1.json"));
    assert(draft1["title"] == "Draft v2");
    assert(draft1["revision"] == 1);

    auto saved = nlohmann::json::parse(ReadFile(dir / "result.json"));
    assert(saved["status"] == "completed");
    assert(saved["revision_count"] == 1);

    auto post = ReadFile(dir / "post.md");
    assert(post.rfind("# Draft v2\n", 0) == 0);
    assert(archive->failedWrites() == 0);

    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        assert(entry.path().extension() != ".tmp");
    }
    std::cout << "[PASS] Drafts and results are archived per topic." << std::endl;
}

void TestStopDrainsQueue() {
    const std::string topic = "Drain Test";
    {
        DraftArchive archive(kTestRoot);
        for (int i = 0; i < 20; ++i) {
            archive.onDraft(topic, i, MakeDraft("Draft " + std::to_string(i)));
        }
        archive.stop();
        archive.onDraft(topic, 99, MakeDraft("Too late"));
        archive.flush();
    }
    const auto dir = std::filesystem::path(kTestRoot) / DraftArchive::Slugify(topic);
    assert(std::filesystem::exists(dir / "draft-19.json"));
    assert(!std::filesystem::exists(dir / "draft-99.json"));
    std::cout << "[PASS] Stopping writes queued drafts and rejects new ones." << std::endl;
}

void TestArchivesInvalidUtf8() {
    const std::string topic = "Caf\xE9 culture";
    application::WorkflowResult result;
    result.status = application::WorkflowStatus::Failed;
    result.topic = topic;
    result.research = MakeResearch(topic);
    result.failure = application::FailureInfo{domain::WorkflowStage::Researching,
                                              application::failure_codes::kResearchFailed,
                                              std::string(10, 'x') + "\xC3"};

    DraftArchive archive(kTestRoot);
    archive.onDraft(topic, 0, MakeDraft("Caf\xE9"));
    archive.saveResult(result);
    archive.flush();

    const auto dir = archive.directoryFor(topic);
    auto saved = nlohmann::json::parse(ReadFile(dir / "result.json"));
    assert(saved["status"] == "failed");
    assert(saved["failure"]["message"].get<std::string>().rfind(std::string(10, 'x'), 0) == 0);
    auto draft = nlohmann::json::parse(ReadFile(dir / "draft-0.json"));
    assert(draft["title"] == "Caf\xEF\xBF\xBD");
    assert(archive.failedWrites() == 0);
    std::cout << "[PASS] Invalid UTF-8 in content is archived with replacement characters." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting DraftArchive Test..." << std::endl;
    std::filesystem::remove_all(kTestRoot);

    TestSlugify();
    TestArchivesWorkflow();
    TestStopDrainsQueue();
    TestArchivesInvalidUtf8();

    std::filesystem::remove_all(kTestRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
