/**
 * @file GenerateCommand.cpp
 * @brief blogforge-cli: generates one blog post from the command line.
 */

#include "application/BlogGenerationService.hpp"
#include "application/ContentFormatter.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DraftArchive.hpp"
#include "infrastructure/OllamaStageExecutors.hpp"

#include <atomic>
#include <csignal>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <boost/program_options.hpp>

namespace po = boost::program_options;
using namespace blogforge;

namespace {

constexpr int kExitCompleted = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

volatile std::sig_atomic_t g_interrupted = 0;

void OnInterrupt(int) {
    g_interrupted = 1;
}

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
    localtime_r(&tt, &tm);
    return tm;
}

std::string FormatEvent(const application::ProgressEvent& event) {
    std::tm tm = ToLocalTime(std::chrono::system_clock::to_time_t(event.timestamp));
    std::ostringstream ss;
    ss << "[" << std::put_time(&tm, "%H:%M:%S") << "] " << event.message << " (" << std::fixed
       << std::setprecision(0) << event.percent << "%)";
    return ss.str();
}

void PrintMetrics(const application::WorkflowResult& result) {
    const auto& m = result.metrics;
    std::cout << "\n--- Generation summary ---\n"
              << "Status:        " << application::WorkflowStatusToString(result.status) << "\n"
              << "Revisions:     " << result.revisionCount << "\n"
              << "Elapsed:       " << std::fixed << std::setprecision(1) << result.elapsed.count() / 1000.0 << " s\n";
    if (result.qualityScore) {
        std::cout << "Quality:       " << std::setprecision(1) << *result.qualityScore << "/10"
                  << (result.qualityBestEffort ? " (best effort)" : "") << "\n";
    }
    if (result.finalDraft) {
        std::cout << "Word count:    " << result.finalDraft->wordCount << "\n";
    }
    std::cout << "API calls:     " << m.apiCalls << " (" << m.retries << " retries, " << m.failures << " failures)\n"
              << "Usage units:   " << m.usageUnits << "\n";
    for (const auto& [kind, usage] : m.executors) {
        std::cout << "  " << std::left << std::setw(10) << application::ExecutorToString(kind) << std::right
                  << usage.calls << " call(s), " << usage.elapsed.count() << " ms\n";
    }
    if (result.degradedResearch) {
        std::cout << "Research:      degraded\n";
    }
    if (result.failure) {
        std::cout << "Failure:       " << result.failure->code << " in " << domain::StageToString(result.failure->stage)
                  << ": " << result.failure->message << "\n";
    }
    std::cout << std::flush;
}

} // namespace

int main(int argc, char* argv[]) {
    po::options_description desc("Allowed options");
    po::positional_options_description posDesc;
    // clang-format off
    desc.add_options()
        ("help,h", "produce help message")
        ("topic", po::value<std::vector<std::string>>()->multitoken(), "topic of the blog post")
        ("config,c", po::value<std::string>()->default_value(infrastructure::ConfigLoader::kDefaultFileName),
             "settings file")
        ("model,m", po::value<std::string>(), "Ollama model name")
        ("host", po::value<std::string>(), "Ollama host")
        ("port", po::value<int>(), "Ollama port")
        ("max-iterations", po::value<int>(), "maximum critique cycles")
        ("threshold", po::value<double>(), "quality score needed for acceptance (0-10)")
        ("output,o", po::value<std::string>(), "directory receiving drafts and the final post")
        ("no-archive", "do not write drafts and results to disk")
        ("allow-degraded", "continue with minimal research when research fails")
        ("quiet,q", "do not print progress events")
    ;
    posDesc.add("topic", -1);
    // clang-format on

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(posDesc).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n" << desc << std::endl;
        return kExitUsage;
    }

    if (vm.count("help") || !vm.count("topic")) {
        std::cout << "Usage: blogforge-cli <topic> [options]\n"
                  << "Researches, writes and iteratively critiques a blog post using a local Ollama server.\n"
                  << desc << std::endl;
        return vm.count("help") ? kExitCompleted : kExitUsage;
    }

    std::string topic;
    for (const auto& word : vm["topic"].as<std::vector<std::string>>()) {
        topic += (topic.empty() ? "" : " ") + word;
    }

    auto config = infrastructure::ConfigLoader::Load(vm["config"].as<std::string>());
    if (vm.count("model")) config.ollama.model = vm["model"].as<std::string>();
    if (vm.count("host")) config.ollama.host = vm["host"].as<std::string>();
    if (vm.count("port")) config.ollama.port = vm["port"].as<int>();
    if (vm.count("max-iterations")) config.workflow.maxIterations = vm["max-iterations"].as<int>();
    if (vm.count("threshold")) config.workflow.qualityThreshold = vm["threshold"].as<double>();
    if (vm.count("output")) config.output.directory = vm["output"].as<std::string>();
    if (vm.count("no-archive")) config.output.archive = false;
    if (vm.count("allow-degraded")) config.workflow.allowDegradedResearch = true;
    const bool quiet = vm.count("quiet") > 0;

    auto executors = infrastructure::MakeOllamaExecutors(config.ollama, config.workflow.qualityThreshold);
    application::BlogGenerationService service(executors, config.workflow, config.progress.bufferCapacity,
                                               config.progress.overflow);

    std::shared_ptr<infrastructure::DraftArchive> archive;
    if (config.output.archive) {
        archive = std::make_shared<infrastructure::DraftArchive>(config.output.directory);
        service.setDraftSink(archive);
    }

    std::signal(SIGINT, OnInterrupt);
    domain::CancellationSource cancellation;
    std::atomic<bool> finished{false};
    std::thread interruptWatcher([&cancellation, &finished] {
        while (!finished.load()) {
            if (g_interrupted && !cancellation.isCancelled()) {
                std::cerr << "\n[blogforge-cli] Interrupted, cancelling..." << std::endl;
                cancellation.cancel();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    auto subscription = service.subscribe();
    std::thread printer([&subscription, quiet] {
        while (auto event = subscription.next()) {
            if (!quiet) {
                std::cout << FormatEvent(*event) << std::endl;
            }
        }
    });

    int exitCode = kExitFailed;
    try {
        auto result = service.run(topic, config.workflow, cancellation.token());
        printer.join();

        if (result.finalDraft && result.completed()) {
            std::cout << "\n" << application::ContentFormatter::RenderMarkdown(*result.finalDraft);
        }
        PrintMetrics(result);
        if (archive) {
            try {
                archive->saveResult(result);
                archive->flush();
                std::cout << "Saved to " << archive->directoryFor(topic).string() << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "[blogforge-cli] Could not archive result: " << e.what() << std::endl;
            }
        }
        exitCode = result.completed() ? kExitCompleted : kExitFailed;
    } catch (const application::ValidationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printer.join();
        exitCode = kExitUsage;
    } catch (const std::exception& e) {
        std::cerr << "[blogforge-cli] Generation aborted: " << e.what() << std::endl;
        if (printer.joinable()) {
            printer.join();
        }
        exitCode = kExitFailed;
    }

    finished = true;
    interruptWatcher.join();
    return exitCode;
}
