// websink-core.cpp - Main runner for WebSink plugin pipelines
#include "websink/EventBus.hpp"
#include "websink/Log.hpp"
#include "websink/PipelineLoader.hpp"
#include "websink/PluginManager.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace websink;
namespace fs = std::filesystem;

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop = true;
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " --pipeline <pipeline.json> [--plugin-dir <dir>] [--log-level <level>]\n";
    std::cout << "       or: " << prog << " --pipelines-dir <dir>\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string pipelineFile;
    std::string pipelinesDir;
    std::string pluginDir = "plugins";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--pipeline" && i + 1 < argc) pipelineFile = argv[++i];
        else if (arg == "--pipelines-dir" && i + 1 < argc) pipelinesDir = argv[++i];
        else if (arg == "--plugin-dir" && i + 1 < argc) pluginDir = argv[++i];
        else if (arg == "--log-level" && i + 1 < argc) {
            try {
                setLogLevel(parseLogLevel(argv[++i]));
            } catch (const std::invalid_argument& e) {
                std::cerr << e.what() << std::endl;
                return 1;
            }
        }
        else if (arg == "-h" || arg == "--help") { print_usage(argv[0]); return 0; }
        else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }
    if (pipelineFile.empty() && pipelinesDir.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    // Find pipeline file if only directory is given
    if (pipelineFile.empty()) {
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(pipelinesDir, ec)) {
            if (entry.path().extension() == ".json") {
                pipelineFile = entry.path().string();
                logf(WEBSINK_LOG_INFO, "Using pipeline: %s", pipelineFile.c_str());
                break;
            }
        }
        if (pipelineFile.empty()) {
            logf(WEBSINK_LOG_ERROR, "No pipeline JSON found in %s", pipelinesDir.c_str());
            return 2;
        }
    }

    PipelineLoader loader(pipelineFile, pluginDir);
    if (!loader.load()) {
        logf(WEBSINK_LOG_ERROR, "Failed to load pipeline: %s", pipelineFile.c_str());
        return 3;
    }
    loader.printProgress();

    // Plugin events (stream state, keyframe requests, final stats) go to the log
    auto token = EventBus::instance().subscribe(PluginManager::kPluginEventChannel, [](const std::string& evt) {
        logf(WEBSINK_LOG_INFO, "[event] %s", evt.c_str());
    });

    PluginManager pm;
    if (!pm.loadPipeline(loader.getPipeline())) {
        logf(WEBSINK_LOG_ERROR, "Failed to load plugins for pipeline.");
        EventBus::instance().unsubscribe(token);
        return 4;
    }

    if (!pm.startAll()) {
        logf(WEBSINK_LOG_ERROR, "Failed to start pipeline.");
        EventBus::instance().unsubscribe(token);
        return 5;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    logf(WEBSINK_LOG_INFO, "[websink-core] Pipeline running. Press Ctrl+C to exit.");
    // Plugins run in their own threads
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    logf(WEBSINK_LOG_INFO, "[websink-core] Shutting down");
    pm.stopAll();
    EventBus::instance().unsubscribe(token);
    return 0;
}
