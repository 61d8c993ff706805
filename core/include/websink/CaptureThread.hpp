#pragma once

#include <thread>
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "websink_plugin.h"
#include "websink/ShmRing.hpp"

namespace websink {

// Runs an input plugin whose frames land in a ShmRing, and fans the ring out to
// the output plugins on a dedicated thread.
class CaptureThread {
public:
    CaptureThread(websink_plugin_t* inputPlugin,
                  ShmRing& ring,
                  const std::vector<websink_plugin_t*>& outputs,
                  const std::string& inputConfig);
    ~CaptureThread();

    // Starts the fan-out loop and the input plugin; false if the plugin refused to start
    bool start();
    // Stops the input plugin, then the fan-out loop
    void stop();

    uint64_t framesForwarded() const { return forwarded_.load(); }
    // Frames lost because the ring was full
    uint64_t framesDropped() const { return dropped_.load(); }
    // Frames lost because they do not fit one ring slot
    uint64_t framesOversized() const { return oversized_.load(); }

private:
    static void hostLog(void* host_ctx, websink_log_level_t level, const char* msg);
    static void hostPublishEvent(void* host_ctx, const char* json_event);
    static void hostOnFrame(void* host_ctx, const void* frame_buf, size_t frame_size);

    void run();

    websink_plugin_t* inputPlugin_;
    ShmRing& ring_;
    std::vector<websink_plugin_t*> outputs_;
    std::string inputConfig_;
    websink_host_api_t hostApi_{};

    std::thread thread_;
    std::atomic<bool> running_{false};
    bool inputStarted_ = false;
    std::atomic<uint64_t> forwarded_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> oversized_{0};
};

} // namespace websink
