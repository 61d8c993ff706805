#include <gtest/gtest.h>
#include "websink/CaptureThread.hpp"
#include "websink/Log.hpp"
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace websink;

namespace {

// Input plugin that pushes the configured payload sizes from start()
struct ScriptedInput {
    std::vector<uint32_t> payloadSizes;
};

int scriptedStart(websink_plugin_t* plugin, websink_host_api_t* host, void* host_ctx, const char*) {
    auto* script = static_cast<ScriptedInput*>(plugin->instance);
    for (uint32_t bytes : script->payloadSizes) {
        std::vector<uint8_t> buf(sizeof(websink_frame_hdr_t) + bytes, 0xAB);
        websink_frame_hdr_t hdr{};
        hdr.bytes = bytes;
        std::memcpy(buf.data(), &hdr, sizeof(hdr));
        host->on_frame(host_ctx, buf.data(), buf.size());
    }
    return 0;
}

std::atomic<int> outputFrames{0};

void countingOnFrame(websink_plugin_t*, const void*, size_t) {
    ++outputFrames;
}

} // namespace

class CaptureThreadTest : public ::testing::Test {
protected:
    void SetUp() override {
        outputFrames = 0;
        setLogSink([this](websink_log_level_t, const char* msg) {
            std::lock_guard<std::mutex> lock(mutex);
            lines.emplace_back(msg);
        });
    }
    void TearDown() override {
        setLogSink({});
    }

    bool logged(const std::string& needle) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& l : lines) {
            if (l.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    std::mutex mutex;
    std::vector<std::string> lines;
};

TEST_F(CaptureThreadTest, OversizedFrameIsNotReportedAsRingFull) {
    ShmRing ring("websink_test_capture_" + std::to_string(getpid()), 8, 128);

    ScriptedInput script;
    script.payloadSizes = {32, 4096, 48};
    websink_plugin_t input{};
    input.type = WEBSINK_PLUGIN_INPUT;
    input.start = &scriptedStart;
    input.instance = &script;

    websink_plugin_t output{};
    output.type = WEBSINK_PLUGIN_OUTPUT;
    output.on_frame = &countingOnFrame;

    CaptureThread capture(&input, ring, {&output}, "{}");
    ASSERT_TRUE(capture.start());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (outputFrames.load() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    capture.stop();

    EXPECT_EQ(outputFrames.load(), 2);
    EXPECT_EQ(capture.framesOversized(), 1u);
    EXPECT_EQ(capture.framesDropped(), 0u);
    EXPECT_TRUE(logged("exceeds the 128 byte ring slot"));
    EXPECT_FALSE(logged("Frame ring full"));
}
