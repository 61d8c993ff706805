#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <dlfcn.h>
#include <unistd.h>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

#include "websink_plugin.h"
#include "websink/platform.hpp"

using json = nlohmann::json;

// Drives the output plugin through its C ABI like the pipeline host does
class WebRTCPluginTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto path = std::filesystem::path(TEST_CMAKE_BINARY_DIR) / "plugins" / "output_webrtc" /
                          (std::string("output_webrtc") + WEBSINK_PLUGIN_EXT);
        handle = dlopen(path.c_str(), RTLD_NOW);
        ASSERT_NE(handle, nullptr) << dlerror();
        auto init = reinterpret_cast<websink_plugin_init_fn>(dlsym(handle, WEBSINK_PLUGIN_EXPORT_SYMBOL));
        ASSERT_NE(init, nullptr);
        std::memset(&plugin, 0, sizeof(plugin));
        init(&plugin);

        host.log = [](void* ctx, websink_log_level_t, const char* msg) {
            static_cast<WebRTCPluginTest*>(ctx)->logs.emplace_back(msg);
        };
        host.publish_evt = [](void* ctx, const char* evt) {
            static_cast<WebRTCPluginTest*>(ctx)->events.push_back(json::parse(evt));
        };
    }

    void TearDown() override {
        if (plugin.instance) plugin.stop(&plugin);
        if (handle) dlclose(handle);
    }

    static std::string config(json extra = json::object()) {
        json cfg = {{"bind_address", "127.0.0.1"}, {"ws_port", 40000 + static_cast<int>(getpid() % 20000)}};
        cfg.update(extra);
        return cfg.dump();
    }

    void frame(uint32_t streamId, const std::vector<uint8_t>& payload, uint64_t usec, bool key) {
        std::vector<uint8_t> buf(sizeof(websink_frame_hdr_t) + payload.size());
        websink_frame_hdr_t hdr{};
        hdr.stream_id = streamId;
        hdr.bytes = static_cast<uint32_t>(payload.size());
        hdr.flags = key ? WEBSINK_FRAME_FLAG_KEY : 0;
        hdr.pts_usec = usec;
        std::memcpy(buf.data(), &hdr, sizeof(hdr));
        std::memcpy(buf.data() + sizeof(hdr), payload.data(), payload.size());
        plugin.on_frame(&plugin, buf.data(), buf.size());
    }

    const json* event(const std::string& name) const {
        for (const auto& e : events) {
            if (e.value("event", "") == name) return &e;
        }
        return nullptr;
    }

    void* handle = nullptr;
    websink_plugin_t plugin{};
    websink_host_api_t host{};
    std::vector<std::string> logs;
    std::vector<json> events;
};

TEST_F(WebRTCPluginTest, IsAnOutputPlugin) {
    EXPECT_EQ(plugin.version, 1u);
    EXPECT_EQ(plugin.type, WEBSINK_PLUGIN_OUTPUT);
    EXPECT_EQ(plugin.instance, nullptr);
}

TEST_F(WebRTCPluginTest, InvalidConfigRefusesToStart) {
    EXPECT_EQ(plugin.start(&plugin, &host, this, "{ not json"), -1);
    EXPECT_EQ(plugin.instance, nullptr);
    EXPECT_EQ(plugin.start(&plugin, &host, this, config({{"max_clients", -1}}).c_str()), -1);
    EXPECT_EQ(plugin.start(&plugin, &host, this, config({{"stream_filter", "cam1"}}).c_str()), -1);
    EXPECT_FALSE(logs.empty());
}

TEST_F(WebRTCPluginTest, StartFramesStop) {
    ASSERT_EQ(plugin.start(&plugin, &host, this, config({{"stream_filter", json::array({0})}}).c_str()), 0);
    ASSERT_NE(plugin.instance, nullptr);
    const json* started = event("WebRTCStarted");
    ASSERT_NE(started, nullptr);
    EXPECT_EQ((*started)["bind_address"], "127.0.0.1");

    const std::vector<uint8_t> key = {0, 0, 0, 1, 0x67, 0x42, 0, 0, 0, 1, 0x68, 0xCE, 0, 0, 0, 1, 0x65, 0x88, 0x84};
    const std::vector<uint8_t> delta = {0, 0, 0, 1, 0x41, 0x9A, 0x33};
    const std::string meta = R"({"stream_id":0,"codec":"h264"})";

    frame(0, key, 0, true);
    frame(0, delta, 33333, false);
    frame(1, delta, 33333, false);                       // filtered
    frame(0, std::vector<uint8_t>(meta.begin(), meta.end()), 0, false);  // metadata
    frame(0, {}, 0, false);                              // empty

    // Truncated buffers are ignored
    plugin.on_frame(&plugin, key.data(), 4);
    plugin.on_frame(&plugin, nullptr, 0);

    plugin.stop(&plugin);
    EXPECT_EQ(plugin.instance, nullptr);

    const json* stats = event("WebRTCStats");
    ASSERT_NE(stats, nullptr);
    EXPECT_EQ((*stats)["frames_in"], 2);
    EXPECT_EQ((*stats)["frames_filtered"], 1);
    EXPECT_EQ((*stats)["keyframes"], 1);
    EXPECT_EQ((*stats)["clients_opened"], 0);
    EXPECT_EQ((*stats)["detached_writers"], 0);
}

TEST_F(WebRTCPluginTest, StopWithoutStartIsHarmless) {
    plugin.stop(&plugin);
    frame(0, {0, 0, 0, 1, 0x41, 0x00}, 0, false);
    EXPECT_TRUE(events.empty());
}
