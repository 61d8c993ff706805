#include <websink_plugin.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <exception>
#include <memory>
#include <string>

#include "websink/Config.hpp"
#include "websink/Log.hpp"
#include "websink/WebSink.hpp"

using json = nlohmann::json;

namespace {

struct WebRTCInstance {
    websink::WebSinkConfig cfg;
    std::unique_ptr<websink::WebSink> sink;

    // Host API
    websink_host_api_t* host = nullptr;
    void* host_ctx = nullptr;

    uint64_t frames_in = 0;
    uint64_t frames_filtered = 0;
};

void log(WebRTCInstance* inst, websink_log_level_t level, const char* fmt, ...) {
    if (!inst || !inst->host || !inst->host->log) return;
    va_list ap;
    va_start(ap, fmt);
    char buf[512];
    vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    inst->host->log(inst->host_ctx, level, buf);
}

void publish(WebRTCInstance* inst, const json& event) {
    if (inst && inst->host && inst->host->publish_evt) {
        inst->host->publish_evt(inst->host_ctx, event.dump().c_str());
    }
}

int handle_plugin_start(websink_plugin_t* plugin, websink_host_api_t* host, void* host_ctx, const char* json_cfg) {
    auto inst = std::make_unique<WebRTCInstance>();
    inst->host = host;
    inst->host_ctx = host_ctx;

    try {
        inst->cfg = websink::parseConfig(json_cfg ? json_cfg : "{}");
    } catch (const std::exception& e) {
        log(inst.get(), WEBSINK_LOG_ERROR, "Invalid WebRTC config JSON: %s", e.what());
        return -1;
    }

    // Engine logs go through the host so they share its sink and prefix
    if (host && host->log) {
        websink::setLogSink([host, host_ctx](websink_log_level_t level, const char* msg) {
            host->log(host_ctx, level, msg);
        });
    }
    websink::setLogLevel(inst->cfg.log_level);

    if (!inst->cfg.stream_filter.empty()) {
        log(inst.get(), WEBSINK_LOG_INFO, "WebRTC stream filter configured for %zu streams",
            inst->cfg.stream_filter.size());
    }

    try {
        inst->sink = std::make_unique<websink::WebSink>(inst->cfg);
        WebRTCInstance* raw = inst.get();
        // Advisory: published on the host event channel for whatever drives the
        // encoder. capture_h264 replays an existing stream and cannot force an IDR,
        // so nothing in this tree subscribes and sessions wait for the next keyframe.
        inst->sink->setKeyframeRequester([raw]() {
            publish(raw, json{{"event", "KeyframeRequest"}, {"source", "output_webrtc"}});
        });
        inst->sink->start();
    } catch (const std::exception& e) {
        log(inst.get(), WEBSINK_LOG_ERROR, "Failed to initialize WebRTC: %s", e.what());
        websink::setLogSink({});
        return -1;
    }

    log(inst.get(), WEBSINK_LOG_INFO, "WebRTC output plugin started on %s:%u (max_clients=%d)",
        inst->cfg.bind_address.c_str(), static_cast<unsigned>(inst->sink->signalingPort()), inst->cfg.max_clients);

    publish(inst.get(), json{
        {"event", "WebRTCStarted"},
        {"bind_address", inst->cfg.bind_address},
        {"port", inst->sink->signalingPort()},
        {"max_clients", inst->cfg.max_clients}
    });

    plugin->instance = inst.release();
    return 0;
}

void handle_plugin_stop(websink_plugin_t* plugin) {
    if (!plugin || !plugin->instance) return;

    std::unique_ptr<WebRTCInstance> inst(static_cast<WebRTCInstance*>(plugin->instance));
    plugin->instance = nullptr;

    log(inst.get(), WEBSINK_LOG_INFO, "Stopping WebRTC output plugin");
    inst->sink->stop();

    const websink::WebSinkStats stats = inst->sink->stats();
    publish(inst.get(), json{
        {"event", "WebRTCStats"},
        {"frames_in", inst->frames_in},
        {"frames_filtered", inst->frames_filtered},
        {"frames_rejected", stats.adapter.rejected},
        {"keyframes", stats.adapter.keyframes},
        {"units_delivered", stats.broadcast.delivered},
        {"units_skipped", stats.broadcast.skipped},
        {"units_dropped", stats.broadcast.dropped},
        {"keyframe_requests", stats.broadcast.keyframeRequests},
        {"clients_opened", stats.sessions.opened},
        {"clients_refused", stats.sessions.refused},
        {"clients_removed", stats.sessions.removed},
        {"negotiation_timeouts", stats.sessions.negotiationTimeouts},
        {"stalled_evictions", stats.sessions.stalledEvictions},
        {"peer_keyframe_requests", stats.sessions.peerKeyframeRequests},
        {"detached_writers", stats.sessions.detachedWriters}
    });

    log(inst.get(), WEBSINK_LOG_INFO, "WebRTC plugin stopped. Stats: frames=%llu, delivered=%llu, clients=%llu",
        static_cast<unsigned long long>(inst->frames_in),
        static_cast<unsigned long long>(stats.broadcast.delivered),
        static_cast<unsigned long long>(stats.sessions.opened));

    inst.reset();
    websink::setLogSink({});
}

void handle_on_frame(websink_plugin_t* plugin, const void* buf, size_t size) {
    if (!plugin || !plugin->instance || !buf || size < sizeof(websink_frame_hdr_t)) {
        return;
    }

    auto inst = static_cast<WebRTCInstance*>(plugin->instance);
    const auto* hdr = static_cast<const websink_frame_hdr_t*>(buf);
    const auto* payload = static_cast<const uint8_t*>(buf) + sizeof(websink_frame_hdr_t);

    if (hdr->bytes == 0 || hdr->bytes > size - sizeof(websink_frame_hdr_t)) {
        return;
    }

    // Stream metadata travels as JSON on the same path; the engine keeps its own parameter sets
    if (payload[0] == '{') {
        return;
    }

    // Filter streams if configured
    const auto& filter = inst->cfg.stream_filter;
    if (!filter.empty() && std::find(filter.begin(), filter.end(), hdr->stream_id) == filter.end()) {
        ++inst->frames_filtered;
        return;
    }

    ++inst->frames_in;
    try {
        inst->sink->ingest(payload, hdr->bytes, hdr->pts_usec, (hdr->flags & WEBSINK_FRAME_FLAG_KEY) != 0);
    } catch (const std::exception& e) {
        log(inst, WEBSINK_LOG_ERROR, "Frame ingest failed: %s", e.what());
    }
}

} // namespace

// Export plugin interface
extern "C" {
    __attribute__((visibility("default"))) void websink_plugin_init(websink_plugin_t* plugin) {
        plugin->version = 1;
        plugin->type = WEBSINK_PLUGIN_OUTPUT;
        plugin->start = handle_plugin_start;
        plugin->stop = handle_plugin_stop;
        plugin->on_frame = handle_on_frame;
        plugin->instance = nullptr;
    }
}
