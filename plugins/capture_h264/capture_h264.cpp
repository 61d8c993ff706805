// H264 input plugin: reads an RTSP stream or a media file with FFmpeg and emits
// one Annex-B access unit per frame to the host.

#include "websink_plugin.h"

// Ensure C linkage for FFmpeg headers
#ifdef __cplusplus
extern "C" {
#endif
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavcodec/bsf.h>
#include <libavutil/dict.h>
#include <libavutil/time.h>
#ifdef __cplusplus
}
#endif

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <random>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;

namespace {

struct H264Context {
    // Configuration
    std::string url;
    std::string transport = "tcp";
    bool realtime = false;    // pace file inputs at their own frame rate
    bool loop = false;        // restart file inputs at end of stream
    uint32_t stream_id = 0;

    // FFmpeg contexts
    AVFormatContext* fmt_ctx = nullptr;
    AVBSFContext* bsf = nullptr;
    AVPacket* packet = nullptr;
    int video_index = -1;

    // Threading
    std::thread worker;
    std::atomic<bool> running{false};

    // Host API reference
    websink_host_api_t* host_api = nullptr;
    void* host_ctx = nullptr;

    // Reconnection management
    int reconnect_delay_ms = 1000;  // Start with 1 second
    const int max_reconnect_delay_ms = 5000;  // Max 5 seconds

    // Timestamp continuity across loops and reconnects
    int64_t pts_offset_usec = 0;
    int64_t last_pts_usec = -1;
    int64_t pace_origin_usec = 0;   // wallclock at the first paced frame
    int64_t pace_first_pts = -1;

    // Statistics
    uint64_t frame_count = 0;
    uint64_t keyframe_count = 0;

    ~H264Context() {
        cleanup_resources();
    }

    void cleanup_resources() {
        if (packet) {
            av_packet_free(&packet);
        }
        if (bsf) {
            av_bsf_free(&bsf);
        }
        if (fmt_ctx) {
            avformat_close_input(&fmt_ctx);
        }
        video_index = -1;
        pace_first_pts = -1;
    }

    void log(websink_log_level_t level, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
    {
        if (!host_api || !host_api->log) return;
        char buf[512];
        va_list ap;
        va_start(ap, fmt);
        vsnprintf(buf, sizeof(buf), fmt, ap);
        va_end(ap);
        host_api->log(host_ctx, level, buf);
    }

    void publish_event(const json& event) {
        if (host_api && host_api->publish_evt) {
            host_api->publish_evt(host_ctx, event.dump().c_str());
        }
    }

    // Frame publishing wrapper: header and payload in one buffer
    void publish_frame(const websink_frame_hdr_t& hdr, const uint8_t* data, size_t size) {
        if (!host_api || !host_api->on_frame) return;
        std::vector<uint8_t> buf(sizeof(websink_frame_hdr_t) + size);
        std::memcpy(buf.data(), &hdr, sizeof(websink_frame_hdr_t));
        if (size > 0) {
            std::memcpy(buf.data() + sizeof(websink_frame_hdr_t), data, size);
        }
        host_api->on_frame(host_ctx, buf.data(), buf.size());
    }
};

std::string av_error_string(int err) {
    char err_buf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(err, err_buf, sizeof(err_buf));
    return err_buf;
}

bool is_network_url(const std::string& url) {
    return url.rfind("rtsp://", 0) == 0 || url.rfind("rtsps://", 0) == 0;
}

bool parse_config(H264Context* ctx, const char* json_cfg) {
    if (!json_cfg || !json_cfg[0]) {
        ctx->log(WEBSINK_LOG_ERROR, "Empty configuration");
        return false;
    }
    try {
        const auto j = json::parse(json_cfg);
        if (!j.is_object()) {
            ctx->log(WEBSINK_LOG_ERROR, "Configuration must be a JSON object");
            return false;
        }
        ctx->url = j.value("url", std::string());
        ctx->transport = j.value("transport", ctx->transport);
        ctx->realtime = j.value("realtime", !is_network_url(ctx->url));
        ctx->loop = j.value("loop", false);
        ctx->stream_id = j.value("stream_id", 0u);
    } catch (const json::exception& e) {
        ctx->log(WEBSINK_LOG_ERROR, "Invalid configuration: %s", e.what());
        return false;
    }
    if (ctx->url.empty()) {
        ctx->log(WEBSINK_LOG_ERROR, "No URL specified in configuration");
        return false;
    }
    if (ctx->transport != "tcp" && ctx->transport != "udp") {
        ctx->log(WEBSINK_LOG_ERROR, "Unsupported RTSP transport '%s'", ctx->transport.c_str());
        return false;
    }
    return true;
}

// Interrupt callback so a blocking open or read returns once the plugin stops
int interrupt_cb(void* opaque) {
    auto* ctx = static_cast<H264Context*>(opaque);
    return ctx->running ? 0 : 1;
}

bool connect_to_stream(H264Context* ctx) {
    ctx->cleanup_resources();

    ctx->packet = av_packet_alloc();
    ctx->fmt_ctx = avformat_alloc_context();
    if (!ctx->packet || !ctx->fmt_ctx) {
        ctx->log(WEBSINK_LOG_ERROR, "Failed to allocate FFmpeg contexts");
        return false;
    }
    ctx->fmt_ctx->interrupt_callback.callback = interrupt_cb;
    ctx->fmt_ctx->interrupt_callback.opaque = ctx;

    AVDictionary* options = nullptr;
    if (is_network_url(ctx->url)) {
        av_dict_set(&options, "rtsp_transport", ctx->transport.c_str(), 0);
        av_dict_set(&options, "max_delay", "500000", 0);        // 500ms max delay
        av_dict_set(&options, "fflags", "nobuffer", 0);
        av_dict_set(&options, "timeout", "5000000", 0);         // socket timeout, usec
    }

    int ret = avformat_open_input(&ctx->fmt_ctx, ctx->url.c_str(), nullptr, &options);
    av_dict_free(&options);
    if (ret < 0) {
        ctx->log(WEBSINK_LOG_ERROR, "Failed to open input %s: %s", ctx->url.c_str(), av_error_string(ret).c_str());
        return false;
    }

    ret = avformat_find_stream_info(ctx->fmt_ctx, nullptr);
    if (ret < 0) {
        ctx->log(WEBSINK_LOG_ERROR, "Failed to find stream info: %s", av_error_string(ret).c_str());
        return false;
    }

    ret = av_find_best_stream(ctx->fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (ret < 0) {
        ctx->log(WEBSINK_LOG_ERROR, "No video stream in %s", ctx->url.c_str());
        return false;
    }
    ctx->video_index = ret;
    AVStream* stream = ctx->fmt_ctx->streams[ctx->video_index];
    if (stream->codecpar->codec_id != AV_CODEC_ID_H264) {
        ctx->log(WEBSINK_LOG_ERROR, "Video stream is not H264 (codec_id=%d)", stream->codecpar->codec_id);
        return false;
    }

    // Containers carry AVCC; the sink expects Annex-B with parameter sets on keyframes
    const AVBitStreamFilter* filter = av_bsf_get_by_name("h264_mp4toannexb");
    if (!filter || av_bsf_alloc(filter, &ctx->bsf) < 0) {
        ctx->log(WEBSINK_LOG_ERROR, "h264_mp4toannexb bitstream filter unavailable");
        return false;
    }
    avcodec_parameters_copy(ctx->bsf->par_in, stream->codecpar);
    ctx->bsf->time_base_in = stream->time_base;
    ret = av_bsf_init(ctx->bsf);
    if (ret < 0) {
        ctx->log(WEBSINK_LOG_ERROR, "Failed to init bitstream filter: %s", av_error_string(ret).c_str());
        return false;
    }

    ctx->log(WEBSINK_LOG_INFO, "H264 input connected: %s (%dx%d)", ctx->url.c_str(),
             stream->codecpar->width, stream->codecpar->height);
    ctx->publish_event(json{
        {"event", "StreamConnected"},
        {"url", ctx->url},
        {"stream_id", ctx->stream_id},
        {"width", stream->codecpar->width},
        {"height", stream->codecpar->height}
    });

    ctx->reconnect_delay_ms = 1000;  // Reset to initial delay
    return true;
}

int64_t packet_pts_usec(H264Context* ctx, const AVPacket* pkt) {
    const AVRational tb = ctx->fmt_ctx->streams[ctx->video_index]->time_base;
    int64_t ts = pkt->pts != AV_NOPTS_VALUE ? pkt->pts : pkt->dts;
    if (ts == AV_NOPTS_VALUE) {
        return -1;
    }
    return av_rescale_q(ts, tb, AVRational{1, 1000000});
}

void emit_packet(H264Context* ctx, const AVPacket* pkt) {
    int64_t pts = packet_pts_usec(ctx, pkt);
    if (pts < 0) {
        pts = av_gettime_relative();
    }

    if (ctx->realtime) {
        if (ctx->pace_first_pts < 0) {
            ctx->pace_first_pts = pts;
            ctx->pace_origin_usec = av_gettime_relative();
        }
        const int64_t due = ctx->pace_origin_usec + (pts - ctx->pace_first_pts);
        const int64_t wait = due - av_gettime_relative();
        if (wait > 0 && wait < 1000000) {
            av_usleep(static_cast<unsigned>(wait));
        }
    }

    int64_t out_pts = pts + ctx->pts_offset_usec;
    if (out_pts <= ctx->last_pts_usec) {
        out_pts = ctx->last_pts_usec + 1;
    }
    ctx->last_pts_usec = out_pts;

    websink_frame_hdr_t hdr{};
    hdr.stream_id = ctx->stream_id;
    hdr.bytes = static_cast<uint32_t>(pkt->size);
    hdr.flags = (pkt->flags & AV_PKT_FLAG_KEY) ? WEBSINK_FRAME_FLAG_KEY : 0;
    hdr.pts_usec = static_cast<uint64_t>(out_pts);

    ctx->frame_count++;
    if (hdr.flags & WEBSINK_FRAME_FLAG_KEY) {
        ctx->keyframe_count++;
    }
    ctx->publish_frame(hdr, pkt->data, static_cast<size_t>(pkt->size));

    if (ctx->frame_count % 300 == 0) {
        ctx->log(WEBSINK_LOG_DEBUG, "Captured %llu frames", static_cast<unsigned long long>(ctx->frame_count));
    }
}

// Push one demuxed packet through the bitstream filter and emit what comes out
void handle_packet(H264Context* ctx, AVPacket* pkt) {
    if (pkt->stream_index != ctx->video_index) {
        return;
    }
    int ret = av_bsf_send_packet(ctx->bsf, pkt);
    if (ret < 0) {
        ctx->log(WEBSINK_LOG_WARN, "Bitstream filter rejected packet: %s", av_error_string(ret).c_str());
        return;
    }
    while ((ret = av_bsf_receive_packet(ctx->bsf, pkt)) == 0) {
        emit_packet(ctx, pkt);
        av_packet_unref(pkt);
    }
    if (ret != AVERROR(EAGAIN) && ret != AVERROR_EOF) {
        ctx->log(WEBSINK_LOG_WARN, "Bitstream filter error: %s", av_error_string(ret).c_str());
    }
}

// Returns false when the input should be reopened
bool rewind_input(H264Context* ctx) {
    if (av_seek_frame(ctx->fmt_ctx, -1, 0, AVSEEK_FLAG_BACKWARD) < 0) {
        return false;
    }
    av_bsf_flush(ctx->bsf);
    ctx->pts_offset_usec = ctx->last_pts_usec + 1;
    ctx->pace_first_pts = -1;
    ctx->log(WEBSINK_LOG_INFO, "Looping %s", ctx->url.c_str());
    return true;
}

void sleep_interruptible(H264Context* ctx, int ms) {
    const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (ctx->running && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void capture_thread(H264Context* ctx) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> jitter(-200, 200);

    while (ctx->running) {
        if (!ctx->fmt_ctx) {
            if (!connect_to_stream(ctx)) {
                ctx->cleanup_resources();
                ctx->log(WEBSINK_LOG_WARN, "Connection failed, will retry in %d ms", ctx->reconnect_delay_ms);
                sleep_interruptible(ctx, ctx->reconnect_delay_ms);
                // Exponential backoff with jitter
                ctx->reconnect_delay_ms = std::clamp(ctx->reconnect_delay_ms * 2 + jitter(gen),
                                                     1000, ctx->max_reconnect_delay_ms);
                continue;
            }
            // Timestamps keep increasing across reconnects
            ctx->pts_offset_usec = ctx->last_pts_usec + 1;
        }

        int ret = av_read_frame(ctx->fmt_ctx, ctx->packet);
        if (ret < 0) {
            if (!ctx->running) break;
            if (ret == AVERROR_EOF) {
                if (ctx->loop && rewind_input(ctx)) {
                    continue;
                }
                ctx->log(WEBSINK_LOG_INFO, "End of stream reached");
                ctx->publish_event(json{{"event", "StreamEnded"}, {"url", ctx->url}});
                if (!ctx->loop && !is_network_url(ctx->url)) {
                    break;
                }
            } else if (ret == AVERROR(EAGAIN)) {
                continue;
            } else {
                ctx->log(WEBSINK_LOG_WARN, "Error reading frame: %s", av_error_string(ret).c_str());
            }
            ctx->publish_event(json{{"event", "StreamReconnecting"}, {"url", ctx->url}});
            ctx->cleanup_resources();
            sleep_interruptible(ctx, 100);
            continue;
        }

        handle_packet(ctx, ctx->packet);
        av_packet_unref(ctx->packet);
    }

    ctx->cleanup_resources();
}

int h264_start(websink_plugin_t* plugin, websink_host_api_t* host_api, void* host_ctx, const char* json_cfg) {
    if (!plugin || !host_api) {
        return -1;
    }

    auto* ctx = new H264Context();
    ctx->host_api = host_api;
    ctx->host_ctx = host_ctx;

    if (!parse_config(ctx, json_cfg)) {
        delete ctx;
        return -1;
    }

    ctx->log(WEBSINK_LOG_INFO, "Starting H264 input with URL: %s (realtime=%d, loop=%d)",
             ctx->url.c_str(), ctx->realtime ? 1 : 0, ctx->loop ? 1 : 0);

    ctx->running = true;
    ctx->worker = std::thread(capture_thread, ctx);
    plugin->instance = ctx;
    return 0;
}

void h264_stop(websink_plugin_t* plugin) {
    if (!plugin || !plugin->instance) {
        return;
    }

    auto* ctx = static_cast<H264Context*>(plugin->instance);
    ctx->log(WEBSINK_LOG_INFO, "Stopping H264 input (frames=%llu, keyframes=%llu)",
             static_cast<unsigned long long>(ctx->frame_count),
             static_cast<unsigned long long>(ctx->keyframe_count));
    ctx->running = false;
    if (ctx->worker.joinable()) {
        ctx->worker.join();
    }
    delete ctx;
    plugin->instance = nullptr;
}

} // namespace

extern "C" __attribute__((visibility("default"))) void websink_plugin_init(websink_plugin_t* plugin) {
    if (!plugin) {
        return;
    }
    plugin->version = 1;
    plugin->type = WEBSINK_PLUGIN_INPUT;
    plugin->instance = nullptr;
    plugin->start = h264_start;
    plugin->stop = h264_stop;
    plugin->on_frame = nullptr;  // Input plugins don't need this
}
