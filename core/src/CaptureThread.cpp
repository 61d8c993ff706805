#include "websink/CaptureThread.hpp"
#include "websink/EventBus.hpp"
#include "websink/Log.hpp"
#include "websink/PluginManager.hpp"
#include <chrono>
#include <thread>

namespace websink {

void CaptureThread::hostLog(void* /*host_ctx*/, websink_log_level_t level, const char* msg) {
    logf(level, "[input] %s", msg ? msg : "(null)");
}

void CaptureThread::hostPublishEvent(void* /*host_ctx*/, const char* json_event) {
    if (!json_event) return;
    EventBus::instance().publish(PluginManager::kPluginEventChannel, json_event);
}

// Input plugin frame callback: header and payload go into the ring as one slot
void CaptureThread::hostOnFrame(void* host_ctx, const void* frame_buf, size_t frame_size) {
    if (!host_ctx || !frame_buf || frame_size < sizeof(websink_frame_hdr_t)) return;
    auto* self = static_cast<CaptureThread*>(host_ctx);
    const auto* hdr = static_cast<const websink_frame_hdr_t*>(frame_buf);
    if (hdr->bytes > frame_size - sizeof(websink_frame_hdr_t)) return;

    const size_t size = sizeof(websink_frame_hdr_t) + hdr->bytes;
    if (size > self->ring_.slotSize()) {
        const uint64_t oversized = ++self->oversized_;
        if (oversized == 1 || oversized % 100 == 0) {
            logf(WEBSINK_LOG_WARN, "Frame of %zu bytes exceeds the %zu byte ring slot, dropped %llu such frames",
                 size, self->ring_.slotSize(), static_cast<unsigned long long>(oversized));
        }
        return;
    }
    if (!self->ring_.push(frame_buf, size)) {
        const uint64_t dropped = ++self->dropped_;
        if (dropped == 1 || dropped % 100 == 0) {
            logf(WEBSINK_LOG_WARN, "Frame ring full, dropped %llu frames so far",
                 static_cast<unsigned long long>(dropped));
        }
    }
}

CaptureThread::CaptureThread(websink_plugin_t* inputPlugin,
                             ShmRing& ring,
                             const std::vector<websink_plugin_t*>& outputs,
                             const std::string& inputConfig)
    : inputPlugin_(inputPlugin)
    , ring_(ring)
    , outputs_(outputs)
    , inputConfig_(inputConfig) {
    hostApi_.log = &CaptureThread::hostLog;
    hostApi_.publish_evt = &CaptureThread::hostPublishEvent;
    hostApi_.on_frame = &CaptureThread::hostOnFrame;
}

CaptureThread::~CaptureThread() {
    stop();
}

bool CaptureThread::start() {
    if (running_.exchange(true))
        return true;
    thread_ = std::thread(&CaptureThread::run, this);

    if (inputPlugin_ && inputPlugin_->start) {
        if (inputPlugin_->start(inputPlugin_, &hostApi_, this, inputConfig_.c_str()) != 0) {
            logf(WEBSINK_LOG_ERROR, "Input plugin failed to start");
            running_ = false;
            if (thread_.joinable())
                thread_.join();
            return false;
        }
        inputStarted_ = true;
    }
    return true;
}

void CaptureThread::stop() {
    // Input first so nothing pushes into a ring nobody drains
    if (inputStarted_ && inputPlugin_->stop) {
        inputPlugin_->stop(inputPlugin_);
    }
    inputStarted_ = false;

    if (!running_.exchange(false))
        return;
    if (thread_.joinable())
        thread_.join();
    logf(WEBSINK_LOG_INFO, "Capture stopped: forwarded=%llu dropped=%llu oversized=%llu",
         static_cast<unsigned long long>(forwarded_.load()), static_cast<unsigned long long>(dropped_.load()),
         static_cast<unsigned long long>(oversized_.load()));
}

void CaptureThread::run() {
    std::vector<char> buffer(ring_.slotSize());
    size_t size = 0;

    while (running_) {
        if (!ring_.tryPop(buffer.data(), buffer.size(), size)) {
            // Sleep a bit if no frames to avoid busy loop
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            continue;
        }
        if (size < sizeof(websink_frame_hdr_t)) {
            logf(WEBSINK_LOG_WARN, "CaptureThread: received invalid frame size %zu", size);
            continue;
        }
        for (auto out : outputs_) {
            if (out && out->on_frame) {
                out->on_frame(out, buffer.data(), size);
            }
        }
        ++forwarded_;
    }
}

} // namespace websink
