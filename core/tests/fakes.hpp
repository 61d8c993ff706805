// Test doubles for the peer transport and the signaling channel
#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "websink/H264.hpp"
#include "websink/ClientSession.hpp"
#include "websink/PeerTransport.hpp"
#include "websink/SessionManager.hpp"

namespace websink::test {

// Shared between a FakePeerTransport and the test; outlives the session
struct FakeTransportControl {
    std::mutex mutex;
    std::condition_variable cv;
    PeerTransportEvents events;

    std::string sessionId;
    RtpStreamState rtp;

    // Script
    bool autoOffer = true;
    bool failOffer = false;
    bool rejectAnswer = false;
    bool rejectCandidates = false;
    bool failSend = false;
    bool blockSend = false;
    bool ignoreClose = false;   // a blocked send stays blocked through close()

    // Observations
    std::string answer;
    std::vector<std::string> remoteCandidates;
    std::vector<std::shared_ptr<const AccessUnit>> frames;
    int closeCalls = 0;
    int sendCalls = 0;          // includes sends still blocked

    void raise(TransportState state) {
        PeerTransportEvents ev;
        {
            std::lock_guard<std::mutex> lock(mutex);
            ev = events;
        }
        if (ev.stateChanged) ev.stateChanged(state);
    }

    void emitCandidate(const std::string& candidate, const std::string& mid = "video") {
        PeerTransportEvents ev;
        {
            std::lock_guard<std::mutex> lock(mutex);
            ev = events;
        }
        if (ev.localCandidate) ev.localCandidate(candidate, mid);
    }

    // Browser PLI on the video track
    void requestKeyframe() {
        PeerTransportEvents ev;
        {
            std::lock_guard<std::mutex> lock(mutex);
            ev = events;
        }
        if (ev.keyframeRequested) ev.keyframeRequested();
    }

    void setBlockSend(bool block, bool throughClose = false) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            blockSend = block;
            ignoreClose = block && throughClose;
        }
        cv.notify_all();
    }

    void setFailSend(bool fail) {
        std::lock_guard<std::mutex> lock(mutex);
        failSend = fail;
    }

    size_t frameCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return frames.size();
    }

    std::vector<std::shared_ptr<const AccessUnit>> sentFrames() {
        std::lock_guard<std::mutex> lock(mutex);
        return frames;
    }

    int sends() {
        std::lock_guard<std::mutex> lock(mutex);
        return sendCalls;
    }

    void offer(const std::string& sdp = "v=0\r\ns=fake-offer\r\n") {
        PeerTransportEvents ev;
        {
            std::lock_guard<std::mutex> lock(mutex);
            ev = events;
        }
        if (ev.localDescription) ev.localDescription(sdp);
    }

    int closes() {
        std::lock_guard<std::mutex> lock(mutex);
        return closeCalls;
    }

    bool waitForFrames(size_t n, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&] { return frames.size() >= n; });
    }
};

class FakePeerTransport : public PeerTransport {
public:
    explicit FakePeerTransport(std::shared_ptr<FakeTransportControl> control)
        : control_(std::move(control)) {}

    void setEventHandler(PeerTransportEvents events) override {
        std::lock_guard<std::mutex> lock(control_->mutex);
        control_->events = std::move(events);
    }

    void createOffer() override {
        PeerTransportEvents ev;
        {
            std::lock_guard<std::mutex> lock(control_->mutex);
            if (control_->failOffer) throw std::runtime_error("offer failed");
            if (!control_->autoOffer) return;
            ev = control_->events;
        }
        if (ev.localDescription) ev.localDescription("v=0\r\ns=fake-offer\r\n");
    }

    void setRemoteAnswer(const std::string& sdp) override {
        std::lock_guard<std::mutex> lock(control_->mutex);
        if (control_->rejectAnswer) throw std::invalid_argument("bad sdp");
        control_->answer = sdp;
    }

    void addRemoteCandidate(const std::string& candidate, const std::string&) override {
        std::lock_guard<std::mutex> lock(control_->mutex);
        if (control_->rejectCandidates) throw std::invalid_argument("bad candidate");
        control_->remoteCandidates.push_back(candidate);
    }

    bool sendFrame(const AccessUnit& unit) override {
        std::unique_lock<std::mutex> lock(control_->mutex);
        ++control_->sendCalls;
        control_->cv.wait(lock, [&] {
            return !control_->blockSend || (control_->closeCalls > 0 && !control_->ignoreClose);
        });
        if (control_->failSend || control_->closeCalls > 0) return false;
        control_->frames.push_back(std::make_shared<const AccessUnit>(unit));
        control_->cv.notify_all();
        return true;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(control_->mutex);
            ++control_->closeCalls;
        }
        control_->cv.notify_all();
    }

private:
    std::shared_ptr<FakeTransportControl> control_;
};

// Hands out FakePeerTransports and remembers their controls by session id
class FakeTransportFactory {
public:
    PeerTransportFactory factory() {
        return [this](const std::string& sessionId, const RtpStreamState& rtp) -> std::unique_ptr<PeerTransport> {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failCreate) throw std::runtime_error("no ports");
            auto control = std::make_shared<FakeTransportControl>();
            control->sessionId = sessionId;
            control->rtp = rtp;
            control->autoOffer = autoOffer;
            controls_[sessionId] = control;
            return std::make_unique<FakePeerTransport>(control);
        };
    }

    std::shared_ptr<FakeTransportControl> control(const std::string& sessionId) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = controls_.find(sessionId);
        return it == controls_.end() ? nullptr : it->second;
    }

    bool failCreate = false;
    bool autoOffer = true;

private:
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<FakeTransportControl>> controls_;
};

// Records everything the server sends to one browser
class RecordingChannel : public SignalingChannel {
public:
    void send(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back(text);
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++closeCalls_;
    }

    std::vector<nlohmann::json> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<nlohmann::json> out;
        for (const auto& s : sent_) out.push_back(nlohmann::json::parse(s));
        return out;
    }

    std::vector<nlohmann::json> messagesOfType(const std::string& type) const {
        std::vector<nlohmann::json> out;
        for (auto& m : messages()) {
            if (m.value("type", "") == type) out.push_back(m);
        }
        return out;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closeCalls_ > 0;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> sent_;
    int closeCalls_ = 0;
};

// Minimal Annex-B access units
inline std::vector<uint8_t> annexB(std::initializer_list<std::vector<uint8_t>> nalus) {
    std::vector<uint8_t> out;
    for (const auto& n : nalus) {
        out.insert(out.end(), {0, 0, 0, 1});
        out.insert(out.end(), n.begin(), n.end());
    }
    return out;
}

inline std::vector<uint8_t> nalOf(uint8_t header, size_t size, uint8_t fill = 0xAB) {
    std::vector<uint8_t> n(size, fill);
    if (!n.empty()) n[0] = header;
    return n;
}

inline std::shared_ptr<const AccessUnit> makeUnit(bool keyframe, uint64_t usec, size_t sliceSize = 64) {
    std::vector<uint8_t> payload = keyframe
        ? annexB({nalOf(0x67, 10), nalOf(0x68, 4), nalOf(0x65, sliceSize)})
        : annexB({nalOf(0x41, sliceSize)});
    std::vector<NalUnitView> nalus;
    splitNalUnits(payload.data(), payload.size(), nalus);
    return AccessUnit::fromNalUnits(nalus, usec, keyframe);
}

// Polls until pred() holds or the timeout expires
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

// A session driven to Connected over a fake transport
struct ConnectedSession {
    std::shared_ptr<ClientSession> session;
    std::shared_ptr<FakeTransportControl> control;
};

inline ConnectedSession connectedSession(const std::string& id, SessionCallbacks callbacks = {},
                                         size_t queueCapacity = 8) {
    ConnectedSession out;
    out.control = std::make_shared<FakeTransportControl>();
    SessionOptions options;
    options.queueCapacity = queueCapacity;
    out.session = ClientSession::create(id, std::make_unique<FakePeerTransport>(out.control),
                                        options, std::move(callbacks));
    out.session->start();
    out.session->applyAnswer("v=0");
    out.control->raise(TransportState::Connected);
    return out;
}

} // namespace websink::test
