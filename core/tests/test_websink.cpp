#include <gtest/gtest.h>
#include "websink/WebSink.hpp"
#include "fakes.hpp"

using namespace websink;
using namespace websink::test;

namespace {

WebSinkConfig quietConfig() {
    WebSinkConfig cfg;
    cfg.keyframe_request_interval_ms = 0;
    return cfg;
}

std::string negotiate(WebSink& sink, FakeTransportFactory& transports,
                      const std::shared_ptr<RecordingChannel>& channel) {
    const std::string id = sink.sessions().openSession(channel);
    if (id.empty()) return id;
    sink.sessions().handleMessage(channel, R"({"type":"answer","sessionId":")" + id + R"(","sdp":"v=0"})");
    transports.control(id)->raise(TransportState::Connected);
    return id;
}

} // namespace

TEST(WebSinkTest, IngestReachesConnectedClients) {
    FakeTransportFactory transports;
    WebSink sink(quietConfig(), transports.factory());
    sink.start(false);
    ASSERT_TRUE(sink.running());

    std::atomic<int> requests{0};
    sink.setKeyframeRequester([&] { ++requests; });

    auto a = std::make_shared<RecordingChannel>();
    auto b = std::make_shared<RecordingChannel>();
    const std::string idA = negotiate(sink, transports, a);
    const std::string idB = negotiate(sink, transports, b);
    ASSERT_FALSE(idA.empty());
    ASSERT_FALSE(idB.empty());
    EXPECT_EQ(sink.clientCount(), 2u);
    EXPECT_GE(requests.load(), 1);

    // a delta before any keyframe is skipped for both clients
    auto delta = annexB({nalOf(0x41, 64)});
    EXPECT_TRUE(sink.ingest(delta.data(), delta.size(), 0, false));

    auto key = annexB({nalOf(0x09, 2), nalOf(0x67, 10), nalOf(0x68, 4), nalOf(0x65, 64)});
    EXPECT_TRUE(sink.ingest(key.data(), key.size(), 33333, false));
    EXPECT_TRUE(sink.ingest(delta.data(), delta.size(), 66666, false));

    ASSERT_TRUE(transports.control(idA)->waitForFrames(2));
    ASSERT_TRUE(transports.control(idB)->waitForFrames(2));
    EXPECT_TRUE(transports.control(idA)->sentFrames().front()->isKeyframe());

    const WebSinkStats s = sink.stats();
    EXPECT_EQ(s.clients, 2u);
    EXPECT_EQ(s.adapter.ingested, 3u);
    EXPECT_EQ(s.adapter.keyframes, 1u);
    EXPECT_EQ(s.broadcast.units, 3u);
    EXPECT_EQ(s.broadcast.skipped, 2u);
    EXPECT_EQ(s.sessions.opened, 2u);

    sink.stop();
    EXPECT_FALSE(sink.running());
    EXPECT_EQ(sink.clientCount(), 0u);
    EXPECT_TRUE(a->closed());
    EXPECT_TRUE(b->closed());
}

TEST(WebSinkTest, RejectsEmptyPayload) {
    FakeTransportFactory transports;
    WebSink sink(quietConfig(), transports.factory());
    sink.start(false);
    const uint8_t nothing[1] = {0};
    EXPECT_FALSE(sink.ingest(nothing, 0, 0, true));
    EXPECT_EQ(sink.stats().adapter.rejected, 1u);
}

TEST(WebSinkTest, StopIsIdempotent) {
    FakeTransportFactory transports;
    WebSink sink(quietConfig(), transports.factory());
    sink.start(false);
    sink.start(false);
    sink.stop();
    sink.stop();
    EXPECT_FALSE(sink.running());

    auto late = std::make_shared<RecordingChannel>();
    EXPECT_TRUE(sink.sessions().openSession(late).empty());
}

TEST(WebSinkTest, ReportsConfiguredPortWhenNotListening) {
    WebSinkConfig cfg = quietConfig();
    cfg.ws_port = 9123;
    FakeTransportFactory transports;
    WebSink sink(cfg, transports.factory());
    sink.start(false);
    EXPECT_EQ(sink.signalingPort(), 9123);
}
