#include <gtest/gtest.h>
#include "websink/EventBus.hpp"
#include "websink/SessionManager.hpp"
#include "fakes.hpp"

using namespace websink;
using namespace websink::test;
using namespace std::chrono_literals;

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        token = EventBus::instance().subscribe(SessionManager::kEventChannel, [this](const std::string& evt) {
            std::lock_guard<std::mutex> lock(eventsMutex);
            events.push_back(nlohmann::json::parse(evt));
        });
    }

    void TearDown() override {
        if (manager) manager->stop();
        EventBus::instance().unsubscribe(token);
    }

    SessionManager& makeManager() {
        manager = std::make_unique<SessionManager>(cfg, registry, engine, transports.factory());
        return *manager;
    }

    std::string connect(const std::shared_ptr<RecordingChannel>& channel) {
        const std::string id = manager->openSession(channel);
        if (id.empty()) return id;
        auto control = transports.control(id);
        manager->handleMessage(channel, R"({"type":"answer","sessionId":")" + id + R"(","sdp":"v=0 answer"})");
        control->raise(TransportState::Checking);
        control->raise(TransportState::Connected);
        return id;
    }

    size_t stateChangesFor(const std::string& id) {
        std::lock_guard<std::mutex> lock(eventsMutex);
        size_t n = 0;
        for (const auto& e : events) {
            if (e["event"] == "SessionStateChanged" && e["session_id"] == id) ++n;
        }
        return n;
    }

    std::vector<uint64_t> stateSeqsFor(const std::string& id) {
        std::lock_guard<std::mutex> lock(eventsMutex);
        std::vector<uint64_t> out;
        for (const auto& e : events) {
            if (e["event"] == "SessionStateChanged" && e["session_id"] == id) out.push_back(e["seq"].get<uint64_t>());
        }
        return out;
    }

    size_t eventCount() {
        std::lock_guard<std::mutex> lock(eventsMutex);
        return events.size();
    }

    WebSinkConfig cfg;
    ClientRegistry registry;
    BroadcastEngine engine{registry, 0ms};
    FakeTransportFactory transports;
    std::unique_ptr<SessionManager> manager;

    EventBus::Token token = 0;
    std::mutex eventsMutex;
    std::vector<nlohmann::json> events;
};

TEST_F(SessionManagerTest, OpenSessionSendsOffer) {
    makeManager();
    auto channel = std::make_shared<RecordingChannel>();
    const std::string id = manager->openSession(channel);
    ASSERT_FALSE(id.empty());
    EXPECT_EQ(manager->sessionCount(), 1u);

    auto offers = channel->messagesOfType("offer");
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_EQ(offers[0]["sessionId"], id);
    EXPECT_FALSE(offers[0]["sdp"].get<std::string>().empty());
    EXPECT_EQ(registry.find(id)->state(), SessionState::OfferSent);
    EXPECT_EQ(manager->stats().opened, 1u);
}

TEST_F(SessionManagerTest, NegotiatesAndStreams) {
    makeManager();
    auto channel = std::make_shared<RecordingChannel>();
    const std::string id = manager->openSession(channel);
    ASSERT_FALSE(id.empty());
    auto control = transports.control(id);

    manager->handleMessage(channel, R"({"type":"answer","sessionId":")" + id + R"(","sdp":"v=0 answer"})");
    manager->handleMessage(channel, R"({"type":"ice-candidate","sessionId":")" + id +
                                        R"(","candidate":"candidate:1 1 udp 1 10.0.0.1 5000 typ host","sdpMid":"0"})");
    manager->handleMessage(channel, R"({"type":"ice-candidate","sessionId":")" + id +
                                        R"(","candidate":{"candidate":"candidate:2 1 udp 1 10.0.0.2 5000 typ host","sdpMid":"0"}})");
    EXPECT_EQ(control->answer, "v=0 answer");
    EXPECT_EQ(control->remoteCandidates.size(), 2u);

    control->emitCandidate("candidate:server");
    EXPECT_EQ(channel->messagesOfType("ice-candidate").size(), 1u);

    control->raise(TransportState::Checking);
    control->raise(TransportState::Connected);
    auto session = registry.find(id);
    ASSERT_EQ(session->state(), SessionState::Connected);
    EXPECT_EQ(stateChangesFor(id), 4u);
    EXPECT_EQ(stateSeqsFor(id), (std::vector<uint64_t>{1, 2, 3, 4}));

    engine.broadcast(makeUnit(true, 0));
    for (int i = 1; i <= 4; ++i) engine.broadcast(makeUnit(false, i * 33333));
    ASSERT_TRUE(eventually([&] { return session->stats().framesSent == 5; }));
    EXPECT_EQ(control->frameCount(), 5u);
    EXPECT_TRUE(channel->messagesOfType("error").empty());
}

TEST_F(SessionManagerTest, AnswerForUnknownSessionIsDiscarded) {
    makeManager();
    auto channel = std::make_shared<RecordingChannel>();
    const std::string id = manager->openSession(channel);
    const size_t sentBefore = channel->messages().size();
    const size_t eventsBefore = eventCount();

    manager->handleMessage(channel, R"({"type":"answer","sessionId":"no-such-session","sdp":"v=0"})");

    EXPECT_EQ(channel->messages().size(), sentBefore);
    EXPECT_EQ(eventCount(), eventsBefore);
    EXPECT_EQ(registry.find(id)->state(), SessionState::OfferSent);
    EXPECT_FALSE(channel->closed());
}

TEST_F(SessionManagerTest, AnswerFromAnotherChannelIsDiscarded) {
    makeManager();
    auto owner = std::make_shared<RecordingChannel>();
    auto intruder = std::make_shared<RecordingChannel>();
    const std::string id = manager->openSession(owner);
    manager->openSession(intruder);

    manager->handleMessage(intruder, R"({"type":"answer","sessionId":")" + id + R"(","sdp":"v=0"})");
    EXPECT_EQ(registry.find(id)->state(), SessionState::OfferSent);
    EXPECT_TRUE(transports.control(id)->answer.empty());
}

TEST_F(SessionManagerTest, ProtocolErrorsAreReportedToTheClient) {
    makeManager();
    auto channel = std::make_shared<RecordingChannel>();
    const std::string id = manager->openSession(channel);

    manager->handleMessage(channel, "{broken");
    manager->handleMessage(channel, R"({"type":"offer","sdp":"v=0"})");
    manager->handleMessage(channel, R"({"type":"answer","sessionId":")" + id + R"(","sdp":"v=0"})");
    // second answer in AnswerReceived
    manager->handleMessage(channel, R"({"type":"answer","sessionId":")" + id + R"(","sdp":"v=0"})");

    auto errors = channel->messagesOfType("error");
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[2]["sessionId"], id);
    EXPECT_EQ(manager->stats().protocolErrors, 3u);
    // protocol errors do not end the session
    EXPECT_EQ(registry.find(id)->state(), SessionState::AnswerReceived);
}

TEST_F(SessionManagerTest, RejectedAnswerFailsAndClosesChannel) {
    makeManager();
    auto channel = std::make_shared<RecordingChannel>();
    const std::string id = manager->openSession(channel);
    transports.control(id)->rejectAnswer = true;

    manager->handleMessage(channel, R"({"type":"answer","sessionId":")" + id + R"(","sdp":"garbage"})");
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(channel->closed());
    EXPECT_FALSE(channel->messagesOfType("error").empty());
}

TEST_F(SessionManagerTest, RefusesClientsBeyondCapacity) {
    cfg.max_clients = 1;
    makeManager();
    auto first = std::make_shared<RecordingChannel>();
    auto second = std::make_shared<RecordingChannel>();

    EXPECT_FALSE(manager->openSession(first).empty());
    EXPECT_TRUE(manager->openSession(second).empty());
    auto errors = second->messagesOfType("error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["message"], "server full");
    EXPECT_TRUE(second->closed());
    EXPECT_EQ(manager->stats().refused, 1u);
    EXPECT_EQ(manager->sessionCount(), 1u);
}

TEST_F(SessionManagerTest, TransportCreationFailureRefusesClient) {
    makeManager();
    transports.failCreate = true;
    auto channel = std::make_shared<RecordingChannel>();
    EXPECT_TRUE(manager->openSession(channel).empty());
    EXPECT_TRUE(channel->closed());
    EXPECT_EQ(manager->sessionCount(), 0u);
}

TEST_F(SessionManagerTest, SweepFailsSlowNegotiation) {
    cfg.negotiation_timeout_ms = 1;
    makeManager();
    auto channel = std::make_shared<RecordingChannel>();
    const std::string id = manager->openSession(channel);
    std::this_thread::sleep_for(5ms);

    manager->sweep();
    EXPECT_EQ(manager->sessionCount(), 0u);
    EXPECT_TRUE(channel->closed());
    ASSERT_FALSE(channel->messagesOfType("error").empty());
    EXPECT_EQ(manager->stats().negotiationTimeouts, 1u);

    manager->reapTerminated();
    EXPECT_EQ(manager->stats().removed, 1u);
}

TEST_F(SessionManagerTest, HousekeepingRunsOnItsOwn) {
    cfg.negotiation_timeout_ms = 20;
    cfg.sweep_interval_ms = 5;
    makeManager().start();
    auto channel = std::make_shared<RecordingChannel>();
    ASSERT_FALSE(manager->openSession(channel).empty());

    ASSERT_TRUE(eventually([&] { return manager->stats().removed == 1; }));
    EXPECT_EQ(manager->sessionCount(), 0u);
}

TEST_F(SessionManagerTest, SweepEvictsStalledSession) {
    cfg.outbound_queue_frames = 1;
    cfg.max_consecutive_drops = 2;
    makeManager();
    auto channel = std::make_shared<RecordingChannel>();
    const std::string id = connect(channel);
    ASSERT_FALSE(id.empty());
    auto control = transports.control(id);
    control->setBlockSend(true);

    engine.broadcast(makeUnit(true, 0));
    ASSERT_TRUE(eventually([&] { return control->sends() >= 1; }));
    engine.broadcast(makeUnit(true, 1));
    // backlog of one keyframe discarded, the new keyframe takes its place
    engine.broadcast(makeUnit(true, 2));
    engine.broadcast(makeUnit(true, 3));
    ASSERT_GE(registry.find(id)->consecutiveDrops(), 2u);

    manager->sweep();
    EXPECT_EQ(manager->sessionCount(), 0u);
    EXPECT_EQ(manager->stats().stalledEvictions, 1u);
    EXPECT_TRUE(channel->closed());
}

TEST_F(SessionManagerTest, ChannelCloseEndsItsSession) {
    makeManager();
    auto a = std::make_shared<RecordingChannel>();
    auto b = std::make_shared<RecordingChannel>();
    const std::string idA = connect(a);
    const std::string idB = connect(b);

    manager->channelClosed(a);
    EXPECT_EQ(registry.find(idA), nullptr);
    ASSERT_NE(registry.find(idB), nullptr);
    EXPECT_EQ(registry.find(idB)->state(), SessionState::Connected);
}

TEST_F(SessionManagerTest, StopClosesEverythingAndRefusesNewClients) {
    makeManager().start();
    auto a = std::make_shared<RecordingChannel>();
    const std::string id = connect(a);
    auto session = registry.find(id);

    manager->stop();
    manager->stop();
    EXPECT_EQ(session->state(), SessionState::Closed);
    EXPECT_EQ(session->closeReason(), "shutdown");
    EXPECT_EQ(manager->sessionCount(), 0u);
    EXPECT_EQ(manager->stats().removed, 1u);

    auto late = std::make_shared<RecordingChannel>();
    EXPECT_TRUE(manager->openSession(late).empty());
    EXPECT_TRUE(late->closed());
}

TEST_F(SessionManagerTest, PublishesLifecycleEvents) {
    makeManager();
    auto channel = std::make_shared<RecordingChannel>();
    const std::string id = connect(channel);
    registry.find(id)->close("bye");
    manager->reapTerminated();

    std::lock_guard<std::mutex> lock(eventsMutex);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front()["event"], "SessionOpened");
    EXPECT_EQ(events.back()["event"], "SessionRemoved");
    EXPECT_EQ(events.back()["reason"], "bye");
    EXPECT_EQ(events.back()["state"], "closed");
}

TEST_F(SessionManagerTest, PeerKeyframeRequestReachesTheSource) {
    std::atomic<int> requests{0};
    engine.setKeyframeRequester([&] { ++requests; });
    makeManager();
    auto channel = std::make_shared<RecordingChannel>();
    const std::string id = connect(channel);
    ASSERT_FALSE(id.empty());
    const int afterConnect = requests.load();

    transports.control(id)->requestKeyframe();
    EXPECT_EQ(requests.load(), afterConnect + 1);
    EXPECT_EQ(manager->stats().peerKeyframeRequests, 1u);
}

TEST_F(SessionManagerTest, WriterIgnoringCloseDoesNotBlockReaping) {
    cfg.writer_join_timeout_ms = 50;
    makeManager();
    auto channel = std::make_shared<RecordingChannel>();
    const std::string id = connect(channel);
    auto control = transports.control(id);
    control->setBlockSend(true, true);

    engine.broadcast(makeUnit(true, 0));
    ASSERT_TRUE(eventually([&] { return control->sends() >= 1; }));
    registry.find(id)->close("bye");

    const auto begin = std::chrono::steady_clock::now();
    manager->reapTerminated();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 1s);
    EXPECT_EQ(manager->stats().removed, 1u);
    EXPECT_EQ(manager->stats().detachedWriters, 1u);

    control->setBlockSend(false);
}
