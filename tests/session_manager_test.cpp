#include "board.h"
#include "config_manager.h"
#include "errors.h"
#include "fake_transport.h"
#include "session_manager.h"
#include "test_helpers.h"
#include <atomic>
#include <gtest/gtest.h>

using namespace testing_support;
using namespace std::chrono_literals;

namespace {

class SessionManagerTest : public ::testing::Test {
protected:
    SessionManagerTest() : dir("lr-session")
    {
        writeJson(dir.path / "agent.json", agentConfig(dir));
        writeJson(dir.path / "home" / "settings.json", boardSettings("online", true, false));

        config = std::make_unique<ConfigManager>((dir.path / "agent.json").string());
        board = std::make_unique<Board>(*config);
        board->load();

        transport_state = std::make_shared<FakeTransport::State>();

        options.reconnect_delay = 150ms;
        options.alive_interval = 20ms;
        options.call_timeout = 300ms;
        options.dispatch_workers = 2;
    }

    void TearDown() override
    {
        if (session) {
            session->stop();
        }
    }

    SessionManager& makeSession()
    {
        session = std::make_unique<SessionManager>(
            *board, options, std::make_unique<FakeTransport>(transport_state));
        return *session;
    }

    TempDir dir;
    std::unique_ptr<ConfigManager> config;
    std::unique_ptr<Board> board;
    std::shared_ptr<FakeTransport::State> transport_state;
    SessionOptions options;
    std::unique_ptr<SessionManager> session;
};

} // namespace

TEST_F(SessionManagerTest, ConnectStoresSessionIdInBoard)
{
    SessionManager& manager = makeSession();
    manager.connect();

    EXPECT_TRUE(manager.isConnected());
    EXPECT_EQ(manager.state(), SessionState::Connected);
    EXPECT_EQ(manager.sessionId(), "1001");
    EXPECT_EQ(board->sessionId(), "1001");
    ASSERT_EQ(transport_state->endpoints.size(), 1u);
    EXPECT_EQ(transport_state->endpoints[0].url, "mqtts://ctrl.example.org:8883");
    EXPECT_TRUE(FakeTransport::isSubscribed(transport_state, "s4t/reply/1001"));
}

TEST_F(SessionManagerTest, ConnectAndDisconnectAreIdempotent)
{
    SessionManager& manager = makeSession();
    manager.connect();
    manager.connect();
    EXPECT_EQ(transport_state->open_count, 1);

    manager.disconnect();
    manager.disconnect();
    EXPECT_FALSE(manager.isConnected());
    EXPECT_EQ(manager.state(), SessionState::Disconnected);
    EXPECT_EQ(transport_state->close_count, 1);
}

TEST_F(SessionManagerTest, ConnectFailureLeavesSessionDisconnected)
{
    transport_state->fail_next_opens = 1;
    SessionManager& manager = makeSession();

    EXPECT_THROW(manager.connect(), TransportError);
    EXPECT_EQ(manager.state(), SessionState::Disconnected);

    manager.connect();
    EXPECT_TRUE(manager.isConnected());
}

TEST_F(SessionManagerTest, OperationsFailWhileDisconnected)
{
    SessionManager& manager = makeSession();
    auto handler = [](const nlohmann::json&) { return nlohmann::json(); };

    EXPECT_THROW(manager.registerProcedure("iotronic.x.y.Verb", handler), NotConnectedError);
    EXPECT_THROW(manager.unregisterProcedure("iotronic.x.y.Verb"), NotConnectedError);
    EXPECT_THROW(manager.call("iotronic.x.y.Verb", nlohmann::json::array()), NotConnectedError);
    EXPECT_THROW(manager.publish("board.events", nlohmann::json::array()), NotConnectedError);
    EXPECT_THROW(manager.subscribe("board.events", [](const nlohmann::json&) {}), NotConnectedError);
}

TEST_F(SessionManagerTest, CallRoundTripsThroughRegisteredProcedure)
{
    SessionManager& manager = makeSession();
    manager.connect();

    manager.registerProcedure("iotronic.test.echo", [](const nlohmann::json& args) {
        return nlohmann::json{{"echo", args.at(0)}};
    });

    nlohmann::json result = manager.call("iotronic.test.echo", nlohmann::json::array({"hello"}));
    EXPECT_EQ(result["echo"], "hello");
}

TEST_F(SessionManagerTest, CallReportsRemoteError)
{
    SessionManager& manager = makeSession();
    manager.connect();

    manager.registerProcedure("iotronic.test.fail", [](const nlohmann::json&) -> nlohmann::json {
        throw std::runtime_error("boom");
    });

    EXPECT_THROW(manager.call("iotronic.test.fail", nlohmann::json::array()), AgentError);
}

TEST_F(SessionManagerTest, CallTimesOutWithoutReply)
{
    SessionManager& manager = makeSession();
    manager.connect();

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(manager.call("iotronic.nobody.listens", nlohmann::json::array()), TimeoutError);
    EXPECT_GE(std::chrono::steady_clock::now() - start, options.call_timeout);
}

TEST_F(SessionManagerTest, InboundInvocationIsAnsweredOnReplyTopic)
{
    SessionManager& manager = makeSession();
    manager.connect();

    std::string procedure = manager.procedureName("DevicePing");
    manager.registerProcedure(procedure, [](const nlohmann::json&) {
        return nlohmann::json{{"result", "SUCCESS"}, {"message", "pong"}};
    });

    // The control plane listens on its own reply topic
    {
        std::lock_guard<std::mutex> lock(transport_state->mutex);
        transport_state->subscriptions.insert("s4t/reply/conductor");
    }

    nlohmann::json request = {{"id", 7}, {"reply_to", "s4t/reply/conductor"}, {"args", nlohmann::json::array()}};
    FakeTransport::inject(transport_state, "s4t/rpc/" + procedure, request.dump());

    ASSERT_TRUE(waitUntil([&]() {
        return !FakeTransport::publishedOn(transport_state, "s4t/reply/conductor").empty();
    }));

    auto replies = FakeTransport::publishedOn(transport_state, "s4t/reply/conductor");
    nlohmann::json reply = nlohmann::json::parse(replies[0].second);
    EXPECT_EQ(reply["id"], 7);
    EXPECT_EQ(reply["result"]["message"], "pong");
}

TEST_F(SessionManagerTest, UnknownProcedureIsAnsweredWithError)
{
    SessionManager& manager = makeSession();
    manager.connect();

    {
        std::lock_guard<std::mutex> lock(transport_state->mutex);
        transport_state->subscriptions.insert("s4t/rpc/iotronic.unknown");
        transport_state->subscriptions.insert("s4t/reply/conductor");
    }

    nlohmann::json request = {{"id", 1}, {"reply_to", "s4t/reply/conductor"}, {"args", nlohmann::json::array()}};
    FakeTransport::inject(transport_state, "s4t/rpc/iotronic.unknown", request.dump());

    ASSERT_TRUE(waitUntil([&]() {
        return !FakeTransport::publishedOn(transport_state, "s4t/reply/conductor").empty();
    }));
    nlohmann::json reply = nlohmann::json::parse(
        FakeTransport::publishedOn(transport_state, "s4t/reply/conductor")[0].second);
    EXPECT_TRUE(reply.contains("error"));
}

TEST_F(SessionManagerTest, MalformedReplyIdsAreDiscarded)
{
    SessionManager& manager = makeSession();
    manager.connect();
    std::string reply_topic = "s4t/reply/" + manager.sessionId();

    EXPECT_NO_THROW(FakeTransport::inject(transport_state, reply_topic, R"({"id":"abc","result":1})"));
    EXPECT_NO_THROW(FakeTransport::inject(transport_state, reply_topic, R"({"id":-4,"result":1})"));
    EXPECT_NO_THROW(FakeTransport::inject(transport_state, reply_topic, R"({"id":1.5,"result":1})"));
    EXPECT_NO_THROW(FakeTransport::inject(transport_state, reply_topic, "not json"));

    // Replies for real calls are still matched
    manager.registerProcedure("iotronic.test.echo", [](const nlohmann::json& args) { return args; });
    EXPECT_EQ(manager.call("iotronic.test.echo", nlohmann::json::array({1})), nlohmann::json::array({1}));
}

TEST_F(SessionManagerTest, InvocationWithNonStringReplyToIsNotAnswered)
{
    SessionManager& manager = makeSession();
    manager.connect();

    std::atomic<int> invocations(0);
    std::string procedure = manager.procedureName("DevicePing");
    manager.registerProcedure(procedure, [&invocations](const nlohmann::json&) {
        ++invocations;
        return rpc::success("pong");
    });
    {
        std::lock_guard<std::mutex> lock(transport_state->mutex);
        transport_state->subscriptions.insert("s4t/reply/conductor");
    }

    nlohmann::json malformed = {{"id", 1}, {"reply_to", 42}, {"args", nlohmann::json::array()}};
    FakeTransport::inject(transport_state, "s4t/rpc/" + procedure, malformed.dump());
    ASSERT_TRUE(waitUntil([&]() { return invocations == 1; }));

    nlohmann::json valid = {{"id", 2}, {"reply_to", "s4t/reply/conductor"}, {"args", nlohmann::json::array()}};
    FakeTransport::inject(transport_state, "s4t/rpc/" + procedure, valid.dump());
    ASSERT_TRUE(waitUntil([&]() {
        return !FakeTransport::publishedOn(transport_state, "s4t/reply/conductor").empty();
    }));

    auto replies = FakeTransport::publishedOn(transport_state, "s4t/reply/conductor");
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(replies[0].second)["id"], 2);
}

TEST_F(SessionManagerTest, PublishedEventsReachSubscribers)
{
    SessionManager& manager = makeSession();
    manager.connect();

    std::atomic<int> received{0};
    manager.subscribe("board.events", [&](const nlohmann::json& args) {
        if (args.is_array() && args.size() == 1 && args[0] == "ping") {
            received++;
        }
    });

    manager.publish("board.events", nlohmann::json::array({"ping"}));
    EXPECT_TRUE(waitUntil([&]() { return received == 1; }));

    manager.unsubscribe("board.events");
    EXPECT_THROW(manager.unsubscribe("board.events"), NotFoundError);
}

TEST_F(SessionManagerTest, UnregisterUnknownProcedureFails)
{
    SessionManager& manager = makeSession();
    manager.connect();

    EXPECT_THROW(manager.unregisterProcedure("iotronic.not.there"), NotFoundError);
}

TEST_F(SessionManagerTest, ProcedureNamesCarryCurrentSessionAndBoard)
{
    SessionManager& manager = makeSession();
    manager.connect();

    EXPECT_EQ(manager.procedureName("DeviceInfo"), "iotronic.1001.9f0c1d7e-board.DeviceInfo");
}

TEST_F(SessionManagerTest, ReconnectWaitsConfiguredDelayAfterDrop)
{
    SessionManager& manager = makeSession();
    manager.connect();
    manager.startKeepAlive();

    auto dropped_at = std::chrono::steady_clock::now();
    FakeTransport::dropConnection(transport_state);
    EXPECT_EQ(manager.state(), SessionState::Disconnected);

    ASSERT_TRUE(waitUntil([&]() { return manager.isConnected(); }));

    std::lock_guard<std::mutex> lock(transport_state->mutex);
    ASSERT_EQ(transport_state->open_times.size(), 2u);
    EXPECT_GE(transport_state->open_times[1] - dropped_at, options.reconnect_delay);
}

TEST_F(SessionManagerTest, FailedReconnectIsRetriedOnNextTick)
{
    SessionManager& manager = makeSession();
    manager.connect();
    manager.startKeepAlive();

    {
        std::lock_guard<std::mutex> lock(transport_state->mutex);
        transport_state->fail_next_opens = 1;
    }
    FakeTransport::dropConnection(transport_state);

    ASSERT_TRUE(waitUntil([&]() { return manager.isConnected(); }, 3000ms));

    std::lock_guard<std::mutex> lock(transport_state->mutex);
    ASSERT_EQ(transport_state->open_times.size(), 3u);
    EXPECT_GE(transport_state->open_times[2] - transport_state->open_times[1], options.reconnect_delay);
}

TEST_F(SessionManagerTest, CapabilitiesAreReadvertisedUnderNewSessionId)
{
    SessionManager& manager = makeSession();
    manager.connect();

    std::vector<rpc::Capability> capabilities = {
        {"DevicePing", [](const nlohmann::json&) { return rpc::success("pong"); }},
        {"DeviceInfo", [](const nlohmann::json&) { return rpc::success("info"); }}
    };
    manager.addConnectListener([&](const std::string&) { manager.advertise(capabilities); });
    manager.advertise(capabilities);

    manager.startKeepAlive();
    FakeTransport::dropConnection(transport_state);

    ASSERT_TRUE(waitUntil([&]() {
        return manager.isConnected() && manager.registeredProcedures().size() == 2;
    }));

    std::string session_id = manager.sessionId();
    EXPECT_EQ(session_id, "1002");
    EXPECT_EQ(board->sessionId(), "1002");
    for (const auto& name : manager.registeredProcedures()) {
        EXPECT_EQ(name.rfind("iotronic.1002.", 0), 0u) << name;
        EXPECT_TRUE(FakeTransport::isSubscribed(transport_state, "s4t/rpc/" + name)) << name;
    }

    // capabilities goes out of scope before TearDown
    manager.stop();
}

TEST_F(SessionManagerTest, FailedAdvertisementDropsSessionUntilRetrySucceeds)
{
    SessionManager& manager = makeSession();
    manager.connect();

    std::vector<rpc::Capability> capabilities = {
        {"DevicePing", [](const nlohmann::json&) { return rpc::success("pong"); }}
    };
    manager.addConnectListener([&](const std::string&) { manager.advertise(capabilities); });
    manager.advertise(capabilities);

    {
        std::lock_guard<std::mutex> lock(transport_state->mutex);
        transport_state->fail_next_rpc_subscribes = 1;
    }
    manager.startKeepAlive();
    FakeTransport::dropConnection(transport_state);

    // Session 1002 could not advertise and is dropped; 1003 advertises
    ASSERT_TRUE(waitUntil([&]() {
        return manager.isConnected() && manager.registeredProcedures().size() == 1;
    }, 3000ms));

    EXPECT_EQ(manager.sessionId(), "1003");
    EXPECT_EQ(manager.registeredProcedures()[0], manager.procedureName("DevicePing"));
    EXPECT_TRUE(FakeTransport::isSubscribed(transport_state, "s4t/rpc/" + manager.procedureName("DevicePing")));

    manager.stop();
}

TEST_F(SessionManagerTest, ConnectFailsWhenListenerCannotAdvertise)
{
    SessionManager& manager = makeSession();
    std::vector<rpc::Capability> capabilities = {
        {"DevicePing", [](const nlohmann::json&) { return rpc::success("pong"); }}
    };
    manager.addConnectListener([&](const std::string&) { manager.advertise(capabilities); });
    {
        std::lock_guard<std::mutex> lock(transport_state->mutex);
        transport_state->fail_next_rpc_subscribes = 1;
    }

    EXPECT_THROW(manager.connect(), TransportError);
    EXPECT_EQ(manager.state(), SessionState::Disconnected);
    EXPECT_FALSE(manager.isConnected());

    manager.connect();
    EXPECT_TRUE(manager.isConnected());
    EXPECT_EQ(manager.registeredProcedures().size(), 1u);

    manager.stop();
}

TEST_F(SessionManagerTest, OptionsReadFromConfig)
{
    SessionOptions loaded = SessionOptions::fromConfig(*config);

    EXPECT_EQ(loaded.reconnect_delay, 50ms);
    EXPECT_EQ(loaded.alive_interval, 50ms);
    EXPECT_EQ(loaded.call_timeout, 500ms);
    EXPECT_EQ(loaded.dispatch_workers, 2u);
    EXPECT_TRUE(loaded.transport.skip_cert_verify);
}
