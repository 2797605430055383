// Tests for the CASTV2 transport and its channel multiplexing.
#include "cast_errors.hpp"
#include "cast_transport.hpp"
#include "support/fake_device.hpp"
#include "support/manual_scheduler.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace
{

constexpr const char* app_namespace = "urn:x-cast:com.example.test";

class TransportTest : public ::testing::Test
{
protected:
    testing_support::manual_scheduler sched;
    testing_support::fake_device device {"TESTAPP", app_namespace};
    googlecast::cast_transport transport {sched, device.factory(), 5000ms};
    googlecast::device_endpoint endpoint {"192.168.0.50"};
};

} // namespace

TEST_F(TransportTest, ConnectSendsConnectThenGetStatus) {
    transport.connect(endpoint);

    ASSERT_TRUE(transport.connected());
    ASSERT_EQ(device.frames.size(), 2u);
    EXPECT_EQ(device.frames[0].payload["type"], "CONNECT");
    EXPECT_EQ(device.frames[0].nspace, googlecast::namespace_connection);
    EXPECT_EQ(device.frames[0].source, "sender-0");
    EXPECT_EQ(device.frames[0].destination, "receiver-0");
    EXPECT_EQ(device.frames[1].payload["type"], "GET_STATUS");
    EXPECT_EQ(device.frames[1].nspace, googlecast::namespace_receiver);
    EXPECT_TRUE(device.frames[1].payload.contains("requestId"));
}

TEST_F(TransportTest, ConnectToSameEndpointIsNoOp) {
    transport.connect(endpoint);
    transport.connect(endpoint);

    EXPECT_EQ(device.connections(), 1u);
    EXPECT_EQ(device.count("CONNECT"), 1u);
}

TEST_F(TransportTest, ConnectToOtherEndpointReplacesLink) {
    transport.connect(endpoint);
    transport.connect(googlecast::device_endpoint {"192.168.0.51"});

    EXPECT_EQ(device.connections(), 2u);
    EXPECT_EQ(device.count("CLOSE"), 1u);
    ASSERT_TRUE(transport.endpoint().has_value());
    EXPECT_EQ(transport.endpoint()->ip, "192.168.0.51");
}

TEST_F(TransportTest, RefusedConnectionThrows) {
    device.refuse_connections = true;

    EXPECT_THROW(transport.connect(endpoint), googlecast::connection_error);
    EXPECT_FALSE(transport.connected());
}

TEST_F(TransportTest, RequestIdsIncrease) {
    const uint64_t first = transport.next_request_id();
    const uint64_t second = transport.next_request_id();

    EXPECT_GT(first, 0u);
    EXPECT_GT(second, first);
}

TEST_F(TransportTest, HeartbeatPingsEveryInterval) {
    transport.connect(endpoint);

    sched.advance(4999ms);
    EXPECT_EQ(device.count("PING"), 0u);
    sched.advance(1ms);
    EXPECT_EQ(device.count("PING"), 1u);
    sched.advance(5000ms);
    EXPECT_EQ(device.count("PING"), 2u);
    EXPECT_EQ(device.last("PING")->nspace, googlecast::namespace_heartbeat);
}

TEST_F(TransportTest, FailedHeartbeatKeepsConnection) {
    bool notified = false;
    transport.on_disconnect([&](const std::string&) { notified = true; });
    transport.connect(endpoint);

    device.fail_heartbeat_sends = true;
    sched.advance(10000ms);
    EXPECT_EQ(device.count("PING"), 0u);
    EXPECT_TRUE(transport.connected());
    EXPECT_FALSE(notified);
    EXPECT_EQ(sched.timers(), 1u);

    device.fail_heartbeat_sends = false;
    sched.advance(5000ms);
    EXPECT_EQ(device.count("PING"), 1u);
    EXPECT_TRUE(transport.connected());
}

TEST_F(TransportTest, HeartbeatStopsAfterDisconnect) {
    transport.connect(endpoint);
    transport.disconnect();

    sched.advance(20000ms);
    EXPECT_EQ(device.count("PING"), 0u);
    EXPECT_EQ(sched.timers(), 0u);
}

TEST_F(TransportTest, AnswersPingWithPong) {
    transport.connect(endpoint);
    device.inject("receiver-0", "sender-0", googlecast::namespace_heartbeat, json {{"type", "PING"}});
    sched.run_pending();

    ASSERT_EQ(device.count("PONG"), 1u);
    EXPECT_EQ(device.last("PONG")->nspace, googlecast::namespace_heartbeat);
}

TEST_F(TransportTest, DisconnectSendsCloseWithoutNotifying) {
    int lost = 0;
    transport.on_disconnect([&lost](const std::string&) { ++lost; });
    transport.connect(endpoint);

    transport.disconnect();
    sched.run_pending();

    EXPECT_FALSE(transport.connected());
    EXPECT_FALSE(device.link_open);
    EXPECT_EQ(device.count("CLOSE"), 1u);
    EXPECT_EQ(lost, 0);
}

TEST_F(TransportTest, DisconnectWithoutConnectionIsSafe) {
    transport.disconnect();
    transport.disconnect();

    EXPECT_TRUE(device.frames.empty());
}

TEST_F(TransportTest, PeerCloseNotifiesOnce) {
    std::vector<std::string> reasons;
    transport.on_disconnect([&reasons](const std::string& reason) { reasons.push_back(reason); });
    transport.connect(endpoint);

    device.drop_link("Connection reset by peer");
    device.drop_link("Connection reset by peer");
    sched.run_pending();

    ASSERT_EQ(reasons.size(), 1u);
    EXPECT_EQ(reasons[0], "Connection reset by peer");
    EXPECT_FALSE(transport.connected());
}

TEST_F(TransportTest, CloseFromReceiverCountsAsDisconnect) {
    int lost = 0;
    transport.on_disconnect([&lost](const std::string&) { ++lost; });
    transport.connect(endpoint);

    device.inject("receiver-0", "sender-0", googlecast::namespace_connection, json {{"type", "CLOSE"}});
    sched.run_pending();

    EXPECT_EQ(lost, 1);
    EXPECT_FALSE(transport.connected());
}

TEST_F(TransportTest, EventsOfReplacedLinkAreDropped) {
    int lost = 0;
    transport.on_disconnect([&lost](const std::string&) { ++lost; });
    transport.connect(endpoint);
    transport.connect(googlecast::device_endpoint {"192.168.0.51"});

    device.drop_link(0, "Old socket failed");
    sched.run_pending();

    EXPECT_EQ(lost, 0);
    EXPECT_TRUE(transport.connected());
}

TEST_F(TransportTest, ChannelReceivesOnlyMatchingFrames) {
    transport.connect(endpoint);
    auto ch = transport.create_channel("sender-0", "web-1", app_namespace);
    std::vector<json> received;
    ch->on_message([&received](const json& msg) { received.push_back(msg); });

    device.inject("web-1", "sender-0", app_namespace, json {{"type", "A"}});
    device.inject("web-2", "sender-0", app_namespace, json {{"type", "B"}});
    device.inject("web-1", "sender-0", googlecast::namespace_receiver, json {{"type", "C"}});
    device.inject("web-1", "*", app_namespace, json {{"type", "D"}});
    device.inject("web-1", "sender-7", app_namespace, json {{"type", "E"}});
    sched.run_pending();

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0]["type"], "A");
    EXPECT_EQ(received[1]["type"], "D");
}

TEST_F(TransportTest, MalformedPayloadIsDropped) {
    transport.connect(endpoint);
    auto ch = transport.create_channel("sender-0", "web-1", app_namespace);
    int received = 0;
    ch->on_message([&received](const json&) { ++received; });

    googlecast::cast_message msg;
    msg.set_protocol_version(googlecast::cast_message::CASTV2_1_0);
    msg.set_source_id("web-1");
    msg.set_destination_id("sender-0");
    msg.set_namespace_(app_namespace);
    msg.set_payload_type(googlecast::cast_message::STRING);
    msg.set_payload_utf8("{not json");
    device.inject_raw(std::move(msg));
    device.inject("web-1", "sender-0", app_namespace, json {{"type", "OK"}});
    sched.run_pending();

    EXPECT_EQ(received, 1);
    EXPECT_TRUE(transport.connected());
}

TEST_F(TransportTest, ChannelSendStampsAddressing) {
    transport.connect(endpoint);
    auto ch = transport.create_channel("sender-0", "web-1", app_namespace);

    ch->send(json {{"type", "HELLO"}});

    const auto* frame = device.last("HELLO");
    ASSERT_NE(frame, nullptr);
    EXPECT_EQ(frame->source, "sender-0");
    EXPECT_EQ(frame->destination, "web-1");
    EXPECT_EQ(frame->nspace, app_namespace);
}

TEST_F(TransportTest, ChannelsCloseWithTransport) {
    transport.connect(endpoint);
    auto ch = transport.create_channel("sender-0", "web-1", app_namespace);

    transport.disconnect();

    EXPECT_FALSE(ch->is_open());
    EXPECT_THROW(ch->send(json {{"type", "HELLO"}}), googlecast::channel_unavailable);
}

TEST_F(TransportTest, ClosedChannelStopsReceiving) {
    transport.connect(endpoint);
    auto ch = transport.create_channel("sender-0", "web-1", app_namespace);
    int received = 0;
    ch->on_message([&received](const json&) { ++received; });

    ch->close();
    device.inject("web-1", "sender-0", app_namespace, json {{"type", "A"}});
    sched.run_pending();

    EXPECT_EQ(received, 0);
    EXPECT_THROW(ch->send(json {{"type", "A"}}), googlecast::channel_unavailable);
}

TEST_F(TransportTest, CreateChannelRequiresConnection) {
    EXPECT_THROW(transport.create_channel("sender-0", "web-1", app_namespace), googlecast::channel_unavailable);
}
