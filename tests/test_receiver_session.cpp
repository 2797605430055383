// Tests for launching the receiver app and driving the cast session.
#include "cast_errors.hpp"
#include "receiver_session.hpp"
#include "support/fake_device.hpp"
#include "support/manual_scheduler.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;
using googlecast::session_phase;

namespace
{

constexpr const char* app_id = "TESTAPP";
constexpr const char* app_namespace = "urn:x-cast:com.example.test";

class ReceiverSessionTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        session.set_device(googlecast::device_endpoint {"192.168.0.50"});
    }

    // Casts and lets the device answer
    bool cast_and_wait(const googlecast::cast_target& target)
    {
        std::optional<bool> result;
        session.cast(target, [&result](bool ok) { result = ok; });
        sched.run_pending();
        EXPECT_TRUE(result.has_value());
        return result.value_or(false);
    }

    testing_support::manual_scheduler sched;
    testing_support::fake_device device {app_id, app_namespace};
    googlecast::cast_transport transport {sched, device.factory(), 5000ms};
    googlecast::receiver_session session {transport, sched,
        googlecast::receiver_app {app_id, app_namespace, "http://192.168.0.2:3000/receiver"}, 10000ms};
    googlecast::cast_target target {"192.168.0.19", 9000, "aa:bb:cc:dd:ee:ff"};
};

} // namespace

TEST_F(ReceiverSessionTest, CastLaunchesAppAndSendsParams) {
    ASSERT_TRUE(cast_and_wait(target));

    EXPECT_EQ(session.phase(), session_phase::casting);
    EXPECT_TRUE(session.casting());
    EXPECT_EQ(device.count("LAUNCH"), 1u);
    EXPECT_EQ(device.last("LAUNCH")->payload["appId"], app_id);

    const auto* connect = device.last("CONNECT");
    ASSERT_NE(connect, nullptr);
    EXPECT_EQ(connect->destination, "web-1");
    EXPECT_EQ(connect->nspace, googlecast::namespace_connection);

    ASSERT_EQ(device.count("SET_LMS_PARAMS"), 1u);
    const auto* params = device.last("SET_LMS_PARAMS");
    EXPECT_EQ(params->destination, "web-1");
    EXPECT_EQ(params->nspace, app_namespace);
    EXPECT_EQ(params->payload["host"], "192.168.0.19");
    EXPECT_EQ(params->payload["port"], 9000);
    EXPECT_EQ(params->payload["player"], "aa:bb:cc:dd:ee:ff");

    const auto status = session.status();
    EXPECT_EQ(status.transport_id, "web-1");
    ASSERT_TRUE(status.target.has_value());
    EXPECT_TRUE(*status.target == target);
}

TEST_F(ReceiverSessionTest, ConcurrentLaunchesShareOneLaunchFrame) {
    std::vector<std::exception_ptr> results;
    session.ensure_launched([&results](std::exception_ptr err) { results.push_back(err); });
    session.ensure_launched([&results](std::exception_ptr err) { results.push_back(err); });
    EXPECT_EQ(session.phase(), session_phase::launch_pending);

    sched.run_pending();

    EXPECT_EQ(device.count("LAUNCH"), 1u);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0], nullptr);
    EXPECT_EQ(results[1], nullptr);
    EXPECT_EQ(session.phase(), session_phase::app_ready);
}

TEST_F(ReceiverSessionTest, EnsureLaunchedResolvesImmediatelyWhenBound) {
    ASSERT_TRUE(cast_and_wait(target));

    bool resolved = false;
    session.ensure_launched([&resolved](std::exception_ptr err) { resolved = err == nullptr; });

    EXPECT_TRUE(resolved);
    EXPECT_EQ(device.count("LAUNCH"), 1u);
}

TEST_F(ReceiverSessionTest, ReusesAlreadyRunningApp) {
    device.app_running = true;
    device.transport_id = "web-42";
    session.connect();
    sched.run_pending();
    EXPECT_EQ(session.phase(), session_phase::app_ready);

    ASSERT_TRUE(cast_and_wait(target));

    EXPECT_EQ(device.count("LAUNCH"), 0u);
    EXPECT_EQ(device.last("SET_LMS_PARAMS")->destination, "web-42");
}

TEST_F(ReceiverSessionTest, LaunchTimesOut) {
    device.on_launch = testing_support::fake_device::launch_reply::silent;
    std::exception_ptr failure;
    session.ensure_launched([&failure](std::exception_ptr err) { failure = err; });
    sched.run_pending();

    sched.advance(9999ms);
    EXPECT_EQ(failure, nullptr);
    EXPECT_EQ(session.phase(), session_phase::launch_pending);

    sched.advance(1ms);
    ASSERT_NE(failure, nullptr);
    EXPECT_THROW(std::rethrow_exception(failure), googlecast::launch_timeout);
    EXPECT_EQ(session.phase(), session_phase::connected);
    EXPECT_TRUE(session.status().transport_id.empty());
}

TEST_F(ReceiverSessionTest, CastRetriesLaunchAfterTimeout) {
    device.on_launch = testing_support::fake_device::launch_reply::silent;
    std::optional<bool> first;
    session.cast(target, [&first](bool ok) { first = ok; });
    sched.advance(10000ms);
    ASSERT_TRUE(first.has_value());
    EXPECT_FALSE(*first);

    device.on_launch = testing_support::fake_device::launch_reply::running;
    EXPECT_TRUE(cast_and_wait(target));
    EXPECT_EQ(device.count("LAUNCH"), 2u);
}

TEST_F(ReceiverSessionTest, LaunchErrorRejectsWithReason) {
    device.on_launch = testing_support::fake_device::launch_reply::error;
    std::exception_ptr failure;
    session.ensure_launched([&failure](std::exception_ptr err) { failure = err; });
    sched.run_pending();

    ASSERT_NE(failure, nullptr);
    try {
        std::rethrow_exception(failure);
        FAIL() << "launch should have failed";
    } catch(const googlecast::launch_error& e) {
        EXPECT_STREQ(e.what(), "NOT_FOUND");
    }
    EXPECT_EQ(sched.timers(), 1u);  // Only the heartbeat is left
}

TEST_F(ReceiverSessionTest, EmptyStatusRejectsPendingLaunch) {
    device.on_launch = testing_support::fake_device::launch_reply::silent;
    std::exception_ptr failure;
    session.ensure_launched([&failure](std::exception_ptr err) { failure = err; });
    sched.run_pending();
    ASSERT_EQ(failure, nullptr);

    device.inject_status(json::array());
    sched.run_pending();

    ASSERT_NE(failure, nullptr);
    try {
        std::rethrow_exception(failure);
        FAIL() << "launch should have failed";
    } catch(const googlecast::launch_error& e) {
        EXPECT_STREQ(e.what(), "App not running");
    }
    EXPECT_EQ(session.phase(), session_phase::connected);
}

TEST_F(ReceiverSessionTest, StatusAnsweringEarlierRequestKeepsLaunchPending) {
    device.on_launch = testing_support::fake_device::launch_reply::silent;
    std::exception_ptr failure;
    bool called = false;
    session.ensure_launched([&](std::exception_ptr err) { called = true; failure = err; });

    // The GET_STATUS answer of connect() reports no app and predates the LAUNCH
    sched.run_pending();

    EXPECT_FALSE(called);
    EXPECT_EQ(session.phase(), session_phase::launch_pending);
}

TEST_F(ReceiverSessionTest, StatusWithoutAppClearsBinding) {
    ASSERT_TRUE(cast_and_wait(target));

    device.inject_status(json::array());
    sched.run_pending();

    EXPECT_EQ(session.phase(), session_phase::connected);
    EXPECT_FALSE(session.casting());
    EXPECT_TRUE(session.status().transport_id.empty());
    EXPECT_FALSE(session.send_app_message(json {{"type", "NOW_PLAYING"}}));
}

TEST_F(ReceiverSessionTest, StatusForOtherAppClearsBinding) {
    ASSERT_TRUE(cast_and_wait(target));

    device.inject_status(json::array({json {{"appId", "CC1AD845"}, {"transportId", "web-9"}}}));
    sched.run_pending();

    EXPECT_EQ(session.phase(), session_phase::connected);
    EXPECT_TRUE(session.status().transport_id.empty());
}

TEST_F(ReceiverSessionTest, NewTransportIdRebindsAndNeedsParamsAgain) {
    ASSERT_TRUE(cast_and_wait(target));

    device.transport_id = "web-7";
    device.inject_status(json::array({device.app_entry()}));
    sched.run_pending();

    EXPECT_EQ(session.phase(), session_phase::app_ready);
    EXPECT_EQ(session.status().transport_id, "web-7");

    ASSERT_TRUE(cast_and_wait(target));
    EXPECT_EQ(device.count("SET_LMS_PARAMS"), 2u);
    EXPECT_EQ(device.last("SET_LMS_PARAMS")->destination, "web-7");
}

TEST_F(ReceiverSessionTest, RepeatedStatusKeepsCasting) {
    ASSERT_TRUE(cast_and_wait(target));

    device.inject_status(json::array({device.app_entry()}));
    sched.run_pending();

    EXPECT_EQ(session.phase(), session_phase::casting);
    EXPECT_EQ(device.count("CONNECT"), 2u);
}

TEST_F(ReceiverSessionTest, CastingSameTargetSendsNothing) {
    ASSERT_TRUE(cast_and_wait(target));
    const size_t frames = device.frames.size();

    ASSERT_TRUE(cast_and_wait(target));

    EXPECT_EQ(device.frames.size(), frames);
}

TEST_F(ReceiverSessionTest, CastingOtherTargetResendsParams) {
    ASSERT_TRUE(cast_and_wait(target));

    googlecast::cast_target other {"192.168.0.19", 9000, "11:22:33:44:55:66"};
    ASSERT_TRUE(cast_and_wait(other));

    EXPECT_EQ(device.count("LAUNCH"), 1u);
    EXPECT_EQ(device.count("SET_LMS_PARAMS"), 2u);
    ASSERT_TRUE(session.current_target().has_value());
    EXPECT_EQ(session.current_target()->player, other.player);
}

TEST_F(ReceiverSessionTest, FailedParamsLeaveSessionRetryable) {
    device.fail_app_sends = true;
    EXPECT_FALSE(cast_and_wait(target));
    EXPECT_FALSE(session.casting());
    EXPECT_EQ(session.phase(), session_phase::app_ready);

    device.fail_app_sends = false;
    EXPECT_TRUE(cast_and_wait(target));
    EXPECT_TRUE(session.casting());
    EXPECT_EQ(device.count("LAUNCH"), 1u);
}

TEST_F(ReceiverSessionTest, StopSendsStopAndDisconnects) {
    ASSERT_TRUE(cast_and_wait(target));

    EXPECT_TRUE(session.stop());

    const auto* stop = device.last("STOP");
    ASSERT_NE(stop, nullptr);
    EXPECT_EQ(stop->payload["sessionId"], "session-1");
    EXPECT_TRUE(stop->payload.contains("requestId"));
    EXPECT_EQ(device.count("CLOSE"), 1u);
    EXPECT_FALSE(session.casting());
    EXPECT_EQ(session.phase(), session_phase::disconnected);
    EXPECT_FALSE(transport.connected());
}

TEST_F(ReceiverSessionTest, StopWhenNotCastingSendsNothing) {
    EXPECT_TRUE(session.stop());
    EXPECT_TRUE(device.frames.empty());

    session.connect();
    sched.run_pending();
    EXPECT_TRUE(session.stop());
    EXPECT_EQ(device.count("STOP"), 0u);
}

TEST_F(ReceiverSessionTest, DisconnectRejectsPendingLaunch) {
    device.on_launch = testing_support::fake_device::launch_reply::silent;
    std::exception_ptr failure;
    session.ensure_launched([&](std::exception_ptr err) {
        failure = err;
        EXPECT_EQ(session.phase(), session_phase::disconnected);
    });
    sched.run_pending();

    session.disconnect();

    ASSERT_NE(failure, nullptr);
    EXPECT_THROW(std::rethrow_exception(failure), googlecast::connection_error);
    EXPECT_EQ(sched.timers(), 0u);
}

TEST_F(ReceiverSessionTest, ConnectionLossDropsCast) {
    ASSERT_TRUE(cast_and_wait(target));

    device.drop_link("Connection reset by peer");
    sched.run_pending();

    EXPECT_FALSE(session.casting());
    EXPECT_EQ(session.phase(), session_phase::disconnected);

    ASSERT_TRUE(cast_and_wait(target));
    EXPECT_EQ(device.connections(), 2u);
    EXPECT_EQ(device.count("LAUNCH"), 2u);
}

TEST_F(ReceiverSessionTest, ConnectionLossRejectsPendingLaunch) {
    device.on_launch = testing_support::fake_device::launch_reply::silent;
    std::exception_ptr failure;
    session.ensure_launched([&failure](std::exception_ptr err) { failure = err; });
    sched.run_pending();

    device.drop_link("Connection reset by peer");
    sched.run_pending();

    ASSERT_NE(failure, nullptr);
    EXPECT_THROW(std::rethrow_exception(failure), googlecast::connection_error);
    EXPECT_EQ(session.phase(), session_phase::disconnected);
}

TEST_F(ReceiverSessionTest, CastWithoutDeviceFails) {
    session.set_device(std::nullopt);

    EXPECT_FALSE(session.configured());
    EXPECT_FALSE(cast_and_wait(target));
    EXPECT_EQ(device.connections(), 0u);
}

TEST_F(ReceiverSessionTest, UnreachableDeviceFailsCast) {
    device.refuse_connections = true;

    EXPECT_FALSE(cast_and_wait(target));
    EXPECT_EQ(session.phase(), session_phase::disconnected);
}

TEST_F(ReceiverSessionTest, SwitchingDeviceStopsCast) {
    ASSERT_TRUE(cast_and_wait(target));

    session.set_device(googlecast::device_endpoint {"192.168.0.51"});

    EXPECT_EQ(device.count("STOP"), 1u);
    EXPECT_FALSE(session.casting());
    ASSERT_TRUE(cast_and_wait(target));
    EXPECT_EQ(device.endpoints.back().ip, "192.168.0.51");
}

TEST_F(ReceiverSessionTest, AppMessagesGoToAppNamespace) {
    ASSERT_TRUE(cast_and_wait(target));

    EXPECT_TRUE(session.send_app_message(json {{"type", "PAUSE"}, {"payload", json::object()}}));

    const auto* pause = device.last("PAUSE");
    ASSERT_NE(pause, nullptr);
    EXPECT_EQ(pause->nspace, app_namespace);
    EXPECT_EQ(pause->destination, "web-1");
}
