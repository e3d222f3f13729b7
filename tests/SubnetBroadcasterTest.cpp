#include "SubnetBroadcaster.hpp"
#include "TestSockets.hpp"
#include <gtest/gtest.h>
#include <thread>

namespace {

using Clock = std::chrono::steady_clock;

PublisherConfig loopback_config(uint16_t client_port) {
    PublisherConfig cfg;
    cfg.broadcast_address = "127.0.0.1";
    cfg.client_port = client_port;
    cfg.ack_port = 0;
    cfg.interval_seconds = 5.0;
    return cfg;
}

std::vector<BroadcastMessage> decode_all(const std::vector<std::string>& datagrams) {
    std::vector<BroadcastMessage> out;
    for (const std::string& d : datagrams) {
        BroadcastMessage msg;
        std::string error;
        if (MessageCodec::decode(d.data(), d.size(), msg, error)) out.push_back(msg);
    }
    return out;
}

} // namespace

TEST(PublisherStateTest, IdsIncreaseByOneWithoutGaps) {
    PublisherState state;
    for (int64_t expected = 0; expected < 20; ++expected) {
        BroadcastMessage msg;
        ASSERT_TRUE(state.next_message("t", msg));
        EXPECT_EQ(msg.message_id, expected);
    }
    EXPECT_EQ(state.next_message_id, 20);
}

TEST(PublisherStateTest, StatesFollowTheFixedCycle) {
    PublisherState state;
    for (std::size_t n = 0; n < 13; ++n) {
        BroadcastMessage msg;
        ASSERT_TRUE(state.next_message("t", msg));
        EXPECT_EQ(msg.state, MessageCodec::STATE_CYCLE[n % 4]) << "tick " << n;
    }
}

TEST(PublisherStateTest, CycleOrder) {
    EXPECT_EQ(MessageCodec::STATE_CYCLE[0], StationState::Active);
    EXPECT_EQ(MessageCodec::STATE_CYCLE[1], StationState::Standby);
    EXPECT_EQ(MessageCodec::STATE_CYCLE[2], StationState::Maintenance);
    EXPECT_EQ(MessageCodec::STATE_CYCLE[3], StationState::Error);
}

TEST(PublisherStateTest, RefusesToWrapPastTheLastId) {
    PublisherState state;
    state.next_message_id = MessageCodec::MAX_MESSAGE_ID - 1;

    BroadcastMessage msg;
    ASSERT_TRUE(state.next_message("t", msg));
    EXPECT_EQ(msg.message_id, MessageCodec::MAX_MESSAGE_ID - 1);
    ASSERT_TRUE(state.next_message("t", msg));
    EXPECT_EQ(msg.message_id, MessageCodec::MAX_MESSAGE_ID);
    EXPECT_FALSE(state.next_message("t", msg));
    EXPECT_TRUE(state.exhausted);
}

TEST(SubnetBroadcasterTest, InitRejectsInvalidBroadcastAddress) {
    PublisherConfig cfg = loopback_config(37020);
    cfg.broadcast_address = "not-an-ip";
    SubnetBroadcaster bc(cfg);
    EXPECT_FALSE(bc.init());
}

TEST(SubnetBroadcasterTest, EmptyAddressFallsBackToLimitedBroadcast) {
    PublisherConfig cfg;
    cfg.broadcast_address.clear();
    SubnetBroadcaster bc(cfg);
    EXPECT_EQ(bc.broadcast_address(), "255.255.255.255");
}

TEST(SubnetBroadcasterTest, TickIsGatedByTheInterval) {
    LoopbackSocket rx;
    ASSERT_TRUE(rx.ok());
    SubnetBroadcaster bc(loopback_config(rx.port()));
    ASSERT_TRUE(bc.init());
    ASSERT_NE(bc.ack_port(), 0);

    auto t0 = Clock::now();
    EXPECT_TRUE(bc.tick(t0));
    EXPECT_FALSE(bc.tick(t0 + std::chrono::seconds(1)));
    EXPECT_FALSE(bc.tick(t0 + std::chrono::milliseconds(4999)));
    EXPECT_TRUE(bc.tick(t0 + std::chrono::seconds(5)));
    EXPECT_FALSE(bc.tick(t0 + std::chrono::seconds(6)));

    auto msgs = decode_all(rx.receive_all(200));
    ASSERT_EQ(msgs.size(), 2u);
    EXPECT_EQ(msgs[0].message_id, 0);
    EXPECT_EQ(msgs[0].state, StationState::Active);
    EXPECT_EQ(msgs[1].message_id, 1);
    EXPECT_EQ(msgs[1].state, StationState::Standby);
    EXPECT_EQ(msgs[0].response_port, bc.ack_port());
    EXPECT_NE(msgs[0].timestamp, "unknown");
}

TEST(SubnetBroadcasterTest, RequestedBroadcastSkipsTheInterval) {
    LoopbackSocket rx;
    SubnetBroadcaster bc(loopback_config(rx.port()));
    ASSERT_TRUE(bc.init());

    auto t0 = Clock::now();
    ASSERT_TRUE(bc.tick(t0));
    bc.request_broadcast();
    EXPECT_TRUE(bc.tick(t0 + std::chrono::milliseconds(10)));
    EXPECT_FALSE(bc.tick(t0 + std::chrono::milliseconds(20)));

    EXPECT_EQ(decode_all(rx.receive_all(200)).size(), 2u);
    EXPECT_EQ(bc.state().next_message_id, 2);
}

TEST(SubnetBroadcasterTest, TickWithoutInitDoesNothing) {
    SubnetBroadcaster bc(loopback_config(37020));
    EXPECT_FALSE(bc.tick(Clock::now()));
    EXPECT_EQ(bc.state().next_message_id, 0);
}

TEST(SubnetBroadcasterTest, StatusTracksSends) {
    LoopbackSocket rx;
    SubnetBroadcaster bc(loopback_config(rx.port()));
    ASSERT_TRUE(bc.init());

    auto t0 = Clock::now();
    bc.tick(t0);
    bc.tick(t0 + std::chrono::seconds(5));
    bc.tick(t0 + std::chrono::seconds(10));

    PublisherStatus st = bc.status();
    EXPECT_EQ(st.messages_sent, 3u);
    EXPECT_EQ(st.send_failures, 0u);
    EXPECT_EQ(st.next_message_id, 3);
    EXPECT_EQ(st.next_state, StationState::Error);
}

// sendto() to port 0 fails with EINVAL on Linux
TEST(SubnetBroadcasterTest, FailedSendStillConsumesItsId) {
    SubnetBroadcaster bc(loopback_config(0));
    ASSERT_TRUE(bc.init());

    auto t0 = Clock::now();
    EXPECT_TRUE(bc.tick(t0));
    EXPECT_TRUE(bc.tick(t0 + std::chrono::seconds(5)));

    PublisherStatus st = bc.status();
    EXPECT_EQ(st.send_failures, 2u);
    EXPECT_EQ(st.messages_sent, 0u);
    EXPECT_EQ(st.next_message_id, 2);
    EXPECT_EQ(st.next_state, StationState::Maintenance);
    EXPECT_EQ(bc.state().next_message_id, 2);
    EXPECT_EQ(bc.state().current_state_index, 2u);
}

TEST(SubnetBroadcasterTest, PollAcksAttributesAcksToTheSender) {
    SubnetBroadcaster bc(loopback_config(37020));
    ASSERT_TRUE(bc.init());

    LoopbackSocket listener;
    ASSERT_TRUE(listener.send_to(bc.ack_port(), "Client aa received message 0"));
    ASSERT_TRUE(listener.send_to(bc.ack_port(), "Client aa received message 1"));

    int acks = 0;
    for (int i = 0; i < 10 && acks < 2; ++i) acks += bc.poll_acks(100);
    EXPECT_EQ(acks, 2);

    auto listeners = bc.get_listeners();
    ASSERT_EQ(listeners.size(), 1u);
    const ListenerInfo& info = listeners.begin()->second;
    EXPECT_EQ(listeners.begin()->first, "127.0.0.1:" + std::to_string(listener.port()));
    EXPECT_EQ(info.ip, "127.0.0.1");
    EXPECT_EQ(info.port, listener.port());
    EXPECT_EQ(info.ack_count, 2u);
    EXPECT_EQ(info.last_ack, "Client aa received message 1");
    EXPECT_EQ(bc.status().acks_received, 2u);
}

TEST(SubnetBroadcasterTest, PollAcksReturnsPromptlyWithoutTraffic) {
    SubnetBroadcaster bc(loopback_config(37020));
    ASSERT_TRUE(bc.init());

    auto start = Clock::now();
    EXPECT_EQ(bc.poll_acks(20), 0);
    EXPECT_LT(Clock::now() - start, std::chrono::milliseconds(500));
}

TEST(SubnetBroadcasterTest, SilentListenersExpire) {
    PublisherConfig cfg = loopback_config(37020);
    cfg.expiry_ms = 1000;
    SubnetBroadcaster bc(cfg);
    ASSERT_TRUE(bc.init());

    LoopbackSocket listener;
    ASSERT_TRUE(listener.send_to(bc.ack_port(), "Client bb received message 0"));
    int acks = 0;
    for (int i = 0; i < 10 && acks < 1; ++i) acks += bc.poll_acks(100);
    ASSERT_EQ(acks, 1);

    EXPECT_EQ(bc.prune_stale(Clock::now()), 0u);
    EXPECT_EQ(bc.prune_stale(Clock::now() + std::chrono::seconds(2)), 1u);
    EXPECT_TRUE(bc.get_listeners().empty());
}

TEST(SubnetBroadcasterTest, WorkerThreadBroadcastsUntilStopped) {
    LoopbackSocket rx;
    SubnetBroadcaster bc(loopback_config(rx.port()));
    ASSERT_TRUE(bc.init());
    ASSERT_TRUE(bc.start());
    EXPECT_FALSE(bc.start());
    EXPECT_TRUE(bc.running());

    auto msgs = decode_all(rx.receive_all(300));
    bc.stop();
    EXPECT_FALSE(bc.running());

    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].message_id, 0);
    EXPECT_EQ(bc.status().messages_sent, 1u);
}
