#include "SubnetBroadcaster.hpp"
#include "SubnetListener.hpp"
#include <gtest/gtest.h>
#include <thread>

// Publisher and listener talking over loopback, driven by explicit ticks.
TEST(EndToEndTest, ThreeBroadcastsAreReceivedAndAcknowledged) {
    ListenerConfig lcfg;
    lcfg.client_id = "e2e";
    lcfg.client_port = 0;
    lcfg.max_runtime = 10;
    lcfg.max_messages = 3;
    SubnetListener listener(lcfg);
    ASSERT_TRUE(listener.init());

    PublisherConfig pcfg;
    pcfg.broadcast_address = "127.0.0.1";
    pcfg.client_port = listener.port();
    pcfg.ack_port = 0;
    SubnetBroadcaster publisher(pcfg);
    ASSERT_TRUE(publisher.init());

    ListenerSummary summary;
    std::thread receiver([&listener, &summary]() { summary = listener.run(); });

    auto t0 = std::chrono::steady_clock::now();
    EXPECT_TRUE(publisher.tick(t0));
    EXPECT_TRUE(publisher.tick(t0 + std::chrono::seconds(5)));
    EXPECT_TRUE(publisher.tick(t0 + std::chrono::seconds(10)));
    receiver.join();

    int acks = 0;
    for (int i = 0; i < 20 && acks < 3; ++i) acks += publisher.poll_acks(100);

    EXPECT_EQ(summary.exit_reason, ExitReason::MaxMessages);
    ASSERT_EQ(summary.messages_received, 3u);
    EXPECT_EQ(summary.received_messages[0].state, StationState::Active);
    EXPECT_EQ(summary.received_messages[1].state, StationState::Standby);
    EXPECT_EQ(summary.received_messages[2].state, StationState::Maintenance);
    EXPECT_EQ(summary.last_processed_id, 2);
    EXPECT_EQ(listener.acks_sent(), 3u);

    EXPECT_EQ(acks, 3);
    PublisherStatus st = publisher.status();
    EXPECT_EQ(st.messages_sent, 3u);
    EXPECT_EQ(st.acks_received, 3u);
    auto listeners = publisher.get_listeners();
    ASSERT_EQ(listeners.size(), 1u);
    EXPECT_EQ(listeners.begin()->second.ack_count, 3u);
    EXPECT_EQ(listeners.begin()->second.last_ack, "Client e2e received message 2");
}
