#include "stats_broadcaster.hpp"
#include "test_util.hpp"

using namespace std::chrono_literals;

class StatsBroadcasterTest : public ::testing::Test {
protected:
  AdmissionGate gate{5, 50ms};
  FileUsageTracker usage;
  ConnectionRegistry subscribers;
  StatsBroadcaster broadcaster{gate, usage, subscribers, 20ms};
};

TEST_F(StatsBroadcasterTest, SnapshotOfIdleServer) {
  StatsMessage msg = broadcaster.snapshot();
  EXPECT_EQ(msg.active, 0u);
  EXPECT_EQ(msg.name, "no files");
  EXPECT_EQ(msg.count, 0u);
}

TEST_F(StatsBroadcasterTest, SnapshotReflectsLoadAndUsage) {
  ASSERT_TRUE(gate.try_acquire());
  ASSERT_TRUE(gate.try_acquire());
  usage.record("a");
  usage.record("b");
  usage.record("b");

  StatsMessage msg = broadcaster.snapshot();
  EXPECT_EQ(msg.active, 2u);
  EXPECT_EQ(msg.name, "b");
  EXPECT_EQ(msg.count, 2u);
}

TEST_F(StatsBroadcasterTest, TickPushesToEverySubscriber) {
  SocketPair a, b;
  subscribers.add(a.release_server());
  subscribers.add(b.release_server());
  usage.record("report.pdf");

  EXPECT_EQ(broadcaster.tick(), 0u);
  for (SocketPair* sp : {&a, &b}) {
    auto msg = decode_stats(sp->peer());
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->name, "report.pdf");
    EXPECT_EQ(msg->count, 1u);
  }
}

TEST_F(StatsBroadcasterTest, TickPrunesClosedSubscriberOnly) {
  SocketPair gone, alive;
  subscribers.add(gone.release_server());
  int64_t alive_id = subscribers.add(alive.release_server());
  gone.close_peer();

  EXPECT_EQ(broadcaster.tick(), 1u);
  EXPECT_EQ(subscribers.size(), 1u);
  EXPECT_TRUE(subscribers.contains(alive_id));
  EXPECT_TRUE(decode_stats(alive.peer()).has_value());
}

TEST_F(StatsBroadcasterTest, SubscriberSendingBytesIsKept) {
  SocketPair chatty;
  subscribers.add(chatty.release_server());
  ASSERT_TRUE(send_all(chatty.peer(), "noise", 5));

  EXPECT_EQ(broadcaster.tick(), 0u);
  EXPECT_EQ(subscribers.size(), 1u);
  EXPECT_TRUE(decode_stats(chatty.peer()).has_value());
}

TEST_F(StatsBroadcasterTest, BackgroundLoopPushesUntilStopped) {
  SocketPair sp;
  subscribers.add(sp.release_server());
  set_recv_timeout(sp.peer(), 2000);

  broadcaster.start();
  auto first = decode_stats(sp.peer());
  auto second = decode_stats(sp.peer());
  broadcaster.stop();

  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->name, "no files");
}

TEST_F(StatsBroadcasterTest, StalledSubscriberIsDroppedWithoutBlocking) {
  SocketPair stalled, healthy;
  int small = 4096;
  ::setsockopt(stalled.server(), SOL_SOCKET, SO_SNDBUF, &small, sizeof(small));
  int64_t stalled_id = subscribers.add(stalled.release_server());
  int64_t healthy_id = subscribers.add(healthy.release_server());
  set_nonblock(healthy.peer());
  usage.record(std::string(200, 'n'));

  size_t pruned = 0;
  for (int i = 0; i < 100000 && subscribers.contains(stalled_id); ++i) {
    pruned += broadcaster.tick();
    healthy.drain_peer();
  }
  EXPECT_EQ(pruned, 1u);
  EXPECT_FALSE(subscribers.contains(stalled_id));
  EXPECT_TRUE(subscribers.contains(healthy_id));
}
