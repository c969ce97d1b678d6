#include "connection_registry.hpp"
#include "test_util.hpp"

TEST(ConnectionRegistry, IdsStartAtZeroAndGrow) {
  SocketPair a, b;
  ConnectionRegistry reg;
  EXPECT_EQ(reg.add(a.release_server()), 0);
  EXPECT_EQ(reg.add(b.release_server()), 1);
  EXPECT_EQ(reg.size(), 2u);
  EXPECT_TRUE(reg.contains(0));
  EXPECT_TRUE(reg.contains(1));
}

TEST(ConnectionRegistry, IdsAreNotReusedAfterPrune) {
  SocketPair a, b;
  ConnectionRegistry reg;
  reg.add(a.release_server());
  EXPECT_EQ(reg.prune({0}), 1u);
  EXPECT_EQ(reg.add(b.release_server()), 1);
}

TEST(ConnectionRegistry, ForEachVisitsEverySubscriber) {
  SocketPair a, b;
  ConnectionRegistry reg;
  int fa = a.server(), fb = b.server();
  reg.add(a.release_server());
  reg.add(b.release_server());

  std::vector<std::pair<int64_t, int>> seen;
  reg.for_each([&](int64_t id, int fd) { seen.emplace_back(id, fd); });
  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], (std::pair<int64_t, int>(0, fa)));
  EXPECT_EQ(seen[1], (std::pair<int64_t, int>(1, fb)));
}

TEST(ConnectionRegistry, PruneClosesSocket) {
  SocketPair a;
  ConnectionRegistry reg;
  int64_t id = reg.add(a.release_server());
  EXPECT_EQ(reg.prune({id, 42}), 1u);
  EXPECT_EQ(reg.size(), 0u);

  char c;
  EXPECT_EQ(::recv(a.peer(), &c, 1, 0), 0);
}

TEST(ConnectionRegistry, CloseAllEmptiesRegistry) {
  SocketPair a, b;
  ConnectionRegistry reg;
  reg.add(a.release_server());
  reg.add(b.release_server());
  reg.close_all();
  EXPECT_EQ(reg.size(), 0u);
  EXPECT_EQ(a.drain_peer(), "");
}

TEST(ConnectionRegistry, EntriesIsASnapshot) {
  SocketPair a, b;
  ConnectionRegistry reg;
  int fa = a.server();
  int64_t ia = reg.add(a.release_server());
  auto snap = reg.entries();
  reg.add(b.release_server());

  ASSERT_EQ(snap.size(), 1u);
  EXPECT_EQ(snap[0], (std::pair<int64_t, int>(ia, fa)));
  EXPECT_EQ(reg.entries().size(), 2u);
}

TEST(ConnectionRegistry, ShutdownAllWakesPeersButKeepsEntries) {
  SocketPair a;
  ConnectionRegistry reg;
  reg.add(a.release_server());
  reg.shutdown_all();
  EXPECT_EQ(reg.size(), 1u);

  char c;
  EXPECT_EQ(::recv(a.peer(), &c, 1, 0), 0);
}
