#include "admission_gate.hpp"
#include <atomic>
#include <future>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST(AdmissionGate, StartsWithFullCapacity) {
  AdmissionGate gate(3, 50ms);
  EXPECT_EQ(gate.capacity(), 3);
  EXPECT_EQ(gate.free_slots(), 3);
  EXPECT_EQ(gate.active(), 0);
}

TEST(AdmissionGate, RefusesBeyondCapacity) {
  AdmissionGate gate(2, 50ms);
  EXPECT_TRUE(gate.try_acquire());
  EXPECT_TRUE(gate.acquire());
  EXPECT_FALSE(gate.try_acquire());
  EXPECT_EQ(gate.free_slots(), 0);
  EXPECT_EQ(gate.active(), 2);
}

TEST(AdmissionGate, ReleaseNeverExceedsCapacity) {
  AdmissionGate gate(2, 50ms);
  gate.release();
  EXPECT_EQ(gate.free_slots(), 2);
  ASSERT_TRUE(gate.try_acquire());
  gate.release();
  gate.release();
  EXPECT_EQ(gate.free_slots(), 2);
}

TEST(AdmissionGate, BlockedAcquireProceedsAfterRelease) {
  AdmissionGate gate(1, 10s);
  ASSERT_TRUE(gate.acquire());

  auto waiter = std::async(std::launch::async, [&] { return gate.acquire(); });
  EXPECT_EQ(waiter.wait_for(100ms), std::future_status::timeout);

  gate.release();
  ASSERT_EQ(waiter.wait_for(2s), std::future_status::ready);
  EXPECT_TRUE(waiter.get());
  EXPECT_EQ(gate.free_slots(), 0);
}

TEST(AdmissionGate, CloseFailsPendingAcquire) {
  AdmissionGate gate(1, 10s);
  ASSERT_TRUE(gate.acquire());
  auto waiter = std::async(std::launch::async, [&] { return gate.acquire(); });
  std::this_thread::sleep_for(50ms);
  gate.close();
  ASSERT_EQ(waiter.wait_for(2s), std::future_status::ready);
  EXPECT_FALSE(waiter.get());
  EXPECT_FALSE(gate.try_acquire());
}

TEST(AdmissionGate, ActiveStaysWithinCapacityUnderContention) {
  const int capacity = 3;
  AdmissionGate gate(capacity, 1ms);
  std::atomic<int> inside{0};
  std::atomic<int> peak{0};
  std::atomic<bool> bad{false};

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 500; ++i) {
        if (!gate.acquire()) { bad = true; return; }
        int now = ++inside;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        int active = gate.active();
        if (active < 0 || active > capacity) bad = true;
        --inside;
        gate.release();
      }
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_FALSE(bad.load());
  EXPECT_LE(peak.load(), capacity);
  EXPECT_EQ(gate.free_slots(), capacity);
}
