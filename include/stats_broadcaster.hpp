#pragma once
#include "admission_gate.hpp"
#include "connection_registry.hpp"
#include "protocol.hpp"
#include "usage_tracker.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

// Background loop pushing a StatsMessage to every subscriber once per interval.
class StatsBroadcaster {
public:
  StatsBroadcaster(const AdmissionGate& gate, const FileUsageTracker& usage,
                   ConnectionRegistry& subscribers, std::chrono::milliseconds interval);
  ~StatsBroadcaster();

  void start();
  void stop();

  StatsMessage snapshot() const;
  // One broadcast round. Subscribers that have hung up, or cannot take a whole
  // message without blocking, are pruned. Returns the number pruned.
  // Only one thread may run tick() at a time.
  size_t tick();

private:
  const AdmissionGate& gate_;
  const FileUsageTracker& usage_;
  ConnectionRegistry& subscribers_;
  const std::chrono::milliseconds interval_;

  std::thread thread_;
  std::mutex mtx_;
  std::condition_variable cv_;
  bool stop_ = false;

  void run();
};
