#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

// Bounded count of admission slots. The accept loop takes one slot per
// connection before dispatching it; the slot goes back when the work ends.
class AdmissionGate {
public:
  AdmissionGate(int capacity, std::chrono::milliseconds backoff);

  // Blocks until a slot is free and takes it. Returns false only after close().
  bool acquire();
  bool try_acquire();
  void release();

  // Wakes every waiter; acquire() fails from now on.
  void close();

  int capacity() const { return capacity_; }
  int free_slots() const;
  // capacity - free, read under the same lock that mutates it.
  int active() const;

private:
  const int capacity_;
  const std::chrono::milliseconds backoff_;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  int free_;
  bool closed_ = false;
};
