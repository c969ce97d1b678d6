#include "admission_gate.hpp"
#include "common.hpp"

AdmissionGate::AdmissionGate(int capacity, std::chrono::milliseconds backoff)
  : capacity_(capacity), backoff_(backoff), free_(capacity) {}

bool AdmissionGate::acquire() {
  std::unique_lock<std::mutex> lk(mtx_);
  // release() notifies, so a saturated gate usually wakes early; the backoff
  // bounds how long a missed wakeup can stall the accept loop.
  while (!closed_ && free_ == 0) {
    if (!cv_.wait_for(lk, backoff_, [this] { return closed_ || free_ > 0; })) {
      log_info("server", "no free slot, retrying in " + std::to_string(backoff_.count()) + " ms");
    }
  }
  if (closed_) return false;
  --free_;
  return true;
}

bool AdmissionGate::try_acquire() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (closed_ || free_ == 0) return false;
  --free_;
  return true;
}

void AdmissionGate::release() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (free_ < capacity_) ++free_;
  }
  cv_.notify_one();
}

void AdmissionGate::close() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    closed_ = true;
  }
  cv_.notify_all();
}

int AdmissionGate::free_slots() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return free_;
}

int AdmissionGate::active() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return capacity_ - free_;
}
