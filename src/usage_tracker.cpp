#include "usage_tracker.hpp"
#include <mutex>

uint64_t FileUsageTracker::record(const std::string& name) {
  std::unique_lock<std::shared_mutex> lk(mtx_);
  return ++counts_[name];
}

uint64_t FileUsageTracker::count(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lk(mtx_);
  auto it = counts_.find(name);
  return it == counts_.end() ? 0 : it->second;
}

size_t FileUsageTracker::size() const {
  std::shared_lock<std::shared_mutex> lk(mtx_);
  return counts_.size();
}

MostDownloaded FileUsageTracker::most_downloaded() const {
  std::shared_lock<std::shared_mutex> lk(mtx_);
  MostDownloaded best;
  bool found = false;
  for (const auto& kv : counts_) {
    if (!found || kv.second > best.count || (kv.second == best.count && kv.first < best.name)) {
      best.name = kv.first;
      best.count = kv.second;
      found = true;
    }
  }
  return best;
}
