#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <shared_mutex>
#include <utility>
#include <vector>

// Statistics subscribers, keyed by a connection id that starts at 0 and only grows.
// The registry owns the sockets it holds and closes them on removal.
class ConnectionRegistry {
public:
  ConnectionRegistry() = default;
  ~ConnectionRegistry();
  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

  int64_t add(int fd);

  // Calls fn(id, fd) for every subscriber under a shared lock.
  void for_each(const std::function<void(int64_t, int)>& fn) const;

  // Copy of the (id, fd) pairs, for callers that must not block while holding the lock.
  // The fds stay valid until prune() or close_all() removes them.
  std::vector<std::pair<int64_t, int>> entries() const;

  // Drops and closes the given ids; unknown ids are ignored. Returns how many went.
  size_t prune(const std::vector<int64_t>& ids);
  void close_all();
  // Wakes anything blocked on a subscriber socket; the fds stay registered.
  void shutdown_all();

  size_t size() const;
  bool contains(int64_t id) const;

private:
  mutable std::shared_mutex mtx_;
  std::map<int64_t, int> conns_;
  int64_t next_id_ = 0;
};
