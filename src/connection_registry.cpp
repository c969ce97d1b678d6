#include "connection_registry.hpp"
#include <mutex>
#include <sys/socket.h>
#include <unistd.h>

ConnectionRegistry::~ConnectionRegistry() { close_all(); }

int64_t ConnectionRegistry::add(int fd) {
  std::unique_lock<std::shared_mutex> lk(mtx_);
  const int64_t id = next_id_++;
  conns_.emplace(id, fd);
  return id;
}

void ConnectionRegistry::for_each(const std::function<void(int64_t, int)>& fn) const {
  std::shared_lock<std::shared_mutex> lk(mtx_);
  for (const auto& c : conns_) fn(c.first, c.second);
}

std::vector<std::pair<int64_t, int>> ConnectionRegistry::entries() const {
  std::shared_lock<std::shared_mutex> lk(mtx_);
  return std::vector<std::pair<int64_t, int>>(conns_.begin(), conns_.end());
}

size_t ConnectionRegistry::prune(const std::vector<int64_t>& ids) {
  std::unique_lock<std::shared_mutex> lk(mtx_);
  size_t removed = 0;
  for (int64_t id : ids) {
    auto it = conns_.find(id);
    if (it == conns_.end()) continue;
    ::close(it->second);
    conns_.erase(it);
    ++removed;
  }
  return removed;
}

void ConnectionRegistry::close_all() {
  std::unique_lock<std::shared_mutex> lk(mtx_);
  for (const auto& c : conns_) ::close(c.second);
  conns_.clear();
}

void ConnectionRegistry::shutdown_all() {
  std::shared_lock<std::shared_mutex> lk(mtx_);
  for (const auto& c : conns_) ::shutdown(c.second, SHUT_RDWR);
}

size_t ConnectionRegistry::size() const {
  std::shared_lock<std::shared_mutex> lk(mtx_);
  return conns_.size();
}

bool ConnectionRegistry::contains(int64_t id) const {
  std::shared_lock<std::shared_mutex> lk(mtx_);
  return conns_.count(id) != 0;
}
