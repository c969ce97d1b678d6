#include "stats_broadcaster.hpp"
#include "common.hpp"
#include <algorithm>
#include <cerrno>
#include <poll.h>

// Subscribers never send after the command byte, so a readable socket that
// yields EOF means the client has gone. Stray bytes are drained and ignored.
static bool peer_closed(int fd) {
  pollfd pfd{fd, POLLIN, 0};
  if (::poll(&pfd, 1, 0) <= 0) return false;
  if (pfd.revents & (POLLERR | POLLNVAL)) return true;
  char scratch[256];
  while (true) {
    ssize_t n = ::recv(fd, scratch, sizeof(scratch), MSG_DONTWAIT);
    if (n == 0) return true;
    if (n < 0) {
      if (errno == EINTR) continue;
      return errno != EAGAIN && errno != EWOULDBLOCK;
    }
  }
}

// Never blocks. A full send buffer counts as a failed write, so a subscriber
// that stops reading is dropped rather than stalling the round.
static bool push_frame(int fd, const std::vector<uint8_t>& wire) {
  size_t off = 0;
  while (off < wire.size()) {
    ssize_t n = ::send(fd, wire.data() + off, wire.size() - off, MSG_NOSIGNAL | MSG_DONTWAIT);
    if (n > 0) {
      off += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    return false;
  }
  return true;
}

StatsBroadcaster::StatsBroadcaster(const AdmissionGate& gate, const FileUsageTracker& usage,
                                   ConnectionRegistry& subscribers, std::chrono::milliseconds interval)
  : gate_(gate), usage_(usage), subscribers_(subscribers), interval_(interval) {}

StatsBroadcaster::~StatsBroadcaster() { stop(); }

void StatsBroadcaster::start() {
  if (thread_.joinable()) return;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    stop_ = false;
  }
  thread_ = std::thread(&StatsBroadcaster::run, this);
}

void StatsBroadcaster::stop() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

StatsMessage StatsBroadcaster::snapshot() const {
  StatsMessage msg;
  msg.active = static_cast<uint64_t>(std::clamp(gate_.active(), 0, gate_.capacity()));
  MostDownloaded top = usage_.most_downloaded();
  msg.name = std::move(top.name);
  msg.count = top.count;
  return msg;
}

size_t StatsBroadcaster::tick() {
  const std::vector<uint8_t> wire = snapshot().encode();

  // Sends happen outside the registry lock.
  std::vector<int64_t> dead;
  for (const auto& sub : subscribers_.entries()) {
    if (peer_closed(sub.second) || !push_frame(sub.second, wire))
      dead.push_back(sub.first);
  }

  size_t pruned = subscribers_.prune(dead);
  for (int64_t id : dead)
    log_info("stats", "dropped connection_id:" + std::to_string(id));
  return pruned;
}

void StatsBroadcaster::run() {
  std::unique_lock<std::mutex> lk(mtx_);
  while (!stop_) {
    if (cv_.wait_for(lk, interval_, [this] { return stop_; })) break;
    lk.unlock();
    tick();
    lk.lock();
  }
}
