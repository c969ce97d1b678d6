#pragma once
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <mutex>
#include <netinet/in.h>
#include <optional>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <thread>
#include <unistd.h>
#include <vector>

inline void die(const std::string& msg) {
  std::cerr << "[FATAL] " << msg << " (errno=" << errno << ": " << std::strerror(errno) << ")\n";
  std::exit(1);
}

// One mutex for stdout/stderr so worker lines do not interleave.
inline std::mutex& log_mutex() {
  static std::mutex m;
  return m;
}

inline void log_info(const std::string& tag, const std::string& msg) {
  std::lock_guard<std::mutex> lk(log_mutex());
  std::cout << "[" << tag << "] " << msg << "\n";
}

inline void log_error(const std::string& tag, const std::string& msg) {
  std::lock_guard<std::mutex> lk(log_mutex());
  std::cerr << "[" << tag << "] " << msg << "\n";
}

inline void set_reuse(int fd) {
  int yes = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0)
    die("setsockopt(SO_REUSEADDR) failed");
}

inline void set_nonblock(int fd, bool nb=true) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) die("fcntl(F_GETFL) failed");
  if (fcntl(fd, F_SETFL, nb ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK)) < 0)
    die("fcntl(F_SETFL) failed");
}

// 0 clears the timeout (blocking reads wait forever).
inline bool set_recv_timeout(int fd, int timeout_ms) {
  timeval tv{};
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = (timeout_ms % 1000) * 1000;
  return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

struct SockAddr {
  std::string ip;
  uint16_t port{};
};

// Connected blocking TCP socket, or -1 with errno set (ETIMEDOUT when the
// handshake outlives timeout_ms).
inline int connect_with_timeout(const SockAddr& to, int timeout_ms) {
  sockaddr_in sa{};
  sa.sin_family = AF_INET;
  sa.sin_port = htons(to.port);
  if (::inet_pton(AF_INET, to.ip.c_str(), &sa.sin_addr) != 1) {
    errno = EINVAL;
    return -1;
  }

  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) return -1;
  set_nonblock(fd, true);

  int err = 0;
  if (::connect(fd, (sockaddr*)&sa, sizeof(sa)) < 0) {
    err = errno;
    if (err == EINPROGRESS) {
      pollfd pfd{fd, POLLOUT, 0};
      int rc = ::poll(&pfd, 1, timeout_ms);
      socklen_t len = sizeof(err);
      if (rc == 0) err = ETIMEDOUT;
      else if (rc < 0) err = errno;
      else if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) err = errno;
    }
  }
  if (err != 0) {
    ::close(fd);
    errno = err;
    return -1;
  }
  set_nonblock(fd, false);
  return fd;
}

using Clock = std::chrono::steady_clock;
inline int64_t now_us() {
  return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now().time_since_epoch()).count();
}

inline int64_t ms_since(int64_t start_us) {
  return (now_us() - start_us) / 1000;
}

