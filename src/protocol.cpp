#include "protocol.hpp"
#include "common.hpp"
#include <algorithm>
#include <cerrno>

std::optional<CommandType> command_from_byte(uint8_t b) {
  switch (b) {
    case 1: return CommandType::Download;
    case 2: return CommandType::Upload;
    case 3: return CommandType::Statistics;
    default: return std::nullopt;
  }
}

const char* command_name(CommandType c) {
  switch (c) {
    case CommandType::Download:   return "Download";
    case CommandType::Upload:     return "Upload";
    case CommandType::Statistics: return "Statistics";
  }
  return "Unknown";
}

RequestMatcher::RequestMatcher() : pattern_(R"(filename=([^|]+)\|)") {}

const RequestMatcher& RequestMatcher::instance() {
  static const RequestMatcher matcher;
  return matcher;
}

std::optional<std::string> RequestMatcher::match_filename(const std::string& bytes) const {
  std::smatch m;
  if (!std::regex_search(bytes, m, pattern_)) return std::nullopt;
  if (m.size() < 2 || m[1].length() == 0) return std::nullopt;
  return m[1].str();
}

bool send_all(int fd, const void* data, size_t len) {
  const char* p = static_cast<const char*>(data);
  size_t off = 0;
  while (off < len) {
    ssize_t m = ::send(fd, p + off, len - off, MSG_NOSIGNAL);
    if (m < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (m == 0) return false;
    off += static_cast<size_t>(m);
  }
  return true;
}

ReadStatus read_until(int fd, char terminator, size_t limit, std::string& out) {
  while (out.size() < limit) {
    char c;
    ssize_t n = ::recv(fd, &c, 1, 0);
    if (n == 0) return ReadStatus::Eof;
    if (n < 0) {
      if (errno == EINTR) continue;
      return ReadStatus::Error;
    }
    out.push_back(c);
    if (c == terminator) return ReadStatus::Terminated;
  }
  return ReadStatus::LimitReached;
}

std::vector<uint8_t> StatsMessage::encode() const {
  const size_t name_len = std::min<size_t>(name.size(), 255);
  std::vector<uint8_t> out;
  out.reserve(name_len + 3);
  out.push_back(static_cast<uint8_t>(std::min<uint64_t>(active, 255)));
  out.push_back(static_cast<uint8_t>(name_len));
  out.insert(out.end(), name.begin(), name.begin() + name_len);
  out.push_back(static_cast<uint8_t>(std::min<uint64_t>(count, 255)));
  return out;
}

static bool recv_exact(int fd, void* buf, size_t len) {
  char* p = static_cast<char*>(buf);
  size_t total = 0;
  while (total < len) {
    ssize_t n = ::recv(fd, p + total, len - total, 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    total += static_cast<size_t>(n);
  }
  return true;
}

std::optional<StatsMessage> decode_stats(int fd) {
  uint8_t head[2];
  if (!recv_exact(fd, head, sizeof(head))) return std::nullopt;

  StatsMessage msg;
  msg.active = head[0];
  msg.name.resize(head[1]);
  if (head[1] > 0 && !recv_exact(fd, &msg.name[0], head[1])) return std::nullopt;

  uint8_t count = 0;
  if (!recv_exact(fd, &count, 1)) return std::nullopt;
  msg.count = count;
  return msg;
}
