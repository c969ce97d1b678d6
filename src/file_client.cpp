#include "file_client.hpp"

int FileClient::connect_with_timeout() const {
  return ::connect_with_timeout(cfg_.target, cfg_.connect_timeout_ms);
}

std::optional<std::string> FileClient::request(uint8_t command, const std::string& body) const {
  int fd = connect_with_timeout();
  if (fd < 0) return std::nullopt;

  std::string out(1, static_cast<char>(command));
  out += body;
  if (!send_all(fd, out.data(), out.size())) {
    ::close(fd);
    return std::nullopt;
  }
  // Nothing more is coming from us; lets the server see EOF on short bodies.
  ::shutdown(fd, SHUT_WR);

  std::string received;
  std::vector<char> buf(cfg_.recv_chunk);
  while (true) {
    ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
    if (n == 0) break;
    if (n < 0) {
      if (errno == EINTR) continue;
      // A reset after the server wrote its error text still leaves us the bytes.
      break;
    }
    received.append(buf.data(), static_cast<size_t>(n));
  }
  ::close(fd);
  return received;
}

std::optional<std::string> FileClient::download(const std::string& name) const {
  return request(static_cast<uint8_t>(CommandType::Download), "filename=" + name + "|");
}

int FileClient::subscribe() const {
  int fd = connect_with_timeout();
  if (fd < 0) return -1;
  const uint8_t cmd = static_cast<uint8_t>(CommandType::Statistics);
  if (!send_all(fd, &cmd, 1)) {
    ::close(fd);
    return -1;
  }
  return fd;
}
