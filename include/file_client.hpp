#pragma once
#include "common.hpp"
#include "protocol.hpp"
#include <optional>

struct ClientConfig {
  SockAddr target { "127.0.0.1", 8089 };
  int connect_timeout_ms = 1500;
  size_t recv_chunk = 40960;
};

// Talks the file server protocol. Every call opens its own connection.
class FileClient {
public:
  explicit FileClient(ClientConfig cfg): cfg_(std::move(cfg)) {}

  // Sends 0x01 + "filename=<name>|" and reads until the server closes.
  // Whatever arrived is returned, file bytes or error text alike.
  std::optional<std::string> download(const std::string& name) const;

  // Raw request body, for malformed or partial requests. Empty body sends only the command byte.
  std::optional<std::string> request(uint8_t command, const std::string& body) const;

  // Sends 0x03 and returns the open socket (caller closes), or -1.
  int subscribe() const;
  static std::optional<StatsMessage> read_stats(int fd) { return decode_stats(fd); }

  int connect_with_timeout() const;

private:
  ClientConfig cfg_;
};
