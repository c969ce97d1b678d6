#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <vector>

// Wire command codes; the first byte of every connection.
enum class CommandType : uint8_t {
  Download   = 1,
  Upload     = 2,
  Statistics = 3,
};

std::optional<CommandType> command_from_byte(uint8_t b);
const char* command_name(CommandType c);

// Compiled once on first use, shared read-only by every worker.
class RequestMatcher {
public:
  static const RequestMatcher& instance();

  // Returns the <name> of the first "filename=<name>|" in bytes, if any.
  std::optional<std::string> match_filename(const std::string& bytes) const;

private:
  RequestMatcher();
  std::regex pattern_;
};

// Sends all of len bytes. False on any error, including a closed peer.
bool send_all(int fd, const void* data, size_t len);

enum class ReadStatus { Terminated, Eof, LimitReached, Error };

// Reads one byte at a time up to and including terminator, so nothing after it is consumed.
ReadStatus read_until(int fd, char terminator, size_t limit, std::string& out);

// Periodic push to subscribers: [active:u8][name_len:u8][name][count:u8].
struct StatsMessage {
  uint64_t active = 0;
  std::string name;
  uint64_t count = 0;

  // Numeric fields saturate at 255; the name is cut to 255 bytes.
  std::vector<uint8_t> encode() const;
};

// Client side: blocks until one full message arrives.
std::optional<StatsMessage> decode_stats(int fd);
