#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
  Initialization,
  RequestParse,
  CommandParse,
  StorageRead,
  ClientWrite,
};

// Per-connection failure. describe() is the exact text written to the client.
struct ServeError {
  ErrorKind kind;
  std::string reason;

  std::string describe() const;
};

inline ServeError request_error(std::string reason) { return {ErrorKind::RequestParse, std::move(reason)}; }
inline ServeError command_error(std::string reason) { return {ErrorKind::CommandParse, std::move(reason)}; }
inline ServeError storage_error(std::string reason) { return {ErrorKind::StorageRead, std::move(reason)}; }
inline ServeError write_error(std::string reason)   { return {ErrorKind::ClientWrite, std::move(reason)}; }

// Thrown when the server cannot start (bind, listen, root directory).
class InitError : public std::runtime_error {
public:
  explicit InitError(const std::string& reason)
    : std::runtime_error("Could not init file server: " + reason) {}
};

// Writes describe() to fd, logging instead of failing if the peer is gone.
void report_error_to_client(int fd, const ServeError& err);
