#include "errors.hpp"
#include "common.hpp"
#include "protocol.hpp"

std::string ServeError::describe() const {
  switch (kind) {
    case ErrorKind::Initialization: return "Could not init file server: " + reason;
    case ErrorKind::RequestParse:   return "Could not parse filename in request: " + reason;
    case ErrorKind::CommandParse:   return "Could not parse command in request: " + reason;
    case ErrorKind::StorageRead:    return "Could not read file: " + reason;
    case ErrorKind::ClientWrite:    return "Could not write to client: " + reason;
  }
  return reason;
}

void report_error_to_client(int fd, const ServeError& err) {
  const std::string text = err.describe();
  log_error("server", "reporting to client: " + text);
  if (!send_all(fd, text.data(), text.size())) {
    log_error("server", "error while reporting to client: " + text);
  }
}
