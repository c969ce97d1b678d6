#pragma once
#include "connection_registry.hpp"
#include "errors.hpp"
#include "storage.hpp"
#include "usage_tracker.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

struct HandlerContext {
  const Storage& storage;
  FileUsageTracker& usage;
  ConnectionRegistry& subscribers;
  size_t chunk_bytes = 1024;
  size_t max_request_bytes = 4096;
};

class ICommandHandler {
public:
  virtual ~ICommandHandler() = default;
  // true: the server spawns a worker thread for handle(); false: handle() runs on the accept loop.
  virtual bool runs_on_worker() const = 0;
  // Returns true when the handler kept fd; otherwise the caller closes it.
  virtual bool handle(int fd, HandlerContext& ctx) = 0;
};

// "filename=<name>|" then the raw file bytes in chunk_bytes writes.
class DownloadHandler : public ICommandHandler {
public:
  bool runs_on_worker() const override { return true; }
  bool handle(int fd, HandlerContext& ctx) override;

  // Everything but the error reporting; exposed for tests.
  std::optional<ServeError> serve(int fd, HandlerContext& ctx, std::string& name, uint64_t& bytes_sent);
};

// Parks the connection in the subscriber registry. Reads nothing.
class StatisticsHandler : public ICommandHandler {
public:
  bool runs_on_worker() const override { return false; }
  bool handle(int fd, HandlerContext& ctx) override;
};
