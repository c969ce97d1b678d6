#pragma once
#include "admission_gate.hpp"
#include "command_handler.hpp"
#include "common.hpp"
#include "connection_registry.hpp"
#include "dispatcher.hpp"
#include "stats_broadcaster.hpp"
#include "storage.hpp"
#include "usage_tracker.hpp"
#include <atomic>
#include <condition_variable>
#include <nlohmann/json.hpp>
#include <set>

struct ServerConfig {
  SockAddr listen { "127.0.0.1", 8089 };  // port 0 picks an ephemeral port
  int max_connections = 10;
  std::string root_name = "fileserve";
  std::string storage_base = "/tmp";
  int stats_interval_ms = 1000;
  int admission_backoff_ms = 6000;
  size_t chunk_bytes = 1024;
  size_t max_request_bytes = 4096;
  int client_read_timeout_ms = 0;  // 0 = wait forever
  bool upload_is_fatal = false;
  bool stats_holds_slot = false;
  bool remove_root_on_exit = false;

  // Throws std::invalid_argument naming the first bad field.
  void validate() const;
};

ServerConfig load_config(const std::string& path);
ServerConfig config_from_json(const nlohmann::json& j);

class FileServer {
public:
  explicit FileServer(const ServerConfig& cfg);
  ~FileServer();
  FileServer(const FileServer&) = delete;
  FileServer& operator=(const FileServer&) = delete;

  void register_handler(CommandType command, std::unique_ptr<ICommandHandler> handler);

  void start_stats();
  void serve();  // blocking accept loop, returns after stop()
  void stop();

  uint16_t port() const { return port_; }
  const ServerConfig& config() const { return cfg_; }
  const AdmissionGate& gate() const { return gate_; }
  const FileUsageTracker& usage() const { return usage_; }
  const ConnectionRegistry& subscribers() const { return subscribers_; }
  StatsBroadcaster& broadcaster() { return broadcaster_; }

private:
  ServerConfig cfg_;
  Storage storage_;
  AdmissionGate gate_;
  FileUsageTracker usage_;
  ConnectionRegistry subscribers_;
  Dispatcher dispatcher_;
  HandlerContext ctx_;
  StatsBroadcaster broadcaster_;

  int listen_fd_ = -1;
  uint16_t port_ = 0;
  std::atomic<bool> stop_{false};

  // Sockets currently being dispatched or served by a worker; stop() shuts them down.
  std::mutex live_mtx_;
  std::condition_variable live_cv_;
  std::set<int> live_fds_;
  int workers_ = 0;

  void handle_connection(int fd);
  void spawn_worker(int fd, ICommandHandler* handler);
  bool track(int fd);
  void untrack_and_close(int fd);

  static int create_listen_socket(const SockAddr& sa, uint16_t& bound_port);
};
