#include "file_server.hpp"
#include <arpa/inet.h>
#include <fstream>

using json = nlohmann::json;

void ServerConfig::validate() const {
  if (max_connections <= 0) throw std::invalid_argument("max_connections must be positive");
  if (chunk_bytes == 0) throw std::invalid_argument("chunk_bytes must be positive");
  if (max_request_bytes == 0) throw std::invalid_argument("max_request_bytes must be positive");
  if (stats_interval_ms <= 0) throw std::invalid_argument("stats_interval_ms must be positive");
  if (admission_backoff_ms <= 0) throw std::invalid_argument("admission_backoff_ms must be positive");
  if (client_read_timeout_ms < 0) throw std::invalid_argument("client_read_timeout_ms must not be negative");
  if (root_name.empty()) throw std::invalid_argument("root_name must not be empty");
}

ServerConfig config_from_json(const json& j) {
  ServerConfig cfg;
  cfg.listen.ip   = j.value("listen_ip", cfg.listen.ip);
  cfg.listen.port = j.value("listen_port", cfg.listen.port);
  cfg.max_connections        = j.value("max_connections", cfg.max_connections);
  cfg.root_name              = j.value("root_name", cfg.root_name);
  cfg.storage_base           = j.value("storage_base", cfg.storage_base);
  cfg.stats_interval_ms      = j.value("stats_interval_ms", cfg.stats_interval_ms);
  cfg.admission_backoff_ms   = j.value("admission_backoff_ms", cfg.admission_backoff_ms);
  cfg.chunk_bytes            = j.value("chunk_bytes", cfg.chunk_bytes);
  cfg.max_request_bytes      = j.value("max_request_bytes", cfg.max_request_bytes);
  cfg.client_read_timeout_ms = j.value("client_read_timeout_ms", cfg.client_read_timeout_ms);
  cfg.upload_is_fatal        = j.value("upload_is_fatal", cfg.upload_is_fatal);
  cfg.stats_holds_slot       = j.value("stats_holds_slot", cfg.stats_holds_slot);
  cfg.remove_root_on_exit    = j.value("remove_root_on_exit", cfg.remove_root_on_exit);
  return cfg;
}

ServerConfig load_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) die("cannot open " + path);
  json j;
  try {
    in >> j;
  } catch (const json::exception& e) {
    die("bad config " + path + ": " + e.what());
  }
  ServerConfig cfg;
  try {
    cfg = config_from_json(j);
    cfg.validate();
  } catch (const std::exception& e) {
    die("bad config " + path + ": " + e.what());
  }
  return cfg;
}

FileServer::FileServer(const ServerConfig& cfg)
  : cfg_(cfg),
    storage_(cfg.storage_base, cfg.root_name),
    gate_(cfg.max_connections, std::chrono::milliseconds(cfg.admission_backoff_ms)),
    dispatcher_(cfg.upload_is_fatal),
    ctx_{storage_, usage_, subscribers_, cfg.chunk_bytes, cfg.max_request_bytes},
    broadcaster_(gate_, usage_, subscribers_, std::chrono::milliseconds(cfg.stats_interval_ms)) {
  cfg_.validate();
  storage_.ensure_root_exists();
  listen_fd_ = create_listen_socket(cfg_.listen, port_);

  dispatcher_.register_handler(CommandType::Download, std::make_unique<DownloadHandler>());
  dispatcher_.register_handler(CommandType::Statistics, std::make_unique<StatisticsHandler>());
}

FileServer::~FileServer() {
  stop();
  if (listen_fd_ >= 0) ::close(listen_fd_);
}

int FileServer::create_listen_socket(const SockAddr& sa, uint16_t& bound_port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) throw InitError(std::string("socket failed: ") + std::strerror(errno));

  set_reuse(fd);

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(sa.port);
  if (::inet_pton(AF_INET, sa.ip.c_str(), &addr.sin_addr) != 1) {
    ::close(fd);
    throw InitError("bad listen address " + sa.ip);
  }

  if (::bind(fd, (sockaddr*)&addr, sizeof(addr)) < 0 || ::listen(fd, 1024) < 0) {
    std::string reason = std::strerror(errno);
    ::close(fd);
    throw InitError(sa.ip + ":" + std::to_string(sa.port) + ": " + reason);
  }

  sockaddr_in bound{}; socklen_t len = sizeof(bound);
  if (::getsockname(fd, (sockaddr*)&bound, &len) == 0) bound_port = ntohs(bound.sin_port);
  else bound_port = sa.port;
  return fd;
}

void FileServer::register_handler(CommandType command, std::unique_ptr<ICommandHandler> handler) {
  dispatcher_.register_handler(command, std::move(handler));
}

void FileServer::start_stats() {
  broadcaster_.start();
}

// Refused once stop() has begun, so nothing slips past its shutdown sweep.
bool FileServer::track(int fd) {
  std::lock_guard<std::mutex> lk(live_mtx_);
  if (stop_) return false;
  live_fds_.insert(fd);
  return true;
}

// Closing under the lock keeps stop() from shutting down a recycled descriptor.
void FileServer::untrack_and_close(int fd) {
  std::lock_guard<std::mutex> lk(live_mtx_);
  live_fds_.erase(fd);
  ::close(fd);
}

void FileServer::spawn_worker(int fd, ICommandHandler* handler) {
  bool refused = false;
  {
    // stop() sets stop_ before it waits on workers_, so checking both under
    // live_mtx_ means no worker can start once that wait has finished.
    std::lock_guard<std::mutex> lk(live_mtx_);
    if (stop_) {
      live_fds_.erase(fd);
      ::close(fd);
      refused = true;
    } else {
      ++workers_;
    }
  }
  if (refused) {
    gate_.release();
    return;
  }
  std::thread([this, fd, handler]() {
    bool kept = handler->handle(fd, ctx_);
    if (kept) {
      std::lock_guard<std::mutex> lk(live_mtx_);
      live_fds_.erase(fd);
    } else {
      untrack_and_close(fd);
    }
    gate_.release();

    std::lock_guard<std::mutex> lk(live_mtx_);
    --workers_;
    live_cv_.notify_all();
  }).detach();
}

void FileServer::handle_connection(int fd) {
  if (!track(fd)) {
    ::close(fd);
    gate_.release();
    return;
  }
  if (cfg_.client_read_timeout_ms > 0) set_recv_timeout(fd, cfg_.client_read_timeout_ms);

  auto routed = dispatcher_.route(fd);
  if (auto* err = std::get_if<ServeError>(&routed)) {
    report_error_to_client(fd, *err);
    untrack_and_close(fd);
    gate_.release();
    return;
  }

  Route r = std::get<Route>(routed);
  if (r.handler->runs_on_worker()) {
    spawn_worker(fd, r.handler);
    return;
  }

  bool kept = r.handler->handle(fd, ctx_);
  if (kept) {
    std::lock_guard<std::mutex> lk(live_mtx_);
    live_fds_.erase(fd);
  } else {
    untrack_and_close(fd);
  }
  if (!(kept && cfg_.stats_holds_slot)) gate_.release();
}

void FileServer::serve() {
  log_info("server", "listening on " + cfg_.listen.ip + ":" + std::to_string(port_)
           + " root=" + storage_.root().string()
           + " max_connections=" + std::to_string(cfg_.max_connections));

  while (!stop_) {
    sockaddr_in cli{}; socklen_t len = sizeof(cli);
    int cfd = ::accept(listen_fd_, (sockaddr*)&cli, &len);
    if (cfd < 0) {
      if (stop_) break;
      if (errno == EINTR || errno == ECONNABORTED) continue;
      die("accept failed");
    }

    if (!gate_.acquire()) {
      ::close(cfd);
      break;
    }
    handle_connection(cfd);
  }
  log_info("server", "accept loop stopped");
}

void FileServer::stop() {
  bool expected = false;
  if (!stop_.compare_exchange_strong(expected, true)) return;

  gate_.close();
  if (listen_fd_ >= 0) ::shutdown(listen_fd_, SHUT_RDWR);
  subscribers_.shutdown_all();
  broadcaster_.stop();

  {
    std::unique_lock<std::mutex> lk(live_mtx_);
    for (int fd : live_fds_) ::shutdown(fd, SHUT_RDWR);
    live_cv_.wait(lk, [this] { return workers_ == 0; });
  }

  subscribers_.close_all();
  if (cfg_.remove_root_on_exit) storage_.remove_root();
  log_info("server", "stopped");
}
