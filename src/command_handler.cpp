#include "command_handler.hpp"
#include "common.hpp"
#include "protocol.hpp"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <vector>

static std::mutex g_access_mtx;
static std::unique_ptr<std::ofstream> g_access;
static void ensure_access_log_open() {
  static std::once_flag once;
  std::call_once(once, []{
    const char* p = std::getenv("FS_ACCESS_LOG");
    if (p && *p) {
      g_access = std::make_unique<std::ofstream>(p, std::ios::app);
      if (*g_access) {
        *g_access << "t_us,file,bytes,result\n";
      }
    }
  });
}

static void append_access_log(const std::string& name, uint64_t bytes, const std::string& result) {
  ensure_access_log_open();
  if (g_access && *g_access) {
    std::lock_guard<std::mutex> lk(g_access_mtx);
    *g_access << now_us() << "," << name << "," << bytes << "," << result << "\n";
    g_access->flush();
  }
}

std::optional<ServeError> DownloadHandler::serve(int fd, HandlerContext& ctx, std::string& name,
                                                 uint64_t& bytes_sent) {
  std::string request;
  switch (read_until(fd, '|', ctx.max_request_bytes, request)) {
    case ReadStatus::Error:
      return request_error(std::string("read failed: ") + std::strerror(errno));
    case ReadStatus::LimitReached:
      return request_error("request too long");
    case ReadStatus::Eof:
    case ReadStatus::Terminated:
      break;
  }

  auto matched = RequestMatcher::instance().match_filename(request);
  if (!matched) return request_error("file name not found");
  name = *matched;

  std::ifstream in;
  if (auto err = ctx.storage.open_for_read(name, in)) return err;

  // Counted before streaming: a transfer that dies midway is still an attempt.
  ctx.usage.record(name);

  std::vector<char> buf(ctx.chunk_bytes);
  while (true) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    std::streamsize n = in.gcount();
    if (in.bad()) return storage_error("read failed on " + name);
    if (n <= 0) break;
    if (!send_all(fd, buf.data(), static_cast<size_t>(n)))
      return write_error(std::strerror(errno));
    bytes_sent += static_cast<uint64_t>(n);
    if (in.eof()) break;
  }
  return std::nullopt;
}

bool DownloadHandler::handle(int fd, HandlerContext& ctx) {
  std::string name;
  uint64_t sent = 0;
  const int64_t t0 = now_us();
  auto err = serve(fd, ctx, name, sent);
  if (err) {
    report_error_to_client(fd, *err);
    append_access_log(name, sent, "error");
  } else {
    log_info("download", "sent " + name + " (" + std::to_string(sent) + " bytes, "
             + std::to_string(ms_since(t0)) + " ms)");
    append_access_log(name, sent, "ok");
  }
  return false;
}

bool StatisticsHandler::handle(int fd, HandlerContext& ctx) {
  int64_t id = ctx.subscribers.add(fd);
  log_info("stats", "client with connection_id:" + std::to_string(id) + " registered on metrics endpoint");
  return true;
}
