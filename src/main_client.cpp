#include "file_client.hpp"
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>

static void usage() {
  std::cerr << "usage: fileserve_client download <name> [ip] [port] [--out=path] [--repeat=N]\n"
            << "       fileserve_client stats [ip] [port] [--count=N]\n";
  std::exit(2);
}

static int run_download(const FileClient& cli, const std::string& name, const std::string& out_path, int repeat) {
  for (int i = 0; i < repeat; ++i) {
    const int64_t t0 = now_us();
    auto body = cli.download(name);
    if (!body) die("download " + name);
    double latency_s = (now_us() - t0) / 1e6;
    double throughput_kb_s = latency_s > 0 ? (body->size() / 1024.0) / latency_s : 0.0;
    std::cout << "Received " << body->size() << " bytes in " << latency_s
              << " s | Throughput: " << throughput_kb_s << " KB/s\n";

    if (!out_path.empty()) {
      std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
      if (!out) die("cannot open " + out_path);
      out.write(body->data(), static_cast<std::streamsize>(body->size()));
    }
  }
  return 0;
}

static int run_stats(const FileClient& cli, int count) {
  int fd = cli.subscribe();
  if (fd < 0) die("subscribe");
  for (int i = 0; count <= 0 || i < count; ++i) {
    auto msg = FileClient::read_stats(fd);
    if (!msg) {
      std::cerr << "server closed the stats connection\n";
      ::close(fd);
      return 1;
    }
    std::cout << "active=" << msg->active << " most_downloaded=" << msg->name
              << " count=" << msg->count << "\n";
  }
  ::close(fd);
  return 0;
}

int main(int argc, char** argv) {
  std::signal(SIGPIPE, SIG_IGN);
  if (argc < 2) usage();
  const std::string mode = argv[1];

  ClientConfig cfg;
  std::vector<std::string> positional;
  std::string out_path;
  int repeat = 1;
  int count = 0;
  try {
    for (int i = 2; i < argc; ++i) {
      std::string a = argv[i];
      if (a.rfind("--out=", 0) == 0) out_path = a.substr(6);
      else if (a.rfind("--repeat=", 0) == 0) repeat = std::stoi(a.substr(9));
      else if (a.rfind("--count=", 0) == 0) count = std::stoi(a.substr(8));
      else positional.push_back(a);
    }
  } catch (const std::exception&) {
    usage();
  }

  size_t next = 0;
  std::string name;
  if (mode == "download") {
    if (positional.empty()) usage();
    name = positional[next++];
  } else if (mode != "stats") {
    usage();
  }
  if (positional.size() > next) cfg.target.ip = positional[next++];
  if (positional.size() > next) {
    try {
      cfg.target.port = static_cast<uint16_t>(std::stoi(positional[next++]));
    } catch (const std::exception&) {
      usage();
    }
  }

  FileClient cli(cfg);
  if (mode == "download") return run_download(cli, name, out_path, repeat);
  return run_stats(cli, count);
}
