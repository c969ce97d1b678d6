#include "file_server.hpp"
#include <csignal>
#include <iostream>
#include <pthread.h>

int main(int argc, char** argv) {
  std::signal(SIGPIPE, SIG_IGN);
  // Usage: fileserve [config.json] [--port=N] [--root=NAME] [--max-connections=N]
  ServerConfig cfg;
  int arg0 = 1;
  if (argc >= 2 && std::string(argv[1]).rfind("--", 0) != 0) {
    cfg = load_config(argv[1]);
    arg0 = 2;
  }
  try {
    for (int i = arg0; i < argc; ++i) {
      std::string a = argv[i];
      if (a.rfind("--port=", 0) == 0) cfg.listen.port = static_cast<uint16_t>(std::stoi(a.substr(7)));
      else if (a.rfind("--root=", 0) == 0) cfg.root_name = a.substr(7);
      else if (a.rfind("--max-connections=", 0) == 0) cfg.max_connections = std::stoi(a.substr(18));
      else die("unknown argument: " + a);
    }
    cfg.validate();
  } catch (const std::exception& e) {
    die(std::string("bad arguments: ") + e.what());
  }

  // SIGINT/SIGTERM go to a dedicated thread so stop() never runs in signal context.
  sigset_t sigs;
  sigemptyset(&sigs);
  sigaddset(&sigs, SIGINT);
  sigaddset(&sigs, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

  std::unique_ptr<FileServer> server;
  try {
    server = std::make_unique<FileServer>(cfg);
  } catch (const InitError& e) {
    die(e.what());
  }

  std::thread waiter([&server, sigs]() {
    int sig = 0;
    sigwait(&sigs, &sig);
    log_info("server", "caught signal " + std::to_string(sig) + ", shutting down");
    server->stop();
  });

  server->start_stats();
  server->serve();
  // serve() only returns once the waiter has called stop().
  waiter.join();
  return 0;
}
