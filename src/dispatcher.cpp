#include "dispatcher.hpp"
#include "common.hpp"
#include <cerrno>

void Dispatcher::register_handler(CommandType command, std::unique_ptr<ICommandHandler> handler) {
  log_info("server", std::string("registering ") + command_name(command) + " handler");
  handlers_[command] = std::move(handler);
}

bool Dispatcher::has_handler(CommandType command) const {
  return handlers_.count(command) != 0;
}

std::variant<Route, ServeError> Dispatcher::route(int fd) const {
  uint8_t byte = 0;
  ssize_t n;
  do {
    n = ::recv(fd, &byte, 1, 0);
  } while (n < 0 && errno == EINTR);
  if (n < 0) return command_error(std::strerror(errno));
  if (n == 0) return command_error("connection closed before command byte");

  auto command = command_from_byte(byte);
  if (!command) return command_error("unknown command byte " + std::to_string(byte));

  if (*command == CommandType::Upload) {
    if (upload_is_fatal_) die("upload command received but upload is not implemented");
    return command_error("upload not implemented");
  }

  auto it = handlers_.find(*command);
  if (it == handlers_.end() || !it->second) return command_error("unsupported command type");
  return Route{*command, it->second.get()};
}
