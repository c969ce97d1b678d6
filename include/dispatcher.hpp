#pragma once
#include "command_handler.hpp"
#include "protocol.hpp"
#include <map>
#include <memory>
#include <variant>

struct Route {
  CommandType command;
  ICommandHandler* handler;
};

// Reads the command byte of a fresh connection and picks its handler.
class Dispatcher {
public:
  explicit Dispatcher(bool upload_is_fatal = false) : upload_is_fatal_(upload_is_fatal) {}

  // Replaces any handler already bound to command. Not safe once serving has begun.
  void register_handler(CommandType command, std::unique_ptr<ICommandHandler> handler);
  bool has_handler(CommandType command) const;

  std::variant<Route, ServeError> route(int fd) const;

private:
  bool upload_is_fatal_;
  std::map<CommandType, std::unique_ptr<ICommandHandler>> handlers_;
};
