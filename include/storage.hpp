#pragma once
#include "errors.hpp"
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

// Serving root at <base>/<root_name>; every download resolves inside it.
class Storage {
public:
  Storage(std::filesystem::path base, std::string root_name);

  // mkdir -p on the root. Throws InitError if it cannot be created.
  const std::filesystem::path& ensure_root_exists();
  // Best effort; errors are ignored.
  void remove_root();

  std::optional<ServeError> open_for_read(const std::string& name, std::ifstream& in) const;

  const std::filesystem::path& root() const { return root_; }

private:
  std::filesystem::path root_;
};
