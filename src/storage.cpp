#include "storage.hpp"
#include <system_error>

namespace fs = std::filesystem;

Storage::Storage(fs::path base, std::string root_name)
  : root_(std::move(base) / root_name) {}

const fs::path& Storage::ensure_root_exists() {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec || !fs::is_directory(root_, ec))
    throw InitError("cannot create root " + root_.string() + ": " + ec.message());
  return root_;
}

void Storage::remove_root() {
  std::error_code ec;
  fs::remove_all(root_, ec);
}

std::optional<ServeError> Storage::open_for_read(const std::string& name, std::ifstream& in) const {
  // The OS would stop at an embedded NUL and open a different file.
  if (name.find('\0') != std::string::npos) return storage_error("invalid file name");
  const fs::path rel(name);
  if (rel.empty() || rel.is_absolute()) return storage_error("invalid file name");
  for (const auto& part : rel) {
    if (part == "..") return storage_error("invalid file name");
  }

  const fs::path full = root_ / rel;
  std::error_code ec;
  if (!fs::is_regular_file(full, ec)) return storage_error("file not found: " + name);

  in.open(full, std::ios::binary);
  if (!in) return storage_error("cannot open " + name);
  return std::nullopt;
}
