#pragma once
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>

struct MostDownloaded {
  std::string name = "no files";
  uint64_t count = 0;
};

// Download counts per file name, shared by every worker.
class FileUsageTracker {
public:
  // Counts one download of name; returns the new count.
  uint64_t record(const std::string& name);
  uint64_t count(const std::string& name) const;
  size_t size() const;

  // Highest count wins; equal counts go to the lexicographically smallest name.
  // Empty tracker gives {"no files", 0}.
  MostDownloaded most_downloaded() const;

private:
  mutable std::shared_mutex mtx_;
  std::unordered_map<std::string, uint64_t> counts_;
};
