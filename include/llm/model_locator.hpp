#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace replyd::llm {

struct LocatorOptions {
  std::string explicit_path{};
  std::string filename{};
  std::vector<std::string> search_dirs{};
  std::uint64_t min_size_bytes{1000};
};

// Resolves the weights file. An explicit path wins; otherwise the search
// directories are tried in order. A file counts only if it exists and is
// larger than the minimum size, so truncated downloads are skipped.
class ModelLocator {
 public:
  explicit ModelLocator(LocatorOptions options);

  [[nodiscard]] std::optional<std::filesystem::path> resolve() const;

  // First candidate location, for error reporting when nothing resolves.
  [[nodiscard]] std::filesystem::path expected_path() const;

  [[nodiscard]] bool usable(const std::filesystem::path& path) const;

 private:
  [[nodiscard]] std::vector<std::filesystem::path> candidates() const;

  LocatorOptions options_;
};

}  // namespace replyd::llm
