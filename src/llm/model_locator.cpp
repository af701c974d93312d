#include "llm/model_locator.hpp"

#include <system_error>
#include <utility>

namespace replyd::llm {

ModelLocator::ModelLocator(LocatorOptions options) : options_(std::move(options)) {}

std::optional<std::filesystem::path> ModelLocator::resolve() const {
  for (const auto& candidate : candidates()) {
    if (usable(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

std::filesystem::path ModelLocator::expected_path() const {
  const auto all = candidates();
  if (all.empty()) {
    return std::filesystem::path(options_.filename);
  }
  return all.front();
}

bool ModelLocator::usable(const std::filesystem::path& path) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec) || ec) {
    return false;
  }
  const auto size = std::filesystem::file_size(path, ec);
  return !ec && size > options_.min_size_bytes;
}

std::vector<std::filesystem::path> ModelLocator::candidates() const {
  std::vector<std::filesystem::path> paths;
  if (!options_.explicit_path.empty()) {
    paths.emplace_back(options_.explicit_path);
  }
  if (!options_.filename.empty()) {
    for (const auto& dir : options_.search_dirs) {
      paths.push_back(std::filesystem::path(dir) / options_.filename);
    }
  }
  return paths;
}

}  // namespace replyd::llm
