#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "hailstone/common/diagnostic.hpp"

namespace hailstone::config {

inline constexpr std::string_view kConfigFileName = "hailstone.toml";

struct ProjectConfig {
  // [batch]
  std::string rule;
  uint64_t total = 0;
  std::optional<double> probability;
  std::optional<uint64_t> seed;
  std::optional<std::size_t> max_iterations;

  // [store], resolved against root_dir
  std::optional<std::filesystem::path> store_path;

  // Directory where hailstone.toml was found
  std::filesystem::path root_dir;
};

// Search for hailstone.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse hailstone.toml.
// Returns error Diagnostic on parse errors or missing required fields.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

// Contents written by `hailstone init`.
auto StarterConfig() -> std::string;

}  // namespace hailstone::config
