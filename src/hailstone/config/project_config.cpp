#include "hailstone/config/project_config.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <toml++/toml.hpp>

namespace hailstone::config {

namespace fs = std::filesystem;

namespace {

auto ConfigError(const fs::path& config_path, std::string_view detail)
    -> std::unexpected<Diagnostic> {
  return std::unexpected(
      Diagnostic::HostError(
          fmt::format("{}: {}", config_path.string(), detail)));
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "failed to parse {}: {}", config_path.string(), e.what())));
  }

  ProjectConfig config;
  config.root_dir = config_path.parent_path();

  auto batch = tbl["batch"];
  if (!batch.is_table()) {
    return ConfigError(config_path, "missing [batch] section");
  }

  auto rule = batch["rule"].value<std::string>();
  if (!rule) {
    return ConfigError(config_path, "missing required field 'batch.rule'");
  }
  config.rule = *rule;

  auto total = batch["total"].value<int64_t>();
  if (!total) {
    return ConfigError(config_path, "missing required field 'batch.total'");
  }
  if (*total < 0) {
    return ConfigError(config_path, "'batch.total' must not be negative");
  }
  config.total = static_cast<uint64_t>(*total);

  config.probability = batch["probability"].value<double>();

  if (auto seed = batch["seed"].value<int64_t>()) {
    if (*seed < 0) {
      return ConfigError(config_path, "'batch.seed' must not be negative");
    }
    config.seed = static_cast<uint64_t>(*seed);
  }

  if (auto cap = batch["max_iterations"].value<int64_t>()) {
    if (*cap < 1) {
      return ConfigError(
          config_path, "'batch.max_iterations' must be at least 1");
    }
    config.max_iterations = static_cast<std::size_t>(*cap);
  }

  // Relative store paths are anchored at the config directory
  if (auto path = tbl["store"]["path"].value<std::string>()) {
    fs::path store_path = *path;
    if (store_path.is_relative()) {
      store_path = config.root_dir / store_path;
    }
    config.store_path = std::move(store_path);
  }

  return config;
}

auto StarterConfig() -> std::string {
  return "[batch]\n"
         "rule = \"m3a1\"\n"
         "total = 1000\n"
         "\n"
         "[store]\n"
         "path = \"db/orbit_info.db\"\n";
}

}  // namespace hailstone::config
