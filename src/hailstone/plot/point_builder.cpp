#include "hailstone/plot/point_builder.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace hailstone::plot {

namespace {

auto CheckLength(
    std::span<const std::string> list, std::string_view what,
    std::size_t expected) -> Result<void> {
  if (!list.empty() && list.size() != expected) {
    return std::unexpected(
        Diagnostic::Error(
            fmt::format(
                "{} {} given for {} records", list.size(), what, expected)));
  }
  return {};
}

}  // namespace

auto BuildScatter(
    std::span<const orbit::OrbitRecord> records, const PointBuilder& builder,
    std::span<const std::string> labels, std::span<const std::string> colors)
    -> Result<Scatter> {
  if (auto ok = CheckLength(labels, "labels", records.size()); !ok) {
    return std::unexpected(std::move(ok.error()));
  }
  if (auto ok = CheckLength(colors, "colors", records.size()); !ok) {
    return std::unexpected(std::move(ok.error()));
  }

  Scatter scatter;
  scatter.points.reserve(records.size());
  for (std::size_t i = 0; i < records.size(); ++i) {
    ScatterPoint point{.position = builder(records[i])};
    if (!labels.empty()) {
      point.label = labels[i];
    }
    if (!colors.empty()) {
      point.color = colors[i];
    }
    scatter.points.push_back(std::move(point));
  }
  return scatter;
}

auto StopCoordinates(const orbit::OrbitRecord& record) -> Point3 {
  return Point3{
      .x = static_cast<double>(record.first_drop_length.value_or(0)),
      .y = static_cast<double>(record.stop_mod.value_or(0)),
      .z = static_cast<double>(record.stop_index.value_or(0)),
  };
}

auto ClassifiedOnly(std::span<const orbit::OrbitRecord> records)
    -> std::vector<orbit::OrbitRecord> {
  std::vector<orbit::OrbitRecord> classified;
  for (const auto& record : records) {
    if (record.IsClassified()) {
      classified.push_back(record);
    }
  }
  return classified;
}

auto WriteScatterCsv(const Scatter& scatter, const std::filesystem::path& path)
    -> Result<void> {
  std::ofstream out(path);
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot open '{}' for writing", path.string())));
  }

  out << "x,y,z,label,color\n";
  for (const auto& point : scatter.points) {
    out << fmt::format(
        "{},{},{},{},{}\n", point.position.x, point.position.y,
        point.position.z, point.label.value_or(""), point.color.value_or(""));
  }

  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("failed writing '{}'", path.string())));
  }
  return {};
}

}  // namespace hailstone::plot
