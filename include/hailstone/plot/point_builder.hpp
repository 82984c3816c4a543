#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "hailstone/common/diagnostic.hpp"
#include "hailstone/orbit/orbit_record.hpp"

namespace hailstone::plot {

struct Point3 {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;

  auto operator==(const Point3&) const -> bool = default;
};

// Projects one orbit record into plot coordinates.
using PointBuilder = std::function<Point3(const orbit::OrbitRecord&)>;

struct ScatterPoint {
  Point3 position;
  std::optional<std::string> label;
  std::optional<std::string> color;
};

struct Scatter {
  std::vector<ScatterPoint> points;
};

// One point per record. `labels` and `colors` may be empty; otherwise they
// must hold exactly one entry per record.
auto BuildScatter(
    std::span<const orbit::OrbitRecord> records, const PointBuilder& builder,
    std::span<const std::string> labels = {},
    std::span<const std::string> colors = {}) -> Result<Scatter>;

// x = first drop length, y = stop_mod, z = stop_index; 0 where unset.
auto StopCoordinates(const orbit::OrbitRecord& record) -> Point3;

// Records carrying a stop_mod and stop_index, in input order.
auto ClassifiedOnly(std::span<const orbit::OrbitRecord> records)
    -> std::vector<orbit::OrbitRecord>;

// Writes "x,y,z,label,color" rows with a header line.
auto WriteScatterCsv(const Scatter& scatter, const std::filesystem::path& path)
    -> Result<void>;

}  // namespace hailstone::plot
