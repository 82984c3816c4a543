#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "hailstone/common/integer.hpp"

namespace hailstone::orbit {

// Tally of operation ids, ordered by id for stable output.
using OpCounts = std::map<std::string, std::size_t>;

// Result of simulating one starting value.
struct OrbitRecord {
  Value start = 0;

  // Steps until the running value first becomes <= start; unset when the
  // orbit halts (or is capped) before that happens.
  std::optional<std::size_t> first_drop_length;

  // Values from start up to, not including, the first value <= start.
  std::vector<Value> first_orbit;

  // Every value visited, start through the halting value (or up to the cap).
  std::vector<Value> total_orbit;

  // Wheel slot and ordinal within (first_drop_length, slot). Set only for
  // classification-eligible rules run with classification state.
  std::optional<uint64_t> stop_mod;
  std::optional<uint64_t> stop_index;

  // Per-step operation log and tally, for the first orbit and the whole
  // orbit. The step that produces the first-drop value counts toward both.
  std::vector<std::string> first_op_ids;
  OpCounts first_op_counts;
  std::vector<std::string> total_op_ids;
  OpCounts total_op_counts;

  [[nodiscard]] auto IsClassified() const -> bool {
    return stop_mod.has_value() && stop_index.has_value();
  }

  auto operator==(const OrbitRecord&) const -> bool = default;
};

}  // namespace hailstone::orbit
