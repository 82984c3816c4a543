#pragma once

#include <optional>
#include <vector>

#include "hailstone/classify/classification_state.hpp"
#include "hailstone/common/diagnostic.hpp"
#include "hailstone/common/integer.hpp"
#include "hailstone/orbit/orbit_record.hpp"
#include "hailstone/rule/rule.hpp"

namespace hailstone::orbit {

struct BatchResult {
  // One record per start value in [rule.MinStart(), total), ascending, up to
  // the first failing start.
  std::vector<OrbitRecord> records;

  // Why the batch stopped early, if it did.
  std::optional<Diagnostic> error;

  [[nodiscard]] auto Complete() const -> bool {
    return !error.has_value();
  }
};

// Simulate every start in [rule.MinStart(), total) against a caller-owned
// classification state. The first orbit failure stops the batch: it is
// logged and returned in BatchResult::error together with the records
// computed before it.
auto RunBatch(
    Value total, const rule::Rule& rule, classify::ClassificationState& state)
    -> BatchResult;

// RunBatch with a classification state built fresh for this call.
auto GenerateBatch(Value total, const rule::Rule& rule)
    -> std::vector<OrbitRecord>;

}  // namespace hailstone::orbit
