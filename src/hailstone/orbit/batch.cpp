#include "hailstone/orbit/batch.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "hailstone/orbit/simulator.hpp"

namespace hailstone::orbit {

namespace {

constexpr Value kMaxReserve = Value{1} << 16;

}  // namespace

auto RunBatch(
    Value total, const rule::Rule& rule, classify::ClassificationState& state)
    -> BatchResult {
  BatchResult result;
  Value first = rule.MinStart();
  if (total <= first) {
    spdlog::debug("batch {}: empty range [{}, {})", rule.Name(), first, total);
    return result;
  }

  spdlog::debug(
      "batch {}: simulating starts [{}, {})", rule.Name(), first, total);
  // total is caller input and may exceed what memory can hold
  result.records.reserve(std::min<Value>(total - first, kMaxReserve));

  for (Value start = first; start < total; ++start) {
    auto record = SimulateOrbit(start, rule, &state);
    if (!record) {
      spdlog::error(
          "batch {} stopped at start {}: {}", rule.Name(), start,
          record.error().primary.message);
      result.error = std::move(record.error());
      break;
    }
    result.records.push_back(std::move(*record));
  }

  spdlog::debug(
      "batch {}: {} records{}", rule.Name(), result.records.size(),
      result.Complete() ? "" : " (partial)");
  return result;
}

auto GenerateBatch(Value total, const rule::Rule& rule)
    -> std::vector<OrbitRecord> {
  auto state = classify::ClassificationState::Build(rule.Name());
  return RunBatch(total, rule, state).records;
}

}  // namespace hailstone::orbit
