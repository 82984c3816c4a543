#include "hailstone/orbit/simulator.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "hailstone/common/internal_error.hpp"

namespace hailstone::orbit {

namespace {

void RecordOp(
    std::vector<std::string>& op_ids, OpCounts& op_counts,
    const std::string& op_id) {
  op_ids.push_back(op_id);
  ++op_counts[op_id];
}

// Orbit for the minimal start value of m3a1 (1) and m3a3 (3). The general
// loop cannot find a first drop there: the start is also the halting value.
auto ShortcutRecord(Value start, std::string_view increase_op) -> OrbitRecord {
  std::string increase(increase_op);
  std::string halve(rule::kHalveOpId);

  OrbitRecord record{.start = start};
  record.first_drop_length = 1;
  record.first_orbit = {start};
  record.total_orbit = {start, 4 * start, 2 * start};
  record.stop_mod = 1;
  record.stop_index = 1;
  RecordOp(record.first_op_ids, record.first_op_counts, increase);
  RecordOp(record.total_op_ids, record.total_op_counts, increase);
  RecordOp(record.total_op_ids, record.total_op_counts, halve);
  return record;
}

auto ApplyStep(const rule::Rule& rule, Value current) -> rule::Step {
  if (rule.IsDecrease(current)) {
    return rule.Decrease(current);
  }
  if (rule.IsIncrease(current)) {
    return rule.Increase(current);
  }
  common::ThrowInternalError(
      "SimulateOrbit",
      fmt::format(
          "rule {} neither decreases nor increases {}", rule.Name(), current));
}

}  // namespace

auto SimulateOrbit(
    Value start, const rule::Rule& rule, classify::ClassificationState* state)
    -> Result<OrbitRecord> {
  if (start < rule.MinStart()) {
    return std::unexpected(
        Diagnostic::Error(
            fmt::format(
                "start {} is below the minimum {} for rule {}", start,
                rule.MinStart(), rule.Name())));
  }

  if (rule.Name() == rule::kClassicRuleName && start == 1) {
    return ShortcutRecord(start, rule::kClassicRuleName);
  }
  if (rule.Name() == rule::kM3a3RuleName && start == 3) {
    return ShortcutRecord(start, rule::kM3a3RuleName);
  }

  bool should_classify =
      state != nullptr && rule::IsClassificationEligible(rule.Name());
  auto max_iterations = rule.MaxIterations();

  OrbitRecord record{.start = start};
  record.total_orbit.push_back(start);
  Value current = start;

  try {
    while (!rule.IsHalt(current)) {
      if (max_iterations && record.total_orbit.size() >= *max_iterations) {
        break;
      }

      rule::Step step = ApplyStep(rule, current);
      current = step.value;
      RecordOp(record.total_op_ids, record.total_op_counts, step.op_id);
      if (!record.first_drop_length) {
        RecordOp(record.first_op_ids, record.first_op_counts, step.op_id);
      }

      if (current <= start && !record.first_drop_length) {
        record.first_orbit = record.total_orbit;
        record.first_drop_length = record.first_orbit.size();

        if (should_classify) {
          auto classification = state->Classify(*record.first_drop_length);
          if (!classification) {
            return std::unexpected(
                std::move(classification.error())
                    .WithNote(fmt::format("while simulating start {}", start)));
          }
          record.stop_mod = classification->slot;
          record.stop_index = classification->ordinal;
        }
      }

      record.total_orbit.push_back(current);
    }
  } catch (const DiagnosticException& e) {
    Diagnostic diag = e.GetDiagnostic();
    return std::unexpected(
        std::move(diag).WithNote(
            fmt::format("while simulating start {}", start)));
  }

  return record;
}

}  // namespace hailstone::orbit
