#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "hailstone/common/integer.hpp"

namespace hailstone::rule {

inline constexpr std::string_view kClassicRuleName = "m3a1";
inline constexpr std::string_view kM3a3RuleName = "m3a3";
inline constexpr std::string_view kM3a5RuleName = "m3a5";
inline constexpr std::string_view kProbabilisticRuleName = "probabilistic";

inline constexpr std::string_view kHalveOpId = "d2";

// Result of one transform: the next value and the symbolic operation that
// produced it.
struct Step {
  Value value;
  std::string op_id;
};

// A Collatz-type rule: halting test, step selection and the two transforms.
//
// For every reachable value v that does not halt, exactly one of
// IsDecrease(v) / IsIncrease(v) holds; callers check IsDecrease first.
// A rule either halts from every start >= MinStart() or sets
// MaxIterations() so that the simulator stops on its own.
class Rule {
 public:
  Rule(
      std::string name, Value min_start,
      std::optional<std::size_t> max_iterations = std::nullopt)
      : name_(std::move(name)),
        min_start_(min_start),
        max_iterations_(max_iterations) {
  }

  Rule(const Rule&) = delete;
  Rule(Rule&&) = delete;
  auto operator=(const Rule&) -> Rule& = delete;
  auto operator=(Rule&&) -> Rule& = delete;
  virtual ~Rule() = default;

  [[nodiscard]] auto Name() const -> const std::string& {
    return name_;
  }

  [[nodiscard]] auto MinStart() const -> Value {
    return min_start_;
  }

  // Cap on orbit length, counting the starting value.
  [[nodiscard]] auto MaxIterations() const -> std::optional<std::size_t> {
    return max_iterations_;
  }

  void SetMaxIterations(std::optional<std::size_t> max_iterations) {
    max_iterations_ = max_iterations;
  }

  [[nodiscard]] virtual auto IsHalt(Value v) const -> bool = 0;
  [[nodiscard]] virtual auto IsDecrease(Value v) const -> bool = 0;
  [[nodiscard]] virtual auto IsIncrease(Value v) const -> bool = 0;

  // Transforms throw DiagnosticException when the result overflows Value.
  [[nodiscard]] virtual auto Decrease(Value v) const -> Step = 0;
  [[nodiscard]] virtual auto Increase(Value v) const -> Step = 0;

  // One-line human readable summary.
  [[nodiscard]] virtual auto Describe() const -> std::string = 0;

 private:
  std::string name_;
  Value min_start_;
  std::optional<std::size_t> max_iterations_;
};

// Only rules named here have auxiliary sequences, so only their orbits get a
// stopping modulus and index.
auto IsClassificationEligible(std::string_view rule_name) -> bool;

}  // namespace hailstone::rule
