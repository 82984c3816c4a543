#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "hailstone/common/diagnostic.hpp"
#include "hailstone/common/integer.hpp"
#include "hailstone/rule/random_source.hpp"
#include "hailstone/rule/rule.hpp"

namespace hailstone::rule {

inline constexpr std::size_t kDefaultM3a5MaxIterations = 100;
inline constexpr double kDefaultProbability = 0.5;

// Halve even values, map odd values to 3v + addend, halt at halt_value.
// Covers m3a1 (classic), m3a3 and m3a5.
class AffineRule final : public Rule {
 public:
  AffineRule(
      std::string name, Value min_start, Value addend, Value halt_value,
      std::optional<std::size_t> max_iterations = std::nullopt);

  [[nodiscard]] auto IsHalt(Value v) const -> bool override {
    return v == halt_value_;
  }
  [[nodiscard]] auto IsDecrease(Value v) const -> bool override {
    return v % 2 == 0;
  }
  [[nodiscard]] auto IsIncrease(Value v) const -> bool override {
    return v % 2 != 0;
  }

  [[nodiscard]] auto Decrease(Value v) const -> Step override;
  [[nodiscard]] auto Increase(Value v) const -> Step override;
  [[nodiscard]] auto Describe() const -> std::string override;

 private:
  Value addend_;
  Value halt_value_;
  std::string increase_op_;
};

// Halve even values; map odd values to 3v+1 with probability p, otherwise
// 3v+3. One independent draw per Increase call. Halts at any value <= 3.
class ProbabilisticRule final : public Rule {
 public:
  ProbabilisticRule(double probability, std::shared_ptr<RandomSource> source);

  [[nodiscard]] auto IsHalt(Value v) const -> bool override {
    return v <= 3;
  }
  [[nodiscard]] auto IsDecrease(Value v) const -> bool override {
    return v % 2 == 0;
  }
  [[nodiscard]] auto IsIncrease(Value v) const -> bool override {
    return v % 2 != 0;
  }

  [[nodiscard]] auto Decrease(Value v) const -> Step override;
  [[nodiscard]] auto Increase(Value v) const -> Step override;
  [[nodiscard]] auto Describe() const -> std::string override;

  [[nodiscard]] auto Probability() const -> double {
    return probability_;
  }

 private:
  double probability_;
  std::shared_ptr<RandomSource> source_;
};

auto MakeClassicRule() -> std::unique_ptr<Rule>;
auto MakeM3a3Rule() -> std::unique_ptr<Rule>;
auto MakeM3a5Rule(
    std::optional<std::size_t> max_iterations = kDefaultM3a5MaxIterations)
    -> std::unique_ptr<Rule>;
auto MakeProbabilisticRule(
    double probability, std::shared_ptr<RandomSource> source)
    -> std::unique_ptr<Rule>;

struct RuleOptions {
  double probability = kDefaultProbability;
  // Seed for the probabilistic rule; nondeterministic when unset.
  std::optional<uint64_t> seed;
  // Replaces the rule's own cap when set.
  std::optional<std::size_t> max_iterations;
};

// Build a built-in rule by name. Unknown names and out-of-range options are
// reported as errors.
auto MakeRule(std::string_view name, const RuleOptions& options = {})
    -> Result<std::unique_ptr<Rule>>;

auto BuiltinRuleNames() -> std::span<const std::string_view>;

}  // namespace hailstone::rule
