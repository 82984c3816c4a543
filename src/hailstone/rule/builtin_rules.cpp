#include "hailstone/rule/builtin_rules.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "hailstone/common/internal_error.hpp"

namespace hailstone::rule {

namespace {

constexpr Value kTripleMultiplier = 3;

constexpr std::array<std::string_view, 4> kBuiltinRuleNames = {
    kClassicRuleName, kM3a3RuleName, kM3a5RuleName, kProbabilisticRuleName};

constexpr std::array<std::string_view, 1> kClassificationEligible = {
    kClassicRuleName};

auto IncreaseOpId(Value addend) -> std::string {
  return fmt::format("m3a{}", addend);
}

auto Halve(Value v) -> Step {
  return Step{.value = v / 2, .op_id = std::string(kHalveOpId)};
}

}  // namespace

auto IsClassificationEligible(std::string_view rule_name) -> bool {
  return std::ranges::find(kClassificationEligible, rule_name) !=
         kClassificationEligible.end();
}

AffineRule::AffineRule(
    std::string name, Value min_start, Value addend, Value halt_value,
    std::optional<std::size_t> max_iterations)
    : Rule(std::move(name), min_start, max_iterations),
      addend_(addend),
      halt_value_(halt_value),
      increase_op_(IncreaseOpId(addend)) {
}

auto AffineRule::Decrease(Value v) const -> Step {
  return Halve(v);
}

auto AffineRule::Increase(Value v) const -> Step {
  return Step{
      .value = common::CheckedAffine(v, kTripleMultiplier, addend_),
      .op_id = increase_op_,
  };
}

auto AffineRule::Describe() const -> std::string {
  std::string text = fmt::format(
      "{}: halt at {}, even -> v/2, odd -> 3v+{}, start >= {}", Name(),
      halt_value_, addend_, MinStart());
  if (auto cap = MaxIterations()) {
    text += fmt::format(", cap {}", *cap);
  }
  return text;
}

ProbabilisticRule::ProbabilisticRule(
    double probability, std::shared_ptr<RandomSource> source)
    : Rule(std::string(kProbabilisticRuleName), 1),
      probability_(probability),
      source_(std::move(source)) {
  if (!(probability_ >= 0.0 && probability_ <= 1.0)) {
    common::ThrowInternalError(
        "ProbabilisticRule",
        fmt::format("probability {} outside [0, 1]", probability_));
  }
  if (source_ == nullptr) {
    common::ThrowInternalError("ProbabilisticRule", "null random source");
  }
}

auto ProbabilisticRule::Decrease(Value v) const -> Step {
  return Halve(v);
}

auto ProbabilisticRule::Increase(Value v) const -> Step {
  constexpr Value kAddendOne = 1;
  constexpr Value kAddendThree = 3;
  Value addend = source_->NextUniform() < probability_ ? kAddendOne
                                                       : kAddendThree;
  return Step{
      .value = common::CheckedAffine(v, kTripleMultiplier, addend),
      .op_id = IncreaseOpId(addend),
  };
}

auto ProbabilisticRule::Describe() const -> std::string {
  return fmt::format(
      "{}: halt at <= 3, even -> v/2, odd -> 3v+1 (p={}) else 3v+3, "
      "start >= {}",
      Name(), probability_, MinStart());
}

auto MakeClassicRule() -> std::unique_ptr<Rule> {
  return std::make_unique<AffineRule>(std::string(kClassicRuleName), 1, 1, 1);
}

auto MakeM3a3Rule() -> std::unique_ptr<Rule> {
  return std::make_unique<AffineRule>(std::string(kM3a3RuleName), 3, 3, 3);
}

auto MakeM3a5Rule(std::optional<std::size_t> max_iterations)
    -> std::unique_ptr<Rule> {
  return std::make_unique<AffineRule>(
      std::string(kM3a5RuleName), 1, 5, 5, max_iterations);
}

auto MakeProbabilisticRule(
    double probability, std::shared_ptr<RandomSource> source)
    -> std::unique_ptr<Rule> {
  return std::make_unique<ProbabilisticRule>(probability, std::move(source));
}

auto MakeRule(std::string_view name, const RuleOptions& options)
    -> Result<std::unique_ptr<Rule>> {
  if (options.max_iterations && *options.max_iterations == 0) {
    return std::unexpected(
        Diagnostic::Error("max_iterations must be at least 1"));
  }

  std::unique_ptr<Rule> rule;
  if (name == kClassicRuleName) {
    rule = MakeClassicRule();
  } else if (name == kM3a3RuleName) {
    rule = MakeM3a3Rule();
  } else if (name == kM3a5RuleName) {
    rule = MakeM3a5Rule();
  } else if (name == kProbabilisticRuleName) {
    if (!(options.probability >= 0.0 && options.probability <= 1.0)) {
      return std::unexpected(
          Diagnostic::Error(
              fmt::format(
                  "probability must be in [0, 1], got {}",
                  options.probability)));
    }
    std::shared_ptr<RandomSource> source;
    if (options.seed) {
      source = std::make_shared<MersenneSource>(*options.seed);
    } else {
      source = std::make_shared<MersenneSource>();
    }
    rule = MakeProbabilisticRule(options.probability, std::move(source));
  } else {
    return std::unexpected(
        Diagnostic::Error(fmt::format("unknown rule '{}'", name))
            .WithNote(
                fmt::format(
                    "known rules: {}", fmt::join(kBuiltinRuleNames, ", "))));
  }

  if (options.max_iterations) {
    rule->SetMaxIterations(options.max_iterations);
  }
  return rule;
}

auto BuiltinRuleNames() -> std::span<const std::string_view> {
  return kBuiltinRuleNames;
}

}  // namespace hailstone::rule
