#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "hailstone/classify/classification_state.hpp"
#include "hailstone/common/diagnostic.hpp"
#include "hailstone/common/integer.hpp"
#include "hailstone/orbit/orbit_record.hpp"
#include "hailstone/orbit/simulator.hpp"
#include "hailstone/rule/builtin_rules.hpp"
#include "hailstone/rule/random_source.hpp"

namespace hailstone::orbit {
namespace {

// Always returns the same draw.
class ConstantSource final : public rule::RandomSource {
 public:
  explicit ConstantSource(double draw) : draw_(draw) {
  }

  auto NextUniform() -> double override {
    return draw_;
  }

 private:
  double draw_;
};

auto SimulateOrFail(
    Value start, const rule::Rule& rule,
    classify::ClassificationState* state = nullptr) -> OrbitRecord {
  auto record = SimulateOrbit(start, rule, state);
  EXPECT_TRUE(record.has_value()) << record.error().primary.message;
  return record.value_or(OrbitRecord{});
}

// =============================================================================
// Classic rule
// =============================================================================

TEST(SimulatorTest, ClassicStartOneShortcut) {
  auto rule = rule::MakeClassicRule();
  auto record = SimulateOrFail(1, *rule);

  EXPECT_EQ(record.first_drop_length, 1);
  EXPECT_EQ(record.first_orbit, (std::vector<Value>{1}));
  EXPECT_EQ(record.total_orbit, (std::vector<Value>{1, 4, 2}));
  EXPECT_EQ(record.stop_mod, 1);
  EXPECT_EQ(record.stop_index, 1);
  EXPECT_EQ(record.first_op_ids, (std::vector<std::string>{"m3a1"}));
  EXPECT_EQ(record.total_op_ids, (std::vector<std::string>{"m3a1", "d2"}));
  EXPECT_EQ(record.total_op_counts, (OpCounts{{"m3a1", 1}, {"d2", 1}}));
}

TEST(SimulatorTest, ShortcutLeavesStateAlone) {
  auto rule = rule::MakeClassicRule();
  auto state = classify::ClassificationState::Seeded();
  (void)SimulateOrFail(1, *rule, &state);
  EXPECT_FALSE(state.Occurrences(1, 1).has_value());
  EXPECT_EQ(state.NextSlot(1), 1);
}

TEST(SimulatorTest, TwentySeven) {
  auto rule = rule::MakeClassicRule();
  auto state = classify::ClassificationState::Build("m3a1");
  auto record = SimulateOrFail(27, *rule, &state);

  ASSERT_EQ(record.total_orbit.size(), 112);
  std::vector<Value> tail(
      record.total_orbit.end() - 5, record.total_orbit.end());
  EXPECT_EQ(tail, (std::vector<Value>{16, 8, 4, 2, 1}));

  EXPECT_EQ(record.first_drop_length, 96);
  EXPECT_EQ(record.first_orbit.size(), 96);
  EXPECT_EQ(record.first_orbit.front(), 27);
  for (Value v : record.first_orbit) {
    if (v != 27) {
      EXPECT_GT(v, 27);
    }
  }

  EXPECT_EQ(record.total_op_ids.size(), 111);
  EXPECT_EQ(record.total_op_counts, (OpCounts{{"m3a1", 41}, {"d2", 70}}));
  EXPECT_EQ(record.first_op_ids.size(), 96);

  EXPECT_EQ(record.stop_mod, 1);
  EXPECT_EQ(record.stop_index, 1);
}

TEST(SimulatorTest, ClassifiedOnceEvenWhenOrbitDipsAgain) {
  auto rule = rule::MakeClassicRule();
  auto state = classify::ClassificationState::Build("m3a1");
  (void)SimulateOrFail(27, *rule, &state);

  EXPECT_EQ(state.Occurrences(96, 1), 1);
  EXPECT_EQ(state.NextSlot(96), 2);
}

TEST(SimulatorTest, EvenStartDropsImmediately) {
  auto rule = rule::MakeClassicRule();
  auto record = SimulateOrFail(6, *rule);
  EXPECT_EQ(record.first_drop_length, 1);
  EXPECT_EQ(record.first_orbit, (std::vector<Value>{6}));
  EXPECT_EQ(record.first_op_ids, (std::vector<std::string>{"d2"}));
  EXPECT_EQ(
      record.total_orbit, (std::vector<Value>{6, 3, 10, 5, 16, 8, 4, 2, 1}));
}

TEST(SimulatorTest, DropStepCountsTowardFirstOps) {
  auto rule = rule::MakeClassicRule();
  auto record = SimulateOrFail(7, *rule);
  ASSERT_EQ(record.first_drop_length, 11);
  EXPECT_EQ(record.first_op_ids.size(), 11);
  EXPECT_EQ(record.first_op_counts, (OpCounts{{"m3a1", 4}, {"d2", 7}}));
}

TEST(SimulatorTest, WithoutStateNothingIsClassified) {
  auto rule = rule::MakeClassicRule();
  auto record = SimulateOrFail(7, *rule);
  EXPECT_TRUE(record.first_drop_length.has_value());
  EXPECT_FALSE(record.IsClassified());
}

TEST(SimulatorTest, WheelWrapAcrossOrbits) {
  auto rule = rule::MakeClassicRule();
  auto state = classify::ClassificationState::Seeded();
  state.AddDroppingTime(3, 2);

  std::vector<std::pair<uint64_t, uint64_t>> got;
  for (Value start : {5, 9, 13}) {
    auto record = SimulateOrFail(start, *rule, &state);
    ASSERT_EQ(record.first_drop_length, 3) << "start " << start;
    got.emplace_back(*record.stop_mod, *record.stop_index);
  }
  using Slots = std::vector<std::pair<uint64_t, uint64_t>>;
  EXPECT_EQ(got, (Slots{{1, 1}, {2, 1}, {1, 2}}));
}

// =============================================================================
// Errors
// =============================================================================

TEST(SimulatorTest, MissingLookupEntryFailsOrbit) {
  auto rule = rule::MakeClassicRule();
  auto state = classify::ClassificationState::Seeded();
  auto record = SimulateOrbit(3, *rule, &state);

  ASSERT_FALSE(record.has_value());
  EXPECT_EQ(record.error().primary.message, "first drop 6 not in lookup");
  ASSERT_EQ(record.error().notes.size(), 1);
  EXPECT_EQ(record.error().notes[0].message, "while simulating start 3");
}

TEST(SimulatorTest, StartBelowMinimumIsError) {
  auto rule = rule::MakeM3a3Rule();
  auto record = SimulateOrbit(2, *rule);
  ASSERT_FALSE(record.has_value());
  EXPECT_NE(
      record.error().primary.message.find("below the minimum 3"),
      std::string::npos);
}

TEST(SimulatorTest, OverflowIsError) {
  auto rule = rule::MakeClassicRule();
  Value start = std::numeric_limits<Value>::max();
  auto record = SimulateOrbit(start, *rule);
  ASSERT_FALSE(record.has_value());
  EXPECT_NE(
      record.error().primary.message.find("overflow"), std::string::npos);
  ASSERT_EQ(record.error().notes.size(), 1);
}

TEST(SimulatorTest, LargestPeakBelowOverflow) {
  auto rule = rule::MakeClassicRule();
  auto record = SimulateOrbit(8528817511, *rule);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(
      std::ranges::max(record->total_orbit), Value{18144594937356598024ULL});
  EXPECT_EQ(record->total_orbit.back(), Value{1});
}

TEST(SimulatorTest, FirstOverflowingStart) {
  auto rule = rule::MakeClassicRule();
  auto record = SimulateOrbit(12327829503, *rule);
  ASSERT_FALSE(record.has_value());
  EXPECT_NE(
      record.error().primary.message.find("overflow"), std::string::npos);
  ASSERT_EQ(record.error().notes.size(), 1);
  EXPECT_EQ(
      record.error().notes[0].message, "while simulating start 12327829503");
}

// =============================================================================
// Other rules
// =============================================================================

TEST(SimulatorTest, M3a3StartThreeShortcut) {
  auto rule = rule::MakeM3a3Rule();
  auto record = SimulateOrFail(3, *rule);
  EXPECT_EQ(record.first_orbit, (std::vector<Value>{3}));
  EXPECT_EQ(record.total_orbit, (std::vector<Value>{3, 12, 6}));
  EXPECT_EQ(record.first_op_ids, (std::vector<std::string>{"m3a3"}));
  EXPECT_EQ(record.total_op_ids, (std::vector<std::string>{"m3a3", "d2"}));
}

TEST(SimulatorTest, IneligibleRuleIgnoresState) {
  auto rule = rule::MakeM3a3Rule();
  auto state = classify::ClassificationState::Seeded();
  auto record = SimulateOrFail(5, *rule, &state);
  EXPECT_TRUE(record.first_drop_length.has_value());
  EXPECT_FALSE(record.stop_mod.has_value());
  EXPECT_FALSE(record.stop_index.has_value());
}

TEST(SimulatorTest, CapStopsOrbitWithoutDrop) {
  auto rule = rule::MakeM3a5Rule(5);
  auto record = SimulateOrFail(7, *rule);
  EXPECT_EQ(record.total_orbit, (std::vector<Value>{7, 26, 13, 44, 22}));
  EXPECT_FALSE(record.first_drop_length.has_value());
  EXPECT_TRUE(record.first_orbit.empty());
  EXPECT_EQ(record.first_op_ids.size(), 4);
}

TEST(SimulatorTest, CapAfterDrop) {
  auto rule = rule::MakeM3a5Rule(5);
  auto record = SimulateOrFail(9, *rule);
  EXPECT_EQ(record.total_orbit, (std::vector<Value>{9, 32, 16, 8, 4}));
  EXPECT_EQ(record.first_drop_length, 3);
  EXPECT_EQ(record.first_orbit, (std::vector<Value>{9, 32, 16}));
  EXPECT_EQ(record.first_op_counts, (OpCounts{{"m3a5", 1}, {"d2", 2}}));
}

TEST(SimulatorTest, M3a5CycleRunsToDefaultCap) {
  auto rule = rule::MakeM3a5Rule();
  auto record = SimulateOrFail(1, *rule);
  EXPECT_EQ(record.total_orbit.size(), rule::kDefaultM3a5MaxIterations);
  EXPECT_EQ(record.first_drop_length, 4);
  EXPECT_EQ(record.first_orbit, (std::vector<Value>{1, 8, 4, 2}));
}

TEST(SimulatorTest, ProbabilisticAlwaysPlusOne) {
  rule::ProbabilisticRule rule(0.5, std::make_shared<ConstantSource>(0.0));
  auto record = SimulateOrFail(7, rule);
  EXPECT_EQ(
      record.total_orbit,
      (std::vector<Value>{
          7, 22, 11, 34, 17, 52, 26, 13, 40, 20, 10, 5, 16, 8, 4, 2}));
  EXPECT_EQ(record.first_drop_length, 11);
  EXPECT_EQ(record.total_op_counts, (OpCounts{{"m3a1", 5}, {"d2", 10}}));
}

TEST(SimulatorTest, ProbabilisticAlwaysPlusThree) {
  rule::ProbabilisticRule rule(0.5, std::make_shared<ConstantSource>(0.9));
  auto state = classify::ClassificationState::Seeded();
  auto record = SimulateOrFail(5, rule, &state);
  EXPECT_EQ(
      record.total_orbit,
      (std::vector<Value>{5, 18, 9, 30, 15, 48, 24, 12, 6, 3}));
  EXPECT_EQ(record.first_drop_length, 9);
  EXPECT_EQ(record.total_op_counts, (OpCounts{{"m3a3", 3}, {"d2", 6}}));
  EXPECT_FALSE(record.IsClassified());
}

}  // namespace
}  // namespace hailstone::orbit
