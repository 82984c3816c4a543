#pragma once

#include "hailstone/classify/classification_state.hpp"
#include "hailstone/common/diagnostic.hpp"
#include "hailstone/common/integer.hpp"
#include "hailstone/orbit/orbit_record.hpp"
#include "hailstone/rule/rule.hpp"

namespace hailstone::orbit {

// Simulate one orbit from `start` under `rule`.
//
// Runs until rule.IsHalt() holds or the orbit reaches rule.MaxIterations()
// values. When `state` is given and the rule is classification-eligible, the
// orbit is classified exactly once, at its first drop, mutating `state`.
//
// Errors (fatal for this orbit only):
// - start below rule.MinStart()
// - first-drop length missing from the lookup
// - a transform overflowing Value
auto SimulateOrbit(
    Value start, const rule::Rule& rule,
    classify::ClassificationState* state = nullptr) -> Result<OrbitRecord>;

}  // namespace hailstone::orbit
