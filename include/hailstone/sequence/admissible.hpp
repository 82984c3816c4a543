#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "hailstone/common/integer.hpp"

namespace hailstone::sequence {

// Working-array headroom of the admissible-term recurrence.
inline constexpr std::size_t kAdmissibleLimit = 1000;

// Term count requested when building classification state. Well inside what
// kAdmissibleLimit supports.
inline constexpr std::size_t kDefaultTermCount = 200;

// Admissible terms (OEIS A100982): for the i-th allowable dropping time, the
// number of residue classes whose orbits first drop after exactly that many
// steps.
//
// Only defined for the classic rule; any other rule name yields an empty
// sequence. Throws InternalError when term_count needs more working slots
// than limit provides.
auto GenerateAdmissibleTerms(
    std::size_t term_count, std::string_view rule_name,
    std::size_t limit = kAdmissibleLimit) -> std::vector<BigInt>;

}  // namespace hailstone::sequence
