#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace hailstone::sequence {

// Allowable dropping times (OEIS A122437): term k (1-indexed) is
// floor(1 + k + k * ln3 / ln2), evaluated in double precision.
//
// Only defined for the classic rule; any other rule name yields an empty
// sequence.
auto GenerateDroppingTimes(std::size_t term_count, std::string_view rule_name)
    -> std::vector<std::size_t>;

}  // namespace hailstone::sequence
