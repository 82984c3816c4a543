#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "hailstone/common/diagnostic.hpp"
#include "hailstone/common/integer.hpp"

namespace hailstone::common {

// Number of distinct values that appear in every list. Zero for no lists.
auto CountCommonElements(std::span<const std::vector<Value>> lists)
    -> std::size_t;

// Number of positions at which all lists hold the same value. Zero for no
// lists. Lists of different lengths are rejected.
auto CountMatchingIndexes(std::span<const std::vector<Value>> lists)
    -> Result<std::size_t>;

}  // namespace hailstone::common
