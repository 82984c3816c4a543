#include "hailstone/common/list_compare.hpp"

#include <algorithm>
#include <cstddef>
#include <expected>
#include <span>
#include <unordered_set>
#include <vector>

#include <fmt/format.h>

namespace hailstone::common {

auto CountCommonElements(std::span<const std::vector<Value>> lists)
    -> std::size_t {
  if (lists.empty()) {
    return 0;
  }

  std::unordered_set<Value> common(lists.front().begin(), lists.front().end());
  for (const auto& list : lists.subspan(1)) {
    std::unordered_set<Value> present(list.begin(), list.end());
    std::erase_if(common, [&](Value v) { return !present.contains(v); });
  }
  return common.size();
}

auto CountMatchingIndexes(std::span<const std::vector<Value>> lists)
    -> Result<std::size_t> {
  if (lists.empty()) {
    return 0;
  }

  std::size_t length = lists.front().size();
  for (const auto& list : lists) {
    if (list.size() != length) {
      return std::unexpected(
          Diagnostic::Error(
              fmt::format(
                  "all lists must have the same length ({} vs {})", length,
                  list.size())));
    }
  }

  std::size_t count = 0;
  for (std::size_t i = 0; i < length; ++i) {
    bool all_equal = std::ranges::all_of(lists, [&](const auto& list) {
      return list[i] == lists.front()[i];
    });
    if (all_equal) {
      ++count;
    }
  }
  return count;
}

}  // namespace hailstone::common
