#include "hailstone/sequence/dropping_time.hpp"

#include <cmath>
#include <cstddef>
#include <string_view>
#include <vector>

#include "hailstone/rule/rule.hpp"

namespace hailstone::sequence {

auto GenerateDroppingTimes(std::size_t term_count, std::string_view rule_name)
    -> std::vector<std::size_t> {
  std::vector<std::size_t> times;
  if (rule_name != rule::kClassicRuleName) {
    return times;
  }

  const double ln2 = std::log(2.0);
  const double ln3 = std::log(3.0);

  times.reserve(term_count);
  for (std::size_t k = 1; k <= term_count; ++k) {
    double term =
        static_cast<double>(1 + k) + (static_cast<double>(k) * ln3) / ln2;
    times.push_back(static_cast<std::size_t>(std::floor(term)));
  }
  return times;
}

}  // namespace hailstone::sequence
