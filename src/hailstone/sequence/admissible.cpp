#include "hailstone/sequence/admissible.hpp"

#include <cmath>
#include <cstddef>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "hailstone/common/internal_error.hpp"
#include "hailstone/rule/rule.hpp"

namespace hailstone::sequence {

auto GenerateAdmissibleTerms(
    std::size_t term_count, std::string_view rule_name, std::size_t limit)
    -> std::vector<BigInt> {
  std::vector<BigInt> terms;
  if (rule_name != rule::kClassicRuleName) {
    return terms;
  }

  const double ln2 = std::log(2.0);
  const double ln3 = std::log(3.0);

  // Slots 1..limit+1 are used; slot 0 is padding.
  std::vector<BigInt> x(limit + 2);
  std::vector<BigInt> y(limit + 2);
  x[1] = 1;

  std::size_t b = 1;
  while (terms.size() < term_count) {
    ++b;
    if (b + 1 > limit + 1) {
      common::ThrowInternalError(
          "GenerateAdmissibleTerms",
          fmt::format(
              "{} terms need more than {} working slots (got {} terms)",
              term_count, limit, terms.size()));
    }

    for (std::size_t c = 2; c <= b + 1; ++c) {
      y[c] = x[c] + x[c - 1];
    }
    for (std::size_t c = 2; c <= b + 1; ++c) {
      x[c] = y[c];
    }

    BigInt candidate = 0;
    for (std::size_t c = 1; c <= b + 1; ++c) {
      if (static_cast<double>(b + 1 - c) * ln3 <
          static_cast<double>(b) * ln2) {
        candidate += x[c];
        x[c] = 0;
      }
    }
    if (candidate != 0) {
      terms.push_back(std::move(candidate));
    }
  }
  return terms;
}

}  // namespace hailstone::sequence
