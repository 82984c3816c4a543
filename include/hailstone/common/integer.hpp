#pragma once

#include <cstdint>
#include <limits>

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

#include "hailstone/common/diagnostic.hpp"

namespace hailstone {

// Orbit values. Transforms check for overflow instead of wrapping. Every m3a1
// orbit from a start below 12327829503 peaks under 2^64; that start is the
// first to overflow.
using Value = uint64_t;

// Admissible-term counts outgrow 64 bits long before term 200.
using BigInt = boost::multiprecision::cpp_int;

namespace common {

// Computes multiplier * v + addend, throwing a DiagnosticException when the
// result does not fit in a Value.
inline auto CheckedAffine(Value v, Value multiplier, Value addend) -> Value {
  constexpr Value kMax = std::numeric_limits<Value>::max();
  if (v > (kMax - addend) / multiplier) {
    throw DiagnosticException(
        Diagnostic::Error(
            fmt::format(
                "value overflow computing {}*{}+{}", multiplier, v, addend)));
  }
  return (multiplier * v) + addend;
}

}  // namespace common

}  // namespace hailstone
