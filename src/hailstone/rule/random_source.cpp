#include "hailstone/rule/random_source.hpp"

#include <cstdint>
#include <random>

namespace hailstone::rule {

MersenneSource::MersenneSource() : engine_(std::random_device{}()) {
}

MersenneSource::MersenneSource(uint64_t seed) : engine_(seed) {
}

auto MersenneSource::NextUniform() -> double {
  return distribution_(engine_);
}

}  // namespace hailstone::rule
