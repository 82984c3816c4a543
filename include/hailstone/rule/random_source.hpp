#pragma once

#include <cstdint>
#include <random>

namespace hailstone::rule {

// Source of independent uniform draws in [0, 1).
class RandomSource {
 public:
  RandomSource() = default;
  RandomSource(const RandomSource&) = delete;
  RandomSource(RandomSource&&) = delete;
  auto operator=(const RandomSource&) -> RandomSource& = delete;
  auto operator=(RandomSource&&) -> RandomSource& = delete;
  virtual ~RandomSource() = default;

  virtual auto NextUniform() -> double = 0;
};

class MersenneSource final : public RandomSource {
 public:
  // Seeded from std::random_device; draws are not reproducible.
  MersenneSource();
  explicit MersenneSource(uint64_t seed);

  auto NextUniform() -> double override;

 private:
  std::mt19937_64 engine_;
  std::uniform_real_distribution<double> distribution_{0.0, 1.0};
};

}  // namespace hailstone::rule
