#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "hailstone/common/diagnostic.hpp"
#include "hailstone/common/integer.hpp"
#include "hailstone/sequence/admissible.hpp"

namespace hailstone::classify {

// Two-level address assigned to an orbit at first-drop time.
struct Classification {
  uint64_t slot;     // Wheel position (stopping modulus), 1-indexed
  uint64_t ordinal;  // Occurrence count within (length, slot)

  auto operator==(const Classification&) const -> bool = default;
};

// Bookkeeping for first-drop classification.
//
//   lookup[L]        admissible magnitude: how many wheel slots length L has
//   wheel[L]         next slot handed out for length L, wraps to 1
//   index[(L, slot)] orbits assigned so far to that slot
//
// One instance per batch. Classify() mutates it in place; it is not safe to
// share between concurrent batches.
class ClassificationState {
 public:
  ClassificationState(const ClassificationState&) = delete;
  auto operator=(const ClassificationState&) -> ClassificationState& = delete;
  ClassificationState(ClassificationState&&) = default;
  auto operator=(ClassificationState&&) -> ClassificationState& = default;
  ~ClassificationState() = default;

  // Only the base entries for first-drop length 1:
  // lookup[1] = 1, wheel[1] = 1 and the legacy index seed index[1] = 1.
  static auto Seeded() -> ClassificationState;

  // Seeded() plus one entry per allowable dropping time, with the matching
  // admissible term as magnitude. Rules without auxiliary sequences get the
  // seeded state only.
  static auto Build(
      std::string_view rule_name,
      std::size_t term_count = sequence::kDefaultTermCount)
      -> ClassificationState;

  // Register first-drop length `length`: lookup = magnitude, wheel = 1,
  // index[(length, 1)] = 0.
  void AddDroppingTime(std::size_t length, BigInt magnitude);

  // Assign the next wheel slot for `length` and bump its ordinal.
  // Fails when `length` has no lookup entry.
  auto Classify(std::size_t length) -> Result<Classification>;

  [[nodiscard]] auto Contains(std::size_t length) const -> bool {
    return lookup_.contains(length);
  }

  [[nodiscard]] auto Magnitude(std::size_t length) const
      -> std::optional<BigInt>;
  [[nodiscard]] auto NextSlot(std::size_t length) const
      -> std::optional<uint64_t>;
  [[nodiscard]] auto Occurrences(std::size_t length, uint64_t slot) const
      -> std::optional<uint64_t>;

  // Number of first-drop lengths with a lookup entry.
  [[nodiscard]] auto Size() const -> std::size_t {
    return lookup_.size();
  }

  // Base entry kept apart from the (length, slot) index; its key shape never
  // comes out of Classify().
  [[nodiscard]] auto LegacyIndexSeed() const
      -> const absl::flat_hash_map<std::size_t, uint64_t>& {
    return legacy_index_seed_;
  }

 private:
  ClassificationState() = default;

  using IndexKey = std::pair<std::size_t, uint64_t>;

  absl::flat_hash_map<std::size_t, BigInt> lookup_;
  absl::flat_hash_map<std::size_t, uint64_t> wheel_;
  absl::flat_hash_map<IndexKey, uint64_t> index_;
  absl::flat_hash_map<std::size_t, uint64_t> legacy_index_seed_;
};

}  // namespace hailstone::classify
