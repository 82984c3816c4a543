#include "hailstone/classify/classification_state.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "hailstone/common/internal_error.hpp"
#include "hailstone/sequence/admissible.hpp"
#include "hailstone/sequence/dropping_time.hpp"

namespace hailstone::classify {

auto ClassificationState::Seeded() -> ClassificationState {
  ClassificationState state;
  state.lookup_[1] = 1;
  state.wheel_[1] = 1;
  state.legacy_index_seed_[1] = 1;
  return state;
}

auto ClassificationState::Build(
    std::string_view rule_name, std::size_t term_count)
    -> ClassificationState {
  ClassificationState state = Seeded();

  std::vector<BigInt> magnitudes =
      sequence::GenerateAdmissibleTerms(term_count, rule_name);
  std::vector<std::size_t> lengths =
      sequence::GenerateDroppingTimes(term_count, rule_name);
  if (magnitudes.size() != lengths.size()) {
    common::ThrowInternalError(
        "ClassificationState::Build",
        fmt::format(
            "{} admissible terms for {} dropping times", magnitudes.size(),
            lengths.size()));
  }

  for (std::size_t i = 0; i < lengths.size(); ++i) {
    state.AddDroppingTime(lengths[i], std::move(magnitudes[i]));
  }
  return state;
}

void ClassificationState::AddDroppingTime(
    std::size_t length, BigInt magnitude) {
  lookup_[length] = std::move(magnitude);
  wheel_[length] = 1;
  index_[IndexKey{length, 1}] = 0;
}

auto ClassificationState::Classify(std::size_t length)
    -> Result<Classification> {
  auto lookup_it = lookup_.find(length);
  if (lookup_it == lookup_.end()) {
    return std::unexpected(
        Diagnostic::Error(fmt::format("first drop {} not in lookup", length)));
  }

  uint64_t& next_slot = wheel_.try_emplace(length, 1).first->second;
  if (next_slot > lookup_it->second) {
    next_slot = 1;
  }

  uint64_t slot = next_slot;
  ++next_slot;

  uint64_t& occurrences = index_[IndexKey{length, slot}];
  ++occurrences;

  return Classification{.slot = slot, .ordinal = occurrences};
}

auto ClassificationState::Magnitude(std::size_t length) const
    -> std::optional<BigInt> {
  auto it = lookup_.find(length);
  if (it == lookup_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ClassificationState::NextSlot(std::size_t length) const
    -> std::optional<uint64_t> {
  auto it = wheel_.find(length);
  if (it == wheel_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ClassificationState::Occurrences(std::size_t length, uint64_t slot) const
    -> std::optional<uint64_t> {
  auto it = index_.find(IndexKey{length, slot});
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace hailstone::classify
