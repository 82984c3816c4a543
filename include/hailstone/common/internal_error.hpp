#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace hailstone::common {

// A broken caller or rule contract: generator capacity, invalid rule
// parameters, a rule that neither decreases nor increases a value. Never
// raised for bad user input; those are Diagnostics.
class InternalError : public std::logic_error {
 public:
  InternalError(std::string_view context, std::string_view detail)
      : std::logic_error(
            fmt::format(
                "internal error in {}: {}\n"
                "This is a bug in hailstone or in the code calling it.",
                context, detail)),
        context_(context) {
  }

  // Function or type that detected the violation
  [[nodiscard]] auto Context() const -> const std::string& {
    return context_;
  }

 private:
  std::string context_;
};

[[noreturn]] inline void ThrowInternalError(
    std::string_view context, std::string_view detail) {
  throw InternalError(context, detail);
}

}  // namespace hailstone::common
