#include "print.hpp"

#include <cstdio>
#include <string>
#include <string_view>

#include <fmt/color.h>
#include <fmt/core.h>

#include "hailstone/common/diagnostic.hpp"

namespace hailstone::driver {

namespace {

constexpr auto kToolStyle =
    fmt::fg(fmt::terminal_color::white) | fmt::emphasis::bold;

struct KindStyle {
  std::string_view label;
  fmt::terminal_color color;
};

auto StyleOf(DiagKind kind) -> KindStyle {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return {.label = "error:", .color = fmt::terminal_color::bright_red};
    case DiagKind::kWarning:
      return {
          .label = "warning:", .color = fmt::terminal_color::bright_magenta};
    case DiagKind::kNote:
      return {.label = "note:", .color = fmt::terminal_color::bright_cyan};
  }
  return {.label = "error:", .color = fmt::terminal_color::bright_red};
}

// One "hailstone: <kind>: <message>" line on stderr. Primary messages are
// bold, notes are plain.
void PrintLine(DiagKind kind, const std::string& message, bool is_primary) {
  KindStyle style = StyleOf(kind);
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("hailstone", kToolStyle),
      fmt::styled(style.label, fmt::fg(style.color) | fmt::emphasis::bold),
      fmt::styled(
          message, is_primary ? fmt::emphasis::bold : fmt::text_style{}));
}

}  // namespace

void PrintError(const std::string& message) {
  PrintLine(DiagKind::kError, message, true);
}

void PrintWarning(const std::string& message) {
  PrintLine(DiagKind::kWarning, message, true);
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintLine(diag.primary.kind, diag.primary.message, true);
  for (const auto& note : diag.notes) {
    PrintLine(note.kind, note.message, false);
  }
}

}  // namespace hailstone::driver
