#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace hailstone {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Orbit or classification failure
  kHostError,  // I/O, database, malformed external input
  kWarning,    // Non-fatal
  kNote,       // Auxiliary message
};

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: failure while simulating or classifying an orbit
  static auto Error(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kError, .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: host error (filesystem, database, config file)
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kHostError, .message = std::move(msg)},
        .notes = {},
    };
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .message = std::move(msg),
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.primary.message.c_str();
  }

 private:
  Diagnostic diag_;
};

}  // namespace hailstone
