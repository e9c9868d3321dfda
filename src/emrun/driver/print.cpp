#include "print.hpp"

#include <cstdio>
#include <string_view>

#include <fmt/color.h>
#include <fmt/core.h>

#include "emrun/common/diagnostic.hpp"

namespace emrun::driver {

namespace {

struct Label {
  std::string_view text;
  fmt::text_style style;
};

auto LabelFor(DiagKind kind) -> Label {
  constexpr auto kBold = fmt::emphasis::bold;
  switch (kind) {
    case DiagKind::kError:
      return {"error:", fmt::fg(fmt::terminal_color::bright_red) | kBold};
    case DiagKind::kHostError:
      return {"host error:", fmt::fg(fmt::terminal_color::bright_red) | kBold};
    case DiagKind::kNote:
      return {"note:", fmt::fg(fmt::terminal_color::bright_cyan) | kBold};
  }
  return {"error:", fmt::fg(fmt::terminal_color::bright_red) | kBold};
}

void PrintLine(DiagKind kind, std::string_view message, bool headline) {
  auto label = LabelFor(kind);
  fmt::print(
      stderr, "{}: {} {}\n",
      fmt::styled("emrun", fmt::fg(fmt::terminal_color::white) |
                               fmt::emphasis::bold),
      fmt::styled(label.text, label.style),
      fmt::styled(
          message, headline ? fmt::emphasis::bold : fmt::text_style{}));
}

}  // namespace

void PrintError(std::string_view message) {
  PrintLine(DiagKind::kError, message, true);
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintLine(diag.primary.kind, diag.primary.message, true);
  for (const auto& note : diag.notes) {
    PrintLine(note.kind, note.message, false);
  }
}

}  // namespace emrun::driver
