#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace emrun {

enum class DiagKind : uint8_t {
  kError,      // capture, document or command line rejected
  kHostError,  // the host failed us: files, sockets, config
  kNote,       // context attached to a primary item
};

struct DiagItem {
  DiagKind kind;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// What the driver prints for a failed command: one headline plus notes
// naming the input, run or path involved.
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  static auto Error(std::string msg) -> Diagnostic {
    return Make(DiagKind::kError, std::move(msg));
  }

  static auto HostError(std::string msg) -> Diagnostic {
    return Make(DiagKind::kHostError, std::move(msg));
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back({.kind = DiagKind::kNote, .message = std::move(msg)});
    return std::move(*this);
  }

 private:
  static auto Make(DiagKind kind, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = kind, .message = std::move(msg)}, .notes = {}};
  }
};

// Host-facing operations (file I/O, config, symbol loading) return this.
template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace emrun
