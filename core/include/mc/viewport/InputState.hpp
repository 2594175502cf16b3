#pragma once
#include <cstdint>

namespace mc {

enum class PointerAction : std::uint8_t { Down = 0, Move, Up, DoubleClick };

// Pointer event already resolved to a viewport. x/y are device pixels
// relative to the viewport's top-left corner.
struct PointerEvent {
  PointerAction action{PointerAction::Move};
  double x{0}, y{0};
  bool shift{false};
  bool ctrl{false};  // Ctrl or Cmd
};

enum class KeyCode : std::uint8_t {
  None = 0, Escape, Enter, Delete, Backspace, C, V, D, Other
};

struct KeyEvent {
  KeyCode key{KeyCode::None};
  bool ctrl{false};  // Ctrl or Cmd
  bool shift{false};
};

} // namespace mc
