#pragma once
#include <cstdint>

namespace mc {

// Pointer-interaction states. Exactly one is current per viewport.
enum class InteractionState : std::uint8_t {
  Idle = 0,
  Dragging,
  Resizing,
  RubberBandSelecting,
  CroppingIdle,
  CroppingHandleDrag
};

inline const char* interactionStateName(InteractionState s) {
  switch (s) {
    case InteractionState::Idle:                return "Idle";
    case InteractionState::Dragging:            return "Dragging";
    case InteractionState::Resizing:            return "Resizing";
    case InteractionState::RubberBandSelecting: return "RubberBandSelecting";
    case InteractionState::CroppingIdle:        return "CroppingIdle";
    case InteractionState::CroppingHandleDrag:  return "CroppingHandleDrag";
  }
  return "Unknown";
}

inline bool isCropping(InteractionState s) {
  return s == InteractionState::CroppingIdle || s == InteractionState::CroppingHandleDrag;
}

} // namespace mc
