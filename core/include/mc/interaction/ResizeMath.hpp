#pragma once
#include "mc/element/Element.hpp"
#include "mc/geom/Geometry.hpp"

#include <cstdint>
#include <optional>

namespace mc {

enum class HandleId : std::uint8_t {
  None = 0, NW, N, NE, E, SE, S, SW, W
};

inline bool isCornerHandle(HandleId h) {
  return h == HandleId::NW || h == HandleId::NE || h == HandleId::SE || h == HandleId::SW;
}

const char* handleName(HandleId h);

struct Box {
  double x{0}, y{0}, width{0}, height{0};
  Rect rect() const { return rectFromBox(x, y, width, height); }
};

// Anchor point of a handle on a box: corners and edge midpoints.
Point handleAnchor(const Rect& r, HandleId h);

// Handle whose anchor is within radius of p (Chebyshev distance).
// Corners are tested before edges. When cornersOnly, edge handles are
// never returned.
HandleId handleAt(const Rect& r, Point p, double radius, bool cornersOnly);

// Corner: proportional, width driven by the x displacement, opposite corner
// anchored. Edge: single axis, opposite edge anchored. Both clamp each side
// to minSize (corners keep the aspect ratio while clamping).
Box resizeBox(const Box& original, HandleId handle, double dx, double dy, double minSize);

struct ResizeOutcome {
  Box box;                        // new full element box
  std::optional<double> fontSize; // text corner resize
  std::optional<CropRect> crop;   // image crop scaled with the box
};

// Resize an element as its visible bounds are dragged. For a cropped image
// the gesture acts on the crop rectangle; the full box and the crop scale
// with it so the bitmap is never resampled.
ResizeOutcome resizeElement(const Element& original, HandleId handle,
                            double dx, double dy, double minSize);

} // namespace mc
