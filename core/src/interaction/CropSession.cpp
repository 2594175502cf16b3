#include "mc/interaction/CropSession.hpp"

#include <cmath>

namespace mc {

void CropSession::begin(const Id& elementId, double width, double height,
                        const std::optional<CropRect>& existing) {
  active_ = true;
  elementId_ = elementId;
  width_ = width;
  height_ = height;
  bounds_ = existing ? clampCrop(*existing, width, height, config_.minSize)
                     : CropRect{0, 0, width, height};
  activeEdges_ = CropEdgeNone;
}

void CropSession::end() {
  active_ = false;
  elementId_.clear();
  activeEdges_ = CropEdgeNone;
}

std::uint8_t CropSession::edgesNear(Point p) const {
  if (!active_) return CropEdgeNone;
  const double t = config_.edgeThreshold;
  const CropRect& b = bounds_;

  // Perpendicular extent of the bounds, padded by the threshold
  bool withinY = p.y >= b.top - t && p.y <= b.bottom + t;
  bool withinX = p.x >= b.left - t && p.x <= b.right + t;

  double dl = std::fabs(p.x - b.left);
  double dr = std::fabs(p.x - b.right);
  double dt = std::fabs(p.y - b.top);
  double db = std::fabs(p.y - b.bottom);

  std::uint8_t vertical = CropEdgeNone;
  if (withinY) {
    if (dl <= t && (dl <= dr || dr > t)) vertical = CropEdgeLeft;
    else if (dr <= t) vertical = CropEdgeRight;
  }

  std::uint8_t horizontal = CropEdgeNone;
  if (withinX) {
    if (dt <= t && (dt <= db || db > t)) horizontal = CropEdgeTop;
    else if (db <= t) horizontal = CropEdgeBottom;
  }

  return static_cast<std::uint8_t>(vertical | horizontal);
}

bool CropSession::beginHandleDrag(Point local) {
  activeEdges_ = edgesNear(local);
  return activeEdges_ != CropEdgeNone;
}

void CropSession::dragTo(Point p) {
  if (!active_ || activeEdges_ == CropEdgeNone) return;
  const double m = config_.minSize;

  if (activeEdges_ & CropEdgeLeft) {
    bounds_.left = clampValue(p.x, 0.0, bounds_.right - m);
  }
  if (activeEdges_ & CropEdgeRight) {
    bounds_.right = clampValue(p.x, bounds_.left + m, width_);
  }
  if (activeEdges_ & CropEdgeTop) {
    bounds_.top = clampValue(p.y, 0.0, bounds_.bottom - m);
  }
  if (activeEdges_ & CropEdgeBottom) {
    bounds_.bottom = clampValue(p.y, bounds_.top + m, height_);
  }
}

std::optional<CropRect> CropSession::result() const {
  if (bounds_.left <= 0 && bounds_.top <= 0 &&
      bounds_.right >= width_ && bounds_.bottom >= height_) {
    return std::nullopt;
  }
  return bounds_;
}

} // namespace mc
