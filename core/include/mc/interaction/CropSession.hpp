#pragma once
#include "mc/element/Element.hpp"
#include "mc/geom/Geometry.hpp"
#include "mc/ids/Id.hpp"

#include <cstdint>
#include <optional>

namespace mc {

// Bit flags for the crop edges a gesture moves.
enum CropEdge : std::uint8_t {
  CropEdgeNone = 0,
  CropEdgeLeft = 1 << 0,
  CropEdgeTop = 1 << 1,
  CropEdgeRight = 1 << 2,
  CropEdgeBottom = 1 << 3
};

struct CropConfig {
  double edgeThreshold{20};
  double minSize{20};
};

// Provisional crop bounds for one image while crop mode is active.
// Points are element-local logical pixels.
class CropSession {
public:
  void setConfig(const CropConfig& cfg) { config_ = cfg; }
  const CropConfig& config() const { return config_; }

  // Bounds start at the stored crop, or the full box.
  void begin(const Id& elementId, double width, double height,
             const std::optional<CropRect>& existing);
  void end();

  bool active() const { return active_; }
  const Id& elementId() const { return elementId_; }
  const CropRect& bounds() const { return bounds_; }
  double boxWidth() const { return width_; }
  double boxHeight() const { return height_; }

  // Edges within the threshold of p. A horizontal and a vertical match
  // together form a corner and win over a single edge.
  std::uint8_t edgesNear(Point local) const;

  bool beginHandleDrag(Point local);
  void dragTo(Point local);
  void endHandleDrag() { activeEdges_ = CropEdgeNone; }
  bool handleDragActive() const { return activeEdges_ != CropEdgeNone; }
  std::uint8_t activeEdges() const { return activeEdges_; }

  // Crop to commit. nullopt when the bounds cover the whole box.
  std::optional<CropRect> result() const;

private:
  CropConfig config_;
  bool active_{false};
  Id elementId_;
  double width_{0}, height_{0};
  CropRect bounds_;
  std::uint8_t activeEdges_{CropEdgeNone};
};

} // namespace mc
