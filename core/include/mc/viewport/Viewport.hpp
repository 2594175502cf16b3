#pragma once
#include "mc/geom/Geometry.hpp"
#include "mc/grid/GridTopology.hpp"
#include "mc/ids/Id.hpp"

#include <string>

namespace mc {

// One rendering surface: a width x height slice of the global plane placed
// at (col*width, row*height).
class Viewport {
public:
  Viewport(Id id, std::string name);

  void setCell(const GridCell& cell);
  void setResolution(int width, int height);
  void setDisplayScale(double scale);
  void setName(const std::string& name) { name_ = name; }

  // Re-derive the offset from (cell, resolution). Idempotent.
  void recomputeOffset();

  // Coordinate mapping
  Point toGlobal(Point local) const { return {local.x + offsetX_, local.y + offsetY_}; }
  Point toLocal(Point global) const { return {global.x - offsetX_, global.y - offsetY_}; }
  Point deviceToLogical(Point device) const { return {device.x / scale_, device.y / scale_}; }
  Point deviceToGlobal(Point device) const { return toGlobal(deviceToLogical(device)); }
  Rect toLocal(const Rect& global) const {
    return global.translated(-offsetX_, -offsetY_);
  }

  Rect globalRect() const { return rectFromBox(offsetX_, offsetY_, width_, height_); }
  Rect localRect() const { return rectFromBox(0, 0, width_, height_); }
  bool containsGlobal(Point p) const { return globalRect().containsHalfOpen(p); }

  const Id& id() const { return id_; }
  const std::string& name() const { return name_; }
  const GridCell& cell() const { return cell_; }
  int width() const { return width_; }
  int height() const { return height_; }
  double offsetX() const { return offsetX_; }
  double offsetY() const { return offsetY_; }
  double displayScale() const { return scale_; }

private:
  Id id_;
  std::string name_;
  GridCell cell_;
  int width_{800};
  int height_{600};
  double offsetX_{0};
  double offsetY_{0};
  double scale_{1.0};
};

} // namespace mc
