#include "mc/interaction/ResizeMath.hpp"

#include <algorithm>
#include <cmath>

namespace mc {

const char* handleName(HandleId h) {
  switch (h) {
    case HandleId::NW: return "nw";
    case HandleId::N:  return "n";
    case HandleId::NE: return "ne";
    case HandleId::E:  return "e";
    case HandleId::SE: return "se";
    case HandleId::S:  return "s";
    case HandleId::SW: return "sw";
    case HandleId::W:  return "w";
    case HandleId::None:
    default:           return "none";
  }
}

Point handleAnchor(const Rect& r, HandleId h) {
  double cx = (r.left + r.right) * 0.5;
  double cy = (r.top + r.bottom) * 0.5;
  switch (h) {
    case HandleId::NW: return {r.left, r.top};
    case HandleId::N:  return {cx, r.top};
    case HandleId::NE: return {r.right, r.top};
    case HandleId::E:  return {r.right, cy};
    case HandleId::SE: return {r.right, r.bottom};
    case HandleId::S:  return {cx, r.bottom};
    case HandleId::SW: return {r.left, r.bottom};
    case HandleId::W:  return {r.left, cy};
    case HandleId::None:
    default:           return {cx, cy};
  }
}

HandleId handleAt(const Rect& r, Point p, double radius, bool cornersOnly) {
  static const HandleId kCorners[4] = {HandleId::NW, HandleId::NE, HandleId::SE, HandleId::SW};
  static const HandleId kEdges[4] = {HandleId::N, HandleId::E, HandleId::S, HandleId::W};

  for (HandleId h : kCorners) {
    Point a = handleAnchor(r, h);
    if (std::fabs(p.x - a.x) <= radius && std::fabs(p.y - a.y) <= radius) return h;
  }
  if (cornersOnly) return HandleId::None;
  for (HandleId h : kEdges) {
    Point a = handleAnchor(r, h);
    if (std::fabs(p.x - a.x) <= radius && std::fabs(p.y - a.y) <= radius) return h;
  }
  return HandleId::None;
}

Box resizeBox(const Box& o, HandleId handle, double dx, double dy, double minSize) {
  Box b = o;

  if (isCornerHandle(handle)) {
    double aspect = (o.height > 0) ? o.width / o.height : 1.0;
    bool west = handle == HandleId::NW || handle == HandleId::SW;
    bool north = handle == HandleId::NW || handle == HandleId::NE;

    double w = west ? o.width - dx : o.width + dx;
    w = std::max(w, minSize);
    double h = w / aspect;
    if (h < minSize) {
      h = minSize;
      w = h * aspect;
    }

    b.width = w;
    b.height = h;
    b.x = west ? o.x + o.width - w : o.x;
    b.y = north ? o.y + o.height - h : o.y;
    return b;
  }

  switch (handle) {
    case HandleId::E:
      b.width = std::max(o.width + dx, minSize);
      break;
    case HandleId::W:
      b.width = std::max(o.width - dx, minSize);
      b.x = o.x + o.width - b.width;
      break;
    case HandleId::S:
      b.height = std::max(o.height + dy, minSize);
      break;
    case HandleId::N:
      b.height = std::max(o.height - dy, minSize);
      b.y = o.y + o.height - b.height;
      break;
    default:
      break;
  }
  return b;
}

ResizeOutcome resizeElement(const Element& original, HandleId handle,
                            double dx, double dy, double minSize) {
  ResizeOutcome out;

  if (original.isImage() && original.crop) {
    const CropRect& c = *original.crop;
    Box visible{original.x + c.left, original.y + c.top, c.width(), c.height()};
    Box v = resizeBox(visible, handle, dx, dy, minSize);

    double sx = v.width / visible.width;
    double sy = v.height / visible.height;

    out.box.width = original.width * sx;
    out.box.height = original.height * sy;
    out.box.x = v.x - c.left * sx;
    out.box.y = v.y - c.top * sy;
    out.crop = CropRect{c.left * sx, c.top * sy, c.right * sx, c.bottom * sy};
    return out;
  }

  out.box = resizeBox(Box{original.x, original.y, original.width, original.height},
                      handle, dx, dy, minSize);

  if (original.isText() && isCornerHandle(handle) && original.width > 0) {
    out.fontSize = original.style.fontSize * (out.box.width / original.width);
  }
  return out;
}

} // namespace mc
