#pragma once
#include <algorithm>

namespace mc {

struct Point {
  double x{0}, y{0};
};

inline Point operator+(Point a, Point b) { return {a.x + b.x, a.y + b.y}; }
inline Point operator-(Point a, Point b) { return {a.x - b.x, a.y - b.y}; }

// Edges, not origin + size.
struct Rect {
  double left{0}, top{0}, right{0}, bottom{0};

  double width() const { return right - left; }
  double height() const { return bottom - top; }
  Point center() const { return {(left + right) * 0.5, (top + bottom) * 0.5}; }

  // Inclusive on all edges (hit testing).
  bool contains(Point p) const {
    return p.x >= left && p.x <= right && p.y >= top && p.y <= bottom;
  }

  // Half-open [left,right) x [top,bottom) (viewport ownership).
  bool containsHalfOpen(Point p) const {
    return p.x >= left && p.x < right && p.y >= top && p.y < bottom;
  }

  Rect translated(double dx, double dy) const {
    return {left + dx, top + dy, right + dx, bottom + dy};
  }

  Rect inflated(double d) const {
    return {left - d, top - d, right + d, bottom + d};
  }

  bool operator==(const Rect& o) const {
    return left == o.left && top == o.top && right == o.right && bottom == o.bottom;
  }
  bool operator!=(const Rect& o) const { return !(*this == o); }
};

inline Rect rectFromBox(double x, double y, double w, double h) {
  return {x, y, x + w, y + h};
}

// Normalized rectangle spanned by two arbitrary corners.
inline Rect rectFromCorners(Point a, Point b) {
  return {std::min(a.x, b.x), std::min(a.y, b.y),
          std::max(a.x, b.x), std::max(a.y, b.y)};
}

// Strict AABB overlap: touching edges do not overlap.
inline bool overlaps(const Rect& a, const Rect& b) {
  return a.left < b.right && a.right > b.left &&
         a.top < b.bottom && a.bottom > b.top;
}

inline double clampValue(double v, double lo, double hi) {
  if (v < lo) return lo;
  if (v > hi) return hi;
  return v;
}

} // namespace mc
