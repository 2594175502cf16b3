#include "mc/viewport/Viewport.hpp"

namespace mc {

Viewport::Viewport(Id id, std::string name)
  : id_(std::move(id)), name_(std::move(name)) {}

void Viewport::setCell(const GridCell& cell) {
  cell_ = cell;
  recomputeOffset();
}

void Viewport::setResolution(int width, int height) {
  if (width <= 0 || height <= 0) return;
  width_ = width;
  height_ = height;
  recomputeOffset();
}

void Viewport::setDisplayScale(double scale) {
  if (scale <= 0.0) return;
  scale_ = scale;
}

void Viewport::recomputeOffset() {
  offsetX_ = static_cast<double>(cell_.col) * width_;
  offsetY_ = static_cast<double>(cell_.row) * height_;
}

} // namespace mc
