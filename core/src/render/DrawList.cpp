#include "mc/render/DrawList.hpp"

#include <algorithm>

namespace mc {

static void copyColor(float dst[4], const float src[4]) {
  for (int i = 0; i < 4; i++) dst[i] = src[i];
}

void DrawList::clear(const float color[4]) {
  DrawCommand c;
  c.op = DrawOp::Clear;
  c.layer = DrawLayer::Background;
  copyColor(c.color, color);
  commands_.push_back(std::move(c));
}

void DrawList::fillRect(const Rect& r, const float color[4], DrawLayer layer,
                        const Id& elementId) {
  DrawCommand c;
  c.op = DrawOp::FillRect;
  c.layer = layer;
  c.elementId = elementId;
  c.rect = r;
  copyColor(c.color, color);
  commands_.push_back(std::move(c));
}

void DrawList::strokeRect(const Rect& r, const float color[4], float lineWidth,
                          const float dash[2], DrawLayer layer, const Id& elementId) {
  DrawCommand c;
  c.op = DrawOp::StrokeRect;
  c.layer = layer;
  c.elementId = elementId;
  c.rect = r;
  c.lineWidth = lineWidth;
  if (dash) {
    c.dash[0] = dash[0];
    c.dash[1] = dash[1];
  }
  copyColor(c.color, color);
  commands_.push_back(std::move(c));
}

void DrawList::image(const Rect& dest, const std::shared_ptr<const Bitmap>& bitmap,
                     const Rect* clip, const Id& elementId) {
  DrawCommand c;
  c.op = DrawOp::Image;
  c.layer = DrawLayer::Content;
  c.elementId = elementId;
  c.rect = dest;
  c.bitmap = bitmap;
  if (clip) {
    c.hasClip = true;
    c.clip = *clip;
  }
  commands_.push_back(std::move(c));
}

void DrawList::text(Point anchor, const std::string& line, const TextStyle& style,
                    const float color[4], DrawLayer layer, const Id& elementId) {
  DrawCommand c;
  c.op = DrawOp::Text;
  c.layer = layer;
  c.elementId = elementId;
  c.from = anchor;
  c.text = line;
  c.textStyle = style;
  copyColor(c.color, color);
  commands_.push_back(std::move(c));
}

void DrawList::line(Point from, Point to, const float color[4], float lineWidth,
                    DrawLayer layer, const Id& elementId) {
  DrawCommand c;
  c.op = DrawOp::Line;
  c.layer = layer;
  c.elementId = elementId;
  c.from = from;
  c.to = to;
  c.lineWidth = lineWidth;
  copyColor(c.color, color);
  commands_.push_back(std::move(c));
}

std::size_t DrawList::count(DrawOp op) const {
  return static_cast<std::size_t>(std::count_if(commands_.begin(), commands_.end(),
    [&](const DrawCommand& c) { return c.op == op; }));
}

std::size_t DrawList::count(DrawOp op, DrawLayer layer) const {
  return static_cast<std::size_t>(std::count_if(commands_.begin(), commands_.end(),
    [&](const DrawCommand& c) { return c.op == op && c.layer == layer; }));
}

bool DrawList::drawsElement(const Id& elementId) const {
  for (const auto& c : commands_) {
    if (c.layer == DrawLayer::Content && c.elementId == elementId) return true;
  }
  return false;
}

std::vector<Id> DrawList::contentElementIds() const {
  std::vector<Id> ids;
  for (const auto& c : commands_) {
    if (c.layer != DrawLayer::Content || c.elementId.empty()) continue;
    if (std::find(ids.begin(), ids.end(), c.elementId) == ids.end()) {
      ids.push_back(c.elementId);
    }
  }
  return ids;
}

} // namespace mc
