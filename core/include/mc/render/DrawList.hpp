#pragma once
#include "mc/element/Element.hpp"
#include "mc/geom/Geometry.hpp"
#include "mc/ids/Id.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mc {

// Immediate-mode output of one viewport render pass, in viewport-local
// logical pixels. A host backend replays it onto its surface.
enum class DrawOp : std::uint8_t {
  Clear = 1,
  FillRect,
  StrokeRect,
  Image,
  Text,
  Line
};

enum class DrawLayer : std::uint8_t {
  Background = 0,
  Content,
  Selection,
  Handle,
  CropOverlay,
  RubberBand
};

struct DrawCommand {
  DrawOp op{DrawOp::FillRect};
  DrawLayer layer{DrawLayer::Content};
  Id elementId;  // empty for chrome not tied to an element

  Rect rect;                 // FillRect/StrokeRect/Image destination
  bool hasClip{false};
  Rect clip;                 // Image: visible region (crop)
  Point from, to;            // Line

  float color[4] = {0, 0, 0, 1};
  float lineWidth{1.0f};
  float dash[2] = {0, 0};    // {0,0} = solid

  std::shared_ptr<const Bitmap> bitmap;  // Image

  // Text: one line, anchored at (from.x, from.y) with a middle baseline
  std::string text;
  TextStyle textStyle;
};

class DrawList {
public:
  void reset() { commands_.clear(); }

  void clear(const float color[4]);
  void fillRect(const Rect& r, const float color[4], DrawLayer layer, const Id& elementId = {});
  void strokeRect(const Rect& r, const float color[4], float lineWidth, const float dash[2],
                  DrawLayer layer, const Id& elementId = {});
  void image(const Rect& dest, const std::shared_ptr<const Bitmap>& bitmap,
             const Rect* clip, const Id& elementId);
  void text(Point anchor, const std::string& line, const TextStyle& style,
            const float color[4], DrawLayer layer, const Id& elementId = {});
  void line(Point from, Point to, const float color[4], float lineWidth,
            DrawLayer layer, const Id& elementId = {});

  const std::vector<DrawCommand>& commands() const { return commands_; }
  std::size_t size() const { return commands_.size(); }

  // Queries for hosts and tests
  std::size_t count(DrawOp op) const;
  std::size_t count(DrawOp op, DrawLayer layer) const;
  bool drawsElement(const Id& elementId) const;  // Content layer only
  std::vector<Id> contentElementIds() const;     // paint order, no duplicates

private:
  std::vector<DrawCommand> commands_;
};

} // namespace mc
