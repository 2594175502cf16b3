#pragma once
#include "mc/geom/Geometry.hpp"
#include "mc/ids/Id.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mc {

enum class ElementKind : std::uint8_t { Text = 1, Image = 2 };

enum class FontWeight : std::uint8_t { Normal = 0, Bold };
enum class FontStyle : std::uint8_t { Normal = 0, Italic };
enum class TextAlign : std::uint8_t { Left = 0, Center, Right };

struct TextStyle {
  std::string fontFamily{"Arial"};
  double fontSize{24};
  FontWeight fontWeight{FontWeight::Normal};
  FontStyle fontStyle{FontStyle::Normal};
  TextAlign textAlign{TextAlign::Left};
  std::string color{"#2d3748"};

  bool operator==(const TextStyle& o) const {
    return fontFamily == o.fontFamily && fontSize == o.fontSize &&
           fontWeight == o.fontWeight && fontStyle == o.fontStyle &&
           textAlign == o.textAlign && color == o.color;
  }
  bool operator!=(const TextStyle& o) const { return !(*this == o); }
};

// Decoded RGBA8 pixels. Elements share it read-only; duplicates deep-copy.
struct Bitmap {
  int width{0};
  int height{0};
  std::vector<std::uint8_t> rgba;
};

inline std::shared_ptr<const Bitmap> cloneBitmap(const std::shared_ptr<const Bitmap>& src) {
  if (!src) return nullptr;
  return std::make_shared<const Bitmap>(*src);
}

// Element-local pixel space: 0 <= left < right <= width, 0 <= top < bottom <= height.
struct CropRect {
  double left{0}, top{0}, right{0}, bottom{0};

  double width() const { return right - left; }
  double height() const { return bottom - top; }

  bool operator==(const CropRect& o) const {
    return left == o.left && top == o.top && right == o.right && bottom == o.bottom;
  }
  bool operator!=(const CropRect& o) const { return !(*this == o); }
};

struct Element {
  Id id;
  ElementKind kind{ElementKind::Text};

  // Global coordinates.
  double x{0}, y{0};
  double width{20}, height{20};

  Id ownerViewportId;

  // Text variant
  std::string content;
  TextStyle style;

  // Image variant
  std::shared_ptr<const Bitmap> image;
  std::optional<CropRect> crop;

  bool isText() const { return kind == ElementKind::Text; }
  bool isImage() const { return kind == ElementKind::Image; }

  Rect bounds() const { return rectFromBox(x, y, width, height); }

  // Crop rectangle in global coordinates when set, else the full box.
  Rect effectiveBounds() const {
    if (crop) return {x + crop->left, y + crop->top, x + crop->right, y + crop->bottom};
    return bounds();
  }
};

// Shallow-merge update. Unset fields are left alone.
struct ElementPatch {
  std::optional<double> x, y;
  std::optional<double> width, height;
  std::optional<Id> ownerViewportId;

  std::optional<std::string> content;
  std::optional<std::string> fontFamily;
  std::optional<double> fontSize;
  std::optional<FontWeight> fontWeight;
  std::optional<FontStyle> fontStyle;
  std::optional<TextAlign> textAlign;
  std::optional<std::string> color;

  // Outer optional: "touch the crop". Inner: the new crop or none.
  std::optional<std::optional<CropRect>> crop;

  bool touchesTextMetrics() const {
    return content || fontFamily || fontSize || fontWeight || fontStyle;
  }
};

// Clamp a crop into [0,w]x[0,h] keeping each side at least minSize.
CropRect clampCrop(const CropRect& c, double w, double h, double minSize);

const char* fontWeightName(FontWeight w);
const char* fontStyleName(FontStyle s);
const char* textAlignName(TextAlign a);
bool parseFontWeight(const std::string& s, FontWeight& out);
bool parseFontStyle(const std::string& s, FontStyle& out);
bool parseTextAlign(const std::string& s, TextAlign& out);

} // namespace mc
