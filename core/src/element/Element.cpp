#include "mc/element/Element.hpp"

#include <algorithm>

namespace mc {

CropRect clampCrop(const CropRect& c, double w, double h, double minSize) {
  double minW = std::min(minSize, w);
  double minH = std::min(minSize, h);

  CropRect r;
  r.left = clampValue(std::min(c.left, c.right), 0.0, w);
  r.right = clampValue(std::max(c.left, c.right), 0.0, w);
  r.top = clampValue(std::min(c.top, c.bottom), 0.0, h);
  r.bottom = clampValue(std::max(c.top, c.bottom), 0.0, h);

  // Grow toward the right/bottom first, then back off the left/top.
  if (r.right - r.left < minW) {
    r.right = std::min(w, r.left + minW);
    r.left = r.right - minW;
  }
  if (r.bottom - r.top < minH) {
    r.bottom = std::min(h, r.top + minH);
    r.top = r.bottom - minH;
  }
  return r;
}

const char* fontWeightName(FontWeight w) {
  return w == FontWeight::Bold ? "bold" : "normal";
}

const char* fontStyleName(FontStyle s) {
  return s == FontStyle::Italic ? "italic" : "normal";
}

const char* textAlignName(TextAlign a) {
  switch (a) {
    case TextAlign::Center: return "center";
    case TextAlign::Right:  return "right";
    case TextAlign::Left:
    default:                return "left";
  }
}

bool parseFontWeight(const std::string& s, FontWeight& out) {
  if (s == "normal") { out = FontWeight::Normal; return true; }
  if (s == "bold")   { out = FontWeight::Bold; return true; }
  return false;
}

bool parseFontStyle(const std::string& s, FontStyle& out) {
  if (s == "normal") { out = FontStyle::Normal; return true; }
  if (s == "italic") { out = FontStyle::Italic; return true; }
  return false;
}

bool parseTextAlign(const std::string& s, TextAlign& out) {
  if (s == "left")   { out = TextAlign::Left; return true; }
  if (s == "center") { out = TextAlign::Center; return true; }
  if (s == "right")  { out = TextAlign::Right; return true; }
  return false;
}

} // namespace mc
