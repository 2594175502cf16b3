#pragma once
#include "mc/element/Element.hpp"
#include "mc/text/TextMeasurer.hpp"

#include <string>
#include <vector>

namespace mc {

struct TextBoxConfig {
  double padding{10};          // added to the widest line
  double lineHeightFactor{1.2};
  double minSize{20};
};

struct TextLine {
  std::string text;
  double width{0};
};

struct TextBox {
  std::vector<TextLine> lines;
  double width{0};
  double height{0};
  double lineHeight{0};
};

// Split on '\n'. An empty string yields one empty line.
std::vector<std::string> splitLines(const std::string& content);

// width = max(maxLineWidth + padding, minSize)
// height = max(fontSize * lineHeightFactor * lineCount, minSize)
TextBox layoutTextBox(const TextMeasurer& measurer, const std::string& content,
                      const TextStyle& style, const TextBoxConfig& cfg);

// X of the draw anchor for a line: left edge + padding/2, center, or
// right edge - padding/2 depending on alignment.
double lineAnchorX(TextAlign align, double boxX, double boxWidth, double padding);

// Y of the vertical middle of line i.
inline double lineMiddleY(double boxY, double lineHeight, std::size_t i) {
  return boxY + lineHeight * (static_cast<double>(i) + 0.5);
}

} // namespace mc
