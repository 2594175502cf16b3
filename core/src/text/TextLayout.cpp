#include "mc/text/TextLayout.hpp"

#include <algorithm>

namespace mc {

std::vector<std::string> splitLines(const std::string& content) {
  std::vector<std::string> lines;
  std::string::size_type start = 0;
  while (true) {
    auto nl = content.find('\n', start);
    if (nl == std::string::npos) {
      lines.push_back(content.substr(start));
      break;
    }
    lines.push_back(content.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

TextBox layoutTextBox(const TextMeasurer& measurer, const std::string& content,
                      const TextStyle& style, const TextBoxConfig& cfg) {
  TextBox box;
  box.lineHeight = style.fontSize * cfg.lineHeightFactor;

  double maxWidth = 0.0;
  for (auto& s : splitLines(content)) {
    TextLine line;
    line.width = measurer.measureLine(s, style);
    line.text = std::move(s);
    maxWidth = std::max(maxWidth, line.width);
    box.lines.push_back(std::move(line));
  }

  box.width = std::max(maxWidth + cfg.padding, cfg.minSize);
  box.height = std::max(box.lineHeight * static_cast<double>(box.lines.size()), cfg.minSize);
  return box;
}

double lineAnchorX(TextAlign align, double boxX, double boxWidth, double padding) {
  switch (align) {
    case TextAlign::Center: return boxX + boxWidth * 0.5;
    case TextAlign::Right:  return boxX + boxWidth - padding * 0.5;
    case TextAlign::Left:
    default:                return boxX + padding * 0.5;
  }
}

} // namespace mc
