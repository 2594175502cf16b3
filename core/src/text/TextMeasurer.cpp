#include "mc/text/TextMeasurer.hpp"

namespace mc {

std::vector<std::uint32_t> decodeUtf8(const std::string& text) {
  std::vector<std::uint32_t> out;
  out.reserve(text.size());

  std::size_t i = 0;
  const std::size_t n = text.size();
  while (i < n) {
    auto c = static_cast<std::uint8_t>(text[i]);
    std::uint32_t cp = 0;
    int extra = 0;
    if (c < 0x80)                { cp = c; extra = 0; }
    else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; }
    else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; }
    else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; }
    else {
      out.push_back(0xFFFD);
      i++;
      continue;
    }

    // Truncated sequence at end of input
    if (i + static_cast<std::size_t>(extra) >= n) {
      out.push_back(0xFFFD);
      break;
    }

    bool ok = true;
    for (int k = 1; k <= extra; k++) {
      auto cc = static_cast<std::uint8_t>(text[i + static_cast<std::size_t>(k)]);
      if ((cc & 0xC0) != 0x80) { ok = false; break; }
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (!ok) {
      out.push_back(0xFFFD);
      i++;
      continue;
    }
    out.push_back(cp);
    i += static_cast<std::size_t>(extra) + 1;
  }
  return out;
}

double FixedAdvanceMeasurer::measureLine(const std::string& line,
                                         const TextStyle& style) const {
  double advance = style.fontSize * factor_;
  if (style.fontWeight == FontWeight::Bold) advance *= 1.1;
  return advance * static_cast<double>(decodeUtf8(line).size());
}

} // namespace mc
