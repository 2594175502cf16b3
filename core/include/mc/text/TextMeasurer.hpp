#pragma once
#include "mc/element/Element.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mc {

// Decode UTF-8 into code points. Malformed bytes become U+FFFD.
std::vector<std::uint32_t> decodeUtf8(const std::string& text);

// Measures the advance width of one line of text, in logical pixels.
class TextMeasurer {
public:
  virtual ~TextMeasurer() = default;
  virtual double measureLine(const std::string& line, const TextStyle& style) const = 0;
};

// Every code point advances by fontSize * advanceFactor (bold is 10% wider).
// Deterministic, so layout is reproducible without any font files.
class FixedAdvanceMeasurer : public TextMeasurer {
public:
  explicit FixedAdvanceMeasurer(double advanceFactor = 0.6) : factor_(advanceFactor) {}

  double measureLine(const std::string& line, const TextStyle& style) const override;

private:
  double factor_;
};

} // namespace mc
