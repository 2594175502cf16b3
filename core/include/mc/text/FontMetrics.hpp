#pragma once
#include "mc/text/TextMeasurer.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mc {

// TrueType/OpenType advance-width measurement via stb_truetype.
// Faces are registered per (family, weight, style). Families without a
// registered face are measured by the fallback measurer.
class FontMetrics : public TextMeasurer {
public:
  FontMetrics();

  // Load a TTF/OTF from memory.
  bool loadFont(const std::string& family, FontWeight weight, FontStyle style,
                const std::uint8_t* data, std::uint32_t len);

  // Load a TTF/OTF from file.
  bool loadFontFile(const std::string& family, FontWeight weight, FontStyle style,
                    const std::string& path);

  bool hasFamily(const std::string& family) const;
  std::size_t faceCount() const { return faces_.size(); }

  double measureLine(const std::string& line, const TextStyle& style) const override;

  // Ascent minus descent at the given pixel size, or 0 if no face matches.
  double lineExtent(const TextStyle& style) const;

private:
  struct Face {
    std::string family;
    FontWeight weight{FontWeight::Normal};
    FontStyle style{FontStyle::Normal};
    std::vector<std::uint8_t> data; // retained font file bytes
  };

  const Face* findFace(const TextStyle& style) const;

  std::vector<Face> faces_;
  FixedAdvanceMeasurer fallback_;
};

} // namespace mc
