#include "mc/text/FontMetrics.hpp"

#include <cstdio>
#include <fstream>

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

namespace mc {

FontMetrics::FontMetrics() = default;

bool FontMetrics::loadFont(const std::string& family, FontWeight weight, FontStyle style,
                           const std::uint8_t* data, std::uint32_t len) {
  if (!data || len == 0) return false;

  Face face;
  face.family = family;
  face.weight = weight;
  face.style = style;
  face.data.assign(data, data + len);

  stbtt_fontinfo info;
  int offset = stbtt_GetFontOffsetForIndex(face.data.data(), 0);
  if (offset < 0 || !stbtt_InitFont(&info, face.data.data(), offset)) {
    std::fprintf(stderr, "[FontMetrics] stbtt_InitFont failed for family '%s'\n",
                 family.c_str());
    return false;
  }

  // Replace an existing face with the same key
  for (auto& f : faces_) {
    if (f.family == family && f.weight == weight && f.style == style) {
      f = std::move(face);
      return true;
    }
  }
  faces_.push_back(std::move(face));
  return true;
}

bool FontMetrics::loadFontFile(const std::string& family, FontWeight weight,
                               FontStyle style, const std::string& path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) {
    std::fprintf(stderr, "[FontMetrics] cannot open font file '%s'\n", path.c_str());
    return false;
  }
  auto sz = f.tellg();
  if (sz <= 0) return false;
  std::vector<std::uint8_t> bytes(static_cast<std::size_t>(sz));
  f.seekg(0);
  f.read(reinterpret_cast<char*>(bytes.data()), sz);
  if (!f) return false;
  return loadFont(family, weight, style, bytes.data(),
                  static_cast<std::uint32_t>(bytes.size()));
}

bool FontMetrics::hasFamily(const std::string& family) const {
  for (const auto& f : faces_) {
    if (f.family == family) return true;
  }
  return false;
}

const FontMetrics::Face* FontMetrics::findFace(const TextStyle& style) const {
  const Face* familyMatch = nullptr;
  for (const auto& f : faces_) {
    if (f.family != style.fontFamily) continue;
    if (f.weight == style.fontWeight && f.style == style.fontStyle) return &f;
    if (!familyMatch || (f.weight == FontWeight::Normal && f.style == FontStyle::Normal)) {
      familyMatch = &f;
    }
  }
  return familyMatch;
}

double FontMetrics::measureLine(const std::string& line, const TextStyle& style) const {
  const Face* face = findFace(style);
  if (!face) return fallback_.measureLine(line, style);

  stbtt_fontinfo info;
  int offset = stbtt_GetFontOffsetForIndex(face->data.data(), 0);
  if (!stbtt_InitFont(&info, face->data.data(), offset)) {
    return fallback_.measureLine(line, style);
  }

  // Em-based scale matches CSS font-size semantics
  float scale = stbtt_ScaleForMappingEmToPixels(&info, static_cast<float>(style.fontSize));

  auto cps = decodeUtf8(line);
  double width = 0.0;
  int prevGlyph = 0;
  for (std::size_t i = 0; i < cps.size(); i++) {
    int glyph = stbtt_FindGlyphIndex(&info, static_cast<int>(cps[i]));
    int advW = 0, lsb = 0;
    stbtt_GetGlyphHMetrics(&info, glyph, &advW, &lsb);
    if (i > 0) width += stbtt_GetGlyphKernAdvance(&info, prevGlyph, glyph) * scale;
    width += advW * scale;
    prevGlyph = glyph;
  }

  // No synthetic bold face loaded: widen like the fallback does
  if (style.fontWeight == FontWeight::Bold && face->weight != FontWeight::Bold) {
    width *= 1.1;
  }
  return width;
}

double FontMetrics::lineExtent(const TextStyle& style) const {
  const Face* face = findFace(style);
  if (!face) return 0.0;

  stbtt_fontinfo info;
  int offset = stbtt_GetFontOffsetForIndex(face->data.data(), 0);
  if (!stbtt_InitFont(&info, face->data.data(), offset)) return 0.0;

  int ascent = 0, descent = 0, lineGap = 0;
  stbtt_GetFontVMetrics(&info, &ascent, &descent, &lineGap);
  float scale = stbtt_ScaleForMappingEmToPixels(&info, static_cast<float>(style.fontSize));
  return (ascent - descent) * scale;
}

} // namespace mc
