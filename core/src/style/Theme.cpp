#include "mc/style/Theme.hpp"

#include <cctype>
#include <string>

namespace mc {

// -------------------- Built-in presets --------------------

Theme lightTheme() {
  Theme t;
  t.name = "Light";
  // Struct initializers already carry the light defaults.
  return t;
}

Theme darkTheme() {
  Theme t;
  t.name = "Dark";

  t.backgroundColor[0] = 0.1f;  t.backgroundColor[1] = 0.1f;
  t.backgroundColor[2] = 0.12f; t.backgroundColor[3] = 1.0f;

  t.selectionColor[0] = 0.388f; t.selectionColor[1] = 0.702f;
  t.selectionColor[2] = 0.929f; t.selectionColor[3] = 1.0f;

  t.handleFill[0] = 0.388f; t.handleFill[1] = 0.702f;
  t.handleFill[2] = 0.929f; t.handleFill[3] = 1.0f;

  t.handleStroke[0] = 0.1f;  t.handleStroke[1] = 0.1f;
  t.handleStroke[2] = 0.12f; t.handleStroke[3] = 1.0f;

  t.rubberBandFill[0] = 0.388f; t.rubberBandFill[1] = 0.702f;
  t.rubberBandFill[2] = 0.929f; t.rubberBandFill[3] = 0.15f;

  t.rubberBandStroke[0] = 0.388f; t.rubberBandStroke[1] = 0.702f;
  t.rubberBandStroke[2] = 0.929f; t.rubberBandStroke[3] = 0.9f;

  t.textColor[0] = 0.8f;  t.textColor[1] = 0.8f;
  t.textColor[2] = 0.85f; t.textColor[3] = 1.0f;

  return t;
}

Theme themeByName(const std::string& name) {
  std::string lower;
  for (char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (lower == "dark") return darkTheme();
  return lightTheme();
}

static int hexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool parseHexColor(const std::string& hex, float out[4]) {
  if (hex.empty() || hex[0] != '#') return false;
  std::string digits = hex.substr(1);

  for (char c : digits) {
    if (hexDigit(c) < 0) return false;
  }

  float rgba[4] = {0, 0, 0, 1.0f};
  if (digits.size() == 3) {
    for (int i = 0; i < 3; i++) {
      int v = hexDigit(digits[static_cast<std::size_t>(i)]);
      rgba[i] = static_cast<float>(v * 17) / 255.0f;
    }
  } else if (digits.size() == 6 || digits.size() == 8) {
    int channels = static_cast<int>(digits.size() / 2);
    for (int i = 0; i < channels; i++) {
      auto k = static_cast<std::size_t>(i * 2);
      int v = hexDigit(digits[k]) * 16 + hexDigit(digits[k + 1]);
      rgba[i] = static_cast<float>(v) / 255.0f;
    }
  } else {
    return false;
  }

  for (int i = 0; i < 4; i++) out[i] = rgba[i];
  return true;
}

} // namespace mc
