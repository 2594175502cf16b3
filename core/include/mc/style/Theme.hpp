#pragma once
#include <string>

namespace mc {

struct Theme {
  std::string name;

  // Surface
  float backgroundColor[4] = {1.0f, 1.0f, 1.0f, 1.0f};

  // Selection outline and resize handles (#3182ce)
  float selectionColor[4] = {0.192f, 0.510f, 0.808f, 1.0f};
  float selectionLineWidth{2.0f};
  float selectionDash[2] = {5.0f, 5.0f};
  float handleFill[4] = {0.192f, 0.510f, 0.808f, 1.0f};
  float handleStroke[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float handleSize{8.0f};

  // Rubber-band rectangle
  float rubberBandFill[4] = {0.192f, 0.510f, 0.808f, 0.1f};
  float rubberBandStroke[4] = {0.192f, 0.510f, 0.808f, 0.8f};

  // Crop overlay
  float cropDim[4] = {0.0f, 0.0f, 0.0f, 0.6f};
  float cropBorder[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float cropBorderWidth{2.0f};
  float cropGrid[4] = {1.0f, 1.0f, 1.0f, 0.3f};
  float cropHandle[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float cropHandleSize{10.0f};
  float cropLabelColor[4] = {1.0f, 1.0f, 1.0f, 1.0f};

  // Fallback text color when an element's color does not parse
  float textColor[4] = {0.176f, 0.216f, 0.282f, 1.0f};
};

// Built-in presets
Theme lightTheme();
Theme darkTheme();

// "light" / "dark" (case-insensitive). Unknown names give the light theme.
Theme themeByName(const std::string& name);

// Parse "#rgb", "#rrggbb" or "#rrggbbaa" into RGBA floats. Returns false
// and leaves out untouched on malformed input.
bool parseHexColor(const std::string& hex, float out[4]);

} // namespace mc
