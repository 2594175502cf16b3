#pragma once
#include "mc/element/Element.hpp"
#include "mc/grid/GridTopology.hpp"

#include <string>

namespace mc {

struct Resolution {
  int width{800};
  int height{600};
};

// Tunables for a composition. Defaults reproduce the reference behaviour.
struct CompositionConfig {
  Resolution resolution;
  LinkModel linkModel{LinkModel::Symmetric};

  double minElementSize{20};
  double minCropSize{20};
  double dragMinVisible{50};
  double resizeHandleRadiusPx{8};
  double cropEdgeThreshold{20};

  double maxImageSide{300};
  double pasteOffset{20};
  double duplicateOffset{20};

  double textPadding{10};
  double lineHeightFactor{1.2};
  TextStyle defaultText;
  std::string placeholderText{"Double-click to edit"};
  double pendingTextInset{50};  // new text starts this far left of the viewport centre

  double minDisplayScale{0.1};
  double maxDisplayScale{2.0};

  std::string themeName{"light"};
};

const char* linkModelName(LinkModel m);
bool parseLinkModel(const std::string& s, LinkModel& out);

// Serialize CompositionConfig to a JSON string.
std::string serializeCompositionConfig(const CompositionConfig& cfg);

// Parse JSON into cfg. Missing keys keep their current values.
// Returns false on malformed JSON or a wrongly typed known key.
bool loadCompositionConfig(const std::string& json, CompositionConfig& cfg);

// Read a file and load it. Logs and returns false when unreadable.
bool loadCompositionConfigFile(const std::string& path, CompositionConfig& cfg);

} // namespace mc
