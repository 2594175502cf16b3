#include "mc/session/CompositionConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cstdio>
#include <fstream>
#include <sstream>

namespace mc {

const char* linkModelName(LinkModel m) {
  return m == LinkModel::Directional ? "directional" : "symmetric";
}

bool parseLinkModel(const std::string& s, LinkModel& out) {
  if (s == "symmetric")   { out = LinkModel::Symmetric; return true; }
  if (s == "directional") { out = LinkModel::Directional; return true; }
  return false;
}

std::string serializeCompositionConfig(const CompositionConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  rapidjson::Value res(rapidjson::kObjectType);
  res.AddMember("width", cfg.resolution.width, alloc);
  res.AddMember("height", cfg.resolution.height, alloc);
  doc.AddMember("resolution", res, alloc);

  doc.AddMember("linkModel", rapidjson::StringRef(linkModelName(cfg.linkModel)), alloc);

  doc.AddMember("minElementSize", cfg.minElementSize, alloc);
  doc.AddMember("minCropSize", cfg.minCropSize, alloc);
  doc.AddMember("dragMinVisible", cfg.dragMinVisible, alloc);
  doc.AddMember("resizeHandleRadiusPx", cfg.resizeHandleRadiusPx, alloc);
  doc.AddMember("cropEdgeThreshold", cfg.cropEdgeThreshold, alloc);
  doc.AddMember("maxImageSide", cfg.maxImageSide, alloc);
  doc.AddMember("pasteOffset", cfg.pasteOffset, alloc);
  doc.AddMember("duplicateOffset", cfg.duplicateOffset, alloc);
  doc.AddMember("textPadding", cfg.textPadding, alloc);
  doc.AddMember("lineHeightFactor", cfg.lineHeightFactor, alloc);
  doc.AddMember("pendingTextInset", cfg.pendingTextInset, alloc);

  // Default text style
  rapidjson::Value text(rapidjson::kObjectType);
  text.AddMember("fontFamily",
                 rapidjson::Value(cfg.defaultText.fontFamily.c_str(), alloc), alloc);
  text.AddMember("fontSize", cfg.defaultText.fontSize, alloc);
  text.AddMember("fontWeight", rapidjson::StringRef(fontWeightName(cfg.defaultText.fontWeight)), alloc);
  text.AddMember("fontStyle", rapidjson::StringRef(fontStyleName(cfg.defaultText.fontStyle)), alloc);
  text.AddMember("textAlign", rapidjson::StringRef(textAlignName(cfg.defaultText.textAlign)), alloc);
  text.AddMember("color", rapidjson::Value(cfg.defaultText.color.c_str(), alloc), alloc);
  doc.AddMember("defaultText", text, alloc);

  doc.AddMember("placeholderText",
                rapidjson::Value(cfg.placeholderText.c_str(), alloc), alloc);
  doc.AddMember("minDisplayScale", cfg.minDisplayScale, alloc);
  doc.AddMember("maxDisplayScale", cfg.maxDisplayScale, alloc);
  doc.AddMember("theme", rapidjson::Value(cfg.themeName.c_str(), alloc), alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

static bool readNumber(const rapidjson::Value& obj, const char* key, double& out) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsNumber()) return false;
  out = v.GetDouble();
  return true;
}

static bool readString(const rapidjson::Value& obj, const char* key, std::string& out) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsString()) return false;
  out = v.GetString();
  return true;
}

bool loadCompositionConfig(const std::string& json, CompositionConfig& cfg) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  // Parse into a copy so a failure leaves cfg untouched
  CompositionConfig out = cfg;

  if (doc.HasMember("resolution")) {
    const auto& res = doc["resolution"];
    if (!res.IsObject()) return false;
    if (res.HasMember("width")) {
      if (!res["width"].IsInt() || res["width"].GetInt() <= 0) return false;
      out.resolution.width = res["width"].GetInt();
    }
    if (res.HasMember("height")) {
      if (!res["height"].IsInt() || res["height"].GetInt() <= 0) return false;
      out.resolution.height = res["height"].GetInt();
    }
  }

  std::string linkModel;
  if (!readString(doc, "linkModel", linkModel)) return false;
  if (!linkModel.empty() && !parseLinkModel(linkModel, out.linkModel)) return false;

  if (!readNumber(doc, "minElementSize", out.minElementSize)) return false;
  if (!readNumber(doc, "minCropSize", out.minCropSize)) return false;
  if (!readNumber(doc, "dragMinVisible", out.dragMinVisible)) return false;
  if (!readNumber(doc, "resizeHandleRadiusPx", out.resizeHandleRadiusPx)) return false;
  if (!readNumber(doc, "cropEdgeThreshold", out.cropEdgeThreshold)) return false;
  if (!readNumber(doc, "maxImageSide", out.maxImageSide)) return false;
  if (!readNumber(doc, "pasteOffset", out.pasteOffset)) return false;
  if (!readNumber(doc, "duplicateOffset", out.duplicateOffset)) return false;
  if (!readNumber(doc, "textPadding", out.textPadding)) return false;
  if (!readNumber(doc, "lineHeightFactor", out.lineHeightFactor)) return false;
  if (!readNumber(doc, "pendingTextInset", out.pendingTextInset)) return false;
  if (!readNumber(doc, "minDisplayScale", out.minDisplayScale)) return false;
  if (!readNumber(doc, "maxDisplayScale", out.maxDisplayScale)) return false;
  if (!readString(doc, "placeholderText", out.placeholderText)) return false;
  if (!readString(doc, "theme", out.themeName)) return false;

  if (doc.HasMember("defaultText")) {
    const auto& t = doc["defaultText"];
    if (!t.IsObject()) return false;
    TextStyle& s = out.defaultText;
    if (!readString(t, "fontFamily", s.fontFamily)) return false;
    if (!readNumber(t, "fontSize", s.fontSize)) return false;
    if (!readString(t, "color", s.color)) return false;

    std::string name;
    if (!readString(t, "fontWeight", name)) return false;
    if (!name.empty() && !parseFontWeight(name, s.fontWeight)) return false;
    name.clear();
    if (!readString(t, "fontStyle", name)) return false;
    if (!name.empty() && !parseFontStyle(name, s.fontStyle)) return false;
    name.clear();
    if (!readString(t, "textAlign", name)) return false;
    if (!name.empty() && !parseTextAlign(name, s.textAlign)) return false;
  }

  if (out.minDisplayScale <= 0 || out.maxDisplayScale < out.minDisplayScale) return false;

  cfg = out;
  return true;
}

bool loadCompositionConfigFile(const std::string& path, CompositionConfig& cfg) {
  std::ifstream f(path);
  if (!f) {
    std::fprintf(stderr, "[CompositionConfig] cannot open '%s'\n", path.c_str());
    return false;
  }
  std::stringstream ss;
  ss << f.rdbuf();
  if (!loadCompositionConfig(ss.str(), cfg)) {
    std::fprintf(stderr, "[CompositionConfig] invalid config in '%s'\n", path.c_str());
    return false;
  }
  return true;
}

} // namespace mc
