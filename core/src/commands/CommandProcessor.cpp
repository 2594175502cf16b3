#include "mc/commands/CommandProcessor.hpp"

#include "mc/session/CompositionOrchestrator.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace mc {

namespace {

// Accepts "viewport-3", "3" or 3. Throws on a malformed string id.
Id readId(const rapidjson::Value& obj, const char* key, const char* prefix) {
  if (!obj.IsObject()) return {};
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return {};
  const auto& v = it->value;

  if (v.IsUint64()) return std::string(prefix) + "-" + std::to_string(v.GetUint64());
  if (!v.IsString()) throw std::runtime_error(std::string(key) + " must be a string or integer");

  std::string s = v.GetString();
  if (s.empty()) return {};
  std::uint64_t n = parseIdSuffix(s);
  if (s.find('-') == std::string::npos) return std::string(prefix) + "-" + std::to_string(n);
  return s;
}

} // namespace

CommandProcessor::CommandProcessor(CompositionOrchestrator& orchestrator)
  : orch_(orchestrator) {}

CmdResult CommandProcessor::fail(const std::string& code,
                                 const std::string& message,
                                 const std::string& detailsJson) {
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  return r;
}

CmdResult CommandProcessor::okResult(const Id& createdId, double value) {
  CmdResult r;
  r.ok = true;
  r.createdId = createdId;
  r.value = value;
  return r;
}

const rapidjson::Value* CommandProcessor::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

std::string CommandProcessor::getStringOrEmpty(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return {};
  if (v->IsString()) return v->GetString();
  return {};
}

bool CommandProcessor::getNumber(const rapidjson::Value& obj, const char* key, double& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsNumber()) return false;
  double d = v->GetDouble();
  if (!std::isfinite(d)) return false;
  out = d;
  return true;
}

CmdResult CommandProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "CommandProcessor: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult CommandProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  try {
    // Viewports and links
    if (cmd == "addViewport") return cmdAddViewport(obj);
    if (cmd == "removeViewport") return cmdRemoveViewport(obj);
    if (cmd == "setResolution") return cmdSetResolution(obj);
    if (cmd == "toggleLink") return cmdToggleLink(obj);
    if (cmd == "setDisplayScale") return cmdSetDisplayScale(obj);
    if (cmd == "renameViewport") return cmdRenameViewport(obj);
    if (cmd == "activateViewport") return cmdActivateViewport(obj);

    // Text
    if (cmd == "beginText") return cmdBeginText(obj);
    if (cmd == "commitText") return cmdCommitText(obj);
    if (cmd == "cancelText") return cmdCancelText(obj);
    if (cmd == "editText") return cmdEditText(obj);
    if (cmd == "setTextStyle") return cmdSetTextStyle(obj);

    // Selection
    if (cmd == "selectElement") return cmdSelectElement(obj);
    if (cmd == "clearSelection") {
      orch_.store().clearSelection();
      return okResult();
    }
    if (cmd == "deleteSelection") {
      if (!orch_.deleteSelection()) return fail("REJECTED", "deleteSelection: nothing selected");
      return okResult();
    }
    if (cmd == "duplicateSelection") return cmdDuplicateSelection(obj);
    if (cmd == "copy") {
      if (orch_.copySelection() == 0) return fail("REJECTED", "copy: nothing selected");
      return okResult();
    }
    if (cmd == "paste") {
      auto ids = orch_.paste();
      if (ids.empty()) return fail("REJECTED", "paste: clipboard is empty");
      return okResult(ids.front(), static_cast<double>(ids.size()));
    }

    // Z-order
    if (cmd == "bringToFront" || cmd == "sendToBack" ||
        cmd == "bringForward" || cmd == "sendBackward") {
      bool done = false;
      if (cmd == "bringToFront") done = orch_.bringToFront();
      else if (cmd == "sendToBack") done = orch_.sendToBack();
      else if (cmd == "bringForward") done = orch_.bringForward();
      else done = orch_.sendBackward();
      if (!done) return fail("REJECTED", cmd + ": nothing selected");
      return okResult();
    }

    // Crop
    if (cmd == "startCrop") {
      if (!orch_.startCrop()) return fail("REJECTED", "startCrop: selection is not an image");
      return okResult();
    }
    if (cmd == "applyCrop") {
      if (!orch_.applyCrop()) return fail("REJECTED", "applyCrop: not cropping");
      return okResult();
    }
    if (cmd == "cancelCrop") {
      if (!orch_.cancelCrop()) return fail("REJECTED", "cancelCrop: not cropping");
      return okResult();
    }

    if (cmd == "clearAll") {
      orch_.clearAll();
      return okResult();
    }
  } catch (const std::exception& e) {
    return fail("BAD_COMMAND", std::string(cmd) + ": " + e.what());
  }

  return fail("UNKNOWN_COMMAND",
              "Unknown cmd",
              std::string(R"({"cmd":")") + cmd + R"("})");
}

// -------------------- viewports --------------------

CmdResult CommandProcessor::cmdAddViewport(const rapidjson::Value& obj) {
  Direction dir = Direction::Right;
  std::string name = getStringOrEmpty(obj, "direction");
  if (!name.empty() && !parseDirection(name, dir)) {
    return fail("BAD_COMMAND", "addViewport: unknown direction",
                std::string(R"({"direction":")") + name + R"("})");
  }
  return okResult(orch_.addViewport(dir));
}

CmdResult CommandProcessor::cmdRemoveViewport(const rapidjson::Value& obj) {
  Id id = readId(obj, "viewportId", "viewport");
  if (id.empty()) return fail("BAD_COMMAND", "removeViewport: missing viewportId");
  if (!orch_.controller(id)) return fail("NOT_FOUND", "removeViewport: unknown viewport");
  if (!orch_.removeViewport(id)) {
    return fail("REJECTED", "removeViewport: cannot remove the last viewport");
  }
  return okResult();
}

CmdResult CommandProcessor::cmdSetResolution(const rapidjson::Value& obj) {
  double w = 0, h = 0;
  if (!getNumber(obj, "width", w) || !getNumber(obj, "height", h)) {
    return fail("BAD_COMMAND", "setResolution: width and height are required");
  }
  const double maxSide = static_cast<double>(std::numeric_limits<int>::max());
  if (w < 1 || h < 1 || w > maxSide || h > maxSide) {
    return fail("BAD_COMMAND", "setResolution: width and height must be in [1, INT_MAX]");
  }
  if (!orch_.setResolutionForAll(static_cast<int>(w), static_cast<int>(h))) {
    return fail("BAD_COMMAND", "setResolution: width and height must be positive");
  }
  return okResult();
}

CmdResult CommandProcessor::cmdToggleLink(const rapidjson::Value& obj) {
  Id a = readId(obj, "a", "viewport");
  Id b = readId(obj, "b", "viewport");
  if (a.empty() || b.empty()) return fail("BAD_COMMAND", "toggleLink: a and b are required");
  if (!orch_.controller(a) || !orch_.controller(b)) {
    return fail("NOT_FOUND", "toggleLink: unknown viewport");
  }
  if (!orch_.topology().areAdjacent(a, b)) {
    return fail("REJECTED", "toggleLink: viewports are not adjacent");
  }
  bool linked = orch_.toggleLink(a, b);
  return okResult(Id{}, linked ? 1.0 : 0.0);
}

CmdResult CommandProcessor::cmdSetDisplayScale(const rapidjson::Value& obj) {
  double s = 0;
  if (!getNumber(obj, "scale", s)) return fail("BAD_COMMAND", "setDisplayScale: missing scale");
  return okResult(Id{}, orch_.setDisplayScale(s));
}

CmdResult CommandProcessor::cmdRenameViewport(const rapidjson::Value& obj) {
  Id id = readId(obj, "viewportId", "viewport");
  std::string name = getStringOrEmpty(obj, "name");
  if (id.empty() || name.empty()) {
    return fail("BAD_COMMAND", "renameViewport: viewportId and name are required");
  }
  if (!orch_.renameViewport(id, name)) return fail("NOT_FOUND", "renameViewport: unknown viewport");
  return okResult();
}

CmdResult CommandProcessor::cmdActivateViewport(const rapidjson::Value& obj) {
  Id id = readId(obj, "viewportId", "viewport");
  if (!orch_.activateViewport(id)) return fail("NOT_FOUND", "activateViewport: unknown viewport");
  return okResult();
}

// -------------------- text --------------------

CmdResult CommandProcessor::cmdBeginText(const rapidjson::Value& obj) {
  Id vp = readId(obj, "viewportId", "viewport");
  double fontSize = orch_.config().defaultText.fontSize;
  getNumber(obj, "fontSize", fontSize);

  PendingText p = orch_.beginText(getStringOrEmpty(obj, "content"), fontSize, vp);
  if (p.pendingId.empty()) return fail("NOT_FOUND", "beginText: unknown viewport");
  return okResult(p.pendingId);
}

CmdResult CommandProcessor::cmdCommitText(const rapidjson::Value& obj) {
  std::string pendingId = getStringOrEmpty(obj, "pendingId");
  Id id = orch_.commitText(pendingId, getStringOrEmpty(obj, "content"));
  if (id.empty()) return fail("NOT_FOUND", "commitText: unknown pendingId");
  return okResult(id);
}

CmdResult CommandProcessor::cmdCancelText(const rapidjson::Value& obj) {
  if (!orch_.cancelText(getStringOrEmpty(obj, "pendingId"))) {
    return fail("NOT_FOUND", "cancelText: unknown pendingId");
  }
  return okResult();
}

CmdResult CommandProcessor::cmdEditText(const rapidjson::Value& obj) {
  Id id = readId(obj, "elementId", "element");
  if (!orch_.editText(id, getStringOrEmpty(obj, "content"))) {
    return fail("NOT_FOUND", "editText: no such text element");
  }
  return okResult(id);
}

CmdResult CommandProcessor::cmdSetTextStyle(const rapidjson::Value& obj) {
  ElementPatch change;
  double size = 0;
  if (getNumber(obj, "fontSize", size)) change.fontSize = size;

  std::string s = getStringOrEmpty(obj, "fontFamily");
  if (!s.empty()) change.fontFamily = s;
  s = getStringOrEmpty(obj, "color");
  if (!s.empty()) change.color = s;

  s = getStringOrEmpty(obj, "fontWeight");
  if (!s.empty()) {
    FontWeight w;
    if (!parseFontWeight(s, w)) return fail("BAD_COMMAND", "setTextStyle: bad fontWeight");
    change.fontWeight = w;
  }
  s = getStringOrEmpty(obj, "fontStyle");
  if (!s.empty()) {
    FontStyle fs;
    if (!parseFontStyle(s, fs)) return fail("BAD_COMMAND", "setTextStyle: bad fontStyle");
    change.fontStyle = fs;
  }
  s = getStringOrEmpty(obj, "textAlign");
  if (!s.empty()) {
    TextAlign a;
    if (!parseTextAlign(s, a)) return fail("BAD_COMMAND", "setTextStyle: bad textAlign");
    change.textAlign = a;
  }

  if (!orch_.setSelectedTextStyle(change)) {
    return fail("REJECTED", "setTextStyle: selection is not a text element");
  }
  return okResult();
}

// -------------------- selection --------------------

CmdResult CommandProcessor::cmdSelectElement(const rapidjson::Value& obj) {
  Id id = readId(obj, "elementId", "element");
  if (!orch_.store().contains(id)) return fail("NOT_FOUND", "selectElement: unknown element");

  const auto* additive = getMember(obj, "additive");
  if (additive && additive->IsBool() && additive->GetBool()) {
    if (!orch_.store().isSelected(id)) orch_.store().toggleSelection(id);
  } else {
    orch_.store().select(id);
  }
  return okResult(id);
}

CmdResult CommandProcessor::cmdDuplicateSelection(const rapidjson::Value& obj) {
  double dx = orch_.config().duplicateOffset;
  double dy = orch_.config().duplicateOffset;
  getNumber(obj, "dx", dx);
  getNumber(obj, "dy", dy);
  auto ids = orch_.duplicateSelection(dx, dy);
  if (ids.empty()) return fail("REJECTED", "duplicateSelection: nothing selected");
  return okResult(ids.front(), static_cast<double>(ids.size()));
}

// -------------------- queries --------------------

std::string CommandProcessor::listViewportsJson() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("active");
  w.String(orch_.activeViewportId().c_str());
  w.Key("displayScale");
  w.Double(orch_.displayScale());

  w.Key("viewports");
  w.StartArray();
  for (const auto& id : orch_.viewportIds()) {
    const ViewportController* c = orch_.controller(id);
    if (!c) continue;
    const Viewport& vp = c->viewport();
    w.StartObject();
    w.Key("id"); w.String(vp.id().c_str());
    w.Key("name"); w.String(vp.name().c_str());
    w.Key("row"); w.Int(vp.cell().row);
    w.Key("col"); w.Int(vp.cell().col);
    w.Key("offsetX"); w.Double(vp.offsetX());
    w.Key("offsetY"); w.Double(vp.offsetY());
    w.Key("width"); w.Int(vp.width());
    w.Key("height"); w.Int(vp.height());
    w.Key("active"); w.Bool(vp.id() == orch_.activeViewportId());
    w.EndObject();
  }
  w.EndArray();

  w.Key("links");
  w.StartArray();
  for (const auto& lc : orch_.linkControls()) {
    w.StartObject();
    w.Key("a"); w.String(lc.a.c_str());
    w.Key("b"); w.String(lc.b.c_str());
    w.Key("horizontal"); w.Bool(lc.horizontal);
    w.Key("buttonRow"); w.Int(lc.buttonRow);
    w.Key("buttonCol"); w.Int(lc.buttonCol);
    w.Key("aShowsB"); w.Bool(lc.aShowsB);
    w.Key("bShowsA"); w.Bool(lc.bShowsA);
    w.EndObject();
  }
  w.EndArray();

  w.EndObject();
  return sb.GetString();
}

std::string CommandProcessor::selectionJson() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  const ElementStore& store = orch_.store();

  w.StartObject();
  w.Key("primary");
  if (store.selection().hasPrimary()) w.String(store.primarySelection().c_str());
  else w.Null();

  w.Key("selected");
  w.StartArray();
  for (const auto& id : store.selectedIds()) w.String(id.c_str());
  w.EndArray();

  w.Key("textStyle");
  auto style = orch_.selectedTextStyle();
  if (style) {
    w.StartObject();
    w.Key("fontFamily"); w.String(style->fontFamily.c_str());
    w.Key("fontSize"); w.Double(style->fontSize);
    w.Key("fontWeight"); w.String(fontWeightName(style->fontWeight));
    w.Key("fontStyle"); w.String(fontStyleName(style->fontStyle));
    w.Key("textAlign"); w.String(textAlignName(style->textAlign));
    w.Key("color"); w.String(style->color.c_str());
    w.EndObject();
  } else {
    w.Null();
  }

  w.EndObject();
  return sb.GetString();
}

} // namespace mc
