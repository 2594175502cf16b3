#pragma once
#include "mc/ids/Id.hpp"

#include <string>

#include <rapidjson/document.h>

namespace mc {

class CompositionOrchestrator;

struct CmdError {
  std::string code;     // e.g. "NOT_FOUND"
  std::string message;  // human text
  std::string details;  // small JSON string with fields
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
  Id createdId;         // new element / viewport / pending text
  double value{0};      // link state (0/1) or applied display scale
};

// JSON command surface for the UI layer. Each command is an object with a
// string "cmd" field.
class CommandProcessor {
public:
  explicit CommandProcessor(CompositionOrchestrator& orchestrator);

  // Apply a single JSON command object.
  CmdResult applyJson(const rapidjson::Value& obj);

  // Convenience: parse string then apply.
  CmdResult applyJsonText(const std::string& jsonText);

  // Viewports with their screen geometry, plus link controls.
  std::string listViewportsJson() const;

  // {"primary": id|null, "selected": [ids], "textStyle": {...}|null}
  std::string selectionJson() const;

private:
  CompositionOrchestrator& orch_;

  // ---- handlers ----
  CmdResult cmdAddViewport(const rapidjson::Value& obj);
  CmdResult cmdRemoveViewport(const rapidjson::Value& obj);
  CmdResult cmdSetResolution(const rapidjson::Value& obj);
  CmdResult cmdToggleLink(const rapidjson::Value& obj);
  CmdResult cmdSetDisplayScale(const rapidjson::Value& obj);
  CmdResult cmdRenameViewport(const rapidjson::Value& obj);
  CmdResult cmdActivateViewport(const rapidjson::Value& obj);

  CmdResult cmdBeginText(const rapidjson::Value& obj);
  CmdResult cmdCommitText(const rapidjson::Value& obj);
  CmdResult cmdCancelText(const rapidjson::Value& obj);
  CmdResult cmdEditText(const rapidjson::Value& obj);
  CmdResult cmdSetTextStyle(const rapidjson::Value& obj);

  CmdResult cmdSelectElement(const rapidjson::Value& obj);
  CmdResult cmdDuplicateSelection(const rapidjson::Value& obj);

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static std::string getStringOrEmpty(const rapidjson::Value& obj, const char* key);
  static bool getNumber(const rapidjson::Value& obj, const char* key, double& out);
  static CmdResult fail(const std::string& code,
                        const std::string& message,
                        const std::string& detailsJson = "{}");
  static CmdResult okResult(const Id& createdId = Id{}, double value = 0);
};

} // namespace mc
