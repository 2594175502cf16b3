#pragma once
#include "mc/element/ElementStore.hpp"
#include "mc/interaction/CropSession.hpp"
#include "mc/interaction/InteractionState.hpp"
#include "mc/interaction/ResizeMath.hpp"
#include "mc/render/DrawList.hpp"
#include "mc/style/Theme.hpp"
#include "mc/text/TextMeasurer.hpp"
#include "mc/viewport/InputState.hpp"
#include "mc/viewport/Viewport.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mc {

// Emitted on every drag move while cross-viewport linking is enabled.
struct DragNotice {
  Id viewportId;      // viewport running the gesture
  Id elementId;       // element under the pointer at drag start
  Point elementPos;   // its new global top-left
  Point pointer;      // current global pointer position
  std::vector<Id> groupIds;  // every element the gesture moves
};

// What a controller needs from its owner. Implemented by the orchestrator.
class ViewportHost {
public:
  virtual ~ViewportHost() = default;

  // Does viewer render elements owned by owner?
  virtual bool isLinked(const Id& viewerId, const Id& ownerId) const = 0;
  // False when no link is enabled anywhere.
  virtual bool linkingEnabled() const = 0;
  virtual std::optional<Rect> viewportRect(const Id& viewportId) const = 0;

  virtual void onViewportActivated(const Id& viewportId) = 0;
  virtual void onElementDragging(const DragNotice& notice) = 0;
  virtual void onTextEditRequested(const Id& viewportId, const Id& elementId) = 0;
};

struct InteractionConfig {
  double minElementSize{20};
  double dragMinVisible{50};    // logical px kept inside the owner when unlinked
  double handleRadiusPx{8};     // device px
  double textPadding{10};
  CropConfig crop;
};

// One per viewport. Owns the local/global transform, renders the slice of
// the store visible to this viewport, and runs the pointer state machine.
// Holds non-owning references to the store and the host.
class ViewportController {
public:
  ViewportController(Id id, std::string name, ElementStore& store, ViewportHost& host);

  void setConfig(const InteractionConfig& cfg);
  const InteractionConfig& config() const { return config_; }
  void setTheme(const Theme& theme) { theme_ = theme; }

  Viewport& viewport() { return viewport_; }
  const Viewport& viewport() const { return viewport_; }
  const Id& id() const { return viewport_.id(); }

  // Returns true when the event changed state or the store. Always renders.
  bool handlePointer(const PointerEvent& ev);
  // Escape cancels and Enter applies an active crop. Returns true if consumed.
  bool handleKey(const KeyEvent& ev);

  // Crop mode for the primary-selected image. False on invalid entry.
  bool startCrop();
  bool applyCrop();
  bool cancelCrop();

  // Abandon an in-progress gesture without committing anything further.
  void cancelGesture();

  InteractionState state() const { return state_; }
  bool cropping() const { return isCropping(state_); }
  const CropSession& cropSession() const { return crop_; }
  HandleId activeHandle() const { return resizeHandle_; }
  std::optional<Rect> rubberBandRect() const;

  // Last pointer position seen by this viewport, in global coordinates.
  const std::optional<Point>& lastPointer() const { return lastPointer_; }

  // Should this viewport render e (ownership + link predicate)?
  bool isVisibleHere(const Element& e) const;

  // Immediate-mode redraw into frame(). Idempotent given current state.
  const DrawList& render();
  const DrawList& frame() const { return frame_; }
  std::vector<Id> visibleElementIds() const { return frame_.contentElementIds(); }
  std::uint64_t renderCount() const { return renderCount_; }

private:
  struct DragItem {
    Id id;
    Point start;
  };

  bool pointerDown(Point g, bool shift);
  bool pointerMove(Point g);
  bool pointerUp();
  bool doubleClick(Point g);

  bool beginResizeIfOnHandle(Point g);
  void beginDrag(const Id& grabbedId, Point g);
  bool updateDrag(Point g);
  bool updateResize(Point g);
  void anchorRefittedText(ResizeOutcome& r) const;
  bool updateRubberBand(Point g);
  void resetGesture();
  bool isDragged(const Id& id) const;

  ElementStore::ElementFilter visibilityFilter() const;

  void drawElement(const Element& e);
  void drawSelection(const Element& e);
  void drawHandles(const Element& e);
  void drawCropOverlay(const Element& e);

  Viewport viewport_;
  ElementStore& store_;
  ViewportHost& host_;

  InteractionConfig config_;
  Theme theme_;
  FixedAdvanceMeasurer layoutMeasurer_;

  InteractionState state_{InteractionState::Idle};
  Point gestureStart_;
  Id grabbedId_;
  std::vector<DragItem> dragItems_;
  HandleId resizeHandle_{HandleId::None};
  Element resizeOriginal_;
  Point rubberCurrent_;
  CropSession crop_;
  std::optional<Point> lastPointer_;

  DrawList frame_;
  std::uint64_t renderCount_{0};
};

} // namespace mc
