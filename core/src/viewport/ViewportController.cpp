#include "mc/viewport/ViewportController.hpp"
#include "mc/text/TextLayout.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace mc {

ViewportController::ViewportController(Id id, std::string name, ElementStore& store,
                                       ViewportHost& host)
  : viewport_(std::move(id), std::move(name)), store_(store), host_(host),
    theme_(lightTheme()) {
  crop_.setConfig(config_.crop);
}

void ViewportController::setConfig(const InteractionConfig& cfg) {
  config_ = cfg;
  crop_.setConfig(cfg.crop);
}

bool ViewportController::isVisibleHere(const Element& e) const {
  if (e.ownerViewportId.empty() || e.ownerViewportId == id()) return true;
  return host_.isLinked(id(), e.ownerViewportId);
}

ElementStore::ElementFilter ViewportController::visibilityFilter() const {
  return [this](const Element& e) { return isVisibleHere(e); };
}

std::optional<Rect> ViewportController::rubberBandRect() const {
  if (state_ != InteractionState::RubberBandSelecting) return std::nullopt;
  return rectFromCorners(gestureStart_, rubberCurrent_);
}

// -------------------- input --------------------

bool ViewportController::handlePointer(const PointerEvent& ev) {
  Point g = viewport_.deviceToGlobal({ev.x, ev.y});
  lastPointer_ = g;

  bool changed = false;
  switch (ev.action) {
    case PointerAction::Down:
      host_.onViewportActivated(id());
      changed = pointerDown(g, ev.shift);
      break;
    case PointerAction::Move:
      changed = pointerMove(g);
      break;
    case PointerAction::Up:
      changed = pointerUp();
      break;
    case PointerAction::DoubleClick:
      changed = doubleClick(g);
      break;
  }

  render();
  return changed;
}

bool ViewportController::handleKey(const KeyEvent& ev) {
  if (!cropping()) return false;
  if (ev.key == KeyCode::Escape) return cancelCrop();
  if (ev.key == KeyCode::Enter) return applyCrop();
  return false;
}

bool ViewportController::pointerDown(Point g, bool shift) {
  // One gesture at a time
  if (state_ != InteractionState::Idle && state_ != InteractionState::CroppingIdle) {
    return false;
  }

  if (state_ == InteractionState::CroppingIdle) {
    const Element* e = store_.get(crop_.elementId());
    if (!e) {
      crop_.end();
      state_ = InteractionState::Idle;
    } else {
      Point local = g - Point{e->x, e->y};
      Rect box = rectFromBox(0, 0, e->width, e->height).inflated(config_.crop.edgeThreshold);
      if (box.contains(local)) {
        if (crop_.beginHandleDrag(local)) {
          state_ = InteractionState::CroppingHandleDrag;
        }
        return true;
      }
      // Outside the image: commit, leave crop mode, then handle as Idle
      applyCrop();
    }
  }

  if (!shift && beginResizeIfOnHandle(g)) return true;

  const Element* hit = store_.hitTest(g, visibilityFilter());
  if (hit) {
    Id hitId = hit->id;
    if (shift) {
      store_.toggleSelection(hitId);
      return true;
    }
    if (!store_.isSelected(hitId)) store_.select(hitId);
    beginDrag(hitId, g);
    return true;
  }

  if (!shift) store_.clearSelection();
  state_ = InteractionState::RubberBandSelecting;
  gestureStart_ = g;
  rubberCurrent_ = g;
  return true;
}

bool ViewportController::beginResizeIfOnHandle(Point g) {
  if (store_.selectedIds().size() != 1 || !store_.selection().hasPrimary()) return false;
  const Element* e = store_.get(store_.primarySelection());
  if (!e || !isVisibleHere(*e)) return false;

  double radius = config_.handleRadiusPx / viewport_.displayScale();
  HandleId h = handleAt(e->effectiveBounds(), g, radius, e->isText());
  if (h == HandleId::None) return false;

  state_ = InteractionState::Resizing;
  resizeHandle_ = h;
  gestureStart_ = g;
  grabbedId_ = e->id;
  resizeOriginal_ = *e;
  resizeOriginal_.image.reset();
  return true;
}

void ViewportController::beginDrag(const Id& grabbedId, Point g) {
  state_ = InteractionState::Dragging;
  gestureStart_ = g;
  grabbedId_ = grabbedId;
  dragItems_.clear();
  for (const auto& id : store_.selectedIds()) {
    const Element* e = store_.get(id);
    if (e) dragItems_.push_back({id, {e->x, e->y}});
  }
}

bool ViewportController::pointerMove(Point g) {
  switch (state_) {
    case InteractionState::Dragging:
      return updateDrag(g);
    case InteractionState::Resizing:
      return updateResize(g);
    case InteractionState::RubberBandSelecting:
      return updateRubberBand(g);
    case InteractionState::CroppingHandleDrag: {
      const Element* e = store_.get(crop_.elementId());
      if (!e) {
        crop_.end();
        state_ = InteractionState::Idle;
        return true;
      }
      crop_.dragTo(g - Point{e->x, e->y});
      return true;
    }
    case InteractionState::Idle:
    case InteractionState::CroppingIdle:
    default:
      return false;
  }
}

bool ViewportController::updateDrag(Point g) {
  const Point d = g - gestureStart_;
  const bool linked = host_.linkingEnabled();

  std::vector<std::pair<Id, ElementPatch>> patches;
  patches.reserve(dragItems_.size());
  for (const auto& item : dragItems_) {
    const Element* e = store_.get(item.id);
    if (!e) continue;

    double nx = item.start.x + d.x;
    double ny = item.start.y + d.y;

    if (!linked) {
      Rect owner = host_.viewportRect(e->ownerViewportId).value_or(viewport_.globalRect());
      double keep = config_.dragMinVisible;
      nx = clampValue(nx, owner.left - e->width + keep, owner.right - keep);
      ny = clampValue(ny, owner.top - e->height + keep, owner.bottom - keep);
    }

    ElementPatch p;
    p.x = nx;
    p.y = ny;
    patches.emplace_back(item.id, p);
  }
  if (patches.empty()) return false;
  store_.updateMany(patches);

  if (linked) {
    const Element* grabbed = store_.get(grabbedId_);
    if (grabbed) {
      DragNotice notice{id(), grabbedId_, {grabbed->x, grabbed->y}, g, {}};
      notice.groupIds.reserve(patches.size());
      for (const auto& p : patches) notice.groupIds.push_back(p.first);
      host_.onElementDragging(notice);
    }
  }
  return true;
}

bool ViewportController::updateResize(Point g) {
  if (!store_.contains(grabbedId_)) {
    resetGesture();
    return true;
  }
  const Point d = g - gestureStart_;
  ResizeOutcome r = resizeElement(resizeOriginal_, resizeHandle_, d.x, d.y,
                                  config_.minElementSize);
  if (r.fontSize) anchorRefittedText(r);

  ElementPatch p;
  p.x = r.box.x;
  p.y = r.box.y;
  p.width = r.box.width;
  p.height = r.box.height;
  if (r.fontSize) p.fontSize = *r.fontSize;
  if (r.crop) p.crop.emplace(*r.crop);
  store_.update(grabbedId_, p);
  return true;
}

// The store re-fits a text box from its font size, and the padding does not
// scale with it. Anchor the edges opposite the handle on the fitted box.
void ViewportController::anchorRefittedText(ResizeOutcome& r) const {
  const TextMeasurer* m = store_.textMeasurer();
  if (!m || !resizeOriginal_.isText()) return;

  TextStyle style = resizeOriginal_.style;
  style.fontSize = *r.fontSize;
  TextBox fitted = layoutTextBox(*m, resizeOriginal_.content, style, store_.textBoxConfig());

  const Element& o = resizeOriginal_;
  bool west = resizeHandle_ == HandleId::NW || resizeHandle_ == HandleId::SW;
  bool north = resizeHandle_ == HandleId::NW || resizeHandle_ == HandleId::NE;
  r.box.width = fitted.width;
  r.box.height = fitted.height;
  r.box.x = west ? o.x + o.width - fitted.width : o.x;
  r.box.y = north ? o.y + o.height - fitted.height : o.y;
}

bool ViewportController::updateRubberBand(Point g) {
  rubberCurrent_ = g;
  Rect band = rectFromCorners(gestureStart_, g);

  std::vector<Id> ids;
  for (const Element* e : store_.elementsOverlapping(band, visibilityFilter())) {
    ids.push_back(e->id);
  }
  store_.setSelection(ids);
  return true;
}

bool ViewportController::pointerUp() {
  switch (state_) {
    case InteractionState::Dragging:
    case InteractionState::Resizing:
    case InteractionState::RubberBandSelecting:
      resetGesture();
      return true;
    case InteractionState::CroppingHandleDrag:
      crop_.endHandleDrag();
      state_ = InteractionState::CroppingIdle;
      return true;
    case InteractionState::Idle:
    case InteractionState::CroppingIdle:
    default:
      return false;
  }
}

bool ViewportController::doubleClick(Point g) {
  if (state_ != InteractionState::Idle) return false;

  const Element* hit = store_.hitTest(g, visibilityFilter());
  if (!hit) return false;
  Id hitId = hit->id;
  bool isImage = hit->isImage();

  store_.select(hitId);
  if (isImage) return startCrop();

  host_.onTextEditRequested(id(), hitId);
  return true;
}

void ViewportController::resetGesture() {
  state_ = InteractionState::Idle;
  grabbedId_.clear();
  dragItems_.clear();
  resizeHandle_ = HandleId::None;
}

void ViewportController::cancelGesture() {
  if (cropping()) {
    crop_.end();
  }
  resetGesture();
}

bool ViewportController::isDragged(const Id& elementId) const {
  if (state_ != InteractionState::Dragging) return false;
  for (const auto& item : dragItems_) {
    if (item.id == elementId) return true;
  }
  return false;
}

// -------------------- crop --------------------

bool ViewportController::startCrop() {
  if (state_ != InteractionState::Idle) return false;
  const Element* e = store_.get(store_.primarySelection());
  if (!e || !e->isImage()) return false;

  crop_.begin(e->id, e->width, e->height, e->crop);
  state_ = InteractionState::CroppingIdle;
  render();
  return true;
}

bool ViewportController::applyCrop() {
  if (!cropping()) return false;
  Id elementId = crop_.elementId();
  std::optional<CropRect> result = crop_.result();

  crop_.end();
  state_ = InteractionState::Idle;

  if (store_.contains(elementId)) {
    ElementPatch p;
    p.crop.emplace(result);
    store_.update(elementId, p);
  }
  render();
  return true;
}

bool ViewportController::cancelCrop() {
  if (!cropping()) return false;
  crop_.end();
  state_ = InteractionState::Idle;
  render();
  return true;
}

// -------------------- render --------------------

const DrawList& ViewportController::render() {
  store_.refreshTextBoxes();

  if (cropping() && !store_.contains(crop_.elementId())) {
    crop_.end();
    state_ = InteractionState::Idle;
  }

  frame_.reset();
  frame_.clear(theme_.backgroundColor);
  frame_.fillRect(viewport_.localRect(), theme_.backgroundColor, DrawLayer::Background);

  const Element* primary = nullptr;
  const Element* cropTarget = nullptr;

  for (const Element* e : store_.elementsOverlapping(viewport_.globalRect())) {
    if (!isDragged(e->id) && !isVisibleHere(*e)) continue;

    drawElement(*e);

    bool isCropTarget = cropping() && e->id == crop_.elementId();
    if (isCropTarget) cropTarget = e;
    if (store_.isSelected(e->id) && !isCropTarget) drawSelection(*e);
    if (e->id == store_.primarySelection()) primary = e;
  }

  if (primary && !cropping() && store_.selectedIds().size() == 1) {
    drawHandles(*primary);
  }
  if (cropTarget) drawCropOverlay(*cropTarget);

  if (auto band = rubberBandRect()) {
    Rect local = viewport_.toLocal(*band);
    frame_.fillRect(local, theme_.rubberBandFill, DrawLayer::RubberBand);
    frame_.strokeRect(local, theme_.rubberBandStroke, 1.0f, nullptr, DrawLayer::RubberBand);
  }

  renderCount_++;
  return frame_;
}

void ViewportController::drawElement(const Element& e) {
  Rect box = viewport_.toLocal(e.bounds());

  if (e.isImage()) {
    bool showFull = cropping() && e.id == crop_.elementId();
    if (e.crop && !showFull) {
      Rect clip = viewport_.toLocal(e.effectiveBounds());
      frame_.image(box, e.image, &clip, e.id);
    } else {
      frame_.image(box, e.image, nullptr, e.id);
    }
    return;
  }

  const TextMeasurer* m = store_.textMeasurer();
  TextBox layout = layoutTextBox(m ? *m : static_cast<const TextMeasurer&>(layoutMeasurer_),
                                 e.content, e.style, store_.textBoxConfig());

  float color[4];
  for (int i = 0; i < 4; i++) color[i] = theme_.textColor[i];
  parseHexColor(e.style.color, color);

  double anchorX = lineAnchorX(e.style.textAlign, box.left, box.width(), config_.textPadding);
  for (std::size_t i = 0; i < layout.lines.size(); i++) {
    Point anchor{anchorX, lineMiddleY(box.top, layout.lineHeight, i)};
    frame_.text(anchor, layout.lines[i].text, e.style, color, DrawLayer::Content, e.id);
  }
}

void ViewportController::drawSelection(const Element& e) {
  Rect r = viewport_.toLocal(e.effectiveBounds());
  frame_.strokeRect(r, theme_.selectionColor, theme_.selectionLineWidth,
                    theme_.selectionDash, DrawLayer::Selection, e.id);
}

void ViewportController::drawHandles(const Element& e) {
  static const HandleId kAll[8] = {
    HandleId::NW, HandleId::N, HandleId::NE, HandleId::E,
    HandleId::SE, HandleId::S, HandleId::SW, HandleId::W
  };

  Rect r = viewport_.toLocal(e.effectiveBounds());
  double half = theme_.handleSize * 0.5 / viewport_.displayScale();
  for (HandleId h : kAll) {
    if (e.isText() && !isCornerHandle(h)) continue;
    Point a = handleAnchor(r, h);
    Rect sq{a.x - half, a.y - half, a.x + half, a.y + half};
    frame_.fillRect(sq, theme_.handleFill, DrawLayer::Handle, e.id);
    frame_.strokeRect(sq, theme_.handleStroke, 1.0f, nullptr, DrawLayer::Handle, e.id);
  }
}

void ViewportController::drawCropOverlay(const Element& e) {
  Rect box = viewport_.toLocal(e.bounds());
  const CropRect& b = crop_.bounds();
  Rect c{box.left + b.left, box.top + b.top, box.left + b.right, box.top + b.bottom};

  // Dim outside the provisional bounds
  const Rect dims[4] = {
    {box.left, box.top, box.right, c.top},
    {box.left, c.bottom, box.right, box.bottom},
    {box.left, c.top, c.left, c.bottom},
    {c.right, c.top, box.right, c.bottom}
  };
  for (const auto& d : dims) {
    if (d.width() > 0 && d.height() > 0) {
      frame_.fillRect(d, theme_.cropDim, DrawLayer::CropOverlay, e.id);
    }
  }

  frame_.strokeRect(c, theme_.cropBorder, theme_.cropBorderWidth, nullptr,
                    DrawLayer::CropOverlay, e.id);

  // Rule of thirds
  for (int i = 1; i <= 2; i++) {
    double x = c.left + c.width() * i / 3.0;
    double y = c.top + c.height() * i / 3.0;
    frame_.line({x, c.top}, {x, c.bottom}, theme_.cropGrid, 1.0f, DrawLayer::CropOverlay, e.id);
    frame_.line({c.left, y}, {c.right, y}, theme_.cropGrid, 1.0f, DrawLayer::CropOverlay, e.id);
  }

  static const HandleId kAll[8] = {
    HandleId::NW, HandleId::N, HandleId::NE, HandleId::E,
    HandleId::SE, HandleId::S, HandleId::SW, HandleId::W
  };
  double half = theme_.cropHandleSize * 0.5;
  for (HandleId h : kAll) {
    Point a = handleAnchor(c, h);
    frame_.fillRect({a.x - half, a.y - half, a.x + half, a.y + half},
                    theme_.cropHandle, DrawLayer::CropOverlay, e.id);
  }

  char label[64];
  std::snprintf(label, sizeof(label), "%d x %d",
                static_cast<int>(std::lround(b.width())),
                static_cast<int>(std::lround(b.height())));
  TextStyle labelStyle;
  labelStyle.fontSize = 12;
  frame_.text({c.left, c.top - 10}, label, labelStyle, theme_.cropLabelColor,
              DrawLayer::CropOverlay, e.id);
}

} // namespace mc
