#include "mc/session/CompositionOrchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace mc {

CompositionOrchestrator::CompositionOrchestrator(const CompositionConfig& cfg)
  : config_(cfg), theme_(themeByName(cfg.themeName)), topology_(cfg.linkModel) {
  TextBoxConfig textCfg;
  textCfg.padding = config_.textPadding;
  textCfg.lineHeightFactor = config_.lineHeightFactor;
  textCfg.minSize = config_.minElementSize;
  store_.setTextBoxConfig(textCfg);
  store_.setMinCropSize(config_.minCropSize);
  store_.setTextMeasurer(&defaultMeasurer_);

  storeToken_ = store_.subscribe([this]() { renderAll(); });

  // A composition always has at least one viewport
  addViewport(Direction::Right);
}

CompositionOrchestrator::~CompositionOrchestrator() {
  store_.unsubscribe(storeToken_);
}

InteractionConfig CompositionOrchestrator::interactionConfig() const {
  InteractionConfig ic;
  ic.minElementSize = config_.minElementSize;
  ic.dragMinVisible = config_.dragMinVisible;
  ic.handleRadiusPx = config_.resizeHandleRadiusPx;
  ic.textPadding = config_.textPadding;
  ic.crop.edgeThreshold = config_.cropEdgeThreshold;
  ic.crop.minSize = config_.minCropSize;
  return ic;
}

// -------------------- viewports --------------------

Id CompositionOrchestrator::addViewport(Direction direction) {
  Id reference = activeId_;
  if (reference.empty() && !controllers_.empty()) reference = controllers_.back()->id();
  GridCell cell = topology_.nextPosition(direction, reference);

  Id id = viewportIds_.next();
  std::string name = "Canvas " + std::to_string(viewportIds_.issued());

  auto c = std::make_unique<ViewportController>(id, name, store_, *this);
  c->setConfig(interactionConfig());
  c->setTheme(theme_);
  c->viewport().setResolution(config_.resolution.width, config_.resolution.height);
  c->viewport().setDisplayScale(displayScale_);
  controllers_.push_back(std::move(c));

  topology_.place(id, cell.row, cell.col);
  if (activeId_.empty()) activeId_ = id;

  recalculateOffsets();
  notifyStructure();
  renderAll();
  return id;
}

bool CompositionOrchestrator::removeViewport(const Id& viewportId) {
  auto it = std::find_if(controllers_.begin(), controllers_.end(),
    [&](const std::unique_ptr<ViewportController>& c) { return c->id() == viewportId; });
  if (it == controllers_.end()) return false;

  if (controllers_.size() <= 1) {
    std::fprintf(stderr, "[Orchestrator] refusing to remove the last viewport '%s'\n",
                 viewportId.c_str());
    return false;
  }

  pendingTexts_.erase(
    std::remove_if(pendingTexts_.begin(), pendingTexts_.end(),
      [&](const PendingText& p) { return p.viewportId == viewportId; }),
    pendingTexts_.end());

  topology_.remove(viewportId);
  controllers_.erase(it);

  if (activeId_ == viewportId) activeId_ = controllers_.front()->id();

  recalculateOffsets();

  // Hand orphaned elements to whichever viewport now shows their centre
  std::vector<std::pair<Id, ElementPatch>> patches;
  for (const auto& e : store_.all()) {
    if (e.ownerViewportId != viewportId) continue;
    Id owner = viewportAt(e.bounds().center());
    ElementPatch p;
    p.ownerViewportId = owner.empty() ? activeId_ : owner;
    patches.emplace_back(e.id, p);
  }
  if (!patches.empty()) store_.updateMany(patches);

  notifyStructure();
  renderAll();
  return true;
}

bool CompositionOrchestrator::setResolutionForAll(int width, int height) {
  if (width <= 0 || height <= 0) return false;
  config_.resolution.width = width;
  config_.resolution.height = height;
  for (auto& c : controllers_) c->viewport().setResolution(width, height);
  recalculateOffsets();
  notifyStructure();
  renderAll();
  return true;
}

void CompositionOrchestrator::recalculateOffsets() {
  for (auto& c : controllers_) {
    const GridCell* cell = topology_.cellOf(c->id());
    if (cell) c->viewport().setCell(*cell);
  }
}

bool CompositionOrchestrator::toggleLink(const Id& a, const Id& b) {
  if (!topology_.areAdjacent(a, b)) return topology_.isLinked(a, b);
  bool linked = topology_.toggleLink(a, b);
  notifyStructure();
  renderAll();
  return linked;
}

std::vector<LinkControl> CompositionOrchestrator::linkControls() const {
  std::vector<LinkControl> out;
  // Only right and bottom neighbours, so every pair appears once
  for (const auto& c : controllers_) {
    const GridCell* cell = topology_.cellOf(c->id());
    if (!cell) continue;
    auto adj = topology_.adjacentOf(c->id());
    for (Direction d : {Direction::Right, Direction::Bottom}) {
      auto it = adj.find(d);
      if (it == adj.end()) continue;
      LinkControl lc;
      lc.a = c->id();
      lc.b = it->second;
      lc.horizontal = (d == Direction::Right);
      if (lc.horizontal) {
        lc.buttonRow = 2 * cell->row + 1;
        lc.buttonCol = 2 * cell->col + 2;
      } else {
        lc.buttonRow = 2 * cell->row + 2;
        lc.buttonCol = 2 * cell->col + 1;
      }
      lc.aShowsB = topology_.isLinked(lc.a, lc.b);
      lc.bShowsA = topology_.isLinked(lc.b, lc.a);
      out.push_back(lc);
    }
  }
  return out;
}

double CompositionOrchestrator::setDisplayScale(double scale) {
  displayScale_ = clampValue(scale, config_.minDisplayScale, config_.maxDisplayScale);
  for (auto& c : controllers_) c->viewport().setDisplayScale(displayScale_);
  renderAll();
  return displayScale_;
}

bool CompositionOrchestrator::renameViewport(const Id& viewportId, const std::string& name) {
  ViewportController* c = controller(viewportId);
  if (!c || name.empty()) return false;
  c->viewport().setName(name);
  notifyStructure();
  return true;
}

bool CompositionOrchestrator::activateViewport(const Id& viewportId) {
  if (!controller(viewportId)) return false;
  if (activeId_ == viewportId) return true;
  activeId_ = viewportId;
  notifyStructure();
  return true;
}

std::vector<Id> CompositionOrchestrator::viewportIds() const {
  std::vector<Id> ids;
  ids.reserve(controllers_.size());
  for (const auto& c : controllers_) ids.push_back(c->id());
  return ids;
}

ViewportController* CompositionOrchestrator::controller(const Id& viewportId) {
  for (auto& c : controllers_) {
    if (c->id() == viewportId) return c.get();
  }
  return nullptr;
}

const ViewportController* CompositionOrchestrator::controller(const Id& viewportId) const {
  for (const auto& c : controllers_) {
    if (c->id() == viewportId) return c.get();
  }
  return nullptr;
}

Id CompositionOrchestrator::resolveViewport(const Id& viewportId) const {
  if (viewportId.empty()) return activeId_;
  return controller(viewportId) ? viewportId : Id{};
}

Id CompositionOrchestrator::viewportAt(Point global) const {
  for (const auto& c : controllers_) {
    if (c->viewport().containsGlobal(global)) return c->id();
  }
  return {};
}

// -------------------- input --------------------

bool CompositionOrchestrator::handlePointer(const Id& viewportId, const PointerEvent& ev) {
  ViewportController* c = controller(viewportId);
  if (!c) return false;
  bool changed = c->handlePointer(ev);
  lastPointer_ = c->lastPointer();
  return changed;
}

bool CompositionOrchestrator::handleKey(const Id& viewportId, const KeyEvent& ev) {
  ViewportController* c = controller(resolveViewport(viewportId));
  if (c && c->handleKey(ev)) return true;

  switch (ev.key) {
    case KeyCode::Delete:
    case KeyCode::Backspace:
      return deleteSelection();
    case KeyCode::C:
      if (ev.ctrl) return copySelection() > 0;
      return false;
    case KeyCode::V:
      if (ev.ctrl) return !paste().empty();
      return false;
    case KeyCode::D:
      if (ev.ctrl) {
        return !duplicateSelection(config_.duplicateOffset, config_.duplicateOffset).empty();
      }
      return false;
    default:
      return false;
  }
}

// -------------------- text --------------------

std::string CompositionOrchestrator::normalizeText(const std::string& content) const {
  auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
  auto first = std::find_if(content.begin(), content.end(), notSpace);
  auto last = std::find_if(content.rbegin(), content.rend(), notSpace).base();
  if (first >= last) return config_.placeholderText;
  return std::string(first, last);
}

PendingText CompositionOrchestrator::beginText(const std::string& initialContent,
                                               double fontSize, const Id& viewportId) {
  PendingText p;
  Id vpId = resolveViewport(viewportId);
  const ViewportController* c = controller(vpId);
  if (!c) return p;

  if (fontSize <= 0) fontSize = config_.defaultText.fontSize;
  Rect r = c->viewport().globalRect();
  Point centre = r.center();

  p.pendingId = pendingIds_.next();
  p.viewportId = vpId;
  p.position = {centre.x - config_.pendingTextInset, centre.y - fontSize / 2};
  p.initialContent = initialContent;
  p.fontSize = fontSize;
  pendingTexts_.push_back(p);
  return p;
}

Id CompositionOrchestrator::commitText(const Id& pendingId, const std::string& content) {
  auto it = std::find_if(pendingTexts_.begin(), pendingTexts_.end(),
    [&](const PendingText& p) { return p.pendingId == pendingId; });
  if (it == pendingTexts_.end()) return {};
  PendingText p = *it;
  pendingTexts_.erase(it);

  Element e;
  e.kind = ElementKind::Text;
  e.x = p.position.x;
  e.y = p.position.y;
  e.ownerViewportId = p.viewportId;
  e.content = normalizeText(content);
  e.style = config_.defaultText;
  e.style.fontSize = p.fontSize;

  Id id = store_.add(std::move(e));
  store_.select(id);
  return id;
}

bool CompositionOrchestrator::cancelText(const Id& pendingId) {
  auto before = pendingTexts_.size();
  pendingTexts_.erase(
    std::remove_if(pendingTexts_.begin(), pendingTexts_.end(),
      [&](const PendingText& p) { return p.pendingId == pendingId; }),
    pendingTexts_.end());
  return pendingTexts_.size() != before;
}

bool CompositionOrchestrator::editText(const Id& elementId, const std::string& content) {
  const Element* e = store_.get(elementId);
  if (!e || !e->isText()) return false;
  ElementPatch p;
  p.content = normalizeText(content);
  store_.update(elementId, p);
  return true;
}

// -------------------- images --------------------

Id CompositionOrchestrator::createImage(std::shared_ptr<const Bitmap> bitmap,
                                        const Id& viewportId) {
  if (!bitmap || bitmap->width <= 0 || bitmap->height <= 0) return {};
  Id vpId = resolveViewport(viewportId);
  const ViewportController* c = controller(vpId);
  if (!c) return {};

  double w = bitmap->width;
  double h = bitmap->height;
  double longest = std::max(w, h);
  if (longest > config_.maxImageSide) {
    double s = config_.maxImageSide / longest;
    w *= s;
    h *= s;
  }
  double shortest = std::min(w, h);
  if (shortest < config_.minElementSize) {
    double s = config_.minElementSize / shortest;
    w *= s;
    h *= s;
  }

  Point centre = c->viewport().globalRect().center();
  Element e;
  e.kind = ElementKind::Image;
  e.x = centre.x - w / 2;
  e.y = centre.y - h / 2;
  e.width = w;
  e.height = h;
  e.ownerViewportId = vpId;
  e.image = std::move(bitmap);

  Id id = store_.add(std::move(e));
  store_.select(id);
  return id;
}

DecodeTicket CompositionOrchestrator::requestImageDecode(const Id& viewportId) {
  Id vpId = resolveViewport(viewportId);
  if (vpId.empty()) return 0;
  return decodes_.request(vpId);
}

void CompositionOrchestrator::completeImageDecode(DecodeTicket ticket,
                                                  std::shared_ptr<const Bitmap> bitmap) {
  decodes_.complete(ticket, std::move(bitmap));
}

std::vector<Id> CompositionOrchestrator::pumpDecodes() {
  std::vector<Id> created;
  for (auto& ready : decodes_.takeReady()) {
    // Viewport closed while decoding: nothing to insert into
    if (!controller(ready.request.viewportId)) continue;
    Id id = createImage(std::move(ready.bitmap), ready.request.viewportId);
    if (!id.empty()) created.push_back(id);
  }
  return created;
}

// -------------------- selection and style --------------------

std::optional<TextStyle> CompositionOrchestrator::selectedTextStyle() const {
  const Element* e = store_.get(store_.primarySelection());
  if (!e || !e->isText()) return std::nullopt;
  return e->style;
}

bool CompositionOrchestrator::setSelectedTextStyle(const ElementPatch& change) {
  const Element* e = store_.get(store_.primarySelection());
  if (!e || !e->isText()) return false;

  ElementPatch p;
  p.fontFamily = change.fontFamily;
  p.fontSize = change.fontSize;
  p.fontWeight = change.fontWeight;
  p.fontStyle = change.fontStyle;
  p.textAlign = change.textAlign;
  p.color = change.color;
  if (p.fontSize && *p.fontSize <= 0) p.fontSize.reset();
  store_.update(e->id, p);
  return true;
}

std::vector<Id> CompositionOrchestrator::selectedInZOrder() const {
  std::vector<Id> ids;
  for (const auto& e : store_.all()) {
    if (store_.isSelected(e.id)) ids.push_back(e.id);
  }
  return ids;
}

bool CompositionOrchestrator::deleteSelection() {
  std::vector<Id> ids = store_.selectedIds();
  if (ids.empty()) return false;
  store_.removeMany(ids);
  return true;
}

std::vector<Id> CompositionOrchestrator::duplicateSelection(double dx, double dy) {
  std::vector<Id> created;
  for (const auto& id : selectedInZOrder()) {
    Id copy = store_.duplicate(id, dx, dy);
    if (!copy.empty()) created.push_back(copy);
  }
  if (!created.empty()) store_.setSelection(created);
  return created;
}

std::size_t CompositionOrchestrator::copySelection() {
  std::vector<Id> ids = selectedInZOrder();
  if (ids.empty()) return 0;
  clipboard_.clear();
  for (const auto& id : ids) {
    const Element* e = store_.get(id);
    if (e) clipboard_.push_back(*e);
  }
  return clipboard_.size();
}

std::vector<Id> CompositionOrchestrator::paste() {
  std::vector<Id> created;
  if (clipboard_.empty()) return created;

  // First item lands on the pointer; the rest keep their relative offsets
  double dx = config_.pasteOffset;
  double dy = config_.pasteOffset;
  if (lastPointer_) {
    dx = lastPointer_->x - clipboard_.front().x;
    dy = lastPointer_->y - clipboard_.front().y;
  }

  for (const auto& src : clipboard_) {
    Element e = src;
    e.id.clear();
    e.x += dx;
    e.y += dy;
    e.ownerViewportId = activeId_;
    e.image = cloneBitmap(src.image);
    created.push_back(store_.add(std::move(e)));
  }
  store_.setSelection(created);
  return created;
}

bool CompositionOrchestrator::bringToFront() {
  std::vector<Id> ids = selectedInZOrder();
  for (const auto& id : ids) store_.bringToFront(id);
  return !ids.empty();
}

bool CompositionOrchestrator::sendToBack() {
  std::vector<Id> ids = selectedInZOrder();
  for (auto it = ids.rbegin(); it != ids.rend(); ++it) store_.sendToBack(*it);
  return !ids.empty();
}

bool CompositionOrchestrator::bringForward() {
  std::vector<Id> ids = selectedInZOrder();
  for (auto it = ids.rbegin(); it != ids.rend(); ++it) store_.bringForward(*it);
  return !ids.empty();
}

bool CompositionOrchestrator::sendBackward() {
  std::vector<Id> ids = selectedInZOrder();
  for (const auto& id : ids) store_.sendBackward(id);
  return !ids.empty();
}

bool CompositionOrchestrator::startCrop() {
  ViewportController* c = activeController();
  if (!c) return false;
  for (auto& other : controllers_) {
    if (other->cropping()) return false;
  }
  return c->startCrop();
}

bool CompositionOrchestrator::applyCrop() {
  for (auto& c : controllers_) {
    if (c->cropping()) return c->applyCrop();
  }
  return false;
}

bool CompositionOrchestrator::cancelCrop() {
  for (auto& c : controllers_) {
    if (c->cropping()) return c->cancelCrop();
  }
  return false;
}

void CompositionOrchestrator::clearAll() {
  for (auto& c : controllers_) c->cancelGesture();
  store_.clear();
  renderAll();
}

// -------------------- collaborators --------------------

void CompositionOrchestrator::setTextMeasurer(const TextMeasurer* measurer) {
  store_.setTextMeasurer(measurer ? measurer : &defaultMeasurer_);
  store_.refreshTextBoxes();
  renderAll();
}

std::uint32_t CompositionOrchestrator::subscribeStructure(StructureListener listener) {
  std::uint32_t token = nextStructureToken_++;
  structureListeners_.emplace_back(token, std::move(listener));
  return token;
}

void CompositionOrchestrator::unsubscribeStructure(std::uint32_t token) {
  structureListeners_.erase(
    std::remove_if(structureListeners_.begin(), structureListeners_.end(),
      [&](const std::pair<std::uint32_t, StructureListener>& l) { return l.first == token; }),
    structureListeners_.end());
}

void CompositionOrchestrator::notifyStructure() {
  auto snapshot = structureListeners_;
  for (auto& l : snapshot) {
    if (l.second) l.second();
  }
}

void CompositionOrchestrator::renderAll() {
  for (auto& c : controllers_) c->render();
  renderPasses_++;
}

// -------------------- ViewportHost --------------------

bool CompositionOrchestrator::isLinked(const Id& viewerId, const Id& ownerId) const {
  return topology_.isLinked(viewerId, ownerId);
}

bool CompositionOrchestrator::linkingEnabled() const {
  return topology_.anyLinkEnabled();
}

std::optional<Rect> CompositionOrchestrator::viewportRect(const Id& viewportId) const {
  const ViewportController* c = controller(viewportId);
  if (!c) return std::nullopt;
  return c->viewport().globalRect();
}

void CompositionOrchestrator::onViewportActivated(const Id& viewportId) {
  activateViewport(viewportId);
}

void CompositionOrchestrator::onElementDragging(const DragNotice& notice) {
  // Ownership follows the pointer into any viewport linked with the owner,
  // including back into the viewport running the gesture
  Id target = viewportAt(notice.pointer);
  if (target.empty()) return;

  std::vector<std::pair<Id, ElementPatch>> patches;
  for (const auto& id : notice.groupIds) {
    const Element* e = store_.get(id);
    if (!e || e->ownerViewportId == target) continue;
    if (!e->ownerViewportId.empty() && !topology_.isLinked(target, e->ownerViewportId)) continue;
    ElementPatch p;
    p.ownerViewportId = target;
    patches.emplace_back(id, p);
  }
  if (patches.empty()) return;
  store_.updateMany(patches);
  activateViewport(target);
}

void CompositionOrchestrator::onTextEditRequested(const Id& viewportId, const Id& elementId) {
  if (textEditHandler_) textEditHandler_(viewportId, elementId);
}

} // namespace mc
