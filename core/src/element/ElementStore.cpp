#include "mc/element/ElementStore.hpp"
#include "mc/text/TextMeasurer.hpp"

#include <algorithm>

namespace mc {

ElementStore::ElementStore() {
  // Shift-click adds; select() replaces explicitly
  selection_.setMode(SelectionMode::Toggle);
}

Id ElementStore::add(Element element) {
  if (element.id.empty() || contains(element.id)) {
    element.id = ids_.next();
  }
  if (element.isText()) fitTextBox(element);
  if (element.isImage() && element.crop) {
    element.crop = clampCrop(*element.crop, element.width, element.height, minCropSize_);
  }
  Id id = element.id;
  elements_.push_back(std::move(element));
  notify();
  return id;
}

void ElementStore::remove(const Id& id) {
  std::size_t idx = indexOf(id);
  if (idx == elements_.size()) return;
  elements_.erase(elements_.begin() + static_cast<std::ptrdiff_t>(idx));
  selection_.deselect(id);
  notify();
}

void ElementStore::removeMany(const std::vector<Id>& ids) {
  bool changed = false;
  for (const auto& id : ids) {
    std::size_t idx = indexOf(id);
    if (idx == elements_.size()) continue;
    elements_.erase(elements_.begin() + static_cast<std::ptrdiff_t>(idx));
    selection_.deselect(id);
    changed = true;
  }
  if (changed) notify();
}

void ElementStore::clear() {
  if (elements_.empty() && !selection_.hasSelection()) return;
  elements_.clear();
  selection_.clear();
  notify();
}

const Element* ElementStore::get(const Id& id) const {
  for (const auto& e : elements_) {
    if (e.id == id) return &e;
  }
  return nullptr;
}

Element* ElementStore::find(const Id& id) {
  for (auto& e : elements_) {
    if (e.id == id) return &e;
  }
  return nullptr;
}

std::size_t ElementStore::indexOf(const Id& id) const {
  for (std::size_t i = 0; i < elements_.size(); i++) {
    if (elements_[i].id == id) return i;
  }
  return elements_.size();
}

std::size_t ElementStore::zIndexOf(const Id& id) const {
  return indexOf(id);
}

void ElementStore::applyPatch(Element& e, const ElementPatch& p) {
  if (p.x) e.x = *p.x;
  if (p.y) e.y = *p.y;
  if (p.width) e.width = *p.width;
  if (p.height) e.height = *p.height;
  if (p.ownerViewportId) e.ownerViewportId = *p.ownerViewportId;

  if (e.isText()) {
    if (p.content) e.content = *p.content;
    if (p.fontFamily) e.style.fontFamily = *p.fontFamily;
    if (p.fontSize) e.style.fontSize = *p.fontSize;
    if (p.fontWeight) e.style.fontWeight = *p.fontWeight;
    if (p.fontStyle) e.style.fontStyle = *p.fontStyle;
    if (p.textAlign) e.style.textAlign = *p.textAlign;
    if (p.color) e.style.color = *p.color;
    if (p.touchesTextMetrics()) fitTextBox(e);
  } else if (e.isImage()) {
    if (p.crop) e.crop = *p.crop;
    if (e.crop) e.crop = clampCrop(*e.crop, e.width, e.height, minCropSize_);
  }
}

void ElementStore::update(const Id& id, const ElementPatch& patch) {
  Element* e = find(id);
  if (!e) return;
  applyPatch(*e, patch);
  notify();
}

void ElementStore::updateMany(const std::vector<std::pair<Id, ElementPatch>>& patches) {
  bool changed = false;
  for (const auto& entry : patches) {
    Element* e = find(entry.first);
    if (!e) continue;
    applyPatch(*e, entry.second);
    changed = true;
  }
  if (changed) notify();
}

std::vector<const Element*> ElementStore::elementsOverlapping(const Rect& rect) const {
  std::vector<const Element*> out;
  for (const auto& e : elements_) {
    if (overlaps(e.bounds(), rect)) out.push_back(&e);
  }
  return out;
}

std::vector<const Element*> ElementStore::elementsOverlapping(const Rect& rect,
                                                              const ElementFilter& filter) const {
  std::vector<const Element*> out;
  for (const auto& e : elements_) {
    if (!overlaps(e.bounds(), rect)) continue;
    if (filter && !filter(e)) continue;
    out.push_back(&e);
  }
  return out;
}

const Element* ElementStore::hitTest(Point p) const {
  return hitTest(p, ElementFilter{});
}

const Element* ElementStore::hitTest(Point p, const ElementFilter& filter) const {
  for (auto it = elements_.rbegin(); it != elements_.rend(); ++it) {
    if (!it->effectiveBounds().contains(p)) continue;
    if (filter && !filter(*it)) continue;
    return &*it;
  }
  return nullptr;
}

void ElementStore::bringToFront(const Id& id) {
  std::size_t idx = indexOf(id);
  if (idx == elements_.size()) return;
  Element e = std::move(elements_[idx]);
  elements_.erase(elements_.begin() + static_cast<std::ptrdiff_t>(idx));
  elements_.push_back(std::move(e));
  notify();
}

void ElementStore::sendToBack(const Id& id) {
  std::size_t idx = indexOf(id);
  if (idx == elements_.size()) return;
  Element e = std::move(elements_[idx]);
  elements_.erase(elements_.begin() + static_cast<std::ptrdiff_t>(idx));
  elements_.insert(elements_.begin(), std::move(e));
  notify();
}

void ElementStore::bringForward(const Id& id) {
  std::size_t idx = indexOf(id);
  if (idx == elements_.size() || idx + 1 == elements_.size()) return;
  std::swap(elements_[idx], elements_[idx + 1]);
  notify();
}

void ElementStore::sendBackward(const Id& id) {
  std::size_t idx = indexOf(id);
  if (idx == elements_.size() || idx == 0) return;
  std::swap(elements_[idx], elements_[idx - 1]);
  notify();
}

Id ElementStore::duplicate(const Id& id, double dx, double dy) {
  const Element* src = get(id);
  if (!src) return {};
  Element copy = *src;
  copy.id = ids_.next();
  copy.x += dx;
  copy.y += dy;
  copy.image = cloneBitmap(src->image);
  Id newId = copy.id;
  elements_.push_back(std::move(copy));
  notify();
  return newId;
}

void ElementStore::select(const Id& id) {
  if (!contains(id)) return;
  SelectionState before = selection_;
  selection_.assign({id});
  if (selection_ != before) notify();
}

void ElementStore::toggleSelection(const Id& id) {
  if (!contains(id)) return;
  selection_.toggle(id);
  notify();
}

void ElementStore::setSelection(const std::vector<Id>& ids) {
  std::vector<Id> known;
  known.reserve(ids.size());
  for (const auto& id : ids) {
    if (contains(id)) known.push_back(id);
  }
  SelectionState before = selection_;
  selection_.assign(known);
  if (selection_ != before) notify();
}

void ElementStore::clearSelection() {
  if (!selection_.hasSelection()) return;
  selection_.clear();
  notify();
}

ElementStore::ListenerToken ElementStore::subscribe(Listener listener) {
  ListenerToken token = nextToken_++;
  listeners_.emplace_back(token, std::move(listener));
  return token;
}

void ElementStore::unsubscribe(ListenerToken token) {
  listeners_.erase(
    std::remove_if(listeners_.begin(), listeners_.end(),
      [&](const std::pair<ListenerToken, Listener>& l) { return l.first == token; }),
    listeners_.end());
}

bool ElementStore::fitTextBox(Element& e) const {
  if (!measurer_ || !e.isText()) return false;
  TextBox box = layoutTextBox(*measurer_, e.content, e.style, textCfg_);
  if (box.width == e.width && box.height == e.height) return false;
  e.width = box.width;
  e.height = box.height;
  return true;
}

bool ElementStore::refreshTextBoxes() {
  bool changed = false;
  for (auto& e : elements_) {
    if (fitTextBox(e)) changed = true;
  }
  return changed;
}

void ElementStore::notify() {
  revision_++;
  // Listeners may subscribe/unsubscribe while being called
  auto snapshot = listeners_;
  for (auto& l : snapshot) {
    if (l.second) l.second();
  }
}

} // namespace mc
