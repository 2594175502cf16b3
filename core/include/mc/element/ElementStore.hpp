#pragma once
#include "mc/element/Element.hpp"
#include "mc/geom/Geometry.hpp"
#include "mc/selection/SelectionState.hpp"
#include "mc/text/TextLayout.hpp"

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace mc {

class TextMeasurer;

// Authoritative, order-preserving element collection in global coordinates.
// Iteration order is z-order: the last element paints on top.
//
// Every mutating call fires exactly one change notification after the
// mutation completes. Calls on unknown ids are no-ops.
//
// Pointers returned by get()/hitTest()/elementsOverlapping() are valid
// until the next mutating call.
class ElementStore {
public:
  using Listener = std::function<void()>;
  using ListenerToken = std::uint32_t;
  using ElementFilter = std::function<bool(const Element&)>;

  ElementStore();

  // Text width/height are derived from these. Without a measurer the
  // sizes of text elements are left as given.
  void setTextMeasurer(const TextMeasurer* measurer) { measurer_ = measurer; }
  void setTextBoxConfig(const TextBoxConfig& cfg) { textCfg_ = cfg; }
  const TextMeasurer* textMeasurer() const { return measurer_; }
  const TextBoxConfig& textBoxConfig() const { return textCfg_; }
  void setMinCropSize(double size) { minCropSize_ = size; }

  // Assigns an id when element.id is empty. Returns the element's id.
  Id add(Element element);
  void remove(const Id& id);
  void removeMany(const std::vector<Id>& ids);
  void clear();

  // nullptr means "not found".
  const Element* get(const Id& id) const;
  bool contains(const Id& id) const { return get(id) != nullptr; }

  void update(const Id& id, const ElementPatch& patch);
  void updateMany(const std::vector<std::pair<Id, ElementPatch>>& patches);

  const std::vector<Element>& all() const { return elements_; }
  std::size_t count() const { return elements_.size(); }

  std::vector<const Element*> elementsOverlapping(const Rect& rect) const;
  std::vector<const Element*> elementsOverlapping(const Rect& rect,
                                                  const ElementFilter& filter) const;

  // Topmost element whose effective bounds (crop when set) contain p.
  const Element* hitTest(Point p) const;
  const Element* hitTest(Point p, const ElementFilter& filter) const;

  // Z-order
  void bringToFront(const Id& id);
  void sendToBack(const Id& id);
  void bringForward(const Id& id);
  void sendBackward(const Id& id);
  std::size_t zIndexOf(const Id& id) const;  // count() when absent

  // Clone with a new id, offset by (dx,dy), with its own copy of any bitmap.
  // Returns the new id, or an empty id when the source is unknown.
  Id duplicate(const Id& id, double dx, double dy);

  // Selection
  const SelectionState& selection() const { return selection_; }
  const Id& primarySelection() const { return selection_.primary(); }
  const std::vector<Id>& selectedIds() const { return selection_.selectedIds(); }
  bool isSelected(const Id& id) const { return selection_.isSelected(id); }
  void select(const Id& id);
  void toggleSelection(const Id& id);
  void setSelection(const std::vector<Id>& ids);
  void clearSelection();

  ListenerToken subscribe(Listener listener);
  void unsubscribe(ListenerToken token);

  // Re-derive text boxes from the measurer without notifying. Called at
  // render time so hit testing always uses current metrics.
  // Returns true when any box changed.
  bool refreshTextBoxes();

  std::uint64_t revision() const { return revision_; }

private:
  Element* find(const Id& id);
  std::size_t indexOf(const Id& id) const;
  void applyPatch(Element& e, const ElementPatch& patch);
  bool fitTextBox(Element& e) const;
  void notify();

  std::vector<Element> elements_;
  SelectionState selection_;
  IdAllocator ids_{"element"};

  const TextMeasurer* measurer_{nullptr};
  TextBoxConfig textCfg_;
  double minCropSize_{20};

  std::vector<std::pair<ListenerToken, Listener>> listeners_;
  ListenerToken nextToken_{1};
  std::uint64_t revision_{0};
};

} // namespace mc
