#pragma once
#include "mc/decode/ImageDecodeQueue.hpp"
#include "mc/element/ElementStore.hpp"
#include "mc/grid/GridTopology.hpp"
#include "mc/session/CompositionConfig.hpp"
#include "mc/style/Theme.hpp"
#include "mc/text/TextMeasurer.hpp"
#include "mc/viewport/ViewportController.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mc {

// User-facing toggle between two orthogonally adjacent viewports.
// a is the left/top member, b the right/bottom one. The button sits in the
// gutter between the two cells of a (2*rows+1) x (2*cols+1) layout grid.
struct LinkControl {
  Id a;
  Id b;
  bool horizontal{true};
  int buttonRow{0};
  int buttonCol{0};
  bool aShowsB{true};  // symmetric model: both flags are the pair's link
  bool bShowsA{true};
};

// Text waiting for the external editor to commit it.
struct PendingText {
  Id pendingId;
  Id viewportId;
  Point position;
  std::string initialContent;
  double fontSize{24};
};

// Root of a composition. Owns the element store, the grid topology and one
// controller per viewport; keeps offsets, link controls and redraws
// consistent as viewports come and go.
class CompositionOrchestrator : public ViewportHost {
public:
  using TextEditHandler = std::function<void(const Id& viewportId, const Id& elementId)>;
  using StructureListener = std::function<void()>;

  // Starts with a single viewport at cell (0,0).
  explicit CompositionOrchestrator(const CompositionConfig& cfg = CompositionConfig{});
  ~CompositionOrchestrator() override;

  CompositionOrchestrator(const CompositionOrchestrator&) = delete;
  CompositionOrchestrator& operator=(const CompositionOrchestrator&) = delete;

  // ---- viewports ----
  Id addViewport(Direction direction = Direction::Right);
  bool removeViewport(const Id& viewportId);
  bool setResolutionForAll(int width, int height);
  void recalculateOffsets();

  bool toggleLink(const Id& a, const Id& b);
  std::vector<LinkControl> linkControls() const;

  // Clamped to the configured range. Returns the applied scale.
  double setDisplayScale(double scale);
  double displayScale() const { return displayScale_; }

  bool renameViewport(const Id& viewportId, const std::string& name);
  bool activateViewport(const Id& viewportId);
  const Id& activeViewportId() const { return activeId_; }

  std::vector<Id> viewportIds() const;
  std::size_t viewportCount() const { return controllers_.size(); }
  ViewportController* controller(const Id& viewportId);
  const ViewportController* controller(const Id& viewportId) const;
  ViewportController* activeController() { return controller(activeId_); }

  // ---- input (already resolved to a viewport) ----
  bool handlePointer(const Id& viewportId, const PointerEvent& ev);
  bool handleKey(const Id& viewportId, const KeyEvent& ev);

  // ---- text ----
  // Reserve a text element at the centre of the viewport (active when empty).
  PendingText beginText(const std::string& initialContent, double fontSize,
                        const Id& viewportId = Id{});
  // Trimmed content; empty content becomes the placeholder. Returns the new
  // element id, or empty when the pending id is unknown.
  Id commitText(const Id& pendingId, const std::string& content);
  bool cancelText(const Id& pendingId);
  bool editText(const Id& elementId, const std::string& content);
  std::size_t pendingTextCount() const { return pendingTexts_.size(); }

  // ---- images ----
  // Centered in the viewport, longest side capped (scale down only).
  Id createImage(std::shared_ptr<const Bitmap> bitmap, const Id& viewportId = Id{});
  DecodeTicket requestImageDecode(const Id& viewportId = Id{});
  // Safe from any thread.
  void completeImageDecode(DecodeTicket ticket, std::shared_ptr<const Bitmap> bitmap);
  // UI thread: insert finished decodes. Targets that no longer exist are
  // skipped. Returns the ids created.
  std::vector<Id> pumpDecodes();
  std::size_t pendingDecodeCount() const { return decodes_.pendingCount(); }

  // ---- selection and style ----
  std::optional<TextStyle> selectedTextStyle() const;
  // Applies only the text style fields of change. No-op unless the primary
  // selection is a text element.
  bool setSelectedTextStyle(const ElementPatch& change);

  bool deleteSelection();
  std::vector<Id> duplicateSelection(double dx, double dy);
  std::size_t copySelection();
  std::vector<Id> paste();
  std::size_t clipboardSize() const { return clipboard_.size(); }

  bool bringToFront();
  bool sendToBack();
  bool bringForward();
  bool sendBackward();

  bool startCrop();
  bool applyCrop();
  bool cancelCrop();

  void clearAll();

  // ---- collaborators ----
  void setTextMeasurer(const TextMeasurer* measurer);
  void setTextEditHandler(TextEditHandler handler) { textEditHandler_ = std::move(handler); }
  std::uint32_t subscribeStructure(StructureListener listener);
  void unsubscribeStructure(std::uint32_t token);

  ElementStore& store() { return store_; }
  const ElementStore& store() const { return store_; }
  const GridTopology& topology() const { return topology_; }
  const CompositionConfig& config() const { return config_; }
  const std::optional<Point>& lastPointer() const { return lastPointer_; }

  void renderAll();
  std::uint64_t renderPasses() const { return renderPasses_; }

private:
  // ViewportHost
  bool isLinked(const Id& viewerId, const Id& ownerId) const override;
  bool linkingEnabled() const override;
  std::optional<Rect> viewportRect(const Id& viewportId) const override;
  void onViewportActivated(const Id& viewportId) override;
  void onElementDragging(const DragNotice& notice) override;
  void onTextEditRequested(const Id& viewportId, const Id& elementId) override;

  InteractionConfig interactionConfig() const;
  Id resolveViewport(const Id& viewportId) const;
  Id viewportAt(Point global) const;
  std::string normalizeText(const std::string& content) const;
  std::vector<Id> selectedInZOrder() const;
  void notifyStructure();

  CompositionConfig config_;
  Theme theme_;
  FixedAdvanceMeasurer defaultMeasurer_;
  ElementStore store_;
  GridTopology topology_;
  std::vector<std::unique_ptr<ViewportController>> controllers_;

  IdAllocator viewportIds_{"viewport"};
  IdAllocator pendingIds_{"pending-text"};
  Id activeId_;
  double displayScale_{1.0};

  std::vector<Element> clipboard_;
  std::optional<Point> lastPointer_;
  std::vector<PendingText> pendingTexts_;
  ImageDecodeQueue decodes_;

  ElementStore::ListenerToken storeToken_{0};
  TextEditHandler textEditHandler_;
  std::vector<std::pair<std::uint32_t, StructureListener>> structureListeners_;
  std::uint32_t nextStructureToken_{1};
  std::uint64_t renderPasses_{0};
};

} // namespace mc
