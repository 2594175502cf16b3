// D4.4: immediate-mode frame contents per viewport

#include "mc/viewport/ViewportController.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <set>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireClose(double a, double b, double tol, const char* msg) {
  if (std::fabs(a - b) > tol) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

class TestHost : public mc::ViewportHost {
public:
  std::set<std::pair<mc::Id, mc::Id>> links;

  bool isLinked(const mc::Id& viewer, const mc::Id& owner) const override {
    return links.count({viewer, owner}) > 0;
  }
  bool linkingEnabled() const override { return !links.empty(); }
  std::optional<mc::Rect> viewportRect(const mc::Id&) const override { return std::nullopt; }
  void onViewportActivated(const mc::Id&) override {}
  void onElementDragging(const mc::DragNotice&) override {}
  void onTextEditRequested(const mc::Id&, const mc::Id&) override {}
};

static const mc::DrawCommand* firstOf(const mc::DrawList& dl, mc::DrawOp op, mc::DrawLayer layer) {
  for (const auto& c : dl.commands()) {
    if (c.op == op && c.layer == layer) return &c;
  }
  return nullptr;
}

int main() {
  // ---- Test 1: empty frame ----
  {
    mc::ElementStore store;
    TestHost host;
    mc::ViewportController vc("viewport-1", "Canvas 1", store, host);
    const mc::DrawList& dl = vc.render();
    requireTrue(dl.count(mc::DrawOp::Clear) == 1, "one clear");
    requireTrue(dl.count(mc::DrawOp::FillRect, mc::DrawLayer::Background) == 1, "background");
    requireTrue(dl.size() == 2, "nothing else");
    requireTrue(vc.renderCount() == 1, "render counted");
    std::printf("  Test 1 (empty frame): PASS\n");
  }

  // ---- Test 2: text lines in local coordinates ----
  {
    mc::ElementStore store;
    TestHost host;
    mc::ViewportController vc("viewport-2", "Canvas 2", store, host);
    vc.viewport().setCell({0, 1});

    mc::Element t;
    t.kind = mc::ElementKind::Text;
    t.content = "one\ntwo";
    t.x = 900;
    t.y = 100;
    t.width = 100;
    t.height = 58;
    t.style.color = "#ff0000";
    t.ownerViewportId = "viewport-2";
    mc::Id id = store.add(t);

    const mc::DrawList& dl = vc.render();
    requireTrue(dl.count(mc::DrawOp::Text, mc::DrawLayer::Content) == 2, "one command per line");
    const mc::DrawCommand* line0 = firstOf(dl, mc::DrawOp::Text, mc::DrawLayer::Content);
    requireClose(line0->from.x, 105, 1e-9, "left aligned at padding/2 in local space");
    requireClose(line0->from.y, 100 + 24 * 1.2 * 0.5, 1e-6, "middle of first line");
    requireTrue(line0->text == "one", "first line text");
    requireClose(line0->color[0], 1.0, 1e-6, "red from hex");
    requireTrue(line0->elementId == id, "tagged with element");
    std::printf("  Test 2 (text): PASS\n");
  }

  // ---- Test 3: selection outline and handles ----
  {
    mc::ElementStore store;
    TestHost host;
    mc::ViewportController vc("viewport-1", "Canvas 1", store, host);

    mc::Element img;
    img.kind = mc::ElementKind::Image;
    img.x = 10;
    img.y = 10;
    img.width = 100;
    img.height = 100;
    mc::Id a = store.add(img);
    mc::Element t;
    t.kind = mc::ElementKind::Text;
    t.content = "t";
    t.x = 300;
    t.y = 300;
    mc::Id b = store.add(t);

    store.select(a);
    const mc::DrawList& one = vc.render();
    const mc::DrawCommand* outline = firstOf(one, mc::DrawOp::StrokeRect, mc::DrawLayer::Selection);
    requireTrue(outline != nullptr, "outline drawn");
    requireTrue(outline->dash[0] == 5.0f && outline->dash[1] == 5.0f, "dashed 5,5");
    requireTrue(one.count(mc::DrawOp::FillRect, mc::DrawLayer::Handle) == 8, "8 image handles");

    store.select(b);
    requireTrue(vc.render().count(mc::DrawOp::FillRect, mc::DrawLayer::Handle) == 4,
                "4 text handles");

    store.setSelection({a, b});
    const mc::DrawList& two = vc.render();
    requireTrue(two.count(mc::DrawOp::StrokeRect, mc::DrawLayer::Selection) == 2, "two outlines");
    requireTrue(two.count(mc::DrawOp::FillRect, mc::DrawLayer::Handle) == 0,
                "no handles for multi-selection");
    std::printf("  Test 3 (selection chrome): PASS\n");
  }

  // ---- Test 4: link predicate and viewport clipping ----
  {
    mc::ElementStore store;
    TestHost host;
    mc::ViewportController left("viewport-1", "Canvas 1", store, host);
    mc::ViewportController right("viewport-2", "Canvas 2", store, host);
    right.viewport().setCell({0, 1});

    mc::Element e;
    e.kind = mc::ElementKind::Image;
    e.x = 790;
    e.y = 100;
    e.width = 40;
    e.height = 40;
    e.ownerViewportId = "viewport-1";
    mc::Id id = store.add(e);

    mc::Element far;
    far.kind = mc::ElementKind::Image;
    far.x = 100;
    far.y = 100;
    far.ownerViewportId = "viewport-1";
    mc::Id farId = store.add(far);

    left.render();
    right.render();
    requireTrue(left.frame().drawsElement(id), "owner draws it");
    requireTrue(!right.frame().drawsElement(id), "unlinked neighbour does not");

    host.links.insert({"viewport-2", "viewport-1"});
    right.render();
    requireTrue(right.frame().drawsElement(id), "linked neighbour draws the overhang");
    requireTrue(!right.frame().drawsElement(farId), "elements outside the rect are skipped");
    const mc::DrawCommand* img = firstOf(right.frame(), mc::DrawOp::Image, mc::DrawLayer::Content);
    requireClose(img->rect.left, -10, 1e-9, "drawn at local x");
    std::printf("  Test 4 (links + clipping): PASS\n");
  }

  // ---- Test 5: cropped image and crop overlay ----
  {
    mc::ElementStore store;
    TestHost host;
    mc::ViewportController vc("viewport-1", "Canvas 1", store, host);

    mc::Element img;
    img.kind = mc::ElementKind::Image;
    img.x = 100;
    img.y = 100;
    img.width = 200;
    img.height = 200;
    img.crop = mc::CropRect{50, 0, 200, 200};
    mc::Id id = store.add(img);

    const mc::DrawList& plain = vc.render();
    const mc::DrawCommand* c = firstOf(plain, mc::DrawOp::Image, mc::DrawLayer::Content);
    requireTrue(c->hasClip, "clipped to crop");
    requireClose(c->clip.left, 150, 1e-9, "clip left");
    requireClose(c->rect.left, 100, 1e-9, "full destination");

    store.select(id);
    requireTrue(vc.startCrop(), "crop mode");
    const mc::DrawList& crop = vc.frame();
    const mc::DrawCommand* full = firstOf(crop, mc::DrawOp::Image, mc::DrawLayer::Content);
    requireTrue(!full->hasClip, "full image while cropping");
    requireTrue(crop.count(mc::DrawOp::StrokeRect, mc::DrawLayer::Selection) == 0,
                "no selection outline on the crop target");
    requireTrue(crop.count(mc::DrawOp::FillRect, mc::DrawLayer::Handle) == 0, "no resize handles");
    requireTrue(crop.count(mc::DrawOp::FillRect, mc::DrawLayer::CropOverlay) == 1 + 8,
                "one dim strip + 8 crop handles");
    requireTrue(crop.count(mc::DrawOp::Line, mc::DrawLayer::CropOverlay) == 4, "thirds grid");
    const mc::DrawCommand* label = firstOf(crop, mc::DrawOp::Text, mc::DrawLayer::CropOverlay);
    requireTrue(label && label->text == "150 x 200", "dimension label");
    std::printf("  Test 5 (crop overlay): PASS\n");
  }

  // ---- Test 6: render is idempotent ----
  {
    mc::ElementStore store;
    TestHost host;
    mc::ViewportController vc("viewport-1", "Canvas 1", store, host);
    mc::Element t;
    t.content = "same";
    store.add(t);
    std::size_t n1 = vc.render().size();
    std::size_t n2 = vc.render().size();
    requireTrue(n1 == n2, "same command count");
    requireTrue(vc.renderCount() == 2, "two passes");
    std::printf("  Test 6 (idempotent): PASS\n");
  }

  std::printf("D4.4 render_frame: ALL PASS\n");
  return 0;
}
