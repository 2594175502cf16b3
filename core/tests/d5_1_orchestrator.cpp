// D5.1: CompositionOrchestrator viewport lifecycle, offsets, links

#include "mc/session/CompositionOrchestrator.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireClose(double a, double b, double tol, const char* msg) {
  if (std::fabs(a - b) > tol) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

int main() {
  // ---- Test 1: starts with one active viewport ----
  {
    mc::CompositionOrchestrator orch;
    requireTrue(orch.viewportCount() == 1, "one viewport");
    const mc::Id& vp = orch.activeViewportId();
    requireTrue(vp == "viewport-1", "first id");
    requireTrue(orch.controller(vp)->viewport().name() == "Canvas 1", "default name");
    requireTrue(!orch.removeViewport(vp), "last viewport cannot be removed");
    requireTrue(orch.viewportCount() == 1, "still one");
    requireTrue(!orch.removeViewport("viewport-99"), "unknown id rejected");

    // Controllers reach the orchestrator through its host interface
    const mc::ViewportHost& host = orch;
    requireTrue(host.viewportRect(vp).has_value(), "host knows the viewport");
    requireTrue(!host.viewportRect("viewport-99").has_value(), "host rejects unknown ids");
    requireTrue(host.isLinked(vp, vp), "a viewport always shows its own elements");
    std::printf("  Test 1 (initial state): PASS\n");
  }

  // ---- Test 2: add right and below, offsets follow cells ----
  {
    mc::CompositionOrchestrator orch;
    mc::Id a = orch.activeViewportId();
    mc::Id b = orch.addViewport(mc::Direction::Right);
    mc::Id c = orch.addViewport(mc::Direction::Bottom);

    requireTrue(orch.viewportCount() == 3, "three viewports");
    requireTrue(orch.activeViewportId() == a, "adding does not change the active viewport");
    requireClose(orch.controller(b)->viewport().offsetX(), 800, 1e-9, "b right of a");
    requireClose(orch.controller(c)->viewport().offsetY(), 600, 1e-9, "c below a");
    requireClose(orch.controller(c)->viewport().offsetX(), 0, 1e-9, "c in column 0");

    mc::Id d = orch.addViewport(mc::Direction::Right);
    const mc::GridCell* cell = orch.topology().cellOf(d);
    requireTrue(cell && cell->row == 0 && cell->col == 2, "scan skips occupied cell");

    requireTrue(orch.setResolutionForAll(1024, 768), "resolution applied");
    requireClose(orch.controller(d)->viewport().offsetX(), 2048, 1e-9, "offset recomputed");
    requireClose(orch.controller(c)->viewport().offsetY(), 768, 1e-9, "offset y recomputed");
    requireTrue(!orch.setResolutionForAll(0, 10), "invalid resolution rejected");
    std::printf("  Test 2 (placement + offsets): PASS\n");
  }

  // ---- Test 3: link controls are orthogonal only ----
  {
    mc::CompositionOrchestrator orch;
    mc::Id a = orch.activeViewportId();
    mc::Id b = orch.addViewport(mc::Direction::Right);
    mc::Id c = orch.addViewport(mc::Direction::Bottom);

    auto controls = orch.linkControls();
    requireTrue(controls.size() == 2, "a-b and a-c; b-c is diagonal");
    bool sawH = false, sawV = false;
    for (const auto& lc : controls) {
      if (lc.horizontal) {
        sawH = true;
        requireTrue(lc.a == a && lc.b == b, "horizontal pair");
        requireTrue(lc.buttonRow == 1 && lc.buttonCol == 2, "gutter between columns");
      } else {
        sawV = true;
        requireTrue(lc.a == a && lc.b == c, "vertical pair");
        requireTrue(lc.buttonRow == 2 && lc.buttonCol == 1, "gutter between rows");
      }
      requireTrue(lc.aShowsB && lc.bShowsA, "default enabled");
    }
    requireTrue(sawH && sawV, "both orientations");
    requireTrue(orch.topology().hasLinkEntry(b, c), "diagonal still tracked");
    std::printf("  Test 3 (link controls): PASS\n");
  }

  // ---- Test 4: element spanning two linked viewports ----
  {
    mc::CompositionOrchestrator orch;
    mc::Id left = orch.activeViewportId();
    mc::Id right = orch.addViewport(mc::Direction::Right);

    mc::Element e;
    e.kind = mc::ElementKind::Image;
    e.x = 790;
    e.y = 100;
    e.width = 40;
    e.height = 40;
    e.ownerViewportId = left;
    mc::Id id = orch.store().add(e);

    requireTrue(orch.controller(left)->frame().drawsElement(id), "owner renders it");
    requireTrue(orch.controller(right)->frame().drawsElement(id), "linked neighbour renders it");

    requireTrue(orch.toggleLink(left, right) == false, "link now off");
    requireTrue(orch.controller(left)->frame().drawsElement(id), "owner still renders it");
    requireTrue(!orch.controller(right)->frame().drawsElement(id), "neighbour drops it");

    requireTrue(orch.toggleLink(right, left) == true, "either order toggles");
    requireTrue(orch.controller(right)->frame().drawsElement(id), "visible again");
    std::printf("  Test 4 (linked overhang): PASS\n");
  }

  // ---- Test 5: non-adjacent toggle is rejected ----
  {
    mc::CompositionOrchestrator orch;
    mc::Id a = orch.activeViewportId();
    orch.addViewport(mc::Direction::Right);
    mc::Id far = orch.addViewport(mc::Direction::Right);
    std::size_t before = orch.topology().linkEntryCount();
    requireTrue(orch.toggleLink(a, far) == true, "returns current default");
    requireTrue(orch.topology().linkEntryCount() == before, "nothing recorded");
    std::printf("  Test 5 (non-adjacent toggle): PASS\n");
  }

  // ---- Test 6: removal reassigns active, links and orphans ----
  {
    mc::CompositionOrchestrator orch;
    mc::Id a = orch.activeViewportId();
    mc::Id b = orch.addViewport(mc::Direction::Right);
    requireTrue(orch.activateViewport(b), "activate b");

    mc::Element e;
    e.kind = mc::ElementKind::Image;
    e.x = 900;
    e.y = 100;
    e.ownerViewportId = b;
    mc::Id id = orch.store().add(e);

    int structureChanges = 0;
    orch.subscribeStructure([&]() { structureChanges++; });

    requireTrue(orch.removeViewport(b), "b removed");
    requireTrue(orch.activeViewportId() == a, "active falls back");
    requireTrue(!orch.topology().contains(b), "topology updated");
    requireTrue(orch.topology().linkEntryCount() == 0, "links dropped");
    requireTrue(orch.store().get(id)->ownerViewportId == a, "orphan reassigned");
    requireTrue(structureChanges == 1, "structure listeners notified");

    mc::Id c = orch.addViewport(mc::Direction::Right);
    requireTrue(c == "viewport-3", "ids never reused");
    requireTrue(orch.controller(c)->viewport().name() == "Canvas 3", "name follows id");
    requireClose(orch.controller(c)->viewport().offsetX(), 800, 1e-9, "freed cell reused");
    std::printf("  Test 6 (removal): PASS\n");
  }

  // ---- Test 7: display scale and rename ----
  {
    mc::CompositionOrchestrator orch;
    mc::Id a = orch.activeViewportId();
    requireClose(orch.setDisplayScale(5.0), 2.0, 1e-9, "clamped high");
    requireClose(orch.setDisplayScale(0.01), 0.1, 1e-9, "clamped low");
    requireClose(orch.setDisplayScale(0.5), 0.5, 1e-9, "in range");
    mc::Id b = orch.addViewport(mc::Direction::Bottom);
    requireClose(orch.controller(b)->viewport().displayScale(), 0.5, 1e-9,
                 "new viewports inherit scale");

    requireTrue(orch.renameViewport(a, "Main"), "rename");
    requireTrue(orch.controller(a)->viewport().name() == "Main", "renamed");
    requireTrue(!orch.renameViewport(a, ""), "empty name rejected");
    std::printf("  Test 7 (scale + rename): PASS\n");
  }

  // ---- Test 8: store changes redraw every viewport ----
  {
    mc::CompositionOrchestrator orch;
    mc::Id b = orch.addViewport(mc::Direction::Right);
    std::uint64_t before = orch.controller(b)->renderCount();
    mc::Element e;
    e.content = "hello";
    orch.store().add(e);
    requireTrue(orch.controller(b)->renderCount() == before + 1, "one redraw per notification");
    std::printf("  Test 8 (notify -> redraw): PASS\n");
  }

  // ---- Test 9: directional link model ----
  {
    mc::CompositionConfig cfg;
    cfg.linkModel = mc::LinkModel::Directional;
    mc::CompositionOrchestrator orch(cfg);
    mc::Id a = orch.activeViewportId();
    mc::Id b = orch.addViewport(mc::Direction::Right);

    mc::Element e;
    e.kind = mc::ElementKind::Image;
    e.x = 790;
    e.y = 0;
    e.width = 40;
    e.height = 40;
    e.ownerViewportId = a;
    mc::Id id = orch.store().add(e);

    orch.toggleLink(b, a);
    requireTrue(!orch.controller(b)->frame().drawsElement(id), "b no longer shows a's elements");
    auto controls = orch.linkControls();
    requireTrue(controls.size() == 1, "one control");
    requireTrue(controls[0].aShowsB && !controls[0].bShowsA, "independent flags");
    std::printf("  Test 9 (directional links): PASS\n");
  }

  std::printf("D5.1 orchestrator: ALL PASS\n");
  return 0;
}
