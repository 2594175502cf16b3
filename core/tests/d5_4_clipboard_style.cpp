// D5.4: text commit, style controls, clipboard, z-order, keyboard

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

static mc::KeyEvent key(mc::KeyCode k, bool ctrl = false) {
  mc::KeyEvent ev;
  ev.key = k;
  ev.ctrl = ctrl;
  return ev;
}

static std::shared_ptr<const mc::Bitmap> makeBitmap(int w, int h) {
  auto b = std::make_shared<mc::Bitmap>();
  b->width = w;
  b->height = h;
  b->rgba.assign(static_cast<std::size_t>(w) * h * 4, 200);
  return b;
}

int main() {
  // ---- Test 1: pending text commit ----
  {
    mc::CompositionOrchestrator orch;
    mc::PendingText p = orch.beginText("Hello", 32);
    requireTrue(!p.pendingId.empty(), "pending id issued");
    requireClose(p.position.x, 350, 1e-9, "centre x - 50");
    requireClose(p.position.y, 284, 1e-9, "centre y - fontSize/2");
    requireTrue(orch.store().count() == 0, "nothing added yet");

    mc::Id id = orch.commitText(p.pendingId, "  Hello  ");
    const mc::Element* e = orch.store().get(id);
    requireTrue(e && e->isText(), "text created");
    requireTrue(e->content == "Hello", "trimmed");
    requireClose(e->style.fontSize, 32, 1e-9, "font size kept");
    requireClose(e->width, 5 * 0.6 * 32 + 10, 1e-9, "measured width");
    requireClose(e->height, 32 * 1.2, 1e-9, "measured height");
    requireTrue(orch.store().primarySelection() == id, "selected");
    requireTrue(orch.commitText(p.pendingId, "again").empty(), "pending consumed");

    mc::PendingText blank = orch.beginText("", 0);
    mc::Id placeholder = orch.commitText(blank.pendingId, "   \n ");
    requireTrue(orch.store().get(placeholder)->content == "Double-click to edit", "placeholder");
    requireClose(orch.store().get(placeholder)->style.fontSize, 24, 1e-9, "default size");

    mc::PendingText dropped = orch.beginText("x", 20);
    requireTrue(orch.cancelText(dropped.pendingId), "cancel");
    requireTrue(orch.pendingTextCount() == 0, "no pending left");

    mc::CompositionConfig cfg;
    cfg.pendingTextInset = 120;
    mc::CompositionOrchestrator inset(cfg);
    requireClose(inset.beginText("x", 20).position.x, 280, 1e-9, "configured inset");
    std::printf("  Test 1 (text commit): PASS\n");
  }

  // ---- Test 2: style controls follow the primary text ----
  {
    mc::CompositionOrchestrator orch;
    mc::Id id = orch.commitText(orch.beginText("", 32).pendingId, "Hello");
    auto st = orch.selectedTextStyle();
    requireTrue(st.has_value() && st->fontFamily == "Arial", "style readable");

    mc::ElementPatch change;
    change.fontWeight = mc::FontWeight::Bold;
    change.color = std::string("#ff0000");
    change.x = 999.0;
    requireTrue(orch.setSelectedTextStyle(change), "applied");
    const mc::Element* e = orch.store().get(id);
    requireTrue(e->style.fontWeight == mc::FontWeight::Bold, "bold");
    requireTrue(e->style.color == "#ff0000", "color");
    requireClose(e->x, 350, 1e-9, "geometry fields ignored");
    requireClose(e->width, 5 * 0.6 * 32 * 1.1 + 10, 1e-9, "box refit for bold");

    requireTrue(orch.editText(id, "Hi\nthere"), "edit");
    requireClose(orch.store().get(id)->height, 2 * 32 * 1.2, 1e-9, "two lines");

    mc::Id img = orch.createImage(makeBitmap(50, 50));
    requireTrue(orch.store().primarySelection() == img, "image selected");
    requireTrue(!orch.selectedTextStyle().has_value(), "no style for images");
    requireTrue(!orch.setSelectedTextStyle(change), "no-op for images");
    requireTrue(!orch.editText(img, "nope"), "images are not editable");
    std::printf("  Test 2 (style): PASS\n");
  }

  // ---- Test 3: copy / paste with and without a pointer ----
  {
    mc::CompositionOrchestrator orch;
    mc::Id a = orch.createImage(makeBitmap(100, 100));
    mc::Id b = orch.commitText(orch.beginText("", 24).pendingId, "B");
    orch.store().setSelection({b, a});

    requireTrue(orch.copySelection() == 2, "two copied");
    auto pasted = orch.paste();
    requireTrue(pasted.size() == 2, "two pasted");
    const mc::Element* pa = orch.store().get(pasted[0]);
    const mc::Element* src = orch.store().get(a);
    requireClose(pa->x, src->x + 20, 1e-9, "offset +20 without pointer");
    requireTrue(pa->image && pa->image != src->image, "bitmap copied");
    requireTrue(pa->image->width == 100, "same pixels");
    requireTrue(orch.store().selectedIds().size() == 2, "paste selects the copies");
    requireTrue(orch.store().isSelected(pasted[1]), "second copy selected");

    mc::PointerEvent move;
    move.action = mc::PointerAction::Move;
    move.x = 600;
    move.y = 500;
    orch.handlePointer(orch.activeViewportId(), move);

    auto second = orch.paste();
    const mc::Element* first = orch.store().get(second[0]);
    const mc::Element* other = orch.store().get(second[1]);
    requireClose(first->x, 600, 1e-9, "first lands on pointer");
    requireClose(first->y, 500, 1e-9, "first lands on pointer y");
    requireClose(other->x - first->x, orch.store().get(b)->x - src->x, 1e-9,
                 "relative offset kept");
    std::printf("  Test 3 (clipboard): PASS\n");
  }

  // ---- Test 4: z-order over the selection ----
  {
    mc::CompositionOrchestrator orch;
    mc::Id a = orch.createImage(makeBitmap(50, 50));
    mc::Id b = orch.createImage(makeBitmap(50, 50));
    mc::Id c = orch.createImage(makeBitmap(50, 50));
    const mc::ElementStore& s = orch.store();

    orch.store().select(a);
    requireTrue(orch.bringToFront(), "front");
    requireTrue(s.zIndexOf(a) == 2, "a on top");
    requireTrue(s.hitTest({400, 300})->id == a, "hit test follows z-order");

    orch.store().setSelection({a, b});
    requireTrue(orch.sendToBack(), "back");
    requireTrue(s.zIndexOf(b) == 0 && s.zIndexOf(a) == 1 && s.zIndexOf(c) == 2,
                "relative order kept");

    orch.store().select(b);
    requireTrue(orch.bringForward(), "forward");
    requireTrue(s.zIndexOf(b) == 1, "one step up");
    requireTrue(orch.sendBackward(), "backward");
    requireTrue(s.zIndexOf(b) == 0, "one step down");

    orch.store().clearSelection();
    requireTrue(!orch.bringToFront(), "no selection");
    std::printf("  Test 4 (z-order): PASS\n");
  }

  // ---- Test 5: keyboard shortcuts ----
  {
    mc::CompositionOrchestrator orch;
    mc::Id vp = orch.activeViewportId();
    mc::Id a = orch.createImage(makeBitmap(80, 40));

    requireTrue(orch.handleKey(vp, key(mc::KeyCode::D, true)), "ctrl+d duplicates");
    requireTrue(orch.store().count() == 2, "two elements");
    mc::Id copy = orch.store().primarySelection();
    requireTrue(copy != a && !copy.empty(), "copy selected");
    requireClose(orch.store().get(copy)->x, orch.store().get(a)->x + 20, 1e-9, "offset");

    requireTrue(orch.handleKey(vp, key(mc::KeyCode::C, true)), "ctrl+c");
    requireTrue(orch.handleKey(vp, key(mc::KeyCode::V, true)), "ctrl+v");
    requireTrue(orch.store().count() == 3, "pasted");
    requireTrue(!orch.handleKey(vp, key(mc::KeyCode::C)), "plain c ignored");

    requireTrue(orch.handleKey(vp, key(mc::KeyCode::Delete)), "delete");
    requireTrue(orch.store().count() == 2, "selection deleted");
    requireTrue(!orch.handleKey(vp, key(mc::KeyCode::Backspace)), "nothing left to delete");
    std::printf("  Test 5 (keyboard): PASS\n");
  }

  // ---- Test 6: crop routing and clearAll ----
  {
    mc::CompositionOrchestrator orch;
    mc::Id vp = orch.activeViewportId();
    orch.createImage(makeBitmap(200, 200));
    requireTrue(orch.startCrop(), "crop started");
    requireTrue(!orch.startCrop(), "already cropping");
    requireTrue(orch.handleKey(vp, key(mc::KeyCode::Escape)), "escape cancels");
    requireTrue(!orch.controller(vp)->cropping(), "crop ended");

    mc::Id t = orch.commitText(orch.beginText("", 24).pendingId, "text");
    requireTrue(!orch.startCrop(), "text cannot be cropped");
    orch.store().select(t);

    mc::Id got;
    orch.setTextEditHandler([&](const mc::Id&, const mc::Id& elementId) { got = elementId; });
    const mc::Element* te = orch.store().get(t);
    mc::PointerEvent dbl;
    dbl.action = mc::PointerAction::DoubleClick;
    dbl.x = te->x + 2;
    dbl.y = te->y + 2;
    orch.handlePointer(vp, dbl);
    requireTrue(got == t, "edit handler called");

    orch.createImage(makeBitmap(100, 100));
    requireTrue(orch.startCrop(), "crop again");
    orch.clearAll();
    requireTrue(orch.store().count() == 0, "cleared");
    requireTrue(!orch.controller(vp)->cropping(), "crop mode cancelled");
    requireTrue(!orch.store().selection().hasSelection(), "selection cleared");
    std::printf("  Test 6 (crop + clearAll): PASS\n");
  }

  std::printf("D5.4 clipboard_style: ALL PASS\n");
  return 0;
}
