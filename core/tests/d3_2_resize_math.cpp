// D3.2: handle picking and resize geometry

#include "mc/interaction/ResizeMath.hpp"

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
  // ---- Test 1: handle picking ----
  {
    mc::Rect r{100, 100, 300, 200};
    requireTrue(mc::handleAt(r, {102, 97}, 8, false) == mc::HandleId::NW, "nw corner");
    requireTrue(mc::handleAt(r, {200, 205}, 8, false) == mc::HandleId::S, "s edge");
    requireTrue(mc::handleAt(r, {200, 205}, 8, true) == mc::HandleId::None, "edges off for text");
    requireTrue(mc::handleAt(r, {200, 150}, 8, false) == mc::HandleId::None, "interior");
    requireTrue(mc::handleAt(r, {309, 100}, 8, false) == mc::HandleId::None, "outside radius");

    // A tiny box: corners win over the overlapping edge midpoints
    mc::Rect t{0, 0, 10, 10};
    requireTrue(mc::handleAt(t, {9, 9}, 8, false) == mc::HandleId::SE, "corner first");
    std::printf("  Test 1 (handleAt): PASS\n");
  }

  // ---- Test 2: proportional corner resize ----
  {
    mc::Box o{0, 0, 200, 100};
    mc::Box b = mc::resizeBox(o, mc::HandleId::SE, 40, 1000, 20);
    requireClose(b.width, 240, 1e-9, "width from dx");
    requireClose(b.height, 120, 1e-9, "height follows aspect, dy ignored");
    requireClose(b.x, 0, 1e-9, "nw anchored x");
    requireClose(b.y, 0, 1e-9, "nw anchored y");

    mc::Box nw = mc::resizeBox(o, mc::HandleId::NW, 100, 0, 20);
    requireClose(nw.width, 100, 1e-9, "nw shrinks");
    requireClose(nw.height, 50, 1e-9, "nw keeps aspect");
    requireClose(nw.x + nw.width, 200, 1e-9, "se anchored right");
    requireClose(nw.y + nw.height, 100, 1e-9, "se anchored bottom");
    std::printf("  Test 2 (corner resize): PASS\n");
  }

  // ---- Test 3: corner resize clamps with aspect ----
  {
    mc::Box o{0, 0, 200, 100};
    mc::Box b = mc::resizeBox(o, mc::HandleId::SE, -190, 0, 20);
    requireClose(b.height, 20, 1e-9, "height clamped to min");
    requireClose(b.width, 40, 1e-9, "width follows aspect");
    std::printf("  Test 3 (corner clamp): PASS\n");
  }

  // ---- Test 4: edge resize ----
  {
    mc::Box o{50, 50, 100, 80};
    mc::Box e = mc::resizeBox(o, mc::HandleId::E, 30, 99, 20);
    requireClose(e.width, 130, 1e-9, "e widens");
    requireClose(e.height, 80, 1e-9, "e keeps height");

    mc::Box w = mc::resizeBox(o, mc::HandleId::W, 500, 0, 20);
    requireClose(w.width, 20, 1e-9, "w clamped");
    requireClose(w.x + w.width, 150, 1e-9, "right edge anchored");

    mc::Box n = mc::resizeBox(o, mc::HandleId::N, 0, -20, 20);
    requireClose(n.height, 100, 1e-9, "n grows up");
    requireClose(n.y, 30, 1e-9, "n moves top");
    std::printf("  Test 4 (edge resize): PASS\n");
  }

  // ---- Test 5: text corner resize scales the font ----
  {
    mc::Element t;
    t.kind = mc::ElementKind::Text;
    t.width = 100;
    t.height = 40;
    t.style.fontSize = 24;
    auto out = mc::resizeElement(t, mc::HandleId::SE, 50, 0, 20);
    requireTrue(out.fontSize.has_value(), "font size produced");
    requireClose(*out.fontSize, 36, 1e-9, "24 * 1.5");
    requireTrue(!out.crop.has_value(), "no crop for text");
    std::printf("  Test 5 (text resize): PASS\n");
  }

  // ---- Test 6: cropped image resizes through its visible area ----
  {
    mc::Element img;
    img.kind = mc::ElementKind::Image;
    img.x = 0;
    img.y = 0;
    img.width = 200;
    img.height = 200;
    img.crop = mc::CropRect{50, 50, 150, 150};

    auto out = mc::resizeElement(img, mc::HandleId::SE, 100, 0, 20);
    requireTrue(out.crop.has_value(), "crop scaled");
    requireClose(out.box.width, 400, 1e-9, "full box doubles");
    requireClose(out.crop->width(), 200, 1e-9, "visible width doubles");
    // Visible top-left stays at (50,50) in global coordinates
    requireClose(out.box.x + out.crop->left, 50, 1e-9, "visible left anchored");
    requireClose(out.box.y + out.crop->top, 50, 1e-9, "visible top anchored");
    std::printf("  Test 6 (cropped image resize): PASS\n");
  }

  std::printf("D3.2 resize_math: ALL PASS\n");
  return 0;
}
