// D4.1: Viewport offsets, local/global mapping, display scale

#include "mc/viewport/Viewport.hpp"

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
  // ---- Test 1: offset from cell and resolution ----
  {
    mc::Viewport vp("viewport-2", "Canvas 2");
    requireTrue(vp.width() == 800 && vp.height() == 600, "default resolution");
    vp.setCell({1, 2});
    requireClose(vp.offsetX(), 1600, 1e-9, "col * width");
    requireClose(vp.offsetY(), 600, 1e-9, "row * height");

    vp.setResolution(1024, 768);
    requireClose(vp.offsetX(), 2048, 1e-9, "offset follows resolution");
    requireClose(vp.offsetY(), 768, 1e-9, "offset y follows resolution");

    vp.setResolution(0, 100);
    requireTrue(vp.width() == 1024, "non-positive resolution ignored");

    vp.recomputeOffset();
    vp.recomputeOffset();
    requireClose(vp.offsetX(), 2048, 1e-9, "idempotent");
    std::printf("  Test 1 (offsets): PASS\n");
  }

  // ---- Test 2: local <-> global round trip ----
  {
    mc::Viewport vp("viewport-1", "Canvas 1");
    vp.setCell({0, 1});
    mc::Point g = vp.toGlobal({10, 20});
    requireClose(g.x, 810, 1e-9, "global x");
    requireClose(g.y, 20, 1e-9, "global y");
    mc::Point l = vp.toLocal(g);
    requireClose(l.x, 10, 1e-9, "back to local x");
    requireClose(l.y, 20, 1e-9, "back to local y");

    mc::Rect r = vp.toLocal(mc::Rect{790, 100, 830, 140});
    requireClose(r.left, -10, 1e-9, "rect translated");
    requireClose(r.right, 30, 1e-9, "rect right");
    std::printf("  Test 2 (mapping): PASS\n");
  }

  // ---- Test 3: ownership is half-open ----
  {
    mc::Viewport a("viewport-1", "Canvas 1");
    mc::Viewport b("viewport-2", "Canvas 2");
    b.setCell({0, 1});
    mc::Point seam{800, 300};
    requireTrue(!a.containsGlobal(seam), "seam not in left viewport");
    requireTrue(b.containsGlobal(seam), "seam in right viewport");
    requireTrue(a.containsGlobal({799.5, 0}), "left edge inclusive");
    std::printf("  Test 3 (half-open ownership): PASS\n");
  }

  // ---- Test 4: device pixels through display scale ----
  {
    mc::Viewport vp("viewport-3", "Canvas 3");
    vp.setCell({1, 0});
    vp.setDisplayScale(0.5);
    mc::Point g = vp.deviceToGlobal({100, 50});
    requireClose(g.x, 200, 1e-9, "device x / scale");
    requireClose(g.y, 700, 1e-9, "device y / scale + offset");

    vp.setDisplayScale(-1);
    requireClose(vp.displayScale(), 0.5, 1e-9, "invalid scale ignored");
    std::printf("  Test 4 (display scale): PASS\n");
  }

  std::printf("D4.1 viewport_transform: ALL PASS\n");
  return 0;
}
