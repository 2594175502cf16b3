// D3.1: text box measurement and line anchoring

#include "mc/text/TextLayout.hpp"
#include "mc/text/TextMeasurer.hpp"

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
  mc::FixedAdvanceMeasurer measurer;
  mc::TextBoxConfig cfg;

  // ---- Test 1: splitLines ----
  {
    auto a = mc::splitLines("");
    requireTrue(a.size() == 1 && a[0].empty(), "empty -> one empty line");
    auto b = mc::splitLines("one\ntwo\n");
    requireTrue(b.size() == 3, "trailing newline gives empty last line");
    requireTrue(b[0] == "one" && b[1] == "two" && b[2].empty(), "split contents");
    std::printf("  Test 1 (splitLines): PASS\n");
  }

  // ---- Test 2: single line box ----
  {
    mc::TextStyle st;
    st.fontSize = 20;
    auto box = mc::layoutTextBox(measurer, "Hello", st, cfg);
    // 5 glyphs * 12px + 10 padding
    requireClose(box.width, 70.0, 1e-9, "width");
    requireClose(box.height, 24.0, 1e-9, "height = 20 * 1.2");
    requireClose(box.lineHeight, 24.0, 1e-9, "lineHeight");
    requireTrue(box.lines.size() == 1, "one line");
    std::printf("  Test 2 (single line): PASS\n");
  }

  // ---- Test 3: widest line drives the width ----
  {
    mc::TextStyle st;
    st.fontSize = 10;
    auto box = mc::layoutTextBox(measurer, "ab\nabcdef\nabc", st, cfg);
    requireClose(box.width, 6 * 6.0 + 10.0, 1e-9, "widest line + padding");
    requireClose(box.height, 10 * 1.2 * 3, 1e-9, "three lines");
    requireClose(box.lines[1].width, 36.0, 1e-9, "line 2 width");
    std::printf("  Test 3 (multi-line): PASS\n");
  }

  // ---- Test 4: minimum size ----
  {
    mc::TextStyle st;
    st.fontSize = 8;
    auto box = mc::layoutTextBox(measurer, "", st, cfg);
    requireClose(box.width, 20.0, 1e-9, "min width");
    requireClose(box.height, 20.0, 1e-9, "min height");
    std::printf("  Test 4 (min size): PASS\n");
  }

  // ---- Test 5: bold and multi-byte code points ----
  {
    mc::TextStyle st;
    st.fontSize = 10;
    double plain = measurer.measureLine("\xC3\xA9t\xC3\xA9", st);
    requireClose(plain, 18.0, 1e-9, "three code points, not five bytes");
    st.fontWeight = mc::FontWeight::Bold;
    requireClose(measurer.measureLine("\xC3\xA9t\xC3\xA9", st), 19.8, 1e-9, "bold is 10% wider");

    auto cps = mc::decodeUtf8("a\xE2\x82");
    requireTrue(cps.size() == 2 && cps[1] == 0xFFFD, "truncated sequence replaced");
    std::printf("  Test 5 (measurement): PASS\n");
  }

  // ---- Test 6: line anchors ----
  {
    requireClose(mc::lineAnchorX(mc::TextAlign::Left, 100, 80, 10), 105.0, 1e-9, "left");
    requireClose(mc::lineAnchorX(mc::TextAlign::Center, 100, 80, 10), 140.0, 1e-9, "center");
    requireClose(mc::lineAnchorX(mc::TextAlign::Right, 100, 80, 10), 175.0, 1e-9, "right");
    requireClose(mc::lineMiddleY(50, 24, 0), 62.0, 1e-9, "line 0 middle");
    requireClose(mc::lineMiddleY(50, 24, 2), 110.0, 1e-9, "line 2 middle");
    std::printf("  Test 6 (anchors): PASS\n");
  }

  std::printf("D3.1 text_layout: ALL PASS\n");
  return 0;
}
