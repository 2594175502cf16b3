// D5.1: Headless composition demo
// Builds a 2x2 viewport grid through the JSON command surface, drops text
// and images into it, drags one image across a linked seam, crops another,
// then rasterizes every viewport's draw list to PPM.
//
// Usage: d5_1_composition_demo [config.json]

#include "mc/commands/CommandProcessor.hpp"
#include "mc/session/CompositionConfig.hpp"
#include "mc/session/CompositionOrchestrator.hpp"
#include "mc/text/FontMetrics.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

// ---- Software raster ----

struct Canvas {
  int w{0}, h{0};
  std::vector<std::uint8_t> rgb;

  Canvas(int width, int height)
    : w(width), h(height), rgb(static_cast<std::size_t>(width) * height * 3, 0) {}

  void blend(int x, int y, const float c[4]) {
    if (x < 0 || y < 0 || x >= w || y >= h) return;
    std::size_t i = (static_cast<std::size_t>(y) * w + x) * 3;
    for (int k = 0; k < 3; k++) {
      float dst = rgb[i + k] / 255.0f;
      float v = c[k] * c[3] + dst * (1.0f - c[3]);
      rgb[i + k] = static_cast<std::uint8_t>(std::lround(std::min(1.0f, std::max(0.0f, v)) * 255.0f));
    }
  }

  void fill(const mc::Rect& r, const float c[4]) {
    int x0 = std::max(0, static_cast<int>(std::floor(r.left)));
    int y0 = std::max(0, static_cast<int>(std::floor(r.top)));
    int x1 = std::min(w, static_cast<int>(std::ceil(r.right)));
    int y1 = std::min(h, static_cast<int>(std::ceil(r.bottom)));
    for (int y = y0; y < y1; y++)
      for (int x = x0; x < x1; x++) blend(x, y, c);
  }

  void stroke(const mc::Rect& r, const float c[4], const float dash[2]) {
    bool dashed = dash[0] > 0 && dash[1] > 0;
    int period = dashed ? static_cast<int>(dash[0] + dash[1]) : 1;
    auto on = [&](int i) { return !dashed || (i % period) < static_cast<int>(dash[0]); };

    int l = static_cast<int>(r.left), t = static_cast<int>(r.top);
    int rr = static_cast<int>(r.right), b = static_cast<int>(r.bottom);
    for (int x = l; x <= rr; x++) {
      if (!on(x - l)) continue;
      blend(x, t, c);
      blend(x, b, c);
    }
    for (int y = t; y <= b; y++) {
      if (!on(y - t)) continue;
      blend(l, y, c);
      blend(rr, y, c);
    }
  }

  void line(mc::Point a, mc::Point b, const float c[4]) {
    int steps = static_cast<int>(std::max(std::fabs(b.x - a.x), std::fabs(b.y - a.y)));
    for (int i = 0; i <= steps; i++) {
      double t = steps ? static_cast<double>(i) / steps : 0.0;
      blend(static_cast<int>(a.x + (b.x - a.x) * t), static_cast<int>(a.y + (b.y - a.y) * t), c);
    }
  }

  // Nearest-neighbour blit, restricted to clip when given
  void image(const mc::DrawCommand& cmd) {
    if (!cmd.bitmap || cmd.bitmap->width <= 0 || cmd.bitmap->height <= 0) return;
    const mc::Bitmap& bmp = *cmd.bitmap;
    mc::Rect area = cmd.hasClip ? cmd.clip : cmd.rect;
    int x0 = std::max(0, static_cast<int>(area.left));
    int y0 = std::max(0, static_cast<int>(area.top));
    int x1 = std::min(w, static_cast<int>(area.right));
    int y1 = std::min(h, static_cast<int>(area.bottom));
    for (int y = y0; y < y1; y++) {
      for (int x = x0; x < x1; x++) {
        double u = (x - cmd.rect.left) / cmd.rect.width();
        double v = (y - cmd.rect.top) / cmd.rect.height();
        int sx = std::min(bmp.width - 1, std::max(0, static_cast<int>(u * bmp.width)));
        int sy = std::min(bmp.height - 1, std::max(0, static_cast<int>(v * bmp.height)));
        std::size_t si = (static_cast<std::size_t>(sy) * bmp.width + sx) * 4;
        float c[4] = {bmp.rgba[si] / 255.0f, bmp.rgba[si + 1] / 255.0f,
                      bmp.rgba[si + 2] / 255.0f, bmp.rgba[si + 3] / 255.0f};
        blend(x, y, c);
      }
    }
  }

  // Glyph boxes: one bar per non-space code point at the fixed advance
  void text(const mc::DrawCommand& cmd) {
    double advance = cmd.textStyle.fontSize * 0.6;
    double half = cmd.textStyle.fontSize * 0.35;
    double runWidth = 0;
    for (char ch : cmd.text) {
      if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) runWidth += advance;
    }
    double x = cmd.from.x;
    if (cmd.textStyle.textAlign == mc::TextAlign::Center) x -= runWidth / 2;
    else if (cmd.textStyle.textAlign == mc::TextAlign::Right) x -= runWidth;
    for (char ch : cmd.text) {
      if ((static_cast<unsigned char>(ch) & 0xC0) == 0x80) continue;
      if (ch != ' ') {
        fill({x + 1, cmd.from.y - half, x + advance - 1, cmd.from.y + half}, cmd.color);
      }
      x += advance;
    }
  }
};

static void rasterize(const mc::DrawList& dl, Canvas& canvas) {
  for (const auto& cmd : dl.commands()) {
    switch (cmd.op) {
      case mc::DrawOp::Clear:
        canvas.fill({0, 0, static_cast<double>(canvas.w), static_cast<double>(canvas.h)}, cmd.color);
        break;
      case mc::DrawOp::FillRect:   canvas.fill(cmd.rect, cmd.color); break;
      case mc::DrawOp::StrokeRect: canvas.stroke(cmd.rect, cmd.color, cmd.dash); break;
      case mc::DrawOp::Image:      canvas.image(cmd); break;
      case mc::DrawOp::Text:       canvas.text(cmd); break;
      case mc::DrawOp::Line:       canvas.line(cmd.from, cmd.to, cmd.color); break;
    }
  }
}

static void writePPM(const std::string& filename, const Canvas& canvas) {
  FILE* f = std::fopen(filename.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "cannot write %s\n", filename.c_str());
    return;
  }
  std::fprintf(f, "P6\n%d %d\n255\n", canvas.w, canvas.h);
  std::fwrite(canvas.rgb.data(), 1, canvas.rgb.size(), f);
  std::fclose(f);
  std::printf("Wrote %s (%dx%d)\n", filename.c_str(), canvas.w, canvas.h);
}

// ---- Scene content ----

static std::shared_ptr<const mc::Bitmap> gradient(int w, int h, int hue) {
  auto b = std::make_shared<mc::Bitmap>();
  b->width = w;
  b->height = h;
  b->rgba.resize(static_cast<std::size_t>(w) * h * 4);
  for (int y = 0; y < h; y++) {
    for (int x = 0; x < w; x++) {
      std::size_t i = (static_cast<std::size_t>(y) * w + x) * 4;
      b->rgba[i + 0] = static_cast<std::uint8_t>(hue == 0 ? 255 * x / w : 60);
      b->rgba[i + 1] = static_cast<std::uint8_t>(hue == 1 ? 255 * y / h : 120);
      b->rgba[i + 2] = static_cast<std::uint8_t>(hue == 2 ? 255 * (x + y) / (w + h) : 180);
      b->rgba[i + 3] = 255;
    }
  }
  return b;
}

static bool run(mc::CommandProcessor& cp, const std::string& json) {
  mc::CmdResult r = cp.applyJsonText(json);
  if (!r.ok) {
    std::fprintf(stderr, "command failed: %s\n  %s: %s\n",
                 json.c_str(), r.err.code.c_str(), r.err.message.c_str());
  }
  return r.ok;
}

int main(int argc, char* argv[]) {
  mc::CompositionConfig cfg;
  if (argc > 1 && !mc::loadCompositionConfigFile(argv[1], cfg)) return 1;

  mc::CompositionOrchestrator orch(cfg);
  mc::CommandProcessor cp(orch);

  mc::FontMetrics fonts;
#ifdef FONT_PATH
  if (fonts.loadFontFile(cfg.defaultText.fontFamily, mc::FontWeight::Normal,
                         mc::FontStyle::Normal, FONT_PATH)) {
    orch.setTextMeasurer(&fonts);
    std::printf("Font loaded\n");
  }
#endif

  // 1. 2x2 grid
  run(cp, R"({"cmd":"addViewport","direction":"right"})");
  run(cp, R"({"cmd":"addViewport","direction":"bottom"})");
  run(cp, R"({"cmd":"activateViewport","viewportId":"viewport-2"})");
  run(cp, R"({"cmd":"addViewport","direction":"bottom"})");
  run(cp, R"({"cmd":"activateViewport","viewportId":"viewport-1"})");
  run(cp, R"({"cmd":"toggleLink","a":"viewport-3","b":"viewport-4"})");

  // 2. Content
  mc::CmdResult pending = cp.applyJsonText(R"({"cmd":"beginText","fontSize":36})");
  if (pending.ok) {
    orch.commitText(pending.createdId, "MultiCanvas\nheadless demo");
    run(cp, R"({"cmd":"setTextStyle","fontWeight":"bold","color":"#2b6cb0","textAlign":"center"})");
  }

  mc::Id left = orch.createImage(gradient(400, 240, 0), "viewport-1");
  mc::Id cropped = orch.createImage(gradient(240, 240, 1), "viewport-3");
  orch.createImage(gradient(180, 120, 2), "viewport-4");

  // 3. Drag the first image across the linked seam into viewport-2
  const mc::Element* e = orch.store().get(left);
  if (e) {
    mc::PointerEvent ev;
    ev.action = mc::PointerAction::Down;
    ev.x = e->x + 10;
    ev.y = e->y + 10;
    orch.handlePointer("viewport-1", ev);
    ev.action = mc::PointerAction::Move;
    ev.x += 600;
    orch.handlePointer("viewport-1", ev);
    ev.action = mc::PointerAction::Up;
    orch.handlePointer("viewport-1", ev);
    std::printf("Dragged %s, owner now %s\n", left.c_str(),
                orch.store().get(left)->ownerViewportId.c_str());
  }

  // 4. Crop the second image to its centre
  orch.store().select(cropped);
  orch.activateViewport("viewport-3");
  if (orch.startCrop()) {
    mc::ViewportController* vc = orch.controller("viewport-3");
    const mc::Element* img = orch.store().get(cropped);
    mc::Point origin = vc->viewport().toLocal(mc::Point{img->x, img->y});
    auto drag = [&](double fx, double fy, double tx, double ty) {
      mc::PointerEvent p;
      p.action = mc::PointerAction::Down;
      p.x = origin.x + fx;
      p.y = origin.y + fy;
      vc->handlePointer(p);
      p.action = mc::PointerAction::Move;
      p.x = origin.x + tx;
      p.y = origin.y + ty;
      vc->handlePointer(p);
      p.action = mc::PointerAction::Up;
      vc->handlePointer(p);
    };
    drag(0, 0, 60, 60);
    drag(img->width, img->height, img->width - 60, img->height - 60);
    run(cp, R"({"cmd":"applyCrop"})");
  }
  orch.store().clearSelection();

  std::printf("%s\n", cp.listViewportsJson().c_str());

  // 5. Rasterize every viewport
  orch.renderAll();
  for (const auto& id : orch.viewportIds()) {
    const mc::ViewportController* vc = orch.controller(id);
    Canvas canvas(vc->viewport().width(), vc->viewport().height());
    rasterize(vc->frame(), canvas);
    std::printf("%s: %zu commands, %zu elements\n", id.c_str(),
                vc->frame().size(), vc->visibleElementIds().size());
    writePPM("d5_1_" + id + ".ppm", canvas);
  }
  return 0;
}
