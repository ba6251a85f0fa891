#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "Canvas.h"
#include "Font.h"
#include "Frame.h"
#include "Image.h"
#include "Layout.h"
#include "Metrics.h"
#include "Renderer.h"
#include "Theme.h"

using nlohmann::json;
namespace fs = std::filesystem;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool have_test_font() {
  std::ifstream f(AX206MON_TEST_FONT);
  return f.is_open();
}

LayoutContext make_context(FontCache* fonts) {
  LayoutContext ctx;
  ctx.width = 320;
  ctx.height = 240;
  ctx.known_fields = {"cpu_percent", "net_rx", "hostname"};
  ctx.default_font = AX206MON_TEST_FONT;
  ctx.fonts = fonts;
  return ctx;
}

MetricSnapshot snapshot_with_history(const std::string& field, const std::vector<double>& values) {
  MetricSnapshot s;
  s.version = 1;
  MetricHistory history(values.size());
  for (double v : values) {
    history.Push(MetricSample::Bytes(field, v, "/s"));
  }
  s.histories.emplace(field, history);
  s.samples[field] = MetricSample::Bytes(field, values.back(), "/s");
  return s;
}

json graph_layout(int depth) {
  json widgets = json::array();
  widgets.push_back({{"type", "graph"}, {"id", "net"}, {"x", 10}, {"y", 20}, {"w", 102}, {"h", 52},
                     {"field", "net_rx"}, {"depth", depth}, {"min", 0}, {"max", 50}, {"color", "#00FF00"}});
  return widgets;
}

int test_frame_matches_layout() {
  LayoutContext ctx = make_context(nullptr);
  LayoutModel model = LayoutModel::Load(json::array(), ctx);
  RenderOptions options;
  options.background = RGB(0, 0, 64);
  Renderer renderer(options);
  Frame frame = renderer.Render(model, MetricSnapshot(), std::chrono::system_clock::now());
  if (frame.Width() != 320 || frame.Height() != 240 || frame.Format() != PixelFormat::RGB565) {
    return fail("test_frame_matches_layout", "frame size or format mismatch");
  }
  if (frame.At(0, 0) != RGB(0, 0, 64) || frame.At(319, 239) != RGB(0, 0, 64)) {
    return fail("test_frame_matches_layout", "empty layout should be pure background");
  }
  return 0;
}

int test_format_sample() {
  if (Renderer::FormatSample(MetricSample::Percent("cpu", 50.0)) != "50%" ||
      Renderer::FormatSample(MetricSample::Percent("cpu", 49.96), 1) != "50.0%") {
    return fail("test_format_sample", "percentage formatting mismatch");
  }
  if (Renderer::FormatSample(MetricSample::Bytes("rx", 1536, "/s")) != "1.5 KiB/s" ||
      Renderer::FormatSample(MetricSample::Bytes("rx", 512)) != "512 B") {
    return fail("test_format_sample", "byte formatting mismatch");
  }
  if (Renderer::FormatSample(MetricSample::Number("t", 45.5, "C")) != "45.5 C" ||
      Renderer::FormatSample(MetricSample::Number("n", 4)) != "4" ||
      Renderer::FormatSample(MetricSample::Number("n", 2.346), 2) != "2.35") {
    return fail("test_format_sample", "number formatting mismatch");
  }
  if (Renderer::FormatSample(MetricSample::Label("h", "box")) != "box") {
    return fail("test_format_sample", "text sample should render verbatim");
  }
  return 0;
}

int test_resolve_text_placeholder() {
  Renderer renderer;
  MetricSnapshot s;
  s.samples["cpu_percent"] = MetricSample::Percent("cpu_percent", 12.34);
  TextWidget text;
  text.field = "cpu_percent";
  text.format = "CPU {value} / {cpu_percent:.1} on {hostname}";
  bool complete = true;
  std::string out = renderer.ResolveText(text, s, complete);
  if (out != "CPU 12% / 12.3% on --" || complete) {
    return fail("test_resolve_text_placeholder", "missing template field should become the placeholder");
  }
  s.samples["hostname"] = MetricSample::Label("hostname", "box");
  out = renderer.ResolveText(text, s, complete);
  if (out != "CPU 12% / 12.3% on box" || !complete) {
    return fail("test_resolve_text_placeholder", "complete template mismatch");
  }
  return 0;
}

int test_gauge_fraction_clamps() {
  if (Renderer::GaugeFraction(50, 0, 100) != 0.5 || Renderer::GaugeFraction(150, 0, 100) != 1.0 ||
      Renderer::GaugeFraction(-5, 0, 100) != 0.0 || Renderer::GaugeFraction(5, 10, 10) != 0.0) {
    return fail("test_gauge_fraction_clamps", "fraction should be clamped to [0, 1]");
  }
  return 0;
}

int test_graph_points_oldest_left() {
  Rect area{0, 0, 101, 11};
  auto points = Renderer::GraphPoints(area, {10, 20, 30, 40, 50}, 5, 0, 50);
  std::vector<std::pair<int, int>> expected = {{0, 8}, {25, 6}, {50, 4}, {75, 2}, {100, 0}};
  if (points != expected) {
    return fail("test_graph_points_oldest_left", "points should run oldest-left to newest-right");
  }
  auto partial = Renderer::GraphPoints(area, {10, 20}, 5, 0, 50);
  if (partial.size() != 2 || partial[0].first != 75 || partial[1].first != 100) {
    return fail("test_graph_points_oldest_left", "short history should be right-aligned");
  }
  auto overflow = Renderer::GraphPoints(area, {1, 2, 3, 70, -4}, 3, 0, 50);
  if (overflow.size() != 3 || overflow[1].second != 0 || overflow[2].second != 10) {
    return fail("test_graph_points_oldest_left", "only the newest depth values, clamped to range");
  }
  return 0;
}

int test_graph_rendered_left_to_right() {
  LayoutContext ctx = make_context(nullptr);
  LayoutModel model = LayoutModel::Load(graph_layout(5), ctx);
  Renderer renderer;
  MetricSnapshot s = snapshot_with_history("net_rx", {10, 20, 30, 40, 50});
  RenderReport report;
  Frame frame = renderer.Render(model, s, std::chrono::system_clock::now(), &report);

  if (!report.placeholders.empty()) {
    return fail("test_graph_rendered_left_to_right", "graph with data is not a placeholder");
  }
  Rect inner{11, 21, 100, 50};
  auto points = Renderer::GraphPoints(inner, {10, 20, 30, 40, 50}, 5, 0, 50);
  for (const auto& p : points) {
    if (frame.At(p.first, p.second) != RGB(0, 255, 0)) {
      return fail("test_graph_rendered_left_to_right", "sample point not drawn");
    }
  }
  if (points.front().first != 11 || points.back().first != 110 || points.front().second <= points.back().second) {
    return fail("test_graph_rendered_left_to_right", "oldest sample should be low at the left edge");
  }

  Frame empty = renderer.Render(model, MetricSnapshot(), std::chrono::system_clock::now(), &report);
  if (report.placeholders != std::vector<std::string>({"net"})) {
    return fail("test_graph_rendered_left_to_right", "graph without history should be reported");
  }
  if (empty.At(60, 45) != renderer.Options().background) {
    return fail("test_graph_rendered_left_to_right", "graph without history draws no line");
  }
  return 0;
}

int test_stale_graph_history_is_placeholder() {
  LayoutContext ctx = make_context(nullptr);
  LayoutModel model = LayoutModel::Load(graph_layout(5), ctx);
  RenderOptions options;
  options.placeholder_color = RGB(255, 0, 0);
  Renderer renderer(options);
  MetricSnapshot s = snapshot_with_history("net_rx", {10, 20, 30});
  s.samples.erase("net_rx");
  RenderReport report;
  Frame frame = renderer.Render(model, s, std::chrono::system_clock::now(), &report);

  if (report.placeholders != std::vector<std::string>({"net"})) {
    return fail("test_stale_graph_history_is_placeholder", "graph of a vanished field should be a placeholder");
  }
  Rect inner{11, 21, 100, 50};
  for (const auto& p : Renderer::GraphPoints(inner, {10, 20, 30}, 5, 0, 50)) {
    if (frame.At(p.first, p.second) == RGB(0, 255, 0)) {
      return fail("test_stale_graph_history_is_placeholder", "stale history drawn as a live line");
    }
  }
  if (frame.At(10, 20) != RGB(255, 0, 0)) {
    return fail("test_stale_graph_history_is_placeholder", "border should use the placeholder colour");
  }

  json two = json::array();
  two.push_back({{"type", "graph"}, {"id", "mixed"}, {"x", 10}, {"y", 20}, {"w", 102}, {"h", 52},
                 {"fields", json::array({"net_rx", "cpu_percent"})}, {"depth", 5}, {"min", 0}, {"max", 50},
                 {"colors", json::array({"#00FF00", "#0000FF"})}});
  LayoutModel mixed = LayoutModel::Load(two, ctx);
  MetricSnapshot partial = snapshot_with_history("net_rx", {10, 20, 30, 40, 50});
  MetricHistory cpu(5);
  cpu.Push(MetricSample::Percent("cpu_percent", 25));
  partial.histories.emplace("cpu_percent", cpu);
  frame = renderer.Render(mixed, partial, std::chrono::system_clock::now(), &report);
  if (!report.placeholders.empty()) {
    return fail("test_stale_graph_history_is_placeholder", "graph with one live series is not a placeholder");
  }
  auto live = Renderer::GraphPoints(inner, {10, 20, 30, 40, 50}, 5, 0, 50);
  auto stale = Renderer::GraphPoints(inner, {25}, 5, 0, 50);
  if (frame.At(live.back().first, live.back().second) != RGB(0, 255, 0) ||
      frame.At(stale.back().first, stale.back().second) == RGB(0, 0, 255)) {
    return fail("test_stale_graph_history_is_placeholder", "only the live series should be drawn");
  }
  return 0;
}

int test_arc_gauge() {
  LayoutContext ctx = make_context(nullptr);
  json widgets = json::array();
  widgets.push_back({{"type", "gauge"}, {"id", "ring"}, {"x", 0}, {"y", 0}, {"w", 40}, {"h", 40},
                     {"field", "cpu_percent"}, {"shape", "arc"}, {"thickness", 6},
                     {"color", "#00FF00"}, {"track", "#0000FF"}});
  LayoutModel model = LayoutModel::Load(widgets, ctx);
  RenderOptions options;
  options.placeholder_color = RGB(255, 0, 0);
  Renderer renderer(options);

  auto count = [](const Frame& f, color_t c) {
    int n = 0;
    for (int y = 0; y < 40; ++y) {
      for (int x = 0; x < 40; ++x) {
        n += f.At(x, y) == c ? 1 : 0;
      }
    }
    return n;
  };
  auto now = std::chrono::system_clock::now();
  MetricSnapshot s;
  s.samples["cpu_percent"] = MetricSample::Percent("cpu_percent", 150);
  Frame full = renderer.Render(model, s, now);
  s.samples["cpu_percent"] = MetricSample::Percent("cpu_percent", 0);
  Frame empty = renderer.Render(model, s, now);
  s.samples["cpu_percent"] = MetricSample::Percent("cpu_percent", 50);
  Frame half = renderer.Render(model, s, now);

  if (count(full, RGB(0, 255, 0)) == 0 || count(full, RGB(0, 0, 255)) != 0) {
    return fail("test_arc_gauge", "over-range value should light the whole ring");
  }
  if (count(empty, RGB(0, 255, 0)) != 0 || count(empty, RGB(0, 0, 255)) == 0) {
    return fail("test_arc_gauge", "zero should leave only the track");
  }
  if (count(half, RGB(0, 255, 0)) == 0 || count(half, RGB(0, 0, 255)) == 0) {
    return fail("test_arc_gauge", "half value should show both active and track segments");
  }
  if (full.At(20, 20) != renderer.Options().background) {
    return fail("test_arc_gauge", "ring centre should stay empty");
  }

  RenderReport report;
  Frame missing = renderer.Render(model, MetricSnapshot(), now, &report);
  if (report.placeholders != std::vector<std::string>({"ring"}) || count(missing, RGB(0, 255, 0)) != 0 ||
      count(missing, RGB(255, 0, 0)) == 0) {
    return fail("test_arc_gauge", "missing value should draw the placeholder ring");
  }
  return 0;
}

int test_image_widget_painted() {
  fs::path png = fs::temp_directory_path() / ("ax206mon_render_" + std::to_string(static_cast<long long>(::getpid())) + ".png");
  Frame source(2, 1);
  source.Set(0, 0, RGB(255, 255, 255));
  source.Set(1, 0, RGB(0, 0, 0));
  if (!SaveFramePng(source, png.string())) {
    return fail("test_image_widget_painted", "cannot write fixture image");
  }

  LayoutContext ctx = make_context(nullptr);
  json widgets = json::array();
  widgets.push_back({{"type", "image"}, {"id", "avg"}, {"x", 5}, {"y", 5}, {"w", 1}, {"h", 1},
                     {"path", png.string()}, {"resample", "area"}});
  widgets.push_back({{"type", "image"}, {"id", "near"}, {"x", 7}, {"y", 5}, {"w", 1}, {"h", 1},
                     {"path", png.string()}});
  widgets.push_back({{"type", "image"}, {"id", "copy"}, {"x", 9}, {"y", 5}, {"w", 2}, {"h", 1},
                     {"path", png.string()}});
  LayoutModel model = LayoutModel::Load(widgets, ctx);
  std::error_code ec;
  fs::remove(png, ec);

  RenderOptions options;
  options.background = RGB(0, 0, 255);
  Renderer renderer(options);
  RenderReport report;
  Frame frame = renderer.Render(model, MetricSnapshot(), std::chrono::system_clock::now(), &report);
  if (!report.placeholders.empty()) {
    return fail("test_image_widget_painted", "image widgets need no metric data");
  }
  if (frame.At(5, 5) != RGB(127, 127, 127)) {
    return fail("test_image_widget_painted", "area resample should average white and black");
  }
  if (frame.At(7, 5) != RGB(255, 255, 255)) {
    return fail("test_image_widget_painted", "nearest resample should keep the first pixel");
  }
  if (frame.At(9, 5) != RGB(255, 255, 255) || frame.At(10, 5) != RGB(0, 0, 0) ||
      frame.At(11, 5) != RGB(0, 0, 255) || frame.At(6, 5) != RGB(0, 0, 255)) {
    return fail("test_image_widget_painted", "same-size image should be copied into its rectangle only");
  }
  return 0;
}

int test_bitmap_alpha_blend() {
  Frame frame(3, 1, RGB(0, 0, 0));
  Canvas canvas(frame);
  Bitmap b;
  b.width = 3;
  b.height = 1;
  b.rgba = {255, 255, 255, 0,
            255, 0, 0, 255,
            255, 255, 255, 128};
  canvas.DrawBitmap(b, 0, 0);
  if (frame.At(0, 0) != RGB(0, 0, 0)) {
    return fail("test_bitmap_alpha_blend", "transparent pixel should leave the frame untouched");
  }
  if (frame.At(1, 0) != RGB(255, 0, 0)) {
    return fail("test_bitmap_alpha_blend", "opaque pixel should replace the frame");
  }
  if (frame.At(2, 0) != interpolate_color(RGB(0, 0, 0), RGB(255, 255, 255), 128 / 255.0f) ||
      frame.At(2, 0) == RGB(0, 0, 0) || frame.At(2, 0) == RGB(255, 255, 255)) {
    return fail("test_bitmap_alpha_blend", "half-transparent pixel should blend");
  }
  return 0;
}

int test_missing_field_renders_placeholder() {
  if (!have_test_font()) {
    std::cout << "[SKIP] test_missing_field_renders_placeholder: no " << AX206MON_TEST_FONT << '\n';
    return 0;
  }
  FontCache fonts;
  LayoutContext ctx = make_context(&fonts);

  json bound = json::array();
  bound.push_back({{"type", "text"}, {"id", "cpu"}, {"x", 0}, {"y", 0}, {"w", 120}, {"h", 30},
                   {"field", "cpu_percent"}, {"format", "CPU {value}"}});
  json literal = json::array();
  literal.push_back({{"type", "text"}, {"id", "cpu"}, {"x", 0}, {"y", 0}, {"w", 120}, {"h", 30},
                     {"format", "--"}, {"color", "#FF0000"}});
  LayoutModel bound_model = LayoutModel::Load(bound, ctx);
  LayoutModel literal_model = LayoutModel::Load(literal, ctx);

  RenderOptions options;
  options.placeholder_color = RGB(255, 0, 0);
  Renderer renderer(options);
  auto now = std::chrono::system_clock::now();
  RenderReport report;
  Frame missing = renderer.Render(bound_model, MetricSnapshot(), now, &report);
  Frame expected = renderer.Render(literal_model, MetricSnapshot(), now);

  if (report.placeholders != std::vector<std::string>({"cpu"})) {
    return fail("test_missing_field_renders_placeholder", "widget should be reported as placeholder");
  }
  if (missing != expected) {
    return fail("test_missing_field_renders_placeholder", "placeholder should be drawn in place of the text");
  }
  if (missing == Frame(320, 240, 0)) {
    return fail("test_missing_field_renders_placeholder", "placeholder should be visible");
  }
  return 0;
}

int test_multiline_text_stops_at_rect() {
  if (!have_test_font()) {
    std::cout << "[SKIP] test_multiline_text_stops_at_rect: no " << AX206MON_TEST_FONT << '\n';
    return 0;
  }
  FontCache fonts;
  LayoutContext ctx = make_context(&fonts);
  const int line_h = fonts.Get(AX206MON_TEST_FONT)->LineHeight(16.0f);

  auto block = [&](const std::string& format) {
    json widgets = json::array();
    widgets.push_back({{"type", "text"}, {"id", "top"}, {"x", 0}, {"y", 0}, {"w", 200}, {"h", 2 * line_h},
                       {"font_size", 16}, {"color", "#FFFFFF"}, {"format", format}});
    return LayoutModel::Load(widgets, ctx);
  };
  Renderer renderer;
  auto now = std::chrono::system_clock::now();
  Frame four = renderer.Render(block("AB\nCD\nEF\nGH"), MetricSnapshot(), now);
  Frame two = renderer.Render(block("AB\nCD"), MetricSnapshot(), now);
  if (four != two) {
    return fail("test_multiline_text_stops_at_rect", "lines past the rectangle should not be drawn");
  }
  for (int y = 2 * line_h; y < 240; ++y) {
    for (int x = 0; x < 200; ++x) {
      if (four.At(x, y) != 0) {
        return fail("test_multiline_text_stops_at_rect", "text leaked below its widget");
      }
    }
  }
  return 0;
}

int test_clock_and_rotation() {
  ClockWidget clock;
  clock.utc = true;
  auto t = std::chrono::system_clock::from_time_t(3661);
  if (Renderer::FormatClock(clock, t) != "01:01:01") {
    return fail("test_clock_and_rotation", "UTC clock text mismatch");
  }
  clock.format = "%Y-%m-%d";
  if (Renderer::FormatClock(clock, t) != "1970-01-01") {
    return fail("test_clock_and_rotation", "date pattern mismatch");
  }

  LayoutContext ctx = make_context(nullptr);
  LayoutModel model = LayoutModel::Load(graph_layout(5), ctx);
  MetricSnapshot s = snapshot_with_history("net_rx", {10, 40, 20, 50, 30});
  Renderer upright;
  RenderOptions flipped_options;
  flipped_options.rotate180 = true;
  Renderer flipped(flipped_options);
  Frame a = upright.Render(model, s, t);
  Frame b = flipped.Render(model, s, t);
  if (b != a.Rotated180() || a == b) {
    return fail("test_clock_and_rotation", "rotate180 should flip the rendered frame");
  }
  if (upright.Render(model, s, t) != a) {
    return fail("test_clock_and_rotation", "rendering should be deterministic");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_frame_matches_layout(); rc != 0) {
    return rc;
  }
  if (int rc = test_format_sample(); rc != 0) {
    return rc;
  }
  if (int rc = test_resolve_text_placeholder(); rc != 0) {
    return rc;
  }
  if (int rc = test_gauge_fraction_clamps(); rc != 0) {
    return rc;
  }
  if (int rc = test_graph_points_oldest_left(); rc != 0) {
    return rc;
  }
  if (int rc = test_graph_rendered_left_to_right(); rc != 0) {
    return rc;
  }
  if (int rc = test_stale_graph_history_is_placeholder(); rc != 0) {
    return rc;
  }
  if (int rc = test_arc_gauge(); rc != 0) {
    return rc;
  }
  if (int rc = test_image_widget_painted(); rc != 0) {
    return rc;
  }
  if (int rc = test_bitmap_alpha_blend(); rc != 0) {
    return rc;
  }
  if (int rc = test_missing_field_renders_placeholder(); rc != 0) {
    return rc;
  }
  if (int rc = test_multiline_text_stops_at_rect(); rc != 0) {
    return rc;
  }
  if (int rc = test_clock_and_rotation(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] render unit tests\n";
  return 0;
}
