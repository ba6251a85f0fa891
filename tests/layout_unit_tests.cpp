#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "Errors.h"
#include "Font.h"
#include "Frame.h"
#include "Image.h"
#include "Layout.h"
#include "SystemMetrics.h"
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
  ctx.known_fields = {"cpu_percent", "net_rx", "net_tx", "mem_percent", "hostname"};
  ctx.default_font = AX206MON_TEST_FONT;
  ctx.default_font_size = 16.0f;
  ctx.fonts = fonts;
  return ctx;
}

// Returns the ConfigError message, or "" when loading succeeded.
std::string load_error(const json& widgets, const LayoutContext& ctx, ConfigErrorKind* kind = nullptr) {
  try {
    LayoutModel::Load(widgets, ctx);
  } catch (const ConfigError& e) {
    if (kind) {
      *kind = e.kind();
    }
    return e.what();
  }
  return "";
}

int test_graph_and_gauge_load() {
  LayoutContext ctx = make_context(nullptr);
  json widgets = json::array();
  widgets.push_back({{"type", "graph"}, {"id", "net"}, {"x", 0}, {"y", 0}, {"w", 160}, {"h", 80},
                     {"fields", json::array({"net_rx", "net_tx"})}, {"depth", 5}, {"auto_scale", true}});
  widgets.push_back({{"type", "gauge"}, {"x", 0}, {"y", 100}, {"w", 200}, {"h", 10},
                     {"field", "cpu_percent"}, {"color", "cpu"}});
  LayoutModel model = LayoutModel::Load(widgets, ctx);

  if (model.Width() != 320 || model.Height() != 240 || model.Widgets().size() != 2) {
    return fail("test_graph_and_gauge_load", "layout size or widget count mismatch");
  }
  const Widget& graph = model.Widgets()[0];
  const auto* g = std::get_if<GraphWidget>(&graph.body);
  if (!g || std::string(graph.TypeName()) != "graph" || g->depth != 5 || g->colors.size() != 2) {
    return fail("test_graph_and_gauge_load", "graph widget not parsed");
  }
  if (graph.Fields() != std::vector<std::string>({"net_rx", "net_tx"})) {
    return fail("test_graph_and_gauge_load", "graph fields mismatch");
  }
  const Widget& gauge = model.Widgets()[1];
  if (gauge.id != "gauge1" || gauge.style.color != ctx.theme.cpu || !std::get_if<GaugeWidget>(&gauge.body)) {
    return fail("test_graph_and_gauge_load", "gauge id default or theme colour mismatch");
  }
  auto depths = model.HistoryDepths();
  if (depths.size() != 2 || depths["net_rx"] != 5) {
    return fail("test_graph_and_gauge_load", "history depths should come from graphs");
  }
  return 0;
}

int test_unknown_field_is_invalid_layout() {
  LayoutContext ctx = make_context(nullptr);
  json widgets = json::array();
  widgets.push_back({{"type", "graph"}, {"id", "g"}, {"x", 0}, {"y", 0}, {"w", 50}, {"h", 50},
                     {"field", "gpu_fan"}});
  ConfigErrorKind kind = ConfigErrorKind::Io;
  std::string msg = load_error(widgets, ctx, &kind);
  if (kind != ConfigErrorKind::InvalidLayout || msg.find("unknown metric field 'gpu_fan'") == std::string::npos) {
    return fail("test_unknown_field_is_invalid_layout", "undefined field should be reported");
  }
  if (msg.find("widget[0] 'g'") == std::string::npos) {
    return fail("test_unknown_field_is_invalid_layout", "error should name the widget");
  }
  return 0;
}

int test_geometry_and_value_validation() {
  LayoutContext ctx = make_context(nullptr);
  const json base = {{"type", "graph"}, {"x", 0}, {"y", 0}, {"w", 50}, {"h", 50}, {"field", "net_rx"}};

  json outside = base;
  outside["x"] = 300;
  if (load_error(json::array({outside}), ctx).find("exceeds 320x240") == std::string::npos) {
    return fail("test_geometry_and_value_validation", "rectangle outside the frame accepted");
  }
  json missing = base;
  missing.erase("y");
  if (load_error(json::array({missing}), ctx).find("missing 'y'") == std::string::npos) {
    return fail("test_geometry_and_value_validation", "missing coordinate accepted");
  }
  json fractional = base;
  fractional["w"] = 10.5;
  if (load_error(json::array({fractional}), ctx).empty()) {
    return fail("test_geometry_and_value_validation", "non-integer width accepted");
  }
  json shallow = base;
  shallow["depth"] = 1;
  if (load_error(json::array({shallow}), ctx).empty()) {
    return fail("test_geometry_and_value_validation", "graph depth 1 accepted");
  }
  json flat = base;
  flat["min"] = 10;
  flat["max"] = 10;
  if (load_error(json::array({flat}), ctx).empty()) {
    return fail("test_geometry_and_value_validation", "graph with empty range accepted");
  }
  flat["auto_scale"] = true;
  if (!load_error(json::array({flat}), ctx).empty()) {
    return fail("test_geometry_and_value_validation", "auto-scaled graph ignores min/max");
  }
  json gauge = {{"type", "gauge"}, {"x", 0}, {"y", 0}, {"w", 50}, {"h", 5}, {"field", "cpu_percent"},
                {"min", 50}, {"max", 0}};
  if (load_error(json::array({gauge}), ctx).find("min must be below max") == std::string::npos) {
    return fail("test_geometry_and_value_validation", "inverted gauge range accepted");
  }
  json dup = base;
  dup["id"] = "same";
  if (load_error(json::array({dup, dup}), ctx).find("duplicate id") == std::string::npos) {
    return fail("test_geometry_and_value_validation", "duplicate id accepted");
  }
  json unknown = base;
  unknown["type"] = "sparkline";
  if (load_error(json::array({unknown}), ctx).find("unknown widget type") == std::string::npos) {
    return fail("test_geometry_and_value_validation", "unknown widget type accepted");
  }
  if (load_error(json::object(), ctx).empty()) {
    return fail("test_geometry_and_value_validation", "non-array widget tree accepted");
  }
  return 0;
}

int test_oversized_integers_rejected() {
  LayoutContext ctx = make_context(nullptr);
  const json base = {{"type", "graph"}, {"x", 0}, {"y", 0}, {"w", 50}, {"h", 50}, {"field", "net_rx"}};
  const long long two32 = 4294967296LL;

  json far = base;
  far["x"] = two32;
  json wide = base;
  wide["w"] = two32 + 50;
  json wrap = base;
  wrap["x"] = 2147483600LL;
  wrap["w"] = 100;
  json huge = base;
  huge["y"] = 18446744073709551615ULL;
  for (const json& w : {far, wide, wrap, huge}) {
    ConfigErrorKind kind = ConfigErrorKind::Io;
    std::string msg = load_error(json::array({w}), ctx, &kind);
    if (kind != ConfigErrorKind::InvalidLayout || msg.find("exceeds 320x240") == std::string::npos) {
      return fail("test_oversized_integers_rejected", "geometry beyond int range accepted");
    }
  }

  json depth = base;
  depth["depth"] = two32 + 5;
  if (load_error(json::array({depth}), ctx).find("'depth' must be in 2..100000") == std::string::npos) {
    return fail("test_oversized_integers_rejected", "depth truncated instead of rejected");
  }
  json line = base;
  line["line_width"] = two32 + 1;
  if (load_error(json::array({line}), ctx).find("'line_width' must be in 1..8") == std::string::npos) {
    return fail("test_oversized_integers_rejected", "line width truncated instead of rejected");
  }
  json gauge = {{"type", "gauge"}, {"x", 0}, {"y", 0}, {"w", 50}, {"h", 10}, {"field", "cpu_percent"},
                {"thickness", two32 + 1}};
  if (load_error(json::array({gauge}), ctx).find("'thickness' must be in") == std::string::npos) {
    return fail("test_oversized_integers_rejected", "thickness truncated instead of rejected");
  }

  color_t c = 0;
  if (ParseColor(json::array({two32, 0, 0}), ctx.theme, c) ||
      ParseColor(json::array({18446744073709551615ULL, 0, 0}), ctx.theme, c) ||
      ParseColor(json::array({-1, 0, 0}), ctx.theme, c)) {
    return fail("test_oversized_integers_rejected", "colour channel outside 0..255 accepted");
  }
  json coloured = base;
  coloured["color"] = json::array({0, two32 + 255, 0});
  if (load_error(json::array({coloured}), ctx).find("invalid colour") == std::string::npos) {
    return fail("test_oversized_integers_rejected", "widget colour wrapped into range");
  }

  if (have_test_font()) {
    FontCache fonts;
    LayoutContext text_ctx = make_context(&fonts);
    json text = {{"type", "text"}, {"x", 0}, {"y", 0}, {"w", 100}, {"h", 20}, {"field", "cpu_percent"},
                 {"precision", two32 + 3}};
    if (load_error(json::array({text}), text_ctx).find("'precision' must be in 0..9") == std::string::npos) {
      return fail("test_oversized_integers_rejected", "precision truncated instead of rejected");
    }
  }
  return 0;
}

int test_colour_parsing() {
  const Theme& theme = THEMES.at("default");
  color_t c = 0;
  if (!ParseColor("#FF0000", theme, c) || c != RGB(255, 0, 0)) {
    return fail("test_colour_parsing", "hex colour mismatch");
  }
  if (!ParseColor(json::array({0, 255, 0}), theme, c) || c != RGB(0, 255, 0)) {
    return fail("test_colour_parsing", "rgb array mismatch");
  }
  if (!ParseColor("CPU", theme, c) || c != theme.cpu) {
    return fail("test_colour_parsing", "theme role lookup mismatch");
  }
  if (ParseColor("#GG0000", theme, c) || ParseColor(json::array({1, 2}), theme, c) ||
      ParseColor(json::array({0, 0, 300}), theme, c) || ParseColor("chartreuse", theme, c)) {
    return fail("test_colour_parsing", "invalid colour accepted");
  }
  return 0;
}

int test_template_fields() {
  std::vector<std::string> names = TemplateFields("CPU {cpu_percent:.1} {value} | {hostname}");
  if (names != std::vector<std::string>({"cpu_percent", "value", "hostname"})) {
    return fail("test_template_fields", "template field extraction mismatch");
  }
  if (!TemplateFields("no fields {").empty()) {
    return fail("test_template_fields", "unterminated brace should yield nothing");
  }
  return 0;
}

int test_text_and_clock_widgets() {
  if (!have_test_font()) {
    std::cout << "[SKIP] test_text_and_clock_widgets: no " << AX206MON_TEST_FONT << '\n';
    return 0;
  }
  FontCache fonts;
  LayoutContext ctx = make_context(&fonts);
  json widgets = json::array();
  widgets.push_back({{"type", "text"}, {"id", "cpu"}, {"x", 0}, {"y", 0}, {"w", 100}, {"h", 20},
                     {"field", "cpu_percent"}, {"format", "CPU {value} on {hostname}"}, {"align", "right"}});
  widgets.push_back({{"type", "text"}, {"id", "label"}, {"x", 0}, {"y", 30}, {"w", 100}, {"h", 20},
                     {"format", "Static"}});
  widgets.push_back({{"type", "clock"}, {"id", "clock"}, {"x", 0}, {"y", 60}, {"w", 100}, {"h", 20},
                     {"format", "%H:%M"}, {"utc", true}});
  LayoutModel model = LayoutModel::Load(widgets, ctx);

  const Widget& text = model.Widgets()[0];
  if (!text.style.font || text.style.align != Align::Right ||
      text.Fields() != std::vector<std::string>({"cpu_percent", "hostname"})) {
    return fail("test_text_and_clock_widgets", "text widget not parsed");
  }
  if (!model.Widgets()[1].Fields().empty()) {
    return fail("test_text_and_clock_widgets", "static label reads no fields");
  }
  const auto* clock = std::get_if<ClockWidget>(&model.Widgets()[2].body);
  if (!clock || clock->format != "%H:%M" || !clock->utc) {
    return fail("test_text_and_clock_widgets", "clock widget not parsed");
  }

  json bad_template = json::array();
  bad_template.push_back({{"type", "text"}, {"x", 0}, {"y", 0}, {"w", 10}, {"h", 10}, {"format", "{swap}"}});
  if (load_error(bad_template, ctx).find("unknown metric field 'swap'") == std::string::npos) {
    return fail("test_text_and_clock_widgets", "template field must be known");
  }
  json bad_font = json::array();
  bad_font.push_back({{"type", "text"}, {"x", 0}, {"y", 0}, {"w", 10}, {"h", 10}, {"format", "x"},
                      {"font", "/nonexistent/font.ttf"}});
  if (load_error(bad_font, ctx).find("cannot be loaded") == std::string::npos) {
    return fail("test_text_and_clock_widgets", "missing font should be reported");
  }
  return 0;
}

int test_image_widget_is_preresized() {
  fs::path dir = fs::temp_directory_path() / ("ax206mon_img_" + std::to_string(static_cast<long long>(::getpid())));
  std::error_code ec;
  fs::create_directories(dir, ec);
  Frame src(4, 4, RGB(255, 0, 0));
  if (!SaveFramePng(src, (dir / "red.png").string())) {
    return fail("test_image_widget_is_preresized", "failed writing png fixture");
  }

  LayoutContext ctx = make_context(nullptr);
  ctx.base_dir = dir.string();
  json widgets = json::array();
  widgets.push_back({{"type", "image"}, {"id", "logo"}, {"x", 10}, {"y", 10}, {"w", 8}, {"h", 6},
                     {"path", "red.png"}, {"resample", "area"}});
  LayoutModel model = LayoutModel::Load(widgets, ctx);
  const auto* img = std::get_if<ImageWidget>(&model.Widgets()[0].body);
  if (!img || img->frames.size() != 1 || img->frames[0]->width != 8 || img->frames[0]->height != 6 ||
      img->resample != ResamplePolicy::AreaAverage) {
    return fail("test_image_widget_is_preresized", "image should be decoded and resized at load");
  }

  json missing = json::array();
  missing.push_back({{"type", "image"}, {"x", 0}, {"y", 0}, {"w", 8}, {"h", 8}, {"path", "nope.png"}});
  if (load_error(missing, ctx).find("cannot load image") == std::string::npos) {
    return fail("test_image_widget_is_preresized", "missing image should be reported");
  }
  fs::remove_all(dir, ec);
  return 0;
}

int test_default_layout_is_valid() {
  if (!have_test_font()) {
    std::cout << "[SKIP] test_default_layout_is_valid: no " << AX206MON_TEST_FONT << '\n';
    return 0;
  }
  SystemMetricsOptions options;
  options.sensors = {{"k10temp", "cpu"}};
  options.syslog_path = "/var/log/syslog";
  SystemMetrics metrics(options);

  FontCache fonts;
  LayoutContext ctx = make_context(&fonts);
  ctx.known_fields = metrics.Fields();
  json widgets = LayoutModel::DefaultWidgets(320, 240, {"cpu"}, 0, 5, true);
  LayoutModel model = LayoutModel::Load(widgets, ctx);

  bool has_syslog = false;
  bool has_graph = false;
  bool has_top_cpu = false;
  for (const auto& w : model.Widgets()) {
    if (w.id == "syslog") has_syslog = true;
    if (std::get_if<GraphWidget>(&w.body)) has_graph = true;
    if (w.id == "top_cpu") {
      const auto& text = std::get<TextWidget>(w.body);
      has_top_cpu = w.rect.y + w.rect.h <= 160 && text.format.find("{top_cpu}") != std::string::npos;
    }
  }
  if (!has_syslog || !has_graph || !has_top_cpu || model.Widgets().size() < 8) {
    return fail("test_default_layout_is_valid", "default dashboard is missing sections");
  }

  json bare = LayoutModel::DefaultWidgets(320, 240, {}, 0, 0, false);
  for (const auto& w : bare) {
    if (w["id"] == "top_cpu" || w["id"] == "top_mem") {
      return fail("test_default_layout_is_valid", "top processes disabled but still laid out");
    }
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_graph_and_gauge_load(); rc != 0) {
    return rc;
  }
  if (int rc = test_unknown_field_is_invalid_layout(); rc != 0) {
    return rc;
  }
  if (int rc = test_geometry_and_value_validation(); rc != 0) {
    return rc;
  }
  if (int rc = test_oversized_integers_rejected(); rc != 0) {
    return rc;
  }
  if (int rc = test_colour_parsing(); rc != 0) {
    return rc;
  }
  if (int rc = test_template_fields(); rc != 0) {
    return rc;
  }
  if (int rc = test_text_and_clock_widgets(); rc != 0) {
    return rc;
  }
  if (int rc = test_image_widget_is_preresized(); rc != 0) {
    return rc;
  }
  if (int rc = test_default_layout_is_valid(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] layout unit tests\n";
  return 0;
}
