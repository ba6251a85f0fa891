#include "Layout.h"
#include "Log.h"
#include "utils.h"
#include <algorithm>
#include <climits>
#include <set>

using nlohmann::json;

namespace {

[[noreturn]] void fail(size_t index, const std::string& id, const std::string& message) {
    std::string where = "widget[" + std::to_string(index) + "]";
    if (!id.empty()) where += " '" + id + "'";
    throw ConfigError(ConfigErrorKind::InvalidLayout, where + ": " + message);
}

struct WidgetReader {
    const json& node;
    const LayoutContext& ctx;
    size_t index;
    std::string id;

    // Full-width read; values beyond long long saturate so range checks still reject them.
    long long wide(const char* key, bool required, long long def) const {
        auto it = node.find(key);
        if (it == node.end()) {
            if (required) fail(index, id, std::string("missing '") + key + "'");
            return def;
        }
        if (!it->is_number_integer()) fail(index, id, std::string("'") + key + "' must be an integer");
        if (it->is_number_unsigned()) {
            auto u = it->get<unsigned long long>();
            return u > static_cast<unsigned long long>(LLONG_MAX) ? LLONG_MAX : static_cast<long long>(u);
        }
        return it->get<long long>();
    }

    int integer(const char* key, int def, long long min_val, long long max_val) const {
        long long v = wide(key, false, def);
        if (v < min_val || v > max_val) {
            fail(index, id, std::string("'") + key + "' must be in " + std::to_string(min_val) + ".." +
                                std::to_string(max_val));
        }
        return static_cast<int>(v);
    }

    double number(const char* key, double def) const {
        auto it = node.find(key);
        if (it == node.end()) return def;
        if (!it->is_number()) fail(index, id, std::string("'") + key + "' must be a number");
        return it->get<double>();
    }

    bool boolean(const char* key, bool def) const {
        auto it = node.find(key);
        if (it == node.end()) return def;
        if (!it->is_boolean()) fail(index, id, std::string("'") + key + "' must be true or false");
        return it->get<bool>();
    }

    std::string string(const char* key, const std::string& def) const {
        auto it = node.find(key);
        if (it == node.end()) return def;
        if (!it->is_string()) fail(index, id, std::string("'") + key + "' must be a string");
        return it->get<std::string>();
    }

    color_t color(const char* key, color_t def) const {
        auto it = node.find(key);
        if (it == node.end()) return def;
        color_t c = def;
        if (!ParseColor(*it, ctx.theme, c)) fail(index, id, std::string("invalid colour for '") + key + "'");
        return c;
    }

    void field(const std::string& name) const {
        if (name.empty()) fail(index, id, "empty metric field");
        if (std::find(ctx.known_fields.begin(), ctx.known_fields.end(), name) == ctx.known_fields.end()) {
            fail(index, id, "unknown metric field '" + name + "'");
        }
    }

    std::string path(const std::string& p) const {
        if (p.empty() || p[0] == '/' || ctx.base_dir.empty()) return p;
        return ctx.base_dir + "/" + p;
    }
};

void read_style(const WidgetReader& r, Widget& w, bool needs_font) {
    w.style.color = r.color("color", r.ctx.theme.text);
    if (r.node.contains("background")) {
        w.style.background = r.color("background", r.ctx.theme.background);
        w.style.has_background = true;
    }
    std::string align = to_lower(r.string("align", "left"));
    if (align == "left") w.style.align = Align::Left;
    else if (align == "center" || align == "centre") w.style.align = Align::Center;
    else if (align == "right") w.style.align = Align::Right;
    else fail(r.index, r.id, "align must be left, center or right");

    w.style.font_size = static_cast<float>(r.number("font_size", r.ctx.default_font_size));
    if (w.style.font_size < 4.0f || w.style.font_size > 512.0f) {
        fail(r.index, r.id, "font_size out of range");
    }

    std::string font_path = r.path(r.string("font", r.ctx.default_font));
    if (!needs_font) return;
    if (font_path.empty()) fail(r.index, r.id, "no font configured");
    if (!r.ctx.fonts) fail(r.index, r.id, "no font cache available");
    w.style.font = r.ctx.fonts->Get(font_path);
    if (!w.style.font) fail(r.index, r.id, "font '" + font_path + "' cannot be loaded");
}

TextWidget read_text(const WidgetReader& r) {
    TextWidget t;
    t.field = r.string("field", "");
    t.format = r.string("format", t.field.empty() ? "" : "{value}");
    if (r.node.contains("precision")) t.precision = r.integer("precision", -1, 0, 9);
    if (!t.field.empty()) r.field(t.field);
    for (const auto& name : TemplateFields(t.format)) {
        if (name == "value") {
            if (t.field.empty()) fail(r.index, r.id, "{value} used without 'field'");
            continue;
        }
        r.field(name);
    }
    return t;
}

GaugeWidget read_gauge(const WidgetReader& r) {
    GaugeWidget g;
    g.field = r.string("field", "");
    r.field(g.field);
    g.min = r.number("min", 0.0);
    g.max = r.number("max", 100.0);
    if (!(g.min < g.max)) fail(r.index, r.id, "gauge min must be below max");
    std::string shape = to_lower(r.string("shape", "bar"));
    if (shape == "bar") g.shape = GaugeShape::Bar;
    else if (shape == "arc" || shape == "ring") g.shape = GaugeShape::Arc;
    else fail(r.index, r.id, "shape must be bar or arc");
    g.thickness = r.integer("thickness", 8, 1, 4096);
    g.show_value = r.boolean("show_value", false);
    g.track = r.color("track", r.ctx.theme.bar_bg);
    g.border = r.color("border", r.ctx.theme.bar_border);
    return g;
}

GraphWidget read_graph(const WidgetReader& r) {
    GraphWidget g;
    if (r.node.contains("fields")) {
        const json& f = r.node.at("fields");
        if (!f.is_array() || f.empty()) fail(r.index, r.id, "'fields' must be a non-empty array");
        for (const auto& name : f) {
            if (!name.is_string()) fail(r.index, r.id, "'fields' entries must be strings");
            g.fields.push_back(name.get<std::string>());
        }
    } else {
        g.fields.push_back(r.string("field", ""));
    }
    for (const auto& name : g.fields) r.field(name);

    g.depth = static_cast<size_t>(r.integer("depth", 60, 2, 100000));
    g.auto_scale = r.boolean("auto_scale", false);
    g.min = r.number("min", 0.0);
    g.max = r.number("max", 100.0);
    if (!g.auto_scale && !(g.min < g.max)) fail(r.index, r.id, "graph min must be below max");
    g.line_width = r.integer("line_width", 1, 1, 8);
    g.border = r.color("border", r.ctx.theme.muted);

    const color_t palette[] = {r.ctx.theme.io, r.ctx.theme.sensor, r.ctx.theme.cpu, r.ctx.theme.mem};
    if (r.node.contains("colors")) {
        const json& c = r.node.at("colors");
        if (!c.is_array()) fail(r.index, r.id, "'colors' must be an array");
        for (const auto& v : c) {
            color_t col;
            if (!ParseColor(v, r.ctx.theme, col)) fail(r.index, r.id, "invalid colour in 'colors'");
            g.colors.push_back(col);
        }
    } else if (r.node.contains("color")) {
        g.colors.push_back(r.color("color", r.ctx.theme.io));
    }
    for (size_t i = g.colors.size(); i < g.fields.size(); ++i) {
        g.colors.push_back(palette[i % 4]);
    }
    return g;
}

ImageWidget read_image(const WidgetReader& r, const Rect& rect) {
    ImageWidget img;
    std::string policy = r.string("resample", "nearest");
    if (!ParseResamplePolicy(policy, img.resample)) fail(r.index, r.id, "resample must be nearest or area");

    std::vector<std::string> paths;
    if (r.node.contains("frames")) {
        const json& f = r.node.at("frames");
        if (!f.is_array() || f.empty()) fail(r.index, r.id, "'frames' must be a non-empty array");
        for (const auto& p : f) {
            if (!p.is_string()) fail(r.index, r.id, "'frames' entries must be strings");
            paths.push_back(r.path(p.get<std::string>()));
        }
        img.frame_ms = r.integer("frame_ms", 500, 1, 3600 * 1000);
    } else {
        std::string p = r.string("path", "");
        if (p.empty()) fail(r.index, r.id, "image needs 'path' or 'frames'");
        paths.push_back(r.path(p));
    }
    img.path = paths.front();

    for (const auto& p : paths) {
        Bitmap decoded;
        std::string error;
        if (!LoadBitmap(p, decoded, error)) fail(r.index, r.id, "cannot load image '" + p + "': " + error);
        auto resized = std::make_shared<Bitmap>(ResizeBitmap(decoded, rect.w, rect.h, img.resample));
        img.frames.push_back(resized);
    }
    return img;
}

ClockWidget read_clock(const WidgetReader& r) {
    ClockWidget c;
    c.format = r.string("format", c.format);
    if (c.format.empty()) fail(r.index, r.id, "clock format is empty");
    c.utc = r.boolean("utc", false);
    return c;
}

int parse_hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

}

bool ParseColor(const json& value, const Theme& theme, color_t& out) {
    if (value.is_array()) {
        if (value.size() != 3) return false;
        int rgb[3];
        for (size_t i = 0; i < 3; ++i) {
            const json& c = value[i];
            if (c.is_number_unsigned()) {
                if (c.get<unsigned long long>() > 255) return false;
            } else if (!c.is_number_integer() || c.get<long long>() < 0 || c.get<long long>() > 255) {
                return false;
            }
            rgb[i] = c.get<int>();
        }
        out = RGB(static_cast<uint8_t>(rgb[0]), static_cast<uint8_t>(rgb[1]), static_cast<uint8_t>(rgb[2]));
        return true;
    }
    if (!value.is_string()) return false;
    std::string s = trim(value.get<std::string>());
    if (!s.empty() && s[0] == '#') {
        if (s.size() != 7) return false;
        int bytes[3];
        for (int i = 0; i < 3; ++i) {
            int hi = parse_hex_digit(s[1 + i * 2]);
            int lo = parse_hex_digit(s[2 + i * 2]);
            if (hi < 0 || lo < 0) return false;
            bytes[i] = hi * 16 + lo;
        }
        out = RGB(static_cast<uint8_t>(bytes[0]), static_cast<uint8_t>(bytes[1]), static_cast<uint8_t>(bytes[2]));
        return true;
    }
    return ThemeRole(theme, to_lower(s), out);
}

std::vector<std::string> TemplateFields(const std::string& format) {
    std::vector<std::string> names;
    size_t pos = 0;
    while ((pos = format.find('{', pos)) != std::string::npos) {
        size_t end = format.find('}', pos);
        if (end == std::string::npos) break;
        std::string token = format.substr(pos + 1, end - pos - 1);
        auto colon = token.find(':');
        names.push_back(trim(colon == std::string::npos ? token : token.substr(0, colon)));
        pos = end + 1;
    }
    return names;
}

const char* Widget::TypeName() const {
    switch (body.index()) {
        case 0: return "text";
        case 1: return "gauge";
        case 2: return "graph";
        case 3: return "image";
        case 4: return "clock";
    }
    return "unknown";
}

std::vector<std::string> Widget::Fields() const {
    if (auto* t = std::get_if<TextWidget>(&body)) {
        std::vector<std::string> out;
        if (!t->field.empty()) out.push_back(t->field);
        for (const auto& name : TemplateFields(t->format)) {
            if (name != "value" && std::find(out.begin(), out.end(), name) == out.end()) out.push_back(name);
        }
        return out;
    }
    if (auto* g = std::get_if<GaugeWidget>(&body)) return {g->field};
    if (auto* g = std::get_if<GraphWidget>(&body)) return g->fields;
    return {};
}

LayoutModel LayoutModel::Load(const json& widgets, const LayoutContext& ctx) {
    if (ctx.width <= 0 || ctx.height <= 0) {
        throw ConfigError(ConfigErrorKind::InvalidLayout, "layout size must be positive");
    }
    if (!widgets.is_array()) {
        throw ConfigError(ConfigErrorKind::InvalidLayout, "'widgets' must be an array");
    }

    LayoutModel model;
    model.width_ = ctx.width;
    model.height_ = ctx.height;
    std::set<std::string> ids;

    for (size_t i = 0; i < widgets.size(); ++i) {
        const json& node = widgets[i];
        if (!node.is_object()) fail(i, "", "must be an object");

        std::string type;
        auto t = node.find("type");
        if (t == node.end() || !t->is_string()) fail(i, "", "missing 'type'");
        type = to_lower(t->get<std::string>());

        Widget w;
        auto id = node.find("id");
        if (id != node.end()) {
            if (!id->is_string()) fail(i, "", "'id' must be a string");
            w.id = id->get<std::string>();
        } else {
            w.id = type + std::to_string(i);
        }
        if (!ids.insert(w.id).second) fail(i, w.id, "duplicate id");

        WidgetReader r{node, ctx, i, w.id};
        long long x = r.wide("x", true, 0);
        long long y = r.wide("y", true, 0);
        long long width = r.wide("w", true, 0);
        long long height = r.wide("h", true, 0);
        if (width <= 0 || height <= 0) fail(i, w.id, "width and height must be positive");
        if (x < 0 || y < 0 || x > ctx.width - width || y > ctx.height - height) {
            fail(i, w.id, "rectangle " + std::to_string(x) + "," + std::to_string(y) + " " +
                              std::to_string(width) + "x" + std::to_string(height) + " exceeds " +
                              std::to_string(ctx.width) + "x" + std::to_string(ctx.height));
        }
        w.rect = Rect{static_cast<int>(x), static_cast<int>(y), static_cast<int>(width), static_cast<int>(height)};

        if (type == "text") {
            read_style(r, w, true);
            w.body = read_text(r);
        } else if (type == "gauge") {
            bool show_value = r.boolean("show_value", false);
            read_style(r, w, show_value);
            w.body = read_gauge(r);
        } else if (type == "graph") {
            read_style(r, w, false);
            w.body = read_graph(r);
        } else if (type == "image") {
            read_style(r, w, false);
            w.body = read_image(r, w.rect);
        } else if (type == "clock") {
            read_style(r, w, true);
            w.body = read_clock(r);
        } else {
            fail(i, w.id, "unknown widget type '" + type + "'");
        }
        model.widgets_.push_back(std::move(w));
    }
    LogDebug("layout", "loaded " + std::to_string(model.widgets_.size()) + " widgets");
    return model;
}

std::map<std::string, size_t> LayoutModel::HistoryDepths() const {
    std::map<std::string, size_t> depths;
    for (const auto& w : widgets_) {
        if (auto* g = std::get_if<GraphWidget>(&w.body)) {
            for (const auto& f : g->fields) {
                depths[f] = std::max(depths[f], g->depth);
            }
        }
    }
    return depths;
}

json LayoutModel::DefaultWidgets(int width, int height,
                                 const std::vector<std::string>& sensor_labels,
                                 int gpus, int top_processes, bool syslog) {
    json widgets = json::array();
    const int margin = 4;
    const int header_h = std::max(14, height / 12);
    const float font = static_cast<float>(std::max(10, header_h - 6));
    const int line_h = static_cast<int>(font) + 4;
    const int half = width / 2;
    const int footer_y = syslog ? height * 2 / 3 : height;

    widgets.push_back({{"type", "text"}, {"id", "header"}, {"x", margin}, {"y", 0},
                       {"w", width - 2 * margin - half / 2}, {"h", header_h}, {"color", "header"},
                       {"font_size", font},
                       {"format", "{hostname} | Up {uptime} | Load {load_avg}"}});
    widgets.push_back({{"type", "clock"}, {"id", "clock"}, {"x", width - half / 2 - margin}, {"y", 0},
                       {"w", half / 2}, {"h", header_h}, {"color", "header"}, {"align", "right"},
                       {"font_size", font}});

    int y = header_h + margin;
    const int bar_h = std::max(6, line_h / 2);
    auto resource = [&](const std::string& id, const std::string& format, const std::string& field,
                        const std::string& color) {
        if (y + line_h + bar_h > footer_y) return;
        widgets.push_back({{"type", "text"}, {"id", id + "_label"}, {"x", margin}, {"y", y},
                           {"w", half - 2 * margin}, {"h", line_h}, {"font_size", font}, {"format", format}});
        y += line_h;
        widgets.push_back({{"type", "gauge"}, {"id", id + "_bar"}, {"x", margin}, {"y", y},
                           {"w", half - 2 * margin}, {"h", bar_h}, {"field", field}, {"color", color}});
        y += bar_h + margin;
    };
    resource("cpu", "CPU {cpu_percent:.1} | {cpu_freq_mhz:.0} | x{cpu_count}", "cpu_percent", "cpu");
    resource("mem", "MEM {mem_percent:.1} | {mem_used}/{mem_total}", "mem_percent", "mem");
    resource("disk", "DISK {disk_percent:.1} | {disk_used}/{disk_total}", "disk_percent", "disk");
    for (int i = 0; i < gpus; ++i) {
        std::string p = "gpu" + std::to_string(i) + "_";
        resource("gpu" + std::to_string(i), "GPU{" + p + "temp} {" + p + "load:.1} | {" + p + "mem_used}",
                 p + "load", "gpu");
    }

    const float small = std::max(8.0f, font - 2);
    const int small_h = static_cast<int>(small) + 4;
    auto processes = [&](const std::string& id, const std::string& title) {
        int lines = std::min(top_processes + 1, (footer_y - y) / small_h);
        if (top_processes <= 0 || lines < 2) return;
        widgets.push_back({{"type", "text"}, {"id", id}, {"x", margin}, {"y", y},
                           {"w", half - 2 * margin}, {"h", lines * small_h}, {"font_size", small},
                           {"color", "process"}, {"format", title + "\n{" + id + "}"}});
        y += lines * small_h + margin;
    };
    processes("top_cpu", "TOP CPU");
    processes("top_mem", "TOP MEM");

    int ry = header_h + margin;
    int graph_h = std::max(24, (footer_y - ry) / 3);
    widgets.push_back({{"type", "graph"}, {"id", "net_graph"}, {"x", half + margin}, {"y", ry},
                       {"w", half - 2 * margin}, {"h", graph_h}, {"fields", json::array({"net_rx", "net_tx"})},
                       {"colors", json::array({"io", "sensor"})}, {"depth", 60}, {"auto_scale", true}});
    ry += graph_h + margin;
    auto right_line = [&](const std::string& id, const std::string& format, const std::string& color) {
        if (ry + line_h > footer_y) return;
        widgets.push_back({{"type", "text"}, {"id", id}, {"x", half + margin}, {"y", ry},
                           {"w", half - 2 * margin}, {"h", line_h}, {"font_size", font},
                           {"color", color}, {"format", format}});
        ry += line_h;
    };
    right_line("net", "NET \xE2\x86\x93{net_rx} \xE2\x86\x91{net_tx}", "io");
    right_line("io", "IO R {disk_read} W {disk_write}", "io");
    right_line("temp", "CPU {cpu_temp:.1}", "sensor");
    for (const auto& label : sensor_labels) {
        right_line("temp_" + label, label + " {temp." + label + ":.1}", "sensor");
    }

    if (syslog && height - footer_y > line_h) {
        widgets.push_back({{"type", "text"}, {"id", "syslog"}, {"x", margin}, {"y", footer_y + margin},
                           {"w", width - 2 * margin}, {"h", height - footer_y - margin},
                           {"font_size", small}, {"color", "log"}, {"field", "syslog"}});
    }
    return widgets;
}
