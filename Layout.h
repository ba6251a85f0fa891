#ifndef LAYOUT_H
#define LAYOUT_H

#include "Errors.h"
#include "Font.h"
#include "Frame.h"
#include "Image.h"
#include "Theme.h"
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

enum class Align {
    Left,
    Center,
    Right
};

struct WidgetStyle {
    color_t color = RGB(238, 238, 236);
    color_t background = 0;
    bool has_background = false;
    std::shared_ptr<Font> font;
    float font_size = 20.0f;
    Align align = Align::Left;
};

// `format` may reference any field as {name} or {name:.N}; {value} is `field`.
struct TextWidget {
    std::string field;
    std::string format = "{value}";
    int precision = -1;
};

enum class GaugeShape {
    Bar,
    Arc
};

struct GaugeWidget {
    std::string field;
    double min = 0.0;
    double max = 100.0;
    GaugeShape shape = GaugeShape::Bar;
    int thickness = 8;
    bool show_value = false;
    color_t track = RGB(30, 30, 30);
    color_t border = RGB(255, 255, 255);
};

struct GraphWidget {
    std::vector<std::string> fields;
    std::vector<color_t> colors;
    size_t depth = 60;
    bool auto_scale = false;
    double min = 0.0;
    double max = 100.0;
    int line_width = 1;
    color_t border = RGB(90, 90, 90);
};

struct ImageWidget {
    std::string path;
    // Pre-decoded and already resized to the widget rectangle.
    std::vector<std::shared_ptr<const Bitmap>> frames;
    int frame_ms = 0;
    ResamplePolicy resample = ResamplePolicy::Nearest;
};

struct ClockWidget {
    std::string format = "%H:%M:%S";
    bool utc = false;
};

using WidgetBody = std::variant<TextWidget, GaugeWidget, GraphWidget, ImageWidget, ClockWidget>;

struct Widget {
    std::string id;
    Rect rect;
    WidgetStyle style;
    WidgetBody body;

    const char* TypeName() const;
    // Metric fields this widget reads.
    std::vector<std::string> Fields() const;
};

struct LayoutContext {
    int width = 320;
    int height = 240;
    std::vector<std::string> known_fields;
    Theme theme = THEMES.at("default");
    std::string default_font;
    float default_font_size = 20.0f;
    std::string base_dir;
    FontCache* fonts = nullptr;
};

// Ordered, validated widget tree. Immutable after Load.
class LayoutModel {
public:
    // Throws ConfigError(InvalidLayout) on the first problem found.
    static LayoutModel Load(const nlohmann::json& widgets, const LayoutContext& ctx);

    // Two-column dashboard: header, resource bars and top processes on the left, traffic
    // graph and sensors on the right, log tail below.
    static nlohmann::json DefaultWidgets(int width, int height,
                                         const std::vector<std::string>& sensor_labels,
                                         int gpus, int top_processes, bool syslog);

    int Width() const { return width_; }
    int Height() const { return height_; }
    const std::vector<Widget>& Widgets() const { return widgets_; }

    // Largest graph depth requested per field.
    std::map<std::string, size_t> HistoryDepths() const;

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<Widget> widgets_;
};

// "#RRGGBB", [r, g, b] or a theme role name.
bool ParseColor(const nlohmann::json& value, const Theme& theme, color_t& out);

// Field names referenced by a text template, in order of appearance.
std::vector<std::string> TemplateFields(const std::string& format);

#endif // LAYOUT_H
