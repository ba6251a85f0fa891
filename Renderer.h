#ifndef RENDERER_H
#define RENDERER_H

#include "Canvas.h"
#include "Frame.h"
#include "Layout.h"
#include "Metrics.h"
#include "Theme.h"
#include <chrono>
#include <string>
#include <utility>
#include <vector>

struct RenderOptions {
    color_t background = 0;
    std::string placeholder = "--";
    color_t placeholder_color = RGB(90, 90, 90);
    bool rotate180 = false;
};

struct RenderReport {
    // Ids of widgets drawn without data.
    std::vector<std::string> placeholders;
};

// Pure function of (layout, snapshot, time): no state survives between frames.
class Renderer {
public:
    explicit Renderer(const RenderOptions& options = RenderOptions());

    Frame Render(const LayoutModel& layout,
                 const MetricSnapshot& snapshot,
                 std::chrono::system_clock::time_point now,
                 RenderReport* report = nullptr) const;

    const RenderOptions& Options() const { return options_; }

    // "50%", "3.2 GiB/s", "45.5 °C", or the text of a label sample.
    static std::string FormatSample(const MetricSample& sample, int precision = -1);

    // Substitutes template fields; `complete` is false when any was missing.
    std::string ResolveText(const TextWidget& text, const MetricSnapshot& snapshot, bool& complete) const;

    static double GaugeFraction(double value, double min, double max);

    // Polyline for the newest `depth` values, oldest at the left, newest at the right edge.
    static std::vector<std::pair<int, int>> GraphPoints(const Rect& area,
                                                        const std::vector<double>& values,
                                                        size_t depth,
                                                        double min_val, double max_val);

    static std::string FormatClock(const ClockWidget& clock, std::chrono::system_clock::time_point now);

private:
    friend struct WidgetPainter;

    void drawLines(Canvas& canvas, const Widget& widget, const std::string& text, color_t color) const;
    bool drawText(Canvas& canvas, const Widget& widget, const TextWidget& text, const MetricSnapshot& snapshot) const;
    bool drawGauge(Canvas& canvas, const Widget& widget, const GaugeWidget& gauge, const MetricSnapshot& snapshot) const;
    bool drawGraph(Canvas& canvas, const Widget& widget, const GraphWidget& graph, const MetricSnapshot& snapshot) const;
    bool drawImage(Canvas& canvas, const Widget& widget, const ImageWidget& image,
                   std::chrono::system_clock::time_point now) const;
    bool drawClock(Canvas& canvas, const Widget& widget, const ClockWidget& clock,
                   std::chrono::system_clock::time_point now) const;

    RenderOptions options_;
};

#endif // RENDERER_H
