#include "Renderer.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ctime>

struct WidgetPainter {
    const Renderer& renderer;
    Canvas& canvas;
    const Widget& widget;
    const MetricSnapshot& snapshot;
    std::chrono::system_clock::time_point now;

    bool operator()(const TextWidget& w) const { return renderer.drawText(canvas, widget, w, snapshot); }
    bool operator()(const GaugeWidget& w) const { return renderer.drawGauge(canvas, widget, w, snapshot); }
    bool operator()(const GraphWidget& w) const { return renderer.drawGraph(canvas, widget, w, snapshot); }
    bool operator()(const ImageWidget& w) const { return renderer.drawImage(canvas, widget, w, now); }
    bool operator()(const ClockWidget& w) const { return renderer.drawClock(canvas, widget, w, now); }
};

Renderer::Renderer(const RenderOptions& options) : options_(options) {}

Frame Renderer::Render(const LayoutModel& layout,
                       const MetricSnapshot& snapshot,
                       std::chrono::system_clock::time_point now,
                       RenderReport* report) const {
    Frame frame(layout.Width(), layout.Height(), options_.background);
    Canvas canvas(frame);

    for (const auto& widget : layout.Widgets()) {
        canvas.SetClip(widget.rect);
        if (widget.style.has_background) {
            canvas.FillRect(widget.rect.x, widget.rect.y, widget.rect.w, widget.rect.h, widget.style.background);
        }
        bool has_data = std::visit(WidgetPainter{*this, canvas, widget, snapshot, now}, widget.body);
        if (!has_data && report) {
            report->placeholders.push_back(widget.id);
        }
    }
    canvas.ResetClip();

    if (options_.rotate180) {
        return frame.Rotated180();
    }
    return frame;
}

// --- Formatting ---

std::string Renderer::FormatSample(const MetricSample& sample, int precision) {
    char buf[64];
    switch (sample.kind) {
        case SampleKind::Text:
            return sample.text;
        case SampleKind::Percentage:
            std::snprintf(buf, sizeof(buf), "%.*f%%", precision < 0 ? 0 : precision, sample.value);
            return buf;
        case SampleKind::Bytes:
            return format_bytes(sample.value) + sample.unit;
        case SampleKind::Number: {
            int p = precision;
            if (p < 0) p = (std::floor(sample.value) == sample.value) ? 0 : 1;
            std::snprintf(buf, sizeof(buf), "%.*f", p, sample.value);
            std::string out = buf;
            if (!sample.unit.empty()) out += " " + sample.unit;
            return out;
        }
    }
    return "";
}

std::string Renderer::ResolveText(const TextWidget& text, const MetricSnapshot& snapshot, bool& complete) const {
    complete = true;
    const std::string& fmt = text.format;
    std::string out;
    size_t pos = 0;
    while (pos < fmt.size()) {
        size_t open = fmt.find('{', pos);
        size_t close = (open == std::string::npos) ? std::string::npos : fmt.find('}', open);
        if (open == std::string::npos || close == std::string::npos) {
            out += fmt.substr(pos);
            break;
        }
        out += fmt.substr(pos, open - pos);
        std::string token = fmt.substr(open + 1, close - open - 1);
        std::string name = token;
        int precision = -1;
        auto colon = token.find(':');
        if (colon != std::string::npos) {
            name = token.substr(0, colon);
            std::string modifier = token.substr(colon + 1);
            if (!modifier.empty() && modifier[0] == '.') modifier = modifier.substr(1);
            precision = std::clamp(std::atoi(modifier.c_str()), 0, 9);
        }
        name = trim(name);
        if (name == "value") {
            name = text.field;
            if (precision < 0) precision = text.precision;
        }
        const MetricSample* sample = snapshot.Find(name);
        if (sample) {
            out += FormatSample(*sample, precision);
        } else {
            out += options_.placeholder;
            complete = false;
        }
        pos = close + 1;
    }
    return out;
}

double Renderer::GaugeFraction(double value, double min, double max) {
    if (!(max > min) || std::isnan(value)) return 0.0;
    return std::clamp((value - min) / (max - min), 0.0, 1.0);
}

std::vector<std::pair<int, int>> Renderer::GraphPoints(const Rect& area,
                                                       const std::vector<double>& values,
                                                       size_t depth,
                                                       double min_val, double max_val) {
    std::vector<std::pair<int, int>> points;
    if (values.empty() || area.Empty()) return points;
    depth = std::max<size_t>(2, depth);
    size_t n = std::min(values.size(), depth);
    size_t first = values.size() - n;
    double range = std::max(1e-9, max_val - min_val);
    const int inner_w = std::max(0, area.w - 1);
    const int inner_h = std::max(0, area.h - 1);
    points.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        double v = std::clamp((values[first + i] - min_val) / range, 0.0, 1.0);
        size_t slot = depth - n + i;
        int px = area.x + static_cast<int>(std::lround(static_cast<double>(slot) * inner_w / (depth - 1)));
        int py = area.y + inner_h - static_cast<int>(std::lround(v * inner_h));
        points.emplace_back(px, py);
    }
    return points;
}

std::string Renderer::FormatClock(const ClockWidget& clock, std::chrono::system_clock::time_point now) {
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    if (clock.utc) {
        gmtime_r(&t, &tm_buf);
    } else {
        localtime_r(&t, &tm_buf);
    }
    char buf[128];
    size_t n = std::strftime(buf, sizeof(buf), clock.format.c_str(), &tm_buf);
    return std::string(buf, n);
}

// --- Widgets ---

void Renderer::drawLines(Canvas& canvas, const Widget& widget, const std::string& text, color_t color) const {
    const Font* font = widget.style.font.get();
    if (!font) return;
    float size = widget.style.font_size;
    std::vector<std::string> lines = split(text, '\n');
    int line_h = font->LineHeight(size);
    int total_h = line_h * static_cast<int>(lines.size());
    const Rect& r = widget.rect;
    int y = (lines.size() == 1) ? r.y + (r.h - total_h) / 2 : r.y;
    for (const auto& line : lines) {
        // multi-line text stops at the bottom of its rectangle
        if (lines.size() > 1 && y + line_h > r.y + r.h) break;
        int x = r.x;
        if (widget.style.align != Align::Left) {
            int tw = font->MeasureText(line, size);
            x = (widget.style.align == Align::Center) ? r.x + (r.w - tw) / 2 : r.x + r.w - tw;
        }
        font->DrawText(canvas, line, x, y, color, size);
        y += line_h;
    }
}

bool Renderer::drawText(Canvas& canvas, const Widget& widget, const TextWidget& text,
                        const MetricSnapshot& snapshot) const {
    if (!text.field.empty() && !snapshot.Find(text.field)) {
        drawLines(canvas, widget, options_.placeholder, options_.placeholder_color);
        return false;
    }
    bool complete = true;
    std::string resolved = ResolveText(text, snapshot, complete);
    drawLines(canvas, widget, resolved, widget.style.color);
    return complete;
}

bool Renderer::drawGauge(Canvas& canvas, const Widget& widget, const GaugeWidget& gauge,
                         const MetricSnapshot& snapshot) const {
    const MetricSample* sample = snapshot.Find(gauge.field);
    bool has_data = sample && sample->IsNumeric();
    double frac = has_data ? GaugeFraction(sample->value, gauge.min, gauge.max) : 0.0;
    const Rect& r = widget.rect;

    if (gauge.shape == GaugeShape::Bar) {
        canvas.DrawProgressBar(r.x, r.y, r.w, r.h, frac, widget.style.color, gauge.track,
                               has_data ? gauge.border : options_.placeholder_color);
    } else {
        int radius = std::max(2, std::min(r.w, r.h) / 2 - 1);
        canvas.DrawRingGauge(r.x + r.w / 2, r.y + r.h / 2, radius, gauge.thickness, frac,
                             widget.style.color, has_data ? gauge.track : options_.placeholder_color, 48);
    }

    if (gauge.show_value) {
        std::string label = has_data ? FormatSample(*sample) : options_.placeholder;
        Widget centred = widget;
        centred.style.align = Align::Center;
        drawLines(canvas, centred, label, has_data ? widget.style.color : options_.placeholder_color);
    }
    return has_data;
}

bool Renderer::drawGraph(Canvas& canvas, const Widget& widget, const GraphWidget& graph,
                         const MetricSnapshot& snapshot) const {
    const Rect& r = widget.rect;
    std::vector<std::vector<double>> series;
    series.reserve(graph.fields.size());
    bool any = false;
    for (const auto& field : graph.fields) {
        // History of a field that stopped reporting is stale, not live.
        const MetricHistory* history = snapshot.Find(field) ? snapshot.History(field) : nullptr;
        std::vector<double> values;
        if (history && !history->Empty()) {
            values = history->Values();
            if (values.size() > graph.depth) {
                values.erase(values.begin(), values.end() - static_cast<std::ptrdiff_t>(graph.depth));
            }
            any = true;
        }
        series.push_back(std::move(values));
    }

    canvas.DrawRect(r.x, r.y, r.w, r.h, any ? graph.border : options_.placeholder_color);
    if (!any) return false;

    double min_val = graph.min;
    double max_val = graph.max;
    if (graph.auto_scale) {
        min_val = 0.0;
        max_val = 0.0;
        for (const auto& s : series) {
            for (double v : s) {
                min_val = std::min(min_val, v);
                max_val = std::max(max_val, v);
            }
        }
        if (max_val <= min_val) max_val = min_val + 1.0;
    }

    Rect area{r.x + 1, r.y + 1, r.w - 2, r.h - 2};
    for (size_t i = 0; i < series.size(); ++i) {
        if (series[i].empty()) continue;
        color_t color = graph.colors.empty() ? widget.style.color : graph.colors[i % graph.colors.size()];
        canvas.DrawPolyline(GraphPoints(area, series[i], graph.depth, min_val, max_val), color, graph.line_width);
    }
    return true;
}

bool Renderer::drawImage(Canvas& canvas, const Widget& widget, const ImageWidget& image,
                         std::chrono::system_clock::time_point now) const {
    if (image.frames.empty()) return false;
    size_t index = 0;
    if (image.frames.size() > 1 && image.frame_ms > 0) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
        index = static_cast<size_t>((ms / image.frame_ms) % static_cast<long long>(image.frames.size()));
    }
    canvas.DrawBitmap(*image.frames[index], widget.rect.x, widget.rect.y);
    return true;
}

bool Renderer::drawClock(Canvas& canvas, const Widget& widget, const ClockWidget& clock,
                         std::chrono::system_clock::time_point now) const {
    std::string text = FormatClock(clock, now);
    if (text.empty()) {
        drawLines(canvas, widget, options_.placeholder, options_.placeholder_color);
        return false;
    }
    drawLines(canvas, widget, text, widget.style.color);
    return true;
}
