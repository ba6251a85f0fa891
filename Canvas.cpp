#include "Canvas.h"
#include <algorithm>
#include <cmath>

Canvas::Canvas(Frame& target) : target_(target), clip_(target.Bounds()) {}

void Canvas::SetClip(const Rect& clip) {
    clip_ = Intersect(clip, target_.Bounds());
}

void Canvas::ResetClip() {
    clip_ = target_.Bounds();
}

void Canvas::Plot(int x, int y, color_t color) {
    if (!clip_.Contains(x, y)) return;
    target_.Set(x, y, color);
}

void Canvas::BlendPixel(int x, int y, color_t color, uint8_t alpha) {
    if (alpha == 0 || !clip_.Contains(x, y)) return;
    if (alpha == 255) {
        target_.Set(x, y, color);
        return;
    }
    target_.Set(x, y, interpolate_color(target_.At(x, y), color, alpha / 255.0f));
}

void Canvas::FillRect(int x, int y, int w, int h, color_t color) {
    Rect r = Intersect(Rect{x, y, w, h}, clip_);
    if (r.Empty()) return;
    for (int j = r.y; j < r.y + r.h; ++j) {
        auto row = target_.Pixels().begin() + static_cast<size_t>(j) * target_.Width();
        std::fill(row + r.x, row + r.x + r.w, color);
    }
}

void Canvas::DrawRect(int x, int y, int w, int h, color_t color) {
    if (w <= 0 || h <= 0) return;
    DrawHLine(x, y, w, color);
    DrawHLine(x, y + h - 1, w, color);
    DrawVLine(x, y, h, color);
    DrawVLine(x + w - 1, y, h, color);
}

void Canvas::DrawHLine(int x, int y, int w, color_t color) {
    FillRect(x, y, w, 1, color);
}

void Canvas::DrawVLine(int x, int y, int h, color_t color) {
    FillRect(x, y, 1, h, color);
}

void Canvas::DrawLine(int x0, int y0, int x1, int y1, color_t color) {
    int dx = std::abs(x1 - x0), sx = x0 < x1 ? 1 : -1;
    int dy = -std::abs(y1 - y0), sy = y0 < y1 ? 1 : -1;
    int err = dx + dy, e2;
    for (;;) {
        Plot(x0, y0, color);
        if (x0 == x1 && y0 == y1) break;
        e2 = 2 * err;
        if (e2 >= dy) { err += dy; x0 += sx; }
        if (e2 <= dx) { err += dx; y0 += sy; }
    }
}

void Canvas::FillCircle(int cx, int cy, int r, color_t color) {
    if (r <= 0) return;
    for (int y = -r; y <= r; ++y) {
        int dx = static_cast<int>(std::sqrt(std::max(0, r * r - y * y)));
        FillRect(cx - dx, cy + y, 2 * dx + 1, 1, color);
    }
}

void Canvas::DrawProgressBar(int x, int y, int w, int h, double frac,
                             color_t color, color_t bg, color_t border) {
    if (w <= 0 || h <= 0) return;
    FillRect(x, y, w, h, bg);
    int fill_w = static_cast<int>(w * std::clamp(frac, 0.0, 1.0));
    if (fill_w > 0) {
        FillRect(x, y, fill_w, h, color);
    }
    DrawRect(x, y, w, h, border);
}

void Canvas::DrawRingGauge(int cx, int cy, int r, int thickness, double frac,
                           color_t active, color_t inactive, int segments) {
    int segs = std::max(12, segments);
    constexpr double kPi = 3.141592653589793;
    double f = std::clamp(frac, 0.0, 1.0);
    int lit = static_cast<int>(std::round(f * segs));
    int inner = std::max(1, r - thickness);
    for (int i = 0; i < segs; ++i) {
        double a = (2.0 * kPi * i / segs) - kPi / 2.0;
        int x0 = cx + static_cast<int>(std::cos(a) * inner);
        int y0 = cy + static_cast<int>(std::sin(a) * inner);
        int x1 = cx + static_cast<int>(std::cos(a) * r);
        int y1 = cy + static_cast<int>(std::sin(a) * r);
        color_t col = (i < lit) ? active : inactive;
        DrawLine(x0, y0, x1, y1, col);
        if (thickness > 6) {
            int x2 = cx + static_cast<int>(std::cos(a) * (inner + 2));
            int y2 = cy + static_cast<int>(std::sin(a) * (inner + 2));
            DrawLine(x2, y2, x1, y1, col);
        }
    }
}

void Canvas::DrawPolyline(const std::vector<std::pair<int, int>>& points, color_t color, int width) {
    if (points.empty()) return;
    if (points.size() == 1) {
        FillCircle(points[0].first, points[0].second, std::max(1, width), color);
        return;
    }
    for (size_t i = 1; i < points.size(); ++i) {
        int x0 = points[i - 1].first;
        int y0 = points[i - 1].second;
        int x1 = points[i].first;
        int y1 = points[i].second;
        DrawLine(x0, y0, x1, y1, color);
        for (int k = 1; k < width; ++k) {
            DrawLine(x0, y0 - k, x1, y1 - k, color);
        }
    }
}

void Canvas::DrawBitmap(const Bitmap& bitmap, int x, int y) {
    if (bitmap.Empty()) return;
    for (int j = 0; j < bitmap.height; ++j) {
        int py = y + j;
        if (py < clip_.y || py >= clip_.y + clip_.h) continue;
        for (int i = 0; i < bitmap.width; ++i) {
            const unsigned char* s = &bitmap.rgba[(static_cast<size_t>(j) * bitmap.width + i) * 4];
            BlendPixel(x + i, py, RGB(s[0], s[1], s[2]), s[3]);
        }
    }
}
