#ifndef CANVAS_H
#define CANVAS_H

#include "Frame.h"
#include "Image.h"
#include "Theme.h"
#include <cstdint>
#include <utility>
#include <vector>

// Clipped drawing primitives over a Frame.
class Canvas {
public:
    explicit Canvas(Frame& target);

    int Width() const { return target_.Width(); }
    int Height() const { return target_.Height(); }

    void SetClip(const Rect& clip);
    void ResetClip();

    void Plot(int x, int y, color_t color);
    void BlendPixel(int x, int y, color_t color, uint8_t alpha);

    void FillRect(int x, int y, int w, int h, color_t color);
    void DrawRect(int x, int y, int w, int h, color_t color);
    void DrawLine(int x0, int y0, int x1, int y1, color_t color);
    void DrawHLine(int x, int y, int w, color_t color);
    void DrawVLine(int x, int y, int h, color_t color);
    void FillCircle(int cx, int cy, int r, color_t color);

    void DrawProgressBar(int x, int y, int w, int h, double frac,
                         color_t color, color_t bg, color_t border);
    void DrawRingGauge(int cx, int cy, int r, int thickness, double frac,
                       color_t active, color_t inactive, int segments);
    void DrawPolyline(const std::vector<std::pair<int, int>>& points, color_t color, int width);

    // Alpha-blended copy of an RGBA bitmap with its top-left corner at (x, y).
    void DrawBitmap(const Bitmap& bitmap, int x, int y);

private:
    Frame& target_;
    Rect clip_;
};

#endif // CANVAS_H
