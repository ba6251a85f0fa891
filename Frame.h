#ifndef FRAME_H
#define FRAME_H

#include "Theme.h"
#include <cstdint>
#include <vector>

enum class PixelFormat {
    RGB565
};

struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    bool Empty() const { return w <= 0 || h <= 0; }
    bool Contains(int px, int py) const { return px >= x && px < x + w && py >= y && py < y + h; }
    bool operator==(const Rect& o) const { return x == o.x && y == o.y && w == o.w && h == o.h; }
};

Rect Intersect(const Rect& a, const Rect& b);

// Fixed-size RGB565 image, row-major, no padding.
class Frame {
public:
    Frame();
    Frame(int width, int height, color_t fill = 0);

    int Width() const { return width_; }
    int Height() const { return height_; }
    PixelFormat Format() const { return PixelFormat::RGB565; }
    Rect Bounds() const { return Rect{0, 0, width_, height_}; }

    std::vector<color_t>& Pixels() { return pixels_; }
    const std::vector<color_t>& Pixels() const { return pixels_; }

    const color_t* Row(int y) const { return pixels_.data() + static_cast<size_t>(y) * width_; }
    color_t At(int x, int y) const { return pixels_[static_cast<size_t>(y) * width_ + x]; }
    void Set(int x, int y, color_t c) { pixels_[static_cast<size_t>(y) * width_ + x] = c; }

    Frame Rotated180() const;
    bool SameSize(const Frame& other) const { return width_ == other.width_ && height_ == other.height_; }
    bool operator==(const Frame& other) const;
    bool operator!=(const Frame& other) const { return !(*this == other); }

private:
    int width_;
    int height_;
    std::vector<color_t> pixels_;
};

// Nearest-neighbour scale preserving aspect ratio, centred on `background`.
Frame FitToSize(const Frame& src, int width, int height, color_t background);

#endif // FRAME_H
