#include "Frame.h"
#include <algorithm>

Rect Intersect(const Rect& a, const Rect& b) {
    int x0 = std::max(a.x, b.x);
    int y0 = std::max(a.y, b.y);
    int x1 = std::min(a.x + a.w, b.x + b.w);
    int y1 = std::min(a.y + a.h, b.y + b.h);
    if (x1 <= x0 || y1 <= y0) return Rect{x0, y0, 0, 0};
    return Rect{x0, y0, x1 - x0, y1 - y0};
}

Frame::Frame() : width_(0), height_(0) {}

Frame::Frame(int width, int height, color_t fill)
    : width_(std::max(0, width)), height_(std::max(0, height)),
      pixels_(static_cast<size_t>(std::max(0, width)) * std::max(0, height), fill) {}

Frame Frame::Rotated180() const {
    Frame out(width_, height_);
    std::reverse_copy(pixels_.begin(), pixels_.end(), out.pixels_.begin());
    return out;
}

bool Frame::operator==(const Frame& other) const {
    return width_ == other.width_ && height_ == other.height_ && pixels_ == other.pixels_;
}

Frame FitToSize(const Frame& src, int width, int height, color_t background) {
    Frame out(width, height, background);
    if (src.Width() <= 0 || src.Height() <= 0 || width <= 0 || height <= 0) return out;
    if (src.Width() == width && src.Height() == height) return src;

    double ratio = std::min(static_cast<double>(width) / src.Width(),
                            static_cast<double>(height) / src.Height());
    int new_w = std::max(1, static_cast<int>(src.Width() * ratio));
    int new_h = std::max(1, static_cast<int>(src.Height() * ratio));
    int off_x = (width - new_w) / 2;
    int off_y = (height - new_h) / 2;

    for (int y = 0; y < new_h; ++y) {
        int sy = std::min(src.Height() - 1, static_cast<int>(y / ratio));
        for (int x = 0; x < new_w; ++x) {
            int sx = std::min(src.Width() - 1, static_cast<int>(x / ratio));
            out.Set(off_x + x, off_y + y, src.At(sx, sy));
        }
    }
    return out;
}
