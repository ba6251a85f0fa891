#include "Image.h"
#include "Log.h"
#include "utils.h"
#include <algorithm>
#include <cmath>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

bool ParseResamplePolicy(const std::string& name, ResamplePolicy& out) {
    std::string n = to_lower(trim(name));
    if (n == "nearest") {
        out = ResamplePolicy::Nearest;
        return true;
    }
    if (n == "area" || n == "area_average" || n == "average") {
        out = ResamplePolicy::AreaAverage;
        return true;
    }
    return false;
}

bool LoadBitmap(const std::string& path, Bitmap& out, std::string& error) {
    int w = 0, h = 0, comp = 0;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &comp, 4);
    if (!data) {
        const char* reason = stbi_failure_reason();
        error = reason ? reason : "decode failed";
        return false;
    }
    out.width = w;
    out.height = h;
    out.rgba.assign(data, data + static_cast<size_t>(w) * h * 4);
    stbi_image_free(data);
    return true;
}

static Bitmap resize_nearest(const Bitmap& src, int width, int height) {
    Bitmap out;
    out.width = width;
    out.height = height;
    out.rgba.resize(static_cast<size_t>(width) * height * 4);
    for (int y = 0; y < height; ++y) {
        int sy = std::min(src.height - 1, static_cast<int>(static_cast<long long>(y) * src.height / height));
        for (int x = 0; x < width; ++x) {
            int sx = std::min(src.width - 1, static_cast<int>(static_cast<long long>(x) * src.width / width));
            const unsigned char* s = &src.rgba[(static_cast<size_t>(sy) * src.width + sx) * 4];
            unsigned char* d = &out.rgba[(static_cast<size_t>(y) * width + x) * 4];
            d[0] = s[0];
            d[1] = s[1];
            d[2] = s[2];
            d[3] = s[3];
        }
    }
    return out;
}

// Box filter: each destination pixel averages the source area it covers.
static Bitmap resize_area(const Bitmap& src, int width, int height) {
    Bitmap out;
    out.width = width;
    out.height = height;
    out.rgba.resize(static_cast<size_t>(width) * height * 4);
    double sx_scale = static_cast<double>(src.width) / width;
    double sy_scale = static_cast<double>(src.height) / height;
    for (int y = 0; y < height; ++y) {
        int y0 = static_cast<int>(std::floor(y * sy_scale));
        int y1 = std::max(y0 + 1, std::min(src.height, static_cast<int>(std::ceil((y + 1) * sy_scale))));
        for (int x = 0; x < width; ++x) {
            int x0 = static_cast<int>(std::floor(x * sx_scale));
            int x1 = std::max(x0 + 1, std::min(src.width, static_cast<int>(std::ceil((x + 1) * sx_scale))));
            unsigned long acc[4] = {0, 0, 0, 0};
            unsigned long count = 0;
            for (int yy = y0; yy < y1 && yy < src.height; ++yy) {
                for (int xx = x0; xx < x1 && xx < src.width; ++xx) {
                    const unsigned char* s = &src.rgba[(static_cast<size_t>(yy) * src.width + xx) * 4];
                    acc[0] += s[0];
                    acc[1] += s[1];
                    acc[2] += s[2];
                    acc[3] += s[3];
                    ++count;
                }
            }
            unsigned char* d = &out.rgba[(static_cast<size_t>(y) * width + x) * 4];
            for (int c = 0; c < 4; ++c) {
                d[c] = static_cast<unsigned char>(count ? acc[c] / count : 0);
            }
        }
    }
    return out;
}

Bitmap ResizeBitmap(const Bitmap& src, int width, int height, ResamplePolicy policy) {
    if (src.Empty() || width <= 0 || height <= 0) return Bitmap{};
    if (src.width == width && src.height == height) return src;
    if (policy == ResamplePolicy::AreaAverage) return resize_area(src, width, height);
    return resize_nearest(src, width, height);
}

bool SaveFramePng(const Frame& frame, const std::string& path) {
    if (frame.Width() <= 0 || frame.Height() <= 0) return false;
    std::vector<unsigned char> rgb(static_cast<size_t>(frame.Width()) * frame.Height() * 3);
    const auto& px = frame.Pixels();
    for (size_t i = 0; i < px.size(); ++i) {
        uint8_t r5 = (px[i] >> 11) & 0x1F;
        uint8_t g6 = (px[i] >> 5) & 0x3F;
        uint8_t b5 = px[i] & 0x1F;
        rgb[i * 3 + 0] = static_cast<unsigned char>((r5 << 3) | (r5 >> 2));
        rgb[i * 3 + 1] = static_cast<unsigned char>((g6 << 2) | (g6 >> 4));
        rgb[i * 3 + 2] = static_cast<unsigned char>((b5 << 3) | (b5 >> 2));
    }
    if (!stbi_write_png(path.c_str(), frame.Width(), frame.Height(), 3, rgb.data(), frame.Width() * 3)) {
        LogWarn("dashboard", "Failed to save dashboard to " + path);
        return false;
    }
    return true;
}
