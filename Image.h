#ifndef IMAGE_H
#define IMAGE_H

#include "Frame.h"
#include <string>
#include <vector>

// Decoded RGBA8888 image.
struct Bitmap {
    int width = 0;
    int height = 0;
    std::vector<unsigned char> rgba;

    bool Empty() const { return width <= 0 || height <= 0 || rgba.empty(); }
};

enum class ResamplePolicy {
    Nearest,
    AreaAverage
};

bool ParseResamplePolicy(const std::string& name, ResamplePolicy& out);

bool LoadBitmap(const std::string& path, Bitmap& out, std::string& error);
Bitmap ResizeBitmap(const Bitmap& src, int width, int height, ResamplePolicy policy);

// Writes the frame as an 8-bit RGB PNG.
bool SaveFramePng(const Frame& frame, const std::string& path);

#endif // IMAGE_H
