#ifndef FONT_H
#define FONT_H

#include "Canvas.h"
#include "Theme.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct stbtt_fontinfo;

// TrueType face rasterized with stb_truetype.
class Font {
public:
    ~Font();

    // nullptr when the file is missing or not a font.
    static std::shared_ptr<Font> Load(const std::string& path);


    int MeasureText(const std::string& text, float size) const;
    int LineHeight(float size) const;
    // (x, y) is the top-left of the line box.
    void DrawText(Canvas& canvas, const std::string& text, int x, int y, color_t color, float size) const;

private:
    Font() = default;

    std::vector<uint8_t> buffer_;
    std::unique_ptr<stbtt_fontinfo> info_;
};

// Shares loaded faces between widgets.
class FontCache {
public:
    std::shared_ptr<Font> Get(const std::string& path);

private:
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Font>> fonts_;
};

// Decodes the next UTF-8 code point starting at `i`; invalid bytes map to '?'.
uint32_t NextCodepoint(const std::string& text, size_t& i);

#endif // FONT_H
