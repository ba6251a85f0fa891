#include "Font.h"
#include "Log.h"
#include <fstream>

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb_truetype.h>

uint32_t NextCodepoint(const std::string& text, size_t& i) {
    unsigned char c = static_cast<unsigned char>(text[i++]);
    if (c < 0x80) return c;
    int extra = 0;
    uint32_t cp = 0;
    if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
    else return '?';
    for (int k = 0; k < extra; ++k) {
        if (i >= text.size()) return '?';
        unsigned char cc = static_cast<unsigned char>(text[i]);
        if ((cc & 0xC0) != 0x80) return '?';
        cp = (cp << 6) | (cc & 0x3F);
        ++i;
    }
    return cp;
}

Font::~Font() = default;

std::shared_ptr<Font> Font::Load(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        LogWarn("font", "Failed to open font file: " + path);
        return nullptr;
    }
    std::streamsize file_size = file.tellg();
    if (file_size <= 0) {
        LogWarn("font", "Empty font file: " + path);
        return nullptr;
    }
    file.seekg(0, std::ios::beg);
    std::shared_ptr<Font> font(new Font());
    font->buffer_.resize(static_cast<size_t>(file_size));
    if (!file.read(reinterpret_cast<char*>(font->buffer_.data()), file_size)) {
        LogWarn("font", "Failed to read font file: " + path);
        return nullptr;
    }
    font->info_.reset(new stbtt_fontinfo());
    int offset = stbtt_GetFontOffsetForIndex(font->buffer_.data(), 0);
    if (offset < 0 || !stbtt_InitFont(font->info_.get(), font->buffer_.data(), offset)) {
        LogWarn("font", "Failed to initialize font: " + path);
        return nullptr;
    }
    return font;
}

int Font::MeasureText(const std::string& text, float size) const {
    float scale = stbtt_ScaleForPixelHeight(info_.get(), size);
    int width = 0;
    size_t i = 0;
    while (i < text.size()) {
        uint32_t cp = NextCodepoint(text, i);
        int advance, lsb;
        stbtt_GetCodepointHMetrics(info_.get(), static_cast<int>(cp), &advance, &lsb);
        width += static_cast<int>(advance * scale);
    }
    return width;
}

int Font::LineHeight(float size) const {
    float scale = stbtt_ScaleForPixelHeight(info_.get(), size);
    int ascent, descent, line_gap;
    stbtt_GetFontVMetrics(info_.get(), &ascent, &descent, &line_gap);
    return static_cast<int>((ascent - descent) * scale + 0.5f);
}

void Font::DrawText(Canvas& canvas, const std::string& text, int x, int y, color_t color, float size) const {
    stbtt_fontinfo* info = info_.get();
    float scale = stbtt_ScaleForPixelHeight(info, size);
    int ascent, descent, line_gap;
    stbtt_GetFontVMetrics(info, &ascent, &descent, &line_gap);
    int baseline = y + static_cast<int>(ascent * scale);

    std::vector<uint8_t> bitmap;
    size_t i = 0;
    while (i < text.size()) {
        int cp = static_cast<int>(NextCodepoint(text, i));
        int advance, lsb;
        stbtt_GetCodepointHMetrics(info, cp, &advance, &lsb);
        int c_x1, c_y1, c_x2, c_y2;
        stbtt_GetCodepointBitmapBox(info, cp, scale, scale, &c_x1, &c_y1, &c_x2, &c_y2);

        int w = c_x2 - c_x1;
        int h = c_y2 - c_y1;
        if (w > 0 && h > 0) {
            bitmap.resize(static_cast<size_t>(w * h));
            stbtt_MakeCodepointBitmap(info, bitmap.data(), w, h, w, scale, scale, cp);
            for (int j = 0; j < h; ++j) {
                for (int k = 0; k < w; ++k) {
                    canvas.BlendPixel(x + c_x1 + k, baseline + c_y1 + j, color, bitmap[j * w + k]);
                }
            }
        }
        x += static_cast<int>(advance * scale);
    }
}

std::shared_ptr<Font> FontCache::Get(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = fonts_.find(path);
    if (it != fonts_.end()) return it->second;
    auto font = Font::Load(path);
    if (font) fonts_[path] = font;
    return font;
}
