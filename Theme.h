#ifndef THEME_H
#define THEME_H

#include <algorithm>
#include <cstdint>
#include <map>
#include <string>

// RGB565 Color representation
using color_t = uint16_t;

// Helper to convert RGB888 to RGB565
constexpr color_t RGB(uint8_t r, uint8_t g, uint8_t b) {
    return static_cast<color_t>(((r & 0xF8) << 8) | ((g & 0xFC) << 3) | (b >> 3));
}

// Interpolate between two RGB565 colors
inline color_t interpolate_color(color_t c1, color_t c2, float t) {
    int r1 = (c1 >> 11) & 0x1F;
    int g1 = (c1 >> 5) & 0x3F;
    int b1 = c1 & 0x1F;

    int r2 = (c2 >> 11) & 0x1F;
    int g2 = (c2 >> 5) & 0x3F;
    int b2 = c2 & 0x1F;

    int r = r1 + static_cast<int>((r2 - r1) * t);
    int g = g1 + static_cast<int>((g2 - g1) * t);
    int b = b1 + static_cast<int>((b2 - b1) * t);

    return static_cast<color_t>((r << 11) | (g << 5) | b);
}

struct Theme {
    color_t background;
    color_t header;
    color_t text;
    color_t cpu;
    color_t mem;
    color_t disk;
    color_t gpu;
    color_t sensor;
    color_t io;
    color_t process;
    color_t log;
    color_t muted;
    color_t bar_bg;
    color_t bar_border;
};

const std::map<std::string, Theme> THEMES = {
    {"default", {
        RGB(0, 0, 0), RGB(114, 159, 207), RGB(238, 238, 236),
        RGB(87, 174, 36), RGB(52, 101, 164), RGB(204, 0, 0), RGB(173, 127, 168),
        RGB(245, 121, 0), RGB(0, 188, 212), RGB(237, 212, 0), RGB(186, 189, 182),
        RGB(90, 90, 90), RGB(30, 30, 30), RGB(255, 255, 255)
    }},
    {"neutral", {
        RGB(8, 8, 16), RGB(140, 140, 140), RGB(220, 220, 220),
        RGB(60, 180, 120), RGB(80, 160, 200), RGB(220, 80, 60), RGB(180, 140, 100),
        RGB(220, 180, 60), RGB(80, 160, 200), RGB(200, 200, 200), RGB(140, 140, 140),
        RGB(80, 80, 80), RGB(10, 10, 18), RGB(30, 30, 40)
    }},
    {"neon", {
        RGB(10, 6, 20), RGB(150, 170, 200), RGB(220, 240, 255),
        RGB(0, 220, 200), RGB(120, 190, 255), RGB(255, 110, 60), RGB(255, 120, 180),
        RGB(255, 160, 90), RGB(120, 190, 255), RGB(210, 240, 255), RGB(150, 170, 200),
        RGB(70, 90, 110), RGB(14, 10, 24), RGB(40, 35, 60)
    }},
    {"orange", {
        RGB(16, 10, 18), RGB(170, 145, 120), RGB(240, 225, 210),
        RGB(80, 200, 140), RGB(245, 130, 60), RGB(255, 100, 50), RGB(245, 150, 60),
        RGB(255, 150, 70), RGB(245, 130, 60), RGB(235, 220, 200), RGB(170, 145, 120),
        RGB(110, 90, 80), RGB(18, 12, 16), RGB(40, 30, 25)
    }}
};

// Looks up a colour by role name ("cpu", "bar_bg", ...).
inline bool ThemeRole(const Theme& theme, const std::string& role, color_t& out) {
    static const std::map<std::string, color_t Theme::*> roles = {
        {"background", &Theme::background}, {"header", &Theme::header},
        {"text", &Theme::text}, {"cpu", &Theme::cpu}, {"mem", &Theme::mem},
        {"disk", &Theme::disk}, {"gpu", &Theme::gpu}, {"sensor", &Theme::sensor},
        {"io", &Theme::io}, {"process", &Theme::process}, {"log", &Theme::log},
        {"muted", &Theme::muted}, {"bar_bg", &Theme::bar_bg}, {"bar_border", &Theme::bar_border}
    };
    auto it = roles.find(role);
    if (it == roles.end()) return false;
    out = theme.*(it->second);
    return true;
}

#endif // THEME_H
