#ifndef CONFIG_H
#define CONFIG_H

#include "AX206Protocol.h"
#include "DirtyRegion.h"
#include "Errors.h"
#include "Font.h"
#include "Layout.h"
#include "Log.h"
#include "Renderer.h"
#include "Scheduler.h"
#include "SystemMetrics.h"
#include "Theme.h"
#include "UsbTransport.h"
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct AppConfig {
    std::string base_dir;

    // lcd
    DeviceSelector selector{AX206_VID, AX206_PID, "", ""};
    int width = 320;
    int height = 240;
    int backlight = 2;
    int orientation = 0;
    int rotate = 0;
    bool partial_updates = true;
    DirtyOptions dirty;
    bool backlight_off_on_exit = false;

    // scheduler
    std::chrono::milliseconds tick_interval{3000};
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds slow_poll_interval{5000};
    std::chrono::milliseconds backoff_initial{1000};
    std::chrono::milliseconds backoff_max{30000};
    double backoff_multiplier = 2.0;
    unsigned int backoff_max_attempts = 6;
    bool wait_for_device = true;
    std::chrono::seconds absent_log_interval{60};

    // render
    std::string theme_name = "default";
    Theme theme = THEMES.at("default");
    color_t background = 0;
    std::string font = "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf";
    float font_size = 16.0f;
    std::string placeholder = "--";

    // dashboard
    bool save_to_file = false;
    std::string dashboard_file = "dashboard.png";

    // logging
    LogLevel log_level = LogLevel::Info;
    bool protocol_trace = false;

    // resources
    SystemMetricsOptions resources;
    size_t history = 60;

    bool has_widgets = false;
    nlohmann::json widgets;
};

// Reads and validates a config file. Throws ConfigError (Io, Parse, InvalidValue).
AppConfig LoadConfig(const std::string& path);

// Validates an already parsed document; relative paths resolve against `base_dir`.
AppConfig ParseConfig(const nlohmann::json& root, const std::string& base_dir);

// AX206_TICK_MS, AX206_BACKLIGHT, AX206_DEVICE, AX206_LOG_LEVEL, AX206_DEBUG.
void ApplyEnvironment(AppConfig& config);

RenderOptions MakeRenderOptions(const AppConfig& config);
SchedulerOptions MakeSchedulerOptions(const AppConfig& config);

// Configured widget tree, or the default dashboard when none is given.
// Throws ConfigError(InvalidLayout).
LayoutModel BuildLayout(const AppConfig& config,
                        const std::vector<std::string>& known_fields,
                        FontCache& fonts);

#endif // CONFIG_H
