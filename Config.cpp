#include "Config.h"
#include "utils.h"
#include <fstream>
#include <set>
#include <sstream>

using nlohmann::json;

namespace {

[[noreturn]] void invalid(const std::string& where, const std::string& message) {
    throw ConfigError(ConfigErrorKind::InvalidValue, where + ": " + message);
}

// Typed access to one config section with range checks.
struct SectionReader {
    const json& node;
    std::string name;

    std::string where(const char* key) const { return name + "." + key; }

    bool has(const char* key) const { return node.contains(key); }

    long long integer(const char* key, long long def, long long min_val, long long max_val) const {
        auto it = node.find(key);
        if (it == node.end()) return def;
        if (!it->is_number_integer()) invalid(where(key), "must be an integer");
        long long v = it->get<long long>();
        if (v < min_val || v > max_val) {
            invalid(where(key), "must be in " + std::to_string(min_val) + ".." + std::to_string(max_val));
        }
        return v;
    }

    double number(const char* key, double def, double min_val, double max_val) const {
        auto it = node.find(key);
        if (it == node.end()) return def;
        if (!it->is_number()) invalid(where(key), "must be a number");
        double v = it->get<double>();
        if (v < min_val || v > max_val) invalid(where(key), "out of range");
        return v;
    }

    bool boolean(const char* key, bool def) const {
        auto it = node.find(key);
        if (it == node.end()) return def;
        if (!it->is_boolean()) invalid(where(key), "must be true or false");
        return it->get<bool>();
    }

    std::string string(const char* key, const std::string& def) const {
        auto it = node.find(key);
        if (it == node.end()) return def;
        if (!it->is_string()) invalid(where(key), "must be a string");
        return it->get<std::string>();
    }

    std::vector<std::string> strings(const char* key) const {
        std::vector<std::string> out;
        auto it = node.find(key);
        if (it == node.end()) return out;
        if (!it->is_array()) invalid(where(key), "must be an array of strings");
        for (const auto& v : *it) {
            if (!v.is_string()) invalid(where(key), "must be an array of strings");
            out.push_back(v.get<std::string>());
        }
        return out;
    }

    // 0x1908, "0x1908" or "1908".
    uint16_t usb_id(const char* key, uint16_t def) const {
        auto it = node.find(key);
        if (it == node.end()) return def;
        if (it->is_number_integer()) {
            long long v = it->get<long long>();
            if (v < 0 || v > 0xFFFF) invalid(where(key), "must be a 16-bit id");
            return static_cast<uint16_t>(v);
        }
        if (!it->is_string()) invalid(where(key), "must be a hex string or integer");
        std::string s = to_lower(trim(it->get<std::string>()));
        if (s.compare(0, 2, "0x") == 0) s = s.substr(2);
        if (s.empty() || s.size() > 4 || s.find_first_not_of("0123456789abcdef") != std::string::npos) {
            invalid(where(key), "'" + it->get<std::string>() + "' is not a hex id");
        }
        return static_cast<uint16_t>(std::stoul(s, nullptr, 16));
    }
};

SectionReader section(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end()) return SectionReader{empty, name};
    if (!it->is_object()) invalid(name, "must be an object");
    return SectionReader{*it, name};
}

std::string resolve_path(const std::string& base_dir, const std::string& p) {
    if (p.empty() || p[0] == '/' || base_dir.empty()) return p;
    return base_dir + "/" + p;
}

void read_lcd(const json& root, AppConfig& c) {
    SectionReader r = section(root, "lcd");
    uint16_t vid = r.usb_id("vid", c.selector.vid);
    uint16_t pid = r.usb_id("pid", c.selector.pid);
    std::string device = r.string("device", "");
    try {
        c.selector = ParseDeviceSelector(device, vid, pid);
    } catch (const DeviceError& e) {
        invalid(r.where("device"), e.what());
    }
    c.width = static_cast<int>(r.integer("width", c.width, 1, 4096));
    c.height = static_cast<int>(r.integer("height", c.height, 1, 4096));
    c.backlight = static_cast<int>(r.integer("backlight", c.backlight, 0, 7));
    c.orientation = static_cast<int>(r.integer("orientation", c.orientation, 0, 3));
    c.rotate = static_cast<int>(r.integer("rotate", c.rotate, 0, 180));
    if (c.rotate != 0 && c.rotate != 180) invalid(r.where("rotate"), "must be 0 or 180");
    c.partial_updates = r.boolean("partial_updates", c.partial_updates);
    c.dirty.tile = static_cast<int>(r.integer("dirty_tile", c.dirty.tile, 1, 1024));
    c.dirty.max_rects = static_cast<int>(r.integer("dirty_max_rects", c.dirty.max_rects, 1, 4096));
    c.dirty.full_frame_threshold = r.number("full_frame_threshold", c.dirty.full_frame_threshold, 0.0, 1.0);
    c.backlight_off_on_exit = r.boolean("backlight_off_on_exit", c.backlight_off_on_exit);
}

void read_scheduler(const json& root, AppConfig& c) {
    SectionReader r = section(root, "scheduler");
    const long long day_ms = 24LL * 3600 * 1000;
    c.tick_interval = std::chrono::milliseconds(r.integer("tick_ms", c.tick_interval.count(), 10, day_ms));
    c.poll_interval = std::chrono::milliseconds(r.integer("poll_ms", c.poll_interval.count(), 10, day_ms));
    c.slow_poll_interval =
        std::chrono::milliseconds(r.integer("slow_poll_ms", c.slow_poll_interval.count(), 100, day_ms));
    c.backoff_initial =
        std::chrono::milliseconds(r.integer("backoff_initial_ms", c.backoff_initial.count(), 1, day_ms));
    c.backoff_max = std::chrono::milliseconds(r.integer("backoff_max_ms", c.backoff_max.count(), 1, day_ms));
    if (c.backoff_max < c.backoff_initial) invalid(r.where("backoff_max_ms"), "must be >= backoff_initial_ms");
    c.backoff_multiplier = r.number("backoff_multiplier", c.backoff_multiplier, 1.0, 100.0);
    c.backoff_max_attempts =
        static_cast<unsigned int>(r.integer("backoff_max_attempts", c.backoff_max_attempts, 1, 1000));
    c.wait_for_device = r.boolean("wait_for_device", c.wait_for_device);
    c.absent_log_interval =
        std::chrono::seconds(r.integer("absent_log_interval_s", c.absent_log_interval.count(), 0, 86400));
}

void read_render(const json& root, AppConfig& c) {
    SectionReader r = section(root, "render");
    c.theme_name = to_lower(r.string("theme", c.theme_name));
    auto theme = THEMES.find(c.theme_name);
    if (theme == THEMES.end()) invalid(r.where("theme"), "unknown theme '" + c.theme_name + "'");
    c.theme = theme->second;
    c.background = c.theme.background;
    if (r.has("background")) {
        if (!ParseColor(r.node.at("background"), c.theme, c.background)) {
            invalid(r.where("background"), "invalid colour");
        }
        c.theme.background = c.background;
    }
    c.font = resolve_path(c.base_dir, r.string("font", c.font));
    c.font_size = static_cast<float>(r.number("font_size", c.font_size, 4.0, 512.0));
    c.placeholder = r.string("placeholder", c.placeholder);
}

void read_dashboard(const json& root, AppConfig& c) {
    SectionReader r = section(root, "dashboard");
    c.save_to_file = r.boolean("save_to_file", c.save_to_file);
    c.dashboard_file = resolve_path(c.base_dir, r.string("file", c.dashboard_file));
    if (c.save_to_file && c.dashboard_file.empty()) invalid(r.where("file"), "must not be empty");
}

void read_logging(const json& root, AppConfig& c) {
    SectionReader r = section(root, "logging");
    std::string level = r.string("level", LogLevelName(c.log_level));
    if (!ParseLogLevel(level, c.log_level)) {
        LogWarn("config", "unknown log level '" + level + "', using info");
        c.log_level = LogLevel::Info;
    }
}

void read_resources(const json& root, AppConfig& c) {
    SectionReader r = section(root, "resources");
    SystemMetricsOptions& res = c.resources;
    res.networks = r.strings("networks");
    res.disks = r.strings("disks");
    res.mount_points = r.strings("mount_points");
    if (res.mount_points.empty()) res.mount_points.push_back("/");

    res.sensors.clear();
    if (r.has("sensors")) {
        const json& sensors = r.node.at("sensors");
        if (!sensors.is_array()) invalid(r.where("sensors"), "must be an array");
        std::set<std::string> labels;
        for (size_t i = 0; i < sensors.size(); ++i) {
            const json& s = sensors[i];
            std::string where = r.where("sensors") + "[" + std::to_string(i) + "]";
            if (!s.is_object()) invalid(where, "must be an object");
            SectionReader sr{s, where};
            SensorMatch m;
            m.match = to_lower(sr.string("match", ""));
            m.label = sr.string("label", "");
            if (m.match.empty()) invalid(where, "'match' is required");
            if (m.label.empty()) m.label = m.match;
            if (!labels.insert(m.label).second) invalid(where, "duplicate label '" + m.label + "'");
            res.sensors.push_back(m);
        }
    }

    res.nvidia = r.boolean("nvidia", res.nvidia);
    res.nvidia_gpus = static_cast<int>(r.integer("nvidia_gpus", res.nvidia_gpus, 1, 16));
    res.syslog_path = resolve_path(c.base_dir, r.string("syslog", res.syslog_path));
    res.syslog_lines = static_cast<int>(r.integer("syslog_lines", res.syslog_lines, 1, 100));
    res.syslog_width = static_cast<int>(r.integer("syslog_width", res.syslog_width, 8, 1000));
    res.top_processes = static_cast<int>(r.integer("top_processes", res.top_processes, 0, 20));
    c.history = static_cast<size_t>(r.integer("history", static_cast<long long>(c.history), 2, 100000));
    res.slow_interval = c.slow_poll_interval;
}

} // namespace

AppConfig ParseConfig(const json& root, const std::string& base_dir) {
    if (!root.is_object()) {
        throw ConfigError(ConfigErrorKind::InvalidValue, "config root must be an object");
    }
    static const std::set<std::string> known = {
        "lcd", "scheduler", "render", "dashboard", "logging", "resources", "widgets"};
    for (auto it = root.begin(); it != root.end(); ++it) {
        if (!known.count(it.key())) LogWarn("config", "ignoring unknown section '" + it.key() + "'");
    }

    AppConfig c;
    c.base_dir = base_dir;
    read_lcd(root, c);
    read_scheduler(root, c);
    read_render(root, c);
    read_dashboard(root, c);
    read_logging(root, c);
    read_resources(root, c);

    auto widgets = root.find("widgets");
    if (widgets != root.end()) {
        if (!widgets->is_array()) invalid("widgets", "must be an array");
        c.has_widgets = true;
        c.widgets = *widgets;
    }
    return c;
}

AppConfig LoadConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError(ConfigErrorKind::Io, "cannot open config '" + path + "'");
    }
    json root;
    try {
        root = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigError(ConfigErrorKind::Parse, path + ": " + e.what());
    }

    std::string base_dir;
    size_t slash = path.find_last_of('/');
    if (slash != std::string::npos) base_dir = path.substr(0, slash == 0 ? 1 : slash);
    return ParseConfig(root, base_dir);
}

void ApplyEnvironment(AppConfig& config) {
    const char* tick = std::getenv("AX206_TICK_MS");
    if (tick) {
        int ms = getenv_int("AX206_TICK_MS", -1);
        if (ms < 10) invalid("AX206_TICK_MS", std::string("'") + tick + "' is not a valid interval");
        config.tick_interval = std::chrono::milliseconds(ms);
    }
    const char* backlight = std::getenv("AX206_BACKLIGHT");
    if (backlight) {
        int level = getenv_int("AX206_BACKLIGHT", -1);
        if (level < 0 || level > 7) invalid("AX206_BACKLIGHT", std::string("'") + backlight + "' is not in 0..7");
        config.backlight = level;
    }
    const char* device = std::getenv("AX206_DEVICE");
    if (device) {
        try {
            config.selector = ParseDeviceSelector(device, config.selector.vid, config.selector.pid);
        } catch (const DeviceError& e) {
            invalid("AX206_DEVICE", e.what());
        }
    }
    const char* level = std::getenv("AX206_LOG_LEVEL");
    if (level && !ParseLogLevel(level, config.log_level)) {
        LogWarn("config", std::string("unknown AX206_LOG_LEVEL '") + level + "', keeping " +
                              LogLevelName(config.log_level));
    }
    config.protocol_trace = getenv_bool("AX206_DEBUG", config.protocol_trace);
}

RenderOptions MakeRenderOptions(const AppConfig& config) {
    RenderOptions o;
    o.background = config.background;
    o.placeholder = config.placeholder;
    o.placeholder_color = config.theme.muted;
    o.rotate180 = config.rotate == 180;
    return o;
}

SchedulerOptions MakeSchedulerOptions(const AppConfig& config) {
    SchedulerOptions o;
    o.tick_interval = config.tick_interval;
    o.selector = config.selector;
    o.backlight = config.backlight;
    o.orientation = config.orientation;
    o.backoff_initial = config.backoff_initial;
    o.backoff_max = config.backoff_max;
    o.backoff_multiplier = config.backoff_multiplier;
    o.backoff_max_attempts = config.backoff_max_attempts;
    o.absent_log_interval = config.absent_log_interval;
    o.partial_updates = config.partial_updates;
    o.dirty = config.dirty;
    o.backlight_off_on_exit = config.backlight_off_on_exit;
    if (config.save_to_file) o.snapshot_path = config.dashboard_file;
    return o;
}

LayoutModel BuildLayout(const AppConfig& config,
                        const std::vector<std::string>& known_fields,
                        FontCache& fonts) {
    LayoutContext ctx;
    ctx.width = config.width;
    ctx.height = config.height;
    ctx.known_fields = known_fields;
    ctx.theme = config.theme;
    ctx.default_font = config.font;
    ctx.default_font_size = config.font_size;
    ctx.base_dir = config.base_dir;
    ctx.fonts = &fonts;

    if (config.has_widgets) {
        return LayoutModel::Load(config.widgets, ctx);
    }

    std::vector<std::string> sensor_labels;
    for (const auto& s : config.resources.sensors) sensor_labels.push_back(s.label);
    int gpus = config.resources.nvidia ? config.resources.nvidia_gpus : 0;
    json widgets = LayoutModel::DefaultWidgets(config.width, config.height, sensor_labels, gpus,
                                               config.resources.top_processes,
                                               !config.resources.syslog_path.empty());
    return LayoutModel::Load(widgets, ctx);
}
