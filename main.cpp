#include "Config.h"
#include "LibusbTransport.h"
#include "Log.h"
#include "Metrics.h"
#include "Renderer.h"
#include "Scheduler.h"
#include "SystemMetrics.h"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

static std::atomic<bool> stop_requested{false};
static void signal_handler(int) { stop_requested = true; }

static const char* DEFAULT_CONFIG = "ax206mon.json";

struct CliOptions {
    std::string config_path = DEFAULT_CONFIG;
    bool config_given = false;
    std::string device;
    bool no_wait = false;
    std::string snapshot;
    bool verbose = false;
};

static void usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [-c PATH] [-d SELECTOR] [--no-wait] [--snapshot PNG] [-v] [-h]\n"
              << "  -c, --config PATH     configuration file (default " << DEFAULT_CONFIG << ")\n"
              << "  -d, --device SEL      device selector [VID:PID][@SERIAL][#BUS-PORT.PORT]\n"
              << "      --no-wait         exit with status 2 if no device is present\n"
              << "      --snapshot PNG    write every rendered frame to PNG\n"
              << "  -v, --verbose         debug logging\n"
              << "  -h, --help            show this help\n";
}

// Returns -1 to continue, otherwise the exit status.
static int parse_args(int argc, char** argv, CliOptions& cli) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << name << " requires an argument" << std::endl;
                return nullptr;
            }
            return argv[++i];
        };
        if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (arg == "-c" || arg == "--config") {
            const char* v = value("--config");
            if (!v) return 1;
            cli.config_path = v;
            cli.config_given = true;
        } else if (arg == "-d" || arg == "--device") {
            const char* v = value("--device");
            if (!v) return 1;
            cli.device = v;
        } else if (arg == "--snapshot") {
            const char* v = value("--snapshot");
            if (!v) return 1;
            cli.snapshot = v;
        } else if (arg == "--no-wait") {
            cli.no_wait = true;
        } else if (arg == "-v" || arg == "--verbose") {
            cli.verbose = true;
        } else {
            std::cerr << "unknown option '" << arg << "'" << std::endl;
            usage(argv[0]);
            return 1;
        }
    }
    return -1;
}

static AppConfig load_config(const CliOptions& cli) {
    AppConfig config;
    if (cli.config_given || access(cli.config_path.c_str(), F_OK) == 0) {
        config = LoadConfig(cli.config_path);
        LogInfo("main", "loaded " + cli.config_path);
    } else {
        config = ParseConfig(nlohmann::json::object(), ".");
        LogInfo("main", std::string("no ") + DEFAULT_CONFIG + ", using built-in defaults");
    }
    ApplyEnvironment(config);
    if (!cli.device.empty()) {
        try {
            config.selector = ParseDeviceSelector(cli.device, config.selector.vid, config.selector.pid);
        } catch (const DeviceError& e) {
            throw ConfigError(ConfigErrorKind::InvalidValue, std::string("--device: ") + e.what());
        }
    }
    if (!cli.snapshot.empty()) {
        config.save_to_file = true;
        config.dashboard_file = cli.snapshot;
    }
    if (cli.no_wait) config.wait_for_device = false;
    if (cli.verbose && config.log_level > LogLevel::Debug) config.log_level = LogLevel::Debug;
    return config;
}

int main(int argc, char** argv) {
    CliOptions cli;
    int rc = parse_args(argc, argv, cli);
    if (rc >= 0) return rc;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    // Everything that can be rejected is validated before the bus is touched.
    AppConfig config;
    std::unique_ptr<SystemMetrics> metrics;
    FontCache fonts;
    std::shared_ptr<const LayoutModel> layout;
    try {
        config = load_config(cli);
        SetLogLevel(config.log_level);
        SetProtocolTrace(config.protocol_trace);
        metrics = std::make_unique<SystemMetrics>(config.resources);
        layout = std::make_shared<const LayoutModel>(BuildLayout(config, metrics->Fields(), fonts));
    } catch (const ConfigError& e) {
        LogError("main", std::string("configuration error: ") + e.what());
        return 1;
    }
    LogInfo("main", "layout " + std::to_string(layout->Width()) + "x" + std::to_string(layout->Height()) +
                    " with " + std::to_string(layout->Widgets().size()) + " widgets, tick " +
                    std::to_string(config.tick_interval.count()) + " ms");

    MetricsCollector collector(*metrics, config.history);
    for (const auto& depth : layout->HistoryDepths()) {
        collector.SetHistoryCapacity(depth.first, depth.second);
    }
    collector.CollectOnce();
    collector.Start(config.poll_interval);

    std::unique_ptr<LibusbBus> bus;
    try {
        bus = std::make_unique<LibusbBus>(config.selector.vid, config.selector.pid);
    } catch (const DeviceError& e) {
        LogError("main", std::string("USB unavailable: ") + e.what());
        collector.Stop();
        return 2;
    }

    Renderer renderer(MakeRenderOptions(config));
    Scheduler scheduler(MakeSchedulerOptions(config), *bus, collector, renderer, layout);

    if (!config.wait_for_device && !scheduler.ConnectNow(std::chrono::steady_clock::now())) {
        LogError("main", "no device matching " + config.selector.ToString());
        scheduler.Shutdown();
        collector.Stop();
        return 2;
    }

    scheduler.Run(stop_requested);

    collector.Stop();
    const SchedulerStats& stats = scheduler.Stats();
    LogInfo("main", "exiting: " + std::to_string(stats.uploads) + " uploads, " +
                    std::to_string(stats.connects) + " connects, " +
                    std::to_string(stats.failures) + " failures");
    return 0;
}
