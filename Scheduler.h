#ifndef SCHEDULER_H
#define SCHEDULER_H

#include "AX206Device.h"
#include "Backoff.h"
#include "DirtyRegion.h"
#include "Frame.h"
#include "Layout.h"
#include "Metrics.h"
#include "Renderer.h"
#include "UsbTransport.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

enum class SchedulerState {
    Disconnected,
    Connecting,
    Active,
    Recovering,
    ShuttingDown
};

const char* SchedulerStateName(SchedulerState state);

enum class TickResult {
    Uploaded,
    Unchanged,     // frame identical to what the panel shows
    Suppressed,    // waiting for the reconnect delay to elapse
    ConnectFailed,
    UploadFailed,
    Stopped
};

struct SchedulerOptions {
    std::chrono::milliseconds tick_interval{3000};
    DeviceSelector selector;
    int backlight = 2;
    int orientation = -1; // -1 keeps the panel default
    std::chrono::milliseconds backoff_initial{1000};
    std::chrono::milliseconds backoff_max{30000};
    double backoff_multiplier = 2.0;
    unsigned int backoff_max_attempts = 6;
    std::chrono::seconds absent_log_interval{60};
    bool partial_updates = true;
    DirtyOptions dirty;
    bool backlight_off_on_exit = false;
    std::string snapshot_path;
};

struct SchedulerStats {
    uint64_t ticks = 0;
    uint64_t uploads = 0;
    uint64_t unchanged = 0;
    uint64_t suppressed = 0;
    uint64_t skipped_ticks = 0;
    uint64_t connect_attempts = 0;
    uint64_t connects = 0;
    uint64_t failures = 0;
};

// Drives render + upload on a fixed cadence and owns the device session.
class Scheduler {
public:
    Scheduler(const SchedulerOptions& options,
              UsbBus& bus,
              MetricsCollector& collector,
              const Renderer& renderer,
              std::shared_ptr<const LayoutModel> layout);
    ~Scheduler();

    // One cycle at `now`. Never throws DeviceError.
    TickResult Tick(std::chrono::steady_clock::time_point now,
                    std::chrono::system_clock::time_point wall);

    // Ticks until `stop` becomes true, then shuts down.
    void Run(const std::atomic<bool>& stop);

    // Single connection attempt outside the tick cadence.
    bool ConnectNow(std::chrono::steady_clock::time_point now);

    void Shutdown();

    SchedulerState State() const { return state_; }
    const SchedulerStats& Stats() const { return stats_; }
    bool Connected() const { return device_ != nullptr; }
    std::chrono::steady_clock::time_point NextAttempt() const { return next_attempt_; }

    // Deadline after `deadline`; ticks that already passed are counted in `skipped`.
    static std::chrono::steady_clock::time_point NextDeadline(std::chrono::steady_clock::time_point deadline,
                                                              std::chrono::steady_clock::time_point now,
                                                              std::chrono::milliseconds interval,
                                                              uint64_t& skipped);

private:
    bool connect(std::chrono::steady_clock::time_point now);
    TickResult renderAndUpload(std::chrono::steady_clock::time_point now,
                               std::chrono::system_clock::time_point wall);
    void onDeviceFailure(std::chrono::steady_clock::time_point now, const DeviceError& error, bool lost_session);
    void dropDevice();
    void setState(SchedulerState state);
    void logPerf(std::chrono::steady_clock::time_point now);

    SchedulerOptions options_;
    UsbBus& bus_;
    MetricsCollector& collector_;
    const Renderer& renderer_;
    std::shared_ptr<const LayoutModel> layout_;

    std::unique_ptr<AX206Device> device_;
    std::unique_ptr<Frame> last_frame_;
    SchedulerState state_ = SchedulerState::Disconnected;
    Backoff backoff_;
    std::chrono::steady_clock::time_point next_attempt_{};

    bool outage_logged_ = false;
    std::chrono::steady_clock::time_point last_absent_log_{};
    bool size_mismatch_logged_ = false;

    SchedulerStats stats_;
    std::chrono::steady_clock::time_point last_perf_log_{};
    double render_time_acc_ = 0.0;
    double usb_time_acc_ = 0.0;
    uint64_t bytes_at_last_log_ = 0;
};

#endif // SCHEDULER_H
