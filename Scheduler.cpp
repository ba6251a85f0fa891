#include "Scheduler.h"
#include "Image.h"
#include "Log.h"
#include <algorithm>
#include <sstream>
#include <thread>

namespace {
const char* TAG = "scheduler";
}

const char* SchedulerStateName(SchedulerState state) {
    switch (state) {
        case SchedulerState::Disconnected: return "Disconnected";
        case SchedulerState::Connecting: return "Connecting";
        case SchedulerState::Active: return "Active";
        case SchedulerState::Recovering: return "Recovering";
        case SchedulerState::ShuttingDown: return "ShuttingDown";
    }
    return "Unknown";
}

Scheduler::Scheduler(const SchedulerOptions& options,
                     UsbBus& bus,
                     MetricsCollector& collector,
                     const Renderer& renderer,
                     std::shared_ptr<const LayoutModel> layout)
    : options_(options),
      bus_(bus),
      collector_(collector),
      renderer_(renderer),
      layout_(std::move(layout)),
      backoff_(options.backoff_initial, options.backoff_max,
               options.backoff_multiplier, options.backoff_max_attempts) {}

void Scheduler::setState(SchedulerState state) {
    if (state == state_) return;
    LogDebug(TAG, std::string(SchedulerStateName(state_)) + " -> " + SchedulerStateName(state));
    state_ = state;
}

Scheduler::~Scheduler() {
    if (device_) {
        device_->Close();
    }
}

std::chrono::steady_clock::time_point Scheduler::NextDeadline(std::chrono::steady_clock::time_point deadline,
                                                              std::chrono::steady_clock::time_point now,
                                                              std::chrono::milliseconds interval,
                                                              uint64_t& skipped) {
    skipped = 0;
    if (interval.count() <= 0) return now;
    auto next = deadline + interval;
    while (next <= now) {
        next += interval;
        ++skipped;
    }
    return next;
}

bool Scheduler::ConnectNow(std::chrono::steady_clock::time_point now) {
    if (device_) return true;
    if (state_ == SchedulerState::ShuttingDown) return false;
    return connect(now);
}

bool Scheduler::connect(std::chrono::steady_clock::time_point now) {
    bool recovering = state_ == SchedulerState::Recovering;
    setState(SchedulerState::Connecting);
    ++stats_.connect_attempts;
    try {
        std::unique_ptr<AX206Device> device = AX206Device::Open(bus_, options_.selector);
        device->SetBacklight(options_.backlight);
        if (options_.orientation >= 0) {
            device->SetOrientation(options_.orientation);
        }
        device->Clear(renderer_.Options().background);
        device_ = std::move(device);
    } catch (const DeviceError& e) {
        setState(recovering ? SchedulerState::Recovering : SchedulerState::Disconnected);
        onDeviceFailure(now, e, false);
        return false;
    }

    if (outage_logged_) {
        std::ostringstream oss;
        oss << "device back after " << backoff_.Failures() << " failed attempt(s)";
        LogInfo(TAG, oss.str());
    }
    LogInfo(TAG, "connected to " + device_->Description() + " (" +
                 std::to_string(device_->Width()) + "x" + std::to_string(device_->Height()) + ")");
    backoff_.Reset();
    outage_logged_ = false;
    last_frame_.reset();
    ++stats_.connects;
    setState(SchedulerState::Active);
    return true;
}

void Scheduler::onDeviceFailure(std::chrono::steady_clock::time_point now, const DeviceError& error, bool lost_session) {
    ++stats_.failures;
    std::chrono::milliseconds delay = backoff_.NextDelay();
    next_attempt_ = now + delay;

    std::ostringstream oss;
    if (lost_session) {
        oss << "lost device: " << error.what();
    } else {
        oss << "device unavailable: " << error.what();
    }
    if (error.code() == DeviceErrorCode::PermissionDenied) {
        oss << " (check udev rules for " << options_.selector.ToString() << ")";
    }
    oss << "; retrying in " << delay.count() << " ms";

    if (!outage_logged_ || lost_session) {
        LogWarn(TAG, oss.str());
        outage_logged_ = true;
        last_absent_log_ = now;
    } else if (now - last_absent_log_ >= options_.absent_log_interval) {
        std::ostringstream still;
        still << "still waiting for device after " << backoff_.Failures() << " attempt(s): " << error.what();
        LogWarn(TAG, still.str());
        last_absent_log_ = now;
    } else {
        LogDebug(TAG, oss.str());
    }
}

void Scheduler::dropDevice() {
    if (device_) {
        device_->Close();
        device_.reset();
    }
    last_frame_.reset();
}

TickResult Scheduler::Tick(std::chrono::steady_clock::time_point now,
                           std::chrono::system_clock::time_point wall) {
    if (state_ == SchedulerState::ShuttingDown) return TickResult::Stopped;
    ++stats_.ticks;

    if (!device_) {
        if (now < next_attempt_) {
            ++stats_.suppressed;
            return TickResult::Suppressed;
        }
        if (!connect(now)) return TickResult::ConnectFailed;
    }
    return renderAndUpload(now, wall);
}

TickResult Scheduler::renderAndUpload(std::chrono::steady_clock::time_point now,
                                      std::chrono::system_clock::time_point wall) {
    auto render_start = std::chrono::steady_clock::now();
    std::shared_ptr<const MetricSnapshot> snapshot = collector_.Snapshot();
    Frame frame = renderer_.Render(*layout_, *snapshot, wall);
    if (frame.Width() != device_->Width() || frame.Height() != device_->Height()) {
        if (!size_mismatch_logged_) {
            std::ostringstream oss;
            oss << "layout is " << frame.Width() << "x" << frame.Height()
                << " but panel is " << device_->Width() << "x" << device_->Height() << ", scaling to fit";
            LogWarn(TAG, oss.str());
            size_mismatch_logged_ = true;
        }
        frame = FitToSize(frame, device_->Width(), device_->Height(), 0);
    }
    auto render_end = std::chrono::steady_clock::now();
    render_time_acc_ += std::chrono::duration_cast<std::chrono::duration<double>>(render_end - render_start).count();

    if (!options_.snapshot_path.empty() && !SaveFramePng(frame, options_.snapshot_path)) {
        LogWarn(TAG, "failed to write snapshot " + options_.snapshot_path);
    }

    DirtyResult dirty;
    if (options_.partial_updates) {
        dirty = ComputeDirtyRegion(frame, last_frame_.get(), options_.dirty);
    } else {
        dirty.full_frame = true;
    }
    if (!dirty.full_frame && dirty.rects.empty()) {
        ++stats_.unchanged;
        logPerf(now);
        return TickResult::Unchanged;
    }

    auto usb_start = std::chrono::steady_clock::now();
    try {
        if (dirty.full_frame) {
            device_->Display(frame);
        } else {
            for (const auto& r : dirty.rects) {
                device_->UpdateRect(frame, r);
            }
        }
    } catch (const DeviceError& e) {
        if (e.code() == DeviceErrorCode::InvalidArgument) {
            LogError(TAG, std::string("upload rejected: ") + e.what());
            last_frame_.reset();
            return TickResult::UploadFailed;
        }
        dropDevice();
        setState(SchedulerState::Recovering);
        onDeviceFailure(now, e, true);
        return TickResult::UploadFailed;
    }
    auto usb_end = std::chrono::steady_clock::now();
    usb_time_acc_ += std::chrono::duration_cast<std::chrono::duration<double>>(usb_end - usb_start).count();

    last_frame_ = std::make_unique<Frame>(std::move(frame));
    ++stats_.uploads;
    logPerf(now);
    return TickResult::Uploaded;
}

void Scheduler::logPerf(std::chrono::steady_clock::time_point now) {
    if (!LogEnabled(LogLevel::Debug) || !device_) return;
    if (last_perf_log_ == std::chrono::steady_clock::time_point{}) {
        last_perf_log_ = now;
        return;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - last_perf_log_).count();
    if (elapsed < 60) return;

    uint64_t bytes = device_->BytesSent();
    std::ostringstream oss;
    oss << "PERF: uploads=" << stats_.uploads
        << " unchanged=" << stats_.unchanged
        << " skipped=" << stats_.skipped_ticks
        << " bytes_" << elapsed << "s=" << (bytes - bytes_at_last_log_)
        << " render_ms=" << (render_time_acc_ * 1000.0)
        << " usb_ms=" << (usb_time_acc_ * 1000.0);
    LogDebug(TAG, oss.str());
    render_time_acc_ = 0.0;
    usb_time_acc_ = 0.0;
    bytes_at_last_log_ = bytes;
    last_perf_log_ = now;
}

void Scheduler::Run(const std::atomic<bool>& stop) {
    auto deadline = std::chrono::steady_clock::now();
    const auto slice = std::chrono::milliseconds(50);

    while (!stop.load()) {
        bus_.PollEvents();
        if (bus_.TakeArrival() && !device_) {
            LogInfo(TAG, "device arrival detected, reconnecting");
            next_attempt_ = std::chrono::steady_clock::now();
            deadline = next_attempt_;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            try {
                Tick(now, std::chrono::system_clock::now());
            } catch (const std::exception& e) {
                LogError(TAG, std::string("tick failed: ") + e.what());
            }
            uint64_t skipped = 0;
            deadline = NextDeadline(deadline, std::chrono::steady_clock::now(), options_.tick_interval, skipped);
            if (skipped > 0) {
                stats_.skipped_ticks += skipped;
                LogDebug(TAG, "tick overran, skipped " + std::to_string(skipped));
            }
            continue;
        }

        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(wait + std::chrono::milliseconds(1), slice));
    }
    Shutdown();
}

void Scheduler::Shutdown() {
    if (state_ == SchedulerState::ShuttingDown) return;
    setState(SchedulerState::ShuttingDown);
    if (device_) {
        if (options_.backlight_off_on_exit) {
            try {
                device_->SetBacklight(0);
            } catch (const DeviceError& e) {
                LogWarn(TAG, std::string("backlight off failed: ") + e.what());
            }
        }
        device_->Close();
        device_.reset();
    }
    LogInfo(TAG, "stopped after " + std::to_string(stats_.uploads) + " upload(s)");
}
