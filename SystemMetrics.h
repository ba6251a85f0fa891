#ifndef SYSTEM_METRICS_H
#define SYSTEM_METRICS_H

#include "Metrics.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct SensorMatch {
    std::string match; // substring of "<name> <label> <model> <path>", lowercase
    std::string label;
};

struct SystemMetricsOptions {
    std::string proc_root = "/proc";
    std::string sys_root = "/sys";
    std::vector<std::string> networks;
    std::vector<std::string> disks;
    std::vector<std::string> mount_points;
    std::vector<SensorMatch> sensors;
    bool nvidia = false;
    int nvidia_gpus = 1;
    std::string nvidia_command =
        "nvidia-smi --query-gpu=gpu_name,temperature.gpu,utilization.gpu,memory.used,memory.total "
        "--format=csv,noheader,nounits";
    int command_timeout_ms = 3000;
    std::string syslog_path;
    int syslog_lines = 5;
    int syslog_width = 75;
    int top_processes = 5; // 0 disables top_cpu / top_mem
    std::chrono::milliseconds slow_interval{5000};
    std::function<std::chrono::steady_clock::time_point()> clock;
};

struct ProcessReading {
    int pid = 0;
    std::string name;
    double cpu_percent = 0.0; // share of all CPUs since the previous poll
    double mem_percent = 0.0; // resident set over MemTotal
};

struct GpuReading {
    std::string name;
    double temperature = 0.0;
    double load_percent = 0.0;
    double memory_used = 0.0;  // bytes
    double memory_total = 0.0; // bytes
};

// Linux /proc and /sys reader. External commands run on a slow worker.
class SystemMetrics : public MetricsSource {
public:
    explicit SystemMetrics(const SystemMetricsOptions& options);
    ~SystemMetrics() override;

    std::vector<std::string> Fields() const override;
    MetricMap Poll() override;

    void Start() override;
    void Stop() override;

    // Runs the slow collectors once on the calling thread.
    void PollSlowOnce();

    static bool ParseNvidiaSmi(const std::string& output, std::vector<GpuReading>& gpus);
    static std::string FormatUptime(long seconds);
    static std::string TailLines(const std::string& content, int lines, int width);
    // One "name pid value%" line per process, highest first, at most `count` lines.
    static std::string FormatTopProcesses(std::vector<ProcessReading> procs, bool by_cpu, size_t count);
    static bool exec_with_timeout(const std::string& cmd, int timeout_ms, std::string& output);

private:
    std::chrono::steady_clock::time_point now() const;

    void readCpu(MetricMap& out);
    void readCpuInfo(MetricMap& out);
    void readCpuTemp(MetricMap& out);
    void readMemory(MetricMap& out);
    void readDiskUsage(MetricMap& out);
    void readDiskIo(MetricMap& out);
    void readNetwork(MetricMap& out);
    void readLoad(MetricMap& out);
    void readUptime(MetricMap& out);
    void readHostname(MetricMap& out);
    void readSensors(MetricMap& out);
    void readProcesses(MetricMap& out);

    void collectNvidia(MetricMap& out);
    void collectSyslog(MetricMap& out);
    void slow_worker_func();

    std::vector<std::string> networkInterfaces() const;
    std::vector<std::string> blockDevices() const;

    SystemMetricsOptions options_;

    // For CPU calculation
    uint64_t prev_cpu_total_ = 0;
    uint64_t prev_cpu_idle_ = 0;

    // Per-process utime + stime, keyed by pid
    uint64_t prev_proc_total_ = 0;
    std::map<int, uint64_t> prev_proc_ticks_;

    // For rate calculation
    struct Counter {
        uint64_t value;
        std::chrono::steady_clock::time_point time;
    };
    std::map<std::string, Counter> prev_counters_;
    bool rate(const std::string& key, uint64_t value, double& per_second);

    struct CachedSample {
        MetricSample sample;
        std::chrono::steady_clock::time_point at;
    };
    std::map<std::string, CachedSample> slow_cache_;
    std::mutex slow_mutex_;

    std::thread slow_worker_;
    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
};

#endif // SYSTEM_METRICS_H
