#include "SystemMetrics.h"
#include "Log.h"
#include "utils.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <fstream>
#include <limits>
#include <sstream>
#include <sys/statvfs.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
std::vector<std::string> list_dir(const std::string& path) {
    std::vector<std::string> names;
    DIR* dir = opendir(path.c_str());
    if (!dir) return names;
    while (struct dirent* ent = readdir(dir)) {
        std::string name = ent->d_name;
        if (name == "." || name == "..") continue;
        names.push_back(name);
    }
    closedir(dir);
    std::sort(names.begin(), names.end());
    return names;
}

bool read_first_line(const std::string& path, std::string& line) {
    std::ifstream f(path);
    if (!f.is_open()) return false;
    if (!std::getline(f, line)) return false;
    line = trim(line);
    return true;
}

bool read_u64(const std::string& path, uint64_t& value) {
    std::ifstream f(path);
    if (!f.is_open()) return false;
    f >> value;
    return !f.fail();
}

bool read_i64(const std::string& path, long long& value) {
    std::ifstream f(path);
    if (!f.is_open()) return false;
    f >> value;
    return !f.fail();
}
}

// --- Constructor / Destructor ---

SystemMetrics::SystemMetrics(const SystemMetricsOptions& options) : options_(options) {
    for (auto& s : options_.sensors) {
        s.match = to_lower(s.match);
    }
    if (options_.mount_points.empty()) {
        options_.mount_points.push_back("/");
    }
}

SystemMetrics::~SystemMetrics() {
    Stop();
}

void SystemMetrics::Start() {
    bool has_slow = options_.nvidia || !options_.syslog_path.empty();
    if (!running_ && has_slow) {
        running_ = true;
        slow_worker_ = std::thread(&SystemMetrics::slow_worker_func, this);
    }
}

void SystemMetrics::Stop() {
    if (running_) {
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            running_ = false;
        }
        wake_.notify_all();
        if (slow_worker_.joinable()) {
            slow_worker_.join();
        }
    }
}

std::chrono::steady_clock::time_point SystemMetrics::now() const {
    if (options_.clock) return options_.clock();
    return std::chrono::steady_clock::now();
}

std::vector<std::string> SystemMetrics::Fields() const {
    std::vector<std::string> fields = {
        "cpu_percent", "cpu_freq_mhz", "cpu_count", "cpu_temp",
        "mem_percent", "mem_used", "mem_total",
        "swap_percent", "swap_used", "swap_total",
        "disk_percent", "disk_used", "disk_total",
        "disk_read", "disk_write", "net_rx", "net_tx",
        "load1", "load_avg", "uptime_seconds", "uptime", "hostname"
    };
    for (const auto& s : options_.sensors) {
        fields.push_back("temp." + s.label);
    }
    if (options_.nvidia) {
        for (int i = 0; i < options_.nvidia_gpus; ++i) {
            std::string p = "gpu" + std::to_string(i) + "_";
            for (const char* f : {"name", "load", "temp", "mem_used", "mem_total", "mem_percent"}) {
                fields.push_back(p + f);
            }
        }
    }
    if (options_.top_processes > 0) {
        fields.push_back("top_cpu");
        fields.push_back("top_mem");
    }
    if (!options_.syslog_path.empty()) {
        fields.push_back("syslog");
    }
    return fields;
}

MetricMap SystemMetrics::Poll() {
    MetricMap out;
    readCpu(out);
    readCpuInfo(out);
    readCpuTemp(out);
    readMemory(out);
    readDiskUsage(out);
    readDiskIo(out);
    readNetwork(out);
    readLoad(out);
    readUptime(out);
    readHostname(out);
    readSensors(out);
    readProcesses(out);

    auto t = now();
    auto max_age = options_.slow_interval * 3;
    std::lock_guard<std::mutex> lock(slow_mutex_);
    for (auto it = slow_cache_.begin(); it != slow_cache_.end();) {
        if (t - it->second.at > max_age) {
            it = slow_cache_.erase(it);
            continue;
        }
        out[it->first] = it->second.sample;
        ++it;
    }
    return out;
}

bool SystemMetrics::rate(const std::string& key, uint64_t value, double& per_second) {
    auto t = now();
    auto it = prev_counters_.find(key);
    bool ok = false;
    if (it != prev_counters_.end()) {
        double dt = std::chrono::duration<double>(t - it->second.time).count();
        if (dt > 0) {
            uint64_t delta = (value > it->second.value) ? (value - it->second.value) : 0;
            per_second = static_cast<double>(delta) / dt;
            ok = true;
        }
    }
    prev_counters_[key] = {value, t};
    return ok;
}

// --- Metric Gathering ---

void SystemMetrics::readCpu(MetricMap& out) {
    std::ifstream stat_file(options_.proc_root + "/stat");
    std::string line;
    if (!std::getline(stat_file, line)) return;
    std::stringstream ss(line);

    std::string cpu_label;
    ss >> cpu_label;
    if (cpu_label != "cpu") return;

    uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0, softirq = 0, steal = 0;
    ss >> user >> nice >> system >> idle >> iowait >> irq >> softirq >> steal;

    uint64_t current_idle = idle + iowait;
    uint64_t current_total = user + nice + system + current_idle + irq + softirq + steal;

    if (prev_cpu_total_ > 0 && current_total > prev_cpu_total_ && current_idle >= prev_cpu_idle_) {
        double total_delta = static_cast<double>(current_total - prev_cpu_total_);
        double idle_delta = static_cast<double>(current_idle - prev_cpu_idle_);
        double usage = std::clamp(100.0 * (1.0 - idle_delta / total_delta), 0.0, 100.0);
        out["cpu_percent"] = MetricSample::Percent("cpu_percent", usage);
    }

    prev_cpu_total_ = current_total;
    prev_cpu_idle_ = current_idle;
}

void SystemMetrics::readCpuInfo(MetricMap& out) {
    std::ifstream cpuinfo(options_.proc_root + "/cpuinfo");
    std::string line;
    int count = 0;
    double mhz_sum = 0.0;
    int mhz_count = 0;
    while (std::getline(cpuinfo, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));
        if (key == "processor") {
            ++count;
        } else if (key == "cpu MHz") {
            try {
                mhz_sum += std::stod(value);
                ++mhz_count;
            } catch (const std::exception&) {
            }
        }
    }
    if (count == 0) {
        count = static_cast<int>(std::thread::hardware_concurrency());
    }
    if (count > 0) {
        out["cpu_count"] = MetricSample::Number("cpu_count", count);
    }

    if (mhz_count > 0) {
        out["cpu_freq_mhz"] = MetricSample::Number("cpu_freq_mhz", mhz_sum / mhz_count, "MHz");
        return;
    }
    uint64_t khz = 0;
    if (read_u64(options_.sys_root + "/devices/system/cpu/cpu0/cpufreq/scaling_cur_freq", khz) && khz > 0) {
        out["cpu_freq_mhz"] = MetricSample::Number("cpu_freq_mhz", khz / 1000.0, "MHz");
    }
}

void SystemMetrics::readCpuTemp(MetricMap& out) {
    for (int i = 0; i < 5; ++i) {
        std::string path = options_.sys_root + "/class/thermal/thermal_zone" + std::to_string(i) + "/temp";
        long long temp_milli_c = 0;
        if (read_i64(path, temp_milli_c)) {
            double temp_c = static_cast<double>(temp_milli_c) / 1000.0;
            if (temp_c > 20 && temp_c < 120) {
                out["cpu_temp"] = MetricSample::Number("cpu_temp", temp_c, "°C");
                return;
            }
        }
    }
}

void SystemMetrics::readMemory(MetricMap& out) {
    std::ifstream meminfo_file(options_.proc_root + "/meminfo");
    if (!meminfo_file.is_open()) return;
    std::string line;
    uint64_t mem_total = 0, mem_available = 0, swap_total = 0, swap_free = 0;
    bool have_available = false;

    while (std::getline(meminfo_file, line)) {
        std::stringstream ss(line);
        std::string key;
        ss >> key;
        if (key == "MemTotal:") {
            ss >> mem_total;
        } else if (key == "MemAvailable:") {
            ss >> mem_available;
            have_available = true;
        } else if (key == "SwapTotal:") {
            ss >> swap_total;
        } else if (key == "SwapFree:") {
            ss >> swap_free;
        }
    }

    if (mem_total > 0 && have_available) {
        double used = static_cast<double>(mem_total - std::min(mem_total, mem_available)) * 1024.0;
        double total = static_cast<double>(mem_total) * 1024.0;
        out["mem_used"] = MetricSample::Bytes("mem_used", used);
        out["mem_total"] = MetricSample::Bytes("mem_total", total);
        out["mem_percent"] = MetricSample::Percent("mem_percent", used / total * 100.0);
    }
    if (swap_total > 0) {
        double used = static_cast<double>(swap_total - std::min(swap_total, swap_free)) * 1024.0;
        double total = static_cast<double>(swap_total) * 1024.0;
        out["swap_used"] = MetricSample::Bytes("swap_used", used);
        out["swap_total"] = MetricSample::Bytes("swap_total", total);
        out["swap_percent"] = MetricSample::Percent("swap_percent", used / total * 100.0);
    }
}

void SystemMetrics::readDiskUsage(MetricMap& out) {
    unsigned long long total = 0;
    unsigned long long used = 0;
    for (const auto& mount : options_.mount_points) {
        struct statvfs vfs;
        if (statvfs(mount.c_str(), &vfs) != 0) continue;
        unsigned long long t = static_cast<unsigned long long>(vfs.f_blocks) * vfs.f_frsize;
        unsigned long long f = static_cast<unsigned long long>(vfs.f_bavail) * vfs.f_frsize;
        total += t;
        used += (t > f) ? (t - f) : 0;
    }
    if (total == 0) return;
    out["disk_used"] = MetricSample::Bytes("disk_used", static_cast<double>(used));
    out["disk_total"] = MetricSample::Bytes("disk_total", static_cast<double>(total));
    out["disk_percent"] = MetricSample::Percent("disk_percent", 100.0 * used / total);
}

std::vector<std::string> SystemMetrics::blockDevices() const {
    if (!options_.disks.empty()) return options_.disks;
    std::vector<std::string> devices;
    for (const auto& name : list_dir(options_.sys_root + "/block")) {
        if (name.rfind("loop", 0) == 0 || name.rfind("ram", 0) == 0 || name.rfind("zram", 0) == 0) continue;
        devices.push_back(name);
    }
    return devices;
}

void SystemMetrics::readDiskIo(MetricMap& out) {
    std::ifstream diskstats(options_.proc_root + "/diskstats");
    if (!diskstats.is_open()) return;
    std::vector<std::string> allowed = blockDevices();
    uint64_t sectors_read = 0;
    uint64_t sectors_written = 0;
    bool any = false;
    std::string line;
    while (std::getline(diskstats, line)) {
        std::stringstream ss(line);
        std::vector<std::string> parts;
        std::string tok;
        while (ss >> tok) parts.push_back(tok);
        if (parts.size() < 10) continue;
        if (std::find(allowed.begin(), allowed.end(), parts[2]) == allowed.end()) continue;
        try {
            sectors_read += std::stoull(parts[5]);
            sectors_written += std::stoull(parts[9]);
            any = true;
        } catch (const std::exception&) {
        }
    }
    if (!any) return;
    double rd = 0.0, wr = 0.0;
    bool ok_r = rate("disk_read", sectors_read * 512, rd);
    bool ok_w = rate("disk_write", sectors_written * 512, wr);
    if (ok_r) out["disk_read"] = MetricSample::Bytes("disk_read", rd, "/s");
    if (ok_w) out["disk_write"] = MetricSample::Bytes("disk_write", wr, "/s");
}

std::vector<std::string> SystemMetrics::networkInterfaces() const {
    if (!options_.networks.empty()) return options_.networks;
    std::vector<std::string> ifaces;
    for (const auto& name : list_dir(options_.sys_root + "/class/net")) {
        if (name == "lo") continue;
        ifaces.push_back(name);
    }
    return ifaces;
}

void SystemMetrics::readNetwork(MetricMap& out) {
    uint64_t rx_total = 0;
    uint64_t tx_total = 0;
    bool any = false;
    for (const auto& iface : networkInterfaces()) {
        std::string base = options_.sys_root + "/class/net/" + iface + "/statistics/";
        uint64_t rx = 0, tx = 0;
        if (read_u64(base + "rx_bytes", rx) && read_u64(base + "tx_bytes", tx)) {
            rx_total += rx;
            tx_total += tx;
            any = true;
        }
    }
    if (!any) return;
    double rx_rate = 0.0, tx_rate = 0.0;
    bool ok_rx = rate("net_rx", rx_total, rx_rate);
    bool ok_tx = rate("net_tx", tx_total, tx_rate);
    if (ok_rx) out["net_rx"] = MetricSample::Bytes("net_rx", rx_rate, "/s");
    if (ok_tx) out["net_tx"] = MetricSample::Bytes("net_tx", tx_rate, "/s");
}

void SystemMetrics::readLoad(MetricMap& out) {
    std::ifstream f(options_.proc_root + "/loadavg");
    double l1 = 0, l5 = 0, l15 = 0;
    if (!(f >> l1 >> l5 >> l15)) return;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f %.2f %.2f", l1, l5, l15);
    out["load1"] = MetricSample::Number("load1", l1);
    out["load_avg"] = MetricSample::Label("load_avg", buf);
}

std::string SystemMetrics::FormatUptime(long seconds) {
    long days = seconds / 86400;
    long hours = (seconds % 86400) / 3600;
    long minutes = (seconds % 3600) / 60;
    long secs = seconds % 60;
    std::string out;
    if (days > 0) out += std::to_string(days) + "d ";
    if (days > 0 || hours > 0) out += std::to_string(hours) + "h ";
    if (days > 0 || hours > 0 || minutes > 0) out += std::to_string(minutes) + "m ";
    out += std::to_string(secs) + "s";
    return out;
}

void SystemMetrics::readUptime(MetricMap& out) {
    std::ifstream uptime_file(options_.proc_root + "/uptime");
    double uptime = 0;
    if (!(uptime_file >> uptime)) return;
    out["uptime_seconds"] = MetricSample::Number("uptime_seconds", uptime, "s");
    out["uptime"] = MetricSample::Label("uptime", FormatUptime(static_cast<long>(uptime)));
}

void SystemMetrics::readHostname(MetricMap& out) {
    std::string name;
    if (!read_first_line(options_.proc_root + "/sys/kernel/hostname", name) || name.empty()) {
        char buf[256] = {0};
        if (gethostname(buf, sizeof(buf) - 1) != 0) return;
        name = buf;
    }
    out["hostname"] = MetricSample::Label("hostname", name);
}

void SystemMetrics::readSensors(MetricMap& out) {
    if (options_.sensors.empty()) return;
    std::string hwmon_root = options_.sys_root + "/class/hwmon";
    for (const auto& hw : list_dir(hwmon_root)) {
        std::string folder = hwmon_root + "/" + hw;
        std::string name, model;
        read_first_line(folder + "/name", name);
        read_first_line(folder + "/device/model", model);
        for (const auto& file : list_dir(folder)) {
            if (file.rfind("temp", 0) != 0) continue;
            auto us = file.find('_');
            if (us == std::string::npos || file.substr(us + 1) != "input") continue;

            std::string label;
            read_first_line(folder + "/" + file.substr(0, us) + "_label", label);
            long long milli = 0;
            if (!read_i64(folder + "/" + file, milli)) continue;

            std::string reference = to_lower(trim(name + " " + label + " " + model + " " + folder + "/" + file));
            for (const auto& s : options_.sensors) {
                std::string field = "temp." + s.label;
                if (out.count(field)) continue;
                if (reference.find(s.match) != std::string::npos) {
                    LogTrace("metrics", "sensor " + reference + " -> " + field);
                    out[field] = MetricSample::Number(field, milli / 1000.0, "°C");
                }
            }
        }
    }
}

std::string SystemMetrics::FormatTopProcesses(std::vector<ProcessReading> procs, bool by_cpu, size_t count) {
    std::sort(procs.begin(), procs.end(), [by_cpu](const ProcessReading& a, const ProcessReading& b) {
        double va = by_cpu ? a.cpu_percent : a.mem_percent;
        double vb = by_cpu ? b.cpu_percent : b.mem_percent;
        if (va != vb) return va > vb;
        return a.pid < b.pid;
    });
    std::string out;
    for (size_t i = 0; i < procs.size() && i < count; ++i) {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "%-12.12s %-7d %5.1f%%", procs[i].name.c_str(), procs[i].pid,
                      by_cpu ? procs[i].cpu_percent : procs[i].mem_percent);
        if (!out.empty()) out += '\n';
        out += buf;
    }
    return out;
}

void SystemMetrics::readProcesses(MetricMap& out) {
    if (options_.top_processes <= 0) return;

    uint64_t total = 0;
    {
        std::ifstream stat_file(options_.proc_root + "/stat");
        std::string label;
        if (!(stat_file >> label) || label != "cpu") return;
        uint64_t v = 0;
        for (int i = 0; i < 8 && stat_file >> v; ++i) total += v;
    }
    uint64_t mem_total_kb = 0;
    {
        std::ifstream meminfo(options_.proc_root + "/meminfo");
        std::string key;
        while (meminfo >> key) {
            if (key == "MemTotal:") {
                meminfo >> mem_total_kb;
                break;
            }
            meminfo.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        }
    }

    const bool have_baseline = prev_proc_total_ > 0 && total > prev_proc_total_;
    const double total_delta = have_baseline ? static_cast<double>(total - prev_proc_total_) : 0.0;
    std::map<int, uint64_t> ticks;
    std::vector<ProcessReading> procs;

    for (const auto& entry : list_dir(options_.proc_root)) {
        bool numeric = !entry.empty() &&
                       std::all_of(entry.begin(), entry.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
        if (!numeric) continue;
        std::string dir = options_.proc_root + "/" + entry;

        // pid (comm) state ppid ... utime stime; comm may hold spaces and parentheses
        std::string stat;
        if (!read_first_line(dir + "/stat", stat)) continue;
        auto open_paren = stat.find('(');
        auto close_paren = stat.rfind(')');
        if (open_paren == std::string::npos || close_paren == std::string::npos || close_paren < open_paren) continue;

        ProcessReading p;
        try {
            p.pid = std::stoi(entry);
        } catch (const std::exception&) {
            continue;
        }
        p.name = stat.substr(open_paren + 1, close_paren - open_paren - 1);
        std::vector<std::string> rest = split(trim(stat.substr(close_paren + 1)), ' ');
        if (rest.size() < 13) continue;
        uint64_t used = 0;
        try {
            used = std::stoull(rest[11]) + std::stoull(rest[12]);
        } catch (const std::exception&) {
            continue;
        }
        ticks[p.pid] = used;
        if (have_baseline) {
            auto prev = prev_proc_ticks_.find(p.pid);
            if (prev != prev_proc_ticks_.end() && used >= prev->second) {
                p.cpu_percent = std::clamp(100.0 * static_cast<double>(used - prev->second) / total_delta, 0.0, 100.0);
            }
        }

        std::ifstream status(dir + "/status");
        std::string key;
        while (status >> key) {
            if (key == "VmRSS:") {
                uint64_t rss_kb = 0;
                status >> rss_kb;
                if (mem_total_kb > 0) p.mem_percent = 100.0 * static_cast<double>(rss_kb) / mem_total_kb;
                break;
            }
            status.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        }
        procs.push_back(p);
    }

    prev_proc_total_ = total;
    prev_proc_ticks_.swap(ticks);
    if (procs.empty()) return;

    const size_t count = static_cast<size_t>(options_.top_processes);
    if (have_baseline) {
        out["top_cpu"] = MetricSample::Label("top_cpu", FormatTopProcesses(procs, true, count));
    }
    if (mem_total_kb > 0) {
        out["top_mem"] = MetricSample::Label("top_mem", FormatTopProcesses(procs, false, count));
    }
}

// --- Slow collectors ---

bool SystemMetrics::exec_with_timeout(const std::string& cmd, int timeout_ms, std::string& output) {
    output.clear();
    int pipefd[2];
    if (pipe(pipefd) != 0) {
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        return false;
    }

    if (pid == 0) {
        // child
        dup2(pipefd[1], STDOUT_FILENO);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) dup2(devnull, STDERR_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);
        execl("/bin/sh", "sh", "-c", cmd.c_str(), (char*)NULL);
        _exit(127);
    }

    // parent
    close(pipefd[1]);
    int flags = fcntl(pipefd[0], F_GETFL, 0);
    fcntl(pipefd[0], F_SETFL, flags | O_NONBLOCK);

    int elapsed_ms = 0;
    const int step_ms = 50;
    bool finished = false;
    int status = 0;
    while (elapsed_ms < timeout_ms) {
        char buf[256];
        ssize_t r = read(pipefd[0], buf, sizeof(buf));
        while (r > 0) {
            output.append(buf, static_cast<size_t>(r));
            r = read(pipefd[0], buf, sizeof(buf));
        }

        pid_t res = waitpid(pid, &status, WNOHANG);
        if (res == pid) {
            finished = true;
            break;
        }
        usleep(step_ms * 1000);
        elapsed_ms += step_ms;
    }

    if (finished) {
        char buf[256];
        ssize_t r = read(pipefd[0], buf, sizeof(buf));
        while (r > 0) {
            output.append(buf, static_cast<size_t>(r));
            r = read(pipefd[0], buf, sizeof(buf));
        }
    } else {
        kill(pid, SIGKILL);
        waitpid(pid, nullptr, 0);
    }

    close(pipefd[0]);
    return finished && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

bool SystemMetrics::ParseNvidiaSmi(const std::string& output, std::vector<GpuReading>& gpus) {
    gpus.clear();
    std::stringstream ss(output);
    std::string line;
    while (std::getline(ss, line)) {
        auto values = split(line, ',');
        if (values.size() != 5) continue;
        for (auto& v : values) v = trim(v);
        GpuReading gpu;
        gpu.name = values[0];
        try {
            gpu.temperature = std::stod(values[1]);
            double raw_load = std::stod(values[2]);
            // Some drivers report a 0..1 fraction instead of a percentage.
            gpu.load_percent = (raw_load > 0.0 && raw_load <= 1.0) ? raw_load * 100.0 : raw_load;
            gpu.memory_used = std::stod(values[3]) * 1024.0 * 1024.0;
            gpu.memory_total = std::stod(values[4]) * 1024.0 * 1024.0;
        } catch (const std::exception&) {
            continue;
        }
        gpus.push_back(gpu);
    }
    return !gpus.empty();
}

void SystemMetrics::collectNvidia(MetricMap& out) {
    std::string output;
    if (!exec_with_timeout(options_.nvidia_command, options_.command_timeout_ms, output)) {
        LogDebug("metrics", "nvidia-smi failed or timed out");
        return;
    }
    std::vector<GpuReading> gpus;
    if (!ParseNvidiaSmi(output, gpus)) return;
    for (size_t i = 0; i < gpus.size() && static_cast<int>(i) < options_.nvidia_gpus; ++i) {
        const auto& g = gpus[i];
        std::string p = "gpu" + std::to_string(i) + "_";
        out[p + "name"] = MetricSample::Label(p + "name", g.name);
        out[p + "load"] = MetricSample::Percent(p + "load", g.load_percent);
        out[p + "temp"] = MetricSample::Number(p + "temp", g.temperature, "°C");
        out[p + "mem_used"] = MetricSample::Bytes(p + "mem_used", g.memory_used);
        out[p + "mem_total"] = MetricSample::Bytes(p + "mem_total", g.memory_total);
        if (g.memory_total > 0) {
            out[p + "mem_percent"] = MetricSample::Percent(p + "mem_percent", g.memory_used / g.memory_total * 100.0);
        }
    }
}

std::string SystemMetrics::TailLines(const std::string& content, int lines, int width) {
    std::vector<std::string> all = split(content, '\n');
    while (!all.empty() && trim(all.back()).empty()) all.pop_back();
    size_t start = all.size() > static_cast<size_t>(std::max(0, lines)) ? all.size() - static_cast<size_t>(lines) : 0;
    std::string out;
    for (size_t i = start; i < all.size(); ++i) {
        std::string l = all[i];
        if (static_cast<int>(l.size()) > width) {
            size_t cut = static_cast<size_t>(width);
            while (cut > 0 && (static_cast<unsigned char>(l[cut]) & 0xC0) == 0x80) --cut;
            l = l.substr(0, cut);
        }
        if (!out.empty()) out += '\n';
        out += l;
    }
    return out;
}

void SystemMetrics::collectSyslog(MetricMap& out) {
    std::ifstream f(options_.syslog_path, std::ios::binary | std::ios::ate);
    if (!f.is_open()) {
        LogDebug("metrics", "cannot open " + options_.syslog_path);
        return;
    }
    const std::streamoff tail_bytes = 64 * 1024;
    std::streamoff size = f.tellg();
    std::streamoff start = std::max<std::streamoff>(0, size - tail_bytes);
    f.seekg(start);
    std::string content(static_cast<size_t>(size - start), '\0');
    f.read(&content[0], size - start);
    content.resize(static_cast<size_t>(f.gcount()));
    out["syslog"] = MetricSample::Label("syslog", TailLines(content, options_.syslog_lines, options_.syslog_width));
}

void SystemMetrics::PollSlowOnce() {
    MetricMap fresh;
    if (options_.nvidia) collectNvidia(fresh);
    if (!options_.syslog_path.empty()) collectSyslog(fresh);
    auto t = now();
    std::lock_guard<std::mutex> lock(slow_mutex_);
    for (auto& [field, sample] : fresh) {
        slow_cache_[field] = CachedSample{sample, t};
    }
}

void SystemMetrics::slow_worker_func() {
    while (running_) {
        PollSlowOnce();
        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_.wait_for(lock, options_.slow_interval, [this] { return !running_; });
    }
}
