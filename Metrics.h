#ifndef METRICS_H
#define METRICS_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

enum class SampleKind {
    Number,
    Percentage,
    Bytes,
    Text
};

struct MetricSample {
    std::string field;
    SampleKind kind = SampleKind::Number;
    double value = 0.0;
    std::string text;
    std::string unit;
    std::chrono::system_clock::time_point captured_at;

    static MetricSample Number(const std::string& field, double value, const std::string& unit = "");
    static MetricSample Percent(const std::string& field, double value);
    static MetricSample Bytes(const std::string& field, double value, const std::string& unit = "");
    static MetricSample Label(const std::string& field, const std::string& text);

    bool IsNumeric() const { return kind != SampleKind::Text; }
};

using MetricMap = std::map<std::string, MetricSample>;

// Fixed-capacity ring of samples; At(0) is the oldest retained one.
class MetricHistory {
public:
    explicit MetricHistory(size_t capacity = 60);

    void Push(const MetricSample& sample);
    void Clear();

    size_t Size() const { return size_; }
    size_t Capacity() const { return ring_.size(); }
    bool Empty() const { return size_ == 0; }

    const MetricSample& At(size_t index) const;
    const MetricSample& Latest() const;
    std::vector<double> Values() const;

    // Keeps the newest min(Size(), capacity) samples.
    void Resize(size_t capacity);

private:
    std::vector<MetricSample> ring_;
    size_t head_ = 0; // index of the oldest element
    size_t size_ = 0;
};

// Immutable view published by the collector.
struct MetricSnapshot {
    uint64_t version = 0;
    std::chrono::system_clock::time_point taken_at;
    MetricMap samples;
    std::map<std::string, MetricHistory> histories;

    const MetricSample* Find(const std::string& field) const;
    const MetricHistory* History(const std::string& field) const;
};

class MetricsSource {
public:
    virtual ~MetricsSource() = default;

    // Fields this source may report; layouts are validated against it.
    virtual std::vector<std::string> Fields() const = 0;

    // One sample per field that could be read right now.
    virtual MetricMap Poll() = 0;

    virtual void Start() {}
    virtual void Stop() {}
};

// Polls a source on its own worker thread and publishes versioned snapshots.
class MetricsCollector {
public:
    MetricsCollector(MetricsSource& source, size_t default_history);
    ~MetricsCollector();

    void SetHistoryCapacity(const std::string& field, size_t capacity);

    void Start(std::chrono::milliseconds interval);
    void Stop();

    // One poll + publish on the calling thread.
    void CollectOnce();

    std::shared_ptr<const MetricSnapshot> Snapshot() const;
    uint64_t Version() const;

private:
    void worker_func(std::chrono::milliseconds interval);

    MetricsSource& source_;
    size_t default_history_;
    std::map<std::string, size_t> capacities_;

    // Owned by the polling thread.
    std::map<std::string, MetricHistory> histories_;
    uint64_t next_version_ = 1;
    std::mutex collect_mutex_;

    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const MetricSnapshot> snapshot_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
};

#endif // METRICS_H
