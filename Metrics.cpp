#include "Metrics.h"
#include "Log.h"
#include <algorithm>
#include <stdexcept>

MetricSample MetricSample::Number(const std::string& field, double value, const std::string& unit) {
    MetricSample s;
    s.field = field;
    s.kind = SampleKind::Number;
    s.value = value;
    s.unit = unit;
    s.captured_at = std::chrono::system_clock::now();
    return s;
}

MetricSample MetricSample::Percent(const std::string& field, double value) {
    MetricSample s = Number(field, value, "%");
    s.kind = SampleKind::Percentage;
    return s;
}

MetricSample MetricSample::Bytes(const std::string& field, double value, const std::string& unit) {
    MetricSample s = Number(field, value, unit);
    s.kind = SampleKind::Bytes;
    return s;
}

MetricSample MetricSample::Label(const std::string& field, const std::string& text) {
    MetricSample s;
    s.field = field;
    s.kind = SampleKind::Text;
    s.text = text;
    s.captured_at = std::chrono::system_clock::now();
    return s;
}

// --- MetricHistory ---

MetricHistory::MetricHistory(size_t capacity) : ring_(std::max<size_t>(1, capacity)) {}

void MetricHistory::Push(const MetricSample& sample) {
    size_t cap = ring_.size();
    if (size_ < cap) {
        ring_[(head_ + size_) % cap] = sample;
        ++size_;
    } else {
        ring_[head_] = sample;
        head_ = (head_ + 1) % cap;
    }
}

void MetricHistory::Clear() {
    head_ = 0;
    size_ = 0;
}

const MetricSample& MetricHistory::At(size_t index) const {
    if (index >= size_) throw std::out_of_range("MetricHistory index");
    return ring_[(head_ + index) % ring_.size()];
}

const MetricSample& MetricHistory::Latest() const {
    if (size_ == 0) throw std::out_of_range("MetricHistory is empty");
    return At(size_ - 1);
}

std::vector<double> MetricHistory::Values() const {
    std::vector<double> out;
    out.reserve(size_);
    for (size_t i = 0; i < size_; ++i) {
        out.push_back(At(i).value);
    }
    return out;
}

void MetricHistory::Resize(size_t capacity) {
    capacity = std::max<size_t>(1, capacity);
    if (capacity == ring_.size()) return;
    std::vector<MetricSample> next(capacity);
    size_t keep = std::min(size_, capacity);
    for (size_t i = 0; i < keep; ++i) {
        next[i] = At(size_ - keep + i);
    }
    ring_.swap(next);
    head_ = 0;
    size_ = keep;
}

// --- MetricSnapshot ---

const MetricSample* MetricSnapshot::Find(const std::string& field) const {
    auto it = samples.find(field);
    return it == samples.end() ? nullptr : &it->second;
}

const MetricHistory* MetricSnapshot::History(const std::string& field) const {
    auto it = histories.find(field);
    return it == histories.end() ? nullptr : &it->second;
}

// --- MetricsCollector ---

MetricsCollector::MetricsCollector(MetricsSource& source, size_t default_history)
    : source_(source), default_history_(std::max<size_t>(2, default_history)),
      snapshot_(std::make_shared<MetricSnapshot>()) {}

MetricsCollector::~MetricsCollector() {
    Stop();
}

void MetricsCollector::SetHistoryCapacity(const std::string& field, size_t capacity) {
    std::lock_guard<std::mutex> lock(collect_mutex_);
    capacities_[field] = std::max(capacities_[field], capacity);
    auto it = histories_.find(field);
    if (it != histories_.end()) {
        it->second.Resize(std::max(default_history_, capacities_[field]));
    }
}

void MetricsCollector::Start(std::chrono::milliseconds interval) {
    if (running_) return;
    running_ = true;
    source_.Start();
    worker_ = std::thread(&MetricsCollector::worker_func, this, interval);
}

void MetricsCollector::Stop() {
    if (!running_) return;
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_ = false;
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    source_.Stop();
}

void MetricsCollector::CollectOnce() {
    std::lock_guard<std::mutex> lock(collect_mutex_);
    MetricMap polled = source_.Poll();

    auto next = std::make_shared<MetricSnapshot>();
    next->taken_at = std::chrono::system_clock::now();
    for (const auto& [field, sample] : polled) {
        if (!sample.IsNumeric()) continue;
        auto it = histories_.find(field);
        if (it == histories_.end()) {
            size_t cap = default_history_;
            auto c = capacities_.find(field);
            if (c != capacities_.end()) cap = std::max(cap, c->second);
            it = histories_.emplace(field, MetricHistory(cap)).first;
        }
        it->second.Push(sample);
    }
    next->samples = std::move(polled);
    next->histories = histories_;
    next->version = next_version_++;

    std::lock_guard<std::mutex> snap_lock(snapshot_mutex_);
    snapshot_ = std::move(next);
}

std::shared_ptr<const MetricSnapshot> MetricsCollector::Snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

uint64_t MetricsCollector::Version() const {
    return Snapshot()->version;
}

void MetricsCollector::worker_func(std::chrono::milliseconds interval) {
    while (running_) {
        try {
            CollectOnce();
        } catch (const std::exception& e) {
            LogWarn("metrics", std::string("poll failed: ") + e.what());
        }
        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_.wait_for(lock, interval, [this] { return !running_; });
    }
}
