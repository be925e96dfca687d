#include "metrics.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <sstream>

namespace driftwatch {

namespace {

// Run latencies in seconds; detection is local math, acquisition and publish
// cross the network
const std::vector<double> kDefaultBuckets = {
    0.001, 0.005, 0.01, 0.05, 0.1, 0.5, 1.0, 5.0, 10.0, 30.0
};

void AtomicAdd(std::atomic<double>& target, double delta) {
    double current = target.load(std::memory_order_relaxed);
    while (!target.compare_exchange_weak(current, current + delta,
                                         std::memory_order_relaxed)) {
    }
}

}  // namespace

Counter::Counter(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

void Counter::Increment() {
    value_.fetch_add(1, std::memory_order_relaxed);
}

void Counter::Add(int64_t delta) {
    if (delta >= 0) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }
}

int64_t Counter::Value() const {
    return value_.load(std::memory_order_relaxed);
}

Histogram::Histogram(std::string name, std::string description)
    : Histogram(std::move(name), kDefaultBuckets, std::move(description)) {}

Histogram::Histogram(std::string name, std::vector<double> buckets, std::string description)
    : name_(std::move(name)),
      description_(std::move(description)),
      bucket_bounds_(std::move(buckets)),
      bucket_counts_(bucket_bounds_.size() + 1) {
    std::sort(bucket_bounds_.begin(), bucket_bounds_.end());
    for (auto& count : bucket_counts_) {
        count.store(0, std::memory_order_relaxed);
    }
}

void Histogram::Observe(double value) {
    count_.fetch_add(1, std::memory_order_relaxed);
    AtomicAdd(sum_, value);

    auto it = std::lower_bound(bucket_bounds_.begin(), bucket_bounds_.end(), value);
    const auto bucket_idx = static_cast<size_t>(std::distance(bucket_bounds_.begin(), it));
    bucket_counts_[bucket_idx].fetch_add(1, std::memory_order_relaxed);
}

int64_t Histogram::Count() const {
    return count_.load(std::memory_order_relaxed);
}

double Histogram::Sum() const {
    return sum_.load(std::memory_order_relaxed);
}

std::vector<std::pair<double, int64_t>> Histogram::Buckets() const {
    std::vector<std::pair<double, int64_t>> result;
    result.reserve(bucket_counts_.size());

    int64_t cumulative = 0;
    for (size_t i = 0; i < bucket_bounds_.size(); ++i) {
        cumulative += bucket_counts_[i].load(std::memory_order_relaxed);
        result.emplace_back(bucket_bounds_[i], cumulative);
    }
    cumulative += bucket_counts_.back().load(std::memory_order_relaxed);
    result.emplace_back(std::numeric_limits<double>::infinity(), cumulative);

    return result;
}

ScopedTimer::ScopedTimer(Histogram& histogram)
    : histogram_(histogram), start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    histogram_.Observe(elapsed.count());
}

MetricsRegistry& MetricsRegistry::Instance() {
    static MetricsRegistry instance;
    return instance;
}

Counter& MetricsRegistry::GetCounter(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = counters_[name];
    if (!slot) {
        slot = std::make_unique<Counter>(name, description);
    }
    return *slot;
}

Histogram& MetricsRegistry::GetHistogram(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = histograms_[name];
    if (!slot) {
        slot = std::make_unique<Histogram>(name, description);
    }
    return *slot;
}

std::string MetricsRegistry::ExportText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    std::map<std::string, const Counter*> counters;
    for (const auto& [name, counter] : counters_) {
        counters.emplace(name, counter.get());
    }
    std::map<std::string, const Histogram*> histograms;
    for (const auto& [name, histogram] : histograms_) {
        histograms.emplace(name, histogram.get());
    }

    for (const auto& [name, counter] : counters) {
        oss << "# HELP " << name << " " << counter->Description() << "\n";
        oss << "# TYPE " << name << " counter\n";
        oss << name << " " << counter->Value() << "\n";
    }

    for (const auto& [name, histogram] : histograms) {
        oss << "# HELP " << name << " " << histogram->Description() << "\n";
        oss << "# TYPE " << name << " histogram\n";
        for (const auto& [bound, count] : histogram->Buckets()) {
            oss << name << "_bucket{le=\"";
            if (std::isinf(bound)) {
                oss << "+Inf";
            } else {
                oss << bound;
            }
            oss << "\"} " << count << "\n";
        }
        oss << name << "_sum " << histogram->Sum() << "\n";
        oss << name << "_count " << histogram->Count() << "\n";
    }

    return oss.str();
}

void MetricsRegistry::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    histograms_.clear();
}

}  // namespace driftwatch
