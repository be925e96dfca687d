#pragma once

/// @file metrics.h
/// @brief Process-local self-metrics for the monitoring engine
///
/// These describe the engine itself (runs, failures, latencies). Drift
/// metrics about monitored models go through monitor::MetricsPublisher.

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace driftwatch {

/// @brief Monotonic counter
class Counter {
public:
    explicit Counter(std::string name, std::string description = "");

    void Increment();

    /// @brief Add a non-negative amount; negative deltas are ignored
    void Add(int64_t delta);

    int64_t Value() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::atomic<int64_t> value_{0};
};

/// @brief Cumulative-bucket histogram of observed values
class Histogram {
public:
    /// @brief Histogram with latency buckets in seconds
    explicit Histogram(std::string name, std::string description = "");

    Histogram(std::string name, std::vector<double> buckets, std::string description = "");

    void Observe(double value);

    int64_t Count() const;
    double Sum() const;

    /// @brief (upper bound, cumulative count) pairs, ending with +Inf
    std::vector<std::pair<double, int64_t>> Buckets() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::vector<double> bucket_bounds_;
    std::vector<std::atomic<int64_t>> bucket_counts_;
    std::atomic<int64_t> count_{0};
    std::atomic<double> sum_{0.0};
};

/// @brief Records the lifetime of the scope into a histogram
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// @brief Registry owning all self-metrics of the process
class MetricsRegistry {
public:
    static MetricsRegistry& Instance();

    /// @brief Register or get an existing counter
    Counter& GetCounter(const std::string& name, const std::string& description = "");

    /// @brief Register or get an existing histogram
    Histogram& GetHistogram(const std::string& name, const std::string& description = "");

    /// @brief Prometheus-style text export, sorted by metric name
    std::string ExportText() const;

    /// @brief Drop all metrics (tests only)
    void Reset();

private:
    MetricsRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Counter>> counters_;
    std::unordered_map<std::string, std::unique_ptr<Histogram>> histograms_;
};

#define DRIFTWATCH_COUNTER(name) \
    ::driftwatch::MetricsRegistry::Instance().GetCounter(name)

#define DRIFTWATCH_HISTOGRAM(name) \
    ::driftwatch::MetricsRegistry::Instance().GetHistogram(name)

}  // namespace driftwatch
