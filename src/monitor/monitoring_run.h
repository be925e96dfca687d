#pragma once

/// @file monitoring_run.h
/// @brief Orchestration of one drift monitoring run
///
/// A run moves through Initializing -> Detecting -> Publishing and ends in
/// Completed or Failed:
/// - Initializing: fetch monitoring data for (model id, environment)
/// - Detecting: data, concept and prediction drift, then the report
/// - Publishing: numeric report fields to the telemetry sink
///
/// A failure before Publishing ends the run without publishing anything. A
/// publish failure ends the run as Failed but keeps the computed report, so
/// the caller can retry publishing without recomputing drift.

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "common/thread_pool.h"
#include "monitor/data_source.h"
#include "monitor/drift_detector.h"
#include "monitor/drift_report.h"
#include "monitor/metrics_publisher.h"

namespace driftwatch::monitor {

/// @brief States of a monitoring run
enum class RunState {
    kInitializing,
    kDetecting,
    kPublishing,
    kCompleted,
    kFailed
};

std::string_view RunStateToString(RunState state);

/// @brief Outcome of a monitoring run
struct RunResult {
    std::string model_id;
    std::string environment;

    RunState state = RunState::kInitializing;

    /// Every state entered, in order, starting with kInitializing
    std::vector<RunState> transitions;

    /// State the run was in when it failed
    std::optional<RunState> failed_stage;

    /// Detection operation that failed, if any
    std::optional<DriftType> failed_detection;

    /// Present once detection succeeded, including after a publish failure
    std::optional<DriftReport> report;

    /// Acquisition or detection error
    absl::Status status;

    /// Publish outcome; only meaningful when a report exists
    absl::Status publish_status;

    /// Which detectors fired
    std::string summary;

    bool Completed() const { return state == RunState::kCompleted; }
    bool MetricsDelivered() const { return Completed() && publish_status.ok(); }

    /// @brief Process exit code: 0 completed, 1 acquisition or detection
    ///        failure, 2 publish failure
    int ExitCode() const;

    /// @brief {"model_id", "environment", "state", "metrics_delivered",
    ///         "report", "error", "publish_error"}
    nlohmann::json ToJson() const;
};

/// @brief Write RunResult::ToJson, indented, to a file
/// @return Internal error if the file cannot be opened or fully written
absl::Status WriteRunResult(const RunResult& result, const std::filesystem::path& path);

/// @brief Settings for MonitoringRunner
struct MonitoringRunOptions {
    ThresholdConfig threshold;

    /// Run the three detections on a worker pool
    bool parallel_detection = false;

    /// Passed to the data source
    std::chrono::milliseconds fetch_timeout{30000};
};

/// @brief Drives monitoring runs against injected collaborators
///
/// The data source and publisher are shared by all runs; every run gets its
/// own detector and report, so runs for different models may execute in
/// parallel.
class MonitoringRunner {
public:
    /// @return InvalidArgument for an invalid threshold or missing collaborator
    static absl::StatusOr<std::unique_ptr<MonitoringRunner>> Create(
        std::shared_ptr<DataSource> data_source,
        std::shared_ptr<MetricsPublisher> publisher,
        MonitoringRunOptions options = {});

    MonitoringRunner(const MonitoringRunner&) = delete;
    MonitoringRunner& operator=(const MonitoringRunner&) = delete;

    /// @brief Execute one run
    RunResult Run(const std::string& model_id, const std::string& environment);

    /// @brief Publish an already computed report, e.g. to retry after a
    ///        failed run
    absl::Status Publish(const DriftReport& report, const std::string& model_id);

    const MonitoringRunOptions& Options() const { return options_; }

private:
    MonitoringRunner(std::shared_ptr<DataSource> data_source,
                     std::shared_ptr<MetricsPublisher> publisher,
                     MonitoringRunOptions options);

    /// @brief Run the three detections in order, stopping at the first failure
    absl::StatusOr<DriftReport> DetectSequential(
        const DriftDetector& detector, const MonitoringData& data,
        std::optional<DriftType>& failed) const;

    /// @brief Run the three detections concurrently, fail-fast
    absl::StatusOr<DriftReport> DetectParallel(
        const DriftDetector& detector, const MonitoringData& data,
        std::optional<DriftType>& failed);

    std::shared_ptr<DataSource> data_source_;
    std::shared_ptr<MetricsPublisher> publisher_;
    MonitoringRunOptions options_;
    std::unique_ptr<ThreadPool> pool_;
};

}  // namespace driftwatch::monitor
