#pragma once

/// @file data_source.h
/// @brief Acquisition of the baseline and current snapshots for a model

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "monitor/dataset.h"

namespace driftwatch::monitor {

/// @brief Everything one monitoring run needs
struct MonitoringData {
    Dataset current;
    Dataset baseline;
    std::vector<std::string> feature_names;

    /// Class labels for concept drift
    std::vector<int64_t> predictions;
    std::vector<int64_t> actuals;

    /// Previously recorded accuracy; not computed by the engine
    double baseline_accuracy = 0.0;

    /// Raw model outputs for prediction drift
    std::vector<double> current_predictions;
    std::vector<double> baseline_predictions;
};

/// @brief Supplies monitoring data for a (model id, environment) pair
///
/// Failures are reported as DataSourceError.
class DataSource {
public:
    virtual ~DataSource() = default;

    /// @param timeout Upper bound for remote acquisition
    virtual absl::StatusOr<MonitoringData> Fetch(
        const std::string& model_id,
        const std::string& environment,
        std::chrono::milliseconds timeout) = 0;

    virtual std::string Name() const = 0;
};

/// @brief Reads snapshots written by the data export job
///
/// Layout: {root}/mlops-data-{environment}/monitoring/{model_id}/snapshot.json
/// @code
///   {"feature_names": ["f1", "f2"],
///    "current": [[0.1, 2.0], ...], "baseline": [[0.2, 1.9], ...],
///    "predictions": [1, 0, ...], "actuals": [1, 1, ...],
///    "baseline_accuracy": 0.95,
///    "current_predictions": [0.4, ...], "baseline_predictions": [0.5, ...]}
/// @endcode
/// Reads are local, so the timeout is not applied. A model id or environment
/// that is empty, "." or "..", or contains a path separator is rejected with
/// DataSourceError so reads never leave the root.
class JsonFileDataSource : public DataSource {
public:
    explicit JsonFileDataSource(std::filesystem::path root);

    absl::StatusOr<MonitoringData> Fetch(
        const std::string& model_id,
        const std::string& environment,
        std::chrono::milliseconds timeout) override;

    std::string Name() const override { return "file"; }

    std::filesystem::path SnapshotPath(const std::string& model_id,
                                       const std::string& environment) const;

    /// @brief Decode a snapshot document
    static absl::StatusOr<MonitoringData> Parse(const nlohmann::json& snapshot);

private:
    std::filesystem::path root_;
};

/// @brief Settings for generated data
struct SyntheticDataConfig {
    uint32_t seed = 42;
    size_t rows = 100;
    size_t features = 5;

    /// Accuracy reported as the recorded baseline
    double baseline_accuracy = 0.95;

    /// Added to every current feature value to simulate data drift
    double current_shift = 0.0;
};

/// @brief Seeded standard-normal data for demos and tests
///
/// Draws, in order: current matrix, baseline matrix, predicted labels, actual
/// labels (0/1), current predictions, baseline predictions. Uses std::mt19937
/// and a Box-Muller transform, so a seed reproduces the same values on every
/// standard library. model_id and environment do not influence the data.
class SyntheticDataSource : public DataSource {
public:
    explicit SyntheticDataSource(SyntheticDataConfig config = {});

    absl::StatusOr<MonitoringData> Fetch(
        const std::string& model_id,
        const std::string& environment,
        std::chrono::milliseconds timeout) override;

    std::string Name() const override { return "synthetic"; }

private:
    SyntheticDataConfig config_;
};

}  // namespace driftwatch::monitor
