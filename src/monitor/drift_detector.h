#pragma once

/// @file drift_detector.h
/// @brief Data, concept and prediction drift detection

#include <cstdint>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "monitor/dataset.h"
#include "monitor/drift_result.h"

namespace driftwatch::monitor {

/// @brief Significance threshold shared by all detections of one detector
struct ThresholdConfig {
    /// p-value cutoff for data drift, ratio cutoff for concept and
    /// prediction drift. Valid range is (0, 1]: the upper bound is
    /// inclusive, wider than the open (0, 1), so that a threshold of 1
    /// flags every feature whose p-value is below 1.
    double threshold = 0.1;

    absl::Status Validate() const;
};

/// @brief Evaluates the three drift kinds against one fixed threshold
///
/// The detector keeps no dataset state: every call is a pure function of its
/// arguments and the threshold, so one instance may be shared across threads.
/// Use separately configured instances when drift kinds need different
/// thresholds.
///
/// Example:
/// @code
///   auto detector = DriftDetector::Create({.threshold = 0.1});
///   auto data = detector->DetectDataDrift(current, baseline, features);
///   if (data.ok() && data->detected) { ... }
/// @endcode
class DriftDetector {
public:
    /// @brief Create a detector
    /// @return InvalidArgument if the threshold is outside (0, 1]
    static absl::StatusOr<DriftDetector> Create(ThresholdConfig config);

    /// @brief Per-feature KS tests between current and baseline
    ///
    /// A feature is affected when its p-value is strictly below the
    /// threshold; score is 100 x the largest KS statistic over all features.
    /// The "p_value" detail is the p-value of the last feature evaluated;
    /// "max_drift_p_value" belongs to the feature with the largest statistic.
    ///
    /// @return SchemaMismatchError if widths or the feature count disagree,
    ///         InsufficientDataError if either dataset has fewer than 2 rows
    absl::StatusOr<DriftResult> DetectDataDrift(
        const Dataset& current,
        const Dataset& baseline,
        const std::vector<std::string>& feature_names) const;

    /// @brief Accuracy degradation against a recorded baseline accuracy
    ///
    /// Symmetric in predictions and actuals.
    ///
    /// @return InsufficientDataError on empty input, SchemaMismatchError on
    ///         a length mismatch
    absl::StatusOr<DriftResult> DetectConceptDrift(
        const std::vector<int64_t>& predictions,
        const std::vector<int64_t>& actuals,
        double baseline_accuracy) const;

    /// @brief Relative shift of the mean model output
    ///
    /// @return InsufficientDataError on empty input, DegenerateBaselineError
    ///         if the baseline mean is zero
    absl::StatusOr<DriftResult> DetectPredictionDrift(
        const std::vector<double>& current_predictions,
        const std::vector<double>& baseline_predictions) const;

    double Threshold() const { return config_.threshold; }

private:
    explicit DriftDetector(ThresholdConfig config) : config_(config) {}

    ThresholdConfig config_;
};

}  // namespace driftwatch::monitor
