#include "monitor/drift_detector.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_set>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"
#include "monitor/statistical_test.h"

namespace driftwatch::monitor {

namespace {

absl::StatusOr<double> Mean(const std::vector<double>& values, const char* label) {
    if (values.empty()) {
        return InsufficientDataError(absl::StrCat("no ", label, " values"));
    }
    for (double v : values) {
        if (!std::isfinite(v)) {
            return absl::InvalidArgumentError(
                absl::StrCat("non-finite value in ", label));
        }
    }
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

}  // namespace

absl::Status ThresholdConfig::Validate() const {
    if (!std::isfinite(threshold) || threshold <= 0.0 || threshold > 1.0) {
        return absl::InvalidArgumentError(
            absl::StrCat("threshold must be in (0, 1], got ", threshold));
    }
    return absl::OkStatus();
}

absl::StatusOr<DriftDetector> DriftDetector::Create(ThresholdConfig config) {
    DRIFTWATCH_RETURN_IF_ERROR(config.Validate());
    return DriftDetector(config);
}

absl::StatusOr<DriftResult> DriftDetector::DetectDataDrift(
    const Dataset& current,
    const Dataset& baseline,
    const std::vector<std::string>& feature_names) const {

    // Shape checks come first so a schema problem is reported regardless of
    // how many rows either side has
    if (current.Width() != baseline.Width()) {
        return SchemaMismatchError(absl::StrCat(
            "current dataset has ", current.Width(), " features, baseline has ",
            baseline.Width()));
    }
    if (feature_names.size() != current.Width()) {
        return SchemaMismatchError(absl::StrCat(
            feature_names.size(), " feature names for datasets of width ",
            current.Width()));
    }
    std::unordered_set<std::string> seen;
    for (const auto& name : feature_names) {
        if (!seen.insert(name).second) {
            return absl::InvalidArgumentError(
                absl::StrCat("duplicate feature name: ", name));
        }
    }
    if (feature_names.empty()) {
        return InsufficientDataError("datasets have no features");
    }

    DriftResult result;
    result.type = DriftType::kData;
    result.threshold = config_.threshold;

    double max_statistic = 0.0;
    double max_statistic_p_value = 1.0;
    double last_p_value = 1.0;

    for (size_t f = 0; f < feature_names.size(); ++f) {
        const std::string& feature = feature_names[f];

        DRIFTWATCH_ASSIGN_OR_RETURN(std::vector<double> current_values, current.Column(f));
        DRIFTWATCH_ASSIGN_OR_RETURN(std::vector<double> baseline_values, baseline.Column(f));

        auto test = KolmogorovSmirnovTest(current_values, baseline_values);
        if (!test.ok()) {
            return AnnotateError(test.status(), absl::StrCat("feature '", feature, "'"));
        }

        DRIFTWATCH_LOG_TRACE("Feature {}: KS statistic {:.4f}, p-value {:.4g}",
                             feature, test->statistic, test->p_value);

        result.feature_scores[feature] = test->statistic;
        if (test->p_value < config_.threshold) {
            result.affected_features.push_back(feature);
        }
        if (f == 0 || test->statistic > max_statistic) {
            max_statistic = test->statistic;
            max_statistic_p_value = test->p_value;
        }
        last_p_value = test->p_value;
    }

    result.detected = !result.affected_features.empty();
    result.score = 100.0 * max_statistic;
    result.values[std::string(kPValueField)] = last_p_value;
    result.values[std::string(kMaxDriftPValueField)] = max_statistic_p_value;
    result.values[std::string(kMaxStatisticField)] = max_statistic;
    result.detected_at = std::chrono::system_clock::now();

    if (result.detected) {
        result.explanation = absl::StrCat(
            "Data drift detected in ", result.affected_features.size(), " of ",
            feature_names.size(), " features: ",
            absl::StrJoin(result.affected_features, ", "));
    } else {
        result.explanation = "Feature distributions are within normal range";
    }

    return result;
}

absl::StatusOr<DriftResult> DriftDetector::DetectConceptDrift(
    const std::vector<int64_t>& predictions,
    const std::vector<int64_t>& actuals,
    double baseline_accuracy) const {

    if (predictions.size() != actuals.size()) {
        return SchemaMismatchError(absl::StrCat(
            predictions.size(), " predictions for ", actuals.size(), " actuals"));
    }
    if (predictions.empty()) {
        return InsufficientDataError("no predictions to compute accuracy from");
    }
    if (!std::isfinite(baseline_accuracy) || baseline_accuracy < 0.0 ||
        baseline_accuracy > 1.0) {
        return absl::InvalidArgumentError(absl::StrCat(
            "baseline accuracy must be in [0, 1], got ", baseline_accuracy));
    }

    size_t correct = 0;
    for (size_t i = 0; i < predictions.size(); ++i) {
        if (predictions[i] == actuals[i]) {
            ++correct;
        }
    }
    const double accuracy =
        static_cast<double>(correct) / static_cast<double>(predictions.size());
    const double degradation = std::abs(baseline_accuracy - accuracy);

    DriftResult result;
    result.type = DriftType::kConcept;
    result.threshold = config_.threshold;
    result.detected = degradation > config_.threshold;
    result.score = 100.0 * degradation;
    result.values[std::string(kCurrentAccuracyField)] = accuracy;
    result.values[std::string(kBaselineAccuracyField)] = baseline_accuracy;
    result.detected_at = std::chrono::system_clock::now();
    result.explanation = result.detected
        ? absl::StrCat("Accuracy moved from ", baseline_accuracy, " to ", accuracy)
        : std::string("Accuracy is within tolerance of the baseline");

    return result;
}

absl::StatusOr<DriftResult> DriftDetector::DetectPredictionDrift(
    const std::vector<double>& current_predictions,
    const std::vector<double>& baseline_predictions) const {

    DRIFTWATCH_ASSIGN_OR_RETURN(double current_mean,
                                Mean(current_predictions, "current predictions"));
    DRIFTWATCH_ASSIGN_OR_RETURN(double baseline_mean,
                                Mean(baseline_predictions, "baseline predictions"));

    if (baseline_mean == 0.0) {
        return DegenerateBaselineError(
            "baseline prediction mean is zero, relative shift is undefined");
    }

    const double ratio = std::abs((current_mean - baseline_mean) / baseline_mean);
    if (!std::isfinite(ratio)) {
        return DegenerateBaselineError(absl::StrCat(
            "relative shift overflowed for baseline mean ", baseline_mean));
    }

    DriftResult result;
    result.type = DriftType::kPrediction;
    result.threshold = config_.threshold;
    result.detected = ratio > config_.threshold;
    result.score = 100.0 * ratio;
    result.values[std::string(kCurrentMeanField)] = current_mean;
    result.values[std::string(kBaselineMeanField)] = baseline_mean;
    result.detected_at = std::chrono::system_clock::now();
    result.explanation = result.detected
        ? absl::StrCat("Mean prediction shifted by ", result.score, "% of baseline")
        : std::string("Prediction distribution is stable");

    return result;
}

}  // namespace driftwatch::monitor
