#pragma once

/// @file drift_result.h
/// @brief Result of a single drift detection operation

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace driftwatch::monitor {

/// @brief Kinds of drift the detector evaluates
enum class DriftType {
    kData,        ///< Input feature distribution shift
    kConcept,     ///< Accuracy degradation against a recorded baseline
    kPrediction   ///< Model output distribution shift
};

/// @brief Short name: "data", "concept", "prediction"
std::string_view DriftTypeToString(DriftType type);

/// @brief Report key: "data_drift", "concept_drift", "prediction_drift"
std::string_view DriftTypeKey(DriftType type);

/// Detail field names
inline constexpr std::string_view kPValueField = "p_value";
inline constexpr std::string_view kMaxDriftPValueField = "max_drift_p_value";
inline constexpr std::string_view kMaxStatisticField = "max_statistic";
inline constexpr std::string_view kCurrentAccuracyField = "current_accuracy";
inline constexpr std::string_view kBaselineAccuracyField = "baseline_accuracy";
inline constexpr std::string_view kCurrentMeanField = "current_mean";
inline constexpr std::string_view kBaselineMeanField = "baseline_mean";

/// @brief Result of one detection operation
struct DriftResult {
    DriftType type = DriftType::kData;
    bool detected = false;

    /// Severity in percent. Not capped at 100 for prediction drift.
    double score = 0.0;

    /// Threshold the result was classified against
    double threshold = 0.0;

    /// Scalar detail fields (p-values, accuracies, means), published as metrics
    std::map<std::string, double> values;

    /// Features whose p-value fell below the threshold, in feature order
    std::vector<std::string> affected_features;

    /// KS statistic per feature (data drift only)
    std::map<std::string, double> feature_scores;

    std::string explanation;
    std::chrono::system_clock::time_point detected_at;

    /// @brief Look up a detail value, 0.0 if absent
    double Value(std::string_view field) const;
};

/// @brief Serialize a result as {"detected", "score", ...detail fields}
nlohmann::json ToJson(const DriftResult& result);

/// @brief Format a timestamp as ISO-8601 UTC with millisecond precision
std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

}  // namespace driftwatch::monitor
