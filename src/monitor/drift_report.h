#pragma once

/// @file drift_report.h
/// @brief Aggregated result of one monitoring run

#include <map>
#include <string>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "monitor/drift_result.h"

namespace driftwatch::monitor {

/// @brief The three drift results of one monitoring run
///
/// A report can only be built from all three results, and is read-only
/// afterwards.
class DriftReport {
public:
    /// @brief Combine the three results
    /// @return InvalidArgument if a result is passed in the wrong slot
    static absl::StatusOr<DriftReport> Build(DriftResult data_drift,
                                             DriftResult concept_drift,
                                             DriftResult prediction_drift);

    const DriftResult& DataDrift() const { return data_; }
    const DriftResult& ConceptDrift() const { return concept_; }
    const DriftResult& PredictionDrift() const { return prediction_; }
    const DriftResult& Get(DriftType type) const;

    bool AnyDetected() const;

    /// @brief {"data_drift": {...}, "concept_drift": {...}, "prediction_drift": {...}}
    nlohmann::json ToJson() const;

    /// @brief Every scalar field flattened as "{drift_key}_{field}"
    ///
    /// Covers "detected" (0 or 1), "score" and each numeric detail field,
    /// e.g. "data_drift_score", "concept_drift_current_accuracy". List
    /// fields such as affected feature names are left out.
    ///
    /// @return Internal error if two fields flatten to the same key
    absl::StatusOr<std::map<std::string, double>> NumericFields() const;

    /// @brief "Data drift: true, Concept drift: false, Prediction drift: false"
    std::string Summary() const;

private:
    DriftReport(DriftResult data_drift, DriftResult concept_drift,
                DriftResult prediction_drift)
        : data_(std::move(data_drift)),
          concept_(std::move(concept_drift)),
          prediction_(std::move(prediction_drift)) {}

    DriftResult data_;
    DriftResult concept_;
    DriftResult prediction_;
};

}  // namespace driftwatch::monitor
