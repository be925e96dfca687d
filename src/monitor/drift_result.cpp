#include "monitor/drift_result.h"

#include <absl/time/time.h>

namespace driftwatch::monitor {

using json = nlohmann::json;

std::string_view DriftTypeToString(DriftType type) {
    switch (type) {
        case DriftType::kData:
            return "data";
        case DriftType::kConcept:
            return "concept";
        case DriftType::kPrediction:
            return "prediction";
        default:
            return "unknown";
    }
}

std::string_view DriftTypeKey(DriftType type) {
    switch (type) {
        case DriftType::kData:
            return "data_drift";
        case DriftType::kConcept:
            return "concept_drift";
        case DriftType::kPrediction:
            return "prediction_drift";
        default:
            return "unknown_drift";
    }
}

double DriftResult::Value(std::string_view field) const {
    auto it = values.find(std::string(field));
    return it == values.end() ? 0.0 : it->second;
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    return absl::FormatTime("%Y-%m-%dT%H:%M:%E3SZ", absl::FromChrono(tp),
                            absl::UTCTimeZone());
}

json ToJson(const DriftResult& result) {
    json j;
    j["detected"] = result.detected;
    j["score"] = result.score;
    j["threshold"] = result.threshold;
    for (const auto& [field, value] : result.values) {
        j[field] = value;
    }
    if (result.type == DriftType::kData) {
        j["affected_features"] = result.affected_features;
        j["feature_scores"] = result.feature_scores;
    }
    j["explanation"] = result.explanation;
    j["detected_at"] = FormatTimestamp(result.detected_at);
    return j;
}

}  // namespace driftwatch::monitor
