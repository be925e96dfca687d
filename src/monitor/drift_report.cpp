#include "monitor/drift_report.h"

#include <absl/strings/str_cat.h>

namespace driftwatch::monitor {

namespace {

absl::Status CheckSlot(const DriftResult& result, DriftType expected) {
    if (result.type != expected) {
        return absl::InvalidArgumentError(absl::StrCat(
            "expected a ", std::string(DriftTypeToString(expected)), " drift result, got ",
            std::string(DriftTypeToString(result.type))));
    }
    return absl::OkStatus();
}

}  // namespace

absl::StatusOr<DriftReport> DriftReport::Build(DriftResult data_drift,
                                               DriftResult concept_drift,
                                               DriftResult prediction_drift) {
    for (auto status : {CheckSlot(data_drift, DriftType::kData),
                        CheckSlot(concept_drift, DriftType::kConcept),
                        CheckSlot(prediction_drift, DriftType::kPrediction)}) {
        if (!status.ok()) {
            return status;
        }
    }
    return DriftReport(std::move(data_drift), std::move(concept_drift),
                       std::move(prediction_drift));
}

const DriftResult& DriftReport::Get(DriftType type) const {
    switch (type) {
        case DriftType::kConcept:
            return concept_;
        case DriftType::kPrediction:
            return prediction_;
        case DriftType::kData:
        default:
            return data_;
    }
}

bool DriftReport::AnyDetected() const {
    return data_.detected || concept_.detected || prediction_.detected;
}

nlohmann::json DriftReport::ToJson() const {
    nlohmann::json j;
    for (const DriftResult* result : {&data_, &concept_, &prediction_}) {
        j[std::string(DriftTypeKey(result->type))] = monitor::ToJson(*result);
    }
    return j;
}

absl::StatusOr<std::map<std::string, double>> DriftReport::NumericFields() const {
    std::map<std::string, double> fields;

    auto add = [&fields](const std::string& key, double value) -> absl::Status {
        if (!fields.emplace(key, value).second) {
            return absl::InternalError(absl::StrCat("duplicate metric key: ", key));
        }
        return absl::OkStatus();
    };

    for (const DriftResult* result : {&data_, &concept_, &prediction_}) {
        const std::string prefix = absl::StrCat(std::string(DriftTypeKey(result->type)), "_");
        auto status = add(prefix + "detected", result->detected ? 1.0 : 0.0);
        if (status.ok()) {
            status = add(prefix + "score", result->score);
        }
        for (const auto& [field, value] : result->values) {
            if (!status.ok()) {
                break;
            }
            status = add(prefix + field, value);
        }
        if (!status.ok()) {
            return status;
        }
    }

    return fields;
}

std::string DriftReport::Summary() const {
    auto flag = [](bool detected) { return detected ? "true" : "false"; };
    return absl::StrCat("Data drift: ", flag(data_.detected),
                        ", Concept drift: ", flag(concept_.detected),
                        ", Prediction drift: ", flag(prediction_.detected));
}

}  // namespace driftwatch::monitor
