#include "monitor/data_source.h"

#include <cmath>
#include <fstream>
#include <numbers>
#include <random>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftwatch::monitor {

using json = nlohmann::json;

namespace {

/// @brief model_id and environment become single path components below the
///        root; anything that could leave it is rejected
absl::Status ValidatePathComponent(const std::string& value, const char* label) {
    if (value.empty() || value == "." || value == ".." ||
        value.find_first_of("/\\") != std::string::npos ||
        value.find('\0') != std::string::npos) {
        return DataSourceError(absl::StrCat("invalid ", label, " '", value,
                                            "' for a snapshot path"));
    }
    return absl::OkStatus();
}

/// @brief Standard-normal draws with a portable transform
class NormalSampler {
public:
    explicit NormalSampler(uint32_t seed) : engine_(seed) {}

    /// Uniform in the open interval (0, 1)
    double Uniform() {
        return (static_cast<double>(engine_()) + 0.5) / 4294967296.0;
    }

    double Normal() {
        if (has_spare_) {
            has_spare_ = false;
            return spare_;
        }
        const double radius = std::sqrt(-2.0 * std::log(Uniform()));
        const double angle = 2.0 * std::numbers::pi * Uniform();
        spare_ = radius * std::sin(angle);
        has_spare_ = true;
        return radius * std::cos(angle);
    }

    int64_t Bit() {
        return static_cast<int64_t>(engine_() >> 31);
    }

private:
    std::mt19937 engine_;
    double spare_ = 0.0;
    bool has_spare_ = false;
};

absl::StatusOr<Dataset> ParseMatrix(const json& rows, size_t fallback_width,
                                    const char* field) {
    if (!rows.is_array()) {
        return DataSourceError(absl::StrCat("snapshot field '", field, "' must be an array"));
    }

    const size_t width = rows.empty() ? fallback_width : rows.front().size();
    std::vector<std::vector<double>> values;
    values.reserve(rows.size());
    try {
        for (const auto& row : rows) {
            values.push_back(row.get<std::vector<double>>());
        }
    } catch (const json::exception& e) {
        return DataSourceError(absl::StrCat("snapshot field '", field, "': ", e.what()));
    }

    auto dataset = Dataset::FromRows(width, values);
    if (!dataset.ok()) {
        return DataSourceError(absl::StrCat("snapshot field '", field, "' is ragged: ",
                                            dataset.status().message()));
    }
    return dataset;
}

}  // namespace

// =============================================================================
// JsonFileDataSource
// =============================================================================

JsonFileDataSource::JsonFileDataSource(std::filesystem::path root)
    : root_(std::move(root)) {}

std::filesystem::path JsonFileDataSource::SnapshotPath(
    const std::string& model_id, const std::string& environment) const {
    return root_ / absl::StrCat("mlops-data-", environment) / "monitoring" /
           model_id / "snapshot.json";
}

absl::StatusOr<MonitoringData> JsonFileDataSource::Fetch(
    const std::string& model_id,
    const std::string& environment,
    std::chrono::milliseconds /*timeout*/) {

    DRIFTWATCH_RETURN_IF_ERROR(ValidatePathComponent(model_id, "model id"));
    DRIFTWATCH_RETURN_IF_ERROR(ValidatePathComponent(environment, "environment"));

    const auto path = SnapshotPath(model_id, environment);
    std::ifstream in(path);
    if (!in) {
        return DataSourceError(absl::StrCat("cannot open snapshot ", path.string()));
    }

    json snapshot = json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (snapshot.is_discarded()) {
        return DataSourceError(absl::StrCat("snapshot ", path.string(), " is not valid JSON"));
    }

    DRIFTWATCH_LOG_DEBUG("Loaded snapshot {}", path.string());
    return Parse(snapshot);
}

absl::StatusOr<MonitoringData> JsonFileDataSource::Parse(const json& snapshot) {
    if (!snapshot.is_object()) {
        return DataSourceError("snapshot must be a JSON object");
    }

    MonitoringData data;
    try {
        data.feature_names = snapshot.at("feature_names").get<std::vector<std::string>>();
        data.predictions = snapshot.at("predictions").get<std::vector<int64_t>>();
        data.actuals = snapshot.at("actuals").get<std::vector<int64_t>>();
        data.baseline_accuracy = snapshot.at("baseline_accuracy").get<double>();
        data.current_predictions = snapshot.at("current_predictions").get<std::vector<double>>();
        data.baseline_predictions = snapshot.at("baseline_predictions").get<std::vector<double>>();
    } catch (const json::exception& e) {
        return DataSourceError(absl::StrCat("malformed snapshot: ", e.what()));
    }

    if (!snapshot.contains("current") || !snapshot.contains("baseline")) {
        return DataSourceError("snapshot needs 'current' and 'baseline' rows");
    }
    const size_t width = data.feature_names.size();
    DRIFTWATCH_ASSIGN_OR_RETURN(data.current, ParseMatrix(snapshot["current"], width, "current"));
    DRIFTWATCH_ASSIGN_OR_RETURN(data.baseline, ParseMatrix(snapshot["baseline"], width, "baseline"));

    return data;
}

// =============================================================================
// SyntheticDataSource
// =============================================================================

SyntheticDataSource::SyntheticDataSource(SyntheticDataConfig config)
    : config_(config) {}

absl::StatusOr<MonitoringData> SyntheticDataSource::Fetch(
    const std::string& model_id,
    const std::string& environment,
    std::chrono::milliseconds /*timeout*/) {

    NormalSampler sampler(config_.seed);
    MonitoringData data;

    data.feature_names.reserve(config_.features);
    for (size_t f = 0; f < config_.features; ++f) {
        data.feature_names.push_back(absl::StrCat("feature_", f + 1));
    }

    auto fill = [&](Dataset& dataset, double shift) -> absl::Status {
        dataset = Dataset(config_.features);
        std::vector<double> row(config_.features);
        for (size_t r = 0; r < config_.rows; ++r) {
            for (auto& v : row) {
                v = sampler.Normal() + shift;
            }
            DRIFTWATCH_RETURN_IF_ERROR(dataset.AddRow(row));
        }
        return absl::OkStatus();
    };
    DRIFTWATCH_RETURN_IF_ERROR(fill(data.current, config_.current_shift));
    DRIFTWATCH_RETURN_IF_ERROR(fill(data.baseline, 0.0));

    data.predictions.reserve(config_.rows);
    data.actuals.reserve(config_.rows);
    for (size_t i = 0; i < config_.rows; ++i) {
        data.predictions.push_back(sampler.Bit());
    }
    for (size_t i = 0; i < config_.rows; ++i) {
        data.actuals.push_back(sampler.Bit());
    }
    data.baseline_accuracy = config_.baseline_accuracy;

    data.current_predictions.reserve(config_.rows);
    data.baseline_predictions.reserve(config_.rows);
    for (size_t i = 0; i < config_.rows; ++i) {
        data.current_predictions.push_back(sampler.Normal());
    }
    for (size_t i = 0; i < config_.rows; ++i) {
        data.baseline_predictions.push_back(sampler.Normal());
    }

    DRIFTWATCH_LOG_DEBUG("Generated synthetic data for {} in {} (seed {}, {} x {})",
                         model_id, environment, config_.seed, config_.rows,
                         config_.features);
    return data;
}

}  // namespace driftwatch::monitor
