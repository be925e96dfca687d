#include "monitor/monitor_config.h"

#include <cmath>
#include <cstdint>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace driftwatch::monitor {

namespace {

// Config getters fall back to the default on a bad value; these reject it
// instead so a typo in a threshold does not go unnoticed.

absl::StatusOr<double> ReadDouble(const Config& config, std::string_view key,
                                  double default_value) {
    if (!config.HasKey(key)) {
        return default_value;
    }
    double value = 0.0;
    const std::string raw = config.GetString(key);
    if (!absl::SimpleAtod(raw, &value)) {
        return ConfigurationError(absl::StrCat(absl::string_view(key.data(), key.size()), ": '", raw, "' is not a number"));
    }
    return value;
}

absl::StatusOr<int64_t> ReadInt(const Config& config, std::string_view key,
                                int64_t default_value) {
    if (!config.HasKey(key)) {
        return default_value;
    }
    int64_t value = 0;
    const std::string raw = config.GetString(key);
    if (!absl::SimpleAtoi(raw, &value)) {
        return ConfigurationError(absl::StrCat(absl::string_view(key.data(), key.size()), ": '", raw, "' is not an integer"));
    }
    return value;
}

absl::StatusOr<bool> ReadBool(const Config& config, std::string_view key,
                              bool default_value) {
    if (!config.HasKey(key)) {
        return default_value;
    }
    bool value = false;
    const std::string raw = config.GetString(key);
    if (!absl::SimpleAtob(raw, &value)) {
        return ConfigurationError(absl::StrCat(absl::string_view(key.data(), key.size()), ": '", raw, "' is not a boolean"));
    }
    return value;
}

absl::StatusOr<uint64_t> ReadCount(const Config& config, std::string_view key,
                                   uint64_t default_value) {
    DRIFTWATCH_ASSIGN_OR_RETURN(int64_t value,
                                ReadInt(config, key, static_cast<int64_t>(default_value)));
    if (value < 0) {
        return ConfigurationError(absl::StrCat(absl::string_view(key.data(), key.size()), " must not be negative"));
    }
    return static_cast<uint64_t>(value);
}

}  // namespace

absl::StatusOr<MonitorConfig> MonitorConfig::FromConfig(const Config& config) {
    MonitorConfig result;

    result.model_id = config.GetString("monitor.model_id", result.model_id);
    result.environment = config.GetString("monitor.environment", result.environment);

    // Detector
    DRIFTWATCH_ASSIGN_OR_RETURN(
        result.run.threshold.threshold,
        ReadDouble(config, "detector.threshold", result.run.threshold.threshold));
    DRIFTWATCH_ASSIGN_OR_RETURN(
        result.run.parallel_detection,
        ReadBool(config, "detector.parallel", result.run.parallel_detection));

    // Data source
    result.data_source.type = absl::AsciiStrToLower(
        config.GetString("data_source.type", result.data_source.type));
    result.data_source.root = config.GetString("data_source.root", result.data_source.root);
    DRIFTWATCH_ASSIGN_OR_RETURN(
        int64_t fetch_timeout_ms,
        ReadInt(config, "data_source.fetch_timeout_ms", result.run.fetch_timeout.count()));
    result.run.fetch_timeout = std::chrono::milliseconds(fetch_timeout_ms);

    auto& synthetic = result.data_source.synthetic;
    DRIFTWATCH_ASSIGN_OR_RETURN(uint64_t seed,
                                ReadCount(config, "data_source.seed", synthetic.seed));
    if (seed > UINT32_MAX) {
        return ConfigurationError("data_source.seed must fit in 32 bits");
    }
    synthetic.seed = static_cast<uint32_t>(seed);
    DRIFTWATCH_ASSIGN_OR_RETURN(synthetic.rows,
                                ReadCount(config, "data_source.rows", synthetic.rows));
    DRIFTWATCH_ASSIGN_OR_RETURN(synthetic.features,
                                ReadCount(config, "data_source.features", synthetic.features));
    DRIFTWATCH_ASSIGN_OR_RETURN(
        synthetic.baseline_accuracy,
        ReadDouble(config, "data_source.baseline_accuracy", synthetic.baseline_accuracy));
    DRIFTWATCH_ASSIGN_OR_RETURN(
        synthetic.current_shift,
        ReadDouble(config, "data_source.current_shift", synthetic.current_shift));

    // Telemetry
    auto& http = result.telemetry.http;
    http.endpoint = config.GetString("telemetry.endpoint", http.endpoint);
    http.metric_namespace = config.GetString("telemetry.namespace", http.metric_namespace);
    http.token = config.GetString("telemetry.token", http.token);
    DRIFTWATCH_ASSIGN_OR_RETURN(
        int64_t connect_ms,
        ReadInt(config, "telemetry.connect_timeout_ms", http.connect_timeout.count()));
    DRIFTWATCH_ASSIGN_OR_RETURN(
        int64_t request_ms,
        ReadInt(config, "telemetry.request_timeout_ms", http.request_timeout.count()));
    http.connect_timeout = std::chrono::milliseconds(connect_ms);
    http.request_timeout = std::chrono::milliseconds(request_ms);

    auto& publisher = result.telemetry.publisher;
    publisher.unit = config.GetString("telemetry.unit", publisher.unit);
    DRIFTWATCH_ASSIGN_OR_RETURN(
        publisher.batch_size,
        ReadCount(config, "telemetry.batch_size", publisher.batch_size));
    DRIFTWATCH_ASSIGN_OR_RETURN(
        result.telemetry.dry_run,
        ReadBool(config, "telemetry.dry_run", result.telemetry.dry_run));

    // Logging
    if (config.HasKey("logging.level")) {
        auto level = ParseLogLevel(config.GetString("logging.level"));
        if (!level.ok()) {
            return ConfigurationError(absl::StrCat("logging.level: ", level.status().message()));
        }
        result.log_level = *level;
    }

    DRIFTWATCH_RETURN_IF_ERROR(result.Validate());
    return result;
}

absl::Status MonitorConfig::Validate() const {
    if (model_id.empty()) {
        return ConfigurationError("monitor.model_id must not be empty");
    }
    if (environment.empty()) {
        return ConfigurationError("monitor.environment must not be empty");
    }

    auto threshold_status = run.threshold.Validate();
    if (!threshold_status.ok()) {
        return ConfigurationError(
            absl::StrCat("detector.threshold: ", threshold_status.message()));
    }

    if (data_source.type != "synthetic" && data_source.type != "file") {
        return ConfigurationError(absl::StrCat(
            "data_source.type must be 'synthetic' or 'file', got '", data_source.type, "'"));
    }
    if (data_source.type == "file" && data_source.root.empty()) {
        return ConfigurationError("data_source.root is required for file data");
    }
    if (data_source.type == "synthetic") {
        const auto& synthetic = data_source.synthetic;
        if (synthetic.rows == 0 || synthetic.features == 0) {
            return ConfigurationError("synthetic data needs at least one row and feature");
        }
        if (!std::isfinite(synthetic.baseline_accuracy) ||
            synthetic.baseline_accuracy < 0.0 || synthetic.baseline_accuracy > 1.0) {
            return ConfigurationError("data_source.baseline_accuracy must be in [0, 1]");
        }
        if (!std::isfinite(synthetic.current_shift)) {
            return ConfigurationError("data_source.current_shift must be finite");
        }
    }

    if (run.fetch_timeout.count() <= 0) {
        return ConfigurationError("data_source.fetch_timeout_ms must be positive");
    }
    if (telemetry.http.connect_timeout.count() <= 0 ||
        telemetry.http.request_timeout.count() <= 0) {
        return ConfigurationError("telemetry timeouts must be positive");
    }
    if (telemetry.publisher.batch_size == 0) {
        return ConfigurationError("telemetry.batch_size must be positive");
    }
    if (telemetry.publisher.unit.empty()) {
        return ConfigurationError("telemetry.unit must not be empty");
    }
    if (!telemetry.http.endpoint.empty() && telemetry.http.metric_namespace.empty()) {
        return ConfigurationError("telemetry.namespace must not be empty");
    }

    return absl::OkStatus();
}

absl::StatusOr<std::shared_ptr<DataSource>> CreateDataSource(const MonitorConfig& config) {
    if (config.data_source.type == "file") {
        return std::make_shared<JsonFileDataSource>(config.data_source.root);
    }
    if (config.data_source.type == "synthetic") {
        return std::make_shared<SyntheticDataSource>(config.data_source.synthetic);
    }
    return ConfigurationError(
        absl::StrCat("unknown data source type '", config.data_source.type, "'"));
}

absl::StatusOr<std::shared_ptr<TelemetrySink>> CreateTelemetrySink(const MonitorConfig& config) {
    if (config.telemetry.dry_run || config.telemetry.http.endpoint.empty()) {
        return std::make_shared<LogTelemetrySink>();
    }
    auto sink = HttpTelemetrySink::Create(config.telemetry.http);
    if (!sink.ok()) {
        return ConfigurationError(
            absl::StrCat("telemetry.endpoint: ", sink.status().message()));
    }
    return std::shared_ptr<TelemetrySink>(std::move(*sink));
}

}  // namespace driftwatch::monitor
