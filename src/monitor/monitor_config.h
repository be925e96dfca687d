#pragma once

/// @file monitor_config.h
/// @brief Typed settings for a monitoring job
///
/// Example configuration:
/// @code
///   monitor:
///     model_id: churn-model
///     environment: prod
///   detector:
///     threshold: 0.05
///     parallel: false
///   data_source:
///     type: file            # synthetic | file
///     root: /var/lib/driftwatch
///     fetch_timeout_ms: 30000
///   telemetry:
///     endpoint: http://metrics.internal:8080/v1/metrics
///     namespace: MLOps/Monitoring
///     batch_size: 20
///   logging:
///     level: info
/// @endcode

#include <chrono>
#include <memory>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "common/logging.h"
#include "monitor/data_source.h"
#include "monitor/drift_detector.h"
#include "monitor/metrics_publisher.h"
#include "monitor/monitoring_run.h"
#include "monitor/telemetry_sink.h"

namespace driftwatch::monitor {

/// @brief Fully resolved monitoring job settings
struct MonitorConfig {
    std::string model_id = "demo-model";
    std::string environment = "dev";

    MonitoringRunOptions run;

    struct DataSourceSettings {
        std::string type = "synthetic";  ///< "synthetic" or "file"
        std::string root = ".";          ///< Snapshot root for "file"
        SyntheticDataConfig synthetic;
    } data_source;

    struct TelemetrySettings {
        /// Without an endpoint metrics go to the log
        HttpTelemetryConfig http;
        PublisherConfig publisher;
        bool dry_run = false;
    } telemetry;

    LogLevel log_level = LogLevel::kInfo;

    /// @brief Build typed settings from a merged configuration
    /// @return ConfigurationError for values that do not parse or validate
    static absl::StatusOr<MonitorConfig> FromConfig(const Config& config);

    /// @brief Check ranges and enumerations
    absl::Status Validate() const;
};

/// @brief Data source selected by the configuration
absl::StatusOr<std::shared_ptr<DataSource>> CreateDataSource(const MonitorConfig& config);

/// @brief HTTP sink when an endpoint is configured and this is not a dry
///        run, log sink otherwise
absl::StatusOr<std::shared_ptr<TelemetrySink>> CreateTelemetrySink(const MonitorConfig& config);

}  // namespace driftwatch::monitor
