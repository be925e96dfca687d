#pragma once

/// @file telemetry_sink.h
/// @brief Telemetry backends receiving published drift metrics

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

namespace httplib {
class Client;
}  // namespace httplib

namespace driftwatch::monitor {

/// @brief One named measurement submitted to the telemetry backend
struct Metric {
    std::string name;   ///< "{model_id}/{metric_key}"
    double value = 0.0;
    std::string unit;   ///< e.g. "Percent"
    std::chrono::system_clock::time_point timestamp;
};

/// @brief Backend accepting batches of metrics
///
/// Implementations report every delivery failure as a PublishError and do
/// not retry.
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;

    /// @brief Deliver one batch
    virtual absl::Status Emit(const std::vector<Metric>& metrics) = 0;

    virtual std::string Name() const = 0;
};

/// @brief HTTP ingestion endpoint configuration
struct HttpTelemetryConfig {
    /// Full URL, e.g. "http://localhost:8125/v1/metrics"
    std::string endpoint;

    /// Metric namespace sent with every batch
    std::string metric_namespace = "MLOps/Monitoring";

    /// Bearer token (optional)
    std::string token;

    std::chrono::milliseconds connect_timeout{2000};
    std::chrono::milliseconds request_timeout{5000};
};

/// @brief Posts metric batches as JSON to an HTTP ingestion endpoint
///
/// Body:
/// @code
///   {"namespace": "MLOps/Monitoring",
///    "metric_data": [{"metric_name": "m/data_drift_score", "value": 12.0,
///                     "unit": "Percent", "timestamp": "2024-01-01T00:00:00.000Z"}]}
/// @endcode
class HttpTelemetrySink : public TelemetrySink {
public:
    /// @return InvalidArgument if the endpoint is not an http(s) URL
    static absl::StatusOr<std::unique_ptr<HttpTelemetrySink>> Create(
        HttpTelemetryConfig config);

    ~HttpTelemetrySink() override;

    HttpTelemetrySink(const HttpTelemetrySink&) = delete;
    HttpTelemetrySink& operator=(const HttpTelemetrySink&) = delete;

    absl::Status Emit(const std::vector<Metric>& metrics) override;
    std::string Name() const override { return "http"; }

    /// @brief Request body for a batch
    static nlohmann::json BuildPayload(const std::vector<Metric>& metrics,
                                       const std::string& metric_namespace);

private:
    HttpTelemetrySink(HttpTelemetryConfig config, std::string base_url, std::string path);

    HttpTelemetryConfig config_;
    std::string base_url_;
    std::string path_;

    std::mutex mutex_;
    std::unique_ptr<httplib::Client> client_;
};

/// @brief Writes every metric to the log; for local runs and dry runs
class LogTelemetrySink : public TelemetrySink {
public:
    absl::Status Emit(const std::vector<Metric>& metrics) override;
    std::string Name() const override { return "log"; }
};

}  // namespace driftwatch::monitor
