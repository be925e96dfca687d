#pragma once

/// @file metrics_publisher.h
/// @brief Turns drift reports into named metrics and ships them to a sink

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "monitor/drift_report.h"
#include "monitor/telemetry_sink.h"

namespace driftwatch::monitor {

/// @brief Publisher settings
struct PublisherConfig {
    std::string unit = "Percent";

    /// Maximum metrics per Emit call
    size_t batch_size = 20;
};

/// @brief Publishes the scalar fields of a report, one metric per field
///
/// Metric names are "{model_id}/{key}". The publisher does not retry; a
/// failed batch ends the call with a PublishError and the caller decides
/// what to do.
class MetricsPublisher {
public:
    MetricsPublisher(std::shared_ptr<TelemetrySink> sink, PublisherConfig config = {});

    /// @brief Publish every numeric field of a report
    absl::Status Publish(const DriftReport& report, const std::string& model_id);

    /// @brief Publish a flat key -> value mapping
    /// @return InvalidArgument for an empty model id or a non-finite value,
    ///         PublishError if the sink fails
    absl::Status Publish(const std::map<std::string, double>& fields,
                         const std::string& model_id);

    /// @brief Metrics that Publish would emit, stamped with @p timestamp
    absl::StatusOr<std::vector<Metric>> BuildMetrics(
        const std::map<std::string, double>& fields,
        const std::string& model_id,
        std::chrono::system_clock::time_point timestamp) const;

    const PublisherConfig& GetConfig() const { return config_; }

private:
    std::shared_ptr<TelemetrySink> sink_;
    PublisherConfig config_;
};

}  // namespace driftwatch::monitor
