#include "monitor/metrics_publisher.h"

#include <algorithm>
#include <cmath>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftwatch::monitor {

MetricsPublisher::MetricsPublisher(std::shared_ptr<TelemetrySink> sink,
                                   PublisherConfig config)
    : sink_(std::move(sink)), config_(std::move(config)) {
    if (config_.batch_size == 0) {
        config_.batch_size = 1;
    }
}

absl::Status MetricsPublisher::Publish(const DriftReport& report,
                                       const std::string& model_id) {
    DRIFTWATCH_ASSIGN_OR_RETURN(auto fields, report.NumericFields());
    return Publish(fields, model_id);
}

absl::StatusOr<std::vector<Metric>> MetricsPublisher::BuildMetrics(
    const std::map<std::string, double>& fields,
    const std::string& model_id,
    std::chrono::system_clock::time_point timestamp) const {

    if (model_id.empty()) {
        return absl::InvalidArgumentError("model id must not be empty");
    }

    std::vector<Metric> metrics;
    metrics.reserve(fields.size());
    for (const auto& [key, value] : fields) {
        if (!std::isfinite(value)) {
            return absl::InvalidArgumentError(
                absl::StrCat("metric ", key, " is not finite"));
        }
        metrics.push_back(Metric{
            .name = absl::StrCat(model_id, "/", key),
            .value = value,
            .unit = config_.unit,
            .timestamp = timestamp,
        });
    }
    return metrics;
}

absl::Status MetricsPublisher::Publish(const std::map<std::string, double>& fields,
                                       const std::string& model_id) {
    if (!sink_) {
        return absl::FailedPreconditionError("no telemetry sink configured");
    }

    DRIFTWATCH_ASSIGN_OR_RETURN(
        std::vector<Metric> metrics,
        BuildMetrics(fields, model_id, std::chrono::system_clock::now()));

    size_t delivered = 0;
    while (delivered < metrics.size()) {
        const size_t end = std::min(metrics.size(), delivered + config_.batch_size);
        std::vector<Metric> batch(metrics.begin() + delivered, metrics.begin() + end);

        auto status = sink_->Emit(batch);
        if (!status.ok()) {
            // Sinks are expected to return PublishError; anything else is
            // still a delivery failure from the caller's point of view
            const std::string context = absl::StrCat(
                "publishing to ", sink_->Name(), " failed after ", delivered,
                " of ", metrics.size(), " metrics");
            if (IsPublishError(status)) {
                return AnnotateError(status, context);
            }
            return PublishError(absl::StrCat(context, ": ", status.message()));
        }
        delivered = end;
    }

    DRIFTWATCH_LOG_INFO("Metrics published for model {} ({} metrics via {})",
                        model_id, metrics.size(), sink_->Name());
    return absl::OkStatus();
}

}  // namespace driftwatch::monitor
