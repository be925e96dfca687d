#include "monitor/telemetry_sink.h"

#include <regex>

#include <absl/strings/str_cat.h>
#include <httplib.h>

#include "common/error.h"
#include "common/logging.h"
#include "monitor/drift_result.h"

namespace driftwatch::monitor {

using json = nlohmann::json;

// =============================================================================
// HttpTelemetrySink
// =============================================================================

absl::StatusOr<std::unique_ptr<HttpTelemetrySink>> HttpTelemetrySink::Create(
    HttpTelemetryConfig config) {

    std::regex url_regex(R"((https?://[^/]+)(/.*)?)", std::regex::icase);
    std::smatch match;
    if (!std::regex_match(config.endpoint, match, url_regex)) {
        return absl::InvalidArgumentError(
            absl::StrCat("telemetry endpoint is not an http(s) URL: ", config.endpoint));
    }

    std::string base_url = match[1].str();
    std::string path = match[2].matched ? match[2].str() : std::string("/");

    return std::unique_ptr<HttpTelemetrySink>(
        new HttpTelemetrySink(std::move(config), std::move(base_url), std::move(path)));
}

HttpTelemetrySink::HttpTelemetrySink(HttpTelemetryConfig config,
                                     std::string base_url,
                                     std::string path)
    : config_(std::move(config)),
      base_url_(std::move(base_url)),
      path_(std::move(path)) {}

HttpTelemetrySink::~HttpTelemetrySink() = default;

json HttpTelemetrySink::BuildPayload(const std::vector<Metric>& metrics,
                                     const std::string& metric_namespace) {
    json data = json::array();
    for (const auto& metric : metrics) {
        data.push_back({
            {"metric_name", metric.name},
            {"value", metric.value},
            {"unit", metric.unit},
            {"timestamp", FormatTimestamp(metric.timestamp)},
        });
    }
    return json{{"namespace", metric_namespace}, {"metric_data", std::move(data)}};
}

absl::Status HttpTelemetrySink::Emit(const std::vector<Metric>& metrics) {
    if (metrics.empty()) {
        return absl::OkStatus();
    }

    const std::string body = BuildPayload(metrics, config_.metric_namespace).dump();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!client_) {
        client_ = std::make_unique<httplib::Client>(base_url_);
        client_->set_connection_timeout(config_.connect_timeout);
        client_->set_read_timeout(config_.request_timeout);
        client_->set_write_timeout(config_.request_timeout);
        if (!config_.token.empty()) {
            client_->set_bearer_token_auth(config_.token);
        }
    }

    httplib::Result res = client_->Post(path_, body, "application/json");
    if (!res) {
        return PublishError(absl::StrCat(
            "telemetry endpoint ", config_.endpoint, " unreachable: ",
            httplib::to_string(res.error())));
    }
    if (res->status < 200 || res->status >= 300) {
        return PublishError(absl::StrCat(
            "telemetry endpoint ", config_.endpoint, " rejected batch with HTTP ",
            res->status, ": ", res->body));
    }

    DRIFTWATCH_LOG_DEBUG("Posted {} metrics to {}", metrics.size(), config_.endpoint);
    return absl::OkStatus();
}

// =============================================================================
// LogTelemetrySink
// =============================================================================

absl::Status LogTelemetrySink::Emit(const std::vector<Metric>& metrics) {
    for (const auto& metric : metrics) {
        DRIFTWATCH_LOG_INFO("metric {} = {:.6g} {} @ {}", metric.name, metric.value,
                            metric.unit, FormatTimestamp(metric.timestamp));
    }
    return absl::OkStatus();
}

}  // namespace driftwatch::monitor
