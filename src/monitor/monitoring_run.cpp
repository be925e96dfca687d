#include "monitor/monitoring_run.h"

#include <array>
#include <atomic>
#include <fstream>
#include <future>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"

namespace driftwatch::monitor {

using json = nlohmann::json;

namespace {

constexpr size_t kDetectionWorkers = 3;

constexpr std::array<DriftType, 3> kDetectionOrder = {
    DriftType::kData, DriftType::kConcept, DriftType::kPrediction};

absl::StatusOr<DriftResult> RunDetection(const DriftDetector& detector,
                                         const MonitoringData& data,
                                         DriftType type) {
    switch (type) {
        case DriftType::kData:
            return detector.DetectDataDrift(data.current, data.baseline,
                                            data.feature_names);
        case DriftType::kConcept:
            return detector.DetectConceptDrift(data.predictions, data.actuals,
                                               data.baseline_accuracy);
        case DriftType::kPrediction:
            return detector.DetectPredictionDrift(data.current_predictions,
                                                  data.baseline_predictions);
    }
    return absl::InternalError("unknown drift type");
}

absl::Status DetectionError(const absl::Status& status, DriftType type) {
    return AnnotateError(status, absl::StrCat(std::string(DriftTypeToString(type)), " drift detection"));
}

void Transition(RunResult& result, RunState next) {
    DRIFTWATCH_LOG_DEBUG("Run {}/{}: {} -> {}", result.model_id, result.environment,
                         RunStateToString(result.state), RunStateToString(next));
    result.state = next;
    result.transitions.push_back(next);
}

void Fail(RunResult& result, const absl::Status& status) {
    result.failed_stage = result.state;
    result.status = status;
    DRIFTWATCH_LOG_ERROR("Monitoring run for {} failed while {}: {}", result.model_id,
                         RunStateToString(result.state), status.ToString());
    Transition(result, RunState::kFailed);
    DRIFTWATCH_COUNTER("driftwatch_runs_failed_total").Increment();
}

}  // namespace

std::string_view RunStateToString(RunState state) {
    switch (state) {
        case RunState::kInitializing: return "initializing";
        case RunState::kDetecting:    return "detecting";
        case RunState::kPublishing:   return "publishing";
        case RunState::kCompleted:    return "completed";
        case RunState::kFailed:       return "failed";
    }
    return "unknown";
}

// =============================================================================
// RunResult
// =============================================================================

int RunResult::ExitCode() const {
    if (state == RunState::kCompleted) {
        return 0;
    }
    if (failed_stage == RunState::kPublishing) {
        return 2;
    }
    return 1;
}

json RunResult::ToJson() const {
    json j;
    j["model_id"] = model_id;
    j["environment"] = environment;
    j["state"] = std::string(RunStateToString(state));
    j["metrics_delivered"] = MetricsDelivered();
    j["report"] = report ? report->ToJson() : json(nullptr);
    if (!summary.empty()) {
        j["summary"] = summary;
    }
    if (!status.ok()) {
        j["error"] = {
            {"kind", std::string(ErrorCodeToString(GetErrorCode(status)))},
            {"message", std::string(status.message())},
        };
        if (failed_detection) {
            j["error"]["detection"] = std::string(DriftTypeToString(*failed_detection));
        }
    }
    if (!publish_status.ok()) {
        j["publish_error"] = {
            {"kind", std::string(ErrorCodeToString(GetErrorCode(publish_status)))},
            {"message", std::string(publish_status.message())},
        };
    }
    return j;
}

absl::Status WriteRunResult(const RunResult& result, const std::filesystem::path& path) {
    std::ofstream out(path);
    if (!out) {
        return absl::InternalError(
            absl::StrCat("cannot open ", path.string(), " for writing"));
    }
    out << result.ToJson().dump(2) << '\n';
    out.close();
    if (!out) {
        return absl::InternalError(absl::StrCat("failed to write ", path.string()));
    }
    return absl::OkStatus();
}

// =============================================================================
// MonitoringRunner
// =============================================================================

absl::StatusOr<std::unique_ptr<MonitoringRunner>> MonitoringRunner::Create(
    std::shared_ptr<DataSource> data_source,
    std::shared_ptr<MetricsPublisher> publisher,
    MonitoringRunOptions options) {

    if (!data_source) {
        return absl::InvalidArgumentError("monitoring run needs a data source");
    }
    if (!publisher) {
        return absl::InvalidArgumentError("monitoring run needs a metrics publisher");
    }
    DRIFTWATCH_RETURN_IF_ERROR(options.threshold.Validate());
    if (options.fetch_timeout.count() <= 0) {
        return absl::InvalidArgumentError("fetch timeout must be positive");
    }

    return std::unique_ptr<MonitoringRunner>(new MonitoringRunner(
        std::move(data_source), std::move(publisher), options));
}

MonitoringRunner::MonitoringRunner(std::shared_ptr<DataSource> data_source,
                                   std::shared_ptr<MetricsPublisher> publisher,
                                   MonitoringRunOptions options)
    : data_source_(std::move(data_source)),
      publisher_(std::move(publisher)),
      options_(options) {
    if (options_.parallel_detection) {
        pool_ = std::make_unique<ThreadPool>(kDetectionWorkers);
    }
}

RunResult MonitoringRunner::Run(const std::string& model_id,
                                const std::string& environment) {
    ScopedTimer timer(DRIFTWATCH_HISTOGRAM("driftwatch_run_duration_seconds"));
    DRIFTWATCH_COUNTER("driftwatch_runs_total").Increment();

    RunResult result;
    result.model_id = model_id;
    result.environment = environment;
    result.transitions.push_back(RunState::kInitializing);

    DRIFTWATCH_LOG_INFO("Starting drift monitoring for model {} in {}", model_id,
                        environment);

    if (model_id.empty() || environment.empty()) {
        Fail(result, ConfigurationError("model id and environment must not be empty"));
        return result;
    }

    auto data = data_source_->Fetch(model_id, environment, options_.fetch_timeout);
    if (!data.ok()) {
        Fail(result, AnnotateError(data.status(),
                                   absl::StrCat("fetching data from ", data_source_->Name())));
        return result;
    }

    Transition(result, RunState::kDetecting);

    auto detector = DriftDetector::Create(options_.threshold);
    if (!detector.ok()) {
        Fail(result, detector.status());
        return result;
    }

    auto report = pool_ ? DetectParallel(*detector, *data, result.failed_detection)
                        : DetectSequential(*detector, *data, result.failed_detection);
    if (!report.ok()) {
        Fail(result, report.status());
        return result;
    }

    result.summary = report->Summary();
    result.report = std::move(*report);
    DRIFTWATCH_LOG_INFO("Drift report for {}: {}", model_id, result.summary);
    if (result.report->AnyDetected()) {
        DRIFTWATCH_COUNTER("driftwatch_drift_detected_total").Increment();
    }

    Transition(result, RunState::kPublishing);

    result.publish_status = Publish(*result.report, model_id);
    if (!result.publish_status.ok()) {
        // The report stays available for a later Publish call
        result.failed_stage = RunState::kPublishing;
        DRIFTWATCH_LOG_ERROR("Publishing drift metrics for {} failed: {}", model_id,
                             result.publish_status.ToString());
        Transition(result, RunState::kFailed);
        DRIFTWATCH_COUNTER("driftwatch_runs_failed_total").Increment();
        return result;
    }

    Transition(result, RunState::kCompleted);
    DRIFTWATCH_LOG_INFO("Drift monitoring for model {} completed", model_id);
    return result;
}

absl::Status MonitoringRunner::Publish(const DriftReport& report,
                                       const std::string& model_id) {
    auto status = publisher_->Publish(report, model_id);
    if (!status.ok()) {
        DRIFTWATCH_COUNTER("driftwatch_publish_failures_total").Increment();
    }
    return status;
}

absl::StatusOr<DriftReport> MonitoringRunner::DetectSequential(
    const DriftDetector& detector, const MonitoringData& data,
    std::optional<DriftType>& failed) const {

    std::array<DriftResult, 3> results;
    for (size_t i = 0; i < kDetectionOrder.size(); ++i) {
        const DriftType type = kDetectionOrder[i];
        auto result = RunDetection(detector, data, type);
        if (!result.ok()) {
            failed = type;
            return DetectionError(result.status(), type);
        }
        results[i] = std::move(*result);
    }

    return DriftReport::Build(std::move(results[0]), std::move(results[1]),
                              std::move(results[2]));
}

absl::StatusOr<DriftReport> MonitoringRunner::DetectParallel(
    const DriftDetector& detector, const MonitoringData& data,
    std::optional<DriftType>& failed) {

    // Set by the first failing detection; detections that have not started
    // yet are skipped
    std::atomic<bool> cancelled{false};

    std::vector<std::future<absl::StatusOr<DriftResult>>> futures;
    futures.reserve(kDetectionOrder.size());
    for (DriftType type : kDetectionOrder) {
        futures.push_back(pool_->Submit(
            [&detector, &data, &cancelled, type]() -> absl::StatusOr<DriftResult> {
                if (cancelled.load()) {
                    return absl::CancelledError("skipped after an earlier detection failed");
                }
                auto result = RunDetection(detector, data, type);
                if (!result.ok()) {
                    cancelled.store(true);
                }
                return result;
            }));
    }

    // Wait for every task before inspecting results, the tasks reference
    // locals of this frame
    std::vector<absl::StatusOr<DriftResult>> results;
    results.reserve(futures.size());
    for (auto& future : futures) {
        results.push_back(future.get());
    }

    for (size_t i = 0; i < results.size(); ++i) {
        const auto& status = results[i].status();
        if (!status.ok() && !absl::IsCancelled(status)) {
            failed = kDetectionOrder[i];
            return DetectionError(status, kDetectionOrder[i]);
        }
    }

    return DriftReport::Build(std::move(*results[0]), std::move(*results[1]),
                              std::move(*results[2]));
}

}  // namespace driftwatch::monitor
