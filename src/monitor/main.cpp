/// @file main.cpp
/// @brief driftwatch entry point: one monitoring run per invocation

#include <iostream>

#include <CLI/CLI.hpp>

#include "common/config.h"
#include "common/logging.h"
#include "common/metrics.h"
#include "monitor/monitor_config.h"
#include "monitor/monitoring_run.h"

namespace {

constexpr const char* kVersion = "1.0.0";

/// Exit code for invalid configuration, distinct from run outcomes
constexpr int kConfigExitCode = 3;

/// Exit code for a completed run whose report could not be written
constexpr int kOutputExitCode = 4;

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"driftwatch - statistical drift monitoring for deployed models"};

    std::string config_path;
    std::string model_id;
    std::string environment;
    double threshold = 0.1;
    std::string data_source;
    std::string data_dir;
    uint32_t seed = 42;
    std::string telemetry_endpoint;
    std::string output_path;
    std::string log_level;
    bool dry_run = false;
    bool parallel = false;
    bool version_flag = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    auto* model_opt = app.add_option("--model-id", model_id, "Model to monitor")
                          ->envname("MODEL_ID");
    auto* env_opt = app.add_option("--environment", environment, "Deployment environment")
                        ->envname("ENVIRONMENT");
    auto* threshold_opt = app.add_option("--threshold", threshold,
                                         "Significance threshold in (0, 1]");
    auto* source_opt = app.add_option("--data-source", data_source, "Data source")
                           ->check(CLI::IsMember({"synthetic", "file"}));
    auto* dir_opt = app.add_option("--data-dir", data_dir, "Snapshot root for file data");
    auto* seed_opt = app.add_option("--seed", seed, "Seed for synthetic data");
    auto* endpoint_opt = app.add_option("--telemetry-endpoint", telemetry_endpoint,
                                        "Metrics ingestion URL");
    auto* level_opt = app.add_option("--log-level", log_level,
                                     "Log level (trace, debug, info, warn, error)");
    app.add_option("--output", output_path, "Write the JSON report to a file");
    app.add_flag("--dry-run", dry_run, "Log metrics instead of sending them");
    app.add_flag("--parallel", parallel, "Run the three detections concurrently");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << "driftwatch v" << kVersion << std::endl;
        return 0;
    }

    // Layers: defaults < file < environment < command line
    driftwatch::Config config;
    if (!config_path.empty()) {
        auto file_config = driftwatch::Config::LoadFromFile(config_path);
        if (!file_config.ok()) {
            std::cerr << "Failed to load config: " << file_config.status().message() << std::endl;
            return kConfigExitCode;
        }
        config.Merge(*file_config);
    }
    config.Merge(driftwatch::Config::LoadFromEnvironment());

    if (*model_opt) config.Set("monitor.model_id", model_id);
    if (*env_opt) config.Set("monitor.environment", environment);
    if (*threshold_opt) config.Set("detector.threshold", threshold);
    if (parallel) config.Set("detector.parallel", true);
    if (*source_opt) config.Set("data_source.type", data_source);
    if (*dir_opt) config.Set("data_source.root", data_dir);
    if (*seed_opt) config.Set("data_source.seed", static_cast<int64_t>(seed));
    if (*endpoint_opt) config.Set("telemetry.endpoint", telemetry_endpoint);
    if (dry_run) config.Set("telemetry.dry_run", true);
    if (*level_opt) config.Set("logging.level", log_level);

    auto settings = driftwatch::monitor::MonitorConfig::FromConfig(config);
    if (!settings.ok()) {
        std::cerr << "Invalid configuration: " << settings.status().message() << std::endl;
        return kConfigExitCode;
    }

    driftwatch::LogConfig log_config;
    log_config.level = settings->log_level;
    driftwatch::InitLogging(log_config);

    DRIFTWATCH_LOG_INFO("driftwatch v{} starting", kVersion);
    DRIFTWATCH_LOG_DEBUG("Effective configuration: {}", config.ToJson().dump());

    auto source = driftwatch::monitor::CreateDataSource(*settings);
    if (!source.ok()) {
        DRIFTWATCH_LOG_ERROR("Failed to create data source: {}", source.status().message());
        driftwatch::ShutdownLogging();
        return kConfigExitCode;
    }
    auto sink = driftwatch::monitor::CreateTelemetrySink(*settings);
    if (!sink.ok()) {
        DRIFTWATCH_LOG_ERROR("Failed to create telemetry sink: {}", sink.status().message());
        driftwatch::ShutdownLogging();
        return kConfigExitCode;
    }

    DRIFTWATCH_LOG_INFO("Configuration:");
    DRIFTWATCH_LOG_INFO("  Model: {} ({})", settings->model_id, settings->environment);
    DRIFTWATCH_LOG_INFO("  Threshold: {}", settings->run.threshold.threshold);
    DRIFTWATCH_LOG_INFO("  Data source: {}", (*source)->Name());
    DRIFTWATCH_LOG_INFO("  Telemetry sink: {}", (*sink)->Name());

    auto publisher = std::make_shared<driftwatch::monitor::MetricsPublisher>(
        *sink, settings->telemetry.publisher);
    auto runner = driftwatch::monitor::MonitoringRunner::Create(*source, publisher, settings->run);
    if (!runner.ok()) {
        DRIFTWATCH_LOG_ERROR("Failed to create monitoring run: {}", runner.status().message());
        driftwatch::ShutdownLogging();
        return kConfigExitCode;
    }

    auto result = (*runner)->Run(settings->model_id, settings->environment);

    // The report is written even when publishing failed. A completed run
    // whose report could not be written is not a success.
    int exit_code = result.ExitCode();
    absl::Status written = absl::OkStatus();
    if (output_path.empty()) {
        std::cout << result.ToJson().dump(2) << std::endl;
        if (!std::cout) {
            written = absl::InternalError("failed to write report to stdout");
        }
    } else {
        written = driftwatch::monitor::WriteRunResult(result, output_path);
    }
    if (!written.ok()) {
        DRIFTWATCH_LOG_ERROR("Failed to write report: {}", written.message());
        if (exit_code == 0) {
            exit_code = kOutputExitCode;
        }
    } else if (!output_path.empty()) {
        DRIFTWATCH_LOG_INFO("Report written to {}", output_path);
    }

    DRIFTWATCH_LOG_DEBUG("Self-metrics:\n{}", driftwatch::MetricsRegistry::Instance().ExportText());
    DRIFTWATCH_LOG_INFO("Run finished: {} (exit code {})",
                        driftwatch::monitor::RunStateToString(result.state), exit_code);
    driftwatch::ShutdownLogging();

    return exit_code;
}
