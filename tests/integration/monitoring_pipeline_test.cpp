/// @file monitoring_pipeline_test.cpp
/// @brief End-to-end monitoring runs: data source, detection and publishing

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <mutex>

#include <nlohmann/json.hpp>

#include "common/error.h"
#include "monitor/monitor_config.h"
#include "monitor/monitoring_run.h"

namespace driftwatch::monitor {
namespace {

using json = nlohmann::json;

/// Keeps every delivered metric; can be switched to refuse batches
class RecordingSink : public TelemetrySink {
public:
    absl::Status Emit(const std::vector<Metric>& metrics) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failing_) {
            return PublishError("ingestion endpoint unavailable");
        }
        delivered_.insert(delivered_.end(), metrics.begin(), metrics.end());
        return absl::OkStatus();
    }

    std::string Name() const override { return "recording"; }

    void SetFailing(bool failing) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = failing;
    }

    std::vector<Metric> Delivered() {
        std::lock_guard<std::mutex> lock(mutex_);
        return delivered_;
    }

private:
    std::mutex mutex_;
    bool failing_ = false;
    std::vector<Metric> delivered_;
};

class MonitoringPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<RecordingSink>();
        publisher_ = std::make_shared<MetricsPublisher>(sink_);
    }

    std::unique_ptr<MonitoringRunner> Runner(std::shared_ptr<DataSource> source,
                                             MonitoringRunOptions options = {}) {
        auto runner = MonitoringRunner::Create(std::move(source), publisher_, options);
        EXPECT_TRUE(runner.ok()) << runner.status();
        return runner.ok() ? std::move(*runner) : nullptr;
    }

    std::shared_ptr<RecordingSink> sink_;
    std::shared_ptr<MetricsPublisher> publisher_;
};

TEST_F(MonitoringPipelineTest, FixedSeedIsReproducible) {
    auto first = Runner(std::make_shared<SyntheticDataSource>(SyntheticDataConfig{.seed = 7}))
                     ->Run("demo-model", "dev");
    auto second = Runner(std::make_shared<SyntheticDataSource>(SyntheticDataConfig{.seed = 7}))
                      ->Run("demo-model", "dev");

    ASSERT_TRUE(first.Completed()) << first.status;
    ASSERT_TRUE(second.Completed()) << second.status;
    EXPECT_EQ(first.report->NumericFields().value(), second.report->NumericFields().value());
    EXPECT_EQ(first.summary, second.summary);
}

TEST_F(MonitoringPipelineTest, PublishesEveryReportField) {
    auto result = Runner(std::make_shared<SyntheticDataSource>())->Run("demo-model", "dev");
    ASSERT_TRUE(result.MetricsDelivered());

    auto fields = result.report->NumericFields().value();
    auto delivered = sink_->Delivered();
    ASSERT_EQ(delivered.size(), fields.size());
    for (const auto& metric : delivered) {
        const std::string prefix = "demo-model/";
        ASSERT_EQ(metric.name.rfind(prefix, 0), 0u) << metric.name;
        const std::string field = metric.name.substr(prefix.size());
        ASSERT_TRUE(fields.count(field)) << field;
        EXPECT_DOUBLE_EQ(metric.value, fields.at(field));
        EXPECT_EQ(metric.unit, "Percent");
    }
}

TEST_F(MonitoringPipelineTest, PublishFailureKeepsSameReport) {
    auto source = std::make_shared<SyntheticDataSource>(SyntheticDataConfig{.seed = 11});

    auto delivered = Runner(source)->Run("demo-model", "dev");
    sink_->SetFailing(true);
    auto refused = Runner(source)->Run("demo-model", "dev");

    ASSERT_TRUE(delivered.Completed());
    EXPECT_EQ(refused.state, RunState::kFailed);
    EXPECT_EQ(refused.ExitCode(), 2);
    ASSERT_TRUE(refused.report.has_value());
    EXPECT_EQ(refused.report->NumericFields().value(),
              delivered.report->NumericFields().value());
}

TEST_F(MonitoringPipelineTest, ShiftedDataIsDetected) {
    SyntheticDataConfig shifted{.seed = 3, .current_shift = 2.0};

    auto result = Runner(std::make_shared<SyntheticDataSource>(shifted))->Run("demo-model", "dev");
    ASSERT_TRUE(result.Completed()) << result.status;

    const auto& data_drift = result.report->DataDrift();
    EXPECT_TRUE(data_drift.detected);
    EXPECT_EQ(data_drift.affected_features.size(), 5u);
    EXPECT_GT(data_drift.score, 50.0);
}

TEST_F(MonitoringPipelineTest, ParallelRunMatchesSequentialRun) {
    auto source = std::make_shared<SyntheticDataSource>(SyntheticDataConfig{.seed = 5});
    MonitoringRunOptions parallel;
    parallel.parallel_detection = true;

    auto sequential_result = Runner(source)->Run("demo-model", "dev");
    auto parallel_result = Runner(source, parallel)->Run("demo-model", "dev");

    ASSERT_TRUE(sequential_result.Completed());
    ASSERT_TRUE(parallel_result.Completed());
    EXPECT_EQ(sequential_result.report->NumericFields().value(),
              parallel_result.report->NumericFields().value());
}

class FilePipelineTest : public MonitoringPipelineTest {
protected:
    void SetUp() override {
        MonitoringPipelineTest::SetUp();
        root_ = std::filesystem::temp_directory_path() /
                ("driftwatch_pipeline_test_" +
                 std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
        std::filesystem::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    void WriteSnapshot(const std::string& model_id, const std::string& environment,
                       const json& snapshot) {
        const auto path = JsonFileDataSource(root_).SnapshotPath(model_id, environment);
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path) << snapshot.dump();
    }

    std::filesystem::path root_;
};

TEST_F(FilePipelineTest, SnapshotRunEndToEnd) {
    json current = json::array();
    json baseline = json::array();
    for (int i = 0; i < 30; ++i) {
        // "income" moves far away, "age" stays put
        current.push_back(json::array({20.0 + i, 5000.0 + i}));
        baseline.push_back(json::array({20.0 + i, 1000.0 + i}));
    }

    json snapshot;
    snapshot["feature_names"] = json::array({"age", "income"});
    snapshot["current"] = current;
    snapshot["baseline"] = baseline;
    snapshot["predictions"] = json::array({1, 1, 0, 0});
    snapshot["actuals"] = json::array({1, 0, 0, 1});
    snapshot["baseline_accuracy"] = 0.9;
    snapshot["current_predictions"] = json::array({0.5, 0.52});
    snapshot["baseline_predictions"] = json::array({0.5, 0.5});
    WriteSnapshot("churn", "prod", snapshot);

    MonitorConfig settings;
    settings.data_source.type = "file";
    settings.data_source.root = root_.string();
    auto source = CreateDataSource(settings);
    ASSERT_TRUE(source.ok());

    auto result = Runner(*source)->Run("churn", "prod");
    ASSERT_TRUE(result.Completed()) << result.status;

    const auto& report = *result.report;
    EXPECT_TRUE(report.DataDrift().detected);
    EXPECT_EQ(report.DataDrift().affected_features, std::vector<std::string>{"income"});
    EXPECT_DOUBLE_EQ(report.DataDrift().score, 100.0);

    // accuracy 0.5 against 0.9
    EXPECT_TRUE(report.ConceptDrift().detected);
    EXPECT_NEAR(report.ConceptDrift().score, 40.0, 1e-9);

    // mean 0.51 against 0.5
    EXPECT_FALSE(report.PredictionDrift().detected);
    EXPECT_NEAR(report.PredictionDrift().score, 2.0, 1e-9);

    EXPECT_EQ(result.summary,
              "Data drift: true, Concept drift: true, Prediction drift: false");
    EXPECT_FALSE(sink_->Delivered().empty());
}

TEST_F(FilePipelineTest, MissingSnapshotFailsWithoutPublishing) {
    auto result = Runner(std::make_shared<JsonFileDataSource>(root_))->Run("absent", "prod");

    EXPECT_EQ(result.state, RunState::kFailed);
    EXPECT_EQ(result.failed_stage, RunState::kInitializing);
    EXPECT_TRUE(IsDataSourceError(result.status));
    EXPECT_EQ(result.ExitCode(), 1);
    EXPECT_TRUE(sink_->Delivered().empty());
}

}  // namespace
}  // namespace driftwatch::monitor
