/// @file drift_report_test.cpp
/// @brief Tests for report aggregation, serialization and flattening

#include <gtest/gtest.h>

#include "monitor/drift_report.h"

namespace driftwatch::monitor {
namespace {

DriftResult MakeResult(DriftType type, bool detected, double score) {
    DriftResult result;
    result.type = type;
    result.detected = detected;
    result.score = score;
    result.threshold = 0.1;
    result.detected_at = std::chrono::system_clock::time_point{};
    return result;
}

class DriftReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        data_ = MakeResult(DriftType::kData, true, 42.0);
        data_.values[std::string(kPValueField)] = 0.003;
        data_.values[std::string(kMaxDriftPValueField)] = 0.001;
        data_.values[std::string(kMaxStatisticField)] = 0.42;
        data_.affected_features = {"feature_2"};
        data_.feature_scores = {{"feature_1", 0.05}, {"feature_2", 0.42}};

        concept_ = MakeResult(DriftType::kConcept, false, 3.0);
        concept_.values[std::string(kCurrentAccuracyField)] = 0.92;
        concept_.values[std::string(kBaselineAccuracyField)] = 0.95;

        prediction_ = MakeResult(DriftType::kPrediction, false, 4.5);
        prediction_.values[std::string(kCurrentMeanField)] = 0.418;
        prediction_.values[std::string(kBaselineMeanField)] = 0.4;
    }

    DriftReport Build() {
        auto report = DriftReport::Build(data_, concept_, prediction_);
        EXPECT_TRUE(report.ok()) << report.status();
        return *report;
    }

    DriftResult data_;
    DriftResult concept_;
    DriftResult prediction_;
};

TEST_F(DriftReportTest, BuildKeepsResultsBySlot) {
    auto report = Build();

    EXPECT_DOUBLE_EQ(report.DataDrift().score, 42.0);
    EXPECT_DOUBLE_EQ(report.ConceptDrift().score, 3.0);
    EXPECT_DOUBLE_EQ(report.PredictionDrift().score, 4.5);
    EXPECT_EQ(&report.Get(DriftType::kConcept), &report.ConceptDrift());
    EXPECT_TRUE(report.AnyDetected());
}

TEST_F(DriftReportTest, BuildRejectsResultInWrongSlot) {
    auto report = DriftReport::Build(concept_, data_, prediction_);
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(DriftReportTest, Summary) {
    EXPECT_EQ(Build().Summary(),
              "Data drift: true, Concept drift: false, Prediction drift: false");
}

TEST_F(DriftReportTest, NothingDetected) {
    data_.detected = false;
    EXPECT_FALSE(Build().AnyDetected());
}

TEST_F(DriftReportTest, ToJsonNestsByDriftKey) {
    auto j = Build().ToJson();

    ASSERT_TRUE(j.contains("data_drift"));
    ASSERT_TRUE(j.contains("concept_drift"));
    ASSERT_TRUE(j.contains("prediction_drift"));

    EXPECT_TRUE(j["data_drift"]["detected"].get<bool>());
    EXPECT_DOUBLE_EQ(j["data_drift"]["score"].get<double>(), 42.0);
    EXPECT_DOUBLE_EQ(j["data_drift"]["p_value"].get<double>(), 0.003);
    EXPECT_EQ(j["data_drift"]["affected_features"][0], "feature_2");
    EXPECT_DOUBLE_EQ(j["data_drift"]["feature_scores"]["feature_1"].get<double>(), 0.05);
    EXPECT_EQ(j["data_drift"]["detected_at"], "1970-01-01T00:00:00.000Z");

    EXPECT_DOUBLE_EQ(j["concept_drift"]["current_accuracy"].get<double>(), 0.92);
    EXPECT_FALSE(j["concept_drift"].contains("affected_features"));
    EXPECT_DOUBLE_EQ(j["prediction_drift"]["baseline_mean"].get<double>(), 0.4);
}

TEST_F(DriftReportTest, NumericFieldsFlattenEveryScalar) {
    auto fields = Build().NumericFields();
    ASSERT_TRUE(fields.ok()) << fields.status();

    // 3 x (detected, score) + 3 data + 2 concept + 2 prediction details
    EXPECT_EQ(fields->size(), 13u);
    EXPECT_DOUBLE_EQ(fields->at("data_drift_detected"), 1.0);
    EXPECT_DOUBLE_EQ(fields->at("data_drift_score"), 42.0);
    EXPECT_DOUBLE_EQ(fields->at("data_drift_p_value"), 0.003);
    EXPECT_DOUBLE_EQ(fields->at("data_drift_max_drift_p_value"), 0.001);
    EXPECT_DOUBLE_EQ(fields->at("concept_drift_detected"), 0.0);
    EXPECT_DOUBLE_EQ(fields->at("concept_drift_baseline_accuracy"), 0.95);
    EXPECT_DOUBLE_EQ(fields->at("prediction_drift_current_mean"), 0.418);
    EXPECT_EQ(fields->count("data_drift_affected_features"), 0u);
}

TEST_F(DriftReportTest, NumericFieldsRejectsCollidingKeys) {
    // A detail named "score" would flatten onto the score itself
    concept_.values["score"] = 1.0;

    auto fields = Build().NumericFields();
    ASSERT_FALSE(fields.ok());
    EXPECT_EQ(fields.status().code(), absl::StatusCode::kInternal);
}

TEST(DriftResultTest, ValueDefaultsToZero) {
    DriftResult result;
    result.values["p_value"] = 0.2;

    EXPECT_DOUBLE_EQ(result.Value("p_value"), 0.2);
    EXPECT_DOUBLE_EQ(result.Value("missing"), 0.0);
}

TEST(DriftResultTest, TypeNames) {
    EXPECT_EQ(DriftTypeToString(DriftType::kPrediction), "prediction");
    EXPECT_EQ(DriftTypeKey(DriftType::kConcept), "concept_drift");
}

}  // namespace
}  // namespace driftwatch::monitor
