/// @file metrics_publisher_test.cpp
/// @brief Tests for metric naming, batching and publish failures

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>

#include "common/error.h"
#include "monitor/metrics_publisher.h"

namespace driftwatch::monitor {
namespace {

using ::testing::_;
using ::testing::AllOf;
using ::testing::Contains;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SizeIs;

class MockTelemetrySink : public TelemetrySink {
public:
    MOCK_METHOD(absl::Status, Emit, (const std::vector<Metric>& metrics), (override));
    MOCK_METHOD(std::string, Name, (), (const, override));
};

std::map<std::string, double> ManyFields(size_t count) {
    std::map<std::string, double> fields;
    for (size_t i = 0; i < count; ++i) {
        fields["field_" + std::to_string(100 + i)] = static_cast<double>(i);
    }
    return fields;
}

class MetricsPublisherTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<NiceMock<MockTelemetrySink>>();
        ON_CALL(*sink_, Name()).WillByDefault(Return("mock"));
    }

    std::shared_ptr<NiceMock<MockTelemetrySink>> sink_;
};

TEST_F(MetricsPublisherTest, BuildMetricsNamesByModel) {
    MetricsPublisher publisher(sink_);
    const auto ts = std::chrono::system_clock::now();

    auto metrics = publisher.BuildMetrics(
        {{"data_drift_score", 12.0}, {"concept_drift_detected", 0.0}}, "churn-model", ts);
    ASSERT_TRUE(metrics.ok()) << metrics.status();
    ASSERT_EQ(metrics->size(), 2u);

    // std::map order
    EXPECT_EQ((*metrics)[0].name, "churn-model/concept_drift_detected");
    EXPECT_EQ((*metrics)[1].name, "churn-model/data_drift_score");
    EXPECT_DOUBLE_EQ((*metrics)[1].value, 12.0);
    EXPECT_EQ((*metrics)[1].unit, "Percent");
    EXPECT_EQ((*metrics)[1].timestamp, ts);
}

TEST_F(MetricsPublisherTest, BuildMetricsRejectsBadInput) {
    MetricsPublisher publisher(sink_);
    const auto ts = std::chrono::system_clock::now();

    auto no_model = publisher.BuildMetrics({{"score", 1.0}}, "", ts);
    EXPECT_EQ(no_model.status().code(), absl::StatusCode::kInvalidArgument);

    auto nan = publisher.BuildMetrics(
        {{"score", std::numeric_limits<double>::quiet_NaN()}}, "m", ts);
    EXPECT_EQ(nan.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(MetricsPublisherTest, CustomUnit) {
    MetricsPublisher publisher(sink_, PublisherConfig{.unit = "None"});

    auto metrics = publisher.BuildMetrics({{"x", 1.0}}, "m", std::chrono::system_clock::now());
    ASSERT_TRUE(metrics.ok());
    EXPECT_EQ(metrics->front().unit, "None");
}

TEST_F(MetricsPublisherTest, PublishesInBatches) {
    MetricsPublisher publisher(sink_);

    ::testing::InSequence seq;
    EXPECT_CALL(*sink_, Emit(SizeIs(20))).WillOnce(Return(absl::OkStatus()));
    EXPECT_CALL(*sink_, Emit(SizeIs(5))).WillOnce(Return(absl::OkStatus()));

    EXPECT_TRUE(publisher.Publish(ManyFields(25), "m").ok());
}

TEST_F(MetricsPublisherTest, ZeroBatchSizeMeansOnePerCall) {
    MetricsPublisher publisher(sink_, PublisherConfig{.batch_size = 0});
    EXPECT_EQ(publisher.GetConfig().batch_size, 1u);

    EXPECT_CALL(*sink_, Emit(SizeIs(1))).Times(3).WillRepeatedly(Return(absl::OkStatus()));
    EXPECT_TRUE(publisher.Publish(ManyFields(3), "m").ok());
}

TEST_F(MetricsPublisherTest, SinkFailureStopsPublishing) {
    MetricsPublisher publisher(sink_, PublisherConfig{.batch_size = 2});

    EXPECT_CALL(*sink_, Emit(_))
        .WillOnce(Return(absl::OkStatus()))
        .WillOnce(Return(PublishError("connection refused")));

    auto status = publisher.Publish(ManyFields(6), "m");
    EXPECT_TRUE(IsPublishError(status)) << status;
    EXPECT_THAT(std::string(status.message()),
                AllOf(HasSubstr("after 2 of 6 metrics"), HasSubstr("connection refused")));
}

TEST_F(MetricsPublisherTest, ForeignSinkErrorBecomesPublishError) {
    MetricsPublisher publisher(sink_);

    EXPECT_CALL(*sink_, Emit(_)).WillOnce(Return(absl::DeadlineExceededError("timed out")));

    auto status = publisher.Publish(ManyFields(1), "m");
    EXPECT_TRUE(IsPublishError(status)) << status;
    EXPECT_THAT(std::string(status.message()), HasSubstr("timed out"));
}

TEST_F(MetricsPublisherTest, PublishReportSendsAllFields) {
    DriftResult data;
    data.type = DriftType::kData;
    data.score = 30.0;
    data.values[std::string(kPValueField)] = 0.02;
    DriftResult concept_result;
    concept_result.type = DriftType::kConcept;
    DriftResult prediction;
    prediction.type = DriftType::kPrediction;
    auto report = DriftReport::Build(data, concept_result, prediction);
    ASSERT_TRUE(report.ok());

    std::vector<Metric> sent;
    EXPECT_CALL(*sink_, Emit(_)).WillOnce([&sent](const std::vector<Metric>& metrics) {
        sent = metrics;
        return absl::OkStatus();
    });

    MetricsPublisher publisher(sink_);
    ASSERT_TRUE(publisher.Publish(*report, "fraud").ok());

    ASSERT_EQ(sent.size(), 7u);
    EXPECT_THAT(sent, Contains(AllOf(Field(&Metric::name, "fraud/data_drift_score"),
                                     Field(&Metric::value, 30.0))));
    EXPECT_THAT(sent, Contains(Field(&Metric::name, "fraud/data_drift_p_value")));
}

TEST_F(MetricsPublisherTest, EmptyFieldsPublishNothing) {
    MetricsPublisher publisher(sink_);

    EXPECT_CALL(*sink_, Emit(_)).Times(0);
    EXPECT_TRUE(publisher.Publish(std::map<std::string, double>{}, "m").ok());
}

TEST(MetricsPublisherNoSinkTest, MissingSink) {
    MetricsPublisher publisher(nullptr);

    auto status = publisher.Publish(ManyFields(1), "m");
    EXPECT_EQ(status.code(), absl::StatusCode::kFailedPrecondition);
}

}  // namespace
}  // namespace driftwatch::monitor
