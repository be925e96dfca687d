/// @file telemetry_sink_test.cpp
/// @brief Tests for telemetry sinks against an in-process HTTP endpoint

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "common/error.h"
#include "monitor/telemetry_sink.h"

namespace driftwatch::monitor {
namespace {

using json = nlohmann::json;

std::vector<Metric> SampleMetrics() {
    const auto ts = std::chrono::system_clock::time_point{} + std::chrono::hours(24);
    return {
        Metric{.name = "churn/data_drift_score", .value = 12.5, .unit = "Percent", .timestamp = ts},
        Metric{.name = "churn/data_drift_detected", .value = 1.0, .unit = "Percent", .timestamp = ts},
    };
}

/// Metrics endpoint on an ephemeral port
class FakeIngestionServer {
public:
    FakeIngestionServer() {
        server_.Post("/v1/metrics", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            bodies_.push_back(req.body);
            authorization_ = req.get_header_value("Authorization");
            res.status = status_.load();
            res.set_content("{}", "application/json");
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~FakeIngestionServer() {
        server_.stop();
        thread_.join();
    }

    std::string Url() const {
        return "http://127.0.0.1:" + std::to_string(port_) + "/v1/metrics";
    }

    void RespondWith(int status) { status_.store(status); }

    std::vector<std::string> Bodies() {
        std::lock_guard<std::mutex> lock(mutex_);
        return bodies_;
    }

    std::string Authorization() {
        std::lock_guard<std::mutex> lock(mutex_);
        return authorization_;
    }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
    std::atomic<int> status_{200};

    std::mutex mutex_;
    std::vector<std::string> bodies_;
    std::string authorization_;
};

TEST(HttpTelemetrySinkTest, RejectsNonHttpEndpoint) {
    for (const char* endpoint : {"", "metrics.internal:8080", "ftp://host/metrics"}) {
        auto sink = HttpTelemetrySink::Create(HttpTelemetryConfig{.endpoint = endpoint});
        EXPECT_FALSE(sink.ok()) << endpoint;
    }
}

TEST(HttpTelemetrySinkTest, BuildPayload) {
    auto payload = HttpTelemetrySink::BuildPayload(SampleMetrics(), "MLOps/Monitoring");

    EXPECT_EQ(payload["namespace"], "MLOps/Monitoring");
    ASSERT_EQ(payload["metric_data"].size(), 2u);
    EXPECT_EQ(payload["metric_data"][0]["metric_name"], "churn/data_drift_score");
    EXPECT_DOUBLE_EQ(payload["metric_data"][0]["value"].get<double>(), 12.5);
    EXPECT_EQ(payload["metric_data"][0]["unit"], "Percent");
    EXPECT_EQ(payload["metric_data"][0]["timestamp"], "1970-01-02T00:00:00.000Z");
}

TEST(HttpTelemetrySinkTest, PostsBatchAsJson) {
    FakeIngestionServer server;
    auto sink = HttpTelemetrySink::Create(HttpTelemetryConfig{
        .endpoint = server.Url(),
        .metric_namespace = "Team/Models",
        .token = "secret",
    });
    ASSERT_TRUE(sink.ok()) << sink.status();

    ASSERT_TRUE((*sink)->Emit(SampleMetrics()).ok());

    auto bodies = server.Bodies();
    ASSERT_EQ(bodies.size(), 1u);
    auto body = json::parse(bodies[0]);
    EXPECT_EQ(body["namespace"], "Team/Models");
    EXPECT_EQ(body["metric_data"].size(), 2u);
    EXPECT_EQ(server.Authorization(), "Bearer secret");
}

TEST(HttpTelemetrySinkTest, EmptyBatchSendsNothing) {
    FakeIngestionServer server;
    auto sink = HttpTelemetrySink::Create(HttpTelemetryConfig{.endpoint = server.Url()});
    ASSERT_TRUE(sink.ok());

    EXPECT_TRUE((*sink)->Emit({}).ok());
    EXPECT_TRUE(server.Bodies().empty());
}

TEST(HttpTelemetrySinkTest, ServerErrorIsPublishError) {
    FakeIngestionServer server;
    server.RespondWith(503);
    auto sink = HttpTelemetrySink::Create(HttpTelemetryConfig{.endpoint = server.Url()});
    ASSERT_TRUE(sink.ok());

    auto status = (*sink)->Emit(SampleMetrics());
    EXPECT_TRUE(IsPublishError(status)) << status;
    EXPECT_NE(status.message().find("503"), std::string::npos);
}

TEST(HttpTelemetrySinkTest, UnreachableEndpointIsPublishError) {
    std::string url;
    {
        // Grab a free port, then release it so nothing listens there
        FakeIngestionServer server;
        url = server.Url();
    }

    auto sink = HttpTelemetrySink::Create(HttpTelemetryConfig{
        .endpoint = url,
        .connect_timeout = std::chrono::milliseconds(200),
        .request_timeout = std::chrono::milliseconds(200),
    });
    ASSERT_TRUE(sink.ok());

    auto status = (*sink)->Emit(SampleMetrics());
    EXPECT_TRUE(IsPublishError(status)) << status;
}

TEST(LogTelemetrySinkTest, AcceptsEveryBatch) {
    LogTelemetrySink sink;

    EXPECT_EQ(sink.Name(), "log");
    EXPECT_TRUE(sink.Emit(SampleMetrics()).ok());
    EXPECT_TRUE(sink.Emit({}).ok());
}

}  // namespace
}  // namespace driftwatch::monitor
