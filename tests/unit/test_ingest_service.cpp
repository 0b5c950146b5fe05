/**
 * @file test_ingest_service.cpp
 * @brief Unit tests for the IngestService over an in-memory transport
 *
 * Tests cover:
 * - Mapping of submit failures to gRPC status codes
 * - Ingest validation, durable and fire-and-forget ingests
 * - Health, flush and service info queries
 * - Bounded request workers
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <ingestd/services/ingest_service.hpp>
#include <ingestd/utils/logger.hpp>

#include "fake_transport.hpp"

#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace ingestd;
using ingestd::test::FakeTransport;
using ::testing::HasSubstr;
using namespace std::chrono_literals;

namespace {

const char* kTablesJson = R"({
  "remote": {"server_endpoint": "localhost:50061"},
  "tables": {
    "orders": {
      "table_name": "main.sales.orders",
      "message_name": "Order",
      "fields": [
        {"name": "order_id", "type": "int64"},
        {"name": "customer", "type": "string"}
      ]
    },
    "events": {
      "table_name": "main.telemetry.events",
      "message_name": "Event",
      "durable_by_default": true,
      "fields": [{"name": "device", "type": "string"}]
    }
  }
})";

core::SubmitResult failedWith(core::ErrorKind kind, const std::string& message) {
    core::SubmitResult result;
    result.error = kind;
    result.error_message = message;
    return result;
}

}  // namespace

// =============================================================================
// Status mapping
// =============================================================================

TEST(SubmitErrorStatusTest, UnknownTableIsNotFound) {
    auto status = services::submitErrorStatus(
        "orders", failedWith(core::ErrorKind::DESTINATION_UNKNOWN, ""));
    EXPECT_EQ(status.error_code(), grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(status.error_message(), "Table 'orders' not configured");
}

TEST(SubmitErrorStatusTest, UnavailableStreamIsUnavailable) {
    for (auto kind : {core::ErrorKind::DESTINATION_UNAVAILABLE,
                      core::ErrorKind::CREATION_FAILED,
                      core::ErrorKind::SEND_REJECTED}) {
        auto status = services::submitErrorStatus("orders", failedWith(kind, "connection refused"));
        EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAVAILABLE);
        EXPECT_EQ(status.error_message(), "Stream for 'orders' unavailable: connection refused");
    }
}

TEST(SubmitErrorStatusTest, TimeoutIsDeadlineExceeded) {
    auto status = services::submitErrorStatus(
        "orders", failedWith(core::ErrorKind::TIMEOUT, "no ack within 30000ms"));
    EXPECT_EQ(status.error_code(), grpc::StatusCode::DEADLINE_EXCEEDED);
    EXPECT_EQ(status.error_message(), "no ack within 30000ms");
}

TEST(SubmitErrorStatusTest, UnacknowledgedIsAborted) {
    for (auto kind : {core::ErrorKind::UNACKNOWLEDGED,
                      core::ErrorKind::UNACKNOWLEDGED_ON_SHUTDOWN}) {
        auto status = services::submitErrorStatus("orders", failedWith(kind, "quota exceeded"));
        EXPECT_EQ(status.error_code(), grpc::StatusCode::ABORTED);
        EXPECT_EQ(status.error_message(), "Record not acknowledged: quota exceeded");
    }
}

TEST(SubmitErrorStatusTest, EmptyMessageFallsBackToKind) {
    auto status = services::submitErrorStatus("orders", failedWith(core::ErrorKind::TIMEOUT, ""));
    EXPECT_EQ(status.error_message(), "timeout");

    status = services::submitErrorStatus("orders", failedWith(core::ErrorKind::NONE, ""));
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INTERNAL);
}

// =============================================================================
// Service over an in-memory transport
// =============================================================================

class IngestServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::WARN);

        config::ServiceConfig serviceConfig;
        std::string error;
        ASSERT_TRUE(config::parseServiceConfig(kTablesJson, &serviceConfig, &error)) << error;

        config::Credentials credentials;
        credentials.client_id = "client";
        credentials.client_secret = "secret";
        std::shared_ptr<const config::TableCatalog> catalog =
            config::TableCatalog::build(serviceConfig, credentials, &error);
        ASSERT_NE(catalog, nullptr) << error;

        transport_ = std::make_shared<FakeTransport>();
        transport_->setAutoAck(true);

        core::ManagerOptions options;
        options.creation_timeout_ms = 2000;
        options.ack_timeout_ms = 2000;
        options.drain_timeout_ms = 500;
        options.shutdown_timeout_ms = 2000;
        manager_ = std::make_shared<core::StreamLifecycleManager>(
            catalog->destinations(), transport_, options);

        service_ = std::make_unique<services::IngestServiceImpl>(catalog, manager_,
                                                                 serviceOptions());

        int port = 0;
        grpc::ServerBuilder builder;
        builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port);
        builder.RegisterService(service_.get());
        server_ = builder.BuildAndStart();
        ASSERT_NE(server_, nullptr);
        ASSERT_GT(port, 0);

        auto channel = grpc::CreateChannel("127.0.0.1:" + std::to_string(port),
                                           grpc::InsecureChannelCredentials());
        stub_ = ingest::IngestService::NewStub(channel);
    }

    void TearDown() override {
        transport_->releaseOpens();
        if (server_) {
            server_->Shutdown(std::chrono::system_clock::now() + 2s);
        }
        if (manager_) {
            manager_->shutdown();
        }
        utils::Logger::instance().setLevel(utils::LogLevel::INFO);
    }

    virtual services::ServiceOptions serviceOptions() const {
        return services::ServiceOptions();
    }

    grpc::Status ingestRecord(const std::string& table, const std::string& recordJson,
                              ingest::IngestResponse* response, int waitForAck = -1) {
        ingest::IngestRequest request;
        request.set_table_key(table);
        if (!recordJson.empty()) {
            auto parsed = google::protobuf::util::JsonStringToMessage(recordJson,
                                                                      request.mutable_record());
            EXPECT_TRUE(parsed.ok()) << parsed.ToString();
        }
        if (waitForAck >= 0) {
            request.set_wait_for_ack(waitForAck != 0);
        }

        grpc::ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() + 5s);
        return stub_->Ingest(&context, request, response);
    }

    std::shared_ptr<FakeTransport> transport_;
    std::shared_ptr<core::StreamLifecycleManager> manager_;
    std::unique_ptr<services::IngestServiceImpl> service_;
    std::unique_ptr<grpc::Server> server_;
    std::unique_ptr<ingest::IngestService::Stub> stub_;
};

TEST_F(IngestServiceTest, IngestFireAndForget) {
    ingest::IngestResponse response;
    auto status = ingestRecord("orders", R"({"order_id": 7, "customer": "ada"})", &response);

    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(response.status(), "success");
    EXPECT_EQ(response.table(), "orders");
    EXPECT_EQ(response.message(), "Record ingested");
    EXPECT_FALSE(response.wait_for_ack());
    EXPECT_EQ(response.outcome(), "accepted");
    EXPECT_EQ(response.sequence(), 1u);
    EXPECT_EQ(transport_->openCountFor("orders"), 1);
}

TEST_F(IngestServiceTest, IngestDurableByRequest) {
    ingest::IngestResponse response;
    auto status = ingestRecord("orders", R"({"order_id": 7, "customer": "ada"})", &response, 1);

    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(response.message(), "Record ingested and acknowledged");
    EXPECT_TRUE(response.wait_for_ack());
    EXPECT_EQ(response.outcome(), "durable");
}

TEST_F(IngestServiceTest, TableDefaultDecidesDurability) {
    ingest::IngestResponse response;
    auto status = ingestRecord("events", R"({"device": "sensor-1"})", &response);

    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_TRUE(response.wait_for_ack());
    EXPECT_EQ(response.outcome(), "durable");

    ingest::IngestResponse explicitResponse;
    status = ingestRecord("events", R"({"device": "sensor-1"})", &explicitResponse, 0);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_FALSE(explicitResponse.wait_for_ack());
    EXPECT_EQ(explicitResponse.sequence(), 2u);
}

TEST_F(IngestServiceTest, UnknownTableIsNotFound) {
    ingest::IngestResponse response;
    auto status = ingestRecord("missing", R"({"device": "x"})", &response);

    EXPECT_EQ(status.error_code(), grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(transport_->openCount(), 0);
}

TEST_F(IngestServiceTest, MissingRecordIsInvalid) {
    ingest::IngestResponse response;
    auto status = ingestRecord("orders", "", &response);

    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(status.error_message(), "record is required");
}

TEST_F(IngestServiceTest, InvalidRecordNeverReachesTheStream) {
    ingest::IngestResponse response;
    auto status = ingestRecord("orders", R"({"order_id": "seven", "customer": "ada"})", &response);

    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_THAT(status.error_message(), HasSubstr("Validation failed"));
    EXPECT_THAT(status.error_message(), HasSubstr("field 'order_id' expects int64, got string"));
    EXPECT_EQ(transport_->openCount(), 0);
}

TEST_F(IngestServiceTest, UnavailableSinkIsUnavailable) {
    transport_->failNextOpens(1, core::TransportErrorClass::FATAL, "UNAUTHENTICATED: bad secret");

    ingest::IngestResponse response;
    auto status = ingestRecord("orders", R"({"order_id": 1, "customer": "c"})", &response);

    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_THAT(status.error_message(), HasSubstr("bad secret"));
}

TEST_F(IngestServiceTest, ServiceHealthListsActiveStreams) {
    ingest::IngestResponse ingested;
    ASSERT_TRUE(ingestRecord("orders", R"({"order_id": 1, "customer": "c"})", &ingested).ok());

    ingest::HealthRequest request;
    ingest::HealthResponse response;
    grpc::ClientContext context;
    auto status = stub_->GetHealth(&context, request, &response);

    ASSERT_TRUE(status.ok());
    EXPECT_EQ(response.status(), "healthy");
    EXPECT_THAT(response.active_streams(), ::testing::ElementsAre("orders"));
}

TEST_F(IngestServiceTest, TableHealthReportsStreamStatus) {
    ingest::HealthRequest request;
    request.set_table_key("events");

    ingest::HealthResponse before;
    {
        grpc::ClientContext context;
        ASSERT_TRUE(stub_->GetHealth(&context, request, &before).ok());
    }
    EXPECT_EQ(before.table(), "events");
    EXPECT_EQ(before.table_name(), "main.telemetry.events");
    EXPECT_EQ(before.stream_status(), "unknown");
    EXPECT_FALSE(before.stream_active());

    ingest::IngestResponse ingested;
    ASSERT_TRUE(ingestRecord("events", R"({"device": "d"})", &ingested).ok());

    ingest::HealthResponse after;
    {
        grpc::ClientContext context;
        ASSERT_TRUE(stub_->GetHealth(&context, request, &after).ok());
    }
    EXPECT_EQ(after.stream_status(), "ready");
    EXPECT_TRUE(after.stream_active());

    request.set_table_key("missing");
    ingest::HealthResponse missing;
    grpc::ClientContext context;
    EXPECT_EQ(stub_->GetHealth(&context, request, &missing).error_code(),
              grpc::StatusCode::NOT_FOUND);
}

TEST_F(IngestServiceTest, FlushWithAndWithoutStream) {
    ingest::FlushRequest request;
    request.set_table_key("orders");

    ingest::FlushResponse idle;
    {
        grpc::ClientContext context;
        ASSERT_TRUE(stub_->Flush(&context, request, &idle).ok());
    }
    EXPECT_EQ(idle.status(), "no_active_stream");

    ingest::IngestResponse ingested;
    ASSERT_TRUE(ingestRecord("orders", R"({"order_id": 1, "customer": "c"})", &ingested).ok());

    ingest::FlushResponse flushed;
    {
        grpc::ClientContext context;
        ASSERT_TRUE(stub_->Flush(&context, request, &flushed).ok());
    }
    EXPECT_EQ(flushed.status(), "success");

    transport_->lastStream()->setFlushFails(true);
    ingest::FlushResponse failed;
    {
        grpc::ClientContext context;
        auto status = stub_->Flush(&context, request, &failed);
        EXPECT_EQ(status.error_code(), grpc::StatusCode::INTERNAL);
        EXPECT_THAT(status.error_message(), HasSubstr("Flush failed"));
    }

    request.set_table_key("missing");
    ingest::FlushResponse missing;
    grpc::ClientContext context;
    EXPECT_EQ(stub_->Flush(&context, request, &missing).error_code(),
              grpc::StatusCode::NOT_FOUND);
}

TEST_F(IngestServiceTest, ServiceInfoListsTables) {
    ingest::ServiceInfoRequest request;
    ingest::ServiceInfoResponse response;
    grpc::ClientContext context;

    ASSERT_TRUE(stub_->GetServiceInfo(&context, request, &response).ok());
    EXPECT_EQ(response.service(), "ingestd");
    EXPECT_FALSE(response.version().empty());
    ASSERT_EQ(response.tables_size(), 2);
    EXPECT_EQ(response.tables(0).key(), "events");
    EXPECT_TRUE(response.tables(0).durable_by_default());
    EXPECT_EQ(response.tables(1).key(), "orders");
    EXPECT_EQ(response.tables(1).table_name(), "main.sales.orders");
    EXPECT_EQ(response.tables(1).message_name(), "Order");
}

TEST_F(IngestServiceTest, IngestAfterShutdownIsUnavailable) {
    manager_->shutdown();

    ingest::IngestResponse response;
    auto status = ingestRecord("orders", R"({"order_id": 1, "customer": "c"})", &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAVAILABLE);
}

TEST_F(IngestServiceTest, ConcurrentDurableIngestsAllComplete) {
    const int kCallers = 32;
    std::vector<std::future<grpc::Status>> calls;
    std::vector<ingest::IngestResponse> responses(kCallers);
    for (int i = 0; i < kCallers; ++i) {
        calls.push_back(std::async(std::launch::async, [this, &responses, i]() {
            return ingestRecord("events", R"({"device": "d"})", &responses[i]);
        }));
    }

    for (auto& call : calls) {
        auto status = call.get();
        EXPECT_TRUE(status.ok()) << status.error_message();
    }
    EXPECT_EQ(transport_->openCountFor("events"), 1);
    EXPECT_EQ(transport_->lastStream()->payloads().size(), static_cast<size_t>(kCallers));
}

// =============================================================================
// Saturated workers
// =============================================================================

class IngestServiceBusyTest : public IngestServiceTest {
protected:
    services::ServiceOptions serviceOptions() const override {
        services::ServiceOptions options;
        options.worker_threads = 1;
        options.max_pending_requests = 1;
        return options;
    }
};

TEST_F(IngestServiceBusyTest, FullQueueIsResourceExhausted) {
    transport_->holdOpens();

    // Occupies the only worker until opens are released
    ingest::IngestResponse firstResponse;
    auto first = std::async(std::launch::async, [this, &firstResponse]() {
        return ingestRecord("orders", R"({"order_id": 1, "customer": "c"})", &firstResponse);
    });
    ASSERT_TRUE(transport_->waitForOpens(1, 2s));

    // Waits in the queue
    ingest::IngestResponse secondResponse;
    auto second = std::async(std::launch::async, [this, &secondResponse]() {
        return ingestRecord("orders", R"({"order_id": 2, "customer": "c"})", &secondResponse);
    });
    std::this_thread::sleep_for(200ms);

    ingest::IngestResponse rejected;
    auto status = ingestRecord("orders", R"({"order_id": 3, "customer": "c"})", &rejected);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::RESOURCE_EXHAUSTED);

    ingest::FlushRequest flushRequest;
    flushRequest.set_table_key("orders");
    ingest::FlushResponse flushResponse;
    {
        grpc::ClientContext context;
        EXPECT_EQ(stub_->Flush(&context, flushRequest, &flushResponse).error_code(),
                  grpc::StatusCode::RESOURCE_EXHAUSTED);
    }

    transport_->releaseOpens();
    EXPECT_TRUE(first.get().ok());
    EXPECT_TRUE(second.get().ok());
    EXPECT_EQ(transport_->openCountFor("orders"), 1);
    EXPECT_EQ(transport_->lastStream()->payloads().size(), 2u);
}

TEST_F(IngestServiceBusyTest, QueuedRequestsCompleteBeforeServiceIsDestroyed) {
    transport_->holdOpens();

    ingest::IngestResponse firstResponse;
    auto first = std::async(std::launch::async, [this, &firstResponse]() {
        return ingestRecord("orders", R"({"order_id": 1, "customer": "c"})", &firstResponse);
    });
    ASSERT_TRUE(transport_->waitForOpens(1, 2s));

    ingest::IngestResponse secondResponse;
    auto second = std::async(std::launch::async, [this, &secondResponse]() {
        return ingestRecord("orders", R"({"order_id": 2, "customer": "c"})", &secondResponse);
    });
    std::this_thread::sleep_for(200ms);

    transport_->releaseOpens();
    server_->Shutdown(std::chrono::system_clock::now() + 2s);
    service_.reset();

    EXPECT_TRUE(first.get().ok());
    EXPECT_TRUE(second.get().ok());
    EXPECT_EQ(transport_->lastStream()->payloads().size(), 2u);
}
