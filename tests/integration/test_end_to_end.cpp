/**
 * @file test_end_to_end.cpp
 * @brief Integration test: IngestService -> GrpcTransport -> in-process record sink
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <ingestd/utils/logger.hpp>
#include <ingestd/config/service_config.hpp>
#include <ingestd/core/stream_lifecycle_manager.hpp>
#include <ingestd/transport/grpc_transport.hpp>
#include <ingestd/services/ingest_service.hpp>

#include "ingestd/proto/sink.grpc.pb.h"

#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace ingestd;
using ::testing::HasSubstr;
using namespace std::chrono_literals;

namespace {

const char* kClientId = "e2e-client";
const char* kClientSecret = "e2e-secret";

/**
 * @brief Minimal RecordSink: acknowledges every record cumulatively unless
 *        told to fail its offset.
 */
class FakeSink final : public sink::RecordSink::CallbackService {
public:
    struct Received {
        std::string table_name;
        uint64_t offset;
        std::string payload;
    };

    grpc::ServerBidiReactor<sink::IngestRequest, sink::IngestResponse>* IngestStream(
        grpc::CallbackServerContext* context) override {
        return new Reactor(this, context);
    }

    void failOffset(uint64_t offset, const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[offset] = reason;
    }

    void setExpectedClientId(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        expectedClientId_ = id;
    }

    std::vector<sink::StreamOpen> opens() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return opens_;
    }

    std::vector<Received> received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    int finishedStreams() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return finished_;
    }

private:
    class Reactor : public grpc::ServerBidiReactor<sink::IngestRequest, sink::IngestResponse> {
    public:
        Reactor(FakeSink* sink, grpc::CallbackServerContext* context)
            : sink_(sink)
        {
            const auto& metadata = context->client_metadata();
            auto it = metadata.find("x-client-id");
            std::string clientId = it == metadata.end()
                ? std::string()
                : std::string(it->second.data(), it->second.size());

            if (clientId != sink_->expectedClientId()) {
                Finish(grpc::Status(grpc::StatusCode::UNAUTHENTICATED,
                                    "unknown client '" + clientId + "'"));
                return;
            }
            StartRead(&request_);
        }

        void OnReadDone(bool ok) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!ok) {
                finishWanted_ = true;
                finishIfIdleLocked();
                return;
            }

            sink::IngestResponse response;
            if (request_.has_open()) {
                tableName_ = request_.open().table_name();
                sink_->recordOpen(request_.open());
                response.mutable_opened()->set_stream_id(
                    tableName_ + "-" + std::to_string(sink_->opens().size()));
            } else if (request_.has_record()) {
                uint64_t offset = request_.record().offset();
                sink_->recordPayload(tableName_, offset, request_.record().payload());

                std::string reason;
                if (sink_->failureFor(offset, &reason)) {
                    response.mutable_failure()->set_offset(offset);
                    response.mutable_failure()->set_reason(reason);
                } else {
                    response.mutable_ack()->set_durability_ack_up_to_offset(offset);
                }
            }

            pending_.push_back(std::move(response));
            startWriteLocked();
            StartRead(&request_);
        }

        void OnWriteDone(bool ok) override {
            std::lock_guard<std::mutex> lock(mutex_);
            writing_ = false;
            pending_.pop_front();
            if (!ok) {
                pending_.clear();
            }
            startWriteLocked();
            finishIfIdleLocked();
        }

        void OnDone() override {
            sink_->recordFinished();
            delete this;
        }

    private:
        void startWriteLocked() {
            if (writing_ || pending_.empty()) {
                return;
            }
            writing_ = true;
            StartWrite(&pending_.front());
        }

        void finishIfIdleLocked() {
            if (finishWanted_ && !writing_ && pending_.empty() && !finished_) {
                finished_ = true;
                Finish(grpc::Status::OK);
            }
        }

        FakeSink* sink_;
        std::mutex mutex_;
        sink::IngestRequest request_;
        std::deque<sink::IngestResponse> pending_;
        std::string tableName_;
        bool writing_ = false;
        bool finishWanted_ = false;
        bool finished_ = false;
    };

    std::string expectedClientId() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return expectedClientId_;
    }

    void recordOpen(const sink::StreamOpen& open) {
        std::lock_guard<std::mutex> lock(mutex_);
        opens_.push_back(open);
    }

    void recordPayload(const std::string& table, uint64_t offset, const std::string& payload) {
        std::lock_guard<std::mutex> lock(mutex_);
        received_.push_back({table, offset, payload});
    }

    bool failureFor(uint64_t offset, std::string* reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = failures_.find(offset);
        if (it == failures_.end()) {
            return false;
        }
        *reason = it->second;
        return true;
    }

    void recordFinished() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++finished_;
    }

    mutable std::mutex mutex_;
    std::string expectedClientId_ = kClientId;
    std::map<uint64_t, std::string> failures_;
    std::vector<sink::StreamOpen> opens_;
    std::vector<Received> received_;
    int finished_ = 0;
};

std::string configJson(int sinkPort) {
    return R"({
      "remote": {"server_endpoint": "http://127.0.0.1:)" + std::to_string(sinkPort) + R"("},
      "tables": {
        "orders": {
          "table_name": "main.sales.orders",
          "message_name": "Order",
          "fields": [
            {"name": "order_id", "type": "int64"},
            {"name": "customer", "type": "string"},
            {"name": "amount", "type": "double"}
          ]
        },
        "events": {
          "table_name": "main.telemetry.events",
          "message_name": "Event",
          "durable_by_default": true,
          "fields": [
            {"name": "device", "type": "string"},
            {"name": "reading", "type": "float"}
          ]
        }
      }
    })";
}

}  // namespace

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::WARN);

        // Sink
        int sinkPort = 0;
        grpc::ServerBuilder sinkBuilder;
        sinkBuilder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &sinkPort);
        sinkBuilder.RegisterService(&sink_);
        sinkServer_ = sinkBuilder.BuildAndStart();
        ASSERT_NE(sinkServer_, nullptr);
        ASSERT_GT(sinkPort, 0);

        // Daemon side
        config::ServiceConfig serviceConfig;
        std::string error;
        ASSERT_TRUE(config::parseServiceConfig(configJson(sinkPort), &serviceConfig, &error))
            << error;
        ASSERT_TRUE(config::validateServiceConfig(serviceConfig, &error)) << error;

        config::Credentials credentials;
        credentials.client_id = kClientId;
        credentials.client_secret = kClientSecret;
        std::shared_ptr<const config::TableCatalog> catalog =
            config::TableCatalog::build(serviceConfig, credentials, &error);
        ASSERT_NE(catalog, nullptr) << error;
        catalog_ = catalog;

        auto transport = std::make_shared<transport::GrpcTransport>();

        core::ManagerOptions options;
        options.creation_timeout_ms = 3000;
        options.ack_timeout_ms = 3000;
        options.drain_timeout_ms = 2000;
        options.shutdown_timeout_ms = 5000;
        options.close_timeout_ms = 2000;
        manager_ = std::make_shared<core::StreamLifecycleManager>(
            catalog->destinations(), transport, options);

        service_ = std::make_unique<services::IngestServiceImpl>(catalog, manager_);

        int ingestPort = 0;
        grpc::ServerBuilder builder;
        builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &ingestPort);
        builder.RegisterService(service_.get());
        ingestServer_ = builder.BuildAndStart();
        ASSERT_NE(ingestServer_, nullptr);

        stub_ = ingest::IngestService::NewStub(grpc::CreateChannel(
            "127.0.0.1:" + std::to_string(ingestPort), grpc::InsecureChannelCredentials()));
    }

    void TearDown() override {
        if (ingestServer_) {
            ingestServer_->Shutdown(std::chrono::system_clock::now() + 2s);
        }
        if (manager_) {
            manager_->shutdown();
        }
        if (sinkServer_) {
            sinkServer_->Shutdown(std::chrono::system_clock::now() + 2s);
        }
        utils::Logger::instance().setLevel(utils::LogLevel::INFO);
    }

    grpc::Status ingestRecord(const std::string& table, const std::string& recordJson,
                              ingest::IngestResponse* response, int waitForAck = -1) {
        ingest::IngestRequest request;
        request.set_table_key(table);
        auto parsed = google::protobuf::util::JsonStringToMessage(recordJson,
                                                                  request.mutable_record());
        EXPECT_TRUE(parsed.ok()) << parsed.ToString();
        if (waitForAck >= 0) {
            request.set_wait_for_ack(waitForAck != 0);
        }

        grpc::ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() + 10s);
        return stub_->Ingest(&context, request, response);
    }

    ingest::HealthResponse health(const std::string& table) {
        ingest::HealthRequest request;
        request.set_table_key(table);
        ingest::HealthResponse response;
        grpc::ClientContext context;
        auto status = stub_->GetHealth(&context, request, &response);
        EXPECT_TRUE(status.ok()) << status.error_message();
        return response;
    }

    bool waitForFinishedStreams(int count, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (sink_.finishedStreams() >= count) {
                return true;
            }
            std::this_thread::sleep_for(10ms);
        }
        return sink_.finishedStreams() >= count;
    }

    FakeSink sink_;
    std::unique_ptr<grpc::Server> sinkServer_;
    std::shared_ptr<const config::TableCatalog> catalog_;
    std::shared_ptr<core::StreamLifecycleManager> manager_;
    std::unique_ptr<services::IngestServiceImpl> service_;
    std::unique_ptr<grpc::Server> ingestServer_;
    std::unique_ptr<ingest::IngestService::Stub> stub_;
};

TEST_F(EndToEndTest, DurableIngestReachesSink) {
    ingest::IngestResponse response;
    auto status = ingestRecord("orders",
                               R"({"order_id": 42, "customer": "ada", "amount": 12.5})",
                               &response, 1);

    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(response.outcome(), "durable");
    EXPECT_EQ(response.sequence(), 1u);

    auto opens = sink_.opens();
    ASSERT_EQ(opens.size(), 1u);
    EXPECT_EQ(opens[0].table_name(), "main.sales.orders");
    EXPECT_EQ(opens[0].message_name(), "Order");
    EXPECT_EQ(opens[0].descriptor(), catalog_->find("orders")->schema->descriptorBytes());

    auto received = sink_.received();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].table_name, "main.sales.orders");
    EXPECT_EQ(received[0].offset, 1u);

    google::protobuf::Struct decoded;
    std::string error;
    ASSERT_TRUE(catalog_->find("orders")->schema->decode(received[0].payload, &decoded, &error))
        << error;
    EXPECT_EQ(decoded.fields().at("order_id").number_value(), 42);
    EXPECT_EQ(decoded.fields().at("customer").string_value(), "ada");
    EXPECT_DOUBLE_EQ(decoded.fields().at("amount").number_value(), 12.5);
}

TEST_F(EndToEndTest, FireAndForgetThenFlush) {
    for (int i = 1; i <= 5; ++i) {
        ingest::IngestResponse response;
        auto status = ingestRecord(
            "orders",
            R"({"order_id": )" + std::to_string(i) + R"(, "customer": "c", "amount": 1})",
            &response, 0);
        ASSERT_TRUE(status.ok()) << status.error_message();
        EXPECT_EQ(response.outcome(), "accepted");
        EXPECT_EQ(response.sequence(), static_cast<uint64_t>(i));
    }

    ingest::FlushRequest request;
    request.set_table_key("orders");
    ingest::FlushResponse flushed;
    grpc::ClientContext context;
    ASSERT_TRUE(stub_->Flush(&context, request, &flushed).ok());
    EXPECT_EQ(flushed.status(), "success");

    EXPECT_EQ(sink_.received().size(), 5u);
    EXPECT_EQ(sink_.opens().size(), 1u);
}

TEST_F(EndToEndTest, TablesGetSeparateStreams) {
    ingest::IngestResponse orders;
    ASSERT_TRUE(ingestRecord("orders", R"({"order_id": 1, "customer": "c", "amount": 1})",
                             &orders, 1).ok());
    ingest::IngestResponse events;
    ASSERT_TRUE(ingestRecord("events", R"({"device": "d-1", "reading": 0.5})", &events).ok());

    EXPECT_EQ(events.outcome(), "durable");
    EXPECT_EQ(events.sequence(), 1u);
    EXPECT_EQ(sink_.opens().size(), 2u);

    ingest::HealthRequest request;
    ingest::HealthResponse response;
    grpc::ClientContext context;
    ASSERT_TRUE(stub_->GetHealth(&context, request, &response).ok());
    EXPECT_THAT(response.active_streams(), ::testing::ElementsAre("events", "orders"));
}

TEST_F(EndToEndTest, SinkFailureIsReportedAsAborted) {
    sink_.failOffset(2, "quota exceeded");

    ingest::IngestResponse first;
    ASSERT_TRUE(ingestRecord("events", R"({"device": "d", "reading": 1})", &first).ok());

    ingest::IngestResponse second;
    auto status = ingestRecord("events", R"({"device": "d", "reading": 2})", &second);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::ABORTED);
    EXPECT_THAT(status.error_message(), HasSubstr("quota exceeded"));

    // A failed record does not end the stream
    ingest::IngestResponse third;
    ASSERT_TRUE(ingestRecord("events", R"({"device": "d", "reading": 3})", &third).ok());
    EXPECT_EQ(third.sequence(), 3u);
    EXPECT_EQ(sink_.opens().size(), 1u);
}

TEST_F(EndToEndTest, InvalidRecordsNeverReachSink) {
    ingest::IngestResponse response;
    auto status = ingestRecord("orders", R"({"order_id": 1.5, "customer": "c", "amount": 1})",
                               &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);

    status = ingestRecord("nowhere", R"({"order_id": 1})", &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::NOT_FOUND);

    EXPECT_TRUE(sink_.opens().empty());
    EXPECT_TRUE(sink_.received().empty());
}

TEST_F(EndToEndTest, RejectedCredentialsMakeTableUnavailable) {
    sink_.setExpectedClientId("someone-else");

    ingest::IngestResponse response;
    auto status = ingestRecord("orders", R"({"order_id": 1, "customer": "c", "amount": 1})",
                               &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_THAT(status.error_message(), HasSubstr("UNAUTHENTICATED"));

    auto tableHealth = health("orders");
    EXPECT_EQ(tableHealth.stream_status(), "failed");
    EXPECT_FALSE(tableHealth.stream_active());
    EXPECT_THAT(tableHealth.last_error(), HasSubstr("UNAUTHENTICATED"));

    // The failure is recoverable once the sink accepts the client
    sink_.setExpectedClientId(kClientId);
    status = ingestRecord("orders", R"({"order_id": 2, "customer": "c", "amount": 1})",
                          &response);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(health("orders").stream_status(), "ready");
}

TEST_F(EndToEndTest, ServiceInfo) {
    ingest::ServiceInfoRequest request;
    ingest::ServiceInfoResponse response;
    grpc::ClientContext context;

    ASSERT_TRUE(stub_->GetServiceInfo(&context, request, &response).ok());
    EXPECT_EQ(response.service(), "ingestd");
    ASSERT_EQ(response.tables_size(), 2);
    EXPECT_EQ(response.tables(1).table_name(), "main.sales.orders");
}

TEST_F(EndToEndTest, ShutdownClosesStreamsCleanly) {
    ingest::IngestResponse response;
    ASSERT_TRUE(ingestRecord("orders", R"({"order_id": 1, "customer": "c", "amount": 1})",
                             &response, 0).ok());
    ASSERT_TRUE(ingestRecord("events", R"({"device": "d", "reading": 1})", &response).ok());

    auto report = manager_->shutdown();
    EXPECT_TRUE(report.clean);
    EXPECT_EQ(report.slots_closed, 2u);
    EXPECT_TRUE(report.failures.empty());
    EXPECT_TRUE(waitForFinishedStreams(2, 3s));
    EXPECT_EQ(sink_.received().size(), 2u);

    auto status = ingestRecord("orders", R"({"order_id": 2, "customer": "c", "amount": 1})",
                               &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(sink_.opens().size(), 2u);
}
