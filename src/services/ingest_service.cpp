/**
 * @file ingest_service.cpp
 * @brief IngestServiceImpl implementation.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#include "ingestd/services/ingest_service.hpp"
#include "ingestd/utils/logger.hpp"

namespace ingestd {
namespace services {

namespace {

grpc::Status tableNotFound(const std::string& key) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND,
                        "Table '" + key + "' not configured");
}

grpc::Status serverBusy() {
    return grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED,
                        "Too many requests waiting; retry later");
}

}  // namespace

grpc::Status submitErrorStatus(const std::string& tableKey, const core::SubmitResult& result) {
    const std::string message = result.error_message.empty()
        ? std::string(core::errorKindToString(result.error))
        : result.error_message;

    switch (result.error) {
        case core::ErrorKind::DESTINATION_UNKNOWN:
            return tableNotFound(tableKey);
        case core::ErrorKind::DESTINATION_UNAVAILABLE:
        case core::ErrorKind::CREATION_FAILED:
        case core::ErrorKind::SEND_REJECTED:
            return grpc::Status(grpc::StatusCode::UNAVAILABLE,
                                "Stream for '" + tableKey + "' unavailable: " + message);
        case core::ErrorKind::TIMEOUT:
            return grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED, message);
        case core::ErrorKind::UNACKNOWLEDGED:
        case core::ErrorKind::UNACKNOWLEDGED_ON_SHUTDOWN:
            return grpc::Status(grpc::StatusCode::ABORTED,
                                "Record not acknowledged: " + message);
        case core::ErrorKind::NONE:
        default:
            return grpc::Status(grpc::StatusCode::INTERNAL, message);
    }
}

// =============================================================================
// Ingest
// =============================================================================

class IngestReactor : public grpc::ServerUnaryReactor {
public:
    IngestReactor(const std::shared_ptr<const config::TableCatalog>& catalog,
                  std::shared_ptr<core::StreamLifecycleManager> manager,
                  utils::WorkerPool& workers,
                  const ingest::IngestRequest* request,
                  ingest::IngestResponse* response)
        : manager_(std::move(manager))
        , response_(response)
        , key_(request->table_key())
    {
        const config::TableEntry* entry = catalog->find(key_);
        if (entry == nullptr) {
            LOG_DEBUG("IngestService", "Ingest for unknown table '{}'", key_);
            Finish(tableNotFound(key_));
            return;
        }

        if (!request->has_record()) {
            Finish(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "record is required"));
            return;
        }

        auto encoded = entry->schema->encode(request->record());
        if (!encoded.success) {
            LOG_DEBUG("IngestService", "[{}] Validation failed: {}", key_, encoded.error_message);
            Finish(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                                "Validation failed: " + encoded.error_message));
            return;
        }

        payload_ = std::move(encoded.payload);
        durable_ = request->has_wait_for_ack()
            ? request->wait_for_ack()
            : entry->table.durable_by_default();

        // Even fire-and-forget may wait on backpressure or a stream recreation
        if (!workers.post([this]() { complete(manager_->submit(key_, payload_, durable_)); })) {
            LOG_WARN("IngestService", "[{}] Rejected ingest: no worker available", key_);
            Finish(serverBusy());
        }
    }

    void OnDone() override {
        delete this;
    }

private:
    void complete(const core::SubmitResult& result) {
        if (!result.success) {
            LOG_WARN("IngestService", "[{}] Ingest failed ({}): {}", key_,
                     core::errorKindToString(result.error), result.error_message);
            Finish(submitErrorStatus(key_, result));
            return;
        }

        response_->set_status("success");
        response_->set_table(key_);
        response_->set_message(durable_ ? "Record ingested and acknowledged"
                                        : "Record ingested");
        response_->set_wait_for_ack(durable_);
        response_->set_outcome(core::submitOutcomeToString(result.outcome));
        response_->set_sequence(result.sequence);

        LOG_TRACE("IngestService", "[{}] Record {} {}", key_, result.sequence,
                  core::submitOutcomeToString(result.outcome));
        Finish(grpc::Status::OK);
    }

    std::shared_ptr<core::StreamLifecycleManager> manager_;
    ingest::IngestResponse* response_;
    std::string key_;
    std::string payload_;
    bool durable_ = false;
};

// =============================================================================
// GetHealth
// =============================================================================

class GetHealthReactor : public grpc::ServerUnaryReactor {
public:
    GetHealthReactor(const std::shared_ptr<const config::TableCatalog>& catalog,
                     const std::shared_ptr<core::StreamLifecycleManager>& manager,
                     const ingest::HealthRequest* request,
                     ingest::HealthResponse* response) {
        const std::string& key = request->table_key();

        if (key.empty()) {
            response->set_status("healthy");
            for (const auto& active : manager->activeDestinations()) {
                response->add_active_streams(active);
            }
            Finish(grpc::Status::OK);
            return;
        }

        const config::TableEntry* entry = catalog->find(key);
        if (entry == nullptr) {
            Finish(tableNotFound(key));
            return;
        }

        auto status = manager->healthOf(key);
        response->set_status("healthy");
        response->set_table(key);
        response->set_table_name(entry->table.table_name());
        response->set_stream_status(core::slotStatusToString(status));
        response->set_stream_active(status == core::SlotStatus::READY);
        response->set_last_error(manager->lastErrorOf(key));
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

// =============================================================================
// Flush
// =============================================================================

class FlushReactor : public grpc::ServerUnaryReactor {
public:
    FlushReactor(const std::shared_ptr<const config::TableCatalog>& catalog,
                 std::shared_ptr<core::StreamLifecycleManager> manager,
                 utils::WorkerPool& workers,
                 const ingest::FlushRequest* request,
                 ingest::FlushResponse* response)
        : manager_(std::move(manager))
        , response_(response)
        , key_(request->table_key())
    {
        if (catalog->find(key_) == nullptr) {
            Finish(tableNotFound(key_));
            return;
        }

        if (!workers.post([this]() { complete(manager_->flush(key_)); })) {
            LOG_WARN("IngestService", "[{}] Rejected flush: no worker available", key_);
            Finish(serverBusy());
        }
    }

    void OnDone() override {
        delete this;
    }

private:
    void complete(const core::FlushResult& result) {
        switch (result.status) {
            case core::FlushStatus::FLUSHED:
                response_->set_status("success");
                response_->set_message("Stream for '" + key_ + "' flushed");
                Finish(grpc::Status::OK);
                break;

            case core::FlushStatus::NO_ACTIVE_STREAM:
                response_->set_status("no_active_stream");
                response_->set_message("No active stream for '" + key_ + "'");
                Finish(grpc::Status::OK);
                break;

            case core::FlushStatus::UNKNOWN_DESTINATION:
                Finish(tableNotFound(key_));
                break;

            case core::FlushStatus::FAILED:
            default:
                LOG_WARN("IngestService", "[{}] Flush failed: {}", key_, result.error_message);
                Finish(grpc::Status(grpc::StatusCode::INTERNAL,
                                    "Flush failed: " + result.error_message));
                break;
        }
    }

    std::shared_ptr<core::StreamLifecycleManager> manager_;
    ingest::FlushResponse* response_;
    std::string key_;
};

// =============================================================================
// IngestServiceImpl
// =============================================================================

IngestServiceImpl::IngestServiceImpl(std::shared_ptr<const config::TableCatalog> catalog,
                                     std::shared_ptr<core::StreamLifecycleManager> manager,
                                     ServiceOptions options)
    : catalog_(std::move(catalog))
    , manager_(std::move(manager))
    , workers_("IngestWorkers", options.worker_threads, options.max_pending_requests)
{
    LOG_INFO("IngestService", "Created ingest service ({} tables, {} workers)",
             catalog_->size(), workers_.threadCount());
}

IngestServiceImpl::~IngestServiceImpl() {
    size_t pending = workers_.queued();
    if (pending > 0) {
        LOG_INFO("IngestService", "Completing {} queued requests", pending);
    }
    workers_.stop();
}

grpc::ServerUnaryReactor* IngestServiceImpl::Ingest(
    grpc::CallbackServerContext* context,
    const ingest::IngestRequest* request,
    ingest::IngestResponse* response) {

    return new IngestReactor(catalog_, manager_, workers_, request, response);
}

grpc::ServerUnaryReactor* IngestServiceImpl::GetHealth(
    grpc::CallbackServerContext* context,
    const ingest::HealthRequest* request,
    ingest::HealthResponse* response) {

    return new GetHealthReactor(catalog_, manager_, request, response);
}

grpc::ServerUnaryReactor* IngestServiceImpl::Flush(
    grpc::CallbackServerContext* context,
    const ingest::FlushRequest* request,
    ingest::FlushResponse* response) {

    return new FlushReactor(catalog_, manager_, workers_, request, response);
}

grpc::ServerUnaryReactor* IngestServiceImpl::GetServiceInfo(
    grpc::CallbackServerContext* context,
    const ingest::ServiceInfoRequest* request,
    ingest::ServiceInfoResponse* response) {

    response->set_service("ingestd");
    response->set_version(INGESTD_VERSION);
    for (const auto& key : catalog_->keys()) {
        const config::TableEntry* entry = catalog_->find(key);
        auto* info = response->add_tables();
        info->set_key(key);
        info->set_table_name(entry->table.table_name());
        info->set_message_name(entry->table.message_name());
        info->set_durable_by_default(entry->table.durable_by_default());
    }

    auto* reactor = context->DefaultReactor();
    reactor->Finish(grpc::Status::OK);
    return reactor;
}

}  // namespace services
}  // namespace ingestd
