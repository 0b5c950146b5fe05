/**
 * @file ingest_service.hpp
 * @brief Async gRPC service accepting records from applications.
 *
 * IngestService is the request-facing API:
 * - Ingest: Validate a record, encode it and forward it to its table's stream
 * - GetHealth: Service health or one table's stream status
 * - Flush: Flush a table's stream
 * - GetServiceInfo: Configured tables
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#pragma once

#include "ingestd/services/export.hpp"
#include "ingestd/config/service_config.hpp"
#include "ingestd/core/stream_lifecycle_manager.hpp"
#include "ingestd/utils/worker_pool.hpp"

#include <grpcpp/grpcpp.h>
#include <memory>
#include <string>

// Include generated gRPC service base
#include "ingestd/proto/ingest.grpc.pb.h"

#ifndef INGESTD_VERSION
#define INGESTD_VERSION "0.1.0"
#endif

namespace ingestd {
namespace services {

/**
 * @brief Map a failed submit to the status returned to the caller.
 *
 * Unknown table -> NOT_FOUND, unavailable or stale stream -> UNAVAILABLE,
 * timeout -> DEADLINE_EXCEEDED, unacknowledged record -> ABORTED.
 */
INGESTD_SERVICES_API grpc::Status submitErrorStatus(const std::string& tableKey,
                                                    const core::SubmitResult& result);

/**
 * @struct ServiceOptions
 * @brief Bounds on request handling.
 */
struct INGESTD_SERVICES_API ServiceOptions {
    size_t worker_threads = 16;             ///< Threads completing Ingest and Flush calls
    size_t max_pending_requests = 10000;    ///< Calls waiting for a worker
};

/**
 * @class IngestServiceImpl
 * @brief Implementation of the IngestService gRPC service.
 *
 * Ingest and Flush calls are completed on a fixed pool of worker threads
 * owned by the service, never on the gRPC callback thread. When
 * max_pending_requests calls are already waiting for a worker, new ones
 * fail with RESOURCE_EXHAUSTED.
 *
 * Usage:
 * @code
 * auto manager = std::make_shared<StreamLifecycleManager>(catalog->destinations(), transport);
 * IngestServiceImpl service(catalog, manager);
 *
 * grpc::ServerBuilder builder;
 * builder.AddListeningPort("0.0.0.0:8000", grpc::InsecureServerCredentials());
 * builder.RegisterService(&service);
 * auto server = builder.BuildAndStart();
 * @endcode
 */
class INGESTD_SERVICES_API IngestServiceImpl final : public ingest::IngestService::CallbackService {
public:
    /**
     * @param catalog Configured tables (schemas and destinations).
     * @param manager Stream manager shared with the daemon.
     * @param options Worker pool size and queue bound.
     */
    IngestServiceImpl(std::shared_ptr<const config::TableCatalog> catalog,
                      std::shared_ptr<core::StreamLifecycleManager> manager,
                      ServiceOptions options = ServiceOptions());

    /**
     * @brief Completes the calls still queued and joins the workers.
     *
     * Destroy the service only after the gRPC server has shut down.
     */
    ~IngestServiceImpl() override;

    // =========================================================================
    // gRPC Service Methods (Async Callback API)
    // =========================================================================

    grpc::ServerUnaryReactor* Ingest(
        grpc::CallbackServerContext* context,
        const ingest::IngestRequest* request,
        ingest::IngestResponse* response) override;

    grpc::ServerUnaryReactor* GetHealth(
        grpc::CallbackServerContext* context,
        const ingest::HealthRequest* request,
        ingest::HealthResponse* response) override;

    grpc::ServerUnaryReactor* Flush(
        grpc::CallbackServerContext* context,
        const ingest::FlushRequest* request,
        ingest::FlushResponse* response) override;

    grpc::ServerUnaryReactor* GetServiceInfo(
        grpc::CallbackServerContext* context,
        const ingest::ServiceInfoRequest* request,
        ingest::ServiceInfoResponse* response) override;

private:
    std::shared_ptr<const config::TableCatalog> catalog_;
    std::shared_ptr<core::StreamLifecycleManager> manager_;

    // Declared last: joined before the manager reference is released
    utils::WorkerPool workers_;
};

}  // namespace services
}  // namespace ingestd
