/**
 * @file main.cpp
 * @brief ingestd daemon entry point
 *
 * This is the thin executable that wires together all the library components:
 * - Table catalog (schemas and destinations) from the service configuration
 * - Stream lifecycle manager over the gRPC sink transport
 * - Ingest service for the application-facing API
 */

#include <ingestd/daemon/config.hpp>
#include <ingestd/utils/logger.hpp>
#include <ingestd/config/service_config.hpp>
#include <ingestd/core/stream_lifecycle_manager.hpp>
#include <ingestd/transport/grpc_transport.hpp>
#include <ingestd/services/ingest_service.hpp>

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <csignal>
#include <atomic>
#include <memory>
#include <thread>
#include <chrono>

using namespace ingestd;
using namespace ingestd::daemon;

// Global shutdown flag
static std::atomic<int> g_signal{0};

// Signal handler
void signalHandler(int signal) {
    g_signal.store(signal);
}

int main(int argc, char* argv[]) {
    // Parse command line arguments
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return config.error ? 1 : 0;
    }

    std::string error;
    if (!validateConfig(config, &error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    // Configure logging
    utils::Logger::instance().setLevel(utils::parseLogLevel(config.log_level));
    utils::Logger::instance().setColorEnabled(config.color);

    LOG_INFO("Daemon", "ingestd {} starting...", INGESTD_VERSION);

    // Load service configuration and credentials
    ingestd::config::ServiceConfig serviceConfig;
    if (!ingestd::config::loadServiceConfig(config.config_path, &serviceConfig, &error)) {
        LOG_ERROR("Daemon", "Failed to load {}: {}", config.config_path, error);
        return 1;
    }

    ingestd::config::Credentials credentials;
    if (!ingestd::config::loadCredentials(&credentials, &error)) {
        LOG_ERROR("Daemon", "{}", error);
        return 1;
    }

    std::shared_ptr<const ingestd::config::TableCatalog> catalog =
        ingestd::config::TableCatalog::build(serviceConfig, credentials, &error);
    if (!catalog) {
        LOG_ERROR("Daemon", "Invalid table configuration: {}", error);
        return 1;
    }

    LOG_INFO("Daemon", "Sink endpoint: {}", catalog->remote().server_endpoint());
    if (!catalog->remote().workspace_url().empty()) {
        LOG_INFO("Daemon", "Workspace: {} ({})", catalog->remote().workspace_url(),
                 catalog->remote().workspace_id());
    }
    for (const auto& key : catalog->keys()) {
        const auto* entry = catalog->find(key);
        LOG_INFO("Daemon", "Table '{}': {} ({} fields, durable_by_default={})",
                 key, entry->table.table_name(), entry->table.fields_size(),
                 entry->table.durable_by_default());
    }

    // Install signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        transport::GrpcStreamOptions streamOptions;
        streamOptions.max_inflight_records = static_cast<size_t>(config.max_inflight_records);

        auto sink_transport = std::make_shared<transport::GrpcTransport>(streamOptions, config.tls);

        core::ManagerOptions managerOptions;
        managerOptions.creation_timeout_ms = config.creation_timeout_ms;
        managerOptions.ack_timeout_ms = config.ack_timeout_ms;
        managerOptions.drain_timeout_ms = config.drain_timeout_ms;
        managerOptions.shutdown_timeout_ms = config.shutdown_timeout_ms;
        managerOptions.close_timeout_ms = config.close_timeout_ms;

        // Create stream lifecycle manager (passed explicitly to the service)
        auto manager = std::make_shared<core::StreamLifecycleManager>(
            catalog->destinations(), sink_transport, managerOptions);

        // Create ingest service
        services::ServiceOptions serviceOptions;
        serviceOptions.worker_threads = static_cast<size_t>(config.worker_threads);
        serviceOptions.max_pending_requests = static_cast<size_t>(config.max_pending_requests);
        auto ingest_service = std::make_unique<services::IngestServiceImpl>(
            catalog, manager, serviceOptions);

        // Build and start gRPC server
        grpc::ServerBuilder builder;
        builder.AddListeningPort(config.listen_addr, grpc::InsecureServerCredentials());
        builder.RegisterService(ingest_service.get());
        auto server = builder.BuildAndStart();

        if (!server) {
            LOG_ERROR("Daemon", "Failed to start ingest server on {}", config.listen_addr);
            manager->shutdown();
            return 1;
        }
        LOG_INFO("Daemon", "Ingest server listening on {}", config.listen_addr);
        LOG_INFO("Daemon", "ingestd is ready");

        // Main loop - wait for shutdown signal
        while (g_signal.load() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // Graceful shutdown
        LOG_INFO("Daemon", "Received signal {}, shutting down...", g_signal.load());

        // Stop accepting requests; in-flight ones finish against open streams
        auto deadline = std::chrono::system_clock::now() + std::chrono::seconds(5);
        server->Shutdown(deadline);

        // Drain and close every stream
        auto report = manager->shutdown();
        for (const auto& failure : report.failures) {
            LOG_WARN("Daemon", "Table '{}' did not drain cleanly ({}): {}",
                     failure.key, core::errorKindToString(failure.error), failure.error_message);
        }

        LOG_INFO("Daemon", "ingestd stopped ({} streams closed cleanly, {} failed)",
                 report.slots_closed, report.failures.size());
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("Daemon", "Fatal error: {}", e.what());
        return 1;
    }
}
