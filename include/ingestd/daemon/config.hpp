/**
 * @file config.hpp
 * @brief ingestd daemon configuration and CLI parsing
 */

#pragma once

#include <string>
#include <cstdint>
#include <iostream>
#include <cstring>
#include <stdexcept>

namespace ingestd {
namespace daemon {

/**
 * @brief Daemon configuration structure
 */
struct Config {
    std::string config_path = "config.json";
    std::string listen_addr = "0.0.0.0:8000";
    std::string log_level = "INFO";
    bool color = true;
    bool tls = false;                           ///< TLS to the sink endpoint
    bool help = false;
    bool error = false;                         ///< Set when parsing failed

    // Stream lifecycle timeouts
    int64_t creation_timeout_ms = 10000;        ///< Stream open handshake / creation wait
    int64_t ack_timeout_ms = 30000;             ///< Durable ingest wait
    int64_t drain_timeout_ms = 10000;           ///< Per-stream flush on shutdown
    int64_t shutdown_timeout_ms = 15000;        ///< Overall shutdown deadline
    int64_t close_timeout_ms = 5000;            ///< Background close of a replaced stream

    // Flow control (signed so negative input is caught by validateConfig)
    int64_t max_inflight_records = 50000;       ///< Unacknowledged records per stream
    int64_t worker_threads = 16;                ///< Request handling threads
    int64_t max_pending_requests = 10000;       ///< Requests queued for a worker
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "ingestd - Streaming Record Ingestion Daemon\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config <path>       Service configuration file (default: config.json)\n"
              << "  --listen <addr>       gRPC listen address (default: 0.0.0.0:8000)\n"
              << "  --log-level <level>   Log level: TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: INFO)\n"
              << "  --no-color            Disable colored log output\n"
              << "  --tls                 Use TLS for connections to the sink\n"
              << "\nStream Options:\n"
              << "  --creation-timeout-ms <ms>  Stream creation timeout (default: 10000)\n"
              << "  --ack-timeout-ms <ms>       Durable ingest acknowledgment timeout (default: 30000)\n"
              << "  --drain-timeout-ms <ms>     Per-stream drain timeout on shutdown (default: 10000)\n"
              << "  --shutdown-timeout-ms <ms>  Overall shutdown timeout (default: 15000)\n"
              << "  --close-timeout-ms <ms>     Close timeout for a replaced stream (default: 5000)\n"
              << "  --max-inflight <n>          Unacknowledged records per stream (default: 50000)\n"
              << "\nRequest Options:\n"
              << "  --workers <n>               Request handling threads (default: 16)\n"
              << "  --max-pending <n>           Requests waiting for a worker before RESOURCE_EXHAUSTED (default: 10000)\n"
              << "\n  --help                Show this help message\n\n"
              << "Environment:\n"
              << "  INGESTD_CLIENT_ID, INGESTD_CLIENT_SECRET  Sink credentials (required)\n\n"
              << "Example:\n"
              << "  " << program_name << " --config /etc/ingestd/config.json --listen 0.0.0.0:8000\n"
              << "  " << program_name << " --ack-timeout-ms 5000 --max-inflight 10000\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; error is set (with help) on invalid input
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Flags
        if (std::strcmp(arg, "--no-color") == 0) {
            config.color = false;
            continue;
        }
        if (std::strcmp(arg, "--tls") == 0) {
            config.tls = true;
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.help = true;
            config.error = true;
            return config;
        }

        const char* value = argv[++i];

        try {
            if (std::strcmp(arg, "--config") == 0) {
                config.config_path = value;
            } else if (std::strcmp(arg, "--listen") == 0) {
                config.listen_addr = value;
            } else if (std::strcmp(arg, "--log-level") == 0) {
                config.log_level = value;
            } else if (std::strcmp(arg, "--creation-timeout-ms") == 0) {
                config.creation_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--ack-timeout-ms") == 0) {
                config.ack_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--drain-timeout-ms") == 0) {
                config.drain_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--shutdown-timeout-ms") == 0) {
                config.shutdown_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--close-timeout-ms") == 0) {
                config.close_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--max-inflight") == 0) {
                config.max_inflight_records = std::stoll(value);
            } else if (std::strcmp(arg, "--workers") == 0) {
                config.worker_threads = std::stoll(value);
            } else if (std::strcmp(arg, "--max-pending") == 0) {
                config.max_pending_requests = std::stoll(value);
            } else {
                std::cerr << "Error: Unknown option " << arg << "\n";
                config.help = true;
                config.error = true;
                return config;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Error: Invalid value '" << value << "' for " << arg << "\n";
            config.help = true;
            config.error = true;
            return config;
        }
    }

    return config;
}

/**
 * @brief Check option ranges after parsing
 * @param config Parsed configuration
 * @param error Receives the first problem found
 * @return True if every timeout and limit is positive
 */
inline bool validateConfig(const Config& config, std::string* error) {
    struct Bound { const char* name; int64_t value; };
    const Bound bounds[] = {
        {"--creation-timeout-ms", config.creation_timeout_ms},
        {"--ack-timeout-ms", config.ack_timeout_ms},
        {"--drain-timeout-ms", config.drain_timeout_ms},
        {"--shutdown-timeout-ms", config.shutdown_timeout_ms},
        {"--close-timeout-ms", config.close_timeout_ms},
        {"--max-inflight", config.max_inflight_records},
        {"--workers", config.worker_threads},
        {"--max-pending", config.max_pending_requests},
    };
    for (const auto& bound : bounds) {
        if (bound.value <= 0) {
            *error = std::string(bound.name) + " must be positive";
            return false;
        }
    }
    if (config.listen_addr.empty()) {
        *error = "--listen must not be empty";
        return false;
    }
    return true;
}

} // namespace daemon
} // namespace ingestd
