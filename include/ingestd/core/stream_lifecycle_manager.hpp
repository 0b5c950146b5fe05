/**
 * @file stream_lifecycle_manager.hpp
 * @brief Owns one persistent outbound stream per destination key.
 *
 * The StreamLifecycleManager maintains:
 * - The configured destinations (read-only after construction)
 * - A lazily populated map of destination key -> StreamSlot
 * - Coordinated, bounded shutdown across every slot
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#pragma once

#include "ingestd/core/export.hpp"
#include "ingestd/core/remote_stream.hpp"
#include "ingestd/core/stream_slot.hpp"
#include "ingestd/core/stream_types.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ingestd {
namespace core {

/**
 * @struct ManagerOptions
 * @brief Timeouts bounding every blocking wait in the manager.
 */
struct INGESTD_CORE_API ManagerOptions {
    int64_t creation_timeout_ms;    ///< acquireReady wait / open handshake
    int64_t ack_timeout_ms;         ///< Durable submit wait
    int64_t drain_timeout_ms;       ///< Per-slot flush on shutdown, and explicit flush
    int64_t shutdown_timeout_ms;    ///< Overall shutdown deadline
    int64_t close_timeout_ms;       ///< Background close of a retired stream

    ManagerOptions()
        : creation_timeout_ms(10000)
        , ack_timeout_ms(30000)
        , drain_timeout_ms(10000)
        , shutdown_timeout_ms(15000)
        , close_timeout_ms(5000)
    {}
};

/**
 * @class StreamLifecycleManager
 * @brief Thread-safe entry point used by the request layer.
 *
 * Constructed once at startup and passed explicitly to whoever needs it.
 * Slots are created the first time a configured key is referenced and live
 * until the manager is destroyed.
 *
 * Usage:
 * @code
 * StreamLifecycleManager manager(destinations, transport);
 *
 * auto result = manager.submit("orders", payload, true);
 * if (result.success && result.outcome == SubmitOutcome::DURABLE) {
 *     // remote side acknowledged the record
 * }
 *
 * manager.shutdown();
 * @endcode
 */
class INGESTD_CORE_API StreamLifecycleManager {
public:
    /**
     * @brief Create a manager for a fixed set of destinations.
     * @param destinations One entry per destination key (keys must be unique).
     * @param transport Transport shared by every slot.
     * @param options Timeouts.
     */
    StreamLifecycleManager(const std::vector<DestinationConfig>& destinations,
                           std::shared_ptr<Transport> transport,
                           ManagerOptions options = ManagerOptions());

    /**
     * @brief Shuts down (if not already done) and joins any drain that
     *        outlived the shutdown deadline.
     */
    ~StreamLifecycleManager();

    // Non-copyable
    StreamLifecycleManager(const StreamLifecycleManager&) = delete;
    StreamLifecycleManager& operator=(const StreamLifecycleManager&) = delete;

    /**
     * @brief Send an encoded record to a destination.
     *
     * A stale stream is invalidated and the send retried once on a fresh
     * one; repeated failures are returned, not retried.
     *
     * @param key Destination key.
     * @param payload Encoded record.
     * @param durable Block until the remote side acknowledges the record.
     * @return ACCEPTED or DURABLE on success; otherwise an ErrorKind.
     */
    SubmitResult submit(const std::string& key, const std::string& payload, bool durable);

    /**
     * @brief Same as submit(), with an explicit durable wait bound.
     */
    SubmitResult submit(const std::string& key, const std::string& payload, bool durable,
                        std::chrono::milliseconds ackTimeout);

    /**
     * @brief Current slot state; UNKNOWN if the key was never referenced.
     *
     * Never blocks and never creates a slot.
     */
    SlotStatus healthOf(const std::string& key) const;

    /**
     * @brief Last failure recorded by the key's slot (empty if none).
     */
    std::string lastErrorOf(const std::string& key) const;

    /**
     * @brief Flush the destination's active stream, bounded by the drain timeout.
     */
    FlushResult flush(const std::string& key);
    FlushResult flush(const std::string& key, std::chrono::milliseconds timeout);

    /**
     * @brief Keys whose stream is currently Ready, sorted.
     */
    std::vector<std::string> activeDestinations() const;

    /**
     * @brief Every configured key, sorted.
     */
    std::vector<std::string> configuredDestinations() const;

    /**
     * @brief Configuration for a key, or nullptr if it is not configured.
     */
    const DestinationConfig* destination(const std::string& key) const;

    /**
     * @brief Drain and close every slot concurrently.
     *
     * Bounded by shutdown_timeout_ms overall. A drain still running at
     * the deadline is reported as failed and joined by the destructor.
     * Idempotent: later calls return the first call's report. Submits
     * after shutdown fail with DESTINATION_UNAVAILABLE.
     */
    ShutdownReport shutdown();

    bool isShutdown() const;

    const ManagerOptions& options() const { return options_; }

private:
    std::unordered_map<std::string, DestinationConfig> destinations_;
    std::shared_ptr<Transport> transport_;
    ManagerOptions options_;

    mutable std::shared_mutex slotsMutex_;
    std::unordered_map<std::string, std::shared_ptr<StreamSlot>> slots_;
    bool shuttingDown_ = false;

    std::once_flag shutdownOnce_;
    ShutdownReport shutdownReport_;

    // Drains that missed the shutdown deadline; written once by drainAll()
    std::vector<std::thread> lateDrains_;

    std::shared_ptr<StreamSlot> slotFor(const std::string& key, SubmitResult& result);
    std::shared_ptr<StreamSlot> findSlot(const std::string& key) const;

    ShutdownReport drainAll();
};

}  // namespace core
}  // namespace ingestd
