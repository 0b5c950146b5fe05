/**
 * @file stream_slot.hpp
 * @brief Per-destination stream state machine.
 *
 * A StreamSlot holds at most one live RemoteStream for its destination
 * and arbitrates concurrent access to it:
 *
 *   Empty -> Creating -> Ready <-> Failed (recovery goes through Creating)
 *   Empty | Ready | Failed -> Draining -> Closed
 *
 * Only one caller performs a creation at a time; callers arriving while
 * it is in flight wait for, and share, its outcome.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#pragma once

#include "ingestd/core/export.hpp"
#include "ingestd/core/ack_tracker.hpp"
#include "ingestd/core/remote_stream.hpp"
#include "ingestd/core/stream_types.hpp"
#include "ingestd/utils/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace ingestd {
namespace core {

/**
 * @struct StreamLease
 * @brief A borrowed reference to a slot's handle.
 *
 * Tagged with the generation it was issued for; StreamSlot::send rejects
 * leases whose generation is no longer current.
 */
struct StreamLease {
    bool success = false;
    std::shared_ptr<RemoteStream> stream;
    uint64_t generation = 0;
    ErrorKind error = ErrorKind::NONE;
    TransportErrorClass error_class = TransportErrorClass::NONE;
    std::string error_message;
};

/**
 * @struct SendOutcome
 * @brief Result of StreamSlot::send.
 */
struct SendOutcome {
    bool success = false;
    uint64_t seq = 0;
    uint64_t generation = 0;
    AckWaiter waiter;           ///< Valid only for durable sends
    ErrorKind error = ErrorKind::NONE;
    std::string error_message;
};

/**
 * @class StreamSlot
 * @brief Owns one destination's stream and its lifecycle.
 *
 * Must be owned by a std::shared_ptr: acknowledgment callbacks handed to
 * the transport hold a weak reference back to the slot.
 *
 * Usage:
 * @code
 * auto slot = std::make_shared<StreamSlot>(config, transport);
 * auto lease = slot->acquireReady(std::chrono::seconds(10));
 * if (lease.success) {
 *     auto sent = slot->send(lease, payload, true);
 *     if (!sent.success) {
 *         slot->invalidate(sent.error_message, lease.generation);
 *     }
 * }
 * @endcode
 */
class INGESTD_CORE_API StreamSlot : public std::enable_shared_from_this<StreamSlot> {
public:
    /**
     * @brief Create an empty slot.
     * @param config Destination parameters passed to Transport::open.
     * @param transport Transport used to open streams.
     * @param closeTimeout Bound on closing a retired stream.
     */
    StreamSlot(DestinationConfig config, std::shared_ptr<Transport> transport,
               std::chrono::milliseconds closeTimeout = std::chrono::milliseconds(5000));

    /**
     * @brief Closes the current stream and waits for retired ones to close.
     */
    ~StreamSlot();

    // Non-copyable
    StreamSlot(const StreamSlot&) = delete;
    StreamSlot& operator=(const StreamSlot&) = delete;

    /**
     * @brief Get a usable stream, creating one if needed.
     *
     * Returns immediately when Ready and the handle probes healthy. Waits
     * (up to @p timeout) on a creation already in flight and reports its
     * outcome. Otherwise the caller becomes the creator; its open call gets
     * whatever is left of @p timeout. A stream retired by the recreation is
     * closed in the background, never on the caller's thread.
     *
     * A wait that times out fails with TIMEOUT but leaves the creation
     * running; its result still updates the slot.
     */
    StreamLease acquireReady(std::chrono::milliseconds timeout);

    /**
     * @brief Send a payload on the leased stream.
     *
     * Sends on one slot reach the transport in call order. Fails with
     * SEND_REJECTED when the lease is stale or the stream is broken, and
     * with TIMEOUT when the stream applies backpressure for too long.
     *
     * @param durable Register a PendingAck and return its waiter.
     */
    SendOutcome send(const StreamLease& lease, const std::string& payload, bool durable);

    /**
     * @brief Mark the current stream broken.
     *
     * Moves a Ready slot to Failed, fails the stream's pending acks and
     * hands the stream to the background closer. Never blocks on a send
     * or on the remote side. With a non-zero @p generation this is a no-op
     * if the slot has already moved on to a newer stream.
     */
    void invalidate(const std::string& reason, uint64_t generation = 0);

    /**
     * @brief Flush the current stream, if any.
     */
    FlushResult flush(std::chrono::milliseconds timeout);

    /**
     * @brief Flush and close the stream, then refuse further use.
     *
     * The flush and the close share @p timeout, so the call returns by
     * then even when the remote side stops responding. Closed is
     * terminal. Calling this again returns a clean result.
     */
    DrainResult drainAndClose(std::chrono::milliseconds timeout);

    SlotStatus status() const;
    std::string lastError() const;
    uint64_t generation() const;

    /**
     * @brief Number of successful creations over the slot's lifetime.
     */
    uint64_t creationCount() const { return creations_.load(); }

    const std::string& key() const { return config_.key; }
    const DestinationConfig& config() const { return config_; }

private:
    DestinationConfig config_;
    std::shared_ptr<Transport> transport_;
    std::chrono::milliseconds closeTimeout_;
    AckTracker acks_;

    // Guards every field below; stateCv_ signals status changes
    mutable std::mutex stateMutex_;
    std::condition_variable stateCv_;
    SlotStatus status_ = SlotStatus::EMPTY;
    std::shared_ptr<RemoteStream> handle_;
    uint64_t generation_ = 0;
    uint64_t nextGeneration_ = 1;
    uint64_t creationAttempt_ = 0;
    uint64_t completedAttempt_ = 0;
    std::string lastError_;
    TransportErrorClass lastErrorClass_ = TransportErrorClass::NONE;

    // Serializes sends (and ack delivery) on this slot.
    // Lock order: sendMutex_ before stateMutex_.
    std::timed_mutex sendMutex_;

    std::atomic<uint64_t> creations_{0};

    // Closes retired streams off the callers' threads
    utils::WorkerPool closer_;

    StreamLease create(std::unique_lock<std::mutex>& lock,
                       std::shared_ptr<RemoteStream> retired,
                       uint64_t retiredGeneration,
                       std::chrono::steady_clock::time_point deadline);

    StreamLease leaseLocked() const;
    StreamLease failureLocked(ErrorKind error, const std::string& message) const;

    AckCallbacks makeCallbacks(uint64_t generation);
    void handleAck(uint64_t generation, uint64_t seq);
    void handleFailure(uint64_t generation, uint64_t seq, const std::string& cause);

    void retire(std::shared_ptr<RemoteStream> stream, uint64_t generation);
};

}  // namespace core
}  // namespace ingestd
