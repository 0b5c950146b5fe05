/**
 * @file ack_tracker.hpp
 * @brief Generation-tagged bookkeeping for durable sends.
 *
 * Each durable send registers a PendingAck keyed by (stream generation,
 * sequence number). Transport acknowledgments resolve it; recreating or
 * closing the stream resolves every entry of the old generation as failed,
 * so an acknowledgment from a superseded stream can never satisfy a waiter
 * on the new one.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#pragma once

#include "ingestd/core/export.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ingestd {
namespace core {

enum class AckState {
    PENDING,
    ACKED,
    FAILED
};

inline const char* ackStateToString(AckState state) {
    switch (state) {
        case AckState::PENDING: return "pending";
        case AckState::ACKED: return "acked";
        case AckState::FAILED: return "failed";
        default: return "unknown";
    }
}

/**
 * @struct PendingAck
 * @brief One in-flight durable send. Resolved exactly once.
 */
struct INGESTD_CORE_API PendingAck {
    std::string key;
    uint64_t generation = 0;
    uint64_t seq = 0;

    mutable std::mutex mutex;
    std::condition_variable cv;
    AckState state = AckState::PENDING;
    std::string cause;
};

/**
 * @class AckWaiter
 * @brief Caller-side view of a PendingAck.
 *
 * The waiter shares ownership of the entry, so it stays valid after the
 * tracker has forgotten it.
 */
class INGESTD_CORE_API AckWaiter {
public:
    AckWaiter() = default;
    explicit AckWaiter(std::shared_ptr<PendingAck> pending);

    bool valid() const { return pending_ != nullptr; }

    /**
     * @brief Block until the entry resolves or the timeout elapses.
     * @return ACKED or FAILED, or PENDING if the wait timed out.
     */
    AckState wait(std::chrono::milliseconds timeout) const;

    AckState state() const;
    std::string cause() const;
    uint64_t sequence() const;
    uint64_t generation() const;

private:
    std::shared_ptr<PendingAck> pending_;
};

/**
 * @class AckTracker
 * @brief Correlates transport acknowledgments with waiting submitters.
 *
 * Thread-safe. Generations must be registered in non-decreasing order,
 * which holds because a slot only ever increases its generation.
 */
class INGESTD_CORE_API AckTracker {
public:
    explicit AckTracker(std::string key);

    AckTracker(const AckTracker&) = delete;
    AckTracker& operator=(const AckTracker&) = delete;

    /**
     * @brief Register a durable send.
     *
     * Registering against a generation that was already invalidated
     * returns a waiter that is resolved as FAILED. Registering the same
     * (generation, seq) twice returns the existing entry.
     */
    AckWaiter registerAck(uint64_t generation, uint64_t seq);

    /**
     * @brief Resolve an entry as acknowledged.
     * @return True if a pending entry was resolved; unknown entries are ignored.
     */
    bool onAck(uint64_t generation, uint64_t seq);

    /**
     * @brief Resolve an entry as failed.
     * @return True if a pending entry was resolved; unknown entries are ignored.
     */
    bool onFailure(uint64_t generation, uint64_t seq, const std::string& cause);

    /**
     * @brief Fail every pending entry of @p generation and older, and
     * refuse further registrations for them.
     * @return Number of entries resolved.
     */
    size_t invalidateGeneration(uint64_t generation,
                                const std::string& cause = "stream generation superseded");

    size_t pendingCount() const;
    size_t pendingCount(uint64_t generation) const;

    const std::string& key() const { return key_; }

private:
    std::string key_;

    mutable std::mutex mutex_;
    // generation -> seq -> entry
    std::map<uint64_t, std::unordered_map<uint64_t, std::shared_ptr<PendingAck>>> pending_;
    uint64_t retiredThrough_ = 0;

    bool resolveLocked(uint64_t generation, uint64_t seq,
                       AckState state, const std::string& cause);
    static void resolve(PendingAck& pending, AckState state, const std::string& cause);
};

}  // namespace core
}  // namespace ingestd
