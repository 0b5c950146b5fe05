/**
 * @file stream_slot.cpp
 * @brief StreamSlot implementation.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#include "ingestd/core/stream_slot.hpp"
#include "ingestd/utils/logger.hpp"

#include <exception>

namespace ingestd {
namespace core {

namespace {

std::chrono::milliseconds remainingUntil(std::chrono::steady_clock::time_point deadline) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
}

// Free of any slot state: a retired stream may outlive its slot on the closer
void closeStream(const std::string& key, const std::shared_ptr<RemoteStream>& stream,
                 uint64_t generation, std::chrono::milliseconds timeout) {
    if (!stream) {
        return;
    }

    std::string error;
    if (!stream->close(timeout, &error)) {
        LOG_WARN("StreamSlot", "[{}] Error closing stream generation {}: {}",
                 key, generation, error);
    } else {
        LOG_DEBUG("StreamSlot", "[{}] Closed stream generation {}", key, generation);
    }
}

}  // namespace

StreamSlot::StreamSlot(DestinationConfig config, std::shared_ptr<Transport> transport,
                       std::chrono::milliseconds closeTimeout)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , closeTimeout_(closeTimeout)
    , acks_(config_.key)
    , closer_("StreamCloser", 1, 0)
{}

StreamSlot::~StreamSlot() {
    std::shared_ptr<RemoteStream> stream;
    uint64_t generation = 0;
    uint64_t retireThrough = 0;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        stream = std::move(handle_);
        generation = generation_;
        retireThrough = nextGeneration_;
    }

    acks_.invalidateGeneration(retireThrough, "destination released");
    closeStream(config_.key, stream, generation, closeTimeout_);
    closer_.stop();
}

// =============================================================================
// Acquire
// =============================================================================

StreamLease StreamSlot::acquireReady(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(stateMutex_);

    switch (status_) {
        case SlotStatus::READY: {
            if (handle_ && handle_->probe()) {
                return leaseLocked();
            }

            LOG_WARN("StreamSlot", "[{}] Stream generation {} failed its health probe, recreating",
                     config_.key, generation_);
            std::shared_ptr<RemoteStream> retired = std::move(handle_);
            handle_.reset();
            return create(lock, std::move(retired), generation_, deadline);
        }

        case SlotStatus::CREATING: {
            uint64_t attempt = creationAttempt_;
            bool completed = stateCv_.wait_until(lock, deadline, [this, attempt]() {
                return completedAttempt_ >= attempt;
            });
            if (!completed) {
                return failureLocked(ErrorKind::TIMEOUT,
                                     "timed out waiting for stream creation");
            }
            if (status_ == SlotStatus::READY && handle_) {
                return leaseLocked();
            }
            if (status_ == SlotStatus::DRAINING || status_ == SlotStatus::CLOSED) {
                return failureLocked(ErrorKind::DESTINATION_UNAVAILABLE, "destination is closed");
            }
            return failureLocked(ErrorKind::CREATION_FAILED,
                                 lastError_.empty() ? "stream creation failed" : lastError_);
        }

        case SlotStatus::DRAINING:
        case SlotStatus::CLOSED:
            return failureLocked(ErrorKind::DESTINATION_UNAVAILABLE, "destination is closed");

        case SlotStatus::EMPTY:
        case SlotStatus::FAILED:
        default:
            return create(lock, nullptr, 0, deadline);
    }
}

StreamLease StreamSlot::create(std::unique_lock<std::mutex>& lock,
                               std::shared_ptr<RemoteStream> retired,
                               uint64_t retiredGeneration,
                               std::chrono::steady_clock::time_point deadline) {
    uint64_t attempt = ++creationAttempt_;
    uint64_t generation = nextGeneration_++;
    status_ = SlotStatus::CREATING;
    lock.unlock();

    if (retired) {
        // A send still racing on the retired handle registers against an
        // invalidated generation and fails at once
        acks_.invalidateGeneration(retiredGeneration, "stream recreated");
        retire(std::move(retired), retiredGeneration);
    }

    auto timeout = remainingUntil(deadline);
    LOG_DEBUG("StreamSlot", "[{}] Opening stream generation {} to {} ({}ms)",
              config_.key, generation, config_.endpoint, timeout.count());

    OpenResult opened;
    try {
        opened = transport_->open(config_, makeCallbacks(generation), timeout);
    } catch (const std::exception& e) {
        opened = OpenResult();
        opened.error_class = TransportErrorClass::RETRIABLE;
        opened.error_message = std::string("transport error: ") + e.what();
    }
    if (opened.success && !opened.stream) {
        opened.success = false;
        opened.error_class = TransportErrorClass::RETRIABLE;
        opened.error_message = "transport returned no stream";
    }

    lock.lock();
    completedAttempt_ = attempt;

    if (status_ != SlotStatus::CREATING) {
        // Drained while the open was in flight
        lock.unlock();
        stateCv_.notify_all();
        if (opened.success) {
            acks_.invalidateGeneration(generation, "destination closed");
            retire(std::move(opened.stream), generation);
        }
        StreamLease lease;
        lease.error = ErrorKind::DESTINATION_UNAVAILABLE;
        lease.error_message = "destination closed during stream creation";
        return lease;
    }

    if (!opened.success) {
        status_ = SlotStatus::FAILED;
        lastError_ = opened.error_message;
        lastErrorClass_ = opened.error_class;
        StreamLease lease = failureLocked(ErrorKind::CREATION_FAILED, lastError_);
        lock.unlock();
        stateCv_.notify_all();

        LOG_ERROR("StreamSlot", "[{}] Failed to open stream ({}): {}",
                  config_.key, transportErrorClassToString(opened.error_class),
                  opened.error_message);
        return lease;
    }

    handle_ = opened.stream;
    generation_ = generation;
    status_ = SlotStatus::READY;
    lastError_.clear();
    lastErrorClass_ = TransportErrorClass::NONE;
    creations_.fetch_add(1);
    StreamLease lease = leaseLocked();
    lock.unlock();
    stateCv_.notify_all();

    LOG_INFO("StreamSlot", "[{}] Stream ready for {} (generation {}, id {})",
             config_.key, config_.table_name, generation, lease.stream->streamId());
    return lease;
}

StreamLease StreamSlot::leaseLocked() const {
    StreamLease lease;
    lease.success = true;
    lease.stream = handle_;
    lease.generation = generation_;
    return lease;
}

StreamLease StreamSlot::failureLocked(ErrorKind error, const std::string& message) const {
    StreamLease lease;
    lease.error = error;
    lease.error_message = message;
    if (error == ErrorKind::CREATION_FAILED) {
        lease.error_class = lastErrorClass_;
    }
    return lease;
}

// =============================================================================
// Send
// =============================================================================

SendOutcome StreamSlot::send(const StreamLease& lease, const std::string& payload, bool durable) {
    SendOutcome outcome;
    outcome.generation = lease.generation;

    std::lock_guard<std::timed_mutex> sendLock(sendMutex_);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (status_ != SlotStatus::READY || !lease.stream ||
            lease.generation != generation_ || lease.stream != handle_) {
            outcome.error = ErrorKind::SEND_REJECTED;
            outcome.error_message = "stream generation " + std::to_string(lease.generation) +
                                    " is no longer current";
            return outcome;
        }
    }

    SendResult sent = lease.stream->send(payload);
    if (!sent.success) {
        outcome.error = sent.error == SendError::BACKPRESSURE
            ? ErrorKind::TIMEOUT
            : ErrorKind::SEND_REJECTED;
        outcome.error_message = sent.error_message;
        return outcome;
    }

    outcome.success = true;
    outcome.seq = sent.seq;
    if (durable) {
        outcome.waiter = acks_.registerAck(lease.generation, sent.seq);
    }
    return outcome;
}

AckCallbacks StreamSlot::makeCallbacks(uint64_t generation) {
    std::weak_ptr<StreamSlot> weak = weak_from_this();

    AckCallbacks callbacks;
    callbacks.onAck = [weak, generation](uint64_t seq) {
        if (auto self = weak.lock()) {
            self->handleAck(generation, seq);
        }
    };
    callbacks.onFailure = [weak, generation](uint64_t seq, const std::string& cause) {
        if (auto self = weak.lock()) {
            self->handleFailure(generation, seq, cause);
        }
    };
    return callbacks;
}

void StreamSlot::handleAck(uint64_t generation, uint64_t seq) {
    // A send registers its ack before releasing sendMutex_
    { std::lock_guard<std::timed_mutex> barrier(sendMutex_); }
    acks_.onAck(generation, seq);
}

void StreamSlot::handleFailure(uint64_t generation, uint64_t seq, const std::string& cause) {
    { std::lock_guard<std::timed_mutex> barrier(sendMutex_); }
    if (acks_.onFailure(generation, seq, cause)) {
        LOG_DEBUG("StreamSlot", "[{}] Record {} of generation {} failed: {}",
                  config_.key, seq, generation, cause);
    }
}

// =============================================================================
// Invalidate / Flush / Drain
// =============================================================================

void StreamSlot::invalidate(const std::string& reason, uint64_t generation) {
    std::shared_ptr<RemoteStream> retired;
    uint64_t retiredGeneration = 0;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (status_ != SlotStatus::READY) {
            return;
        }
        if (generation != 0 && generation != generation_) {
            return;
        }

        retired = std::move(handle_);
        handle_.reset();
        retiredGeneration = generation_;
        status_ = SlotStatus::FAILED;
        lastError_ = reason;
        lastErrorClass_ = TransportErrorClass::RETRIABLE;
    }
    stateCv_.notify_all();

    LOG_WARN("StreamSlot", "[{}] Invalidated stream generation {}: {}",
             config_.key, retiredGeneration, reason);

    acks_.invalidateGeneration(retiredGeneration, reason);
    retire(std::move(retired), retiredGeneration);
}

FlushResult StreamSlot::flush(std::chrono::milliseconds timeout) {
    FlushResult result;

    std::shared_ptr<RemoteStream> stream;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (status_ != SlotStatus::READY || !handle_) {
            result.status = FlushStatus::NO_ACTIVE_STREAM;
            return result;
        }
        stream = handle_;
        generation = generation_;
    }

    std::string error;
    if (!stream->flush(timeout, &error)) {
        result.status = FlushStatus::FAILED;
        result.error_message = error.empty() ? "flush failed" : error;
        LOG_WARN("StreamSlot", "[{}] Flush failed: {}", config_.key, result.error_message);

        if (!stream->probe()) {
            invalidate(result.error_message, generation);
        }
        return result;
    }

    result.status = FlushStatus::FLUSHED;
    LOG_DEBUG("StreamSlot", "[{}] Flushed stream generation {}", config_.key, generation);
    return result;
}

DrainResult StreamSlot::drainAndClose(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    DrainResult result;
    result.key = config_.key;

    std::shared_ptr<RemoteStream> stream;
    uint64_t generation = 0;
    {
        std::unique_lock<std::mutex> lock(stateMutex_);

        bool settled = stateCv_.wait_until(lock, deadline, [this]() {
            return status_ != SlotStatus::CREATING && status_ != SlotStatus::DRAINING;
        });

        if (!settled) {
            result.clean = false;
            result.error = ErrorKind::TIMEOUT;
            if (status_ == SlotStatus::CREATING) {
                // The creator discards its stream once it sees the slot closed
                status_ = SlotStatus::CLOSED;
                lastError_ = "closed while stream creation was in flight";
                result.error_message = lastError_;
                lock.unlock();
                stateCv_.notify_all();
                LOG_WARN("StreamSlot", "[{}] Closed with stream creation still in flight",
                         config_.key);
            } else {
                result.error_message = "timed out waiting for a concurrent drain";
            }
            return result;
        }

        if (status_ == SlotStatus::CLOSED) {
            return result;
        }

        if (status_ != SlotStatus::READY || !handle_) {
            status_ = SlotStatus::CLOSED;
            lock.unlock();
            stateCv_.notify_all();
            LOG_DEBUG("StreamSlot", "[{}] Closed (no active stream)", config_.key);
            return result;
        }

        status_ = SlotStatus::DRAINING;
        stream = handle_;
        generation = generation_;
    }
    stateCv_.notify_all();

    // No new send can pass the status check; wait out the one in progress
    {
        std::unique_lock<std::timed_mutex> barrier(sendMutex_, deadline);
        if (!barrier.owns_lock()) {
            LOG_WARN("StreamSlot", "[{}] A send is still blocked on generation {}; draining anyway",
                     config_.key, generation);
        }
    }

    std::string flushError;
    bool flushed = stream->flush(remainingUntil(deadline), &flushError);
    if (!flushed) {
        result.failed_acks = acks_.pendingCount(generation);
    }

    closeStream(config_.key, stream, generation, remainingUntil(deadline));
    acks_.invalidateGeneration(generation, "stream closed");

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        handle_.reset();
        status_ = SlotStatus::CLOSED;
        if (!flushed) {
            lastError_ = flushError;
        }
    }
    stateCv_.notify_all();

    if (!flushed) {
        result.clean = false;
        result.error = ErrorKind::UNACKNOWLEDGED_ON_SHUTDOWN;
        result.error_message = flushError.empty() ? "flush did not complete" : flushError;
        LOG_WARN("StreamSlot", "[{}] Closed with {} unacknowledged records: {}",
                 config_.key, result.failed_acks, result.error_message);
    } else {
        LOG_INFO("StreamSlot", "[{}] Drained and closed stream generation {}",
                 config_.key, generation);
    }
    return result;
}

// =============================================================================
// Accessors
// =============================================================================

SlotStatus StreamSlot::status() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return status_;
}

std::string StreamSlot::lastError() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return lastError_;
}

uint64_t StreamSlot::generation() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return generation_;
}

void StreamSlot::retire(std::shared_ptr<RemoteStream> stream, uint64_t generation) {
    if (!stream) {
        return;
    }

    std::string key = config_.key;
    auto timeout = closeTimeout_;
    bool queued = closer_.post([key, stream, generation, timeout]() {
        closeStream(key, stream, generation, timeout);
    });
    if (!queued) {
        closeStream(key, stream, generation, timeout);
    }
}

}  // namespace core
}  // namespace ingestd
