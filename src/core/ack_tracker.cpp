/**
 * @file ack_tracker.cpp
 * @brief AckTracker implementation.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#include "ingestd/core/ack_tracker.hpp"
#include "ingestd/utils/logger.hpp"

namespace ingestd {
namespace core {

// =============================================================================
// AckWaiter
// =============================================================================

AckWaiter::AckWaiter(std::shared_ptr<PendingAck> pending)
    : pending_(std::move(pending))
{}

AckState AckWaiter::wait(std::chrono::milliseconds timeout) const {
    if (!pending_) {
        return AckState::FAILED;
    }

    std::unique_lock<std::mutex> lock(pending_->mutex);
    pending_->cv.wait_for(lock, timeout, [this]() {
        return pending_->state != AckState::PENDING;
    });
    return pending_->state;
}

AckState AckWaiter::state() const {
    if (!pending_) {
        return AckState::FAILED;
    }
    std::lock_guard<std::mutex> lock(pending_->mutex);
    return pending_->state;
}

std::string AckWaiter::cause() const {
    if (!pending_) {
        return "no pending acknowledgment";
    }
    std::lock_guard<std::mutex> lock(pending_->mutex);
    return pending_->cause;
}

uint64_t AckWaiter::sequence() const {
    return pending_ ? pending_->seq : 0;
}

uint64_t AckWaiter::generation() const {
    return pending_ ? pending_->generation : 0;
}

// =============================================================================
// AckTracker
// =============================================================================

AckTracker::AckTracker(std::string key)
    : key_(std::move(key))
{}

AckWaiter AckTracker::registerAck(uint64_t generation, uint64_t seq) {
    auto pending = std::make_shared<PendingAck>();
    pending->key = key_;
    pending->generation = generation;
    pending->seq = seq;

    std::lock_guard<std::mutex> lock(mutex_);

    if (generation <= retiredThrough_) {
        resolve(*pending, AckState::FAILED, "stream generation already invalidated");
        return AckWaiter(pending);
    }

    auto& entries = pending_[generation];
    auto inserted = entries.emplace(seq, pending);
    if (!inserted.second) {
        return AckWaiter(inserted.first->second);
    }

    LOG_TRACE("AckTracker", "[{}] Registered ack gen={} seq={}", key_, generation, seq);
    return AckWaiter(pending);
}

bool AckTracker::onAck(uint64_t generation, uint64_t seq) {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolveLocked(generation, seq, AckState::ACKED, std::string());
}

bool AckTracker::onFailure(uint64_t generation, uint64_t seq, const std::string& cause) {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolveLocked(generation, seq, AckState::FAILED, cause);
}

size_t AckTracker::invalidateGeneration(uint64_t generation, const std::string& cause) {
    size_t resolved = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    if (generation > retiredThrough_) {
        retiredThrough_ = generation;
    }

    auto it = pending_.begin();
    while (it != pending_.end() && it->first <= generation) {
        for (auto& [seq, pending] : it->second) {
            resolve(*pending, AckState::FAILED, cause);
            ++resolved;
        }
        it = pending_.erase(it);
    }

    if (resolved > 0) {
        LOG_DEBUG("AckTracker", "[{}] Failed {} pending acks through generation {}: {}",
                  key_, resolved, generation, cause);
    }
    return resolved;
}

size_t AckTracker::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [generation, entries] : pending_) {
        total += entries.size();
    }
    return total;
}

size_t AckTracker::pendingCount(uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(generation);
    return it != pending_.end() ? it->second.size() : 0;
}

bool AckTracker::resolveLocked(uint64_t generation, uint64_t seq,
                               AckState state, const std::string& cause) {
    auto genIt = pending_.find(generation);
    if (genIt == pending_.end()) {
        return false;
    }

    auto entryIt = genIt->second.find(seq);
    if (entryIt == genIt->second.end()) {
        return false;
    }

    resolve(*entryIt->second, state, cause);
    genIt->second.erase(entryIt);
    if (genIt->second.empty()) {
        pending_.erase(genIt);
    }
    return true;
}

void AckTracker::resolve(PendingAck& pending, AckState state, const std::string& cause) {
    {
        std::lock_guard<std::mutex> lock(pending.mutex);
        if (pending.state != AckState::PENDING) {
            return;
        }
        pending.state = state;
        pending.cause = cause;
    }
    pending.cv.notify_all();
}

}  // namespace core
}  // namespace ingestd
