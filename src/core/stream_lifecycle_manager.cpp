/**
 * @file stream_lifecycle_manager.cpp
 * @brief StreamLifecycleManager implementation.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#include "ingestd/core/stream_lifecycle_manager.hpp"
#include "ingestd/utils/logger.hpp"

#include <algorithm>
#include <future>
#include <thread>

namespace ingestd {
namespace core {

StreamLifecycleManager::StreamLifecycleManager(const std::vector<DestinationConfig>& destinations,
                                               std::shared_ptr<Transport> transport,
                                               ManagerOptions options)
    : transport_(std::move(transport))
    , options_(options)
{
    for (const auto& config : destinations) {
        if (!destinations_.emplace(config.key, config).second) {
            LOG_WARN("LifecycleManager", "Duplicate destination key '{}' ignored", config.key);
        }
    }
    LOG_DEBUG("LifecycleManager", "Managing {} destinations", destinations_.size());
}

StreamLifecycleManager::~StreamLifecycleManager() {
    shutdown();

    if (!lateDrains_.empty()) {
        LOG_INFO("LifecycleManager", "Waiting for {} late drains", lateDrains_.size());
    }
    for (auto& thread : lateDrains_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

// =============================================================================
// Submit
// =============================================================================

SubmitResult StreamLifecycleManager::submit(const std::string& key,
                                            const std::string& payload,
                                            bool durable) {
    return submit(key, payload, durable, std::chrono::milliseconds(0));
}

SubmitResult StreamLifecycleManager::submit(const std::string& key,
                                            const std::string& payload,
                                            bool durable,
                                            std::chrono::milliseconds ackTimeout) {
    SubmitResult result;

    auto slot = slotFor(key, result);
    if (!slot) {
        return result;
    }

    if (ackTimeout.count() <= 0) {
        int64_t ms = slot->config().ack_timeout_ms > 0
            ? slot->config().ack_timeout_ms
            : options_.ack_timeout_ms;
        ackTimeout = std::chrono::milliseconds(ms);
    }
    const std::chrono::milliseconds creationTimeout(options_.creation_timeout_ms);

    SendOutcome sent;
    for (int attempt = 0; attempt < 2; ++attempt) {
        StreamLease lease = slot->acquireReady(creationTimeout);
        if (!lease.success) {
            result.error = lease.error == ErrorKind::TIMEOUT
                ? ErrorKind::TIMEOUT
                : ErrorKind::DESTINATION_UNAVAILABLE;
            result.error_class = lease.error_class;
            result.error_message = lease.error_message;
            return result;
        }

        sent = slot->send(lease, payload, durable);
        if (sent.success) {
            break;
        }

        if (sent.error == ErrorKind::TIMEOUT) {
            result.error = ErrorKind::TIMEOUT;
            result.error_message = sent.error_message;
            return result;
        }

        slot->invalidate(sent.error_message, lease.generation);
        if (attempt == 0) {
            LOG_WARN("LifecycleManager", "[{}] Send rejected ({}), retrying on a new stream",
                     key, sent.error_message);
            continue;
        }

        result.error = ErrorKind::SEND_REJECTED;
        result.error_message = sent.error_message;
        return result;
    }

    result.sequence = sent.seq;
    result.generation = sent.generation;

    if (!durable) {
        result.success = true;
        result.outcome = SubmitOutcome::ACCEPTED;
        return result;
    }

    switch (sent.waiter.wait(ackTimeout)) {
        case AckState::ACKED:
            result.success = true;
            result.outcome = SubmitOutcome::DURABLE;
            break;

        case AckState::FAILED:
            result.outcome = SubmitOutcome::UNACKNOWLEDGED;
            result.error = ErrorKind::UNACKNOWLEDGED;
            result.error_message = sent.waiter.cause();
            LOG_WARN("LifecycleManager", "[{}] Record {} not acknowledged: {}",
                     key, sent.seq, result.error_message);
            break;

        case AckState::PENDING:
        default:
            result.error = ErrorKind::TIMEOUT;
            result.error_message = "timed out after " + std::to_string(ackTimeout.count()) +
                                   "ms waiting for acknowledgment of record " +
                                   std::to_string(sent.seq);
            break;
    }
    return result;
}

// =============================================================================
// Queries
// =============================================================================

SlotStatus StreamLifecycleManager::healthOf(const std::string& key) const {
    auto slot = findSlot(key);
    return slot ? slot->status() : SlotStatus::UNKNOWN;
}

std::string StreamLifecycleManager::lastErrorOf(const std::string& key) const {
    auto slot = findSlot(key);
    return slot ? slot->lastError() : std::string();
}

FlushResult StreamLifecycleManager::flush(const std::string& key) {
    return flush(key, std::chrono::milliseconds(options_.drain_timeout_ms));
}

FlushResult StreamLifecycleManager::flush(const std::string& key,
                                          std::chrono::milliseconds timeout) {
    FlushResult result;
    if (destinations_.find(key) == destinations_.end()) {
        result.status = FlushStatus::UNKNOWN_DESTINATION;
        result.error_message = "unknown destination '" + key + "'";
        return result;
    }

    auto slot = findSlot(key);
    if (!slot) {
        result.status = FlushStatus::NO_ACTIVE_STREAM;
        return result;
    }
    return slot->flush(timeout);
}

std::vector<std::string> StreamLifecycleManager::activeDestinations() const {
    std::vector<std::shared_ptr<StreamSlot>> slots;
    {
        std::shared_lock<std::shared_mutex> lock(slotsMutex_);
        slots.reserve(slots_.size());
        for (const auto& [key, slot] : slots_) {
            slots.push_back(slot);
        }
    }

    std::vector<std::string> result;
    for (const auto& slot : slots) {
        if (slot->status() == SlotStatus::READY) {
            result.push_back(slot->key());
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<std::string> StreamLifecycleManager::configuredDestinations() const {
    std::vector<std::string> result;
    result.reserve(destinations_.size());
    for (const auto& [key, config] : destinations_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

const DestinationConfig* StreamLifecycleManager::destination(const std::string& key) const {
    auto it = destinations_.find(key);
    return it != destinations_.end() ? &it->second : nullptr;
}

bool StreamLifecycleManager::isShutdown() const {
    std::shared_lock<std::shared_mutex> lock(slotsMutex_);
    return shuttingDown_;
}

// =============================================================================
// Shutdown
// =============================================================================

ShutdownReport StreamLifecycleManager::shutdown() {
    std::call_once(shutdownOnce_, [this]() {
        shutdownReport_ = drainAll();
    });
    return shutdownReport_;
}

ShutdownReport StreamLifecycleManager::drainAll() {
    std::vector<std::shared_ptr<StreamSlot>> slots;
    {
        std::unique_lock<std::shared_mutex> lock(slotsMutex_);
        shuttingDown_ = true;
        slots.reserve(slots_.size());
        for (const auto& [key, slot] : slots_) {
            slots.push_back(slot);
        }
    }

    LOG_INFO("LifecycleManager", "Draining {} destinations", slots.size());

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(options_.shutdown_timeout_ms);
    std::chrono::milliseconds drainTimeout(
        std::min(options_.drain_timeout_ms, options_.shutdown_timeout_ms));

    struct Drain {
        std::string key;
        std::future<DrainResult> result;
        std::thread thread;
    };

    std::vector<Drain> drains;
    drains.reserve(slots.size());
    for (const auto& slot : slots) {
        std::packaged_task<DrainResult()> task([slot, drainTimeout]() {
            return slot->drainAndClose(drainTimeout);
        });

        Drain drain;
        drain.key = slot->key();
        drain.result = task.get_future();
        drain.thread = std::thread(std::move(task));
        drains.push_back(std::move(drain));
    }

    ShutdownReport report;
    for (auto& drain : drains) {
        if (drain.result.wait_until(deadline) == std::future_status::ready) {
            drain.thread.join();
            DrainResult result = drain.result.get();
            if (result.clean) {
                ++report.slots_closed;
            } else {
                LOG_WARN("LifecycleManager", "[{}] Drain incomplete ({}): {}",
                         result.key, errorKindToString(result.error), result.error_message);
                report.failures.push_back(std::move(result));
            }
        } else {
            // The thread holds its own reference to the slot
            lateDrains_.push_back(std::move(drain.thread));

            DrainResult result;
            result.key = drain.key;
            result.clean = false;
            result.error = ErrorKind::UNACKNOWLEDGED_ON_SHUTDOWN;
            result.error_message = "drain did not finish before the shutdown deadline";
            LOG_ERROR("LifecycleManager", "[{}] {}", result.key, result.error_message);
            report.failures.push_back(std::move(result));
        }
    }

    report.clean = report.failures.empty();
    LOG_INFO("LifecycleManager", "Shutdown complete: {} closed cleanly, {} failed",
             report.slots_closed, report.failures.size());
    return report;
}

// =============================================================================
// Slot map
// =============================================================================

std::shared_ptr<StreamSlot> StreamLifecycleManager::slotFor(const std::string& key,
                                                            SubmitResult& result) {
    auto configIt = destinations_.find(key);
    if (configIt == destinations_.end()) {
        result.error = ErrorKind::DESTINATION_UNKNOWN;
        result.error_message = "unknown destination '" + key + "'";
        return nullptr;
    }

    {
        std::shared_lock<std::shared_mutex> lock(slotsMutex_);
        if (shuttingDown_) {
            result.error = ErrorKind::DESTINATION_UNAVAILABLE;
            result.error_message = "stream manager is shut down";
            return nullptr;
        }
        auto it = slots_.find(key);
        if (it != slots_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(slotsMutex_);
    if (shuttingDown_) {
        result.error = ErrorKind::DESTINATION_UNAVAILABLE;
        result.error_message = "stream manager is shut down";
        return nullptr;
    }

    auto& slot = slots_[key];
    if (!slot) {
        slot = std::make_shared<StreamSlot>(configIt->second, transport_,
                                            std::chrono::milliseconds(options_.close_timeout_ms));
        LOG_DEBUG("LifecycleManager", "[{}] Created slot", key);
    }
    return slot;
}

std::shared_ptr<StreamSlot> StreamLifecycleManager::findSlot(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(slotsMutex_);
    auto it = slots_.find(key);
    return it != slots_.end() ? it->second : nullptr;
}

}  // namespace core
}  // namespace ingestd
