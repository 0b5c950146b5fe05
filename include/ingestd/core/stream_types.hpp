/**
 * @file stream_types.hpp
 * @brief Status, error and result types shared by the stream lifecycle core.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#pragma once

#include "ingestd/core/remote_stream.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ingestd {
namespace core {

/**
 * @enum SlotStatus
 * @brief Lifecycle state of one destination's stream slot.
 */
enum class SlotStatus {
    UNKNOWN,    ///< Key never referenced (no slot exists)
    EMPTY,      ///< Slot exists, no stream opened yet
    CREATING,   ///< One creation attempt in flight
    READY,      ///< Stream usable
    DRAINING,   ///< Shutdown flush in progress
    FAILED,     ///< Last creation or use failed
    CLOSED      ///< Terminal
};

inline const char* slotStatusToString(SlotStatus status) {
    switch (status) {
        case SlotStatus::UNKNOWN: return "unknown";
        case SlotStatus::EMPTY: return "empty";
        case SlotStatus::CREATING: return "creating";
        case SlotStatus::READY: return "ready";
        case SlotStatus::DRAINING: return "draining";
        case SlotStatus::FAILED: return "failed";
        case SlotStatus::CLOSED: return "closed";
        default: return "unknown";
    }
}

/**
 * @enum ErrorKind
 * @brief Error taxonomy surfaced to the request layer.
 */
enum class ErrorKind {
    NONE,
    DESTINATION_UNKNOWN,         ///< Key is not configured
    DESTINATION_UNAVAILABLE,     ///< Stream could not be created, or manager shut down
    CREATION_FAILED,             ///< Transport open failed (slot-level detail)
    SEND_REJECTED,               ///< Handle was stale and the retry failed too
    TIMEOUT,                     ///< A bounded wait elapsed
    UNACKNOWLEDGED,              ///< Durable send failed remotely
    UNACKNOWLEDGED_ON_SHUTDOWN   ///< Drain could not confirm every record
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::DESTINATION_UNKNOWN: return "destination_unknown";
        case ErrorKind::DESTINATION_UNAVAILABLE: return "destination_unavailable";
        case ErrorKind::CREATION_FAILED: return "creation_failed";
        case ErrorKind::SEND_REJECTED: return "send_rejected";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::UNACKNOWLEDGED: return "unacknowledged";
        case ErrorKind::UNACKNOWLEDGED_ON_SHUTDOWN: return "unacknowledged_on_shutdown";
        default: return "unknown";
    }
}

/**
 * @enum SubmitOutcome
 * @brief What happened to a submitted record.
 */
enum class SubmitOutcome {
    NONE,            ///< Record was not sent
    ACCEPTED,        ///< Fire-and-forget send accepted by the transport
    DURABLE,         ///< Remote side acknowledged the record
    UNACKNOWLEDGED   ///< Remote side (or a recreation) failed the record
};

inline const char* submitOutcomeToString(SubmitOutcome outcome) {
    switch (outcome) {
        case SubmitOutcome::NONE: return "none";
        case SubmitOutcome::ACCEPTED: return "accepted";
        case SubmitOutcome::DURABLE: return "durable";
        case SubmitOutcome::UNACKNOWLEDGED: return "unacknowledged";
        default: return "unknown";
    }
}

/**
 * @struct SubmitResult
 * @brief Result of StreamLifecycleManager::submit.
 */
struct SubmitResult {
    bool success = false;
    SubmitOutcome outcome = SubmitOutcome::NONE;
    ErrorKind error = ErrorKind::NONE;
    TransportErrorClass error_class = TransportErrorClass::NONE;
    std::string error_message;
    uint64_t sequence = 0;      ///< Stream-local sequence number (0 if not sent)
    uint64_t generation = 0;    ///< Stream generation the record went to
};

enum class FlushStatus {
    FLUSHED,
    NO_ACTIVE_STREAM,
    UNKNOWN_DESTINATION,
    FAILED
};

struct FlushResult {
    FlushStatus status = FlushStatus::NO_ACTIVE_STREAM;
    std::string error_message;
};

/**
 * @struct DrainResult
 * @brief Outcome of draining one slot during shutdown.
 */
struct DrainResult {
    std::string key;
    bool clean = true;
    ErrorKind error = ErrorKind::NONE;
    std::string error_message;
    size_t failed_acks = 0;     ///< Pending durable sends resolved as failed
};

/**
 * @struct ShutdownReport
 * @brief Aggregated result of StreamLifecycleManager::shutdown.
 */
struct ShutdownReport {
    bool clean = true;
    size_t slots_closed = 0;
    std::vector<DrainResult> failures;
};

}  // namespace core
}  // namespace ingestd
