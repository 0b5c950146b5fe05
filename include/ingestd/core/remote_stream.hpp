/**
 * @file remote_stream.hpp
 * @brief Transport-facing interfaces consumed by the stream lifecycle core.
 *
 * The core never talks to the network directly. A Transport opens
 * RemoteStreams for a destination and reports acknowledgments through
 * the AckCallbacks it was given at open time.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#pragma once

#include "ingestd/core/export.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace ingestd {
namespace core {

/**
 * @enum TransportErrorClass
 * @brief How the transport classifies a failed open.
 */
enum class TransportErrorClass {
    NONE,
    RETRIABLE,  ///< Transient (network, overload); a later attempt may succeed
    FATAL       ///< Configuration or credential problem; retrying will not help
};

inline const char* transportErrorClassToString(TransportErrorClass errorClass) {
    switch (errorClass) {
        case TransportErrorClass::NONE: return "none";
        case TransportErrorClass::RETRIABLE: return "retriable";
        case TransportErrorClass::FATAL: return "fatal";
        default: return "unknown";
    }
}

/**
 * @struct DestinationConfig
 * @brief Connection parameters for one destination key.
 *
 * Resolved from configuration at startup and read-only afterwards.
 */
struct INGESTD_CORE_API DestinationConfig {
    std::string key;                ///< Destination key (table key)
    std::string endpoint;           ///< Remote service endpoint (host:port)
    std::string table_name;         ///< Fully qualified remote table name
    std::string message_name;       ///< Record message type name
    std::string descriptor;         ///< Serialized google.protobuf.DescriptorProto
    std::string client_id;          ///< Opaque credential
    std::string client_secret;      ///< Opaque credential
    bool durable_by_default;        ///< Wait for acks when the caller does not say
    int64_t ack_timeout_ms;         ///< Durable wait override (0 = manager default)

    DestinationConfig()
        : durable_by_default(false)
        , ack_timeout_ms(0)
    {}
};

/**
 * @struct AckCallbacks
 * @brief Acknowledgment notifications for one opened stream.
 *
 * Invoked asynchronously by the transport, once per sequence number.
 * Implementations must never invoke them from inside RemoteStream::send(),
 * and must release the in-flight capacity an acknowledgment frees before
 * invoking them.
 */
struct AckCallbacks {
    std::function<void(uint64_t seq)> onAck;
    std::function<void(uint64_t seq, const std::string& cause)> onFailure;
};

/**
 * @enum SendError
 * @brief Why RemoteStream::send refused a record.
 */
enum class SendError {
    NONE,
    STREAM_BROKEN,  ///< Handle is no longer usable; recreate it
    BACKPRESSURE    ///< Too many unacknowledged records; the handle is fine
};

struct SendResult {
    bool success = false;
    uint64_t seq = 0;
    SendError error = SendError::NONE;
    std::string error_message;
};

/**
 * @class RemoteStream
 * @brief Bidirectional streaming handle to one destination.
 *
 * Sequence numbers are assigned by the stream, start at 1 and grow by
 * one for every accepted send. All methods are thread-safe.
 */
class RemoteStream {
public:
    virtual ~RemoteStream() = default;

    /**
     * @brief Queue an encoded record for delivery.
     * @return The record's sequence number, or an error.
     */
    virtual SendResult send(const std::string& payload) = 0;

    /**
     * @brief Block until every record sent so far is acknowledged.
     * @param timeout Upper bound on the wait.
     * @param error Receives the reason on failure (may be nullptr).
     * @return True if all records were acknowledged in time.
     */
    virtual bool flush(std::chrono::milliseconds timeout, std::string* error) = 0;

    /**
     * @brief Close the stream. Outstanding records are reported as failed.
     * @param timeout Upper bound on the whole close, including any
     *        cancellation once the remote side stops responding.
     * @param error Receives the reason on failure (may be nullptr).
     * @return False if the remote side reported an error while closing
     *         or did not finish in time.
     */
    virtual bool close(std::chrono::milliseconds timeout, std::string* error) = 0;

    /**
     * @brief Non-blocking liveness query.
     */
    virtual bool probe() const = 0;

    /**
     * @brief Identifier assigned by the remote side (for logs).
     */
    virtual std::string streamId() const = 0;
};

struct OpenResult {
    bool success = false;
    std::shared_ptr<RemoteStream> stream;
    TransportErrorClass error_class = TransportErrorClass::NONE;
    std::string error_message;
};

/**
 * @class Transport
 * @brief Opens RemoteStreams for destinations.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Open a new stream for a destination.
     * @param config Destination connection parameters.
     * @param callbacks Where acknowledgments for this stream are reported.
     * @param timeout Upper bound on the handshake.
     */
    virtual OpenResult open(const DestinationConfig& config,
                            AckCallbacks callbacks,
                            std::chrono::milliseconds timeout) = 0;
};

}  // namespace core
}  // namespace ingestd
