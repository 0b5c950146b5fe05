/**
 * @file grpc_remote_stream.hpp
 * @brief RemoteStream backed by a RecordSink.IngestStream gRPC call.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#pragma once

#include "ingestd/transport/export.hpp"
#include "ingestd/core/remote_stream.hpp"

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace ingestd {
namespace transport {

/**
 * @struct GrpcStreamOptions
 * @brief Per-stream flow control bounds.
 */
struct INGESTD_TRANSPORT_API GrpcStreamOptions {
    size_t max_inflight_records = 50000;    ///< Unacknowledged records before send() waits
    int64_t backpressure_timeout_ms = 5000; ///< How long send() waits for room
};

/**
 * @brief Classify a gRPC status for retry purposes.
 *
 * UNAVAILABLE, DEADLINE_EXCEEDED, RESOURCE_EXHAUSTED, ABORTED, INTERNAL and
 * UNKNOWN are retriable; everything else is fatal.
 */
INGESTD_TRANSPORT_API core::TransportErrorClass classifyStatus(grpc::StatusCode code);

INGESTD_TRANSPORT_API const char* statusCodeName(grpc::StatusCode code);

/**
 * @class GrpcRemoteStream
 * @brief One open IngestStream call.
 *
 * Records get consecutive offsets starting at 1. Cumulative
 * acknowledgments from the server are reported per offset through the
 * AckCallbacks given to open(); when the call ends, every outstanding
 * offset is reported as failed.
 */
class INGESTD_TRANSPORT_API GrpcRemoteStream : public core::RemoteStream {
public:
    /**
     * @brief Start a call and wait for the server's StreamOpened.
     * @param channel Channel to the sink endpoint.
     * @param config Table, descriptor and credentials for the handshake.
     * @param callbacks Acknowledgment notifications for this stream.
     * @param options Flow control bounds.
     * @param timeout Upper bound on the handshake.
     */
    static core::OpenResult open(std::shared_ptr<grpc::Channel> channel,
                                 const core::DestinationConfig& config,
                                 core::AckCallbacks callbacks,
                                 const GrpcStreamOptions& options,
                                 std::chrono::milliseconds timeout);

    ~GrpcRemoteStream() override;

    GrpcRemoteStream(const GrpcRemoteStream&) = delete;
    GrpcRemoteStream& operator=(const GrpcRemoteStream&) = delete;

    core::SendResult send(const std::string& payload) override;
    bool flush(std::chrono::milliseconds timeout, std::string* error) override;
    bool close(std::chrono::milliseconds timeout, std::string* error) override;
    bool probe() const override;
    std::string streamId() const override;

private:
    class Call;

    explicit GrpcRemoteStream(std::shared_ptr<Call> call);

    std::shared_ptr<Call> call_;
};

}  // namespace transport
}  // namespace ingestd
