/**
 * @file grpc_transport.hpp
 * @brief Transport that opens IngestStream calls against a RecordSink.
 *
 * GrpcTransport caches one channel per sink endpoint and opens a new
 * GrpcRemoteStream per Transport::open call.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#pragma once

#include "ingestd/transport/export.hpp"
#include "ingestd/transport/grpc_remote_stream.hpp"
#include "ingestd/core/remote_stream.hpp"

#include <grpcpp/grpcpp.h>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ingestd {
namespace transport {

/**
 * @class GrpcTransport
 * @brief core::Transport over gRPC.
 *
 * Usage:
 * @code
 * auto transport = std::make_shared<GrpcTransport>();
 * StreamLifecycleManager manager(destinations, transport);
 * @endcode
 */
class INGESTD_TRANSPORT_API GrpcTransport : public core::Transport {
public:
    /**
     * @param options Flow control bounds applied to every stream.
     * @param secure Use TLS channel credentials instead of plaintext.
     */
    explicit GrpcTransport(GrpcStreamOptions options = GrpcStreamOptions(),
                           bool secure = false);

    ~GrpcTransport() override;

    // Non-copyable
    GrpcTransport(const GrpcTransport&) = delete;
    GrpcTransport& operator=(const GrpcTransport&) = delete;

    core::OpenResult open(const core::DestinationConfig& config,
                          core::AckCallbacks callbacks,
                          std::chrono::milliseconds timeout) override;

    /**
     * @brief Drop every cached channel.
     *
     * Streams already open keep their own channel reference.
     */
    void clearChannels();

    size_t channelCount() const;

    const GrpcStreamOptions& options() const { return options_; }

private:
    std::shared_ptr<grpc::Channel> getChannel(const std::string& endpoint);

    GrpcStreamOptions options_;
    bool secure_;

    mutable std::mutex channelMutex_;
    std::unordered_map<std::string, std::shared_ptr<grpc::Channel>> channels_;
};

}  // namespace transport
}  // namespace ingestd
