/**
 * @file grpc_transport.cpp
 * @brief GrpcTransport implementation.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#include "ingestd/transport/grpc_transport.hpp"
#include "ingestd/utils/logger.hpp"

namespace ingestd {
namespace transport {

GrpcTransport::GrpcTransport(GrpcStreamOptions options, bool secure)
    : options_(options)
    , secure_(secure)
{
    LOG_DEBUG("GrpcTransport", "Created transport (max_inflight={}, tls={})",
              options_.max_inflight_records, secure_);
}

GrpcTransport::~GrpcTransport() {
    clearChannels();
}

std::shared_ptr<grpc::Channel> GrpcTransport::getChannel(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(channelMutex_);

    auto it = channels_.find(endpoint);
    if (it != channels_.end()) {
        return it->second;
    }

    LOG_DEBUG("GrpcTransport", "Creating channel to {}", endpoint);

    grpc::ChannelArguments args;
    args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, 10000);
    args.SetInt(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, 5000);
    args.SetInt(GRPC_ARG_HTTP2_MAX_PINGS_WITHOUT_DATA, 0);
    args.SetInt(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);

    auto credentials = secure_
        ? grpc::SslCredentials(grpc::SslCredentialsOptions())
        : grpc::InsecureChannelCredentials();
    auto channel = grpc::CreateCustomChannel(endpoint, credentials, args);

    channels_[endpoint] = channel;
    return channel;
}

core::OpenResult GrpcTransport::open(const core::DestinationConfig& config,
                                     core::AckCallbacks callbacks,
                                     std::chrono::milliseconds timeout) {
    if (config.endpoint.empty()) {
        core::OpenResult result;
        result.error_class = core::TransportErrorClass::FATAL;
        result.error_message = "no sink endpoint configured for " + config.key;
        return result;
    }

    auto channel = getChannel(config.endpoint);
    LOG_DEBUG("GrpcTransport", "[{}] Opening stream for {} on {}",
              config.key, config.table_name, config.endpoint);

    auto result = GrpcRemoteStream::open(channel, config, std::move(callbacks), options_, timeout);
    if (!result.success) {
        LOG_WARN("GrpcTransport", "[{}] Open failed ({}): {}", config.key,
                 core::transportErrorClassToString(result.error_class), result.error_message);
    }
    return result;
}

void GrpcTransport::clearChannels() {
    std::lock_guard<std::mutex> lock(channelMutex_);
    channels_.clear();
}

size_t GrpcTransport::channelCount() const {
    std::lock_guard<std::mutex> lock(channelMutex_);
    return channels_.size();
}

}  // namespace transport
}  // namespace ingestd
