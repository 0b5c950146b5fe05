/**
 * @file grpc_remote_stream.cpp
 * @brief GrpcRemoteStream implementation.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#include "ingestd/transport/grpc_remote_stream.hpp"
#include "ingestd/utils/logger.hpp"

#include "ingestd/proto/sink.grpc.pb.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <iterator>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

namespace ingestd {
namespace transport {

namespace {

constexpr uint64_t kAckLogInterval = 1000;
constexpr int64_t kCancelReserveMs = 500;

}  // namespace

const char* statusCodeName(grpc::StatusCode code) {
    switch (code) {
        case grpc::StatusCode::OK: return "OK";
        case grpc::StatusCode::CANCELLED: return "CANCELLED";
        case grpc::StatusCode::UNKNOWN: return "UNKNOWN";
        case grpc::StatusCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case grpc::StatusCode::DEADLINE_EXCEEDED: return "DEADLINE_EXCEEDED";
        case grpc::StatusCode::NOT_FOUND: return "NOT_FOUND";
        case grpc::StatusCode::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case grpc::StatusCode::PERMISSION_DENIED: return "PERMISSION_DENIED";
        case grpc::StatusCode::UNAUTHENTICATED: return "UNAUTHENTICATED";
        case grpc::StatusCode::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
        case grpc::StatusCode::FAILED_PRECONDITION: return "FAILED_PRECONDITION";
        case grpc::StatusCode::ABORTED: return "ABORTED";
        case grpc::StatusCode::OUT_OF_RANGE: return "OUT_OF_RANGE";
        case grpc::StatusCode::UNIMPLEMENTED: return "UNIMPLEMENTED";
        case grpc::StatusCode::INTERNAL: return "INTERNAL";
        case grpc::StatusCode::UNAVAILABLE: return "UNAVAILABLE";
        case grpc::StatusCode::DATA_LOSS: return "DATA_LOSS";
        default: return "UNRECOGNIZED";
    }
}

core::TransportErrorClass classifyStatus(grpc::StatusCode code) {
    switch (code) {
        case grpc::StatusCode::OK:
            return core::TransportErrorClass::NONE;
        case grpc::StatusCode::UNAVAILABLE:
        case grpc::StatusCode::DEADLINE_EXCEEDED:
        case grpc::StatusCode::RESOURCE_EXHAUSTED:
        case grpc::StatusCode::ABORTED:
        case grpc::StatusCode::INTERNAL:
        case grpc::StatusCode::UNKNOWN:
            return core::TransportErrorClass::RETRIABLE;
        default:
            return core::TransportErrorClass::FATAL;
    }
}

// =============================================================================
// Call - client bidi reactor for one IngestStream
// =============================================================================

class GrpcRemoteStream::Call
    : public grpc::ClientBidiReactor<sink::IngestRequest, sink::IngestResponse> {
public:
    enum class Phase {
        OPENING,    ///< Waiting for StreamOpened
        OPEN,       ///< Accepting records
        CLOSING,    ///< WritesDone requested, waiting for the server to finish
        BROKEN,     ///< Read side ended, status not yet delivered
        DONE        ///< OnDone ran
    };

    Call(std::shared_ptr<grpc::Channel> channel,
         const core::DestinationConfig& config,
         core::AckCallbacks callbacks,
         const GrpcStreamOptions& options)
        : channel_(std::move(channel))
        , stub_(sink::RecordSink::NewStub(channel_))
        , key_(config.key)
        , callbacks_(std::move(callbacks))
        , options_(options)
    {
        context_.AddMetadata("x-client-id", config.client_id);
        context_.AddMetadata("x-client-secret", config.client_secret);

        auto* open = current_.mutable_open();
        open->set_table_name(config.table_name);
        open->set_message_name(config.message_name);
        open->set_descriptor(config.descriptor);
    }

    /**
     * @brief Start the call. The reactor keeps itself alive until OnDone.
     */
    void start(std::shared_ptr<Call> self) {
        self_ = std::move(self);

        stub_->async()->IngestStream(&context_, this);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            writing_ = true;
        }
        StartWrite(&current_);
        StartRead(&response_);
        // Keeps OnDone away while sends may still start writes
        AddHold();
        StartCall();
    }

    /**
     * @brief Wait until the handshake succeeds or the call ends.
     * @return True once StreamOpened arrived. On false, @p timedOut tells a
     *         timeout apart from a call that ended with @p status.
     */
    bool waitOpened(std::chrono::milliseconds timeout, grpc::Status* status, bool* timedOut) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool settled = cv_.wait_for(lock, timeout, [this]() {
            return phase_ == Phase::OPEN || phase_ == Phase::DONE;
        });
        *timedOut = !settled;
        if (phase_ == Phase::OPEN) {
            return true;
        }
        if (phase_ == Phase::DONE) {
            *status = status_;
        }
        return false;
    }

    core::SendResult send(const std::string& payload) {
        core::SendResult result;

        std::unique_lock<std::mutex> lock(mutex_);
        if (phase_ == Phase::OPEN && inflight_.size() >= options_.max_inflight_records) {
            bool room = cv_.wait_for(lock,
                std::chrono::milliseconds(options_.backpressure_timeout_ms), [this]() {
                    return phase_ != Phase::OPEN ||
                           inflight_.size() < options_.max_inflight_records;
                });
            if (!room && phase_ == Phase::OPEN) {
                result.error = core::SendError::BACKPRESSURE;
                result.error_message = std::to_string(inflight_.size()) +
                                       " records awaiting acknowledgment";
                return result;
            }
        }

        if (phase_ != Phase::OPEN) {
            result.error = core::SendError::STREAM_BROKEN;
            result.error_message = endedMessageLocked();
            return result;
        }

        uint64_t offset = nextOffset_++;
        inflight_.insert(offset);

        sink::IngestRequest request;
        auto* record = request.mutable_record();
        record->set_offset(offset);
        record->set_payload(payload);
        queue_.push_back(std::move(request));
        startNextWriteLocked();

        result.success = true;
        result.seq = offset;
        return result;
    }

    bool flush(std::chrono::milliseconds timeout, std::string* error) {
        std::unique_lock<std::mutex> lock(mutex_);
        uint64_t target = nextOffset_ - 1;
        uint64_t failuresBefore = failures_;

        bool drained = cv_.wait_for(lock, timeout, [this, target]() {
            return inflight_.empty() || *inflight_.begin() > target;
        });
        if (!drained) {
            size_t outstanding = std::distance(inflight_.begin(), inflight_.upper_bound(target));
            if (error) {
                *error = "timed out after " + std::to_string(timeout.count()) + "ms with " +
                         std::to_string(outstanding) + " records unacknowledged";
            }
            return false;
        }
        if (failures_ != failuresBefore) {
            if (error) {
                *error = std::to_string(failures_ - failuresBefore) + " records failed";
                if (phase_ != Phase::OPEN) {
                    *error += " (" + endedMessageLocked() + ")";
                }
            }
            return false;
        }
        return true;
    }

    bool close(std::chrono::milliseconds timeout, std::string* error) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (phase_ == Phase::OPENING || phase_ == Phase::OPEN) {
            phase_ = Phase::CLOSING;
            writesDoneWanted_ = true;
            startNextWriteLocked();
            cv_.notify_all();
        }

        // Part of the budget is kept for the cancellation to be delivered
        auto deadline = std::chrono::steady_clock::now() + timeout;
        auto cancelReserve = std::min(timeout / 4, std::chrono::milliseconds(kCancelReserveMs));
        auto finished = [this]() { return phase_ == Phase::DONE; };
        if (!cv_.wait_until(lock, deadline - cancelReserve, finished)) {
            cancelled_ = true;
            releaseHoldLocked();
            lock.unlock();
            context_.TryCancel();
            lock.lock();
            cv_.wait_until(lock, deadline, finished);
            if (error) {
                *error = "server did not finish the stream within " +
                         std::to_string(timeout.count()) + "ms; call cancelled";
            }
            return false;
        }

        if (!status_.ok() && !(cancelled_ && status_.error_code() == grpc::StatusCode::CANCELLED)) {
            if (error) {
                *error = endedMessageLocked();
            }
            return false;
        }
        return true;
    }

    /**
     * @brief Cancel without waiting. Used when the owner goes away early.
     */
    void abandon() {
        bool cancel = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (phase_ != Phase::DONE) {
                cancel = true;
                cancelled_ = true;
                if (phase_ == Phase::OPENING || phase_ == Phase::OPEN) {
                    phase_ = Phase::CLOSING;
                }
                releaseHoldLocked();
            }
        }
        if (cancel) {
            context_.TryCancel();
        }
    }

    bool healthy() const {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (phase_ != Phase::OPEN) {
                return false;
            }
        }
        auto state = channel_->GetState(false);
        return state != GRPC_CHANNEL_TRANSIENT_FAILURE && state != GRPC_CHANNEL_SHUTDOWN;
    }

    std::string streamId() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return streamId_;
    }

    // =========================================================================
    // Reactions
    // =========================================================================

    void OnWriteDone(bool ok) override {
        std::lock_guard<std::mutex> lock(mutex_);
        writing_ = false;
        if (!ok) {
            // The read side observes the end of the call
            return;
        }
        startNextWriteLocked();
    }

    void OnReadDone(bool ok) override {
        if (!ok) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (phase_ != Phase::DONE) {
                phase_ = Phase::BROKEN;
            }
            queue_.clear();
            releaseHoldLocked();
            cv_.notify_all();
            return;
        }

        std::vector<uint64_t> acked;
        std::vector<std::pair<uint64_t, std::string>> failed;
        std::string openedId;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            switch (response_.body_case()) {
                case sink::IngestResponse::kOpened:
                    if (phase_ == Phase::OPENING) {
                        phase_ = Phase::OPEN;
                        streamId_ = response_.opened().stream_id();
                        openedId = streamId_;
                    }
                    break;

                case sink::IngestResponse::kAck: {
                    auto end = inflight_.upper_bound(response_.ack().durability_ack_up_to_offset());
                    acked.assign(inflight_.begin(), end);
                    inflight_.erase(inflight_.begin(), end);
                    break;
                }

                case sink::IngestResponse::kFailure:
                    if (inflight_.erase(response_.failure().offset()) > 0) {
                        failed.emplace_back(response_.failure().offset(),
                                            response_.failure().reason());
                        ++failures_;
                    }
                    break;

                default:
                    LOG_WARN("GrpcTransport", "[{}] Ignoring empty stream response", key_);
                    break;
            }
            cv_.notify_all();
            StartRead(&response_);
        }

        if (!openedId.empty()) {
            LOG_DEBUG("GrpcTransport", "[{}] Stream opened: {}", key_, openedId);
        }
        for (uint64_t offset : acked) {
            if (offset % kAckLogInterval == 0) {
                LOG_INFO("GrpcTransport", "[{}] Acknowledged through offset {}", key_, offset);
            }
            if (callbacks_.onAck) {
                callbacks_.onAck(offset);
            }
        }
        for (const auto& [offset, reason] : failed) {
            LOG_WARN("GrpcTransport", "[{}] Record {} failed: {}", key_, offset, reason);
            if (callbacks_.onFailure) {
                callbacks_.onFailure(offset, reason);
            }
        }
    }

    void OnDone(const grpc::Status& status) override {
        // Last reaction; this object may be destroyed when `self` goes away
        std::shared_ptr<Call> self = std::move(self_);

        std::vector<uint64_t> outstanding;
        std::string reason;
        bool expected = status.ok();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            phase_ = Phase::DONE;
            status_ = status;
            outstanding.assign(inflight_.begin(), inflight_.end());
            inflight_.clear();
            failures_ += outstanding.size();
            queue_.clear();
            reason = endedMessageLocked();
            expected = expected || cancelled_;
            cv_.notify_all();
        }

        if (expected) {
            LOG_DEBUG("GrpcTransport", "[{}] Stream finished: {}", key_, reason);
        } else {
            LOG_WARN("GrpcTransport", "[{}] Stream ended: {}", key_, reason);
        }

        if (callbacks_.onFailure) {
            for (uint64_t offset : outstanding) {
                callbacks_.onFailure(offset, reason);
            }
        }
    }

private:
    void startNextWriteLocked() {
        if (writing_ || holdReleased_) {
            return;
        }
        if (!queue_.empty()) {
            current_ = std::move(queue_.front());
            queue_.pop_front();
            writing_ = true;
            StartWrite(&current_);
            return;
        }
        if (writesDoneWanted_) {
            writesDoneWanted_ = false;
            StartWritesDone();
            releaseHoldLocked();
        }
    }

    void releaseHoldLocked() {
        if (!holdReleased_) {
            holdReleased_ = true;
            RemoveHold();
        }
    }

    std::string endedMessageLocked() const {
        switch (phase_) {
            case Phase::OPENING: return "stream is not open yet";
            case Phase::OPEN: return "stream is open";
            case Phase::CLOSING: return "stream is closing";
            case Phase::BROKEN: return "stream ended by the server";
            case Phase::DONE:
            default:
                if (status_.ok()) {
                    return "stream closed";
                }
                return std::string("stream ended: ") + statusCodeName(status_.error_code()) +
                       ": " + status_.error_message();
        }
    }

    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<sink::RecordSink::Stub> stub_;
    grpc::ClientContext context_;
    std::string key_;
    core::AckCallbacks callbacks_;
    GrpcStreamOptions options_;
    std::shared_ptr<Call> self_;

    sink::IngestResponse response_;   // owned by the outstanding read
    sink::IngestRequest current_;     // owned by the outstanding write

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Phase phase_ = Phase::OPENING;
    std::string streamId_;
    std::deque<sink::IngestRequest> queue_;
    bool writing_ = false;
    bool writesDoneWanted_ = false;
    bool holdReleased_ = false;
    bool cancelled_ = false;
    uint64_t nextOffset_ = 1;
    std::set<uint64_t> inflight_;
    uint64_t failures_ = 0;
    grpc::Status status_;
};

// =============================================================================
// GrpcRemoteStream
// =============================================================================

core::OpenResult GrpcRemoteStream::open(std::shared_ptr<grpc::Channel> channel,
                                        const core::DestinationConfig& config,
                                        core::AckCallbacks callbacks,
                                        const GrpcStreamOptions& options,
                                        std::chrono::milliseconds timeout) {
    core::OpenResult result;

    auto call = std::make_shared<Call>(std::move(channel), config, std::move(callbacks), options);
    call->start(call);

    grpc::Status status;
    bool timedOut = false;
    if (call->waitOpened(timeout, &status, &timedOut)) {
        result.success = true;
        result.stream = std::shared_ptr<GrpcRemoteStream>(new GrpcRemoteStream(std::move(call)));
        return result;
    }

    if (timedOut) {
        call->abandon();
        result.error_class = core::TransportErrorClass::RETRIABLE;
        result.error_message = "timed out after " + std::to_string(timeout.count()) +
                               "ms opening stream to " + config.endpoint;
        return result;
    }

    if (status.ok()) {
        result.error_class = core::TransportErrorClass::RETRIABLE;
        result.error_message = "server closed the stream before opening it";
    } else {
        result.error_class = classifyStatus(status.error_code());
        result.error_message = std::string(statusCodeName(status.error_code())) + ": " +
                               status.error_message();
    }
    return result;
}

GrpcRemoteStream::GrpcRemoteStream(std::shared_ptr<Call> call)
    : call_(std::move(call))
{}

GrpcRemoteStream::~GrpcRemoteStream() {
    call_->abandon();
}

core::SendResult GrpcRemoteStream::send(const std::string& payload) {
    return call_->send(payload);
}

bool GrpcRemoteStream::flush(std::chrono::milliseconds timeout, std::string* error) {
    return call_->flush(timeout, error);
}

bool GrpcRemoteStream::close(std::chrono::milliseconds timeout, std::string* error) {
    return call_->close(timeout, error);
}

bool GrpcRemoteStream::probe() const {
    return call_->healthy();
}

std::string GrpcRemoteStream::streamId() const {
    return call_->streamId();
}

}  // namespace transport
}  // namespace ingestd
