#include "sync/transfer_engine.hpp"

#include "core/logging.hpp"
#include "network/binary_frame.hpp"
#include "network/connection_manager.hpp"

#include <QDebug>

#include <algorithm>
#include <utility>

namespace tandem::sync {

using network::FrameHeader;

TransferEngine::TransferEngine(network::ConnectionManager& connection, const SyncConfig& config,
                               QObject* parent)
    : QObject(parent)
    , connection_(connection)
    , frame_size_(std::max<size_t>(config.frame_size, 1))
    , buffer_threshold_(config.buffer_threshold)
{
}

// ============================================================================
// Sending
// ============================================================================

void TransferEngine::sendStream(std::string stream_id, uint32_t stream_index, Bytes data,
                                ProgressCallback on_progress, SendCallback on_done) {
    if (sending_) {
        on_done(fail(ErrorCode::InvalidState,
                     "Stream " + sending_->id + " is still being sent"));
        return;
    }

    const auto total_frames = network::frameCount(data.size(), frame_size_);
    if (sync_debug_enabled()) {
        qInfo() << "XFER: send stream" << QString::fromStdString(stream_id)
                << "index=" << stream_index << "bytes=" << data.size()
                << "frames=" << total_frames;
    }

    ++send_generation_;
    sending_ = OutboundStream{
        .id = std::move(stream_id),
        .index = stream_index,
        .data = std::move(data),
        .total_frames = total_frames,
        .on_progress = std::move(on_progress),
        .on_done = std::move(on_done),
    };
    pump();
}

void TransferEngine::pump() {
    if (pumping_) return;
    pumping_ = true;
    const auto generation = send_generation_;

    while (sending_ && generation == send_generation_) {
        auto& stream = *sending_;

        if (stream.next_frame >= stream.total_frames) {
            pumping_ = false;
            finishSending(Result<void>::ok());
            return;
        }
        if (!connection_.isConnected()) {
            pumping_ = false;
            finishSending(fail(ErrorCode::Transfer,
                               "Connection closed while sending stream " + stream.id));
            return;
        }

        // Backpressure point: resumes here once the bulk channel drains.
        const bool ready = connection_.awaitBufferDrain(buffer_threshold_, this, [this, generation]() {
            if (generation == send_generation_) {
                pump();
            }
        });
        if (!ready) break;

        const uint64_t offset = static_cast<uint64_t>(stream.next_frame) * frame_size_;
        const auto length = static_cast<size_t>(
            std::min<uint64_t>(frame_size_, stream.data.size() - offset));
        auto frame = network::serializeFrame(
            FrameHeader{.stream_index = stream.index, .frame_index = stream.next_frame},
            stream.data.data() + offset, length);

        if (!connection_.sendBulk(frame)) {
            pumping_ = false;
            finishSending(fail(ErrorCode::Transfer,
                               "Bulk channel refused frame " + std::to_string(stream.next_frame) +
                                   " of stream " + stream.id));
            return;
        }

        ++stream.next_frame;
        stream.sent += length;
        if (stream.on_progress) {
            stream.on_progress(stream.sent, stream.data.size());
        }
    }

    pumping_ = false;
}

void TransferEngine::finishSending(Result<void> result) {
    auto stream = std::move(*sending_);
    sending_.reset();
    ++send_generation_;

    if (result.is_err()) {
        qWarning() << "XFER: stream" << QString::fromStdString(stream.id) << "failed:"
                   << QString::fromStdString(result.unwrap_err().message);
    } else if (sync_debug_enabled()) {
        qInfo() << "XFER: stream" << QString::fromStdString(stream.id) << "sent";
    }

    if (stream.on_done) {
        stream.on_done(std::move(result));
    }
}

void TransferEngine::cancelSending() {
    if (!sending_) return;
    if (sync_debug_enabled()) {
        qInfo() << "XFER: cancel outbound stream" << QString::fromStdString(sending_->id);
    }
    sending_.reset();
    ++send_generation_;
}

// ============================================================================
// Receiving
// ============================================================================

Result<void> TransferEngine::startReceiving(uint32_t stream_index, std::string stream_id,
                                            uint32_t total_frames, uint64_t total_size) {
    if (total_frames != network::frameCount(total_size, frame_size_)) {
        return fail(ErrorCode::ProtocolViolation,
                    "Stream " + stream_id + " declares " + std::to_string(total_frames) +
                        " frames for " + std::to_string(total_size) + " bytes");
    }
    if (receiving_.count(stream_index) > 0) {
        qWarning() << "XFER: restarting stream index" << stream_index;
    }
    receiving_[stream_index] = ReassemblyBuffer{
        .stream_id = std::move(stream_id),
        .total_frames = total_frames,
        .total_size = total_size,
        .frames = {},
    };
    return Result<void>::ok();
}

std::optional<ReceiveResult> TransferEngine::receiveFrame(const Bytes& raw,
                                                          const ProgressCallback& on_progress) {
    auto parsed = network::parseFrame(raw);
    if (parsed.is_err()) {
        qWarning() << "XFER: dropping malformed frame:"
                   << QString::fromStdString(parsed.unwrap_err().message);
        return std::nullopt;
    }
    auto frame = std::move(parsed).unwrap();

    auto it = receiving_.find(frame.header.stream_index);
    if (it == receiving_.end()) {
        qWarning() << "XFER: dropping frame" << frame.header.frame_index
                   << "for unknown stream index" << frame.header.stream_index;
        return std::nullopt;
    }

    auto& buffer = it->second;
    if (frame.header.frame_index >= buffer.total_frames) {
        qWarning() << "XFER: dropping frame" << frame.header.frame_index
                   << "beyond declared count" << buffer.total_frames
                   << "for stream" << QString::fromStdString(buffer.stream_id);
        return std::nullopt;
    }

    // Duplicates overwrite the stored slot.
    buffer.frames[frame.header.frame_index] = std::move(frame.payload);

    uint64_t received = 0;
    for (const auto& [index, bytes] : buffer.frames) {
        received += bytes.size();
    }
    const auto total_size = buffer.total_size;

    ReceiveResult result{
        .stream_id = buffer.stream_id,
        .stream_index = frame.header.stream_index,
        .complete = false,
        .payload = std::nullopt,
        .error = std::nullopt,
    };

    if (buffer.frames.size() == buffer.total_frames) {
        Bytes assembled;
        assembled.reserve(static_cast<size_t>(received));
        bool missing = false;
        for (uint32_t i = 0; i < buffer.total_frames; ++i) {
            auto slot = buffer.frames.find(i);
            if (slot == buffer.frames.end()) {
                missing = true;
                break;
            }
            assembled.insert(assembled.end(), slot->second.begin(), slot->second.end());
        }

        if (!missing) {
            receiving_.erase(it);
            result.complete = true;
            if (assembled.size() != total_size) {
                result.error = Error{"Stream " + result.stream_id + " reassembled " +
                                         std::to_string(assembled.size()) + " bytes, expected " +
                                         std::to_string(total_size),
                                     ErrorCode::Transfer};
                qWarning() << "XFER:" << QString::fromStdString(result.error->message);
            } else {
                result.payload = std::move(assembled);
                if (sync_debug_enabled()) {
                    qInfo() << "XFER: stream" << QString::fromStdString(result.stream_id)
                            << "complete," << total_size << "bytes";
                }
            }
        }
    }

    if (on_progress) {
        on_progress(received, total_size);
    }
    return result;
}

void TransferEngine::cancelReceiving(uint32_t stream_index) {
    auto it = receiving_.find(stream_index);
    if (it == receiving_.end()) return;
    if (sync_debug_enabled()) {
        qInfo() << "XFER: cancel inbound stream" << QString::fromStdString(it->second.stream_id);
    }
    receiving_.erase(it);
}

void TransferEngine::cancelAll() {
    cancelSending();
    receiving_.clear();
}

bool TransferEngine::isReceiving(uint32_t stream_index) const {
    return receiving_.count(stream_index) > 0;
}

} // namespace tandem::sync
