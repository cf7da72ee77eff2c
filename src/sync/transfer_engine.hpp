#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <QObject>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace tandem::network {
class ConnectionManager;
}

namespace tandem::sync {

/**
 * Outcome of feeding one frame to the receiver.
 *
 * `complete` is set once every frame of the stream has arrived and the
 * reassembly buffer was released. A completed stream carries either the
 * payload or, when the rebuilt size disagrees with the declared size, an
 * ErrorCode::Transfer error.
 */
struct ReceiveResult {
    std::string stream_id;
    uint32_t stream_index = 0;
    bool complete = false;
    std::optional<Bytes> payload;
    std::optional<Error> error;
};

/**
 * TransferEngine - chunks and reassembles binary streams over the bulk channel.
 *
 * Sending slices a payload into fixed-size frames and waits for the bulk
 * channel to drain below the backpressure threshold before every frame.
 * One stream is sent at a time; callers queue further streams themselves.
 *
 * Receiving keeps one reassembly buffer per stream index. Frames are stored
 * by frame index, so arrival order does not matter, and a payload is only
 * produced once every index is present.
 */
class TransferEngine : public QObject {
    Q_OBJECT

public:
    using ProgressCallback = std::function<void(uint64_t transferred, uint64_t total)>;
    using SendCallback = std::function<void(Result<void>)>;

    TransferEngine(network::ConnectionManager& connection, const SyncConfig& config,
                   QObject* parent = nullptr);

    /**
     * Stream `data` as stream `stream_index`. `on_done` runs exactly once,
     * with a Transfer error if the channel closes or a send is refused.
     * A zero-length payload sends nothing and completes immediately.
     * Fails with InvalidState when another stream is still being sent.
     */
    void sendStream(std::string stream_id, uint32_t stream_index, Bytes data,
                    ProgressCallback on_progress, SendCallback on_done);

    /**
     * Abandon the outbound stream. Its `on_done` is not invoked.
     */
    void cancelSending();

    [[nodiscard]] bool isSending() const { return sending_.has_value(); }

    /**
     * Open a reassembly buffer. Fails with ProtocolViolation when the frame
     * count does not match the declared size at this engine's frame size.
     */
    [[nodiscard]] Result<void> startReceiving(uint32_t stream_index, std::string stream_id,
                                              uint32_t total_frames, uint64_t total_size);

    /**
     * Store one raw bulk frame. Returns nullopt when the frame was dropped
     * (malformed, unknown stream, frame index out of range).
     */
    std::optional<ReceiveResult> receiveFrame(const Bytes& raw,
                                              const ProgressCallback& on_progress = {});

    void cancelReceiving(uint32_t stream_index);

    /**
     * Drop the outbound stream and every reassembly buffer.
     */
    void cancelAll();

    [[nodiscard]] bool isReceiving(uint32_t stream_index) const;
    [[nodiscard]] size_t receivingCount() const { return receiving_.size(); }

    [[nodiscard]] size_t frameSize() const { return frame_size_; }

private:
    struct OutboundStream {
        std::string id;
        uint32_t index = 0;
        Bytes data;
        uint32_t total_frames = 0;
        uint32_t next_frame = 0;
        uint64_t sent = 0;
        ProgressCallback on_progress;
        SendCallback on_done;
    };

    struct ReassemblyBuffer {
        std::string stream_id;
        uint32_t total_frames = 0;
        uint64_t total_size = 0;
        std::map<uint32_t, Bytes> frames;
    };

    network::ConnectionManager& connection_;
    size_t frame_size_;
    uint64_t buffer_threshold_;

    std::optional<OutboundStream> sending_;
    uint64_t send_generation_ = 0;
    bool pumping_ = false;

    std::unordered_map<uint32_t, ReassemblyBuffer> receiving_;

    void pump();
    void finishSending(Result<void> result);
};

} // namespace tandem::sync
