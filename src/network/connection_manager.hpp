#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/control_message.hpp"
#include "network/peer_transport.hpp"
#include "network/signaling_codec.hpp"

#include <QElapsedTimer>
#include <QObject>
#include <QPointer>
#include <QTimer>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tandem::network {

enum class ConnectionState {
    Disconnected,
    CreatingOffer,
    AwaitingAnswer,
    CreatingAnswer,
    Connecting,
    Connected,
    Reconnecting,
    Error
};

[[nodiscard]] const char* connectionStateName(ConnectionState state) noexcept;

/**
 * Locally produced handshake descriptor plus its out-of-band code.
 */
struct LocalDescriptor {
    ConnectionDescriptor descriptor;
    std::string code;
};

/**
 * ConnectionManager - owns the peer link and its control and bulk channels.
 *
 * Drives the handshake state machine, exposes send/receive and buffered-byte
 * introspection for the bulk channel, runs the heartbeat, and performs
 * graceful or abrupt teardown. The link is only reachable through this
 * class; nothing else holds a reference to the transport.
 *
 * Initiator: Disconnected -> CreatingOffer -> AwaitingAnswer -> Connecting -> Connected
 * Responder: Disconnected -> CreatingAnswer -> Connecting -> Connected
 *
 * Connected is reached only once both channels are open. Liveness loss is
 * reported via livenessTimeout() and never repaired automatically, since a
 * fresh handshake needs another manual exchange.
 */
class ConnectionManager : public QObject {
    Q_OBJECT

public:
    using DescriptorCallback = std::function<void(Result<LocalDescriptor>)>;

    ConnectionManager(std::unique_ptr<PeerTransport> transport,
                      SyncConfig config,
                      QObject* parent = nullptr);
    ~ConnectionManager() override;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * Offer side: open both channels, wait for path discovery (bounded,
     * proceeding with partial results on timeout), then report the offer.
     * Fails immediately when a handshake is already in progress.
     */
    void initiate(DescriptorCallback done);

    /**
     * Answer side: check the offer, apply it, wait for path discovery,
     * then report the answer.
     */
    void accept(const ConnectionDescriptor& offer, DescriptorCallback done);

    /**
     * Offer side: apply the peer's answer; the state moves to Connecting.
     */
    [[nodiscard]] Result<void> complete(const ConnectionDescriptor& answer);

    /**
     * Send a control message; false if the control channel is not open.
     */
    bool send(const ControlMessage& message);

    /**
     * Send one bulk frame; false if the bulk channel is not open.
     */
    bool sendBulk(const Bytes& frame);

    [[nodiscard]] uint64_t bufferedBytes() const;

    /**
     * Invoke `resume` once bufferedBytes() <= threshold; synchronously when
     * already under. Returns true when `resume` ran synchronously.
     * `context` bounds the callback's lifetime like a connection context.
     * On teardown every pending waiter is released.
     */
    bool awaitBufferDrain(uint64_t threshold, QObject* context, std::function<void()> resume);

    void startHeartbeat();
    void stopHeartbeat();
    [[nodiscard]] bool heartbeatRunning() const { return heartbeat_timer_.isActive(); }

    /**
     * Send `disconnect`, wait a short grace period for delivery, then tear down.
     * `done` runs after teardown.
     */
    void gracefulDisconnect(DisconnectReason reason, std::function<void()> done = {});

    /**
     * Close the link immediately.
     */
    void teardown();

    [[nodiscard]] ConnectionState state() const { return state_; }
    [[nodiscard]] bool isConnected() const {
        return state_ == ConnectionState::Connected || state_ == ConnectionState::Reconnecting;
    }
    [[nodiscard]] const SyncConfig& config() const { return config_; }

signals:
    void stateChanged(tandem::network::ConnectionState state);
    void controlMessageReceived(const tandem::network::ControlMessage& message);
    void bulkReceived(const tandem::Bytes& frame);
    void livenessTimeout();
    void livenessRestored();
    void peerDisconnected(tandem::network::DisconnectReason reason);
    void errorOccurred(const tandem::Error& error);

private slots:
    void onLocalDescriptionReady();
    void onGatheringTimeout();
    void onLinkStateChanged(tandem::network::PeerTransport::LinkState state);
    void onChannelOpened(tandem::network::PeerTransport::Channel channel);
    void onChannelClosed(tandem::network::PeerTransport::Channel channel);
    void onControlReceived(const QByteArray& bytes);
    void onBulkBufferedAmountLow();
    void onHeartbeatTick();

private:
    struct DrainWaiter {
        uint64_t threshold;
        QPointer<QObject> context;
        std::function<void()> resume;
    };

    std::unique_ptr<PeerTransport> transport_;
    SyncConfig config_;
    ConnectionState state_ = ConnectionState::Disconnected;

    DescriptorCallback pending_descriptor_;
    DescriptorKind pending_kind_ = DescriptorKind::Offer;
    QTimer gathering_timer_;

    bool control_open_ = false;
    bool bulk_open_ = false;

    std::vector<DrainWaiter> drain_waiters_;
    QTimer drain_poll_timer_;

    QTimer heartbeat_timer_;
    QElapsedTimer since_last_pong_;
    std::string last_ping_id_;
    bool liveness_timed_out_ = false;

    QTimer disconnect_timer_;
    std::function<void()> disconnect_done_;

    void setState(ConnectionState state);
    void failAttempt(Error error);
    void finishGathering(bool timed_out);
    void resolveDrainWaiters(bool release_all);
    bool handleLiveness(const ControlMessage& message);
};

} // namespace tandem::network
