#include "network/connection_manager.hpp"

#include "core/logging.hpp"

#include <QDebug>

#include <algorithm>
#include <iterator>
#include <utility>

namespace tandem::network {

namespace {

constexpr int kDrainPollIntervalMs = 20;

} // namespace

const char* connectionStateName(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::CreatingOffer: return "creating_offer";
        case ConnectionState::AwaitingAnswer: return "awaiting_answer";
        case ConnectionState::CreatingAnswer: return "creating_answer";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
        case ConnectionState::Error: return "error";
    }
    return "unknown";
}

ConnectionManager::ConnectionManager(std::unique_ptr<PeerTransport> transport,
                                     SyncConfig config,
                                     QObject* parent)
    : QObject(parent)
    , transport_(std::move(transport))
    , config_(std::move(config))
{
    transport_->setParent(nullptr);

    gathering_timer_.setSingleShot(true);
    disconnect_timer_.setSingleShot(true);
    drain_poll_timer_.setInterval(kDrainPollIntervalMs);

    connect(&gathering_timer_, &QTimer::timeout, this, &ConnectionManager::onGatheringTimeout);
    connect(&heartbeat_timer_, &QTimer::timeout, this, &ConnectionManager::onHeartbeatTick);
    connect(&drain_poll_timer_, &QTimer::timeout, this, [this]() { resolveDrainWaiters(false); });
    connect(&disconnect_timer_, &QTimer::timeout, this, &ConnectionManager::teardown);

    connect(transport_.get(), &PeerTransport::localDescriptionReady,
            this, &ConnectionManager::onLocalDescriptionReady);
    connect(transport_.get(), &PeerTransport::linkStateChanged,
            this, &ConnectionManager::onLinkStateChanged);
    connect(transport_.get(), &PeerTransport::channelOpened,
            this, &ConnectionManager::onChannelOpened);
    connect(transport_.get(), &PeerTransport::channelClosed,
            this, &ConnectionManager::onChannelClosed);
    connect(transport_.get(), &PeerTransport::controlReceived,
            this, &ConnectionManager::onControlReceived);
    connect(transport_.get(), &PeerTransport::bulkReceived,
            this, &ConnectionManager::bulkReceived);
    connect(transport_.get(), &PeerTransport::bulkBufferedAmountLow,
            this, &ConnectionManager::onBulkBufferedAmountLow);
    connect(transport_.get(), &PeerTransport::transportError, this, [](const QString& message) {
        qWarning() << "SYNC: transport error:" << message;
    });
}

ConnectionManager::~ConnectionManager() {
    gathering_timer_.stop();
    heartbeat_timer_.stop();
    disconnect_timer_.stop();
    drain_poll_timer_.stop();
    transport_->disconnect(this);
    transport_->close();
}

void ConnectionManager::setState(ConnectionState state) {
    if (state_ == state) return;
    if (sync_debug_enabled()) {
        qInfo() << "SYNC: connection" << connectionStateName(state_) << "->"
                << connectionStateName(state);
    }
    state_ = state;
    emit stateChanged(state);
}

// ============================================================================
// Handshake
// ============================================================================

void ConnectionManager::initiate(DescriptorCallback done) {
    if (state_ != ConnectionState::Disconnected && state_ != ConnectionState::Error) {
        done(fail<LocalDescriptor>(ErrorCode::InvalidState,
                                   std::string("Cannot start a connection while ") +
                                       connectionStateName(state_)));
        return;
    }

    control_open_ = false;
    bulk_open_ = false;
    pending_kind_ = DescriptorKind::Offer;
    pending_descriptor_ = std::move(done);
    setState(ConnectionState::CreatingOffer);

    auto created = transport_->createOffer();
    if (created.is_err()) {
        failAttempt(created.unwrap_err());
        return;
    }
    gathering_timer_.start(config_.ice_gathering_timeout);
}

void ConnectionManager::accept(const ConnectionDescriptor& offer, DescriptorCallback done) {
    if (state_ != ConnectionState::Disconnected && state_ != ConnectionState::Error) {
        done(fail<LocalDescriptor>(ErrorCode::InvalidState,
                                   std::string("Cannot accept an offer while ") +
                                       connectionStateName(state_)));
        return;
    }
    if (offer.kind != DescriptorKind::Offer) {
        done(fail<LocalDescriptor>(ErrorCode::Signaling,
                                   "Expected an offer code but received an answer code"));
        return;
    }
    if (!validateDescriptor(offer)) {
        done(fail<LocalDescriptor>(ErrorCode::Signaling, "Offer does not contain a session description"));
        return;
    }

    control_open_ = false;
    bulk_open_ = false;
    pending_kind_ = DescriptorKind::Answer;
    pending_descriptor_ = std::move(done);
    setState(ConnectionState::CreatingAnswer);

    auto applied = transport_->acceptOffer(offer.payload);
    if (applied.is_err()) {
        failAttempt(applied.unwrap_err());
        return;
    }
    gathering_timer_.start(config_.ice_gathering_timeout);
}

Result<void> ConnectionManager::complete(const ConnectionDescriptor& answer) {
    if (state_ != ConnectionState::AwaitingAnswer) {
        return fail(ErrorCode::InvalidState,
                    std::string("No offer is awaiting an answer (state ") +
                        connectionStateName(state_) + ")");
    }
    if (answer.kind != DescriptorKind::Answer) {
        return fail(ErrorCode::Signaling, "Expected an answer code but received an offer code");
    }
    if (!validateDescriptor(answer)) {
        return fail(ErrorCode::Signaling, "Answer does not contain a session description");
    }

    auto applied = transport_->applyAnswer(answer.payload);
    if (applied.is_err()) {
        failAttempt(applied.unwrap_err());
        return applied;
    }

    setState(ConnectionState::Connecting);
    if (control_open_ && bulk_open_) {
        setState(ConnectionState::Connected);
    }
    return Result<void>::ok();
}

void ConnectionManager::onLocalDescriptionReady() {
    finishGathering(false);
}

void ConnectionManager::onGatheringTimeout() {
    finishGathering(true);
}

void ConnectionManager::finishGathering(bool timed_out) {
    if (!pending_descriptor_) return;
    gathering_timer_.stop();

    if (timed_out) {
        qWarning() << "SYNC: path discovery timed out, continuing with the candidates found";
    }

    ConnectionDescriptor descriptor{
        .kind = pending_kind_,
        .payload = transport_->localDescription(),
    };
    if (descriptor.payload.empty()) {
        failAttempt(Error{"No local session description was produced", ErrorCode::Negotiation});
        return;
    }

    auto code = encodeDescriptor(descriptor);
    if (code.is_err()) {
        failAttempt(Error{code.unwrap_err().message, ErrorCode::Negotiation});
        return;
    }

    if (pending_kind_ == DescriptorKind::Offer) {
        setState(ConnectionState::AwaitingAnswer);
    } else {
        setState(ConnectionState::Connecting);
        if (control_open_ && bulk_open_) {
            setState(ConnectionState::Connected);
        }
    }

    if (sync_debug_enabled()) {
        qInfo() << "SYNC:" << descriptorKindName(pending_kind_).data() << "ready, code length"
                << code.unwrap().size();
    }

    auto done = std::move(pending_descriptor_);
    pending_descriptor_ = nullptr;
    done(Result<LocalDescriptor>::ok(LocalDescriptor{
        .descriptor = std::move(descriptor),
        .code = std::move(code).unwrap(),
    }));
}

void ConnectionManager::failAttempt(Error error) {
    qWarning() << "SYNC: negotiation failed:" << QString::fromStdString(error.message);

    gathering_timer_.stop();
    stopHeartbeat();
    transport_->close();
    control_open_ = false;
    bulk_open_ = false;
    resolveDrainWaiters(true);
    setState(ConnectionState::Error);

    if (pending_descriptor_) {
        auto done = std::move(pending_descriptor_);
        pending_descriptor_ = nullptr;
        done(Result<LocalDescriptor>::err(error));
    }
    emit errorOccurred(error);
}

// ============================================================================
// Link events
// ============================================================================

void ConnectionManager::onLinkStateChanged(PeerTransport::LinkState link) {
    if (link != PeerTransport::LinkState::Failed && link != PeerTransport::LinkState::Closed) {
        return;
    }
    switch (state_) {
        case ConnectionState::CreatingOffer:
        case ConnectionState::AwaitingAnswer:
        case ConnectionState::CreatingAnswer:
        case ConnectionState::Connecting:
            failAttempt(Error{"Peer connection failed during negotiation", ErrorCode::Negotiation});
            break;
        case ConnectionState::Connected:
        case ConnectionState::Reconnecting:
            qWarning() << "SYNC: peer link lost";
            teardown();
            break;
        case ConnectionState::Disconnected:
        case ConnectionState::Error:
            break;
    }
}

void ConnectionManager::onChannelOpened(PeerTransport::Channel channel) {
    if (channel == PeerTransport::Channel::Control) {
        control_open_ = true;
    } else {
        bulk_open_ = true;
    }
    if (control_open_ && bulk_open_ && state_ == ConnectionState::Connecting) {
        setState(ConnectionState::Connected);
    }
}

void ConnectionManager::onChannelClosed(PeerTransport::Channel channel) {
    if (channel == PeerTransport::Channel::Control) {
        control_open_ = false;
    } else {
        bulk_open_ = false;
    }
    if (isConnected() || state_ == ConnectionState::Connecting) {
        if (sync_debug_enabled()) {
            qInfo() << "SYNC: channel closed, tearing down";
        }
        teardown();
    }
}

void ConnectionManager::onControlReceived(const QByteArray& bytes) {
    auto decoded = decodeMessage(bytes);
    if (decoded.is_err()) {
        qWarning() << "SYNC: dropping control message:"
                   << QString::fromStdString(decoded.unwrap_err().message);
        return;
    }
    const auto& message = decoded.unwrap();
    if (handleLiveness(message)) {
        return;
    }
    if (sync_debug_enabled()) {
        qInfo() << "SYNC: recv" << QString::fromUtf8(message.type().data(),
                                                     static_cast<qsizetype>(message.type().size()));
    }
    emit controlMessageReceived(message);
}

bool ConnectionManager::handleLiveness(const ControlMessage& message) {
    if (message.as<HeartbeatPing>()) {
        send(makeMessage(HeartbeatPong{.ping_id = message.id}));
        return true;
    }
    if (message.as<HeartbeatPong>()) {
        since_last_pong_.restart();
        if (liveness_timed_out_) {
            liveness_timed_out_ = false;
            qInfo() << "SYNC: heartbeat recovered";
            if (state_ == ConnectionState::Reconnecting) {
                setState(ConnectionState::Connected);
            }
            emit livenessRestored();
        }
        return true;
    }
    if (const auto* bye = message.as<Disconnect>()) {
        qInfo() << "SYNC: peer disconnected, reason" << disconnectReasonName(bye->reason).data();
        emit peerDisconnected(bye->reason);
        teardown();
        return true;
    }
    return false;
}

// ============================================================================
// Send / backpressure
// ============================================================================

bool ConnectionManager::send(const ControlMessage& message) {
    if (!transport_->isChannelOpen(PeerTransport::Channel::Control)) {
        return false;
    }
    if (sync_debug_enabled() && !message.as<HeartbeatPing>() && !message.as<HeartbeatPong>()) {
        qInfo() << "SYNC: send" << QString::fromUtf8(message.type().data(),
                                                     static_cast<qsizetype>(message.type().size()));
    }
    return transport_->sendControl(encodeMessage(message));
}

bool ConnectionManager::sendBulk(const Bytes& frame) {
    return transport_->sendBulk(frame);
}

uint64_t ConnectionManager::bufferedBytes() const {
    return transport_->bulkBufferedAmount();
}

bool ConnectionManager::awaitBufferDrain(uint64_t threshold, QObject* context,
                                         std::function<void()> resume) {
    if (bufferedBytes() <= threshold || !isConnected()) {
        resume();
        return true;
    }

    drain_waiters_.push_back(DrainWaiter{threshold, QPointer<QObject>(context), std::move(resume)});

    uint64_t lowest = threshold;
    for (const auto& waiter : drain_waiters_) {
        lowest = std::min(lowest, waiter.threshold);
    }
    transport_->setBulkLowThreshold(lowest);
    if (!drain_poll_timer_.isActive()) {
        drain_poll_timer_.start();
    }
    return false;
}

void ConnectionManager::onBulkBufferedAmountLow() {
    resolveDrainWaiters(false);
}

void ConnectionManager::resolveDrainWaiters(bool release_all) {
    if (drain_waiters_.empty()) {
        drain_poll_timer_.stop();
        return;
    }

    const auto buffered = bufferedBytes();
    std::vector<DrainWaiter> ready;
    auto it = std::stable_partition(drain_waiters_.begin(), drain_waiters_.end(),
                                    [&](const DrainWaiter& w) {
                                        return !(release_all || buffered <= w.threshold);
                                    });
    std::move(it, drain_waiters_.end(), std::back_inserter(ready));
    drain_waiters_.erase(it, drain_waiters_.end());
    if (drain_waiters_.empty()) {
        drain_poll_timer_.stop();
    }

    for (auto& waiter : ready) {
        if (waiter.context && waiter.resume) {
            waiter.resume();
        }
    }
}

// ============================================================================
// Heartbeat
// ============================================================================

void ConnectionManager::startHeartbeat() {
    if (!isConnected()) return;
    since_last_pong_.start();
    liveness_timed_out_ = false;
    heartbeat_timer_.start(config_.heartbeat_interval);
}

void ConnectionManager::stopHeartbeat() {
    heartbeat_timer_.stop();
}

void ConnectionManager::onHeartbeatTick() {
    if (!isConnected()) {
        stopHeartbeat();
        return;
    }

    const auto timeout = config_.heartbeat_timeout().count();
    if (!liveness_timed_out_ && since_last_pong_.elapsed() > timeout) {
        liveness_timed_out_ = true;
        qWarning() << "SYNC: no heartbeat reply for" << since_last_pong_.elapsed() << "ms";
        setState(ConnectionState::Reconnecting);
        emit livenessTimeout();
    }

    auto ping = makeMessage(HeartbeatPing{});
    last_ping_id_ = ping.id;
    send(ping);
}

// ============================================================================
// Teardown
// ============================================================================

void ConnectionManager::gracefulDisconnect(DisconnectReason reason, std::function<void()> done) {
    if (state_ == ConnectionState::Disconnected) {
        if (done) done();
        return;
    }
    disconnect_done_ = std::move(done);
    stopHeartbeat();

    if (!send(makeMessage(Disconnect{.reason = reason}))) {
        teardown();
        return;
    }
    disconnect_timer_.start(config_.disconnect_grace);
}

void ConnectionManager::teardown() {
    gathering_timer_.stop();
    disconnect_timer_.stop();
    stopHeartbeat();
    transport_->close();
    control_open_ = false;
    bulk_open_ = false;
    liveness_timed_out_ = false;

    auto pending = std::move(pending_descriptor_);
    pending_descriptor_ = nullptr;
    auto done = std::move(disconnect_done_);
    disconnect_done_ = nullptr;

    resolveDrainWaiters(true);
    setState(ConnectionState::Disconnected);

    if (pending) {
        pending(fail<LocalDescriptor>(ErrorCode::Negotiation, "Connection closed during negotiation"));
    }
    if (done) {
        done();
    }
}

} // namespace tandem::network
