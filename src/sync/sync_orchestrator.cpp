#include "sync/sync_orchestrator.hpp"

#include "core/logging.hpp"
#include "network/binary_frame.hpp"
#include "sync/remote_apply_guard.hpp"

#include <QDebug>

#include <utility>

namespace tandem::sync {

using namespace tandem::network;

namespace {

constexpr const char* kConnectionLostReason = "Connection lost. Please start a new session.";

QString qs(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

} // namespace

const char* peerRoleName(PeerRole role) noexcept {
    return role == PeerRole::Editor ? "editor" : "viewer";
}

const char* syncPhaseName(SyncPhase phase) noexcept {
    switch (phase) {
        case SyncPhase::Idle: return "idle";
        case SyncPhase::Requesting: return "requesting";
        case SyncPhase::AwaitingAccept: return "awaiting_accept";
        case SyncPhase::Transferring: return "transferring";
        case SyncPhase::Complete: return "complete";
        case SyncPhase::Error: return "error";
    }
    return "unknown";
}

const char* roleTransferPhaseName(RoleTransferPhase phase) noexcept {
    switch (phase) {
        case RoleTransferPhase::Idle: return "idle";
        case RoleTransferPhase::PendingRequest: return "pending_request";
        case RoleTransferPhase::PendingApproval: return "pending_approval";
        case RoleTransferPhase::Transferring: return "transferring";
        case RoleTransferPhase::Denied: return "denied";
    }
    return "unknown";
}

const char* reconnectionPhaseName(ReconnectionPhase phase) noexcept {
    switch (phase) {
        case ReconnectionPhase::Idle: return "idle";
        case ReconnectionPhase::Reconnecting: return "reconnecting";
        case ReconnectionPhase::Failed: return "failed";
        case ReconnectionPhase::PeerDisconnected: return "peer_disconnected";
    }
    return "unknown";
}

SyncOrchestrator::SyncOrchestrator(ConnectionManager& connection,
                                   storage::ProjectStore& store,
                                   SyncConfig config,
                                   QObject* parent)
    : QObject(parent)
    , connection_(connection)
    , store_(store)
    , config_(std::move(config))
    , transfer_(connection, config_)
{
    auto_sync_timer_.setSingleShot(true);
    deny_timer_.setSingleShot(true);
    role_request_timer_.setSingleShot(true);
    reconnect_timer_.setSingleShot(true);

    connect(&auto_sync_timer_, &QTimer::timeout, this, &SyncOrchestrator::onAutoSyncTimeout);
    connect(&deny_timer_, &QTimer::timeout, this, [this]() {
        if (role_transfer_.phase == RoleTransferPhase::Denied) {
            setRoleTransfer(RoleTransferPhase::Idle);
        }
    });
    connect(&role_request_timer_, &QTimer::timeout, this, &SyncOrchestrator::onRoleRequestExpired);
    connect(&reconnect_timer_, &QTimer::timeout, this, &SyncOrchestrator::onReconnectGraceExpired);

    connect(&connection_, &ConnectionManager::stateChanged,
            this, &SyncOrchestrator::onConnectionStateChanged);
    connect(&connection_, &ConnectionManager::controlMessageReceived,
            this, &SyncOrchestrator::onControlMessage);
    connect(&connection_, &ConnectionManager::bulkReceived,
            this, &SyncOrchestrator::onBulkReceived);
    connect(&connection_, &ConnectionManager::livenessTimeout,
            this, &SyncOrchestrator::onLivenessTimeout);
    connect(&connection_, &ConnectionManager::livenessRestored,
            this, &SyncOrchestrator::onLivenessRestored);
    connect(&connection_, &ConnectionManager::peerDisconnected,
            this, &SyncOrchestrator::onPeerDisconnected);

    if (connection_.state() == ConnectionState::Connected) {
        beginSession();
    }
}

SyncOrchestrator::~SyncOrchestrator() {
    connection_.disconnect(this);
    transfer_.cancelAll();
}

bool SyncOrchestrator::canEdit() const {
    if (!connection_.isConnected()) return true;
    if (role_transfer_.phase == RoleTransferPhase::Transferring) return false;
    return role_ == PeerRole::Editor;
}

// ============================================================================
// Session lifecycle
// ============================================================================

void SyncOrchestrator::onConnectionStateChanged(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connected:
            if (!session_active_) {
                beginSession();
            }
            break;
        case ConnectionState::Disconnected:
        case ConnectionState::Error:
            if (session_active_) {
                endSessionState();
            }
            break;
        default:
            break;
    }
}

void SyncOrchestrator::beginSession() {
    session_active_ = true;
    leaving_ = false;
    ++session_;
    role_ = preferred_role_;
    auto_synced_ = false;

    qInfo() << "SYNC: session started as" << peerRoleName(*role_);

    setReconnection(ReconnectionPhase::Idle);
    setRoleTransfer(RoleTransferPhase::Idle);
    setProgress(SyncProgress{});
    emit roleChanged();

    connection_.startHeartbeat();

    if (*role_ == PeerRole::Editor && config_.auto_sync_on_connect) {
        auto_sync_timer_.start(config_.auto_sync_delay);
    }
}

void SyncOrchestrator::endSessionState() {
    session_active_ = false;
    ++session_;

    auto_sync_timer_.stop();
    deny_timer_.stop();
    role_request_timer_.stop();
    reconnect_timer_.stop();

    transfer_.cancelAll();
    jobs_.clear();
    job_running_ = false;
    sync_gate_held_ = false;
    role_request_expired_ = false;
    stream_targets_.clear();
    pending_payloads_.clear();
    early_payloads_.clear();
    outbound_items_.clear();
    dropStaging();

    if (pending_request_) {
        pending_request_.reset();
        emit pendingRequestChanged();
    }

    switch (progress_.phase) {
        case SyncPhase::Requesting:
        case SyncPhase::AwaitingAccept:
        case SyncPhase::Transferring:
            failProgress("Connection closed during sync");
            break;
        case SyncPhase::Complete:
            setProgress(SyncProgress{});
            break;
        case SyncPhase::Idle:
        case SyncPhase::Error:
            break;
    }

    setRoleTransfer(RoleTransferPhase::Idle);

    // A drop that was neither announced by the peer nor requested locally.
    if (leaving_) {
        setReconnection(ReconnectionPhase::Idle);
    } else if (reconnection_.phase == ReconnectionPhase::Idle ||
               reconnection_.phase == ReconnectionPhase::Reconnecting) {
        setReconnection(ReconnectionPhase::Failed, kConnectionLostReason);
    }
    leaving_ = false;

    role_.reset();
    emit roleChanged();
    qInfo() << "SYNC: session ended";
}

void SyncOrchestrator::endSession(std::function<void()> done) {
    leaving_ = true;
    connection_.gracefulDisconnect(DisconnectReason::UserInitiated, std::move(done));
}

// ============================================================================
// Reconnection
// ============================================================================

void SyncOrchestrator::onLivenessTimeout() {
    if (!session_active_) return;
    qWarning() << "SYNC: peer unresponsive, waiting" << config_.reconnect_grace.count()
               << "ms for recovery";
    setReconnection(ReconnectionPhase::Reconnecting);
    reconnect_timer_.start(config_.reconnect_grace);
}

void SyncOrchestrator::onLivenessRestored() {
    reconnect_timer_.stop();
    if (reconnection_.phase == ReconnectionPhase::Reconnecting) {
        setReconnection(ReconnectionPhase::Idle);
    }
}

void SyncOrchestrator::onReconnectGraceExpired() {
    if (reconnection_.phase != ReconnectionPhase::Reconnecting) return;
    qWarning() << "SYNC: peer did not recover, giving up";
    setReconnection(ReconnectionPhase::Failed, kConnectionLostReason);
    connection_.teardown();
}

void SyncOrchestrator::onPeerDisconnected(DisconnectReason reason) {
    reconnect_timer_.stop();
    setReconnection(ReconnectionPhase::PeerDisconnected,
                    std::string(disconnectReasonName(reason)));
}

// ============================================================================
// Inbound dispatch
// ============================================================================

void SyncOrchestrator::onControlMessage(const ControlMessage& message) {
    if (!session_active_) return;
    dispatch(message);
}

void SyncOrchestrator::dispatch(const ControlMessage& message) {
    std::visit(overloaded{
        [&](const SyncRequest& m) { handleSyncRequest(m); },
        [&](const SyncAccept&) { handleSyncAccept(); },
        [&](const SyncReject& m) { handleSyncReject(m); },
        [&](const ChunkStart& m) { handleChunkStart(m); },
        [&](const ChunkComplete& m) { handleChunkComplete(m); },
        [&](const SyncComplete& m) { handleSyncComplete(m); },
        [&](const SyncFailed& m) { handleSyncFailed(m); },
        [&](const OpCreate&) { handleOperation(message); },
        [&](const OpUpdate&) { handleOperation(message); },
        [&](const OpDelete&) { handleOperation(message); },
        [&](const OpReorder&) { handleOperation(message); },
        [&](const OpPayloadChange&) { handleOperation(message); },
        [&](const RoleRequest& m) { handleRoleRequest(m); },
        [&](const RoleGrant&) { handleRoleGrant(); },
        [&](const RoleDeny& m) { handleRoleDeny(m); },
        [&](const RoleTransferComplete&) { handleRoleTransferComplete(); },
        // Liveness traffic is consumed by the connection manager.
        [&](const HeartbeatPing&) {},
        [&](const HeartbeatPong&) {},
        [&](const Disconnect&) {},
    }, message.body);
}

void SyncOrchestrator::protocolViolation(std::string_view type, std::string_view detail) {
    qWarning() << "SYNC: ignoring" << qs(type) << "-" << qs(detail);
}

void SyncOrchestrator::handleSyncRequest(const SyncRequest& msg) {
    if (role_ != PeerRole::Viewer) {
        protocolViolation("sync_request", "received while editor");
        return;
    }

    // A new request supersedes anything staged from an earlier one.
    cancelInitialStreams();
    dropStaging();

    pending_request_ = PendingSyncRequest{
        .project = msg.project,
        .items = msg.items,
        .total_bytes = msg.total_bytes,
    };

    SyncProgress progress;
    progress.phase = SyncPhase::Requesting;
    progress.total_items = static_cast<uint32_t>(msg.items.size());
    progress.total_bytes_total = msg.total_bytes;
    setProgress(progress);

    qInfo() << "SYNC: incoming sync request," << msg.items.size() << "items,"
            << msg.total_bytes << "bytes";
    emit pendingRequestChanged();
}

void SyncOrchestrator::handleSyncAccept() {
    if (role_ != PeerRole::Editor || progress_.phase != SyncPhase::AwaitingAccept) {
        protocolViolation("sync_accept", "no sync request outstanding");
        return;
    }
    qInfo() << "SYNC: viewer accepted, transferring";
    auto progress = progress_;
    progress.phase = SyncPhase::Transferring;
    setProgress(progress);

    // The gate job still owns the queue; the snapshot streams in its place.
    sync_gate_held_ = false;
    runInitialSync();
}

void SyncOrchestrator::handleSyncReject(const SyncReject& msg) {
    if (role_ != PeerRole::Editor || progress_.phase != SyncPhase::AwaitingAccept) {
        protocolViolation("sync_reject", "no sync request outstanding");
        return;
    }
    qInfo() << "SYNC: viewer rejected sync:" << qs(msg.reason);
    outbound_items_.clear();
    failProgress("Sync rejected: " + msg.reason);
    emit syncRejected(QString::fromStdString(msg.reason));
    releaseSyncGate();
}

bool SyncOrchestrator::isSnapshotStream(const ChunkStart& msg) const {
    if (!staged_ || progress_.phase != SyncPhase::Transferring) return false;
    if (msg.item_index >= staged_->items.size()) return false;
    return staged_->items[msg.item_index].id == msg.item_id &&
           staged_->payloads.count(msg.item_id) == 0;
}

void SyncOrchestrator::handleChunkStart(const ChunkStart& msg) {
    const bool initial = isSnapshotStream(msg);
    if (!initial && role_ != PeerRole::Viewer) {
        protocolViolation("chunk_start", "received while editor");
        return;
    }

    StreamTarget target{
        .purpose = initial ? StreamPurpose::InitialSync : StreamPurpose::Operation,
        .item_id = msg.item_id,
        .size = msg.size,
    };

    if (initial) {
        auto progress = progress_;
        progress.current_item_index = msg.item_index;
        progress.current_item_bytes_transferred = 0;
        progress.current_item_bytes_total = msg.size;
        setProgress(progress);
    }

    if (sync_debug_enabled()) {
        qInfo() << "SYNC: chunk_start" << qs(msg.item_id) << "index" << msg.item_index
                << "frames" << msg.total_frames << "size" << msg.size;
    }

    if (msg.total_frames == 0 && msg.size == 0) {
        finishStream(msg.item_index, target, Bytes{}, std::nullopt);
        return;
    }

    auto started = transfer_.startReceiving(msg.item_index, msg.item_id, msg.total_frames, msg.size);
    if (started.is_err()) {
        protocolViolation("chunk_start", started.unwrap_err().message);
        finishStream(msg.item_index, target, std::nullopt, started.unwrap_err());
        return;
    }
    stream_targets_[msg.item_index] = target;
}

void SyncOrchestrator::handleChunkComplete(const ChunkComplete& msg) {
    if (!transfer_.isReceiving(msg.item_index)) {
        return;  // stream already finished
    }

    auto it = stream_targets_.find(msg.item_index);
    if (it == stream_targets_.end()) {
        transfer_.cancelReceiving(msg.item_index);
        return;
    }

    // chunk_complete overtook frames on an ordered link: the payload is short.
    transfer_.cancelReceiving(msg.item_index);
    const auto target = it->second;
    finishStream(msg.item_index, target, std::nullopt,
                 Error{"Missing frames for item " + msg.item_id, ErrorCode::Transfer});
}

void SyncOrchestrator::handleSyncComplete(const SyncComplete& msg) {
    if (!staged_) {
        protocolViolation("sync_complete", "nothing staged");
        return;
    }

    if (msg.total_items != staged_->items.size()) {
        qWarning() << "SYNC: sync_complete announced" << msg.total_items << "items, staged"
                   << staged_->items.size() << "- discarding";
        const auto staged_count = staged_->items.size();
        dropStaging();
        failProgress("Sync inconsistent: expected " + std::to_string(msg.total_items) +
                     " items, received " + std::to_string(staged_count));
        return;
    }

    qInfo() << "SYNC: initial sync received," << msg.total_items << "items,"
            << msg.total_bytes << "bytes; awaiting commit";
    auto progress = progress_;
    progress.phase = SyncPhase::Complete;
    progress.total_bytes_transferred = staged_bytes_done_;
    setProgress(progress);
}

void SyncOrchestrator::handleSyncFailed(const SyncFailed& msg) {
    qWarning() << "SYNC: peer reported sync error:" << qs(msg.error);
    cancelInitialStreams();
    dropStaging();
    failProgress(msg.error);
    releaseSyncGate();
}

void SyncOrchestrator::handleOperation(const ControlMessage& message) {
    if (role_ == PeerRole::Editor) {
        protocolViolation(message.type(), "operation received while editor");
        return;
    }
    if (staged_) {
        // Applied after commit, in arrival order.
        deferred_ops_.push_back(message);
        return;
    }
    applyOperation(message);
}

void SyncOrchestrator::onBulkReceived(const Bytes& frame) {
    if (!session_active_) return;

    auto result = transfer_.receiveFrame(frame, [this, &frame](uint64_t received, uint64_t total) {
        auto parsed = parseFrame(frame);
        if (parsed.is_err()) return;
        auto it = stream_targets_.find(parsed.unwrap().header.stream_index);
        if (it == stream_targets_.end() || it->second.purpose != StreamPurpose::InitialSync) {
            return;
        }
        auto progress = progress_;
        progress.current_item_bytes_transferred = received;
        progress.current_item_bytes_total = total;
        progress.total_bytes_transferred = staged_bytes_done_ + received;
        setProgress(progress);
    });

    if (!result || !result->complete) return;

    auto it = stream_targets_.find(result->stream_index);
    if (it == stream_targets_.end()) return;
    const auto target = it->second;
    finishStream(result->stream_index, target, std::move(result->payload), std::move(result->error));
}

void SyncOrchestrator::finishStream(uint32_t stream_index, const StreamTarget& target,
                                    std::optional<Bytes> payload, std::optional<Error> error) {
    stream_targets_.erase(stream_index);

    if (error) {
        qWarning() << "SYNC: transfer of item" << qs(target.item_id) << "failed:"
                   << qs(error->message);
        if (target.purpose == StreamPurpose::Operation) {
            pending_payloads_.erase(target.item_id);
        }
        emit itemTransferFailed(QString::fromStdString(target.item_id),
                                QString::fromStdString(error->message));
        return;
    }

    if (target.purpose == StreamPurpose::InitialSync) {
        if (!staged_) return;
        staged_bytes_done_ += payload->size();
        staged_->payloads[target.item_id] = std::move(*payload);
        return;
    }

    applyPayload(target.item_id, std::move(*payload));
}

// ============================================================================
// Remote apply
// ============================================================================

void SyncOrchestrator::applyOperation(const ControlMessage& message) {
    RemoteApplyGuard guard(remote_apply_depth_);

    std::visit(overloaded{
        [&](const OpCreate& op) {
            auto saved = store_.save_item(op.item);
            if (saved.is_err()) {
                reportStorageError(saved.unwrap_err());
                return;
            }
            if (op.payload_size > 0) {
                auto early = early_payloads_.find(op.item.id);
                if (early != early_payloads_.end()) {
                    auto payload = std::move(early->second);
                    early_payloads_.erase(early);
                    pending_payloads_[op.item.id] = PendingPayload{};
                    applyPayload(op.item.id, std::move(payload));
                } else {
                    pending_payloads_[op.item.id] = PendingPayload{};
                }
            }
            emit itemsChanged();
        },
        [&](const OpUpdate& op) {
            auto loaded = store_.load_item(op.item_id);
            if (loaded.is_err()) {
                reportStorageError(loaded.unwrap_err());
                return;
            }
            if (!loaded.unwrap()) {
                qWarning() << "SYNC: op_update for unknown item" << qs(op.item_id);
                return;
            }
            auto saved = store_.save_item(with_changes(*loaded.unwrap(), op.changes));
            if (saved.is_err()) {
                reportStorageError(saved.unwrap_err());
                return;
            }
            emit itemsChanged();
        },
        [&](const OpDelete& op) {
            pending_payloads_.erase(op.item_id);
            early_payloads_.erase(op.item_id);
            auto removed = store_.remove_item(op.item_id);
            if (removed.is_err()) {
                reportStorageError(removed.unwrap_err());
                return;
            }
            emit itemsChanged();
        },
        [&](const OpReorder& op) {
            auto loaded = store_.load_items();
            if (loaded.is_err()) {
                reportStorageError(loaded.unwrap_err());
                return;
            }
            for (const auto& item : apply_order(std::move(loaded).unwrap(), op.order)) {
                auto saved = store_.save_item(item);
                if (saved.is_err()) {
                    reportStorageError(saved.unwrap_err());
                    return;
                }
            }
            emit itemsChanged();
        },
        [&](const OpPayloadChange& op) {
            if (op.payload_size == 0) {
                auto loaded = store_.load_item(op.item_id);
                if (loaded.is_err()) {
                    reportStorageError(loaded.unwrap_err());
                    return;
                }
                if (loaded.unwrap()) {
                    auto saved = store_.save_item(with_payload_metadata(*loaded.unwrap(), op.metadata));
                    if (saved.is_err()) {
                        reportStorageError(saved.unwrap_err());
                        return;
                    }
                    emit itemsChanged();
                }
                return;
            }
            pending_payloads_[op.item_id] = PendingPayload{.metadata = op.metadata};
            auto early = early_payloads_.find(op.item_id);
            if (early != early_payloads_.end()) {
                auto payload = std::move(early->second);
                early_payloads_.erase(early);
                applyPayload(op.item_id, std::move(payload));
            }
        },
        [&](const auto&) {
            protocolViolation(message.type(), "not an operation");
        },
    }, message.body);
}

void SyncOrchestrator::applyPayload(const std::string& item_id, Bytes payload) {
    RemoteApplyGuard guard(remote_apply_depth_);

    auto pending = pending_payloads_.find(item_id);
    if (pending == pending_payloads_.end()) {
        // The operation is deferred or has not arrived yet.
        early_payloads_[item_id] = std::move(payload);
        return;
    }
    const auto metadata = pending->second.metadata;
    pending_payloads_.erase(pending);

    if (metadata) {
        auto loaded = store_.load_item(item_id);
        if (loaded.is_err()) {
            reportStorageError(loaded.unwrap_err());
            return;
        }
        if (loaded.unwrap()) {
            auto saved = store_.save_item(with_payload_metadata(*loaded.unwrap(), *metadata));
            if (saved.is_err()) {
                reportStorageError(saved.unwrap_err());
                return;
            }
        } else {
            qWarning() << "SYNC: op_audio_change for unknown item" << qs(item_id)
                       << "- storing payload only";
        }
    }

    auto saved = store_.save_payload(item_id, payload);
    if (saved.is_err()) {
        reportStorageError(saved.unwrap_err());
        return;
    }
    emit itemsChanged();
}

// ============================================================================
// Initial sync
// ============================================================================

Result<void> SyncOrchestrator::startSync() {
    if (!connection_.isConnected()) {
        return fail(ErrorCode::InvalidState, "Not connected");
    }
    if (role_ != PeerRole::Editor) {
        return fail(ErrorCode::ReadOnly, "Only the editor can start a sync");
    }
    switch (progress_.phase) {
        case SyncPhase::Requesting:
        case SyncPhase::AwaitingAccept:
        case SyncPhase::Transferring:
            return fail(ErrorCode::InvalidState, "A sync is already in progress");
        default:
            break;
    }

    auto_sync_timer_.stop();
    auto_synced_ = true;

    SyncProgress progress;
    progress.phase = SyncPhase::Requesting;
    setProgress(progress);

    auto project = store_.load_project();
    if (project.is_err()) {
        failProgress(project.unwrap_err().message);
        return Result<void>::err(project.unwrap_err());
    }
    if (!project.unwrap()) {
        auto created = create_project();
        auto saved = store_.save_project(created);
        if (saved.is_err()) {
            failProgress(saved.unwrap_err().message);
            return saved;
        }
        project = Result<std::optional<Project>>::ok(created);
    }

    auto items = store_.load_items();
    if (items.is_err()) {
        failProgress(items.unwrap_err().message);
        return Result<void>::err(items.unwrap_err());
    }

    std::vector<ItemMetadata> metadata;
    uint64_t total_bytes = 0;
    for (auto& item : items.unwrap()) {
        auto size = store_.payload_size(item.id);
        if (size.is_err()) {
            failProgress(size.unwrap_err().message);
            return Result<void>::err(size.unwrap_err());
        }
        total_bytes += size.unwrap();
        metadata.push_back(ItemMetadata{.item = std::move(item), .payload_size = size.unwrap()});
    }

    SyncRequest request{
        .project = *project.unwrap(),
        .items = metadata,
        .total_bytes = total_bytes,
    };
    outbound_items_ = std::move(metadata);
    progress.total_items = static_cast<uint32_t>(outbound_items_.size());
    progress.total_bytes_total = total_bytes;
    setProgress(progress);

    // Operations queued earlier reach the viewer before the request. The job
    // then keeps the queue until the viewer answers, so anything edited in
    // the meantime follows sync_complete.
    const auto session = session_;
    enqueue([this, session, request = std::move(request)]() mutable {
        if (!connection_.send(makeMessage(std::move(request)))) {
            outbound_items_.clear();
            failProgress("Control channel closed");
            finishJob(session);
            return;
        }
        auto sent = progress_;
        sent.phase = SyncPhase::AwaitingAccept;
        setProgress(sent);
        sync_gate_held_ = true;
        qInfo() << "SYNC: sync request sent," << outbound_items_.size() << "items,"
                << sent.total_bytes_total << "bytes";
    });

    if (progress_.phase == SyncPhase::Error) {
        return fail(ErrorCode::Transfer, "Control channel closed");
    }
    return Result<void>::ok();
}

void SyncOrchestrator::releaseSyncGate() {
    if (!sync_gate_held_) return;
    sync_gate_held_ = false;
    finishJob(session_);
}

void SyncOrchestrator::runInitialSync() {
    if (!connection_.isConnected()) {
        finishJob(session_);
        return;
    }
    sendSyncItem(0, 0);
}

void SyncOrchestrator::sendSyncItem(size_t index, uint64_t bytes_sent) {
    const auto session = session_;

    // Items without a payload need no stream.
    while (index < outbound_items_.size() && outbound_items_[index].payload_size == 0) {
        ++index;
    }

    if (index >= outbound_items_.size()) {
        const auto total_items = static_cast<uint32_t>(outbound_items_.size());
        if (!connection_.send(makeMessage(SyncComplete{.total_items = total_items,
                                                       .total_bytes = bytes_sent}))) {
            outbound_items_.clear();
            failProgress("Control channel closed before sync_complete");
            finishJob(session);
            return;
        }
        auto progress = progress_;
        progress.phase = SyncPhase::Complete;
        progress.total_bytes_transferred = bytes_sent;
        setProgress(progress);
        outbound_items_.clear();
        qInfo() << "SYNC: initial sync sent," << total_items << "items," << bytes_sent << "bytes";
        finishJob(session);
        return;
    }

    const auto& item_id = outbound_items_[index].item.id;
    auto payload = store_.load_payload(item_id);
    if (payload.is_err() || !payload.unwrap() || payload.unwrap()->empty()) {
        // Vanished since the request was sent; the viewer keeps the item without payload.
        qWarning() << "SYNC: payload for" << qs(item_id) << "unavailable, skipping";
        sendSyncItem(index + 1, bytes_sent);
        return;
    }
    auto data = std::move(*payload.unwrap());
    const auto size = data.size();

    auto progress = progress_;
    progress.current_item_index = static_cast<uint32_t>(index);
    progress.current_item_bytes_transferred = 0;
    progress.current_item_bytes_total = size;
    setProgress(progress);

    sendPayload(item_id, static_cast<uint32_t>(index), std::move(data),
        [this, bytes_sent](uint64_t sent, uint64_t total) {
            auto progress = progress_;
            progress.current_item_bytes_transferred = sent;
            progress.current_item_bytes_total = total;
            progress.total_bytes_transferred = bytes_sent + sent;
            setProgress(progress);
        },
        [this, session, index, bytes_sent, size](Result<void> result) {
            if (session != session_) return;
            if (result.is_err()) {
                const auto& message = result.unwrap_err().message;
                if (!connection_.send(makeMessage(SyncFailed{.error = message}))) {
                    qWarning() << "SYNC: could not report sync error to peer";
                }
                outbound_items_.clear();
                failProgress(message);
                finishJob(session);
                return;
            }
            sendSyncItem(index + 1, bytes_sent + size);
        });
}

Result<void> SyncOrchestrator::acceptSync() {
    if (!pending_request_) {
        return fail(ErrorCode::InvalidState, "No sync request to accept");
    }
    if (!connection_.send(makeMessage(SyncAccept{}))) {
        return fail(ErrorCode::Transfer, "Control channel closed");
    }

    ProjectSnapshot snapshot;
    snapshot.project = pending_request_->project;
    for (const auto& meta : pending_request_->items) {
        snapshot.items.push_back(meta.item);
    }
    staged_ = std::move(snapshot);
    staged_bytes_done_ = 0;
    deferred_ops_.clear();

    pending_request_.reset();
    emit pendingRequestChanged();

    auto progress = progress_;
    progress.phase = SyncPhase::Transferring;
    setProgress(progress);
    qInfo() << "SYNC: sync accepted, staging" << staged_->items.size() << "items";
    return Result<void>::ok();
}

Result<void> SyncOrchestrator::rejectSync(std::string reason) {
    if (!pending_request_) {
        return fail(ErrorCode::InvalidState, "No sync request to reject");
    }
    if (!connection_.send(makeMessage(SyncReject{.reason = reason}))) {
        return fail(ErrorCode::Transfer, "Control channel closed");
    }
    pending_request_.reset();
    emit pendingRequestChanged();
    setProgress(SyncProgress{});
    qInfo() << "SYNC: sync rejected:" << QString::fromStdString(reason);
    return Result<void>::ok();
}

Result<void> SyncOrchestrator::commitSync() {
    if (!staged_ || progress_.phase != SyncPhase::Complete) {
        return fail(ErrorCode::InvalidState, "No completed sync to commit");
    }

    auto replaced = store_.replace_all(*staged_);
    if (replaced.is_err()) {
        reportStorageError(replaced.unwrap_err());
        return replaced;
    }

    qInfo() << "SYNC: committed" << staged_->items.size() << "items,"
            << staged_->payloads.size() << "payloads";
    staged_.reset();
    staged_bytes_done_ = 0;
    emit projectReloaded();

    auto deferred = std::move(deferred_ops_);
    deferred_ops_.clear();
    for (const auto& message : deferred) {
        applyOperation(message);
    }
    return Result<void>::ok();
}

Result<void> SyncOrchestrator::discardSync() {
    if (!staged_) {
        return fail(ErrorCode::InvalidState, "Nothing staged");
    }
    cancelInitialStreams();
    dropStaging();
    setProgress(SyncProgress{});
    qInfo() << "SYNC: staged snapshot discarded";
    return Result<void>::ok();
}

void SyncOrchestrator::cancelInitialStreams() {
    for (auto it = stream_targets_.begin(); it != stream_targets_.end();) {
        if (it->second.purpose == StreamPurpose::InitialSync) {
            transfer_.cancelReceiving(it->first);
            it = stream_targets_.erase(it);
        } else {
            ++it;
        }
    }
}

void SyncOrchestrator::dropStaging() {
    staged_.reset();
    staged_bytes_done_ = 0;
    deferred_ops_.clear();
    early_payloads_.clear();
}

void SyncOrchestrator::onAutoSyncTimeout() {
    if (auto_synced_ || role_ != PeerRole::Editor || !connection_.isConnected()) return;
    auto started = startSync();
    if (started.is_err()) {
        qWarning() << "SYNC: automatic sync not started:"
                   << QString::fromStdString(started.unwrap_err().message);
    }
}

// ============================================================================
// Local mutations
// ============================================================================

Result<void> SyncOrchestrator::checkEditable() const {
    if (canEdit()) return Result<void>::ok();
    if (role_transfer_.phase == RoleTransferPhase::Transferring) {
        return fail(ErrorCode::InvalidState, "Editing is paused while the editor role is handed over");
    }
    return fail(ErrorCode::ReadOnly, "Only the editor can modify the project while connected");
}

bool SyncOrchestrator::shouldBroadcast() const {
    return connection_.isConnected() && session_active_ && role_ == PeerRole::Editor &&
           !RemoteApplyGuard::active(remote_apply_depth_);
}

Result<Item> SyncOrchestrator::createItem(Item item, std::optional<Bytes> payload) {
    auto editable = checkEditable();
    if (editable.is_err()) return Result<Item>::err(editable.unwrap_err());

    if (item.id.empty()) {
        item.id = Uuid::generate().to_string();
    }
    if (item.created_at.empty()) {
        item.created_at = Timestamp::now().to_iso_string();
    }
    if (item.updated_at.empty()) {
        item.updated_at = item.created_at;
    }

    auto saved = store_.save_item(item);
    if (saved.is_err()) return Result<Item>::err(saved.unwrap_err());

    uint64_t payload_size = 0;
    if (payload) {
        auto stored = store_.save_payload(item.id, *payload);
        if (stored.is_err()) return Result<Item>::err(stored.unwrap_err());
        payload_size = payload->size();
    }

    if (shouldBroadcast()) {
        enqueueMessage(OpCreate{.item = item, .payload_size = payload_size});
        if (payload_size > 0) {
            enqueuePayload(item.id, std::move(*payload));
        }
    }
    emit itemsChanged();
    return Result<Item>::ok(std::move(item));
}

Result<Item> SyncOrchestrator::updateItem(const std::string& id, const ItemChanges& changes) {
    auto editable = checkEditable();
    if (editable.is_err()) return Result<Item>::err(editable.unwrap_err());

    auto loaded = store_.load_item(id);
    if (loaded.is_err()) return Result<Item>::err(loaded.unwrap_err());
    if (!loaded.unwrap()) {
        return fail<Item>(ErrorCode::InvalidState, "Unknown item " + id);
    }

    auto updated = with_changes(*loaded.unwrap(), changes);
    auto saved = store_.save_item(updated);
    if (saved.is_err()) return Result<Item>::err(saved.unwrap_err());

    if (shouldBroadcast() && !changes.empty()) {
        enqueueMessage(OpUpdate{.item_id = id, .changes = changes});
    }
    emit itemsChanged();
    return Result<Item>::ok(std::move(updated));
}

Result<void> SyncOrchestrator::deleteItem(const std::string& id) {
    auto editable = checkEditable();
    if (editable.is_err()) return editable;

    auto removed = store_.remove_item(id);
    if (removed.is_err()) return removed;

    if (shouldBroadcast()) {
        enqueueMessage(OpDelete{.item_id = id});
    }
    emit itemsChanged();
    return Result<void>::ok();
}

Result<void> SyncOrchestrator::reorderItems(const std::vector<ItemOrder>& order) {
    auto editable = checkEditable();
    if (editable.is_err()) return editable;

    auto loaded = store_.load_items();
    if (loaded.is_err()) return Result<void>::err(loaded.unwrap_err());

    for (const auto& item : apply_order(std::move(loaded).unwrap(), order)) {
        auto saved = store_.save_item(item);
        if (saved.is_err()) return saved;
    }

    if (shouldBroadcast()) {
        enqueueMessage(OpReorder{.order = order});
    }
    emit itemsChanged();
    return Result<void>::ok();
}

Result<Item> SyncOrchestrator::replaceItemPayload(const std::string& id,
                                                  const PayloadMetadata& metadata,
                                                  Bytes payload) {
    auto editable = checkEditable();
    if (editable.is_err()) return Result<Item>::err(editable.unwrap_err());

    auto loaded = store_.load_item(id);
    if (loaded.is_err()) return Result<Item>::err(loaded.unwrap_err());
    if (!loaded.unwrap()) {
        return fail<Item>(ErrorCode::InvalidState, "Unknown item " + id);
    }

    auto updated = with_payload_metadata(*loaded.unwrap(), metadata);
    auto saved = store_.save_item(updated);
    if (saved.is_err()) return Result<Item>::err(saved.unwrap_err());
    auto stored = store_.save_payload(id, payload);
    if (stored.is_err()) return Result<Item>::err(stored.unwrap_err());

    if (shouldBroadcast()) {
        enqueueMessage(OpPayloadChange{
            .item_id = id,
            .metadata = metadata,
            .payload_size = payload.size(),
        });
        if (!payload.empty()) {
            enqueuePayload(id, std::move(payload));
        }
    }
    emit itemsChanged();
    return Result<Item>::ok(std::move(updated));
}

// ============================================================================
// Outbound FIFO
// ============================================================================

void SyncOrchestrator::enqueue(std::function<void()> job) {
    jobs_.push_back(std::move(job));
    runJobs();
}

void SyncOrchestrator::runJobs() {
    if (draining_) return;
    draining_ = true;
    while (!job_running_ && !jobs_.empty()) {
        auto job = std::move(jobs_.front());
        jobs_.pop_front();
        job_running_ = true;
        job();
    }
    draining_ = false;
}

void SyncOrchestrator::finishJob(uint64_t session) {
    if (session != session_) return;
    job_running_ = false;
    runJobs();
}

void SyncOrchestrator::enqueueMessage(MessageBody body) {
    enqueue([this, body = std::move(body)]() mutable {
        if (!connection_.send(makeMessage(std::move(body)))) {
            qWarning() << "SYNC: control channel closed, operation not sent";
        }
        finishJob(session_);
    });
}

void SyncOrchestrator::enqueuePayload(std::string item_id, Bytes payload) {
    const auto stream_index = next_stream_index_++;
    enqueue([this, item_id = std::move(item_id), payload = std::move(payload), stream_index]() mutable {
        const auto session = session_;
        sendPayload(item_id, stream_index, std::move(payload), {},
            [this, session, item_id](Result<void> result) {
                if (result.is_err()) {
                    qWarning() << "SYNC: payload for" << qs(item_id) << "not delivered:"
                               << qs(result.unwrap_err().message);
                }
                finishJob(session);
            });
    });
}

void SyncOrchestrator::sendPayload(const std::string& item_id, uint32_t stream_index, Bytes payload,
                                   TransferEngine::ProgressCallback on_progress,
                                   std::function<void(Result<void>)> done) {
    const auto size = payload.size();
    const auto frames = frameCount(size, transfer_.frameSize());

    if (!connection_.send(makeMessage(ChunkStart{
            .item_id = item_id,
            .item_index = stream_index,
            .total_frames = frames,
            .size = size,
        }))) {
        done(fail(ErrorCode::Transfer, "Control channel closed before streaming " + item_id));
        return;
    }

    const auto session = session_;
    transfer_.sendStream(item_id, stream_index, std::move(payload), std::move(on_progress),
        [this, session, item_id, stream_index, done = std::move(done)](Result<void> result) {
            if (session != session_) return;
            if (result.is_ok() &&
                !connection_.send(makeMessage(ChunkComplete{.item_id = item_id,
                                                            .item_index = stream_index}))) {
                done(fail(ErrorCode::Transfer, "Control channel closed after streaming " + item_id));
                return;
            }
            done(std::move(result));
        });
}

// ============================================================================
// Role transfer
// ============================================================================

Result<void> SyncOrchestrator::requestRole(std::optional<std::string> reason) {
    if (!connection_.isConnected()) {
        return fail(ErrorCode::InvalidState, "Not connected");
    }
    if (role_ != PeerRole::Viewer) {
        return fail(ErrorCode::InvalidState, "Only the viewer can request the editor role");
    }
    if (role_transfer_.phase != RoleTransferPhase::Idle &&
        role_transfer_.phase != RoleTransferPhase::Denied) {
        return fail(ErrorCode::InvalidState,
                    std::string("Role transfer already ") + roleTransferPhaseName(role_transfer_.phase));
    }
    if (!connection_.send(makeMessage(RoleRequest{.reason = reason}))) {
        return fail(ErrorCode::Transfer, "Control channel closed");
    }

    deny_timer_.stop();
    role_request_expired_ = false;
    setRoleTransfer(RoleTransferPhase::PendingRequest);
    if (config_.role_request_timeout.count() > 0) {
        role_request_timer_.start(config_.role_request_timeout);
    }
    return Result<void>::ok();
}

Result<void> SyncOrchestrator::grantRole() {
    if (role_ != PeerRole::Editor || role_transfer_.phase != RoleTransferPhase::PendingApproval) {
        return fail(ErrorCode::InvalidState, "No role request to grant");
    }
    switch (progress_.phase) {
        case SyncPhase::Requesting:
        case SyncPhase::AwaitingAccept:
        case SyncPhase::Transferring:
            return fail(ErrorCode::InvalidState, "Finish the running sync before handing over");
        default:
            break;
    }
    role_request_timer_.stop();

    // Queued behind outstanding operations so the new editor starts from the same state.
    enqueueMessage(RoleGrant{});

    role_ = PeerRole::Viewer;
    setRoleTransfer(RoleTransferPhase::Transferring);
    emit roleChanged();
    qInfo() << "SYNC: editor role granted, waiting for confirmation";
    return Result<void>::ok();
}

Result<void> SyncOrchestrator::denyRole(std::optional<std::string> reason) {
    if (role_ != PeerRole::Editor || role_transfer_.phase != RoleTransferPhase::PendingApproval) {
        return fail(ErrorCode::InvalidState, "No role request to deny");
    }
    role_request_timer_.stop();
    if (!connection_.send(makeMessage(RoleDeny{.reason = reason}))) {
        return fail(ErrorCode::Transfer, "Control channel closed");
    }
    setRoleTransfer(RoleTransferPhase::Idle);
    return Result<void>::ok();
}

void SyncOrchestrator::handleRoleRequest(const RoleRequest& msg) {
    if (role_ != PeerRole::Editor) {
        protocolViolation("role_request", "received while viewer");
        return;
    }
    if (role_transfer_.phase == RoleTransferPhase::Transferring) {
        protocolViolation("role_request", "role transfer in progress");
        return;
    }
    qInfo() << "SYNC: peer requests editor role";
    setRoleTransfer(RoleTransferPhase::PendingApproval, msg.reason);
    if (config_.role_request_timeout.count() > 0) {
        role_request_timer_.start(config_.role_request_timeout);
    }
}

void SyncOrchestrator::handleRoleGrant() {
    if (role_ != PeerRole::Viewer) {
        protocolViolation("role_grant", "received while editor");
        return;
    }
    // A grant racing our own expiry is still honoured; the editor has already stepped down.
    const bool expected = role_transfer_.phase == RoleTransferPhase::PendingRequest ||
                          (role_request_expired_ && role_transfer_.phase == RoleTransferPhase::Idle);
    if (!expected) {
        protocolViolation("role_grant", "no role request outstanding");
        return;
    }
    role_request_expired_ = false;
    role_request_timer_.stop();
    deny_timer_.stop();

    setRoleTransfer(RoleTransferPhase::Transferring);
    role_ = PeerRole::Editor;
    emit roleChanged();

    if (!connection_.send(makeMessage(RoleTransferComplete{}))) {
        qWarning() << "SYNC: could not confirm role transfer";
    }
    setRoleTransfer(RoleTransferPhase::Idle);
    qInfo() << "SYNC: now editor";
}

void SyncOrchestrator::handleRoleDeny(const RoleDeny& msg) {
    if (role_ != PeerRole::Viewer) {
        protocolViolation("role_deny", "received while editor");
        return;
    }
    role_request_timer_.stop();
    role_request_expired_ = false;
    setRoleTransfer(RoleTransferPhase::Denied, msg.reason);
    deny_timer_.start(config_.role_deny_display);
}

void SyncOrchestrator::handleRoleTransferComplete() {
    if (role_transfer_.phase != RoleTransferPhase::Transferring) {
        protocolViolation("role_transfer_complete", "no role transfer in progress");
        return;
    }
    setRoleTransfer(RoleTransferPhase::Idle);
    qInfo() << "SYNC: role transfer complete, now viewer";
}

void SyncOrchestrator::onRoleRequestExpired() {
    if (role_transfer_.phase == RoleTransferPhase::PendingRequest ||
        role_transfer_.phase == RoleTransferPhase::PendingApproval) {
        qInfo() << "SYNC: role request expired";
        role_request_expired_ = role_transfer_.phase == RoleTransferPhase::PendingRequest;
        setRoleTransfer(RoleTransferPhase::Idle);
    }
}

// ============================================================================
// State publication
// ============================================================================

void SyncOrchestrator::setProgress(SyncProgress progress) {
    const bool phase_changed = progress.phase != progress_.phase;
    progress_ = std::move(progress);
    if (phase_changed && sync_debug_enabled()) {
        qInfo() << "SYNC: sync phase" << syncPhaseName(progress_.phase);
    }
    emit progressChanged(progress_);
}

void SyncOrchestrator::failProgress(std::string message) {
    SyncProgress progress;
    progress.phase = SyncPhase::Error;
    progress.error = std::move(message);
    setProgress(std::move(progress));
}

void SyncOrchestrator::setRoleTransfer(RoleTransferPhase phase, std::optional<std::string> reason) {
    if (role_transfer_.phase == phase && role_transfer_.reason == reason) return;
    if (sync_debug_enabled()) {
        qInfo() << "SYNC: role transfer" << roleTransferPhaseName(role_transfer_.phase) << "->"
                << roleTransferPhaseName(phase);
    }
    role_transfer_ = RoleTransferState{.phase = phase, .reason = std::move(reason)};
    emit roleTransferChanged();
}

void SyncOrchestrator::setReconnection(ReconnectionPhase phase, std::optional<std::string> reason) {
    if (reconnection_.phase == phase && reconnection_.reason == reason) return;
    if (sync_debug_enabled()) {
        qInfo() << "SYNC: reconnection" << reconnectionPhaseName(reconnection_.phase) << "->"
                << reconnectionPhaseName(phase);
    }
    reconnection_ = ReconnectionState{.phase = phase, .reason = std::move(reason)};
    emit reconnectionChanged();
}

void SyncOrchestrator::reportStorageError(const Error& error) {
    qWarning() << "SYNC: storage error:" << QString::fromStdString(error.message);
    emit errorOccurred(error);
}

} // namespace tandem::sync
