#pragma once

#include "core/config.hpp"
#include "core/item.hpp"
#include "core/result.hpp"
#include "network/connection_manager.hpp"
#include "network/control_message.hpp"
#include "storage/project_store.hpp"
#include "sync/transfer_engine.hpp"

#include <QObject>
#include <QString>
#include <QTimer>

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tandem::sync {

enum class PeerRole {
    Editor,
    Viewer
};

[[nodiscard]] const char* peerRoleName(PeerRole role) noexcept;

enum class SyncPhase {
    Idle,
    Requesting,
    AwaitingAccept,
    Transferring,
    Complete,
    Error
};

[[nodiscard]] const char* syncPhaseName(SyncPhase phase) noexcept;

/**
 * Initial sync progress as published to the presentation layer.
 */
struct SyncProgress {
    SyncPhase phase = SyncPhase::Idle;
    uint32_t current_item_index = 0;
    uint32_t total_items = 0;
    uint64_t current_item_bytes_transferred = 0;
    uint64_t current_item_bytes_total = 0;
    uint64_t total_bytes_transferred = 0;
    uint64_t total_bytes_total = 0;
    std::optional<std::string> error;
};

/**
 * Incoming sync offer waiting for the viewer to accept or reject it.
 */
struct PendingSyncRequest {
    Project project;
    std::vector<ItemMetadata> items;
    uint64_t total_bytes = 0;
};

enum class RoleTransferPhase {
    Idle,
    PendingRequest,   // viewer asked, waiting for the editor
    PendingApproval,  // editor received a request
    Transferring,     // roles are being swapped; nobody may edit
    Denied
};

struct RoleTransferState {
    RoleTransferPhase phase = RoleTransferPhase::Idle;
    std::optional<std::string> reason;
};

[[nodiscard]] const char* roleTransferPhaseName(RoleTransferPhase phase) noexcept;

enum class ReconnectionPhase {
    Idle,
    Reconnecting,
    Failed,
    PeerDisconnected
};

struct ReconnectionState {
    ReconnectionPhase phase = ReconnectionPhase::Idle;
    std::optional<std::string> reason;
};

[[nodiscard]] const char* reconnectionPhaseName(ReconnectionPhase phase) noexcept;

/**
 * SyncOrchestrator - the peer sync protocol on top of a ConnectionManager.
 *
 * Responsibilities:
 * - Initial sync: the editor offers a full snapshot, the viewer stages it
 *   and installs it only on an explicit commit (full replacement).
 * - Real-time broadcast: local mutations made by the editor while connected
 *   are sent as operations; the viewer applies them in arrival order.
 * - Role transfer: request/grant/deny of the single writer role.
 * - Reconnection: liveness loss, grace window, peer-initiated disconnect.
 *
 * Every local mutation of the project goes through this class so the
 * single-writer rule is enforced in one place. Outbound work is serialized
 * in one FIFO, so the chunk_start/frames/chunk_complete sequence of one item
 * never interleaves with another message that depends on it.
 */
class SyncOrchestrator : public QObject {
    Q_OBJECT

public:
    SyncOrchestrator(network::ConnectionManager& connection,
                     storage::ProjectStore& store,
                     SyncConfig config,
                     QObject* parent = nullptr);
    ~SyncOrchestrator() override;

    SyncOrchestrator(const SyncOrchestrator&) = delete;
    SyncOrchestrator& operator=(const SyncOrchestrator&) = delete;

    // ---- Roles ------------------------------------------------------------

    /**
     * Role assumed when the next connection is established.
     */
    void setPreferredRole(PeerRole role) { preferred_role_ = role; }
    [[nodiscard]] PeerRole preferredRole() const { return preferred_role_; }

    /**
     * Current role; unset while disconnected.
     */
    [[nodiscard]] std::optional<PeerRole> role() const { return role_; }

    /**
     * Local edits are always allowed while disconnected. While connected
     * only the editor may edit, and nobody during a role swap.
     */
    [[nodiscard]] bool canEdit() const;

    // ---- Initial sync -----------------------------------------------------

    /**
     * Editor: gather the snapshot and send sync_request.
     */
    [[nodiscard]] Result<void> startSync();

    /**
     * Viewer: accept the pending request and begin staging.
     */
    [[nodiscard]] Result<void> acceptSync();

    [[nodiscard]] Result<void> rejectSync(std::string reason);

    /**
     * Viewer: atomically replace the local project with the staged snapshot,
     * then replay operations deferred while staging.
     */
    [[nodiscard]] Result<void> commitSync();

    /**
     * Viewer: drop the staged snapshot and the deferred operations.
     */
    [[nodiscard]] Result<void> discardSync();

    [[nodiscard]] const SyncProgress& progress() const { return progress_; }
    [[nodiscard]] const std::optional<PendingSyncRequest>& pendingRequest() const {
        return pending_request_;
    }
    [[nodiscard]] bool hasStagedSnapshot() const { return staged_.has_value(); }
    [[nodiscard]] size_t deferredOperationCount() const { return deferred_ops_.size(); }

    /**
     * Inbound streams with a reassembly buffer still open.
     */
    [[nodiscard]] size_t openStreamCount() const { return transfer_.receivingCount(); }

    // ---- Local mutations --------------------------------------------------

    [[nodiscard]] Result<Item> createItem(Item item, std::optional<Bytes> payload = std::nullopt);
    [[nodiscard]] Result<Item> updateItem(const std::string& id, const ItemChanges& changes);
    [[nodiscard]] Result<void> deleteItem(const std::string& id);
    [[nodiscard]] Result<void> reorderItems(const std::vector<ItemOrder>& order);
    [[nodiscard]] Result<Item> replaceItemPayload(const std::string& id,
                                                  const PayloadMetadata& metadata,
                                                  Bytes payload);

    // ---- Role transfer ----------------------------------------------------

    [[nodiscard]] Result<void> requestRole(std::optional<std::string> reason = std::nullopt);
    [[nodiscard]] Result<void> grantRole();
    [[nodiscard]] Result<void> denyRole(std::optional<std::string> reason = std::nullopt);

    [[nodiscard]] const RoleTransferState& roleTransfer() const { return role_transfer_; }

    // ---- Connection -------------------------------------------------------

    [[nodiscard]] const ReconnectionState& reconnection() const { return reconnection_; }

    /**
     * Leave the session: notify the peer, then tear down.
     */
    void endSession(std::function<void()> done = {});

    /**
     * Number of queued outbound jobs, including the running one.
     */
    [[nodiscard]] size_t outboundBacklog() const {
        return jobs_.size() + (job_running_ ? 1 : 0);
    }

signals:
    void progressChanged(const tandem::sync::SyncProgress& progress);
    void pendingRequestChanged();
    void syncRejected(const QString& reason);
    void projectReloaded();
    void itemsChanged();
    void itemTransferFailed(const QString& item_id, const QString& message);
    void roleChanged();
    void roleTransferChanged();
    void reconnectionChanged();
    void errorOccurred(const tandem::Error& error);

private slots:
    void onConnectionStateChanged(tandem::network::ConnectionState state);
    void onControlMessage(const tandem::network::ControlMessage& message);
    void onBulkReceived(const tandem::Bytes& frame);
    void onLivenessTimeout();
    void onLivenessRestored();
    void onPeerDisconnected(tandem::network::DisconnectReason reason);
    void onReconnectGraceExpired();
    void onAutoSyncTimeout();
    void onRoleRequestExpired();

private:
    enum class StreamPurpose {
        InitialSync,
        Operation
    };

    struct StreamTarget {
        StreamPurpose purpose = StreamPurpose::Operation;
        std::string item_id;
        uint64_t size = 0;
    };

    // Remote operation waiting for its binary payload.
    struct PendingPayload {
        std::optional<PayloadMetadata> metadata;  // set for a payload replace, unset for create
    };

    network::ConnectionManager& connection_;
    storage::ProjectStore& store_;
    SyncConfig config_;
    TransferEngine transfer_;

    PeerRole preferred_role_ = PeerRole::Editor;
    std::optional<PeerRole> role_;
    bool session_active_ = false;
    bool leaving_ = false;
    uint64_t session_ = 0;

    // Initial sync
    SyncProgress progress_;
    std::optional<PendingSyncRequest> pending_request_;
    std::vector<ItemMetadata> outbound_items_;
    std::optional<ProjectSnapshot> staged_;
    uint64_t staged_bytes_done_ = 0;
    std::vector<network::ControlMessage> deferred_ops_;
    bool auto_synced_ = false;
    QTimer auto_sync_timer_;

    // Real-time receive
    int remote_apply_depth_ = 0;
    std::unordered_map<uint32_t, StreamTarget> stream_targets_;
    std::unordered_map<std::string, PendingPayload> pending_payloads_;
    std::unordered_map<std::string, Bytes> early_payloads_;

    // Outbound FIFO
    std::deque<std::function<void()>> jobs_;
    bool job_running_ = false;
    bool draining_ = false;
    bool sync_gate_held_ = false;  // sync_request sent, queue held until the viewer answers
    uint32_t next_stream_index_ = 0;

    // Role transfer
    RoleTransferState role_transfer_;
    bool role_request_expired_ = false;
    QTimer deny_timer_;
    QTimer role_request_timer_;

    // Reconnection
    ReconnectionState reconnection_;
    QTimer reconnect_timer_;

    // Dispatch
    void dispatch(const network::ControlMessage& message);
    void handleSyncRequest(const network::SyncRequest& msg);
    void handleSyncAccept();
    void handleSyncReject(const network::SyncReject& msg);
    void handleChunkStart(const network::ChunkStart& msg);
    [[nodiscard]] bool isSnapshotStream(const network::ChunkStart& msg) const;
    void handleChunkComplete(const network::ChunkComplete& msg);
    void handleSyncComplete(const network::SyncComplete& msg);
    void handleSyncFailed(const network::SyncFailed& msg);
    void handleOperation(const network::ControlMessage& message);
    void handleRoleRequest(const network::RoleRequest& msg);
    void handleRoleGrant();
    void handleRoleDeny(const network::RoleDeny& msg);
    void handleRoleTransferComplete();
    void protocolViolation(std::string_view type, std::string_view detail);

    // Remote apply
    void applyOperation(const network::ControlMessage& message);
    void applyPayload(const std::string& item_id, Bytes payload);
    void finishStream(uint32_t stream_index, const StreamTarget& target,
                      std::optional<Bytes> payload, std::optional<Error> error);

    // Outbound
    [[nodiscard]] bool shouldBroadcast() const;
    [[nodiscard]] Result<void> checkEditable() const;
    void enqueue(std::function<void()> job);
    void runJobs();
    void finishJob(uint64_t session);
    void enqueueMessage(network::MessageBody body);
    void enqueuePayload(std::string item_id, Bytes payload);
    void sendPayload(const std::string& item_id, uint32_t stream_index, Bytes payload,
                     TransferEngine::ProgressCallback on_progress,
                     std::function<void(Result<void>)> done);
    void runInitialSync();
    void releaseSyncGate();
    void sendSyncItem(size_t index, uint64_t bytes_sent);

    // State publication
    void setProgress(SyncProgress progress);
    void failProgress(std::string message);
    void setRoleTransfer(RoleTransferPhase phase, std::optional<std::string> reason = std::nullopt);
    void setReconnection(ReconnectionPhase phase, std::optional<std::string> reason = std::nullopt);
    void reportStorageError(const Error& error);

    void beginSession();
    void endSessionState();
    void cancelInitialStreams();
    void dropStaging();
};

} // namespace tandem::sync
