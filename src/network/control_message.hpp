#pragma once

#include "core/item.hpp"
#include "core/result.hpp"

#include <QByteArray>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tandem::network {

// ---------------------------------------------------------------------------
// Initial sync
// ---------------------------------------------------------------------------

struct SyncRequest {
    Project project;
    std::vector<ItemMetadata> items;
    uint64_t total_bytes = 0;
};

struct SyncAccept {};

struct SyncReject {
    std::string reason;
};

struct ChunkStart {
    std::string item_id;
    uint32_t item_index = 0;
    uint32_t total_frames = 0;
    uint64_t size = 0;
};

struct ChunkComplete {
    std::string item_id;
    uint32_t item_index = 0;
};

struct SyncComplete {
    uint32_t total_items = 0;
    uint64_t total_bytes = 0;
};

struct SyncFailed {
    std::string error;
};

// ---------------------------------------------------------------------------
// Real-time operations
// ---------------------------------------------------------------------------

struct OpCreate {
    Item item;
    uint64_t payload_size = 0;
};

struct OpUpdate {
    std::string item_id;
    ItemChanges changes;
};

struct OpDelete {
    std::string item_id;
};

struct OpReorder {
    std::vector<ItemOrder> order;
};

struct OpPayloadChange {
    std::string item_id;
    PayloadMetadata metadata;
    uint64_t payload_size = 0;
};

// ---------------------------------------------------------------------------
// Role transfer
// ---------------------------------------------------------------------------

struct RoleRequest {
    std::optional<std::string> reason;
};

struct RoleGrant {};

struct RoleDeny {
    std::optional<std::string> reason;
};

struct RoleTransferComplete {};

// ---------------------------------------------------------------------------
// Liveness
// ---------------------------------------------------------------------------

struct HeartbeatPing {};

struct HeartbeatPong {
    std::string ping_id;
};

enum class DisconnectReason {
    UserInitiated,
    Error
};

struct Disconnect {
    DisconnectReason reason = DisconnectReason::UserInitiated;
};

using MessageBody = std::variant<
    SyncRequest, SyncAccept, SyncReject, ChunkStart, ChunkComplete, SyncComplete, SyncFailed,
    OpCreate, OpUpdate, OpDelete, OpReorder, OpPayloadChange,
    RoleRequest, RoleGrant, RoleDeny, RoleTransferComplete,
    HeartbeatPing, HeartbeatPong, Disconnect>;

/**
 * ControlMessage - one structured message on the control channel.
 *
 * Wire form is a JSON object `{type, id, timestamp, ...fields}`.
 */
struct ControlMessage {
    std::string id;
    int64_t timestamp = 0;
    MessageBody body;

    /**
     * Wire name of the body alternative (e.g. "chunk_start").
     */
    [[nodiscard]] std::string_view type() const noexcept;

    template<typename T>
    [[nodiscard]] const T* as() const noexcept {
        return std::get_if<T>(&body);
    }
};

/**
 * Wrap a body with a fresh id and the current timestamp.
 */
[[nodiscard]] ControlMessage makeMessage(MessageBody body);

[[nodiscard]] std::string_view disconnectReasonName(DisconnectReason reason) noexcept;

[[nodiscard]] QByteArray encodeMessage(const ControlMessage& message);

/**
 * Parse a control message. Unknown types and missing required fields fail
 * with ErrorCode::ProtocolViolation.
 */
[[nodiscard]] Result<ControlMessage> decodeMessage(const QByteArray& bytes);

/**
 * Helper for exhaustive std::visit dispatch.
 */
template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace tandem::network
