#include <catch2/catch_test_macros.hpp>
#include "network/control_message.hpp"

#include <QJsonDocument>
#include <QJsonObject>

using namespace tandem;
using namespace tandem::network;

namespace {

QJsonObject wire(const ControlMessage& message) {
    return QJsonDocument::fromJson(encodeMessage(message)).object();
}

ControlMessage reparse(const ControlMessage& message) {
    auto decoded = decodeMessage(encodeMessage(message));
    REQUIRE(decoded.is_ok());
    return std::move(decoded).unwrap();
}

Item sampleItem() {
    Item item;
    item.id = "item-1";
    item.label = "Take 1";
    item.notes = "first pass";
    item.tags = {"drums", "rough"};
    item.color = ItemColor::Blue;
    item.duration = 12.5;
    item.waveform = std::vector<double>{0.1, 0.5, 0.9};
    item.transcript = std::vector<TranscriptSegment>{{.start = 0.0, .end = 1.5, .text = "one"}};
    item.created_at = "2024-05-01T10:00:00.000Z";
    item.updated_at = "2024-05-01T10:05:00.000Z";
    item.order = 2;
    return item;
}

} // namespace

TEST_CASE("Every message carries type, id and timestamp", "[control]") {
    auto message = makeMessage(SyncAccept{});
    auto obj = wire(message);

    REQUIRE(obj.value("type").toString() == "sync_accept");
    REQUIRE_FALSE(obj.value("id").toString().isEmpty());
    REQUIRE(obj.value("timestamp").toDouble() > 0);
    REQUIRE(message.type() == "sync_accept");

    SECTION("ids are unique") {
        REQUIRE(makeMessage(SyncAccept{}).id != makeMessage(SyncAccept{}).id);
    }
}

TEST_CASE("Wire field names are camelCase", "[control]") {
    auto chunk = wire(makeMessage(ChunkStart{
        .item_id = "a", .item_index = 3, .total_frames = 4, .size = 50000}));
    REQUIRE(chunk.value("type").toString() == "chunk_start");
    REQUIRE(chunk.value("itemId").toString() == "a");
    REQUIRE(chunk.value("itemIndex").toInt() == 3);
    REQUIRE(chunk.value("totalFrames").toInt() == 4);
    REQUIRE(chunk.value("size").toInteger() == 50000);

    auto change = wire(makeMessage(OpPayloadChange{
        .item_id = "a", .metadata = {.duration = 2.0}, .payload_size = 10}));
    REQUIRE(change.value("type").toString() == "op_audio_change");
    REQUIRE(change.value("payloadSize").toInteger() == 10);
    REQUIRE(change.value("duration").toDouble() == 2.0);
    REQUIRE_FALSE(change.contains("waveform"));

    auto bye = wire(makeMessage(Disconnect{.reason = DisconnectReason::UserInitiated}));
    REQUIRE(bye.value("reason").toString() == "user_initiated");

    auto failed = wire(makeMessage(SyncFailed{.error = "boom"}));
    REQUIRE(failed.value("type").toString() == "sync_error");
}

TEST_CASE("Messages survive encode and decode", "[control]") {
    SECTION("sync_request with item metadata") {
        SyncRequest request{
            .project = {.created_at = "2024-05-01T09:00:00.000Z", .updated_at = "2024-05-01T10:00:00.000Z"},
            .items = {{.item = sampleItem(), .payload_size = 50000}},
            .total_bytes = 50000,
        };
        auto parsed = reparse(makeMessage(request));
        const auto* body = parsed.as<SyncRequest>();
        REQUIRE(body != nullptr);
        REQUIRE(body->project == request.project);
        REQUIRE(body->items == request.items);
        REQUIRE(body->total_bytes == 50000);
    }

    SECTION("op_update carries only the changed fields") {
        ItemChanges changes;
        changes.label = "renamed";
        changes.color = ItemColor::Red;
        auto parsed = reparse(makeMessage(OpUpdate{.item_id = "item-1", .changes = changes}));
        const auto* body = parsed.as<OpUpdate>();
        REQUIRE(body != nullptr);
        REQUIRE(body->changes.label == std::optional<std::string>("renamed"));
        REQUIRE(body->changes.color == std::optional<ItemColor>(ItemColor::Red));
        REQUIRE_FALSE(body->changes.notes.has_value());
        REQUIRE_FALSE(body->changes.tags.has_value());
    }

    SECTION("op_reorder") {
        std::vector<ItemOrder> order{{.id = "b", .order = 0}, {.id = "a", .order = 1}};
        auto parsed = reparse(makeMessage(OpReorder{.order = order}));
        REQUIRE(parsed.as<OpReorder>()->order == order);
    }

    SECTION("role messages with and without reason") {
        auto with_reason = reparse(makeMessage(RoleRequest{.reason = "my turn"}));
        REQUIRE(with_reason.as<RoleRequest>()->reason == std::optional<std::string>("my turn"));
        auto without = reparse(makeMessage(RoleDeny{}));
        REQUIRE_FALSE(without.as<RoleDeny>()->reason.has_value());
    }

    SECTION("heartbeat pong echoes the ping id") {
        auto ping = makeMessage(HeartbeatPing{});
        auto pong = reparse(makeMessage(HeartbeatPong{.ping_id = ping.id}));
        REQUIRE(pong.as<HeartbeatPong>()->ping_id == ping.id);
    }
}

TEST_CASE("Invalid control messages are protocol violations", "[control]") {
    SECTION("not JSON") {
        auto decoded = decodeMessage("{not json");
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.unwrap_err().code == ErrorCode::ProtocolViolation);
    }

    SECTION("unknown type") {
        auto decoded = decodeMessage(R"({"type":"teleport","id":"x","timestamp":1})");
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.unwrap_err().code == ErrorCode::ProtocolViolation);
    }

    SECTION("missing envelope field") {
        REQUIRE(decodeMessage(R"({"type":"sync_accept","timestamp":1})").is_err());
    }

    SECTION("missing body field") {
        auto decoded = decodeMessage(R"({"type":"chunk_start","id":"x","timestamp":1,"itemId":"a"})");
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.unwrap_err().code == ErrorCode::ProtocolViolation);
    }
}
