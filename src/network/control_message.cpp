#include "network/control_message.hpp"

#include "core/types.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>

#include <functional>
#include <utility>

namespace tandem::network {

namespace {

QString qs(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

// Accumulates the first missing or mistyped field while reading an object.
class FieldReader {
public:
    explicit FieldReader(const QJsonObject& obj) : obj_(obj) {}

    std::string string(const char* key) {
        const auto v = obj_.value(QLatin1String(key));
        if (!v.isString()) {
            flag(key);
            return {};
        }
        return v.toString().toStdString();
    }

    std::optional<std::string> optional_string(const char* key) {
        const auto v = obj_.value(QLatin1String(key));
        if (v.isUndefined() || v.isNull()) return std::nullopt;
        if (!v.isString()) {
            flag(key);
            return std::nullopt;
        }
        return v.toString().toStdString();
    }

    double number(const char* key) {
        const auto v = obj_.value(QLatin1String(key));
        if (!v.isDouble()) {
            flag(key);
            return 0.0;
        }
        return v.toDouble();
    }

    uint64_t u64(const char* key) {
        const auto v = obj_.value(QLatin1String(key));
        if (!v.isDouble() || v.toDouble() < 0) {
            flag(key);
            return 0;
        }
        return static_cast<uint64_t>(v.toInteger());
    }

    uint32_t u32(const char* key) {
        const auto value = u64(key);
        if (value > UINT32_MAX) {
            flag(key);
            return 0;
        }
        return static_cast<uint32_t>(value);
    }

    int integer(const char* key) {
        const auto v = obj_.value(QLatin1String(key));
        if (!v.isDouble()) {
            flag(key);
            return 0;
        }
        return static_cast<int>(v.toInteger());
    }

    QJsonObject object(const char* key) {
        const auto v = obj_.value(QLatin1String(key));
        if (!v.isObject()) {
            flag(key);
            return {};
        }
        return v.toObject();
    }

    QJsonArray array(const char* key) {
        const auto v = obj_.value(QLatin1String(key));
        if (!v.isArray()) {
            flag(key);
            return {};
        }
        return v.toArray();
    }

    [[nodiscard]] bool has(const char* key) const {
        const auto v = obj_.value(QLatin1String(key));
        return !v.isUndefined() && !v.isNull();
    }

    void flag(const char* key) {
        if (bad_field_.empty()) bad_field_ = key;
    }

    [[nodiscard]] bool ok() const { return bad_field_.empty(); }
    [[nodiscard]] const std::string& bad_field() const { return bad_field_; }

private:
    const QJsonObject& obj_;
    std::string bad_field_;
};

// ---------------------------------------------------------------------------
// Domain records
// ---------------------------------------------------------------------------

QJsonArray strings_to_json(const std::vector<std::string>& values) {
    QJsonArray out;
    for (const auto& v : values) out.append(qs(v));
    return out;
}

QJsonArray waveform_to_json(const std::vector<double>& values) {
    QJsonArray out;
    for (double v : values) out.append(v);
    return out;
}

QJsonArray transcript_to_json(const std::vector<TranscriptSegment>& segments) {
    QJsonArray out;
    for (const auto& seg : segments) {
        QJsonObject o;
        o.insert(QStringLiteral("start"), seg.start);
        o.insert(QStringLiteral("end"), seg.end);
        o.insert(QStringLiteral("text"), qs(seg.text));
        out.append(o);
    }
    return out;
}

std::vector<std::string> strings_from_json(const QJsonArray& arr, FieldReader& reader,
                                           const char* key) {
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(arr.size()));
    for (const auto& v : arr) {
        if (!v.isString()) {
            reader.flag(key);
            return {};
        }
        out.push_back(v.toString().toStdString());
    }
    return out;
}

std::optional<std::vector<double>> waveform_from(FieldReader& reader) {
    if (!reader.has("waveform")) return std::nullopt;
    std::vector<double> out;
    for (const auto& v : reader.array("waveform")) {
        if (!v.isDouble()) {
            reader.flag("waveform");
            return std::nullopt;
        }
        out.push_back(v.toDouble());
    }
    return out;
}

std::optional<std::vector<TranscriptSegment>> transcript_from(FieldReader& reader) {
    if (!reader.has("transcript")) return std::nullopt;
    std::vector<TranscriptSegment> out;
    for (const auto& v : reader.array("transcript")) {
        if (!v.isObject()) {
            reader.flag("transcript");
            return std::nullopt;
        }
        const auto seg_obj = v.toObject();
        FieldReader seg(seg_obj);
        TranscriptSegment segment{
            .start = seg.number("start"),
            .end = seg.number("end"),
            .text = seg.string("text"),
        };
        if (!seg.ok()) {
            reader.flag("transcript");
            return std::nullopt;
        }
        out.push_back(std::move(segment));
    }
    return out;
}

ItemColor color_from(FieldReader& reader, const char* key) {
    const auto name = reader.string(key);
    if (!reader.ok()) return ItemColor::Neutral;
    const auto color = item_color_from_string(name);
    if (!color) {
        reader.flag(key);
        return ItemColor::Neutral;
    }
    return *color;
}

QJsonObject project_to_json(const Project& project) {
    QJsonObject o;
    o.insert(QStringLiteral("createdAt"), qs(project.created_at));
    o.insert(QStringLiteral("updatedAt"), qs(project.updated_at));
    return o;
}

Project project_from_json(const QJsonObject& obj, FieldReader& outer) {
    FieldReader reader(obj);
    Project project{
        .created_at = reader.string("createdAt"),
        .updated_at = reader.string("updatedAt"),
    };
    if (!reader.ok()) outer.flag("project");
    return project;
}

QJsonObject item_to_json(const Item& item) {
    QJsonObject o;
    o.insert(QStringLiteral("id"), qs(item.id));
    o.insert(QStringLiteral("label"), qs(item.label));
    o.insert(QStringLiteral("notes"), qs(item.notes));
    o.insert(QStringLiteral("tags"), strings_to_json(item.tags));
    o.insert(QStringLiteral("color"), qs(item_color_to_string(item.color)));
    o.insert(QStringLiteral("duration"), item.duration);
    if (item.waveform) o.insert(QStringLiteral("waveform"), waveform_to_json(*item.waveform));
    if (item.transcript) {
        o.insert(QStringLiteral("transcript"), transcript_to_json(*item.transcript));
    }
    o.insert(QStringLiteral("createdAt"), qs(item.created_at));
    o.insert(QStringLiteral("updatedAt"), qs(item.updated_at));
    o.insert(QStringLiteral("order"), item.order);
    return o;
}

Item item_from_json(const QJsonObject& obj, FieldReader& outer, const char* key) {
    FieldReader reader(obj);
    Item item;
    item.id = reader.string("id");
    item.label = reader.string("label");
    item.notes = reader.string("notes");
    item.tags = strings_from_json(reader.array("tags"), reader, "tags");
    item.color = color_from(reader, "color");
    item.duration = reader.number("duration");
    item.waveform = waveform_from(reader);
    item.transcript = transcript_from(reader);
    item.created_at = reader.string("createdAt");
    item.updated_at = reader.string("updatedAt");
    item.order = reader.integer("order");
    if (!reader.ok()) {
        outer.flag(key);
    }
    return item;
}

// ---------------------------------------------------------------------------
// Per-type body codecs
// ---------------------------------------------------------------------------

void write_body(QJsonObject& o, const SyncRequest& m) {
    o.insert(QStringLiteral("project"), project_to_json(m.project));
    QJsonArray items;
    for (const auto& meta : m.items) {
        auto item = item_to_json(meta.item);
        item.insert(QStringLiteral("payloadSize"), static_cast<qint64>(meta.payload_size));
        items.append(item);
    }
    o.insert(QStringLiteral("items"), items);
    o.insert(QStringLiteral("totalBytes"), static_cast<qint64>(m.total_bytes));
}

void write_body(QJsonObject&, const SyncAccept&) {}

void write_body(QJsonObject& o, const SyncReject& m) {
    o.insert(QStringLiteral("reason"), qs(m.reason));
}

void write_body(QJsonObject& o, const ChunkStart& m) {
    o.insert(QStringLiteral("itemId"), qs(m.item_id));
    o.insert(QStringLiteral("itemIndex"), static_cast<qint64>(m.item_index));
    o.insert(QStringLiteral("totalFrames"), static_cast<qint64>(m.total_frames));
    o.insert(QStringLiteral("size"), static_cast<qint64>(m.size));
}

void write_body(QJsonObject& o, const ChunkComplete& m) {
    o.insert(QStringLiteral("itemId"), qs(m.item_id));
    o.insert(QStringLiteral("itemIndex"), static_cast<qint64>(m.item_index));
}

void write_body(QJsonObject& o, const SyncComplete& m) {
    o.insert(QStringLiteral("totalItems"), static_cast<qint64>(m.total_items));
    o.insert(QStringLiteral("totalBytes"), static_cast<qint64>(m.total_bytes));
}

void write_body(QJsonObject& o, const SyncFailed& m) {
    o.insert(QStringLiteral("error"), qs(m.error));
}

void write_body(QJsonObject& o, const OpCreate& m) {
    o.insert(QStringLiteral("item"), item_to_json(m.item));
    o.insert(QStringLiteral("payloadSize"), static_cast<qint64>(m.payload_size));
}

void write_body(QJsonObject& o, const OpUpdate& m) {
    o.insert(QStringLiteral("itemId"), qs(m.item_id));
    QJsonObject changes;
    if (m.changes.label) changes.insert(QStringLiteral("label"), qs(*m.changes.label));
    if (m.changes.notes) changes.insert(QStringLiteral("notes"), qs(*m.changes.notes));
    if (m.changes.tags) changes.insert(QStringLiteral("tags"), strings_to_json(*m.changes.tags));
    if (m.changes.color) {
        changes.insert(QStringLiteral("color"), qs(item_color_to_string(*m.changes.color)));
    }
    o.insert(QStringLiteral("changes"), changes);
}

void write_body(QJsonObject& o, const OpDelete& m) {
    o.insert(QStringLiteral("itemId"), qs(m.item_id));
}

void write_body(QJsonObject& o, const OpReorder& m) {
    QJsonArray order;
    for (const auto& entry : m.order) {
        QJsonObject e;
        e.insert(QStringLiteral("id"), qs(entry.id));
        e.insert(QStringLiteral("order"), entry.order);
        order.append(e);
    }
    o.insert(QStringLiteral("order"), order);
}

void write_body(QJsonObject& o, const OpPayloadChange& m) {
    o.insert(QStringLiteral("itemId"), qs(m.item_id));
    o.insert(QStringLiteral("duration"), m.metadata.duration);
    if (m.metadata.waveform) {
        o.insert(QStringLiteral("waveform"), waveform_to_json(*m.metadata.waveform));
    }
    if (m.metadata.transcript) {
        o.insert(QStringLiteral("transcript"), transcript_to_json(*m.metadata.transcript));
    }
    o.insert(QStringLiteral("payloadSize"), static_cast<qint64>(m.payload_size));
}

void write_body(QJsonObject& o, const RoleRequest& m) {
    if (m.reason) o.insert(QStringLiteral("reason"), qs(*m.reason));
}

void write_body(QJsonObject&, const RoleGrant&) {}

void write_body(QJsonObject& o, const RoleDeny& m) {
    if (m.reason) o.insert(QStringLiteral("reason"), qs(*m.reason));
}

void write_body(QJsonObject&, const RoleTransferComplete&) {}
void write_body(QJsonObject&, const HeartbeatPing&) {}

void write_body(QJsonObject& o, const HeartbeatPong& m) {
    o.insert(QStringLiteral("pingId"), qs(m.ping_id));
}

void write_body(QJsonObject& o, const Disconnect& m) {
    o.insert(QStringLiteral("reason"), qs(disconnectReasonName(m.reason)));
}

using BodyParser = std::function<MessageBody(const QJsonObject&, FieldReader&)>;

struct TypeEntry {
    std::string_view name;
    BodyParser parse;
};

const std::vector<TypeEntry>& type_table() {
    static const std::vector<TypeEntry> table = {
        {"sync_request", [](const QJsonObject&, FieldReader& r) -> MessageBody {
            SyncRequest m;
            m.project = project_from_json(r.object("project"), r);
            for (const auto& v : r.array("items")) {
                if (!v.isObject()) {
                    r.flag("items");
                    break;
                }
                const auto obj = v.toObject();
                FieldReader item_reader(obj);
                ItemMetadata meta;
                meta.item = item_from_json(obj, r, "items");
                meta.payload_size = item_reader.u64("payloadSize");
                if (!item_reader.ok()) r.flag("items");
                m.items.push_back(std::move(meta));
            }
            m.total_bytes = r.u64("totalBytes");
            return m;
        }},
        {"sync_accept", [](const QJsonObject&, FieldReader&) -> MessageBody {
            return SyncAccept{};
        }},
        {"sync_reject", [](const QJsonObject&, FieldReader& r) -> MessageBody {
            return SyncReject{.reason = r.optional_string("reason").value_or(std::string{})};
        }},
        {"chunk_start", [](const QJsonObject&, FieldReader& r) -> MessageBody {
            ChunkStart m;
            m.item_id = r.string("itemId");
            m.item_index = r.u32("itemIndex");
            m.total_frames = r.u32("totalFrames");
            m.size = r.u64("size");
            return m;
        }},
        {"chunk_complete", [](const QJsonObject&, FieldReader& r) -> MessageBody {
            ChunkComplete m;
            m.item_id = r.string("itemId");
            m.item_index = r.u32("itemIndex");
            return m;
        }},
        {"sync_complete", [](const QJsonObject&, FieldReader& r) -> MessageBody {
            SyncComplete m;
            m.total_items = r.u32("totalItems");
            m.total_bytes = r.u64("totalBytes");
            return m;
        }},
        {"sync_error", [](const QJsonObject&, FieldReader& r) -> MessageBody {
            return SyncFailed{.error = r.string("error")};
        }},
        {"op_create", [](const QJsonObject&, FieldReader& r) -> MessageBody {
            OpCreate m;
            m.item = item_from_json(r.object("item"), r, "item");
            m.payload_size = r.has("payloadSize") ? r.u64("payloadSize") : 0;
            return m;
        }},
        {"op_update", [](const QJsonObject&, FieldReader& r) -> MessageBody {
            OpUpdate m;
            m.item_id = r.string("itemId");
            const auto changes_obj = r.object("changes");
            FieldReader c(changes_obj);
            m.changes.label = c.optional_string("label");
            m.changes.notes = c.optional_string("notes");
            if (c.has("tags")) m.changes.tags = strings_from_json(c.array("tags"), c, "tags");
            if (c.has("color")) m.changes.color = color_from(c, "color");
            if (!c.ok()) r.flag("changes");
            return m;
        }},
        {"op_delete", [](const QJsonObject&, FieldReader& r) -> MessageBody {
            return OpDelete{.item_id = r.string("itemId")};
        }},
        {"op_reorder", [](const QJsonObject&, FieldReader& r) -> MessageBody {
            OpReorder m;
            for (const auto& v : r.array("order")) {
                const auto entry_obj = v.toObject();
                FieldReader e(entry_obj);
                ItemOrder entry{.id = e.string("id"), .order = e.integer("order")};
                if (!v.isObject() || !e.ok()) {
                    r.flag("order");
                    break;
                }
                m.order.push_back(std::move(entry));
            }
            return m;
        }},
        {"op_audio_change", [](const QJsonObject&, FieldReader& r) -> MessageBody {
            OpPayloadChange m;
            m.item_id = r.string("itemId");
            m.metadata.duration = r.number("duration");
            m.metadata.waveform = waveform_from(r);
            m.metadata.transcript = transcript_from(r);
            m.payload_size = r.u64("payloadSize");
            return m;
        }},
        {"role_request", [](const QJsonObject&, FieldReader& r) -> MessageBody {
            return RoleRequest{.reason = r.optional_string("reason")};
        }},
        {"role_grant", [](const QJsonObject&, FieldReader&) -> MessageBody {
            return RoleGrant{};
        }},
        {"role_deny", [](const QJsonObject&, FieldReader& r) -> MessageBody {
            return RoleDeny{.reason = r.optional_string("reason")};
        }},
        {"role_transfer_complete", [](const QJsonObject&, FieldReader&) -> MessageBody {
            return RoleTransferComplete{};
        }},
        {"heartbeat_ping", [](const QJsonObject&, FieldReader&) -> MessageBody {
            return HeartbeatPing{};
        }},
        {"heartbeat_pong", [](const QJsonObject&, FieldReader& r) -> MessageBody {
            return HeartbeatPong{.ping_id = r.optional_string("pingId").value_or(std::string{})};
        }},
        {"disconnect", [](const QJsonObject&, FieldReader& r) -> MessageBody {
            const auto reason = r.optional_string("reason").value_or("user_initiated");
            return Disconnect{.reason = reason == "error" ? DisconnectReason::Error
                                                          : DisconnectReason::UserInitiated};
        }},
    };
    return table;
}

} // namespace

std::string_view ControlMessage::type() const noexcept {
    return std::visit(overloaded{
        [](const SyncRequest&) -> std::string_view { return "sync_request"; },
        [](const SyncAccept&) -> std::string_view { return "sync_accept"; },
        [](const SyncReject&) -> std::string_view { return "sync_reject"; },
        [](const ChunkStart&) -> std::string_view { return "chunk_start"; },
        [](const ChunkComplete&) -> std::string_view { return "chunk_complete"; },
        [](const SyncComplete&) -> std::string_view { return "sync_complete"; },
        [](const SyncFailed&) -> std::string_view { return "sync_error"; },
        [](const OpCreate&) -> std::string_view { return "op_create"; },
        [](const OpUpdate&) -> std::string_view { return "op_update"; },
        [](const OpDelete&) -> std::string_view { return "op_delete"; },
        [](const OpReorder&) -> std::string_view { return "op_reorder"; },
        [](const OpPayloadChange&) -> std::string_view { return "op_audio_change"; },
        [](const RoleRequest&) -> std::string_view { return "role_request"; },
        [](const RoleGrant&) -> std::string_view { return "role_grant"; },
        [](const RoleDeny&) -> std::string_view { return "role_deny"; },
        [](const RoleTransferComplete&) -> std::string_view { return "role_transfer_complete"; },
        [](const HeartbeatPing&) -> std::string_view { return "heartbeat_ping"; },
        [](const HeartbeatPong&) -> std::string_view { return "heartbeat_pong"; },
        [](const Disconnect&) -> std::string_view { return "disconnect"; },
    }, body);
}

ControlMessage makeMessage(MessageBody body) {
    return ControlMessage{
        .id = Uuid::generate().to_string(),
        .timestamp = Timestamp::now().millis(),
        .body = std::move(body),
    };
}

std::string_view disconnectReasonName(DisconnectReason reason) noexcept {
    switch (reason) {
        case DisconnectReason::UserInitiated: return "user_initiated";
        case DisconnectReason::Error: return "error";
    }
    return "user_initiated";
}

QByteArray encodeMessage(const ControlMessage& message) {
    QJsonObject o;
    o.insert(QStringLiteral("type"), qs(message.type()));
    o.insert(QStringLiteral("id"), qs(message.id));
    o.insert(QStringLiteral("timestamp"), static_cast<qint64>(message.timestamp));
    std::visit([&o](const auto& body) { write_body(o, body); }, message.body);
    return QJsonDocument(o).toJson(QJsonDocument::Compact);
}

Result<ControlMessage> decodeMessage(const QByteArray& bytes) {
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(bytes, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return fail<ControlMessage>(ErrorCode::ProtocolViolation,
                                    "Malformed control message: " +
                                        parse_error.errorString().toStdString());
    }

    const auto obj = doc.object();
    FieldReader reader(obj);
    const auto type = reader.string("type");
    const auto id = reader.string("id");
    const auto timestamp = static_cast<int64_t>(reader.number("timestamp"));
    if (!reader.ok()) {
        return fail<ControlMessage>(ErrorCode::ProtocolViolation,
                                    "Control message missing field '" + reader.bad_field() + "'");
    }

    for (const auto& entry : type_table()) {
        if (entry.name != type) continue;
        auto body = entry.parse(obj, reader);
        if (!reader.ok()) {
            return fail<ControlMessage>(ErrorCode::ProtocolViolation,
                                        type + ": missing or invalid field '" +
                                            reader.bad_field() + "'");
        }
        return Result<ControlMessage>::ok(ControlMessage{
            .id = id,
            .timestamp = timestamp,
            .body = std::move(body),
        });
    }

    return fail<ControlMessage>(ErrorCode::ProtocolViolation,
                                "Unknown control message type '" + type + "'");
}

} // namespace tandem::network
