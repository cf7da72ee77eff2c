#include "storage/project_repository.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>

namespace tandem::storage {

namespace {

constexpr const char* kItemColumns = R"SQL(
    SELECT id, label, notes, tags_json, color, duration, waveform_json,
           transcript_json, created_at, updated_at, sort_order
    FROM items
)SQL";

std::string to_json_text(const QJsonArray& arr) {
    return QJsonDocument(arr).toJson(QJsonDocument::Compact).toStdString();
}

QJsonArray from_json_text(const std::string& text) {
    return QJsonDocument::fromJson(QByteArray::fromStdString(text)).array();
}

std::string tags_to_json(const std::vector<std::string>& tags) {
    QJsonArray arr;
    for (const auto& tag : tags) {
        arr.append(QString::fromStdString(tag));
    }
    return to_json_text(arr);
}

std::vector<std::string> tags_from_json(const std::string& text) {
    std::vector<std::string> tags;
    for (const auto& v : from_json_text(text)) {
        tags.push_back(v.toString().toStdString());
    }
    return tags;
}

std::string waveform_to_json(const std::vector<double>& waveform) {
    QJsonArray arr;
    for (double sample : waveform) {
        arr.append(sample);
    }
    return to_json_text(arr);
}

std::vector<double> waveform_from_json(const std::string& text) {
    std::vector<double> waveform;
    for (const auto& v : from_json_text(text)) {
        waveform.push_back(v.toDouble());
    }
    return waveform;
}

std::string transcript_to_json(const std::vector<TranscriptSegment>& segments) {
    QJsonArray arr;
    for (const auto& segment : segments) {
        arr.append(QJsonObject{
            {"start", segment.start},
            {"end", segment.end},
            {"text", QString::fromStdString(segment.text)},
        });
    }
    return to_json_text(arr);
}

std::vector<TranscriptSegment> transcript_from_json(const std::string& text) {
    std::vector<TranscriptSegment> segments;
    for (const auto& v : from_json_text(text)) {
        const auto obj = v.toObject();
        segments.push_back(TranscriptSegment{
            .start = obj.value("start").toDouble(),
            .end = obj.value("end").toDouble(),
            .text = obj.value("text").toString().toStdString(),
        });
    }
    return segments;
}

template<typename T>
Result<T> step_error(const Result<bool>& step) {
    return Result<T>::err(step.unwrap_err());
}

} // namespace

Item ProjectRepository::row_to_item(Statement& stmt) {
    Item item;
    item.id = stmt.column_text(0);
    item.label = stmt.column_text(1);
    item.notes = stmt.column_text(2);
    item.tags = tags_from_json(stmt.column_text(3));
    item.color = item_color_from_string(stmt.column_text(4)).value_or(ItemColor::Neutral);
    item.duration = stmt.column_double(5);
    if (!stmt.column_is_null(6)) {
        item.waveform = waveform_from_json(stmt.column_text(6));
    }
    if (!stmt.column_is_null(7)) {
        item.transcript = transcript_from_json(stmt.column_text(7));
    }
    item.created_at = stmt.column_text(8);
    item.updated_at = stmt.column_text(9);
    item.order = stmt.column_int(10);
    return item;
}

// ============================================================================
// Project
// ============================================================================

Result<std::optional<Project>> ProjectRepository::load_project() {
    auto stmt_result = db_.prepare("SELECT created_at, updated_at FROM project WHERE id = 1;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Project>>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return step_error<std::optional<Project>>(step_result);
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Project>>::ok(std::nullopt);
    }

    return Result<std::optional<Project>>::ok(Project{
        .created_at = stmt.column_text(0),
        .updated_at = stmt.column_text(1),
    });
}

Result<void> ProjectRepository::save_project(const Project& project) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO project (id, created_at, updated_at) VALUES (1, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            created_at = excluded.created_at,
            updated_at = excluded.updated_at;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, project.created_at)
        .and_then([&] { return stmt.bind_text(2, project.updated_at); });
    if (bound.is_err()) return bound;

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void>::err(step_result.unwrap_err());
    }
    return Result<void>::ok();
}

// ============================================================================
// Items
// ============================================================================

Result<std::vector<Item>> ProjectRepository::load_items() {
    std::vector<Item> items;

    auto stmt_result = db_.prepare(std::string(kItemColumns) + " ORDER BY sort_order, created_at;");
    if (stmt_result.is_err()) {
        return Result<std::vector<Item>>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return step_error<std::vector<Item>>(step_result);
        }
        if (!step_result.unwrap()) break;

        items.push_back(row_to_item(stmt));
    }

    return Result<std::vector<Item>>::ok(std::move(items));
}

Result<std::optional<Item>> ProjectRepository::load_item(const std::string& id) {
    auto stmt_result = db_.prepare(std::string(kItemColumns) + " WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Item>>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, id);
    if (bound.is_err()) {
        return Result<std::optional<Item>>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return step_error<std::optional<Item>>(step_result);
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Item>>::ok(std::nullopt);
    }
    return Result<std::optional<Item>>::ok(row_to_item(stmt));
}

Result<void> ProjectRepository::insert_item(const Item& item) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO items (id, label, notes, tags_json, color, duration, waveform_json,
                           transcript_json, created_at, updated_at, sort_order)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            label = excluded.label,
            notes = excluded.notes,
            tags_json = excluded.tags_json,
            color = excluded.color,
            duration = excluded.duration,
            waveform_json = excluded.waveform_json,
            transcript_json = excluded.transcript_json,
            created_at = excluded.created_at,
            updated_at = excluded.updated_at,
            sort_order = excluded.sort_order;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, item.id)
        .and_then([&] { return stmt.bind_text(2, item.label); })
        .and_then([&] { return stmt.bind_text(3, item.notes); })
        .and_then([&] { return stmt.bind_text(4, tags_to_json(item.tags)); })
        .and_then([&] { return stmt.bind_text(5, item_color_to_string(item.color)); })
        .and_then([&] { return stmt.bind_double(6, item.duration); })
        .and_then([&] {
            return item.waveform ? stmt.bind_text(7, waveform_to_json(*item.waveform))
                                 : stmt.bind_null(7);
        })
        .and_then([&] {
            return item.transcript ? stmt.bind_text(8, transcript_to_json(*item.transcript))
                                   : stmt.bind_null(8);
        })
        .and_then([&] { return stmt.bind_text(9, item.created_at); })
        .and_then([&] { return stmt.bind_text(10, item.updated_at); })
        .and_then([&] { return stmt.bind_int(11, item.order); });
    if (bound.is_err()) return bound;

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void>::err(step_result.unwrap_err());
    }
    return Result<void>::ok();
}

Result<void> ProjectRepository::save_item(const Item& item) {
    if (item.id.empty()) {
        return fail(ErrorCode::Storage, "Cannot save an item without an id");
    }
    return insert_item(item);
}

Result<void> ProjectRepository::remove_item(const std::string& id) {
    return db_.transaction([&]() -> Result<void> {
        for (const char* sql : {"DELETE FROM payloads WHERE item_id = ?;",
                                "DELETE FROM items WHERE id = ?;"}) {
            auto stmt_result = db_.prepare(sql);
            if (stmt_result.is_err()) {
                return Result<void>::err(stmt_result.unwrap_err());
            }
            auto stmt = std::move(stmt_result).unwrap();
            auto bound = stmt.bind_text(1, id);
            if (bound.is_err()) return bound;
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void>::err(step_result.unwrap_err());
            }
        }
        return Result<void>::ok();
    });
}

// ============================================================================
// Payloads
// ============================================================================

Result<std::optional<Bytes>> ProjectRepository::load_payload(const std::string& item_id) {
    auto stmt_result = db_.prepare("SELECT data FROM payloads WHERE item_id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Bytes>>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, item_id);
    if (bound.is_err()) {
        return Result<std::optional<Bytes>>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return step_error<std::optional<Bytes>>(step_result);
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Bytes>>::ok(std::nullopt);
    }
    return Result<std::optional<Bytes>>::ok(stmt.column_blob(0));
}

Result<uint64_t> ProjectRepository::payload_size(const std::string& item_id) {
    auto stmt_result = db_.prepare("SELECT length(data) FROM payloads WHERE item_id = ?;");
    if (stmt_result.is_err()) {
        return Result<uint64_t>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, item_id);
    if (bound.is_err()) {
        return Result<uint64_t>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return step_error<uint64_t>(step_result);
    }
    if (!step_result.unwrap()) {
        return Result<uint64_t>::ok(0);
    }
    return Result<uint64_t>::ok(static_cast<uint64_t>(stmt.column_int64(0)));
}

Result<void> ProjectRepository::insert_payload(const std::string& item_id, const Bytes& data) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO payloads (item_id, data) VALUES (?, ?)
        ON CONFLICT(item_id) DO UPDATE SET data = excluded.data;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, item_id)
        .and_then([&] { return stmt.bind_blob(2, data); });
    if (bound.is_err()) return bound;

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void>::err(step_result.unwrap_err());
    }
    return Result<void>::ok();
}

Result<void> ProjectRepository::save_payload(const std::string& item_id, const Bytes& data) {
    return insert_payload(item_id, data);
}

// ============================================================================
// Snapshot
// ============================================================================

Result<void> ProjectRepository::replace_all(const ProjectSnapshot& snapshot) {
    return db_.transaction([&]() -> Result<void> {
        auto cleared = db_.execute("DELETE FROM payloads; DELETE FROM items; DELETE FROM project;");
        if (cleared.is_err()) return cleared;

        auto saved = save_project(snapshot.project);
        if (saved.is_err()) return saved;

        for (const auto& item : snapshot.items) {
            auto inserted = insert_item(item);
            if (inserted.is_err()) return inserted;
        }
        for (const auto& [item_id, data] : snapshot.payloads) {
            auto inserted = insert_payload(item_id, data);
            if (inserted.is_err()) return inserted;
        }
        return Result<void>::ok();
    });
}

} // namespace tandem::storage
