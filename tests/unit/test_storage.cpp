#include <catch2/catch_test_macros.hpp>
#include "core/item.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/project_repository.hpp"

using namespace tandem;
using namespace tandem::storage;

namespace {

Item makeItem(const std::string& id, const std::string& label, int order) {
    Item item = create_item(label, order);
    item.id = id;
    return item;
}

} // namespace

TEST_CASE("Database basic operations", "[storage]") {
    auto db_result = Database::open_memory();
    REQUIRE(db_result.is_ok());
    auto db = std::move(db_result).unwrap();

    SECTION("Execute creates table") {
        auto result = db.execute("CREATE TABLE test (id INTEGER PRIMARY KEY);");
        REQUIRE(result.is_ok());
    }

    SECTION("Prepare and step") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1, 'Alice');").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (2, 'Bob');").is_ok());

        auto stmt = db.prepare("SELECT * FROM test ORDER BY id;").unwrap();

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_text(1) == "Alice");

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 2);
        REQUIRE(stmt.column_text(1) == "Bob");

        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("Blobs keep embedded zero bytes") {
        REQUIRE(db.execute("CREATE TABLE blobs (data BLOB);").is_ok());
        const Bytes data{0x00, 0x01, 0x00, 0xFF};
        auto insert = db.prepare("INSERT INTO blobs VALUES (?);").unwrap();
        REQUIRE(insert.bind_blob(1, data).is_ok());
        REQUIRE(insert.step().is_ok());

        auto select = db.prepare("SELECT data FROM blobs;").unwrap();
        REQUIRE(select.step().unwrap());
        REQUIRE(select.column_blob(0) == data);
    }

    SECTION("Transaction commit") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());

        auto result = db.transaction([&]() -> Result<void> {
            return db.execute("INSERT INTO test VALUES (1);").and_then([&]() {
                return db.execute("INSERT INTO test VALUES (2);");
            });
        });
        REQUIRE(result.is_ok());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 2);
    }

    SECTION("Transaction rollback on error") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1);").is_ok());

        auto result = db.transaction([&]() -> Result<void> {
            REQUIRE(db.execute("INSERT INTO test VALUES (2);").is_ok());
            return fail(ErrorCode::Storage, "Intentional error");
        });
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().message == "Intentional error");

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 1);
    }

    SECTION("SQL errors carry the storage category") {
        auto result = db.execute("SELECT * FROM missing_table;");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::Storage);
    }
}

TEST_CASE("Migrations", "[storage][migrations]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    REQUIRE(runner.current_version().unwrap() == 0);
    REQUIRE(runner.migrate().is_ok());
    REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());

    SECTION("Migrating again is a no-op") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    }

    SECTION("Rollback removes the schema") {
        REQUIRE(runner.rollback_to(0).is_ok());
        REQUIRE(runner.current_version().unwrap() == 0);
        REQUIRE(db.execute("SELECT * FROM items;").is_err());
    }
}

TEST_CASE("ProjectRepository", "[storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    ProjectRepository repo(db);

    SECTION("Project metadata is absent until saved") {
        REQUIRE_FALSE(repo.load_project().unwrap().has_value());

        auto project = create_project();
        REQUIRE(repo.save_project(project).is_ok());
        REQUIRE(repo.load_project().unwrap() == std::optional<Project>(project));
    }

    SECTION("Items keep every field") {
        auto item = makeItem("a", "Take 1", 0);
        item.notes = "notes";
        item.tags = {"x", "y"};
        item.color = ItemColor::Purple;
        item.duration = 3.25;
        item.waveform = std::vector<double>{0.25, 0.75};
        item.transcript = std::vector<TranscriptSegment>{{.start = 0.0, .end = 1.0, .text = "hi"}};
        REQUIRE(repo.save_item(item).is_ok());

        auto loaded = repo.load_item("a").unwrap();
        REQUIRE(loaded.has_value());
        REQUIRE(*loaded == item);
    }

    SECTION("Saving an existing id replaces the item") {
        REQUIRE(repo.save_item(makeItem("a", "old", 0)).is_ok());
        REQUIRE(repo.save_item(makeItem("a", "new", 0)).is_ok());
        REQUIRE(repo.load_items().unwrap().size() == 1);
        REQUIRE(repo.load_item("a").unwrap()->label == "new");
    }

    SECTION("Items are listed by order") {
        REQUIRE(repo.save_item(makeItem("c", "third", 2)).is_ok());
        REQUIRE(repo.save_item(makeItem("a", "first", 0)).is_ok());
        REQUIRE(repo.save_item(makeItem("b", "second", 1)).is_ok());

        auto items = repo.load_items().unwrap();
        REQUIRE(items.size() == 3);
        REQUIRE(items[0].id == "a");
        REQUIRE(items[1].id == "b");
        REQUIRE(items[2].id == "c");
    }

    SECTION("Items without an id are rejected") {
        REQUIRE(repo.save_item(makeItem("", "nameless", 0)).is_err());
    }

    SECTION("Payloads are stored by item id") {
        REQUIRE(repo.save_item(makeItem("a", "with audio", 0)).is_ok());
        REQUIRE(repo.payload_size("a").unwrap() == 0);
        REQUIRE_FALSE(repo.load_payload("a").unwrap().has_value());

        Bytes payload(50000);
        for (size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<uint8_t>(i);
        REQUIRE(repo.save_payload("a", payload).is_ok());
        REQUIRE(repo.payload_size("a").unwrap() == 50000);
        REQUIRE(*repo.load_payload("a").unwrap() == payload);
    }

    SECTION("A payload may be stored before its item exists") {
        REQUIRE(repo.save_payload("later", Bytes{1, 2, 3}).is_ok());
        REQUIRE(repo.payload_size("later").unwrap() == 3);
    }

    SECTION("Removing an item removes its payload") {
        REQUIRE(repo.save_item(makeItem("a", "doomed", 0)).is_ok());
        REQUIRE(repo.save_payload("a", Bytes{1, 2, 3}).is_ok());

        REQUIRE(repo.remove_item("a").is_ok());
        REQUIRE_FALSE(repo.load_item("a").unwrap().has_value());
        REQUIRE_FALSE(repo.load_payload("a").unwrap().has_value());

        // Unknown ids are not an error.
        REQUIRE(repo.remove_item("never-existed").is_ok());
    }

    SECTION("replace_all installs exactly the snapshot") {
        REQUIRE(repo.save_item(makeItem("old", "stale", 0)).is_ok());
        REQUIRE(repo.save_payload("old", Bytes{9}).is_ok());

        ProjectSnapshot snapshot;
        snapshot.project = create_project();
        snapshot.items = {makeItem("x", "one", 0), makeItem("y", "two", 1)};
        snapshot.payloads["y"] = Bytes{4, 5, 6};

        REQUIRE(repo.replace_all(snapshot).is_ok());

        REQUIRE(repo.load_project().unwrap() == std::optional<Project>(snapshot.project));
        auto items = repo.load_items().unwrap();
        REQUIRE(items == snapshot.items);
        REQUIRE_FALSE(repo.load_payload("old").unwrap().has_value());
        REQUIRE(*repo.load_payload("y").unwrap() == Bytes{4, 5, 6});
        REQUIRE_FALSE(repo.load_payload("x").unwrap().has_value());
    }
}
