#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace tandem::storage {

/**
 * Migration - A database schema migration.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "initial_schema",
        .up_sql = R"SQL(
            -- Singleton project record
            CREATE TABLE IF NOT EXISTS project (
                id INTEGER PRIMARY KEY CHECK (id = 1),
                created_at TEXT NOT NULL,
                updated_at TEXT NOT NULL
            );

            -- Items; list-valued fields are stored as JSON
            CREATE TABLE IF NOT EXISTS items (
                id TEXT PRIMARY KEY,
                label TEXT NOT NULL DEFAULT '',
                notes TEXT NOT NULL DEFAULT '',
                tags_json TEXT NOT NULL DEFAULT '[]',
                color TEXT NOT NULL DEFAULT 'neutral',
                duration REAL NOT NULL DEFAULT 0,
                waveform_json TEXT,
                transcript_json TEXT,
                created_at TEXT NOT NULL,
                updated_at TEXT NOT NULL,
                sort_order INTEGER NOT NULL DEFAULT 0
            );
            CREATE INDEX IF NOT EXISTS idx_items_order ON items(sort_order);

            -- Binary payloads keyed by item id; a payload may arrive before its item
            CREATE TABLE IF NOT EXISTS payloads (
                item_id TEXT PRIMARY KEY,
                data BLOB NOT NULL
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS payloads;
            DROP TABLE IF EXISTS items;
            DROP TABLE IF EXISTS project;
        )SQL"
    }
};

/**
 * MigrationRunner - Runs database migrations.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Run all pending migrations.
     */
    [[nodiscard]] Result<void> migrate();

    [[nodiscard]] Result<void> migrate_to(int target_version);

    /**
     * Rollback to a specific version.
     */
    [[nodiscard]] Result<void> rollback_to(int target_version);

    [[nodiscard]] Result<int> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void> ensure_migrations_table();
    [[nodiscard]] Result<void> run_migration(const Migration& m);
    [[nodiscard]] Result<void> run_rollback(const Migration& m);
    [[nodiscard]] Result<void> set_version(const Migration& m);
};

/**
 * Initialize a database with all migrations.
 */
[[nodiscard]] inline Result<void> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace tandem::storage
