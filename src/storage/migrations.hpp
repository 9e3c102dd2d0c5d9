#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace weave::storage {

/**
 * Migration - one forward step of the cache schema.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
};

/**
 * All migrations in order. Append only; never edit a shipped entry.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "room_cache",
        .up_sql = R"SQL(
            -- Latest compacted state per room
            CREATE TABLE IF NOT EXISTS room_snapshots (
                room TEXT PRIMARY KEY,
                snapshot BLOB NOT NULL,
                updated_at INTEGER NOT NULL
            );

            -- Updates appended since the snapshot, replayed in id order
            CREATE TABLE IF NOT EXISTS room_updates (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                room TEXT NOT NULL,
                update_bytes BLOB NOT NULL,
                created_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_room_updates_room ON room_updates(room, id);
        )SQL"
    },
};

/**
 * MigrationRunner - brings a database up to the latest schema inside one
 * transaction, recording applied versions in schema_migrations.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> migrate();
    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
};

/**
 * Open-time helper: run all pending migrations.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace weave::storage
