#include "storage/document_store.hpp"

namespace weave::storage {

namespace {

Error persistence(const Error& e) {
    return Error{"cache: " + e.message, ErrorCode::Persistence};
}

template<typename T>
Result<T, Error> fail(const Error& e) {
    return Result<T, Error>::err(persistence(e));
}

} // namespace

Result<std::optional<RoomSnapshot>, Error> DocumentStore::get_snapshot(const std::string& room) {
    using R = Result<std::optional<RoomSnapshot>, Error>;
    auto stmt_result = db_.prepare(R"SQL(
        SELECT room, snapshot, updated_at FROM room_snapshots WHERE room = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return fail<std::optional<RoomSnapshot>>(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, room);
    if (bound.is_err()) {
        return fail<std::optional<RoomSnapshot>>(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return fail<std::optional<RoomSnapshot>>(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return R::ok(std::nullopt);
    }
    return R::ok(RoomSnapshot{
        .room = stmt.column_text(0),
        .snapshot = stmt.column_blob(1),
        .updated_at = Timestamp(stmt.column_int64(2))
    });
}

Result<void, Error> DocumentStore::write_snapshot(const std::string& room, const Bytes& snapshot) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO room_snapshots (room, snapshot, updated_at)
        VALUES (?, ?, ?)
        ON CONFLICT(room) DO UPDATE SET
            snapshot = excluded.snapshot,
            updated_at = excluded.updated_at;
    )SQL");
    if (stmt_result.is_err()) {
        return fail<void>(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, room)
        .and_then([&] { return stmt.bind_blob(2, snapshot); })
        .and_then([&] { return stmt.bind_int64(3, Timestamp::now().millis()); });
    if (bound.is_err()) {
        return fail<void>(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return fail<void>(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> DocumentStore::delete_updates(const std::string& room) {
    auto stmt_result = db_.prepare("DELETE FROM room_updates WHERE room = ?;");
    if (stmt_result.is_err()) {
        return fail<void>(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, room);
    if (bound.is_err()) {
        return fail<void>(bound.unwrap_err());
    }
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return fail<void>(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> DocumentStore::save_snapshot(const std::string& room, const Bytes& snapshot) {
    return write_snapshot(room, snapshot);
}

Result<int64_t, Error> DocumentStore::append_update(const std::string& room, const Bytes& update) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO room_updates (room, update_bytes, created_at) VALUES (?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return fail<int64_t>(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, room)
        .and_then([&] { return stmt.bind_blob(2, update); })
        .and_then([&] { return stmt.bind_int64(3, Timestamp::now().millis()); });
    if (bound.is_err()) {
        return fail<int64_t>(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return fail<int64_t>(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(sqlite3_last_insert_rowid(sqlite3_db_handle(stmt.get())));
}

Result<std::vector<RoomUpdate>, Error> DocumentStore::get_updates(const std::string& room) {
    auto stmt_result = db_.prepare(R"SQL(
        SELECT id, room, update_bytes, created_at
        FROM room_updates WHERE room = ? ORDER BY id ASC;
    )SQL");
    if (stmt_result.is_err()) {
        return fail<std::vector<RoomUpdate>>(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, room);
    if (bound.is_err()) {
        return fail<std::vector<RoomUpdate>>(bound.unwrap_err());
    }

    std::vector<RoomUpdate> updates;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return fail<std::vector<RoomUpdate>>(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        updates.push_back(RoomUpdate{
            .id = stmt.column_int64(0),
            .room = stmt.column_text(1),
            .update_bytes = stmt.column_blob(2),
            .created_at = Timestamp(stmt.column_int64(3))
        });
    }
    return Result<std::vector<RoomUpdate>, Error>::ok(std::move(updates));
}

Result<int64_t, Error> DocumentStore::count_updates(const std::string& room) {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM room_updates WHERE room = ?;");
    if (stmt_result.is_err()) {
        return fail<int64_t>(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, room);
    if (bound.is_err()) {
        return fail<int64_t>(bound.unwrap_err());
    }
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return fail<int64_t>(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

Result<std::vector<Bytes>, Error> DocumentStore::load(const std::string& room) {
    auto snapshot = get_snapshot(room);
    if (snapshot.is_err()) {
        return Result<std::vector<Bytes>, Error>::err(snapshot.unwrap_err());
    }
    auto updates = get_updates(room);
    if (updates.is_err()) {
        return Result<std::vector<Bytes>, Error>::err(updates.unwrap_err());
    }

    std::vector<Bytes> out;
    if (snapshot.unwrap()) {
        out.push_back(snapshot.unwrap()->snapshot);
    }
    for (auto& u : std::move(updates).unwrap()) {
        out.push_back(std::move(u.update_bytes));
    }
    return Result<std::vector<Bytes>, Error>::ok(std::move(out));
}

Result<void, Error> DocumentStore::compact(const std::string& room, const Bytes& snapshot) {
    return db_.transaction([&]() -> Result<void, Error> {
        return write_snapshot(room, snapshot).and_then([&] { return delete_updates(room); });
    });
}

Result<void, Error> DocumentStore::clear(const std::string& room) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto stmt_result = db_.prepare("DELETE FROM room_snapshots WHERE room = ?;");
        if (stmt_result.is_err()) {
            return fail<void>(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        auto bound = stmt.bind_text(1, room);
        if (bound.is_err()) {
            return fail<void>(bound.unwrap_err());
        }
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return fail<void>(step_result.unwrap_err());
        }
        return delete_updates(room);
    });
}

} // namespace weave::storage
