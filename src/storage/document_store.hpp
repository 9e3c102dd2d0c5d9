#pragma once

#include "storage/database.hpp"
#include "core/types.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace weave::storage {

/**
 * RoomSnapshot - compacted replica state of one room.
 */
struct RoomSnapshot {
    std::string room;
    Bytes snapshot;
    Timestamp updated_at;
};

/**
 * RoomUpdate - an update appended after the snapshot.
 */
struct RoomUpdate {
    int64_t id;
    std::string room;
    Bytes update_bytes;
    Timestamp created_at;
};

/**
 * DocumentStore - data access for cached room state.
 *
 * A room's state is its snapshot (if any) followed by its updates in id
 * order. Every error leaves this class tagged ErrorCode::Persistence.
 */
class DocumentStore {
public:
    explicit DocumentStore(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<RoomSnapshot>, Error> get_snapshot(const std::string& room);
    [[nodiscard]] Result<void, Error> save_snapshot(const std::string& room, const Bytes& snapshot);

    [[nodiscard]] Result<int64_t, Error> append_update(const std::string& room, const Bytes& update);
    [[nodiscard]] Result<std::vector<RoomUpdate>, Error> get_updates(const std::string& room);
    [[nodiscard]] Result<int64_t, Error> count_updates(const std::string& room);

    /**
     * Snapshot followed by updates, oldest first. Empty when nothing is cached.
     */
    [[nodiscard]] Result<std::vector<Bytes>, Error> load(const std::string& room);

    /**
     * Replace snapshot and updates by one snapshot, atomically.
     */
    [[nodiscard]] Result<void, Error> compact(const std::string& room, const Bytes& snapshot);

    [[nodiscard]] Result<void, Error> clear(const std::string& room);

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> write_snapshot(const std::string& room, const Bytes& snapshot);
    [[nodiscard]] Result<void, Error> delete_updates(const std::string& room);
};

} // namespace weave::storage
