#pragma once

#include "crdt/document_replica.hpp"
#include "storage/database.hpp"
#include "storage/document_store.hpp"

#include <QObject>
#include <QPointer>
#include <QString>
#include <QTimer>

#include <memory>
#include <optional>
#include <vector>

namespace weave::storage {

/**
 * DocumentCache - durable local copy of one room's replica.
 *
 * hydrate() replays the cached state into the replica (origin Persistence)
 * and then emits synced(); the transport holds its first handshake until
 * then so the handshake only exchanges a delta. After hydration every
 * non-persistence update is appended asynchronously, coalesced on a
 * zero-delay timer, and the room is compacted once the update log reaches
 * the trim threshold.
 *
 * Storage failures never block editing: they are logged, reported through
 * errorOccurred(), and the cache degrades to network-only. synced() is still
 * emitted in that case.
 */
class DocumentCache : public QObject {
    Q_OBJECT

public:
    struct Options {
        int trim_threshold = 500;
    };

    DocumentCache(std::string room, crdt::DocumentReplica* replica,
                  Options options, QObject* parent = nullptr);
    ~DocumentCache() override;

    /**
     * Open (creating and migrating) the cache file. On failure the cache
     * stays network-only and the error is returned for the caller to log.
     */
    Result<void, Error> open(const std::string& path);

    /**
     * Adopt an already-open database (tests use in-memory ones).
     */
    Result<void, Error> open(Database db);

    void hydrate();

    [[nodiscard]] bool isSynced() const { return synced_; }
    [[nodiscard]] bool isPersistent() const { return store_ != nullptr; }
    [[nodiscard]] const std::string& room() const { return room_; }
    [[nodiscard]] size_t pendingWrites() const { return pending_.size(); }

    /**
     * Write queued updates now instead of on the next event loop turn.
     */
    void flush();

    /**
     * Remove everything cached for the room.
     */
    Result<void, Error> clearData();

signals:
    void synced();
    void errorOccurred(const QString& message);

private:
    void onReplicaUpdated(const Bytes& update, const crdt::UpdateOrigin& origin);
    void fail(const Error& error);

    std::string room_;
    QPointer<crdt::DocumentReplica> replica_;
    Options options_;
    std::optional<Database> db_;
    std::unique_ptr<DocumentStore> store_;
    std::vector<Bytes> pending_;
    QTimer flush_timer_;
    bool synced_ = false;
};

} // namespace weave::storage
