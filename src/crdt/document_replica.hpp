#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <QMetaType>
#include <QObject>
#include <QString>

namespace weave::crdt {

/**
 * UpdateOrigin - who caused a replica or presence mutation.
 *
 * A SyncTransport tags everything it applies with Remote(its id) and ignores
 * change events carrying that tag, so remote data is never echoed back.
 */
struct UpdateOrigin {
    enum class Source { Local, Remote, Persistence };

    Source source = Source::Local;
    quint64 connection_id = 0;

    [[nodiscard]] static UpdateOrigin local() { return {}; }
    [[nodiscard]] static UpdateOrigin remote(quint64 connection_id) {
        return {Source::Remote, connection_id};
    }
    [[nodiscard]] static UpdateOrigin persistence() { return {Source::Persistence, 0}; }

    [[nodiscard]] bool is_remote() const { return source == Source::Remote; }

    bool operator==(const UpdateOrigin&) const = default;
};

[[nodiscard]] QString describe(const UpdateOrigin& origin);

/**
 * DocumentReplica - the CRDT document of one room, seen through the
 * operations a sync protocol needs.
 *
 * Implementations must make applyUpdate idempotent and commutative; the
 * transport relies on that instead of exactly-once delivery.
 */
class DocumentReplica : public QObject {
    Q_OBJECT

public:
    using QObject::QObject;
    ~DocumentReplica() override = default;

    /**
     * Merge an update produced by encodeUpdate() on any replica of the room.
     * Emits updated(update, origin) when the merge changed local state.
     * An empty update is a no-op.
     */
    virtual Result<void, Error> applyUpdate(const Bytes& update, const UpdateOrigin& origin) = 0;

    /**
     * Update containing everything this replica has that a replica with the
     * given state vector lacks. An empty state vector means "everything".
     */
    [[nodiscard]] virtual Result<Bytes, Error> encodeUpdate(const Bytes& remote_state_vector) const = 0;

    /**
     * Compact summary of what this replica has seen.
     */
    [[nodiscard]] virtual Bytes stateVector() const = 0;

    /**
     * Full state as a single update; used for cache snapshots.
     */
    [[nodiscard]] Bytes encodeStateAsUpdate() const {
        return encodeUpdate(Bytes{}).value_or(Bytes{});
    }

signals:
    void updated(const weave::Bytes& update, const weave::crdt::UpdateOrigin& origin);
};

} // namespace weave::crdt

Q_DECLARE_METATYPE(weave::crdt::UpdateOrigin)
