#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "crdt/document_replica.hpp"

#include <QJsonObject>
#include <QObject>

#include <map>
#include <optional>
#include <vector>

namespace weave::presence {

/**
 * Client ids touched by one presence mutation.
 */
struct PresenceChange {
    std::vector<ClientId> added;
    std::vector<ClientId> updated;
    std::vector<ClientId> removed;

    [[nodiscard]] bool empty() const {
        return added.empty() && updated.empty() && removed.empty();
    }

    // added + updated + removed, in that order.
    [[nodiscard]] std::vector<ClientId> all() const;
};

/**
 * PresenceTable - ephemeral per-client key/value state with last-writer-wins
 * clocks, wire compatible with y-protocols awareness.
 *
 * Every entry has a clock owned by its producer. An inbound entry replaces the
 * stored one when its clock is newer, or when clocks tie and the inbound
 * state is null (removal). A remote null for our own id bumps our clock
 * instead of deleting, so the next broadcast wins.
 *
 * changed() fires only when content changed. updated() fires for every
 * accepted write, including identical re-sends used as heartbeats.
 */
class PresenceTable : public QObject {
    Q_OBJECT

public:
    explicit PresenceTable(ClientId client_id, QObject* parent = nullptr, NowFn now = {});
    ~PresenceTable() override;

    [[nodiscard]] ClientId clientId() const { return client_id_; }

    [[nodiscard]] std::optional<QJsonObject> localState() const;

    /**
     * Replace the local entry. std::nullopt removes it (sent as "null").
     */
    void setLocalState(const std::optional<QJsonObject>& state,
                       const crdt::UpdateOrigin& origin = crdt::UpdateOrigin::local());

    /**
     * Set one field of the local entry. No-op once the local entry was removed.
     */
    void setLocalField(const QString& field, const QJsonValue& value);

    [[nodiscard]] const std::map<ClientId, QJsonObject>& states() const { return states_; }
    [[nodiscard]] std::optional<quint64> clockOf(ClientId client) const;

    /**
     * Ids of every entry other than ours.
     */
    [[nodiscard]] std::vector<ClientId> remoteClientIds() const;

    /**
     * Encode the given entries (absent ones as null) for the wire.
     */
    [[nodiscard]] Bytes encodeUpdate(const std::vector<ClientId>& clients) const;

    /**
     * Encode every known entry; used to answer QueryAwareness and on connect.
     */
    [[nodiscard]] Bytes encodeAll() const;

    /**
     * Encode the given entries as removed at their current clocks, without
     * touching the table. Peers drop an entry on a null state at an equal clock.
     */
    [[nodiscard]] Bytes encodeRemoval(const std::vector<ClientId>& clients) const;

    /**
     * Merge an encoded update. The whole update is decoded before anything
     * is applied, so a malformed update changes nothing.
     */
    Result<void, Error> applyUpdate(const Bytes& update, const crdt::UpdateOrigin& origin);

    /**
     * Drop entries without a network message, e.g. when their connection closed.
     */
    void removeStates(const std::vector<ClientId>& clients, const crdt::UpdateOrigin& origin);

signals:
    void changed(const weave::presence::PresenceChange& change,
                 const weave::crdt::UpdateOrigin& origin);
    void updated(const weave::presence::PresenceChange& change,
                 const weave::crdt::UpdateOrigin& origin);

private:
    struct Meta {
        quint64 clock = 0;
        qint64 last_updated = 0;
    };

    ClientId client_id_;
    NowFn now_;
    std::map<ClientId, QJsonObject> states_;
    std::map<ClientId, Meta> meta_;
};

} // namespace weave::presence
