#pragma once

#include "core/types.hpp"
#include "crdt/document_replica.hpp"
#include "network/relay_socket.hpp"
#include "presence/presence_table.hpp"
#include "protocol/frame.hpp"
#include "storage/document_store.hpp"

#include <QObject>
#include <QString>
#include <QTimer>

#include <functional>
#include <map>
#include <memory>
#include <set>

namespace weave::relay {

using ReplicaFactory = std::function<std::unique_ptr<crdt::DocumentReplica>()>;

/**
 * RelayRoom - the relay's side of one room.
 *
 * Holds the authoritative replica and the presence entries of every client
 * connected to the room. Each connection gets step 1 and the known presence
 * on join; updates applied from one connection are forwarded to all others.
 * Presence entries are tracked per connection and dropped when it closes.
 */
class RelayRoom : public QObject {
    Q_OBJECT

public:
    struct Options {
        int persist_debounce_ms = 1000;
    };

    // Client id of the relay's own (always empty) presence entry.
    static constexpr ClientId RELAY_CLIENT_ID = 0;

    RelayRoom(QString name, std::unique_ptr<crdt::DocumentReplica> replica,
              storage::DocumentStore* store, Options options, QObject* parent = nullptr);
    ~RelayRoom() override;

    /**
     * Replay persisted state into the replica. Bad rows are skipped.
     */
    void load();

    /**
     * Take ownership of an open socket and start the handshake on it.
     */
    void addConnection(network::RelaySocket* socket);

    [[nodiscard]] const QString& name() const { return name_; }
    [[nodiscard]] size_t connectionCount() const { return connections_.size(); }
    [[nodiscard]] bool isEmpty() const { return connections_.empty(); }
    [[nodiscard]] crdt::DocumentReplica& replica() { return *replica_; }
    [[nodiscard]] const presence::PresenceTable& presence() const { return presence_; }

    /**
     * Write the replica to the store now.
     */
    void persist();

signals:
    // The last connection left; the room may be dropped.
    void emptied();

private:
    struct Connection {
        quint64 id = 0;
        network::RelaySocket* socket = nullptr;
        std::set<ClientId> clients;
    };

    void onMessage(quint64 connection_id, const Bytes& message);
    void onClosed(quint64 connection_id);
    void onReplicaUpdated(const Bytes& update, const crdt::UpdateOrigin& origin);
    void onPresenceUpdated(const presence::PresenceChange& change, const crdt::UpdateOrigin& origin);

    void send(Connection& connection, const protocol::Frame& frame);
    void broadcast(const protocol::Frame& frame, quint64 except_connection);

    QString name_;
    std::unique_ptr<crdt::DocumentReplica> replica_;
    presence::PresenceTable presence_;
    storage::DocumentStore* store_;
    Options options_;
    QTimer persist_timer_;
    std::map<quint64, Connection> connections_;
    quint64 next_connection_id_ = 1;
};

} // namespace weave::relay
