#include "relay/relay_room.hpp"
#include "core/logging.hpp"
#include "protocol/sync_protocol.hpp"

namespace weave::relay {

RelayRoom::RelayRoom(QString name, std::unique_ptr<crdt::DocumentReplica> replica,
                     storage::DocumentStore* store, Options options, QObject* parent)
    : QObject(parent)
    , name_(std::move(name))
    , replica_(std::move(replica))
    , presence_(RELAY_CLIENT_ID)
    , store_(store)
    , options_(options)
{
    // The relay only mirrors other clients' presence.
    presence_.setLocalState(std::nullopt);

    persist_timer_.setSingleShot(true);
    connect(&persist_timer_, &QTimer::timeout, this, &RelayRoom::persist);
    connect(replica_.get(), &crdt::DocumentReplica::updated,
            this, &RelayRoom::onReplicaUpdated);
    connect(&presence_, &presence::PresenceTable::updated,
            this, &RelayRoom::onPresenceUpdated);
}

RelayRoom::~RelayRoom() {
    if (persist_timer_.isActive()) {
        persist();
    }
    for (auto& [id, connection] : connections_) {
        disconnect(connection.socket, nullptr, this, nullptr);
    }
}

void RelayRoom::load() {
    if (!store_) return;
    auto rows = store_->load(name_.toStdString());
    if (rows.is_err()) {
        qCWarning(lcRelay) << "room" << name_ << "load failed:"
                           << QString::fromStdString(rows.unwrap_err().message);
        return;
    }
    const auto updates = std::move(rows).unwrap();
    for (const auto& update : updates) {
        auto applied = replica_->applyUpdate(update, crdt::UpdateOrigin::persistence());
        if (applied.is_err()) {
            qCWarning(lcRelay) << "room" << name_ << "skipping unreadable row:"
                               << QString::fromStdString(applied.unwrap_err().message);
        }
    }
    qCInfo(lcRelay) << "room" << name_ << "loaded" << updates.size() << "rows";
}

void RelayRoom::addConnection(network::RelaySocket* socket) {
    const quint64 id = next_connection_id_++;
    socket->setParent(this);
    connections_[id] = Connection{id, socket, {}};

    connect(socket, &network::RelaySocket::messageReceived, this,
            [this, id](const Bytes& message) { onMessage(id, message); });
    connect(socket, &network::RelaySocket::closed, this,
            [this, id](int, const QString&) { onClosed(id); });

    qCInfo(lcRelay) << "room" << name_ << "connection" << id << "joined,"
                    << connections_.size() << "connected";

    auto& connection = connections_[id];
    send(connection, protocol::make_sync_step1(*replica_));
    if (!presence_.states().empty()) {
        send(connection, protocol::AwarenessFrame{presence_.encodeAll()});
    }
}

void RelayRoom::persist() {
    persist_timer_.stop();
    if (!store_) return;
    auto saved = store_->compact(name_.toStdString(), replica_->encodeStateAsUpdate());
    if (saved.is_err()) {
        qCWarning(lcRelay) << "room" << name_ << "persist failed:"
                           << QString::fromStdString(saved.unwrap_err().message);
        return;
    }
    qCDebug(lcRelay) << "room" << name_ << "persisted";
}

void RelayRoom::onMessage(quint64 connection_id, const Bytes& message) {
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) return;

    auto decoded = protocol::decode_frame(message);
    if (decoded.is_err()) {
        qCWarning(lcRelay) << "room" << name_ << "connection" << connection_id
                           << "sent a malformed frame:"
                           << QString::fromStdString(decoded.unwrap_err().message);
        return;
    }
    const auto frame = std::move(decoded).unwrap();
    const auto origin = crdt::UpdateOrigin::remote(connection_id);

    if (const auto* sync = std::get_if<protocol::SyncFrame>(&frame)) {
        auto reply = protocol::read_sync_frame(*replica_, *sync, origin);
        if (reply.is_err()) {
            qCWarning(lcRelay) << "room" << name_ << "dropping sync frame:"
                               << QString::fromStdString(reply.unwrap_err().message);
            return;
        }
        if (auto out = std::move(reply).unwrap()) {
            send(it->second, *out);
        }
    } else if (const auto* awareness = std::get_if<protocol::AwarenessFrame>(&frame)) {
        auto applied = presence_.applyUpdate(awareness->update, origin);
        if (applied.is_err()) {
            qCWarning(lcRelay) << "room" << name_ << "dropping presence frame:"
                               << QString::fromStdString(applied.unwrap_err().message);
        }
    } else {
        send(it->second, protocol::AwarenessFrame{presence_.encodeAll()});
    }
}

void RelayRoom::onClosed(quint64 connection_id) {
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) return;

    network::RelaySocket* socket = it->second.socket;
    const std::vector<ClientId> clients(it->second.clients.begin(), it->second.clients.end());
    connections_.erase(it);
    disconnect(socket, nullptr, this, nullptr);
    socket->deleteLater();

    if (!clients.empty()) {
        // Encode at the current clocks first; peers drop an entry on a null
        // state with an equal clock.
        const auto removal = presence_.encodeRemoval(clients);
        presence_.removeStates(clients, crdt::UpdateOrigin::local());
        broadcast(protocol::AwarenessFrame{removal}, connection_id);
    }

    qCInfo(lcRelay) << "room" << name_ << "connection" << connection_id << "left,"
                    << connections_.size() << "connected";

    if (connections_.empty()) {
        persist();
        emit emptied();
    }
}

void RelayRoom::onReplicaUpdated(const Bytes& update, const crdt::UpdateOrigin& origin) {
    if (origin.source == crdt::UpdateOrigin::Source::Persistence) return;
    broadcast(protocol::make_sync_update(update), origin.is_remote() ? origin.connection_id : 0);
    if (store_) {
        persist_timer_.start(options_.persist_debounce_ms);
    }
}

void RelayRoom::onPresenceUpdated(const presence::PresenceChange& change,
                                  const crdt::UpdateOrigin& origin) {
    if (!origin.is_remote()) return;

    auto it = connections_.find(origin.connection_id);
    if (it != connections_.end()) {
        for (ClientId client : change.added) it->second.clients.insert(client);
        for (ClientId client : change.updated) it->second.clients.insert(client);
        for (ClientId client : change.removed) it->second.clients.erase(client);
    }
    broadcast(protocol::AwarenessFrame{presence_.encodeUpdate(change.all())},
              origin.connection_id);
}

void RelayRoom::send(Connection& connection, const protocol::Frame& frame) {
    if (!connection.socket->send(protocol::encode_frame(frame))) {
        qCDebug(lcRelay) << "room" << name_ << "connection" << connection.id
                         << "not writable, dropped" << protocol::frame_name(frame);
    }
}

void RelayRoom::broadcast(const protocol::Frame& frame, quint64 except_connection) {
    const Bytes encoded = protocol::encode_frame(frame);
    for (auto& [id, connection] : connections_) {
        if (id == except_connection) continue;
        if (!connection.socket->send(encoded)) {
            qCDebug(lcRelay) << "room" << name_ << "connection" << id
                             << "not writable, dropped" << protocol::frame_name(frame);
        }
    }
}

} // namespace weave::relay
