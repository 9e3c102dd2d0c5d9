#include "relay/relay_server.hpp"
#include "core/logging.hpp"
#include "storage/migrations.hpp"

#include <QUrlQuery>

namespace weave::relay {

AcceptedRelaySocket::AcceptedRelaySocket(QWebSocket* socket, QObject* parent)
    : network::RelaySocket(parent)
    , socket_(socket)
{
    socket_->setParent(this);
    connect(socket_, &QWebSocket::binaryMessageReceived, this, [this](const QByteArray& message) {
        const auto* data = reinterpret_cast<const uint8_t*>(message.constData());
        emit messageReceived(Bytes(data, data + message.size()));
    });
    connect(socket_, &QWebSocket::disconnected, this, [this] {
        if (close_reported_) return;
        close_reported_ = true;
        emit closed(static_cast<int>(socket_->closeCode()), socket_->closeReason());
    });
}

AcceptedRelaySocket::~AcceptedRelaySocket() {
    socket_->disconnect(this);
    socket_->abort();
}

void AcceptedRelaySocket::open(const QUrl&) {}

void AcceptedRelaySocket::close(int code, const QString& reason) {
    socket_->close(static_cast<QWebSocketProtocol::CloseCode>(code), reason);
}

bool AcceptedRelaySocket::send(const Bytes& message) {
    if (!isOpen()) return false;
    const QByteArray payload(reinterpret_cast<const char*>(message.data()),
                             static_cast<qsizetype>(message.size()));
    return socket_->sendBinaryMessage(payload) == payload.size();
}

bool AcceptedRelaySocket::isOpen() const {
    return socket_->state() == QAbstractSocket::ConnectedState;
}

RelayServer::RelayServer(Options options, ReplicaFactory factory, QObject* parent)
    : QObject(parent)
    , options_(std::move(options))
    , factory_(std::move(factory))
    , server_(QStringLiteral("weave-relay"), QWebSocketServer::NonSecureMode)
{
    connect(&server_, &QWebSocketServer::newConnection,
            this, &RelayServer::onNewConnection);
}

RelayServer::~RelayServer() {
    close();
}

Result<quint16, Error> RelayServer::listen() {
    if (!options_.store_path.isEmpty() && !store_) {
        auto db = storage::Database::open(options_.store_path.toStdString());
        if (db.is_err()) {
            return Result<quint16, Error>::err(db.unwrap_err());
        }
        db_.emplace(std::move(db).unwrap());
        auto migrated = storage::initialize_database(*db_);
        if (migrated.is_err()) {
            db_.reset();
            return Result<quint16, Error>::err(migrated.unwrap_err());
        }
        store_ = std::make_unique<storage::DocumentStore>(*db_);
    }

    if (!server_.listen(options_.host, options_.port)) {
        return Result<quint16, Error>::err(
            Error{server_.errorString().toStdString(), ErrorCode::Transport});
    }
    qCInfo(lcRelay) << "relay: listening on" << options_.host.toString() << server_.serverPort();
    return Result<quint16, Error>::ok(server_.serverPort());
}

void RelayServer::close() {
    server_.close();
    for (auto& [name, room] : rooms_) {
        if (room) {
            room->persist();
            delete room.data();
        }
    }
    rooms_.clear();
}

bool RelayServer::isListening() const {
    return server_.isListening();
}

quint16 RelayServer::port() const {
    return server_.serverPort();
}

RelayRoom* RelayServer::room(const QString& name) const {
    auto it = rooms_.find(name);
    return it == rooms_.end() ? nullptr : it->second.data();
}

void RelayServer::onNewConnection() {
    while (server_.hasPendingConnections()) {
        QWebSocket* socket = server_.nextPendingConnection();
        const QString name = QUrlQuery(socket->requestUrl()).queryItemValue(
            QStringLiteral("room"), QUrl::FullyDecoded);
        if (name.isEmpty()) {
            qCWarning(lcRelay) << "relay: refusing connection without a room from"
                               << socket->peerAddress().toString();
            socket->close(QWebSocketProtocol::CloseCodePolicyViolated,
                          QStringLiteral("room required"));
            socket->deleteLater();
            continue;
        }
        roomFor(name)->addConnection(new AcceptedRelaySocket(socket));
    }
}

RelayRoom* RelayServer::roomFor(const QString& name) {
    if (auto* existing = room(name)) {
        return existing;
    }
    auto* created = new RelayRoom(name, factory_(), store_.get(),
                                  RelayRoom::Options{options_.persist_debounce_ms}, this);
    created->load();
    connect(created, &RelayRoom::emptied, this, [this, name] { onRoomEmptied(name); });
    rooms_[name] = created;
    qCInfo(lcRelay) << "relay: opened room" << name;
    emit roomOpened(name);
    return created;
}

void RelayServer::onRoomEmptied(const QString& name) {
    auto it = rooms_.find(name);
    if (it == rooms_.end()) return;
    if (it->second) {
        it->second->deleteLater();
    }
    rooms_.erase(it);
    qCInfo(lcRelay) << "relay: closed room" << name;
    emit roomClosed(name);
}

} // namespace weave::relay
