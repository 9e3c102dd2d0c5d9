#include "network/sync_transport.hpp"
#include "core/logging.hpp"
#include "protocol/sync_protocol.hpp"

#include <QUrlQuery>

#include <algorithm>
#include <atomic>

namespace weave::network {

namespace {

std::atomic<quint64> next_transport_id{1};

// Grace period for a closing socket to flush its close frame.
constexpr int CLOSE_GRACE_MS = 1000;

} // namespace

SyncTransport::SyncTransport(crdt::DocumentReplica* replica,
                             presence::PresenceTable* presence,
                             Options options,
                             SocketFactory factory,
                             QObject* parent,
                             NowFn now)
    : QObject(parent)
    , id_(next_transport_id.fetch_add(1))
    , replica_(replica)
    , presence_(presence)
    , options_(std::move(options))
    , factory_(factory ? std::move(factory) : WebSocketRelaySocket::factory())
    , now_(now ? std::move(now) : NowFn(&Timestamp::now))
    , reconnect_(options_.policy.initialState())
{
    reconnect_timer_.setSingleShot(true);
    start_timer_.setSingleShot(true);
    connect(&reconnect_timer_, &QTimer::timeout, this, &SyncTransport::connectToRelay);
    connect(&start_timer_, &QTimer::timeout, this, &SyncTransport::connectToRelay);

    if (replica_) {
        listeners_.push_back(connect(replica_, &crdt::DocumentReplica::updated,
                                     this, &SyncTransport::onReplicaUpdated));
    }
    if (presence_) {
        listeners_.push_back(connect(presence_, &presence::PresenceTable::updated,
                                     this, &SyncTransport::onPresenceUpdated));
        listeners_.push_back(connect(presence_, &presence::PresenceTable::changed,
                                     this, &SyncTransport::onPresenceChanged));
    }
}

SyncTransport::~SyncTransport() {
    destroy();
}

void SyncTransport::setCache(storage::DocumentCache* cache) {
    if (destroyed_) return;
    if (cache_listener_) {
        disconnect(cache_listener_);
    }
    cache_ = cache;
    if (cache_) {
        cache_listener_ = connect(cache_, &storage::DocumentCache::synced,
                                  this, &SyncTransport::onCacheSynced);
    }
}

void SyncTransport::start() {
    if (destroyed_ || start_requested_) return;
    start_requested_ = true;

    if (cache_ && !cache_->isSynced()) {
        qCDebug(lcSync) << "transport: waiting for cache hydration of" << options_.room;
        return;
    }
    scheduleFirstConnect();
}

void SyncTransport::scheduleFirstConnect() {
    if (options_.initial_connect_delay_ms > 0) {
        start_timer_.start(options_.initial_connect_delay_ms);
    } else {
        connectToRelay();
    }
}

void SyncTransport::onCacheSynced() {
    if (destroyed_ || !start_requested_) return;
    if (status_ != ConnectionStatus::Disconnected || hasPendingTimers()) return;
    scheduleFirstConnect();
}

void SyncTransport::connectToRelay() {
    if (destroyed_) return;
    if (status_ == ConnectionStatus::Connecting || status_ == ConnectionStatus::Connected) {
        return;
    }

    if (status_ == ConnectionStatus::Error) {
        // Manual retry after giving up: fresh budget.
        options_.policy.reset(reconnect_);
        last_error_.reset();
    }
    reconnect_timer_.stop();
    start_timer_.stop();

    setStatus(ConnectionStatus::Connecting);
    openSocket();
}

void SyncTransport::openSocket() {
    releaseSocket();

    auto socket = factory_();
    socket_ = socket.release();
    socket_->setParent(this);

    connect(socket_, &RelaySocket::opened, this, &SyncTransport::onSocketOpened);
    connect(socket_, &RelaySocket::closed, this, &SyncTransport::onSocketClosed);
    connect(socket_, &RelaySocket::messageReceived, this, &SyncTransport::onSocketMessage);
    connect(socket_, &RelaySocket::errorOccurred, this, [this](const QString& message) {
        qCDebug(lcSync) << "transport: socket error:" << message;
    });

    const QUrl url = connectionUrl();
    qCInfo(lcSync) << "transport: connecting to" << url.toString(QUrl::RemoveQuery)
                   << "room" << options_.room
                   << "attempt" << reconnect_.attempts;
    socket_->open(url);
}

void SyncTransport::releaseSocket() {
    if (!socket_) return;
    RelaySocket* socket = socket_;
    socket_ = nullptr;
    disconnect(socket, nullptr, this, nullptr);
    if (socket->isOpen()) {
        socket->close(close_code::Normal);
    }
    socket->deleteLater();
}

void SyncTransport::destroy() {
    if (destroyed_) return;
    destroyed_ = true;

    reconnect_timer_.stop();
    start_timer_.stop();

    for (const auto& listener : listeners_) {
        disconnect(listener);
    }
    listeners_.clear();
    if (cache_listener_) {
        disconnect(cache_listener_);
        cache_listener_ = {};
    }

    if (socket_) {
        RelaySocket* socket = socket_;
        socket_ = nullptr;
        disconnect(socket, nullptr, this, nullptr);
        if (socket->isOpen()) {
            if (presence_) {
                // Best effort: tell peers our entry is gone before we leave.
                const auto removal = presence_->encodeRemoval({presence_->clientId()});
                if (!socket->send(protocol::encode_frame(protocol::AwarenessFrame{removal}))) {
                    qCDebug(lcSync) << "transport: presence removal not sent";
                }
            }
            // Unparent so the close frame outlives us if we are deleted next.
            socket->setParent(nullptr);
            socket->close(close_code::Normal);
            connect(socket, &RelaySocket::closed, socket, &QObject::deleteLater);
            QTimer::singleShot(CLOSE_GRACE_MS, socket, &QObject::deleteLater);
        } else {
            socket->deleteLater();
        }
    }

    offline_edits_ = false;
    synced_ = false;
    status_ = ConnectionStatus::Disconnected;
    qCInfo(lcSync) << "transport: destroyed for room" << options_.room;
}

bool SyncTransport::hasPendingTimers() const {
    return reconnect_timer_.isActive() || start_timer_.isActive();
}

size_t SyncTransport::listenerCount() const {
    size_t count = std::count_if(listeners_.begin(), listeners_.end(),
                                 [](const QMetaObject::Connection& c) { return bool(c); });
    if (cache_listener_) {
        ++count;
    }
    return count;
}

QUrl SyncTransport::connectionUrl() const {
    QUrl url(options_.server_url);
    const QString scheme = url.scheme().toLower();
    url.setScheme(scheme == QLatin1String("https") || scheme == QLatin1String("wss")
                      ? QStringLiteral("wss")
                      : QStringLiteral("ws"));

    QUrlQuery query(url);
    for (const auto* key : {"room", "userId", "userName", "userColor"}) {
        query.removeAllQueryItems(QLatin1String(key));
    }
    query.addQueryItem(QStringLiteral("room"), options_.room);
    query.addQueryItem(QStringLiteral("userId"), options_.user.id);
    query.addQueryItem(QStringLiteral("userName"), options_.user.name);
    query.addQueryItem(QStringLiteral("userColor"), options_.user.color);
    url.setQuery(query);
    return url;
}

std::vector<presence::UserIdentity> SyncTransport::users() const {
    std::vector<presence::UserIdentity> out;
    if (!presence_) return out;
    for (const auto& [client, state] : presence_->states()) {
        if (auto user = presence::parseUser(state.value(presence::fields::user))) {
            out.push_back(*user);
        }
    }
    return out;
}

CollaborationState SyncTransport::state() const {
    CollaborationState s;
    s.status = status_;
    s.synced = synced_;
    s.offline = status_ != ConnectionStatus::Connected;
    s.users = users();
    s.error = last_error_;
    s.lastSyncedAt = last_synced_at_;
    return s;
}

QMetaObject::Connection SyncTransport::onStatus(std::function<void(ConnectionStatus)> callback) {
    if (!destroyed_) callback(status_);
    return connect(this, &SyncTransport::statusChanged, this, std::move(callback));
}

QMetaObject::Connection SyncTransport::onSynced(std::function<void(bool)> callback) {
    if (!destroyed_) callback(synced_);
    return connect(this, &SyncTransport::syncedChanged, this, std::move(callback));
}

QMetaObject::Connection SyncTransport::onUsers(
    std::function<void(const std::vector<presence::UserIdentity>&)> callback) {
    if (!destroyed_) callback(users());
    return connect(this, &SyncTransport::usersChanged, this, std::move(callback));
}

QMetaObject::Connection SyncTransport::onStateChanged(
    std::function<void(const CollaborationState&)> callback) {
    return connect(this, &SyncTransport::stateChanged, this, std::move(callback));
}

void SyncTransport::setStatus(ConnectionStatus status) {
    if (destroyed_ || status_ == status) return;
    qCInfo(lcSync) << "transport:" << to_string(status_) << "->" << to_string(status);
    status_ = status;
    emit statusChanged(status_);
    if (!destroyed_) {
        emit stateChanged(state());
    }
}

void SyncTransport::setSynced(bool synced) {
    if (destroyed_ || synced_ == synced) return;
    synced_ = synced;
    emit syncedChanged(synced_);
    if (!destroyed_) {
        emit stateChanged(state());
    }
}

void SyncTransport::sendFrame(const protocol::Frame& frame) {
    if (!socket_ || !socket_->isOpen()) {
        qCDebug(lcSync) << "transport: not open, dropping" << protocol::frame_name(frame);
        return;
    }
    if (!socket_->send(protocol::encode_frame(frame))) {
        qCWarning(lcSync) << "transport: failed to send" << protocol::frame_name(frame);
    }
}

void SyncTransport::onSocketOpened() {
    options_.policy.reset(reconnect_);
    last_error_.reset();
    setStatus(ConnectionStatus::Connected);
    if (destroyed_ || !socket_) return;

    if (replica_) {
        sendFrame(protocol::make_sync_step1(*replica_));
    }
    if (presence_ && presence_->localState()) {
        // Re-announce at a fresh clock: peers that saw our entry removed while
        // we were away hold its old clock and would ignore the same one.
        presence_->setLocalState(presence_->localState());
    }

    // Edits made while offline go out right behind the handshake, as one update.
    if (offline_edits_ && replica_) {
        offline_edits_ = false;
        auto update = replica_->encodeUpdate(Bytes{});
        if (update.is_err()) {
            qCWarning(lcSync) << "transport: could not encode offline edits:"
                              << QString::fromStdString(update.unwrap_err().message);
        } else if (!update.unwrap().empty()) {
            sendFrame(protocol::make_sync_update(update.unwrap()));
        }
    }
}

void SyncTransport::onSocketClosed(int code, const QString& reason) {
    releaseSocket();
    qCInfo(lcSync) << "transport: closed code" << code << reason;

    setSynced(false);
    if (presence_ && !destroyed_) {
        // Peers behind this connection are no longer observable.
        presence_->removeStates(presence_->remoteClientIds(),
                                crdt::UpdateOrigin::remote(id_));
    }
    if (destroyed_) return;

    if (code == close_code::Normal) {
        setStatus(ConnectionStatus::Disconnected);
        return;
    }

    if (!options_.auto_reconnect) {
        last_error_ = QStringLiteral("Connection closed (code %1)").arg(code);
        setStatus(ConnectionStatus::Disconnected);
        return;
    }

    if (options_.policy.recordFailure(reconnect_)) {
        qCInfo(lcSync) << "transport: retry" << reconnect_.attempts << "of"
                       << reconnect_.maxAttempts << "in" << reconnect_.nextDelayMs << "ms";
        reconnect_timer_.start(static_cast<int>(reconnect_.nextDelayMs));
        setStatus(ConnectionStatus::Reconnecting);
        return;
    }

    last_error_ = QStringLiteral("Unable to reach %1 after %2 attempts")
                      .arg(options_.server_url.toString())
                      .arg(reconnect_.maxAttempts);
    qCWarning(lcSync) << "transport:" << *last_error_;
    setStatus(ConnectionStatus::Error);
}

void SyncTransport::onSocketMessage(const Bytes& message) {
    auto decoded = protocol::decode_frame(message);
    if (decoded.is_err()) {
        qCWarning(lcSync) << "transport: dropping malformed frame:"
                          << QString::fromStdString(decoded.unwrap_err().message);
        return;
    }
    const auto frame = std::move(decoded).unwrap();
    qCDebug(lcSync) << "transport: received" << protocol::frame_name(frame);

    if (const auto* sync = std::get_if<protocol::SyncFrame>(&frame)) {
        handleSyncFrame(*sync);
    } else if (const auto* awareness = std::get_if<protocol::AwarenessFrame>(&frame)) {
        handleAwarenessFrame(*awareness);
    } else if (presence_) {
        sendFrame(protocol::AwarenessFrame{presence_->encodeAll()});
    }
}

void SyncTransport::handleSyncFrame(const protocol::SyncFrame& frame) {
    if (!replica_) return;
    auto reply = protocol::read_sync_frame(*replica_, frame, crdt::UpdateOrigin::remote(id_));
    if (reply.is_err()) {
        qCWarning(lcSync) << "transport: dropping sync frame:"
                          << QString::fromStdString(reply.unwrap_err().message);
        return;
    }
    if (auto out = std::move(reply).unwrap()) {
        sendFrame(*out);
    }
    if (frame.type == protocol::SyncMessageType::Step2) {
        last_synced_at_ = now_();
        setSynced(true);
    }
}

void SyncTransport::handleAwarenessFrame(const protocol::AwarenessFrame& frame) {
    if (!presence_) return;
    auto applied = presence_->applyUpdate(frame.update, crdt::UpdateOrigin::remote(id_));
    if (applied.is_err()) {
        qCWarning(lcSync) << "transport: dropping presence frame:"
                          << QString::fromStdString(applied.unwrap_err().message);
    }
}

void SyncTransport::onReplicaUpdated(const Bytes& update, const crdt::UpdateOrigin& origin) {
    if (origin == crdt::UpdateOrigin::remote(id_)
        || origin.source == crdt::UpdateOrigin::Source::Persistence) {
        return;
    }
    if (isConnected()) {
        sendFrame(protocol::make_sync_update(update));
    } else {
        offline_edits_ = true;
    }
}

void SyncTransport::onPresenceUpdated(const presence::PresenceChange& change,
                                      const crdt::UpdateOrigin& origin) {
    if (!isConnected() || !presence_) {
        return;
    }
    auto clients = change.all();
    if (origin == crdt::UpdateOrigin::remote(id_)) {
        // Never echo what we just received, except our own entry: a peer
        // declared it gone and the table bumped its clock to outbid that.
        const ClientId self = presence_->clientId();
        if (std::find(clients.begin(), clients.end(), self) == clients.end()) {
            return;
        }
        clients = {self};
    }
    if (clients.empty()) return;
    sendFrame(protocol::AwarenessFrame{presence_->encodeUpdate(clients)});
}

void SyncTransport::onPresenceChanged() {
    emit usersChanged(users());
    emit stateChanged(state());
}

} // namespace weave::network
