#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "crdt/document_replica.hpp"
#include "network/reconnect_policy.hpp"
#include "network/relay_socket.hpp"
#include "presence/presence_state.hpp"
#include "presence/presence_table.hpp"
#include "protocol/frame.hpp"
#include "storage/document_cache.hpp"

#include <QObject>
#include <QPointer>
#include <QTimer>
#include <QUrl>

#include <functional>
#include <optional>
#include <vector>

namespace weave::network {

/**
 * CollaborationState - everything a host shows about one session.
 */
struct CollaborationState {
    ConnectionStatus status = ConnectionStatus::Disconnected;
    bool synced = false;
    bool offline = true;   // status != Connected
    std::vector<presence::UserIdentity> users;
    std::optional<QString> error;
    std::optional<Timestamp> lastSyncedAt;
};

/**
 * SyncTransport - keeps one room's replica and presence table in sync with a
 * relay over a single connection.
 *
 * Lifecycle:
 *   Disconnected --connectToRelay()--> Connecting
 *   Connecting   --opened-->           Connected (send step 1 and our presence)
 *   Connected    --closed(1000)-->     Disconnected
 *   otherwise    --closed-->           Reconnecting (timer) or Error (budget spent)
 *   Reconnecting --timer-->            Connecting
 *   any          --destroy()-->        Disconnected, silent from then on
 *
 * Everything applied from the network carries UpdateOrigin::remote(id());
 * replica and presence events with that origin are never sent back.
 * Socket failures and malformed frames are handled here; the only failure a
 * host sees is status Error.
 */
class SyncTransport : public QObject {
    Q_OBJECT

public:
    struct Options {
        QUrl server_url;
        QString room;
        presence::UserIdentity user;
        ReconnectPolicy policy;
        bool auto_reconnect = true;
        int initial_connect_delay_ms = 0;
    };

    SyncTransport(crdt::DocumentReplica* replica, presence::PresenceTable* presence,
                  Options options, SocketFactory factory,
                  QObject* parent = nullptr, NowFn now = {});
    ~SyncTransport() override;

    /**
     * Hold the first connection until the cache has hydrated the replica.
     * Must be called before start().
     */
    void setCache(storage::DocumentCache* cache);

    /**
     * Connect after the initial delay and once the cache (if any) is synced.
     */
    void start();

    /**
     * Open a connection now. From Error this is the manual retry and starts a
     * fresh attempt budget. Ignored while connecting or connected.
     */
    void connectToRelay();

    /**
     * Tear down: cancel timers, detach from replica and presence, announce our
     * presence removal, close with a normal code. Idempotent; no signal is
     * emitted once it returns.
     */
    void destroy();

    [[nodiscard]] quint64 id() const { return id_; }
    [[nodiscard]] ConnectionStatus status() const { return status_; }
    [[nodiscard]] bool isConnected() const { return status_ == ConnectionStatus::Connected; }
    [[nodiscard]] bool isSynced() const { return synced_; }
    [[nodiscard]] bool isDestroyed() const { return destroyed_; }
    [[nodiscard]] std::vector<presence::UserIdentity> users() const;
    [[nodiscard]] CollaborationState state() const;
    [[nodiscard]] const ReconnectState& reconnectState() const { return reconnect_; }
    [[nodiscard]] const std::optional<QString>& lastError() const { return last_error_; }
    /**
     * Updates waiting for the next connection: offline edits are coalesced
     * into a single update, so this is 0 or 1.
     */
    [[nodiscard]] size_t pendingUpdates() const { return offline_edits_ ? 1 : 0; }

    /**
     * True while a reconnect or deferred start timer is armed.
     */
    [[nodiscard]] bool hasPendingTimers() const;

    /**
     * Connections held on the replica, presence table and cache.
     */
    [[nodiscard]] size_t listenerCount() const;

    [[nodiscard]] QUrl connectionUrl() const;

    /**
     * Host subscriptions. Each returns a token for QObject::disconnect().
     * onStatus, onSynced and onUsers call back once with the current value.
     */
    QMetaObject::Connection onStatus(std::function<void(ConnectionStatus)> callback);
    QMetaObject::Connection onSynced(std::function<void(bool)> callback);
    QMetaObject::Connection onUsers(std::function<void(const std::vector<presence::UserIdentity>&)> callback);
    QMetaObject::Connection onStateChanged(std::function<void(const CollaborationState&)> callback);

signals:
    void statusChanged(weave::ConnectionStatus status);
    void syncedChanged(bool synced);
    void usersChanged(const std::vector<weave::presence::UserIdentity>& users);
    void stateChanged(const weave::network::CollaborationState& state);

private:
    void scheduleFirstConnect();
    void openSocket();
    void releaseSocket();
    void setStatus(ConnectionStatus status);
    void setSynced(bool synced);
    void sendFrame(const protocol::Frame& frame);

    void onSocketOpened();
    void onSocketClosed(int code, const QString& reason);
    void onSocketMessage(const Bytes& message);
    void onReplicaUpdated(const Bytes& update, const crdt::UpdateOrigin& origin);
    void onPresenceUpdated(const presence::PresenceChange& change, const crdt::UpdateOrigin& origin);
    void onPresenceChanged();
    void onCacheSynced();

    void handleSyncFrame(const protocol::SyncFrame& frame);
    void handleAwarenessFrame(const protocol::AwarenessFrame& frame);

    quint64 id_;
    QPointer<crdt::DocumentReplica> replica_;
    QPointer<presence::PresenceTable> presence_;
    QPointer<storage::DocumentCache> cache_;
    Options options_;
    SocketFactory factory_;
    NowFn now_;

    RelaySocket* socket_ = nullptr;
    QTimer reconnect_timer_;
    QTimer start_timer_;
    std::vector<QMetaObject::Connection> listeners_;
    QMetaObject::Connection cache_listener_;

    ConnectionStatus status_ = ConnectionStatus::Disconnected;
    ReconnectState reconnect_;
    bool offline_edits_ = false;
    std::optional<QString> last_error_;
    std::optional<Timestamp> last_synced_at_;
    bool synced_ = false;
    bool start_requested_ = false;
    bool destroyed_ = false;
};

} // namespace weave::network

Q_DECLARE_METATYPE(weave::network::CollaborationState)
