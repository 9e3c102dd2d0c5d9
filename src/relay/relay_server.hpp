#pragma once

#include "core/result.hpp"
#include "network/relay_socket.hpp"
#include "relay/relay_room.hpp"
#include "storage/database.hpp"
#include "storage/document_store.hpp"

#include <QHostAddress>
#include <QObject>
#include <QPointer>
#include <QWebSocket>
#include <QWebSocketServer>

#include <map>
#include <memory>
#include <optional>

namespace weave::relay {

/**
 * AcceptedRelaySocket - RelaySocket over a QWebSocket the server accepted.
 * Already open; open() is never needed.
 */
class AcceptedRelaySocket : public network::RelaySocket {
    Q_OBJECT

public:
    explicit AcceptedRelaySocket(QWebSocket* socket, QObject* parent = nullptr);
    ~AcceptedRelaySocket() override;

    void open(const QUrl& url) override;
    void close(int code, const QString& reason = {}) override;
    bool send(const Bytes& message) override;
    [[nodiscard]] bool isOpen() const override;

private:
    QWebSocket* socket_;
    bool close_reported_ = false;
};

/**
 * RelayServer - WebSocket endpoint that routes clients into rooms.
 *
 * The room is the `room` query parameter of the upgrade request; requests
 * without one are refused. Rooms are created on first join, persisted when
 * they go quiet, and dropped when their last client leaves.
 */
class RelayServer : public QObject {
    Q_OBJECT

public:
    struct Options {
        QHostAddress host = QHostAddress::LocalHost;
        quint16 port = 1234;
        QString store_path;   // empty: rooms live in memory only
        int persist_debounce_ms = 1000;
    };

    RelayServer(Options options, ReplicaFactory factory, QObject* parent = nullptr);
    ~RelayServer() override;

    /**
     * Open the store (if configured) and start listening. Returns the bound port.
     */
    Result<quint16, Error> listen();
    void close();

    [[nodiscard]] bool isListening() const;
    [[nodiscard]] quint16 port() const;
    [[nodiscard]] size_t roomCount() const { return rooms_.size(); }
    [[nodiscard]] RelayRoom* room(const QString& name) const;

signals:
    void roomOpened(const QString& name);
    void roomClosed(const QString& name);

private slots:
    void onNewConnection();

private:
    RelayRoom* roomFor(const QString& name);
    void onRoomEmptied(const QString& name);

    Options options_;
    ReplicaFactory factory_;
    QWebSocketServer server_;
    std::optional<storage::Database> db_;
    std::unique_ptr<storage::DocumentStore> store_;
    std::map<QString, QPointer<RelayRoom>> rooms_;
};

} // namespace weave::relay
