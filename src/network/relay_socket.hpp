#pragma once

#include "core/types.hpp"

#include <QObject>
#include <QUrl>
#include <QWebSocket>

#include <functional>
#include <memory>
#include <optional>

namespace weave::network {

/**
 * WebSocket close codes the engine distinguishes.
 */
namespace close_code {
inline constexpr int Normal = 1000;
inline constexpr int GoingAway = 1001;
inline constexpr int Abnormal = 1006;
} // namespace close_code

/**
 * RelaySocket - one message-oriented connection to the relay.
 *
 * A socket is single use: open() once, then either opened() followed by
 * closed(code), or closed(code) directly when the attempt fails. Every
 * attempt ends with exactly one closed().
 */
class RelaySocket : public QObject {
    Q_OBJECT

public:
    using QObject::QObject;
    ~RelaySocket() override = default;

    virtual void open(const QUrl& url) = 0;
    virtual void close(int code, const QString& reason = {}) = 0;

    /**
     * Queue one binary message. Returns false when the socket is not open.
     */
    virtual bool send(const Bytes& message) = 0;

    [[nodiscard]] virtual bool isOpen() const = 0;

signals:
    void opened();
    void closed(int code, const QString& reason);
    void messageReceived(const weave::Bytes& message);
    void errorOccurred(const QString& message);
};

using SocketFactory = std::function<std::unique_ptr<RelaySocket>()>;

/**
 * WebSocketRelaySocket - RelaySocket over QWebSocket (binary frames).
 */
class WebSocketRelaySocket : public RelaySocket {
    Q_OBJECT

public:
    explicit WebSocketRelaySocket(QObject* parent = nullptr);
    ~WebSocketRelaySocket() override;

    void open(const QUrl& url) override;
    void close(int code, const QString& reason = {}) override;
    bool send(const Bytes& message) override;
    [[nodiscard]] bool isOpen() const override;

    [[nodiscard]] static SocketFactory factory();

private slots:
    void onConnected();
    void onDisconnected();
    void onBinaryMessage(const QByteArray& message);
    void onError(QAbstractSocket::SocketError error);

private:
    void reportClosed();

    QWebSocket socket_;
    std::optional<int> requested_close_code_;
    bool close_reported_ = false;
};

} // namespace weave::network
