#include "network/relay_socket.hpp"
#include "core/logging.hpp"

#include <QTimer>

namespace weave::network {

WebSocketRelaySocket::WebSocketRelaySocket(QObject* parent)
    : RelaySocket(parent)
{
    connect(&socket_, &QWebSocket::connected,
            this, &WebSocketRelaySocket::onConnected);
    connect(&socket_, &QWebSocket::disconnected,
            this, &WebSocketRelaySocket::onDisconnected);
    connect(&socket_, &QWebSocket::binaryMessageReceived,
            this, &WebSocketRelaySocket::onBinaryMessage);
    connect(&socket_, &QWebSocket::errorOccurred,
            this, &WebSocketRelaySocket::onError);
}

WebSocketRelaySocket::~WebSocketRelaySocket() {
    // Owner is tearing down; no signals should reach it from here on.
    socket_.disconnect(this);
    socket_.abort();
}

void WebSocketRelaySocket::open(const QUrl& url) {
    qCDebug(lcSync) << "socket: opening" << url.toString();
    socket_.open(url);
}

void WebSocketRelaySocket::close(int code, const QString& reason) {
    requested_close_code_ = code;
    socket_.close(static_cast<QWebSocketProtocol::CloseCode>(code), reason);
    // Hand queued frames to the OS now; the event loop may not run again.
    socket_.flush();
}

bool WebSocketRelaySocket::send(const Bytes& message) {
    if (!isOpen()) {
        return false;
    }
    const QByteArray payload(reinterpret_cast<const char*>(message.data()),
                             static_cast<qsizetype>(message.size()));
    return socket_.sendBinaryMessage(payload) == payload.size();
}

bool WebSocketRelaySocket::isOpen() const {
    return socket_.state() == QAbstractSocket::ConnectedState;
}

SocketFactory WebSocketRelaySocket::factory() {
    return [] { return std::make_unique<WebSocketRelaySocket>(); };
}

void WebSocketRelaySocket::onConnected() {
    emit opened();
}

void WebSocketRelaySocket::onDisconnected() {
    reportClosed();
}

void WebSocketRelaySocket::onBinaryMessage(const QByteArray& message) {
    const auto* data = reinterpret_cast<const uint8_t*>(message.constData());
    emit messageReceived(Bytes(data, data + message.size()));
}

void WebSocketRelaySocket::onError(QAbstractSocket::SocketError) {
    qCDebug(lcSync) << "socket: error" << socket_.errorString();
    emit errorOccurred(socket_.errorString());
    // A refused attempt may never leave a connected state to report from.
    QTimer::singleShot(0, this, [this] {
        if (socket_.state() == QAbstractSocket::UnconnectedState) {
            reportClosed();
        }
    });
}

void WebSocketRelaySocket::reportClosed() {
    if (close_reported_) return;
    close_reported_ = true;

    // QWebSocket reports Normal both for a peer's close frame and for a
    // dropped link. Only trust Normal when we asked for it or the peer gave
    // a reason; everything else counts as abnormal and is retried.
    int code = static_cast<int>(socket_.closeCode());
    if (requested_close_code_) {
        code = *requested_close_code_;
    } else if (code == close_code::Normal && socket_.closeReason().isEmpty()) {
        code = close_code::Abnormal;
    }
    emit closed(code, socket_.closeReason());
}

} // namespace weave::network
