#include "support/fake_relay_socket.hpp"

namespace weave::testing {

FakeRelaySocket::FakeRelaySocket(FakeSocketHub* hub)
    : hub_(hub)
{
}

void FakeRelaySocket::open(const QUrl& target) {
    url = target;
}

void FakeRelaySocket::close(int code, const QString& reason) {
    close_codes.push_back(code);
    if (!open_) return;
    open_ = false;
    emit closed(code, reason);
}

bool FakeRelaySocket::send(const Bytes& message) {
    if (!open_) return false;
    hub_->sent.push_back(message);
    return true;
}

void FakeRelaySocket::accept() {
    open_ = true;
    emit opened();
}

void FakeRelaySocket::fail(int code, const QString& reason) {
    open_ = false;
    emit closed(code, reason);
}

void FakeRelaySocket::deliver(const Bytes& message) {
    emit messageReceived(message);
}

void FakeRelaySocket::deliver(const protocol::Frame& frame) {
    deliver(protocol::encode_frame(frame));
}

network::SocketFactory FakeSocketHub::factory() {
    return [this] {
        auto socket = std::make_unique<FakeRelaySocket>(this);
        sockets_.emplace_back(socket.get());
        return std::unique_ptr<network::RelaySocket>(std::move(socket));
    };
}

FakeRelaySocket* FakeSocketHub::last() const {
    return sockets_.empty() ? nullptr : sockets_.back().data();
}

std::vector<protocol::Frame> FakeSocketHub::sentFrames() const {
    std::vector<protocol::Frame> frames;
    for (const auto& message : sent) {
        auto decoded = protocol::decode_frame(message);
        if (decoded.is_ok()) {
            frames.push_back(std::move(decoded).unwrap());
        }
    }
    return frames;
}

} // namespace weave::testing
