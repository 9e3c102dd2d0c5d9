#include <QCoreApplication>
#include <QEventLoop>
#include <QHostAddress>
#include <QTimer>

#include "crdt/automerge_replica.hpp"
#include "network/sync_transport.hpp"
#include "presence/presence_state.hpp"
#include "relay/relay_server.hpp"

// Starts a relay and two clients on loopback, edits on A and waits for B to
// see the edit and A's presence. Exit code 0 on success.
int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    qputenv("WEAVE_DEBUG_SYNC", "1");

    weave::relay::RelayServer::Options relayOptions;
    relayOptions.port = 0;
    weave::relay::RelayServer relay(relayOptions, [] {
        return std::make_unique<weave::crdt::AutomergeReplica>();
    });
    auto port = relay.listen();
    if (port.is_err()) {
        qCritical().noquote() << "relay:" << QString::fromStdString(port.unwrap_err().message);
        return 1;
    }

    const QUrl url(QStringLiteral("ws://127.0.0.1:%1").arg(port.unwrap()));
    auto makeOptions = [&](const QString& id, const QString& name) {
        weave::network::SyncTransport::Options options;
        options.server_url = url;
        options.room = QStringLiteral("doc-1");
        options.user = weave::presence::makeUserIdentity(id, name);
        return options;
    };

    weave::crdt::AutomergeReplica replicaA;
    weave::crdt::AutomergeReplica replicaB;
    weave::presence::PresenceTable presenceA(1001);
    weave::presence::PresenceTable presenceB(1002);
    presenceA.setLocalField(weave::presence::fields::user,
                            weave::presence::serializeUser(makeOptions("a", "A").user));

    weave::network::SyncTransport a(&replicaA, &presenceA, makeOptions("a", "A"),
                                    weave::network::WebSocketRelaySocket::factory());
    weave::network::SyncTransport b(&replicaB, &presenceB, makeOptions("b", "B"),
                                    weave::network::WebSocketRelaySocket::factory());

    replicaA.setText("title", "written offline");
    a.start();
    b.start();

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    timeout.setInterval(5000);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    auto done = [&] {
        return replicaB.text("title") == std::optional<std::string>("written offline")
            && b.users().size() == 1;
    };

    QTimer poll;
    poll.setInterval(20);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (done()) {
            loop.quit();
        }
    });

    timeout.start();
    poll.start();
    loop.exec();

    const bool ok = done();
    a.destroy();
    b.destroy();
    return ok ? 0 : 2;
}
