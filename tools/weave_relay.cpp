#include <QCommandLineParser>
#include <QCoreApplication>
#include <QHostAddress>
#include <QTextStream>

#include "core/logging.hpp"
#include "crdt/automerge_replica.hpp"
#include "relay/relay_server.hpp"

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("weave-relay");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Weave");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Relay for weave rooms."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption hostOption(
        QStringList{QStringLiteral("host")},
        QStringLiteral("Address to bind (default 127.0.0.1)."),
        QStringLiteral("address"), QStringLiteral("127.0.0.1"));
    parser.addOption(hostOption);

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("p"), QStringLiteral("port")},
        QStringLiteral("Port to listen on (default 1234)."),
        QStringLiteral("port"), QStringLiteral("1234"));
    parser.addOption(portOption);

    const QCommandLineOption storeOption(
        QStringList{QStringLiteral("store")},
        QStringLiteral("SQLite file for room state; rooms are memory-only without it."),
        QStringLiteral("path"));
    parser.addOption(storeOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging."));
    parser.addOption(debugSyncOption);

    parser.process(app);

    if (parser.isSet(debugSyncOption) || weave::sync_debug_enabled()) {
        weave::enable_debug_logging();
    }

    weave::relay::RelayServer::Options options;
    options.host = QHostAddress(parser.value(hostOption));
    if (options.host.isNull()) {
        QTextStream(stderr) << "Invalid --host: " << parser.value(hostOption) << '\n';
        return 1;
    }
    bool ok = false;
    const uint port = parser.value(portOption).toUInt(&ok);
    if (!ok || port > 65535) {
        QTextStream(stderr) << "Invalid --port: " << parser.value(portOption) << '\n';
        return 1;
    }
    options.port = static_cast<quint16>(port);
    options.store_path = parser.value(storeOption);

    weave::relay::RelayServer server(options, [] {
        return std::make_unique<weave::crdt::AutomergeReplica>();
    });

    auto listening = server.listen();
    if (listening.is_err()) {
        QTextStream(stderr) << "Failed to start relay: "
                            << QString::fromStdString(listening.unwrap_err().message) << '\n';
        return 1;
    }
    QTextStream(stdout) << "weave-relay listening on " << options.host.toString()
                        << ':' << listening.unwrap() << Qt::endl;

    return app.exec();
}
