#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QSocketNotifier>
#include <QTextStream>
#include <QUuid>

#include <unistd.h>

#include "cli/commands.hpp"
#include "cli/session.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "presence/presence_state.hpp"

namespace {

// The identity outlives sessions: generated once, then read back.
weave::presence::UserIdentity load_identity(QSettings& settings, const QString& name_override) {
    settings.beginGroup(QStringLiteral("identity"));
    QString id = settings.value(QStringLiteral("userId")).toString();
    if (id.isEmpty()) {
        id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        settings.setValue(QStringLiteral("userId"), id);
    }
    QString name = settings.value(QStringLiteral("userName"),
                                  QStringLiteral("Anonymous User")).toString();
    if (!name_override.trimmed().isEmpty()) {
        name = name_override.trimmed();
        settings.setValue(QStringLiteral("userName"), name);
    }
    settings.endGroup();
    return weave::presence::makeUserIdentity(id, name);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("weave");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Weave");
    app.setOrganizationDomain("weave.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Join a shared document room from the terminal."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption serverOption(
        QStringList{QStringLiteral("s"), QStringLiteral("server")},
        QStringLiteral("Relay URL (ws://, wss://, http:// or https://)."),
        QStringLiteral("url"));
    parser.addOption(serverOption);

    const QCommandLineOption roomOption(
        QStringList{QStringLiteral("r"), QStringLiteral("room")},
        QStringLiteral("Room (document) to join."),
        QStringLiteral("room"));
    parser.addOption(roomOption);

    const QCommandLineOption nameOption(
        QStringList{QStringLiteral("name")},
        QStringLiteral("Display name; remembered for later runs."),
        QStringLiteral("name"));
    parser.addOption(nameOption);

    const QCommandLineOption cacheOption(
        QStringList{QStringLiteral("cache")},
        QStringLiteral("Override the local cache file."),
        QStringLiteral("path"));
    parser.addOption(cacheOption);

    const QCommandLineOption noCacheOption(
        QStringList{QStringLiteral("no-cache")},
        QStringLiteral("Do not keep a local copy of the document."));
    parser.addOption(noCacheOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Append log output to this file."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets WEAVE_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    parser.process(app);

    if (parser.isSet(debugSyncOption)) {
        qputenv("WEAVE_DEBUG_SYNC", "1");
    }
    if (weave::sync_debug_enabled()) {
        weave::enable_debug_logging();
    }
    weave::install_file_logging(parser.value(logFileOption));

    QSettings store;
    auto settings = weave::SyncSettings::load(store);
    settings.apply_environment();
    if (parser.isSet(serverOption)) {
        settings.server_url = QUrl(parser.value(serverOption));
    }
    if (parser.isSet(roomOption)) {
        settings.room = parser.value(roomOption);
    }
    if (parser.isSet(cacheOption)) {
        settings.cache_path = parser.value(cacheOption);
    }
    if (parser.isSet(noCacheOption)) {
        settings.enable_offline_persistence = false;
    }

    auto validated = settings.validated();
    if (validated.is_err()) {
        QTextStream(stderr) << QString::fromStdString(validated.unwrap_err().message) << QLatin1Char('\n');
        return 1;
    }
    settings = std::move(validated).unwrap();

    const auto user = load_identity(store, parser.value(nameOption));
    qInfo() << "weave: joining" << settings.room << "as" << user.name;

    weave::cli::Session session(settings, user);
    QTextStream out(stdout);

    QObject::connect(&session, &weave::cli::Session::message, &app, [&out](const QString& text) {
        out << text << Qt::endl;
    });
    QObject::connect(&session, &weave::cli::Session::quitRequested, &app, [&session] {
        session.shutdown();
        QCoreApplication::quit();
    });

    QTextStream in(stdin);
    QSocketNotifier notifier(STDIN_FILENO, QSocketNotifier::Read);
    QObject::connect(&notifier, &QSocketNotifier::activated, &app, [&] {
        const QString line = in.readLine();
        if (line.isNull()) {
            notifier.setEnabled(false);
            session.shutdown();
            QCoreApplication::quit();
            return;
        }
        if (line.trimmed().isEmpty()) return;

        auto command = weave::cli::parse_command(line);
        if (command.is_err()) {
            out << QString::fromStdString(command.unwrap_err().message) << Qt::endl;
            return;
        }
        out << session.execute(command.unwrap()) << Qt::endl;
    });

    session.start();
    out << "joined room " << settings.room << " as " << user.name
        << " (type 'help' for commands)" << Qt::endl;

    const int code = app.exec();
    session.shutdown();
    return code;
}
