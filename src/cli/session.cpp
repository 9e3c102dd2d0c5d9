#include "cli/session.hpp"
#include "core/logging.hpp"

namespace weave::cli {

Session::Session(SyncSettings settings, presence::UserIdentity user,
                 network::SocketFactory factory, QObject* parent)
    : QObject(parent)
    , settings_(std::move(settings))
    , user_(std::move(user))
    , replica_(std::make_unique<crdt::AutomergeReplica>())
    , presence_(std::make_unique<presence::PresenceTable>(generate_client_id()))
{
    network::SyncTransport::Options transport_options{
        .server_url = settings_.server_url,
        .room = settings_.room,
        .user = user_,
        .policy = network::ReconnectPolicy(settings_.reconnect_base_ms,
                                           settings_.reconnect_cap_ms,
                                           settings_.max_reconnect_attempts),
        .auto_reconnect = settings_.auto_reconnect,
        .initial_connect_delay_ms = settings_.initial_connect_delay_ms,
    };
    transport_ = std::make_unique<network::SyncTransport>(
        replica_.get(), presence_.get(), std::move(transport_options), std::move(factory));

    surface_ = std::make_unique<TextSurface>(replica_.get());
    cursors_ = std::make_unique<presence::CursorBroadcaster>(
        presence_.get(), surface_.get(), user_,
        presence::CursorBroadcaster::Options{settings_.cursor_debounce_ms,
                                             settings_.cursor_inactive_ms});

    presence::PresenceStatusTracker::Options tracker_options;
    tracker_options.thresholds = presence::StatusThresholds{settings_.away_timeout_ms,
                                                            settings_.offline_timeout_ms};
    tracker_options.refresh_interval_ms = settings_.status_refresh_ms;
    tracker_options.activity_debounce_ms = settings_.activity_debounce_ms;
    tracker_ = std::make_unique<presence::PresenceStatusTracker>(
        presence_.get(), user_, tracker_options);

    // New or removed lines move everyone's cursors.
    connect(replica_.get(), &crdt::DocumentReplica::updated,
            cursors_.get(), &presence::CursorBroadcaster::layoutChanged);

    transport_->onStatus([this](ConnectionStatus status) {
        emit message(QStringLiteral("* %1").arg(QString::fromLatin1(to_string(status))));
    });
    transport_->onSynced([this](bool synced) {
        if (synced) {
            emit message(QStringLiteral("* synced"));
        }
    });
    connect(tracker_.get(), &presence::PresenceStatusTracker::summaryChanged, this,
            [this](const presence::PresenceSummary& summary) {
                const QString text = format_presence(summary).trimmed();
                if (text != last_presence_) {
                    last_presence_ = text;
                    emit message(text);
                }
            });
}

Session::~Session() {
    shutdown();
}

void Session::start() {
    if (settings_.enable_offline_persistence) {
        cache_ = std::make_unique<storage::DocumentCache>(
            settings_.room.toStdString(), replica_.get(),
            storage::DocumentCache::Options{settings_.cache_trim_threshold});
        auto opened = cache_->open(settings_.effective_cache_path().toStdString());
        if (opened.is_err()) {
            qCWarning(lcStorage) << "session: continuing without cache:"
                                 << QString::fromStdString(opened.unwrap_err().message);
        }
        connect(cache_.get(), &storage::DocumentCache::errorOccurred, this,
                [this](const QString& error) { emit message(QStringLiteral("! cache: %1").arg(error)); });
        transport_->setCache(cache_.get());
    }

    tracker_->start();
    transport_->start();
    if (cache_) {
        cache_->hydrate();
    }
}

void Session::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;

    cursors_->detach();
    tracker_->stop();
    transport_->destroy();
    if (cache_) {
        cache_->flush();
    }
}

QString Session::execute(const Command& command) {
    switch (command.kind) {
    case CommandKind::Set:
        replica_->setText(command.args.at(0).toStdString(), command.args.at(1).toStdString());
        tracker_->recordActivity(presence::ActivityKind::KeyDown);
        return QStringLiteral("ok");

    case CommandKind::Get: {
        const auto text = replica_->text(command.args.at(0).toStdString());
        return text ? QString::fromStdString(*text) : QStringLiteral("(unset)");
    }

    case CommandKind::Select: {
        const QString key = command.args.at(0);
        const int anchor = command.args.at(1).toInt();
        const int focus = command.args.size() > 2 ? command.args.at(2).toInt() : anchor;
        surface_->setSelection(presence::CursorRange{{key, anchor}, {key, focus}});
        cursors_->selectionChanged();
        tracker_->recordActivity(presence::ActivityKind::PointerDown);
        return QStringLiteral("ok");
    }

    case CommandKind::Deselect:
        surface_->clearSelection();
        cursors_->selectionChanged();
        return QStringLiteral("ok");

    case CommandKind::Who:
        tracker_->refresh();
        cursors_->recompute();
        return format_presence(tracker_->summary()) + format_cursors(cursors_->remoteCursors());

    case CommandKind::Status:
        return format_state(transport_->state());

    case CommandKind::Away:
        tracker_->setVisible(false);
        return QStringLiteral("away");

    case CommandKind::Back:
        tracker_->setVisible(true);
        return QStringLiteral("online");

    case CommandKind::Retry:
        transport_->connectToRelay();
        return QString::fromLatin1(to_string(transport_->status()));

    case CommandKind::Help:
        return help_text();

    case CommandKind::Quit:
        emit quitRequested();
        return QStringLiteral("bye");
    }
    return {};
}

} // namespace weave::cli
