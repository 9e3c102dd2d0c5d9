#pragma once

#include "cli/commands.hpp"
#include "cli/text_surface.hpp"
#include "core/config.hpp"
#include "crdt/automerge_replica.hpp"
#include "network/sync_transport.hpp"
#include "presence/cursor_broadcaster.hpp"
#include "presence/presence_table.hpp"
#include "presence/status_resolver.hpp"
#include "storage/document_cache.hpp"

#include <QObject>

#include <memory>

namespace weave::cli {

/**
 * Session - one user in one room: replica, presence, cache, transport and
 * the cursor/status layers, wired the way a host editor would wire them.
 */
class Session : public QObject {
    Q_OBJECT

public:
    Session(SyncSettings settings, presence::UserIdentity user,
            network::SocketFactory factory = {}, QObject* parent = nullptr);
    ~Session() override;

    /**
     * Open the cache, hydrate, and start connecting. Cache failures are
     * logged and the session continues without persistence.
     */
    void start();

    /**
     * Leave the room: clear our cursor, stop timers, close the connection,
     * flush the cache.
     */
    void shutdown();

    /**
     * Run one command and return what to print.
     */
    QString execute(const Command& command);

    [[nodiscard]] crdt::AutomergeReplica& replica() { return *replica_; }
    [[nodiscard]] network::SyncTransport& transport() { return *transport_; }
    [[nodiscard]] presence::PresenceTable& presence() { return *presence_; }
    [[nodiscard]] const presence::UserIdentity& user() const { return user_; }

signals:
    void message(const QString& text);
    void quitRequested();

private:
    SyncSettings settings_;
    presence::UserIdentity user_;
    std::unique_ptr<crdt::AutomergeReplica> replica_;
    std::unique_ptr<presence::PresenceTable> presence_;
    std::unique_ptr<storage::DocumentCache> cache_;
    std::unique_ptr<network::SyncTransport> transport_;
    std::unique_ptr<TextSurface> surface_;
    std::unique_ptr<presence::CursorBroadcaster> cursors_;
    std::unique_ptr<presence::PresenceStatusTracker> tracker_;
    QString last_presence_;
    bool shut_down_ = false;
};

} // namespace weave::cli
