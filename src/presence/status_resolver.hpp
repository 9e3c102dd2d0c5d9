#pragma once

#include "core/types.hpp"
#include "presence/presence_state.hpp"
#include "presence/presence_table.hpp"

#include <QObject>
#include <QPointer>
#include <QTimer>

#include <optional>
#include <vector>

namespace weave::presence {

struct StatusThresholds {
    qint64 away_ms = 60000;
    qint64 offline_ms = 300000;
};

/**
 * online while now - last_active < away, away while < offline, else offline.
 */
[[nodiscard]] PresenceStatus derivePresenceStatus(qint64 last_active_ms, qint64 now_ms,
                                                  const StatusThresholds& thresholds);

/**
 * Activity time of an entry: cursor.lastActive, then the entry's lastActive,
 * then `fallback_ms` (an entry that never reported activity counts as fresh).
 */
[[nodiscard]] qint64 entryLastActive(const PresenceEntry& entry, qint64 fallback_ms);

/**
 * Explicit status wins; otherwise derived from entryLastActive().
 */
[[nodiscard]] PresenceStatus resolvePresenceStatus(const PresenceEntry& entry, qint64 now_ms,
                                                   const StatusThresholds& thresholds);

struct PresenceUser {
    ClientId clientId = 0;
    UserIdentity user;
    PresenceStatus status = PresenceStatus::Online;
    qint64 lastActive = 0;
};

/**
 * Everyone but us, plus counts that include us.
 */
struct PresenceSummary {
    std::vector<PresenceUser> users;
    int onlineCount = 1;
    int totalCount = 1;

    [[nodiscard]] bool hasOtherUsers() const { return !users.empty(); }
};

/**
 * Remote entries that carry a user object, resolved at `now_ms`.
 */
[[nodiscard]] PresenceSummary summarizePresence(const PresenceTable& table, qint64 now_ms,
                                                const StatusThresholds& thresholds);

enum class ActivityKind { PointerMove, PointerDown, KeyDown, Scroll, TouchStart };

/**
 * PresenceStatusTracker - keeps the local entry's activity fields current and
 * recomputes everyone's status on a fixed cadence.
 *
 * Activity is written at most once per activity debounce window: the first
 * event arms a timer, later events are ignored until it fires. Visibility
 * changes bypass the debounce.
 */
class PresenceStatusTracker : public QObject {
    Q_OBJECT

public:
    struct Options {
        StatusThresholds thresholds;
        int refresh_interval_ms = 10000;
        int activity_debounce_ms = 5000;
    };

    PresenceStatusTracker(PresenceTable* table, UserIdentity user, Options options,
                          QObject* parent = nullptr, NowFn now = {});
    ~PresenceStatusTracker() override;

    /**
     * Publish the user and a fresh activity stamp, then start the refresh
     * timer. Status is left to be derived until visibility sets one.
     */
    void start();
    void stop();

    void recordActivity(ActivityKind kind);
    void setVisible(bool visible);

    /**
     * Publish an explicit status. It overrides derived status for everyone
     * reading our entry.
     */
    void setLocalStatus(PresenceStatus status);

    [[nodiscard]] const PresenceSummary& summary() const { return summary_; }
    [[nodiscard]] bool activityPending() const { return activity_timer_.isActive(); }
    [[nodiscard]] bool isRunning() const { return refresh_timer_.isActive(); }

public slots:
    void refresh();

signals:
    void summaryChanged(const weave::presence::PresenceSummary& summary);

private:
    void writeActivity();

    QPointer<PresenceTable> table_;
    UserIdentity user_;
    Options options_;
    NowFn now_;
    QTimer refresh_timer_;
    QTimer activity_timer_;
    PresenceSummary summary_;
    QMetaObject::Connection table_connection_;
};

} // namespace weave::presence
