#include "presence/status_resolver.hpp"
#include "core/logging.hpp"

namespace weave::presence {

PresenceStatus derivePresenceStatus(qint64 last_active_ms, qint64 now_ms,
                                    const StatusThresholds& thresholds) {
    const qint64 elapsed = now_ms - last_active_ms;
    if (elapsed < thresholds.away_ms) return PresenceStatus::Online;
    if (elapsed < thresholds.offline_ms) return PresenceStatus::Away;
    return PresenceStatus::Offline;
}

qint64 entryLastActive(const PresenceEntry& entry, qint64 fallback_ms) {
    if (entry.cursor && entry.cursor->lastActive > 0) {
        return entry.cursor->lastActive;
    }
    if (entry.lastActive) {
        return *entry.lastActive;
    }
    return fallback_ms;
}

PresenceStatus resolvePresenceStatus(const PresenceEntry& entry, qint64 now_ms,
                                     const StatusThresholds& thresholds) {
    if (entry.status) {
        return *entry.status;
    }
    return derivePresenceStatus(entryLastActive(entry, now_ms), now_ms, thresholds);
}

PresenceSummary summarizePresence(const PresenceTable& table, qint64 now_ms,
                                  const StatusThresholds& thresholds) {
    PresenceSummary summary;
    for (const auto& [client, state] : table.states()) {
        if (client == table.clientId()) {
            continue;
        }
        const auto entry = parsePresenceEntry(client, state);
        if (!entry.user) {
            continue;
        }
        summary.users.push_back(PresenceUser{
            .clientId = client,
            .user = *entry.user,
            .status = resolvePresenceStatus(entry, now_ms, thresholds),
            .lastActive = entryLastActive(entry, now_ms)
        });
    }

    int online = 0;
    for (const auto& u : summary.users) {
        if (u.status == PresenceStatus::Online) ++online;
    }
    summary.onlineCount = online + 1;
    summary.totalCount = static_cast<int>(summary.users.size()) + 1;
    return summary;
}

PresenceStatusTracker::PresenceStatusTracker(PresenceTable* table, UserIdentity user,
                                             Options options, QObject* parent, NowFn now)
    : QObject(parent)
    , table_(table)
    , user_(std::move(user))
    , options_(options)
    , now_(now ? std::move(now) : NowFn(&Timestamp::now))
{
    refresh_timer_.setInterval(options_.refresh_interval_ms);
    connect(&refresh_timer_, &QTimer::timeout, this, &PresenceStatusTracker::refresh);

    activity_timer_.setSingleShot(true);
    activity_timer_.setInterval(options_.activity_debounce_ms);
    connect(&activity_timer_, &QTimer::timeout, this, &PresenceStatusTracker::writeActivity);
}

PresenceStatusTracker::~PresenceStatusTracker() {
    stop();
}

void PresenceStatusTracker::start() {
    if (!table_ || refresh_timer_.isActive()) {
        return;
    }
    // No explicit status; readers derive ours from lastActive.
    table_->setLocalField(fields::user, serializeUser(user_));
    writeActivity();

    table_connection_ = connect(table_, &PresenceTable::updated, this,
                                [this](const PresenceChange&, const crdt::UpdateOrigin&) { refresh(); });
    refresh_timer_.start();
    refresh();
}

void PresenceStatusTracker::stop() {
    refresh_timer_.stop();
    activity_timer_.stop();
    QObject::disconnect(table_connection_);
}

void PresenceStatusTracker::recordActivity(ActivityKind) {
    if (activity_timer_.isActive()) {
        return;
    }
    activity_timer_.start();
}

void PresenceStatusTracker::setVisible(bool visible) {
    if (!visible) {
        setLocalStatus(PresenceStatus::Away);
        return;
    }
    setLocalStatus(PresenceStatus::Online);
    activity_timer_.stop();
    writeActivity();
}

void PresenceStatusTracker::setLocalStatus(PresenceStatus status) {
    if (!table_) return;
    qCDebug(lcPresence) << "presence: local status" << toString(status);
    table_->setLocalField(fields::status, toString(status));
}

void PresenceStatusTracker::writeActivity() {
    if (!table_) return;
    table_->setLocalField(fields::lastActive, static_cast<double>(now_().millis()));
}

void PresenceStatusTracker::refresh() {
    if (!table_) return;
    summary_ = summarizePresence(*table_, now_().millis(), options_.thresholds);
    emit summaryChanged(summary_);
}

} // namespace weave::presence
