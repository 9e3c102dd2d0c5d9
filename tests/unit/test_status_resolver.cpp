#include <catch2/catch_test_macros.hpp>
#include "presence/status_resolver.hpp"

#include <QTest>

using namespace weave;
using namespace weave::presence;
using weave::crdt::UpdateOrigin;

namespace {

constexpr qint64 NOW = 1'700'000'000'000;
const StatusThresholds THRESHOLDS{60'000, 300'000};

PresenceEntry entryActiveAt(qint64 last_active) {
    PresenceEntry entry;
    entry.clientId = 9;
    entry.lastActive = last_active;
    return entry;
}

QJsonObject remoteState(const QString& id, const QString& name, qint64 last_active,
                        std::optional<QString> status = std::nullopt) {
    QJsonObject state{
        {fields::user, serializeUser(makeUserIdentity(id, name))},
        {fields::lastActive, static_cast<double>(last_active)},
    };
    if (status) {
        state.insert(fields::status, *status);
    }
    return state;
}

// Pushes a remote client's state into `table` as if it arrived over the wire.
void addRemote(PresenceTable& table, ClientId client, const QJsonObject& state) {
    PresenceTable peer(client);
    peer.setLocalState(state);
    REQUIRE(table.applyUpdate(peer.encodeUpdate({client}), UpdateOrigin::remote(1)).is_ok());
}

} // namespace

TEST_CASE("Derived status follows the away and offline thresholds", "[presence][status]") {
    REQUIRE(resolvePresenceStatus(entryActiveAt(NOW - 59'999), NOW, THRESHOLDS) == PresenceStatus::Online);
    REQUIRE(resolvePresenceStatus(entryActiveAt(NOW - 60'000), NOW, THRESHOLDS) == PresenceStatus::Away);
    REQUIRE(resolvePresenceStatus(entryActiveAt(NOW - 299'999), NOW, THRESHOLDS) == PresenceStatus::Away);
    REQUIRE(resolvePresenceStatus(entryActiveAt(NOW - 300'000), NOW, THRESHOLDS) == PresenceStatus::Offline);
}

TEST_CASE("An explicit status wins over the derived one", "[presence][status]") {
    auto entry = entryActiveAt(NOW - 1'000'000);
    entry.status = PresenceStatus::Online;
    REQUIRE(resolvePresenceStatus(entry, NOW, THRESHOLDS) == PresenceStatus::Online);

    auto fresh = entryActiveAt(NOW);
    fresh.status = PresenceStatus::Away;
    REQUIRE(resolvePresenceStatus(fresh, NOW, THRESHOLDS) == PresenceStatus::Away);
}

TEST_CASE("Cursor activity is preferred over the entry stamp", "[presence][status]") {
    auto entry = entryActiveAt(NOW - 400'000);
    entry.cursor = CursorState{};
    entry.cursor->lastActive = NOW - 1'000;
    REQUIRE(entryLastActive(entry, NOW) == NOW - 1'000);
    REQUIRE(resolvePresenceStatus(entry, NOW, THRESHOLDS) == PresenceStatus::Online);

    SECTION("no stamp at all counts as fresh") {
        REQUIRE(entryLastActive(PresenceEntry{}, NOW) == NOW);
    }
}

TEST_CASE("summarizePresence lists remote users and counts us", "[presence][status]") {
    PresenceTable table(1);
    addRemote(table, 2, remoteState(QStringLiteral("u2"), QStringLiteral("Bea"), NOW - 1'000));
    addRemote(table, 3, remoteState(QStringLiteral("u3"), QStringLiteral("Cy"), NOW - 120'000));
    addRemote(table, 4, remoteState(QStringLiteral("u4"), QStringLiteral("Di"), NOW,
                                    QStringLiteral("away")));
    addRemote(table, 5, QJsonObject{{QStringLiteral("cursor"), QJsonValue::Null}});

    const auto summary = summarizePresence(table, NOW, THRESHOLDS);
    REQUIRE(summary.users.size() == 3);
    REQUIRE(summary.users[0].status == PresenceStatus::Online);
    REQUIRE(summary.users[1].status == PresenceStatus::Away);
    REQUIRE(summary.users[2].status == PresenceStatus::Away);
    REQUIRE(summary.onlineCount == 2);
    REQUIRE(summary.totalCount == 4);
    REQUIRE(summary.hasOtherUsers());
}

TEST_CASE("PresenceStatusTracker keeps the local entry current", "[presence][status]") {
    qint64 now = NOW;
    PresenceTable table(1);
    const auto me = makeUserIdentity(QStringLiteral("me"), QStringLiteral("Me"));

    PresenceStatusTracker::Options options;
    options.thresholds = THRESHOLDS;
    options.refresh_interval_ms = 10'000;
    options.activity_debounce_ms = 30;
    PresenceStatusTracker tracker(&table, me, options, nullptr, [&] { return Timestamp(now); });

    tracker.start();
    REQUIRE(tracker.isRunning());
    auto local = parsePresenceEntry(1, *table.localState());
    REQUIRE(local.user == me);
    REQUIRE_FALSE(local.status.has_value());
    REQUIRE(local.lastActive == NOW);
    REQUIRE(resolvePresenceStatus(local, NOW, THRESHOLDS) == PresenceStatus::Online);

    SECTION("activity is written once per debounce window") {
        const auto clock_before = *table.clockOf(1);
        now = NOW + 1'000;
        tracker.recordActivity(ActivityKind::KeyDown);
        tracker.recordActivity(ActivityKind::PointerMove);
        tracker.recordActivity(ActivityKind::Scroll);
        REQUIRE(tracker.activityPending());
        REQUIRE(*table.clockOf(1) == clock_before);

        REQUIRE(QTest::qWaitFor([&] { return !tracker.activityPending(); }, 1000));
        REQUIRE(*table.clockOf(1) == clock_before + 1);
        REQUIRE(parsePresenceEntry(1, *table.localState()).lastActive == NOW + 1'000);
    }

    SECTION("hiding sets away at once; showing bypasses the debounce") {
        tracker.setVisible(false);
        REQUIRE(parsePresenceEntry(1, *table.localState()).status == PresenceStatus::Away);

        tracker.recordActivity(ActivityKind::PointerDown);
        now = NOW + 5'000;
        tracker.setVisible(true);
        local = parsePresenceEntry(1, *table.localState());
        REQUIRE(local.status == PresenceStatus::Online);
        REQUIRE(local.lastActive == NOW + 5'000);
        REQUIRE_FALSE(tracker.activityPending());
    }

    SECTION("refresh decays remote users without any new update") {
        qint64 peer_now = NOW;
        PresenceTable peer(2);
        PresenceStatusTracker peer_tracker(&peer, makeUserIdentity(QStringLiteral("u2"), QStringLiteral("Bea")),
                                           options, nullptr, [&] { return Timestamp(peer_now); });
        peer_tracker.start();
        REQUIRE(table.applyUpdate(peer.encodeUpdate({2}), UpdateOrigin::remote(1)).is_ok());
        REQUIRE(tracker.summary().users.size() == 1);
        REQUIRE(tracker.summary().users[0].status == PresenceStatus::Online);

        // The peer goes quiet; nothing new arrives from it.
        peer_tracker.stop();
        now = NOW + 61'000;
        tracker.refresh();
        REQUIRE(tracker.summary().users[0].status == PresenceStatus::Away);

        now = NOW + 301'000;
        tracker.refresh();
        REQUIRE(tracker.summary().users[0].status == PresenceStatus::Offline);
        REQUIRE(tracker.summary().onlineCount == 1);
    }

    tracker.stop();
    REQUIRE_FALSE(tracker.isRunning());
}
