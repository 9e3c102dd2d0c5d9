#include <catch2/catch_test_macros.hpp>
#include "core/config.hpp"
#include "core/types.hpp"

#include <QTemporaryDir>

#include <algorithm>
#include <set>

using namespace weave;

namespace {

// Restores the WEAVE_* variables a test touched.
struct EnvGuard {
    ~EnvGuard() {
        for (const char* name : {"WEAVE_SERVER_URL", "WEAVE_ROOM", "WEAVE_CACHE_PATH",
                                 "WEAVE_DISABLE_PERSISTENCE", "WEAVE_MAX_RECONNECT_ATTEMPTS"}) {
            qunsetenv(name);
        }
    }
};

} // namespace

TEST_CASE("SyncSettings defaults", "[config]") {
    const SyncSettings s;
    REQUIRE(s.auto_reconnect);
    REQUIRE(s.reconnect_base_ms == 2000);
    REQUIRE(s.reconnect_cap_ms == 30000);
    REQUIRE(s.max_reconnect_attempts == 5);
    REQUIRE(s.cursor_debounce_ms == 50);
    REQUIRE(s.cursor_inactive_ms == 30000);
    REQUIRE(s.away_timeout_ms == 60000);
    REQUIRE(s.offline_timeout_ms == 300000);
    REQUIRE(s.status_refresh_ms == 10000);
    REQUIRE(s.activity_debounce_ms == 5000);
    REQUIRE(s.enable_offline_persistence);
}

TEST_CASE("SyncSettings load and save through QSettings", "[config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings store(dir.filePath(QStringLiteral("weave.ini")), QSettings::IniFormat);

    SECTION("missing keys keep defaults") {
        const auto s = SyncSettings::load(store);
        REQUIRE(s.room == QStringLiteral("default"));
        REQUIRE(s.max_reconnect_attempts == 5);
    }

    SECTION("saved values come back") {
        SyncSettings s;
        s.server_url = QUrl(QStringLiteral("wss://relay.example.com"));
        s.room = QStringLiteral("notes");
        s.max_reconnect_attempts = 8;
        s.enable_offline_persistence = false;
        s.save(store);

        const auto loaded = SyncSettings::load(store);
        REQUIRE(loaded.server_url == s.server_url);
        REQUIRE(loaded.room == QStringLiteral("notes"));
        REQUIRE(loaded.max_reconnect_attempts == 8);
        REQUIRE_FALSE(loaded.enable_offline_persistence);
    }

    SECTION("non-numeric values fall back") {
        store.setValue(QStringLiteral("sync/awayTimeoutMs"), QStringLiteral("soon"));
        REQUIRE(SyncSettings::load(store).away_timeout_ms == 60000);
    }
}

TEST_CASE("Environment overrides stored settings", "[config]") {
    EnvGuard guard;
    qputenv("WEAVE_SERVER_URL", "https://relay.example.com");
    qputenv("WEAVE_ROOM", " shared ");
    qputenv("WEAVE_DISABLE_PERSISTENCE", "true");
    qputenv("WEAVE_MAX_RECONNECT_ATTEMPTS", "7");

    SyncSettings s;
    s.apply_environment();
    REQUIRE(s.server_url == QUrl(QStringLiteral("https://relay.example.com")));
    REQUIRE(s.room == QStringLiteral("shared"));
    REQUIRE_FALSE(s.enable_offline_persistence);
    REQUIRE(s.max_reconnect_attempts == 7);
}

TEST_CASE("validated() clamps ranges and rejects unusable values", "[config]") {
    SyncSettings s;
    s.room = QStringLiteral("  doc  ");
    s.max_reconnect_attempts = 99;
    s.reconnect_base_ms = 5000;
    s.reconnect_cap_ms = 100;
    s.away_timeout_ms = 1000;
    s.offline_timeout_ms = 10;
    s.status_refresh_ms = 1;

    const auto v = s.validated().unwrap();
    REQUIRE(v.room == QStringLiteral("doc"));
    REQUIRE(v.max_reconnect_attempts == SyncSettings::MAX_RECONNECT_ATTEMPTS);
    REQUIRE(v.reconnect_cap_ms == 5000);
    REQUIRE(v.offline_timeout_ms == 1000);
    REQUIRE(v.status_refresh_ms == 100);

    s.max_reconnect_attempts = 0;
    REQUIRE(s.validated().unwrap().max_reconnect_attempts == SyncSettings::MIN_RECONNECT_ATTEMPTS);

    SyncSettings no_host;
    no_host.server_url = QUrl(QStringLiteral("ws://"));
    REQUIRE(no_host.validated().unwrap_err().is(ErrorCode::InvalidArgument));

    SyncSettings no_room;
    no_room.room = QStringLiteral("   ");
    REQUIRE(no_room.validated().is_err());
}

TEST_CASE("Collaborator colours are stable palette entries", "[types]") {
    REQUIRE(color_for_user("") == "#f44336");
    REQUIRE(color_for_user("a") == "#e91e63");
    REQUIRE(color_for_user("ab") == "#e91e63");
    REQUIRE(color_for_user("user-123") == color_for_user("user-123"));

    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        const auto color = color_for_user("user-" + std::to_string(i));
        REQUIRE(std::find(COLLABORATION_COLORS.begin(), COLLABORATION_COLORS.end(), color)
                != COLLABORATION_COLORS.end());
        seen.insert(color);
    }
    REQUIRE(seen.size() > 8);
}

TEST_CASE("Client ids are non-zero", "[types]") {
    for (int i = 0; i < 100; ++i) {
        REQUIRE(generate_client_id() != 0);
    }
    REQUIRE(std::string(to_string(ConnectionStatus::Reconnecting)) == "reconnecting");
}
