#pragma once

#include "core/result.hpp"

#include <QSettings>
#include <QString>
#include <QUrl>

namespace weave {

/**
 * SyncSettings - every tunable of a collaboration session.
 *
 * Sources, later ones win: built-in defaults, QSettings group "sync",
 * WEAVE_* environment variables, then whatever the caller assigns
 * (command-line options). validated() clamps the result.
 */
struct SyncSettings {
    QUrl server_url{QStringLiteral("ws://127.0.0.1:1234")};
    QString room{QStringLiteral("default")};

    // Reconnection
    bool auto_reconnect = true;
    int reconnect_base_ms = 2000;
    int reconnect_cap_ms = 30000;
    int max_reconnect_attempts = 5;
    int initial_connect_delay_ms = 0;

    // Cursor broadcast
    int cursor_debounce_ms = 50;
    int cursor_inactive_ms = 30000;

    // Presence status
    int away_timeout_ms = 60000;
    int offline_timeout_ms = 300000;
    int status_refresh_ms = 10000;
    int activity_debounce_ms = 5000;

    // Local durable cache
    bool enable_offline_persistence = true;
    QString cache_path;
    int cache_trim_threshold = 500;

    static constexpr int MIN_RECONNECT_ATTEMPTS = 1;
    static constexpr int MAX_RECONNECT_ATTEMPTS = 10;

    /**
     * Read the "sync" group; missing keys keep their defaults.
     */
    static SyncSettings load(QSettings& settings);

    /**
     * Persist the user-facing subset (server, room, reconnect, persistence).
     */
    void save(QSettings& settings) const;

    /**
     * Apply WEAVE_SERVER_URL, WEAVE_ROOM, WEAVE_CACHE_PATH,
     * WEAVE_DISABLE_PERSISTENCE and WEAVE_MAX_RECONNECT_ATTEMPTS.
     */
    void apply_environment();

    /**
     * Clamp numeric ranges. Fails only on values that cannot be repaired
     * (an unusable server URL or an empty room).
     */
    [[nodiscard]] Result<SyncSettings, Error> validated() const;

    /**
     * Cache file used when cache_path is empty: <AppLocalData>/cache.db.
     */
    [[nodiscard]] QString effective_cache_path() const;
};

} // namespace weave
