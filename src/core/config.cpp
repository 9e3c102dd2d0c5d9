#include "core/config.hpp"

#include <QDir>
#include <QStandardPaths>
#include <QtGlobal>

#include <algorithm>

namespace weave {
namespace {

constexpr auto kGroup = "sync";

int read_int(QSettings& settings, const char* key, int fallback) {
    bool ok = false;
    const int value = settings.value(QLatin1String(key), fallback).toInt(&ok);
    return ok ? value : fallback;
}

bool env_flag(const char* name) {
    const auto value = qEnvironmentVariable(name).trimmed().toLower();
    return value == QStringLiteral("1") || value == QStringLiteral("true") ||
           value == QStringLiteral("yes");
}

} // namespace

SyncSettings SyncSettings::load(QSettings& settings) {
    SyncSettings s;
    settings.beginGroup(QLatin1String(kGroup));

    const auto url = settings.value(QStringLiteral("serverUrl")).toString();
    if (!url.isEmpty()) {
        s.server_url = QUrl(url);
    }
    const auto room = settings.value(QStringLiteral("room")).toString();
    if (!room.isEmpty()) {
        s.room = room;
    }

    s.auto_reconnect = settings.value(QStringLiteral("autoReconnect"), s.auto_reconnect).toBool();
    s.reconnect_base_ms = read_int(settings, "reconnectDelayMs", s.reconnect_base_ms);
    s.reconnect_cap_ms = read_int(settings, "reconnectCapMs", s.reconnect_cap_ms);
    s.max_reconnect_attempts = read_int(settings, "maxReconnectAttempts", s.max_reconnect_attempts);
    s.initial_connect_delay_ms = read_int(settings, "initialConnectDelayMs", s.initial_connect_delay_ms);
    s.cursor_debounce_ms = read_int(settings, "cursorDebounceMs", s.cursor_debounce_ms);
    s.cursor_inactive_ms = read_int(settings, "cursorInactiveMs", s.cursor_inactive_ms);
    s.away_timeout_ms = read_int(settings, "awayTimeoutMs", s.away_timeout_ms);
    s.offline_timeout_ms = read_int(settings, "offlineTimeoutMs", s.offline_timeout_ms);
    s.status_refresh_ms = read_int(settings, "statusRefreshMs", s.status_refresh_ms);
    s.activity_debounce_ms = read_int(settings, "activityDebounceMs", s.activity_debounce_ms);
    s.enable_offline_persistence =
        settings.value(QStringLiteral("enableOfflinePersistence"), s.enable_offline_persistence).toBool();
    s.cache_path = settings.value(QStringLiteral("cachePath"), s.cache_path).toString();
    s.cache_trim_threshold = read_int(settings, "cacheTrimThreshold", s.cache_trim_threshold);

    settings.endGroup();
    return s;
}

void SyncSettings::save(QSettings& settings) const {
    settings.beginGroup(QLatin1String(kGroup));
    settings.setValue(QStringLiteral("serverUrl"), server_url.toString());
    settings.setValue(QStringLiteral("room"), room);
    settings.setValue(QStringLiteral("autoReconnect"), auto_reconnect);
    settings.setValue(QStringLiteral("reconnectDelayMs"), reconnect_base_ms);
    settings.setValue(QStringLiteral("maxReconnectAttempts"), max_reconnect_attempts);
    settings.setValue(QStringLiteral("enableOfflinePersistence"), enable_offline_persistence);
    if (!cache_path.isEmpty()) {
        settings.setValue(QStringLiteral("cachePath"), cache_path);
    }
    settings.endGroup();
}

void SyncSettings::apply_environment() {
    const auto url = qEnvironmentVariable("WEAVE_SERVER_URL").trimmed();
    if (!url.isEmpty()) {
        server_url = QUrl(url);
    }
    const auto room_env = qEnvironmentVariable("WEAVE_ROOM").trimmed();
    if (!room_env.isEmpty()) {
        room = room_env;
    }
    const auto cache = qEnvironmentVariable("WEAVE_CACHE_PATH").trimmed();
    if (!cache.isEmpty()) {
        cache_path = cache;
    }
    if (env_flag("WEAVE_DISABLE_PERSISTENCE")) {
        enable_offline_persistence = false;
    }
    bool ok = false;
    const int attempts = qEnvironmentVariableIntValue("WEAVE_MAX_RECONNECT_ATTEMPTS", &ok);
    if (ok) {
        max_reconnect_attempts = attempts;
    }
}

Result<SyncSettings, Error> SyncSettings::validated() const {
    if (!server_url.isValid() || server_url.host().isEmpty()) {
        return Result<SyncSettings, Error>::err(
            Error{"Invalid server URL: " + server_url.toString().toStdString(),
                  ErrorCode::InvalidArgument});
    }
    if (room.trimmed().isEmpty()) {
        return Result<SyncSettings, Error>::err(
            Error{"Room must not be empty", ErrorCode::InvalidArgument});
    }

    SyncSettings s = *this;
    s.room = room.trimmed();
    s.max_reconnect_attempts =
        std::clamp(s.max_reconnect_attempts, MIN_RECONNECT_ATTEMPTS, MAX_RECONNECT_ATTEMPTS);
    s.reconnect_base_ms = std::max(1, s.reconnect_base_ms);
    s.reconnect_cap_ms = std::max(s.reconnect_base_ms, s.reconnect_cap_ms);
    s.initial_connect_delay_ms = std::max(0, s.initial_connect_delay_ms);
    s.cursor_debounce_ms = std::max(0, s.cursor_debounce_ms);
    s.cursor_inactive_ms = std::max(1, s.cursor_inactive_ms);
    s.away_timeout_ms = std::max(1, s.away_timeout_ms);
    s.offline_timeout_ms = std::max(s.away_timeout_ms, s.offline_timeout_ms);
    s.status_refresh_ms = std::max(100, s.status_refresh_ms);
    s.activity_debounce_ms = std::max(0, s.activity_debounce_ms);
    s.cache_trim_threshold = std::max(1, s.cache_trim_threshold);
    return Result<SyncSettings, Error>::ok(std::move(s));
}

QString SyncSettings::effective_cache_path() const {
    if (!cache_path.isEmpty()) {
        return cache_path;
    }
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("cache.db"));
}

} // namespace weave
