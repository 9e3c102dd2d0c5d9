#include "presence/presence_state.hpp"

#include <cmath>

namespace weave::presence {

namespace {

QJsonObject serializePoint(const TextPoint& point) {
    QJsonObject obj;
    obj.insert(QStringLiteral("key"), point.key);
    obj.insert(QStringLiteral("offset"), point.offset);
    return obj;
}

std::optional<TextPoint> parsePoint(const QJsonValue& value) {
    if (!value.isObject()) {
        return std::nullopt;
    }
    const auto obj = value.toObject();
    const auto key = obj.value(QStringLiteral("key")).toString();
    if (key.isEmpty()) {
        return std::nullopt;
    }
    return TextPoint{key, obj.value(QStringLiteral("offset")).toInt(0)};
}

// Largest integer a JSON number carries exactly.
constexpr double MAX_EXACT_MILLIS = 9007199254740992.0;

std::optional<qint64> parseMillis(const QJsonValue& value) {
    if (!value.isDouble()) {
        return std::nullopt;
    }
    const double raw = value.toDouble();
    if (!std::isfinite(raw) || raw < 1.0 || raw > MAX_EXACT_MILLIS) {
        return std::nullopt;
    }
    return static_cast<qint64>(raw);
}

} // namespace

UserIdentity makeUserIdentity(const QString& id, const QString& name) {
    return UserIdentity{
        .id = id,
        .name = name,
        .color = QString::fromStdString(color_for_user(id.toStdString()))
    };
}

QString toString(PresenceStatus status) {
    switch (status) {
        case PresenceStatus::Online: return QStringLiteral("online");
        case PresenceStatus::Away: return QStringLiteral("away");
        case PresenceStatus::Offline: return QStringLiteral("offline");
    }
    return QStringLiteral("offline");
}

std::optional<PresenceStatus> parsePresenceStatus(const QString& text) {
    if (text == QStringLiteral("online")) return PresenceStatus::Online;
    if (text == QStringLiteral("away")) return PresenceStatus::Away;
    if (text == QStringLiteral("offline")) return PresenceStatus::Offline;
    return std::nullopt;
}

QJsonObject serializeUser(const UserIdentity& user) {
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), user.id);
    obj.insert(QStringLiteral("name"), user.name);
    obj.insert(QStringLiteral("color"), user.color);
    return obj;
}

std::optional<UserIdentity> parseUser(const QJsonValue& value) {
    if (!value.isObject()) {
        return std::nullopt;
    }
    const auto obj = value.toObject();
    UserIdentity out;
    out.id = obj.value(QStringLiteral("id")).toString();
    if (out.id.isEmpty()) {
        return std::nullopt;
    }
    out.name = obj.value(QStringLiteral("name")).toString();
    out.color = obj.value(QStringLiteral("color")).toString();
    if (out.color.isEmpty()) {
        out.color = QString::fromStdString(color_for_user(out.id.toStdString()));
    }
    return out;
}

QJsonValue serializeCursorState(const std::optional<CursorState>& state) {
    if (!state) {
        return QJsonValue(QJsonValue::Null);
    }

    QJsonObject obj;
    obj.insert(QStringLiteral("user"), serializeUser(state->user));
    if (state->cursor) {
        QJsonObject range;
        range.insert(QStringLiteral("anchor"), serializePoint(state->cursor->anchor));
        range.insert(QStringLiteral("focus"), serializePoint(state->cursor->focus));
        obj.insert(QStringLiteral("cursor"), range);
    } else {
        obj.insert(QStringLiteral("cursor"), QJsonValue(QJsonValue::Null));
    }
    if (state->selection) {
        QJsonObject sel;
        sel.insert(QStringLiteral("anchorKey"), state->selection->anchorKey);
        sel.insert(QStringLiteral("anchorOffset"), state->selection->anchorOffset);
        sel.insert(QStringLiteral("focusKey"), state->selection->focusKey);
        sel.insert(QStringLiteral("focusOffset"), state->selection->focusOffset);
        obj.insert(QStringLiteral("selection"), sel);
    } else {
        obj.insert(QStringLiteral("selection"), QJsonValue(QJsonValue::Null));
    }
    obj.insert(QStringLiteral("lastActive"), static_cast<double>(state->lastActive));
    return obj;
}

std::optional<CursorState> parseCursorState(const QJsonValue& value) {
    if (!value.isObject()) {
        return std::nullopt;
    }
    const auto obj = value.toObject();

    CursorState out;
    if (auto user = parseUser(obj.value(QStringLiteral("user")))) {
        out.user = *user;
    }

    const auto range = obj.value(QStringLiteral("cursor"));
    if (range.isObject()) {
        auto anchor = parsePoint(range.toObject().value(QStringLiteral("anchor")));
        auto focus = parsePoint(range.toObject().value(QStringLiteral("focus")));
        if (anchor && focus) {
            out.cursor = CursorRange{*anchor, *focus};
        }
    }

    const auto sel = obj.value(QStringLiteral("selection"));
    if (sel.isObject()) {
        const auto s = sel.toObject();
        SelectionRefs refs{
            .anchorKey = s.value(QStringLiteral("anchorKey")).toString(),
            .anchorOffset = s.value(QStringLiteral("anchorOffset")).toInt(0),
            .focusKey = s.value(QStringLiteral("focusKey")).toString(),
            .focusOffset = s.value(QStringLiteral("focusOffset")).toInt(0)
        };
        if (!refs.anchorKey.isEmpty() && !refs.focusKey.isEmpty()) {
            out.selection = refs;
        }
    }

    out.lastActive = parseMillis(obj.value(QStringLiteral("lastActive"))).value_or(0);
    return out;
}

PresenceEntry parsePresenceEntry(ClientId client, const QJsonObject& state) {
    PresenceEntry entry;
    entry.clientId = client;
    entry.user = parseUser(state.value(fields::user));
    entry.cursor = parseCursorState(state.value(fields::cursor));
    entry.status = parsePresenceStatus(state.value(fields::status).toString());
    entry.lastActive = parseMillis(state.value(fields::lastActive));
    if (!entry.lastActive && state.value(fields::user).isObject()) {
        // Older clients stamp activity inside the user object.
        entry.lastActive = parseMillis(state.value(fields::user).toObject().value(fields::lastActive));
    }
    return entry;
}

} // namespace weave::presence
