#pragma once

#include "core/types.hpp"

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <optional>

namespace weave::presence {

/**
 * Who a collaborator is. Injected by the host; never derived by the engine.
 */
struct UserIdentity {
    QString id;
    QString name;
    QString color;

    bool operator==(const UserIdentity&) const = default;
};

/**
 * Build an identity with the palette colour for the id.
 */
[[nodiscard]] UserIdentity makeUserIdentity(const QString& id, const QString& name);

/**
 * A point in the editing surface. `key` is an opaque node reference.
 */
struct TextPoint {
    QString key;
    int offset = 0;

    bool operator==(const TextPoint&) const = default;
};

struct CursorRange {
    TextPoint anchor;
    TextPoint focus;

    bool operator==(const CursorRange&) const = default;
};

struct SelectionRefs {
    QString anchorKey;
    int anchorOffset = 0;
    QString focusKey;
    int focusOffset = 0;

    bool operator==(const SelectionRefs&) const = default;
};

/**
 * What a client publishes under the "cursor" presence field.
 */
struct CursorState {
    UserIdentity user;
    std::optional<CursorRange> cursor;
    std::optional<SelectionRefs> selection;
    qint64 lastActive = 0;

    bool operator==(const CursorState&) const = default;
};

enum class PresenceStatus { Online, Away, Offline };

[[nodiscard]] QString toString(PresenceStatus status);
[[nodiscard]] std::optional<PresenceStatus> parsePresenceStatus(const QString& text);

/**
 * Typed view of one presence table entry.
 *
 * Table layout: {"user": {...}, "cursor": CursorState|null,
 *                "status": "online"|"away"|"offline", "lastActive": ms}
 */
struct PresenceEntry {
    ClientId clientId = 0;
    std::optional<UserIdentity> user;
    std::optional<CursorState> cursor;
    std::optional<PresenceStatus> status;
    std::optional<qint64> lastActive;
};

namespace fields {
inline const QString user = QStringLiteral("user");
inline const QString cursor = QStringLiteral("cursor");
inline const QString status = QStringLiteral("status");
inline const QString lastActive = QStringLiteral("lastActive");
} // namespace fields

[[nodiscard]] QJsonObject serializeUser(const UserIdentity& user);
[[nodiscard]] std::optional<UserIdentity> parseUser(const QJsonValue& value);

// Null when the cursor is cleared.
[[nodiscard]] QJsonValue serializeCursorState(const std::optional<CursorState>& state);
[[nodiscard]] std::optional<CursorState> parseCursorState(const QJsonValue& value);

// Unknown or malformed fields are left empty rather than failing the entry.
[[nodiscard]] PresenceEntry parsePresenceEntry(ClientId client, const QJsonObject& state);

} // namespace weave::presence
