#include <catch2/catch_test_macros.hpp>
#include "presence/presence_state.hpp"

#include <QJsonArray>

using namespace weave;
using namespace weave::presence;

TEST_CASE("User identities carry a palette colour derived from the id", "[presence][state]") {
    const auto user = makeUserIdentity(QStringLiteral("user-42"), QStringLiteral("Ada"));
    REQUIRE(user.color == QString::fromStdString(color_for_user("user-42")));
    REQUIRE(makeUserIdentity(QStringLiteral("user-42"), QStringLiteral("Other")).color == user.color);
}

TEST_CASE("Cursor state serialises to the shared presence layout", "[presence][state]") {
    CursorState state;
    state.user = makeUserIdentity(QStringLiteral("u1"), QStringLiteral("Ada"));
    state.cursor = CursorRange{{QStringLiteral("p1"), 2}, {QStringLiteral("p1"), 5}};
    state.selection = SelectionRefs{QStringLiteral("p1"), 2, QStringLiteral("p1"), 5};
    state.lastActive = 1700000000000;

    const auto json = serializeCursorState(state);
    REQUIRE(json.isObject());
    const auto obj = json.toObject();
    REQUIRE(obj.value(QStringLiteral("cursor")).toObject()
                .value(QStringLiteral("focus")).toObject()
                .value(QStringLiteral("offset")).toInt() == 5);
    REQUIRE(obj.value(QStringLiteral("selection")).toObject()
                .value(QStringLiteral("anchorKey")).toString() == QStringLiteral("p1"));

    REQUIRE(parseCursorState(json) == state);
}

TEST_CASE("A cleared cursor is null on the wire", "[presence][state]") {
    REQUIRE(serializeCursorState(std::nullopt).isNull());
    REQUIRE_FALSE(parseCursorState(QJsonValue(QJsonValue::Null)).has_value());

    CursorState collapsed;
    collapsed.user = makeUserIdentity(QStringLiteral("u1"), QStringLiteral("Ada"));
    collapsed.lastActive = 10;
    const auto obj = serializeCursorState(collapsed).toObject();
    REQUIRE(obj.value(QStringLiteral("cursor")).isNull());
    REQUIRE(obj.value(QStringLiteral("selection")).isNull());
}

TEST_CASE("Presence entries tolerate missing and malformed fields", "[presence][state]") {
    SECTION("empty entry") {
        const auto entry = parsePresenceEntry(5, QJsonObject{});
        REQUIRE(entry.clientId == 5);
        REQUIRE_FALSE(entry.user.has_value());
        REQUIRE_FALSE(entry.cursor.has_value());
        REQUIRE_FALSE(entry.status.has_value());
        REQUIRE_FALSE(entry.lastActive.has_value());
    }

    SECTION("wrong types are ignored") {
        const QJsonObject state{
            {fields::user, QStringLiteral("not an object")},
            {fields::status, QStringLiteral("sleeping")},
            {fields::lastActive, QJsonArray{}},
        };
        const auto entry = parsePresenceEntry(5, state);
        REQUIRE_FALSE(entry.user.has_value());
        REQUIRE_FALSE(entry.status.has_value());
        REQUIRE_FALSE(entry.lastActive.has_value());
    }

    SECTION("activity stamps outside the exact millisecond range are ignored") {
        for (const double stamp : {1e300, -1e300, -5.0, 0.5, 9007199254740994.0}) {
            const auto entry = parsePresenceEntry(5, QJsonObject{{fields::lastActive, stamp}});
            REQUIRE_FALSE(entry.lastActive.has_value());

            CursorState cursor;
            cursor.lastActive = 1;
            auto wire = serializeCursorState(cursor).toObject();
            wire.insert(QStringLiteral("lastActive"), stamp);
            REQUIRE(parseCursorState(wire)->lastActive == 0);
        }
        const auto entry = parsePresenceEntry(5, QJsonObject{{fields::lastActive, 9007199254740992.0}});
        REQUIRE(entry.lastActive == 9007199254740992LL);
    }

    SECTION("activity stamped inside the user object is used as a fallback") {
        auto user = serializeUser(makeUserIdentity(QStringLiteral("u1"), QStringLiteral("Ada")));
        user.insert(fields::lastActive, 1234.0);
        const auto entry = parsePresenceEntry(5, QJsonObject{{fields::user, user}});
        REQUIRE(entry.lastActive == 1234);
    }

    SECTION("explicit status") {
        const auto entry = parsePresenceEntry(5, QJsonObject{{fields::status, QStringLiteral("away")}});
        REQUIRE(entry.status == PresenceStatus::Away);
    }
}

TEST_CASE("Status strings round-trip", "[presence][state]") {
    for (auto status : {PresenceStatus::Online, PresenceStatus::Away, PresenceStatus::Offline}) {
        REQUIRE(parsePresenceStatus(toString(status)) == status);
    }
    REQUIRE_FALSE(parsePresenceStatus(QStringLiteral("busy")).has_value());
}
