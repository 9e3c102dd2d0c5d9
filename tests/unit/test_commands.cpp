#include <catch2/catch_test_macros.hpp>
#include "cli/commands.hpp"
#include "cli/text_surface.hpp"

using namespace weave;
using namespace weave::cli;
using weave::presence::TextPoint;

TEST_CASE("parse_command recognises every verb", "[cli]") {
    SECTION("set keeps the spaces inside the value") {
        const auto cmd = parse_command(QStringLiteral("set title  Hello shared   world")).unwrap();
        REQUIRE(cmd.kind == CommandKind::Set);
        REQUIRE(cmd.args == QStringList{QStringLiteral("title"), QStringLiteral("Hello shared world")});
    }

    SECTION("verbs are case-insensitive") {
        REQUIRE(parse_command(QStringLiteral("WHO")).unwrap().kind == CommandKind::Who);
        REQUIRE(parse_command(QStringLiteral("  Quit ")).unwrap().kind == CommandKind::Quit);
    }

    SECTION("select takes one or two offsets") {
        auto caret = parse_command(QStringLiteral("select body 4")).unwrap();
        REQUIRE(caret.kind == CommandKind::Select);
        REQUIRE(caret.args.size() == 2);
        REQUIRE(parse_command(QStringLiteral("select body 4 9")).unwrap().args.size() == 3);
    }

    SECTION("errors") {
        REQUIRE(parse_command(QStringLiteral("   ")).is_err());
        REQUIRE(parse_command(QStringLiteral("dance")).unwrap_err().is(ErrorCode::InvalidArgument));
        REQUIRE(parse_command(QStringLiteral("get")).is_err());
        REQUIRE(parse_command(QStringLiteral("get a b")).is_err());
        REQUIRE(parse_command(QStringLiteral("set onlykey")).is_err());
        REQUIRE(parse_command(QStringLiteral("select body -1")).is_err());
        REQUIRE(parse_command(QStringLiteral("select body x")).is_err());
        REQUIRE(parse_command(QStringLiteral("status now")).is_err());
    }
}

TEST_CASE("Formatting helpers", "[cli]") {
    network::CollaborationState state;
    state.status = ConnectionStatus::Error;
    state.error = QStringLiteral("Unable to reach relay");
    const auto text = format_state(state);
    REQUIRE(text.contains(QStringLiteral("status: error")));
    REQUIRE(text.contains(QStringLiteral("Unable to reach relay")));

    presence::PresenceSummary summary;
    summary.users.push_back(presence::PresenceUser{
        .clientId = 2,
        .user = presence::makeUserIdentity(QStringLiteral("b"), QStringLiteral("Bea")),
        .status = presence::PresenceStatus::Away,
        .lastActive = 0});
    summary.onlineCount = 1;
    summary.totalCount = 2;
    const auto who = format_presence(summary);
    REQUIRE(who.startsWith(QStringLiteral("1 online, 2 total")));
    REQUIRE(who.contains(QStringLiteral("Bea [away]")));

    presence::RemoteCursor hidden;
    hidden.user.name = QStringLiteral("Cy");
    hidden.cursor = presence::CursorRange{{QStringLiteral("gone"), 0}, {QStringLiteral("gone"), 1}};
    REQUIRE(format_cursors({hidden}).contains(QStringLiteral("gone (not visible), idle")));
}

TEST_CASE("TextSurface lays lines out on a character grid", "[cli]") {
    crdt::AutomergeReplica replica;
    replica.setText("a-title", "Hello");
    replica.setText("b-body", "Shared text");
    TextSurface surface(&replica);

    REQUIRE(surface.containsNode(QStringLiteral("b-body")));
    REQUIRE_FALSE(surface.containsNode(QStringLiteral("missing")));
    REQUIRE_FALSE(surface.caretRect({QStringLiteral("missing"), 0}).has_value());

    const auto caret = surface.caretRect({QStringLiteral("b-body"), 3});
    REQUIRE(caret.has_value());
    REQUIRE(caret->x() == 3 * TextSurface::CHAR_WIDTH);
    REQUIRE(caret->y() == TextSurface::LINE_HEIGHT);

    // Offsets past the end of a line are clamped.
    REQUIRE(surface.caretRect({QStringLiteral("a-title"), 99})->x() == 5 * TextSurface::CHAR_WIDTH);

    SECTION("a range over two lines yields one rect per line, in either direction") {
        const TextPoint end{QStringLiteral("b-body"), 6};
        const TextPoint start{QStringLiteral("a-title"), 2};
        const auto forward = surface.rangeRects(start, end);
        REQUIRE(forward.size() == 2);
        REQUIRE(forward[0] == QRectF(2 * TextSurface::CHAR_WIDTH, 0, 3 * TextSurface::CHAR_WIDTH,
                                     TextSurface::LINE_HEIGHT));
        REQUIRE(forward[1] == QRectF(0, TextSurface::LINE_HEIGHT, 6 * TextSurface::CHAR_WIDTH,
                                     TextSurface::LINE_HEIGHT));
        REQUIRE(surface.rangeRects(end, start) == forward);
    }

    SECTION("selection bookkeeping") {
        REQUIRE_FALSE(surface.currentSelection().has_value());
        surface.setSelection({{QStringLiteral("a-title"), 0}, {QStringLiteral("a-title"), 2}});
        REQUIRE(surface.currentSelection()->focus.offset == 2);
        surface.clearSelection();
        REQUIRE_FALSE(surface.currentSelection().has_value());
    }
}
