#include "cli/commands.hpp"

#include <QDateTime>

namespace weave::cli {

namespace {

struct Verb {
    const char* name;
    CommandKind kind;
    int min_args;
    int max_args;   // -1: unbounded
};

constexpr Verb VERBS[] = {
    {"set", CommandKind::Set, 2, -1},
    {"get", CommandKind::Get, 1, 1},
    {"select", CommandKind::Select, 2, 3},
    {"deselect", CommandKind::Deselect, 0, 0},
    {"who", CommandKind::Who, 0, 0},
    {"status", CommandKind::Status, 0, 0},
    {"away", CommandKind::Away, 0, 0},
    {"back", CommandKind::Back, 0, 0},
    {"retry", CommandKind::Retry, 0, 0},
    {"help", CommandKind::Help, 0, 0},
    {"quit", CommandKind::Quit, 0, 0},
};

[[nodiscard]] bool is_offset(const QString& text) {
    bool ok = false;
    const int value = text.toInt(&ok);
    return ok && value >= 0;
}

} // namespace

Result<Command> parse_command(const QString& line) {
    const auto words = line.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (words.isEmpty()) {
        return Result<Command>::err(Error{"Empty command", ErrorCode::InvalidArgument});
    }

    const QString verb = words.first().toLower();
    for (const auto& candidate : VERBS) {
        if (verb != QLatin1String(candidate.name)) continue;

        QStringList args = words.mid(1);
        const int count = static_cast<int>(args.size());
        if (count < candidate.min_args
            || (candidate.max_args >= 0 && count > candidate.max_args)) {
            return Result<Command>::err(Error{
                ("Wrong number of arguments for '" + verb + "'").toStdString(),
                ErrorCode::InvalidArgument});
        }
        if (candidate.kind == CommandKind::Set) {
            // The value keeps its inner spaces.
            args = QStringList{args.first(), args.mid(1).join(QLatin1Char(' '))};
        }
        if (candidate.kind == CommandKind::Select) {
            for (int i = 1; i < count; ++i) {
                if (!is_offset(args.at(i))) {
                    return Result<Command>::err(Error{
                        ("Not an offset: " + args.at(i)).toStdString(),
                        ErrorCode::InvalidArgument});
                }
            }
        }
        return Result<Command>::ok(Command{candidate.kind, args});
    }

    return Result<Command>::err(Error{("Unknown command: " + verb).toStdString(),
                                      ErrorCode::InvalidArgument});
}

QString help_text() {
    return QStringLiteral(
        "set <key> <value>          write a line of the shared document\n"
        "get <key>                  print a line\n"
        "select <key> <a> [<f>]     move the local selection\n"
        "deselect                   clear the local selection\n"
        "who                        list collaborators and their cursors\n"
        "status                     connection and sync state\n"
        "away | back                change local visibility\n"
        "retry                      reconnect after giving up\n"
        "quit                       leave the room\n");
}

QString format_state(const network::CollaborationState& state) {
    QString out = QStringLiteral("status: %1%2\n")
                      .arg(QString::fromLatin1(to_string(state.status)),
                           state.synced ? QStringLiteral(" (synced)") : QString());
    if (state.lastSyncedAt) {
        out += QStringLiteral("last synced: %1\n")
                   .arg(QDateTime::fromMSecsSinceEpoch(state.lastSyncedAt->millis())
                            .toString(Qt::ISODate));
    }
    if (state.error) {
        out += QStringLiteral("error: %1\n").arg(*state.error);
    }
    out += QStringLiteral("users: %1\n").arg(state.users.size());
    return out;
}

QString format_presence(const presence::PresenceSummary& summary) {
    QString out = QStringLiteral("%1 online, %2 total\n")
                      .arg(summary.onlineCount)
                      .arg(summary.totalCount);
    for (const auto& user : summary.users) {
        out += QStringLiteral("  %1 [%2] %3\n")
                   .arg(user.user.name, presence::toString(user.status), user.user.color);
    }
    return out;
}

QString format_cursors(const std::vector<presence::RemoteCursor>& cursors) {
    QString out;
    for (const auto& cursor : cursors) {
        out += QStringLiteral("  %1: ").arg(cursor.user.name);
        if (!cursor.cursor) {
            out += QStringLiteral("no selection");
        } else if (!cursor.position) {
            out += QStringLiteral("%1 (not visible)").arg(cursor.cursor->focus.key);
        } else {
            out += QStringLiteral("%1:%2 at (%3, %4)")
                       .arg(cursor.cursor->focus.key)
                       .arg(cursor.cursor->focus.offset)
                       .arg(cursor.position->x)
                       .arg(cursor.position->y);
            if (!cursor.selectionRects.empty()) {
                out += QStringLiteral(", %1 highlighted").arg(cursor.selectionRects.size());
            }
        }
        if (!cursor.isActive) {
            out += QStringLiteral(", idle");
        }
        out += QLatin1Char('\n');
    }
    return out;
}

} // namespace weave::cli
