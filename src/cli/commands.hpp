#pragma once

#include "core/result.hpp"
#include "network/sync_transport.hpp"
#include "presence/cursor_broadcaster.hpp"
#include "presence/status_resolver.hpp"

#include <QString>
#include <QStringList>

#include <vector>

namespace weave::cli {

enum class CommandKind {
    Set,        // set <key> <value...>
    Get,        // get <key>
    Select,     // select <key> <anchor> [focus]
    Deselect,
    Who,
    Status,
    Away,
    Back,
    Retry,
    Help,
    Quit
};

struct Command {
    CommandKind kind = CommandKind::Help;
    QStringList args;
};

/**
 * Parse one line of stdin. Blank lines and unknown verbs are errors.
 */
[[nodiscard]] Result<Command> parse_command(const QString& line);

[[nodiscard]] QString help_text();

[[nodiscard]] QString format_state(const network::CollaborationState& state);
[[nodiscard]] QString format_presence(const presence::PresenceSummary& summary);
[[nodiscard]] QString format_cursors(const std::vector<presence::RemoteCursor>& cursors);

} // namespace weave::cli
