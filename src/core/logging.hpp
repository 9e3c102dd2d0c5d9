#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcSync)
Q_DECLARE_LOGGING_CATEGORY(lcPresence)
Q_DECLARE_LOGGING_CATEGORY(lcStorage)
Q_DECLARE_LOGGING_CATEGORY(lcRelay)

namespace weave {

// Turns on debug output for every weave.* category. Called for --debug-sync
// and when WEAVE_DEBUG_SYNC is set.
void enable_debug_logging();

// True when WEAVE_DEBUG_SYNC is set in the environment.
bool sync_debug_enabled();

// Installs a Qt message handler that appends to a log file. An empty path
// uses default_log_file_path(). Messages still reach stderr.
void install_file_logging(const QString& path = {});

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

} // namespace weave
