#pragma once

#include <QLoggingCategory>
#include <QString>

namespace tidesync {

Q_DECLARE_LOGGING_CATEGORY(tidesyncSyncLog)
Q_DECLARE_LOGGING_CATEGORY(tidesyncSchedulerLog)
Q_DECLARE_LOGGING_CATEGORY(tidesyncRemoteLog)
Q_DECLARE_LOGGING_CATEGORY(tidesyncConflictLog)
Q_DECLARE_LOGGING_CATEGORY(tidesyncStorageLog)

// Installs a Qt message handler that appends every message to the log file
// as "<utc time> <level> <category> <message>".
void install_file_logging();

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// True when TIDESYNC_DEBUG_SYNC is set.
bool sync_debug_requested();

// Turns on debug output for all tidesync.* categories.
void enable_sync_debug_logging();

} // namespace tidesync
