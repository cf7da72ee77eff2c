#pragma once

#include <QString>

namespace tandem {

// Installs a Qt message handler that appends every message to a log file.
// Warnings and above are echoed to stderr as well. An empty path selects
// default_log_file_path().
void install_file_logging(const QString& path = {});

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Verbose protocol tracing, enabled by TANDEM_DEBUG_SYNC.
bool sync_debug_enabled();

} // namespace tandem
