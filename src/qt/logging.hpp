#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(sortidEntropyLog)

namespace sortid::qt {

// Installs a Qt message handler that appends every message to `path`.
// Returns false if the file could not be opened; the handler is not
// installed in that case.
bool install_file_logging(const QString& path);

// Restores the handler that was active before install_file_logging.
void uninstall_file_logging();

// SORTID_LOG_FILE, or an empty string when unset.
QString log_file_path_from_env();

} // namespace sortid::qt
