/**
 * @file Logging.h
 * @brief Process-wide Qt message handler for the floor plan tools
 *
 * Routes every qDebug/qInfo/qWarning through one formatter and writes the
 * result to stderr and to a per-run log file. stdout stays reserved for
 * command output.
 */
#ifndef FLOORPLAN_APP_LOGGING_H
#define FLOORPLAN_APP_LOGGING_H

#include <QString>

namespace floorplan::app {

struct LoggingOptions {
    /// Enable every debug category
    bool debug = false;

    /// Also write to a log file under FLOORPLAN_LOG_DIR (or the app data dir)
    bool writeLogFile = true;
};

class Logging {
public:
    /**
     * @brief Install the message handler and open the run log
     *
     * Environment overrides: FLOORPLAN_LOG_DIR (log directory),
     * FLOORPLAN_LOG_DEBUG (enable all debug output) and
     * FLOORPLAN_LOG_DEBUG_CATEGORIES (comma separated category patterns with
     * debug output when debug is otherwise off).
     *
     * A log file that cannot be created degrades to stderr-only logging.
     */
    static void initialize(const QString& appName, const LoggingOptions& options);

    static void shutdown();

    /// Empty when no log file is open
    static QString logFilePath();
};

} // namespace floorplan::app

#endif // FLOORPLAN_APP_LOGGING_H
