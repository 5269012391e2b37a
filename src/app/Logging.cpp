#include "Logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMessageLogContext>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QTextStream>
#include <QThread>

#include <cstdlib>
#include <exception>
#include <iostream>

namespace floorplan::app {
namespace {

QMutex gLogMutex;
QFile gLogFile;
QString gLogFilePath;
QtMessageHandler gPreviousHandler = nullptr;
std::terminate_handler gPreviousTerminateHandler = nullptr;
bool gInitialized = false;

constexpr int kLogRetentionDays = 30;
constexpr int kMaxRunLogFiles = 30;

const char* levelName(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:
            return "DEBUG";
        case QtInfoMsg:
            return "INFO";
        case QtWarningMsg:
            return "WARN";
        case QtCriticalMsg:
            return "ERROR";
        case QtFatalMsg:
            return "FATAL";
    }
    return "UNKNOWN";
}

bool isEnabledFlag(const QString& value) {
    const QString normalized = value.trimmed().toLower();
    return normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on";
}

QStringList debugCategoriesFromEnvironment() {
    QStringList categories;
    const QString configured = qEnvironmentVariable("FLOORPLAN_LOG_DEBUG_CATEGORIES");
    for (const QString& token : configured.split(',', Qt::SkipEmptyParts)) {
        const QString category = token.trimmed();
        if (!category.isEmpty()) {
            categories.push_back(category);
        }
    }
    categories.removeDuplicates();
    return categories;
}

bool applyFilterRules(bool debug) {
    const bool debugEnabled = debug || isEnabledFlag(qEnvironmentVariable("FLOORPLAN_LOG_DEBUG"));

    QStringList rules;
    rules << QStringLiteral("*.info=true")
          << QStringLiteral("*.warning=true")
          << QStringLiteral("*.critical=true");

    if (debugEnabled) {
        rules << QStringLiteral("floorplan.*.debug=true");
    } else {
        rules << QStringLiteral("*.debug=false");
        for (const QString& category : debugCategoriesFromEnvironment()) {
            rules << QStringLiteral("%1.debug=true").arg(category);
        }
    }
    // Qt's own categories stay quiet even in debug runs.
    rules << QStringLiteral("qt.*.debug=false");

    QLoggingCategory::setFilterRules(rules.join('\n'));
    return debugEnabled;
}

QString formatMessage(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString timestamp = QDateTime::currentDateTime().toString(Qt::ISODateWithMs);
    const QString threadId = QString::number(reinterpret_cast<quintptr>(QThread::currentThreadId()), 16);
    const QString location = (context.file && context.line > 0)
                                 ? QStringLiteral("%1:%2").arg(QFileInfo(QString::fromUtf8(context.file)).fileName())
                                       .arg(context.line)
                                 : QStringLiteral("<unknown>");
    const QString function = context.function ? QString::fromUtf8(context.function) : QStringLiteral("<unknown>");
    const QString category = context.category ? QString::fromUtf8(context.category) : QStringLiteral("default");

    return QStringLiteral("%1 [%2] [tid=0x%3] [%4] [%5] [%6] %7")
        .arg(timestamp,
             QString::fromLatin1(levelName(type)),
             threadId,
             category,
             location,
             function,
             msg);
}

void appendToLogFile(const QString& line) {
    QMutexLocker lock(&gLogMutex);
    if (!gLogFile.isOpen()) {
        return;
    }
    QTextStream stream(&gLogFile);
    stream << line << Qt::endl;
    gLogFile.flush();
}

void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString formatted = formatMessage(type, context, msg);
    appendToLogFile(formatted);
    std::cerr << formatted.toStdString() << std::endl;

    if (type == QtFatalMsg) {
        std::abort();
    }
}

void terminateHandler() {
    const QString message = QStringLiteral("%1 [FATAL] [terminate] Unhandled exception triggered std::terminate")
                                .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs));
    appendToLogFile(message);
    std::cerr << message.toStdString() << std::endl;

    if (gPreviousTerminateHandler != nullptr) {
        gPreviousTerminateHandler();
    }
    std::abort();
}

QString logDirectoryPath() {
    const QString overridePath = qEnvironmentVariable("FLOORPLAN_LOG_DIR").trimmed();
    if (!overridePath.isEmpty()) {
        return overridePath;
    }
    const QString appDataPath = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (!appDataPath.isEmpty()) {
        return QDir(appDataPath).filePath(QStringLiteral("logs"));
    }
    return QDir::current().filePath(QStringLiteral("logs"));
}

// Drops run logs older than the retention window, then the oldest beyond
// the file cap. The current run's log is never removed.
void pruneOldLogs(const QDir& dir, const QString& currentLogPath) {
    const QDateTime cutoff = QDateTime::currentDateTime().addDays(-kLogRetentionDays);
    const QFileInfoList newestFirst = dir.entryInfoList(QStringList() << QStringLiteral("*.log"),
                                                        QDir::Files,
                                                        QDir::Time);
    int retained = 0;
    int removed = 0;
    for (const QFileInfo& fileInfo : newestFirst) {
        const QString path = fileInfo.absoluteFilePath();
        if (path == currentLogPath) {
            ++retained;
            continue;
        }
        const bool expired = fileInfo.lastModified().isValid() && fileInfo.lastModified() < cutoff;
        if (expired || retained >= kMaxRunLogFiles) {
            if (QFile::remove(path)) {
                ++removed;
            }
            continue;
        }
        ++retained;
    }

    if (removed > 0) {
        qInfo().noquote() << "Log retention applied"
                          << "removed=" << removed
                          << "days=" << kLogRetentionDays
                          << "maxFiles=" << kMaxRunLogFiles;
    }
}

bool openRunLog(const QString& appName, QString& directoryOut) {
    const QString dirPath = logDirectoryPath();
    QDir dir(dirPath);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        std::cerr << "Failed to create log directory: " << dirPath.toStdString() << std::endl;
        return false;
    }

    const QString fileName = QStringLiteral("%1_%2_%3.log")
                                 .arg(appName.toLower(),
                                      QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss_zzz")))
                                 .arg(QCoreApplication::applicationPid());
    gLogFilePath = QFileInfo(dir.filePath(fileName)).absoluteFilePath();
    gLogFile.setFileName(gLogFilePath);
    if (!gLogFile.open(QIODevice::WriteOnly | QIODevice::Text)) {
        std::cerr << "Failed to open log file: " << gLogFilePath.toStdString() << std::endl;
        gLogFilePath.clear();
        return false;
    }
    directoryOut = dir.absolutePath();
    return true;
}

} // namespace

void Logging::initialize(const QString& appName, const LoggingOptions& options) {
    QString initializedLogFilePath;
    QString directory;
    bool debugEnabled = false;

    {
        QMutexLocker lock(&gLogMutex);
        if (gInitialized) {
            return;
        }

        debugEnabled = applyFilterRules(options.debug);
        if (options.writeLogFile && !openRunLog(appName, directory)) {
            std::cerr << "Continuing with stderr logging only" << std::endl;
        }

        gPreviousHandler = qInstallMessageHandler(messageHandler);
        gPreviousTerminateHandler = std::set_terminate(terminateHandler);
        gInitialized = true;
        initializedLogFilePath = gLogFilePath;
    }

    qInfo().noquote() << "Logging initialized"
                      << "logFile=" << (initializedLogFilePath.isEmpty() ? QStringLiteral("<none>")
                                                                       : initializedLogFilePath)
                      << "debugLogsEnabled=" << debugEnabled;

    if (!initializedLogFilePath.isEmpty()) {
        pruneOldLogs(QDir(directory), initializedLogFilePath);
    }
}

void Logging::shutdown() {
    QString closingLogFilePath;
    {
        QMutexLocker lock(&gLogMutex);
        if (!gInitialized) {
            return;
        }
        closingLogFilePath = gLogFilePath;
    }

    qInfo().noquote() << "Logging shutdown" << "logFile=" << closingLogFilePath;

    QMutexLocker lock(&gLogMutex);
    qInstallMessageHandler(gPreviousHandler);
    gPreviousHandler = nullptr;
    std::set_terminate(gPreviousTerminateHandler);
    gPreviousTerminateHandler = nullptr;

    if (gLogFile.isOpen()) {
        gLogFile.flush();
        gLogFile.close();
    }
    gLogFilePath.clear();
    gInitialized = false;
}

QString Logging::logFilePath() {
    QMutexLocker lock(&gLogMutex);
    return gLogFilePath;
}

} // namespace floorplan::app
