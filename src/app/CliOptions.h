/**
 * @file CliOptions.h
 * @brief Command line options of floorplan-rooms and their mapping onto
 *        the detection settings
 */
#ifndef FLOORPLAN_APP_CLIOPTIONS_H
#define FLOORPLAN_APP_CLIOPTIONS_H

#include "../core/plan/PlanTypes.h"
#include "../core/room/RoomDetector.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QString>
#include <QStringList>

#include <optional>

namespace floorplan::app {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitNoRoomAtPoint = 2;

struct CliOptions {
    QCommandLineOption output{QStringList{QStringLiteral("o"), QStringLiteral("output")},
                              QStringLiteral("Write the room export to <file> instead of stdout."),
                              QStringLiteral("file")};
    QCommandLineOption mergeEpsilon{QStringLiteral("merge-epsilon"),
                                    QStringLiteral("Endpoint merge distance in meters."),
                                    QStringLiteral("m")};
    QCommandLineOption minArea{QStringLiteral("min-area"),
                               QStringLiteral("Smallest room area kept, in square meters."),
                               QStringLiteral("m2")};
    QCommandLineOption maxSteps{QStringLiteral("max-steps"),
                                QStringLiteral("Step cap for a single face trace."),
                                QStringLiteral("n")};
    QCommandLineOption at{QStringLiteral("at"),
                          QStringLiteral("Print only the room containing the point <x,y>."),
                          QStringLiteral("x,y")};
    QCommandLineOption debug{QStringLiteral("debug"),
                             QStringLiteral("Enable debug logging and print the log file path.")};
    QCommandLineOption noLogFile{QStringLiteral("no-log-file"),
                                 QStringLiteral("Log to stderr only.")};

    void addTo(QCommandLineParser& parser) const;
};

/// Parses "x,y"; whitespace around either number is allowed
std::optional<core::plan::Vec2d> parsePoint(const QString& text);

/**
 * @brief Apply command line detection settings on top of @p config
 *
 * @p config arrives holding the plan file settings (or the defaults); every
 * option that is set replaces the matching field. Negative distances and
 * areas and non-positive step caps are rejected.
 * @return false with @p errorMessage set on the first invalid value
 */
bool applyOverrides(const QCommandLineParser& parser,
                    const CliOptions& options,
                    core::room::RoomDetectorConfig& config,
                    QString& errorMessage);

} // namespace floorplan::app

#endif // FLOORPLAN_APP_CLIOPTIONS_H
