/**
 * @file main.cpp
 * @brief floorplan-rooms: detect the rooms of a plan file
 *
 * Usage: floorplan-rooms [options] <plan.json>
 *
 * Exit codes: 0 success (also when no rooms are found), 1 load or argument
 * failure, 2 when --at names a point outside every room.
 */

#include "CliOptions.h"
#include "Logging.h"
#include "../core/room/RoomDetector.h"
#include "../io/PlanIO.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QStringList>

#include <algorithm>
#include <iostream>
#include <optional>

Q_LOGGING_CATEGORY(logMain, "floorplan.main")

namespace {

using floorplan::app::CliOptions;
using floorplan::app::kExitFailure;
using floorplan::app::kExitNoRoomAtPoint;
using floorplan::app::kExitOk;
using floorplan::core::plan::Vec2d;
using floorplan::core::room::RoomDetectorConfig;

int runDetection(const QCommandLineParser& parser, const CliOptions& options) {
    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        std::cerr << "Expected exactly one plan file" << std::endl;
        std::cerr << parser.helpText().toStdString();
        return kExitFailure;
    }

    std::optional<Vec2d> queryPoint;
    if (parser.isSet(options.at)) {
        queryPoint = floorplan::app::parsePoint(parser.value(options.at));
        if (!queryPoint) {
            std::cerr << "Invalid --at '" << parser.value(options.at).toStdString()
                      << "', expected x,y" << std::endl;
            return kExitFailure;
        }
    }

    QString errorMessage;
    floorplan::io::PlanDocument document;
    if (!floorplan::io::PlanIO::loadPlan(positional.front(), document, errorMessage)) {
        std::cerr << errorMessage.toStdString() << std::endl;
        return kExitFailure;
    }

    RoomDetectorConfig config = document.detection;
    if (!floorplan::app::applyOverrides(parser, options, config, errorMessage)) {
        std::cerr << errorMessage.toStdString() << std::endl;
        return kExitFailure;
    }

    floorplan::core::room::RoomDetector detector(config);
    const auto result = detector.detect(*document.plan);
    qCInfo(logMain) << "detect:done"
                    << "plan=" << QString::fromStdString(document.plan->name())
                    << "walls=" << document.plan->getWallCount()
                    << "rooms=" << result.rooms.size();

    QJsonObject output;
    if (queryPoint) {
        const auto& rooms = result.rooms;
        auto it = std::find_if(rooms.begin(), rooms.end(),
                               [&](const floorplan::core::room::DetectedRoom& room) {
                                   return room.contains(*queryPoint);
                               });
        if (it == rooms.end()) {
            qCInfo(logMain) << "at:no-room" << "x=" << queryPoint->x << "y=" << queryPoint->y;
            return kExitNoRoomAtPoint;
        }
        output = floorplan::io::PlanIO::serializeRoom(*it);
    } else {
        output = floorplan::io::PlanIO::serializeRooms(result);
    }

    if (!floorplan::io::PlanIO::writeJson(parser.value(options.output), output, errorMessage)) {
        std::cerr << errorMessage.toStdString() << std::endl;
        return kExitFailure;
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("floorplan-rooms"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Detect the rooms enclosed by the walls of a floor plan."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("plan"), QStringLiteral("Plan file (JSON)."));

    CliOptions options;
    options.addTo(parser);
    parser.process(app);

    floorplan::app::LoggingOptions loggingOptions;
    loggingOptions.debug = parser.isSet(options.debug);
    loggingOptions.writeLogFile = !parser.isSet(options.noLogFile);
    floorplan::app::Logging::initialize(QCoreApplication::applicationName(), loggingOptions);
    if (loggingOptions.debug) {
        const QString logPath = floorplan::app::Logging::logFilePath();
        std::cerr << "Log file: " << (logPath.isEmpty() ? std::string("<none>") : logPath.toStdString())
                  << std::endl;
    }

    const int exitCode = runDetection(parser, options);
    floorplan::app::Logging::shutdown();
    return exitCode;
}
