#include "CliOptions.h"

namespace floorplan::app {

void CliOptions::addTo(QCommandLineParser& parser) const {
    parser.addOptions({output, mergeEpsilon, minArea, maxSteps, at, debug, noLogFile});
}

std::optional<core::plan::Vec2d> parsePoint(const QString& text) {
    const QStringList parts = text.split(',');
    if (parts.size() != 2) {
        return std::nullopt;
    }
    bool okX = false;
    bool okY = false;
    core::plan::Vec2d point{parts[0].trimmed().toDouble(&okX), parts[1].trimmed().toDouble(&okY)};
    if (!okX || !okY) {
        return std::nullopt;
    }
    return point;
}

bool applyOverrides(const QCommandLineParser& parser,
                    const CliOptions& options,
                    core::room::RoomDetectorConfig& config,
                    QString& errorMessage) {
    if (parser.isSet(options.mergeEpsilon)) {
        bool ok = false;
        const double value = parser.value(options.mergeEpsilon).toDouble(&ok);
        if (!ok || value < 0.0) {
            errorMessage = QString("Invalid --merge-epsilon '%1'").arg(parser.value(options.mergeEpsilon));
            return false;
        }
        config.mergeEpsilon = value;
    }
    if (parser.isSet(options.minArea)) {
        bool ok = false;
        const double value = parser.value(options.minArea).toDouble(&ok);
        if (!ok || value < 0.0) {
            errorMessage = QString("Invalid --min-area '%1'").arg(parser.value(options.minArea));
            return false;
        }
        config.minRoomArea = value;
    }
    if (parser.isSet(options.maxSteps)) {
        bool ok = false;
        const int value = parser.value(options.maxSteps).toInt(&ok);
        if (!ok || value <= 0) {
            errorMessage = QString("Invalid --max-steps '%1'").arg(parser.value(options.maxSteps));
            return false;
        }
        config.maxTraceSteps = value;
    }
    return true;
}

} // namespace floorplan::app
