/**
 * @file PlanIO.cpp
 * @brief Implementation of plan file serialization and room export
 */

#include "PlanIO.h"
#include "../core/room/RegionUtils.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QSaveFile>

#include <cmath>
#include <cstdio>
#include <initializer_list>

namespace floorplan::io {

using core::plan::FloorPlan;
using core::room::DetectedRoom;
using core::room::RoomDetectionResult;
using core::room::RoomDetectorConfig;

Q_LOGGING_CATEGORY(logPlanIO, "floorplan.io.plan")

namespace {

const QString kFormatName = QStringLiteral("floorplan");

QJsonObject pointToJson(double x, double y) {
    QJsonObject obj;
    obj["x"] = x;
    obj["y"] = y;
    return obj;
}

QJsonArray idsToJson(const std::vector<core::plan::WallID>& ids) {
    QJsonArray array;
    for (const auto& id : ids) {
        array.append(QString::fromStdString(id));
    }
    return array;
}

QJsonObject statsToJson(const core::room::RoomDetectionStats& stats) {
    QJsonObject json;
    json["nodes"] = static_cast<qint64>(stats.nodeCount);
    json["edges"] = static_cast<qint64>(stats.edgeCount);
    json["degenerateWalls"] = idsToJson(stats.degenerateWallIds);
    json["collapsedWalls"] = idsToJson(stats.collapsedWallIds);
    json["tracedFaces"] = static_cast<qint64>(stats.tracedFaces);
    json["abortedTraces"] = static_cast<qint64>(stats.abortedTraces);
    json["duplicateFaces"] = static_cast<qint64>(stats.duplicateFaces);
    json["uniqueFaces"] = static_cast<qint64>(stats.uniqueFaces);
    json["exteriorFaces"] = static_cast<qint64>(stats.exteriorFaces);
    json["degenerateFaces"] = static_cast<qint64>(stats.degenerateFaces);
    return json;
}

} // anonymous namespace

bool PlanIO::loadPlan(const QString& path, PlanDocument& document, QString& errorMessage) {
    qCInfo(logPlanIO) << "loadPlan:start" << "path=" << path;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        errorMessage = QString("Cannot open %1: %2").arg(path, file.errorString());
        qCWarning(logPlanIO) << "loadPlan:open-failed" << "path=" << path << "error=" << file.errorString();
        return false;
    }
    const QByteArray data = file.readAll();
    if (!parsePlan(data, document, errorMessage)) {
        qCWarning(logPlanIO) << "loadPlan:parse-failed" << "path=" << path << "error=" << errorMessage;
        return false;
    }
    qCInfo(logPlanIO) << "loadPlan:done"
                      << "walls=" << document.plan->getWallCount();
    return true;
}

bool PlanIO::parsePlan(const QByteArray& data, PlanDocument& document, QString& errorMessage) {
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        errorMessage = QString("Invalid JSON at offset %1: %2")
                           .arg(parseError.offset)
                           .arg(parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        errorMessage = "Plan file root must be a JSON object";
        return false;
    }

    const QJsonObject root = doc.object();
    if (root.contains("format") && root["format"].toString() != kFormatName) {
        errorMessage = QString("Unknown format '%1'").arg(root["format"].toString());
        return false;
    }
    if (root.contains("version")) {
        if (!root["version"].isDouble()) {
            errorMessage = "Plan version must be a number";
            return false;
        }
        const double version = root["version"].toDouble();
        if (version != std::floor(version)) {
            errorMessage = QString("Plan version must be a whole number, got %1").arg(version);
            return false;
        }
        if (version > kFormatVersion) {
            errorMessage = QString("Unsupported plan version %1 (newest supported: %2)")
                               .arg(version)
                               .arg(kFormatVersion);
            return false;
        }
    }

    RoomDetectorConfig detection;
    if (root.contains("detection")) {
        if (!root["detection"].isObject()) {
            errorMessage = "Plan detection settings must be an object";
            return false;
        }
        if (!deserializeDetectionConfig(root["detection"].toObject(), detection, errorMessage)) {
            return false;
        }
    }

    std::unique_ptr<FloorPlan> plan = FloorPlan::deserialize(root, errorMessage);
    if (!plan) {
        return false;
    }

    document.plan = std::move(plan);
    document.detection = detection;
    qCDebug(logPlanIO) << "parsePlan:done"
                       << "name=" << QString::fromStdString(document.plan->name())
                       << "walls=" << document.plan->getWallCount();
    return true;
}

bool PlanIO::savePlan(const QString& path, const PlanDocument& document, QString& errorMessage) {
    if (!document.plan) {
        errorMessage = "No plan to save";
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        errorMessage = QString("Cannot write %1: %2").arg(path, file.errorString());
        qCWarning(logPlanIO) << "savePlan:open-failed" << "path=" << path;
        return false;
    }
    file.write(QJsonDocument(serializePlan(document)).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        errorMessage = QString("Cannot write %1: %2").arg(path, file.errorString());
        qCWarning(logPlanIO) << "savePlan:commit-failed" << "path=" << path;
        return false;
    }
    qCInfo(logPlanIO) << "savePlan:done" << "path=" << path
                      << "walls=" << document.plan->getWallCount();
    return true;
}

QJsonObject PlanIO::serializePlan(const PlanDocument& document) {
    QJsonObject root;
    root["format"] = kFormatName;
    root["version"] = kFormatVersion;
    if (document.plan) {
        document.plan->serialize(root);
    }
    root["detection"] = serializeDetectionConfig(document.detection);
    return root;
}

QJsonObject PlanIO::serializeDetectionConfig(const RoomDetectorConfig& config) {
    QJsonObject json;
    json["mergeEpsilon"] = config.mergeEpsilon;
    json["minRoomArea"] = config.minRoomArea;
    json["maxTraceSteps"] = config.maxTraceSteps;
    return json;
}

bool PlanIO::deserializeDetectionConfig(const QJsonObject& json,
                                        RoomDetectorConfig& config,
                                        QString& errorMessage) {
    RoomDetectorConfig result = config;
    for (const char* name : {"mergeEpsilon", "minRoomArea", "maxTraceSteps"}) {
        const QLatin1String key(name);
        if (json.contains(key) && !json[key].isDouble()) {
            errorMessage = QString("Detection setting '%1' must be a number").arg(key);
            return false;
        }
    }

    if (json.contains("mergeEpsilon")) {
        result.mergeEpsilon = json["mergeEpsilon"].toDouble();
        if (result.mergeEpsilon < 0.0) {
            errorMessage = "Detection setting 'mergeEpsilon' must not be negative";
            return false;
        }
    }
    if (json.contains("minRoomArea")) {
        result.minRoomArea = json["minRoomArea"].toDouble();
        if (result.minRoomArea < 0.0) {
            errorMessage = "Detection setting 'minRoomArea' must not be negative";
            return false;
        }
    }
    if (json.contains("maxTraceSteps")) {
        result.maxTraceSteps = json["maxTraceSteps"].toInt();
        if (result.maxTraceSteps <= 0) {
            errorMessage = "Detection setting 'maxTraceSteps' must be positive";
            return false;
        }
    }

    config = result;
    return true;
}

QJsonObject PlanIO::serializeRoom(const DetectedRoom& room) {
    QJsonObject json;
    json["wallIds"] = idsToJson(room.wallIds);

    QJsonArray polygon;
    for (const auto& vertex : room.polygon) {
        polygon.append(pointToJson(vertex.x, vertex.y));
    }
    json["polygon"] = polygon;
    json["area"] = room.area;
    json["perimeter"] = core::room::polygonPerimeter(room.polygon);

    const auto centroid = core::room::computeCentroid(room.polygon);
    json["centroid"] = pointToJson(centroid.x, centroid.y);
    return json;
}

QJsonObject PlanIO::serializeRooms(const RoomDetectionResult& result) {
    QJsonArray rooms;
    for (const auto& room : result.rooms) {
        rooms.append(serializeRoom(room));
    }

    QJsonObject json;
    json["rooms"] = rooms;
    json["stats"] = statsToJson(result.stats);
    return json;
}

bool PlanIO::writeJson(const QString& path, const QJsonObject& json, QString& errorMessage) {
    const QByteArray bytes = QJsonDocument(json).toJson(QJsonDocument::Indented);

    if (path.isEmpty()) {
        QFile out;
        if (!out.open(stdout, QIODevice::WriteOnly)) {
            errorMessage = "Cannot write to standard output";
            return false;
        }
        if (out.write(bytes) != bytes.size()) {
            errorMessage = QString("Cannot write to standard output: %1").arg(out.errorString());
            return false;
        }
        out.flush();
        return true;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        errorMessage = QString("Cannot write %1: %2").arg(path, file.errorString());
        qCWarning(logPlanIO) << "writeJson:open-failed" << "path=" << path;
        return false;
    }
    file.write(bytes);
    if (!file.commit()) {
        errorMessage = QString("Cannot write %1: %2").arg(path, file.errorString());
        qCWarning(logPlanIO) << "writeJson:commit-failed" << "path=" << path;
        return false;
    }
    qCDebug(logPlanIO) << "writeJson:done" << "path=" << QFileInfo(path).absoluteFilePath()
                       << "bytes=" << bytes.size();
    return true;
}

} // namespace floorplan::io
