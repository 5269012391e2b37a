/**
 * @file PlanIO.h
 * @brief Plan file reading/writing and room export
 *
 * A plan file is a UTF-8 JSON object:
 * - format: "floorplan"
 * - version: file format version (current: 1)
 * - name: plan name
 * - walls: array of walls (see Wall::serialize)
 * - detection: optional room detection settings
 */
#ifndef FLOORPLAN_IO_PLAN_IO_H
#define FLOORPLAN_IO_PLAN_IO_H

#include "../core/plan/FloorPlan.h"
#include "../core/room/RoomDetector.h"

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include <memory>

namespace floorplan::io {

/**
 * @brief Contents of a plan file
 */
struct PlanDocument {
    std::unique_ptr<core::plan::FloorPlan> plan;

    /// File settings layered over the defaults
    core::room::RoomDetectorConfig detection;
};

class PlanIO {
public:
    static constexpr int kFormatVersion = 1;

    /**
     * @brief Load a plan file from disk
     * @return false with @p errorMessage set when the file cannot be read or
     *         is not a valid plan
     */
    static bool loadPlan(const QString& path, PlanDocument& document, QString& errorMessage);

    /**
     * @brief Parse plan file contents
     */
    static bool parsePlan(const QByteArray& data, PlanDocument& document, QString& errorMessage);

    static bool savePlan(const QString& path, const PlanDocument& document, QString& errorMessage);

    static QJsonObject serializePlan(const PlanDocument& document);

    static QJsonObject serializeDetectionConfig(const core::room::RoomDetectorConfig& config);

    /**
     * @brief Overlay the keys present in @p json onto @p config
     * @return false when a present key has the wrong type or an out of
     *         range value; @p config is unchanged then
     */
    static bool deserializeDetectionConfig(const QJsonObject& json,
                                           core::room::RoomDetectorConfig& config,
                                           QString& errorMessage);

    /**
     * @brief Room export: rooms with derived measures plus run statistics
     */
    static QJsonObject serializeRooms(const core::room::RoomDetectionResult& result);

    static QJsonObject serializeRoom(const core::room::DetectedRoom& room);

    /**
     * @brief Write JSON to @p path, or to stdout when @p path is empty
     */
    static bool writeJson(const QString& path, const QJsonObject& json, QString& errorMessage);
};

} // namespace floorplan::io

#endif // FLOORPLAN_IO_PLAN_IO_H
