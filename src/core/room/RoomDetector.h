/**
 * @file RoomDetector.h
 * @brief Automatic room detection from wall centerlines
 *
 * Rooms are the bounded faces of the planar graph induced by the walls:
 *
 * 1. Merge wall endpoints closer than the merge epsilon into graph nodes
 * 2. Sort every node's neighbors by outgoing edge angle
 * 3. Trace one face per unvisited directed edge (see FaceTracer)
 * 4. Drop repeated faces, the unbounded face and zero-area artifacts
 * 5. Map each remaining face back to its walls; sort rooms by area
 *
 * Detection never fails. Imperfect geometry (zero-length walls, dangling
 * walls, gaps wider than the merge epsilon) silently produces fewer rooms;
 * the statistics in RoomDetectionResult tell a caller why.
 */
#ifndef FLOORPLAN_CORE_ROOM_ROOM_DETECTOR_H
#define FLOORPLAN_CORE_ROOM_ROOM_DETECTOR_H

#include "RoomGraph.h"

#include <optional>
#include <string>
#include <vector>

namespace floorplan::core::plan {
class FloorPlan;
} // namespace floorplan::core::plan

namespace floorplan::core::room {

/**
 * @brief Enclosed region bounded by walls
 */
struct DetectedRoom {
    /// Walls along the boundary, each listed once, in boundary order
    std::vector<pl::WallID> wallIds;

    /// Boundary vertices in face order, clockwise, last vertex not repeated
    std::vector<pl::Vec2d> polygon;

    /// Floor area in square meters, never negative
    double area = 0.0;

    bool contains(const pl::Vec2d& point) const;
};

/**
 * @brief Counters describing one detection run
 */
struct RoomDetectionStats {
    size_t nodeCount = 0;
    size_t edgeCount = 0;

    /// Walls whose endpoints merged into a single node
    std::vector<pl::WallID> degenerateWallIds;

    /// Walls connecting a node pair an earlier wall already connected. They
    /// never appear in a room's wallIds; overlapping walls are usually an
    /// editing mistake worth surfacing to the user.
    std::vector<pl::WallID> collapsedWallIds;

    size_t tracedFaces = 0;

    /// Traces that hit a dead end or the step cap
    size_t abortedTraces = 0;

    size_t duplicateFaces = 0;
    size_t uniqueFaces = 0;

    /// Unbounded face plus non-enclosing (zero or exterior-sign) faces
    size_t exteriorFaces = 0;

    /// Interior-sign faces rejected for too few nodes or too little area
    size_t degenerateFaces = 0;
};

struct RoomDetectionResult {
    /// Ascending by area; equal areas keep discovery order
    std::vector<DetectedRoom> rooms;

    RoomDetectionStats stats;
};

/**
 * @brief Configuration for room detection
 */
struct RoomDetectorConfig {
    /// Endpoints closer than this are one node (m)
    double mergeEpsilon = pl::constants::MERGE_EPSILON;

    /// Faces smaller than this are discarded (m^2)
    double minRoomArea = pl::constants::MIN_ROOM_AREA;

    /// Faces with more edges than this are abandoned
    int maxTraceSteps = pl::constants::MAX_TRACE_STEPS;
};

class RoomDetector {
public:
    RoomDetector();
    explicit RoomDetector(const RoomDetectorConfig& config);

    /**
     * @brief Detect all rooms bounded by @p walls
     *
     * Pure function of the wall list: identical input gives identical output.
     * Node merging is first-match in wall order, so permuting the input can
     * shift which endpoint positions become node positions.
     */
    RoomDetectionResult detect(const std::vector<WallInput>& walls) const;

    /**
     * @brief Detect rooms for all walls of a plan, in plan order
     */
    RoomDetectionResult detect(const pl::FloorPlan& plan) const;

    /**
     * @brief Smallest detected room containing @p point
     */
    std::optional<DetectedRoom> findRoomAtPoint(const std::vector<WallInput>& walls,
                                                const pl::Vec2d& point) const;

    void setConfig(const RoomDetectorConfig& config) { config_ = config; }
    const RoomDetectorConfig& getConfig() const { return config_; }

private:
    RoomDetectorConfig config_;
};

/**
 * @brief Room list for @p walls with default configuration
 */
std::vector<DetectedRoom> detectRooms(const std::vector<WallInput>& walls);

/**
 * @brief Wall inputs for every wall of a plan, in plan order
 */
std::vector<WallInput> toWallInputs(const pl::FloorPlan& plan);

/**
 * @brief Rotation-invariant key of a node cycle
 *
 * The cycle (closing duplicate already removed) is rotated to start at its
 * smallest node index and joined with commas. The same cycle traced from a
 * different starting edge yields the same key; the reversed cycle does not.
 */
std::string canonicalFaceKey(const std::vector<int>& cycle);

} // namespace floorplan::core::room

#endif // FLOORPLAN_CORE_ROOM_ROOM_DETECTOR_H
