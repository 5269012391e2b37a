#include "RoomDetector.h"
#include "FaceTracer.h"
#include "RegionUtils.h"
#include "../plan/FloorPlan.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_set>

namespace floorplan::core::room {

Q_LOGGING_CATEGORY(logRoomDetector, "floorplan.core.room")

namespace {

std::vector<int> rotateFrom(const std::vector<int>& cycle, std::size_t start) {
    std::vector<int> rotated;
    rotated.reserve(cycle.size());
    for (std::size_t i = 0; i < cycle.size(); ++i) {
        rotated.push_back(cycle[(start + i) % cycle.size()]);
    }
    return rotated;
}

std::size_t countDistinct(const std::vector<int>& cycle) {
    std::unordered_set<int> distinct(cycle.begin(), cycle.end());
    return distinct.size();
}

std::vector<pl::WallID> collectWallIds(const RoomGraph& graph,
                                       const std::vector<WallInput>& walls,
                                       const std::vector<int>& cycle) {
    std::vector<pl::WallID> ids;
    std::unordered_set<std::size_t> seen;
    for (std::size_t i = 0; i < cycle.size(); ++i) {
        int a = cycle[i];
        int b = cycle[(i + 1) % cycle.size()];
        auto wallIndex = graph.findWall(a, b);
        if (!wallIndex || !seen.insert(*wallIndex).second) {
            continue;
        }
        ids.push_back(walls[*wallIndex].id);
    }
    return ids;
}

} // namespace

bool DetectedRoom::contains(const pl::Vec2d& point) const {
    return isPointInPolygon(point, polygon);
}

RoomDetector::RoomDetector() = default;

RoomDetector::RoomDetector(const RoomDetectorConfig& config)
    : config_(config) {
}

RoomDetectionResult RoomDetector::detect(const std::vector<WallInput>& walls) const {
    RoomDetectionResult result;
    if (walls.empty()) {
        return result;
    }

    qCDebug(logRoomDetector) << "detect:start"
                             << "walls=" << walls.size()
                             << "mergeEpsilon=" << config_.mergeEpsilon
                             << "minRoomArea=" << config_.minRoomArea
                             << "maxTraceSteps=" << config_.maxTraceSteps;

    RoomGraph graph = buildRoomGraph(walls, config_.mergeEpsilon);
    RoomDetectionStats& stats = result.stats;
    stats.nodeCount = graph.nodes.size();
    stats.edgeCount = graph.edgeCount;
    for (std::size_t index : graph.degenerateWalls) {
        stats.degenerateWallIds.push_back(walls[index].id);
    }
    for (std::size_t index : graph.collapsedWalls) {
        stats.collapsedWallIds.push_back(walls[index].id);
    }

    VisitedEdgeSet visited;
    FaceTracer tracer(graph, config_.maxTraceSteps);
    std::vector<TracedFace> traced = tracer.traceAll(visited);
    stats.tracedFaces = traced.size();

    std::unordered_set<std::string> seenKeys;
    for (auto& face : traced) {
        if (!face.isClosed()) {
            ++stats.abortedTraces;
            continue;
        }

        // Closed faces end on their start node
        std::vector<int> cycle(face.nodes.begin(), face.nodes.end() - 1);
        if (!seenKeys.insert(canonicalFaceKey(cycle)).second) {
            ++stats.duplicateFaces;
            continue;
        }
        ++stats.uniqueFaces;

        std::vector<pl::Vec2d> polygon;
        polygon.reserve(cycle.size());
        for (int node : cycle) {
            polygon.push_back(graph.nodes[static_cast<std::size_t>(node)].position);
        }

        double signedArea = computeSignedArea(polygon);
        if (!isInteriorSignedArea(signedArea)) {
            ++stats.exteriorFaces;
            continue;
        }

        double area = std::abs(signedArea);
        if (countDistinct(cycle) < 3 || area < config_.minRoomArea) {
            ++stats.degenerateFaces;
            qCDebug(logRoomDetector) << "detect:degenerate-face"
                                     << "nodes=" << cycle.size()
                                     << "area=" << area;
            continue;
        }

        DetectedRoom room;
        room.wallIds = collectWallIds(graph, walls, cycle);
        room.polygon = std::move(polygon);
        room.area = area;
        result.rooms.push_back(std::move(room));
    }

    std::stable_sort(result.rooms.begin(), result.rooms.end(),
                     [](const DetectedRoom& a, const DetectedRoom& b) {
                         return a.area < b.area;
                     });

    if (!stats.collapsedWallIds.empty()) {
        qCInfo(logRoomDetector) << "detect:overlapping-walls"
                                << "count=" << stats.collapsedWallIds.size()
                                << "first=" << QString::fromStdString(stats.collapsedWallIds.front());
    }
    qCDebug(logRoomDetector) << "detect:done"
                             << "nodes=" << stats.nodeCount
                             << "edges=" << stats.edgeCount
                             << "faces=" << stats.tracedFaces
                             << "aborted=" << stats.abortedTraces
                             << "rooms=" << result.rooms.size();
    return result;
}

RoomDetectionResult RoomDetector::detect(const pl::FloorPlan& plan) const {
    return detect(toWallInputs(plan));
}

std::optional<DetectedRoom> RoomDetector::findRoomAtPoint(const std::vector<WallInput>& walls,
                                                          const pl::Vec2d& point) const {
    RoomDetectionResult result = detect(walls);
    for (auto& room : result.rooms) {
        if (room.contains(point)) {
            return std::move(room);
        }
    }
    return std::nullopt;
}

std::vector<DetectedRoom> detectRooms(const std::vector<WallInput>& walls) {
    return RoomDetector().detect(walls).rooms;
}

std::vector<WallInput> toWallInputs(const pl::FloorPlan& plan) {
    std::vector<WallInput> inputs;
    inputs.reserve(plan.getWallCount());
    for (const auto& wall : plan.getAllWalls()) {
        inputs.push_back({wall->id(),
                          {wall->start().X(), wall->start().Y()},
                          {wall->end().X(), wall->end().Y()}});
    }
    return inputs;
}

std::string canonicalFaceKey(const std::vector<int>& cycle) {
    if (cycle.empty()) {
        return {};
    }

    // A face through a dangling wall visits some nodes twice; among the
    // rotations starting at the smallest index keep the lexicographic minimum.
    int minNode = *std::min_element(cycle.begin(), cycle.end());
    std::vector<int> best;
    for (std::size_t i = 0; i < cycle.size(); ++i) {
        if (cycle[i] != minNode) {
            continue;
        }
        std::vector<int> candidate = rotateFrom(cycle, i);
        if (best.empty() || candidate < best) {
            best = std::move(candidate);
        }
    }

    std::ostringstream key;
    for (std::size_t i = 0; i < best.size(); ++i) {
        if (i > 0) {
            key << ',';
        }
        key << best[i];
    }
    return key.str();
}

} // namespace floorplan::core::room
