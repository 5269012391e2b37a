/**
 * @file FaceTracer.h
 * @brief Minimal-face enumeration over an angularly sorted RoomGraph
 *
 * Every directed edge of the graph belongs to exactly one traced face. A face
 * is walked by always taking the rightmost turn: arriving at a node, the next
 * edge is the first one met when rotating clockwise from the travel
 * direction. Under that rule each bounded face is walked clockwise (negative
 * shoelace area) and the unbounded face counter-clockwise (positive area).
 *
 * The turn rule and the interior sign are a single convention. Changing one
 * without the other silently swaps rooms and exterior; both live here.
 */
#ifndef FLOORPLAN_CORE_ROOM_FACE_TRACER_H
#define FLOORPLAN_CORE_ROOM_FACE_TRACER_H

#include "RoomGraph.h"

#include <cstdint>
#include <unordered_set>
#include <vector>

namespace floorplan::core::room {

/**
 * @brief Sign of the shoelace area carried by enclosed faces under the
 *        tracer's turn rule
 */
constexpr double kInteriorAreaSign = -1.0;

/**
 * @brief True when a face with this signed area is enclosed (a room
 *        candidate) rather than the exterior or a zero-area artifact
 */
constexpr bool isInteriorSignedArea(double signedArea) {
    return signedArea * kInteriorAreaSign > 0.0;
}

/**
 * @brief Set of directed edges already consumed by a trace run
 *
 * Owned by the caller of a run so independent runs never share state.
 */
using VisitedEdgeSet = std::unordered_set<std::uint64_t>;

std::uint64_t directedEdgeKey(int from, int to);

enum class TraceStatus {
    Closed,          ///< Walk returned to its starting directed edge
    DeadEnd,         ///< Reached a node with no continuation
    IterationLimit   ///< Exceeded the step cap before closing
};

struct TracedFace {
    /// Visited nodes in walk order, starting with the start node. A closed
    /// face repeats the start node at the end.
    std::vector<int> nodes;

    TraceStatus status = TraceStatus::DeadEnd;

    bool isClosed() const { return status == TraceStatus::Closed; }
};

class FaceTracer {
public:
    /**
     * @param graph Graph with neighbor lists already sorted by angle
     * @param maxSteps Faces with more edges than this are aborted
     */
    explicit FaceTracer(const RoomGraph& graph, int maxSteps = pl::constants::MAX_TRACE_STEPS);

    /**
     * @brief Node following @p current when arriving from @p prev
     *
     * In the counter-clockwise ascending neighbor list of @p current this is
     * the entry immediately after @p prev, wrapping around. A single neighbor
     * is returned as is (the walk turns back). Returns -1 when @p current has
     * no neighbors or does not list @p prev.
     */
    int nextNode(int prev, int current) const;

    /**
     * @brief Walk one face starting with the directed edge from -> to
     *
     * Every directed edge walked is added to @p visited.
     */
    TracedFace trace(int from, int to, VisitedEdgeSet& visited) const;

    /**
     * @brief Trace a face from every directed edge not yet in @p visited,
     *        iterating nodes in index order and then their sorted neighbors
     */
    std::vector<TracedFace> traceAll(VisitedEdgeSet& visited) const;

    int maxSteps() const { return maxSteps_; }

private:
    const RoomGraph& graph_;
    int maxSteps_;
};

} // namespace floorplan::core::room

#endif // FLOORPLAN_CORE_ROOM_FACE_TRACER_H
