/**
 * @file RoomGraph.h
 * @brief Planar wall graph used by room detection
 *
 * Wall endpoints closer than the merge epsilon collapse into one node. Each
 * distinct node pair connected by at least one wall becomes one undirected
 * edge. The graph lives for a single detection run.
 */
#ifndef FLOORPLAN_CORE_ROOM_ROOM_GRAPH_H
#define FLOORPLAN_CORE_ROOM_ROOM_GRAPH_H

#include "../plan/PlanTypes.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace floorplan::core::room {

namespace pl = floorplan::core::plan;

/**
 * @brief Wall as consumed by room detection: identity and centerline only
 */
struct WallInput {
    pl::WallID id;
    pl::Vec2d start;
    pl::Vec2d end;
};

/**
 * @brief Merged wall endpoint
 */
struct GraphNode {
    int index = -1;

    /// Position of the first endpoint that created this node
    pl::Vec2d position;

    /// Adjacent node indices, duplicate-free; ascending by edge angle
    /// once RoomGraph::sortNeighborsByAngle() has run
    std::vector<int> neighbors;
};

/**
 * @brief Node pair a source wall resolved to, parallel to the wall input
 */
struct WallNodePair {
    int nodeA = -1;
    int nodeB = -1;

    bool isDegenerate() const { return nodeA == nodeB; }

    bool connects(int a, int b) const {
        return (nodeA == a && nodeB == b) || (nodeA == b && nodeB == a);
    }
};

struct RoomGraph {
    std::vector<GraphNode> nodes;

    /// One entry per input wall, in input order
    std::vector<WallNodePair> wallNodePairs;

    /// Input indices of walls whose endpoints merged into one node
    std::vector<std::size_t> degenerateWalls;

    /// Input indices of walls whose node pair an earlier wall already connected
    std::vector<std::size_t> collapsedWalls;

    /// Number of undirected edges
    std::size_t edgeCount = 0;

    /**
     * @brief Return the first node within @p mergeEpsilon of @p position,
     *        creating a new node when none matches
     *
     * Nodes are scanned in creation order and the first match wins, so node
     * identity depends on the order endpoints are presented.
     */
    int findOrCreateNode(const pl::Vec2d& position, double mergeEpsilon);

    /**
     * @brief Add the undirected edge a-b
     * @return false when a == b or the edge already exists
     */
    bool addEdge(int a, int b);

    bool hasEdge(int a, int b) const;

    /**
     * @brief Order every neighbor list ascending by atan2 of the outgoing edge
     *
     * Must run after the last addEdge() and before face tracing.
     */
    void sortNeighborsByAngle();

    /**
     * @brief Input index of the first wall connecting a and b in either
     *        orientation
     */
    std::optional<std::size_t> findWall(int a, int b) const;

    /// Outgoing edge angle from node @p from towards node @p to
    double edgeAngle(int from, int to) const;
};

/**
 * @brief Build the merged, angularly sorted graph for a wall list
 */
RoomGraph buildRoomGraph(const std::vector<WallInput>& walls, double mergeEpsilon);

} // namespace floorplan::core::room

#endif // FLOORPLAN_CORE_ROOM_ROOM_GRAPH_H
