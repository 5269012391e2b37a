#include "RoomGraph.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <cmath>
#include <utility>

namespace floorplan::core::room {

Q_LOGGING_CATEGORY(logRoomGraph, "floorplan.core.room.graph")

namespace {

double distance(const pl::Vec2d& a, const pl::Vec2d& b) {
    double dx = a.x - b.x;
    double dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

} // namespace

int RoomGraph::findOrCreateNode(const pl::Vec2d& position, double mergeEpsilon) {
    for (const auto& node : nodes) {
        if (distance(position, node.position) < mergeEpsilon) {
            return node.index;
        }
    }

    GraphNode node;
    node.index = static_cast<int>(nodes.size());
    node.position = position;
    nodes.push_back(std::move(node));
    return nodes.back().index;
}

bool RoomGraph::addEdge(int a, int b) {
    if (a == b || hasEdge(a, b)) {
        return false;
    }
    nodes[static_cast<std::size_t>(a)].neighbors.push_back(b);
    nodes[static_cast<std::size_t>(b)].neighbors.push_back(a);
    ++edgeCount;
    return true;
}

bool RoomGraph::hasEdge(int a, int b) const {
    const auto& neighbors = nodes[static_cast<std::size_t>(a)].neighbors;
    return std::find(neighbors.begin(), neighbors.end(), b) != neighbors.end();
}

double RoomGraph::edgeAngle(int from, int to) const {
    const auto& p = nodes[static_cast<std::size_t>(from)].position;
    const auto& q = nodes[static_cast<std::size_t>(to)].position;
    return std::atan2(q.y - p.y, q.x - p.x);
}

void RoomGraph::sortNeighborsByAngle() {
    for (auto& node : nodes) {
        if (node.neighbors.size() < 2) {
            continue;
        }
        std::vector<std::pair<double, int>> keyed;
        keyed.reserve(node.neighbors.size());
        for (int neighbor : node.neighbors) {
            keyed.emplace_back(edgeAngle(node.index, neighbor), neighbor);
        }
        // Stable so that exactly overlapping directions keep insertion order.
        std::stable_sort(keyed.begin(), keyed.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });
        for (std::size_t i = 0; i < keyed.size(); ++i) {
            node.neighbors[i] = keyed[i].second;
        }
    }
}

std::optional<std::size_t> RoomGraph::findWall(int a, int b) const {
    for (std::size_t w = 0; w < wallNodePairs.size(); ++w) {
        if (wallNodePairs[w].connects(a, b)) {
            return w;
        }
    }
    return std::nullopt;
}

RoomGraph buildRoomGraph(const std::vector<WallInput>& walls, double mergeEpsilon) {
    RoomGraph graph;
    graph.nodes.reserve(walls.size() * 2);
    graph.wallNodePairs.reserve(walls.size());

    for (std::size_t w = 0; w < walls.size(); ++w) {
        const auto& wall = walls[w];
        int a = graph.findOrCreateNode(wall.start, mergeEpsilon);
        int b = graph.findOrCreateNode(wall.end, mergeEpsilon);
        graph.wallNodePairs.push_back({a, b});

        if (a == b) {
            graph.degenerateWalls.push_back(w);
            qCDebug(logRoomGraph) << "build:degenerate-wall"
                                  << "id=" << QString::fromStdString(wall.id)
                                  << "node=" << a;
            continue;
        }

        if (!graph.addEdge(a, b)) {
            graph.collapsedWalls.push_back(w);
            qCDebug(logRoomGraph) << "build:collapsed-wall"
                                  << "id=" << QString::fromStdString(wall.id)
                                  << "nodes=" << a << b;
        }
    }

    graph.sortNeighborsByAngle();

    qCDebug(logRoomGraph) << "build:done"
                          << "walls=" << walls.size()
                          << "nodes=" << graph.nodes.size()
                          << "edges=" << graph.edgeCount
                          << "degenerate=" << graph.degenerateWalls.size()
                          << "collapsed=" << graph.collapsedWalls.size();
    return graph;
}

} // namespace floorplan::core::room
