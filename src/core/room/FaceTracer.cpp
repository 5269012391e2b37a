#include "FaceTracer.h"

#include <QLoggingCategory>

#include <algorithm>

namespace floorplan::core::room {

Q_LOGGING_CATEGORY(logFaceTracer, "floorplan.core.room.tracer")

std::uint64_t directedEdgeKey(int from, int to) {
    return (static_cast<std::uint64_t>(static_cast<std::uint32_t>(from)) << 32) |
           static_cast<std::uint64_t>(static_cast<std::uint32_t>(to));
}

FaceTracer::FaceTracer(const RoomGraph& graph, int maxSteps)
    : graph_(graph),
      maxSteps_(maxSteps) {
}

int FaceTracer::nextNode(int prev, int current) const {
    const auto& neighbors = graph_.nodes[static_cast<std::size_t>(current)].neighbors;
    if (neighbors.empty()) {
        return -1;
    }
    if (neighbors.size() == 1) {
        return neighbors.front();
    }

    auto it = std::find(neighbors.begin(), neighbors.end(), prev);
    if (it == neighbors.end()) {
        return -1;
    }
    auto pos = static_cast<std::size_t>(it - neighbors.begin());
    return neighbors[(pos + 1) % neighbors.size()];
}

TracedFace FaceTracer::trace(int from, int to, VisitedEdgeSet& visited) const {
    TracedFace face;
    face.nodes.push_back(from);
    visited.insert(directedEdgeKey(from, to));

    int prev = from;
    int current = to;
    for (int steps = 0;; ++steps) {
        if (steps >= maxSteps_) {
            face.status = TraceStatus::IterationLimit;
            qCDebug(logFaceTracer) << "trace:iteration-limit"
                                   << "start=" << from << to
                                   << "maxSteps=" << maxSteps_;
            return face;
        }

        int next = nextNode(prev, current);
        face.nodes.push_back(current);
        if (next < 0) {
            face.status = TraceStatus::DeadEnd;
            qCDebug(logFaceTracer) << "trace:dead-end"
                                   << "start=" << from << to
                                   << "node=" << current;
            return face;
        }

        if (current == from && next == to) {
            face.status = TraceStatus::Closed;
            return face;
        }

        visited.insert(directedEdgeKey(current, next));
        prev = current;
        current = next;
    }
}

std::vector<TracedFace> FaceTracer::traceAll(VisitedEdgeSet& visited) const {
    std::vector<TracedFace> faces;
    for (const auto& node : graph_.nodes) {
        for (int neighbor : node.neighbors) {
            if (visited.count(directedEdgeKey(node.index, neighbor))) {
                continue;
            }
            faces.push_back(trace(node.index, neighbor, visited));
        }
    }
    qCDebug(logFaceTracer) << "traceAll:done"
                           << "faces=" << faces.size()
                           << "visitedEdges=" << visited.size();
    return faces;
}

} // namespace floorplan::core::room
