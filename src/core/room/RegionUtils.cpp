#include "RegionUtils.h"

#include <algorithm>
#include <cmath>

namespace floorplan::core::room {

namespace {

constexpr double kDegenerateArea = 1e-12;

} // namespace

double computeSignedArea(const std::vector<pl::Vec2d>& polygon) {
    if (polygon.size() < 3) {
        return 0.0;
    }
    double area = 0.0;
    for (size_t i = 0; i < polygon.size(); ++i) {
        const auto& p1 = polygon[i];
        const auto& p2 = polygon[(i + 1) % polygon.size()];
        area += p1.x * p2.y - p2.x * p1.y;
    }
    return 0.5 * area;
}

double polygonArea(const std::vector<pl::Vec2d>& polygon) {
    return std::abs(computeSignedArea(polygon));
}

double polygonPerimeter(const std::vector<pl::Vec2d>& polygon) {
    if (polygon.size() < 2) {
        return 0.0;
    }
    double perimeter = 0.0;
    for (size_t i = 0; i < polygon.size(); ++i) {
        const auto& p1 = polygon[i];
        const auto& p2 = polygon[(i + 1) % polygon.size()];
        perimeter += std::hypot(p2.x - p1.x, p2.y - p1.y);
    }
    return perimeter;
}

pl::Vec2d computeCentroid(const std::vector<pl::Vec2d>& polygon) {
    pl::Vec2d centroid{0.0, 0.0};
    if (polygon.empty()) {
        return centroid;
    }

    double area = computeSignedArea(polygon);
    if (std::abs(area) < kDegenerateArea) {
        for (const auto& p : polygon) {
            centroid.x += p.x;
            centroid.y += p.y;
        }
        centroid.x /= static_cast<double>(polygon.size());
        centroid.y /= static_cast<double>(polygon.size());
        return centroid;
    }

    for (size_t i = 0; i < polygon.size(); ++i) {
        const auto& p1 = polygon[i];
        const auto& p2 = polygon[(i + 1) % polygon.size()];
        double cross = p1.x * p2.y - p2.x * p1.y;
        centroid.x += (p1.x + p2.x) * cross;
        centroid.y += (p1.y + p2.y) * cross;
    }

    double factor = 1.0 / (6.0 * area);
    centroid.x *= factor;
    centroid.y *= factor;
    return centroid;
}

bool isPointInPolygon(const pl::Vec2d& point, const std::vector<pl::Vec2d>& polygon) {
    if (polygon.size() < 3) {
        return false;
    }
    bool inside = false;
    for (size_t i = 0, j = polygon.size() - 1; i < polygon.size(); j = i++) {
        const auto& pi = polygon[i];
        const auto& pj = polygon[j];
        bool intersect = ((pi.y > point.y) != (pj.y > point.y)) &&
                         (point.x < (pj.x - pi.x) * (point.y - pi.y) / (pj.y - pi.y) + pi.x);
        if (intersect) {
            inside = !inside;
        }
    }
    return inside;
}

pl::Bounds2d computeBounds(const std::vector<pl::Vec2d>& polygon) {
    pl::Bounds2d bounds;
    if (polygon.empty()) {
        return bounds;
    }
    bounds.minX = bounds.maxX = polygon.front().x;
    bounds.minY = bounds.maxY = polygon.front().y;
    for (const auto& p : polygon) {
        bounds.minX = std::min(bounds.minX, p.x);
        bounds.minY = std::min(bounds.minY, p.y);
        bounds.maxX = std::max(bounds.maxX, p.x);
        bounds.maxY = std::max(bounds.maxY, p.y);
    }
    return bounds;
}

} // namespace floorplan::core::room
