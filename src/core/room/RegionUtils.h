/**
 * @file RegionUtils.h
 * @brief Polygon measures and predicates for room outlines
 *
 * Polygons are vertex lists treated as closed (last vertex connects back to
 * the first); the first vertex is not repeated.
 */
#ifndef FLOORPLAN_CORE_ROOM_REGION_UTILS_H
#define FLOORPLAN_CORE_ROOM_REGION_UTILS_H

#include "../plan/PlanTypes.h"

#include <vector>

namespace floorplan::core::room {

namespace pl = floorplan::core::plan;

/**
 * @brief Shoelace signed area
 *
 * Positive = CCW, Negative = CW. Zero for fewer than 3 vertices.
 */
double computeSignedArea(const std::vector<pl::Vec2d>& polygon);

/**
 * @brief Absolute shoelace area
 */
double polygonArea(const std::vector<pl::Vec2d>& polygon);

/**
 * @brief Sum of edge lengths, closing edge included
 */
double polygonPerimeter(const std::vector<pl::Vec2d>& polygon);

/**
 * @brief Area centroid; vertex average for degenerate polygons
 */
pl::Vec2d computeCentroid(const std::vector<pl::Vec2d>& polygon);

/**
 * @brief Ray-casting containment test
 *
 * Points exactly on the boundary may report either result.
 */
bool isPointInPolygon(const pl::Vec2d& point, const std::vector<pl::Vec2d>& polygon);

pl::Bounds2d computeBounds(const std::vector<pl::Vec2d>& polygon);

} // namespace floorplan::core::room

#endif // FLOORPLAN_CORE_ROOM_REGION_UTILS_H
