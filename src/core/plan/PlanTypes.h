/**
 * @file PlanTypes.h
 * @brief Core type definitions for the floor-plan geometry core
 *
 * Fundamental types, identifiers and constants shared by the plan model
 * and the room detection engine. All lengths are meters, all areas are
 * square meters.
 */

#ifndef FLOORPLAN_CORE_PLAN_TYPES_H
#define FLOORPLAN_CORE_PLAN_TYPES_H

#include <string>

namespace floorplan::core::plan {

//==============================================================================
// Type Aliases
//==============================================================================

/**
 * @brief Wall identifier - UUID string or caller-supplied name
 */
using WallID = std::string;

//==============================================================================
// Basic Geometry Types
//==============================================================================

/**
 * @brief Simple 2D vector type for plan-space math
 */
struct Vec2d {
    double x = 0.0;
    double y = 0.0;
};

inline bool operator==(const Vec2d& a, const Vec2d& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Vec2d& a, const Vec2d& b) {
    return !(a == b);
}

/**
 * @brief Axis-aligned bounding box
 */
struct Bounds2d {
    double minX = 0.0;
    double minY = 0.0;
    double maxX = 0.0;
    double maxY = 0.0;

    double width() const { return maxX - minX; }
    double height() const { return maxY - minY; }
};

//==============================================================================
// Constants
//==============================================================================

namespace constants {

/// Endpoints closer than this are the same graph node (m)
constexpr double MERGE_EPSILON = 0.05;

/// Faces smaller than this are numerical noise, not rooms (m^2)
constexpr double MIN_ROOM_AREA = 0.01;

/// Upper bound on edges walked while tracing a single face
constexpr int MAX_TRACE_STEPS = 10000;

/// Default wall thickness (m)
constexpr double DEFAULT_WALL_THICKNESS = 0.15;

/// Default wall height (m)
constexpr double DEFAULT_WALL_HEIGHT = 2.8;

/// Walls shorter than this are reported as degenerate by the plan model (m)
constexpr double MIN_WALL_LENGTH = 1e-6;

} // namespace constants

} // namespace floorplan::core::plan

#endif // FLOORPLAN_CORE_PLAN_TYPES_H
