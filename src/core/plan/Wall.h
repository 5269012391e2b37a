/**
 * @file Wall.h
 * @brief Wall centerline segment of a floor plan
 *
 * A wall is a straight centerline between two endpoints plus the physical
 * attributes carried for collaborators (thickness, height). Room detection
 * only consumes the id and the two endpoints.
 */

#ifndef FLOORPLAN_CORE_PLAN_WALL_H
#define FLOORPLAN_CORE_PLAN_WALL_H

#include "PlanTypes.h"

#include <gp_Pnt2d.hxx>
#include <gp_Vec2d.hxx>
#include <QJsonObject>

namespace floorplan::core::plan {

/**
 * @brief Projection of a point onto a wall centerline
 */
struct WallProjection {
    /// Parametric position along the centerline, clamped to [0, 1]
    double t = 0.0;

    /// Closest point on the centerline
    gp_Pnt2d point{0.0, 0.0};

    /// Distance from the query point to @ref point
    double distance = 0.0;
};

class Wall {
public:
    Wall();
    Wall(const gp_Pnt2d& start, const gp_Pnt2d& end);
    Wall(const WallID& id, const gp_Pnt2d& start, const gp_Pnt2d& end);
    ~Wall() = default;

    Wall(const Wall&) = delete;
    Wall& operator=(const Wall&) = delete;
    Wall(Wall&&) noexcept = default;
    Wall& operator=(Wall&&) noexcept = default;

    WallID id() const { return m_id; }

    const gp_Pnt2d& start() const { return m_start; }
    const gp_Pnt2d& end() const { return m_end; }
    void setStart(const gp_Pnt2d& p) { m_start = p; }
    void setEnd(const gp_Pnt2d& p) { m_end = p; }

    double thickness() const { return m_thickness; }
    void setThickness(double thickness) { m_thickness = thickness; }

    double height() const { return m_height; }
    void setHeight(double height) { m_height = height; }

    double length() const;

    /**
     * @brief Unit direction from start to end, zero vector for degenerate walls
     */
    gp_Vec2d direction() const;

    gp_Pnt2d midpoint() const;

    /**
     * @brief Angle of the centerline from the positive x-axis, (-pi, pi]
     */
    double angle() const;

    /**
     * @brief True when the endpoints coincide within constants::MIN_WALL_LENGTH
     */
    bool isDegenerate() const;

    Bounds2d bounds() const;

    /**
     * @brief Project a point onto the centerline
     */
    WallProjection project(const gp_Pnt2d& point) const;

    /**
     * @brief Hit test against the rendered wall body
     *
     * The effective radius is @p tolerance plus half the wall thickness, so a
     * click on the drawn body registers even away from the centerline.
     */
    bool isNear(const gp_Pnt2d& point, double tolerance) const;

    void serialize(QJsonObject& json) const;

    /**
     * @brief Read a wall from JSON
     * @return false without modifying the wall when required fields are
     *         missing or mistyped
     */
    bool deserialize(const QJsonObject& json);

    static WallID generateId();

private:
    WallID m_id;
    gp_Pnt2d m_start;
    gp_Pnt2d m_end;
    double m_thickness = constants::DEFAULT_WALL_THICKNESS;
    double m_height = constants::DEFAULT_WALL_HEIGHT;
};

} // namespace floorplan::core::plan

#endif // FLOORPLAN_CORE_PLAN_WALL_H
