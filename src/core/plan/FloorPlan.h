/**
 * @file FloorPlan.h
 * @brief Wall container for one floor of a plan
 *
 * FloorPlan owns the walls of a single floor and provides the editing
 * operations the wall tools rely on: adding, removing and moving walls, hit
 * testing, splitting a wall at a point and querying where a new wall would
 * cross existing ones. Walls keep their insertion order, which is also the
 * order room detection consumes them in.
 */
#ifndef FLOORPLAN_CORE_PLAN_FLOOR_PLAN_H
#define FLOORPLAN_CORE_PLAN_FLOOR_PLAN_H

#include "PlanTypes.h"
#include "Wall.h"

#include <gp_Pnt2d.hxx>
#include <QJsonObject>
#include <QString>

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace floorplan::core::plan {

enum class WallEnd {
    Start,
    End
};

/**
 * @brief Closest wall to a query point
 */
struct WallHit {
    WallID wallId;

    /// Parametric position along the wall centerline (0 = start, 1 = end)
    double t = 0.0;

    /// Distance from the query point to the centerline
    double distance = 0.0;
};

/**
 * @brief Crossing between a prospective wall and an existing one
 */
struct WallIntersection {
    WallID wallId;
    gp_Pnt2d point;

    /// Parametric position on the prospective wall
    double t1 = 0.0;

    /// Parametric position on the existing wall
    double t2 = 0.0;
};

class FloorPlan {
public:
    explicit FloorPlan(std::string name = {});
    ~FloorPlan();

    // Non-copyable, movable
    FloorPlan(const FloorPlan&) = delete;
    FloorPlan& operator=(const FloorPlan&) = delete;
    FloorPlan(FloorPlan&&) noexcept;
    FloorPlan& operator=(FloorPlan&&) noexcept;

    const std::string& name() const { return name_; }
    void setName(std::string name) { name_ = std::move(name); }

    // ========== Wall Management ==========

    /**
     * @brief Add a wall between two points
     * @param id Explicit identifier; a UUID is generated when empty
     * @return Identifier of the new wall, or empty if @p id is already used
     */
    WallID addWall(const gp_Pnt2d& start, const gp_Pnt2d& end, const WallID& id = {});

    WallID addWall(double x1, double y1, double x2, double y2, const WallID& id = {});

    bool removeWall(const WallID& id);

    /**
     * @brief Move one endpoint of a wall
     */
    bool moveWallEndpoint(const WallID& id, WallEnd which, const gp_Pnt2d& position);

    Wall* getWall(const WallID& id);
    const Wall* getWall(const WallID& id) const;

    const std::vector<std::unique_ptr<Wall>>& getAllWalls() const { return walls_; }
    size_t getWallCount() const { return walls_.size(); }
    bool isEmpty() const { return walls_.empty(); }

    // ========== Wall Operations ==========

    /**
     * @brief Closest wall within @p threshold of @p point
     *
     * The threshold is widened by half of each wall's thickness so the drawn
     * wall body counts as a hit.
     */
    std::optional<WallHit> findWallAtPoint(const gp_Pnt2d& point, double threshold) const;

    /**
     * @brief Replace a wall by two walls meeting at the projection of @p point
     *
     * The pieces are named "<id>_a" (start side) and "<id>_b" (end side),
     * inherit thickness and height, and take the original wall's slot in the
     * wall order.
     * @return The two new ids, or nullopt when the wall does not exist, the
     *         split would leave a degenerate piece, or a derived id is taken
     */
    std::optional<std::pair<WallID, WallID>> splitWall(const WallID& id, const gp_Pnt2d& point);

    /**
     * @brief Crossings of the segment start-end with all existing walls,
     *        ascending by position along the segment
     */
    std::vector<WallIntersection> findWallIntersections(const gp_Pnt2d& start,
                                                        const gp_Pnt2d& end) const;

    Bounds2d bounds() const;

    // ========== Serialization ==========

    void serialize(QJsonObject& json) const;

    /**
     * @brief Build a plan from JSON
     * @return nullptr and a message in @p errorMessage on malformed input
     */
    static std::unique_ptr<FloorPlan> deserialize(const QJsonObject& json, QString& errorMessage);

private:
    std::string name_;
    std::vector<std::unique_ptr<Wall>> walls_;
    std::unordered_map<WallID, size_t> wallIndex_;

    void rebuildWallIndex();
};

} // namespace floorplan::core::plan

#endif // FLOORPLAN_CORE_PLAN_FLOOR_PLAN_H
