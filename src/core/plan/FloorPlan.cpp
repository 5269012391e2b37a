#include "FloorPlan.h"

#include <QJsonArray>
#include <QLoggingCategory>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <limits>
#include <utility>

namespace floorplan::core::plan {

Q_LOGGING_CATEGORY(logFloorPlan, "floorplan.core.plan")

namespace {

// Splits closer than this to either end would leave a sliver wall.
constexpr double kMinSplitParam = 0.001;

constexpr double kParallelTolerance = 1e-12;

double cross2d(const gp_Vec2d& a, const gp_Vec2d& b) {
    return a.X() * b.Y() - a.Y() * b.X();
}

bool segmentIntersection(const gp_Pnt2d& p1, const gp_Pnt2d& p2,
                         const gp_Pnt2d& q1, const gp_Pnt2d& q2,
                         double& tOut, double& uOut, gp_Pnt2d& outPoint) {
    gp_Vec2d r(p1, p2);
    gp_Vec2d s(q1, q2);
    double denom = cross2d(r, s);
    if (std::abs(denom) <= kParallelTolerance) {
        return false;
    }

    gp_Vec2d qp(p1, q1);
    double t = cross2d(qp, s) / denom;
    double u = cross2d(qp, r) / denom;
    if (t < 0.0 || t > 1.0 || u < 0.0 || u > 1.0) {
        return false;
    }

    outPoint = gp_Pnt2d(p1.X() + t * r.X(), p1.Y() + t * r.Y());
    tOut = t;
    uOut = u;
    return true;
}

} // namespace

FloorPlan::FloorPlan(std::string name)
    : name_(std::move(name)) {
}

FloorPlan::~FloorPlan() = default;

FloorPlan::FloorPlan(FloorPlan&& other) noexcept = default;

FloorPlan& FloorPlan::operator=(FloorPlan&& other) noexcept = default;

WallID FloorPlan::addWall(const gp_Pnt2d& start, const gp_Pnt2d& end, const WallID& id) {
    if (!id.empty() && wallIndex_.count(id)) {
        qCWarning(logFloorPlan) << "addWall:duplicate-id" << "id=" << QString::fromStdString(id);
        return {};
    }

    auto wall = std::make_unique<Wall>(id, start, end);
    WallID newId = wall->id();
    if (wall->isDegenerate()) {
        qCDebug(logFloorPlan) << "addWall:degenerate" << "id=" << QString::fromStdString(newId);
    }

    wallIndex_[newId] = walls_.size();
    walls_.push_back(std::move(wall));
    qCDebug(logFloorPlan) << "addWall:done"
                          << "id=" << QString::fromStdString(newId)
                          << "totalWalls=" << walls_.size();
    return newId;
}

WallID FloorPlan::addWall(double x1, double y1, double x2, double y2, const WallID& id) {
    return addWall(gp_Pnt2d(x1, y1), gp_Pnt2d(x2, y2), id);
}

bool FloorPlan::removeWall(const WallID& id) {
    auto it = wallIndex_.find(id);
    if (it == wallIndex_.end()) {
        qCWarning(logFloorPlan) << "removeWall:missing-wall" << "id=" << QString::fromStdString(id);
        return false;
    }
    walls_.erase(walls_.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuildWallIndex();
    qCDebug(logFloorPlan) << "removeWall:done"
                          << "id=" << QString::fromStdString(id)
                          << "totalWalls=" << walls_.size();
    return true;
}

bool FloorPlan::moveWallEndpoint(const WallID& id, WallEnd which, const gp_Pnt2d& position) {
    Wall* wall = getWall(id);
    if (!wall) {
        qCWarning(logFloorPlan) << "moveWallEndpoint:missing-wall" << "id=" << QString::fromStdString(id);
        return false;
    }
    if (which == WallEnd::Start) {
        wall->setStart(position);
    } else {
        wall->setEnd(position);
    }
    return true;
}

Wall* FloorPlan::getWall(const WallID& id) {
    auto it = wallIndex_.find(id);
    if (it == wallIndex_.end() || it->second >= walls_.size()) {
        return nullptr;
    }
    return walls_[it->second].get();
}

const Wall* FloorPlan::getWall(const WallID& id) const {
    auto it = wallIndex_.find(id);
    if (it == wallIndex_.end() || it->second >= walls_.size()) {
        return nullptr;
    }
    return walls_[it->second].get();
}

std::optional<WallHit> FloorPlan::findWallAtPoint(const gp_Pnt2d& point, double threshold) const {
    std::optional<WallHit> best;
    for (const auto& wall : walls_) {
        WallProjection projection = wall->project(point);
        double effectiveThreshold = threshold + wall->thickness() * 0.5;
        if (projection.distance > effectiveThreshold) {
            continue;
        }
        if (!best || projection.distance < best->distance) {
            best = WallHit{wall->id(), projection.t, projection.distance};
        }
    }
    return best;
}

std::optional<std::pair<WallID, WallID>> FloorPlan::splitWall(const WallID& id, const gp_Pnt2d& point) {
    auto it = wallIndex_.find(id);
    if (it == wallIndex_.end()) {
        qCWarning(logFloorPlan) << "splitWall:missing-wall" << "id=" << QString::fromStdString(id);
        return std::nullopt;
    }
    size_t index = it->second;
    const Wall& original = *walls_[index];
    if (original.isDegenerate()) {
        return std::nullopt;
    }

    WallProjection projection = original.project(point);
    if (projection.t < kMinSplitParam || projection.t > 1.0 - kMinSplitParam) {
        qCDebug(logFloorPlan) << "splitWall:too-close-to-endpoint"
                              << "id=" << QString::fromStdString(id)
                              << "t=" << projection.t;
        return std::nullopt;
    }

    WallID idA = id + "_a";
    WallID idB = id + "_b";
    if (wallIndex_.count(idA) || wallIndex_.count(idB)) {
        qCWarning(logFloorPlan) << "splitWall:derived-id-taken" << "id=" << QString::fromStdString(id);
        return std::nullopt;
    }

    auto wallA = std::make_unique<Wall>(idA, original.start(), projection.point);
    auto wallB = std::make_unique<Wall>(idB, projection.point, original.end());
    for (auto* piece : {wallA.get(), wallB.get()}) {
        piece->setThickness(original.thickness());
        piece->setHeight(original.height());
    }

    walls_[index] = std::move(wallA);
    walls_.insert(walls_.begin() + static_cast<std::ptrdiff_t>(index + 1), std::move(wallB));
    rebuildWallIndex();

    qCDebug(logFloorPlan) << "splitWall:done"
                          << "id=" << QString::fromStdString(id)
                          << "t=" << projection.t;
    return std::make_pair(idA, idB);
}

std::vector<WallIntersection> FloorPlan::findWallIntersections(const gp_Pnt2d& start,
                                                               const gp_Pnt2d& end) const {
    std::vector<WallIntersection> results;
    for (const auto& wall : walls_) {
        double t = 0.0;
        double u = 0.0;
        gp_Pnt2d point;
        if (!segmentIntersection(start, end, wall->start(), wall->end(), t, u, point)) {
            continue;
        }
        results.push_back({wall->id(), point, t, u});
    }
    std::stable_sort(results.begin(), results.end(),
                     [](const WallIntersection& a, const WallIntersection& b) {
                         return a.t1 < b.t1;
                     });
    return results;
}

Bounds2d FloorPlan::bounds() const {
    Bounds2d box;
    if (walls_.empty()) {
        return box;
    }
    box.minX = box.minY = std::numeric_limits<double>::infinity();
    box.maxX = box.maxY = -std::numeric_limits<double>::infinity();
    for (const auto& wall : walls_) {
        Bounds2d wb = wall->bounds();
        box.minX = std::min(box.minX, wb.minX);
        box.minY = std::min(box.minY, wb.minY);
        box.maxX = std::max(box.maxX, wb.maxX);
        box.maxY = std::max(box.maxY, wb.maxY);
    }
    return box;
}

void FloorPlan::serialize(QJsonObject& json) const {
    json["name"] = QString::fromStdString(name_);
    QJsonArray wallArray;
    for (const auto& wall : walls_) {
        QJsonObject obj;
        wall->serialize(obj);
        wallArray.append(obj);
    }
    json["walls"] = wallArray;
}

std::unique_ptr<FloorPlan> FloorPlan::deserialize(const QJsonObject& json, QString& errorMessage) {
    if (json.contains("name") && !json["name"].isString()) {
        errorMessage = QStringLiteral("Plan name must be a string");
        return nullptr;
    }
    if (!json["walls"].isArray()) {
        errorMessage = QStringLiteral("Plan has no walls array");
        return nullptr;
    }

    auto plan = std::make_unique<FloorPlan>(json["name"].toString().toStdString());
    const QJsonArray wallArray = json["walls"].toArray();
    for (qsizetype i = 0; i < wallArray.size(); ++i) {
        if (!wallArray[i].isObject()) {
            errorMessage = QStringLiteral("Wall %1 is not an object").arg(i);
            return nullptr;
        }
        Wall wall;
        if (!wall.deserialize(wallArray[i].toObject())) {
            errorMessage = QStringLiteral("Wall %1 has invalid geometry").arg(i);
            return nullptr;
        }
        if (plan->wallIndex_.count(wall.id())) {
            errorMessage = QStringLiteral("Wall %1 repeats id %2")
                               .arg(i)
                               .arg(QString::fromStdString(wall.id()));
            return nullptr;
        }
        plan->wallIndex_[wall.id()] = plan->walls_.size();
        plan->walls_.push_back(std::make_unique<Wall>(std::move(wall)));
    }

    qCDebug(logFloorPlan) << "deserialize:done"
                          << "name=" << QString::fromStdString(plan->name_)
                          << "walls=" << plan->walls_.size();
    return plan;
}

void FloorPlan::rebuildWallIndex() {
    wallIndex_.clear();
    for (size_t i = 0; i < walls_.size(); ++i) {
        wallIndex_[walls_[i]->id()] = i;
    }
}

} // namespace floorplan::core::plan
