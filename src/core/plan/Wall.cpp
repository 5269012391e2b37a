#include "Wall.h"

#include <QJsonObject>
#include <QLoggingCategory>
#include <QString>
#include <QUuid>

#include <algorithm>
#include <cmath>
#include <utility>

namespace floorplan::core::plan {

Q_LOGGING_CATEGORY(logWall, "floorplan.core.plan.wall")

namespace {

bool readPoint(const QJsonValue& value, gp_Pnt2d& out) {
    if (!value.isObject()) {
        return false;
    }
    const QJsonObject obj = value.toObject();
    if (!obj["x"].isDouble() || !obj["y"].isDouble()) {
        return false;
    }
    out.SetCoord(obj["x"].toDouble(), obj["y"].toDouble());
    return true;
}

QJsonObject writePoint(const gp_Pnt2d& p) {
    QJsonObject obj;
    obj["x"] = p.X();
    obj["y"] = p.Y();
    return obj;
}

} // namespace

Wall::Wall()
    : m_id(generateId()),
      m_start(0.0, 0.0),
      m_end(0.0, 0.0) {
}

Wall::Wall(const gp_Pnt2d& start, const gp_Pnt2d& end)
    : m_id(generateId()),
      m_start(start),
      m_end(end) {
}

Wall::Wall(const WallID& id, const gp_Pnt2d& start, const gp_Pnt2d& end)
    : m_id(id.empty() ? generateId() : id),
      m_start(start),
      m_end(end) {
}

WallID Wall::generateId() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
}

double Wall::length() const {
    return m_start.Distance(m_end);
}

gp_Vec2d Wall::direction() const {
    gp_Vec2d vec(m_start, m_end);
    double magnitude = vec.Magnitude();
    if (magnitude <= 0.0) {
        return gp_Vec2d(0.0, 0.0);
    }
    vec /= magnitude;
    return vec;
}

gp_Pnt2d Wall::midpoint() const {
    return gp_Pnt2d((m_start.X() + m_end.X()) * 0.5,
                    (m_start.Y() + m_end.Y()) * 0.5);
}

double Wall::angle() const {
    return std::atan2(m_end.Y() - m_start.Y(), m_end.X() - m_start.X());
}

bool Wall::isDegenerate() const {
    return length() <= constants::MIN_WALL_LENGTH;
}

Bounds2d Wall::bounds() const {
    Bounds2d box;
    box.minX = std::min(m_start.X(), m_end.X());
    box.minY = std::min(m_start.Y(), m_end.Y());
    box.maxX = std::max(m_start.X(), m_end.X());
    box.maxY = std::max(m_start.Y(), m_end.Y());
    return box;
}

WallProjection Wall::project(const gp_Pnt2d& point) const {
    WallProjection result;
    gp_Vec2d ab(m_start, m_end);
    double denom = ab.SquareMagnitude();
    if (denom <= 0.0) {
        result.t = 0.0;
        result.point = m_start;
        result.distance = m_start.Distance(point);
        return result;
    }

    gp_Vec2d ap(m_start, point);
    double t = std::clamp(ap.Dot(ab) / denom, 0.0, 1.0);
    result.t = t;
    result.point = gp_Pnt2d(m_start.X() + t * ab.X(), m_start.Y() + t * ab.Y());
    result.distance = result.point.Distance(point);
    return result;
}

bool Wall::isNear(const gp_Pnt2d& point, double tolerance) const {
    return project(point).distance <= tolerance + m_thickness * 0.5;
}

void Wall::serialize(QJsonObject& json) const {
    json["id"] = QString::fromStdString(m_id);
    json["start"] = writePoint(m_start);
    json["end"] = writePoint(m_end);
    json["thickness"] = m_thickness;
    json["height"] = m_height;
}

bool Wall::deserialize(const QJsonObject& json) {
    gp_Pnt2d newStart;
    gp_Pnt2d newEnd;
    if (!readPoint(json["start"], newStart) || !readPoint(json["end"], newEnd)) {
        qCWarning(logWall) << "deserialize:invalid-endpoints";
        return false;
    }
    if (json.contains("id") && !json["id"].isString()) {
        qCWarning(logWall) << "deserialize:invalid-id-type";
        return false;
    }
    if (json.contains("thickness") && !json["thickness"].isDouble()) {
        qCWarning(logWall) << "deserialize:invalid-thickness-type";
        return false;
    }
    if (json.contains("height") && !json["height"].isDouble()) {
        qCWarning(logWall) << "deserialize:invalid-height-type";
        return false;
    }

    WallID newId = json.contains("id") && !json["id"].toString().isEmpty()
                       ? json["id"].toString().toStdString()
                       : generateId();
    double newThickness = json.contains("thickness")
                              ? json["thickness"].toDouble()
                              : constants::DEFAULT_WALL_THICKNESS;
    double newHeight = json.contains("height")
                           ? json["height"].toDouble()
                           : constants::DEFAULT_WALL_HEIGHT;

    m_id = std::move(newId);
    m_start = newStart;
    m_end = newEnd;
    m_thickness = newThickness;
    m_height = newHeight;
    qCDebug(logWall) << "deserialize:done"
                     << "id=" << QString::fromStdString(m_id)
                     << "length=" << length();
    return true;
}

} // namespace floorplan::core::plan
