#include "BoundingBox.hpp"

#include <algorithm>

namespace Terragraph {

void BoundingBox::merge(const Vec2d &point)
{
    if (m_defined) {
        min = min.cwiseMin(point);
        max = max.cwiseMax(point);
    } else {
        min       = point;
        max       = point;
        m_defined = true;
    }
}

void BoundingBox::merge(const Points &points)
{
    for (const Vec2d &pt : points)
        this->merge(pt);
}

void BoundingBox::merge(const BoundingBox &bb)
{
    if (! bb.defined())
        return;
    this->merge(bb.min);
    this->merge(bb.max);
}

void BoundingBox::offset(double delta)
{
    if (! m_defined)
        return;
    min -= Vec2d(delta, delta);
    max += Vec2d(delta, delta);
}

std::ostream &operator<<(std::ostream &os, const BoundingBox &bb)
{
    return os << "[" << bb.min.x() << ", " << bb.min.y() << " - " << bb.max.x() << ", " << bb.max.y() << "]";
}

BoundingBox get_extents(const Polygon &polygon)
{
    return BoundingBox(polygon.points);
}

BoundingBox get_extents(const ExPolygon &expolygon)
{
    return get_extents(expolygon.contour);
}

BoundingBox get_extents(const ExPolygons &expolygons)
{
    BoundingBox bb;
    for (const ExPolygon &expoly : expolygons)
        bb.merge(get_extents(expoly));
    return bb;
}

} // namespace Terragraph
