#ifndef libterragraph_BoundingBox_hpp_
#define libterragraph_BoundingBox_hpp_

#include "libterragraph.h"
#include "Point.hpp"

#include <ostream>

namespace Terragraph {

// Axis aligned extent in projected coordinates.
class BoundingBox
{
public:
    Vec2d min { Vec2d::Zero() };
    Vec2d max { Vec2d::Zero() };

    BoundingBox() = default;
    BoundingBox(const Vec2d &pmin, const Vec2d &pmax) : min(pmin), max(pmax), m_defined(true) {}
    BoundingBox(double xmin, double ymin, double xmax, double ymax) : BoundingBox(Vec2d(xmin, ymin), Vec2d(xmax, ymax)) {}
    explicit BoundingBox(const Points &points) { this->merge(points); }

    void   merge(const Vec2d &point);
    void   merge(const Points &points);
    void   merge(const BoundingBox &bb);
    void   offset(double delta);
    BoundingBox expanded(double delta) const { BoundingBox out(*this); out.offset(delta); return out; }

    bool   defined() const { return m_defined; }
    // Zero width or height, a caller error for anything that tiles or clips.
    bool   degenerate() const { return !m_defined || !(min.x() < max.x()) || !(min.y() < max.y()); }
    double width() const { return max.x() - min.x(); }
    double height() const { return max.y() - min.y(); }
    Vec2d  size() const { return max - min; }
    Vec2d  center() const { return 0.5 * (min + max); }
    double area() const { return this->width() * this->height(); }

    // Closed box semantics: points on the border are contained.
    bool   contains(const Vec2d &point) const
    {
        return point.x() >= min.x() && point.x() <= max.x() && point.y() >= min.y() && point.y() <= max.y();
    }
    bool   contains(const BoundingBox &other) const { return this->contains(other.min) && this->contains(other.max); }
    bool   overlap(const BoundingBox &other) const
    {
        return !(max.x() < other.min.x() || min.x() > other.max.x() || max.y() < other.min.y() || min.y() > other.max.y());
    }

    bool operator==(const BoundingBox &rhs) const { return min == rhs.min && max == rhs.max; }
    bool operator!=(const BoundingBox &rhs) const { return !(*this == rhs); }

private:
    // Set once a point was merged, a single point gives a defined but degenerate box.
    bool m_defined { false };
};

std::ostream &operator<<(std::ostream &os, const BoundingBox &bb);

BoundingBox get_extents(const Polygon &polygon);
BoundingBox get_extents(const ExPolygon &expolygon);
BoundingBox get_extents(const ExPolygons &expolygons);

} // namespace Terragraph

#endif // libterragraph_BoundingBox_hpp_
