#ifndef libterragraph_Point_hpp_
#define libterragraph_Point_hpp_

#include "libterragraph.h"

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include <Eigen/Geometry>

namespace Terragraph {

using Vec2d = Eigen::Matrix<double, 2, 1, Eigen::DontAlign>;

using Points = std::vector<Vec2d>;

inline Vec2d perp(const Vec2d &v) { return Vec2d(-v.y(), v.x()); }

inline double distance(const Vec2d &a, const Vec2d &b) { return (b - a).norm(); }

struct PointLess
{
    bool operator()(const Vec2d &lhs, const Vec2d &rhs) const { return lhs.x() < rhs.x() || (lhs.x() == rhs.x() && lhs.y() < rhs.y()); }
};

inline std::ostream &operator<<(std::ostream &os, const Vec2d &pt)
{
    return os << "(" << pt.x() << ", " << pt.y() << ")";
}

// Eigen's own operator<< wins the argument dependent lookup inside boost::format.
inline std::string to_string(const Vec2d &pt)
{
    return "(" + std::to_string(pt.x()) + ", " + std::to_string(pt.y()) + ")";
}

// Hash of the exact bit pattern of a position. Only meaningful together with
// exact equality, which is what vertex deduplication relies on.
struct PointHash
{
    size_t operator()(const Vec2d &pt) const
    {
        // -0. and 0. compare equal, they have to hash equal too.
        const double x = pt.x() == 0. ? 0. : pt.x();
        const double y = pt.y() == 0. ? 0. : pt.y();
        size_t seed = std::hash<double>()(x);
        seed ^= std::hash<double>()(y) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }
};

struct PointEqual
{
    bool operator()(const Vec2d &lhs, const Vec2d &rhs) const { return lhs.x() == rhs.x() && lhs.y() == rhs.y(); }
};

// Closed ring without the repeated first point.
class Polygon
{
public:
    Polygon() = default;
    explicit Polygon(const Points &points) : points(points) {}
    explicit Polygon(Points &&points) : points(std::move(points)) {}

    size_t size() const { return points.size(); }
    bool   empty() const { return points.empty(); }
    double area() const;
    bool   is_counter_clockwise() const { return this->area() > 0.; }
    void   make_counter_clockwise();
    // Rotate the ring so that it starts at its lexicographically smallest vertex.
    void   canonicalize();

    Points points;
};

using Polygons = std::vector<Polygon>;

class ExPolygon
{
public:
    ExPolygon() = default;
    explicit ExPolygon(const Polygon &contour) : contour(contour) {}
    ExPolygon(const Polygon &contour, const Polygons &holes) : contour(contour), holes(holes) {}

    double area() const;
    bool   empty() const { return contour.empty(); }

    Polygon  contour;
    Polygons holes;
};

using ExPolygons = std::vector<ExPolygon>;

using Polyline  = Points;
using Polylines = std::vector<Polyline>;

// Points along the closed ring so that no two consecutive ones are farther than max_spacing.
Points segmentize(const Polygon &ring, double max_spacing);

} // namespace Terragraph

#endif // libterragraph_Point_hpp_
