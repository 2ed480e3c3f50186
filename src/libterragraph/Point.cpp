#include "Point.hpp"
#include "Exception.hpp"

#include <algorithm>
#include <cmath>

namespace Terragraph {

double Polygon::area() const
{
    const size_t n = points.size();
    if (n < 3)
        return 0.;

    double a = 0.;
    for (size_t i = 0, j = n - 1; i < n; j = i ++)
        a += (points[j].x() + points[i].x()) * (points[j].y() - points[i].y());
    return -a * 0.5;
}

void Polygon::make_counter_clockwise()
{
    if (!this->is_counter_clockwise())
        std::reverse(points.begin(), points.end());
}

void Polygon::canonicalize()
{
    if (points.size() < 2)
        return;
    auto it_min = std::min_element(points.begin(), points.end(), PointLess());
    std::rotate(points.begin(), it_min, points.end());
}

double ExPolygon::area() const
{
    double a = contour.area();
    for (const Polygon &hole : holes)
        a -= std::abs(hole.area());
    return a;
}

Points segmentize(const Polygon &ring, double max_spacing)
{
    if (max_spacing <= 0.)
        throw InvalidArgument("segmentize: spacing has to be positive");

    Points out;
    const size_t n = ring.points.size();
    out.reserve(n);
    for (size_t i = 0; i < n; ++ i) {
        const Vec2d &a = ring.points[i];
        const Vec2d &b = ring.points[(i + 1) % n];
        out.emplace_back(a);
        const double len = (b - a).norm();
        if (len <= max_spacing)
            continue;
        // Same split count as ST_Segmentize: equal pieces none longer than max_spacing.
        const int pieces = int(std::ceil(len / max_spacing));
        for (int k = 1; k < pieces; ++ k)
            out.emplace_back(a + (b - a) * (double(k) / double(pieces)));
    }
    return out;
}

} // namespace Terragraph
