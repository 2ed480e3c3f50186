#ifndef libterragraph_BoostGeometryEngine_hpp_
#define libterragraph_BoostGeometryEngine_hpp_

#include "GeometryEngine.hpp"

namespace Terragraph {

// Voronoi diagram and its Delaunay dual come from Boost.Polygon, the rest from Boost.Geometry.
//
// Boost.Polygon works on 32bit integer sites, therefore input points are snapped to a grid
// of the given tolerance anchored at the envelope minimum. Points collapsing onto one grid
// site share the cell of the first of them. A tolerance of zero picks the finest grid
// the envelope fits into.
class BoostGeometryEngine : public GeometryEngine
{
public:
    Triangulation       triangulate(const Points &points) const override;
    VoronoiCells        voronoi(const Points &points, double tolerance, const BoundingBox &envelope) const override;
    std::vector<size_t> unique_points(const Points &points) const override;
    BoundingBox         envelope(const Points &points) const override;
    BoundingBox         expand(const BoundingBox &box, double margin) const override;

    ExPolygons          buffer(const ExPolygons &polygons, double distance, int segments) const override;
    ExPolygons          dissolve(const ExPolygons &polygons) const override;

    double              distance(const Vec2d &a, const Vec2d &b) const override;
    double              distance(const Vec2d &point, const ExPolygons &polygons) const override;
    bool                within(const Vec2d &point, const Polygon &polygon) const override;
    bool                within(const Vec2d &point, const ExPolygons &polygons) const override;
    double              length_inside(const Vec2d &a, const Vec2d &b, const ExPolygons &polygons) const override;
    bool                intersects(const BoundingBox &box, const ExPolygon &polygon) const override;
};

} // namespace Terragraph

#endif // libterragraph_BoostGeometryEngine_hpp_
