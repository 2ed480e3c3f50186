#ifndef libterragraph_GeometryEngine_hpp_
#define libterragraph_GeometryEngine_hpp_

#include "libterragraph.h"
#include "BoundingBox.hpp"
#include "Point.hpp"

#include <array>
#include <utility>
#include <vector>

namespace Terragraph {

struct VoronoiCell
{
    // Index into the point sequence the diagram was computed for.
    size_t  owner_id { 0 };
    Polygon polygon;
};

using VoronoiCells = std::vector<VoronoiCell>;

struct Triangulation
{
    // Undirected Delaunay edges as index pairs into the input points, first < second.
    std::vector<std::pair<size_t, size_t>> edges;
    std::vector<std::array<size_t, 3>>     triangles;
};

// Geometric primitives the pipeline is built on. Implementations have to be
// thread safe for concurrent calls on one instance, the scheduler shares a
// single engine between its workers.
class GeometryEngine
{
public:
    virtual ~GeometryEngine() = default;

    virtual Triangulation       triangulate(const Points &points) const = 0;
    // One cell per distinct input point at the given tolerance, clipped to envelope.
    // Throws GeometryError if the decomposition cannot be computed.
    virtual VoronoiCells        voronoi(const Points &points, double tolerance, const BoundingBox &envelope) const = 0;
    // Indices of the first occurrences of every distinct position, in input order.
    virtual std::vector<size_t> unique_points(const Points &points) const = 0;
    virtual BoundingBox         envelope(const Points &points) const = 0;
    virtual BoundingBox         expand(const BoundingBox &box, double margin) const = 0;

    virtual ExPolygons          buffer(const ExPolygons &polygons, double distance, int segments) const = 0;
    // Union of overlapping polygons.
    virtual ExPolygons          dissolve(const ExPolygons &polygons) const = 0;

    virtual double              distance(const Vec2d &a, const Vec2d &b) const = 0;
    // Distance to the nearest polygon, 0 inside.
    virtual double              distance(const Vec2d &point, const ExPolygons &polygons) const = 0;
    // Boundary counts as inside.
    virtual bool                within(const Vec2d &point, const Polygon &polygon) const = 0;
    virtual bool                within(const Vec2d &point, const ExPolygons &polygons) const = 0;
    // Length of the part of segment ab running through the polygons.
    virtual double              length_inside(const Vec2d &a, const Vec2d &b, const ExPolygons &polygons) const = 0;
    virtual bool                intersects(const BoundingBox &box, const ExPolygon &polygon) const = 0;
};

} // namespace Terragraph

#endif // libterragraph_GeometryEngine_hpp_
