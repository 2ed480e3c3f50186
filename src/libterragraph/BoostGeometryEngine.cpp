#include "BoostGeometryEngine.hpp"
#include "Exception.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_map>

#include <boost/format.hpp>
#include <boost/functional/hash.hpp>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/multi_linestring.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/log/trivial.hpp>
#include <boost/polygon/voronoi.hpp>

namespace Terragraph {

namespace bg = boost::geometry;

using BPoint           = bg::model::d2::point_xy<double>;
// counter clockwise, closed
using BPolygon         = bg::model::polygon<BPoint, false, true>;
using BMultiPolygon    = bg::model::multi_polygon<BPolygon>;
using BLinestring      = bg::model::linestring<BPoint>;
using BMultiLinestring = bg::model::multi_linestring<BLinestring>;
using BBox             = bg::model::box<BPoint>;

using VD   = boost::polygon::voronoi_diagram<double>;
using Site = boost::polygon::point_data<int>;

namespace {

// Boost.Polygon accepts the whole int32 range, keep a safety margin for the predicates.
static constexpr double MAX_SITE_COORD = double(1 << 30);
static constexpr double AUTO_GRID_STEPS = double(1 << 28);

struct SiteSet
{
    Vec2d               origin { Vec2d::Zero() };
    double              resolution { 1. };
    std::vector<Site>   sites;
    // Input index of the first point snapped onto each site.
    std::vector<size_t> owners;

    Vec2d position(size_t site_idx) const
    {
        return origin + resolution * Vec2d(double(sites[site_idx].x()), double(sites[site_idx].y()));
    }
};

double auto_resolution(const BoundingBox &bb)
{
    const double extent = std::max(bb.width(), bb.height());
    return extent > 0. ? extent / AUTO_GRID_STEPS : 1.;
}

SiteSet snap_sites(const Points &points, const Vec2d &origin, double resolution)
{
    SiteSet out;
    out.origin     = origin;
    out.resolution = resolution;
    out.sites.reserve(points.size());
    out.owners.reserve(points.size());

    std::unordered_map<std::pair<int, int>, size_t, boost::hash<std::pair<int, int>>> site_map;
    site_map.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++ i) {
        const Vec2d s = (points[i] - origin) / resolution;
        if (! (std::abs(s.x()) <= MAX_SITE_COORD && std::abs(s.y()) <= MAX_SITE_COORD))
            throw GeometryError((boost::format("Point %1% does not fit into a site grid of resolution %2% anchored at %3%")
                % to_string(points[i]) % resolution % to_string(origin)).str());
        const std::pair<int, int> key(int(std::lround(s.x())), int(std::lround(s.y())));
        if (site_map.emplace(key, out.sites.size()).second) {
            out.sites.emplace_back(key.first, key.second);
            out.owners.emplace_back(i);
        }
    }
    return out;
}

// Part of the convex polygon closer to a than to b.
Points clip_half_plane(const Points &poly, const Vec2d &a, const Vec2d &b)
{
    const Vec2d n   = b - a;
    const Vec2d mid = 0.5 * (a + b);
    auto side = [&n, &mid](const Vec2d &p) { return (p - mid).dot(n); };

    Points out;
    out.reserve(poly.size() + 1);
    for (size_t i = 0; i < poly.size(); ++ i) {
        const Vec2d &p  = poly[i];
        const Vec2d &q  = poly[(i + 1) % poly.size()];
        const double sp = side(p);
        const double sq = side(q);
        if (sp <= 0.)
            out.emplace_back(p);
        if ((sp < 0. && sq > 0.) || (sp > 0. && sq < 0.))
            out.emplace_back(p + (q - p) * (sp / (sp - sq)));
    }
    return out;
}

Points box_ring(const BoundingBox &bb)
{
    return { bb.min, Vec2d(bb.max.x(), bb.min.y()), bb.max, Vec2d(bb.min.x(), bb.max.y()) };
}

BPoint to_boost(const Vec2d &pt) { return BPoint(pt.x(), pt.y()); }

BPolygon to_boost(const ExPolygon &expoly)
{
    BPolygon out;
    for (const Vec2d &pt : expoly.contour.points)
        out.outer().emplace_back(to_boost(pt));
    out.inners().resize(expoly.holes.size());
    for (size_t i = 0; i < expoly.holes.size(); ++ i)
        for (const Vec2d &pt : expoly.holes[i].points)
            out.inners()[i].emplace_back(to_boost(pt));
    // closes the rings and fixes their orientation
    bg::correct(out);
    return out;
}

template<typename Ring>
Polygon from_boost_ring(const Ring &ring)
{
    Polygon out;
    out.points.reserve(ring.size());
    for (const BPoint &pt : ring)
        out.points.emplace_back(pt.x(), pt.y());
    if (out.points.size() > 1 && out.points.front() == out.points.back())
        out.points.pop_back();
    return out;
}

ExPolygons from_boost(const BMultiPolygon &mp)
{
    ExPolygons out;
    out.reserve(mp.size());
    for (const BPolygon &poly : mp) {
        ExPolygon expoly(from_boost_ring(poly.outer()));
        for (const auto &inner : poly.inners())
            expoly.holes.emplace_back(from_boost_ring(inner));
        out.emplace_back(std::move(expoly));
    }
    return out;
}

} // namespace

Triangulation BoostGeometryEngine::triangulate(const Points &points) const
{
    Triangulation out;
    if (points.size() < 2)
        return out;

    const BoundingBox bb(points);
    const SiteSet     set = snap_sites(points, bb.min, auto_resolution(bb));
    if (set.sites.size() < 2)
        return out;

    VD vd;
    boost::polygon::construct_voronoi(set.sites.begin(), set.sites.end(), &vd);

    // Every Voronoi edge separates two Delaunay neighbors.
    for (const VD::edge_type &edge : vd.edges()) {
        const size_t a = edge.cell()->source_index();
        const size_t b = edge.twin()->cell()->source_index();
        if (a < b)
            out.edges.emplace_back(set.owners[a], set.owners[b]);
    }
    // Every Voronoi vertex is a Delaunay face, cocircular faces are fanned.
    std::vector<size_t> face;
    for (const VD::vertex_type &vertex : vd.vertices()) {
        face.clear();
        const VD::edge_type *first_edge = vertex.incident_edge();
        const VD::edge_type *edge       = first_edge;
        do {
            face.emplace_back(set.owners[edge->cell()->source_index()]);
            edge = edge->rot_next();
        } while (edge != first_edge);
        for (size_t k = 1; k + 1 < face.size(); ++ k)
            out.triangles.push_back({ face[0], face[k], face[k + 1] });
    }

    BOOST_LOG_TRIVIAL(trace) << __FUNCTION__ << boost::format(": %1% points, %2% edges, %3% triangles")
        % points.size() % out.edges.size() % out.triangles.size();
    return out;
}

VoronoiCells BoostGeometryEngine::voronoi(const Points &points, double tolerance, const BoundingBox &envelope) const
{
    if (points.empty())
        throw GeometryError("Voronoi diagram of an empty point set");
    if (envelope.degenerate())
        throw GeometryError((boost::format("Degenerate Voronoi envelope %1%") % envelope).str());

    const double  resolution = tolerance > 0. ? tolerance : auto_resolution(envelope);
    const SiteSet set        = snap_sites(points, envelope.min, resolution);

    VoronoiCells cells;
    cells.reserve(set.sites.size());
    if (set.sites.size() == 1) {
        cells.push_back({ set.owners.front(), Polygon(box_ring(envelope)) });
        return cells;
    }

    VD vd;
    boost::polygon::construct_voronoi(set.sites.begin(), set.sites.end(), &vd);

    for (const VD::cell_type &cell : vd.cells()) {
        const size_t site_idx = cell.source_index();
        if (cell.is_degenerate())
            throw GeometryError((boost::format("Degenerate Voronoi cell of point %1%") % to_string(points[set.owners[site_idx]])).str());

        // The cell is the envelope clipped by the bisectors of all Delaunay neighbors.
        const Vec2d site = set.position(site_idx);
        Points      poly = box_ring(envelope);
        const VD::edge_type *first_edge = cell.incident_edge();
        const VD::edge_type *edge       = first_edge;
        do {
            poly = clip_half_plane(poly, site, set.position(edge->twin()->cell()->source_index()));
            edge = edge->next();
        } while (edge != first_edge && poly.size() >= 3);

        Polygon polygon(std::move(poly));
        if (polygon.size() < 3 || polygon.area() <= 0.)
            throw GeometryError((boost::format("Voronoi cell of point %1% vanished when clipped to %2%")
                % to_string(points[set.owners[site_idx]]) % envelope).str());
        cells.push_back({ set.owners[site_idx], std::move(polygon) });
    }

    std::sort(cells.begin(), cells.end(), [](const VoronoiCell &l, const VoronoiCell &r) { return l.owner_id < r.owner_id; });
    if (set.sites.size() < points.size())
        BOOST_LOG_TRIVIAL(debug) << __FUNCTION__ << boost::format(": %1% of %2% points collapsed at tolerance %3%")
            % (points.size() - set.sites.size()) % points.size() % resolution;
    return cells;
}

std::vector<size_t> BoostGeometryEngine::unique_points(const Points &points) const
{
    std::vector<size_t> out;
    out.reserve(points.size());
    std::unordered_map<Vec2d, size_t, PointHash, PointEqual> seen;
    seen.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++ i)
        if (seen.emplace(points[i], i).second)
            out.emplace_back(i);
    return out;
}

BoundingBox BoostGeometryEngine::envelope(const Points &points) const
{
    return BoundingBox(points);
}

BoundingBox BoostGeometryEngine::expand(const BoundingBox &box, double margin) const
{
    return box.expanded(margin);
}

ExPolygons BoostGeometryEngine::buffer(const ExPolygons &polygons, double distance, int segments) const
{
    if (distance == 0.)
        return polygons;

    // segments per quarter circle
    const int points_per_circle = std::max(4, 4 * segments);
    bg::strategy::buffer::distance_symmetric<double> distance_strategy(distance);
    bg::strategy::buffer::join_round                 join_strategy(points_per_circle);
    bg::strategy::buffer::end_round                  end_strategy(points_per_circle);
    bg::strategy::buffer::point_circle               point_strategy(points_per_circle);
    bg::strategy::buffer::side_straight              side_strategy;

    ExPolygons out;
    out.reserve(polygons.size());
    for (const ExPolygon &expoly : polygons) {
        BMultiPolygon result;
        bg::buffer(to_boost(expoly), result, distance_strategy, side_strategy, join_strategy, end_strategy, point_strategy);
        ExPolygons buffered = from_boost(result);
        out.insert(out.end(), std::make_move_iterator(buffered.begin()), std::make_move_iterator(buffered.end()));
    }
    return out;
}

ExPolygons BoostGeometryEngine::dissolve(const ExPolygons &polygons) const
{
    BMultiPolygon acc;
    for (const ExPolygon &expoly : polygons) {
        BMultiPolygon merged;
        bg::union_(acc, to_boost(expoly), merged);
        acc.swap(merged);
    }
    return from_boost(acc);
}

double BoostGeometryEngine::distance(const Vec2d &a, const Vec2d &b) const
{
    return (b - a).norm();
}

double BoostGeometryEngine::distance(const Vec2d &point, const ExPolygons &polygons) const
{
    double best = std::numeric_limits<double>::infinity();
    const BPoint pt = to_boost(point);
    for (const ExPolygon &expoly : polygons)
        best = std::min(best, bg::distance(pt, to_boost(expoly)));
    return best;
}

bool BoostGeometryEngine::within(const Vec2d &point, const Polygon &polygon) const
{
    return bg::covered_by(to_boost(point), to_boost(ExPolygon(polygon)));
}

bool BoostGeometryEngine::within(const Vec2d &point, const ExPolygons &polygons) const
{
    const BPoint pt = to_boost(point);
    for (const ExPolygon &expoly : polygons)
        if (get_extents(expoly).contains(point) && bg::covered_by(pt, to_boost(expoly)))
            return true;
    return false;
}

double BoostGeometryEngine::length_inside(const Vec2d &a, const Vec2d &b, const ExPolygons &polygons) const
{
    BoundingBox seg_bb;
    seg_bb.merge(a);
    seg_bb.merge(b);
    BLinestring segment;
    segment.emplace_back(to_boost(a));
    segment.emplace_back(to_boost(b));

    double length = 0.;
    for (const ExPolygon &expoly : polygons) {
        if (! seg_bb.overlap(get_extents(expoly)))
            continue;
        BMultiLinestring inside;
        bg::intersection(segment, to_boost(expoly), inside);
        length += bg::length(inside);
    }
    return length;
}

bool BoostGeometryEngine::intersects(const BoundingBox &box, const ExPolygon &polygon) const
{
    return bg::intersects(BBox(to_boost(box.min), to_boost(box.max)), to_boost(polygon));
}

} // namespace Terragraph
