#include "ChunkProcessor.hpp"
#include "../Exception.hpp"
#include "../Voronoi/RobustVoronoiGenerator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <set>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

namespace Terragraph {

// Length of a segment inside an obstacle that still counts as touching its boundary.
static constexpr double CROSSING_TOLERANCE = 1e-6;

VertexId LocalGraph::add_vertex(const Vec2d &position, VertexKind kind)
{
    LocalVertex vertex;
    vertex.local_id = VertexId(vertices.size()) + 1;
    vertex.position = position;
    vertex.kind     = kind;
    vertices.emplace_back(vertex);
    return vertex.local_id;
}

EdgeId LocalGraph::add_edge(VertexId source, VertexId target, EdgeType type, double cost_factor)
{
    const Vec2d &a = this->vertex(source).position;
    const Vec2d &b = this->vertex(target).position;
    LocalEdge edge;
    edge.local_id        = EdgeId(edges.size()) + 1;
    edge.source_local_id = source;
    edge.target_local_id = target;
    edge.length          = (b - a).norm();
    edge.cost            = edge.length * cost_factor;
    edge.edge_type       = type;
    edge.geometry        = { a, b };
    edges.emplace_back(std::move(edge));
    return edges.back().local_id;
}

ExPolygons ChunkProcessor::extract_obstacles(const Tile &tile, StoreSession &session) const
{
    const ObstacleConfig &config = m_config.obstacle;

    // Whole features are kept, so that overlapping tiles derive identical obstacles.
    PolygonRecords features = session.query_polygons(SOURCE_NAMESPACE, Relations::WATER_FEATURES, tile.extent);
    features.erase(std::remove_if(features.begin(), features.end(),
        [this, &tile](const PolygonRecord &f) { return ! m_engine.intersects(tile.extent, f.polygon); }), features.end());
    session.write_polygons(tile.id, Relations::WATER_FEATURES, features);

    PolygonRecords buffers;
    ExPolygons     buffered;
    for (const PolygonRecord &feature : features) {
        for (ExPolygon &expoly : m_engine.buffer({ feature.polygon }, config.buffer_distance, config.buffer_segments)) {
            buffers.push_back({ feature.id, expoly, "water_buffer" });
            buffered.emplace_back(std::move(expoly));
        }
    }
    session.write_polygons(tile.id, Relations::WATER_BUFFERS, buffers);

    ExPolygons obstacles = m_engine.dissolve(buffered);
    for (ExPolygon &obstacle : obstacles) {
        obstacle.contour.make_counter_clockwise();
        obstacle.contour.canonicalize();
    }
    std::sort(obstacles.begin(), obstacles.end(), [](const ExPolygon &l, const ExPolygon &r) {
        return PointLess()(l.contour.points.front(), r.contour.points.front());
    });

    PolygonRecords records;
    records.reserve(obstacles.size());
    for (size_t i = 0; i < obstacles.size(); ++ i)
        records.push_back({ std::int64_t(i + 1), obstacles[i], "water_obstacle" });
    session.write_polygons(tile.id, Relations::WATER_OBSTACLES, records);

    BOOST_LOG_TRIVIAL(debug) << tile.id << boost::format(": %1% water features, %2% buffers, %3% obstacles")
        % features.size() % buffers.size() % obstacles.size();
    return obstacles;
}

void ChunkProcessor::sample_terrain(const Tile &tile, LocalGraph &graph) const
{
    const SamplingConfig &config  = m_config.sampling;
    const double          spacing = config.grid_spacing;
    const Vec2d          &origin  = config.grid_origin;

    // Grid indices are global, every tile regenerates bit identical coordinates in the overlaps.
    const long ix0 = long(std::ceil((tile.extent.min.x() - origin.x()) / spacing));
    const long ix1 = long(std::floor((tile.extent.max.x() - origin.x()) / spacing));
    const long iy0 = long(std::ceil((tile.extent.min.y() - origin.y()) / spacing));
    const long iy1 = long(std::floor((tile.extent.max.y() - origin.y()) / spacing));

    size_t skipped = 0;
    for (long ix = ix0; ix <= ix1; ++ ix)
        for (long iy = iy0; iy <= iy1; ++ iy) {
            const Vec2d pt(origin.x() + double(ix) * spacing, origin.y() + double(iy) * spacing);
            VertexKind kind = VertexKind::Terrain;
            if (! graph.obstacles.empty()) {
                if (m_engine.within(pt, graph.obstacles)) {
                    ++ skipped;
                    continue;
                }
                if (m_engine.distance(pt, graph.obstacles) <= config.boundary_band)
                    kind = VertexKind::BoundaryTerrain;
            }
            graph.add_vertex(pt, kind);
        }

    BOOST_LOG_TRIVIAL(debug) << tile.id << boost::format(": %1% terrain points, %2% inside obstacles")
        % graph.vertices.size() % skipped;
}

void ChunkProcessor::triangulate_terrain(LocalGraph &graph) const
{
    std::vector<VertexId> ids;
    Points                points;
    for (const LocalVertex &v : graph.vertices)
        if (v.kind != VertexKind::BoundaryNode) {
            ids.emplace_back(v.local_id);
            points.emplace_back(v.position);
        }

    const double  factor = m_config.obstacle.water_crossing_factor;
    Triangulation tri    = m_engine.triangulate(points);
    size_t too_long = 0;
    size_t crossing = 0;
    for (const std::pair<size_t, size_t> &e : tri.edges) {
        const Vec2d &a = points[e.first];
        const Vec2d &b = points[e.second];
        if ((b - a).norm() > m_config.sampling.max_edge_length) {
            ++ too_long;
            continue;
        }
        if (! graph.obstacles.empty() && m_engine.length_inside(a, b, graph.obstacles) > CROSSING_TOLERANCE) {
            ++ crossing;
            if (factor > 0.)
                graph.add_edge(ids[e.first], ids[e.second], EdgeType::Water, factor);
            continue;
        }
        graph.add_edge(ids[e.first], ids[e.second], EdgeType::Terrain);
    }

    BOOST_LOG_TRIVIAL(debug) << __FUNCTION__ << boost::format(": %1% Delaunay edges, %2% too long, %3% crossing water")
        % tri.edges.size() % too_long % crossing;
}

void ChunkProcessor::place_boundary_nodes(const Tile &tile, LocalGraph &graph) const
{
    size_t nodes = 0;
    for (size_t obstacle_idx = 0; obstacle_idx < graph.obstacles.size(); ++ obstacle_idx) {
        const Points ring = segmentize(graph.obstacles[obstacle_idx].contour, m_config.obstacle.boundary_node_spacing);
        std::vector<VertexId> ids(ring.size(), INVALID_ID);
        for (size_t r = 0; r < ring.size(); ++ r) {
            if (! tile.extent.contains(ring[r]))
                continue;
            ids[r] = graph.add_vertex(ring[r], VertexKind::BoundaryNode);
            LocalVertex &v = graph.vertices.back();
            v.obstacle_id = int(obstacle_idx);
            v.ring_order  = int(r);
            ++ nodes;
        }
        // consecutive nodes along the ring, closing the loop
        const size_t n = ring.size();
        for (size_t r = 0; n > 1 && r < n; ++ r) {
            const size_t next = (r + 1) % n;
            if (n == 2 && r == 1)
                break;
            if (ids[r] != INVALID_ID && ids[next] != INVALID_ID)
                graph.add_edge(ids[r], ids[next], EdgeType::Water);
        }
    }
    BOOST_LOG_TRIVIAL(debug) << tile.id << boost::format(": %1% boundary nodes on %2% obstacles") % nodes % graph.obstacles.size();
}

bool ChunkProcessor::connection_allowed(const LocalGraph &graph, VertexId a, VertexId b, double max_distance, bool relaxed) const
{
    const Vec2d &pa = graph.vertex(a).position;
    const Vec2d &pb = graph.vertex(b).position;
    const double d  = m_engine.distance(pa, pb);
    if (d > max_distance)
        return false;
    const double inside = m_engine.length_inside(pa, pb, graph.obstacles);
    // The relaxed check only rejects connections running entirely through water.
    return relaxed ? inside < d - CROSSING_TOLERANCE : inside <= CROSSING_TOLERANCE;
}

size_t ChunkProcessor::connect_nearest(LocalGraph &graph, const std::vector<VertexId> &terrain, const std::vector<VertexId> &nodes,
    double max_distance, int limit, bool relaxed) const
{
    size_t added = 0;
    std::vector<std::pair<double, VertexId>> candidates;
    for (VertexId t : terrain) {
        const Vec2d &pt = graph.vertex(t).position;
        candidates.clear();
        for (VertexId n : nodes) {
            const double d = m_engine.distance(pt, graph.vertex(n).position);
            if (d <= max_distance)
                candidates.emplace_back(d, n);
        }
        std::sort(candidates.begin(), candidates.end());
        int connected = 0;
        for (const std::pair<double, VertexId> &c : candidates) {
            if (connected >= limit)
                break;
            if (this->connection_allowed(graph, t, c.second, max_distance, relaxed)) {
                graph.add_edge(t, c.second, EdgeType::BoundaryConnection);
                ++ connected;
            }
        }
        added += size_t(connected);
    }
    return added;
}

static int find_cell(const GeometryEngine &engine, const VoronoiCells &cells, const std::vector<BoundingBox> &boxes, const Vec2d &pt)
{
    for (size_t i = 0; i < cells.size(); ++ i)
        if (boxes[i].contains(pt) && engine.within(pt, cells[i].polygon))
            return int(i);
    return -1;
}

size_t ChunkProcessor::connect_boundary(LocalGraph &graph, VoronoiStats *stats) const
{
    const ConnectionConfig &config = m_config.connection;

    std::vector<VertexId> terrain;
    std::vector<VertexId> nodes;
    Points                terrain_pts;
    Points                node_pts;
    for (const LocalVertex &v : graph.vertices) {
        if (v.kind == VertexKind::BoundaryTerrain) {
            terrain.emplace_back(v.local_id);
            terrain_pts.emplace_back(v.position);
        } else if (v.kind == VertexKind::BoundaryNode) {
            nodes.emplace_back(v.local_id);
            node_pts.emplace_back(v.position);
        }
    }
    if (terrain.empty() || nodes.empty())
        return 0;

    RobustVoronoiGenerator  generator(m_engine, m_config.voronoi);
    ChunkedVoronoiGenerator chunked(generator);

    const bool reversed = config.mode == ConnectionMode::ReversedVoronoi;
    // Cells around boundary terrain points in the reversed orientation, around boundary nodes otherwise.
    VoronoiCells cells = chunked.generate(reversed ? terrain_pts : node_pts, stats);
    std::vector<BoundingBox> boxes;
    boxes.reserve(cells.size());
    for (const VoronoiCell &cell : cells)
        boxes.emplace_back(get_extents(cell.polygon));

    std::set<VertexId> connected;
    size_t             added = 0;
    auto connect = [&](VertexId t, VertexId n) {
        if (this->connection_allowed(graph, t, n, config.max_distance, false)) {
            graph.add_edge(t, n, EdgeType::BoundaryConnection);
            connected.insert(t);
            ++ added;
        }
    };
    if (reversed) {
        for (size_t n = 0; n < nodes.size(); ++ n) {
            const int cell = find_cell(m_engine, cells, boxes, node_pts[n]);
            if (cell >= 0)
                connect(terrain[cells[size_t(cell)].owner_id], nodes[n]);
        }
    } else {
        for (size_t t = 0; t < terrain.size(); ++ t) {
            const int cell = find_cell(m_engine, cells, boxes, terrain_pts[t]);
            if (cell >= 0)
                connect(terrain[t], nodes[cells[size_t(cell)].owner_id]);
        }
    }
    const size_t voronoi_connections = added;

    // Boundary terrain points the cells left alone get their nearest boundary nodes.
    std::vector<VertexId> unconnected;
    for (VertexId t : terrain)
        if (connected.find(t) == connected.end())
            unconnected.emplace_back(t);
    if (! unconnected.empty() && config.fallback_limit > 0)
        added += this->connect_nearest(graph, unconnected, nodes, config.max_distance, config.fallback_limit, false);

    if (added == 0) {
        BOOST_LOG_TRIVIAL(warning) << __FUNCTION__ << ": no connections created, falling back to nearest nodes at twice the distance";
        added += this->connect_nearest(graph, terrain, nodes, 2. * config.max_distance, 1, true);
    }

    // Cells are kept keyed by the local id of their owner.
    for (VoronoiCell &cell : cells)
        cell.owner_id = size_t(reversed ? terrain[cell.owner_id] : nodes[cell.owner_id]);
    graph.cells = std::move(cells);

    BOOST_LOG_TRIVIAL(debug) << __FUNCTION__ << boost::format(": %1% mode, %2% boundary terrain points, %3% boundary nodes, %4% Voronoi connections, %5% in total")
        % connection_mode_name(config.mode) % terrain.size() % nodes.size() % voronoi_connections % added;
    return added;
}

void ChunkProcessor::write_graph(const Tile &tile, const LocalGraph &graph, StoreSession &session) const
{
    PointRecords vertices;
    vertices.reserve(graph.vertices.size());
    for (const LocalVertex &v : graph.vertices)
        vertices.emplace_back(to_record(v));
    EdgeRecords edges;
    edges.reserve(graph.edges.size());
    for (const LocalEdge &e : graph.edges)
        edges.emplace_back(to_record(e));
    PolygonRecords cells;
    cells.reserve(graph.cells.size());
    for (const VoronoiCell &cell : graph.cells)
        cells.push_back({ std::int64_t(cell.owner_id), ExPolygon(cell.polygon), "voronoi_cell" });

    session.write_points(tile.id, Relations::VERTICES, vertices);
    session.write_edges(tile.id, Relations::EDGES, edges);
    session.write_polygons(tile.id, Relations::VORONOI_CELLS, cells);
    session.build_index(tile.id, Relations::VERTICES);
    session.build_index(tile.id, Relations::EDGES);
}

ChunkResult ChunkProcessor::process(const Tile &tile, StoreSession &session) const
{
    const auto t_start = std::chrono::steady_clock::now();

    ChunkResult result;
    result.tile_id = tile.id;
    BOOST_LOG_TRIVIAL(info) << __FUNCTION__ << boost::format(": start %1% %2%") % tile.id % tile.extent;
    try {
        session.drop_namespace(tile.id);
        session.create_namespace(tile.id);

        LocalGraph graph;
        graph.obstacles = this->extract_obstacles(tile, session);
        this->sample_terrain(tile, graph);
        this->triangulate_terrain(graph);
        this->place_boundary_nodes(tile, graph);
        VoronoiStats stats;
        this->connect_boundary(graph, &stats);
        if (stats.failed_attempts() > 0)
            BOOST_LOG_TRIVIAL(warning) << tile.id << boost::format(": Voronoi needed %1% attempts") % stats.attempts.size();
        this->write_graph(tile, graph, session);

        result.status       = ChunkStatus::Success;
        result.vertex_count = graph.vertices.size();
        result.edge_count   = graph.edges.size();
    } catch (const std::exception &ex) {
        result.status = ChunkStatus::Failed;
        result.error  = ex.what();
        BOOST_LOG_TRIVIAL(error) << __FUNCTION__ << boost::format(": tile %1% failed: %2%") % tile.id % ex.what();
        // the data of a failed tile must never reach the merge
        try {
            session.drop_namespace(tile.id);
        } catch (const std::exception &drop_ex) {
            BOOST_LOG_TRIVIAL(warning) << __FUNCTION__ << boost::format(": cannot drop namespace %1%: %2%") % tile.id % drop_ex.what();
        }
    }

    result.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - t_start).count();
    if (result.succeeded())
        BOOST_LOG_TRIVIAL(info) << __FUNCTION__ << boost::format(": done %1%, %2% vertices, %3% edges in %4%s")
            % tile.id % result.vertex_count % result.edge_count % result.elapsed_seconds;
    return result;
}

} // namespace Terragraph
