#include "GraphMerger.hpp"
#include "../Exception.hpp"

#include <algorithm>
#include <iterator>

#include <boost/format.hpp>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/index/rtree.hpp>
#include <boost/log/trivial.hpp>

namespace Terragraph {

namespace bg  = boost::geometry;
namespace bgi = boost::geometry::index;

void GraphMerger::clear()
{
    m_vertices.clear();
    m_edges.clear();
    m_vertex_ids.clear();
    m_edge_keys.clear();
    m_topology_nodes.clear();
}

void GraphMerger::merge_tile(const std::string &tile_id, StoreSession &session, MergeReport &report)
{
    const PointRecords vertices = session.read_points(tile_id, Relations::VERTICES);
    const EdgeRecords  edges    = session.read_edges(tile_id, Relations::EDGES);

    std::unordered_map<VertexId, VertexId> local_to_global;
    local_to_global.reserve(vertices.size());
    for (const PointRecord &record : vertices) {
        const LocalVertex local = local_vertex_from_record(record);
        auto it = m_vertex_ids.find(local.position);
        if (it == m_vertex_ids.end()) {
            GlobalVertex global;
            global.global_id = VertexId(m_vertices.size()) + 1;
            global.position  = local.position;
            global.elevation = local.elevation;
            global.cost      = local.cost;
            global.kind      = local.kind;
            it = m_vertex_ids.emplace(local.position, global.global_id).first;
            m_vertices.emplace_back(global);
        } else {
            ++ report.duplicate_vertices;
        }
        local_to_global[local.local_id] = it->second;
    }

    for (const EdgeRecord &record : edges) {
        const LocalEdge local = local_edge_from_record(record);
        auto it_source = local_to_global.find(local.source_local_id);
        auto it_target = local_to_global.find(local.target_local_id);
        if (it_source == local_to_global.end() || it_target == local_to_global.end()) {
            const VertexId missing = it_source == local_to_global.end() ? local.source_local_id : local.target_local_id;
            report.defects.push_back({ tile_id, local.local_id, missing });
            BOOST_LOG_TRIVIAL(error) << __FUNCTION__ << boost::format(": edge %1% of %2% references unknown vertex %3%")
                % local.local_id % tile_id % missing;
            continue;
        }
        const VertexId source = it_source->second;
        const VertexId target = it_target->second;
        if (m_config.deduplicate_edges &&
            ! m_edge_keys.emplace(std::min(source, target), std::max(source, target), local.edge_type).second) {
            ++ report.duplicate_edges;
            continue;
        }

        GlobalEdge global;
        global.global_id        = EdgeId(m_edges.size()) + 1;
        global.source_global_id = source;
        global.target_global_id = target;
        global.length           = local.length;
        global.cost             = local.cost;
        global.edge_type        = local.edge_type;
        global.geometry         = local.geometry;
        m_edges.emplace_back(std::move(global));
    }

    BOOST_LOG_TRIVIAL(debug) << __FUNCTION__ << boost::format(": %1% with %2% vertices and %3% edges, %4% global vertices so far")
        % tile_id % vertices.size() % edges.size() % m_vertices.size();
}

void GraphMerger::build_topology(MergeReport &report)
{
    using TopologyPoint = bg::model::d2::point_xy<double>;
    using TopologyValue = std::pair<TopologyPoint, VertexId>;
    bgi::rtree<TopologyValue, bgi::rstar<16>> tree;

    const double tolerance = m_config.topology_tolerance;
    // Endpoints closer than the tolerance to an existing node snap onto it.
    auto node_for = [this, &tree, tolerance](const Vec2d &pt) {
        const TopologyPoint query(pt.x(), pt.y());
        std::vector<TopologyValue> nearest;
        tree.query(bgi::nearest(query, 1), std::back_inserter(nearest));
        if (! nearest.empty() && bg::distance(nearest.front().first, query) <= tolerance)
            return nearest.front().second;
        const VertexId id = VertexId(m_topology_nodes.size()) + 1;
        m_topology_nodes.emplace_back(pt);
        tree.insert(TopologyValue(query, id));
        return id;
    };

    for (GlobalEdge &edge : m_edges) {
        const Vec2d &a = edge.geometry.empty() ? m_vertices[size_t(edge.source_global_id - 1)].position : edge.geometry.front();
        const Vec2d &b = edge.geometry.empty() ? m_vertices[size_t(edge.target_global_id - 1)].position : edge.geometry.back();
        edge.source_node = node_for(a);
        edge.target_node = node_for(b);
    }
    report.topology_nodes = m_topology_nodes.size();
}

void GraphMerger::publish(StoreSession &session) const
{
    PointRecords vertices;
    vertices.reserve(m_vertices.size());
    for (const GlobalVertex &v : m_vertices)
        vertices.emplace_back(to_record(v));
    EdgeRecords edges;
    edges.reserve(m_edges.size());
    for (const GlobalEdge &e : m_edges)
        edges.emplace_back(to_record(e));
    PointRecords nodes;
    nodes.reserve(m_topology_nodes.size());
    for (size_t i = 0; i < m_topology_nodes.size(); ++ i) {
        PointRecord node;
        node.id       = std::int64_t(i + 1);
        node.position = m_topology_nodes[i];
        nodes.emplace_back(node);
    }

    try {
        session.drop_namespace(STAGING_NAMESPACE);
        session.create_namespace(STAGING_NAMESPACE);
        session.write_points(STAGING_NAMESPACE, Relations::VERTICES, vertices);
        session.write_edges(STAGING_NAMESPACE, Relations::EDGES, edges);
        session.write_points(STAGING_NAMESPACE, Relations::TOPOLOGY_NODES, nodes);
        session.build_index(STAGING_NAMESPACE, Relations::VERTICES);
        session.build_index(STAGING_NAMESPACE, Relations::EDGES);
        session.build_index(STAGING_NAMESPACE, Relations::TOPOLOGY_NODES);
        session.publish_namespace(STAGING_NAMESPACE, GRAPH_NAMESPACE);
    } catch (const StoreError &ex) {
        BOOST_LOG_TRIVIAL(error) << __FUNCTION__ << ": publishing the graph failed, the previous graph is kept: " << ex.what();
        try {
            session.drop_namespace(STAGING_NAMESPACE);
        } catch (const StoreError &drop_ex) {
            BOOST_LOG_TRIVIAL(warning) << __FUNCTION__ << ": cannot drop the staging namespace: " << drop_ex.what();
        }
        throw;
    }
}

MergeReport GraphMerger::merge(const ChunkResults &results, StoreSession &session)
{
    this->clear();
    MergeReport report;

    std::vector<std::string> tile_ids;
    for (const ChunkResult &result : results) {
        if (result.succeeded())
            tile_ids.emplace_back(result.tile_id);
        else
            ++ report.tiles_skipped;
    }
    // Completion order is arbitrary, global ids must not depend on it.
    std::sort(tile_ids.begin(), tile_ids.end());

    BOOST_LOG_TRIVIAL(info) << __FUNCTION__ << boost::format(": merging %1% tiles, skipping %2% failed ones")
        % tile_ids.size() % report.tiles_skipped;

    try {
        for (const std::string &tile_id : tile_ids) {
            this->merge_tile(tile_id, session, report);
            ++ report.tiles_merged;
        }
    } catch (const StoreError &ex) {
        BOOST_LOG_TRIVIAL(error) << __FUNCTION__ << ": reading the tiles failed: " << ex.what();
        throw;
    }

    if (! report.defects.empty()) {
        BOOST_LOG_TRIVIAL(error) << __FUNCTION__ << boost::format(": %1% reconciliation defects") % report.defects.size();
        if (m_config.strict_reconciliation) {
            const ReconciliationDefect &first = report.defects.front();
            throw ReconciliationError((boost::format("%1% edges reference unknown vertices, first one is edge %2% of %3%")
                % report.defects.size() % first.edge_id % first.tile_id).str());
        }
    }

    this->build_topology(report);
    report.vertices = m_vertices.size();
    report.edges    = m_edges.size();
    this->publish(session);

    if (m_config.drop_tile_namespaces) {
        for (const ChunkResult &result : results) {
            try {
                session.drop_namespace(result.tile_id);
            } catch (const StoreError &ex) {
                BOOST_LOG_TRIVIAL(warning) << __FUNCTION__ << boost::format(": cannot drop namespace %1%: %2%") % result.tile_id % ex.what();
            }
        }
    }

    BOOST_LOG_TRIVIAL(info) << __FUNCTION__ << boost::format(": %1% vertices (%2% duplicates), %3% edges (%4% duplicates), %5% topology nodes")
        % report.vertices % report.duplicate_vertices % report.edges % report.duplicate_edges % report.topology_nodes;
    return report;
}

} // namespace Terragraph
