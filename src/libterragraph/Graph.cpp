#include "Graph.hpp"
#include "Exception.hpp"

#include <boost/format.hpp>

namespace Terragraph {

std::string vertex_kind_name(VertexKind kind)
{
    switch (kind) {
    case VertexKind::Terrain:         return "terrain";
    case VertexKind::BoundaryTerrain: return "boundary_terrain";
    case VertexKind::BoundaryNode:    return "boundary_node";
    }
    return "unknown";
}

std::string edge_type_name(EdgeType type)
{
    switch (type) {
    case EdgeType::Terrain:            return "terrain";
    case EdgeType::Water:              return "water";
    case EdgeType::BoundaryConnection: return "boundary_connection";
    }
    return "unknown";
}

static VertexKind vertex_kind_from_int(int kind)
{
    if (kind < int(VertexKind::Terrain) || kind > int(VertexKind::BoundaryNode))
        throw StoreError((boost::format("Invalid vertex kind %1%") % kind).str());
    return VertexKind(kind);
}

static EdgeType edge_type_from_int(int type)
{
    if (type < int(EdgeType::Terrain) || type > int(EdgeType::BoundaryConnection))
        throw StoreError((boost::format("Invalid edge type %1%") % type).str());
    return EdgeType(type);
}

PointRecord to_record(const LocalVertex &vertex)
{
    PointRecord out;
    out.id        = vertex.local_id;
    out.position  = vertex.position;
    out.elevation = vertex.elevation;
    out.cost      = vertex.cost;
    out.kind      = int(vertex.kind);
    out.group     = vertex.obstacle_id;
    out.order     = vertex.ring_order;
    return out;
}

PointRecord to_record(const GlobalVertex &vertex)
{
    PointRecord out;
    out.id        = vertex.global_id;
    out.position  = vertex.position;
    out.elevation = vertex.elevation;
    out.cost      = vertex.cost;
    out.kind      = int(vertex.kind);
    return out;
}

EdgeRecord to_record(const LocalEdge &edge)
{
    EdgeRecord out;
    out.id       = edge.local_id;
    out.source   = edge.source_local_id;
    out.target   = edge.target_local_id;
    out.length   = edge.length;
    out.cost     = edge.cost;
    out.type     = int(edge.edge_type);
    out.geometry = edge.geometry;
    return out;
}

EdgeRecord to_record(const GlobalEdge &edge)
{
    EdgeRecord out;
    out.id          = edge.global_id;
    out.source      = edge.source_global_id;
    out.target      = edge.target_global_id;
    out.length      = edge.length;
    out.cost        = edge.cost;
    out.type        = int(edge.edge_type);
    out.geometry    = edge.geometry;
    out.source_node = edge.source_node;
    out.target_node = edge.target_node;
    return out;
}

LocalVertex local_vertex_from_record(const PointRecord &record)
{
    LocalVertex out;
    out.local_id    = record.id;
    out.position    = record.position;
    out.elevation   = record.elevation;
    out.cost        = record.cost;
    out.kind        = vertex_kind_from_int(record.kind);
    out.obstacle_id = record.group;
    out.ring_order  = record.order;
    return out;
}

LocalEdge local_edge_from_record(const EdgeRecord &record)
{
    LocalEdge out;
    out.local_id        = record.id;
    out.source_local_id = record.source;
    out.target_local_id = record.target;
    out.length          = record.length;
    out.cost            = record.cost;
    out.edge_type       = edge_type_from_int(record.type);
    out.geometry        = record.geometry;
    return out;
}

GlobalVertex global_vertex_from_record(const PointRecord &record)
{
    GlobalVertex out;
    out.global_id = record.id;
    out.position  = record.position;
    out.elevation = record.elevation;
    out.cost      = record.cost;
    out.kind      = vertex_kind_from_int(record.kind);
    return out;
}

GlobalEdge global_edge_from_record(const EdgeRecord &record)
{
    GlobalEdge out;
    out.global_id        = record.id;
    out.source_global_id = record.source;
    out.target_global_id = record.target;
    out.length           = record.length;
    out.cost             = record.cost;
    out.edge_type        = edge_type_from_int(record.type);
    out.geometry         = record.geometry;
    out.source_node      = record.source_node;
    out.target_node      = record.target_node;
    return out;
}

} // namespace Terragraph
