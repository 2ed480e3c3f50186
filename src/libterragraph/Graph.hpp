#ifndef libterragraph_Graph_hpp_
#define libterragraph_Graph_hpp_

#include "libterragraph.h"
#include "BoundingBox.hpp"
#include "Point.hpp"
#include "SpatialStore.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace Terragraph {

using VertexId = std::int64_t;
using EdgeId   = std::int64_t;

static constexpr VertexId INVALID_ID = -1;

enum class VertexKind : std::uint8_t {
    Terrain,
    // Terrain sample point inside the boundary band of an obstacle.
    BoundaryTerrain,
    // Node placed along an obstacle boundary ring.
    BoundaryNode,
};

enum class EdgeType : std::uint8_t {
    Terrain,
    Water,
    BoundaryConnection,
};

std::string vertex_kind_name(VertexKind kind);
std::string edge_type_name(EdgeType type);

// One tile of the partitioned extent. Immutable after partitioning.
struct Tile
{
    std::string id;
    int         i { 0 };
    int         j { 0 };
    // Unexpanded part of the global extent owned by this tile.
    BoundingBox core;
    // Core expanded by overlap_margin on every interior facing edge.
    BoundingBox extent;
    double      overlap_margin { 0. };
};

using Tiles = std::vector<Tile>;

// Vertex of a tile namespace, local_id is meaningless outside of it.
struct LocalVertex
{
    VertexId   local_id { INVALID_ID };
    Vec2d      position { Vec2d::Zero() };
    double     elevation { 0. };
    double     cost { 1. };
    VertexKind kind { VertexKind::Terrain };
    // Only set for boundary nodes.
    int        obstacle_id { -1 };
    int        ring_order { -1 };
};

struct LocalEdge
{
    EdgeId   local_id { INVALID_ID };
    VertexId source_local_id { INVALID_ID };
    VertexId target_local_id { INVALID_ID };
    double   length { 0. };
    double   cost { 0. };
    EdgeType edge_type { EdgeType::Terrain };
    Polyline geometry;
};

struct GlobalVertex
{
    VertexId   global_id { INVALID_ID };
    Vec2d      position { Vec2d::Zero() };
    double     elevation { 0. };
    double     cost { 1. };
    VertexKind kind { VertexKind::Terrain };
};

struct GlobalEdge
{
    EdgeId   global_id { INVALID_ID };
    VertexId source_global_id { INVALID_ID };
    VertexId target_global_id { INVALID_ID };
    double   length { 0. };
    double   cost { 0. };
    EdgeType edge_type { EdgeType::Terrain };
    Polyline geometry;
    // Routing topology node ids, assigned by the final topology pass.
    VertexId source_node { INVALID_ID };
    VertexId target_node { INVALID_ID };
};

using LocalVertices  = std::vector<LocalVertex>;
using LocalEdges     = std::vector<LocalEdge>;
using GlobalVertices = std::vector<GlobalVertex>;
using GlobalEdges    = std::vector<GlobalEdge>;

enum class ChunkStatus : std::uint8_t {
    Success,
    Failed,
};

struct ChunkResult
{
    std::string tile_id;
    ChunkStatus status { ChunkStatus::Failed };
    std::string error;
    size_t      vertex_count { 0 };
    size_t      edge_count { 0 };
    double      elapsed_seconds { 0. };

    bool succeeded() const { return status == ChunkStatus::Success; }
};

using ChunkResults = std::vector<ChunkResult>;

// Mapping of the graph onto the generic rows of the store.
PointRecord  to_record(const LocalVertex &vertex);
PointRecord  to_record(const GlobalVertex &vertex);
EdgeRecord   to_record(const LocalEdge &edge);
EdgeRecord   to_record(const GlobalEdge &edge);
LocalVertex  local_vertex_from_record(const PointRecord &record);
LocalEdge    local_edge_from_record(const EdgeRecord &record);
GlobalVertex global_vertex_from_record(const PointRecord &record);
GlobalEdge   global_edge_from_record(const EdgeRecord &record);

} // namespace Terragraph

#endif // libterragraph_Graph_hpp_
