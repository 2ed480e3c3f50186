#ifndef libterragraph_ChunkProcessor_hpp_
#define libterragraph_ChunkProcessor_hpp_

#include "../libterragraph.h"
#include "../Config.hpp"
#include "../GeometryEngine.hpp"
#include "../Graph.hpp"
#include "../SpatialStore.hpp"

namespace Terragraph {

struct VoronoiStats;

// Local graph of one tile before it is written to the tile namespace.
struct LocalGraph
{
    LocalVertices vertices;
    LocalEdges    edges;
    ExPolygons    obstacles;
    VoronoiCells  cells;

    VertexId add_vertex(const Vec2d &position, VertexKind kind);
    EdgeId   add_edge(VertexId source, VertexId target, EdgeType type, double cost_factor = 1.);
    const LocalVertex& vertex(VertexId id) const { return vertices[size_t(id - 1)]; }
};

// Builds the local graph of a single tile inside the namespace named after the tile:
// water features, buffers, dissolved obstacles, grid sampled terrain, Delaunay terrain
// edges, obstacle boundary nodes and the Voronoi based connections between the two.
// A tile only reads the source namespace and its own one.
class ChunkProcessor
{
public:
    ChunkProcessor(const RunConfig &config, const GeometryEngine &engine) : m_config(config), m_engine(engine) {}

    // Never throws, a failed tile is reported by the result and its namespace is dropped.
    ChunkResult process(const Tile &tile, StoreSession &session) const;

    // Steps of process(), exposed for the tests.
    ExPolygons  extract_obstacles(const Tile &tile, StoreSession &session) const;
    void        sample_terrain(const Tile &tile, LocalGraph &graph) const;
    void        triangulate_terrain(LocalGraph &graph) const;
    void        place_boundary_nodes(const Tile &tile, LocalGraph &graph) const;
    // Returns the number of connection edges.
    size_t      connect_boundary(LocalGraph &graph, VoronoiStats *stats = nullptr) const;

private:
    bool        connection_allowed(const LocalGraph &graph, VertexId a, VertexId b, double max_distance, bool relaxed) const;
    size_t      connect_nearest(LocalGraph &graph, const std::vector<VertexId> &terrain, const std::vector<VertexId> &nodes,
                    double max_distance, int limit, bool relaxed) const;
    void        write_graph(const Tile &tile, const LocalGraph &graph, StoreSession &session) const;

    const RunConfig      &m_config;
    const GeometryEngine &m_engine;
};

} // namespace Terragraph

#endif // libterragraph_ChunkProcessor_hpp_
