#ifndef libterragraph_GraphMerger_hpp_
#define libterragraph_GraphMerger_hpp_

#include "../libterragraph.h"
#include "../Config.hpp"
#include "../Graph.hpp"
#include "../SpatialStore.hpp"

#include <string>
#include <tuple>
#include <unordered_map>
#include <set>
#include <vector>

namespace Terragraph {

// An edge of a tile referencing a vertex the tile never wrote.
struct ReconciliationDefect
{
    std::string tile_id;
    EdgeId      edge_id { INVALID_ID };
    VertexId    missing_local_id { INVALID_ID };
};

struct MergeReport
{
    size_t tiles_merged { 0 };
    size_t tiles_skipped { 0 };
    size_t vertices { 0 };
    size_t edges { 0 };
    // Local vertices mapped onto an already existing global vertex.
    size_t duplicate_vertices { 0 };
    size_t duplicate_edges { 0 };
    size_t topology_nodes { 0 };
    std::vector<ReconciliationDefect> defects;
};

// Unions the local graphs of the successful tiles into the global graph.
// Single threaded, runs after all tiles finished. Vertices are deduplicated
// by exact position, edges are remapped through the per tile local to global
// id tables. The result is written into a staging namespace and published
// atomically, a failing store leaves the previously published graph untouched.
class GraphMerger
{
public:
    explicit GraphMerger(const MergeConfig &config) : m_config(config) {}

    // Throws StoreError if the store fails, ReconciliationError on defects with strict reconciliation.
    MergeReport merge(const ChunkResults &results, StoreSession &session);

    const GlobalVertices& vertices() const { return m_vertices; }
    const GlobalEdges&    edges() const { return m_edges; }

private:
    using EdgeKey = std::tuple<VertexId, VertexId, EdgeType>;

    void merge_tile(const std::string &tile_id, StoreSession &session, MergeReport &report);
    void build_topology(MergeReport &report);
    void publish(StoreSession &session) const;
    void clear();

    MergeConfig                                               m_config;
    GlobalVertices                                            m_vertices;
    GlobalEdges                                               m_edges;
    std::unordered_map<Vec2d, VertexId, PointHash, PointEqual> m_vertex_ids;
    std::set<EdgeKey>                                         m_edge_keys;
    Points                                                    m_topology_nodes;
};

} // namespace Terragraph

#endif // libterragraph_GraphMerger_hpp_
