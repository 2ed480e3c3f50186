#ifndef _libterragraph_h_
#define _libterragraph_h_

#include "libterragraph_version.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace Terragraph {

// Planar projected coordinates (EPSG:3857 in practice), in meters.
using coordf_t = double;

static constexpr double EPSILON = 1e-9;

// Name of the namespace holding the input features of a run.
static constexpr const char *SOURCE_NAMESPACE = "public";
// Name of the namespace holding the published graph.
static constexpr const char *GRAPH_NAMESPACE  = "graph";
// Scratch namespace the merger writes before publishing.
static constexpr const char *STAGING_NAMESPACE = "graph_staging";

// Relation names shared by the chunk processor, the merger and the store.
namespace Relations {
    static constexpr const char *WATER_FEATURES  = "water_features";
    static constexpr const char *WATER_BUFFERS   = "water_buffers";
    static constexpr const char *WATER_OBSTACLES = "water_obstacles";
    static constexpr const char *VERTICES        = "vertices";
    static constexpr const char *EDGES           = "edges";
    static constexpr const char *VORONOI_CELLS   = "voronoi_cells";
    static constexpr const char *TOPOLOGY_NODES  = "topology_nodes";
} // namespace Relations

template<typename T>
constexpr inline T sqr(T x)
{
    return x * x;
}

template<typename T>
inline bool is_approx(T value, T test_value, T precision = EPSILON)
{
    return std::abs(double(value) - double(test_value)) < double(precision);
}

} // namespace Terragraph

#endif // _libterragraph_h_
