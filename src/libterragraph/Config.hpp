#ifndef libterragraph_Config_hpp_
#define libterragraph_Config_hpp_

#include "libterragraph.h"
#include "BoundingBox.hpp"

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace Terragraph {

struct PartitionConfig
{
    // Target tile edge length, in projected units.
    double tile_size        = 5000.;
    double overlap_fraction = 0.1;
    // Global extent of the run. Undefined means the extent of the source features.
    BoundingBox extent;
};

struct SamplingConfig
{
    double grid_spacing    = 200.;
    // Global origin of the sampling grid, shared by all tiles.
    Vec2d  grid_origin     = Vec2d::Zero();
    // Terrain points closer than this to an obstacle are boundary terrain points.
    double boundary_band   = 300.;
    double max_edge_length = 500.;
};

struct ObstacleConfig
{
    double buffer_distance       = 50.;
    int    buffer_segments       = 8;
    double boundary_node_spacing = 100.;
    // Cost multiplier of Delaunay edges running through water, 0 drops them instead.
    double water_crossing_factor = 0.;
};

struct VoronoiConfig
{
    double tolerance            = 0.1;
    double envelope_margin      = 100.;
    bool   jitter               = false;
    double jitter_amount        = 0.01;
    // Tolerance escalation stops once the tolerance reaches this value.
    double tolerance_ceiling    = 1.0;
    size_t max_points_per_chunk = 5000;
    size_t chunk_overlap        = 50;
};

enum class ConnectionMode {
    // Cells around boundary nodes, terrain points connect to the node owning their cell.
    Voronoi,
    // Cells around boundary terrain points, boundary nodes connect to the owner of their cell.
    ReversedVoronoi,
};

struct ConnectionConfig
{
    ConnectionMode mode           = ConnectionMode::ReversedVoronoi;
    double         max_distance   = 300.;
    // Nearest boundary nodes tried for terrain points the Voronoi step left unconnected.
    int            fallback_limit = 1;
};

struct SchedulerConfig
{
    // 0 picks the hardware concurrency.
    int    worker_count          = 0;
    // Fraction of failed tiles above which the run is aborted before the merge.
    double max_failed_tile_ratio = 1.0;
};

struct MergeConfig
{
    double topology_tolerance    = 0.0001;
    bool   deduplicate_edges     = true;
    bool   strict_reconciliation = false;
    bool   drop_tile_namespaces  = true;
};

struct RunConfig
{
    PartitionConfig  partition;
    SamplingConfig   sampling;
    ObstacleConfig   obstacle;
    VoronoiConfig    voronoi;
    ConnectionConfig connection;
    SchedulerConfig  scheduler;
    MergeConfig      merge;

    // Throws ConfigError on the first invalid value.
    void validate() const;
};

std::string     connection_mode_name(ConnectionMode mode);
ConnectionMode  connection_mode_from_name(const std::string &name);

RunConfig run_config_from_json(const nlohmann::json &j);
RunConfig load_run_config(const std::string &path);

} // namespace Terragraph

#endif // libterragraph_Config_hpp_
