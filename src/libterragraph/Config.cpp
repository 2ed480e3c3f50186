#include "Config.hpp"
#include "Exception.hpp"

#include <fstream>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

#include <nlohmann/json.hpp>

namespace Terragraph {

using json = nlohmann::json;

static void check(bool condition, const char *key, const char *message)
{
    if (! condition)
        throw ConfigError((boost::format("Invalid configuration value \"%1%\": %2%") % key % message).str());
}

void RunConfig::validate() const
{
    check(partition.tile_size > 0., "partition.tile_size", "has to be positive");
    check(partition.overlap_fraction >= 0. && partition.overlap_fraction < 1., "partition.overlap_fraction", "has to be in <0, 1)");
    check(! partition.extent.defined() || ! partition.extent.degenerate(), "partition.extent", "has zero width or height");
    check(sampling.grid_spacing > 0., "sampling.grid_spacing", "has to be positive");
    check(sampling.boundary_band >= 0., "sampling.boundary_band", "must not be negative");
    check(sampling.max_edge_length > 0., "sampling.max_edge_length", "has to be positive");
    check(obstacle.buffer_distance >= 0., "obstacle.buffer_distance", "must not be negative");
    check(obstacle.buffer_segments >= 1, "obstacle.buffer_segments", "has to be at least 1");
    check(obstacle.boundary_node_spacing > 0., "obstacle.boundary_node_spacing", "has to be positive");
    check(obstacle.water_crossing_factor >= 0., "obstacle.water_crossing_factor", "must not be negative");
    check(voronoi.tolerance >= 0., "voronoi.tolerance", "must not be negative");
    check(voronoi.envelope_margin >= 0., "voronoi.envelope_margin", "must not be negative");
    check(voronoi.jitter_amount >= 0., "voronoi.jitter_amount", "must not be negative");
    check(voronoi.tolerance_ceiling > 0., "voronoi.tolerance_ceiling", "has to be positive");
    check(voronoi.max_points_per_chunk >= 1, "voronoi.max_points_per_chunk", "has to be at least 1");
    check(connection.max_distance > 0., "connection.max_distance", "has to be positive");
    check(connection.fallback_limit >= 0, "connection.fallback_limit", "must not be negative");
    check(scheduler.worker_count >= 0, "scheduler.worker_count", "must not be negative");
    check(scheduler.max_failed_tile_ratio >= 0. && scheduler.max_failed_tile_ratio <= 1., "scheduler.max_failed_tile_ratio", "has to be in <0, 1>");
    check(merge.topology_tolerance >= 0., "merge.topology_tolerance", "must not be negative");
}

std::string connection_mode_name(ConnectionMode mode)
{
    return mode == ConnectionMode::Voronoi ? "voronoi" : "reversed_voronoi";
}

ConnectionMode connection_mode_from_name(const std::string &name)
{
    if (name == "voronoi")
        return ConnectionMode::Voronoi;
    if (name == "reversed_voronoi")
        return ConnectionMode::ReversedVoronoi;
    throw ConfigError("Unknown connection mode: " + name);
}

template<typename T>
static void read_value(const json &section, const char *key, T &value)
{
    if (section.contains(key))
        value = section.at(key).get<T>();
}

static const json& section(const json &j, const char *name)
{
    static const json empty = json::object();
    if (! j.contains(name))
        return empty;
    const json &s = j.at(name);
    if (! s.is_object())
        throw ConfigError((boost::format("Configuration section \"%1%\" is not an object") % name).str());
    return s;
}

RunConfig run_config_from_json(const json &j)
{
    RunConfig config;
    try {
        const json &partition = section(j, "partition");
        read_value(partition, "tile_size", config.partition.tile_size);
        read_value(partition, "overlap_fraction", config.partition.overlap_fraction);
        if (partition.contains("extent")) {
            // [xmin, ymin, xmax, ymax]
            std::vector<double> e = partition.at("extent").get<std::vector<double>>();
            if (e.size() != 4)
                throw ConfigError("partition.extent has to be [xmin, ymin, xmax, ymax]");
            config.partition.extent = BoundingBox(e[0], e[1], e[2], e[3]);
        }

        const json &sampling = section(j, "sampling");
        read_value(sampling, "grid_spacing", config.sampling.grid_spacing);
        read_value(sampling, "boundary_band", config.sampling.boundary_band);
        read_value(sampling, "max_edge_length", config.sampling.max_edge_length);
        if (sampling.contains("grid_origin")) {
            std::vector<double> o = sampling.at("grid_origin").get<std::vector<double>>();
            if (o.size() != 2)
                throw ConfigError("sampling.grid_origin has to be [x, y]");
            config.sampling.grid_origin = Vec2d(o[0], o[1]);
        }

        const json &obstacle = section(j, "obstacle");
        read_value(obstacle, "buffer_distance", config.obstacle.buffer_distance);
        read_value(obstacle, "buffer_segments", config.obstacle.buffer_segments);
        read_value(obstacle, "boundary_node_spacing", config.obstacle.boundary_node_spacing);
        read_value(obstacle, "water_crossing_factor", config.obstacle.water_crossing_factor);

        // Same keys as the voronoi_preprocessing section of the pipeline configuration files.
        const json &voronoi = section(j, "voronoi_preprocessing");
        read_value(voronoi, "tolerance", config.voronoi.tolerance);
        read_value(voronoi, "envelope_expansion", config.voronoi.envelope_margin);
        read_value(voronoi, "add_jitter", config.voronoi.jitter);
        read_value(voronoi, "jitter_amount", config.voronoi.jitter_amount);
        read_value(voronoi, "tolerance_ceiling", config.voronoi.tolerance_ceiling);
        read_value(voronoi, "max_points_per_chunk", config.voronoi.max_points_per_chunk);
        read_value(voronoi, "chunk_overlap", config.voronoi.chunk_overlap);

        const json &connection = section(j, "connection");
        if (connection.contains("mode"))
            config.connection.mode = connection_mode_from_name(connection.at("mode").get<std::string>());
        read_value(connection, "max_distance", config.connection.max_distance);
        read_value(connection, "fallback_limit", config.connection.fallback_limit);

        const json &scheduler = section(j, "scheduler");
        read_value(scheduler, "threads", config.scheduler.worker_count);
        read_value(scheduler, "max_failed_tile_ratio", config.scheduler.max_failed_tile_ratio);

        const json &merge = section(j, "merge");
        read_value(merge, "topology_tolerance", config.merge.topology_tolerance);
        read_value(merge, "deduplicate_edges", config.merge.deduplicate_edges);
        read_value(merge, "strict_reconciliation", config.merge.strict_reconciliation);
        read_value(merge, "drop_tile_namespaces", config.merge.drop_tile_namespaces);
    } catch (const json::exception &e) {
        throw ConfigError(std::string("Malformed configuration: ") + e.what());
    }

    config.validate();
    return config;
}

RunConfig load_run_config(const std::string &path)
{
    if (! boost::filesystem::exists(path))
        throw ConfigError("Configuration file does not exist: " + path);

    std::ifstream ifs(path);
    if (! ifs)
        throw ConfigError("Cannot open configuration file: " + path);

    json j;
    try {
        ifs >> j;
    } catch (const json::parse_error &e) {
        throw ConfigError((boost::format("Cannot parse %1%: %2%") % path % e.what()).str());
    }

    BOOST_LOG_TRIVIAL(info) << "Loaded configuration " << path;
    return run_config_from_json(j);
}

} // namespace Terragraph
