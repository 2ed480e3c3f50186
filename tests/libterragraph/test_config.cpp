#include <catch2/catch.hpp>

#include "libterragraph/Config.hpp"
#include "libterragraph/Exception.hpp"

#include <fstream>

#include <boost/filesystem.hpp>
#include <nlohmann/json.hpp>

using namespace Terragraph;
using json = nlohmann::json;

TEST_CASE("Default configuration is valid", "[Config]") {
    RunConfig config;
    REQUIRE_NOTHROW(config.validate());
    REQUIRE(config.partition.tile_size == Approx(5000.));
    REQUIRE(config.partition.overlap_fraction == Approx(0.1));
    REQUIRE_FALSE(config.partition.extent.defined());
    REQUIRE(config.voronoi.tolerance == Approx(0.1));
    REQUIRE(config.voronoi.max_points_per_chunk == 5000);
    REQUIRE(config.connection.mode == ConnectionMode::ReversedVoronoi);
    REQUIRE(config.scheduler.max_failed_tile_ratio == Approx(1.));
    REQUIRE(config.merge.topology_tolerance == Approx(0.0001));
}

TEST_CASE("Configuration sections override the defaults", "[Config]") {
    const json j = json::parse(R"({
        "partition": { "tile_size": 2500, "overlap_fraction": 0.2, "extent": [0, 0, 10000, 8000] },
        "sampling": { "grid_spacing": 100, "grid_origin": [5, 10] },
        "voronoi_preprocessing": { "tolerance": 0.5, "envelope_expansion": 250, "add_jitter": true,
                                   "max_points_per_chunk": 1000, "chunk_overlap": 20 },
        "connection": { "mode": "voronoi", "max_distance": 450 },
        "scheduler": { "threads": 3, "max_failed_tile_ratio": 0.25 },
        "merge": { "strict_reconciliation": true }
    })");
    const RunConfig config = run_config_from_json(j);

    REQUIRE(config.partition.tile_size == Approx(2500.));
    REQUIRE(config.partition.overlap_fraction == Approx(0.2));
    REQUIRE(config.partition.extent == BoundingBox(0., 0., 10000., 8000.));
    REQUIRE(config.sampling.grid_spacing == Approx(100.));
    REQUIRE(config.sampling.grid_origin == Vec2d(5., 10.));
    // untouched keys keep their defaults
    REQUIRE(config.sampling.boundary_band == Approx(300.));
    REQUIRE(config.voronoi.tolerance == Approx(0.5));
    REQUIRE(config.voronoi.envelope_margin == Approx(250.));
    REQUIRE(config.voronoi.jitter);
    REQUIRE(config.voronoi.max_points_per_chunk == 1000);
    REQUIRE(config.voronoi.chunk_overlap == 20);
    REQUIRE(config.connection.mode == ConnectionMode::Voronoi);
    REQUIRE(config.connection.max_distance == Approx(450.));
    REQUIRE(config.scheduler.worker_count == 3);
    REQUIRE(config.scheduler.max_failed_tile_ratio == Approx(0.25));
    REQUIRE(config.merge.strict_reconciliation);
    REQUIRE(config.merge.deduplicate_edges);
}

TEST_CASE("Invalid configuration values are rejected", "[Config]") {
    SECTION("non positive tile size") {
        REQUIRE_THROWS_AS(run_config_from_json(json::parse(R"({ "partition": { "tile_size": 0 } })")), ConfigError);
    }
    SECTION("overlap fraction out of range") {
        REQUIRE_THROWS_AS(run_config_from_json(json::parse(R"({ "partition": { "overlap_fraction": 1.5 } })")), ConfigError);
    }
    SECTION("degenerate extent") {
        REQUIRE_THROWS_AS(run_config_from_json(json::parse(R"({ "partition": { "extent": [0, 0, 0, 100] } })")), ConfigError);
    }
    SECTION("extent of a wrong arity") {
        REQUIRE_THROWS_AS(run_config_from_json(json::parse(R"({ "partition": { "extent": [0, 0, 100] } })")), ConfigError);
    }
    SECTION("negative tolerance") {
        REQUIRE_THROWS_AS(run_config_from_json(json::parse(R"({ "voronoi_preprocessing": { "tolerance": -1 } })")), ConfigError);
    }
    SECTION("unknown connection mode") {
        REQUIRE_THROWS_AS(run_config_from_json(json::parse(R"({ "connection": { "mode": "nearest" } })")), ConfigError);
    }
    SECTION("wrong value type") {
        REQUIRE_THROWS_AS(run_config_from_json(json::parse(R"({ "sampling": { "grid_spacing": "dense" } })")), ConfigError);
    }
    SECTION("section is not an object") {
        REQUIRE_THROWS_AS(run_config_from_json(json::parse(R"({ "merge": [] })")), ConfigError);
    }
    SECTION("failed tile ratio above one") {
        REQUIRE_THROWS_AS(run_config_from_json(json::parse(R"({ "scheduler": { "max_failed_tile_ratio": 1.5 } })")), ConfigError);
    }
}

TEST_CASE("Connection mode names", "[Config]") {
    REQUIRE(connection_mode_from_name(connection_mode_name(ConnectionMode::Voronoi)) == ConnectionMode::Voronoi);
    REQUIRE(connection_mode_from_name(connection_mode_name(ConnectionMode::ReversedVoronoi)) == ConnectionMode::ReversedVoronoi);
    REQUIRE(connection_mode_name(ConnectionMode::ReversedVoronoi) == "reversed_voronoi");
}

TEST_CASE("Loading configuration files", "[Config]") {
    namespace fs = boost::filesystem;
    const fs::path dir = fs::temp_directory_path() / fs::unique_path("terragraph_config_%%%%-%%%%");
    fs::create_directories(dir);

    SECTION("missing file") {
        REQUIRE_THROWS_AS(load_run_config((dir / "missing.json").string()), ConfigError);
    }
    SECTION("malformed json") {
        const fs::path path = dir / "broken.json";
        std::ofstream(path.string()) << "{ \"partition\": { ";
        REQUIRE_THROWS_AS(load_run_config(path.string()), ConfigError);
    }
    SECTION("valid file") {
        const fs::path path = dir / "run.json";
        std::ofstream(path.string()) << R"({ "partition": { "tile_size": 1000 } })";
        REQUIRE(load_run_config(path.string()).partition.tile_size == Approx(1000.));
    }

    fs::remove_all(dir);
}
