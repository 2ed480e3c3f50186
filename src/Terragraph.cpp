#include "libterragraph/libterragraph.h"
#include "libterragraph/BoostGeometryEngine.hpp"
#include "libterragraph/Config.hpp"
#include "libterragraph/Exception.hpp"
#include "libterragraph/MemorySpatialStore.hpp"
#include "libterragraph/Utils.hpp"
#include "libterragraph/Format/GeoJSON.hpp"
#include "libterragraph/Format/GraphCSV.hpp"
#include "libterragraph/Pipeline/TerrainPipeline.hpp"

#include <cstdlib>
#include <iostream>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

using namespace Terragraph;

static void print_usage()
{
    std::cout << TERRAGRAPH_APP_NAME << " " << TERRAGRAPH_VERSION << "\n"
              << "usage: terragraph <config.json> <features.geojson> <output_dir> [log_level]\n"
              << "  log_level: fatal, error, warning, info, debug, trace or 0..5 (default: info)\n";
}

int main(int argc, char **argv)
{
    if (argc < 4 || argc > 5) {
        print_usage();
        return EXIT_FAILURE;
    }
    const std::string config_path   = argv[1];
    const std::string features_path = argv[2];
    const std::string output_dir    = argv[3];

    try {
        set_logging_level(argc == 5 ? level_string_to_number(argv[4]) : 3);
        const std::string run_id = make_run_id();
        add_file_log((boost::filesystem::path(output_dir) / "log").string(), run_id);
        BOOST_LOG_TRIVIAL(info) << boost::format("%1% %2% (%3%), run %4%")
            % TERRAGRAPH_APP_NAME % TERRAGRAPH_VERSION % TERRAGRAPH_BUILD_ID % run_id;

        const RunConfig config = load_run_config(config_path);

        BoostGeometryEngine engine;
        MemorySpatialStore  store;
        {
            std::unique_ptr<StoreSession> session = store.open_session();
            import_water_features(*session, load_geojson_polygons(features_path));
        }

        TerrainPipeline pipeline(config, engine, store);
        pipeline.set_run_id(run_id);
        pipeline.set_progress_callback([](const ChunkResult &result, size_t done, size_t total) {
            std::cout << boost::format("[%1%/%2%] %3% %4%\n") % done % total % result.tile_id % (result.succeeded() ? "ok" : result.error);
        });
        const RunReport report = pipeline.run();

        std::cout << boost::format("%1% of %2% tiles succeeded\n") % report.succeeded_tiles() % report.chunk_results.size();
        if (! report.success) {
            std::cerr << "Run failed: " << report.error << "\n";
            flush_logs();
            return EXIT_FAILURE;
        }

        std::unique_ptr<StoreSession> session = store.open_session();
        if (! export_graph_csv(*session, GRAPH_NAMESPACE, output_dir)) {
            std::cerr << "Cannot export the graph into " << output_dir << "\n";
            flush_logs();
            return EXIT_FAILURE;
        }
        std::cout << boost::format("%1% vertices, %2% edges, %3% reconciliation defects written to %4%\n")
            % report.merge.vertices % report.merge.edges % report.merge.defects.size() % output_dir;
        flush_logs();
        return EXIT_SUCCESS;
    } catch (const Exception &ex) {
        std::cerr << ex.what() << "\n";
        BOOST_LOG_TRIVIAL(fatal) << ex.what();
        flush_logs();
        return EXIT_FAILURE;
    } catch (const std::exception &ex) {
        std::cerr << "Unexpected error: " << ex.what() << "\n";
        BOOST_LOG_TRIVIAL(fatal) << "Unexpected error: " << ex.what();
        flush_logs();
        return EXIT_FAILURE;
    }
}
