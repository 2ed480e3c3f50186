#include "TerrainPipeline.hpp"
#include "../Exception.hpp"
#include "ChunkProcessor.hpp"
#include "SpatialPartitioner.hpp"

#include <algorithm>
#include <chrono>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

namespace Terragraph {

size_t RunReport::succeeded_tiles() const
{
    return size_t(std::count_if(chunk_results.begin(), chunk_results.end(), [](const ChunkResult &r) { return r.succeeded(); }));
}

size_t RunReport::failed_tiles() const
{
    return chunk_results.size() - this->succeeded_tiles();
}

BoundingBox TerrainPipeline::resolve_extent(StoreSession &session) const
{
    if (m_config.partition.extent.defined())
        return m_config.partition.extent;

    BoundingBox extent;
    if (session.has_namespace(SOURCE_NAMESPACE))
        for (const PolygonRecord &feature : session.read_polygons(SOURCE_NAMESPACE, Relations::WATER_FEATURES))
            extent.merge(get_extents(feature.polygon));
    if (extent.degenerate())
        throw ConfigError("No extent configured and no water features to derive it from");
    BOOST_LOG_TRIVIAL(info) << "Extent of the source features " << extent;
    return extent;
}

RunReport TerrainPipeline::run()
{
    std::unique_ptr<StoreSession> session = m_store.open_session();
    return this->run(this->resolve_extent(*session));
}

RunReport TerrainPipeline::run(const BoundingBox &extent)
{
    const auto t_start = std::chrono::steady_clock::now();

    RunReport report;
    report.run_id = m_run_id;
    report.extent = extent;
    report.tiles  = SpatialPartitioner(m_config.partition).partition(extent);

    ChunkProcessor    processor(m_config, m_engine);
    ParallelScheduler scheduler(m_store, m_config.scheduler);
    scheduler.set_progress_callback(m_progress);
    scheduler.set_cancel_callback(m_cancel);
    report.chunk_results = scheduler.run(report.tiles, [&processor](const Tile &tile, StoreSession &session) {
        return processor.process(tile, session);
    });
    std::sort(report.chunk_results.begin(), report.chunk_results.end(),
        [](const ChunkResult &l, const ChunkResult &r) { return l.tile_id < r.tile_id; });

    for (const ChunkResult &r : report.chunk_results)
        if (! r.succeeded())
            BOOST_LOG_TRIVIAL(warning) << "Tile " << r.tile_id << " failed: " << r.error;

    const size_t succeeded = report.succeeded_tiles();
    const size_t failed    = report.failed_tiles();
    const double ratio     = report.chunk_results.empty() ? 0. : double(failed) / double(report.chunk_results.size());
    auto finish = [&report, &t_start]() {
        report.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - t_start).count();
        return report;
    };

    if (succeeded == 0) {
        report.error = "No tile succeeded";
        BOOST_LOG_TRIVIAL(error) << report.error;
        return finish();
    }
    if (ratio > m_config.scheduler.max_failed_tile_ratio) {
        report.error = (boost::format("%1% of %2% tiles failed, more than the allowed ratio %3%")
            % failed % report.chunk_results.size() % m_config.scheduler.max_failed_tile_ratio).str();
        BOOST_LOG_TRIVIAL(error) << report.error;
        return finish();
    }

    try {
        std::unique_ptr<StoreSession> session = m_store.open_session();
        GraphMerger merger(m_config.merge);
        report.merge   = merger.merge(report.chunk_results, *session);
        report.merged  = true;
        report.success = true;
    } catch (const StoreError &ex) {
        report.error = std::string("Merge aborted: ") + ex.what();
        BOOST_LOG_TRIVIAL(error) << report.error;
    } catch (const ReconciliationError &ex) {
        report.error = std::string("Merge aborted: ") + ex.what();
        BOOST_LOG_TRIVIAL(error) << report.error;
    }

    if (report.success)
        BOOST_LOG_TRIVIAL(info) << boost::format("Run %1% finished: %2% of %3% tiles, %4% vertices, %5% edges")
            % m_run_id % succeeded % report.chunk_results.size() % report.merge.vertices % report.merge.edges;
    return finish();
}

} // namespace Terragraph
