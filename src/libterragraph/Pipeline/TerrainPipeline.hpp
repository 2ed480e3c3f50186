#ifndef libterragraph_TerrainPipeline_hpp_
#define libterragraph_TerrainPipeline_hpp_

#include "../libterragraph.h"
#include "../Config.hpp"
#include "../GeometryEngine.hpp"
#include "../Graph.hpp"
#include "../SpatialStore.hpp"
#include "GraphMerger.hpp"
#include "ParallelScheduler.hpp"

#include <string>

namespace Terragraph {

struct RunReport
{
    std::string  run_id;
    BoundingBox  extent;
    Tiles        tiles;
    // Sorted by tile id.
    ChunkResults chunk_results;
    MergeReport  merge;
    bool         merged { false };
    bool         success { false };
    std::string  error;
    double       elapsed_seconds { 0. };

    size_t succeeded_tiles() const;
    size_t failed_tiles() const;
};

// Partition, process the tiles in parallel, merge. Failed tiles are tolerated
// up to scheduler.max_failed_tile_ratio, a run without any successful tile fails.
class TerrainPipeline
{
public:
    TerrainPipeline(const RunConfig &config, const GeometryEngine &engine, SpatialStore &store)
        : m_config(config), m_engine(engine), m_store(store) {}

    void set_run_id(const std::string &run_id) { m_run_id = run_id; }
    void set_progress_callback(ProgressCallback callback) { m_progress = std::move(callback); }
    void set_cancel_callback(CancelCallback callback) { m_cancel = std::move(callback); }

    // Extent of the configuration, or the extent of the source water features.
    RunReport run();
    RunReport run(const BoundingBox &extent);

    // Throws ConfigError if there is neither a configured extent nor any source feature.
    BoundingBox resolve_extent(StoreSession &session) const;

private:
    const RunConfig      &m_config;
    const GeometryEngine &m_engine;
    SpatialStore         &m_store;
    std::string           m_run_id;
    ProgressCallback      m_progress;
    CancelCallback        m_cancel;
};

} // namespace Terragraph

#endif // libterragraph_TerrainPipeline_hpp_
