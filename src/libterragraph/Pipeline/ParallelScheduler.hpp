#ifndef libterragraph_ParallelScheduler_hpp_
#define libterragraph_ParallelScheduler_hpp_

#include "../libterragraph.h"
#include "../Config.hpp"
#include "../Graph.hpp"
#include "../SpatialStore.hpp"

#include <functional>

namespace Terragraph {

using TileJob          = std::function<ChunkResult(const Tile&, StoreSession&)>;
// Called once per finished tile, serialized. done counts the finished tiles including this one.
using ProgressCallback = std::function<void(const ChunkResult &result, size_t done, size_t total)>;
// Polled before a tile starts, true cancels the tiles not started yet.
using CancelCallback   = std::function<bool()>;

// Runs a job for every tile on a TBB arena of a bounded number of workers.
// Every worker thread lazily opens its own store session. Results are collected
// in completion order, an exception escaping a job fails that tile only.
class ParallelScheduler
{
public:
    ParallelScheduler(SpatialStore &store, const SchedulerConfig &config) : m_store(store), m_config(config) {}

    void set_progress_callback(ProgressCallback callback) { m_progress = std::move(callback); }
    void set_cancel_callback(CancelCallback callback) { m_cancel = std::move(callback); }

    ChunkResults run(const Tiles &tiles, const TileJob &job) const;

    int worker_count() const;

    static const char* CANCELED_MESSAGE;
    static const char* UNKNOWN_EXCEPTION_MESSAGE;

private:
    SpatialStore     &m_store;
    SchedulerConfig   m_config;
    ProgressCallback  m_progress;
    CancelCallback    m_cancel;
};

} // namespace Terragraph

#endif // libterragraph_ParallelScheduler_hpp_
