#include "ParallelScheduler.hpp"

#include <atomic>
#include <memory>
#include <mutex>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

#include <tbb/blocked_range.h>
#include <tbb/concurrent_vector.h>
#include <tbb/enumerable_thread_specific.h>
#include <tbb/parallel_for.h>
#include <tbb/partitioner.h>
#include <tbb/task_arena.h>

namespace Terragraph {

const char* ParallelScheduler::CANCELED_MESSAGE          = "canceled";
const char* ParallelScheduler::UNKNOWN_EXCEPTION_MESSAGE = "unknown exception";

int ParallelScheduler::worker_count() const
{
    return m_config.worker_count > 0 ? m_config.worker_count : tbb::this_task_arena::max_concurrency();
}

static ChunkResult failed_result(const Tile &tile, const std::string &error)
{
    ChunkResult result;
    result.tile_id = tile.id;
    result.status  = ChunkStatus::Failed;
    result.error   = error;
    return result;
}

ChunkResults ParallelScheduler::run(const Tiles &tiles, const TileJob &job) const
{
    const int workers = this->worker_count();
    BOOST_LOG_TRIVIAL(info) << __FUNCTION__ << boost::format(": %1% tiles on %2% workers") % tiles.size() % workers;

    tbb::enumerable_thread_specific<std::unique_ptr<StoreSession>> sessions;
    tbb::concurrent_vector<ChunkResult>                            results;
    std::atomic<size_t>                                            done { 0 };
    std::mutex                                                     progress_mutex;

    auto run_tile = [&](const Tile &tile) {
        if (m_cancel && m_cancel())
            return failed_result(tile, CANCELED_MESSAGE);
        try {
            std::unique_ptr<StoreSession> &session = sessions.local();
            if (! session)
                session = m_store.open_session();
            return job(tile, *session);
        } catch (const std::exception &ex) {
            BOOST_LOG_TRIVIAL(error) << __FUNCTION__ << boost::format(": tile %1% crashed: %2%") % tile.id % ex.what();
            return failed_result(tile, ex.what());
        } catch (...) {
            BOOST_LOG_TRIVIAL(error) << __FUNCTION__ << boost::format(": tile %1% crashed with an unknown exception") % tile.id;
            return failed_result(tile, UNKNOWN_EXCEPTION_MESSAGE);
        }
    };

    tbb::task_arena arena(workers);
    arena.execute([&]() {
        tbb::parallel_for(tbb::blocked_range<size_t>(0, tiles.size(), 1), [&](const tbb::blocked_range<size_t> &range) {
            for (size_t i = range.begin(); i < range.end(); ++ i) {
                ChunkResult result = run_tile(tiles[i]);
                results.push_back(result);
                const size_t finished = ++ done;
                if (m_progress) {
                    std::lock_guard<std::mutex> lock(progress_mutex);
                    m_progress(result, finished, tiles.size());
                }
            }
        }, tbb::simple_partitioner());
    });

    ChunkResults out(results.begin(), results.end());
    size_t failed = 0;
    for (const ChunkResult &r : out)
        if (! r.succeeded())
            ++ failed;
    BOOST_LOG_TRIVIAL(info) << __FUNCTION__ << boost::format(": %1% tiles succeeded, %2% failed, %3% store sessions")
        % (out.size() - failed) % failed % sessions.size();
    return out;
}

} // namespace Terragraph
