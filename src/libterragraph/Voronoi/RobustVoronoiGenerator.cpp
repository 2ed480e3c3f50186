#include "RobustVoronoiGenerator.hpp"
#include "../Exception.hpp"

#include <algorithm>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

namespace Terragraph {

std::string voronoi_state_name(VoronoiState state)
{
    switch (state) {
    case VoronoiState::Initial:            return "initial";
    case VoronoiState::Jittered:           return "jittered";
    case VoronoiState::ToleranceEscalated: return "tolerance_escalated";
    }
    return "unknown";
}

size_t VoronoiStats::failed_attempts() const
{
    return size_t(std::count_if(attempts.begin(), attempts.end(), [](const VoronoiAttempt &a) { return ! a.succeeded; }));
}

RobustVoronoiGenerator::RobustVoronoiGenerator(const GeometryEngine &engine, const VoronoiConfig &config)
    : m_engine(engine), m_config(config), m_preprocessor(engine)
{}

VoronoiCells RobustVoronoiGenerator::generate(const Points &points, VoronoiStats *stats) const
{
    return this->generate(points, m_config.tolerance, m_config.envelope_margin, m_config.jitter, stats);
}

VoronoiCells RobustVoronoiGenerator::generate(const Points &points, double tolerance, double envelope_margin, bool jitter, VoronoiStats *stats) const
{
    if (points.empty())
        return VoronoiCells();

    VoronoiState state       = jitter ? VoronoiState::Jittered : VoronoiState::Initial;
    int          escalations = 0;
    for (;;) {
        VoronoiAttempt attempt;
        attempt.state      = state;
        attempt.tolerance  = tolerance;
        attempt.jitter     = jitter;
        attempt.escalation = escalations;
        try {
            PreprocessedPoints pre   = m_preprocessor.preprocess(points, tolerance, envelope_margin, jitter, m_config.jitter_amount);
            VoronoiCells       cells = m_engine.voronoi(pre.points, tolerance, pre.envelope);
            for (VoronoiCell &cell : cells)
                cell.owner_id = pre.source_indices[cell.owner_id];
            attempt.succeeded = true;
            if (stats != nullptr) {
                stats->attempts.emplace_back(attempt);
                stats->cells += cells.size();
            }
            if (state != VoronoiState::Initial)
                BOOST_LOG_TRIVIAL(info) << __FUNCTION__ << boost::format(": recovered in state %1% at tolerance %2%, %3% cells")
                    % voronoi_state_name(state) % tolerance % cells.size();
            return cells;
        } catch (const GeometryError &e) {
            attempt.error = e.what();
            if (stats != nullptr)
                stats->attempts.emplace_back(attempt);
            BOOST_LOG_TRIVIAL(warning) << __FUNCTION__ << boost::format(": %1% points failed in state %2% at tolerance %3%: %4%")
                % points.size() % voronoi_state_name(state) % tolerance % e.what();

            if (! jitter) {
                jitter = true;
                state  = VoronoiState::Jittered;
            } else if (tolerance < m_config.tolerance_ceiling && escalations < MAX_TOLERANCE_ESCALATIONS) {
                tolerance = tolerance > 0. ? tolerance * 10. : MIN_ESCALATED_TOLERANCE;
                state     = VoronoiState::ToleranceEscalated;
                ++ escalations;
            } else {
                BOOST_LOG_TRIVIAL(error) << __FUNCTION__ << boost::format(": giving up after %1% tolerance escalations") % escalations;
                throw VoronoiError((boost::format("Voronoi generation of %1% points failed at tolerance %2% after %3% escalations: %4%")
                    % points.size() % tolerance % escalations % e.what()).str());
            }
        }
    }
}

VoronoiCells ChunkedVoronoiGenerator::generate(const Points &points, VoronoiStats *stats) const
{
    const VoronoiConfig &config = m_generator.config();
    return this->generate(points, config.max_points_per_chunk, config.chunk_overlap, config.tolerance, config.envelope_margin, config.jitter, stats);
}

VoronoiCells ChunkedVoronoiGenerator::generate(const Points &points, size_t max_points_per_chunk, size_t chunk_overlap,
    double tolerance, double envelope_margin, bool jitter, VoronoiStats *stats) const
{
    if (max_points_per_chunk == 0)
        throw InvalidArgument("ChunkedVoronoiGenerator: max_points_per_chunk has to be positive");

    if (points.size() <= max_points_per_chunk) {
        if (stats != nullptr)
            ++ stats->chunks;
        return m_generator.generate(points, tolerance, envelope_margin, jitter, stats);
    }

    // Deduplicate up front, so that a position repeated in two chunks is still owned once.
    const std::vector<size_t> unique = m_generator.engine().unique_points(points);
    Points                    distinct;
    distinct.reserve(unique.size());
    for (size_t idx : unique)
        distinct.emplace_back(points[idx]);

    const size_t n          = distinct.size();
    const size_t num_chunks = (n + max_points_per_chunk - 1) / max_points_per_chunk;
    const size_t chunk_size = (n + num_chunks - 1) / num_chunks;

    BOOST_LOG_TRIVIAL(debug) << __FUNCTION__ << boost::format(": %1% points in %2% chunks of %3%, overlap %4%")
        % n % num_chunks % chunk_size % chunk_overlap;

    const size_t cells_before = stats != nullptr ? stats->cells : 0;
    VoronoiCells out;
    out.reserve(n);
    for (size_t chunk_idx = 0; chunk_idx < num_chunks; ++ chunk_idx) {
        const size_t core_begin = chunk_idx * chunk_size;
        if (core_begin >= n)
            break;
        const size_t core_end = std::min(n, core_begin + chunk_size);
        const size_t begin    = core_begin > chunk_overlap ? core_begin - chunk_overlap : 0;
        const size_t end      = std::min(n, core_end + chunk_overlap);

        const Points chunk(distinct.begin() + begin, distinct.begin() + end);
        VoronoiCells cells = m_generator.generate(chunk, tolerance, envelope_margin, jitter, stats);
        if (stats != nullptr)
            ++ stats->chunks;
        for (VoronoiCell &cell : cells) {
            const size_t idx = begin + cell.owner_id;
            if (idx < core_begin || idx >= core_end)
                continue;
            cell.owner_id = unique[idx];
            out.emplace_back(std::move(cell));
        }
    }

    std::sort(out.begin(), out.end(), [](const VoronoiCell &l, const VoronoiCell &r) { return l.owner_id < r.owner_id; });
    // the overlaps computed cells that were thrown away
    if (stats != nullptr)
        stats->cells = cells_before + out.size();
    return out;
}

} // namespace Terragraph
