#ifndef libterragraph_RobustVoronoiGenerator_hpp_
#define libterragraph_RobustVoronoiGenerator_hpp_

#include "../libterragraph.h"
#include "../Config.hpp"
#include "../GeometryEngine.hpp"
#include "VoronoiPreprocessor.hpp"

#include <string>
#include <vector>

namespace Terragraph {

enum class VoronoiState {
    Initial,
    Jittered,
    ToleranceEscalated,
};

std::string voronoi_state_name(VoronoiState state);

struct VoronoiAttempt
{
    VoronoiState state { VoronoiState::Initial };
    double       tolerance { 0. };
    bool         jitter { false };
    // Number of tolerance escalations done before this attempt.
    int          escalation { 0 };
    bool         succeeded { false };
    std::string  error;
};

struct VoronoiStats
{
    std::vector<VoronoiAttempt> attempts;
    size_t                      chunks { 0 };
    size_t                      cells { 0 };

    size_t failed_attempts() const;
};

// Voronoi decomposition resilient to coincident and collinear points and points
// on the envelope. A failed decomposition is retried first with jitter at the
// same tolerance, then with the tolerance multiplied by ten until it reaches
// the configured ceiling. The number of escalations is capped, so the loop
// terminates even for a zero tolerance.
class RobustVoronoiGenerator
{
public:
    // Tolerance used for the first escalation of a zero tolerance.
    static constexpr double MIN_ESCALATED_TOLERANCE   = 0.001;
    static constexpr int    MAX_TOLERANCE_ESCALATIONS = 8;

    RobustVoronoiGenerator(const GeometryEngine &engine, const VoronoiConfig &config);

    // Cells owned by indices into points, one per distinct position.
    // Positions closer than the tolerance collapse into the cell of the first of them,
    // so coverage holds per distinct point at the final tolerance, not per exact position.
    // Throws VoronoiError once the escalation chain is exhausted.
    VoronoiCells generate(const Points &points, double tolerance, double envelope_margin, bool jitter = false, VoronoiStats *stats = nullptr) const;
    // Tolerance, envelope margin and jitter of the configuration.
    VoronoiCells generate(const Points &points, VoronoiStats *stats = nullptr) const;

    const GeometryEngine& engine() const { return m_engine; }
    const VoronoiConfig&  config() const { return m_config; }

private:
    const GeometryEngine &m_engine;
    VoronoiConfig         m_config;
    VoronoiPreprocessor   m_preprocessor;
};

// Splits large point sets into contiguous runs so that every decomposition stays bounded.
// Each run is extended by an overlap on both sides, but keeps only the cells of its own
// core run, so that every distinct input point is owned by exactly one cell.
class ChunkedVoronoiGenerator
{
public:
    explicit ChunkedVoronoiGenerator(const RobustVoronoiGenerator &generator) : m_generator(generator) {}

    VoronoiCells generate(const Points &points, size_t max_points_per_chunk, size_t chunk_overlap,
        double tolerance, double envelope_margin, bool jitter = false, VoronoiStats *stats = nullptr) const;
    VoronoiCells generate(const Points &points, VoronoiStats *stats = nullptr) const;

private:
    const RobustVoronoiGenerator &m_generator;
};

} // namespace Terragraph

#endif // libterragraph_RobustVoronoiGenerator_hpp_
