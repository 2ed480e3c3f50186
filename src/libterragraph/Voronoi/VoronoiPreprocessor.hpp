#ifndef libterragraph_VoronoiPreprocessor_hpp_
#define libterragraph_VoronoiPreprocessor_hpp_

#include "../libterragraph.h"
#include "../BoundingBox.hpp"
#include "../Point.hpp"

#include <vector>

namespace Terragraph {

class GeometryEngine;

struct PreprocessedPoints
{
    Points              points;
    // points[k] was derived from the caller's point source_indices[k].
    std::vector<size_t> source_indices;
    // Envelope of points, expanded by the margin.
    BoundingBox         envelope;
    double              tolerance { 0. };
};

// Cleans a point set before the Voronoi decomposition: duplicate positions are
// removed (the first occurrence wins), points are optionally perturbed and the
// working envelope is expanded so that the outer cells get clipped to finite polygons.
class VoronoiPreprocessor
{
public:
    explicit VoronoiPreprocessor(const GeometryEngine &engine) : m_engine(engine) {}

    PreprocessedPoints preprocess(const Points &points, double tolerance, double envelope_margin, bool jitter, double jitter_amount) const;

private:
    const GeometryEngine &m_engine;
};

// Offset of both coordinates uniform in <-amount/2, amount/2>. Thread safe.
Vec2d jitter_offset(double amount);

} // namespace Terragraph

#endif // libterragraph_VoronoiPreprocessor_hpp_
