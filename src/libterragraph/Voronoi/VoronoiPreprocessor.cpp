#include "VoronoiPreprocessor.hpp"
#include "../GeometryEngine.hpp"

#include <functional>
#include <random>
#include <thread>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

namespace Terragraph {

// Produces a random value between 0 and 1. Thread-safe.
static double random_value()
{
    thread_local std::random_device rd;
    // Hash thread ID for random number seed if no hardware rng seed is available
    thread_local std::mt19937                           gen(rd.entropy() > 0 ? rd() : std::hash<std::thread::id>()(std::this_thread::get_id()));
    thread_local std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(gen);
}

Vec2d jitter_offset(double amount)
{
    return Vec2d((random_value() - 0.5) * amount, (random_value() - 0.5) * amount);
}

PreprocessedPoints VoronoiPreprocessor::preprocess(const Points &points, double tolerance, double envelope_margin, bool jitter, double jitter_amount) const
{
    PreprocessedPoints out;
    out.tolerance      = tolerance;
    out.source_indices = m_engine.unique_points(points);
    out.points.reserve(out.source_indices.size());
    for (size_t idx : out.source_indices)
        out.points.emplace_back(points[idx]);

    if (jitter && jitter_amount > 0.)
        for (Vec2d &pt : out.points)
            pt += jitter_offset(jitter_amount);

    out.envelope = m_engine.expand(m_engine.envelope(out.points), envelope_margin);

    BOOST_LOG_TRIVIAL(trace) << __FUNCTION__ << boost::format(": %1% points, %2% unique, jitter %3%, envelope %4%")
        % points.size() % out.points.size() % (jitter ? jitter_amount : 0.) % out.envelope;
    return out;
}

} // namespace Terragraph
