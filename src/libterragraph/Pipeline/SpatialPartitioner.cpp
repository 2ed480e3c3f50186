#include "SpatialPartitioner.hpp"
#include "../Exception.hpp"

#include <algorithm>
#include <cmath>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

namespace Terragraph {

std::string SpatialPartitioner::tile_id(int i, int j)
{
    return (boost::format("chunk_%1%_%2%") % i % j).str();
}

Tiles SpatialPartitioner::partition(const BoundingBox &extent, double tile_size, double overlap_fraction)
{
    if (extent.degenerate())
        throw InvalidArgument((boost::format("Cannot partition a degenerate extent %1%") % extent).str());
    if (! (tile_size > 0.))
        throw InvalidArgument((boost::format("Invalid tile size %1%") % tile_size).str());
    if (overlap_fraction < 0.)
        throw InvalidArgument((boost::format("Invalid overlap fraction %1%") % overlap_fraction).str());

    const int    nx     = std::max(1, int(std::lround(extent.width() / tile_size)));
    const int    ny     = std::max(1, int(std::lround(extent.height() / tile_size)));
    const double dx     = extent.width() / nx;
    const double dy     = extent.height() / ny;
    const double margin = tile_size * overlap_fraction;

    Tiles tiles;
    tiles.reserve(size_t(nx) * size_t(ny));
    for (int i = 0; i < nx; ++ i) {
        // the last column and row snap to the extent, so that rounding leaves no gap
        const double x0 = extent.min.x() + i * dx;
        const double x1 = i + 1 == nx ? extent.max.x() : extent.min.x() + (i + 1) * dx;
        for (int j = 0; j < ny; ++ j) {
            const double y0 = extent.min.y() + j * dy;
            const double y1 = j + 1 == ny ? extent.max.y() : extent.min.y() + (j + 1) * dy;

            Tile tile;
            tile.id             = tile_id(i, j);
            tile.i              = i;
            tile.j              = j;
            tile.core           = BoundingBox(x0, y0, x1, y1);
            tile.overlap_margin = margin;
            tile.extent         = BoundingBox(
                i > 0      ? x0 - margin : x0,
                j > 0      ? y0 - margin : y0,
                i + 1 < nx ? x1 + margin : x1,
                j + 1 < ny ? y1 + margin : y1);
            tiles.emplace_back(std::move(tile));
        }
    }

    BOOST_LOG_TRIVIAL(info) << __FUNCTION__ << boost::format(": %1% x %2% tiles of %3% x %4%, overlap %5%")
        % nx % ny % dx % dy % margin;
    return tiles;
}

} // namespace Terragraph
