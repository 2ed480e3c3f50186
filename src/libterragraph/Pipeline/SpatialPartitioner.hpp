#ifndef libterragraph_SpatialPartitioner_hpp_
#define libterragraph_SpatialPartitioner_hpp_

#include "../libterragraph.h"
#include "../BoundingBox.hpp"
#include "../Config.hpp"
#include "../Graph.hpp"

namespace Terragraph {

// Divides the global extent into a grid of overlapping tiles. The tile count
// adapts to the extent: nx = max(1, round(width / tile_size)), the same for ny,
// and the cores split the extent exactly. Tiles are expanded by
// tile_size * overlap_fraction on the interior facing edges only.
class SpatialPartitioner
{
public:
    explicit SpatialPartitioner(const PartitionConfig &config) : m_config(config) {}

    Tiles partition(const BoundingBox &extent) const { return partition(extent, m_config.tile_size, m_config.overlap_fraction); }

    // Tiles in column major order (i over x outer, j over y inner).
    // Throws InvalidArgument on a degenerate extent or a non-positive tile size.
    static Tiles partition(const BoundingBox &extent, double tile_size, double overlap_fraction = 0.1);

    static std::string tile_id(int i, int j);

private:
    PartitionConfig m_config;
};

} // namespace Terragraph

#endif // libterragraph_SpatialPartitioner_hpp_
