#include <catch2/catch.hpp>

#include "libterragraph/Exception.hpp"
#include "libterragraph/Pipeline/SpatialPartitioner.hpp"

#include <set>

using namespace Terragraph;

// Cores have to cover the extent exactly: areas add up, cores stay inside
// and neighboring cores share their edges.
static void check_exact_cover(const BoundingBox &extent, const Tiles &tiles)
{
    double area = 0.;
    for (const Tile &tile : tiles) {
        REQUIRE(extent.contains(tile.core));
        REQUIRE(tile.extent.contains(tile.core));
        REQUIRE(extent.contains(tile.extent));
        area += tile.core.area();
    }
    REQUIRE(area == Approx(extent.area()));
    for (const Tile &a : tiles)
        for (const Tile &b : tiles) {
            if (b.i == a.i + 1 && b.j == a.j)
                REQUIRE(b.core.min.x() == a.core.max.x());
            if (b.j == a.j + 1 && b.i == a.i)
                REQUIRE(b.core.min.y() == a.core.max.y());
        }
}

TEST_CASE("Partition of a square extent", "[SpatialPartitioner]") {
    const BoundingBox extent(0., 0., 10000., 10000.);
    const Tiles tiles = SpatialPartitioner::partition(extent, 5000., 0.1);

    REQUIRE(tiles.size() == 4);
    REQUIRE(tiles[0].id == "chunk_0_0");
    REQUIRE(tiles[1].id == "chunk_0_1");
    REQUIRE(tiles[2].id == "chunk_1_0");
    REQUIRE(tiles[3].id == "chunk_1_1");

    for (const Tile &tile : tiles)
        REQUIRE(tile.overlap_margin == Approx(500.));

    // only interior facing edges are expanded
    REQUIRE(tiles[0].core   == BoundingBox(0., 0., 5000., 5000.));
    REQUIRE(tiles[0].extent == BoundingBox(0., 0., 5500., 5500.));
    REQUIRE(tiles[1].core   == BoundingBox(0., 5000., 5000., 10000.));
    REQUIRE(tiles[1].extent == BoundingBox(0., 4500., 5500., 10000.));
    REQUIRE(tiles[3].extent == BoundingBox(4500., 4500., 10000., 10000.));

    check_exact_cover(extent, tiles);
}

TEST_CASE("Tile counts adapt to the extent", "[SpatialPartitioner]") {
    SECTION("rounding to the nearest count") {
        const BoundingBox extent(1000., -500., 13400., 4500.);
        const Tiles tiles = SpatialPartitioner::partition(extent, 5000., 0.1);
        // 12400 / 5000 rounds to 2, 5000 / 5000 is 1
        REQUIRE(tiles.size() == 2);
        REQUIRE(tiles[0].core.width() == Approx(6200.));
        REQUIRE(tiles[1].id == "chunk_1_0");
        check_exact_cover(extent, tiles);
    }
    SECTION("an extent smaller than a tile gives a single tile without overlap") {
        const BoundingBox extent(0., 0., 1000., 700.);
        const Tiles tiles = SpatialPartitioner::partition(extent, 5000., 0.1);
        REQUIRE(tiles.size() == 1);
        REQUIRE(tiles.front().core == extent);
        REQUIRE(tiles.front().extent == extent);
    }
    SECTION("uneven extents are covered exactly") {
        const BoundingBox extents[] = {
            BoundingBox(0.3, 0.7, 10000.1, 7777.7),
            BoundingBox(-12345.6, 100., 33333.3, 41234.5),
            BoundingBox(5., 5., 9., 17000.)
        };
        for (const BoundingBox &extent : extents) {
            const Tiles tiles = SpatialPartitioner::partition(extent, 3000., 0.25);
            std::set<std::string> ids;
            for (const Tile &tile : tiles)
                ids.insert(tile.id);
            REQUIRE(ids.size() == tiles.size());
            check_exact_cover(extent, tiles);
        }
    }
    SECTION("configured partitioner") {
        PartitionConfig config;
        config.tile_size        = 2500.;
        config.overlap_fraction = 0.;
        const Tiles tiles = SpatialPartitioner(config).partition(BoundingBox(0., 0., 10000., 5000.));
        REQUIRE(tiles.size() == 8);
        for (const Tile &tile : tiles)
            REQUIRE(tile.extent == tile.core);
    }
}

TEST_CASE("Invalid partition arguments", "[SpatialPartitioner]") {
    REQUIRE_THROWS_AS(SpatialPartitioner::partition(BoundingBox(0., 0., 0., 100.), 5000.), InvalidArgument);
    REQUIRE_THROWS_AS(SpatialPartitioner::partition(BoundingBox(), 5000.), InvalidArgument);
    REQUIRE_THROWS_AS(SpatialPartitioner::partition(BoundingBox(0., 0., 100., 100.), 0.), InvalidArgument);
    REQUIRE_THROWS_AS(SpatialPartitioner::partition(BoundingBox(0., 0., 100., 100.), 50., -0.1), InvalidArgument);
}
