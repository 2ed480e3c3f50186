#include <catch2/catch.hpp>

#include "libterragraph/Exception.hpp"
#include "libterragraph/MemorySpatialStore.hpp"

#include "test_data.hpp"

#include <algorithm>

using namespace Terragraph;

static PointRecords grid_records(int n, double spacing)
{
    PointRecords out;
    for (int i = 0; i < n; ++ i)
        for (int j = 0; j < n; ++ j) {
            PointRecord r;
            r.id       = std::int64_t(out.size()) + 1;
            r.position = Vec2d(i * spacing, j * spacing);
            out.emplace_back(r);
        }
    return out;
}

static std::vector<std::int64_t> ids(const PointRecords &records)
{
    std::vector<std::int64_t> out;
    for (const PointRecord &r : records)
        out.emplace_back(r.id);
    std::sort(out.begin(), out.end());
    return out;
}

TEST_CASE("Namespaces", "[SpatialStore]") {
    MemorySpatialStore store;
    std::unique_ptr<StoreSession> session = store.open_session();

    REQUIRE_FALSE(session->has_namespace("chunk_0_0"));
    session->create_namespace("chunk_0_0");
    session->create_namespace("chunk_0_1");
    REQUIRE(session->has_namespace("chunk_0_0"));
    REQUIRE(session->namespaces() == std::vector<std::string>{ "chunk_0_0", "chunk_0_1" });

    SECTION("creating twice keeps the content") {
        session->write_points("chunk_0_0", Relations::VERTICES, grid_records(2, 1.));
        session->create_namespace("chunk_0_0");
        REQUIRE(session->read_points("chunk_0_0", Relations::VERTICES).size() == 4);
    }
    SECTION("dropping removes the content") {
        session->write_points("chunk_0_0", Relations::VERTICES, grid_records(2, 1.));
        session->drop_namespace("chunk_0_0");
        REQUIRE_FALSE(session->has_namespace("chunk_0_0"));
        session->create_namespace("chunk_0_0");
        REQUIRE(session->read_points("chunk_0_0", Relations::VERTICES).empty());
    }
    SECTION("dropping a missing namespace is a no-op") {
        REQUIRE_NOTHROW(session->drop_namespace("chunk_9_9"));
    }
    SECTION("namespaces are shared between sessions") {
        std::unique_ptr<StoreSession> other = store.open_session();
        REQUIRE(other->has_namespace("chunk_0_1"));
        REQUIRE(store.sessions_opened() == 2);
    }
}

TEST_CASE("Reading and writing rows", "[SpatialStore]") {
    MemorySpatialStore store;
    std::unique_ptr<StoreSession> session = store.open_session();

    SECTION("writing into a missing namespace fails") {
        REQUIRE_THROWS_AS(session->write_points("nowhere", Relations::VERTICES, grid_records(1, 1.)), StoreError);
    }
    SECTION("reading from a missing namespace fails") {
        REQUIRE_THROWS_AS(session->read_edges("nowhere", Relations::EDGES), StoreError);
    }

    session->create_namespace("graph");
    SECTION("a relation never written is empty") {
        REQUIRE(session->read_points("graph", Relations::VERTICES).empty());
        REQUIRE(session->read_polygons("graph", Relations::WATER_FEATURES).empty());
        REQUIRE_FALSE(session->has_index("graph", Relations::VERTICES));
    }
    SECTION("writes append") {
        session->write_points("graph", Relations::VERTICES, grid_records(2, 1.));
        session->write_points("graph", Relations::VERTICES, grid_records(3, 1.));
        REQUIRE(session->read_points("graph", Relations::VERTICES).size() == 13);
    }
    SECTION("predicates filter rows") {
        session->write_points("graph", Relations::VERTICES, grid_records(4, 10.));
        const PointRecords left = session->read_points("graph", Relations::VERTICES,
            [](const PointRecord &r) { return r.position.x() < 15.; });
        REQUIRE(left.size() == 8);

        EdgeRecord edge;
        edge.id = 7;
        edge.geometry = { Vec2d(0., 0.), Vec2d(10., 0.) };
        edge.type = 2;
        session->write_edges("graph", Relations::EDGES, { edge });
        REQUIRE(session->read_edges("graph", Relations::EDGES, [](const EdgeRecord &e) { return e.type == 2; }).size() == 1);
        REQUIRE(session->read_edges("graph", Relations::EDGES, [](const EdgeRecord &e) { return e.type == 0; }).empty());
    }
}

TEST_CASE("Spatial index queries", "[SpatialStore]") {
    MemorySpatialStore store;
    std::unique_ptr<StoreSession> session = store.open_session();
    session->create_namespace("chunk_0_0");
    session->write_points("chunk_0_0", Relations::VERTICES, grid_records(20, 10.));

    const BoundingBox box(15., 15., 45., 35.);
    const std::vector<std::int64_t> scanned = ids(session->query_points("chunk_0_0", Relations::VERTICES, box));
    REQUIRE(scanned.size() == 3 * 2);

    REQUIRE_THROWS_AS(session->build_index("chunk_0_0", Relations::EDGES), StoreError);
    session->build_index("chunk_0_0", Relations::VERTICES);
    REQUIRE(session->has_index("chunk_0_0", Relations::VERTICES));
    REQUIRE(ids(session->query_points("chunk_0_0", Relations::VERTICES, box)) == scanned);

    SECTION("a write invalidates the index") {
        PointRecord extra;
        extra.id       = 1000;
        extra.position = Vec2d(25., 25.);
        session->write_points("chunk_0_0", Relations::VERTICES, { extra });
        REQUIRE_FALSE(session->has_index("chunk_0_0", Relations::VERTICES));
        REQUIRE(session->query_points("chunk_0_0", Relations::VERTICES, box).size() == 7);
    }
    SECTION("polygons are found by their bounding box") {
        session->write_polygons("chunk_0_0", Relations::WATER_FEATURES, {
            { 1, Test::square(Vec2d(0., 0.), 5.), "water" },
            { 2, Test::square(Vec2d(100., 100.), 5.), "water" } });
        session->build_index("chunk_0_0", Relations::WATER_FEATURES);
        const PolygonRecords hits = session->query_polygons("chunk_0_0", Relations::WATER_FEATURES, BoundingBox(4., 4., 50., 50.));
        REQUIRE(hits.size() == 1);
        REQUIRE(hits.front().id == 1);
    }
}

TEST_CASE("Geometric equality join", "[SpatialStore]") {
    MemorySpatialStore store;
    std::unique_ptr<StoreSession> session = store.open_session();
    session->create_namespace("chunk_0_0");
    session->create_namespace("chunk_1_0");
    session->write_points("chunk_0_0", Relations::VERTICES, grid_records(3, 10.));

    PointRecords shifted = grid_records(3, 10.);
    for (PointRecord &r : shifted) {
        r.position.x() += 20.;
        r.id += 100;
    }
    session->write_points("chunk_1_0", Relations::VERTICES, shifted);

    std::vector<std::pair<std::int64_t, std::int64_t>> pairs =
        session->geometric_equality_join("chunk_0_0", Relations::VERTICES, "chunk_1_0", Relations::VERTICES);
    std::sort(pairs.begin(), pairs.end());
    // the column x = 20 is shared
    REQUIRE(pairs.size() == 3);
    REQUIRE(pairs[0] == std::make_pair(std::int64_t(7), std::int64_t(101)));
    REQUIRE(pairs[2] == std::make_pair(std::int64_t(9), std::int64_t(103)));

    REQUIRE(session->geometric_equality_join("chunk_0_0", Relations::VERTICES, "chunk_1_0", Relations::EDGES).empty());
}

TEST_CASE("Publishing a namespace replaces the target", "[SpatialStore]") {
    MemorySpatialStore store;
    std::unique_ptr<StoreSession> session = store.open_session();
    session->create_namespace(GRAPH_NAMESPACE);
    session->write_points(GRAPH_NAMESPACE, Relations::VERTICES, grid_records(2, 1.));
    session->create_namespace(STAGING_NAMESPACE);
    session->write_points(STAGING_NAMESPACE, Relations::VERTICES, grid_records(3, 1.));

    session->publish_namespace(STAGING_NAMESPACE, GRAPH_NAMESPACE);
    REQUIRE_FALSE(session->has_namespace(STAGING_NAMESPACE));
    REQUIRE(session->read_points(GRAPH_NAMESPACE, Relations::VERTICES).size() == 9);

    REQUIRE_THROWS_AS(session->publish_namespace(STAGING_NAMESPACE, GRAPH_NAMESPACE), StoreError);
    REQUIRE(session->read_points(GRAPH_NAMESPACE, Relations::VERTICES).size() == 9);
}

TEST_CASE("Fault hook fails selected operations", "[SpatialStore]") {
    MemorySpatialStore store;
    store.set_fault_hook([](const std::string &operation, const std::string &ns) {
        if (operation == "write_points" && ns == "chunk_0_1")
            throw StoreError("injected failure");
    });
    std::unique_ptr<StoreSession> session = store.open_session();
    session->create_namespace("chunk_0_0");
    session->create_namespace("chunk_0_1");

    REQUIRE_NOTHROW(session->write_points("chunk_0_0", Relations::VERTICES, grid_records(2, 1.)));
    REQUIRE_THROWS_AS(session->write_points("chunk_0_1", Relations::VERTICES, grid_records(2, 1.)), StoreError);
    REQUIRE(session->read_points("chunk_0_1", Relations::VERTICES).empty());

    store.set_fault_hook(MemorySpatialStore::FaultHook());
    REQUIRE_NOTHROW(session->write_points("chunk_0_1", Relations::VERTICES, grid_records(2, 1.)));
}
