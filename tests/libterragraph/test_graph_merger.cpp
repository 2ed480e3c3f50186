#include <catch2/catch.hpp>

#include "libterragraph/Exception.hpp"
#include "libterragraph/MemorySpatialStore.hpp"
#include "libterragraph/Pipeline/GraphMerger.hpp"

#include <set>

using namespace Terragraph;

namespace {

// Local graph written by hand into a tile namespace.
struct TileGraph
{
    std::string   id;
    LocalVertices vertices;
    LocalEdges    edges;

    VertexId vertex(double x, double y, VertexKind kind = VertexKind::Terrain)
    {
        LocalVertex v;
        v.local_id = VertexId(vertices.size()) + 1;
        v.position = Vec2d(x, y);
        v.kind     = kind;
        vertices.emplace_back(v);
        return v.local_id;
    }

    void edge(VertexId a, VertexId b, EdgeType type = EdgeType::Terrain)
    {
        const Vec2d pa = a <= VertexId(vertices.size()) ? vertices[size_t(a - 1)].position : Vec2d(-1., -1.);
        const Vec2d pb = b <= VertexId(vertices.size()) ? vertices[size_t(b - 1)].position : Vec2d(-1., -1.);
        LocalEdge e;
        e.local_id        = EdgeId(edges.size()) + 1;
        e.source_local_id = a;
        e.target_local_id = b;
        e.length          = (pb - pa).norm();
        e.cost            = e.length;
        e.edge_type       = type;
        e.geometry        = { pa, pb };
        edges.emplace_back(std::move(e));
    }

    void write(StoreSession &session) const
    {
        PointRecords points;
        for (const LocalVertex &v : vertices)
            points.emplace_back(to_record(v));
        EdgeRecords rows;
        for (const LocalEdge &e : edges)
            rows.emplace_back(to_record(e));
        session.drop_namespace(id);
        session.create_namespace(id);
        session.write_points(id, Relations::VERTICES, points);
        session.write_edges(id, Relations::EDGES, rows);
    }

    ChunkResult result(ChunkStatus status = ChunkStatus::Success) const
    {
        ChunkResult r;
        r.tile_id      = id;
        r.status       = status;
        r.vertex_count = vertices.size();
        r.edge_count   = edges.size();
        return r;
    }
};

// Two tiles sharing the vertex (5000, 5000) and the edge towards (5000, 4800).
void shared_corner_tiles(TileGraph &left, TileGraph &right)
{
    left.id = "chunk_0_0";
    VertexId a = left.vertex(4800., 4800.);
    VertexId b = left.vertex(5000., 5000.);
    VertexId c = left.vertex(5000., 4800.);
    left.edge(a, b);
    left.edge(b, c);
    left.edge(c, a);

    right.id = "chunk_1_0";
    VertexId d = right.vertex(5000., 4800.);
    VertexId e = right.vertex(5000., 5000.);
    VertexId f = right.vertex(5200., 5000.);
    right.edge(e, d);
    right.edge(e, f);
    right.edge(f, d);
}

std::set<std::pair<double, double>> positions(const PointRecords &records)
{
    std::set<std::pair<double, double>> out;
    for (const PointRecord &r : records)
        out.emplace(r.position.x(), r.position.y());
    return out;
}

} // namespace

TEST_CASE("Vertices shared by tiles are merged", "[GraphMerger]") {
    MemorySpatialStore store;
    std::unique_ptr<StoreSession> session = store.open_session();
    TileGraph left, right;
    shared_corner_tiles(left, right);
    left.write(*session);
    right.write(*session);

    GraphMerger merger(MergeConfig{});
    const MergeReport report = merger.merge({ right.result(), left.result() }, *session);

    REQUIRE(report.tiles_merged == 2);
    REQUIRE(report.vertices == 4);
    REQUIRE(report.duplicate_vertices == 2);
    // the edge (5000, 5000) - (5000, 4800) is in both tiles
    REQUIRE(report.edges == 5);
    REQUIRE(report.duplicate_edges == 1);
    REQUIRE(report.defects.empty());

    const PointRecords vertices = session->read_points(GRAPH_NAMESPACE, Relations::VERTICES);
    REQUIRE(vertices.size() == 4);
    REQUIRE(positions(vertices).size() == 4);
    size_t corner = 0;
    for (const PointRecord &v : vertices)
        if (v.position == Vec2d(5000., 5000.))
            ++ corner;
    REQUIRE(corner == 1);

    std::set<std::int64_t> ids;
    for (const PointRecord &v : vertices)
        ids.insert(v.id);
    for (const EdgeRecord &e : session->read_edges(GRAPH_NAMESPACE, Relations::EDGES)) {
        REQUIRE(ids.count(e.source) == 1);
        REQUIRE(ids.count(e.target) == 1);
        REQUIRE(e.source_node > 0);
        REQUIRE(e.target_node > 0);
    }

    // global ids follow the sorted tile ids, not the completion order
    REQUIRE(merger.vertices().front().position == Vec2d(4800., 4800.));
    REQUIRE(report.topology_nodes == 4);
    REQUIRE(session->read_points(GRAPH_NAMESPACE, Relations::TOPOLOGY_NODES).size() == 4);
    REQUIRE(session->has_index(GRAPH_NAMESPACE, Relations::VERTICES));

    // tile namespaces are scratch space
    REQUIRE_FALSE(session->has_namespace("chunk_0_0"));
    REQUIRE_FALSE(session->has_namespace(STAGING_NAMESPACE));
}

TEST_CASE("Merging is idempotent", "[GraphMerger]") {
    MemorySpatialStore store;
    std::unique_ptr<StoreSession> session = store.open_session();
    TileGraph left, right;
    shared_corner_tiles(left, right);
    left.write(*session);
    right.write(*session);

    MergeConfig config;
    config.drop_tile_namespaces = false;
    GraphMerger merger(config);

    SECTION("the same tile twice adds nothing") {
        const MergeReport report = merger.merge({ left.result(), left.result() }, *session);
        REQUIRE(report.vertices == 3);
        REQUIRE(report.edges == 3);
        REQUIRE(report.duplicate_vertices == 3);
        REQUIRE(report.duplicate_edges == 3);
    }
    SECTION("merging again gives the same graph") {
        const MergeReport first  = merger.merge({ left.result(), right.result() }, *session);
        const PointRecords before = session->read_points(GRAPH_NAMESPACE, Relations::VERTICES);
        const MergeReport second = merger.merge({ left.result(), right.result() }, *session);
        REQUIRE(second.vertices == first.vertices);
        REQUIRE(second.edges == first.edges);
        REQUIRE(session->read_points(GRAPH_NAMESPACE, Relations::VERTICES).size() == before.size());
        REQUIRE(session->has_namespace("chunk_1_0"));
    }
    SECTION("without edge deduplication parallel edges are kept") {
        MergeConfig keep = config;
        keep.deduplicate_edges = false;
        const MergeReport report = GraphMerger(keep).merge({ left.result(), right.result() }, *session);
        REQUIRE(report.edges == 6);
    }
}

TEST_CASE("Failed tiles are skipped", "[GraphMerger]") {
    MemorySpatialStore store;
    std::unique_ptr<StoreSession> session = store.open_session();
    TileGraph left, right;
    shared_corner_tiles(left, right);
    left.write(*session);
    right.write(*session);

    const MergeReport report = GraphMerger(MergeConfig{}).merge({ left.result(), right.result(ChunkStatus::Failed) }, *session);
    REQUIRE(report.tiles_merged == 1);
    REQUIRE(report.tiles_skipped == 1);
    REQUIRE(positions(session->read_points(GRAPH_NAMESPACE, Relations::VERTICES)).count({ 5200., 5000. }) == 0);
}

TEST_CASE("Edges referencing unknown vertices", "[GraphMerger]") {
    MemorySpatialStore store;
    std::unique_ptr<StoreSession> session = store.open_session();
    TileGraph tile;
    tile.id = "chunk_0_0";
    VertexId a = tile.vertex(0., 0.);
    VertexId b = tile.vertex(100., 0.);
    tile.edge(a, b);
    tile.edge(b, 17);
    tile.write(*session);

    SECTION("are reported and dropped") {
        const MergeReport report = GraphMerger(MergeConfig{}).merge({ tile.result() }, *session);
        REQUIRE(report.defects.size() == 1);
        REQUIRE(report.defects.front().tile_id == "chunk_0_0");
        REQUIRE(report.defects.front().edge_id == 2);
        REQUIRE(report.defects.front().missing_local_id == 17);
        REQUIRE(report.edges == 1);
    }
    SECTION("abort a strict merge") {
        MergeConfig config;
        config.strict_reconciliation = true;
        REQUIRE_THROWS_AS(GraphMerger(config).merge({ tile.result() }, *session), ReconciliationError);
        REQUIRE_FALSE(session->has_namespace(GRAPH_NAMESPACE));
    }
}

TEST_CASE("Topology snaps nearly coincident endpoints", "[GraphMerger]") {
    MemorySpatialStore store;
    std::unique_ptr<StoreSession> session = store.open_session();
    TileGraph tile;
    tile.id = "chunk_0_0";
    VertexId a = tile.vertex(0., 0.);
    VertexId b = tile.vertex(100., 0.);
    VertexId c = tile.vertex(100.00001, 0.);
    VertexId d = tile.vertex(200., 0.);
    tile.edge(a, b);
    tile.edge(c, d);
    tile.write(*session);

    GraphMerger merger(MergeConfig{});
    const MergeReport report = merger.merge({ tile.result() }, *session);
    // distinct vertices, one routing node
    REQUIRE(report.vertices == 4);
    REQUIRE(report.topology_nodes == 3);
    REQUIRE(merger.edges()[0].target_node == merger.edges()[1].source_node);
}

TEST_CASE("A failing store keeps the published graph", "[GraphMerger]") {
    MemorySpatialStore store;
    std::unique_ptr<StoreSession> session = store.open_session();
    TileGraph left, right;
    shared_corner_tiles(left, right);

    MergeConfig config;
    config.drop_tile_namespaces = false;
    left.write(*session);
    GraphMerger(config).merge({ left.result() }, *session);
    REQUIRE(session->read_points(GRAPH_NAMESPACE, Relations::VERTICES).size() == 3);

    right.write(*session);
    SECTION("failing writes into the staging namespace") {
        store.set_fault_hook([](const std::string &operation, const std::string &ns) {
            if (operation == "write_edges" && ns == STAGING_NAMESPACE)
                throw StoreError("disk full");
        });
        REQUIRE_THROWS_AS(GraphMerger(config).merge({ left.result(), right.result() }, *session), StoreError);
    }
    SECTION("failing publication") {
        store.set_fault_hook([](const std::string &operation, const std::string &) {
            if (operation == "publish_namespace")
                throw StoreError("connection lost");
        });
        REQUIRE_THROWS_AS(GraphMerger(config).merge({ left.result(), right.result() }, *session), StoreError);
    }

    store.set_fault_hook(MemorySpatialStore::FaultHook());
    REQUIRE(session->read_points(GRAPH_NAMESPACE, Relations::VERTICES).size() == 3);
    REQUIRE(session->read_edges(GRAPH_NAMESPACE, Relations::EDGES).size() == 3);
    REQUIRE_FALSE(session->has_namespace(STAGING_NAMESPACE));
}
