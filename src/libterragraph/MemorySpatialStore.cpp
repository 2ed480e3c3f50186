#include "MemorySpatialStore.hpp"
#include "Exception.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_map>

#include <boost/format.hpp>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/index/rtree.hpp>
#include <boost/log/trivial.hpp>

namespace Terragraph {

namespace bg  = boost::geometry;
namespace bgi = boost::geometry::index;

using IndexPoint = bg::model::d2::point_xy<double>;
using IndexBox   = bg::model::box<IndexPoint>;
using IndexValue = std::pair<IndexBox, size_t>;
using IndexTree  = bgi::rtree<IndexValue, bgi::rstar<16>>;

struct MemorySpatialStore::Relation
{
    PointRecords   points;
    EdgeRecords    edges;
    PolygonRecords polygons;
    // Reset by every write.
    std::shared_ptr<const IndexTree> index;
};

struct MemorySpatialStore::Namespace
{
    std::map<std::string, Relation> relations;
};

static IndexBox index_box(const BoundingBox &bb)
{
    return IndexBox(IndexPoint(bb.min.x(), bb.min.y()), IndexPoint(bb.max.x(), bb.max.y()));
}

static BoundingBox row_extents(const PointRecord &row)
{
    return BoundingBox(row.position, row.position);
}

static BoundingBox row_extents(const EdgeRecord &row)
{
    return BoundingBox(row.geometry);
}

static BoundingBox row_extents(const PolygonRecord &row)
{
    return get_extents(row.polygon);
}

template<typename Rows>
static void index_rows(const Rows &rows, std::vector<IndexValue> &values)
{
    for (size_t i = 0; i < rows.size(); ++ i) {
        const BoundingBox bb = row_extents(rows[i]);
        if (bb.defined())
            values.emplace_back(index_box(bb), i);
    }
}

template<typename Rows, typename Predicate>
static Rows filter_rows(const Rows &rows, const Predicate &predicate)
{
    if (! predicate)
        return rows;
    Rows out;
    for (const auto &row : rows)
        if (predicate(row))
            out.emplace_back(row);
    return out;
}

template<typename Rows>
static Rows query_rows(const Rows &rows, const IndexTree *index, const BoundingBox &box)
{
    Rows out;
    if (index != nullptr) {
        std::vector<IndexValue> hits;
        index->query(bgi::intersects(index_box(box)), std::back_inserter(hits));
        // keep the row order independent of the tree layout
        std::sort(hits.begin(), hits.end(), [](const IndexValue &l, const IndexValue &r) { return l.second < r.second; });
        out.reserve(hits.size());
        for (const IndexValue &hit : hits)
            out.emplace_back(rows[hit.second]);
    } else {
        for (const auto &row : rows) {
            const BoundingBox bb = row_extents(row);
            if (bb.defined() && bb.overlap(box))
                out.emplace_back(row);
        }
    }
    return out;
}

class MemoryStoreSession : public StoreSession
{
public:
    explicit MemoryStoreSession(MemorySpatialStore &store) : m_store(store) {}

    void create_namespace(const std::string &ns) override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        this->fault("create_namespace", ns);
        if (m_store.m_namespaces.find(ns) == m_store.m_namespaces.end())
            m_store.m_namespaces.emplace(ns, std::make_shared<MemorySpatialStore::Namespace>());
    }

    void drop_namespace(const std::string &ns) override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        this->fault("drop_namespace", ns);
        m_store.m_namespaces.erase(ns);
    }

    bool has_namespace(const std::string &ns) const override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        return m_store.m_namespaces.find(ns) != m_store.m_namespaces.end();
    }

    std::vector<std::string> namespaces() const override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        std::vector<std::string> out;
        out.reserve(m_store.m_namespaces.size());
        for (const auto &kvp : m_store.m_namespaces)
            out.emplace_back(kvp.first);
        return out;
    }

    void write_points(const std::string &ns, const std::string &relation, const PointRecords &rows) override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        this->fault("write_points", ns);
        MemorySpatialStore::Relation &rel = this->relation_for_write(ns, relation);
        rel.points.insert(rel.points.end(), rows.begin(), rows.end());
        rel.index.reset();
    }

    void write_edges(const std::string &ns, const std::string &relation, const EdgeRecords &rows) override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        this->fault("write_edges", ns);
        MemorySpatialStore::Relation &rel = this->relation_for_write(ns, relation);
        rel.edges.insert(rel.edges.end(), rows.begin(), rows.end());
        rel.index.reset();
    }

    void write_polygons(const std::string &ns, const std::string &relation, const PolygonRecords &rows) override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        this->fault("write_polygons", ns);
        MemorySpatialStore::Relation &rel = this->relation_for_write(ns, relation);
        rel.polygons.insert(rel.polygons.end(), rows.begin(), rows.end());
        rel.index.reset();
    }

    PointRecords read_points(const std::string &ns, const std::string &relation, const PointPredicate &predicate) const override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        const MemorySpatialStore::Relation *rel = this->relation_for_read(ns, relation);
        return rel ? filter_rows(rel->points, predicate) : PointRecords();
    }

    EdgeRecords read_edges(const std::string &ns, const std::string &relation, const EdgePredicate &predicate) const override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        const MemorySpatialStore::Relation *rel = this->relation_for_read(ns, relation);
        return rel ? filter_rows(rel->edges, predicate) : EdgeRecords();
    }

    PolygonRecords read_polygons(const std::string &ns, const std::string &relation, const PolygonPredicate &predicate) const override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        const MemorySpatialStore::Relation *rel = this->relation_for_read(ns, relation);
        return rel ? filter_rows(rel->polygons, predicate) : PolygonRecords();
    }

    std::vector<std::pair<std::int64_t, std::int64_t>> geometric_equality_join(
        const std::string &ns_a, const std::string &relation_a, const std::string &ns_b, const std::string &relation_b) const override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        std::vector<std::pair<std::int64_t, std::int64_t>> out;
        const MemorySpatialStore::Relation *a = this->relation_for_read(ns_a, relation_a);
        const MemorySpatialStore::Relation *b = this->relation_for_read(ns_b, relation_b);
        if (a == nullptr || b == nullptr)
            return out;

        std::unordered_multimap<Vec2d, std::int64_t, PointHash, PointEqual> positions;
        positions.reserve(b->points.size());
        for (const PointRecord &row : b->points)
            positions.emplace(row.position, row.id);
        for (const PointRecord &row : a->points) {
            auto range = positions.equal_range(row.position);
            for (auto it = range.first; it != range.second; ++ it)
                out.emplace_back(row.id, it->second);
        }
        return out;
    }

    void build_index(const std::string &ns, const std::string &relation) override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        this->fault("build_index", ns);
        auto it = m_store.m_namespaces.find(ns);
        MemorySpatialStore::Relation *rel = nullptr;
        if (it != m_store.m_namespaces.end()) {
            auto it_rel = it->second->relations.find(relation);
            if (it_rel != it->second->relations.end())
                rel = &it_rel->second;
        }
        if (rel == nullptr)
            throw StoreError((boost::format("Cannot index missing relation %1%.%2%") % ns % relation).str());

        std::vector<IndexValue> values;
        index_rows(rel->points, values);
        index_rows(rel->edges, values);
        index_rows(rel->polygons, values);
        // packing constructor
        rel->index = std::make_shared<const IndexTree>(values.begin(), values.end());
        BOOST_LOG_TRIVIAL(trace) << __FUNCTION__ << boost::format(": %1%.%2% with %3% entries") % ns % relation % values.size();
    }

    bool has_index(const std::string &ns, const std::string &relation) const override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        const MemorySpatialStore::Relation *rel = this->relation_for_read(ns, relation);
        return rel != nullptr && rel->index != nullptr;
    }

    PointRecords query_points(const std::string &ns, const std::string &relation, const BoundingBox &box) const override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        const MemorySpatialStore::Relation *rel = this->relation_for_read(ns, relation);
        return rel ? query_rows(rel->points, rel->index.get(), box) : PointRecords();
    }

    EdgeRecords query_edges(const std::string &ns, const std::string &relation, const BoundingBox &box) const override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        const MemorySpatialStore::Relation *rel = this->relation_for_read(ns, relation);
        return rel ? query_rows(rel->edges, rel->index.get(), box) : EdgeRecords();
    }

    PolygonRecords query_polygons(const std::string &ns, const std::string &relation, const BoundingBox &box) const override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        const MemorySpatialStore::Relation *rel = this->relation_for_read(ns, relation);
        return rel ? query_rows(rel->polygons, rel->index.get(), box) : PolygonRecords();
    }

    void publish_namespace(const std::string &from, const std::string &to) override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        this->fault("publish_namespace", to);
        auto it = m_store.m_namespaces.find(from);
        if (it == m_store.m_namespaces.end())
            throw StoreError("Cannot publish missing namespace " + from);
        std::shared_ptr<MemorySpatialStore::Namespace> content = it->second;
        m_store.m_namespaces.erase(it);
        m_store.m_namespaces[to] = std::move(content);
    }

private:
    // m_mutex has to be locked.
    void fault(const char *operation, const std::string &ns) const
    {
        if (m_store.m_fault_hook)
            m_store.m_fault_hook(operation, ns);
    }

    MemorySpatialStore::Relation& relation_for_write(const std::string &ns, const std::string &relation)
    {
        auto it = m_store.m_namespaces.find(ns);
        if (it == m_store.m_namespaces.end())
            throw StoreError((boost::format("Cannot write %1%.%2%: namespace does not exist") % ns % relation).str());
        return it->second->relations[relation];
    }

    const MemorySpatialStore::Relation* relation_for_read(const std::string &ns, const std::string &relation) const
    {
        auto it = m_store.m_namespaces.find(ns);
        if (it == m_store.m_namespaces.end())
            throw StoreError((boost::format("Cannot read %1%.%2%: namespace does not exist") % ns % relation).str());
        auto it_rel = it->second->relations.find(relation);
        return it_rel == it->second->relations.end() ? nullptr : &it_rel->second;
    }

    MemorySpatialStore &m_store;
};

MemorySpatialStore::MemorySpatialStore() = default;
MemorySpatialStore::~MemorySpatialStore() = default;

std::unique_ptr<StoreSession> MemorySpatialStore::open_session()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ++ m_sessions_opened;
    return std::make_unique<MemoryStoreSession>(*this);
}

void MemorySpatialStore::set_fault_hook(FaultHook hook)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_fault_hook = std::move(hook);
}

size_t MemorySpatialStore::sessions_opened() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions_opened;
}

} // namespace Terragraph
