#ifndef libterragraph_SpatialStore_hpp_
#define libterragraph_SpatialStore_hpp_

#include "libterragraph.h"
#include "BoundingBox.hpp"
#include "Point.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Terragraph {

// Generic rows of the store. The pipeline maps its own types onto them,
// the store only understands ids, geometry and numeric attributes.
struct PointRecord
{
    std::int64_t id { -1 };
    Vec2d        position { Vec2d::Zero() };
    double       elevation { 0. };
    double       cost { 1. };
    int          kind { 0 };
    int          group { -1 };
    int          order { -1 };
};

struct EdgeRecord
{
    std::int64_t id { -1 };
    std::int64_t source { -1 };
    std::int64_t target { -1 };
    double       length { 0. };
    double       cost { 0. };
    int          type { 0 };
    Polyline     geometry;
    std::int64_t source_node { -1 };
    std::int64_t target_node { -1 };
};

struct PolygonRecord
{
    std::int64_t id { -1 };
    ExPolygon    polygon;
    std::string  kind;
};

using PointRecords   = std::vector<PointRecord>;
using EdgeRecords    = std::vector<EdgeRecord>;
using PolygonRecords = std::vector<PolygonRecord>;

using PointPredicate   = std::function<bool(const PointRecord&)>;
using EdgePredicate    = std::function<bool(const EdgeRecord&)>;
using PolygonPredicate = std::function<bool(const PolygonRecord&)>;

// Connection into a SpatialStore. A session is used by one thread at a time,
// every worker opens its own one. Failures are reported by StoreError.
class StoreSession
{
public:
    virtual ~StoreSession() = default;

    virtual void create_namespace(const std::string &ns) = 0;
    // Dropping a namespace that does not exist is a no-op.
    virtual void drop_namespace(const std::string &ns) = 0;
    virtual bool has_namespace(const std::string &ns) const = 0;
    virtual std::vector<std::string> namespaces() const = 0;

    // Writes append to the relation, creating it on first write.
    virtual void write_points(const std::string &ns, const std::string &relation, const PointRecords &rows) = 0;
    virtual void write_edges(const std::string &ns, const std::string &relation, const EdgeRecords &rows) = 0;
    virtual void write_polygons(const std::string &ns, const std::string &relation, const PolygonRecords &rows) = 0;

    // Reading a relation that was never written returns no rows.
    virtual PointRecords   read_points(const std::string &ns, const std::string &relation, const PointPredicate &predicate = PointPredicate()) const = 0;
    virtual EdgeRecords    read_edges(const std::string &ns, const std::string &relation, const EdgePredicate &predicate = EdgePredicate()) const = 0;
    virtual PolygonRecords read_polygons(const std::string &ns, const std::string &relation, const PolygonPredicate &predicate = PolygonPredicate()) const = 0;

    // Pairs of (id in a, id in b) of point rows at exactly the same position.
    virtual std::vector<std::pair<std::int64_t, std::int64_t>> geometric_equality_join(
        const std::string &ns_a, const std::string &relation_a, const std::string &ns_b, const std::string &relation_b) const = 0;

    virtual void build_index(const std::string &ns, const std::string &relation) = 0;
    virtual bool has_index(const std::string &ns, const std::string &relation) const = 0;
    // Rows whose geometry bounding box intersects the box. Uses the index when built.
    virtual PointRecords   query_points(const std::string &ns, const std::string &relation, const BoundingBox &box) const = 0;
    virtual EdgeRecords    query_edges(const std::string &ns, const std::string &relation, const BoundingBox &box) const = 0;
    virtual PolygonRecords query_polygons(const std::string &ns, const std::string &relation, const BoundingBox &box) const = 0;

    // Atomically replace namespace `to` with the content of `from`, `from` ceases to exist.
    virtual void publish_namespace(const std::string &from, const std::string &to) = 0;
};

class SpatialStore
{
public:
    virtual ~SpatialStore() = default;
    virtual std::unique_ptr<StoreSession> open_session() = 0;
};

} // namespace Terragraph

#endif // libterragraph_SpatialStore_hpp_
