#include "GeoJSON.hpp"
#include "../Exception.hpp"

#include <fstream>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

#include <nlohmann/json.hpp>

namespace Terragraph {

using json = nlohmann::json;

static Polygon ring_from_json(const json &ring)
{
    Polygon out;
    for (const json &coord : ring) {
        if (! coord.is_array() || coord.size() < 2)
            throw RuntimeError("GeoJSON: a position has to be an array of at least two numbers");
        out.points.emplace_back(coord[0].get<double>(), coord[1].get<double>());
    }
    // GeoJSON rings repeat the first position
    if (out.points.size() > 1 && out.points.front() == out.points.back())
        out.points.pop_back();
    if (out.points.size() < 3)
        throw RuntimeError("GeoJSON: a linear ring needs at least three distinct positions");
    return out;
}

static ExPolygon polygon_from_json(const json &rings)
{
    if (! rings.is_array() || rings.empty())
        throw RuntimeError("GeoJSON: a polygon needs an exterior ring");
    ExPolygon out(ring_from_json(rings[0]));
    out.contour.make_counter_clockwise();
    for (size_t i = 1; i < rings.size(); ++ i)
        out.holes.emplace_back(ring_from_json(rings[i]));
    return out;
}

PolygonRecords polygons_from_geojson(const json &collection)
{
    PolygonRecords out;
    try {
        if (collection.value("type", std::string()) != "FeatureCollection")
            throw RuntimeError("GeoJSON: expected a FeatureCollection");
        const json &features = collection.at("features");
        for (size_t i = 0; i < features.size(); ++ i) {
            const json &feature = features[i];
            std::int64_t id = std::int64_t(i + 1);
            std::string  kind = "water";
            if (feature.contains("properties") && feature.at("properties").is_object()) {
                const json &props = feature.at("properties");
                id   = props.value("id", id);
                kind = props.value("kind", kind);
            }
            const json       &geometry = feature.at("geometry");
            const std::string type     = geometry.at("type").get<std::string>();
            const json       &coords   = geometry.at("coordinates");
            if (type == "Polygon") {
                out.push_back({ id, polygon_from_json(coords), kind });
            } else if (type == "MultiPolygon") {
                for (const json &rings : coords)
                    out.push_back({ id, polygon_from_json(rings), kind });
            } else {
                BOOST_LOG_TRIVIAL(warning) << "GeoJSON: skipping feature " << id << " of type " << type;
            }
        }
    } catch (const json::exception &ex) {
        throw RuntimeError(std::string("GeoJSON: malformed feature collection: ") + ex.what());
    }
    return out;
}

PolygonRecords load_geojson_polygons(const std::string &path)
{
    if (! boost::filesystem::exists(path))
        throw RuntimeError("Feature file does not exist: " + path);
    std::ifstream ifs(path);
    if (! ifs)
        throw RuntimeError("Cannot open feature file: " + path);

    json j;
    try {
        ifs >> j;
    } catch (const json::parse_error &ex) {
        throw RuntimeError((boost::format("Cannot parse %1%: %2%") % path % ex.what()).str());
    }
    PolygonRecords out = polygons_from_geojson(j);
    BOOST_LOG_TRIVIAL(info) << boost::format("Loaded %1% polygons from %2%") % out.size() % path;
    return out;
}

void import_water_features(StoreSession &session, const PolygonRecords &features)
{
    session.create_namespace(SOURCE_NAMESPACE);
    session.write_polygons(SOURCE_NAMESPACE, Relations::WATER_FEATURES, features);
    session.build_index(SOURCE_NAMESPACE, Relations::WATER_FEATURES);
}

} // namespace Terragraph
