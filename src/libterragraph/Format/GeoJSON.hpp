#ifndef libterragraph_Format_GeoJSON_hpp_
#define libterragraph_Format_GeoJSON_hpp_

#include "../SpatialStore.hpp"

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace Terragraph {

// Polygons and multipolygons of a GeoJSON FeatureCollection in projected coordinates.
// Every polygon becomes one record, its id is properties.id or the 1 based feature index.
// Throws RuntimeError on malformed input.
PolygonRecords polygons_from_geojson(const nlohmann::json &collection);
PolygonRecords load_geojson_polygons(const std::string &path);

// Write the features into SOURCE_NAMESPACE.water_features, creating the namespace.
void import_water_features(StoreSession &session, const PolygonRecords &features);

} // namespace Terragraph

#endif // libterragraph_Format_GeoJSON_hpp_
