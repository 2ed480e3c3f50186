#ifndef libterragraph_Format_GraphCSV_hpp_
#define libterragraph_Format_GraphCSV_hpp_

#include "../SpatialStore.hpp"

#include <string>

namespace Terragraph {

// Writes <dir>/vertices.csv and <dir>/edges.csv of the graph published in the namespace.
// Returns false if a file could not be written.
bool export_graph_csv(const StoreSession &session, const std::string &ns, const std::string &dir);

} // namespace Terragraph

#endif // libterragraph_Format_GraphCSV_hpp_
