#include "GraphCSV.hpp"
#include "../Graph.hpp"

#include <fstream>
#include <iomanip>

#include <boost/filesystem.hpp>
#include <boost/log/trivial.hpp>

namespace Terragraph {

bool export_graph_csv(const StoreSession &session, const std::string &ns, const std::string &dir)
{
    namespace fs = boost::filesystem;

    boost::system::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        BOOST_LOG_TRIVIAL(error) << "Cannot create output directory " << dir << ": " << ec.message();
        return false;
    }

    const std::string vertices_path = (fs::path(dir) / "vertices.csv").string();
    std::ofstream vertices(vertices_path);
    if (! vertices) {
        BOOST_LOG_TRIVIAL(error) << "Cannot write " << vertices_path;
        return false;
    }
    vertices << std::setprecision(12) << "id,x,y,elevation,cost,kind\n";
    for (const PointRecord &record : session.read_points(ns, Relations::VERTICES)) {
        const GlobalVertex v = global_vertex_from_record(record);
        vertices << v.global_id << "," << v.position.x() << "," << v.position.y() << ","
                 << v.elevation << "," << v.cost << "," << vertex_kind_name(v.kind) << "\n";
    }

    const std::string edges_path = (fs::path(dir) / "edges.csv").string();
    std::ofstream edges(edges_path);
    if (! edges) {
        BOOST_LOG_TRIVIAL(error) << "Cannot write " << edges_path;
        return false;
    }
    edges << std::setprecision(12) << "id,source,target,source_node,target_node,length,cost,type\n";
    for (const EdgeRecord &record : session.read_edges(ns, Relations::EDGES)) {
        const GlobalEdge e = global_edge_from_record(record);
        edges << e.global_id << "," << e.source_global_id << "," << e.target_global_id << ","
              << e.source_node << "," << e.target_node << "," << e.length << "," << e.cost << ","
              << edge_type_name(e.edge_type) << "\n";
    }

    vertices.close();
    edges.close();
    if (! vertices || ! edges) {
        BOOST_LOG_TRIVIAL(error) << "Writing the graph into " << dir << " failed";
        return false;
    }
    BOOST_LOG_TRIVIAL(info) << "Graph exported to " << dir;
    return true;
}

} // namespace Terragraph
