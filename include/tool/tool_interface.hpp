#ifndef STOPGRAPH_TOOL_INTERFACE_HPP
#define STOPGRAPH_TOOL_INTERFACE_HPP

#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "graph/graph_store.hpp"
#include "io/stops_reader.hpp"
#include "tool/area_selection.hpp"

namespace stopgraph {
namespace tool {

/**
 * Output settings of a tool run
 */
struct GraphWriterConfig {
    std::string output_dir = "output";                 // Created if missing
    std::string turtle_file_name = "estaciones.ttl";   // Full graph, Turtle
    std::string rdfxml_file_name = "estaciones.rdf";   // Full graph, RDF/XML
    std::string filtered_file_prefix = "estaciones_";  // Filtered graph: <prefix><area>.ttl
    std::string points_output_file_path;               // Optional station point layer (GDAL)
    size_t sample_size = 0;                            // Facts printed as a sample (0 = none)

    GraphWriterConfig() = default;
};

/**
 * Parse a stops reader configuration
 * Keys: file_path, max_lines, delimiter
 */
io::StopsReaderConfig parseStopsReaderConfig(const nlohmann::json& config_json);

/**
 * Parse an area configuration
 * Keys: area (preset key, "all" or "custom"), min_lat, max_lat, min_lon, max_lon
 */
AreaSelection parseAreaConfig(const nlohmann::json& config_json);

/**
 * Parse a writer configuration
 * Keys: output_dir, turtle_file_name, rdfxml_file_name, filtered_file_prefix,
 *       points_output_file_path, sample_size
 */
GraphWriterConfig parseGraphWriterConfig(const nlohmann::json& config_json);

/**
 * Filter a store with every area preset and print the stations found
 * @param store Graph store
 * @param out Output stream
 */
void demonstrateFiltering(const graph::GraphStore& store, std::ostream& out);

/**
 * StopGraph Tool
 * Ingests the stops table, exports the full graph, filters it by area and
 * exports the filtered graph
 * @param reader_config_json JSON string for stops reader configuration
 * @param area_config_json JSON string for area configuration
 * @param writer_config_json JSON string for writer configuration
 * @return Result message ("Success: ..." or "Error: ...")
 */
std::string processStopGraphTool(
    const std::string& reader_config_json,
    const std::string& area_config_json,
    const std::string& writer_config_json
);

} // namespace tool
} // namespace stopgraph

#endif // STOPGRAPH_TOOL_INTERFACE_HPP
