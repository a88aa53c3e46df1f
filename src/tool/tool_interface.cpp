#include "tool/tool_interface.hpp"
#include "graph/bbox_filter.hpp"
#include "io/graph_report.hpp"
#include "io/rdfxml_writer.hpp"
#include "io/turtle_writer.hpp"
#include "io/writer_stations.hpp"
#include <boost/filesystem.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace fs = boost::filesystem;

namespace stopgraph {
namespace tool {

namespace {

// Bounds may be given as numbers (config files) or as raw text (command line)
std::string boundText(const nlohmann::json& config_json, const std::string& key) {
    if (!config_json.contains(key)) {
        return "";
    }
    const auto& value = config_json[key];
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number()) {
        // dump() prints the shortest text that reads back to the same double
        return value.dump();
    }
    return "";
}

// Line and fact counts must be non-negative integers
size_t countValue(const nlohmann::json& config_json, const std::string& key) {
    const auto& value = config_json[key];
    if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<long long>() < 0)) {
        throw std::runtime_error("'" + key + "' must be a non-negative integer: " + value.dump());
    }
    return value.get<size_t>();
}

} // namespace

io::StopsReaderConfig parseStopsReaderConfig(const nlohmann::json& config_json) {
    io::StopsReaderConfig config;

    if (config_json.contains("file_path")) {
        config.file_path = config_json["file_path"];
    }
    if (config_json.contains("max_lines")) {
        config.max_lines = countValue(config_json, "max_lines");
    }
    if (config_json.contains("delimiter")) {
        std::string delimiter = config_json["delimiter"];
        if (delimiter.size() != 1) {
            throw std::runtime_error("Delimiter must be a single character: '" + delimiter + "'");
        }
        config.delimiter = delimiter[0];
    }

    return config;
}

AreaSelection parseAreaConfig(const nlohmann::json& config_json) {
    std::string area = config_json.value("area", std::string("madrid"));
    std::transform(area.begin(), area.end(), area.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (area == "custom") {
        return customArea(boundText(config_json, "min_lat"), boundText(config_json, "max_lat"),
                          boundText(config_json, "min_lon"), boundText(config_json, "max_lon"));
    }

    return selectAreaByName(area);
}

GraphWriterConfig parseGraphWriterConfig(const nlohmann::json& config_json) {
    GraphWriterConfig config;

    if (config_json.contains("output_dir")) {
        config.output_dir = config_json["output_dir"];
    }
    if (config_json.contains("turtle_file_name")) {
        config.turtle_file_name = config_json["turtle_file_name"];
    }
    if (config_json.contains("rdfxml_file_name")) {
        config.rdfxml_file_name = config_json["rdfxml_file_name"];
    }
    if (config_json.contains("filtered_file_prefix")) {
        config.filtered_file_prefix = config_json["filtered_file_prefix"];
    }
    if (config_json.contains("points_output_file_path")) {
        config.points_output_file_path = config_json["points_output_file_path"];
    }
    if (config_json.contains("sample_size")) {
        config.sample_size = countValue(config_json, "sample_size");
    }

    return config;
}

void demonstrateFiltering(const graph::GraphStore& store, std::ostream& out) {
    out << "\nGeographic filtering demonstration:" << std::endl;

    for (const auto& preset : graph::areaPresets()) {
        graph::FilterResult result = graph::BoundingBoxFilter::filterInBounds(store, preset.bounds);
        out << "\n--- Stations in " << preset.display_name << " ---" << std::endl;
        io::GraphReport::printFilteredEntities(result.entities, out);
    }
}

// StopGraph Tool
std::string processStopGraphTool(
    const std::string& reader_config_json,
    const std::string& area_config_json,
    const std::string& writer_config_json) {

    try {
        // Parse configurations
        nlohmann::json reader_config = nlohmann::json::parse(reader_config_json);
        nlohmann::json area_config = nlohmann::json::parse(area_config_json);
        nlohmann::json writer_config = nlohmann::json::parse(writer_config_json);

        io::StopsReaderConfig reader_cfg = parseStopsReaderConfig(reader_config);
        AreaSelection area = parseAreaConfig(area_config);
        GraphWriterConfig writer_cfg = parseGraphWriterConfig(writer_config);

        if (reader_cfg.file_path.empty()) {
            return "Error: No stops file specified";
        }

        // Part 1: build the graph
        graph::GraphStore store;
        io::StopsReader reader(reader_cfg);
        if (!reader.read(store)) {
            return "Error: Failed to read stops file: " + reader.getLastError();
        }

        io::GraphReport::printStatistics(store, std::cout);

        fs::path output_dir(writer_cfg.output_dir);
        boost::system::error_code ec;
        fs::create_directories(output_dir, ec);
        if (ec) {
            return "Error: Failed to create output directory " + output_dir.string() + ": " + ec.message();
        }

        std::string turtle_path = (output_dir / writer_cfg.turtle_file_name).string();
        if (!io::TurtleWriter::writeToFile(store, turtle_path)) {
            return "Error: " + io::TurtleWriter::getLastError();
        }

        std::string rdfxml_path = (output_dir / writer_cfg.rdfxml_file_name).string();
        if (!io::RdfXmlWriter::writeToFile(store, rdfxml_path)) {
            return "Error: " + io::RdfXmlWriter::getLastError();
        }

        if (writer_cfg.sample_size > 0) {
            io::GraphReport::printSample(store, std::cout, writer_cfg.sample_size);
        }

        // Part 2: geographic filtering
        if (area.show_all) {
            demonstrateFiltering(store, std::cout);
            return "Success: Graph built with " + std::to_string(store.size()) + " triples from " +
                   std::to_string(reader.getProcessedCount()) + " stations; all areas listed";
        }

        const graph::GeographicBounds& bounds = *area.bounds;
        graph::FilterResult result = graph::BoundingBoxFilter::filterInBounds(store, bounds);
        io::GraphReport::printFilteredEntities(result.entities, std::cout);

        graph::GraphStore filtered = graph::BoundingBoxFilter::copySubjects(store, result.entities);
        std::cout << "Filtered graph created with " << filtered.size() << " triples" << std::endl;

        std::string filtered_path =
            (output_dir / (writer_cfg.filtered_file_prefix + area.area_name + ".ttl")).string();
        if (!io::TurtleWriter::writeToFile(filtered, filtered_path)) {
            return "Error: " + io::TurtleWriter::getLastError();
        }

        std::string message = "Success: " + std::to_string(result.total_retained) + " of " +
                              std::to_string(result.total_examined) + " stations inside " +
                              bounds.toString() + "; files: " + turtle_path + ", " + rdfxml_path +
                              ", " + filtered_path;

        if (!writer_cfg.points_output_file_path.empty()) {
            io::StationPointWriterConfig points_cfg;
            points_cfg.output_file_path = writer_cfg.points_output_file_path;

            io::StationPointWriter points_writer;
            if (!points_writer.writeStations(points_cfg, result.entities)) {
                return "Error: Failed to write station points: " + points_writer.getLastError();
            }
            message += ", " + points_writer.getOutputFilePath();
        }

        return message;

    } catch (const std::exception& e) {
        return "Error: " + std::string(e.what());
    }
}

} // namespace tool
} // namespace stopgraph
