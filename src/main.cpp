#include <iostream>
#include <fstream>
#include <string>
#include <unordered_map>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "tool/area_selection.hpp"
#include "tool/tool_interface.hpp"

using namespace stopgraph;


void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " --stops-file <path> [options]\n"
              << "\nRequired arguments:\n"
              << "  --stops-file <path>          Path to the stops table (GTFS stops.txt layout)\n"
              << "\nOptional arguments:\n"
              << "  --output-dir <path>          Output directory (default: output)\n"
              << "  --area <name>                madrid, centro_espana, extremadura, cataluna, all or custom (default: madrid)\n"
              << "  --min-lat <value>            Minimum latitude for --area custom\n"
              << "  --max-lat <value>            Maximum latitude for --area custom\n"
              << "  --min-lon <value>            Minimum longitude for --area custom\n"
              << "  --max-lon <value>            Maximum longitude for --area custom\n"
              << "  --max-lines <n>              Data lines to read, 0 for no limit (default: 200)\n"
              << "  --points-output <path>       Also write the filtered stations as a point layer (.geojson, .gpkg, .shp, ...)\n"
              << "  --sample <n>                 Print the first n triples of the graph\n"
              << "  --interactive                Choose the area and sample from a menu\n"
              << "  --config <path>              JSON file with \"reader\", \"area\" and \"writer\" sections\n"
              << "\nExamples:\n"
              << "  " << programName << " --stops-file google_transit/stops.txt --area madrid\n"
              << "  " << programName << " --stops-file stops.txt --area custom --min-lat 40.3 --max-lat 40.5 --min-lon -3.8 --max-lon -3.6\n"
              << "  " << programName << " --stops-file stops.txt --area all --sample 20\n"
              << "\nUse --help for detailed parameter explanations.\n"
              << "Use --version to display version information.\n";
}

void printDetailedHelp(const char* programName) {
    std::cout << "StopGraph - Transit Stop Graph Builder\n"
              << "======================================\n\n"
              << "StopGraph reads a transit stop registry, builds a graph of geolocated stations\n"
              << "(geo:SpatialThing with rdfs:label, geo:lat and geo:long) and extracts the\n"
              << "stations inside a latitude/longitude rectangle together with all their facts.\n\n"
              << "OUTPUT:\n"
              << "  <output-dir>/estaciones.ttl          Full graph (Turtle)\n"
              << "  <output-dir>/estaciones.rdf          Full graph (RDF/XML)\n"
              << "  <output-dir>/estaciones_<area>.ttl   Filtered graph (Turtle)\n\n"
              << "AREAS:\n"
              << "  madrid          40.0 to 41.0 lat, -4.0 to -3.0 lon (default)\n"
              << "  centro_espana   39.0 to 41.0 lat, -5.0 to -3.0 lon\n"
              << "  extremadura     38.0 to 40.0 lat, -7.0 to -5.0 lon\n"
              << "  cataluna        40.0 to 42.0 lat,  0.0 to  3.0 lon\n"
              << "  all             Print the stations of every area\n"
              << "  custom          Use --min-lat, --max-lat, --min-lon and --max-lon\n"
              << "                  Invalid bounds fall back to the default area.\n\n"
              << "INPUT:\n"
              << "  Comma separated, header line first. Columns 0, 2, 4 and 5 hold stop id,\n"
              << "  name, latitude and longitude. Quoted fields are not supported.\n\n"
              << "OTHER OPTIONS:\n"
              << "  --help, -h     Show this detailed help message\n"
              << "  --version, -v  Show version information\n\n"
              << "Run " << programName << " without arguments for the option list.\n";
}

std::unordered_map<std::string, std::string> parseArgs(int argc, char* argv[]) {
    std::unordered_map<std::string, std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "-v") {
            args[arg.substr(1)] = "true";
        } else if (arg.substr(0, 2) == "--") {
            std::string key = arg.substr(2);

            // Negative numbers are values, only "--" starts a new option
            if (i + 1 < argc && std::string(argv[i + 1]).substr(0, 2) != "--") {
                args[key] = argv[i + 1];
                i++; // Skip the value in next iteration
            } else {
                args[key] = "true";
            }
        }
    }

    return args;
}

nlohmann::json loadConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    nlohmann::json config = nlohmann::json::parse(file);
    if (!config.is_object()) {
        throw std::runtime_error("Config file must contain a JSON object: " + path);
    }
    return config;
}

nlohmann::json section(const nlohmann::json& config, const std::string& name) {
    if (config.contains(name) && config[name].is_object()) {
        return config[name];
    }
    return nlohmann::json::object();
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        auto args = parseArgs(argc, argv);

        // Check for help flag first
        if (args.count("help") > 0 || args.count("h") > 0) {
            printDetailedHelp(argv[0]);
            return 0;
        }

        // Check for version flag
        if (args.count("version") > 0 || args.count("v") > 0) {
            std::cout << "StopGraph v1.0.0\n";
            std::cout << "Transit Stop Graph Builder\n";
            return 0;
        }

        nlohmann::json file_config = nlohmann::json::object();
        if (args.count("config")) {
            file_config = loadConfigFile(args.at("config"));
        }

        // Convert arguments to JSON configurations, flags override the config file
        nlohmann::json reader_config = section(file_config, "reader");
        nlohmann::json area_config = section(file_config, "area");
        nlohmann::json writer_config = section(file_config, "writer");

        if (args.count("stops-file")) reader_config["file_path"] = args.at("stops-file");
        if (args.count("max-lines")) reader_config["max_lines"] = std::stoll(args.at("max-lines"));

        if (!reader_config.contains("file_path")) {
            std::cerr << "Error: --stops-file is required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        if (args.count("output-dir")) writer_config["output_dir"] = args.at("output-dir");
        if (args.count("points-output")) writer_config["points_output_file_path"] = args.at("points-output");
        if (args.count("sample")) {
            const std::string& sample = args.at("sample");
            writer_config["sample_size"] = (sample == "true") ? 20LL : std::stoll(sample);
        }

        if (args.count("area")) area_config["area"] = args.at("area");
        if (args.count("min-lat")) area_config["min_lat"] = args.at("min-lat");
        if (args.count("max-lat")) area_config["max_lat"] = args.at("max-lat");
        if (args.count("min-lon")) area_config["min_lon"] = args.at("min-lon");
        if (args.count("max-lon")) area_config["max_lon"] = args.at("max-lon");

        if (args.count("interactive")) {
            if (tool::promptYesNo(std::cin, std::cout, "\nShow a sample of the generated graph?")) {
                writer_config["sample_size"] = 20;
            }

            tool::AreaSelection selection = tool::promptArea(std::cin, std::cout);
            area_config = nlohmann::json::object();
            if (selection.show_all) {
                area_config["area"] = "all";
            } else if (selection.is_custom) {
                area_config["area"] = "custom";
                area_config["min_lat"] = selection.bounds->getMinLat();
                area_config["max_lat"] = selection.bounds->getMaxLat();
                area_config["min_lon"] = selection.bounds->getMinLon();
                area_config["max_lon"] = selection.bounds->getMaxLon();
            } else {
                area_config["area"] = selection.area_name;
            }
        }

        std::string result = tool::processStopGraphTool(
            reader_config.dump(),
            area_config.dump(),
            writer_config.dump()
        );

        std::cout << result << std::endl;

        // Check if result indicates an error
        if (result.substr(0, 5) == "Error") {
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
