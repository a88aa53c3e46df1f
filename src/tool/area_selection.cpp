#include "tool/area_selection.hpp"
#include "io/record_parser.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace stopgraph {
namespace tool {

namespace {

const std::string CUSTOM_AREA_NAME = "personalizada";

AreaSelection defaultSelection() {
    const graph::AreaPreset& preset = graph::areaPresets().front();
    AreaSelection selection;
    selection.area_name = preset.file_suffix;
    selection.bounds = preset.bounds;
    selection.used_fallback = true;
    return selection;
}

AreaSelection presetSelection(const graph::AreaPreset& preset) {
    AreaSelection selection;
    selection.area_name = preset.file_suffix;
    selection.bounds = preset.bounds;
    return selection;
}

std::string readAnswer(std::istream& in) {
    std::string line;
    if (!std::getline(in, line)) {
        return "";
    }
    return io::RecordParser::trim(line);
}

} // namespace

AreaSelection selectAreaByName(const std::string& key) {
    std::string lowered = key;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "all") {
        AreaSelection selection;
        selection.area_name = "all";
        selection.show_all = true;
        return selection;
    }

    std::optional<graph::AreaPreset> preset = graph::findAreaPreset(lowered);
    if (preset) {
        return presetSelection(*preset);
    }

    std::cerr << "Warning: Unknown area '" << key << "'. Using default area "
              << graph::defaultBounds().toString() << std::endl;
    return defaultSelection();
}

AreaSelection customArea(const std::string& min_lat, const std::string& max_lat,
                         const std::string& min_lon, const std::string& max_lon) {
    std::optional<double> values[4] = {
        graph::parseNumber(io::RecordParser::trim(min_lat)),
        graph::parseNumber(io::RecordParser::trim(max_lat)),
        graph::parseNumber(io::RecordParser::trim(min_lon)),
        graph::parseNumber(io::RecordParser::trim(max_lon))
    };

    for (const auto& value : values) {
        if (!value) {
            std::cerr << "Warning: Invalid coordinate input. Using default area "
                      << graph::defaultBounds().toString() << std::endl;
            return defaultSelection();
        }
    }

    AreaSelection selection;
    selection.area_name = CUSTOM_AREA_NAME;
    selection.is_custom = true;
    selection.bounds = graph::GeographicBounds(*values[0], *values[1], *values[2], *values[3]);
    return selection;
}

AreaSelection promptArea(std::istream& in, std::ostream& out) {
    const auto& presets = graph::areaPresets();

    out << "\nSelect a geographic area to filter:" << std::endl;
    out << "1. Madrid and surroundings (40.0-41.0 lat, -4.0--3.0 lon)" << std::endl;
    out << "2. Central Spain (39.0-41.0 lat, -5.0--3.0 lon)" << std::endl;
    out << "3. Extremadura (38.0-40.0 lat, -7.0--5.0 lon)" << std::endl;
    out << "4. Custom area" << std::endl;
    out << "5. Show all areas" << std::endl;
    out << "Option (1-5): ";

    std::string answer = readAnswer(in);

    if (answer == "1" || answer == "2" || answer == "3") {
        return presetSelection(presets[static_cast<size_t>(answer[0] - '1')]);
    }

    if (answer == "4") {
        out << "\nEnter the bounds of the rectangular area:" << std::endl;
        out << "Minimum latitude: ";
        std::string min_lat = readAnswer(in);
        out << "Maximum latitude: ";
        std::string max_lat = readAnswer(in);
        out << "Minimum longitude: ";
        std::string min_lon = readAnswer(in);
        out << "Maximum longitude: ";
        std::string max_lon = readAnswer(in);
        return customArea(min_lat, max_lat, min_lon, max_lon);
    }

    if (answer == "5") {
        return selectAreaByName("all");
    }

    std::cerr << "Warning: Invalid option '" << answer << "'. Using default area "
              << graph::defaultBounds().toString() << std::endl;
    return defaultSelection();
}

bool promptYesNo(std::istream& in, std::ostream& out, const std::string& question) {
    out << question << " (s/n): ";
    std::string answer = readAnswer(in);
    if (answer.empty()) {
        return false;
    }
    char first = static_cast<char>(std::tolower(static_cast<unsigned char>(answer[0])));
    return first == 's' || first == 'y';
}

} // namespace tool
} // namespace stopgraph
