#include "io/record_parser.hpp"
#include "graph/errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace stopgraph {
namespace io {

graph::StopRecord RecordParser::parse(const std::string& line, char delimiter) {
    std::vector<std::string> fields = split(line, delimiter);

    if (fields.size() < MIN_FIELD_COUNT) {
        std::ostringstream msg;
        msg << "Malformed line, expected at least " << MIN_FIELD_COUNT
            << " fields but found " << fields.size();
        throw graph::RecordError(graph::ErrorKind::MALFORMED_RECORD, msg.str());
    }

    std::string stop_id = trim(fields[ID_COLUMN]);
    std::string stop_name = trim(fields[NAME_COLUMN]);
    std::string stop_lat = trim(fields[LAT_COLUMN]);
    std::string stop_lon = trim(fields[LON_COLUMN]);

    if (stop_id.empty() || stop_name.empty() || stop_lat.empty() || stop_lon.empty()) {
        throw graph::RecordError(graph::ErrorKind::MISSING_REQUIRED_FIELD, "Empty required fields");
    }

    std::optional<double> lat = graph::parseNumber(stop_lat);
    if (!lat) {
        throw graph::RecordError(graph::ErrorKind::INVALID_COORDINATE,
                                 "Invalid latitude '" + stop_lat + "'");
    }

    std::optional<double> lon = graph::parseNumber(stop_lon);
    if (!lon) {
        throw graph::RecordError(graph::ErrorKind::INVALID_COORDINATE,
                                 "Invalid longitude '" + stop_lon + "'");
    }

    return graph::StopRecord(stop_id, stop_name, stop_lat, stop_lon, *lat, *lon);
}

std::vector<std::string> RecordParser::split(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    size_t start = 0;

    while (true) {
        size_t pos = line.find(delimiter, start);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }

    return fields;
}

std::string RecordParser::trim(const std::string& value) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };

    auto first = std::find_if(value.begin(), value.end(), not_space);
    auto last = std::find_if(value.rbegin(), value.rend(), not_space).base();

    if (first >= last) {
        return "";
    }
    return std::string(first, last);
}

bool RecordParser::isBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace io
} // namespace stopgraph
