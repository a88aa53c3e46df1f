#ifndef STOPGRAPH_RECORD_PARSER_HPP
#define STOPGRAPH_RECORD_PARSER_HPP

#include <string>
#include <vector>
#include "graph/common.hpp"

namespace stopgraph {
namespace io {

/**
 * Parser for one row of the stops table.
 * Columns 0, 2, 4 and 5 hold identifier, name, latitude and longitude.
 * Fields are split on a single delimiter character; quoted fields are not supported.
 */
class RecordParser {
public:
    // Minimum number of fields a row must have
    static constexpr size_t MIN_FIELD_COUNT = 6;

    static constexpr size_t ID_COLUMN = 0;
    static constexpr size_t NAME_COLUMN = 2;
    static constexpr size_t LAT_COLUMN = 4;
    static constexpr size_t LON_COLUMN = 5;

    /**
     * Parse one non-blank line into a validated stop record
     * @param line Raw text line
     * @param delimiter Field delimiter
     * @return Stop record with trimmed fields and parsed coordinates
     * @throws graph::RecordError MALFORMED_RECORD, MISSING_REQUIRED_FIELD or INVALID_COORDINATE
     */
    static graph::StopRecord parse(const std::string& line, char delimiter = ',');

    /**
     * Split a line on a delimiter, keeping empty fields (including trailing ones)
     * @param line Text line
     * @param delimiter Field delimiter
     * @return Fields
     */
    static std::vector<std::string> split(const std::string& line, char delimiter);

    /**
     * Remove leading and trailing whitespace
     * @param value Text
     * @return Trimmed text
     */
    static std::string trim(const std::string& value);

    /**
     * Check whether a line holds only whitespace
     * @param line Text line
     * @return true if blank
     */
    static bool isBlank(const std::string& line);

private:
    // Disable instantiation
    RecordParser() = delete;
};

} // namespace io
} // namespace stopgraph

#endif // STOPGRAPH_RECORD_PARSER_HPP
