#ifndef STOPGRAPH_AREA_SELECTION_HPP
#define STOPGRAPH_AREA_SELECTION_HPP

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include "graph/bbox_filter.hpp"

namespace stopgraph {
namespace tool {

/**
 * Area chosen by the user: a rectangle with a name for output files,
 * or the request to run every preset
 */
struct AreaSelection {
    std::string area_name;                           // Used in output file names
    std::optional<graph::GeographicBounds> bounds;   // Empty when show_all is set
    bool show_all = false;
    bool is_custom = false;                          // Bounds typed by the user
    bool used_fallback = false;                      // Invalid input replaced by the default area
};

/**
 * Select an area by preset key, "all" or "custom"
 * @param key Area key ("madrid", "centro_espana", "extremadura", "cataluna", "all")
 * @return Selection; unknown keys fall back to the default area
 */
AreaSelection selectAreaByName(const std::string& key);

/**
 * Build a custom area from four bound texts
 * @return Custom selection, or the default area if any bound is not numeric
 */
AreaSelection customArea(const std::string& min_lat, const std::string& max_lat,
                         const std::string& min_lon, const std::string& max_lon);

/**
 * Interactive area menu (options 1-5), reading answers line by line
 * @param in Input stream
 * @param out Output stream for prompts
 * @return Selection; invalid answers fall back to the default area
 */
AreaSelection promptArea(std::istream& in, std::ostream& out);

/**
 * Ask a yes/no question; answers starting with 's' or 'y' mean yes
 * @param in Input stream
 * @param out Output stream for the prompt
 * @param question Prompt text
 * @return true for yes
 */
bool promptYesNo(std::istream& in, std::ostream& out, const std::string& question);

} // namespace tool
} // namespace stopgraph

#endif // STOPGRAPH_AREA_SELECTION_HPP
