#ifndef STOPGRAPH_BBOX_FILTER_HPP
#define STOPGRAPH_BBOX_FILTER_HPP

#include <optional>
#include <string>
#include <vector>
#include "graph/common.hpp"
#include "graph/graph_store.hpp"

namespace stopgraph {
namespace graph {

/**
 * Immutable latitude/longitude rectangle with inclusive edges
 */
class GeographicBounds {
public:
    GeographicBounds(double min_lat, double max_lat, double min_lon, double max_lon);

    /**
     * Check membership: min_lat <= lat <= max_lat and min_lon <= lon <= max_lon
     * @param lat Latitude
     * @param lon Longitude
     * @return true if the point lies inside or on the boundary
     */
    bool contains(double lat, double lon) const;

    /**
     * Format as "Bounds[lat: a to b, lon: c to d]" with 4 decimals
     */
    std::string toString() const;

    double getMinLat() const { return bg::get<bg::min_corner, 1>(box_); }
    double getMaxLat() const { return bg::get<bg::max_corner, 1>(box_); }
    double getMinLon() const { return bg::get<bg::min_corner, 0>(box_); }
    double getMaxLon() const { return bg::get<bg::max_corner, 0>(box_); }

    const GeoBox& box() const { return box_; }

private:
    GeoBox box_;
};

// Named rectangle used by the area menu
struct AreaPreset {
    std::string key;           // Command-line name (e.g. "madrid")
    std::string display_name;  // Printed name (e.g. "Madrid")
    std::string file_suffix;   // Used in output file names
    GeographicBounds bounds;

    AreaPreset(const std::string& preset_key, const std::string& name, const std::string& suffix,
               const GeographicBounds& area_bounds)
        : key(preset_key), display_name(name), file_suffix(suffix), bounds(area_bounds) {}
};

/**
 * Get the predefined areas (Madrid, central Spain, Extremadura, Catalonia)
 * @return Presets in menu order
 */
const std::vector<AreaPreset>& areaPresets();

/**
 * Find a preset by key (case-insensitive)
 * @param key Preset key
 * @return Preset if found
 */
std::optional<AreaPreset> findAreaPreset(const std::string& key);

/**
 * Get the rectangle used when no valid rectangle was supplied (Madrid)
 * @return Default bounds
 */
GeographicBounds defaultBounds();

// Result of filtering the spatial entities of a store
struct FilterResult {
    std::vector<SpatialEntity> entities;  // Retained, in enumeration order
    size_t total_examined = 0;
    size_t total_retained = 0;
};

/**
 * Bounding-box filter over the spatial entities of a graph store
 */
class BoundingBoxFilter {
public:
    /**
     * Retain the spatial entities whose coordinates lie inside bounds
     * @param store Graph store
     * @param bounds Rectangle
     * @return Retained entities and counters
     */
    static FilterResult filterInBounds(const GraphStore& store, const GeographicBounds& bounds);

    /**
     * Build a new store holding every fact of every retained subject.
     * Prefix metadata is copied from the source store.
     * @param store Source graph store
     * @param bounds Rectangle
     * @return Filtered graph store
     */
    static GraphStore buildFilteredGraph(const GraphStore& store, const GeographicBounds& bounds);

    /**
     * Copy the complete fact set of the given entities into a new store
     * @param store Source graph store
     * @param entities Entities whose subjects are copied, in order
     * @return New graph store
     */
    static GraphStore copySubjects(const GraphStore& store, const std::vector<SpatialEntity>& entities);

private:
    // Disable instantiation
    BoundingBoxFilter() = delete;
};

} // namespace graph
} // namespace stopgraph

#endif // STOPGRAPH_BBOX_FILTER_HPP
