#include "graph/bbox_filter.hpp"
#include "graph/spatial_view.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_set>

namespace stopgraph {
namespace graph {

GeographicBounds::GeographicBounds(double min_lat, double max_lat, double min_lon, double max_lon)
    : box_(GeoPoint(min_lon, min_lat), GeoPoint(max_lon, max_lat)) {
}

bool GeographicBounds::contains(double lat, double lon) const {
    // covered_by includes the boundary of the box
    return bg::covered_by(GeoPoint(lon, lat), box_);
}

std::string GeographicBounds::toString() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4)
        << "Bounds[lat: " << getMinLat() << " to " << getMaxLat()
        << ", lon: " << getMinLon() << " to " << getMaxLon() << "]";
    return oss.str();
}

const std::vector<AreaPreset>& areaPresets() {
    static const std::vector<AreaPreset> presets = {
        AreaPreset("madrid", "Madrid", "madrid", GeographicBounds(40.0, 41.0, -4.0, -3.0)),
        AreaPreset("centro_espana", "Centro de España", "centro_espana", GeographicBounds(39.0, 41.0, -5.0, -3.0)),
        AreaPreset("extremadura", "Extremadura", "extremadura", GeographicBounds(38.0, 40.0, -7.0, -5.0)),
        AreaPreset("cataluna", "Cataluña", "cataluna", GeographicBounds(40.0, 42.0, 0.0, 3.0))
    };
    return presets;
}

std::optional<AreaPreset> findAreaPreset(const std::string& key) {
    std::string lowered = key;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& preset : areaPresets()) {
        if (preset.key == lowered) {
            return preset;
        }
    }
    return std::nullopt;
}

GeographicBounds defaultBounds() {
    return areaPresets().front().bounds;
}

FilterResult BoundingBoxFilter::filterInBounds(const GraphStore& store, const GeographicBounds& bounds) {
    std::cout << "Filtering stations in area: " << bounds.toString() << std::endl;

    SpatialListing listing = SpatialIndexView::listSpatialEntities(store);

    FilterResult result;
    result.total_examined = listing.total_examined;

    for (auto& entity : listing.entities) {
        if (bounds.contains(entity.latitude, entity.longitude)) {
            result.entities.push_back(std::move(entity));
        }
    }
    result.total_retained = result.entities.size();

    std::cout << "Found " << result.total_retained << " stations inside the area out of "
              << result.total_examined << " total" << std::endl;

    return result;
}

GraphStore BoundingBoxFilter::buildFilteredGraph(const GraphStore& store, const GeographicBounds& bounds) {
    FilterResult result = filterInBounds(store, bounds);
    GraphStore filtered = copySubjects(store, result.entities);

    std::cout << "Filtered graph created with " << filtered.size() << " triples" << std::endl;
    return filtered;
}

GraphStore BoundingBoxFilter::copySubjects(const GraphStore& store, const std::vector<SpatialEntity>& entities) {
    GraphStore filtered;
    filtered.setPrefixes(store.prefixes());

    // A subject listed twice is copied once
    std::unordered_set<std::string> copied;
    for (const auto& entity : entities) {
        if (!copied.insert(entity.subject).second) {
            continue;
        }
        for (const auto& triple : store.factsFor(entity.subject)) {
            filtered.append(triple);
        }
    }

    return filtered;
}

} // namespace graph
} // namespace stopgraph
