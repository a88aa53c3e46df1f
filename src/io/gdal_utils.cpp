#include "io/gdal_utils.hpp"
#include <gdal.h>
#include <gdal_priv.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <unordered_map>

namespace stopgraph {
namespace io {

void GDALUtils::registerDrivers() {
    static std::once_flag registered;
    std::call_once(registered, []() { GDALAllRegister(); });
}

bool GDALUtils::isDriverAvailable(const std::string& driver_name) {
    registerDrivers();

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driver_name.c_str());
    if (!driver) {
        std::cout << "WARNING: GDAL driver '" << driver_name << "' is not available. Falling back to GeoJSON format." << std::endl;
        return false;
    }

    // Check if the driver supports creation
    const char* creation_support = driver->GetMetadataItem(GDAL_DCAP_CREATE);
    if (!creation_support || strcmp(creation_support, "YES") != 0) {
        std::cout << "WARNING: GDAL driver '" << driver_name << "' does not support creation. Falling back to GeoJSON format." << std::endl;
        return false;
    }

    return true;
}

std::string GDALUtils::formatForExtension(const std::string& extension) {
    static const std::unordered_map<std::string, std::string> formats = {
        {".geojson", "GeoJSON"},
        {".json", "GeoJSON"},
        {".geojsonseq", "GeoJSONSeq"},
        {".shp", "ESRI Shapefile"},
        {".gpkg", "GPKG"},
        {".csv", "CSV"},
        {".kml", "KML"},
        {".gml", "GML"},
        {".fgb", "FlatGeobuf"},
        {".flatgeobuf", "FlatGeobuf"}
    };

    auto it = formats.find(extension);
    return it != formats.end() ? it->second : "";
}

std::string GDALUtils::determineFormatAndModifyPath(std::string& file_path) {
    std::filesystem::path path(file_path);
    std::string extension = path.extension().string();

    // Convert to lowercase for case-insensitive comparison
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::string format = formatForExtension(extension);
    bool needs_modification = format.empty();

    if (!needs_modification && format != "GeoJSON" && !isDriverAvailable(format)) {
        needs_modification = true;
    }

    if (needs_modification) {
        format = "GeoJSON";
        std::string new_path = path.replace_extension(".geojson").string();
        std::cout << "WARNING: Changing output file extension from '" << extension
                  << "' to '.geojson' due to format fallback." << std::endl;
        std::cout << "New output file: " << new_path << std::endl;
        file_path = new_path;
    }

    return format;
}

} // namespace io
} // namespace stopgraph
