#ifndef STOPGRAPH_GDAL_UTILS_HPP
#define STOPGRAPH_GDAL_UTILS_HPP

#include <string>

namespace stopgraph {
namespace io {

/**
 * GDAL utility functions for output format detection
 */
class GDALUtils {
public:
    /**
     * Register all GDAL drivers once per process
     */
    static void registerDrivers();

    /**
     * Check if a specific GDAL driver is available and supports creation
     * @param driver_name GDAL driver name
     * @return true if driver is available and supports creation, false otherwise
     */
    static bool isDriverAvailable(const std::string& driver_name);

    /**
     * Map a file extension to a GDAL vector driver name
     * @param extension Lowercase extension including the dot (e.g. ".gpkg")
     * @return Driver name, or empty string if the extension is unknown
     */
    static std::string formatForExtension(const std::string& extension);

    /**
     * Determine GDAL output format and modify file path if the format is unknown or unavailable
     * @param file_path File path with extension (switched to .geojson on fallback)
     * @return GDAL format string
     */
    static std::string determineFormatAndModifyPath(std::string& file_path);

private:
    // Disable instantiation
    GDALUtils() = delete;
};

} // namespace io
} // namespace stopgraph

#endif // STOPGRAPH_GDAL_UTILS_HPP
