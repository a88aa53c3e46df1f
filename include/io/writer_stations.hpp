#ifndef STOPGRAPH_WRITER_STATIONS_HPP
#define STOPGRAPH_WRITER_STATIONS_HPP

#include <string>
#include <vector>
#include <gdal.h>
#include <ogr_api.h>
#include "graph/common.hpp"

namespace stopgraph {
namespace io {

/**
 * Configuration for the station point-layer writer
 */
struct StationPointWriterConfig {
    std::string output_file_path;          // Output file path with extension (format picked from it)
    std::string layer_name = "stations";   // Layer name inside the dataset

    StationPointWriterConfig() = default;
};

/**
 * Writes spatial entities as an EPSG:4326 point layer through GDAL/OGR
 */
class StationPointWriter {
public:
    StationPointWriter();
    ~StationPointWriter() = default;

    // Disable copy constructor and assignment
    StationPointWriter(const StationPointWriter&) = delete;
    StationPointWriter& operator=(const StationPointWriter&) = delete;

    /**
     * Write stations to the configured output file
     * @param config Writer configuration
     * @param stations Stations to write
     * @return true if successful, false otherwise
     */
    bool writeStations(const StationPointWriterConfig& config, const std::vector<graph::SpatialEntity>& stations);

    /**
     * Get the path actually written (after a possible format fallback)
     * @return Output file path
     */
    std::string getOutputFilePath() const { return output_file_path_; }

    /**
     * Get the last error message
     * @return Error message string
     */
    std::string getLastError() const { return last_error_; }

    /**
     * Clear the last error message
     */
    void clearError() { last_error_.clear(); }

private:
    std::string last_error_;
    std::string output_file_path_;

    /**
     * Create the dataset and its point layer with station fields
     * @param config Writer configuration
     * @param output_file_path Output path, updated on format fallback
     * @return Dataset handle, or nullptr on failure
     */
    GDALDatasetH createPointDataset(const StationPointWriterConfig& config, std::string& output_file_path);

    /**
     * Write one station feature
     * @return true if successful, false otherwise
     */
    bool writeFeature(OGRLayerH layer, const graph::SpatialEntity& station);
};

} // namespace io
} // namespace stopgraph

#endif // STOPGRAPH_WRITER_STATIONS_HPP
