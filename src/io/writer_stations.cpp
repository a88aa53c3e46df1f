#include "io/writer_stations.hpp"
#include "io/gdal_utils.hpp"
#include "graph/vocabulary.hpp"
#include <ogr_spatialref.h>
#include <iostream>

namespace stopgraph {
namespace io {

StationPointWriter::StationPointWriter() {
    GDALUtils::registerDrivers();
}

GDALDatasetH StationPointWriter::createPointDataset(const StationPointWriterConfig& config, std::string& output_file_path) {
    // Determine format from file extension and modify path if needed
    output_file_path = config.output_file_path;
    std::string format = GDALUtils::determineFormatAndModifyPath(output_file_path);

    GDALDriverH driver = GDALGetDriverByName(format.c_str());
    if (!driver) {
        last_error_ = "Failed to get GDAL driver for format: " + format;
        return nullptr;
    }

    GDALDatasetH dataset = GDALCreate(driver, output_file_path.c_str(), 0, 0, 0, GDT_Unknown, nullptr);
    if (!dataset) {
        last_error_ = "Failed to create GDAL dataset: " + output_file_path;
        return nullptr;
    }

    // Stations are stored as lon/lat in WGS84
    OGRSpatialReferenceH layer_srs = OSRNewSpatialReference(nullptr);
    OSRImportFromEPSG(layer_srs, 4326);
    OSRSetAxisMappingStrategy(layer_srs, OAMS_TRADITIONAL_GIS_ORDER);

    OGRLayerH layer = GDALDatasetCreateLayer(dataset, config.layer_name.c_str(), layer_srs, wkbPoint, nullptr);
    OSRDestroySpatialReference(layer_srs);

    if (!layer) {
        last_error_ = "Failed to create layer: " + config.layer_name;
        GDALClose(dataset);
        return nullptr;
    }

    OGRFieldDefnH stop_id_field = OGR_Fld_Create("stop_id", OFTString);
    OGR_L_CreateField(layer, stop_id_field, 1);
    OGR_Fld_Destroy(stop_id_field);

    OGRFieldDefnH name_field = OGR_Fld_Create("name", OFTString);
    OGR_L_CreateField(layer, name_field, 1);
    OGR_Fld_Destroy(name_field);

    OGRFieldDefnH iri_field = OGR_Fld_Create("iri", OFTString);
    OGR_L_CreateField(layer, iri_field, 1);
    OGR_Fld_Destroy(iri_field);

    OGRFieldDefnH lat_field = OGR_Fld_Create("lat", OFTReal);
    OGR_L_CreateField(layer, lat_field, 1);
    OGR_Fld_Destroy(lat_field);

    OGRFieldDefnH lon_field = OGR_Fld_Create("lon", OFTReal);
    OGR_L_CreateField(layer, lon_field, 1);
    OGR_Fld_Destroy(lon_field);

    return dataset;
}

bool StationPointWriter::writeFeature(OGRLayerH layer, const graph::SpatialEntity& station) {
    OGRFeatureDefnH layer_defn = OGR_L_GetLayerDefn(layer);
    OGRFeatureH feature = OGR_F_Create(layer_defn);
    if (!feature) {
        last_error_ = "Failed to create feature";
        return false;
    }

    OGRGeometryH point = OGR_G_CreateGeometry(wkbPoint);
    OGR_G_SetPoint_2D(point, 0, station.longitude, station.latitude);
    OGR_F_SetGeometryDirectly(feature, point);

    // Stop identifier is the subject IRI without the entity namespace
    std::string stop_id = station.subject;
    if (stop_id.compare(0, graph::vocab::EX_NS.size(), graph::vocab::EX_NS) == 0) {
        stop_id = stop_id.substr(graph::vocab::EX_NS.size());
    }

    OGR_F_SetFieldString(feature, OGR_F_GetFieldIndex(feature, "stop_id"), stop_id.c_str());
    OGR_F_SetFieldString(feature, OGR_F_GetFieldIndex(feature, "name"), station.name.c_str());
    OGR_F_SetFieldString(feature, OGR_F_GetFieldIndex(feature, "iri"), station.subject.c_str());
    OGR_F_SetFieldDouble(feature, OGR_F_GetFieldIndex(feature, "lat"), station.latitude);
    OGR_F_SetFieldDouble(feature, OGR_F_GetFieldIndex(feature, "lon"), station.longitude);

    if (OGR_L_CreateFeature(layer, feature) != OGRERR_NONE) {
        last_error_ = "Failed to create feature in layer";
        OGR_F_Destroy(feature);
        return false;
    }

    OGR_F_Destroy(feature);
    return true;
}

bool StationPointWriter::writeStations(const StationPointWriterConfig& config,
                                       const std::vector<graph::SpatialEntity>& stations) {
    clearError();

    if (config.output_file_path.empty()) {
        last_error_ = "No output file path specified";
        return false;
    }

    GDALDatasetH dataset = createPointDataset(config, output_file_path_);
    if (!dataset) {
        // createPointDataset already sets last_error_ if it fails
        return false;
    }

    OGRLayerH layer = GDALDatasetGetLayer(dataset, 0);
    if (!layer) {
        last_error_ = "Failed to get layer from dataset";
        GDALClose(dataset);
        return false;
    }

    for (const auto& station : stations) {
        if (!writeFeature(layer, station)) {
            GDALClose(dataset);
            return false;
        }
    }

    GDALClose(dataset);

    std::cout << "Successfully wrote " << stations.size() << " stations to: " << output_file_path_ << std::endl;
    return true;
}

} // namespace io
} // namespace stopgraph
