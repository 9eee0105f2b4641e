#ifndef EVINDEX_GEOJSON_WRITER_HPP
#define EVINDEX_GEOJSON_WRITER_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "geometry/common.hpp"

namespace evindex {
namespace io {

/**
 * GeoJSON writer for converting GeospatialDataset objects to GeoJSON files
 */
class GeoJSONWriter {
public:
    /**
     * Write a GeospatialDataset to a GeoJSON file, creating missing parent directories
     * @param dataset Dataset to write
     * @param filepath Path to the output GeoJSON file
     * @return true if successful, false otherwise
     */
    static bool writeToFile(const geometry::GeospatialDataset& dataset, const std::string& filepath);

    /**
     * Convert a GeospatialDataset to a GeoJSON string
     * @param dataset Dataset to convert
     * @return GeoJSON string representation
     */
    static std::string writeToString(const geometry::GeospatialDataset& dataset);

    /**
     * Set CRS information in a GeoJSON object
     * @param geojson JSON object to modify
     * @param crs CRS string (e.g., "EPSG:4326")
     */
    static void setCRS(nlohmann::json& geojson, const std::string& crs);

    static std::string getLastError() {
        return last_error_;
    }

private:
    static std::string last_error_;

    static nlohmann::json featureToGeoJSON(const geometry::GeospatialFeature& feature);

    static void setError(const std::string& error) {
        last_error_ = error;
    }

    // Disable instantiation
    GeoJSONWriter() = delete;
};

} // namespace io
} // namespace evindex

#endif // EVINDEX_GEOJSON_WRITER_HPP
