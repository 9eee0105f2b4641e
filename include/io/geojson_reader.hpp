#ifndef EVINDEX_GEOJSON_READER_HPP
#define EVINDEX_GEOJSON_READER_HPP

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "geometry/common.hpp"

namespace evindex {
namespace io {

/**
 * GeoJSON reader for parsing station FeatureCollections into GeospatialDataset objects
 */
class GeoJSONReader {
public:
    /**
     * Read a GeoJSON file and parse it into a GeospatialDataset
     * @param filepath Path to the GeoJSON file
     * @return GeospatialDataset containing all features and CRS information
     * @throws EvIndexError(IO_FAILURE) if file cannot be read or parsed
     */
    static geometry::GeospatialDataset readFromFile(const std::string& filepath);

    /**
     * Parse a GeoJSON string and convert it into a GeospatialDataset
     * @param geojson_string JSON string containing GeoJSON data
     * @return GeospatialDataset containing all features and CRS information
     * @throws EvIndexError(IO_FAILURE) if string cannot be parsed or is not in geographic coordinates
     */
    static geometry::GeospatialDataset readFromString(const std::string& geojson_string);

    /**
     * Parse CRS information from a GeoJSON object
     * @param geojson JSON object containing GeoJSON data
     * @return CRS string (e.g., "EPSG:4326") or empty string if not found
     */
    static std::string parseCRS(const nlohmann::json& geojson);

    /**
     * Check whether a CRS string names WGS84 geographic coordinates
     * An empty CRS is the GeoJSON default and counts as WGS84.
     */
    static bool isGeographicCRS(const std::string& crs);

    /**
     * Get the last error message
     * @return Error message from the last operation
     */
    static std::string getLastError() {
        return last_error_;
    }

private:
    static std::string last_error_;

    /**
     * Parse a single feature from GeoJSON format
     * @param feature_json JSON object representing a GeoJSON feature
     * @param id Feature index starting from 0
     * @return Optional GeospatialFeature object (nullopt if geometry is missing or null)
     */
    static std::optional<geometry::GeospatialFeature> parseFeature(const nlohmann::json& feature_json, size_t id);

    static void setError(const std::string& error) {
        last_error_ = error;
    }

    // Disable instantiation
    GeoJSONReader() = delete;
};

} // namespace io
} // namespace evindex

#endif // EVINDEX_GEOJSON_READER_HPP
