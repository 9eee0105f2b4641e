#include "io/geojson_reader.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <sstream>
#include <optional>

namespace evindex {
namespace io {

std::string GeoJSONReader::last_error_ = "";

geometry::GeospatialDataset GeoJSONReader::readFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        setError("Failed to open file: " + filepath);
        throw EvIndexError(ErrorKind::IO_FAILURE, last_error_);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    try {
        return readFromString(buffer.str());
    } catch (const std::exception& e) {
        setError("Error reading file " + filepath + ": " + e.what());
        throw EvIndexError(ErrorKind::IO_FAILURE, last_error_);
    }
}

geometry::GeospatialDataset GeoJSONReader::readFromString(const std::string& geojson_string) {
    nlohmann::json geojson;
    try {
        geojson = nlohmann::json::parse(geojson_string);
    } catch (const nlohmann::json::parse_error& e) {
        setError("JSON parse error: " + std::string(e.what()));
        throw EvIndexError(ErrorKind::IO_FAILURE, last_error_);
    }

    // Validate that this is a FeatureCollection
    if (!geojson.is_object() || !geojson.contains("type") || geojson["type"] != "FeatureCollection") {
        setError("Invalid GeoJSON: Expected FeatureCollection type");
        throw EvIndexError(ErrorKind::IO_FAILURE, last_error_);
    }

    std::string crs = parseCRS(geojson);

    // Station coordinates must be latitude/longitude degrees
    if (!isGeographicCRS(crs)) {
        setError("Coordinate system " + crs + " is not supported; station locations must be WGS84 (EPSG:4326)");
        throw EvIndexError(ErrorKind::IO_FAILURE, last_error_);
    }

    std::vector<geometry::GeospatialFeature> features;
    if (geojson.contains("features") && geojson["features"].is_array()) {
        size_t feature_index = 0;
        for (const auto& feature_json : geojson["features"]) {
            auto feature = parseFeature(feature_json, feature_index);
            if (feature.has_value()) {
                features.push_back(feature.value());
            }
            feature_index++;
        }
    }

    if (features.empty()) {
        setError("No valid features found in GeoJSON");
        throw EvIndexError(ErrorKind::IO_FAILURE, last_error_);
    }

    return geometry::GeospatialDataset(crs.empty() ? "EPSG:4326" : crs, features);
}

std::string GeoJSONReader::parseCRS(const nlohmann::json& geojson) {
    if (!geojson.contains("crs") || !geojson["crs"].is_object()) {
        return "";
    }
    const auto& crs_obj = geojson["crs"];
    if (!crs_obj.contains("properties") || !crs_obj["properties"].is_object()) {
        return "";
    }
    const auto& properties = crs_obj["properties"];

    // Standard format: {"type": "name", "properties": {"name": "EPSG:4326"}}
    if (crs_obj.value("type", "") == "name" && properties.contains("name") && properties["name"].is_string()) {
        return properties["name"].get<std::string>();
    }

    // Legacy format: {"type": "EPSG", "properties": {"code": 4326}}
    if (crs_obj.value("type", "") == "EPSG" && properties.contains("code") &&
        properties["code"].is_number_integer()) {
        return "EPSG:" + std::to_string(properties["code"].get<int>());
    }

    return "";
}

bool GeoJSONReader::isGeographicCRS(const std::string& crs) {
    if (crs.empty()) {
        return true;
    }
    return crs == "EPSG:4326" ||
           crs.find("EPSG::4326") != std::string::npos ||
           crs.find("CRS84") != std::string::npos;
}

std::optional<geometry::GeospatialFeature> GeoJSONReader::parseFeature(const nlohmann::json& feature_json,
                                                                       size_t id) {
    if (!feature_json.is_object() || !feature_json.contains("type") || feature_json["type"] != "Feature") {
        setError("Invalid feature " + std::to_string(id) + ": Expected Feature type");
        throw EvIndexError(ErrorKind::IO_FAILURE, last_error_);
    }

    if (!feature_json.contains("geometry") || feature_json["geometry"].is_null()) {
        return std::nullopt;
    }

    nlohmann::json properties = feature_json.value("properties", nlohmann::json::object());
    if (properties.is_null()) {
        properties = nlohmann::json::object();
    }

    return geometry::GeospatialFeature(id, feature_json["geometry"], properties);
}

} // namespace io
} // namespace evindex
