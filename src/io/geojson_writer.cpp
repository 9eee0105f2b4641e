#include "io/geojson_writer.hpp"
#include <fstream>
#include <boost/filesystem.hpp>
namespace fs = boost::filesystem;

namespace evindex {
namespace io {

std::string GeoJSONWriter::last_error_ = "";

bool GeoJSONWriter::writeToFile(const geometry::GeospatialDataset& dataset, const std::string& filepath) {
    std::string geojson_string = writeToString(dataset);

    try {
        fs::path parent = fs::path(filepath).parent_path();
        if (!parent.empty() && !fs::exists(parent)) {
            fs::create_directories(parent);
        }
    } catch (const fs::filesystem_error& e) {
        setError("Failed to create output directory for " + filepath + ": " + e.what());
        return false;
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        setError("Failed to open file for writing: " + filepath);
        return false;
    }

    file << geojson_string;
    file.close();
    if (file.fail()) {
        setError("Error writing file " + filepath);
        return false;
    }

    return true;
}

std::string GeoJSONWriter::writeToString(const geometry::GeospatialDataset& dataset) {
    nlohmann::json geojson;
    geojson["type"] = "FeatureCollection";

    if (!dataset.crs.empty()) {
        setCRS(geojson, dataset.crs);
    }

    nlohmann::json features = nlohmann::json::array();
    for (const auto& feature : dataset.features) {
        features.push_back(featureToGeoJSON(feature));
    }
    geojson["features"] = features;

    return geojson.dump(2);
}

void GeoJSONWriter::setCRS(nlohmann::json& geojson, const std::string& crs) {
    if (crs.empty()) {
        return;
    }

    // Standard GeoJSON CRS format: {"type": "name", "properties": {"name": "EPSG:4326"}}
    nlohmann::json crs_obj;
    crs_obj["type"] = "name";
    crs_obj["properties"]["name"] = crs;

    geojson["crs"] = crs_obj;
}

nlohmann::json GeoJSONWriter::featureToGeoJSON(const geometry::GeospatialFeature& feature) {
    nlohmann::json feature_json;
    feature_json["type"] = "Feature";
    feature_json["geometry"] = feature.geometry;

    nlohmann::json properties = feature.properties;
    if (!properties.contains("id")) {
        properties["id"] = feature.id;
    }
    feature_json["properties"] = properties;

    return feature_json;
}

} // namespace io
} // namespace evindex
