#include "geometry/common.hpp"
#include <iostream>
#include <cmath>

namespace evindex {
namespace geometry {

// Geometry Conversion Utilities for GeoJSON
nlohmann::json pointToGeoJSON(double x, double y) {
    nlohmann::json geometry;
    geometry["type"] = "Point";
    geometry["coordinates"] = {x, y};
    return geometry;
}

nlohmann::json polygonToGeoJSON(const Polygon& polygon) {
    nlohmann::json geometry;
    geometry["type"] = "Polygon";
    nlohmann::json coordinates = nlohmann::json::array();

    // Outer ring
    nlohmann::json outerRing = nlohmann::json::array();
    for (const auto& point : polygon.outer()) {
        outerRing.push_back({bg::get<0>(point), bg::get<1>(point)});
    }
    coordinates.push_back(outerRing);

    geometry["coordinates"] = coordinates;
    return geometry;
}

nlohmann::json geoRingToGeoJSON(const std::vector<GeoPoint>& ring) {
    nlohmann::json geometry;
    geometry["type"] = "Polygon";
    nlohmann::json outerRing = nlohmann::json::array();
    for (const auto& point : ring) {
        outerRing.push_back({point.longitude, point.latitude});
    }
    geometry["coordinates"] = nlohmann::json::array({outerRing});
    return geometry;
}

// GeoJSON to geographic point
std::optional<GeoPoint> geoJSONPointToGeo(const nlohmann::json& geometry) {
    if (!geometry.is_object() || !geometry.contains("type") || !geometry.contains("coordinates")) {
        return std::nullopt;
    }

    const auto& coords = geometry["coordinates"];
    if (geometry["type"] == "Point") {
        if (coords.size() >= 2 && coords[0].is_number() && coords[1].is_number()) {
            return GeoPoint(coords[1].get<double>(), coords[0].get<double>());
        }
        return std::nullopt;
    } else if (geometry["type"] == "MultiPoint") {
        if (coords.size() > 1) {
            std::cerr << "Warning: MultiPoint geometry contains " << coords.size()
                      << " points, using only the first point" << std::endl;
        }
        if (!coords.empty() && coords[0].size() >= 2 &&
            coords[0][0].is_number() && coords[0][1].is_number()) {
            return GeoPoint(coords[0][1].get<double>(), coords[0][0].get<double>());
        }
        return std::nullopt;
    }

    std::cerr << "Warning: Unsupported geometry type for station location: "
              << geometry["type"].dump() << std::endl;
    return std::nullopt;
}

// GeoJSON Field Value Utilities
std::optional<int64_t> getFieldValueAsInt64(const nlohmann::json& properties,
                                            const std::string& field_name) {
    if (field_name.empty() || !properties.contains(field_name)) {
        return std::nullopt;
    }

    const auto& value = properties[field_name];

    if (value.is_number_integer()) {
        return value.get<int64_t>();
    } else if (value.is_number_float()) {
        double d = value.get<double>();
        if (std::isfinite(d) && d == std::floor(d)) {
            return static_cast<int64_t>(d);
        }
        return std::nullopt;
    } else if (value.is_string()) {
        try {
            size_t consumed = 0;
            const std::string text = value.get<std::string>();
            int64_t parsed = std::stoll(text, &consumed);
            if (consumed == text.size()) {
                return parsed;
            }
        } catch (const std::exception&) {
            // Not an integer
        }
    }

    return std::nullopt;
}

std::optional<double> getFieldValueAsDouble(const nlohmann::json& properties,
                                            const std::string& field_name) {
    if (field_name.empty() || !properties.contains(field_name)) {
        return std::nullopt;
    }

    const auto& value = properties[field_name];

    if (value.is_number()) {
        return value.get<double>();
    } else if (value.is_string()) {
        try {
            return std::stod(value.get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    return std::nullopt;
}

std::optional<std::string> getFieldValueAsString(const nlohmann::json& properties,
                                                 const std::string& field_name) {
    if (field_name.empty() || !properties.contains(field_name)) {
        return std::nullopt;
    }

    const auto& value = properties[field_name];

    if (value.is_string()) {
        std::string text = value.get<std::string>();
        if (text.empty()) {
            return std::nullopt;
        }
        return text;
    } else if (value.is_number_integer()) {
        return std::to_string(value.get<int64_t>());
    } else if (value.is_number()) {
        return std::to_string(value.get<double>());
    } else if (value.is_boolean()) {
        return value.get<bool>() ? std::string("true") : std::string("false");
    }

    return std::nullopt;
}

std::optional<bool> getFieldValueAsBool(const nlohmann::json& properties,
                                        const std::string& field_name) {
    if (field_name.empty() || !properties.contains(field_name)) {
        return std::nullopt;
    }

    const auto& value = properties[field_name];

    if (value.is_boolean()) {
        return value.get<bool>();
    } else if (value.is_number_integer()) {
        return value.get<int64_t>() != 0;
    } else if (value.is_string()) {
        const std::string str_val = value.get<std::string>();
        if (str_val == "true" || str_val == "True" || str_val == "1" || str_val == "yes") {
            return true;
        }
        if (str_val == "false" || str_val == "False" || str_val == "0" || str_val == "no") {
            return false;
        }
    }

    return std::nullopt;
}

} // namespace geometry
} // namespace evindex
