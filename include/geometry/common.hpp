#ifndef EVINDEX_COMMON_HPP
#define EVINDEX_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/polygon.hpp>

namespace evindex {
namespace geometry {

// Boost Geometry namespace aliases
namespace bg = boost::geometry;

// Planar (projected, meters) geometry types
using Point = bg::model::point<double, 2, bg::cs::cartesian>;
using Box = bg::model::box<Point>;
using MultiPoint = bg::model::multi_point<Point>;

// Counter-clockwise, closed polygon for convex hulls
using Polygon = bg::model::polygon<Point, false, true>;
using LinearRing = bg::model::ring<Point, false, true>;

// EPSG code of the geographic input coordinate system
constexpr int WGS84_EPSG = 4326;

// EPSG code of the default planar projection (Web Mercator)
constexpr int WEB_MERCATOR_EPSG = 3857;

// Geographic coordinate in degrees (EPSG:4326)
struct GeoPoint {
    double latitude;
    double longitude;

    GeoPoint() : latitude(0.0), longitude(0.0) {}
    GeoPoint(double lat, double lon) : latitude(lat), longitude(lon) {}

    bool operator==(const GeoPoint& other) const {
        return latitude == other.latitude && longitude == other.longitude;
    }
    bool operator!=(const GeoPoint& other) const { return !(*this == other); }
};

// Geographic bounding box in degrees
struct GeoBox {
    GeoPoint min_corner;
    GeoPoint max_corner;

    GeoBox(const GeoPoint& min_pt, const GeoPoint& max_pt)
        : min_corner(min_pt), max_corner(max_pt) {}
};

// Raw GeoJSON feature (geometry and properties kept as JSON)
struct GeospatialFeature {
    size_t id;
    nlohmann::json geometry;
    nlohmann::json properties;

    GeospatialFeature(size_t feature_id, const nlohmann::json& geom, const nlohmann::json& props)
        : id(feature_id), geometry(geom), properties(props) {}
};

// Collection of features with the CRS declared by the source
struct GeospatialDataset {
    std::string crs;
    std::vector<GeospatialFeature> features;

    GeospatialDataset() = default;
    GeospatialDataset(const std::string& crs_name, const std::vector<GeospatialFeature>& feats)
        : crs(crs_name), features(feats) {}
};

// Geometry Conversion Utilities for GeoJSON
nlohmann::json pointToGeoJSON(double x, double y);
nlohmann::json polygonToGeoJSON(const Polygon& polygon);
nlohmann::json geoRingToGeoJSON(const std::vector<GeoPoint>& ring);

/**
 * Read a GeoJSON Point geometry as a geographic coordinate
 * GeoJSON stores [longitude, latitude]; MultiPoint uses its first point
 * @param geometry GeoJSON geometry object
 * @return Geographic point, or nullopt for empty or unsupported geometries
 */
std::optional<GeoPoint> geoJSONPointToGeo(const nlohmann::json& geometry);

// GeoJSON Field Value Utilities
std::optional<int64_t> getFieldValueAsInt64(const nlohmann::json& properties,
                                            const std::string& field_name);
std::optional<double> getFieldValueAsDouble(const nlohmann::json& properties,
                                            const std::string& field_name);
std::optional<std::string> getFieldValueAsString(const nlohmann::json& properties,
                                                 const std::string& field_name);
std::optional<bool> getFieldValueAsBool(const nlohmann::json& properties,
                                        const std::string& field_name);

} // namespace geometry
} // namespace evindex

#endif // EVINDEX_COMMON_HPP
