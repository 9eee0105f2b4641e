#ifndef EVINDEX_PROJECTION_HPP
#define EVINDEX_PROJECTION_HPP

#include <string>
#include <mutex>
#include <ogr_api.h>
#include <ogr_spatialref.h>
#include "geometry/common.hpp"

namespace evindex {
namespace geometry {

// Planar projection used for distance arithmetic
enum class ProjectionMode {
    WEB_MERCATOR,   // EPSG:3857, pseudo-Mercator in meters
    UTM             // UTM zone picked from a reference location
};

// Projection configuration
struct ProjectionConfig {
    ProjectionMode mode;
    double reference_longitude;     // Used by UTM mode to pick the zone
    double reference_latitude;      // Used by UTM mode to pick the hemisphere

    ProjectionConfig() : mode(ProjectionMode::WEB_MERCATOR), reference_longitude(0.0), reference_latitude(0.0) {}
};

/**
 * Forward and inverse transformation between EPSG:4326 and a metric plane.
 * The projection is a pure function of the geographic coordinate.
 */
class Projector {
public:
    /**
     * Create the GDAL coordinate transformations for the configured projection
     * @param config Projection configuration
     * @throws EvIndexError(PROJECTION_FAILURE) if GDAL cannot build the transformation
     */
    explicit Projector(const ProjectionConfig& config = ProjectionConfig());
    ~Projector();

    // Disable copy constructor and assignment
    Projector(const Projector&) = delete;
    Projector& operator=(const Projector&) = delete;

    /**
     * Project a geographic coordinate onto the plane
     * @param geo Latitude/longitude in degrees
     * @return Planar point in meters
     * @throws EvIndexError(INVALID_COORDINATE) for out-of-range or unprojectable input
     */
    Point project(const GeoPoint& geo) const;

    /**
     * Convert a planar point back to degrees
     * @param planar Planar point in meters
     * @return Geographic coordinate
     * @throws EvIndexError(INVALID_COORDINATE) if the inverse transformation fails
     */
    GeoPoint unproject(const Point& planar) const;

    /**
     * Get the EPSG code of the planar coordinate system
     */
    int getTargetEPSG() const { return target_epsg_; }

    /**
     * Get the planar coordinate system as CRS string (e.g., "EPSG:3857")
     */
    std::string getCoordinateSystemCRS() const { return "EPSG:" + std::to_string(target_epsg_); }

    /**
     * Check latitude/longitude ranges
     * @throws EvIndexError(INVALID_COORDINATE) if latitude is outside [-90, 90],
     *         longitude outside [-180, 180] or either value is not finite
     */
    static void validateGeoPoint(const GeoPoint& geo);

    /**
     * Determine UTM zone from longitude coordinate
     * @param longitude Longitude in degrees
     * @return UTM zone number (1-60)
     */
    static int determineUTMZone(double longitude);

    /**
     * Determine UTM EPSG code from longitude and latitude
     * @return EPSG code for UTM zone (326xx for northern, 327xx for southern)
     */
    static int determineUTMEPSG(double longitude, double latitude);

private:
    int target_epsg_;
    OGRCoordinateTransformationH forward_;
    OGRCoordinateTransformationH inverse_;

    // OGR transformation handles are not safe for concurrent use
    mutable std::mutex transform_mutex_;

    static OGRCoordinateTransformationH createTransformation(int source_epsg, int target_epsg);
};

} // namespace geometry
} // namespace evindex

#endif // EVINDEX_PROJECTION_HPP
