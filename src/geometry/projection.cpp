#include "geometry/projection.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <sstream>
#include <iostream>

namespace evindex {
namespace geometry {

Projector::Projector(const ProjectionConfig& config)
    : target_epsg_(WEB_MERCATOR_EPSG), forward_(nullptr), inverse_(nullptr) {
    if (config.mode == ProjectionMode::UTM) {
        target_epsg_ = determineUTMEPSG(config.reference_longitude, config.reference_latitude);
    }

    forward_ = createTransformation(WGS84_EPSG, target_epsg_);
    inverse_ = createTransformation(target_epsg_, WGS84_EPSG);

    if (!forward_ || !inverse_) {
        if (forward_) OCTDestroyCoordinateTransformation(forward_);
        if (inverse_) OCTDestroyCoordinateTransformation(inverse_);
        throw EvIndexError(ErrorKind::PROJECTION_FAILURE,
                           "Failed to create coordinate transformation between EPSG:4326 and EPSG:" +
                           std::to_string(target_epsg_));
    }
}

Projector::~Projector() {
    if (forward_) {
        OCTDestroyCoordinateTransformation(forward_);
    }
    if (inverse_) {
        OCTDestroyCoordinateTransformation(inverse_);
    }
}

OGRCoordinateTransformationH Projector::createTransformation(int source_epsg, int target_epsg) {
    OGRSpatialReferenceH source_srs = OSRNewSpatialReference(nullptr);
    OGRSpatialReferenceH target_srs = OSRNewSpatialReference(nullptr);

    if (OSRImportFromEPSG(source_srs, source_epsg) != OGRERR_NONE ||
        OSRImportFromEPSG(target_srs, target_epsg) != OGRERR_NONE) {
        std::cerr << "Error: Unknown EPSG code " << source_epsg << " or " << target_epsg << std::endl;
        OSRDestroySpatialReference(source_srs);
        OSRDestroySpatialReference(target_srs);
        return nullptr;
    }

    // Longitude first on both sides (GDAL 3+ defaults to authority order)
    OSRSetAxisMappingStrategy(source_srs, OAMS_TRADITIONAL_GIS_ORDER);
    OSRSetAxisMappingStrategy(target_srs, OAMS_TRADITIONAL_GIS_ORDER);

    OGRCoordinateTransformationH coord_trans = OCTNewCoordinateTransformation(source_srs, target_srs);

    // Clean up spatial references
    OSRDestroySpatialReference(source_srs);
    OSRDestroySpatialReference(target_srs);

    return coord_trans;
}

void Projector::validateGeoPoint(const GeoPoint& geo) {
    if (!std::isfinite(geo.latitude) || !std::isfinite(geo.longitude) ||
        geo.latitude < -90.0 || geo.latitude > 90.0 ||
        geo.longitude < -180.0 || geo.longitude > 180.0) {
        std::ostringstream error_msg;
        error_msg << "Coordinate out of range: latitude " << geo.latitude
                  << ", longitude " << geo.longitude;
        throw EvIndexError(ErrorKind::INVALID_COORDINATE, error_msg.str());
    }
}

Point Projector::project(const GeoPoint& geo) const {
    validateGeoPoint(geo);

    double x = geo.longitude;
    double y = geo.latitude;
    double z = 0.0;
    int success = FALSE;
    {
        std::lock_guard<std::mutex> lock(transform_mutex_);
        success = OCTTransform(forward_, 1, &x, &y, &z);
    }

    if (!success || !std::isfinite(x) || !std::isfinite(y)) {
        std::ostringstream error_msg;
        error_msg << "Coordinate cannot be projected to EPSG:" << target_epsg_
                  << ": latitude " << geo.latitude << ", longitude " << geo.longitude;
        throw EvIndexError(ErrorKind::INVALID_COORDINATE, error_msg.str());
    }

    return Point(x, y);
}

GeoPoint Projector::unproject(const Point& planar) const {
    double x = bg::get<0>(planar);
    double y = bg::get<1>(planar);
    double z = 0.0;
    int success = FALSE;
    {
        std::lock_guard<std::mutex> lock(transform_mutex_);
        success = OCTTransform(inverse_, 1, &x, &y, &z);
    }

    if (!success || !std::isfinite(x) || !std::isfinite(y)) {
        std::ostringstream error_msg;
        error_msg << "Planar point (" << bg::get<0>(planar) << ", " << bg::get<1>(planar)
                  << ") cannot be converted to EPSG:4326";
        throw EvIndexError(ErrorKind::INVALID_COORDINATE, error_msg.str());
    }

    return GeoPoint(y, x);
}

int Projector::determineUTMZone(double longitude) {
    // UTM zones are 6 degrees wide, starting from -180
    int zone = static_cast<int>((longitude + 180.0) / 6.0) + 1;

    // Ensure zone is within valid range
    if (zone < 1) zone = 1;
    if (zone > 60) zone = 60;

    return zone;
}

int Projector::determineUTMEPSG(double longitude, double latitude) {
    int zone = determineUTMZone(longitude);

    if (latitude >= 0) {
        // Northern hemisphere: EPSG 326xx
        return 32600 + zone;
    }
    // Southern hemisphere: EPSG 327xx
    return 32700 + zone;
}

} // namespace geometry
} // namespace evindex
