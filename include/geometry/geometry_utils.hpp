#ifndef EVINDEX_GEOMETRY_UTILS_HPP
#define EVINDEX_GEOMETRY_UTILS_HPP

#include <vector>
#include "geometry/common.hpp"

namespace evindex {
namespace geometry {

/**
 * Euclidean distance between two planar points
 * @return Distance in meters
 */
double distance(const Point& a, const Point& b);

/**
 * Minimum squared distance from a point to a box (zero when the point is inside)
 */
double minSquaredDistance(const Point& point, const Box& box);

/**
 * Build the convex hull of a point set
 * @param points Planar points (duplicates allowed)
 * @return Counter-clockwise closed polygon; empty when there are fewer than
 *         3 distinct points or all points are collinear
 */
Polygon convexHull(const std::vector<Point>& points);

/**
 * Area of a hull in square kilometers of the planar projection
 */
double hullAreaKm2(const Polygon& hull);

} // namespace geometry
} // namespace evindex

#endif // EVINDEX_GEOMETRY_UTILS_HPP
