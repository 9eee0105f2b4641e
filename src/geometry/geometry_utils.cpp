#include "geometry/geometry_utils.hpp"
#include <algorithm>
#include <cmath>

namespace evindex {
namespace geometry {

double distance(const Point& a, const Point& b) {
    return bg::distance(a, b);
}

double minSquaredDistance(const Point& point, const Box& box) {
    // Cartesian comparable distance is the squared Euclidean distance
    return bg::comparable_distance(point, box);
}

Polygon convexHull(const std::vector<Point>& points) {
    Polygon hull;

    // Distinct points in lexicographic order
    std::vector<Point> distinct(points.begin(), points.end());
    std::sort(distinct.begin(), distinct.end(), [](const Point& a, const Point& b) {
        if (bg::get<0>(a) != bg::get<0>(b)) {
            return bg::get<0>(a) < bg::get<0>(b);
        }
        return bg::get<1>(a) < bg::get<1>(b);
    });
    distinct.erase(std::unique(distinct.begin(), distinct.end(), [](const Point& a, const Point& b) {
        return bg::get<0>(a) == bg::get<0>(b) && bg::get<1>(a) == bg::get<1>(b);
    }), distinct.end());

    if (distinct.size() < 3) {
        return hull;
    }

    MultiPoint input(distinct.begin(), distinct.end());
    bg::convex_hull(input, hull);

    // Collinear input yields a zero-area ring
    if (hull.outer().size() < 4 || bg::area(hull) <= 0.0) {
        return Polygon();
    }

    return hull;
}

double hullAreaKm2(const Polygon& hull) {
    if (hull.outer().empty()) {
        return 0.0;
    }
    return std::abs(bg::area(hull)) / 1.0e6;
}

} // namespace geometry
} // namespace evindex
