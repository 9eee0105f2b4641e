#ifndef EVINDEX_ANALYTICS_CONFIG_HPP
#define EVINDEX_ANALYTICS_CONFIG_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace evindex {
namespace analytics {

// Population used as denominator of share-of-total views
enum class ShareDenominator {
    NON_NULL_KEYS,  // Stations with a null key are excluded from numerator and denominator
    ALL_STATIONS    // Every station in the view counts toward the denominator
};

// Competition level thresholds
struct CompetitionThresholds {
    size_t high_min_operators;          // At least this many distinct operators...
    double high_min_price_spread;       // ...and a spread strictly greater than this
    size_t moderate_operator_count;     // Exactly this many operators

    CompetitionThresholds()
        : high_min_operators(3), high_min_price_spread(50.0), moderate_operator_count(2) {}
};

// Analytics configuration
struct AnalyticsConfig {
    CompetitionThresholds competition;
    size_t min_city_stations;           // Minimum priced stations for a city to be scored
    size_t min_operator_stations;       // Minimum stations for an operator strategy row
    size_t min_coverage_stations;       // Minimum stations for a coverage hull
    double density_scale_factor;        // Multiplier of the proxy density
    std::map<std::string, double> region_areas_km2;    // Enables true area density per region
    std::vector<std::string> major_cities;
    ShareDenominator share_denominator;

    AnalyticsConfig()
        : min_city_stations(3),
          min_operator_stations(5),
          min_coverage_stations(2),
          density_scale_factor(1000.0),
          major_cities({"Budapest", "Debrecen", "Szeged", "Miskolc", "Pécs"}),
          share_denominator(ShareDenominator::NON_NULL_KEYS) {}
};

} // namespace analytics
} // namespace evindex

#endif // EVINDEX_ANALYTICS_CONFIG_HPP
