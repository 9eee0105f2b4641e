#ifndef EVINDEX_ANALYTICS_ENGINE_HPP
#define EVINDEX_ANALYTICS_ENGINE_HPP

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include "analytics/analytics_config.hpp"
#include "catalog/station_catalog.hpp"
#include "geometry/common.hpp"
#include "geometry/projection.hpp"

namespace evindex {
namespace analytics {

// Station attribute used as grouping key
enum class GroupField {
    CITY,
    COUNTY,
    COUNTRY,
    POSTAL_CODE,
    OPERATOR
};

// Price field used by price statistics
enum class PriceField {
    AC_PER_KWH,
    DC_PER_KWH,
    PER_MINUTE
};

enum class DensityMode {
    PROXY_SHARE,    // Share of all stations times the scale factor
    AREA            // Stations per 1000 km2 of configured region area
};

enum class CompetitionLevel {
    HIGH,
    MODERATE,
    LOW
};

enum class LocationType {
    MAJOR_CITY,
    TOWN,
    RURAL_OTHER
};

std::string groupFieldName(GroupField field);
std::string densityModeName(DensityMode mode);
std::string competitionLevelName(CompetitionLevel level);
std::string locationTypeName(LocationType type);

using GroupKeyFn = std::function<std::optional<std::string>(const catalog::Station&)>;

/**
 * Get the key extractor for a station attribute
 */
GroupKeyFn groupKey(GroupField field);

/**
 * Round half away from zero
 * @param value Value to round
 * @param decimals Number of decimal places
 */
double roundTo(double value, int decimals);

// Result rows

struct StatusCountRow {
    catalog::OperationalStatus status;
    size_t count;
};

struct GroupCountRow {
    std::string key;
    size_t count;
};

struct ShareRow {
    std::string key;
    size_t count;
    double percentage;
};

struct PriceStatsRow {
    std::string key;
    size_t sample_count;
    double mean;
    double min;
    double max;
    std::optional<double> variance;     // Sample variance, undefined below two samples
    std::optional<double> stddev;
};

struct DensityRow {
    std::string region;
    size_t station_count;
    double density;
    DensityMode mode;
};

struct CompetitionRow {
    std::string city;
    size_t station_count;
    size_t operator_count;
    double avg_price;
    double min_price;
    double max_price;
    double price_spread;
    CompetitionLevel level;
};

struct MonthlyCountRow {
    int year;
    int month;
    size_t count;
};

struct CapacityCountRow {
    int capacity;
    size_t count;
};

struct CoverageAreaRow {
    std::string city;
    size_t station_count;
    geometry::Polygon hull;                     // Planar, empty when degenerate
    std::vector<geometry::GeoPoint> hull_geo;   // Hull vertices in degrees
    double area_km2;
};

struct PricingModelRow {
    catalog::PricingModel model;
    LocationType location_type;
    size_t station_count;
    std::optional<double> avg_capacity;
    std::optional<double> avg_kwh_price;
    std::optional<double> avg_minute_price;
    double market_share_pct;
};

struct OperatorStrategyRow {
    std::string operator_name;
    size_t total_stations;
    double kwh_model_pct;
    double minute_model_pct;
    double free_model_pct;
    std::optional<double> avg_kwh_price;
    std::optional<double> price_consistency_score;  // Sample stddev of the AC price
};

/**
 * Grouped statistics over an immutable station snapshot.
 * Every view is a pure function of the snapshot and the configuration;
 * callers narrow the population with StationCatalog::scan beforehand.
 */
class AnalyticsEngine {
public:
    explicit AnalyticsEngine(const AnalyticsConfig& config = AnalyticsConfig());

    /**
     * Count stations per operational status (only statuses present, enum order)
     */
    std::vector<StatusCountRow> statusBreakdown(const catalog::StationSnapshot& stations) const;

    /**
     * Most frequent keys
     * @param stations Station population
     * @param field Grouping attribute, null keys excluded
     * @param n Maximum number of rows
     * @return Rows by count descending, key ascending
     */
    std::vector<GroupCountRow> topN(const catalog::StationSnapshot& stations, GroupField field, size_t n) const;

    /**
     * Percentage of stations per key, rounded to 2 decimals
     * The denominator follows the configured ShareDenominator.
     * @return Rows by percentage descending, key ascending
     */
    std::vector<ShareRow> shareOfTotal(const catalog::StationSnapshot& stations, GroupField field) const;

    /**
     * Price statistics per group over non-free stations with the price present
     * @return Rows by mean descending, key ascending; values rounded to 2 decimals
     */
    std::vector<PriceStatsRow> priceStatistics(const catalog::StationSnapshot& stations, GroupField field,
                                               PriceField price_field) const;

    /**
     * Station density per county
     * Counties with a configured area get stations per 1000 km2, the others
     * the proxy share of all stations times the scale factor.
     */
    std::vector<DensityRow> density(const catalog::StationSnapshot& stations) const;

    /**
     * Competition level per city among operational stations with an AC price
     * @return Rows by price spread descending, city ascending
     */
    std::vector<CompetitionRow> competition(const catalog::StationSnapshot& stations) const;

    /**
     * Stations created per calendar month, chronological
     */
    std::vector<MonthlyCountRow> monthlyTrend(const catalog::StationSnapshot& stations) const;

    /**
     * Stations per number of charging points, ascending
     */
    std::vector<CapacityCountRow> capacityDistribution(const catalog::StationSnapshot& stations) const;

    /**
     * Convex hull of operational stations per city
     * @param stations Station population
     * @param projector Projection used to report hull vertices in degrees
     * @return Rows by city ascending
     */
    std::vector<CoverageAreaRow> coverageAreas(const catalog::StationSnapshot& stations,
                                               const geometry::Projector& projector) const;

    /**
     * Operational stations per pricing model and location type
     */
    std::vector<PricingModelRow> pricingModels(const catalog::StationSnapshot& stations) const;

    /**
     * Pricing strategy of operators with a significant presence
     * @return Rows by station count descending, operator ascending
     */
    std::vector<OperatorStrategyRow> operatorStrategies(const catalog::StationSnapshot& stations) const;

    /**
     * Classify a city name into a location type
     */
    LocationType locationTypeOf(const std::optional<std::string>& city) const;

    const AnalyticsConfig& getConfig() const { return config_; }

private:
    AnalyticsConfig config_;
};

} // namespace analytics
} // namespace evindex

#endif // EVINDEX_ANALYTICS_ENGINE_HPP
