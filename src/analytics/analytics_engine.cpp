#include "analytics/analytics_engine.hpp"
#include "geometry/geometry_utils.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace evindex {
namespace analytics {

using catalog::Station;
using catalog::StationPtr;
using catalog::StationSnapshot;

namespace {

std::optional<double> priceOf(const Station& station, PriceField field) {
    switch (field) {
        case PriceField::AC_PER_KWH:
            return station.pricing().ac_price_per_kwh;
        case PriceField::DC_PER_KWH:
            return station.pricing().dc_price_per_kwh;
        case PriceField::PER_MINUTE:
            return station.pricing().price_per_minute;
    }
    return std::nullopt;
}

std::optional<double> mean(const std::vector<double>& values) {
    if (values.empty()) {
        return std::nullopt;
    }
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

// Sample variance (n - 1 denominator)
std::optional<double> sampleVariance(const std::vector<double>& values) {
    if (values.size() < 2) {
        return std::nullopt;
    }
    double avg = *mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - avg) * (v - avg);
    }
    return sum_sq / static_cast<double>(values.size() - 1);
}

std::optional<double> roundOptional(const std::optional<double>& value, int decimals) {
    if (!value) {
        return std::nullopt;
    }
    return roundTo(*value, decimals);
}

double percentage(size_t part, size_t total) {
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(part) * 100.0 / static_cast<double>(total);
}

} // namespace

std::string groupFieldName(GroupField field) {
    switch (field) {
        case GroupField::CITY:
            return "city";
        case GroupField::COUNTY:
            return "county";
        case GroupField::COUNTRY:
            return "country";
        case GroupField::POSTAL_CODE:
            return "postal_code";
        case GroupField::OPERATOR:
            return "operator";
    }
    return "unknown";
}

std::string densityModeName(DensityMode mode) {
    return mode == DensityMode::AREA ? "area" : "proxy";
}

std::string competitionLevelName(CompetitionLevel level) {
    switch (level) {
        case CompetitionLevel::HIGH:
            return "High Competition";
        case CompetitionLevel::MODERATE:
            return "Moderate Competition";
        case CompetitionLevel::LOW:
            return "Low Competition";
    }
    return "Low Competition";
}

std::string locationTypeName(LocationType type) {
    switch (type) {
        case LocationType::MAJOR_CITY:
            return "Major City";
        case LocationType::TOWN:
            return "Town/City";
        case LocationType::RURAL_OTHER:
            return "Rural/Other";
    }
    return "Rural/Other";
}

GroupKeyFn groupKey(GroupField field) {
    switch (field) {
        case GroupField::CITY:
            return [](const Station& s) { return s.address().city; };
        case GroupField::COUNTY:
            return [](const Station& s) { return s.address().county; };
        case GroupField::COUNTRY:
            return [](const Station& s) { return s.address().country; };
        case GroupField::POSTAL_CODE:
            return [](const Station& s) { return s.address().postal_code; };
        case GroupField::OPERATOR:
            return [](const Station& s) { return s.operatorName(); };
    }
    return [](const Station&) { return std::optional<std::string>(); };
}

double roundTo(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    // std::round rounds half away from zero
    return std::round(value * scale) / scale;
}

AnalyticsEngine::AnalyticsEngine(const AnalyticsConfig& config) : config_(config) {
}

std::vector<StatusCountRow> AnalyticsEngine::statusBreakdown(const StationSnapshot& stations) const {
    auto groups = catalog::groupBy([](const Station& s) { return s.status(); }, stations);

    std::vector<StatusCountRow> rows;
    for (const auto& group : groups) {
        rows.push_back(StatusCountRow{group.first, group.second.size()});
    }
    return rows;
}

std::vector<GroupCountRow> AnalyticsEngine::topN(const StationSnapshot& stations, GroupField field,
                                                 size_t n) const {
    auto groups = catalog::groupBy(groupKey(field), stations);

    std::vector<GroupCountRow> rows;
    for (const auto& group : groups) {
        if (!group.first) {
            continue;
        }
        rows.push_back(GroupCountRow{*group.first, group.second.size()});
    }

    std::sort(rows.begin(), rows.end(), [](const GroupCountRow& a, const GroupCountRow& b) {
        if (a.count != b.count) {
            return a.count > b.count;
        }
        return a.key < b.key;
    });
    if (rows.size() > n) {
        rows.resize(n);
    }
    return rows;
}

std::vector<ShareRow> AnalyticsEngine::shareOfTotal(const StationSnapshot& stations, GroupField field) const {
    auto groups = catalog::groupBy(groupKey(field), stations);

    size_t denominator = stations.size();
    if (config_.share_denominator == ShareDenominator::NON_NULL_KEYS) {
        auto null_group = groups.find(std::nullopt);
        if (null_group != groups.end()) {
            denominator -= null_group->second.size();
        }
    }

    std::vector<ShareRow> rows;
    for (const auto& group : groups) {
        if (!group.first) {
            continue;
        }
        size_t count = group.second.size();
        rows.push_back(ShareRow{*group.first, count, roundTo(percentage(count, denominator), 2)});
    }

    std::sort(rows.begin(), rows.end(), [](const ShareRow& a, const ShareRow& b) {
        if (a.percentage != b.percentage) {
            return a.percentage > b.percentage;
        }
        return a.key < b.key;
    });
    return rows;
}

std::vector<PriceStatsRow> AnalyticsEngine::priceStatistics(const StationSnapshot& stations, GroupField field,
                                                            PriceField price_field) const {
    auto priced = stations.filter([price_field](const Station& s) {
        return !s.pricing().is_free && priceOf(s, price_field).has_value();
    });
    auto groups = catalog::groupBy(groupKey(field), priced);

    std::vector<PriceStatsRow> rows;
    for (const auto& group : groups) {
        if (!group.first) {
            continue;
        }
        std::vector<double> prices;
        for (const StationPtr& station : group.second) {
            prices.push_back(*priceOf(*station, price_field));
        }

        std::optional<double> variance = sampleVariance(prices);
        std::optional<double> stddev;
        if (variance) {
            stddev = std::sqrt(*variance);
        }

        PriceStatsRow row;
        row.key = *group.first;
        row.sample_count = prices.size();
        row.mean = roundTo(*mean(prices), 2);
        row.min = roundTo(*std::min_element(prices.begin(), prices.end()), 2);
        row.max = roundTo(*std::max_element(prices.begin(), prices.end()), 2);
        row.variance = roundOptional(variance, 2);
        row.stddev = roundOptional(stddev, 2);
        rows.push_back(row);
    }

    std::sort(rows.begin(), rows.end(), [](const PriceStatsRow& a, const PriceStatsRow& b) {
        if (a.mean != b.mean) {
            return a.mean > b.mean;
        }
        return a.key < b.key;
    });
    return rows;
}

std::vector<DensityRow> AnalyticsEngine::density(const StationSnapshot& stations) const {
    auto groups = catalog::groupBy(groupKey(GroupField::COUNTY), stations);
    size_t total = stations.size();

    std::vector<DensityRow> rows;
    for (const auto& group : groups) {
        if (!group.first) {
            continue;
        }
        size_t count = group.second.size();
        auto area = config_.region_areas_km2.find(*group.first);
        if (area != config_.region_areas_km2.end() && area->second > 0.0) {
            rows.push_back(DensityRow{*group.first, count,
                                      roundTo(static_cast<double>(count) / area->second * 1000.0, 2),
                                      DensityMode::AREA});
        } else {
            double share = total == 0 ? 0.0 : static_cast<double>(count) / static_cast<double>(total);
            rows.push_back(DensityRow{*group.first, count, roundTo(share * config_.density_scale_factor, 0),
                                      DensityMode::PROXY_SHARE});
        }
    }

    std::sort(rows.begin(), rows.end(), [](const DensityRow& a, const DensityRow& b) {
        if (a.density != b.density) {
            return a.density > b.density;
        }
        return a.region < b.region;
    });
    return rows;
}

std::vector<CompetitionRow> AnalyticsEngine::competition(const StationSnapshot& stations) const {
    auto priced = stations.filter([](const Station& s) {
        return s.isOperational() && s.pricing().ac_price_per_kwh.has_value() && s.city().has_value();
    });
    auto groups = catalog::groupBy(groupKey(GroupField::CITY), priced);

    const CompetitionThresholds& thresholds = config_.competition;
    std::vector<CompetitionRow> rows;
    for (const auto& group : groups) {
        if (group.second.size() < config_.min_city_stations) {
            continue;
        }

        std::set<std::string> operators;
        std::vector<double> prices;
        for (const StationPtr& station : group.second) {
            if (station->operatorName()) {
                operators.insert(*station->operatorName());
            }
            prices.push_back(*station->pricing().ac_price_per_kwh);
        }

        CompetitionRow row;
        row.city = *group.first;
        row.station_count = group.second.size();
        row.operator_count = operators.size();
        row.avg_price = roundTo(*mean(prices), 2);
        row.min_price = *std::min_element(prices.begin(), prices.end());
        row.max_price = *std::max_element(prices.begin(), prices.end());
        row.price_spread = row.max_price - row.min_price;

        if (row.operator_count >= thresholds.high_min_operators &&
            row.price_spread > thresholds.high_min_price_spread) {
            row.level = CompetitionLevel::HIGH;
        } else if (row.operator_count == thresholds.moderate_operator_count) {
            row.level = CompetitionLevel::MODERATE;
        } else {
            row.level = CompetitionLevel::LOW;
        }
        rows.push_back(row);
    }

    std::sort(rows.begin(), rows.end(), [](const CompetitionRow& a, const CompetitionRow& b) {
        if (a.price_spread != b.price_spread) {
            return a.price_spread > b.price_spread;
        }
        return a.city < b.city;
    });
    return rows;
}

std::vector<MonthlyCountRow> AnalyticsEngine::monthlyTrend(const StationSnapshot& stations) const {
    std::map<std::pair<int, int>, size_t> months;
    for (const StationPtr& station : stations) {
        if (!station->creationDate()) {
            continue;
        }
        const catalog::Date& date = *station->creationDate();
        ++months[std::make_pair(static_cast<int>(date.year()), static_cast<int>(date.month()))];
    }

    std::vector<MonthlyCountRow> rows;
    for (const auto& month : months) {
        rows.push_back(MonthlyCountRow{month.first.first, month.first.second, month.second});
    }
    return rows;
}

std::vector<CapacityCountRow> AnalyticsEngine::capacityDistribution(const StationSnapshot& stations) const {
    auto groups = catalog::groupBy([](const Station& s) { return s.capacity(); }, stations);

    std::vector<CapacityCountRow> rows;
    for (const auto& group : groups) {
        if (!group.first) {
            continue;
        }
        rows.push_back(CapacityCountRow{*group.first, group.second.size()});
    }
    return rows;
}

std::vector<CoverageAreaRow> AnalyticsEngine::coverageAreas(const StationSnapshot& stations,
                                                            const geometry::Projector& projector) const {
    auto operational = stations.filter([](const Station& s) { return s.isOperational(); });
    auto groups = catalog::groupBy(groupKey(GroupField::CITY), operational);

    std::vector<CoverageAreaRow> rows;
    for (const auto& group : groups) {
        if (!group.first || group.second.size() < config_.min_coverage_stations) {
            continue;
        }

        std::vector<geometry::Point> points;
        for (const StationPtr& station : group.second) {
            points.push_back(station->planarLocation());
        }

        CoverageAreaRow row;
        row.city = *group.first;
        row.station_count = group.second.size();
        row.hull = geometry::convexHull(points);
        for (const auto& vertex : row.hull.outer()) {
            row.hull_geo.push_back(projector.unproject(vertex));
        }
        row.area_km2 = roundTo(geometry::hullAreaKm2(row.hull), 2);
        rows.push_back(row);
    }
    return rows;
}

LocationType AnalyticsEngine::locationTypeOf(const std::optional<std::string>& city) const {
    if (!city || city->empty()) {
        return LocationType::RURAL_OTHER;
    }
    if (std::find(config_.major_cities.begin(), config_.major_cities.end(), *city) != config_.major_cities.end()) {
        return LocationType::MAJOR_CITY;
    }
    char first = (*city)[0];
    if (first >= 'A' && first <= 'Z') {
        return LocationType::TOWN;
    }
    return LocationType::RURAL_OTHER;
}

std::vector<PricingModelRow> AnalyticsEngine::pricingModels(const StationSnapshot& stations) const {
    auto operational = stations.filter([](const Station& s) { return s.isOperational(); });
    auto groups = catalog::groupBy([this](const Station& s) {
        return std::make_pair(s.pricing().model(), locationTypeOf(s.city()));
    }, operational);

    std::vector<PricingModelRow> rows;
    for (const auto& group : groups) {
        std::vector<double> capacities;
        std::vector<double> kwh_prices;
        std::vector<double> minute_prices;
        for (const StationPtr& station : group.second) {
            if (station->capacity()) {
                capacities.push_back(static_cast<double>(*station->capacity()));
            }
            if (station->pricing().ac_price_per_kwh) {
                kwh_prices.push_back(*station->pricing().ac_price_per_kwh);
            }
            if (station->pricing().price_per_minute) {
                minute_prices.push_back(*station->pricing().price_per_minute);
            }
        }

        PricingModelRow row;
        row.model = group.first.first;
        row.location_type = group.first.second;
        row.station_count = group.second.size();
        row.avg_capacity = roundOptional(mean(capacities), 1);
        row.avg_kwh_price = roundOptional(mean(kwh_prices), 0);
        row.avg_minute_price = roundOptional(mean(minute_prices), 1);
        row.market_share_pct = roundTo(percentage(row.station_count, operational.size()), 1);
        rows.push_back(row);
    }
    return rows;
}

std::vector<OperatorStrategyRow> AnalyticsEngine::operatorStrategies(const StationSnapshot& stations) const {
    auto operational = stations.filter([](const Station& s) { return s.isOperational(); });
    auto groups = catalog::groupBy(groupKey(GroupField::OPERATOR), operational);

    std::vector<OperatorStrategyRow> rows;
    for (const auto& group : groups) {
        if (!group.first || group.second.size() < config_.min_operator_stations) {
            continue;
        }

        size_t kwh_count = 0;
        size_t minute_count = 0;
        size_t free_count = 0;
        std::vector<double> kwh_prices;
        for (const StationPtr& station : group.second) {
            const catalog::Pricing& pricing = station->pricing();
            if (pricing.ac_price_per_kwh) {
                ++kwh_count;
                kwh_prices.push_back(*pricing.ac_price_per_kwh);
            }
            if (pricing.price_per_minute) {
                ++minute_count;
            }
            if (pricing.is_free) {
                ++free_count;
            }
        }

        size_t total = group.second.size();
        std::optional<double> variance = sampleVariance(kwh_prices);

        OperatorStrategyRow row;
        row.operator_name = *group.first;
        row.total_stations = total;
        row.kwh_model_pct = roundTo(percentage(kwh_count, total), 1);
        row.minute_model_pct = roundTo(percentage(minute_count, total), 1);
        row.free_model_pct = roundTo(percentage(free_count, total), 1);
        row.avg_kwh_price = roundOptional(mean(kwh_prices), 0);
        if (variance) {
            row.price_consistency_score = roundTo(std::sqrt(*variance), 1);
        }
        rows.push_back(row);
    }

    std::sort(rows.begin(), rows.end(), [](const OperatorStrategyRow& a, const OperatorStrategyRow& b) {
        if (a.total_stations != b.total_stations) {
            return a.total_stations > b.total_stations;
        }
        return a.operator_name < b.operator_name;
    });
    return rows;
}

} // namespace analytics
} // namespace evindex
