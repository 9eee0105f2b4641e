#include "io/result_serializer.hpp"
#include "analytics/analytics_engine.hpp"
#include "core/errors.hpp"
#include <cstdio>

namespace evindex {
namespace io {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

nlohmann::json dateToJson(const std::optional<catalog::Date>& date) {
    if (!date) {
        return nullptr;
    }
    return boost::gregorian::to_iso_extended_string(*date);
}

} // namespace

nlohmann::json stationToJson(const catalog::Station& station) {
    const catalog::Pricing& pricing = station.pricing();

    nlohmann::json row;
    row["station_id"] = station.id();
    row["latitude"] = station.geoLocation().latitude;
    row["longitude"] = station.geoLocation().longitude;
    row["city"] = optionalToJson(station.address().city);
    row["county"] = optionalToJson(station.address().county);
    row["country"] = optionalToJson(station.address().country);
    row["postal_code"] = optionalToJson(station.address().postal_code);
    row["operator"] = optionalToJson(station.operatorName());
    row["status"] = catalog::operationalStatusName(station.status());
    row["num_charging_points"] = optionalToJson(station.capacity());
    row["pricing_model"] = catalog::pricingModelName(pricing.model());
    row["is_free"] = pricing.is_free;
    row["ac_price_huf_kwh"] = optionalToJson(pricing.ac_price_per_kwh);
    row["dc_price_huf_kwh"] = optionalToJson(pricing.dc_price_per_kwh);
    row["time_based_price_huf_min"] = optionalToJson(pricing.price_per_minute);
    row["usage_cost"] = optionalToJson(pricing.usage_cost);
    row["creation_date"] = dateToJson(station.creationDate());
    row["last_verified_date"] = dateToJson(station.lastVerifiedDate());
    return row;
}

nlohmann::json toJson(const std::vector<catalog::NearestStation>& rows) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& nearest : rows) {
        const catalog::Station& station = *nearest.station;
        nlohmann::json row;
        row["station_id"] = station.id();
        row["city"] = optionalToJson(station.city());
        row["operator"] = optionalToJson(station.operatorName());
        row["num_charging_points"] = optionalToJson(station.capacity());
        row["usage_cost"] = optionalToJson(station.pricing().usage_cost);
        row["distance_m"] = nearest.distance;
        row["distance_km"] = analytics::roundTo(nearest.distance / 1000.0, 2);
        result.push_back(row);
    }
    return result;
}

nlohmann::json toJson(const std::vector<catalog::StationPtr>& rows) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& station : rows) {
        result.push_back(stationToJson(*station));
    }
    return result;
}

nlohmann::json toJson(const std::vector<analytics::StatusCountRow>& rows) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& r : rows) {
        result.push_back({{"status", catalog::operationalStatusName(r.status)}, {"station_count", r.count}});
    }
    return result;
}

nlohmann::json toJson(const std::vector<analytics::GroupCountRow>& rows) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& r : rows) {
        result.push_back({{"key", r.key}, {"station_count", r.count}});
    }
    return result;
}

nlohmann::json toJson(const std::vector<analytics::ShareRow>& rows) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& r : rows) {
        result.push_back({{"key", r.key}, {"station_count", r.count}, {"percentage", r.percentage}});
    }
    return result;
}

nlohmann::json toJson(const std::vector<analytics::PriceStatsRow>& rows) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& r : rows) {
        nlohmann::json row;
        row["key"] = r.key;
        row["sample_count"] = r.sample_count;
        row["mean"] = r.mean;
        row["min"] = r.min;
        row["max"] = r.max;
        row["variance"] = optionalToJson(r.variance);
        row["stddev"] = optionalToJson(r.stddev);
        result.push_back(row);
    }
    return result;
}

nlohmann::json toJson(const std::vector<analytics::DensityRow>& rows) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& r : rows) {
        result.push_back({{"region", r.region},
                          {"station_count", r.station_count},
                          {"density", r.density},
                          {"mode", analytics::densityModeName(r.mode)}});
    }
    return result;
}

nlohmann::json toJson(const std::vector<analytics::CompetitionRow>& rows) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& r : rows) {
        nlohmann::json row;
        row["city"] = r.city;
        row["station_count"] = r.station_count;
        row["operator_count"] = r.operator_count;
        row["avg_market_price"] = r.avg_price;
        row["min_price"] = r.min_price;
        row["max_price"] = r.max_price;
        row["price_spread"] = r.price_spread;
        row["competition_level"] = analytics::competitionLevelName(r.level);
        result.push_back(row);
    }
    return result;
}

nlohmann::json toJson(const std::vector<analytics::MonthlyCountRow>& rows) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& r : rows) {
        char month[8];
        std::snprintf(month, sizeof(month), "%04d-%02d", r.year, r.month);
        result.push_back({{"month", std::string(month)}, {"stations_added", r.count}});
    }
    return result;
}

nlohmann::json toJson(const std::vector<analytics::CapacityCountRow>& rows) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& r : rows) {
        result.push_back({{"num_charging_points", r.capacity}, {"station_count", r.count}});
    }
    return result;
}

nlohmann::json toJson(const std::vector<analytics::CoverageAreaRow>& rows) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& r : rows) {
        nlohmann::json row;
        row["city"] = r.city;
        row["stations_in_city"] = r.station_count;
        row["area_km2"] = r.area_km2;
        row["coverage_area"] = r.hull_geo.empty() ? nlohmann::json(nullptr) : geometry::geoRingToGeoJSON(r.hull_geo);
        result.push_back(row);
    }
    return result;
}

nlohmann::json toJson(const std::vector<analytics::PricingModelRow>& rows) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& r : rows) {
        nlohmann::json row;
        row["pricing_model"] = catalog::pricingModelName(r.model);
        row["location_type"] = analytics::locationTypeName(r.location_type);
        row["station_count"] = r.station_count;
        row["avg_charging_points"] = optionalToJson(r.avg_capacity);
        row["avg_kwh_price_huf"] = optionalToJson(r.avg_kwh_price);
        row["avg_minute_price_huf"] = optionalToJson(r.avg_minute_price);
        row["market_share_pct"] = r.market_share_pct;
        result.push_back(row);
    }
    return result;
}

nlohmann::json toJson(const std::vector<analytics::OperatorStrategyRow>& rows) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& r : rows) {
        nlohmann::json row;
        row["operator"] = r.operator_name;
        row["total_stations"] = r.total_stations;
        row["kwh_model_pct"] = r.kwh_model_pct;
        row["minute_model_pct"] = r.minute_model_pct;
        row["free_model_pct"] = r.free_model_pct;
        row["avg_kwh_price"] = optionalToJson(r.avg_kwh_price);
        row["price_consistency_score"] = optionalToJson(r.price_consistency_score);
        result.push_back(row);
    }
    return result;
}

nlohmann::json toJson(const std::vector<analytics::DataQualityIssue>& rows) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& r : rows) {
        nlohmann::json row;
        row["station_id"] = r.id;
        row["city"] = optionalToJson(r.city);
        row["operator"] = optionalToJson(r.operator_name);
        row["data_issue"] = analytics::issueKindName(r.kind);
        result.push_back(row);
    }
    return result;
}

nlohmann::json toJson(const catalog::LoadSummary& summary) {
    nlohmann::json failures = nlohmann::json::array();
    for (const auto& failure : summary.failures) {
        failures.push_back({{"record_index", failure.record_index},
                            {"station_id", failure.id},
                            {"kind", errorKindName(failure.kind)},
                            {"message", failure.message}});
    }
    return {{"loaded", summary.loaded}, {"failures", failures}};
}

geometry::GeospatialDataset coverageToDataset(const std::vector<analytics::CoverageAreaRow>& rows) {
    geometry::GeospatialDataset dataset;
    dataset.crs = "EPSG:4326";

    for (size_t i = 0; i < rows.size(); ++i) {
        const auto& r = rows[i];
        nlohmann::json properties;
        properties["city"] = r.city;
        properties["stations_in_city"] = r.station_count;
        properties["area_km2"] = r.area_km2;

        nlohmann::json geom = r.hull_geo.empty() ? nlohmann::json(nullptr) : geometry::geoRingToGeoJSON(r.hull_geo);
        dataset.features.emplace_back(i, geom, properties);
    }
    return dataset;
}

} // namespace io
} // namespace evindex
