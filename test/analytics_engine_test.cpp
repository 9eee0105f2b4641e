#include "gtest/gtest.h"

#include <numeric>
#include <string>
#include <vector>

#include "analytics/analytics_engine.hpp"
#include "catalog/station_catalog.hpp"
#include "geometry/geometry_utils.hpp"
#include "test_util.hpp"

using namespace evindex;
using namespace evindex::analytics;
using evindex::catalog::OperationalStatus;
using evindex::catalog::PricingModel;
using evindex::catalog::StationRecord;
using evindex::test::makePricedRecord;
using evindex::test::makeRecord;

namespace {

catalog::StationSnapshot snapshotOf(const std::vector<StationRecord>& records) {
    catalog::StationCatalog station_catalog;
    station_catalog.load(records);
    return station_catalog.snapshot();
}

StationRecord withOperator(StationRecord record, const std::string& operator_name) {
    record.operator_name = operator_name;
    return record;
}

StationRecord withCounty(StationRecord record, const std::string& county) {
    record.address.county = county;
    return record;
}

} // namespace

TEST(analytics_engine, round_half_away_from_zero) {
    EXPECT_DOUBLE_EQ(0.13, roundTo(0.125, 2));
    EXPECT_DOUBLE_EQ(-2.0, roundTo(-1.5, 0));
    EXPECT_DOUBLE_EQ(3.0, roundTo(2.5, 0));
    EXPECT_DOUBLE_EQ(16.7, roundTo(16.6666, 1));
}

TEST(analytics_engine, status_breakdown) {
    auto a = makeRecord(1, 47.0, 19.0);
    auto b = makeRecord(2, 47.1, 19.0);
    b.status = OperationalStatus::NON_OPERATIONAL;
    auto c = makeRecord(3, 47.2, 19.0);
    c.status = OperationalStatus::UNKNOWN;
    auto d = makeRecord(4, 47.3, 19.0);

    AnalyticsEngine engine;
    auto rows = engine.statusBreakdown(snapshotOf({a, b, c, d}));
    ASSERT_EQ(3U, rows.size());
    EXPECT_EQ(OperationalStatus::OPERATIONAL, rows[0].status);
    EXPECT_EQ(2U, rows[0].count);
    EXPECT_EQ(OperationalStatus::NON_OPERATIONAL, rows[1].status);
    EXPECT_EQ(OperationalStatus::UNKNOWN, rows[2].status);
}

TEST(analytics_engine, top_n_orders_by_count_then_key) {
    std::vector<StationRecord> records;
    const char* cities[] = {"Szeged", "Budapest", "Szeged", "Debrecen", "Budapest", "Eger", "Szeged"};
    StationId id = 1;
    for (const char* city : cities) {
        auto record = makeRecord(id, 47.0 + static_cast<double>(id) * 0.01, 19.0);
        record.address.city = std::string(city);
        records.push_back(record);
        ++id;
    }
    records.push_back(makeRecord(id, 46.0, 20.0));

    AnalyticsEngine engine;
    auto rows = engine.topN(snapshotOf(records), GroupField::CITY, 3);
    ASSERT_EQ(3U, rows.size());
    EXPECT_EQ("Szeged", rows[0].key);
    EXPECT_EQ(3U, rows[0].count);
    EXPECT_EQ("Budapest", rows[1].key);
    EXPECT_EQ("Debrecen", rows[2].key);

    EXPECT_EQ(4U, engine.topN(snapshotOf(records), GroupField::CITY, 10).size());
    EXPECT_TRUE(engine.topN(snapshotOf(records), GroupField::CITY, 0).empty());
}

TEST(analytics_engine, share_of_total_excludes_null_keys) {
    std::vector<StationRecord> records = {
        withOperator(makeRecord(1, 47.0, 19.0), "MOL Plugee"),
        withOperator(makeRecord(2, 47.1, 19.0), "MOL Plugee"),
        withOperator(makeRecord(3, 47.2, 19.0), "MOL Plugee"),
        withOperator(makeRecord(4, 47.3, 19.0), "E.ON"),
        makeRecord(5, 47.4, 19.0),
        makeRecord(6, 47.5, 19.0),
    };
    auto snapshot = snapshotOf(records);

    AnalyticsEngine engine;
    auto rows = engine.shareOfTotal(snapshot, GroupField::OPERATOR);
    ASSERT_EQ(2U, rows.size());
    EXPECT_EQ("MOL Plugee", rows[0].key);
    EXPECT_DOUBLE_EQ(75.0, rows[0].percentage);
    EXPECT_EQ("E.ON", rows[1].key);
    EXPECT_DOUBLE_EQ(25.0, rows[1].percentage);

    AnalyticsConfig config;
    config.share_denominator = ShareDenominator::ALL_STATIONS;
    AnalyticsEngine all_stations(config);
    auto of_all = all_stations.shareOfTotal(snapshot, GroupField::OPERATOR);
    ASSERT_EQ(2U, of_all.size());
    EXPECT_DOUBLE_EQ(50.0, of_all[0].percentage);
    EXPECT_DOUBLE_EQ(16.67, of_all[1].percentage);
}

TEST(analytics_engine, share_of_total_sums_to_hundred) {
    std::vector<StationRecord> records;
    const char* operators[] = {"A", "B", "C"};
    for (StationId id = 1; id <= 7; ++id) {
        records.push_back(withOperator(makeRecord(id, 47.0 + static_cast<double>(id) * 0.01, 19.0),
                                       operators[id % 3]));
    }

    AnalyticsEngine engine;
    auto rows = engine.shareOfTotal(snapshotOf(records), GroupField::OPERATOR);
    double total = 0.0;
    for (const auto& row : rows) {
        total += row.percentage;
    }
    EXPECT_NEAR(100.0, total, 0.1);
}

TEST(analytics_engine, price_statistics_use_sample_deviation) {
    auto free_station = withOperator(makeRecord(4, 47.3, 19.0), "A");
    free_station.pricing.is_free = true;
    free_station.pricing.ac_price_per_kwh = 0.0;

    std::vector<StationRecord> records = {
        makePricedRecord(1, 47.0, 19.0, "Budapest", "A", 100.0),
        makePricedRecord(2, 47.1, 19.0, "Budapest", "A", 120.0),
        makePricedRecord(3, 47.2, 19.0, "Budapest", "B", 150.0),
        free_station,
        withOperator(makeRecord(5, 47.4, 19.0), "C"),
    };

    AnalyticsEngine engine;
    auto rows = engine.priceStatistics(snapshotOf(records), GroupField::OPERATOR, PriceField::AC_PER_KWH);
    ASSERT_EQ(2U, rows.size());

    EXPECT_EQ("B", rows[0].key);
    EXPECT_EQ(1U, rows[0].sample_count);
    EXPECT_DOUBLE_EQ(150.0, rows[0].mean);
    EXPECT_FALSE(rows[0].stddev.has_value());
    EXPECT_FALSE(rows[0].variance.has_value());

    EXPECT_EQ("A", rows[1].key);
    EXPECT_EQ(2U, rows[1].sample_count);
    EXPECT_DOUBLE_EQ(110.0, rows[1].mean);
    EXPECT_DOUBLE_EQ(100.0, rows[1].min);
    EXPECT_DOUBLE_EQ(120.0, rows[1].max);
    ASSERT_TRUE(rows[1].variance.has_value());
    EXPECT_DOUBLE_EQ(200.0, *rows[1].variance);
    ASSERT_TRUE(rows[1].stddev.has_value());
    EXPECT_DOUBLE_EQ(14.14, *rows[1].stddev);
}

TEST(analytics_engine, density_proxy_and_area) {
    std::vector<StationRecord> records = {
        withCounty(makeRecord(1, 47.0, 19.0), "Pest"),
        withCounty(makeRecord(2, 47.1, 19.0), "Pest"),
        withCounty(makeRecord(3, 47.2, 19.0), "Pest"),
        withCounty(makeRecord(4, 46.2, 20.1), "Csongrad"),
        makeRecord(5, 46.0, 18.0),
    };
    auto snapshot = snapshotOf(records);

    AnalyticsEngine proxy;
    auto rows = proxy.density(snapshot);
    ASSERT_EQ(2U, rows.size());
    EXPECT_EQ("Pest", rows[0].region);
    EXPECT_DOUBLE_EQ(600.0, rows[0].density);
    EXPECT_EQ(DensityMode::PROXY_SHARE, rows[0].mode);
    EXPECT_EQ("Csongrad", rows[1].region);
    EXPECT_DOUBLE_EQ(200.0, rows[1].density);

    AnalyticsConfig config;
    config.region_areas_km2["Pest"] = 6393.0;
    AnalyticsEngine area(config);
    auto area_rows = area.density(snapshot);
    ASSERT_EQ(2U, area_rows.size());
    EXPECT_EQ("Csongrad", area_rows[0].region);
    EXPECT_EQ(DensityMode::PROXY_SHARE, area_rows[0].mode);
    EXPECT_EQ("Pest", area_rows[1].region);
    EXPECT_EQ(DensityMode::AREA, area_rows[1].mode);
    EXPECT_DOUBLE_EQ(0.47, area_rows[1].density);
}

TEST(analytics_engine, competition_levels) {
    std::vector<StationRecord> records = {
        // Three operators, spread 60
        makePricedRecord(1, 46.25, 20.14, "Szeged", "A", 100.0),
        makePricedRecord(2, 46.26, 20.14, "Szeged", "B", 130.0),
        makePricedRecord(3, 46.27, 20.14, "Szeged", "C", 160.0),
        // Two operators, spread 100
        makePricedRecord(4, 47.53, 21.62, "Debrecen", "A", 100.0),
        makePricedRecord(5, 47.54, 21.62, "Debrecen", "B", 100.0),
        makePricedRecord(6, 47.55, 21.62, "Debrecen", "A", 200.0),
        // One operator
        makePricedRecord(7, 47.90, 20.37, "Eger", "A", 100.0),
        makePricedRecord(8, 47.91, 20.37, "Eger", "A", 110.0),
        makePricedRecord(9, 47.92, 20.37, "Eger", "A", 120.0),
        // Too few stations
        makePricedRecord(10, 46.07, 18.23, "Pecs", "A", 100.0),
        makePricedRecord(11, 46.08, 18.23, "Pecs", "B", 300.0),
    };
    // Non-operational stations do not count
    auto closed = makePricedRecord(12, 46.09, 18.23, "Pecs", "C", 150.0);
    closed.status = OperationalStatus::NON_OPERATIONAL;
    records.push_back(closed);

    AnalyticsEngine engine;
    auto rows = engine.competition(snapshotOf(records));
    ASSERT_EQ(3U, rows.size());

    EXPECT_EQ("Debrecen", rows[0].city);
    EXPECT_EQ(2U, rows[0].operator_count);
    EXPECT_DOUBLE_EQ(100.0, rows[0].price_spread);
    EXPECT_EQ(CompetitionLevel::MODERATE, rows[0].level);

    EXPECT_EQ("Szeged", rows[1].city);
    EXPECT_EQ(3U, rows[1].operator_count);
    EXPECT_DOUBLE_EQ(60.0, rows[1].price_spread);
    EXPECT_DOUBLE_EQ(130.0, rows[1].avg_price);
    EXPECT_EQ(CompetitionLevel::HIGH, rows[1].level);

    EXPECT_EQ("Eger", rows[2].city);
    EXPECT_EQ(CompetitionLevel::LOW, rows[2].level);
    EXPECT_EQ("Low Competition", competitionLevelName(rows[2].level));
}

TEST(analytics_engine, competition_needs_wide_spread_for_high) {
    std::vector<StationRecord> records = {
        makePricedRecord(1, 46.25, 20.14, "Szeged", "A", 100.0),
        makePricedRecord(2, 46.26, 20.14, "Szeged", "B", 130.0),
        makePricedRecord(3, 46.27, 20.14, "Szeged", "C", 150.0),
    };

    AnalyticsEngine engine;
    auto rows = engine.competition(snapshotOf(records));
    ASSERT_EQ(1U, rows.size());
    EXPECT_DOUBLE_EQ(50.0, rows[0].price_spread);
    EXPECT_EQ(CompetitionLevel::LOW, rows[0].level);
}

TEST(analytics_engine, monthly_trend_and_capacity_distribution) {
    auto a = makeRecord(1, 47.0, 19.0);
    a.creation_date = catalog::Date(2023, 1, 15);
    a.capacity = 2;
    auto b = makeRecord(2, 47.1, 19.0);
    b.creation_date = catalog::Date(2023, 1, 20);
    b.capacity = 2;
    auto c = makeRecord(3, 47.2, 19.0);
    c.creation_date = catalog::Date(2022, 12, 1);
    c.capacity = 4;
    auto d = makeRecord(4, 47.3, 19.0);

    AnalyticsEngine engine;
    auto snapshot = snapshotOf({a, b, c, d});

    auto months = engine.monthlyTrend(snapshot);
    ASSERT_EQ(2U, months.size());
    EXPECT_EQ(2022, months[0].year);
    EXPECT_EQ(12, months[0].month);
    EXPECT_EQ(1U, months[0].count);
    EXPECT_EQ(2023, months[1].year);
    EXPECT_EQ(1, months[1].month);
    EXPECT_EQ(2U, months[1].count);

    auto capacities = engine.capacityDistribution(snapshot);
    ASSERT_EQ(2U, capacities.size());
    EXPECT_EQ(2, capacities[0].capacity);
    EXPECT_EQ(2U, capacities[0].count);
    EXPECT_EQ(4, capacities[1].capacity);
    EXPECT_EQ(1U, capacities[1].count);
}

TEST(analytics_engine, coverage_areas) {
    std::vector<StationRecord> records;
    StationId id = 1;
    for (double lat : {47.45, 47.55}) {
        for (double lon : {19.00, 19.10}) {
            auto record = makeRecord(id++, lat, lon);
            record.address.city = std::string("Budapest");
            records.push_back(record);
        }
    }
    auto center = makeRecord(id++, 47.50, 19.05);
    center.address.city = std::string("Budapest");
    records.push_back(center);

    auto lone = makeRecord(id++, 46.25, 20.14);
    lone.address.city = std::string("Szeged");
    records.push_back(lone);

    auto collinear_a = makeRecord(id++, 47.90, 20.37);
    collinear_a.address.city = std::string("Eger");
    auto collinear_b = makeRecord(id++, 47.91, 20.37);
    collinear_b.address.city = std::string("Eger");
    records.push_back(collinear_a);
    records.push_back(collinear_b);

    catalog::StationCatalog station_catalog;
    station_catalog.load(records);

    AnalyticsEngine engine;
    auto rows = engine.coverageAreas(station_catalog.snapshot(), station_catalog.projector());
    ASSERT_EQ(2U, rows.size());

    EXPECT_EQ("Budapest", rows[0].city);
    EXPECT_EQ(5U, rows[0].station_count);
    ASSERT_EQ(5U, rows[0].hull.outer().size());
    EXPECT_GT(rows[0].area_km2, 0.0);
    EXPECT_DOUBLE_EQ(roundTo(geometry::hullAreaKm2(rows[0].hull), 2), rows[0].area_km2);
    ASSERT_EQ(rows[0].hull.outer().size(), rows[0].hull_geo.size());
    EXPECT_NEAR(rows[0].hull_geo.front().latitude, rows[0].hull_geo.back().latitude, 1e-9);
    for (const auto& vertex : rows[0].hull_geo) {
        EXPECT_TRUE(vertex.latitude > 47.44 && vertex.latitude < 47.56);
    }

    // Two points never make a hull
    EXPECT_EQ("Eger", rows[1].city);
    EXPECT_TRUE(rows[1].hull.outer().empty());
    EXPECT_DOUBLE_EQ(0.0, rows[1].area_km2);
}

TEST(analytics_engine, location_types) {
    AnalyticsEngine engine;
    EXPECT_EQ(LocationType::MAJOR_CITY, engine.locationTypeOf(std::string("Budapest")));
    EXPECT_EQ(LocationType::TOWN, engine.locationTypeOf(std::string("Eger")));
    EXPECT_EQ(LocationType::RURAL_OTHER, engine.locationTypeOf(std::string("kisfalu")));
    EXPECT_EQ(LocationType::RURAL_OTHER, engine.locationTypeOf(std::nullopt));
    EXPECT_EQ(LocationType::RURAL_OTHER, engine.locationTypeOf(std::string("")));
}

TEST(analytics_engine, pricing_models) {
    auto per_energy = makePricedRecord(1, 47.50, 19.04, "Budapest", "A", 100.0);
    per_energy.capacity = 4;

    auto per_time = makeRecord(2, 47.90, 20.37);
    per_time.address.city = std::string("Eger");
    per_time.pricing.price_per_minute = 20.0;

    auto hybrid = makeRecord(3, 46.80, 19.50);
    hybrid.pricing.ac_price_per_kwh = 120.0;
    hybrid.pricing.price_per_minute = 15.0;

    auto free_station = makeRecord(4, 46.90, 19.60);
    free_station.address.city = std::string("kisfalu");
    free_station.pricing.is_free = true;

    auto closed = makePricedRecord(5, 47.51, 19.05, "Budapest", "A", 90.0);
    closed.status = OperationalStatus::NON_OPERATIONAL;

    AnalyticsEngine engine;
    auto rows = engine.pricingModels(snapshotOf({per_energy, per_time, hybrid, free_station, closed}));
    ASSERT_EQ(4U, rows.size());

    EXPECT_EQ(PricingModel::PER_ENERGY, rows[0].model);
    EXPECT_EQ(LocationType::MAJOR_CITY, rows[0].location_type);
    EXPECT_EQ(1U, rows[0].station_count);
    ASSERT_TRUE(rows[0].avg_capacity.has_value());
    EXPECT_DOUBLE_EQ(4.0, *rows[0].avg_capacity);
    EXPECT_DOUBLE_EQ(100.0, *rows[0].avg_kwh_price);
    EXPECT_FALSE(rows[0].avg_minute_price.has_value());
    EXPECT_DOUBLE_EQ(25.0, rows[0].market_share_pct);

    EXPECT_EQ(PricingModel::PER_TIME, rows[1].model);
    EXPECT_EQ(LocationType::TOWN, rows[1].location_type);
    EXPECT_DOUBLE_EQ(20.0, *rows[1].avg_minute_price);

    EXPECT_EQ(PricingModel::HYBRID, rows[2].model);
    EXPECT_EQ(LocationType::RURAL_OTHER, rows[2].location_type);
    EXPECT_FALSE(rows[2].avg_capacity.has_value());

    EXPECT_EQ(PricingModel::FREE, rows[3].model);
    EXPECT_EQ(LocationType::RURAL_OTHER, rows[3].location_type);
    EXPECT_EQ("Free", catalog::pricingModelName(rows[3].model));
}

TEST(analytics_engine, operator_strategies) {
    std::vector<StationRecord> records = {
        makePricedRecord(1, 47.00, 19.0, "Budapest", "A", 100.0),
        makePricedRecord(2, 47.01, 19.0, "Budapest", "A", 110.0),
        makePricedRecord(3, 47.02, 19.0, "Budapest", "A", 120.0),
    };
    auto minute = withOperator(makeRecord(4, 47.03, 19.0), "A");
    minute.pricing.price_per_minute = 25.0;
    auto free_station = withOperator(makeRecord(5, 47.04, 19.0), "A");
    free_station.pricing.is_free = true;
    records.push_back(minute);
    records.push_back(free_station);

    // Below the minimum station count
    for (StationId id = 6; id <= 9; ++id) {
        records.push_back(makePricedRecord(id, 46.0 + static_cast<double>(id) * 0.01, 20.0, "Szeged", "B", 150.0));
    }

    AnalyticsEngine engine;
    auto rows = engine.operatorStrategies(snapshotOf(records));
    ASSERT_EQ(1U, rows.size());
    EXPECT_EQ("A", rows[0].operator_name);
    EXPECT_EQ(5U, rows[0].total_stations);
    EXPECT_DOUBLE_EQ(60.0, rows[0].kwh_model_pct);
    EXPECT_DOUBLE_EQ(20.0, rows[0].minute_model_pct);
    EXPECT_DOUBLE_EQ(20.0, rows[0].free_model_pct);
    ASSERT_TRUE(rows[0].avg_kwh_price.has_value());
    EXPECT_DOUBLE_EQ(110.0, *rows[0].avg_kwh_price);
    ASSERT_TRUE(rows[0].price_consistency_score.has_value());
    EXPECT_DOUBLE_EQ(10.0, *rows[0].price_consistency_score);

    AnalyticsConfig config;
    config.min_operator_stations = 4;
    AnalyticsEngine relaxed(config);
    auto relaxed_rows = relaxed.operatorStrategies(snapshotOf(records));
    ASSERT_EQ(2U, relaxed_rows.size());
    EXPECT_EQ("B", relaxed_rows[1].operator_name);
    EXPECT_DOUBLE_EQ(0.0, *relaxed_rows[1].price_consistency_score);
}
