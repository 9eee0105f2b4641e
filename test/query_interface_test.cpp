#include "gtest/gtest.h"

#include <fstream>
#include <limits>
#include <sstream>
#include <string>

#include <boost/filesystem.hpp>
#include <nlohmann/json.hpp>

#include "io/geojson_writer.hpp"
#include "io/result_writer.hpp"
#include "service/query_interface.hpp"
#include "test_util.hpp"

namespace fs = boost::filesystem;

using namespace evindex;
using namespace evindex::service;
using evindex::test::makePricedRecord;
using evindex::test::makeRecord;

namespace {

class ScratchDir {
public:
    ScratchDir() : path_(fs::temp_directory_path() / fs::unique_path("evindex-%%%%-%%%%-%%%%")) {
        fs::create_directories(path_);
    }
    ~ScratchDir() {
        boost::system::error_code ec;
        fs::remove_all(path_, ec);
    }

    fs::path path() const { return path_; }

private:
    fs::path path_;
};

void loadSampleStations(catalog::StationCatalog& station_catalog) {
    auto a = makePricedRecord(1, 47.50, 19.04, "Budapest", "MOL Plugee", 100.0);
    a.pricing.usage_cost = std::string("100 HUF/kWh");
    auto b = makePricedRecord(2, 47.49, 19.03, "Budapest", "E.ON", 130.0);
    auto c = makePricedRecord(3, 47.51, 19.05, "Budapest", "Tesla", 160.0);
    auto d = makeRecord(4, 46.43, 20.32);
    d.address.city = std::string("Szeged");
    station_catalog.load({a, b, c, d});
}

std::string readFile(const fs::path& path) {
    std::ifstream file(path.string());
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

TEST(query_interface, nearest_query) {
    catalog::StationCatalog station_catalog;
    loadSampleStations(station_catalog);

    nlohmann::json request = {
        {"query", "nearest"},
        {"params", {{"latitude", 47.50}, {"longitude", 19.04}, {"k", 10}, {"require_capacity", true}}}
    };
    auto response = executeQuery(station_catalog, request);
    ASSERT_EQ("ok", response["status"]);
    EXPECT_EQ("nearest", response["query"]);
    ASSERT_EQ(3U, response["row_count"].get<size_t>());
    EXPECT_EQ(1, response["rows"][0]["station_id"].get<int>());
    EXPECT_DOUBLE_EQ(0.0, response["rows"][0]["distance_km"].get<double>());
    EXPECT_EQ(2, response["rows"][1]["station_id"].get<int>());
    EXPECT_DOUBLE_EQ(1.99, response["rows"][1]["distance_km"].get<double>());

    request["params"]["require_usage_cost"] = true;
    response = executeQuery(station_catalog, request);
    ASSERT_EQ(1U, response["row_count"].get<size_t>());
    EXPECT_EQ("100 HUF/kWh", response["rows"][0]["usage_cost"]);
}

TEST(query_interface, analytics_queries) {
    catalog::StationCatalog station_catalog;
    loadSampleStations(station_catalog);

    auto competition = executeQuery(station_catalog, {{"query", "competition"}});
    ASSERT_EQ("ok", competition["status"]);
    ASSERT_EQ(1U, competition["row_count"].get<size_t>());
    EXPECT_EQ("Budapest", competition["rows"][0]["city"]);
    EXPECT_EQ("High Competition", competition["rows"][0]["competition_level"]);

    auto relaxed = executeQuery(station_catalog, {
        {"query", "competition"},
        {"analytics", {{"competition", {{"high_min_price_spread", 80}}}}}
    });
    EXPECT_EQ("Low Competition", relaxed["rows"][0]["competition_level"]);

    auto top = executeQuery(station_catalog, {{"query", "top-cities"}, {"params", {{"n", 1}}}});
    ASSERT_EQ(1U, top["row_count"].get<size_t>());
    EXPECT_EQ("Budapest", top["rows"][0]["key"]);
    EXPECT_EQ(3, top["rows"][0]["station_count"].get<int>());

    auto share = executeQuery(station_catalog, {{"query", "operator-share"}});
    ASSERT_EQ(3U, share["row_count"].get<size_t>());

    auto quality = executeQuery(station_catalog, {{"query", "data-quality"}});
    ASSERT_EQ("ok", quality["status"]);
    ASSERT_EQ(1U, quality["row_count"].get<size_t>());
    EXPECT_EQ(4, quality["rows"][0]["station_id"].get<int>());
    EXPECT_EQ("Missing price", quality["rows"][0]["data_issue"]);

    auto range = executeQuery(station_catalog, {
        {"query", "range"},
        {"params", {{"min_latitude", 46.0}, {"min_longitude", 20.0}, {"max_latitude", 47.0}, {"max_longitude", 21.0}}}
    });
    ASSERT_EQ(1U, range["row_count"].get<size_t>());
    EXPECT_EQ("Szeged", range["rows"][0]["city"]);
}

TEST(query_interface, every_query_name_runs) {
    catalog::StationCatalog station_catalog;
    loadSampleStations(station_catalog);

    nlohmann::json params = {
        {"latitude", 47.5}, {"longitude", 19.0},
        {"min_latitude", 46.0}, {"min_longitude", 18.0}, {"max_latitude", 48.0}, {"max_longitude", 21.0}
    };
    for (const auto& name : queryNames()) {
        auto response = executeQuery(station_catalog, {{"query", name}, {"params", params}});
        EXPECT_EQ("ok", response["status"]) << name << ": " << response.dump();
    }
}

TEST(query_interface, error_responses) {
    catalog::StationCatalog station_catalog;
    loadSampleStations(station_catalog);

    auto unknown = executeQuery(station_catalog, {{"query", "heatmap"}});
    EXPECT_EQ("error", unknown["status"]);
    EXPECT_EQ("InvalidRequest", unknown["kind"]);

    auto missing = executeQuery(station_catalog, nlohmann::json::object());
    EXPECT_EQ("InvalidRequest", missing["kind"]);

    auto bad_field = executeQuery(station_catalog, {{"query", "top-cities"}, {"params", {{"field", "street"}}}});
    EXPECT_EQ("InvalidRequest", bad_field["kind"]);

    auto bad_point = executeQuery(station_catalog, {
        {"query", "nearest"}, {"params", {{"latitude", 91.0}, {"longitude", 19.0}}}
    });
    EXPECT_EQ("error", bad_point["status"]);
    EXPECT_EQ("InvalidCoordinate", bad_point["kind"]);

    auto parse_error = nlohmann::json::parse(processQuery(station_catalog, "{\"query\": "));
    EXPECT_EQ("InvalidRequest", parse_error["kind"]);
}

TEST(query_interface, expired_deadline_times_out) {
    catalog::StationCatalog station_catalog;
    loadSampleStations(station_catalog);

    auto nearest = nlohmann::json::parse(processQuery(station_catalog,
        R"({"query": "nearest", "params": {"latitude": 47.5, "longitude": 19.0}, "deadline_ms": -1})"));
    EXPECT_EQ("error", nearest["status"]);
    EXPECT_EQ("Timeout", nearest["kind"]);

    auto density = executeQuery(station_catalog, {{"query", "density"}, {"deadline_ms", -1}});
    EXPECT_EQ("Timeout", density["kind"]);

    auto generous = executeQuery(station_catalog, {{"query", "density"}, {"deadline_ms", 60000}});
    EXPECT_EQ("ok", generous["status"]);
}

TEST(query_interface, far_deadlines_are_unbounded) {
    catalog::StationCatalog station_catalog;
    loadSampleStations(station_catalog);

    auto far = executeQuery(station_catalog, {{"query", "density"}, {"deadline_ms", 10000000000000LL}});
    EXPECT_EQ("ok", far["status"]) << far.dump();

    auto largest = executeQuery(station_catalog,
                                {{"query", "nearest"},
                                 {"params", {{"latitude", 47.5}, {"longitude", 19.0}}},
                                 {"deadline_ms", std::numeric_limits<unsigned long long>::max()}});
    EXPECT_EQ("ok", largest["status"]) << largest.dump();

    auto long_past = executeQuery(station_catalog, {{"query", "density"}, {"deadline_ms", -10000000000000LL}});
    EXPECT_EQ("Timeout", long_past["kind"]);

    auto fractional = executeQuery(station_catalog, {{"query", "density"}, {"deadline_ms", 1.5}});
    EXPECT_EQ("InvalidRequest", fractional["kind"]);
}

TEST(query_interface, result_counts_are_validated) {
    catalog::StationCatalog station_catalog;
    loadSampleStations(station_catalog);

    auto nearest = [&station_catalog](const nlohmann::json& k) {
        return executeQuery(station_catalog, {
            {"query", "nearest"}, {"params", {{"latitude", 47.5}, {"longitude", 19.0}, {"k", k}}}
        });
    };

    EXPECT_EQ("InvalidRequest", nearest(-1)["kind"]);
    EXPECT_EQ("InvalidRequest", nearest(-2)["kind"]);
    EXPECT_EQ("InvalidRequest", nearest("3")["kind"]);

    auto huge = nearest(1099511627776LL);
    ASSERT_EQ("ok", huge["status"]) << huge.dump();
    EXPECT_EQ(4U, huge["row_count"].get<size_t>());
    EXPECT_FALSE(huge.contains("index_rebuilt"));

    EXPECT_EQ(0U, nearest(0)["row_count"].get<size_t>());

    auto negative_n = executeQuery(station_catalog, {{"query", "top-cities"}, {"params", {{"n", -1}}}});
    EXPECT_EQ("InvalidRequest", negative_n["kind"]);
}

TEST(query_interface, parse_configs) {
    auto analytics_config = parseAnalyticsConfig({
        {"competition", {{"high_min_operators", 4}, {"moderate_operator_count", 3}}},
        {"min_city_stations", 2},
        {"region_areas_km2", {{"Pest", 6393.0}}},
        {"major_cities", nlohmann::json::array({"Budapest"})},
        {"share_denominator", "all_stations"}
    });
    EXPECT_EQ(4U, analytics_config.competition.high_min_operators);
    EXPECT_DOUBLE_EQ(50.0, analytics_config.competition.high_min_price_spread);
    EXPECT_EQ(3U, analytics_config.competition.moderate_operator_count);
    EXPECT_EQ(2U, analytics_config.min_city_stations);
    EXPECT_EQ(5U, analytics_config.min_operator_stations);
    EXPECT_DOUBLE_EQ(6393.0, analytics_config.region_areas_km2.at("Pest"));
    ASSERT_EQ(1U, analytics_config.major_cities.size());
    EXPECT_EQ(analytics::ShareDenominator::ALL_STATIONS, analytics_config.share_denominator);

    EXPECT_THROW(parseAnalyticsConfig({{"share_denominator", "some"}}), std::invalid_argument);

    auto projection = parseProjectionConfig({{"mode", "utm"}, {"reference_longitude", 19.0}});
    EXPECT_EQ(geometry::ProjectionMode::UTM, projection.mode);
    EXPECT_DOUBLE_EQ(19.0, projection.reference_longitude);
    EXPECT_THROW(parseProjectionConfig({{"mode", "lambert"}}), std::invalid_argument);

    EXPECT_EQ(catalog::LoadMode::BEST_EFFORT, parseLoadMode("best-effort"));
    EXPECT_THROW(parseLoadMode("partial"), std::invalid_argument);
    EXPECT_EQ(analytics::PriceField::PER_MINUTE, parsePriceField("minute"));
    EXPECT_EQ(analytics::GroupField::POSTAL_CODE, parseGroupField("postal_code"));
}

TEST(query_interface, load_tool_reads_station_file) {
    ScratchDir dir;
    fs::path stations = dir.path() / "stations.geojson";
    {
        std::ofstream file(stations.string());
        file << R"({"type": "FeatureCollection", "features": [
            {"type": "Feature", "geometry": {"type": "Point", "coordinates": [19.04, 47.50]},
             "properties": {"station_id": 1, "is_operational": true, "num_charging_points": 2}},
            {"type": "Feature", "geometry": {"type": "Point", "coordinates": [19.03, 47.49]},
             "properties": {"station_id": 2, "is_operational": true, "num_charging_points": -3}},
            {"type": "Feature", "geometry": {"type": "Point", "coordinates": [20.32, 46.43]},
             "properties": {"station_id": 3}}
        ]})";
    }

    nlohmann::json reader_config = {{"file_path", stations.string()}};

    catalog::StationCatalog atomic_catalog;
    std::string atomic = processLoadTool(atomic_catalog, reader_config.dump());
    EXPECT_EQ(0U, atomic.find("Error"));
    EXPECT_EQ(0U, atomic_catalog.size());

    reader_config["load_mode"] = "best-effort";
    catalog::StationCatalog best_effort_catalog;
    std::string best_effort = processLoadTool(best_effort_catalog, reader_config.dump());
    EXPECT_EQ("Success: Loaded 2 stations, rejected 1", best_effort);
    EXPECT_EQ(2U, best_effort_catalog.size());

    reader_config["file_path"] = (dir.path() / "missing.geojson").string();
    EXPECT_EQ(0U, processLoadTool(best_effort_catalog, reader_config.dump()).find("Error"));
    EXPECT_EQ(2U, best_effort_catalog.size());
}

TEST(result_writer, writes_json_into_new_directory) {
    ScratchDir dir;
    io::ResultWriterConfig config;
    config.output_file_path = (dir.path() / "nested" / "out" / "rows.json").string();

    io::ResultWriter writer(config);
    nlohmann::json document = {{"status", "ok"}, {"rows", nlohmann::json::array()}};
    ASSERT_TRUE(writer.writeJson(document)) << writer.getLastError();
    EXPECT_EQ(document, nlohmann::json::parse(readFile(config.output_file_path)));

    io::ResultWriter unconfigured{io::ResultWriterConfig()};
    EXPECT_FALSE(unconfigured.writeJson(document));
    EXPECT_FALSE(unconfigured.getLastError().empty());
}

TEST(result_writer, writes_coverage_geojson) {
    catalog::StationCatalog station_catalog;
    std::vector<catalog::StationRecord> records;
    StationId id = 1;
    for (double lat : {47.45, 47.55}) {
        for (double lon : {19.00, 19.10}) {
            auto record = makeRecord(id++, lat, lon);
            record.address.city = std::string("Budapest");
            records.push_back(record);
        }
    }
    station_catalog.load(records);

    analytics::AnalyticsEngine engine;
    auto rows = engine.coverageAreas(station_catalog.snapshot(), station_catalog.projector());
    ASSERT_EQ(1U, rows.size());

    ScratchDir dir;
    io::ResultWriterConfig config;
    config.output_file_path = (dir.path() / "coverage" / "hulls.geojson").string();
    io::ResultWriter writer(config);
    ASSERT_TRUE(writer.writeCoverage(rows)) << writer.getLastError();

    auto geojson = nlohmann::json::parse(readFile(config.output_file_path));
    EXPECT_EQ("FeatureCollection", geojson["type"]);
    ASSERT_EQ(1U, geojson["features"].size());
    const auto& feature = geojson["features"][0];
    EXPECT_EQ("Polygon", feature["geometry"]["type"]);
    EXPECT_EQ("Budapest", feature["properties"]["city"]);
    EXPECT_EQ(5U, feature["geometry"]["coordinates"][0].size());

    // Coordinates are longitude first
    double lon = feature["geometry"]["coordinates"][0][0][0].get<double>();
    EXPECT_TRUE(lon > 18.99 && lon < 19.11);
}
