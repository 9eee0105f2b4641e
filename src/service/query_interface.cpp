#include "service/query_interface.hpp"
#include "analytics/data_quality_validator.hpp"
#include "core/errors.hpp"
#include "io/result_serializer.hpp"
#include <chrono>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>

namespace evindex {
namespace service {

namespace {

using Deadline = std::optional<catalog::Clock::time_point>;

void checkDeadline(const Deadline& deadline, const std::string& step) {
    if (deadline && catalog::Clock::now() > *deadline) {
        throw EvIndexError(ErrorKind::TIMEOUT, "Deadline passed " + step);
    }
}

catalog::StationSnapshot takeSnapshot(const catalog::StationCatalog& station_catalog, const Deadline& deadline) {
    if (deadline) {
        return station_catalog.snapshot(*deadline);
    }
    return station_catalog.snapshot();
}

// Non-negative integer parameter such as a result count
size_t parseCount(const nlohmann::json& params, const std::string& name, size_t default_value) {
    if (!params.contains(name)) {
        return default_value;
    }
    const nlohmann::json& value = params[name];
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        throw std::invalid_argument("\"" + name + "\" must be a non-negative integer");
    }
    return value.get<size_t>();
}

// Requests without a deadline, or with one too far away to represent, are unbounded
Deadline parseDeadline(const nlohmann::json& request) {
    if (!request.contains("deadline_ms")) {
        return Deadline();
    }
    const nlohmann::json& value = request["deadline_ms"];
    if (!value.is_number_integer()) {
        throw std::invalid_argument("\"deadline_ms\" must be an integer");
    }

    catalog::Clock::time_point now = catalog::Clock::now();
    if (value.is_number_unsigned() && value.get<unsigned long long>() >
                                          static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        return Deadline();
    }
    long long deadline_ms = value.get<long long>();
    if (deadline_ms < 0) {
        return now - std::chrono::milliseconds(1);
    }

    auto max_ms = std::chrono::duration_cast<std::chrono::milliseconds>(catalog::Clock::time_point::max() - now);
    if (deadline_ms >= max_ms.count()) {
        return Deadline();
    }
    return now + std::chrono::milliseconds(deadline_ms);
}

nlohmann::json errorResponse(const std::string& kind, const std::string& message) {
    return {{"status", "error"}, {"kind", kind}, {"message", message}};
}

// Station filter shared by the spatial queries
catalog::StationPredicate parseStationFilter(const nlohmann::json& params) {
    bool operational_only = params.value("operational_only", false);
    bool require_usage_cost = params.value("require_usage_cost", false);
    bool require_capacity = params.value("require_capacity", false);

    if (!operational_only && !require_usage_cost && !require_capacity) {
        return catalog::StationPredicate();
    }
    return [=](const catalog::Station& station) {
        if (operational_only && !station.isOperational()) {
            return false;
        }
        if (require_usage_cost && !station.pricing().usage_cost) {
            return false;
        }
        if (require_capacity && !station.capacity()) {
            return false;
        }
        return true;
    };
}

nlohmann::json runQuery(const catalog::StationCatalog& station_catalog, const std::string& query,
                        const nlohmann::json& params, const analytics::AnalyticsConfig& config,
                        const Deadline& deadline) {
    analytics::AnalyticsEngine engine(config);

    if (query == "nearest") {
        if (!params.contains("latitude") || !params.contains("longitude")) {
            throw std::invalid_argument("nearest requires latitude and longitude");
        }
        geometry::GeoPoint point(params["latitude"].get<double>(), params["longitude"].get<double>());
        size_t k = parseCount(params, "k", 10);
        checkDeadline(deadline, "before nearest-neighbor search");
        return io::toJson(station_catalog.nearestK(point, k, parseStationFilter(params)));
    }

    if (query == "range") {
        geometry::GeoBox box(geometry::GeoPoint(params.at("min_latitude").get<double>(),
                                                params.at("min_longitude").get<double>()),
                             geometry::GeoPoint(params.at("max_latitude").get<double>(),
                                                params.at("max_longitude").get<double>()));
        checkDeadline(deadline, "before range search");
        return io::toJson(station_catalog.rangeQuery(box));
    }

    catalog::StationSnapshot snapshot = takeSnapshot(station_catalog, deadline);
    checkDeadline(deadline, "after taking the snapshot");

    if (query == "status-breakdown") {
        return io::toJson(engine.statusBreakdown(snapshot));
    }
    if (query == "top-cities") {
        analytics::GroupField field = parseGroupField(params.value("field", "city"));
        return io::toJson(engine.topN(snapshot, field, parseCount(params, "n", 5)));
    }
    if (query == "operator-share") {
        analytics::GroupField field = parseGroupField(params.value("field", "operator"));
        return io::toJson(engine.shareOfTotal(snapshot, field));
    }
    if (query == "operator-price") {
        analytics::GroupField field = parseGroupField(params.value("field", "operator"));
        analytics::PriceField price_field = parsePriceField(params.value("price_field", "ac"));
        return io::toJson(engine.priceStatistics(snapshot, field, price_field));
    }
    if (query == "density") {
        return io::toJson(engine.density(snapshot));
    }
    if (query == "competition") {
        return io::toJson(engine.competition(snapshot));
    }
    if (query == "monthly-trend") {
        return io::toJson(engine.monthlyTrend(snapshot));
    }
    if (query == "capacity-distribution") {
        return io::toJson(engine.capacityDistribution(snapshot));
    }
    if (query == "coverage") {
        return io::toJson(engine.coverageAreas(snapshot, station_catalog.projector()));
    }
    if (query == "pricing-models") {
        return io::toJson(engine.pricingModels(snapshot));
    }
    if (query == "operator-strategy") {
        return io::toJson(engine.operatorStrategies(snapshot));
    }
    if (query == "data-quality") {
        analytics::DataQualityValidator validator(params.value("strict", true));
        return io::toJson(validator.scan(snapshot));
    }

    throw std::invalid_argument("Unknown query: " + query);
}

} // namespace

io::StationReaderConfig parseStationReaderConfig(const nlohmann::json& config_json) {
    io::StationReaderConfig config;

    if (config_json.contains("file_path")) {
        config.file_path = config_json["file_path"];
    }
    if (config_json.contains("id_field")) {
        config.id_field = config_json["id_field"];
    }

    return config;
}

io::ResultWriterConfig parseResultWriterConfig(const nlohmann::json& config_json) {
    io::ResultWriterConfig config;

    if (config_json.contains("output_file_path")) {
        config.output_file_path = config_json["output_file_path"];
    }
    if (config_json.contains("indent")) {
        config.indent = config_json["indent"];
    }

    return config;
}

geometry::ProjectionConfig parseProjectionConfig(const nlohmann::json& config_json) {
    geometry::ProjectionConfig config;

    if (config_json.contains("mode")) {
        std::string mode = config_json["mode"];
        if (mode == "web-mercator") {
            config.mode = geometry::ProjectionMode::WEB_MERCATOR;
        } else if (mode == "utm") {
            config.mode = geometry::ProjectionMode::UTM;
        } else {
            throw std::invalid_argument("Unknown projection mode: " + mode);
        }
    }
    if (config_json.contains("reference_longitude")) {
        config.reference_longitude = config_json["reference_longitude"];
    }
    if (config_json.contains("reference_latitude")) {
        config.reference_latitude = config_json["reference_latitude"];
    }

    return config;
}

analytics::AnalyticsConfig parseAnalyticsConfig(const nlohmann::json& config_json) {
    analytics::AnalyticsConfig config;

    if (config_json.contains("competition")) {
        const auto& competition = config_json["competition"];
        if (competition.contains("high_min_operators")) {
            config.competition.high_min_operators = competition["high_min_operators"];
        }
        if (competition.contains("high_min_price_spread")) {
            config.competition.high_min_price_spread = competition["high_min_price_spread"];
        }
        if (competition.contains("moderate_operator_count")) {
            config.competition.moderate_operator_count = competition["moderate_operator_count"];
        }
    }
    if (config_json.contains("min_city_stations")) {
        config.min_city_stations = config_json["min_city_stations"];
    }
    if (config_json.contains("min_operator_stations")) {
        config.min_operator_stations = config_json["min_operator_stations"];
    }
    if (config_json.contains("min_coverage_stations")) {
        config.min_coverage_stations = config_json["min_coverage_stations"];
    }
    if (config_json.contains("density_scale_factor")) {
        config.density_scale_factor = config_json["density_scale_factor"];
    }
    if (config_json.contains("region_areas_km2")) {
        config.region_areas_km2 = config_json["region_areas_km2"].get<std::map<std::string, double>>();
    }
    if (config_json.contains("major_cities")) {
        config.major_cities = config_json["major_cities"].get<std::vector<std::string>>();
    }
    if (config_json.contains("share_denominator")) {
        std::string denominator = config_json["share_denominator"];
        if (denominator == "non_null_keys") {
            config.share_denominator = analytics::ShareDenominator::NON_NULL_KEYS;
        } else if (denominator == "all_stations") {
            config.share_denominator = analytics::ShareDenominator::ALL_STATIONS;
        } else {
            throw std::invalid_argument("Unknown share denominator: " + denominator);
        }
    }

    return config;
}

catalog::LoadMode parseLoadMode(const std::string& mode) {
    if (mode == "atomic") {
        return catalog::LoadMode::ATOMIC;
    }
    if (mode == "best-effort") {
        return catalog::LoadMode::BEST_EFFORT;
    }
    throw std::invalid_argument("Unknown load mode: " + mode);
}

analytics::GroupField parseGroupField(const std::string& field) {
    if (field == "city") {
        return analytics::GroupField::CITY;
    }
    if (field == "county") {
        return analytics::GroupField::COUNTY;
    }
    if (field == "country") {
        return analytics::GroupField::COUNTRY;
    }
    if (field == "postal_code") {
        return analytics::GroupField::POSTAL_CODE;
    }
    if (field == "operator") {
        return analytics::GroupField::OPERATOR;
    }
    throw std::invalid_argument("Unknown group field: " + field);
}

analytics::PriceField parsePriceField(const std::string& field) {
    if (field == "ac") {
        return analytics::PriceField::AC_PER_KWH;
    }
    if (field == "dc") {
        return analytics::PriceField::DC_PER_KWH;
    }
    if (field == "minute") {
        return analytics::PriceField::PER_MINUTE;
    }
    throw std::invalid_argument("Unknown price field: " + field);
}

const std::vector<std::string>& queryNames() {
    static const std::vector<std::string> names = {
        "nearest", "range", "status-breakdown", "top-cities", "operator-share", "operator-price",
        "density", "competition", "monthly-trend", "capacity-distribution", "coverage",
        "pricing-models", "operator-strategy", "data-quality"
    };
    return names;
}

// Station Load Tool
std::string processLoadTool(catalog::StationCatalog& station_catalog, const std::string& reader_config_json) {
    try {
        nlohmann::json reader_config = nlohmann::json::parse(reader_config_json);
        io::StationReaderConfig reader_cfg = parseStationReaderConfig(reader_config);
        catalog::LoadMode mode = parseLoadMode(reader_config.value("load_mode", "atomic"));

        io::StationReader reader(reader_cfg);
        if (!reader.read()) {
            return "Error: Failed to read stations from " + reader_cfg.file_path;
        }

        catalog::LoadSummary summary = station_catalog.load(reader.getRecords(), mode);
        reader.clearRecords();

        if (station_catalog.ensureConsistency()) {
            std::cerr << "Warning: Spatial index was rebuilt after load" << std::endl;
        }

        std::string message = "Success: Loaded " + std::to_string(summary.loaded) + " stations";
        if (!summary.failures.empty()) {
            message += ", rejected " + std::to_string(summary.failures.size());
        }
        return message;

    } catch (const std::exception& e) {
        return "Error: " + std::string(e.what());
    }
}

nlohmann::json executeQuery(catalog::StationCatalog& station_catalog, const nlohmann::json& request) {
    try {
        if (!request.is_object() || !request.contains("query")) {
            return errorResponse("InvalidRequest", "Request must be an object with a \"query\" field");
        }
        std::string query = request["query"];

        Deadline deadline = parseDeadline(request);

        nlohmann::json params = request.value("params", nlohmann::json::object());
        analytics::AnalyticsConfig config = parseAnalyticsConfig(request.value("analytics", nlohmann::json::object()));

        nlohmann::json rows = runQuery(station_catalog, query, params, config, deadline);
        checkDeadline(deadline, "before the response was ready");

        return {{"status", "ok"}, {"query", query}, {"row_count", rows.size()}, {"rows", rows}};

    } catch (const EvIndexError& e) {
        nlohmann::json response = errorResponse(errorKindName(e.kind()), e.what());
        if (e.kind() == ErrorKind::INTERNAL_INCONSISTENCY) {
            response["index_rebuilt"] = station_catalog.ensureConsistency();
        }
        return response;
    } catch (const nlohmann::json::exception& e) {
        return errorResponse("InvalidRequest", e.what());
    } catch (const std::invalid_argument& e) {
        return errorResponse("InvalidRequest", e.what());
    }
}

std::string processQuery(catalog::StationCatalog& station_catalog, const std::string& request_json) {
    nlohmann::json request;
    try {
        request = nlohmann::json::parse(request_json);
    } catch (const nlohmann::json::parse_error& e) {
        return errorResponse("InvalidRequest", e.what()).dump();
    }
    return executeQuery(station_catalog, request).dump();
}

} // namespace service
} // namespace evindex
