#include <iostream>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "analytics/analytics_engine.hpp"
#include "catalog/station_catalog.hpp"
#include "io/result_writer.hpp"
#include "service/query_interface.hpp"

using namespace evindex;
using namespace evindex::service;


void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " --stations-file <path> --mode <query> [options]\n"
              << "\nRequired arguments:\n"
              << "  --stations-file <path>       Path to the station GeoJSON file (WGS84 points)\n"
              << "  --mode <query>               One of: nearest, range, status-breakdown, top-cities, operator-share,\n"
              << "                               operator-price, density, competition, monthly-trend,\n"
              << "                               capacity-distribution, coverage, pricing-models, operator-strategy,\n"
              << "                               data-quality\n"
              << "\nOptional arguments:\n"
              << "  --output-file <path>         Write the result to a file instead of standard output\n"
              << "                               (coverage results are written as GeoJSON if the path ends in .geojson)\n"
              << "  --config <path>              JSON file with \"projection\" and \"analytics\" sections\n"
              << "  --station-id-field <name>    Field name for station ID (default: station_id)\n"
              << "  --load-mode <mode>           'atomic' (default) or 'best-effort'\n"
              << "  --deadline-ms <ms>           Fail with a timeout if the query takes longer\n"
              << "\nFor nearest mode:\n"
              << "  --latitude <deg> --longitude <deg> [--k <count>] [--operational-only] [--require-usage-cost]\n"
              << "  [--require-capacity]\n"
              << "\nFor range mode:\n"
              << "  --min-latitude <deg> --min-longitude <deg> --max-latitude <deg> --max-longitude <deg>\n"
              << "\nFor top-cities, operator-share and operator-price modes:\n"
              << "  --field <name>               city, county, country, postal_code or operator\n"
              << "  --n <count>                  Number of rows for top-cities (default: 5)\n"
              << "  --price-field <name>         ac, dc or minute for operator-price (default: ac)\n"
              << "\nFor data-quality mode:\n"
              << "  --lenient                    Report unmatched selections as 'Other issue' instead of failing\n"
              << "\nExamples:\n"
              << "  " << programName << " --stations-file stations.geojson --mode nearest --latitude 47.4979 --longitude 19.0402 --k 10 --operational-only --require-usage-cost\n"
              << "  " << programName << " --stations-file stations.geojson --mode coverage --output-file coverage.geojson\n"
              << "  " << programName << " --stations-file stations.geojson --mode competition --config analytics.json\n"
              << "\nUse --help for detailed parameter explanations and examples.\n"
              << "Use --version to display version information.\n";
}

void printDetailedHelp(const char* programName) {
    std::cout << "EvIndex - Charging Station Spatial Index and Analytics\n"
              << "======================================================\n\n"
              << "EvIndex loads charging station records, indexes their locations in an R-tree over a metric\n"
              << "projection and answers spatial and statistical queries about them.\n\n"
              << "SPATIAL QUERIES:\n\n"
              << "  nearest      Up to k stations closest to a point, ascending distance (ties by station id)\n"
              << "  range        Stations inside a latitude/longitude box\n\n"
              << "ANALYTICS VIEWS:\n\n"
              << "  status-breakdown       Stations per operational status\n"
              << "  top-cities             Most frequent values of a location attribute\n"
              << "  operator-share         Percentage of stations per operator (null operators excluded)\n"
              << "  operator-price         Price statistics per group over non-free stations\n"
              << "  density                Stations per county (proxy share, or per 1000 km2 with configured areas)\n"
              << "  competition            Competition level per city from operator count and AC price spread\n"
              << "  monthly-trend          Stations created per month\n"
              << "  capacity-distribution  Stations per number of charging points\n"
              << "  coverage               Convex hull of operational stations per city with area in km2\n"
              << "  pricing-models         Operational stations per pricing model and location type\n"
              << "  operator-strategy      Pricing strategy of operators with at least 5 stations\n"
              << "  data-quality           Stations with missing or contradictory attributes\n\n"
              << "CONFIGURATION FILE (--config):\n\n"
              << "  {\n"
              << "    \"projection\": {\"mode\": \"web-mercator\" | \"utm\", \"reference_longitude\": 19.0,\n"
              << "                   \"reference_latitude\": 47.5},\n"
              << "    \"analytics\": {\"competition\": {\"high_min_operators\": 3, \"high_min_price_spread\": 50,\n"
              << "                                  \"moderate_operator_count\": 2},\n"
              << "                  \"min_city_stations\": 3, \"min_operator_stations\": 5,\n"
              << "                  \"region_areas_km2\": {\"Pest\": 6393}, \"share_denominator\": \"non_null_keys\"}\n"
              << "  }\n\n"
              << "INPUT DATASET:\n\n"
              << "  - GeoJSON FeatureCollection of Point features in WGS84 (EPSG:4326)\n"
              << "  - Properties follow the station table columns: station_id, city, county, postal_code, country,\n"
              << "    operator, is_operational, num_charging_points, is_free, is_paid_unspecified,\n"
              << "    ac_price_huf_kwh, dc_price_huf_kwh, time_based_price_huf_min, usage_cost, creation_date, ...\n\n"
              << "Example:\n"
              << "  " << programName << " --stations-file stations.geojson --mode nearest --latitude 46.4303 --longitude 20.3188 --k 10\n\n"
              << "OTHER OPTIONS:\n"
              << "  --help, -h     Show this detailed help message\n"
              << "  --version, -v  Show version information\n";
}

std::unordered_map<std::string, std::string> parseArgs(int argc, char* argv[]) {
    std::unordered_map<std::string, std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg.substr(0, 2) == "--") {
            std::string key = arg.substr(2);

            // Values may be negative coordinates, so only "--" starts a new option
            if (i + 1 < argc && std::string(argv[i + 1]).substr(0, 2) != "--") {
                args[key] = argv[i + 1];
                i++;
            } else {
                args[key] = "true";
            }
        } else if (arg == "-h") {
            args["help"] = "true";
        } else if (arg == "-v") {
            args["version"] = "true";
        }
    }

    return args;
}

nlohmann::json readConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return nlohmann::json::parse(buffer.str());
}

bool hasSuffix(const std::string& value, const std::string& suffix) {
    return value.length() >= suffix.length() &&
           value.compare(value.length() - suffix.length(), suffix.length(), suffix) == 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        auto args = parseArgs(argc, argv);

        if (args.count("help") > 0 || args.count("h") > 0) {
            printDetailedHelp(argv[0]);
            return 0;
        }

        if (args.count("version") > 0 || args.count("v") > 0) {
            std::cout << "EvIndex v1.0.0\n";
            std::cout << "Charging Station Spatial Index and Analytics\n";
            return 0;
        }

        if (args.count("stations-file") == 0) {
            std::cerr << "Error: --stations-file is required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        if (args.count("mode") == 0) {
            std::cerr << "Error: --mode is required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        std::string mode = args.at("mode");
        const auto& names = queryNames();
        if (std::find(names.begin(), names.end(), mode) == names.end()) {
            std::cerr << "Error: Unknown mode '" << mode << "'" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        nlohmann::json config = nlohmann::json::object();
        if (args.count("config")) {
            config = readConfigFile(args.at("config"));
        }

        geometry::ProjectionConfig projection_cfg =
            parseProjectionConfig(config.value("projection", nlohmann::json::object()));
        catalog::StationCatalog station_catalog(projection_cfg);

        // Load stations
        nlohmann::json reader_config = nlohmann::json::object();
        reader_config["file_path"] = args.at("stations-file");
        if (args.count("station-id-field")) reader_config["id_field"] = args.at("station-id-field");
        if (args.count("load-mode")) reader_config["load_mode"] = args.at("load-mode");

        std::string load_result = processLoadTool(station_catalog, reader_config.dump());
        std::cout << load_result << std::endl;
        if (load_result.substr(0, 5) == "Error") {
            return 1;
        }

        // Convert arguments to a query request
        nlohmann::json params = nlohmann::json::object();
        if (args.count("latitude")) params["latitude"] = std::stod(args.at("latitude"));
        if (args.count("longitude")) params["longitude"] = std::stod(args.at("longitude"));
        if (args.count("k")) params["k"] = std::stoul(args.at("k"));
        if (args.count("operational-only")) params["operational_only"] = true;
        if (args.count("require-usage-cost")) params["require_usage_cost"] = true;
        if (args.count("require-capacity")) params["require_capacity"] = true;
        if (args.count("min-latitude")) params["min_latitude"] = std::stod(args.at("min-latitude"));
        if (args.count("min-longitude")) params["min_longitude"] = std::stod(args.at("min-longitude"));
        if (args.count("max-latitude")) params["max_latitude"] = std::stod(args.at("max-latitude"));
        if (args.count("max-longitude")) params["max_longitude"] = std::stod(args.at("max-longitude"));
        if (args.count("field")) params["field"] = args.at("field");
        if (args.count("n")) params["n"] = std::stoul(args.at("n"));
        if (args.count("price-field")) params["price_field"] = args.at("price-field");
        if (args.count("lenient")) params["strict"] = false;

        nlohmann::json request = nlohmann::json::object();
        request["query"] = mode;
        request["params"] = params;
        request["analytics"] = config.value("analytics", nlohmann::json::object());
        if (args.count("deadline-ms")) request["deadline_ms"] = std::stoll(args.at("deadline-ms"));

        nlohmann::json writer_config = nlohmann::json::object();
        if (args.count("output-file")) writer_config["output_file_path"] = args.at("output-file");
        io::ResultWriterConfig writer_cfg = parseResultWriterConfig(writer_config);

        // Coverage hulls go to GeoJSON when asked for
        if (mode == "coverage" && hasSuffix(writer_cfg.output_file_path, ".geojson")) {
            analytics::AnalyticsEngine engine(parseAnalyticsConfig(request["analytics"]));
            auto rows = engine.coverageAreas(station_catalog.snapshot(), station_catalog.projector());

            io::ResultWriter writer(writer_cfg);
            if (!writer.writeCoverage(rows)) {
                std::cerr << "Error: Failed to write coverage results: " << writer.getLastError() << std::endl;
                return 1;
            }
            std::cout << "Success: Coverage computed for " << rows.size() << " cities" << std::endl;
            return 0;
        }

        nlohmann::json response = executeQuery(station_catalog, request);
        if (response["status"] != "ok") {
            std::cerr << "Error: " << response["kind"].get<std::string>() << ": "
                      << response["message"].get<std::string>() << std::endl;
            return 1;
        }

        if (writer_cfg.output_file_path.empty()) {
            std::cout << response.dump(2) << std::endl;
        } else {
            io::ResultWriter writer(writer_cfg);
            if (!writer.writeJson(response)) {
                std::cerr << "Error: Failed to write results: " << writer.getLastError() << std::endl;
                return 1;
            }
        }

        std::cout << "Success: " << mode << " returned " << response["row_count"].get<size_t>() << " rows"
                  << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
