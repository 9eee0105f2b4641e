#ifndef EVINDEX_QUERY_INTERFACE_HPP
#define EVINDEX_QUERY_INTERFACE_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "analytics/analytics_config.hpp"
#include "analytics/analytics_engine.hpp"
#include "catalog/station_catalog.hpp"
#include "geometry/projection.hpp"
#include "io/result_writer.hpp"
#include "io/station_reader.hpp"

namespace evindex {
namespace service {

// Configuration helpers; absent keys keep their defaults

io::StationReaderConfig parseStationReaderConfig(const nlohmann::json& config_json);
io::ResultWriterConfig parseResultWriterConfig(const nlohmann::json& config_json);
geometry::ProjectionConfig parseProjectionConfig(const nlohmann::json& config_json);
analytics::AnalyticsConfig parseAnalyticsConfig(const nlohmann::json& config_json);
catalog::LoadMode parseLoadMode(const std::string& mode);
analytics::GroupField parseGroupField(const std::string& field);
analytics::PriceField parsePriceField(const std::string& field);

/**
 * Station Load Tool
 * Reads a station file and bulk loads it into the catalog
 * @param station_catalog Target catalog
 * @param reader_config_json JSON string for station reader configuration (file_path, id_field, load_mode)
 * @return Result message (success or error)
 */
std::string processLoadTool(catalog::StationCatalog& station_catalog, const std::string& reader_config_json);

/**
 * Run one query against the catalog
 * Request: {"query": name, "params": {...}, "analytics": {...}, "deadline_ms": n}
 * @param station_catalog Catalog to query
 * @param request Parsed request
 * @return {"status": "ok", "query": name, "row_count": n, "rows": [...]} or
 *         {"status": "error", "kind": ..., "message": ...}
 * An InternalInconsistency error repairs the catalog's spatial index before returning
 * and reports it as "index_rebuilt"
 */
nlohmann::json executeQuery(catalog::StationCatalog& station_catalog, const nlohmann::json& request);

/**
 * Run one query given as JSON text
 * @return Response JSON text
 */
std::string processQuery(catalog::StationCatalog& station_catalog, const std::string& request_json);

/**
 * Names of every supported query
 */
const std::vector<std::string>& queryNames();

} // namespace service
} // namespace evindex

#endif // EVINDEX_QUERY_INTERFACE_HPP
