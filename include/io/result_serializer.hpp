#ifndef EVINDEX_RESULT_SERIALIZER_HPP
#define EVINDEX_RESULT_SERIALIZER_HPP

#include <vector>
#include <nlohmann/json.hpp>
#include "analytics/analytics_engine.hpp"
#include "analytics/data_quality_validator.hpp"
#include "catalog/station_catalog.hpp"

namespace evindex {
namespace io {

// JSON conversion of result rows; every function returns an array of row objects

nlohmann::json stationToJson(const catalog::Station& station);

nlohmann::json toJson(const std::vector<catalog::NearestStation>& rows);
nlohmann::json toJson(const std::vector<catalog::StationPtr>& rows);
nlohmann::json toJson(const std::vector<analytics::StatusCountRow>& rows);
nlohmann::json toJson(const std::vector<analytics::GroupCountRow>& rows);
nlohmann::json toJson(const std::vector<analytics::ShareRow>& rows);
nlohmann::json toJson(const std::vector<analytics::PriceStatsRow>& rows);
nlohmann::json toJson(const std::vector<analytics::DensityRow>& rows);
nlohmann::json toJson(const std::vector<analytics::CompetitionRow>& rows);
nlohmann::json toJson(const std::vector<analytics::MonthlyCountRow>& rows);
nlohmann::json toJson(const std::vector<analytics::CapacityCountRow>& rows);
nlohmann::json toJson(const std::vector<analytics::CoverageAreaRow>& rows);
nlohmann::json toJson(const std::vector<analytics::PricingModelRow>& rows);
nlohmann::json toJson(const std::vector<analytics::OperatorStrategyRow>& rows);
nlohmann::json toJson(const std::vector<analytics::DataQualityIssue>& rows);

/**
 * Summary of a bulk load as a JSON object
 */
nlohmann::json toJson(const catalog::LoadSummary& summary);

/**
 * Coverage hulls as GeoJSON polygons in degrees, one feature per city
 * Degenerate hulls are written with a null geometry.
 */
geometry::GeospatialDataset coverageToDataset(const std::vector<analytics::CoverageAreaRow>& rows);

} // namespace io
} // namespace evindex

#endif // EVINDEX_RESULT_SERIALIZER_HPP
