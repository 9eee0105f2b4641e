#ifndef EVINDEX_STATION_READER_HPP
#define EVINDEX_STATION_READER_HPP

#include <string>
#include <vector>
#include <optional>
#include "catalog/station.hpp"
#include "geometry/common.hpp"

namespace evindex {
namespace io {

// Station reader configuration
struct StationReaderConfig {
    std::string file_path;          // Input file path (GeoJSON, WGS84 points)
    std::string id_field;           // Field name for station ID (uses feature index if not found)

    StationReaderConfig() : id_field("station_id") {}
};

/**
 * Reads station features and turns their properties into normalized records.
 * Property names follow the station table columns (city, operator,
 * is_operational, num_charging_points, ac_price_huf_kwh, ...).
 */
class StationReader {
public:
    explicit StationReader(const StationReaderConfig& config);
    ~StationReader();

    // Disable copy constructor and assignment
    StationReader(const StationReader&) = delete;
    StationReader& operator=(const StationReader&) = delete;

    /**
     * Read station features from file
     * @return true if successful, false otherwise
     */
    bool read();

    /**
     * Read station features from an already parsed dataset
     * @return true if at least one record was produced
     */
    bool readDataset(const geometry::GeospatialDataset& dataset);

    size_t getRecordCount() const { return records_.size(); }

    /**
     * Get all records in file order
     */
    const std::vector<catalog::StationRecord>& getRecords() const { return records_; }

    /**
     * Number of features skipped for lacking a usable point geometry
     */
    size_t getSkippedCount() const { return skipped_; }

    std::string getCoordinateSystemCRS() const { return coordinate_system_crs_; }

    /**
     * Convert one feature into a record
     * @param feature GeoJSON feature with a Point geometry
     * @param id_field Property holding the station id
     * @return Record, or nullopt if the geometry is not a point
     */
    static std::optional<catalog::StationRecord> parseStation(const geometry::GeospatialFeature& feature,
                                                              const std::string& id_field);

    /**
     * Parse an ISO date ("2023-05-17", a trailing time part is ignored)
     * @return Date, or nullopt for empty or unparseable text
     */
    static std::optional<catalog::Date> parseDate(const std::optional<std::string>& text);

    void clearRecords();

private:
    StationReaderConfig config_;
    std::vector<catalog::StationRecord> records_;
    size_t skipped_;
    std::string coordinate_system_crs_;
};

} // namespace io
} // namespace evindex

#endif // EVINDEX_STATION_READER_HPP
