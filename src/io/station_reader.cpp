#include "io/station_reader.hpp"
#include "io/geojson_reader.hpp"
#include <iostream>
#include <limits>

namespace evindex {
namespace io {

using geometry::getFieldValueAsBool;
using geometry::getFieldValueAsDouble;
using geometry::getFieldValueAsInt64;
using geometry::getFieldValueAsString;

StationReader::StationReader(const StationReaderConfig& config)
    : config_(config), skipped_(0) {
}

StationReader::~StationReader() = default;

bool StationReader::read() {
    records_.clear();
    skipped_ = 0;

    try {
        geometry::GeospatialDataset dataset = GeoJSONReader::readFromFile(config_.file_path);

        coordinate_system_crs_ = dataset.crs;

        std::cout << "Station dataset coordinate system: " << coordinate_system_crs_ << std::endl;
        std::cout << "Station feature count: " << dataset.features.size() << std::endl;

        return readDataset(dataset);

    } catch (const std::exception& e) {
        std::cerr << "Failed to read station file: " << config_.file_path << std::endl;
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }
}

bool StationReader::readDataset(const geometry::GeospatialDataset& dataset) {
    records_.clear();
    skipped_ = 0;
    coordinate_system_crs_ = dataset.crs;

    // Check if the specified ID field exists in the first feature
    std::string id_field = config_.id_field;
    if (!dataset.features.empty() && !dataset.features[0].properties.contains(id_field)) {
        std::cout << "Warning: Specified ID field '" << id_field
                  << "' not found. Falling back to feature index." << std::endl;
        id_field.clear();
    }

    for (const auto& feature : dataset.features) {
        auto record = parseStation(feature, id_field);
        if (!record) {
            ++skipped_;
            continue;
        }
        records_.push_back(*record);
    }

    if (skipped_ > 0) {
        std::cerr << "Warning: Skipped " << skipped_ << " features without a point geometry" << std::endl;
    }

    if (records_.empty()) {
        std::cerr << "Warning: No valid station features found in dataset" << std::endl;
        return false;
    }

    std::cout << "Successfully read " << records_.size() << " station records" << std::endl;
    return true;
}

std::optional<catalog::StationRecord> StationReader::parseStation(const geometry::GeospatialFeature& feature,
                                                                  const std::string& id_field) {
    std::optional<geometry::GeoPoint> location = geometry::geoJSONPointToGeo(feature.geometry);
    if (!location) {
        return std::nullopt;
    }

    const nlohmann::json& props = feature.properties;
    catalog::StationRecord record;

    auto id = getFieldValueAsInt64(props, id_field);
    if (id) {
        record.id = *id;
    } else {
        if (!id_field.empty()) {
            std::cerr << "Warning: Could not get ID for feature " << feature.id
                      << ". Using feature index instead." << std::endl;
        }
        record.id = static_cast<StationId>(feature.id);
    }

    record.location = *location;

    record.address.city = getFieldValueAsString(props, "city");
    record.address.county = getFieldValueAsString(props, "county");
    record.address.country = getFieldValueAsString(props, "country");
    record.address.postal_code = getFieldValueAsString(props, "postal_code");
    record.operator_name = getFieldValueAsString(props, "operator");

    auto operational = getFieldValueAsBool(props, "is_operational");
    if (operational) {
        record.status = *operational ? catalog::OperationalStatus::OPERATIONAL
                                     : catalog::OperationalStatus::NON_OPERATIONAL;
    }

    // Out-of-range counts are kept negative so the catalog rejects them
    auto capacity = getFieldValueAsInt64(props, "num_charging_points");
    if (capacity) {
        if (*capacity > std::numeric_limits<int>::max() || *capacity < std::numeric_limits<int>::min()) {
            record.capacity = -1;
        } else {
            record.capacity = static_cast<int>(*capacity);
        }
    }

    record.pricing.is_free = getFieldValueAsBool(props, "is_free").value_or(false);
    record.pricing.is_paid_unspecified = getFieldValueAsBool(props, "is_paid_unspecified").value_or(false);
    record.pricing.ac_price_per_kwh = getFieldValueAsDouble(props, "ac_price_huf_kwh");
    record.pricing.dc_price_per_kwh = getFieldValueAsDouble(props, "dc_price_huf_kwh");
    record.pricing.price_per_minute = getFieldValueAsDouble(props, "time_based_price_huf_min");
    record.pricing.usage_cost = getFieldValueAsString(props, "usage_cost");
    record.pricing.additional_fees = getFieldValueAsString(props, "additional_fees");

    record.access.inaccessible = getFieldValueAsBool(props, "is_inaccessible").value_or(false);
    record.access.membership_required = getFieldValueAsBool(props, "is_membership_required").value_or(false);
    record.access.pay_at_location = getFieldValueAsBool(props, "is_pay_at_location").value_or(false);

    record.creation_date = parseDate(getFieldValueAsString(props, "creation_date"));
    record.last_verified_date = parseDate(getFieldValueAsString(props, "last_verified_date"));

    record.access_comments = getFieldValueAsString(props, "access_comments");
    record.notes = getFieldValueAsString(props, "notes");

    return record;
}

std::optional<catalog::Date> StationReader::parseDate(const std::optional<std::string>& text) {
    if (!text || text->size() < 10) {
        return std::nullopt;
    }
    try {
        catalog::Date date = boost::gregorian::from_simple_string(text->substr(0, 10));
        if (date.is_special()) {
            return std::nullopt;
        }
        return date;
    } catch (const std::exception& e) {
        std::cerr << "Warning: Ignoring unparseable date '" << *text << "': " << e.what() << std::endl;
        return std::nullopt;
    }
}

void StationReader::clearRecords() {
    records_.clear();
    std::cout << "Cleared station records" << std::endl;
}

} // namespace io
} // namespace evindex
