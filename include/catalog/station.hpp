#ifndef EVINDEX_STATION_HPP
#define EVINDEX_STATION_HPP

#include <string>
#include <optional>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "geometry/common.hpp"
#include "geometry/projection.hpp"
#include "index/spatial_index.hpp"

namespace evindex {
namespace catalog {

using Date = boost::gregorian::date;

// Operational status (tri-state, null in the source maps to UNKNOWN)
enum class OperationalStatus {
    OPERATIONAL,
    NON_OPERATIONAL,
    UNKNOWN
};

// Pricing model derived from the price fields
enum class PricingModel {
    PER_ENERGY,     // AC price per kWh only
    PER_TIME,       // Price per minute only
    HYBRID,         // Both per kWh and per minute
    FREE,
    UNSPECIFIED     // Paid, price unknown
};

std::string operationalStatusName(OperationalStatus status);
std::string pricingModelName(PricingModel model);

// Location attributes (free text, optional)
struct LocationAttributes {
    std::optional<std::string> city;
    std::optional<std::string> county;
    std::optional<std::string> country;
    std::optional<std::string> postal_code;

    bool operator==(const LocationAttributes& other) const {
        return city == other.city && county == other.county &&
               country == other.country && postal_code == other.postal_code;
    }
};

// Pricing fields (prices in local currency)
struct Pricing {
    bool is_free = false;
    bool is_paid_unspecified = false;
    std::optional<double> ac_price_per_kwh;
    std::optional<double> dc_price_per_kwh;
    std::optional<double> price_per_minute;
    std::optional<std::string> usage_cost;
    std::optional<std::string> additional_fees;

    /**
     * Classify the pricing model; price fields take precedence over the free flag
     */
    PricingModel model() const;

    bool operator==(const Pricing& other) const {
        return is_free == other.is_free && is_paid_unspecified == other.is_paid_unspecified &&
               ac_price_per_kwh == other.ac_price_per_kwh && dc_price_per_kwh == other.dc_price_per_kwh &&
               price_per_minute == other.price_per_minute && usage_cost == other.usage_cost &&
               additional_fees == other.additional_fees;
    }
};

// Independent access flags
struct AccessFlags {
    bool inaccessible = false;
    bool membership_required = false;
    bool pay_at_location = false;

    bool operator==(const AccessFlags& other) const {
        return inaccessible == other.inaccessible && membership_required == other.membership_required &&
               pay_at_location == other.pay_at_location;
    }
};

// Normalized station record as delivered by the cleaning step
struct StationRecord {
    StationId id = 0;
    geometry::GeoPoint location;
    LocationAttributes address;
    std::optional<std::string> operator_name;
    OperationalStatus status = OperationalStatus::UNKNOWN;
    std::optional<int> capacity;            // Number of charging points
    Pricing pricing;
    AccessFlags access;
    std::optional<Date> creation_date;
    std::optional<Date> last_verified_date;
    std::optional<std::string> access_comments;
    std::optional<std::string> notes;

    bool operator==(const StationRecord& other) const;
    bool operator!=(const StationRecord& other) const { return !(*this == other); }
};

/**
 * Immutable station entity.
 * The planar location is always derived from the geographic location at
 * construction, so the two can never disagree.
 */
class Station {
public:
    /**
     * Validate a record and derive its planar location
     * @param record Normalized record
     * @param projector Projection to the metric plane
     * @return Station
     * @throws EvIndexError(INVALID_COORDINATE) for out-of-range coordinates
     * @throws EvIndexError(MALFORMED_RECORD) for negative capacity or price, or
     *         an unknown pricing combination
     */
    static Station fromRecord(const StationRecord& record, const geometry::Projector& projector);

    /**
     * Check the schema rules that do not need the projection
     * @throws EvIndexError(MALFORMED_RECORD)
     */
    static void validateRecord(const StationRecord& record);

    StationId id() const { return record_.id; }
    const geometry::GeoPoint& geoLocation() const { return record_.location; }
    const geometry::Point& planarLocation() const { return planar_; }

    const LocationAttributes& address() const { return record_.address; }
    const std::optional<std::string>& city() const { return record_.address.city; }
    const std::optional<std::string>& county() const { return record_.address.county; }
    const std::optional<std::string>& operatorName() const { return record_.operator_name; }
    OperationalStatus status() const { return record_.status; }
    bool isOperational() const { return record_.status == OperationalStatus::OPERATIONAL; }
    const std::optional<int>& capacity() const { return record_.capacity; }
    const Pricing& pricing() const { return record_.pricing; }
    const AccessFlags& access() const { return record_.access; }
    const std::optional<Date>& creationDate() const { return record_.creation_date; }
    const std::optional<Date>& lastVerifiedDate() const { return record_.last_verified_date; }

    const StationRecord& record() const { return record_; }

private:
    Station(const StationRecord& record, const geometry::Point& planar)
        : record_(record), planar_(planar) {}

    StationRecord record_;
    geometry::Point planar_;
};

} // namespace catalog
} // namespace evindex

#endif // EVINDEX_STATION_HPP
