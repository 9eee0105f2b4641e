#include "catalog/station.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <sstream>

namespace evindex {
namespace catalog {

namespace {

void validatePrice(const std::optional<double>& price, const char* field, StationId id) {
    if (!price) {
        return;
    }
    if (!std::isfinite(*price) || *price < 0.0) {
        std::ostringstream error_msg;
        error_msg << "Station " << id << ": " << field << " must be a non-negative number, got " << *price;
        throw EvIndexError(ErrorKind::MALFORMED_RECORD, error_msg.str());
    }
}

bool hasPositivePrice(const Pricing& pricing) {
    return (pricing.ac_price_per_kwh && *pricing.ac_price_per_kwh > 0.0) ||
           (pricing.dc_price_per_kwh && *pricing.dc_price_per_kwh > 0.0) ||
           (pricing.price_per_minute && *pricing.price_per_minute > 0.0);
}

} // namespace

std::string operationalStatusName(OperationalStatus status) {
    switch (status) {
        case OperationalStatus::OPERATIONAL:
            return "operational";
        case OperationalStatus::NON_OPERATIONAL:
            return "non-operational";
        case OperationalStatus::UNKNOWN:
            return "unknown";
    }
    return "unknown";
}

std::string pricingModelName(PricingModel model) {
    switch (model) {
        case PricingModel::PER_ENERGY:
            return "Per kWh Only";
        case PricingModel::PER_TIME:
            return "Per Minute Only";
        case PricingModel::HYBRID:
            return "Hybrid Pricing";
        case PricingModel::FREE:
            return "Free";
        case PricingModel::UNSPECIFIED:
            return "Unknown/Other";
    }
    return "Unknown/Other";
}

PricingModel Pricing::model() const {
    if (ac_price_per_kwh && !price_per_minute) {
        return PricingModel::PER_ENERGY;
    }
    if (price_per_minute && !ac_price_per_kwh) {
        return PricingModel::PER_TIME;
    }
    if (ac_price_per_kwh && price_per_minute) {
        return PricingModel::HYBRID;
    }
    if (is_free) {
        return PricingModel::FREE;
    }
    return PricingModel::UNSPECIFIED;
}

bool StationRecord::operator==(const StationRecord& other) const {
    return id == other.id && location == other.location && address == other.address &&
           operator_name == other.operator_name && status == other.status &&
           capacity == other.capacity && pricing == other.pricing && access == other.access &&
           creation_date == other.creation_date && last_verified_date == other.last_verified_date &&
           access_comments == other.access_comments && notes == other.notes;
}

void Station::validateRecord(const StationRecord& record) {
    geometry::Projector::validateGeoPoint(record.location);

    if (record.capacity && *record.capacity < 0) {
        throw EvIndexError(ErrorKind::MALFORMED_RECORD,
                           "Station " + std::to_string(record.id) + ": capacity must be non-negative, got " +
                           std::to_string(*record.capacity));
    }

    validatePrice(record.pricing.ac_price_per_kwh, "AC price per kWh", record.id);
    validatePrice(record.pricing.dc_price_per_kwh, "DC price per kWh", record.id);
    validatePrice(record.pricing.price_per_minute, "price per minute", record.id);

    if (record.pricing.is_free && record.pricing.is_paid_unspecified) {
        throw EvIndexError(ErrorKind::MALFORMED_RECORD,
                           "Station " + std::to_string(record.id) + ": marked both free and paid-unspecified");
    }
    if (record.pricing.is_free && hasPositivePrice(record.pricing)) {
        throw EvIndexError(ErrorKind::MALFORMED_RECORD,
                           "Station " + std::to_string(record.id) + ": marked free but carries a positive price");
    }
}

Station Station::fromRecord(const StationRecord& record, const geometry::Projector& projector) {
    validateRecord(record);
    return Station(record, projector.project(record.location));
}

} // namespace catalog
} // namespace evindex
