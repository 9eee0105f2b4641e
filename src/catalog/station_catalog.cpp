#include "catalog/station_catalog.hpp"
#include <iostream>
#include <sstream>
#include <unordered_set>
#include <mutex>
#include <algorithm>

namespace evindex {
namespace catalog {

StationSnapshot StationSnapshot::filter(const StationPredicate& predicate) const {
    std::vector<StationPtr> result;
    for (const StationPtr& station : *stations_) {
        if (!predicate || predicate(*station)) {
            result.push_back(station);
        }
    }
    return StationSnapshot(std::move(result));
}

StationSnapshot StationScan::collect() const {
    return StationSnapshot(std::vector<StationPtr>(begin(), end()));
}

size_t StationScan::count() const {
    size_t n = 0;
    for (auto it = begin(); it != end(); ++it) {
        ++n;
    }
    return n;
}

StationCatalog::StationCatalog(const geometry::ProjectionConfig& projection,
                               const index::SpatialIndexParameters& index_parameters)
    : projector_(std::make_unique<geometry::Projector>(projection)),
      index_(index_parameters) {
}

bool StationCatalog::upsert(const StationRecord& record) {
    // Validation and projection happen before any lock is taken
    StationPtr station = std::make_shared<const Station>(Station::fromRecord(record, *projector_));

    std::unique_lock<std::shared_timed_mutex> lock(mutex_);
    return applyLocked(station, false);
}

void StationCatalog::insert(const StationRecord& record) {
    StationPtr station = std::make_shared<const Station>(Station::fromRecord(record, *projector_));

    std::unique_lock<std::shared_timed_mutex> lock(mutex_);
    applyLocked(station, true);
}

bool StationCatalog::remove(StationId id) {
    std::unique_lock<std::shared_timed_mutex> lock(mutex_);

    auto it = stations_.find(id);
    if (it == stations_.end()) {
        return false;
    }

    try {
        index_.remove(id);
    } catch (const std::exception& e) {
        std::cerr << "Error: Index update failed while removing station " << id << ": " << e.what() << std::endl;
        rebuildIndexLocked();
        throw;
    }
    stations_.erase(it);
    return true;
}

std::optional<Station> StationCatalog::get(StationId id) const {
    StationPtr station = find(id);
    if (!station) {
        return std::nullopt;
    }
    return *station;
}

StationPtr StationCatalog::find(StationId id) const {
    std::shared_lock<std::shared_timed_mutex> lock(mutex_);
    auto it = stations_.find(id);
    if (it == stations_.end()) {
        return nullptr;
    }
    return it->second;
}

size_t StationCatalog::size() const {
    std::shared_lock<std::shared_timed_mutex> lock(mutex_);
    return stations_.size();
}

StationSnapshot StationCatalog::snapshot() const {
    std::shared_lock<std::shared_timed_mutex> lock(mutex_);
    return snapshotLocked();
}

StationSnapshot StationCatalog::snapshot(Clock::time_point deadline) const {
    std::shared_lock<std::shared_timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_until(deadline)) {
        throw EvIndexError(ErrorKind::TIMEOUT, "Timed out waiting for a catalog snapshot");
    }
    return snapshotLocked();
}

StationScan StationCatalog::scan(const StationPredicate& predicate) const {
    return StationScan(snapshot(), predicate);
}

std::vector<NearestStation> StationCatalog::nearestK(const geometry::GeoPoint& query_point, size_t k,
                                                     const StationPredicate& predicate) const {
    std::vector<NearestStation> result;
    geometry::Point planar = projector_->project(query_point);
    if (k == 0) {
        return result;
    }

    std::shared_lock<std::shared_timed_mutex> lock(mutex_);

    index::SpatialIndex::Predicate id_predicate;
    if (predicate) {
        id_predicate = [this, &predicate](StationId id) {
            auto it = stations_.find(id);
            return it != stations_.end() && predicate(*it->second);
        };
    }

    std::vector<index::NearestResult> nearest = index_.nearestK(planar, k, id_predicate);
    result.reserve(nearest.size());
    for (const auto& hit : nearest) {
        auto it = stations_.find(hit.id);
        if (it == stations_.end()) {
            throw EvIndexError(ErrorKind::INTERNAL_INCONSISTENCY,
                               "Index returned station " + std::to_string(hit.id) + " which is not in the catalog");
        }
        result.push_back(NearestStation{it->second, hit.distance});
    }
    return result;
}

std::vector<StationPtr> StationCatalog::rangeQuery(const geometry::Box& box) const {
    std::shared_lock<std::shared_timed_mutex> lock(mutex_);
    return resolveLocked(index_.rangeQuery(box));
}

std::vector<StationPtr> StationCatalog::rangeQuery(const geometry::GeoBox& box) const {
    geometry::Point min_corner = projector_->project(box.min_corner);
    geometry::Point max_corner = projector_->project(box.max_corner);

    geometry::Box planar_box(
        geometry::Point(std::min(geometry::bg::get<0>(min_corner), geometry::bg::get<0>(max_corner)),
                        std::min(geometry::bg::get<1>(min_corner), geometry::bg::get<1>(max_corner))),
        geometry::Point(std::max(geometry::bg::get<0>(min_corner), geometry::bg::get<0>(max_corner)),
                        std::max(geometry::bg::get<1>(min_corner), geometry::bg::get<1>(max_corner))));
    return rangeQuery(planar_box);
}

LoadSummary StationCatalog::load(const std::vector<StationRecord>& records, LoadMode mode) {
    LoadSummary summary;

    // Validate and project every record before touching the catalog
    std::vector<StationPtr> prepared;
    prepared.reserve(records.size());
    std::unordered_set<StationId> batch_ids;

    for (size_t i = 0; i < records.size(); ++i) {
        const StationRecord& record = records[i];
        try {
            if (!batch_ids.insert(record.id).second) {
                throw EvIndexError(ErrorKind::MALFORMED_RECORD,
                                   "Station id " + std::to_string(record.id) + " appears more than once in the batch");
            }
            prepared.push_back(std::make_shared<const Station>(Station::fromRecord(record, *projector_)));
        } catch (const EvIndexError& e) {
            if (mode == LoadMode::ATOMIC) {
                std::ostringstream error_msg;
                error_msg << "Record " << i << " (station id " << record.id << ") rejected: " << e.what();
                throw EvIndexError(ErrorKind::MALFORMED_RECORD, error_msg.str());
            }
            std::cerr << "Warning: Skipping record " << i << " (station id " << record.id << "): "
                      << e.what() << std::endl;
            summary.failures.push_back(LoadFailure{i, record.id, e.kind(), e.what()});
        }
    }

    std::unique_lock<std::shared_timed_mutex> lock(mutex_);

    std::map<StationId, StationPtr> updated = stations_;
    for (const StationPtr& station : prepared) {
        updated[station->id()] = station;
    }

    std::vector<index::IndexEntry> entries;
    entries.reserve(updated.size());
    for (const auto& pair : updated) {
        entries.emplace_back(pair.first, pair.second->planarLocation());
    }

    try {
        index_.build(entries);
    } catch (const std::exception& e) {
        std::cerr << "Error: Index build failed during load: " << e.what() << std::endl;
        rebuildIndexLocked();
        throw;
    }
    stations_.swap(updated);

    summary.loaded = prepared.size();
    std::cout << "Loaded " << summary.loaded << " stations";
    if (!summary.failures.empty()) {
        std::cout << " (" << summary.failures.size() << " rejected)";
    }
    std::cout << std::endl;
    return summary;
}

bool StationCatalog::verifyConsistency(std::string* reason) const {
    std::shared_lock<std::shared_timed_mutex> lock(mutex_);
    std::string violation;
    bool consistent = verifyLocked(violation);
    if (!consistent && reason) {
        *reason = violation;
    }
    return consistent;
}

void StationCatalog::rebuildIndex() {
    std::unique_lock<std::shared_timed_mutex> lock(mutex_);
    rebuildIndexLocked();
}

bool StationCatalog::ensureConsistency() {
    std::unique_lock<std::shared_timed_mutex> lock(mutex_);
    std::string violation;
    if (verifyLocked(violation)) {
        return false;
    }
    std::cerr << "Error: Catalog and index disagree (" << violation << "), rebuilding index" << std::endl;
    rebuildIndexLocked();
    return true;
}

size_t StationCatalog::indexHeight() const {
    std::shared_lock<std::shared_timed_mutex> lock(mutex_);
    return index_.height();
}

std::vector<index::IndexEntry> StationCatalog::indexEntries() const {
    std::shared_lock<std::shared_timed_mutex> lock(mutex_);
    return index_.entries();
}

bool StationCatalog::applyLocked(const StationPtr& station, bool strict) {
    StationId id = station->id();
    auto it = stations_.find(id);

    if (it != stations_.end()) {
        if (strict) {
            throw EvIndexError(ErrorKind::DUPLICATE_ID, "Station " + std::to_string(id) + " already exists");
        }
        if (it->second->record() == station->record()) {
            return false;
        }
    }

    try {
        if (it != stations_.end()) {
            index_.remove(id);
        }
        index_.insert(id, station->planarLocation());
    } catch (const std::exception& e) {
        std::cerr << "Error: Index update failed for station " << id << ": " << e.what() << std::endl;
        rebuildIndexLocked();
        throw;
    }

    stations_[id] = station;
    return true;
}

void StationCatalog::rebuildIndexLocked() {
    std::vector<index::IndexEntry> entries;
    entries.reserve(stations_.size());
    for (const auto& pair : stations_) {
        entries.emplace_back(pair.first, pair.second->planarLocation());
    }
    index_.build(entries);
}

bool StationCatalog::verifyLocked(std::string& reason) const {
    if (!index_.checkInvariants(&reason)) {
        return false;
    }
    if (index_.size() != stations_.size()) {
        reason = "index holds " + std::to_string(index_.size()) + " entries for " +
                 std::to_string(stations_.size()) + " stations";
        return false;
    }
    for (const auto& pair : stations_) {
        std::optional<geometry::Point> indexed = index_.pointOf(pair.first);
        if (!indexed) {
            reason = "station " + std::to_string(pair.first) + " is not indexed";
            return false;
        }
        const geometry::Point& planar = pair.second->planarLocation();
        if (geometry::bg::get<0>(*indexed) != geometry::bg::get<0>(planar) ||
            geometry::bg::get<1>(*indexed) != geometry::bg::get<1>(planar)) {
            reason = "station " + std::to_string(pair.first) + " is indexed at a stale location";
            return false;
        }
    }
    return true;
}

StationSnapshot StationCatalog::snapshotLocked() const {
    std::vector<StationPtr> stations;
    stations.reserve(stations_.size());
    for (const auto& pair : stations_) {
        stations.push_back(pair.second);
    }
    return StationSnapshot(std::move(stations));
}

std::vector<StationPtr> StationCatalog::resolveLocked(const std::vector<StationId>& ids) const {
    std::vector<StationPtr> result;
    result.reserve(ids.size());
    for (StationId id : ids) {
        auto it = stations_.find(id);
        if (it == stations_.end()) {
            throw EvIndexError(ErrorKind::INTERNAL_INCONSISTENCY,
                               "Index returned station " + std::to_string(id) + " which is not in the catalog");
        }
        result.push_back(it->second);
    }
    return result;
}

} // namespace catalog
} // namespace evindex
