#ifndef EVINDEX_STATION_CATALOG_HPP
#define EVINDEX_STATION_CATALOG_HPP

#include <map>
#include <memory>
#include <vector>
#include <string>
#include <chrono>
#include <optional>
#include <functional>
#include <shared_mutex>
#include <type_traits>
#include <boost/iterator/filter_iterator.hpp>
#include "catalog/station.hpp"
#include "core/errors.hpp"
#include "geometry/projection.hpp"
#include "index/spatial_index.hpp"

namespace evindex {
namespace catalog {

using StationPtr = std::shared_ptr<const Station>;
using StationPredicate = std::function<bool(const Station&)>;
using Clock = std::chrono::steady_clock;

/**
 * Immutable point-in-time view of the catalog, ordered by station id.
 * Copies share the same underlying vector.
 */
class StationSnapshot {
public:
    using const_iterator = std::vector<StationPtr>::const_iterator;

    StationSnapshot() : stations_(std::make_shared<const std::vector<StationPtr>>()) {}
    explicit StationSnapshot(std::vector<StationPtr> stations)
        : stations_(std::make_shared<const std::vector<StationPtr>>(std::move(stations))) {}

    const_iterator begin() const { return stations_->begin(); }
    const_iterator end() const { return stations_->end(); }
    size_t size() const { return stations_->size(); }
    bool empty() const { return stations_->empty(); }
    const Station& operator[](size_t i) const { return *(*stations_)[i]; }
    const std::vector<StationPtr>& stations() const { return *stations_; }

    /**
     * Materialize the stations that satisfy a predicate
     * @param predicate Filter, an empty function keeps everything
     * @return New snapshot in the same order
     */
    StationSnapshot filter(const StationPredicate& predicate) const;

private:
    std::shared_ptr<const std::vector<StationPtr>> stations_;
};

// Adapts a station predicate to snapshot elements
struct StationFilter {
    StationPredicate predicate;

    StationFilter() = default;
    explicit StationFilter(StationPredicate pred) : predicate(std::move(pred)) {}

    bool operator()(const StationPtr& station) const {
        return !predicate || predicate(*station);
    }
};

/**
 * Lazy filtered sequence over a snapshot.
 * Iteration can be restarted any number of times and never observes
 * mutations made after the scan was created.
 */
class StationScan {
public:
    using iterator = boost::filter_iterator<StationFilter, StationSnapshot::const_iterator>;

    StationScan(const StationSnapshot& snapshot, const StationPredicate& predicate)
        : snapshot_(snapshot), filter_(predicate) {}

    iterator begin() const {
        return boost::make_filter_iterator(filter_, snapshot_.begin(), snapshot_.end());
    }
    iterator end() const {
        return boost::make_filter_iterator(filter_, snapshot_.end(), snapshot_.end());
    }

    /**
     * Materialize the matching stations
     */
    StationSnapshot collect() const;

    size_t count() const;

private:
    StationSnapshot snapshot_;
    StationFilter filter_;
};

/**
 * Group stations by a key, preserving input order inside each group.
 * Keys may be std::optional; a null key forms its own group.
 * @param key_fn Key extractor taking a const Station&
 * @param records Any range of StationPtr
 * @return Ordered map from key to the stations in that group
 */
template <typename KeyFn, typename Range>
auto groupBy(KeyFn key_fn, const Range& records)
    -> std::map<typename std::decay<decltype(key_fn(std::declval<const Station&>()))>::type,
                std::vector<StationPtr>> {
    using Key = typename std::decay<decltype(key_fn(std::declval<const Station&>()))>::type;
    std::map<Key, std::vector<StationPtr>> groups;
    for (const StationPtr& station : records) {
        groups[key_fn(*station)].push_back(station);
    }
    return groups;
}

// Bulk load behavior on invalid records
enum class LoadMode {
    ATOMIC,         // First failure aborts the load, nothing is committed
    BEST_EFFORT     // Valid records are committed, failures are reported
};

// A record rejected during a best-effort load
struct LoadFailure {
    size_t record_index;
    StationId id;
    ErrorKind kind;
    std::string message;
};

// Outcome of a bulk load
struct LoadSummary {
    size_t loaded = 0;
    std::vector<LoadFailure> failures;
};

// Nearest station with its planar distance
struct NearestStation {
    StationPtr station;
    double distance;    // Meters
};

/**
 * Owner of all stations and of the spatial index over them.
 * Readers take a shared lock, mutations an exclusive lock; the station map
 * and the index are always updated inside the same exclusive section.
 */
class StationCatalog {
public:
    /**
     * @param projection Planar projection used for the index
     * @param index_parameters R-tree node fill bounds
     */
    explicit StationCatalog(const geometry::ProjectionConfig& projection = geometry::ProjectionConfig(),
                            const index::SpatialIndexParameters& index_parameters = index::SpatialIndexParameters());

    // Disable copy constructor and assignment
    StationCatalog(const StationCatalog&) = delete;
    StationCatalog& operator=(const StationCatalog&) = delete;

    /**
     * Insert or replace a station
     * Re-applying an identical record leaves the catalog unchanged.
     * @param record Normalized record
     * @return true if the catalog changed
     * @throws EvIndexError(INVALID_COORDINATE) or EvIndexError(MALFORMED_RECORD)
     */
    bool upsert(const StationRecord& record);

    /**
     * Insert a station whose id must not be present yet
     * @throws EvIndexError(DUPLICATE_ID) if the id is live
     */
    void insert(const StationRecord& record);

    /**
     * Remove a station
     * @return true if the id was present
     */
    bool remove(StationId id);

    std::optional<Station> get(StationId id) const;
    StationPtr find(StationId id) const;
    size_t size() const;

    /**
     * Capture every station in id order
     */
    StationSnapshot snapshot() const;

    /**
     * Capture every station, waiting for the shared lock no longer than the deadline
     * @throws EvIndexError(TIMEOUT) if the lock was not obtained in time
     */
    StationSnapshot snapshot(Clock::time_point deadline) const;

    /**
     * Lazily filter a snapshot captured now
     */
    StationScan scan(const StationPredicate& predicate = StationPredicate()) const;

    /**
     * Find up to k stations closest to a geographic point
     * @param query_point Latitude/longitude in degrees
     * @param k Maximum number of results
     * @param predicate Optional station filter; it runs while the catalog's shared lock is
     *        held and must not call back into this catalog
     * @return Stations in ascending distance, ties by ascending id
     * @throws EvIndexError(INVALID_COORDINATE) for an invalid query point
     * @throws EvIndexError(INTERNAL_INCONSISTENCY) when the index names a missing station;
     *         callers repair with ensureConsistency()
     */
    std::vector<NearestStation> nearestK(const geometry::GeoPoint& query_point, size_t k,
                                         const StationPredicate& predicate = StationPredicate()) const;

    /**
     * Find stations inside a planar box (boundary inclusive), ascending id
     */
    std::vector<StationPtr> rangeQuery(const geometry::Box& box) const;

    /**
     * Find stations inside a geographic box; the corners are projected
     * and the planar box between them is searched
     */
    std::vector<StationPtr> rangeQuery(const geometry::GeoBox& box) const;

    /**
     * Load many records
     * @param records Normalized records
     * @param mode ATOMIC or BEST_EFFORT
     * @return Loaded count and, in best-effort mode, the rejected records
     * @throws EvIndexError(MALFORMED_RECORD) naming the first bad record in atomic mode
     */
    LoadSummary load(const std::vector<StationRecord>& records, LoadMode mode = LoadMode::ATOMIC);

    /**
     * Check that the index holds exactly the catalog's ids at their planar points
     * and that the tree invariants hold
     * @param reason Receives a description of the first violation
     */
    bool verifyConsistency(std::string* reason = nullptr) const;

    /**
     * Rebuild the index from the station map
     */
    void rebuildIndex();

    /**
     * Verify consistency and rebuild the index when it is violated
     * @return true if a rebuild was needed
     */
    bool ensureConsistency();

    size_t indexHeight() const;
    std::vector<index::IndexEntry> indexEntries() const;

    const geometry::Projector& projector() const { return *projector_; }

private:
    std::unique_ptr<geometry::Projector> projector_;
    std::map<StationId, StationPtr> stations_;
    index::SpatialIndex index_;
    mutable std::shared_timed_mutex mutex_;

    bool applyLocked(const StationPtr& station, bool strict);
    void rebuildIndexLocked();
    bool verifyLocked(std::string& reason) const;
    StationSnapshot snapshotLocked() const;
    std::vector<StationPtr> resolveLocked(const std::vector<StationId>& ids) const;
};

} // namespace catalog
} // namespace evindex

#endif // EVINDEX_STATION_CATALOG_HPP
