#ifndef EVINDEX_SPATIAL_INDEX_HPP
#define EVINDEX_SPATIAL_INDEX_HPP

#include <cstdint>
#include <cstddef>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <string>
#include <unordered_map>
#include "geometry/common.hpp"

namespace evindex {

// Station primary key
using StationId = std::int64_t;

namespace index {

// R-tree value: a station id and its planar location
struct IndexEntry {
    StationId id;
    geometry::Point location;

    IndexEntry(StationId station_id, const geometry::Point& loc)
        : id(station_id), location(loc) {}
};

// Result of a nearest-neighbor query
struct NearestResult {
    StationId id;
    double distance;    // Planar distance in meters

    NearestResult(StationId station_id, double dist) : id(station_id), distance(dist) {}
};

// Node fill bounds (same defaults as bgi::quadratic<16>)
struct SpatialIndexParameters {
    size_t max_entries;
    size_t min_entries;

    SpatialIndexParameters() : max_entries(16), min_entries(4) {}
    SpatialIndexParameters(size_t max_fill, size_t min_fill) : max_entries(max_fill), min_entries(min_fill) {}
};

/**
 * Balanced bounding-box tree (R-tree) over station points.
 * Bulk load uses Sort-Tile-Recursive packing, incremental inserts use the
 * quadratic split and removals condense the tree and reinsert orphaned entries.
 */
class SpatialIndex {
public:
    using Predicate = std::function<bool(StationId)>;

    explicit SpatialIndex(const SpatialIndexParameters& parameters = SpatialIndexParameters());
    ~SpatialIndex();

    // Disable copy constructor and assignment
    SpatialIndex(const SpatialIndex&) = delete;
    SpatialIndex& operator=(const SpatialIndex&) = delete;

    /**
     * Replace the index content with a packed tree over all entries
     * @param entries Station ids and planar points
     * @throws EvIndexError(DUPLICATE_ID) if an id appears twice
     * @throws EvIndexError(INVALID_COORDINATE) for non-finite points
     */
    void build(const std::vector<IndexEntry>& entries);

    /**
     * Insert a station point
     * @throws EvIndexError(DUPLICATE_ID) if the id is already indexed
     * @throws EvIndexError(INVALID_COORDINATE) for non-finite points
     */
    void insert(StationId id, const geometry::Point& location);

    /**
     * Remove a station point
     * @return true if the id was indexed
     */
    bool remove(StationId id);

    /**
     * Find up to k stations nearest to a query point
     * Subtrees whose minimum distance exceeds the current k-th best are pruned.
     * @param query_point Planar query point
     * @param k Maximum number of results
     * @param predicate Optional filter on station ids
     * @return Results in ascending distance, ties broken by ascending id
     */
    std::vector<NearestResult> nearestK(const geometry::Point& query_point, size_t k,
                                        const Predicate& predicate = Predicate()) const;

    /**
     * Find all stations whose point falls inside a box (boundary inclusive)
     * @return Station ids in ascending order
     */
    std::vector<StationId> rangeQuery(const geometry::Box& box) const;

    size_t size() const { return locations_.size(); }
    bool empty() const { return locations_.empty(); }
    size_t height() const { return height_; }
    bool contains(StationId id) const { return locations_.count(id) > 0; }
    std::optional<geometry::Point> pointOf(StationId id) const;

    /**
     * Get every indexed entry ordered by id
     */
    std::vector<IndexEntry> entries() const;

    /**
     * Verify bounding-box containment, uniform leaf depth and node fill bounds
     * @param reason Receives a description of the first violation
     * @return true if every invariant holds
     */
    bool checkInvariants(std::string* reason = nullptr) const;

    void clear();

private:
    struct Node;

    SpatialIndexParameters parameters_;
    std::unique_ptr<Node> root_;
    size_t height_;
    std::unordered_map<StationId, geometry::Point> locations_;

    std::unique_ptr<Node> insertEntry(Node& node, const IndexEntry& entry);
    std::unique_ptr<Node> splitNode(Node& node);
    void growRoot(std::unique_ptr<Node> sibling);
    bool removeEntry(Node& node, StationId id, const geometry::Point& location,
                     std::vector<IndexEntry>& orphans);
    void condenseRoot();

    void searchNearest(const Node& node, const geometry::Point& query_point, size_t k,
                       const Predicate& predicate,
                       std::vector<std::pair<double, StationId>>& best) const;
    void searchRange(const Node& node, const geometry::Box& box, std::vector<StationId>& result) const;
    bool checkNode(const Node& node, size_t depth, bool is_root, size_t& entry_count, std::string& reason) const;

    static void collectEntries(const Node& node, std::vector<IndexEntry>& out);
    static void recomputeBounds(Node& node);
};

} // namespace index
} // namespace evindex

#endif // EVINDEX_SPATIAL_INDEX_HPP
