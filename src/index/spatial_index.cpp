#include "index/spatial_index.hpp"
#include "core/errors.hpp"
#include "geometry/geometry_utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace evindex {
namespace index {

namespace bg = boost::geometry;
using geometry::Box;
using geometry::Point;

struct SpatialIndex::Node {
    bool is_leaf;
    Box bounds;
    std::vector<std::unique_ptr<Node>> children;   // Internal nodes only
    std::vector<IndexEntry> entries;               // Leaf nodes only

    explicit Node(bool leaf) : is_leaf(leaf) {
        bg::assign_inverse(bounds);
    }

    size_t count() const { return is_leaf ? entries.size() : children.size(); }
};

namespace {

double boxArea(const Box& box) {
    return bg::area(box);
}

// Half perimeter, separates boxes that are degenerate in one axis
double boxMargin(const Box& box) {
    return (bg::get<bg::max_corner, 0>(box) - bg::get<bg::min_corner, 0>(box)) +
           (bg::get<bg::max_corner, 1>(box) - bg::get<bg::min_corner, 1>(box));
}

Box pointBox(const Point& point) {
    return Box(point, point);
}

Box unionBox(const Box& a, const Box& b) {
    Box result = a;
    bg::expand(result, b);
    return result;
}

// Area growth first, margin growth when the areas are degenerate
std::pair<double, double> enlargement(const Box& box, const Box& added) {
    Box merged = unionBox(box, added);
    return {boxArea(merged) - boxArea(box), boxMargin(merged) - boxMargin(box)};
}

Point boxCenter(const Box& box) {
    return Point((bg::get<bg::min_corner, 0>(box) + bg::get<bg::max_corner, 0>(box)) / 2.0,
                 (bg::get<bg::min_corner, 1>(box) + bg::get<bg::max_corner, 1>(box)) / 2.0);
}

bool isFinitePoint(const Point& point) {
    return std::isfinite(bg::get<0>(point)) && std::isfinite(bg::get<1>(point));
}

// Near-equal chunk sizes, none larger than capacity
std::vector<size_t> evenChunkSizes(size_t total, size_t capacity) {
    std::vector<size_t> sizes;
    if (total == 0 || capacity == 0) {
        return sizes;
    }
    size_t chunks = (total + capacity - 1) / capacity;
    sizes.assign(chunks, total / chunks);
    for (size_t i = 0; i < total % chunks; ++i) {
        sizes[i]++;
    }
    return sizes;
}

/**
 * Sort-Tile-Recursive partition: sort by x into vertical slices, sort each slice
 * by y and cut it into groups of at most capacity items
 */
template <typename T, typename CenterOf>
std::vector<std::vector<T>> strPartition(std::vector<T> items, size_t capacity, CenterOf center_of) {
    const size_t group_count = (items.size() + capacity - 1) / capacity;
    const size_t slice_count = static_cast<size_t>(std::ceil(std::sqrt(static_cast<double>(group_count))));
    const size_t slice_capacity = (items.size() + slice_count - 1) / slice_count;

    auto by_x = [&center_of](const T& a, const T& b) {
        Point pa = center_of(a);
        Point pb = center_of(b);
        if (bg::get<0>(pa) != bg::get<0>(pb)) return bg::get<0>(pa) < bg::get<0>(pb);
        return bg::get<1>(pa) < bg::get<1>(pb);
    };
    auto by_y = [&center_of](const T& a, const T& b) {
        Point pa = center_of(a);
        Point pb = center_of(b);
        if (bg::get<1>(pa) != bg::get<1>(pb)) return bg::get<1>(pa) < bg::get<1>(pb);
        return bg::get<0>(pa) < bg::get<0>(pb);
    };

    std::sort(items.begin(), items.end(), by_x);

    std::vector<std::vector<T>> groups;
    size_t offset = 0;
    for (size_t slice_size : evenChunkSizes(items.size(), slice_capacity)) {
        auto slice_begin = items.begin() + static_cast<std::ptrdiff_t>(offset);
        std::sort(slice_begin, slice_begin + static_cast<std::ptrdiff_t>(slice_size), by_y);

        size_t position = offset;
        for (size_t chunk_size : evenChunkSizes(slice_size, capacity)) {
            std::vector<T> group;
            group.reserve(chunk_size);
            for (size_t i = 0; i < chunk_size; ++i) {
                group.push_back(std::move(items[position + i]));
            }
            groups.push_back(std::move(group));
            position += chunk_size;
        }
        offset += slice_size;
    }
    return groups;
}

/**
 * Quadratic split of an overflowing item list into two groups
 * @param items Items to distribute (consumed)
 * @param box_of Bounding box accessor
 * @param min_entries Minimum group size
 */
template <typename T, typename BoxOf>
std::pair<std::vector<T>, std::vector<T>> quadraticSplit(std::vector<T>& items, BoxOf box_of, size_t min_entries) {
    // Pick the pair of seeds wasting the most area when grouped together
    size_t seed_a = 0;
    size_t seed_b = 1;
    std::pair<double, double> worst_waste(-std::numeric_limits<double>::max(), -std::numeric_limits<double>::max());
    for (size_t i = 0; i < items.size(); ++i) {
        for (size_t j = i + 1; j < items.size(); ++j) {
            const Box& box_i = box_of(items[i]);
            const Box& box_j = box_of(items[j]);
            Box merged = unionBox(box_i, box_j);
            std::pair<double, double> waste(boxArea(merged) - boxArea(box_i) - boxArea(box_j),
                                            boxMargin(merged) - boxMargin(box_i) - boxMargin(box_j));
            if (waste > worst_waste) {
                worst_waste = waste;
                seed_a = i;
                seed_b = j;
            }
        }
    }

    std::vector<T> group_a;
    std::vector<T> group_b;
    Box bounds_a = box_of(items[seed_a]);
    Box bounds_b = box_of(items[seed_b]);
    group_a.push_back(std::move(items[seed_a]));
    group_b.push_back(std::move(items[seed_b]));

    std::vector<T> remaining;
    remaining.reserve(items.size() - 2);
    for (size_t i = 0; i < items.size(); ++i) {
        if (i != seed_a && i != seed_b) {
            remaining.push_back(std::move(items[i]));
        }
    }
    items.clear();

    while (!remaining.empty()) {
        // Give everything left to a group that would otherwise stay underfull
        if (group_a.size() + remaining.size() == min_entries) {
            for (auto& item : remaining) {
                bg::expand(bounds_a, box_of(item));
                group_a.push_back(std::move(item));
            }
            break;
        }
        if (group_b.size() + remaining.size() == min_entries) {
            for (auto& item : remaining) {
                bg::expand(bounds_b, box_of(item));
                group_b.push_back(std::move(item));
            }
            break;
        }

        // Pick the item with the strongest preference for one group
        size_t next = 0;
        std::pair<double, double> best_preference(-1.0, -1.0);
        for (size_t i = 0; i < remaining.size(); ++i) {
            auto grow_a = enlargement(bounds_a, box_of(remaining[i]));
            auto grow_b = enlargement(bounds_b, box_of(remaining[i]));
            std::pair<double, double> preference(std::abs(grow_a.first - grow_b.first),
                                                 std::abs(grow_a.second - grow_b.second));
            if (preference > best_preference) {
                best_preference = preference;
                next = i;
            }
        }

        const Box& next_box = box_of(remaining[next]);
        auto grow_a = enlargement(bounds_a, next_box);
        auto grow_b = enlargement(bounds_b, next_box);
        bool to_a;
        if (grow_a != grow_b) {
            to_a = grow_a < grow_b;
        } else if (boxArea(bounds_a) != boxArea(bounds_b)) {
            to_a = boxArea(bounds_a) < boxArea(bounds_b);
        } else {
            to_a = group_a.size() <= group_b.size();
        }

        if (to_a) {
            bg::expand(bounds_a, next_box);
            group_a.push_back(std::move(remaining[next]));
        } else {
            bg::expand(bounds_b, next_box);
            group_b.push_back(std::move(remaining[next]));
        }
        remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(next));
    }

    return {std::move(group_a), std::move(group_b)};
}

} // namespace

SpatialIndex::SpatialIndex(const SpatialIndexParameters& parameters)
    : parameters_(parameters), root_(new Node(true)), height_(1) {
    if (parameters_.max_entries < 2 || parameters_.min_entries < 1 ||
        parameters_.min_entries * 2 > parameters_.max_entries) {
        throw std::invalid_argument("Spatial index requires 1 <= min_entries <= max_entries / 2");
    }
}

SpatialIndex::~SpatialIndex() = default;

void SpatialIndex::clear() {
    root_.reset(new Node(true));
    height_ = 1;
    locations_.clear();
}

void SpatialIndex::recomputeBounds(Node& node) {
    bg::assign_inverse(node.bounds);
    if (node.is_leaf) {
        for (const auto& entry : node.entries) {
            bg::expand(node.bounds, entry.location);
        }
    } else {
        for (const auto& child : node.children) {
            bg::expand(node.bounds, child->bounds);
        }
    }
}

void SpatialIndex::build(const std::vector<IndexEntry>& entries) {
    std::unordered_map<StationId, Point> locations;
    locations.reserve(entries.size());
    for (const auto& entry : entries) {
        if (!isFinitePoint(entry.location)) {
            throw EvIndexError(ErrorKind::INVALID_COORDINATE,
                               "Non-finite planar point for station " + std::to_string(entry.id));
        }
        if (!locations.emplace(entry.id, entry.location).second) {
            throw EvIndexError(ErrorKind::DUPLICATE_ID,
                               "Station " + std::to_string(entry.id) + " appears twice in index build");
        }
    }

    clear();
    if (entries.empty()) {
        return;
    }

    // Pack leaves
    std::vector<std::unique_ptr<Node>> level;
    auto leaf_groups = strPartition(entries, parameters_.max_entries,
                                    [](const IndexEntry& entry) { return entry.location; });
    for (auto& group : leaf_groups) {
        std::unique_ptr<Node> leaf(new Node(true));
        leaf->entries = std::move(group);
        recomputeBounds(*leaf);
        level.push_back(std::move(leaf));
    }

    // Pack internal levels until a single root remains
    size_t height = 1;
    while (level.size() > 1) {
        auto node_groups = strPartition(std::move(level), parameters_.max_entries,
                                        [](const std::unique_ptr<Node>& node) { return boxCenter(node->bounds); });
        level.clear();
        for (auto& group : node_groups) {
            std::unique_ptr<Node> parent(new Node(false));
            parent->children = std::move(group);
            recomputeBounds(*parent);
            level.push_back(std::move(parent));
        }
        ++height;
    }

    root_ = std::move(level.front());
    height_ = height;
    locations_ = std::move(locations);
}

void SpatialIndex::insert(StationId id, const Point& location) {
    if (!isFinitePoint(location)) {
        throw EvIndexError(ErrorKind::INVALID_COORDINATE,
                           "Non-finite planar point for station " + std::to_string(id));
    }
    if (locations_.count(id) > 0) {
        throw EvIndexError(ErrorKind::DUPLICATE_ID,
                           "Station " + std::to_string(id) + " is already indexed");
    }

    growRoot(insertEntry(*root_, IndexEntry(id, location)));
    locations_.emplace(id, location);
}

void SpatialIndex::growRoot(std::unique_ptr<Node> sibling) {
    if (!sibling) {
        return;
    }
    std::unique_ptr<Node> new_root(new Node(false));
    new_root->children.push_back(std::move(root_));
    new_root->children.push_back(std::move(sibling));
    recomputeBounds(*new_root);
    root_ = std::move(new_root);
    ++height_;
}

std::unique_ptr<SpatialIndex::Node> SpatialIndex::insertEntry(Node& node, const IndexEntry& entry) {
    bg::expand(node.bounds, entry.location);

    if (node.is_leaf) {
        node.entries.push_back(entry);
    } else {
        // Choose the child needing the least enlargement
        const Box entry_box = pointBox(entry.location);
        size_t chosen = 0;
        std::pair<double, double> best_growth(std::numeric_limits<double>::max(), std::numeric_limits<double>::max());
        double best_area = std::numeric_limits<double>::max();
        size_t best_count = std::numeric_limits<size_t>::max();
        for (size_t i = 0; i < node.children.size(); ++i) {
            const Node& child = *node.children[i];
            auto growth = enlargement(child.bounds, entry_box);
            double area = boxArea(child.bounds);
            if (growth < best_growth ||
                (growth == best_growth && (area < best_area ||
                                           (area == best_area && child.count() < best_count)))) {
                chosen = i;
                best_growth = growth;
                best_area = area;
                best_count = child.count();
            }
        }

        std::unique_ptr<Node> child_sibling = insertEntry(*node.children[chosen], entry);
        if (child_sibling) {
            node.children.push_back(std::move(child_sibling));
        }
    }

    if (node.count() > parameters_.max_entries) {
        return splitNode(node);
    }
    return nullptr;
}

std::unique_ptr<SpatialIndex::Node> SpatialIndex::splitNode(Node& node) {
    std::unique_ptr<Node> sibling(new Node(node.is_leaf));

    if (node.is_leaf) {
        auto groups = quadraticSplit(node.entries,
                                     [](const IndexEntry& entry) { return pointBox(entry.location); },
                                     parameters_.min_entries);
        node.entries = std::move(groups.first);
        sibling->entries = std::move(groups.second);
    } else {
        auto groups = quadraticSplit(node.children,
                                     [](const std::unique_ptr<Node>& child) -> const Box& { return child->bounds; },
                                     parameters_.min_entries);
        node.children = std::move(groups.first);
        sibling->children = std::move(groups.second);
    }

    recomputeBounds(node);
    recomputeBounds(*sibling);
    return sibling;
}

bool SpatialIndex::remove(StationId id) {
    auto it = locations_.find(id);
    if (it == locations_.end()) {
        return false;
    }
    const Point location = it->second;

    std::vector<IndexEntry> orphans;
    if (!removeEntry(*root_, id, location, orphans)) {
        throw EvIndexError(ErrorKind::INTERNAL_INCONSISTENCY,
                           "Station " + std::to_string(id) + " is registered but missing from the tree");
    }
    locations_.erase(it);
    condenseRoot();

    // Entries of dissolved underfull nodes go back in at leaf level
    for (const auto& orphan : orphans) {
        growRoot(insertEntry(*root_, orphan));
    }
    return true;
}

bool SpatialIndex::removeEntry(Node& node, StationId id, const Point& location,
                               std::vector<IndexEntry>& orphans) {
    if (node.is_leaf) {
        auto it = std::find_if(node.entries.begin(), node.entries.end(),
                               [id](const IndexEntry& entry) { return entry.id == id; });
        if (it == node.entries.end()) {
            return false;
        }
        node.entries.erase(it);
        recomputeBounds(node);
        return true;
    }

    for (size_t i = 0; i < node.children.size(); ++i) {
        Node& child = *node.children[i];
        if (child.count() == 0 || !bg::covered_by(location, child.bounds)) {
            continue;
        }
        if (!removeEntry(child, id, location, orphans)) {
            continue;
        }
        if (child.count() < parameters_.min_entries) {
            collectEntries(child, orphans);
            node.children.erase(node.children.begin() + static_cast<std::ptrdiff_t>(i));
        }
        recomputeBounds(node);
        return true;
    }
    return false;
}

void SpatialIndex::condenseRoot() {
    while (!root_->is_leaf && root_->children.size() == 1) {
        std::unique_ptr<Node> only_child = std::move(root_->children.front());
        root_ = std::move(only_child);
        --height_;
    }
    if (!root_->is_leaf && root_->children.empty()) {
        root_.reset(new Node(true));
        height_ = 1;
    }
}

void SpatialIndex::collectEntries(const Node& node, std::vector<IndexEntry>& out) {
    if (node.is_leaf) {
        out.insert(out.end(), node.entries.begin(), node.entries.end());
        return;
    }
    for (const auto& child : node.children) {
        collectEntries(*child, out);
    }
}

std::vector<NearestResult> SpatialIndex::nearestK(const Point& query_point, size_t k,
                                                  const Predicate& predicate) const {
    std::vector<NearestResult> results;
    if (k == 0 || locations_.empty()) {
        return results;
    }
    k = std::min(k, locations_.size());

    // Max-heap of (squared distance, id) holding the k best candidates
    std::vector<std::pair<double, StationId>> best;
    best.reserve(k + 1);
    searchNearest(*root_, query_point, k, predicate, best);

    std::sort(best.begin(), best.end());
    results.reserve(best.size());
    for (const auto& candidate : best) {
        results.emplace_back(candidate.second, std::sqrt(candidate.first));
    }
    return results;
}

void SpatialIndex::searchNearest(const Node& node, const Point& query_point, size_t k,
                                 const Predicate& predicate,
                                 std::vector<std::pair<double, StationId>>& best) const {
    if (node.is_leaf) {
        for (const auto& entry : node.entries) {
            std::pair<double, StationId> candidate(bg::comparable_distance(query_point, entry.location), entry.id);
            if (best.size() == k && !(candidate < best.front())) {
                continue;
            }
            if (predicate && !predicate(entry.id)) {
                continue;
            }
            best.push_back(candidate);
            std::push_heap(best.begin(), best.end());
            if (best.size() > k) {
                std::pop_heap(best.begin(), best.end());
                best.pop_back();
            }
        }
        return;
    }

    // Visit children in order of their minimum distance to the query point
    std::vector<std::pair<double, const Node*>> ordered;
    ordered.reserve(node.children.size());
    for (const auto& child : node.children) {
        ordered.emplace_back(geometry::minSquaredDistance(query_point, child->bounds), child.get());
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const std::pair<double, const Node*>& a, const std::pair<double, const Node*>& b) {
                  return a.first < b.first;
              });

    for (const auto& item : ordered) {
        // Equal distances are still visited so that id tie-breaking stays exact
        if (best.size() == k && item.first > best.front().first) {
            break;
        }
        searchNearest(*item.second, query_point, k, predicate, best);
    }
}

std::vector<StationId> SpatialIndex::rangeQuery(const Box& box) const {
    std::vector<StationId> result;
    if (!locations_.empty()) {
        searchRange(*root_, box, result);
    }
    std::sort(result.begin(), result.end());
    return result;
}

void SpatialIndex::searchRange(const Node& node, const Box& box, std::vector<StationId>& result) const {
    if (node.count() == 0 || !bg::intersects(node.bounds, box)) {
        return;
    }
    if (node.is_leaf) {
        for (const auto& entry : node.entries) {
            if (bg::covered_by(entry.location, box)) {
                result.push_back(entry.id);
            }
        }
        return;
    }
    for (const auto& child : node.children) {
        searchRange(*child, box, result);
    }
}

std::optional<Point> SpatialIndex::pointOf(StationId id) const {
    auto it = locations_.find(id);
    if (it == locations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<IndexEntry> SpatialIndex::entries() const {
    std::vector<IndexEntry> result;
    result.reserve(locations_.size());
    for (const auto& item : locations_) {
        result.emplace_back(item.first, item.second);
    }
    std::sort(result.begin(), result.end(),
              [](const IndexEntry& a, const IndexEntry& b) { return a.id < b.id; });
    return result;
}

bool SpatialIndex::checkInvariants(std::string* reason) const {
    std::string failure;
    size_t entry_count = 0;
    bool valid = checkNode(*root_, 1, true, entry_count, failure);

    if (valid && entry_count != locations_.size()) {
        std::ostringstream error_msg;
        error_msg << "Tree holds " << entry_count << " entries but " << locations_.size() << " ids are registered";
        failure = error_msg.str();
        valid = false;
    }

    if (!valid && reason) {
        *reason = failure;
    }
    return valid;
}

bool SpatialIndex::checkNode(const Node& node, size_t depth, bool is_root, size_t& entry_count,
                             std::string& reason) const {
    if (node.count() > parameters_.max_entries) {
        reason = "Node at depth " + std::to_string(depth) + " exceeds the maximum fill";
        return false;
    }
    if (!is_root && node.count() < parameters_.min_entries) {
        reason = "Node at depth " + std::to_string(depth) + " is below the minimum fill";
        return false;
    }

    if (node.is_leaf) {
        if (depth != height_) {
            reason = "Leaf at depth " + std::to_string(depth) + " but tree height is " + std::to_string(height_);
            return false;
        }
        for (const auto& entry : node.entries) {
            if (!bg::covered_by(entry.location, node.bounds)) {
                reason = "Station " + std::to_string(entry.id) + " lies outside its leaf box";
                return false;
            }
            auto it = locations_.find(entry.id);
            if (it == locations_.end() || !bg::equals(it->second, entry.location)) {
                reason = "Station " + std::to_string(entry.id) + " has no matching registered location";
                return false;
            }
        }
        entry_count += node.entries.size();
        return true;
    }

    if (is_root && node.children.size() < 2) {
        reason = "Internal root has fewer than two children";
        return false;
    }
    for (const auto& child : node.children) {
        if (!bg::covered_by(child->bounds, node.bounds)) {
            reason = "Child box at depth " + std::to_string(depth + 1) + " is not covered by its parent";
            return false;
        }
        if (!checkNode(*child, depth + 1, false, entry_count, reason)) {
            return false;
        }
    }
    return true;
}

} // namespace index
} // namespace evindex
