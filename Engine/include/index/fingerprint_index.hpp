/**
 * @file fingerprint_index.hpp
 * @brief BK-tree over Hamming distance with exact-match buckets
 */

#pragma once

#include <fingerprint/fingerprint.hpp>
#include <storage/relation_types.hpp>
#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Lookalike {

struct IndexMatch {
    ItemId id;
    uint32_t distance;

    bool operator==(const IndexMatch& o) const { return id == o.id && distance == o.distance; }
};

/**
 * @brief Burkhard-Keller tree keyed by Hamming distance.
 *
 * Each node holds one distinct fingerprint and the bucket of item ids that
 * carry it, so identical codes never deepen the tree and exact lookups are a
 * hash probe. Nodes are addressed by a dense ordinal ("group") that the
 * candidate generator uses to partition work.
 *
 * Removal is by exclusion: the id leaves its bucket but the node stays as a
 * routing point until the next build(). Concurrent const calls are safe;
 * mutation needs exclusive access.
 */
class FingerprintIndex {
public:
    explicit FingerprintIndex(size_t bits = 64);

    /**
     * @brief Replace the contents with items; clears all exclusions
     * @throws std::invalid_argument if a fingerprint has the wrong width
     */
    void build(const std::vector<Item>& items);

    /**
     * @brief Add or move one item. An excluded id becomes visible again.
     */
    void insert(const Item& item);

    /**
     * @brief Hide an id from every later query
     * @return false if the id is not indexed
     */
    bool exclude(ItemId id);

    /**
     * @brief Undo exclude()
     * @return false if the id was not excluded
     */
    bool restore(ItemId id);

    bool contains(ItemId id) const { return id_to_node_.count(id) > 0; }

    size_t bits() const { return bits_; }
    size_t size() const { return id_to_node_.size(); }
    size_t excluded_count() const { return excluded_.size(); }

    /**
     * @brief Item ids with exactly this fingerprint, ascending
     */
    std::vector<ItemId> exact(const Fingerprint& fingerprint) const;

    /**
     * @brief All items within radius, ordered by id
     */
    std::vector<IndexMatch> query(const Fingerprint& fingerprint, uint32_t radius) const;

    // ---- Group access ------------------------------------------------------

    size_t group_count() const { return nodes_.size(); }
    const Fingerprint& group_fingerprint(size_t group) const { return nodes_[group].fingerprint; }
    const std::vector<ItemId>& group_ids(size_t group) const { return nodes_[group].ids; }

    /**
     * @brief Non-empty groups within radius as (group, distance), unordered
     */
    std::vector<std::pair<uint32_t, uint32_t>> query_groups(const Fingerprint& fingerprint, uint32_t radius) const;

    /**
     * @brief Linear scan with the same result contract as query()
     */
    static std::vector<IndexMatch> brute_force(const std::vector<Item>& items,
                                               const Fingerprint& fingerprint, uint32_t radius);

private:
    struct Node {
        Fingerprint fingerprint;
        std::vector<ItemId> ids;
        std::vector<std::pair<uint32_t, uint32_t>> children;   // (edge distance, node)
    };

    void check_width(const Fingerprint& fingerprint) const;
    uint32_t place(const Fingerprint& fingerprint);
    void detach(ItemId id, uint32_t node);

    size_t bits_;
    std::vector<Node> nodes_;     // nodes_[0] is the root
    std::unordered_map<Fingerprint, uint32_t, FingerprintHasher> buckets_;
    std::unordered_map<ItemId, uint32_t> id_to_node_;
    std::unordered_map<ItemId, uint32_t> excluded_;
};

} // namespace Lookalike
