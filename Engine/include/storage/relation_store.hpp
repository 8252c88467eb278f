#pragma once

#include <storage/relation_types.hpp>
#include <storage/store_error.hpp>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Lookalike {

struct EngineConfig;

struct BatchFailure {
    PairKey pair;
    ErrorKind kind;
    std::string reason;
};

/**
 * @brief Outcome of upsert_if_absent: every input pair lands in exactly one list.
 */
struct BatchResult {
    std::vector<PairKey> inserted;
    std::vector<PairKey> existing;     // row already present, left untouched
    std::vector<BatchFailure> failures;

    bool complete() const { return failures.empty(); }
};

struct ItemFailure {
    ItemId id;
    ErrorKind kind;
    std::string reason;
};

struct ItemBatchResult {
    size_t written = 0;
    std::vector<ItemFailure> failures;
};

struct ClusterRecord {
    int64_t id = 0;
    std::string name;
    std::string target_folder;
    int64_t created_at = 0;
};

using RelationMap = std::unordered_map<PairKey, Relation, PairKeyHasher>;

/**
 * @brief Durable item/relation store: the single source of truth for pair state.
 *
 * Invariants enforced here, not by callers:
 * - every relation references two live items (cascade on item deletion)
 * - rediscovery never overwrites an existing row
 * - new_match is only re-entered through reset_kind()
 * - each write is its own transaction; a failed call leaves no trace
 */
class RelationStore {
public:
    virtual ~RelationStore() = default;

    /**
     * @brief Create tables if missing
     */
    virtual void initialize() = 0;

    // ---- Items -------------------------------------------------------------

    /**
     * @brief Insert or update items. Retired ids are refused per entry.
     */
    virtual ItemBatchResult upsert_items(const std::vector<Item>& items) = 0;

    /**
     * @throws StoreError(ConstraintViolation) for a retired id
     */
    void upsert_item(const Item& item);

    virtual bool is_live(ItemId id) = 0;
    virtual std::vector<Item> live_items(const SourceScope& scope = SourceScope()) = 0;
    virtual size_t item_count() = 0;

    /**
     * @brief Delete the item and every relation and cluster membership
     * referencing it, atomically. The id is retired.
     * @return Number of relations removed by the cascade
     * @throws StoreError(NotFound) if the item is not live
     */
    virtual size_t delete_item(ItemId id) = 0;

    // ---- Relations ---------------------------------------------------------

    /**
     * @brief Insert new_match rows for pairs without a row; existing rows are
     * not modified (kind and distance stay as stored).
     */
    virtual BatchResult upsert_if_absent(const std::vector<Candidate>& batch) = 0;

    /**
     * @brief Single-pair form
     * @return true if a row was inserted
     * @throws StoreError on failure
     */
    bool upsert_if_absent(const PairKey& pair, uint32_t distance,
                          RelationKind kind = RelationKind::NewMatch);

    /**
     * @brief Record a user annotation. Distance is left unchanged.
     * @throws StoreError(InvalidTransition) if kind is new_match
     * @throws StoreError(ConstraintViolation) if an endpoint is not live
     * @throws StoreError(NotFound) if the pair has no row
     */
    virtual void set_kind(const PairKey& pair, RelationKind kind) = 0;

    /**
     * @brief Explicit return to new_match. Same failure modes as set_kind.
     */
    virtual void reset_kind(const PairKey& pair) = 0;

    virtual std::optional<RelationKind> get_kind(const PairKey& pair) = 0;
    virtual std::optional<Relation> get_relation(const PairKey& pair) = 0;

    /**
     * @brief Authoritative batch read; absent pairs are absent from the map
     */
    virtual RelationMap get_relations(const std::vector<PairKey>& pairs) = 0;

    virtual std::vector<Relation> all_relations() = 0;
    virtual size_t relation_count() = 0;

    /**
     * @brief Remove relations and memberships with a non-live endpoint.
     *
     * Any non-zero result means some path bypassed the delete cascade; it is
     * logged as an integrity anomaly.
     */
    virtual size_t sweep_orphans() = 0;

    // ---- Sticky clusters ---------------------------------------------------

    virtual int64_t create_cluster(const std::string& name, const std::string& target_folder) = 0;
    virtual std::vector<ClusterRecord> clusters() = 0;

    /**
     * @brief item id -> cluster id for every member
     */
    virtual std::unordered_map<ItemId, int64_t> cluster_members() = 0;

    /**
     * @brief Add live items to a cluster; items already in a cluster are skipped
     */
    virtual void add_cluster_members(int64_t cluster_id, const std::vector<ItemId>& items) = 0;
    virtual void delete_cluster(int64_t cluster_id) = 0;

protected:
    // Error-level report shared by the backends' sweep_orphans()
    static void report_orphans(const std::vector<PairKey>& relations, size_t members);
};

/**
 * @brief Open the backend named by config.backend ("postgres" or "memory")
 */
std::unique_ptr<RelationStore> open_relation_store(const EngineConfig& config);

} // namespace Lookalike
