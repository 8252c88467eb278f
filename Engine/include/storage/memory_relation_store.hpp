#pragma once

#include <storage/relation_store.hpp>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>

namespace Lookalike {

/**
 * @brief In-process RelationStore with optional JSON snapshot persistence.
 *
 * Every write mutates a private copy of the tables, persists it when a
 * snapshot path is set, and only then swaps it in: a failed write leaves the
 * visible state untouched. Suited to tests and single-user collections.
 *
 * The price is O(total rows) per write: each set_kind or reconcile chunk
 * copies every table and, with a snapshot path, rewrites the whole file.
 * Large collections belong on PgRelationStore.
 */
class MemoryRelationStore : public RelationStore {
public:
    /**
     * @param snapshot_path File to load on construction (if present) and to
     *        rewrite after every write. Empty keeps everything in memory.
     */
    explicit MemoryRelationStore(std::string snapshot_path = "");

    using RelationStore::upsert_if_absent;

    void initialize() override;

    ItemBatchResult upsert_items(const std::vector<Item>& items) override;
    bool is_live(ItemId id) override;
    std::vector<Item> live_items(const SourceScope& scope = SourceScope()) override;
    size_t item_count() override;
    size_t delete_item(ItemId id) override;

    BatchResult upsert_if_absent(const std::vector<Candidate>& batch) override;
    void set_kind(const PairKey& pair, RelationKind kind) override;
    void reset_kind(const PairKey& pair) override;
    std::optional<RelationKind> get_kind(const PairKey& pair) override;
    std::optional<Relation> get_relation(const PairKey& pair) override;
    RelationMap get_relations(const std::vector<PairKey>& pairs) override;
    std::vector<Relation> all_relations() override;
    size_t relation_count() override;
    size_t sweep_orphans() override;

    int64_t create_cluster(const std::string& name, const std::string& target_folder) override;
    std::vector<ClusterRecord> clusters() override;
    std::unordered_map<ItemId, int64_t> cluster_members() override;
    void add_cluster_members(int64_t cluster_id, const std::vector<ItemId>& items) override;
    void delete_cluster(int64_t cluster_id) override;

    /**
     * @brief Write the tables to path atomically (temp file + rename)
     * @throws StoreError(TransientStorageError) on I/O failure
     */
    void save(const std::string& path);

    /**
     * @brief Replace the tables with a snapshot, verbatim. A damaged
     * snapshot may hold orphans; sweep_orphans() finds them.
     * @throws std::runtime_error if the file is unreadable or malformed
     */
    void load(const std::string& path);

private:
    struct Tables {
        std::map<ItemId, Item> items;
        std::set<ItemId> retired;
        std::map<PairKey, Relation> relations;
        std::map<int64_t, ClusterRecord> clusters;
        std::map<ItemId, int64_t> members;
        int64_t next_cluster_id = 1;
    };

    // Run fn on a copy of the tables, persist, then publish. Caller holds no lock.
    template<typename Fn>
    auto write(Fn&& fn) -> decltype(fn(std::declval<Tables&>()));

    void write_kind(const PairKey& pair, RelationKind kind);
    static void persist(const Tables& tables, const std::string& path);
    static std::string serialize(const Tables& tables);
    static Tables parse(const std::string& text);

    std::string snapshot_path_;
    std::mutex mutex_;
    Tables tables_;
};

} // namespace Lookalike
