#pragma once

#include <storage/relation_store.hpp>
#include <storage/retry.hpp>
#include <database/postgres_connection.hpp>
#include <memory>
#include <mutex>
#include <string>

namespace Lookalike {

/**
 * @brief RelationStore over PostgreSQL.
 *
 * Delete cascade and referential integrity come from foreign keys with
 * ON DELETE CASCADE; insert-if-absent from INSERT ... ON CONFLICT DO NOTHING. Every public
 * write is one transaction. The connection is not shared: calls from several
 * threads are serialised on an internal mutex.
 */
class PgRelationStore : public RelationStore {
public:
    /**
     * @throws std::invalid_argument if schema is not a plain lowercase identifier
     */
    PgRelationStore(std::unique_ptr<PostgresConnection> db,
                    std::string schema = "lookalike",
                    RetryPolicy retry = RetryPolicy());

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

    const std::string& schema() const { return schema_; }

private:
    // Serialise, map DatabaseError to StoreError, retry transient failures.
    template<typename Fn>
    auto run(const std::string& what, Fn&& fn) -> decltype(fn());

    void write_kind(const PairKey& pair, RelationKind kind);
    std::string table(const char* name) const { return schema_ + "." + name; }

    std::unique_ptr<PostgresConnection> db_;
    std::string schema_;
    RetryPolicy retry_;
    std::mutex mutex_;
};

} // namespace Lookalike
