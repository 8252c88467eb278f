#include <storage/relation_store.hpp>
#include <storage/memory_relation_store.hpp>
#include <storage/pg_relation_store.hpp>
#include <config/engine_config.hpp>
#include <database/postgres_connection.hpp>
#include <utils/logger.hpp>

namespace Lookalike {

void RelationStore::upsert_item(const Item& item) {
    auto result = upsert_items({item});
    if (!result.failures.empty()) {
        const auto& f = result.failures.front();
        throw StoreError(f.kind, f.reason);
    }
}

bool RelationStore::upsert_if_absent(const PairKey& pair, uint32_t distance, RelationKind kind) {
    auto result = upsert_if_absent(std::vector<Candidate>{Candidate{pair, distance, kind}});
    if (!result.failures.empty()) {
        const auto& f = result.failures.front();
        throw StoreError(f.kind, f.reason);
    }
    return !result.inserted.empty();
}

void RelationStore::report_orphans(const std::vector<PairKey>& relations, size_t members) {
    if (relations.empty() && members == 0) return;

    std::string sample;
    for (size_t i = 0; i < relations.size() && i < 5; ++i) {
        sample += (i ? ", " : "") + to_string(relations[i]);
    }
    if (relations.size() > 5) sample += ", ...";

    Logger::error("Integrity anomaly: removed " + std::to_string(relations.size()) + " orphan relations" +
                  (sample.empty() ? std::string() : " [" + sample + "]") +
                  " and " + std::to_string(members) + " orphan cluster memberships");
}

std::unique_ptr<RelationStore> open_relation_store(const EngineConfig& config) {
    if (config.backend == "memory") {
        Logger::info("Opening in-process relation store" +
                     (config.snapshot_path.empty() ? std::string() : " (" + config.snapshot_path + ")"));
        return std::make_unique<MemoryRelationStore>(config.snapshot_path);
    }
    if (config.backend == "postgres") {
        auto db = config.conninfo.empty()
            ? std::make_unique<PostgresConnection>()
            : std::make_unique<PostgresConnection>(config.conninfo);
        return std::make_unique<PgRelationStore>(std::move(db), config.schema, config.retry_policy());
    }
    throw std::invalid_argument("Unknown store backend '" + config.backend + "'");
}

} // namespace Lookalike
