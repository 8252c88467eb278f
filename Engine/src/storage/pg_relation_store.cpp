#include <storage/pg_relation_store.hpp>
#include <storage/format_utils.hpp>
#include <utils/logger.hpp>
#include <unordered_set>

namespace Lookalike {

namespace {

RelationKind kind_from_db(const std::string& text) {
    auto kind = parse_relation_kind(text);
    if (!kind) {
        throw StoreError(ErrorKind::IntegrityAnomaly, "Unknown relation kind in storage: '" + text + "'");
    }
    return *kind;
}

// Row layout: ida, idb, distance, kind, createdat epoch
Relation relation_from_row(const std::vector<std::string>& row) {
    Relation rel;
    rel.pair.a = std::stoll(row[0]);
    rel.pair.b = std::stoll(row[1]);
    rel.distance = static_cast<uint32_t>(std::stoul(row[2]));
    rel.kind = kind_from_db(row[3]);
    rel.created_at = std::stoll(row[4]);
    return rel;
}

} // namespace

PgRelationStore::PgRelationStore(std::unique_ptr<PostgresConnection> db, std::string schema, RetryPolicy retry)
    : db_(std::move(db)), schema_(std::move(schema)), retry_(retry) {
    if (!db_) {
        throw std::invalid_argument("PgRelationStore requires a connection");
    }
    if (!is_plain_identifier(schema_)) {
        throw std::invalid_argument("Invalid schema name: '" + schema_ + "'");
    }
}

template<typename Fn>
auto PgRelationStore::run(const std::string& what, Fn&& fn) -> decltype(fn()) {
    std::lock_guard<std::mutex> lock(mutex_);
    return with_retry(retry_, what, [&]() -> decltype(fn()) {
        try {
            if (!db_->is_connected()) {
                Logger::warn("Connection lost, reconnecting");
                db_->reset();
            }
            return fn();
        } catch (const DatabaseError& e) {
            if (e.is_constraint_violation()) {
                throw StoreError(ErrorKind::ConstraintViolation, e.what());
            }
            if (e.is_transient()) {
                throw StoreError(ErrorKind::TransientStorageError, e.what());
            }
            throw;
        }
    });
}

void PgRelationStore::initialize() {
    run("initialize", [&] {
        PostgresConnection::Transaction tx(*db_);
        db_->execute("CREATE SCHEMA IF NOT EXISTS " + schema_);

        db_->execute("CREATE TABLE IF NOT EXISTS " + table("item") + R"( (
            id          BIGINT PRIMARY KEY,
            fingerprint TEXT NOT NULL,
            bits        INTEGER NOT NULL CHECK (bits > 0),
            source      TEXT NOT NULL DEFAULT '',
            createdat   TIMESTAMPTZ NOT NULL DEFAULT now(),
            modifiedat  TIMESTAMPTZ NOT NULL DEFAULT now()
        ))");

        db_->execute("CREATE TABLE IF NOT EXISTS " + table("retireditem") + R"( (
            id          BIGINT PRIMARY KEY,
            retiredat   TIMESTAMPTZ NOT NULL DEFAULT now()
        ))");

        db_->execute("CREATE TABLE IF NOT EXISTS " + table("relation") + " (" +
            "ida BIGINT NOT NULL REFERENCES " + table("item") + "(id) ON DELETE CASCADE, " +
            "idb BIGINT NOT NULL REFERENCES " + table("item") + "(id) ON DELETE CASCADE, " +
            R"(distance    INTEGER NOT NULL CHECK (distance >= 0),
            kind        TEXT NOT NULL DEFAULT 'new_match'
                        CHECK (kind IN ('new_match', 'not_duplicate', 'near_duplicate', 'similar', 'same_set')),
            createdat   TIMESTAMPTZ NOT NULL DEFAULT now(),
            modifiedat  TIMESTAMPTZ NOT NULL DEFAULT now(),
            PRIMARY KEY (ida, idb),
            CHECK (ida < idb)
        ))");
        // The primary key serves lookups and cascades on ida
        db_->execute("CREATE INDEX IF NOT EXISTS relation_idb_idx ON " + table("relation") + " (idb)");

        db_->execute("CREATE TABLE IF NOT EXISTS " + table("cluster") + R"( (
            id           BIGSERIAL PRIMARY KEY,
            name         TEXT NOT NULL,
            targetfolder TEXT NOT NULL DEFAULT '',
            createdat    TIMESTAMPTZ NOT NULL DEFAULT now()
        ))");

        db_->execute("CREATE TABLE IF NOT EXISTS " + table("clustermember") + " (" +
            "itemid BIGINT PRIMARY KEY REFERENCES " + table("item") + "(id) ON DELETE CASCADE, " +
            "clusterid BIGINT NOT NULL REFERENCES " + table("cluster") + "(id) ON DELETE CASCADE)");
        db_->execute("CREATE INDEX IF NOT EXISTS clustermember_cluster_idx ON " + table("clustermember") + " (clusterid)");

        tx.commit();
    });
    Logger::success("Schema " + schema_ + " ready");
}

// =============================================================================
// Items
// =============================================================================

ItemBatchResult PgRelationStore::upsert_items(const std::vector<Item>& items) {
    ItemBatchResult result;
    if (items.empty()) return result;

    // Last write wins within a batch; ON CONFLICT DO UPDATE refuses to touch a row twice.
    std::unordered_map<ItemId, size_t> last;
    for (size_t i = 0; i < items.size(); ++i) last[items[i].id] = i;

    std::vector<ItemId> ids;
    ids.reserve(last.size());
    for (const auto& [id, idx] : last) ids.push_back(id);

    return run("upsert_items", [&] {
        ItemBatchResult attempt;
        PostgresConnection::Transaction tx(*db_);

        std::unordered_set<ItemId> retired;
        db_->query("SELECT id FROM " + table("retireditem") + " WHERE id = ANY($1::bigint[])",
                   {pg_int_array(ids)},
                   [&](const std::vector<std::string>& row) { retired.insert(std::stoll(row[0])); });

        std::vector<ItemId> out_ids;
        std::vector<std::string> hexes, sources;
        std::vector<int64_t> bits;
        for (ItemId id : ids) {
            if (retired.count(id)) {
                attempt.failures.push_back({id, ErrorKind::ConstraintViolation,
                                            "Item " + std::to_string(id) + " was deleted; ids are never reused"});
                continue;
            }
            const Item& item = items[last[id]];
            if (item.fingerprint.empty()) {
                attempt.failures.push_back({id, ErrorKind::ConstraintViolation, "Item has no fingerprint"});
                continue;
            }
            out_ids.push_back(id);
            hexes.push_back(item.fingerprint.to_hex());
            bits.push_back(static_cast<int64_t>(item.fingerprint.bits()));
            sources.push_back(item.source);
        }

        if (!out_ids.empty()) {
            attempt.written = db_->execute(
                "INSERT INTO " + table("item") + " (id, fingerprint, bits, source) "
                "SELECT * FROM unnest($1::bigint[], $2::text[], $3::int[], $4::text[]) "
                "ON CONFLICT (id) DO UPDATE SET fingerprint = EXCLUDED.fingerprint, bits = EXCLUDED.bits, "
                "source = EXCLUDED.source, modifiedat = now()",
                {pg_int_array(out_ids), pg_text_array(hexes), pg_int_array(bits), pg_text_array(sources)});
        }

        tx.commit();
        return attempt;
    });
}

bool PgRelationStore::is_live(ItemId id) {
    return run("is_live", [&] {
        return db_->query_single("SELECT 1 FROM " + table("item") + " WHERE id = $1",
                                 {std::to_string(id)}).has_value();
    });
}

std::vector<Item> PgRelationStore::live_items(const SourceScope& scope) {
    return run("live_items", [&] {
        std::vector<Item> items;
        db_->query("SELECT id, fingerprint, bits, source FROM " + table("item") + " ORDER BY id", {},
                   [&](const std::vector<std::string>& row) {
            if (!scope.empty() && !scope.contains(row[3])) return;
            Item item;
            item.id = std::stoll(row[0]);
            item.fingerprint = Fingerprint::from_hex(row[1], std::stoul(row[2]));
            item.source = row[3];
            items.push_back(std::move(item));
        });
        return items;
    });
}

size_t PgRelationStore::item_count() {
    return run("item_count", [&] {
        auto v = db_->query_single("SELECT count(*) FROM " + table("item"));
        return v ? static_cast<size_t>(std::stoull(*v)) : size_t(0);
    });
}

size_t PgRelationStore::delete_item(ItemId id) {
    size_t removed = run("delete_item", [&] {
        const std::string sid = std::to_string(id);
        PostgresConnection::Transaction tx(*db_);

        // Row lock first: upserts referencing this item hold FOR SHARE and finish before or after us.
        if (!db_->query_single("SELECT id FROM " + table("item") + " WHERE id = $1 FOR UPDATE", {sid})) {
            throw StoreError(ErrorKind::NotFound, "Item " + sid + " is not live");
        }

        auto count = db_->query_single("SELECT count(*) FROM " + table("relation") + " WHERE ida = $1 OR idb = $1", {sid});
        db_->execute("DELETE FROM " + table("item") + " WHERE id = $1", {sid});
        db_->execute("INSERT INTO " + table("retireditem") + " (id) VALUES ($1) ON CONFLICT DO NOTHING", {sid});

        tx.commit();
        return count ? static_cast<size_t>(std::stoull(*count)) : size_t(0);
    });
    Logger::info("Deleted item " + std::to_string(id) + " and " + std::to_string(removed) + " relations");
    return removed;
}

// =============================================================================
// Relations
// =============================================================================

BatchResult PgRelationStore::upsert_if_absent(const std::vector<Candidate>& batch) {
    BatchResult result;
    if (batch.empty()) return result;

    std::vector<Candidate> unique;
    std::unordered_set<PairKey, PairKeyHasher> seen;
    std::unordered_set<ItemId> endpoints;
    for (const auto& c : batch) {
        if (!(c.pair.a < c.pair.b)) {
            result.failures.push_back({c.pair, ErrorKind::ConstraintViolation, "Pair is not canonical"});
            continue;
        }
        if (!seen.insert(c.pair).second) {
            result.existing.push_back(c.pair);
            continue;
        }
        unique.push_back(c);
        endpoints.insert(c.pair.a);
        endpoints.insert(c.pair.b);
    }
    if (unique.empty()) return result;

    std::vector<ItemId> endpoint_ids(endpoints.begin(), endpoints.end());

    BatchResult written;
    try {
        written = run("upsert_if_absent", [&] {
            BatchResult attempt;
            PostgresConnection::Transaction tx(*db_);

            // Shared row locks keep every endpoint live until commit.
            std::unordered_set<ItemId> live;
            db_->query("SELECT id FROM " + table("item") + " WHERE id = ANY($1::bigint[]) FOR SHARE",
                       {pg_int_array(endpoint_ids)},
                       [&](const std::vector<std::string>& row) { live.insert(std::stoll(row[0])); });

            std::vector<ItemId> as, bs;
            std::vector<int64_t> distances;
            std::vector<std::string> kinds;
            std::vector<PairKey> todo;
            for (const auto& c : unique) {
                if (!live.count(c.pair.a) || !live.count(c.pair.b)) {
                    attempt.failures.push_back({c.pair, ErrorKind::ConstraintViolation,
                                                "Pair " + to_string(c.pair) + " references a non-live item"});
                    continue;
                }
                todo.push_back(c.pair);
                as.push_back(c.pair.a);
                bs.push_back(c.pair.b);
                distances.push_back(c.distance);
                kinds.push_back(to_string(c.kind));
            }

            std::unordered_set<PairKey, PairKeyHasher> inserted;
            if (!todo.empty()) {
                db_->query("INSERT INTO " + table("relation") + " (ida, idb, distance, kind) "
                           "SELECT * FROM unnest($1::bigint[], $2::bigint[], $3::int[], $4::text[]) "
                           "ON CONFLICT (ida, idb) DO NOTHING RETURNING ida, idb",
                           {pg_int_array(as), pg_int_array(bs), pg_int_array(distances), pg_text_array(kinds)},
                           [&](const std::vector<std::string>& row) {
                    inserted.insert(PairKey{std::stoll(row[0]), std::stoll(row[1])});
                });
            }
            tx.commit();

            for (const auto& pair : todo) {
                (inserted.count(pair) ? attempt.inserted : attempt.existing).push_back(pair);
            }
            return attempt;
        });
    } catch (const StoreError& e) {
        // Whole batch rolled back: every entry is reported with the cause.
        for (const auto& c : unique) {
            result.failures.push_back({c.pair, e.kind(), e.what()});
        }
        Logger::warn("upsert_if_absent: batch of " + std::to_string(unique.size()) +
                     " rolled back (" + to_string(e.kind()) + ")");
        return result;
    }

    result.inserted = std::move(written.inserted);
    result.existing.insert(result.existing.end(), written.existing.begin(), written.existing.end());
    result.failures.insert(result.failures.end(), written.failures.begin(), written.failures.end());
    return result;
}

void PgRelationStore::set_kind(const PairKey& pair, RelationKind kind) {
    if (kind == RelationKind::NewMatch) {
        throw StoreError(ErrorKind::InvalidTransition,
                         "Annotation cannot return " + to_string(pair) + " to new_match; use reset_kind");
    }
    write_kind(pair, kind);
}

void PgRelationStore::reset_kind(const PairKey& pair) {
    write_kind(pair, RelationKind::NewMatch);
}

void PgRelationStore::write_kind(const PairKey& pair, RelationKind kind) {
    run("set_kind", [&] {
        const std::string a = std::to_string(pair.a);
        const std::string b = std::to_string(pair.b);
        PostgresConnection::Transaction tx(*db_);

        size_t live = 0;
        db_->query("SELECT id FROM " + table("item") + " WHERE id IN ($1::bigint, $2::bigint) FOR SHARE", {a, b},
                   [&](const std::vector<std::string>&) { ++live; });
        if (live < 2) {
            throw StoreError(ErrorKind::ConstraintViolation, "Pair " + to_string(pair) + " references a non-live item");
        }

        size_t updated = db_->execute("UPDATE " + table("relation") +
                                      " SET kind = $3, modifiedat = now() WHERE ida = $1 AND idb = $2",
                                      {a, b, to_string(kind)});
        if (updated == 0) {
            throw StoreError(ErrorKind::NotFound, "No relation for " + to_string(pair));
        }
        tx.commit();
    });
}

std::optional<RelationKind> PgRelationStore::get_kind(const PairKey& pair) {
    auto text = run("get_kind", [&] {
        return db_->query_single("SELECT kind FROM " + table("relation") + " WHERE ida = $1 AND idb = $2",
                                 {std::to_string(pair.a), std::to_string(pair.b)});
    });
    if (!text) return std::nullopt;
    return kind_from_db(*text);
}

std::optional<Relation> PgRelationStore::get_relation(const PairKey& pair) {
    return run("get_relation", [&] {
        std::optional<Relation> rel;
        db_->query("SELECT ida, idb, distance, kind, EXTRACT(EPOCH FROM createdat)::bigint FROM " + table("relation") +
                   " WHERE ida = $1 AND idb = $2",
                   {std::to_string(pair.a), std::to_string(pair.b)},
                   [&](const std::vector<std::string>& row) { rel = relation_from_row(row); });
        return rel;
    });
}

RelationMap PgRelationStore::get_relations(const std::vector<PairKey>& pairs) {
    if (pairs.empty()) return {};

    std::vector<ItemId> as, bs;
    as.reserve(pairs.size());
    bs.reserve(pairs.size());
    for (const auto& p : pairs) {
        as.push_back(p.a);
        bs.push_back(p.b);
    }

    return run("get_relations", [&] {
        RelationMap out;
        db_->query("SELECT r.ida, r.idb, r.distance, r.kind, EXTRACT(EPOCH FROM r.createdat)::bigint FROM " +
                   table("relation") + " r JOIN unnest($1::bigint[], $2::bigint[]) AS p(ida, idb) "
                   "ON r.ida = p.ida AND r.idb = p.idb",
                   {pg_int_array(as), pg_int_array(bs)},
                   [&](const std::vector<std::string>& row) {
            Relation rel = relation_from_row(row);
            out[rel.pair] = rel;
        });
        return out;
    });
}

std::vector<Relation> PgRelationStore::all_relations() {
    return run("all_relations", [&] {
        std::vector<Relation> out;
        db_->query("SELECT ida, idb, distance, kind, EXTRACT(EPOCH FROM createdat)::bigint FROM " + table("relation") +
                   " ORDER BY ida, idb", {},
                   [&](const std::vector<std::string>& row) { out.push_back(relation_from_row(row)); });
        return out;
    });
}

size_t PgRelationStore::relation_count() {
    return run("relation_count", [&] {
        auto v = db_->query_single("SELECT count(*) FROM " + table("relation"));
        return v ? static_cast<size_t>(std::stoull(*v)) : size_t(0);
    });
}

size_t PgRelationStore::sweep_orphans() {
    std::vector<PairKey> relations;
    std::vector<ItemId> members;

    run("sweep_orphans", [&] {
        relations.clear();
        members.clear();
        PostgresConnection::Transaction tx(*db_);
        db_->query("DELETE FROM " + table("relation") + " r WHERE "
                   "NOT EXISTS (SELECT 1 FROM " + table("item") + " i WHERE i.id = r.ida) OR "
                   "NOT EXISTS (SELECT 1 FROM " + table("item") + " i WHERE i.id = r.idb) "
                   "RETURNING r.ida, r.idb", {},
                   [&](const std::vector<std::string>& row) {
            relations.push_back(PairKey{std::stoll(row[0]), std::stoll(row[1])});
        });
        db_->query("DELETE FROM " + table("clustermember") + " m WHERE "
                   "NOT EXISTS (SELECT 1 FROM " + table("item") + " i WHERE i.id = m.itemid) "
                   "RETURNING m.itemid", {},
                   [&](const std::vector<std::string>& row) { members.push_back(std::stoll(row[0])); });
        tx.commit();
    });

    report_orphans(relations, members.size());
    return relations.size() + members.size();
}

// =============================================================================
// Sticky clusters
// =============================================================================

int64_t PgRelationStore::create_cluster(const std::string& name, const std::string& target_folder) {
    return run("create_cluster", [&] {
        auto id = db_->query_single("INSERT INTO " + table("cluster") + " (name, targetfolder) VALUES ($1, $2) RETURNING id",
                                    {name, target_folder});
        if (!id) {
            throw StoreError(ErrorKind::IntegrityAnomaly, "INSERT ... RETURNING produced no cluster id");
        }
        return static_cast<int64_t>(std::stoll(*id));
    });
}

std::vector<ClusterRecord> PgRelationStore::clusters() {
    return run("clusters", [&] {
        std::vector<ClusterRecord> out;
        db_->query("SELECT id, name, targetfolder, EXTRACT(EPOCH FROM createdat)::bigint FROM " + table("cluster") +
                   " ORDER BY id", {},
                   [&](const std::vector<std::string>& row) {
            out.push_back(ClusterRecord{std::stoll(row[0]), row[1], row[2], std::stoll(row[3])});
        });
        return out;
    });
}

std::unordered_map<ItemId, int64_t> PgRelationStore::cluster_members() {
    return run("cluster_members", [&] {
        std::unordered_map<ItemId, int64_t> out;
        db_->query("SELECT itemid, clusterid FROM " + table("clustermember"), {},
                   [&](const std::vector<std::string>& row) { out[std::stoll(row[0])] = std::stoll(row[1]); });
        return out;
    });
}

void PgRelationStore::add_cluster_members(int64_t cluster_id, const std::vector<ItemId>& items) {
    if (items.empty()) return;
    run("add_cluster_members", [&] {
        const std::string cid = std::to_string(cluster_id);
        PostgresConnection::Transaction tx(*db_);
        if (!db_->query_single("SELECT id FROM " + table("cluster") + " WHERE id = $1 FOR SHARE", {cid})) {
            throw StoreError(ErrorKind::NotFound, "Cluster " + cid + " does not exist");
        }
        db_->execute("INSERT INTO " + table("clustermember") + " (itemid, clusterid) "
                     "SELECT u.id, $1::bigint FROM unnest($2::bigint[]) AS u(id) "
                     "JOIN " + table("item") + " i ON i.id = u.id "
                     "ON CONFLICT (itemid) DO NOTHING",
                     {cid, pg_int_array(items)});
        tx.commit();
    });
}

void PgRelationStore::delete_cluster(int64_t cluster_id) {
    run("delete_cluster", [&] {
        const std::string cid = std::to_string(cluster_id);
        if (!db_->query_single("DELETE FROM " + table("cluster") + " WHERE id = $1 RETURNING id", {cid})) {
            throw StoreError(ErrorKind::NotFound, "Cluster " + cid + " does not exist");
        }
    });
}

} // namespace Lookalike
