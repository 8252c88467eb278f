#include <storage/memory_relation_store.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace fs = std::filesystem;

namespace Lookalike {

MemoryRelationStore::MemoryRelationStore(std::string snapshot_path)
    : snapshot_path_(std::move(snapshot_path)) {
    if (!snapshot_path_.empty() && fs::exists(snapshot_path_)) {
        load(snapshot_path_);
    }
}

template<typename Fn>
auto MemoryRelationStore::write(Fn&& fn) -> decltype(fn(std::declval<Tables&>())) {
    std::lock_guard<std::mutex> lock(mutex_);
    Tables next = tables_;
    if constexpr (std::is_void_v<decltype(fn(next))>) {
        fn(next);
        if (!snapshot_path_.empty()) persist(next, snapshot_path_);
        tables_ = std::move(next);
    } else {
        auto result = fn(next);
        if (!snapshot_path_.empty()) persist(next, snapshot_path_);
        tables_ = std::move(next);
        return result;
    }
}

void MemoryRelationStore::initialize() {
    if (snapshot_path_.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fs::exists(snapshot_path_)) {
        persist(tables_, snapshot_path_);
        Logger::success("Created snapshot " + snapshot_path_);
    }
}

// =============================================================================
// Items
// =============================================================================

ItemBatchResult MemoryRelationStore::upsert_items(const std::vector<Item>& items) {
    return write([&](Tables& t) {
        ItemBatchResult result;
        for (const auto& item : items) {
            if (t.retired.count(item.id)) {
                result.failures.push_back({item.id, ErrorKind::ConstraintViolation,
                                           "Item " + std::to_string(item.id) + " was deleted; ids are never reused"});
                continue;
            }
            if (item.fingerprint.empty()) {
                result.failures.push_back({item.id, ErrorKind::ConstraintViolation, "Item has no fingerprint"});
                continue;
            }
            t.items[item.id] = item;
            ++result.written;
        }
        return result;
    });
}

bool MemoryRelationStore::is_live(ItemId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tables_.items.count(id) > 0;
}

std::vector<Item> MemoryRelationStore::live_items(const SourceScope& scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Item> out;
    out.reserve(tables_.items.size());
    for (const auto& [id, item] : tables_.items) {
        if (scope.empty() || scope.contains(item.source)) out.push_back(item);
    }
    return out;
}

size_t MemoryRelationStore::item_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return tables_.items.size();
}

size_t MemoryRelationStore::delete_item(ItemId id) {
    size_t removed = write([&](Tables& t) {
        if (!t.items.erase(id)) {
            throw StoreError(ErrorKind::NotFound, "Item " + std::to_string(id) + " is not live");
        }
        size_t count = 0;
        for (auto it = t.relations.begin(); it != t.relations.end();) {
            if (it->first.contains(id)) {
                it = t.relations.erase(it);
                ++count;
            } else {
                ++it;
            }
        }
        t.members.erase(id);
        t.retired.insert(id);
        return count;
    });
    Logger::info("Deleted item " + std::to_string(id) + " and " + std::to_string(removed) + " relations");
    return removed;
}

// =============================================================================
// Relations
// =============================================================================

BatchResult MemoryRelationStore::upsert_if_absent(const std::vector<Candidate>& batch) {
    if (batch.empty()) return {};
    try {
        return write([&](Tables& t) {
            BatchResult result;
            const int64_t now = unix_now();
            for (const auto& c : batch) {
                if (!(c.pair.a < c.pair.b)) {
                    result.failures.push_back({c.pair, ErrorKind::ConstraintViolation, "Pair is not canonical"});
                    continue;
                }
                if (!t.items.count(c.pair.a) || !t.items.count(c.pair.b)) {
                    result.failures.push_back({c.pair, ErrorKind::ConstraintViolation,
                                               "Pair " + to_string(c.pair) + " references a non-live item"});
                    continue;
                }
                if (t.relations.count(c.pair)) {
                    result.existing.push_back(c.pair);
                    continue;
                }
                t.relations[c.pair] = Relation{c.pair, c.distance, c.kind, now};
                result.inserted.push_back(c.pair);
            }
            return result;
        });
    } catch (const StoreError& e) {
        // Snapshot write failed: nothing was published.
        BatchResult result;
        for (const auto& c : batch) {
            result.failures.push_back({c.pair, e.kind(), e.what()});
        }
        Logger::warn("upsert_if_absent: batch of " + std::to_string(batch.size()) +
                     " rolled back (" + to_string(e.kind()) + ")");
        return result;
    }
}

void MemoryRelationStore::set_kind(const PairKey& pair, RelationKind kind) {
    if (kind == RelationKind::NewMatch) {
        throw StoreError(ErrorKind::InvalidTransition,
                         "Annotation cannot return " + to_string(pair) + " to new_match; use reset_kind");
    }
    write_kind(pair, kind);
}

void MemoryRelationStore::reset_kind(const PairKey& pair) {
    write_kind(pair, RelationKind::NewMatch);
}

void MemoryRelationStore::write_kind(const PairKey& pair, RelationKind kind) {
    write([&](Tables& t) {
        if (!t.items.count(pair.a) || !t.items.count(pair.b)) {
            throw StoreError(ErrorKind::ConstraintViolation, "Pair " + to_string(pair) + " references a non-live item");
        }
        auto it = t.relations.find(pair);
        if (it == t.relations.end()) {
            throw StoreError(ErrorKind::NotFound, "No relation for " + to_string(pair));
        }
        it->second.kind = kind;
    });
}

std::optional<RelationKind> MemoryRelationStore::get_kind(const PairKey& pair) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tables_.relations.find(pair);
    if (it == tables_.relations.end()) return std::nullopt;
    return it->second.kind;
}

std::optional<Relation> MemoryRelationStore::get_relation(const PairKey& pair) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tables_.relations.find(pair);
    if (it == tables_.relations.end()) return std::nullopt;
    return it->second;
}

RelationMap MemoryRelationStore::get_relations(const std::vector<PairKey>& pairs) {
    std::lock_guard<std::mutex> lock(mutex_);
    RelationMap out;
    for (const auto& pair : pairs) {
        auto it = tables_.relations.find(pair);
        if (it != tables_.relations.end()) out[pair] = it->second;
    }
    return out;
}

std::vector<Relation> MemoryRelationStore::all_relations() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Relation> out;
    out.reserve(tables_.relations.size());
    for (const auto& [pair, rel] : tables_.relations) out.push_back(rel);
    return out;
}

size_t MemoryRelationStore::relation_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return tables_.relations.size();
}

size_t MemoryRelationStore::sweep_orphans() {
    std::vector<PairKey> relations;
    size_t members = 0;

    write([&](Tables& t) {
        relations.clear();
        members = 0;
        for (auto it = t.relations.begin(); it != t.relations.end();) {
            if (!t.items.count(it->first.a) || !t.items.count(it->first.b)) {
                relations.push_back(it->first);
                it = t.relations.erase(it);
            } else {
                ++it;
            }
        }
        for (auto it = t.members.begin(); it != t.members.end();) {
            if (!t.items.count(it->first) || !t.clusters.count(it->second)) {
                it = t.members.erase(it);
                ++members;
            } else {
                ++it;
            }
        }
    });

    report_orphans(relations, members);
    return relations.size() + members;
}

// =============================================================================
// Sticky clusters
// =============================================================================

int64_t MemoryRelationStore::create_cluster(const std::string& name, const std::string& target_folder) {
    return write([&](Tables& t) {
        int64_t id = t.next_cluster_id++;
        t.clusters[id] = ClusterRecord{id, name, target_folder, unix_now()};
        return id;
    });
}

std::vector<ClusterRecord> MemoryRelationStore::clusters() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ClusterRecord> out;
    for (const auto& [id, rec] : tables_.clusters) out.push_back(rec);
    return out;
}

std::unordered_map<ItemId, int64_t> MemoryRelationStore::cluster_members() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::unordered_map<ItemId, int64_t>(tables_.members.begin(), tables_.members.end());
}

void MemoryRelationStore::add_cluster_members(int64_t cluster_id, const std::vector<ItemId>& items) {
    if (items.empty()) return;
    write([&](Tables& t) {
        if (!t.clusters.count(cluster_id)) {
            throw StoreError(ErrorKind::NotFound, "Cluster " + std::to_string(cluster_id) + " does not exist");
        }
        for (ItemId id : items) {
            if (t.items.count(id)) t.members.emplace(id, cluster_id);
        }
    });
}

void MemoryRelationStore::delete_cluster(int64_t cluster_id) {
    write([&](Tables& t) {
        if (!t.clusters.erase(cluster_id)) {
            throw StoreError(ErrorKind::NotFound, "Cluster " + std::to_string(cluster_id) + " does not exist");
        }
        for (auto it = t.members.begin(); it != t.members.end();) {
            it = (it->second == cluster_id) ? t.members.erase(it) : std::next(it);
        }
    });
}

// =============================================================================
// Snapshot
// =============================================================================

void MemoryRelationStore::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    persist(tables_, path);
}

void MemoryRelationStore::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open snapshot: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    Tables loaded = parse(buffer.str());
    std::lock_guard<std::mutex> lock(mutex_);
    tables_ = std::move(loaded);
    Logger::info("Loaded snapshot " + path + ": " + std::to_string(tables_.items.size()) + " items, " +
                 std::to_string(tables_.relations.size()) + " relations");
}

void MemoryRelationStore::persist(const Tables& tables, const std::string& path) {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        out << serialize(tables);
        out.flush();
        if (!out) {
            throw StoreError(ErrorKind::TransientStorageError, "Cannot write snapshot " + tmp);
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        throw StoreError(ErrorKind::TransientStorageError, "Cannot replace snapshot " + path + ": " + ec.message());
    }
}

std::string MemoryRelationStore::serialize(const Tables& t) {
    nlohmann::json json;
    json["version"] = 1;
    json["next_cluster_id"] = t.next_cluster_id;

    auto& items = json["items"] = nlohmann::json::array();
    for (const auto& [id, item] : t.items) {
        items.push_back({{"id", id},
                         {"fingerprint", item.fingerprint.to_hex()},
                         {"bits", item.fingerprint.bits()},
                         {"source", item.source}});
    }

    json["retired"] = std::vector<ItemId>(t.retired.begin(), t.retired.end());

    auto& relations = json["relations"] = nlohmann::json::array();
    for (const auto& [pair, rel] : t.relations) {
        relations.push_back({{"a", pair.a},
                             {"b", pair.b},
                             {"distance", rel.distance},
                             {"kind", to_string(rel.kind)},
                             {"created_at", rel.created_at}});
    }

    auto& clusters = json["clusters"] = nlohmann::json::array();
    for (const auto& [id, rec] : t.clusters) {
        clusters.push_back({{"id", id},
                            {"name", rec.name},
                            {"target_folder", rec.target_folder},
                            {"created_at", rec.created_at}});
    }

    auto& members = json["members"] = nlohmann::json::array();
    for (const auto& [item, cluster] : t.members) {
        members.push_back({{"item", item}, {"cluster", cluster}});
    }

    return json.dump(2);
}

MemoryRelationStore::Tables MemoryRelationStore::parse(const std::string& text) {
    Tables t;
    try {
        auto json = nlohmann::json::parse(text);

        for (const auto& j : json.at("items")) {
            Item item;
            item.id = j.at("id").get<ItemId>();
            item.fingerprint = Fingerprint::from_hex(j.at("fingerprint").get<std::string>(),
                                                     j.at("bits").get<size_t>());
            item.source = j.value("source", std::string());
            t.items[item.id] = std::move(item);
        }

        if (json.contains("retired")) {
            for (const auto& id : json["retired"]) t.retired.insert(id.get<ItemId>());
        }

        for (const auto& j : json.at("relations")) {
            Relation rel;
            rel.pair.a = j.at("a").get<ItemId>();
            rel.pair.b = j.at("b").get<ItemId>();
            rel.distance = j.at("distance").get<uint32_t>();
            auto kind = parse_relation_kind(j.at("kind").get<std::string>());
            if (!kind) {
                throw std::runtime_error("unknown relation kind " + j.at("kind").dump());
            }
            rel.kind = *kind;
            rel.created_at = j.value("created_at", int64_t(0));
            t.relations[rel.pair] = rel;
        }

        if (json.contains("clusters")) {
            for (const auto& j : json["clusters"]) {
                ClusterRecord rec;
                rec.id = j.at("id").get<int64_t>();
                rec.name = j.value("name", std::string());
                rec.target_folder = j.value("target_folder", std::string());
                rec.created_at = j.value("created_at", int64_t(0));
                t.clusters[rec.id] = rec;
            }
        }

        if (json.contains("members")) {
            for (const auto& j : json["members"]) {
                t.members[j.at("item").get<ItemId>()] = j.at("cluster").get<int64_t>();
            }
        }

        t.next_cluster_id = json.value("next_cluster_id", int64_t(1));
        for (const auto& [id, rec] : t.clusters) {
            if (id >= t.next_cluster_id) t.next_cluster_id = id + 1;
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed snapshot: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Malformed snapshot: ") + e.what());
    }
    return t;
}

} // namespace Lookalike
