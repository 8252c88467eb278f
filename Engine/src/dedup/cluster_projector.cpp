#include <dedup/cluster_projector.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <map>
#include <unordered_set>

namespace Lookalike {

ClusterProjector::ClusterProjector(RelationStore& store) : store_(store) {}

std::vector<std::vector<ItemId>> ClusterProjector::components(const std::vector<Item>& items,
                                                              const ClusterOptions& options) const {
    std::unordered_set<ItemId> live;
    for (const auto& item : items) live.insert(item.id);

    auto relations = store_.all_relations();

    std::unordered_set<PairKey, PairKeyHasher> negative;
    if (!options.ignore_negative) {
        for (const auto& rel : relations) {
            if (rel.kind == RelationKind::NotDuplicate) negative.insert(rel.pair);
        }
    }

    std::unordered_map<ItemId, std::vector<ItemId>> adjacency;
    size_t edges = 0;
    auto connect = [&](ItemId a, ItemId b) {
        adjacency[a].push_back(b);
        adjacency[b].push_back(a);
        ++edges;
    };

    if (options.exact_fingerprint) {
        std::unordered_map<Fingerprint, std::vector<ItemId>, FingerprintHasher> buckets;
        for (const auto& item : items) buckets[item.fingerprint].push_back(item.id);
        for (auto& [fp, ids] : buckets) {
            std::sort(ids.begin(), ids.end());
            for (size_t i = 0; i < ids.size(); ++i) {
                for (size_t j = i + 1; j < ids.size(); ++j) {
                    if (!negative.count(PairKey{ids[i], ids[j]})) connect(ids[i], ids[j]);
                }
            }
        }
    }

    for (const auto& rel : relations) {
        if (!live.count(rel.pair.a) || !live.count(rel.pair.b)) continue;
        if (std::find(options.positive_kinds.begin(), options.positive_kinds.end(), rel.kind) ==
            options.positive_kinds.end()) continue;
        connect(rel.pair.a, rel.pair.b);
    }

    // BFS over item ids in ascending order so component order is stable.
    std::vector<ItemId> order;
    order.reserve(adjacency.size());
    for (const auto& [id, next] : adjacency) order.push_back(id);
    std::sort(order.begin(), order.end());

    std::vector<std::vector<ItemId>> out;
    std::unordered_set<ItemId> visited;
    for (ItemId start : order) {
        if (visited.count(start)) continue;
        std::vector<ItemId> component;
        std::vector<ItemId> queue{start};
        visited.insert(start);
        for (size_t head = 0; head < queue.size(); ++head) {
            ItemId cur = queue[head];
            component.push_back(cur);
            for (ItemId n : adjacency[cur]) {
                if (visited.insert(n).second) queue.push_back(n);
            }
        }
        if (component.size() >= 2) {
            std::sort(component.begin(), component.end());
            out.push_back(std::move(component));
        }
    }

    Logger::info("Cluster graph: " + std::to_string(edges) + " edges, " + std::to_string(negative.size()) +
                 " negative pairs, " + std::to_string(out.size()) + " components");
    return out;
}

ClusterProjection ClusterProjector::project(const ClusterOptions& options) {
    ClusterProjection result;

    auto items = store_.live_items();
    std::unordered_map<ItemId, std::string> sources;
    for (const auto& item : items) sources[item.id] = item.source;

    auto fresh = components(items, options);
    result.components = fresh.size();

    auto stored = store_.cluster_members();
    std::map<int64_t, ClusterView> views;
    for (const auto& rec : store_.clusters()) {
        views[rec.id] = ClusterView{rec.id, rec.name, rec.target_folder, {}};
    }

    std::unordered_set<ItemId> placed;
    std::vector<ClusterView> provisional;

    for (const auto& component : fresh) {
        std::vector<int64_t> touched;
        for (ItemId id : component) {
            auto it = stored.find(id);
            if (it != stored.end() && views.count(it->second)) touched.push_back(it->second);
        }

        int64_t target = 0;
        if (!touched.empty()) {
            target = *std::min_element(touched.begin(), touched.end());
        } else if (options.persist_new) {
            std::string name = "New Cluster " + std::to_string(component.front());
            target = store_.create_cluster(name, "");
            views[target] = ClusterView{target, name, "", {}};
            ++result.created;
        } else {
            provisional.push_back(ClusterView{-static_cast<int64_t>(provisional.size() + 1),
                                              "New Cluster " + std::to_string(provisional.size() + 1),
                                              "", component});
            placed.insert(component.begin(), component.end());
            continue;
        }

        std::vector<ItemId> unclustered;
        for (ItemId id : component) {
            if (!stored.count(id)) {
                unclustered.push_back(id);
                stored[id] = target;
            }
        }
        if (!unclustered.empty()) {
            store_.add_cluster_members(target, unclustered);
            result.members_added += unclustered.size();
        }

        // Members stored elsewhere stay there, but show with the component this pass.
        auto& view = views[target];
        view.members.insert(view.members.end(), component.begin(), component.end());
        placed.insert(component.begin(), component.end());
    }

    // Sticky: stored members no edge reached this pass keep their cluster.
    for (const auto& [id, cluster] : stored) {
        if (placed.count(id) || !sources.count(id)) continue;
        auto it = views.find(cluster);
        if (it != views.end()) it->second.members.push_back(id);
    }

    auto in_scope = [&](const ClusterView& view) {
        if (options.scope.empty()) return true;
        return std::all_of(view.members.begin(), view.members.end(),
                           [&](ItemId id) { return options.scope.contains(sources[id]); });
    };

    for (auto& [id, view] : views) {
        if (view.members.empty()) continue;
        std::sort(view.members.begin(), view.members.end());
        if (in_scope(view)) result.clusters.push_back(std::move(view));
    }
    for (auto& view : provisional) {
        if (in_scope(view)) result.clusters.push_back(std::move(view));
    }

    Logger::success("Projected " + std::to_string(result.clusters.size()) + " clusters (" +
                    std::to_string(result.created) + " created, " + std::to_string(result.members_added) +
                    " members added)");
    return result;
}

} // namespace Lookalike
