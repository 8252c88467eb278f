#include <index/fingerprint_index.hpp>
#include <algorithm>
#include <stdexcept>

namespace Lookalike {

FingerprintIndex::FingerprintIndex(size_t bits) : bits_(bits) {
    if (bits == 0 || bits > Fingerprint::MAX_BITS) {
        throw std::invalid_argument("FingerprintIndex: width must be in 1.." + std::to_string(Fingerprint::MAX_BITS));
    }
}

void FingerprintIndex::check_width(const Fingerprint& fingerprint) const {
    if (fingerprint.bits() != bits_) {
        throw std::invalid_argument("FingerprintIndex: expected " + std::to_string(bits_) +
                                    "-bit fingerprint, got " + std::to_string(fingerprint.bits()));
    }
}

void FingerprintIndex::build(const std::vector<Item>& items) {
    for (const auto& item : items) check_width(item.fingerprint);

    nodes_.clear();
    buckets_.clear();
    id_to_node_.clear();
    excluded_.clear();
    nodes_.reserve(items.size());
    buckets_.reserve(items.size());
    id_to_node_.reserve(items.size());

    for (const auto& item : items) insert(item);
}

uint32_t FingerprintIndex::place(const Fingerprint& fingerprint) {
    auto found = buckets_.find(fingerprint);
    if (found != buckets_.end()) return found->second;

    const uint32_t created = static_cast<uint32_t>(nodes_.size());
    if (!nodes_.empty()) {
        uint32_t cur = 0;
        for (;;) {
            // d > 0: identical codes were caught by the bucket lookup
            uint32_t d = Fingerprint::hamming(nodes_[cur].fingerprint, fingerprint);
            auto& children = nodes_[cur].children;
            auto edge = std::find_if(children.begin(), children.end(),
                                     [d](const std::pair<uint32_t, uint32_t>& c) { return c.first == d; });
            if (edge == children.end()) {
                children.emplace_back(d, created);
                break;
            }
            cur = edge->second;
        }
    }

    nodes_.push_back(Node{fingerprint, {}, {}});
    buckets_.emplace(fingerprint, created);
    return created;
}

void FingerprintIndex::detach(ItemId id, uint32_t node) {
    auto& ids = nodes_[node].ids;
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
}

void FingerprintIndex::insert(const Item& item) {
    check_width(item.fingerprint);

    auto live = id_to_node_.find(item.id);
    if (live != id_to_node_.end()) {
        if (nodes_[live->second].fingerprint == item.fingerprint) return;
        detach(item.id, live->second);
        id_to_node_.erase(live);
    }
    excluded_.erase(item.id);

    uint32_t node = place(item.fingerprint);
    nodes_[node].ids.push_back(item.id);
    id_to_node_[item.id] = node;
}

bool FingerprintIndex::exclude(ItemId id) {
    auto it = id_to_node_.find(id);
    if (it == id_to_node_.end()) return false;

    detach(id, it->second);
    excluded_[id] = it->second;
    id_to_node_.erase(it);
    return true;
}

bool FingerprintIndex::restore(ItemId id) {
    auto it = excluded_.find(id);
    if (it == excluded_.end()) return false;

    nodes_[it->second].ids.push_back(id);
    id_to_node_[id] = it->second;
    excluded_.erase(it);
    return true;
}

std::vector<ItemId> FingerprintIndex::exact(const Fingerprint& fingerprint) const {
    check_width(fingerprint);
    auto it = buckets_.find(fingerprint);
    if (it == buckets_.end()) return {};

    std::vector<ItemId> ids = nodes_[it->second].ids;
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<std::pair<uint32_t, uint32_t>> FingerprintIndex::query_groups(const Fingerprint& fingerprint,
                                                                          uint32_t radius) const {
    check_width(fingerprint);
    std::vector<std::pair<uint32_t, uint32_t>> out;
    if (nodes_.empty()) return out;
    // Every code is within bits_ of every other; a wider radius would wrap d + radius.
    radius = std::min<uint32_t>(radius, static_cast<uint32_t>(bits_));

    std::vector<uint32_t> stack;
    stack.push_back(0);
    while (!stack.empty()) {
        uint32_t n = stack.back();
        stack.pop_back();
        const Node& node = nodes_[n];

        uint32_t d = Fingerprint::hamming(node.fingerprint, fingerprint);
        if (d <= radius && !node.ids.empty()) out.emplace_back(n, d);

        // Triangle inequality: a child at edge c can only hold matches if |c - d| <= radius
        uint32_t lo = d > radius ? d - radius : 0;
        uint32_t hi = d + radius;
        for (const auto& [edge, child] : node.children) {
            if (edge >= lo && edge <= hi) stack.push_back(child);
        }
    }
    return out;
}

std::vector<IndexMatch> FingerprintIndex::query(const Fingerprint& fingerprint, uint32_t radius) const {
    std::vector<IndexMatch> out;
    for (const auto& [group, distance] : query_groups(fingerprint, radius)) {
        for (ItemId id : nodes_[group].ids) out.push_back(IndexMatch{id, distance});
    }
    std::sort(out.begin(), out.end(), [](const IndexMatch& a, const IndexMatch& b) { return a.id < b.id; });
    return out;
}

std::vector<IndexMatch> FingerprintIndex::brute_force(const std::vector<Item>& items,
                                                      const Fingerprint& fingerprint, uint32_t radius) {
    std::vector<IndexMatch> out;
    for (const auto& item : items) {
        uint32_t d = Fingerprint::hamming(item.fingerprint, fingerprint);
        if (d <= radius) out.push_back(IndexMatch{item.id, d});
    }
    std::sort(out.begin(), out.end(), [](const IndexMatch& a, const IndexMatch& b) { return a.id < b.id; });
    return out;
}

} // namespace Lookalike
