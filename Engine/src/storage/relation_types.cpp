#include <storage/relation_types.hpp>
#include <algorithm>
#include <stdexcept>

namespace Lookalike {

const char* to_string(RelationKind kind) {
    switch (kind) {
        case RelationKind::NewMatch:      return "new_match";
        case RelationKind::NotDuplicate:  return "not_duplicate";
        case RelationKind::NearDuplicate: return "near_duplicate";
        case RelationKind::Similar:       return "similar";
        case RelationKind::SameSet:       return "same_set";
    }
    return "new_match";
}

std::optional<RelationKind> parse_relation_kind(const std::string& text) {
    for (RelationKind kind : all_relation_kinds()) {
        if (text == to_string(kind)) return kind;
    }
    return std::nullopt;
}

std::vector<RelationKind> all_relation_kinds() {
    return {RelationKind::NewMatch, RelationKind::NotDuplicate, RelationKind::NearDuplicate,
            RelationKind::Similar, RelationKind::SameSet};
}

PairKey PairKey::make(ItemId x, ItemId y) {
    if (x == y) {
        throw std::invalid_argument("Self pair (" + std::to_string(x) + ", " + std::to_string(x) + ")");
    }
    return x < y ? PairKey{x, y} : PairKey{y, x};
}

std::string to_string(const PairKey& pair) {
    return "(" + std::to_string(pair.a) + ", " + std::to_string(pair.b) + ")";
}

SourceScope::SourceScope(std::vector<std::string> roots) {
    for (auto& r : roots) {
        std::string n = normalize(r);
        if (!n.empty()) roots_.push_back(std::move(n));
    }
    std::sort(roots_.begin(), roots_.end());
    roots_.erase(std::unique(roots_.begin(), roots_.end()), roots_.end());
}

std::string SourceScope::normalize(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        // Collapse repeated separators
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

bool SourceScope::contains(const std::string& source) const {
    if (roots_.empty()) return true;

    std::string path = normalize(source);
    for (const auto& root : roots_) {
        if (path == root) return true;
        if (root == "/") {
            if (!path.empty() && path[0] == '/') return true;
            continue;
        }
        if (path.size() > root.size() && path.compare(0, root.size(), root) == 0 &&
            path[root.size()] == '/') {
            return true;
        }
    }
    return false;
}

} // namespace Lookalike
