#pragma once

#include <fingerprint/fingerprint.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Lookalike {

using ItemId = int64_t;

/**
 * @brief A fingerprinted item as delivered by the scanning collaborator.
 *
 * The id is stable and never reused after deletion. source is the item's
 * location (a file path for images) and is only used for scope filtering.
 */
struct Item {
    ItemId id = 0;
    Fingerprint fingerprint;
    std::string source;
};

enum class RelationKind {
    NewMatch,       // freshly discovered, unreviewed
    NotDuplicate,
    NearDuplicate,
    Similar,
    SameSet
};

const char* to_string(RelationKind kind);
std::optional<RelationKind> parse_relation_kind(const std::string& text);
std::vector<RelationKind> all_relation_kinds();

inline bool is_annotated(RelationKind kind) {
    return kind != RelationKind::NewMatch;
}

/**
 * @brief Canonical unordered item pair, smaller id first.
 */
struct PairKey {
    ItemId a = 0;
    ItemId b = 0;

    /**
     * @throws std::invalid_argument for a self pair
     */
    static PairKey make(ItemId x, ItemId y);

    bool contains(ItemId id) const { return a == id || b == id; }

    bool operator==(const PairKey& o) const { return a == o.a && b == o.b; }
    bool operator!=(const PairKey& o) const { return !(*this == o); }
    bool operator<(const PairKey& o) const { return a < o.a || (a == o.a && b < o.b); }
};

struct PairKeyHasher {
    size_t operator()(const PairKey& k) const {
        size_t h = std::hash<ItemId>{}(k.a);
        h ^= std::hash<ItemId>{}(k.b) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

std::string to_string(const PairKey& pair);

/**
 * @brief Persisted relation row. Pair identity is immutable, kind is not.
 */
struct Relation {
    PairKey pair;
    uint32_t distance = 0;
    RelationKind kind = RelationKind::NewMatch;
    int64_t created_at = 0;     // epoch seconds
};

/**
 * @brief Freshly discovered pair. kind is provisional until re-read from storage.
 */
struct Candidate {
    PairKey pair;
    uint32_t distance = 0;
    RelationKind kind = RelationKind::NewMatch;
};

/**
 * @brief Restriction of a scan to items under a set of source roots.
 *
 * An empty scope admits every item. A source is in scope when it equals a
 * root or lies below it; trailing separators on roots are ignored.
 */
class SourceScope {
public:
    SourceScope() = default;
    explicit SourceScope(std::vector<std::string> roots);

    bool empty() const { return roots_.empty(); }
    bool contains(const std::string& source) const;
    const std::vector<std::string>& roots() const { return roots_; }

    bool operator==(const SourceScope& o) const { return roots_ == o.roots_; }
    bool operator!=(const SourceScope& o) const { return !(*this == o); }

    static std::string normalize(const std::string& path);

private:
    std::vector<std::string> roots_;    // normalized, sorted, unique
};

} // namespace Lookalike
