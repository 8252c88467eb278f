/**
 * @file cluster_projector.hpp
 * @brief Groups items into sticky clusters from reconciled relations
 */

#pragma once

#include <storage/relation_store.hpp>
#include <string>
#include <vector>

namespace Lookalike {

struct ClusterOptions {
    bool exact_fingerprint = true;      // identical codes are always connected
    std::vector<RelationKind> positive_kinds{RelationKind::NearDuplicate, RelationKind::SameSet};
    bool ignore_negative = false;       // keep not_duplicate pairs connected
    bool persist_new = false;           // store fresh components as clusters
    SourceScope scope;                  // only clusters entirely inside
};

struct ClusterView {
    int64_t id = 0;                     // < 0: provisional, not stored
    std::string name;
    std::string target_folder;
    std::vector<ItemId> members;        // ascending
};

struct ClusterProjection {
    std::vector<ClusterView> clusters;  // stored ids ascending, then provisional
    size_t components = 0;
    size_t created = 0;
    size_t members_added = 0;
};

/**
 * @brief Connected components over positive edges, reconciled with the
 * clusters already in the store.
 *
 * A component touching stored clusters joins the lowest of them; its
 * unclustered items are persisted there. Items keep their stored cluster
 * while live even when no edge reaches them any more. Each item appears in
 * exactly one view.
 */
class ClusterProjector {
public:
    explicit ClusterProjector(RelationStore& store);

    ClusterProjection project(const ClusterOptions& options = ClusterOptions());

private:
    std::vector<std::vector<ItemId>> components(const std::vector<Item>& items,
                                                const ClusterOptions& options) const;

    RelationStore& store_;
};

} // namespace Lookalike
