/**
 * @file reconciler.hpp
 * @brief Merge discovered candidates with persisted relation state
 */

#pragma once

#include <storage/relation_store.hpp>
#include <string>
#include <vector>

namespace Lookalike {

/**
 * @brief A candidate left out of the result because its stored state could
 * not be read back
 */
struct ReconcileWarning {
    PairKey pair;
    ErrorKind kind;
    std::string reason;
};

struct ReconcileResult {
    std::vector<Relation> relations;            // visible relations, sorted by pair
    std::vector<ReconcileWarning> warnings;     // excluded pairs
    std::vector<BatchFailure> failures;         // rejected writes (the pair may still be visible)
    size_t inserted = 0;
    size_t existing = 0;

    bool complete() const { return warnings.empty(); }
};

/**
 * @brief Writes candidates as new_match only where no row exists, then
 * re-reads every pair from the store and filters on the stored kind.
 *
 * A candidate's own kind never reaches the result: visibility is decided
 * from the row read back after the writes, in one place.
 */
class Reconciler {
public:
    explicit Reconciler(RelationStore& store, size_t batch_size = 5000);

    ReconcileResult reconcile(const std::vector<Candidate>& candidates, bool include_annotated) const;

private:
    static bool visible(const Relation& relation, bool include_annotated) {
        return include_annotated || relation.kind == RelationKind::NewMatch;
    }

    void reconcile_chunk(std::vector<Candidate> chunk, bool include_annotated, ReconcileResult& result) const;

    RelationStore& store_;
    size_t batch_size_;
};

} // namespace Lookalike
