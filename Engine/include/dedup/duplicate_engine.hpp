/**
 * @file duplicate_engine.hpp
 * @brief Entry point for scanners, deletion handlers and presentation layers
 */

#pragma once

#include <export.hpp>
#include <config/engine_config.hpp>
#include <dedup/candidate_generator.hpp>
#include <dedup/cluster_projector.hpp>
#include <dedup/reconciler.hpp>
#include <index/fingerprint_index.hpp>
#include <storage/relation_store.hpp>
#include <functional>
#include <shared_mutex>
#include <vector>

namespace Lookalike {

struct ScanRequest {
    uint32_t threshold = 5;
    SourceScope scope;
    bool include_annotated = false;
    const CancellationToken* cancel = nullptr;
    std::function<void(size_t done, size_t total)> progress;
};

struct ScanReport {
    std::vector<Relation> relations;
    std::vector<ReconcileWarning> warnings;
    std::vector<BatchFailure> failures;
    size_t orphans_swept = 0;       // non-zero is an integrity anomaly
    GeneratorStats stats;
    size_t inserted = 0;
    size_t existing = 0;
    bool cancelled = false;         // no relation was written or read
    double elapsed_ms = 0.0;
};

/**
 * @brief Owns the fingerprint index and drives discovery against one store.
 *
 * The index is rebuilt on demand: on the first scan, when the scope changes,
 * or when too many deleted ids are parked in it. Scans read it under a shared
 * lock; registration and deletion take it exclusively. A scan that rebuilds
 * also generates under the exclusive lock, so its candidates always come from
 * an index built for its own scope.
 */
class LOOKALIKE_API DuplicateEngine {
public:
    DuplicateEngine(RelationStore& store, EngineConfig config);

    /**
     * @brief Persist items from the scanner and add them to the live index.
     * Entries with the wrong fingerprint width fail with ConstraintViolation.
     */
    ItemBatchResult register_items(const std::vector<Item>& items);

    /**
     * @brief Hide the id from the index, then delete it and its relations.
     * The index change is undone if the store refuses the delete.
     * @return Relations removed
     */
    size_t item_deleted(ItemId id);

    ScanReport find_duplicates(const ScanRequest& request);
    ScanReport find_duplicates(uint32_t threshold, const SourceScope& scope, bool include_annotated);

    /**
     * @brief User annotation. new_match is routed to reset_annotation().
     */
    void annotate(const PairKey& pair, RelationKind kind);

    /**
     * @throws StoreError(InvalidTransition) unless allow_annotation_reset is set
     */
    void reset_annotation(const PairKey& pair);

    /**
     * @return Orphans removed; zero in steady state
     */
    size_t integrity_check();

    ClusterProjection project_clusters(const ClusterOptions& options = ClusterOptions());

    /**
     * @brief Force a rebuild on the next scan (items changed behind our back)
     */
    void invalidate();

    const EngineConfig& config() const { return config_; }
    RelationStore& store() { return store_; }

private:
    bool needs_rebuild(const SourceScope& scope) const;

    RelationStore& store_;
    EngineConfig config_;
    CandidateGenerator generator_;
    Reconciler reconciler_;

    std::shared_mutex index_mutex_;
    FingerprintIndex index_;
    SourceScope indexed_scope_;
    bool index_ready_ = false;
};

} // namespace Lookalike
