#include <dedup/duplicate_engine.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

namespace Lookalike {

DuplicateEngine::DuplicateEngine(RelationStore& store, EngineConfig config)
    : store_(store),
      config_(std::move(config)),
      generator_(store),
      reconciler_(store, config_.reconcile_batch_size),
      index_(config_.fingerprint_bits) {
    config_.validate();
}

ItemBatchResult DuplicateEngine::register_items(const std::vector<Item>& items) {
    ItemBatchResult result;
    std::vector<Item> valid;
    valid.reserve(items.size());
    for (const auto& item : items) {
        if (item.fingerprint.bits() != config_.fingerprint_bits) {
            result.failures.push_back({item.id, ErrorKind::ConstraintViolation,
                                       "Expected " + std::to_string(config_.fingerprint_bits) + "-bit fingerprint, got " +
                                       std::to_string(item.fingerprint.bits())});
            continue;
        }
        valid.push_back(item);
    }

    ItemBatchResult stored = store_.upsert_items(valid);
    result.written = stored.written;
    std::unordered_set<ItemId> refused;
    for (const auto& f : stored.failures) {
        refused.insert(f.id);
        result.failures.push_back(f);
    }

    std::unique_lock<std::shared_mutex> lock(index_mutex_);
    if (index_ready_) {
        for (const auto& item : valid) {
            if (refused.count(item.id)) continue;
            if (indexed_scope_.empty() || indexed_scope_.contains(item.source)) {
                index_.insert(item);
            } else if (index_.contains(item.id)) {
                // Moved out of the indexed scope
                index_.exclude(item.id);
            }
        }
    }
    return result;
}

size_t DuplicateEngine::item_deleted(ItemId id) {
    std::unique_lock<std::shared_mutex> lock(index_mutex_);
    bool was_indexed = index_.exclude(id);
    try {
        return store_.delete_item(id);
    } catch (const StoreError& e) {
        // NotFound: the item is gone either way, keep it hidden.
        if (was_indexed && e.kind() != ErrorKind::NotFound) index_.restore(id);
        throw;
    } catch (const std::exception&) {
        if (was_indexed) index_.restore(id);
        throw;
    }
}

bool DuplicateEngine::needs_rebuild(const SourceScope& scope) const {
    if (!index_ready_ || scope != indexed_scope_) return true;
    size_t parked = index_.excluded_count();
    if (parked == 0) return false;
    double ratio = static_cast<double>(parked) / static_cast<double>(parked + index_.size());
    return ratio > config_.rebuild_exclusion_ratio;
}

ScanReport DuplicateEngine::find_duplicates(uint32_t threshold, const SourceScope& scope, bool include_annotated) {
    ScanRequest request;
    request.threshold = threshold;
    request.scope = scope;
    request.include_annotated = include_annotated;
    return find_duplicates(request);
}

ScanReport DuplicateEngine::find_duplicates(const ScanRequest& request) {
    if (request.threshold > config_.fingerprint_bits) {
        throw std::invalid_argument("Threshold " + std::to_string(request.threshold) + " exceeds fingerprint width " +
                                    std::to_string(config_.fingerprint_bits));
    }

    Timer timer;
    ScanReport report;

    GeneratorOptions options;
    options.threshold = request.threshold;
    options.mih_slices = config_.mih_slices;
    options.worker_threads = config_.worker_threads;
    options.cancel = request.cancel;
    options.progress = request.progress;

    // The index must still cover request.scope while it is queried, so a
    // rebuild and its generation share one exclusive section.
    CandidateSet candidates;
    bool generated = false;
    {
        std::shared_lock<std::shared_mutex> lock(index_mutex_);
        if (!needs_rebuild(request.scope)) {
            candidates = generator_.generate(index_, options);
            generated = true;
        }
    }
    if (!generated) {
        std::unique_lock<std::shared_mutex> lock(index_mutex_);
        if (needs_rebuild(request.scope)) {
            generator_.load(index_, request.scope);
            indexed_scope_ = request.scope;
            index_ready_ = true;
        }
        candidates = generator_.generate(index_, options);
    }
    report.stats = candidates.stats;

    if (candidates.cancelled) {
        // Nothing half-written: generation stops, no transaction was started.
        report.cancelled = true;
        report.elapsed_ms = timer.elapsed_ms();
        Logger::warn("Scan cancelled after " + std::to_string(static_cast<int>(report.elapsed_ms)) + "ms");
        return report;
    }

    ReconcileResult reconciled = reconciler_.reconcile(candidates.candidates, request.include_annotated);
    report.relations = std::move(reconciled.relations);
    report.warnings = std::move(reconciled.warnings);
    report.failures = std::move(reconciled.failures);
    report.inserted = reconciled.inserted;
    report.existing = reconciled.existing;

    if (config_.integrity_check_on_scan) {
        report.orphans_swept = store_.sweep_orphans();
        if (report.orphans_swept > 0) {
            Logger::warn("Scan completed with " + std::to_string(report.orphans_swept) + " integrity anomalies");
        }
    }

    report.elapsed_ms = timer.elapsed_ms();
    Logger::success("Scan: " + std::to_string(report.relations.size()) + " relations visible, " +
                    std::to_string(report.inserted) + " new, " + std::to_string(report.existing) + " known" +
                    (report.warnings.empty() ? std::string() : ", " + std::to_string(report.warnings.size()) + " excluded") +
                    " in " + std::to_string(static_cast<int>(report.elapsed_ms)) + "ms");
    return report;
}

void DuplicateEngine::annotate(const PairKey& pair, RelationKind kind) {
    if (kind == RelationKind::NewMatch) {
        reset_annotation(pair);
        return;
    }
    store_.set_kind(pair, kind);
}

void DuplicateEngine::reset_annotation(const PairKey& pair) {
    if (!config_.allow_annotation_reset) {
        throw StoreError(ErrorKind::InvalidTransition,
                         "Resetting " + to_string(pair) + " to new_match is disabled (allow_annotation_reset)");
    }
    store_.reset_kind(pair);
}

size_t DuplicateEngine::integrity_check() {
    size_t orphans = store_.sweep_orphans();
    if (orphans == 0) {
        Logger::success("Integrity check: no orphans");
    }
    return orphans;
}

ClusterProjection DuplicateEngine::project_clusters(const ClusterOptions& options) {
    ClusterProjector projector(store_);
    return projector.project(options);
}

void DuplicateEngine::invalidate() {
    std::unique_lock<std::shared_mutex> lock(index_mutex_);
    index_ready_ = false;
}

} // namespace Lookalike
