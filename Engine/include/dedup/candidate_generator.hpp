/**
 * @file candidate_generator.hpp
 * @brief All item pairs within a Hamming threshold, from a built index
 */

#pragma once

#include <index/fingerprint_index.hpp>
#include <storage/relation_store.hpp>
#include <atomic>
#include <functional>
#include <vector>

namespace Lookalike {

/**
 * @brief Cooperative stop flag for long scans. Polled between queries.
 */
class CancellationToken {
public:
    void cancel() { flag_.store(true, std::memory_order_relaxed); }
    void reset() { flag_.store(false, std::memory_order_relaxed); }
    bool cancelled() const { return flag_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> flag_{false};
};

struct GeneratorOptions {
    uint32_t threshold = 5;
    size_t mih_slices = 0;                  // 0 = query the BK-tree
    int worker_threads = 0;                 // 0 = OpenMP default
    const CancellationToken* cancel = nullptr;
    std::function<void(size_t done, size_t total)> progress;   // called from one thread only
};

struct GeneratorStats {
    size_t items = 0;
    size_t fingerprints = 0;
    size_t exact_pairs = 0;
    size_t fuzzy_pairs = 0;
    double elapsed_ms = 0.0;
};

struct CandidateSet {
    std::vector<Candidate> candidates;      // unique canonical pairs, sorted by (a, b)
    GeneratorStats stats;
    bool cancelled = false;
};

/**
 * @brief Two-pass pair discovery.
 *
 * Exact pass: every pair inside a fingerprint bucket, distance 0. Fuzzy pass:
 * each distinct fingerprint queries the index; a pair of buckets is emitted
 * only by the bucket with the lower ordinal, so workers never need a shared
 * visited set and no pair can appear twice.
 */
class CandidateGenerator {
public:
    explicit CandidateGenerator(RelationStore& store);

    /**
     * @brief Rebuild index from the store's live items in scope
     * @return Number of items indexed
     */
    size_t load(FingerprintIndex& index, const SourceScope& scope = SourceScope());

    CandidateSet generate(const FingerprintIndex& index, const GeneratorOptions& options) const;

private:
    RelationStore& store_;
};

} // namespace Lookalike
