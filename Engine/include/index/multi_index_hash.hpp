/**
 * @file multi_index_hash.hpp
 * @brief Multi-index hashing prefilter for Hamming range queries
 */

#pragma once

#include <fingerprint/fingerprint.hpp>
#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Lookalike {

/**
 * @brief Splits codes into k disjoint slices, each with an exact-match table.
 *
 * Two codes within distance t differ by at most floor(t/k) bits in at least
 * one slice, so probing every slice value within that bound finds every true
 * match; candidates are then verified on the full code. With t < k the probe
 * is a plain bucket lookup. Results are exact, identical to a linear scan.
 */
class MultiIndexHash {
public:
    /**
     * @throws std::invalid_argument if slices is 0, exceeds bits, or leaves
     *         a slice wider than 64 bits
     */
    MultiIndexHash(size_t bits, size_t slices);

    /**
     * @brief Register a code under a caller-chosen key
     */
    void add(uint32_t key, const Fingerprint& fingerprint);

    void clear();

    size_t size() const { return entries_.size(); }
    size_t slices() const { return widths_.size(); }
    const std::vector<size_t>& slice_widths() const { return widths_; }

    /**
     * @brief (key, distance) for every entry within radius, ordered by key
     */
    std::vector<std::pair<uint32_t, uint32_t>> query(const Fingerprint& fingerprint, uint32_t radius) const;

    /**
     * @brief Table probes a query at this radius would issue
     */
    double probe_count(uint32_t radius) const;

private:
    std::vector<uint32_t> candidates(const Fingerprint& fingerprint, uint32_t radius) const;

    size_t bits_;
    std::vector<size_t> widths_;
    std::vector<size_t> offsets_;
    std::vector<std::pair<uint32_t, Fingerprint>> entries_;
    std::vector<std::unordered_map<uint64_t, std::vector<uint32_t>>> tables_;  // slice value -> entry
};

} // namespace Lookalike
