/**
 * @file engine_config.hpp
 * @brief Engine settings from JSON and LOOKALIKE_* environment variables
 */

#pragma once

#include <storage/retry.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace Lookalike {

struct EngineConfig {
    // Storage
    std::string backend = "postgres";   // "postgres" | "memory"
    std::string conninfo;               // empty: PG* environment
    std::string schema = "lookalike";
    std::string snapshot_path;          // memory backend only; empty = no persistence

    // Matching
    size_t fingerprint_bits = 64;
    uint32_t default_threshold = 5;
    size_t mih_slices = 0;              // 0 = BK-tree only
    int worker_threads = 0;             // 0 = OpenMP default

    // Store boundary
    int retry_attempts = 4;
    int retry_base_ms = 20;
    size_t reconcile_batch_size = 5000;

    // Policy
    bool allow_annotation_reset = false;
    bool integrity_check_on_scan = true;
    double rebuild_exclusion_ratio = 0.25;

    /**
     * @brief Defaults overridden by the environment
     */
    static EngineConfig from_env();

    /**
     * @brief Read a JSON object; unknown keys are ignored, the environment
     * still wins over the file.
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static EngineConfig from_file(const std::string& path);

    /**
     * @brief Apply LOOKALIKE_BACKEND, LOOKALIKE_CONNINFO, LOOKALIKE_SCHEMA,
     * LOOKALIKE_SNAPSHOT, LOOKALIKE_THRESHOLD, LOOKALIKE_MIH_SLICES,
     * LOOKALIKE_THREADS, LOOKALIKE_ALLOW_RESET
     */
    void apply_env();

    /**
     * @throws std::invalid_argument describing the first bad field
     */
    void validate() const;

    RetryPolicy retry_policy() const { return RetryPolicy{retry_attempts, retry_base_ms}; }
};

} // namespace Lookalike
