#pragma once

#include <storage/store_error.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace Lookalike {

struct RetryPolicy {
    int attempts = 4;   // total tries, including the first
    int base_ms = 20;
};

constexpr int64_t k_max_backoff_ms = 30000;

/**
 * @brief Backoff before retry number attempt (0-based): base * 2^attempt plus
 * jitter derived from the calling thread, so colliding workers drift apart.
 * With base 20: 20-60ms, 40-120ms, 80-240ms. The base part saturates at 30s.
 */
inline std::chrono::milliseconds retry_backoff(const RetryPolicy& policy, int attempt) {
    int64_t base_ms = policy.base_ms;
    for (int i = 0; i < attempt && base_ms > 0 && base_ms < k_max_backoff_ms; ++i) base_ms *= 2;
    base_ms = std::min(base_ms, k_max_backoff_ms);
    if (base_ms <= 0) return std::chrono::milliseconds(0);
    size_t jitter = std::hash<std::thread::id>{}(std::this_thread::get_id()) %
                    static_cast<size_t>(base_ms * 2);
    return std::chrono::milliseconds(base_ms + static_cast<int64_t>(jitter));
}

/**
 * @brief Run fn, retrying TransientStorageError with backoff.
 *
 * Every other error propagates on first occurrence. fn must be safe to run
 * again after a transient failure, i.e. it must own its transaction.
 */
template<typename Fn>
auto with_retry(const RetryPolicy& policy, const std::string& what, Fn&& fn) -> decltype(fn()) {
    int attempts = policy.attempts < 1 ? 1 : policy.attempts;
    for (int attempt = 0;; ++attempt) {
        try {
            return fn();
        } catch (const StoreError& e) {
            if (!e.retryable() || attempt + 1 >= attempts) throw;
            auto delay = retry_backoff(policy, attempt);
            Logger::warn(what + " failed (" + e.what() + "), retry " +
                         std::to_string(attempt + 1) + "/" + std::to_string(attempts - 1) +
                         " in " + std::to_string(delay.count()) + "ms");
            std::this_thread::sleep_for(delay);
        }
    }
}

} // namespace Lookalike
