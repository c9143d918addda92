#pragma once

#include "duet/config.hpp"
#include "duet/conversation_types.hpp"
#include "duet/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <thread>

namespace duet {

// Bounded exponential backoff for one storage step
struct RetryPolicy {
    int max_retries = 3;
    int base_ms = 20;
    double multiplier = 2.0;
    int max_ms = 500;

    static RetryPolicy from_config(const StoreConfig& config) {
        RetryPolicy policy;
        policy.max_retries = config.max_retries;
        policy.base_ms = config.retry_base_ms;
        policy.multiplier = config.retry_multiplier;
        policy.max_ms = config.retry_max_ms;
        return policy;
    }
};

/**
 * Runs `fn`, retrying on TransientStorageError with exponential backoff.
 * Any other exception propagates immediately. Once `cancel` is set no further
 * attempt starts and the last transient error is rethrown.
 */
template <typename Fn>
auto with_retry(const RetryPolicy& policy, const char* step, Fn&& fn,
                const CancellationToken* cancel = nullptr) -> decltype(fn()) {
    double delay_ms = policy.base_ms;
    for (int attempt = 0;; ++attempt) {
        try {
            return fn();
        } catch (const TransientStorageError& e) {
            bool cancelled = cancel && cancel->is_cancelled();
            if (attempt >= policy.max_retries || cancelled) {
                spdlog::warn("[{}] giving up after {} attempt(s){}: {}",
                             step, attempt + 1, cancelled ? " (cancelled)" : "", e.what());
                throw;
            }
            auto sleep_ms = static_cast<int>(std::min<double>(delay_ms, policy.max_ms));
            spdlog::debug("[{}] transient failure (attempt {}/{}), retrying in {}ms: {}",
                          step, attempt + 1, policy.max_retries + 1, sleep_ms, e.what());
            std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));
            delay_ms *= policy.multiplier;
        }
    }
}

} // namespace duet
