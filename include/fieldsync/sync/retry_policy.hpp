#pragma once

#include "fieldsync/core/config.hpp"

#include <chrono>
#include <cstdint>

namespace fieldsync::sync {

/**
 * @brief Exponential backoff with bounded jitter and a dead-letter threshold
 *
 * next_delay(n) = min(base * 2^n + jitter(n, salt), max_delay)
 *
 * Jitter is derived from (salt, n) rather than a random generator, which keeps
 * the policy a pure function: the same item always gets the same schedule,
 * while different items (different salts) spread out. Jitter never exceeds
 * base_delay, so next_delay is non-decreasing in n.
 */
class RetryPolicy {
public:
    RetryPolicy(RetryConfig config, std::uint32_t max_retries);

    std::chrono::milliseconds next_delay(std::uint32_t attempt_count, std::uint64_t salt = 0) const;

    bool is_dead(std::uint32_t attempt_count) const noexcept { return attempt_count >= max_retries_; }

    std::uint32_t max_retries() const noexcept { return max_retries_; }
    const RetryConfig& config() const noexcept { return config_; }

    /**
     * @brief Same backoff curve, different retry budget (settings change)
     */
    RetryPolicy with_max_retries(std::uint32_t max_retries) const {
        return RetryPolicy(config_, max_retries);
    }

private:
    RetryConfig config_;
    std::uint32_t max_retries_;
};

} // namespace fieldsync::sync
