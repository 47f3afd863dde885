#include "fieldsync/sync/retry_policy.hpp"

#include <algorithm>

namespace fieldsync::sync {
namespace {

// 2^kMaxShift * base already exceeds any sensible cap
constexpr std::uint32_t kMaxShift = 30;

std::uint64_t mix(std::uint64_t salt, std::uint64_t attempt) {
    std::uint64_t x = salt ^ (attempt * 0x9e3779b97f4a7c15ULL);
    x ^= x >> 33;
    x *= 0xff51afd7ed558ccdULL;
    x ^= x >> 33;
    x *= 0xc4ceb9fe1a85ec53ULL;
    x ^= x >> 33;
    return x;
}

} // namespace

RetryPolicy::RetryPolicy(RetryConfig config, std::uint32_t max_retries)
    : config_(config), max_retries_(max_retries) {
    if (config_.jitter > config_.base_delay) {
        config_.jitter = config_.base_delay;
    }
    if (config_.max_delay < config_.base_delay) {
        config_.max_delay = config_.base_delay;
    }
}

std::chrono::milliseconds RetryPolicy::next_delay(std::uint32_t attempt_count, std::uint64_t salt) const {
    const auto base = static_cast<std::uint64_t>(config_.base_delay.count());
    const auto cap = static_cast<std::uint64_t>(config_.max_delay.count());

    std::uint64_t exponential = cap;
    if (base == 0) {
        exponential = 0;
    } else if (attempt_count < kMaxShift && base <= (cap >> attempt_count)) {
        exponential = base << attempt_count;
    }

    std::uint64_t jitter = 0;
    const auto jitter_range = static_cast<std::uint64_t>(config_.jitter.count());
    if (jitter_range > 0) {
        jitter = mix(salt, attempt_count) % (jitter_range + 1);
    }

    const std::uint64_t total = std::min(exponential + jitter, cap);
    return std::chrono::milliseconds(static_cast<std::int64_t>(total));
}

} // namespace fieldsync::sync
