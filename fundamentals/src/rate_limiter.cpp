#include "rate_limiter.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

RateLimiter::RateLimiter(int requests_per_second, int burst_capacity)
    : requests_per_second_(requests_per_second),
      burst_capacity_(burst_capacity) {
}

bool RateLimiter::allow_request(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& bucket = bucket_for(endpoint);
    refill_bucket(bucket);

    if (bucket.tokens >= 1.0) {
        bucket.tokens -= 1.0;
        return true;
    }

    return false;
}

std::chrono::milliseconds RateLimiter::time_until_allowed(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = buckets_.find(endpoint);
    if (it == buckets_.end()) {
        return std::chrono::milliseconds(0);
    }

    refill_bucket(it->second);

    if (it->second.tokens >= 1.0) {
        return std::chrono::milliseconds(0);
    }

    // Time needed to accumulate one token
    double tokens_needed = 1.0 - it->second.tokens;
    double seconds_needed = tokens_needed / it->second.refill_rate;

    return std::chrono::milliseconds(static_cast<int>(seconds_needed * 1000) + 1);
}

bool RateLimiter::acquire(const std::string& endpoint, const CancellationToken& cancel) {
    while (!cancel.is_cancelled()) {
        if (allow_request(endpoint)) {
            return true;
        }
        auto wait = time_until_allowed(endpoint);
        spdlog::debug("Rate limit reached for {}, waiting {} ms", endpoint, wait.count());
        cancel.sleep_for(std::max(wait, std::chrono::milliseconds(1)));
    }
    return false;
}

RateLimiter::TokenBucket& RateLimiter::bucket_for(const std::string& endpoint) {
    auto it = buckets_.find(endpoint);
    if (it == buckets_.end()) {
        it = buckets_.emplace(endpoint, TokenBucket(burst_capacity_, requests_per_second_)).first;
    }
    return it->second;
}

void RateLimiter::refill_bucket(TokenBucket& bucket) {
    auto now = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::duration<double>>(now - bucket.last_refill).count();

    bucket.tokens = std::min(bucket.tokens + duration * bucket.refill_rate,
                             static_cast<double>(bucket.capacity));
    bucket.last_refill = now;
}
