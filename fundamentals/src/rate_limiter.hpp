#pragma once
#include "cancellation.hpp"
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

// Token-bucket limiter shared by every pipeline that talks to the upstream
// provider. One bucket per endpoint host.
class RateLimiter {
public:
    RateLimiter(int requests_per_second = 10, int burst_capacity = 10);

    // Take a token if one is available
    bool allow_request(const std::string& endpoint = "default");

    // Time until the next token is available
    std::chrono::milliseconds time_until_allowed(const std::string& endpoint = "default");

    // Block until a token is taken. Returns false if cancelled while waiting.
    bool acquire(const std::string& endpoint, const CancellationToken& cancel);

private:
    struct TokenBucket {
        double tokens;
        int capacity;
        double refill_rate; // tokens per second
        std::chrono::steady_clock::time_point last_refill;

        TokenBucket(int cap, double rate)
            : tokens(cap), capacity(cap), refill_rate(rate),
              last_refill(std::chrono::steady_clock::now()) {}
    };

    TokenBucket& bucket_for(const std::string& endpoint);
    void refill_bucket(TokenBucket& bucket);

    std::mutex mutex_;
    std::unordered_map<std::string, TokenBucket> buckets_;
    int requests_per_second_;
    int burst_capacity_;
};
