#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

// Per-endpoint exponential backoff. Failures push the next allowed request
// time out; a server-provided Retry-After extends it further.
class BackoffManager {
public:
    BackoffManager(double base_delay_seconds = 1.0, double max_delay_seconds = 30.0,
                   double multiplier = 2.0, double jitter_factor = 0.1);

    void record_failure(const std::string& endpoint);

    // A 429: back off at least as long as the server asked
    void record_rate_limited(const std::string& endpoint, std::chrono::milliseconds retry_after);

    // Resets the endpoint's backoff
    void record_success(const std::string& endpoint);

    int failure_count(const std::string& endpoint);
    std::chrono::milliseconds time_until_allowed(const std::string& endpoint);

    // Delay applied after the n-th consecutive failure (1-based), before jitter
    std::chrono::milliseconds nominal_delay(int failure_count) const;

private:
    struct BackoffState {
        int failure_count = 0;
        std::chrono::steady_clock::time_point last_failure;
        std::chrono::milliseconds current_delay{0};

        BackoffState() : last_failure(std::chrono::steady_clock::now()) {}
    };

    std::chrono::milliseconds calculate_delay(int failure_count) const;

    std::mutex mutex_;
    std::unordered_map<std::string, BackoffState> states_;
    double base_delay_seconds_;
    double max_delay_seconds_;
    double multiplier_;
    double jitter_factor_;
};
