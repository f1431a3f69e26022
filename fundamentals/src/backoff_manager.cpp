#include "backoff_manager.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

BackoffManager::BackoffManager(double base_delay_seconds, double max_delay_seconds,
                               double multiplier, double jitter_factor)
    : base_delay_seconds_(base_delay_seconds),
      max_delay_seconds_(max_delay_seconds),
      multiplier_(multiplier),
      jitter_factor_(jitter_factor) {
}

void BackoffManager::record_failure(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& state = states_[endpoint];
    state.failure_count++;
    state.last_failure = std::chrono::steady_clock::now();
    state.current_delay = calculate_delay(state.failure_count);
}

void BackoffManager::record_rate_limited(const std::string& endpoint, std::chrono::milliseconds retry_after) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& state = states_[endpoint];
    state.failure_count++;
    state.last_failure = std::chrono::steady_clock::now();
    state.current_delay = std::max(calculate_delay(state.failure_count), retry_after);
}

void BackoffManager::record_success(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(endpoint);
    if (it != states_.end()) {
        it->second.failure_count = 0;
        it->second.current_delay = std::chrono::milliseconds(0);
    }
}

int BackoffManager::failure_count(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(endpoint);
    return it == states_.end() ? 0 : it->second.failure_count;
}

std::chrono::milliseconds BackoffManager::time_until_allowed(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(endpoint);
    if (it == states_.end() || it->second.failure_count == 0) {
        return std::chrono::milliseconds(0);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - it->second.last_failure);

    if (elapsed >= it->second.current_delay) {
        return std::chrono::milliseconds(0);
    }

    return it->second.current_delay - elapsed;
}

std::chrono::milliseconds BackoffManager::nominal_delay(int failure_count) const {
    if (failure_count <= 0) {
        return std::chrono::milliseconds(0);
    }

    double delay_seconds = base_delay_seconds_ * std::pow(multiplier_, failure_count - 1);
    delay_seconds = std::min(delay_seconds, max_delay_seconds_);
    return std::chrono::milliseconds(static_cast<long>(delay_seconds * 1000));
}

std::chrono::milliseconds BackoffManager::calculate_delay(int failure_count) const {
    auto nominal = nominal_delay(failure_count);
    if (nominal.count() == 0 || jitter_factor_ <= 0.0) {
        return nominal;
    }

    double jittered = util::random_jitter(static_cast<double>(nominal.count()), jitter_factor_);
    return std::chrono::milliseconds(static_cast<long>(jittered));
}
