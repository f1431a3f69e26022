#include "fact_cache.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <iterator>
#include <vector>

MemoryFactCache::MemoryFactCache(size_t max_size, std::chrono::seconds ttl)
    : max_size_(max_size), ttl_(ttl) {
}

std::optional<RawFactSet> MemoryFactCache::get(const std::string& ticker) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find(ticker);
    if (it == cache_.end()) {
        miss_count_++;
        return std::nullopt;
    }

    if (is_expired(it->second)) {
        lru_list_.erase(it->second.lru_iterator);
        cache_.erase(it);
        miss_count_++;
        return std::nullopt;
    }

    // Move to front of LRU list
    lru_list_.erase(it->second.lru_iterator);
    lru_list_.push_front(ticker);
    it->second.lru_iterator = lru_list_.begin();

    hit_count_++;
    return it->second.facts;
}

void MemoryFactCache::put(const std::string& ticker, const RawFactSet& facts) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find(ticker);
    if (it != cache_.end()) {
        it->second.facts = facts;
        it->second.timestamp = std::chrono::steady_clock::now();

        lru_list_.erase(it->second.lru_iterator);
        lru_list_.push_front(ticker);
        it->second.lru_iterator = lru_list_.begin();
        return;
    }

    if (cache_.size() >= max_size_) {
        evict_lru();
    }

    lru_list_.push_front(ticker);
    cache_.emplace(ticker, CacheEntry{facts, std::chrono::steady_clock::now(), lru_list_.begin()});
}

void MemoryFactCache::remove(const std::string& ticker) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find(ticker);
    if (it != cache_.end()) {
        lru_list_.erase(it->second.lru_iterator);
        cache_.erase(it);
    }
}

size_t MemoryFactCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

void MemoryFactCache::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.begin();
    while (it != cache_.end()) {
        if (is_expired(it->second)) {
            lru_list_.erase(it->second.lru_iterator);
            it = cache_.erase(it);
        } else {
            ++it;
        }
    }
}

double MemoryFactCache::hit_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t total = hit_count_ + miss_count_;
    if (total == 0) return 0.0;

    return static_cast<double>(hit_count_) / total;
}

bool MemoryFactCache::is_expired(const CacheEntry& entry) const {
    return std::chrono::steady_clock::now() - entry.timestamp >= ttl_;
}

void MemoryFactCache::evict_lru() {
    if (lru_list_.empty()) return;

    std::string lru_key = lru_list_.back();
    lru_list_.pop_back();
    cache_.erase(lru_key);
    spdlog::debug("Evicted {} from fact cache", lru_key);
}

RedisFactCache::RedisFactCache(std::shared_ptr<sw::redis::Redis> redis, std::chrono::seconds ttl)
    : redis_(std::move(redis)), ttl_(ttl) {
}

std::string RedisFactCache::key_for(const std::string& ticker) {
    return fmt::format("facts:{}", ticker);
}

std::optional<RawFactSet> RedisFactCache::get(const std::string& ticker) {
    try {
        auto payload = redis_->get(key_for(ticker));
        if (!payload) {
            return std::nullopt;
        }
        return RawFactSet::from_json(nlohmann::json::parse(*payload));
    } catch (const sw::redis::Error& e) {
        spdlog::warn("Redis read failed for {}: {}", ticker, e.what());
    } catch (const std::exception& e) {
        spdlog::warn("Discarding unreadable cache entry for {}: {}", ticker, e.what());
    }
    return std::nullopt;
}

void RedisFactCache::put(const std::string& ticker, const RawFactSet& facts) {
    try {
        redis_->set(key_for(ticker), facts.to_json().dump(), ttl_);
    } catch (const sw::redis::Error& e) {
        spdlog::warn("Redis write failed for {}: {}", ticker, e.what());
    }
}

void RedisFactCache::remove(const std::string& ticker) {
    try {
        redis_->del(key_for(ticker));
    } catch (const sw::redis::Error& e) {
        spdlog::warn("Redis delete failed for {}: {}", ticker, e.what());
    }
}

size_t RedisFactCache::size() const {
    try {
        size_t count = 0;
        long long cursor = 0;
        do {
            std::vector<std::string> keys;
            cursor = redis_->scan(cursor, "facts:*", 100, std::back_inserter(keys));
            count += keys.size();
        } while (cursor != 0);
        return count;
    } catch (const sw::redis::Error& e) {
        spdlog::warn("Redis scan failed: {}", e.what());
        return 0;
    }
}
