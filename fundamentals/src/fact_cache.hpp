#pragma once

#include "types.hpp"
#include <sw/redis++/redis.h>
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Cache of RawFactSets keyed by canonical ticker. Implementations must be
// safe for concurrent use.
class FactCache {
public:
    virtual ~FactCache() = default;

    virtual std::optional<RawFactSet> get(const std::string& ticker) = 0;
    virtual void put(const std::string& ticker, const RawFactSet& facts) = 0;
    virtual void remove(const std::string& ticker) = 0;
    virtual size_t size() const = 0;
};

// In-process cache with TTL expiry and LRU eviction.
class MemoryFactCache : public FactCache {
public:
    MemoryFactCache(size_t max_size, std::chrono::seconds ttl);

    std::optional<RawFactSet> get(const std::string& ticker) override;
    void put(const std::string& ticker, const RawFactSet& facts) override;
    void remove(const std::string& ticker) override;
    size_t size() const override;

    void cleanup_expired();
    double hit_rate() const;

private:
    struct CacheEntry {
        RawFactSet facts;
        std::chrono::steady_clock::time_point timestamp;
        std::list<std::string>::iterator lru_iterator;
    };

    bool is_expired(const CacheEntry& entry) const;
    void evict_lru();

    size_t max_size_;
    std::chrono::seconds ttl_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, CacheEntry> cache_;
    std::list<std::string> lru_list_;
    size_t hit_count_ = 0;
    size_t miss_count_ = 0;
};

// Shared cache stored as JSON strings under "facts:{TICKER}" with a Redis
// TTL. Redis failures are logged and treated as misses.
class RedisFactCache : public FactCache {
public:
    RedisFactCache(std::shared_ptr<sw::redis::Redis> redis, std::chrono::seconds ttl);

    std::optional<RawFactSet> get(const std::string& ticker) override;
    void put(const std::string& ticker, const RawFactSet& facts) override;
    void remove(const std::string& ticker) override;
    size_t size() const override;

    static std::string key_for(const std::string& ticker);

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::chrono::seconds ttl_;
};
