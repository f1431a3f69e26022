#pragma once

#include "facts_client.hpp"
#include "cancellation.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

struct CompanyId {
    std::string ticker; // canonical SEC spelling, e.g. "BRK-B"
    std::string cik;    // zero-padded to 10 digits
    std::string name;
};

// Ticker -> CIK lookup table, loaded from the provider and refreshed after
// its TTL. Safe for concurrent use; concurrent first lookups load it once.
class TickerDirectory {
public:
    TickerDirectory(FactsClient& client, std::chrono::hours ttl);

    // Throws FundamentalsError on upstream failure while loading the table
    std::optional<CompanyId> resolve(const std::string& ticker, const CancellationToken& cancel);

    // True when the next resolve() will download the table
    bool needs_load() const;

    size_t size() const;

    static std::string normalize(const std::string& ticker);
    static std::string pad_cik(long long cik);

private:
    void load_locked(const CancellationToken& cancel);
    bool is_stale_locked() const;

    FactsClient& client_;
    std::chrono::hours ttl_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, CompanyId> by_ticker_;
    std::optional<std::chrono::steady_clock::time_point> loaded_at_;
};
