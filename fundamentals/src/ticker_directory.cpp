#include "ticker_directory.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iomanip>
#include <sstream>

TickerDirectory::TickerDirectory(FactsClient& client, std::chrono::hours ttl)
    : client_(client), ttl_(ttl) {
}

std::optional<CompanyId> TickerDirectory::resolve(const std::string& ticker, const CancellationToken& cancel) {
    auto key = normalize(ticker);
    if (key.empty()) {
        return std::nullopt;
    }

    // Held across the load so concurrent first lookups fetch the table once
    std::lock_guard<std::mutex> lock(mutex_);

    if (is_stale_locked()) {
        try {
            load_locked(cancel);
        } catch (const FundamentalsError& e) {
            // Serve a stale table rather than nothing
            if (!loaded_at_ || e.kind() == ErrorKind::Cancelled) {
                throw;
            }
            spdlog::warn("Ticker table refresh failed, keeping stale table: {}", e.what());
        }
    }

    auto it = by_ticker_.find(key);
    if (it == by_ticker_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TickerDirectory::needs_load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_stale_locked();
}

size_t TickerDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_ticker_.size();
}

std::string TickerDirectory::normalize(const std::string& ticker) {
    std::string key = util::to_upper(util::trim(ticker));
    std::replace(key.begin(), key.end(), '.', '-');
    std::replace(key.begin(), key.end(), '/', '-');
    return key;
}

std::string TickerDirectory::pad_cik(long long cik) {
    std::ostringstream ss;
    ss << std::setw(10) << std::setfill('0') << cik;
    return ss.str();
}

void TickerDirectory::load_locked(const CancellationToken& cancel) {
    auto table = client_.fetch_ticker_table(cancel);
    if (!table.is_object() && !table.is_array()) {
        throw FundamentalsError::malformed("Ticker table is not a JSON object");
    }

    std::unordered_map<std::string, CompanyId> loaded;
    int skipped = 0;

    for (const auto& item : table) {
        if (!item.is_object()) {
            skipped++;
            continue;
        }
        try {
            CompanyId company;
            company.ticker = normalize(item.at("ticker").get<std::string>());
            company.cik = pad_cik(item.at("cik_str").get<long long>());
            company.name = item.value("title", "");
            if (company.ticker.empty()) {
                skipped++;
                continue;
            }
            // First listing wins; the SEC file orders primary share classes first
            loaded.emplace(company.ticker, std::move(company));
        } catch (const nlohmann::json::exception& e) {
            skipped++;
            spdlog::debug("Skipping malformed ticker table entry: {}", e.what());
        }
    }

    by_ticker_ = std::move(loaded);
    loaded_at_ = std::chrono::steady_clock::now();
    spdlog::info("Loaded {} tickers into directory ({} malformed entries skipped)", by_ticker_.size(), skipped);
}

bool TickerDirectory::is_stale_locked() const {
    if (!loaded_at_) {
        return true;
    }
    return std::chrono::steady_clock::now() - *loaded_at_ >= ttl_;
}
