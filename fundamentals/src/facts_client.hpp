#pragma once
#include "cancellation.hpp"
#include <string>
#include <nlohmann/json.hpp>

// Upstream data provider. Implementations throw FundamentalsError
// (UpstreamUnavailable, RateLimited, MalformedPayload, Cancelled).
class FactsClient {
public:
    virtual ~FactsClient() = default;

    // Ticker table in SEC company_tickers.json shape:
    // {"0": {"cik_str": 320193, "ticker": "AAPL", "title": "Apple Inc."}, ...}
    virtual nlohmann::json fetch_ticker_table(const CancellationToken& cancel) = 0;

    // Company facts document for a zero-padded CIK
    virtual nlohmann::json fetch_company_facts(const std::string& cik, const CancellationToken& cancel) = 0;

    // Key used for rate limiting and backoff bookkeeping
    virtual std::string endpoint_name() const { return "default"; }
};
