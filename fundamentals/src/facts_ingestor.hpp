#pragma once

#include "config.hpp"
#include "types.hpp"
#include "facts_client.hpp"
#include "ticker_directory.hpp"
#include "rate_limiter.hpp"
#include "backoff_manager.hpp"
#include "cancellation.hpp"
#include <string>

// Resolves a ticker and fetches its normalized facts from the provider,
// retrying transient failures with backoff. Throws FundamentalsError:
// UnknownTicker, UpstreamUnavailable / RateLimited after the last attempt,
// MalformedPayload for unusable documents, Cancelled.
class FactsIngestor {
public:
    FactsIngestor(const Config& config,
                  FactsClient& client,
                  TickerDirectory& directory,
                  RateLimiter& rate_limiter,
                  BackoffManager& backoff);

    RawFactSet fetch_company_facts(const std::string& ticker,
                                   const CancellationToken& cancel = CancellationToken());

private:
    template <typename Fn>
    auto with_retry(const std::string& what, const CancellationToken& cancel, Fn&& fn);

    const Config& config_;
    FactsClient& client_;
    TickerDirectory& directory_;
    RateLimiter& rate_limiter_;
    BackoffManager& backoff_;
};
