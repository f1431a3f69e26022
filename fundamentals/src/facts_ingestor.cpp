#include "facts_ingestor.hpp"
#include "facts_parser.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <optional>

FactsIngestor::FactsIngestor(const Config& config,
                             FactsClient& client,
                             TickerDirectory& directory,
                             RateLimiter& rate_limiter,
                             BackoffManager& backoff)
    : config_(config),
      client_(client),
      directory_(directory),
      rate_limiter_(rate_limiter),
      backoff_(backoff) {
}

template <typename Fn>
auto FactsIngestor::with_retry(const std::string& what, const CancellationToken& cancel, Fn&& fn) {
    const auto endpoint = client_.endpoint_name();
    std::optional<FundamentalsError> last_error;

    for (int attempt = 1; attempt <= config_.max_fetch_attempts; ++attempt) {
        if (!cancel.sleep_for(backoff_.time_until_allowed(endpoint)) ||
            !rate_limiter_.acquire(endpoint, cancel)) {
            throw FundamentalsError::cancelled(what);
        }

        try {
            auto result = fn();
            backoff_.record_success(endpoint);
            return result;
        } catch (const FundamentalsError& e) {
            if (!e.retryable()) {
                throw;
            }

            if (e.kind() == ErrorKind::RateLimited) {
                backoff_.record_rate_limited(endpoint, e.retry_after());
            } else {
                backoff_.record_failure(endpoint);
            }

            spdlog::warn("Attempt {}/{} of {} failed: {}", attempt, config_.max_fetch_attempts, what, e.what());
            last_error = e;
        }
    }

    spdlog::error("Giving up on {} after {} attempts", what, config_.max_fetch_attempts);
    throw *last_error;
}

RawFactSet FactsIngestor::fetch_company_facts(const std::string& ticker, const CancellationToken& cancel) {
    auto start_time = std::chrono::steady_clock::now();

    // Only a table download goes through the rate limiter and retries
    auto company = directory_.needs_load()
        ? with_retry("ticker lookup for " + ticker, cancel, [&]() { return directory_.resolve(ticker, cancel); })
        : directory_.resolve(ticker, cancel);
    if (!company) {
        spdlog::warn("Ticker {} could not be resolved", ticker);
        throw FundamentalsError::unknown_ticker(ticker);
    }

    auto document = with_retry("company facts for " + company->ticker, cancel, [&]() {
        return client_.fetch_company_facts(company->cik, cancel);
    });

    ParsedFacts parsed;
    try {
        parsed = FactsParser::parse(document);
    } catch (const nlohmann::json::exception& e) {
        throw FundamentalsError::malformed("Company facts for " + company->ticker + " could not be read: " + e.what());
    }

    RawFactSet set;
    set.ticker = company->ticker;
    set.cik = company->cik;
    set.entity_name = parsed.entity_name.empty() ? company->name : parsed.entity_name;
    set.facts = std::move(parsed.facts);
    set.dropped_count = parsed.dropped_count;
    set.fetched_at = std::chrono::system_clock::now();

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    spdlog::info("Fetched {} facts for {} (CIK {}) in {} ms", set.facts.size(), set.ticker, set.cik, duration);

    return set;
}
