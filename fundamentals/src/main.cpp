#include "config.hpp"
#include "edgar_client.hpp"
#include "rate_limiter.hpp"
#include "backoff_manager.hpp"
#include "ticker_directory.hpp"
#include "facts_ingestor.hpp"
#include "fact_cache.hpp"
#include "fact_store.hpp"
#include "fundamentals_service.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <signal.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// Global token so the signal handler can stop an in-progress batch
CancellationToken batch_cancel;

void signal_handler(int signum) {
    spdlog::info("Caught signal {}, cancelling batch...", signum);
    batch_cancel.cancel();
}

std::unique_ptr<FactCache> make_cache(const Config& config) {
    auto ttl = std::chrono::hours(config.cache_ttl_hours);
    if (config.cache_backend == "redis") {
        spdlog::info("Using Redis fact cache at {}", config.redis_url);
        return std::make_unique<RedisFactCache>(std::make_shared<sw::redis::Redis>(config.redis_url), ttl);
    }
    spdlog::info("Using in-memory fact cache ({} entries)", config.cache_max_entries);
    return std::make_unique<MemoryFactCache>(static_cast<size_t>(config.cache_max_entries), ttl);
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " TICKER [TICKER...]" << std::endl;
        return 2;
    }

    // stdout carries the reports, so every log line goes to stderr
    util::init_stderr_logging();

    try {
        // 1. Load configuration
        Config config = Config::from_env();
        config.validate();

        // 2. Apply the configured log level
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::info("Log level set to '{}'", config.log_level);
        spdlog::info("Starting {}...", config.service_name);

        // 3. Register signal handlers for graceful cancellation
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // 4. Wire the pipeline
        EdgarClient client(config);
        RateLimiter rate_limiter(config.requests_per_second, config.burst_capacity);
        BackoffManager backoff(config.base_backoff_seconds, config.max_backoff_seconds);
        TickerDirectory directory(client, std::chrono::hours(config.ticker_table_ttl_hours));
        FactsIngestor ingestor(config, client, directory, rate_limiter, backoff);
        auto cache = make_cache(config);
        FactStore store(*cache, ingestor);
        FundamentalsService service(config, store);

        // 5. Run the batch and print the reports
        std::vector<std::string> tickers(argv + 1, argv + argc);
        auto result = service.refresh_batch(tickers, batch_cancel);
        std::cout << result.to_json().dump(2) << std::endl;

        if (!result.failures.empty() || !result.cancelled.empty()) {
            return 1;
        }

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    spdlog::info("Fundamentals batch finished.");
    return 0;
}
