#include "config.hpp"
#include "util.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

using util::get_env_var;
using util::get_env_int;
using util::get_env_double;

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = get_env_var("SERVICE_NAME", config.service_name);
    config.log_level = get_env_var("LOG_LEVEL", config.log_level);

    // Upstream
    config.sec_user_agent = get_env_var("SEC_USER_AGENT", config.sec_user_agent);
    config.sec_tickers_url = get_env_var("SEC_TICKERS_URL", config.sec_tickers_url);
    config.sec_facts_url = get_env_var("SEC_FACTS_URL", config.sec_facts_url);
    config.http_timeout_ms = get_env_int("HTTP_TIMEOUT_MS", config.http_timeout_ms);

    // Retry and rate limiting
    config.max_fetch_attempts = get_env_int("MAX_FETCH_ATTEMPTS", config.max_fetch_attempts);
    config.base_backoff_seconds = get_env_double("BASE_BACKOFF_SECONDS", config.base_backoff_seconds);
    config.max_backoff_seconds = get_env_double("MAX_BACKOFF_SECONDS", config.max_backoff_seconds);
    config.requests_per_second = get_env_int("REQUESTS_PER_SECOND", config.requests_per_second);
    config.burst_capacity = get_env_int("BURST_CAPACITY", config.burst_capacity);

    // Batch
    config.worker_threads = get_env_int("WORKER_THREADS", config.worker_threads);

    // Cache
    config.cache_backend = get_env_var("CACHE_BACKEND", config.cache_backend);
    config.cache_ttl_hours = get_env_int("CACHE_TTL_HOURS", config.cache_ttl_hours);
    config.cache_max_entries = get_env_int("CACHE_MAX_ENTRIES", config.cache_max_entries);
    config.redis_url = get_env_var("REDIS_URL", config.redis_url);
    config.ticker_table_ttl_hours = get_env_int("TICKER_TABLE_TTL_HOURS", config.ticker_table_ttl_hours);

    // Classification and scoring
    config.classifier.ytd_ratio_threshold =
        get_env_double("YTD_RATIO_THRESHOLD", config.classifier.ytd_ratio_threshold);
    config.classifier.final_quarter_month_override =
        get_env_int("FINAL_QUARTER_MONTH", config.classifier.final_quarter_month_override);
    config.classifier.scale_mismatch_multiple =
        get_env_double("SCALE_MISMATCH_MULTIPLE", config.classifier.scale_mismatch_multiple);
    config.classifier.derive_missing_quarters =
        get_env_int("DERIVE_MISSING_QUARTERS", config.classifier.derive_missing_quarters ? 1 : 0) != 0;
    config.growth.growth_ceiling_pct =
        get_env_double("GROWTH_CEILING_PCT", config.growth.growth_ceiling_pct);
    config.ratios.balance_sheet_tolerance =
        get_env_double("BALANCE_SHEET_TOLERANCE", config.ratios.balance_sheet_tolerance);
    config.ratios.net_margin_limit_pct =
        get_env_double("NET_MARGIN_LIMIT_PCT", config.ratios.net_margin_limit_pct);
    config.quality.scale_mismatch_penalty =
        get_env_double("SCALE_MISMATCH_PENALTY", config.quality.scale_mismatch_penalty);

    return config;
}

void Config::validate() const {
    if (sec_user_agent.empty()) {
        throw std::runtime_error("SEC_USER_AGENT is required by SEC fair-access rules");
    }

    if (http_timeout_ms < 1000 || http_timeout_ms > 60000) {
        throw std::runtime_error("HTTP timeout must be between 1000 and 60000 ms");
    }

    if (max_fetch_attempts < 1 || max_fetch_attempts > 3) {
        throw std::runtime_error("Max fetch attempts must be between 1 and 3");
    }

    if (base_backoff_seconds <= 0.0 || max_backoff_seconds < base_backoff_seconds) {
        throw std::runtime_error("Backoff must satisfy 0 < base <= max");
    }

    if (requests_per_second < 1 || burst_capacity < 1) {
        throw std::runtime_error("Rate limit and burst capacity must be positive");
    }

    if (worker_threads < 1 || worker_threads > 32) {
        throw std::runtime_error("Worker threads must be between 1 and 32");
    }

    if (cache_backend != "memory" && cache_backend != "redis") {
        throw std::runtime_error("CACHE_BACKEND must be 'memory' or 'redis'");
    }

    if (cache_ttl_hours < 1 || cache_max_entries < 1) {
        throw std::runtime_error("Cache TTL and size must be positive");
    }

    if (ticker_table_ttl_hours < 1) {
        throw std::runtime_error("Ticker table TTL must be at least 1 hour");
    }

    if (classifier.ytd_ratio_threshold <= 1.0) {
        throw std::runtime_error("YTD ratio threshold must be greater than 1");
    }

    if (classifier.final_quarter_month_override < 0 || classifier.final_quarter_month_override > 12) {
        throw std::runtime_error("FINAL_QUARTER_MONTH must be 0 (detect) or 1..12");
    }

    if (classifier.scale_mismatch_multiple <= 1.0) {
        throw std::runtime_error("Scale mismatch multiple must be greater than 1");
    }

    if (growth.growth_ceiling_pct <= 0.0) {
        throw std::runtime_error("Growth ceiling must be positive");
    }

    if (ratios.balance_sheet_tolerance <= 0.0 || ratios.balance_sheet_tolerance >= 1.0) {
        throw std::runtime_error("Balance sheet tolerance must be between 0 and 1");
    }

    if (ratios.net_margin_limit_pct <= 0.0) {
        throw std::runtime_error("Net margin limit must be positive");
    }

    spdlog::info("Configuration validated successfully");
}
