#pragma once
#include <string>

// Knobs consumed by the pure classification/scoring stages. Kept separate so
// tests can build them without touching the environment.
struct ClassifierSettings {
    double ytd_ratio_threshold = 8.0;
    int final_quarter_month_override = 0; // 0 = use the detected fiscal year-end month
    double scale_mismatch_multiple = 100.0;
    int week_rollback_days = 7;
    int max_quarter_days = 120;
    int min_annual_days = 330;
    bool derive_missing_quarters = true;
    double derived_confidence = 0.75;
};

struct GrowthSettings {
    double growth_ceiling_pct = 300.0;
};

struct RatioSettings {
    double balance_sheet_tolerance = 0.02; // |A - (L + E)| / A
    double net_margin_limit_pct = 50.0;
};

struct QualitySettings {
    double scale_mismatch_penalty = 15.0;
};

class Config {
public:
    // Service info
    std::string service_name = "fundamentals";
    std::string log_level = "info";

    // Upstream provider (SEC EDGAR)
    std::string sec_user_agent = "FundamentalsEngine admin@example.com";
    std::string sec_tickers_url = "https://www.sec.gov/files/company_tickers.json";
    std::string sec_facts_url = "https://data.sec.gov/api/xbrl/companyfacts";
    int http_timeout_ms = 10000;

    // Retry and rate limiting
    int max_fetch_attempts = 3;
    double base_backoff_seconds = 1.0;
    double max_backoff_seconds = 30.0;
    int requests_per_second = 10;
    int burst_capacity = 10;

    // Batch refresh
    int worker_threads = 6;

    // Fact cache
    std::string cache_backend = "memory"; // "memory" or "redis"
    int cache_ttl_hours = 24;
    int cache_max_entries = 5000;
    std::string redis_url = "tcp://127.0.0.1:6379";
    int ticker_table_ttl_hours = 24;

    ClassifierSettings classifier;
    GrowthSettings growth;
    RatioSettings ratios;
    QualitySettings quality;

    static Config from_env();
    void validate() const;
};
