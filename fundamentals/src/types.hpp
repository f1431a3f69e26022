#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

// Calendar date as reported by XBRL period boundaries and filing dates.
struct Date {
    int year = 0;
    int month = 0;
    int day = 0;

    bool valid() const { return year > 0 && month >= 1 && month <= 12 && day >= 1 && day <= 31; }

    // Days since 1970-01-01 (proleptic Gregorian).
    long days_since_epoch() const;

    std::string to_string() const;
    static std::optional<Date> parse(const std::string& text);
    static Date from_time_point(const std::chrono::system_clock::time_point& tp);
    static Date from_days_since_epoch(long days);

    bool operator==(const Date& o) const { return year == o.year && month == o.month && day == o.day; }
    bool operator!=(const Date& o) const { return !(*this == o); }
    bool operator<(const Date& o) const {
        if (year != o.year) return year < o.year;
        if (month != o.month) return month < o.month;
        return day < o.day;
    }
    bool operator>(const Date& o) const { return o < *this; }
    bool operator<=(const Date& o) const { return !(o < *this); }
    bool operator>=(const Date& o) const { return !(*this < o); }
};

struct RawFact {
    std::string concept_name;
    std::string taxonomy = "us-gaap";
    std::string unit;
    double value = 0.0;
    std::optional<Date> period_start;
    Date period_end;
    Date filed_date;
    std::string form_type;
    int fiscal_year = 0;
    std::string fiscal_period;
    std::string accession;
    std::string frame;

    nlohmann::json to_json() const;
    static RawFact from_json(const nlohmann::json& j);
};

struct RawFactSet {
    std::string ticker;
    std::string cik;
    std::string entity_name;
    std::vector<RawFact> facts;
    int dropped_count = 0;
    std::chrono::system_clock::time_point fetched_at;

    nlohmann::json to_json() const;
    static RawFactSet from_json(const nlohmann::json& j);
};

enum class Bucket {
    Quarterly,
    Annual,
    Ytd,
    PointInTime
};

std::string to_string(Bucket bucket);

enum class PeriodType {
    Duration,
    Instant
};

struct ClassifiedFact {
    RawFact fact;
    Bucket bucket = Bucket::Quarterly;
    double confidence = 0.0;
    std::string reason;
    int fiscal_year = 0;
    int fiscal_quarter = 0; // 1..4, 0 for annual
    bool superseded = false;
    bool derived = false;   // computed from cumulative totals, not reported

    nlohmann::json to_json() const;
};

enum class WarningCode {
    MetricUnavailable,
    NoBaseline,
    ScaleMismatch,
    FiscalYearEndAssumed,
    UnknownForm,
    MalformedFactsDropped,
    GrowthFlagged,
    UpstreamUnavailable,
    NoUsableData,
    StaleData,
    BalanceSheetMismatch,
    MarginOutOfRange
};

std::string to_string(WarningCode code);

struct Warning {
    WarningCode code;
    std::string metric;
    std::string message;

    nlohmann::json to_json() const;
};

struct ConceptSeries {
    std::string metric;
    std::string concept_name;
    std::string unit;
    PeriodType period_type = PeriodType::Duration;
    int fiscal_year_end_month = 12;

    std::vector<ClassifiedFact> all;
    std::vector<ClassifiedFact> quarterly;
    std::vector<ClassifiedFact> annual;
    std::vector<ClassifiedFact> ytd;
    std::vector<ClassifiedFact> point_in_time;

    std::vector<Warning> warnings;

    const std::vector<ClassifiedFact>& bucket(Bucket b) const;
    bool has_warning(WarningCode code) const;
    bool empty() const { return all.empty(); }

    nlohmann::json to_json() const;
};

enum class Comparison {
    YoY,
    QoQ
};

struct GrowthMetric {
    std::string metric_name;
    Comparison comparison = Comparison::YoY;
    Bucket basis = Bucket::Quarterly;
    std::string current_period;
    std::string previous_period;
    double current_value = 0.0;
    double previous_value = 0.0;
    double growth_pct = 0.0;
    bool meaningful = false;
    bool flagged = false;
    std::string note;

    nlohmann::json to_json() const;
};

// Ratio or amount computed from two or more reported metrics for one period
struct DerivedMetric {
    std::string name;
    double value = 0.0;
    std::string unit; // "percent", "ratio" or the currency unit
    std::string period;
    Date period_end;
    Bucket basis = Bucket::Annual;
    bool annualized = false;

    nlohmann::json to_json() const;
};

struct QualityReport {
    std::string ticker;
    std::string company_name;
    double completeness_score = 0.0;
    double freshness_score = 0.0;
    double data_quality_score = 0.0;
    double overall_score = 0.0;
    std::string grade = "F";

    int core_metrics_available = 0;
    int core_metrics_tracked = 0;
    int quarterly_points = 0;
    std::optional<Date> latest_period;
    int freshness_months = 0;

    nlohmann::json to_json() const;
};

struct FundamentalsReport {
    std::string ticker;
    std::string cik;
    std::string company_name;
    std::vector<ConceptSeries> series;
    std::vector<std::string> unavailable_metrics;
    std::vector<GrowthMetric> growth;
    std::vector<DerivedMetric> derived_metrics;
    QualityReport quality;
    std::vector<Warning> warnings;
    bool degraded = false;
    Date generated_at;

    const ConceptSeries* find_series(const std::string& metric) const;
    const DerivedMetric* find_derived(const std::string& name) const;
    bool has_warning(WarningCode code) const;

    nlohmann::json to_json() const;
};
