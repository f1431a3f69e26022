#include "types.hpp"
#include "util.hpp"
#include <cstdio>
#include <ctime>
#include <algorithm>
#include <stdexcept>

long Date::days_since_epoch() const {
    // Howard Hinnant's days_from_civil
    int y = year - (month <= 2 ? 1 : 0);
    long era = (y >= 0 ? y : y - 399) / 400;
    long yoe = static_cast<long>(y - era * 400);
    long mp = (month + 9) % 12;
    long doy = (153 * mp + 2) / 5 + day - 1;
    long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

std::string Date::to_string() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

std::optional<Date> Date::parse(const std::string& text) {
    // Accepts "YYYY-MM-DD" and ignores a trailing time component.
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (text[i] < '0' || text[i] > '9') {
            return std::nullopt;
        }
    }

    Date date;
    date.year = std::stoi(text.substr(0, 4));
    date.month = std::stoi(text.substr(5, 2));
    date.day = std::stoi(text.substr(8, 2));
    if (!date.valid()) {
        return std::nullopt;
    }
    return date;
}

Date Date::from_time_point(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    return Date{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

Date Date::from_days_since_epoch(long days) {
    // Howard Hinnant's civil_from_days
    days += 719468;
    long era = (days >= 0 ? days : days - 146096) / 146097;
    long doe = days - era * 146097;
    long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    long mp = (5 * doy + 2) / 153;
    int day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    int month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    int year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
    return Date{year, month, day};
}

nlohmann::json RawFact::to_json() const {
    nlohmann::json j = {
        {"concept", concept_name},
        {"taxonomy", taxonomy},
        {"unit", unit},
        {"value", value},
        {"end", period_end.to_string()},
        {"filed", filed_date.to_string()},
        {"form", form_type},
        {"fy", fiscal_year},
        {"fp", fiscal_period},
        {"accn", accession},
        {"frame", frame}
    };
    if (period_start) {
        j["start"] = period_start->to_string();
    }
    return j;
}

RawFact RawFact::from_json(const nlohmann::json& j) {
    RawFact fact;
    fact.concept_name = j.at("concept").get<std::string>();
    fact.taxonomy = j.value("taxonomy", "us-gaap");
    fact.unit = j.at("unit").get<std::string>();
    fact.value = j.at("value").get<double>();

    auto end = Date::parse(j.at("end").get<std::string>());
    auto filed = Date::parse(j.at("filed").get<std::string>());
    if (!end || !filed) {
        throw std::runtime_error("Cached fact has invalid dates for concept " + fact.concept_name);
    }
    fact.period_end = *end;
    fact.filed_date = *filed;
    if (j.contains("start")) {
        fact.period_start = Date::parse(j.at("start").get<std::string>());
    }

    fact.form_type = j.at("form").get<std::string>();
    fact.fiscal_year = j.value("fy", 0);
    fact.fiscal_period = j.value("fp", "");
    fact.accession = j.value("accn", "");
    fact.frame = j.value("frame", "");
    return fact;
}

nlohmann::json RawFactSet::to_json() const {
    nlohmann::json facts_json = nlohmann::json::array();
    for (const auto& fact : facts) {
        facts_json.push_back(fact.to_json());
    }
    return {
        {"ticker", ticker},
        {"cik", cik},
        {"entity_name", entity_name},
        {"dropped_count", dropped_count},
        {"fetched_at", util::format_iso8601(fetched_at)},
        {"facts", facts_json}
    };
}

RawFactSet RawFactSet::from_json(const nlohmann::json& j) {
    RawFactSet set;
    set.ticker = j.at("ticker").get<std::string>();
    set.cik = j.at("cik").get<std::string>();
    set.entity_name = j.value("entity_name", "");
    set.dropped_count = j.value("dropped_count", 0);
    set.fetched_at = util::parse_iso8601(j.at("fetched_at").get<std::string>());
    for (const auto& item : j.at("facts")) {
        set.facts.push_back(RawFact::from_json(item));
    }
    return set;
}

std::string to_string(Bucket bucket) {
    switch (bucket) {
        case Bucket::Quarterly: return "quarterly";
        case Bucket::Annual: return "annual";
        case Bucket::Ytd: return "ytd";
        case Bucket::PointInTime: return "point_in_time";
    }
    return "unknown";
}

std::string to_string(WarningCode code) {
    switch (code) {
        case WarningCode::MetricUnavailable: return "metric_unavailable";
        case WarningCode::NoBaseline: return "no_baseline";
        case WarningCode::ScaleMismatch: return "scale_mismatch";
        case WarningCode::FiscalYearEndAssumed: return "fiscal_year_end_assumed";
        case WarningCode::UnknownForm: return "unknown_form";
        case WarningCode::MalformedFactsDropped: return "malformed_facts_dropped";
        case WarningCode::GrowthFlagged: return "growth_flagged";
        case WarningCode::UpstreamUnavailable: return "upstream_unavailable";
        case WarningCode::NoUsableData: return "no_usable_data";
        case WarningCode::StaleData: return "stale_data";
        case WarningCode::BalanceSheetMismatch: return "balance_sheet_mismatch";
        case WarningCode::MarginOutOfRange: return "margin_out_of_range";
    }
    return "unknown";
}

nlohmann::json ClassifiedFact::to_json() const {
    nlohmann::json j = fact.to_json();
    j["bucket"] = ::to_string(bucket);
    j["confidence"] = confidence;
    j["reason"] = reason;
    j["fiscal_year"] = fiscal_year;
    j["fiscal_quarter"] = fiscal_quarter;
    j["superseded"] = superseded;
    j["derived"] = derived;
    return j;
}

nlohmann::json Warning::to_json() const {
    return {
        {"code", ::to_string(code)},
        {"metric", metric},
        {"message", message}
    };
}

const std::vector<ClassifiedFact>& ConceptSeries::bucket(Bucket b) const {
    switch (b) {
        case Bucket::Quarterly: return quarterly;
        case Bucket::Annual: return annual;
        case Bucket::Ytd: return ytd;
        case Bucket::PointInTime: return point_in_time;
    }
    return quarterly;
}

bool ConceptSeries::has_warning(WarningCode code) const {
    return std::any_of(warnings.begin(), warnings.end(),
        [code](const Warning& w) { return w.code == code; });
}

nlohmann::json ConceptSeries::to_json() const {
    auto dump_bucket = [](const std::vector<ClassifiedFact>& facts) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& f : facts) {
            arr.push_back(f.to_json());
        }
        return arr;
    };

    nlohmann::json warnings_json = nlohmann::json::array();
    for (const auto& w : warnings) {
        warnings_json.push_back(w.to_json());
    }

    return {
        {"metric", metric},
        {"concept", concept_name},
        {"unit", unit},
        {"period_type", period_type == PeriodType::Duration ? "duration" : "instant"},
        {"fiscal_year_end_month", fiscal_year_end_month},
        {"total_facts", all.size()},
        {"quarterly", dump_bucket(quarterly)},
        {"annual", dump_bucket(annual)},
        {"ytd", dump_bucket(ytd)},
        {"point_in_time", dump_bucket(point_in_time)},
        {"warnings", warnings_json}
    };
}

nlohmann::json GrowthMetric::to_json() const {
    return {
        {"metric", metric_name},
        {"comparison", comparison == Comparison::YoY ? "yoy" : "qoq"},
        {"basis", ::to_string(basis)},
        {"current_period", current_period},
        {"previous_period", previous_period},
        {"current_value", current_value},
        {"previous_value", previous_value},
        {"growth_pct", growth_pct},
        {"meaningful", meaningful},
        {"flagged", flagged},
        {"note", note}
    };
}

nlohmann::json DerivedMetric::to_json() const {
    return {
        {"name", name},
        {"value", value},
        {"unit", unit},
        {"period", period},
        {"period_end", period_end.to_string()},
        {"basis", ::to_string(basis)},
        {"annualized", annualized}
    };
}

nlohmann::json QualityReport::to_json() const {
    nlohmann::json j = {
        {"ticker", ticker},
        {"company_name", company_name},
        {"completeness_score", completeness_score},
        {"freshness_score", freshness_score},
        {"data_quality_score", data_quality_score},
        {"overall_score", overall_score},
        {"grade", grade},
        {"core_metrics_available", core_metrics_available},
        {"core_metrics_tracked", core_metrics_tracked},
        {"quarterly_points", quarterly_points},
        {"freshness_months", freshness_months}
    };
    j["latest_period"] = latest_period ? nlohmann::json(latest_period->to_string()) : nlohmann::json(nullptr);
    return j;
}

const ConceptSeries* FundamentalsReport::find_series(const std::string& metric) const {
    for (const auto& s : series) {
        if (s.metric == metric) {
            return &s;
        }
    }
    return nullptr;
}

const DerivedMetric* FundamentalsReport::find_derived(const std::string& name) const {
    for (const auto& d : derived_metrics) {
        if (d.name == name) {
            return &d;
        }
    }
    return nullptr;
}

bool FundamentalsReport::has_warning(WarningCode code) const {
    return std::any_of(warnings.begin(), warnings.end(),
        [code](const Warning& w) { return w.code == code; });
}

nlohmann::json FundamentalsReport::to_json() const {
    nlohmann::json series_json = nlohmann::json::array();
    for (const auto& s : series) {
        series_json.push_back(s.to_json());
    }
    nlohmann::json growth_json = nlohmann::json::array();
    for (const auto& g : growth) {
        growth_json.push_back(g.to_json());
    }
    nlohmann::json derived_json = nlohmann::json::array();
    for (const auto& d : derived_metrics) {
        derived_json.push_back(d.to_json());
    }
    nlohmann::json warnings_json = nlohmann::json::array();
    for (const auto& w : warnings) {
        warnings_json.push_back(w.to_json());
    }

    return {
        {"ticker", ticker},
        {"cik", cik},
        {"company_name", company_name},
        {"generated_at", generated_at.to_string()},
        {"degraded", degraded},
        {"series", series_json},
        {"unavailable_metrics", unavailable_metrics},
        {"growth", growth_json},
        {"derived_metrics", derived_json},
        {"quality", quality.to_json()},
        {"warnings", warnings_json}
    };
}
