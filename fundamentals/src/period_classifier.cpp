#include "period_classifier.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <set>
#include <tuple>
#include <utility>

int FiscalCalendar::fiscal_year(const Date& period_end) const {
    int month = util::effective_month(period_end, rollback_days);
    int year = util::effective_year(period_end, rollback_days);
    return month <= year_end_month ? year : year + 1;
}

int FiscalCalendar::fiscal_quarter(const Date& period_end) const {
    int month = util::effective_month(period_end, rollback_days);
    int offset = ((month - year_end_month - 1) % 12 + 12) % 12;
    return offset / 3 + 1;
}

bool FiscalCalendar::in_final_quarter_month(const Date& period_end) const {
    return util::effective_month(period_end, rollback_days) == final_quarter_month;
}

PeriodClassifier::PeriodClassifier(const ClassifierSettings& settings)
    : settings_(settings) {
}

FiscalCalendar PeriodClassifier::detect_calendar(const std::vector<RawFact>& facts) const {
    FiscalCalendar calendar;
    calendar.rollback_days = settings_.week_rollback_days;

    std::map<int, int> month_counts;
    const RawFact* latest_annual = nullptr;

    for (const auto& fact : facts) {
        if (!util::is_annual_form(fact.form_type)) {
            continue;
        }
        // Annual reports also carry discrete fourth quarters and quarterly notes
        if (fact.period_start &&
            util::days_between(*fact.period_start, fact.period_end) < settings_.min_annual_days) {
            continue;
        }

        month_counts[util::effective_month(fact.period_end, calendar.rollback_days)]++;
        if (!latest_annual ||
            std::tie(fact.filed_date, fact.period_end) > std::tie(latest_annual->filed_date, latest_annual->period_end)) {
            latest_annual = &fact;
        }
    }

    if (latest_annual) {
        int latest_month = util::effective_month(latest_annual->period_end, calendar.rollback_days);
        int best_month = latest_month;
        int best_count = month_counts[latest_month];
        for (const auto& [month, count] : month_counts) {
            if (count > best_count) {
                best_month = month;
                best_count = count;
            }
        }
        calendar.year_end_month = best_month;
        calendar.assumed = false;
    }

    calendar.final_quarter_month = settings_.final_quarter_month_override > 0
        ? settings_.final_quarter_month_override
        : calendar.year_end_month;
    return calendar;
}

ConceptSeries PeriodClassifier::classify(const ConceptSelection& selection) const {
    ConceptSeries series;
    series.metric = selection.metric.name;
    series.concept_name = selection.concept_name;
    series.unit = selection.unit;
    series.period_type = selection.metric.period_type;

    if (!selection.available()) {
        return series;
    }

    auto calendar = detect_calendar(selection.facts);
    series.fiscal_year_end_month = calendar.year_end_month;
    if (calendar.assumed) {
        series.warnings.push_back({WarningCode::FiscalYearEndAssumed, series.metric,
                                   "No annual filings for " + series.concept_name +
                                   "; assuming a December fiscal year-end"});
    }

    series.all.reserve(selection.facts.size());
    for (const auto& fact : selection.facts) {
        ClassifiedFact classified;
        classified.fact = fact;
        classified.fiscal_year = calendar.fiscal_year(fact.period_end);
        classified.fiscal_quarter = calendar.fiscal_quarter(fact.period_end);
        series.all.push_back(std::move(classified));
    }

    if (series.period_type == PeriodType::Instant) {
        for (auto& fact : series.all) {
            fact.bucket = Bucket::PointInTime;
            fact.confidence = 1.0;
            fact.reason = "balance as of period end";
        }
    } else {
        classify_durations(series.all, calendar, series.warnings, series.metric);
    }

    mark_superseded(series.all);

    for (const auto& fact : series.all) {
        if (fact.superseded) {
            continue;
        }
        switch (fact.bucket) {
            case Bucket::Quarterly: series.quarterly.push_back(fact); break;
            case Bucket::Annual: series.annual.push_back(fact); break;
            case Bucket::Ytd: series.ytd.push_back(fact); break;
            case Bucket::PointInTime: series.point_in_time.push_back(fact); break;
        }
    }

    if (series.period_type == PeriodType::Duration && settings_.derive_missing_quarters) {
        derive_quarters(series);
    }

    auto latest_first = [](const ClassifiedFact& a, const ClassifiedFact& b) {
        return a.fact.period_end > b.fact.period_end;
    };
    std::sort(series.quarterly.begin(), series.quarterly.end(), latest_first);
    std::sort(series.annual.begin(), series.annual.end(), latest_first);
    std::sort(series.ytd.begin(), series.ytd.end(), latest_first);
    std::sort(series.point_in_time.begin(), series.point_in_time.end(), latest_first);

    if (series.period_type == PeriodType::Duration) {
        check_scale(series);
    }

    spdlog::debug("Classified {} ({}): {} quarterly, {} annual, {} ytd, {} point-in-time, FYE month {}",
                  series.metric, series.concept_name, series.quarterly.size(), series.annual.size(),
                  series.ytd.size(), series.point_in_time.size(), series.fiscal_year_end_month);
    return series;
}

bool PeriodClassifier::classify_by_duration(ClassifiedFact& fact) const {
    if (!fact.fact.period_start) {
        return false;
    }

    long days = util::days_between(*fact.fact.period_start, fact.fact.period_end);
    if (days <= settings_.max_quarter_days) {
        fact.bucket = Bucket::Quarterly;
        fact.reason = fmt::format("{}-day duration", days);
    } else if (days >= settings_.min_annual_days) {
        fact.bucket = Bucket::Annual;
        fact.fiscal_quarter = 0;
        fact.reason = fmt::format("{}-day duration", days);
    } else {
        fact.bucket = Bucket::Ytd;
        fact.reason = fmt::format("cumulative {}-day duration", days);
    }
    fact.confidence = 0.95;
    return true;
}

void PeriodClassifier::classify_durations(std::vector<ClassifiedFact>& facts, const FiscalCalendar& calendar,
                                          std::vector<Warning>& warnings, const std::string& metric) const {
    std::vector<ClassifiedFact*> pending;
    std::set<std::string> unknown_forms;

    for (auto& fact : facts) {
        if (classify_by_duration(fact)) {
            continue;
        }

        const auto& form = fact.fact.form_type;
        if (util::is_annual_form(form)) {
            fact.bucket = Bucket::Annual;
            fact.fiscal_quarter = 0;
            fact.confidence = 0.95;
            fact.reason = "reported on annual form " + form;
        } else if (util::is_quarterly_form(form)) {
            pending.push_back(&fact);
        } else {
            fact.bucket = Bucket::Quarterly;
            fact.confidence = 0.40;
            fact.reason = "unrecognized form " + form;
            unknown_forms.insert(form);
        }
    }

    for (const auto& form : unknown_forms) {
        warnings.push_back({WarningCode::UnknownForm, metric,
                            "Facts reported on unrecognized form " + form + " treated as quarterly"});
    }

    // Q1 baselines per fiscal year: latest-filed discrete first-quarter value
    std::map<int, const ClassifiedFact*> baselines;
    auto offer_baseline = [&baselines](const ClassifiedFact& fact) {
        auto& current = baselines[fact.fiscal_year];
        if (!current ||
            std::tie(fact.fact.filed_date, fact.fact.accession) >
            std::tie(current->fact.filed_date, current->fact.accession)) {
            current = &fact;
        }
    };

    for (const auto& fact : facts) {
        if (fact.fact.period_start && fact.bucket == Bucket::Quarterly && fact.fiscal_quarter == 1) {
            offer_baseline(fact);
        }
    }
    for (auto* fact : pending) {
        if (fact->fiscal_quarter == 1) {
            fact->bucket = Bucket::Quarterly;
            fact->confidence = 0.95;
            fact->reason = "first fiscal quarter";
            offer_baseline(*fact);
        }
    }

    std::set<int> missing_baselines;
    for (auto* fact : pending) {
        if (fact->fiscal_quarter == 1) {
            continue;
        }

        auto it = baselines.find(fact->fiscal_year);
        if (it == baselines.end() || it->second->fact.value == 0.0) {
            fact->bucket = Bucket::Quarterly;
            fact->confidence = 0.50;
            fact->reason = fmt::format("no Q1 baseline for FY{}", fact->fiscal_year);
            missing_baselines.insert(fact->fiscal_year);
            continue;
        }

        double ratio = std::abs(fact->fact.value) / std::abs(it->second->fact.value);
        if (ratio > settings_.ytd_ratio_threshold && calendar.in_final_quarter_month(fact->fact.period_end)) {
            fact->bucket = Bucket::Ytd;
            fact->confidence = 0.80;
            fact->reason = fmt::format("{:.2f}x Q1 baseline in final fiscal quarter month", ratio);
            spdlog::debug("{} {} classified as year-to-date ({:.2f}x Q1)", metric,
                          fact->fact.period_end.to_string(), ratio);
        } else {
            fact->bucket = Bucket::Quarterly;
            fact->confidence = 0.85;
            fact->reason = fmt::format("{:.2f}x Q1 baseline", ratio);
        }
    }

    for (int fiscal_year : missing_baselines) {
        warnings.push_back({WarningCode::NoBaseline, metric,
                            fmt::format("No Q1 baseline for FY{}; later quarters kept as quarterly "
                                        "with reduced confidence", fiscal_year)});
    }
}

void PeriodClassifier::mark_superseded(std::vector<ClassifiedFact>& facts) {
    // Deterministic order: period, bucket, then newest filing first
    std::sort(facts.begin(), facts.end(), [](const ClassifiedFact& a, const ClassifiedFact& b) {
        if (a.fact.period_end != b.fact.period_end) return a.fact.period_end < b.fact.period_end;
        if (a.bucket != b.bucket) return a.bucket < b.bucket;
        if (a.fact.filed_date != b.fact.filed_date) return a.fact.filed_date > b.fact.filed_date;
        if (a.fact.accession != b.fact.accession) return a.fact.accession > b.fact.accession;
        if (a.fact.form_type != b.fact.form_type) return a.fact.form_type < b.fact.form_type;
        return a.fact.value > b.fact.value;
    });

    for (size_t i = 0; i < facts.size(); ++i) {
        facts[i].superseded = i > 0 &&
            facts[i].fact.period_end == facts[i - 1].fact.period_end &&
            facts[i].bucket == facts[i - 1].bucket;
    }
}

void PeriodClassifier::derive_quarters(ConceptSeries& series) const {
    using Key = std::pair<int, int>; // fiscal year, fiscal quarter

    // Reported discrete quarters, and cumulative totals through a quarter
    std::map<Key, const ClassifiedFact*> discrete;
    std::map<Key, const ClassifiedFact*> cumulative;
    std::set<int> fiscal_years;

    for (const auto& fact : series.quarterly) {
        discrete.emplace(Key{fact.fiscal_year, fact.fiscal_quarter}, &fact);
    }
    for (const auto& fact : series.ytd) {
        if (fact.fiscal_quarter >= 2 && fact.fiscal_quarter <= 3) {
            cumulative.emplace(Key{fact.fiscal_year, fact.fiscal_quarter}, &fact);
            fiscal_years.insert(fact.fiscal_year);
        }
    }
    for (const auto& fact : series.annual) {
        cumulative.emplace(Key{fact.fiscal_year, 4}, &fact);
        fiscal_years.insert(fact.fiscal_year);
    }

    std::vector<ClassifiedFact> derived;
    for (int fiscal_year : fiscal_years) {
        // Running total through the previous quarter, when known
        std::optional<double> running;
        std::optional<Date> running_end;

        for (int quarter = 1; quarter <= 4; ++quarter) {
            auto d = discrete.find(Key{fiscal_year, quarter});
            auto c = cumulative.find(Key{fiscal_year, quarter});
            const ClassifiedFact* reported = d != discrete.end() ? d->second : nullptr;
            const ClassifiedFact* total = c != cumulative.end() ? c->second : nullptr;
            std::optional<double> quarter_value = reported ? std::optional<double>(reported->fact.value)
                                                           : std::nullopt;

            if (!reported && total && running && total->fact.period_end > *running_end) {
                ClassifiedFact fact;
                fact.fact = total->fact;
                fact.fact.value = total->fact.value - *running;
                fact.fact.period_start = Date::from_days_since_epoch(running_end->days_since_epoch() + 1);
                fact.fact.frame.clear();
                fact.bucket = Bucket::Quarterly;
                fact.fiscal_year = fiscal_year;
                fact.fiscal_quarter = quarter;
                fact.confidence = settings_.derived_confidence;
                fact.derived = true;
                fact.reason = total->bucket == Bucket::Annual
                    ? fmt::format("annual total less cumulative through Q{}", quarter - 1)
                    : fmt::format("Q{} year-to-date less cumulative through Q{}", quarter, quarter - 1);
                quarter_value = fact.fact.value;
                spdlog::debug("{} FY{} Q{} derived as {} ({})", series.metric, fiscal_year, quarter,
                              fact.fact.value, fact.reason);
                derived.push_back(std::move(fact));
            }

            if (total) {
                running = total->fact.value;
                running_end = total->fact.period_end;
            } else if (quarter_value && (quarter == 1 || running)) {
                running = (quarter == 1 ? 0.0 : *running) + *quarter_value;
                running_end = reported ? reported->fact.period_end : *running_end;
            } else {
                running.reset();
                running_end.reset();
            }
        }
    }

    series.quarterly.insert(series.quarterly.end(), derived.begin(), derived.end());
}

void PeriodClassifier::check_scale(ConceptSeries& series) const {
    double min_value = 0.0;
    double max_value = 0.0;
    for (const auto& fact : series.quarterly) {
        double magnitude = std::abs(fact.fact.value);
        if (magnitude == 0.0) {
            continue;
        }
        if (min_value == 0.0 || magnitude < min_value) min_value = magnitude;
        if (magnitude > max_value) max_value = magnitude;
    }

    if (min_value > 0.0 && max_value / min_value > settings_.scale_mismatch_multiple) {
        series.warnings.push_back({WarningCode::ScaleMismatch, series.metric,
                                   fmt::format("Possible unit/scale mismatch: quarterly values span {:.0f}x",
                                               max_value / min_value)});
        spdlog::debug("Scale mismatch in {}: max/min {:.1f}", series.metric, max_value / min_value);
    }
}
