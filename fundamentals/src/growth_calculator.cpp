#include "growth_calculator.hpp"
#include <fmt/core.h>
#include <cmath>

GrowthCalculator::GrowthCalculator(const GrowthSettings& settings)
    : settings_(settings) {
}

std::vector<GrowthMetric> GrowthCalculator::calculate(const ConceptSeries& series) const {
    std::vector<GrowthMetric> results;

    for (auto bucket : {Bucket::Quarterly, Bucket::Annual, Bucket::Ytd, Bucket::PointInTime}) {
        if (!series.bucket(bucket).empty()) {
            results.push_back(year_over_year(series, bucket));
        }
    }
    if (!series.quarterly.empty()) {
        results.push_back(quarter_over_quarter(series));
    }
    return results;
}

GrowthMetric GrowthCalculator::year_over_year(const ConceptSeries& series, Bucket bucket) const {
    const auto& entries = series.bucket(bucket);
    const auto& current = entries.front();

    const ClassifiedFact* previous = nullptr;
    for (size_t i = 1; i < entries.size(); ++i) {
        if (entries[i].fiscal_year == current.fiscal_year - 1 &&
            entries[i].fiscal_quarter == current.fiscal_quarter) {
            previous = &entries[i];
            break;
        }
    }

    return compare(series.metric, Comparison::YoY, bucket, current, previous);
}

GrowthMetric GrowthCalculator::quarter_over_quarter(const ConceptSeries& series) const {
    const auto& entries = series.quarterly;
    const ClassifiedFact* previous = entries.size() > 1 ? &entries[1] : nullptr;

    auto metric = compare(series.metric, Comparison::QoQ, Bucket::Quarterly, entries.front(), previous);
    if (previous && metric.note.empty()) {
        int current_index = entries.front().fiscal_year * 4 + entries.front().fiscal_quarter;
        int previous_index = previous->fiscal_year * 4 + previous->fiscal_quarter;
        if (current_index - previous_index != 1) {
            metric.note = "previous quarterly entry is not the adjacent quarter";
        }
    }
    return metric;
}

std::string GrowthCalculator::period_label(const ClassifiedFact& fact) {
    switch (fact.bucket) {
        case Bucket::Annual: return fmt::format("FY{}", fact.fiscal_year);
        case Bucket::Quarterly: return fmt::format("FY{} Q{}", fact.fiscal_year, fact.fiscal_quarter);
        case Bucket::Ytd: return fmt::format("FY{} Q{} YTD", fact.fiscal_year, fact.fiscal_quarter);
        case Bucket::PointInTime: return fact.fact.period_end.to_string();
    }
    return fact.fact.period_end.to_string();
}

GrowthMetric GrowthCalculator::compare(const std::string& metric, Comparison comparison, Bucket basis,
                                       const ClassifiedFact& current, const ClassifiedFact* previous) const {
    GrowthMetric growth;
    growth.metric_name = metric;
    growth.comparison = comparison;
    growth.basis = basis;
    growth.current_period = period_label(current);
    growth.current_value = current.fact.value;

    if (!previous) {
        growth.note = "no comparable prior period";
        return growth;
    }

    growth.previous_period = period_label(*previous);
    growth.previous_value = previous->fact.value;

    if (growth.previous_value == 0.0) {
        growth.note = "previous value is zero";
        return growth;
    }
    if ((growth.current_value < 0.0 && growth.previous_value > 0.0) ||
        (growth.current_value > 0.0 && growth.previous_value < 0.0)) {
        growth.note = "sign change between periods";
        return growth;
    }

    growth.growth_pct = (growth.current_value - growth.previous_value) / std::abs(growth.previous_value) * 100.0;
    growth.meaningful = true;

    if (std::abs(growth.growth_pct) > settings_.growth_ceiling_pct) {
        growth.flagged = true;
        growth.note = fmt::format("exceeds {:.0f}% sanity ceiling", settings_.growth_ceiling_pct);
    }
    return growth;
}
