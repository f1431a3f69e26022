#pragma once

#include "config.hpp"
#include "types.hpp"
#include <string>
#include <vector>

// Year-over-year and quarter-over-quarter growth. Comparisons never cross
// buckets: QoQ is quarterly against quarterly only.
class GrowthCalculator {
public:
    explicit GrowthCalculator(const GrowthSettings& settings);

    // YoY for each non-empty bucket, plus QoQ for the quarterly bucket
    std::vector<GrowthMetric> calculate(const ConceptSeries& series) const;

    GrowthMetric year_over_year(const ConceptSeries& series, Bucket bucket) const;
    GrowthMetric quarter_over_quarter(const ConceptSeries& series) const;

    static std::string period_label(const ClassifiedFact& fact);

private:
    GrowthMetric compare(const std::string& metric, Comparison comparison, Bucket basis,
                         const ClassifiedFact& current, const ClassifiedFact* previous) const;

    GrowthSettings settings_;
};
