#pragma once

#include "config.hpp"
#include "types.hpp"
#include <vector>

// Margins, returns and leverage computed from the classified series, plus
// consistency checks across statements. Flow ratios only pair values of the
// same bucket and period end; balance ratios pair balances of the same date.
class RatioCalculator {
public:
    explicit RatioCalculator(const RatioSettings& settings);

    // Appends balance_sheet_mismatch / margin_out_of_range warnings
    std::vector<DerivedMetric> calculate(const std::vector<ConceptSeries>& series,
                                         std::vector<Warning>& warnings) const;

private:
    RatioSettings settings_;
};
