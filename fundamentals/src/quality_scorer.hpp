#pragma once

#include "config.hpp"
#include "types.hpp"
#include <string>
#include <vector>

// Completeness, freshness and granularity sub-scores plus the weighted
// composite and letter grade.
class QualityScorer {
public:
    explicit QualityScorer(const QualitySettings& settings);

    // Appends stale_data to `warnings` when the newest core point is over a year old
    QualityReport score(const std::string& ticker,
                        const std::string& company_name,
                        const std::vector<ConceptSeries>& series,
                        const Date& as_of,
                        std::vector<Warning>& warnings) const;

    static double completeness_score(int available, int tracked);
    static double freshness_score(int months_old);
    static double granularity_score(int quarterly_points);
    static double overall_score(double completeness, double freshness, double data_quality);
    static std::string grade_for(double overall);

private:
    QualitySettings settings_;
};
