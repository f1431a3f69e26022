#pragma once

#include "config.hpp"
#include "types.hpp"
#include "concept_selector.hpp"
#include "period_classifier.hpp"
#include "growth_calculator.hpp"
#include "ratio_calculator.hpp"
#include "quality_scorer.hpp"
#include <string>

// Pure pipeline from a fact set to a report: selection, classification,
// growth, derived ratios and scoring. The report date is explicit so results are repeatable.
class ReportAssembler {
public:
    explicit ReportAssembler(const Config& config);
    ReportAssembler(const ClassifierSettings& classifier,
                    const GrowthSettings& growth,
                    const QualitySettings& quality,
                    const RatioSettings& ratios = RatioSettings());

    FundamentalsReport assemble(const RawFactSet& facts, const Date& as_of) const;

    // Grade F report standing in for a ticker whose facts could not be fetched
    static FundamentalsReport degraded(const std::string& ticker, const std::string& reason, const Date& as_of);

private:
    ConceptSelector selector_;
    PeriodClassifier classifier_;
    GrowthCalculator growth_;
    RatioCalculator ratios_;
    QualityScorer scorer_;
};
