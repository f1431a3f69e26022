#pragma once

#include "config.hpp"
#include "types.hpp"
#include "concept_selector.hpp"
#include <vector>

// Fiscal year layout of one company, as detected from its annual filings
struct FiscalCalendar {
    int year_end_month = 12;
    int final_quarter_month = 12;
    bool assumed = true;
    int rollback_days = 7;

    int fiscal_year(const Date& period_end) const;
    int fiscal_quarter(const Date& period_end) const; // 1..4
    bool in_final_quarter_month(const Date& period_end) const;
};

// Assigns every fact of a selected concept to exactly one bucket. Never
// throws; ambiguous facts get a best-guess bucket, a lower confidence and a
// warning on the series. Deterministic for a given input.
class PeriodClassifier {
public:
    explicit PeriodClassifier(const ClassifierSettings& settings);

    ConceptSeries classify(const ConceptSelection& selection) const;

    FiscalCalendar detect_calendar(const std::vector<RawFact>& facts) const;

private:
    void classify_durations(std::vector<ClassifiedFact>& facts, const FiscalCalendar& calendar,
                            std::vector<Warning>& warnings, const std::string& metric) const;
    bool classify_by_duration(ClassifiedFact& fact) const;

    static void mark_superseded(std::vector<ClassifiedFact>& facts);
    void derive_quarters(ConceptSeries& series) const;
    void check_scale(ConceptSeries& series) const;

    ClassifierSettings settings_;
};
