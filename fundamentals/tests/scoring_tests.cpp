#include <catch2/catch.hpp>

#include "concept_selector.hpp"
#include "period_classifier.hpp"
#include "growth_calculator.hpp"
#include "quality_scorer.hpp"
#include "fact_builders.hpp"

namespace {

ClassifiedFact classified(double value, Date end, Bucket bucket, int fiscal_year, int fiscal_quarter) {
    ClassifiedFact fact;
    fact.fact = make_fact("Revenues", value, end, end, "10-Q");
    fact.bucket = bucket;
    fact.fiscal_year = fiscal_year;
    fact.fiscal_quarter = fiscal_quarter;
    fact.confidence = 0.95;
    return fact;
}

ConceptSeries revenue_series() {
    ConceptSeries series;
    series.metric = "Revenue";
    series.concept_name = "Revenues";
    series.unit = "USD";
    return series;
}

const GrowthMetric* find_growth(const std::vector<GrowthMetric>& growth, Comparison comparison, Bucket basis) {
    for (const auto& g : growth) {
        if (g.comparison == comparison && g.basis == basis) return &g;
    }
    return nullptr;
}

} // namespace

TEST_CASE("GrowthCalculator computes YoY and QoQ on quarterly data", "[growth]") {
    auto series = revenue_series();
    series.quarterly = {
        classified(1200, make_date(2023, 6, 30), Bucket::Quarterly, 2023, 2),
        classified(1000, make_date(2023, 3, 31), Bucket::Quarterly, 2023, 1),
        classified(1100, make_date(2022, 6, 30), Bucket::Quarterly, 2022, 2),
    };

    GrowthCalculator calculator{GrowthSettings()};
    auto growth = calculator.calculate(series);

    const auto* yoy = find_growth(growth, Comparison::YoY, Bucket::Quarterly);
    REQUIRE(yoy != nullptr);
    CHECK(yoy->meaningful);
    CHECK(yoy->growth_pct == Approx(100.0 / 1100.0 * 100.0));
    CHECK(yoy->current_period == "FY2023 Q2");
    CHECK(yoy->previous_period == "FY2022 Q2");

    const auto* qoq = find_growth(growth, Comparison::QoQ, Bucket::Quarterly);
    REQUIRE(qoq != nullptr);
    CHECK(qoq->meaningful);
    CHECK(qoq->growth_pct == Approx(20.0));
    CHECK(qoq->previous_period == "FY2023 Q1");
}

TEST_CASE("QoQ never uses annual or year-to-date entries", "[growth]") {
    auto series = revenue_series();
    series.quarterly = {classified(1000, make_date(2023, 3, 31), Bucket::Quarterly, 2023, 1)};
    series.ytd = {classified(2100, make_date(2023, 6, 30), Bucket::Ytd, 2023, 2)};
    series.annual = {classified(4000, make_date(2022, 12, 31), Bucket::Annual, 2022, 0)};

    GrowthCalculator calculator{GrowthSettings()};
    auto growth = calculator.calculate(series);

    for (const auto& g : growth) {
        if (g.comparison == Comparison::QoQ) {
            CHECK(g.basis == Bucket::Quarterly);
            CHECK_FALSE(g.meaningful);
            CHECK(g.previous_period.empty());
        }
        CHECK_FALSE(g.meaningful);
    }
    CHECK(find_growth(growth, Comparison::QoQ, Bucket::Ytd) == nullptr);
    CHECK(find_growth(growth, Comparison::QoQ, Bucket::Annual) == nullptr);
}

TEST_CASE("Growth from zero or across a sign change is not meaningful", "[growth]") {
    GrowthCalculator calculator{GrowthSettings()};

    auto series = revenue_series();
    series.quarterly = {
        classified(50, make_date(2023, 6, 30), Bucket::Quarterly, 2023, 2),
        classified(0, make_date(2023, 3, 31), Bucket::Quarterly, 2023, 1),
    };
    auto from_zero = calculator.quarter_over_quarter(series);
    CHECK_FALSE(from_zero.meaningful);
    CHECK(from_zero.growth_pct == 0.0);

    series.quarterly = {
        classified(-50, make_date(2023, 6, 30), Bucket::Quarterly, 2023, 2),
        classified(80, make_date(2023, 3, 31), Bucket::Quarterly, 2023, 1),
    };
    auto sign_change = calculator.quarter_over_quarter(series);
    CHECK_FALSE(sign_change.meaningful);
    CHECK(sign_change.growth_pct == 0.0);

    series.quarterly = {
        classified(-50, make_date(2023, 6, 30), Bucket::Quarterly, 2023, 2),
        classified(-100, make_date(2023, 3, 31), Bucket::Quarterly, 2023, 1),
    };
    auto both_negative = calculator.quarter_over_quarter(series);
    CHECK(both_negative.meaningful);
    CHECK(both_negative.growth_pct == Approx(50.0));
}

TEST_CASE("Extreme growth is flagged but still reported", "[growth]") {
    auto series = revenue_series();
    series.quarterly = {
        classified(5000, make_date(2023, 6, 30), Bucket::Quarterly, 2023, 2),
        classified(1000, make_date(2023, 3, 31), Bucket::Quarterly, 2023, 1),
    };

    GrowthCalculator calculator{GrowthSettings()};
    auto qoq = calculator.quarter_over_quarter(series);

    CHECK(qoq.meaningful);
    CHECK(qoq.flagged);
    CHECK(qoq.growth_pct == Approx(400.0));
}

TEST_CASE("A single data point yields no meaningful growth", "[growth]") {
    auto series = revenue_series();
    series.quarterly = {classified(1000, make_date(2023, 3, 31), Bucket::Quarterly, 2023, 1)};

    GrowthCalculator calculator{GrowthSettings()};
    auto growth = calculator.calculate(series);

    REQUIRE(growth.size() == 2);
    for (const auto& g : growth) {
        CHECK_FALSE(g.meaningful);
        CHECK_FALSE(g.note.empty());
    }
}

TEST_CASE("Annual YoY compares consecutive fiscal years", "[growth]") {
    auto series = revenue_series();
    series.annual = {
        classified(4400, make_date(2023, 12, 31), Bucket::Annual, 2023, 0),
        classified(4000, make_date(2022, 12, 31), Bucket::Annual, 2022, 0),
    };

    GrowthCalculator calculator{GrowthSettings()};
    auto yoy = calculator.year_over_year(series, Bucket::Annual);

    CHECK(yoy.meaningful);
    CHECK(yoy.growth_pct == Approx(10.0));
    CHECK(yoy.current_period == "FY2023");
}

TEST_CASE("QualityScorer sub-score tiers", "[quality]") {
    CHECK(QualityScorer::completeness_score(3, 4) == Approx(75.0));
    CHECK(QualityScorer::completeness_score(0, 0) == Approx(0.0));

    CHECK(QualityScorer::freshness_score(0) == Approx(100.0));
    CHECK(QualityScorer::freshness_score(3) == Approx(100.0));
    CHECK(QualityScorer::freshness_score(6) == Approx(85.0));
    CHECK(QualityScorer::freshness_score(12) == Approx(60.0));
    CHECK(QualityScorer::freshness_score(13) == Approx(30.0));

    CHECK(QualityScorer::granularity_score(8) == Approx(100.0));
    CHECK(QualityScorer::granularity_score(6) == Approx(85.0));
    CHECK(QualityScorer::granularity_score(4) == Approx(70.0));
    CHECK(QualityScorer::granularity_score(2) == Approx(50.0));
    CHECK(QualityScorer::granularity_score(1) == Approx(30.0));
    CHECK(QualityScorer::granularity_score(0) == Approx(0.0));

    CHECK(QualityScorer::overall_score(100, 100, 100) == Approx(100.0));
    CHECK(QualityScorer::overall_score(50, 100, 0) == Approx(50.0));
}

TEST_CASE("QualityScorer letter grades", "[quality]") {
    CHECK(QualityScorer::grade_for(97) == "A+");
    CHECK(QualityScorer::grade_for(95) == "A+");
    CHECK(QualityScorer::grade_for(92) == "A");
    CHECK(QualityScorer::grade_for(86) == "B+");
    CHECK(QualityScorer::grade_for(80) == "B");
    CHECK(QualityScorer::grade_for(76) == "C+");
    CHECK(QualityScorer::grade_for(70) == "C");
    CHECK(QualityScorer::grade_for(61) == "D");
    CHECK(QualityScorer::grade_for(59.9) == "F");
}

TEST_CASE("QualityScorer scores a complete, fresh company", "[quality]") {
    ConceptSelector selector;
    PeriodClassifier classifier{ClassifierSettings()};
    std::vector<ConceptSeries> series;
    for (const auto& selection : selector.select_all(clean_calendar_company(2019, 5))) {
        if (selection.available()) series.push_back(classifier.classify(selection));
    }

    QualityScorer scorer{QualitySettings()};
    std::vector<Warning> warnings;
    auto report = scorer.score("AAPL", "Apple Inc.", series, make_date(2024, 3, 1), warnings);

    CHECK(report.core_metrics_available == 4);
    CHECK(report.core_metrics_tracked == 4);
    CHECK(report.completeness_score == Approx(100.0));
    REQUIRE(report.latest_period.has_value());
    CHECK(*report.latest_period == make_date(2023, 12, 31));
    CHECK(report.freshness_months == 2);
    CHECK(report.freshness_score == Approx(100.0));
    CHECK(report.quarterly_points == 20);
    CHECK(report.data_quality_score == Approx(100.0));
    CHECK(report.grade == "A+");
    CHECK(warnings.empty());
}

TEST_CASE("QualityScorer marks stale data", "[quality]") {
    ConceptSelector selector;
    PeriodClassifier classifier{ClassifierSettings()};
    std::vector<ConceptSeries> series;
    for (const auto& selection : selector.select_all(clean_calendar_company(2019, 2))) {
        if (selection.available()) series.push_back(classifier.classify(selection));
    }

    QualityScorer scorer{QualitySettings()};
    std::vector<Warning> warnings;
    auto report = scorer.score("OLD", "Old Co", series, make_date(2024, 3, 1), warnings);

    CHECK(report.freshness_months > 12);
    CHECK(report.freshness_score == Approx(30.0));
    REQUIRE(warnings.size() == 1);
    CHECK(warnings.front().code == WarningCode::StaleData);
}

TEST_CASE("QualityScorer gives an empty company zero scores", "[quality]") {
    QualityScorer scorer{QualitySettings()};
    std::vector<Warning> warnings;
    auto report = scorer.score("NONE", "", {}, make_date(2024, 3, 1), warnings);

    CHECK(report.completeness_score == Approx(0.0));
    CHECK(report.freshness_score == Approx(0.0));
    CHECK(report.data_quality_score == Approx(0.0));
    CHECK_FALSE(report.latest_period.has_value());
    CHECK(report.grade == "F");
}
