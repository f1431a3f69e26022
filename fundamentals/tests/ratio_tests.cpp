#include <catch2/catch.hpp>

#include "ratio_calculator.hpp"
#include "fact_builders.hpp"

namespace {

ConceptSeries series_named(const std::string& metric, PeriodType period_type = PeriodType::Duration) {
    ConceptSeries series;
    series.metric = metric;
    series.concept_name = metric;
    series.unit = "USD";
    series.period_type = period_type;
    return series;
}

void add(ConceptSeries& series, double value, Date end, Bucket bucket, int fiscal_year, int fiscal_quarter) {
    ClassifiedFact fact;
    fact.fact = make_fact(series.concept_name, value, end, end, bucket == Bucket::Annual ? "10-K" : "10-Q");
    fact.bucket = bucket;
    fact.fiscal_year = fiscal_year;
    fact.fiscal_quarter = fiscal_quarter;
    fact.confidence = 0.95;
    series.all.push_back(fact);
    switch (bucket) {
        case Bucket::Quarterly: series.quarterly.push_back(fact); break;
        case Bucket::Annual: series.annual.push_back(fact); break;
        case Bucket::Ytd: series.ytd.push_back(fact); break;
        case Bucket::PointInTime: series.point_in_time.push_back(fact); break;
    }
}

const DerivedMetric* find_metric(const std::vector<DerivedMetric>& metrics, const std::string& name) {
    for (const auto& metric : metrics) {
        if (metric.name == name) return &metric;
    }
    return nullptr;
}

bool has_code(const std::vector<Warning>& warnings, WarningCode code) {
    for (const auto& warning : warnings) {
        if (warning.code == code) return true;
    }
    return false;
}

} // namespace

class RatioFixture {
protected:
    RatioFixture()
        : calculator_(RatioSettings()) {
    }

    std::vector<DerivedMetric> run(const std::vector<ConceptSeries>& series) {
        warnings_.clear();
        return calculator_.calculate(series, warnings_);
    }

    RatioCalculator calculator_;
    std::vector<Warning> warnings_;
};

TEST_CASE_METHOD(RatioFixture, "Margins pair revenue with costs of the same quarter", "[ratios]") {
    auto revenue = series_named("Revenue");
    add(revenue, 1200, make_date(2023, 9, 30), Bucket::Quarterly, 2023, 3);
    add(revenue, 1000, make_date(2023, 6, 30), Bucket::Quarterly, 2023, 2);

    // Costs are a quarter behind, so only Q2 lines up
    auto cost = series_named("CostOfRevenue");
    add(cost, 600, make_date(2023, 6, 30), Bucket::Quarterly, 2023, 2);

    auto operating = series_named("OperatingIncome");
    add(operating, 300, make_date(2023, 9, 30), Bucket::Quarterly, 2023, 3);

    auto net_income = series_named("NetIncome");
    add(net_income, 180, make_date(2023, 9, 30), Bucket::Quarterly, 2023, 3);

    auto metrics = run({revenue, cost, operating, net_income});

    const auto* gross = find_metric(metrics, "GrossProfit");
    REQUIRE(gross);
    CHECK(gross->value == Approx(400));
    CHECK(gross->unit == "USD");
    CHECK(gross->period == "FY2023 Q2");

    const auto* gross_margin = find_metric(metrics, "GrossMargin");
    REQUIRE(gross_margin);
    CHECK(gross_margin->value == Approx(40.0));
    CHECK(gross_margin->basis == Bucket::Quarterly);

    const auto* operating_margin = find_metric(metrics, "OperatingMargin");
    REQUIRE(operating_margin);
    CHECK(operating_margin->value == Approx(25.0));
    CHECK(operating_margin->period_end == make_date(2023, 9, 30));

    const auto* net_margin = find_metric(metrics, "NetMargin");
    REQUIRE(net_margin);
    CHECK(net_margin->value == Approx(15.0));
    CHECK(warnings_.empty());
}

TEST_CASE_METHOD(RatioFixture, "Quarterly and annual values are never mixed", "[ratios]") {
    auto revenue = series_named("Revenue");
    add(revenue, 4000, make_date(2023, 12, 31), Bucket::Annual, 2023, 4);

    auto net_income = series_named("NetIncome");
    add(net_income, 300, make_date(2023, 12, 31), Bucket::Quarterly, 2023, 4);

    auto metrics = run({revenue, net_income});

    CHECK_FALSE(find_metric(metrics, "NetMargin"));
}

TEST_CASE_METHOD(RatioFixture, "Free cash flow subtracts capital spending", "[ratios]") {
    auto cash_flow = series_named("OperatingCashFlow");
    add(cash_flow, 5000, make_date(2023, 12, 31), Bucket::Annual, 2023, 4);

    auto capex = series_named("CapitalExpenditures");
    add(capex, 1500, make_date(2023, 12, 31), Bucket::Annual, 2023, 4);

    auto metrics = run({cash_flow, capex});

    const auto* fcf = find_metric(metrics, "FreeCashFlow");
    REQUIRE(fcf);
    CHECK(fcf->value == Approx(3500));
    CHECK(fcf->period == "FY2023");
    CHECK(fcf->basis == Bucket::Annual);

    // Some filers report the outflow as a negative number
    capex.all[0].fact.value = -1500;
    capex.annual[0].fact.value = -1500;
    metrics = run({cash_flow, capex});
    REQUIRE(find_metric(metrics, "FreeCashFlow"));
    CHECK(find_metric(metrics, "FreeCashFlow")->value == Approx(3500));
}

TEST_CASE_METHOD(RatioFixture, "Returns prefer a full fiscal year", "[ratios]") {
    auto net_income = series_named("NetIncome");
    add(net_income, 120, make_date(2024, 3, 31), Bucket::Quarterly, 2024, 1);
    add(net_income, 400, make_date(2023, 12, 31), Bucket::Annual, 2023, 4);

    auto equity = series_named("StockholdersEquity", PeriodType::Instant);
    add(equity, 2000, make_date(2024, 3, 31), Bucket::PointInTime, 2024, 1);
    add(equity, 2000, make_date(2023, 12, 31), Bucket::PointInTime, 2023, 4);

    auto assets = series_named("TotalAssets", PeriodType::Instant);
    add(assets, 8000, make_date(2024, 3, 31), Bucket::PointInTime, 2024, 1);

    auto metrics = run({net_income, equity, assets});

    const auto* roe = find_metric(metrics, "ReturnOnEquity");
    REQUIRE(roe);
    CHECK(roe->value == Approx(20.0));
    CHECK_FALSE(roe->annualized);
    CHECK(roe->period == "FY2023");

    // No year-end asset balance, so the latest quarter is annualized
    const auto* roa = find_metric(metrics, "ReturnOnAssets");
    REQUIRE(roa);
    CHECK(roa->value == Approx(6.0));
    CHECK(roa->annualized);
    CHECK(roa->basis == Bucket::Quarterly);
}

TEST_CASE_METHOD(RatioFixture, "Leverage and the balance sheet identity use one date", "[ratios][consistency]") {
    auto assets = series_named("TotalAssets", PeriodType::Instant);
    add(assets, 10000, make_date(2023, 12, 31), Bucket::PointInTime, 2023, 4);

    auto liabilities = series_named("TotalLiabilities", PeriodType::Instant);
    add(liabilities, 6000, make_date(2023, 12, 31), Bucket::PointInTime, 2023, 4);

    auto equity = series_named("StockholdersEquity", PeriodType::Instant);
    add(equity, 3950, make_date(2023, 12, 31), Bucket::PointInTime, 2023, 4);

    SECTION("within tolerance") {
        auto metrics = run({assets, liabilities, equity});

        const auto* leverage = find_metric(metrics, "DebtToEquity");
        REQUIRE(leverage);
        CHECK(leverage->value == Approx(6000.0 / 3950.0));
        CHECK(leverage->unit == "ratio");
        CHECK_FALSE(has_code(warnings_, WarningCode::BalanceSheetMismatch));
    }

    SECTION("off by more than two percent") {
        equity.all[0].fact.value = 3500;
        equity.point_in_time[0].fact.value = 3500;

        run({assets, liabilities, equity});

        REQUIRE(has_code(warnings_, WarningCode::BalanceSheetMismatch));
        CHECK(warnings_[0].metric == "TotalAssets");
    }
}

TEST_CASE("Implausible net margins are flagged", "[ratios][consistency]") {
    auto revenue = series_named("Revenue");
    add(revenue, 1000, make_date(2023, 12, 31), Bucket::Annual, 2023, 4);

    auto net_income = series_named("NetIncome");
    add(net_income, -700, make_date(2023, 12, 31), Bucket::Annual, 2023, 4);

    std::vector<Warning> warnings;
    auto metrics = RatioCalculator(RatioSettings()).calculate({revenue, net_income}, warnings);

    REQUIRE(find_metric(metrics, "NetMargin"));
    CHECK(find_metric(metrics, "NetMargin")->value == Approx(-70.0));
    REQUIRE(has_code(warnings, WarningCode::MarginOutOfRange));

    RatioSettings loose;
    loose.net_margin_limit_pct = 80.0;
    warnings.clear();
    RatioCalculator(loose).calculate({revenue, net_income}, warnings);
    CHECK(warnings.empty());
}
