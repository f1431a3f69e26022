#include "ratio_calculator.hpp"
#include "growth_calculator.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cmath>
#include <optional>
#include <string>
#include <utility>

namespace {

const ConceptSeries* find_series(const std::vector<ConceptSeries>& series, const std::string& metric) {
    for (const auto& s : series) {
        if (s.metric == metric && !s.empty()) {
            return &s;
        }
    }
    return nullptr;
}

using FactPair = std::pair<const ClassifiedFact*, const ClassifiedFact*>;

// Latest period both series report in the same bucket. Ties on the period end
// prefer the quarterly bucket, then annual.
std::optional<FactPair> latest_aligned(const ConceptSeries* a, const ConceptSeries* b) {
    if (!a || !b) {
        return std::nullopt;
    }

    std::optional<FactPair> best;
    for (auto bucket : {Bucket::Quarterly, Bucket::Annual, Bucket::Ytd}) {
        for (const auto& lhs : a->bucket(bucket)) {
            const ClassifiedFact* match = nullptr;
            for (const auto& rhs : b->bucket(bucket)) {
                if (rhs.fact.period_end == lhs.fact.period_end) {
                    match = &rhs;
                    break;
                }
            }
            if (match) {
                if (!best || lhs.fact.period_end > best->first->fact.period_end) {
                    best = FactPair{&lhs, match};
                }
                break;
            }
        }
    }
    return best;
}

const ClassifiedFact* balance_at(const ConceptSeries* series, const Date& date) {
    if (!series) {
        return nullptr;
    }
    for (const auto& fact : series->point_in_time) {
        if (fact.fact.period_end == date) {
            return &fact;
        }
    }
    return nullptr;
}

DerivedMetric make_metric(const std::string& name, double value, const std::string& unit,
                          const ClassifiedFact& basis) {
    DerivedMetric metric;
    metric.name = name;
    metric.value = value;
    metric.unit = unit;
    metric.period = GrowthCalculator::period_label(basis);
    metric.period_end = basis.fact.period_end;
    metric.basis = basis.bucket;
    return metric;
}

} // namespace

RatioCalculator::RatioCalculator(const RatioSettings& settings)
    : settings_(settings) {
}

std::vector<DerivedMetric> RatioCalculator::calculate(const std::vector<ConceptSeries>& series,
                                                      std::vector<Warning>& warnings) const {
    std::vector<DerivedMetric> out;

    const auto* revenue = find_series(series, "Revenue");
    const auto* cost = find_series(series, "CostOfRevenue");
    const auto* operating = find_series(series, "OperatingIncome");
    const auto* net_income = find_series(series, "NetIncome");
    const auto* cash_flow = find_series(series, "OperatingCashFlow");
    const auto* capex = find_series(series, "CapitalExpenditures");
    const auto* assets = find_series(series, "TotalAssets");
    const auto* liabilities = find_series(series, "TotalLiabilities");
    const auto* equity = find_series(series, "StockholdersEquity");

    if (auto pair = latest_aligned(revenue, cost)) {
        double sales = pair->first->fact.value;
        double gross_profit = sales - pair->second->fact.value;
        out.push_back(make_metric("GrossProfit", gross_profit, revenue->unit, *pair->first));
        if (sales != 0.0) {
            out.push_back(make_metric("GrossMargin", gross_profit / sales * 100.0, "percent", *pair->first));
        }
    }

    if (auto pair = latest_aligned(revenue, operating)) {
        if (pair->first->fact.value != 0.0) {
            out.push_back(make_metric("OperatingMargin",
                                      pair->second->fact.value / pair->first->fact.value * 100.0,
                                      "percent", *pair->first));
        }
    }

    if (auto pair = latest_aligned(revenue, net_income)) {
        if (pair->first->fact.value != 0.0) {
            auto margin = make_metric("NetMargin", pair->second->fact.value / pair->first->fact.value * 100.0,
                                      "percent", *pair->first);
            if (std::abs(margin.value) >= settings_.net_margin_limit_pct) {
                warnings.push_back({WarningCode::MarginOutOfRange, "NetIncome",
                                    fmt::format("Net margin of {:.1f}% for {} is outside +/-{:.0f}%",
                                                margin.value, margin.period, settings_.net_margin_limit_pct)});
            }
            out.push_back(std::move(margin));
        }
    }

    if (auto pair = latest_aligned(cash_flow, capex)) {
        out.push_back(make_metric("FreeCashFlow", pair->first->fact.value - std::abs(pair->second->fact.value),
                                  cash_flow->unit, *pair->first));
    }

    // Returns use a full fiscal year when one lines up with a balance,
    // otherwise the latest quarter annualized
    auto add_return = [&](const std::string& name, const ConceptSeries* balances) {
        if (!net_income || !balances) {
            return;
        }
        for (auto bucket : {Bucket::Annual, Bucket::Quarterly}) {
            for (const auto& income : net_income->bucket(bucket)) {
                const auto* balance = balance_at(balances, income.fact.period_end);
                if (!balance) {
                    continue;
                }
                if (balance->fact.value == 0.0) {
                    return;
                }
                double factor = bucket == Bucket::Quarterly ? 4.0 : 1.0;
                auto metric = make_metric(name, income.fact.value * factor / balance->fact.value * 100.0,
                                          "percent", income);
                metric.annualized = bucket == Bucket::Quarterly;
                out.push_back(std::move(metric));
                return;
            }
        }
    };
    add_return("ReturnOnEquity", equity);
    add_return("ReturnOnAssets", assets);

    if (liabilities && equity) {
        for (const auto& owed : liabilities->point_in_time) {
            const auto* capital = balance_at(equity, owed.fact.period_end);
            if (capital) {
                if (capital->fact.value != 0.0) {
                    out.push_back(make_metric("DebtToEquity", owed.fact.value / capital->fact.value, "ratio", owed));
                }
                break;
            }
        }
    }

    // Balance sheet identity on the latest date all three balances share
    if (assets && liabilities && equity) {
        for (const auto& total : assets->point_in_time) {
            const auto* owed = balance_at(liabilities, total.fact.period_end);
            const auto* capital = balance_at(equity, total.fact.period_end);
            if (!owed || !capital) {
                continue;
            }
            if (total.fact.value != 0.0) {
                double gap = std::abs(total.fact.value - (owed->fact.value + capital->fact.value)) /
                             std::abs(total.fact.value);
                if (gap >= settings_.balance_sheet_tolerance) {
                    warnings.push_back({WarningCode::BalanceSheetMismatch, "TotalAssets",
                                        fmt::format("Assets differ from liabilities plus equity by {:.1f}% on {}",
                                                    gap * 100.0, total.fact.period_end.to_string())});
                }
            }
            break;
        }
    }

    spdlog::debug("Computed {} derived metrics", out.size());
    return out;
}
