#include "concept_selector.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <set>

namespace {

struct Candidate {
    size_t priority = 0;
    std::string concept_name;
    std::string unit;
    std::vector<const RawFact*> facts;
    int coverage = 0;
    Date latest_filed;
    Date earliest_end;
};

int quarterly_coverage(const std::vector<const RawFact*>& facts, PeriodType period_type) {
    std::set<Date> ends;
    for (const auto* fact : facts) {
        if (period_type == PeriodType::Instant || util::is_quarterly_form(fact->form_type)) {
            ends.insert(fact->period_end);
        }
    }
    return static_cast<int>(ends.size());
}

// Coverage, then most recent filing, then longest history, then alias order
bool better(const Candidate& a, const Candidate& b) {
    if (a.coverage != b.coverage) return a.coverage > b.coverage;
    if (a.latest_filed != b.latest_filed) return a.latest_filed > b.latest_filed;
    if (a.earliest_end != b.earliest_end) return a.earliest_end < b.earliest_end;
    return a.priority < b.priority;
}

} // namespace

ConceptSelector::ConceptSelector()
    : metrics_(default_metrics()) {
}

ConceptSelector::ConceptSelector(std::vector<MetricDefinition> metrics)
    : metrics_(std::move(metrics)) {
}

const std::vector<MetricDefinition>& ConceptSelector::default_metrics() {
    static const std::vector<MetricDefinition> metrics = {
        {"Revenue", PeriodType::Duration, true,
         {"Revenues",
          "RevenueFromContractWithCustomerExcludingAssessedTax",
          "RevenueFromContractWithCustomerIncludingAssessedTax",
          "SalesRevenueNet",
          "SalesRevenueGoodsNet",
          "SalesRevenueServicesNet"},
         {"USD"}},
        {"NetIncome", PeriodType::Duration, true,
         {"NetIncomeLoss",
          "ProfitLoss",
          "NetIncomeLossAvailableToCommonStockholdersBasic",
          "NetIncomeLossAttributableToParent"},
         {"USD"}},
        {"TotalAssets", PeriodType::Instant, true,
         {"Assets"},
         {"USD"}},
        {"StockholdersEquity", PeriodType::Instant, true,
         {"StockholdersEquity",
          "StockholdersEquityIncludingPortionAttributableToNoncontrollingInterest"},
         {"USD"}},
        {"CostOfRevenue", PeriodType::Duration, false,
         {"CostOfRevenue", "CostOfGoodsAndServicesSold", "CostOfGoodsSold"},
         {"USD"}},
        {"OperatingIncome", PeriodType::Duration, false,
         {"OperatingIncomeLoss"},
         {"USD"}},
        {"EPS", PeriodType::Duration, false,
         {"EarningsPerShareBasic", "EarningsPerShareDiluted"},
         {"USD/shares"}},
        {"OperatingCashFlow", PeriodType::Duration, false,
         {"NetCashProvidedByUsedInOperatingActivities", "NetCashProvidedByOperatingActivities"},
         {"USD"}},
        {"CapitalExpenditures", PeriodType::Duration, false,
         {"PaymentsToAcquirePropertyPlantAndEquipment", "CapitalExpenditures"},
         {"USD"}},
        {"TotalLiabilities", PeriodType::Instant, false,
         {"Liabilities"},
         {"USD"}},
        {"Cash", PeriodType::Instant, false,
         {"CashAndCashEquivalentsAtCarryingValue", "Cash"},
         {"USD"}},
    };
    return metrics;
}

std::vector<std::string> ConceptSelector::core_metric_names() {
    std::vector<std::string> names;
    for (const auto& metric : default_metrics()) {
        if (metric.core) {
            names.push_back(metric.name);
        }
    }
    return names;
}

std::vector<ConceptSelection> ConceptSelector::select_all(const std::vector<RawFact>& facts) const {
    auto index = build_index(facts);

    std::vector<ConceptSelection> selections;
    selections.reserve(metrics_.size());
    for (const auto& metric : metrics_) {
        selections.push_back(select_indexed(metric, index));
    }
    return selections;
}

ConceptSelection ConceptSelector::select(const MetricDefinition& metric, const std::vector<RawFact>& facts) const {
    return select_indexed(metric, build_index(facts));
}

ConceptSelector::FactIndex ConceptSelector::build_index(const std::vector<RawFact>& facts) {
    FactIndex index;
    for (const auto& fact : facts) {
        index[fact.concept_name].push_back(&fact);
    }
    return index;
}

ConceptSelection ConceptSelector::select_indexed(const MetricDefinition& metric, const FactIndex& index) {
    std::vector<Candidate> candidates;

    for (size_t alias_index = 0; alias_index < metric.aliases.size(); ++alias_index) {
        const auto& alias = metric.aliases[alias_index];
        auto it = index.find(alias);
        if (it == index.end()) {
            continue;
        }

        for (size_t unit_index = 0; unit_index < metric.units.size(); ++unit_index) {
            Candidate candidate;
            candidate.priority = alias_index * metric.units.size() + unit_index;
            candidate.concept_name = alias;
            candidate.unit = metric.units[unit_index];

            for (const auto* fact : it->second) {
                if (fact->unit == candidate.unit) {
                    candidate.facts.push_back(fact);
                }
            }
            if (candidate.facts.empty()) {
                continue;
            }

            candidate.coverage = quarterly_coverage(candidate.facts, metric.period_type);
            candidate.latest_filed = candidate.facts.front()->filed_date;
            candidate.earliest_end = candidate.facts.front()->period_end;
            for (const auto* fact : candidate.facts) {
                if (fact->filed_date > candidate.latest_filed) candidate.latest_filed = fact->filed_date;
                if (fact->period_end < candidate.earliest_end) candidate.earliest_end = fact->period_end;
            }
            candidates.push_back(std::move(candidate));
        }
    }

    ConceptSelection selection;
    selection.metric = metric;

    if (candidates.empty()) {
        spdlog::debug("No reported concept for metric {}", metric.name);
        return selection;
    }

    const Candidate* best = &candidates.front();
    for (const auto& candidate : candidates) {
        if (better(candidate, *best)) {
            best = &candidate;
        }
    }

    selection.concept_name = best->concept_name;
    selection.unit = best->unit;
    selection.quarterly_coverage = best->coverage;
    selection.facts.reserve(best->facts.size());
    for (const auto* fact : best->facts) {
        selection.facts.push_back(*fact);
    }

    spdlog::debug("Metric {} -> {} [{}] ({} facts, {} quarterly periods, {} candidates)",
                  metric.name, selection.concept_name, selection.unit,
                  selection.facts.size(), selection.quarterly_coverage, candidates.size());
    return selection;
}
