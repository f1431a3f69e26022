#pragma once

#include "types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

struct MetricDefinition {
    std::string name;
    PeriodType period_type = PeriodType::Duration;
    bool core = false;
    std::vector<std::string> aliases; // priority order
    std::vector<std::string> units;   // accepted units, priority order
};

struct ConceptSelection {
    MetricDefinition metric;
    std::string concept_name;
    std::string unit;
    std::vector<RawFact> facts;
    int quarterly_coverage = 0;

    bool available() const { return !facts.empty(); }
};

// Maps logical metrics onto the XBRL concept a company actually reports.
class ConceptSelector {
public:
    ConceptSelector();
    explicit ConceptSelector(std::vector<MetricDefinition> metrics);

    static const std::vector<MetricDefinition>& default_metrics();
    static std::vector<std::string> core_metric_names();

    const std::vector<MetricDefinition>& metrics() const { return metrics_; }

    // One selection per tracked metric, in table order. Metrics without data
    // come back with available() == false.
    std::vector<ConceptSelection> select_all(const std::vector<RawFact>& facts) const;

    ConceptSelection select(const MetricDefinition& metric, const std::vector<RawFact>& facts) const;

private:
    using FactIndex = std::unordered_map<std::string, std::vector<const RawFact*>>;

    static FactIndex build_index(const std::vector<RawFact>& facts);
    static ConceptSelection select_indexed(const MetricDefinition& metric, const FactIndex& index);

    std::vector<MetricDefinition> metrics_;
};
