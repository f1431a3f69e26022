#include "report_assembler.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>

ReportAssembler::ReportAssembler(const Config& config)
    : ReportAssembler(config.classifier, config.growth, config.quality, config.ratios) {
}

ReportAssembler::ReportAssembler(const ClassifierSettings& classifier,
                                 const GrowthSettings& growth,
                                 const QualitySettings& quality,
                                 const RatioSettings& ratios)
    : classifier_(classifier), growth_(growth), ratios_(ratios), scorer_(quality) {
}

FundamentalsReport ReportAssembler::assemble(const RawFactSet& facts, const Date& as_of) const {
    FundamentalsReport report;
    report.ticker = facts.ticker;
    report.cik = facts.cik;
    report.company_name = facts.entity_name;
    report.generated_at = as_of;

    if (facts.dropped_count > 0) {
        report.warnings.push_back({WarningCode::MalformedFactsDropped, "",
                                   fmt::format("{} malformed facts were dropped during ingestion",
                                               facts.dropped_count)});
    }

    for (const auto& selection : selector_.select_all(facts.facts)) {
        if (!selection.available()) {
            report.unavailable_metrics.push_back(selection.metric.name);
            report.warnings.push_back({WarningCode::MetricUnavailable, selection.metric.name,
                                       "No reported concept for " + selection.metric.name});
            continue;
        }

        auto series = classifier_.classify(selection);
        report.warnings.insert(report.warnings.end(), series.warnings.begin(), series.warnings.end());

        for (auto& growth : growth_.calculate(series)) {
            if (growth.flagged) {
                report.warnings.push_back({WarningCode::GrowthFlagged, growth.metric_name,
                                           fmt::format("{} {} growth of {:.1f}% ({} vs {})",
                                                       growth.metric_name,
                                                       growth.comparison == Comparison::YoY ? "YoY" : "QoQ",
                                                       growth.growth_pct, growth.current_period,
                                                       growth.previous_period)});
            }
            report.growth.push_back(std::move(growth));
        }

        report.series.push_back(std::move(series));
    }

    report.derived_metrics = ratios_.calculate(report.series, report.warnings);

    if (report.series.empty()) {
        report.warnings.push_back({WarningCode::NoUsableData, "",
                                   "No tracked metric has usable data for " + facts.ticker});
    }

    report.quality = scorer_.score(report.ticker, report.company_name, report.series, as_of, report.warnings);

    spdlog::info("Assembled report for {}: {} series, {} unavailable, {} derived, grade {} ({:.1f}), {} warnings",
                 report.ticker, report.series.size(), report.unavailable_metrics.size(),
                 report.derived_metrics.size(),
                 report.quality.grade, report.quality.overall_score, report.warnings.size());
    return report;
}

FundamentalsReport ReportAssembler::degraded(const std::string& ticker, const std::string& reason, const Date& as_of) {
    FundamentalsReport report;
    report.ticker = ticker;
    report.degraded = true;
    report.generated_at = as_of;
    report.warnings.push_back({WarningCode::UpstreamUnavailable, "", reason});

    report.quality.ticker = ticker;
    report.quality.grade = "F";
    report.quality.core_metrics_tracked = static_cast<int>(ConceptSelector::core_metric_names().size());
    return report;
}
