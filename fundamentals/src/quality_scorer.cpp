#include "quality_scorer.hpp"
#include "concept_selector.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>

QualityScorer::QualityScorer(const QualitySettings& settings)
    : settings_(settings) {
}

QualityReport QualityScorer::score(const std::string& ticker,
                                   const std::string& company_name,
                                   const std::vector<ConceptSeries>& series,
                                   const Date& as_of,
                                   std::vector<Warning>& warnings) const {
    QualityReport report;
    report.ticker = ticker;
    report.company_name = company_name;

    const auto core = ConceptSelector::core_metric_names();
    report.core_metrics_tracked = static_cast<int>(core.size());

    auto find = [&series](const std::string& metric) -> const ConceptSeries* {
        for (const auto& s : series) {
            if (s.metric == metric && !s.empty()) {
                return &s;
            }
        }
        return nullptr;
    };

    int scale_flags = 0;
    for (const auto& metric : core) {
        const auto* s = find(metric);
        if (!s) {
            continue;
        }
        report.core_metrics_available++;
        if (s->has_warning(WarningCode::ScaleMismatch)) {
            scale_flags++;
        }

        for (auto bucket : {Bucket::Quarterly, Bucket::Annual, Bucket::Ytd, Bucket::PointInTime}) {
            const auto& entries = s->bucket(bucket);
            if (!entries.empty() &&
                (!report.latest_period || entries.front().fact.period_end > *report.latest_period)) {
                report.latest_period = entries.front().fact.period_end;
            }
        }
    }

    report.completeness_score = completeness_score(report.core_metrics_available, report.core_metrics_tracked);

    if (report.latest_period) {
        report.freshness_months = util::months_between(*report.latest_period, as_of);
        report.freshness_score = freshness_score(report.freshness_months);
        if (report.freshness_months > 12) {
            warnings.push_back({WarningCode::StaleData, "",
                                fmt::format("Latest reported period {} is {} months old",
                                            report.latest_period->to_string(), report.freshness_months)});
        }
    }

    const auto* primary = find("Revenue");
    if (!primary) {
        primary = find("NetIncome");
    }
    report.quarterly_points = primary ? static_cast<int>(primary->quarterly.size()) : 0;
    report.data_quality_score = std::max(0.0, granularity_score(report.quarterly_points) -
                                              scale_flags * settings_.scale_mismatch_penalty);

    report.overall_score = overall_score(report.completeness_score, report.freshness_score,
                                         report.data_quality_score);
    report.grade = grade_for(report.overall_score);

    spdlog::debug("Quality for {}: completeness {:.0f}, freshness {:.0f}, data quality {:.0f}, overall {:.1f} ({})",
                  ticker, report.completeness_score, report.freshness_score, report.data_quality_score,
                  report.overall_score, report.grade);
    return report;
}

double QualityScorer::completeness_score(int available, int tracked) {
    if (tracked <= 0) return 0.0;
    return static_cast<double>(available) / tracked * 100.0;
}

double QualityScorer::freshness_score(int months_old) {
    if (months_old <= 3) return 100.0;
    if (months_old <= 6) return 85.0;
    if (months_old <= 12) return 60.0;
    return 30.0;
}

double QualityScorer::granularity_score(int quarterly_points) {
    if (quarterly_points >= 8) return 100.0;
    if (quarterly_points >= 6) return 85.0;
    if (quarterly_points >= 4) return 70.0;
    if (quarterly_points >= 2) return 50.0;
    if (quarterly_points >= 1) return 30.0;
    return 0.0;
}

double QualityScorer::overall_score(double completeness, double freshness, double data_quality) {
    return completeness * 0.4 + freshness * 0.3 + data_quality * 0.3;
}

std::string QualityScorer::grade_for(double overall) {
    if (overall >= 95) return "A+";
    if (overall >= 90) return "A";
    if (overall >= 85) return "B+";
    if (overall >= 80) return "B";
    if (overall >= 75) return "C+";
    if (overall >= 70) return "C";
    if (overall >= 60) return "D";
    return "F";
}
