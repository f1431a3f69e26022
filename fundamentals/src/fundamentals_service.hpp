#pragma once

#include "config.hpp"
#include "types.hpp"
#include "errors.hpp"
#include "fact_store.hpp"
#include "report_assembler.hpp"
#include "cancellation.hpp"
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct BatchFailure {
    std::string ticker;
    ErrorKind kind = ErrorKind::UpstreamUnavailable;
    std::string message;
};

struct BatchResult {
    std::vector<FundamentalsReport> reports; // input order
    std::vector<BatchFailure> failures;
    std::vector<std::string> cancelled;

    nlohmann::json to_json() const;
};

class FundamentalsService {
public:
    using Clock = std::function<Date()>;

    FundamentalsService(const Config& config, FactStore& store, Clock clock = Clock());

    // Throws FundamentalsError(UnknownTicker) for unresolvable tickers and
    // Cancelled when `cancel` fires. Upstream failures yield a degraded report.
    FundamentalsReport get_fundamentals(const std::string& ticker,
                                        const CancellationToken& cancel = CancellationToken());

    QualityReport get_quality_report(const std::string& ticker);
    std::vector<Warning> list_data_quality_warnings(const std::string& ticker);

    // Runs tickers on at most `worker_threads` threads. Cancellation stops new
    // tickers from starting; finished reports are kept.
    BatchResult refresh_batch(const std::vector<std::string>& tickers, const CancellationToken& cancel);

    void invalidate(const std::string& ticker);

private:
    const Config& config_;
    FactStore& store_;
    ReportAssembler assembler_;
    Clock clock_;
};
