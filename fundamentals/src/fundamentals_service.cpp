#include "fundamentals_service.hpp"
#include "ticker_directory.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <optional>
#include <thread>

nlohmann::json BatchResult::to_json() const {
    nlohmann::json reports_json = nlohmann::json::array();
    for (const auto& report : reports) {
        reports_json.push_back(report.to_json());
    }
    nlohmann::json failures_json = nlohmann::json::array();
    for (const auto& failure : failures) {
        failures_json.push_back({
            {"ticker", failure.ticker},
            {"kind", to_string(failure.kind)},
            {"message", failure.message}
        });
    }
    return {
        {"reports", reports_json},
        {"failures", failures_json},
        {"cancelled", cancelled}
    };
}

FundamentalsService::FundamentalsService(const Config& config, FactStore& store, Clock clock)
    : config_(config),
      store_(store),
      assembler_(config),
      clock_(clock ? std::move(clock) : Clock(util::today_utc)) {
}

FundamentalsReport FundamentalsService::get_fundamentals(const std::string& ticker, const CancellationToken& cancel) {
    RawFactSet facts;
    try {
        facts = store_.get(ticker, cancel);
    } catch (const FundamentalsError& e) {
        if (e.kind() == ErrorKind::UnknownTicker || e.kind() == ErrorKind::Cancelled) {
            throw;
        }
        spdlog::error("Returning degraded report for {}: {} ({})", ticker, e.what(), to_string(e.kind()));
        return ReportAssembler::degraded(TickerDirectory::normalize(ticker), e.what(), clock_());
    }

    return assembler_.assemble(facts, clock_());
}

QualityReport FundamentalsService::get_quality_report(const std::string& ticker) {
    return get_fundamentals(ticker).quality;
}

std::vector<Warning> FundamentalsService::list_data_quality_warnings(const std::string& ticker) {
    return get_fundamentals(ticker).warnings;
}

BatchResult FundamentalsService::refresh_batch(const std::vector<std::string>& tickers, const CancellationToken& cancel) {
    enum class Status { Pending, Done, Failed, Cancelled };
    struct Slot {
        Status status = Status::Pending;
        std::optional<FundamentalsReport> report;
        BatchFailure failure;
    };

    auto start_time = std::chrono::steady_clock::now();
    std::vector<Slot> slots(tickers.size());
    std::atomic<size_t> next_index{0};

    auto worker = [&]() {
        while (!cancel.is_cancelled()) {
            size_t index = next_index.fetch_add(1);
            if (index >= tickers.size()) {
                break;
            }

            auto& slot = slots[index];
            const auto& ticker = tickers[index];
            try {
                slot.report = get_fundamentals(ticker, cancel);
                slot.status = Status::Done;
            } catch (const FundamentalsError& e) {
                if (e.kind() == ErrorKind::Cancelled) {
                    slot.status = Status::Cancelled;
                } else {
                    spdlog::warn("Batch refresh of {} failed: {}", ticker, e.what());
                    slot.status = Status::Failed;
                    slot.failure = {ticker, e.kind(), e.what()};
                }
            } catch (const std::exception& e) {
                spdlog::error("Unexpected error refreshing {}: {}", ticker, e.what());
                slot.status = Status::Failed;
                slot.failure = {ticker, ErrorKind::UpstreamUnavailable, e.what()};
            }
        }
    };

    size_t thread_count = std::min(static_cast<size_t>(config_.worker_threads), tickers.size());
    spdlog::info("Refreshing {} tickers on {} workers", tickers.size(), thread_count);

    std::vector<std::thread> workers;
    workers.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }

    BatchResult result;
    for (size_t i = 0; i < slots.size(); ++i) {
        switch (slots[i].status) {
            case Status::Done: result.reports.push_back(std::move(*slots[i].report)); break;
            case Status::Failed: result.failures.push_back(std::move(slots[i].failure)); break;
            case Status::Pending:
            case Status::Cancelled: result.cancelled.push_back(tickers[i]); break;
        }
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    spdlog::info("Batch refresh finished in {} ms: {} reports, {} failures, {} cancelled",
                 duration, result.reports.size(), result.failures.size(), result.cancelled.size());
    return result;
}

void FundamentalsService::invalidate(const std::string& ticker) {
    store_.invalidate(ticker);
}
