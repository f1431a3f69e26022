#pragma once

#include "facts_client.hpp"
#include "errors.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

// In-memory provider. Company facts are keyed by zero-padded CIK; unknown
// CIKs return an empty document the way the SEC answers a 404.
class MockFactsClient : public FactsClient {
public:
    std::atomic<int> table_calls{0};
    std::atomic<int> facts_calls{0};

    // Delay inside fetch_company_facts, cancellation-aware
    std::chrono::milliseconds facts_delay{0};

    // Invoked with the CIK at the start of each company facts fetch
    std::function<void(const std::string&)> on_fetch;

    MockFactsClient() {
        ticker_table_ = R"({
            "0": {"cik_str": 320193, "ticker": "AAPL", "title": "Apple Inc."},
            "1": {"cik_str": 789019, "ticker": "MSFT", "title": "MICROSOFT CORP"},
            "2": {"cik_str": 1067983, "ticker": "BRK-B", "title": "BERKSHIRE HATHAWAY INC"},
            "3": {"cik_str": 1045810, "ticker": "NVDA", "title": "NVIDIA CORP"},
            "4": {"cik_str": 1018724, "ticker": "AMZN", "title": "AMAZON COM INC"}
        })"_json;
    }

    nlohmann::json fetch_ticker_table(const CancellationToken& cancel) override {
        table_calls++;
        if (cancel.is_cancelled()) {
            throw FundamentalsError::cancelled("ticker table fetch");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return ticker_table_;
    }

    nlohmann::json fetch_company_facts(const std::string& cik, const CancellationToken& cancel) override {
        facts_calls++;
        if (on_fetch) {
            on_fetch(cik);
        }
        if (!cancel.sleep_for(facts_delay)) {
            throw FundamentalsError::cancelled("company facts fetch for CIK " + cik);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (failures_remaining_ > 0 && failure_) {
            failures_remaining_--;
            throw *failure_;
        }

        auto it = documents_.find(cik);
        if (it == documents_.end()) {
            return nlohmann::json{{"facts", nlohmann::json::object()}};
        }
        return it->second;
    }

    void set_ticker_table(const nlohmann::json& table) {
        std::lock_guard<std::mutex> lock(mutex_);
        ticker_table_ = table;
    }

    void set_company_facts(const std::string& cik, const nlohmann::json& document) {
        std::lock_guard<std::mutex> lock(mutex_);
        documents_[cik] = document;
    }

    // The next `times` company facts fetches throw `error`
    void fail_next(int times, const FundamentalsError& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_remaining_ = times;
        failure_ = error;
    }

private:
    std::mutex mutex_;
    nlohmann::json ticker_table_;
    std::map<std::string, nlohmann::json> documents_;
    int failures_remaining_ = 0;
    std::optional<FundamentalsError> failure_;
};
