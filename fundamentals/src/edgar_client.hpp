#pragma once

#include "config.hpp"
#include "facts_client.hpp"
#include <memory>
#include <string>

// FactsClient backed by the SEC EDGAR JSON APIs
class EdgarClient : public FactsClient {
public:
    explicit EdgarClient(const Config& config);
    ~EdgarClient() override;

    nlohmann::json fetch_ticker_table(const CancellationToken& cancel) override;
    nlohmann::json fetch_company_facts(const std::string& cik, const CancellationToken& cancel) override;
    std::string endpoint_name() const override { return "sec.gov"; }

    // Non-copyable
    EdgarClient(const EdgarClient&) = delete;
    EdgarClient& operator=(const EdgarClient&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
