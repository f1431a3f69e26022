#include "edgar_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

class EdgarClient::Impl {
public:
    explicit Impl(const Config& config) : config_(config) {
        spdlog::info("EDGAR client initialized (timeout {} ms)", config_.http_timeout_ms);
    }

    nlohmann::json fetch_ticker_table(const CancellationToken& cancel) {
        return get_json(config_.sec_tickers_url, cancel, false);
    }

    nlohmann::json fetch_company_facts(const std::string& cik, const CancellationToken& cancel) {
        auto url = config_.sec_facts_url + "/CIK" + cik + ".json";
        return get_json(url, cancel, true);
    }

private:
    nlohmann::json get_json(const std::string& url, const CancellationToken& cancel, bool missing_is_empty) {
        spdlog::debug("GET {}", url);

        auto response = cpr::Get(
            cpr::Url{url},
            cpr::Timeout{config_.http_timeout_ms},
            cpr::Header{{"User-Agent", config_.sec_user_agent}, {"Accept", "application/json"}},
            cpr::ProgressCallback{[&cancel](auto&&...) { return !cancel.is_cancelled(); }}
        );

        if (cancel.is_cancelled()) {
            throw FundamentalsError::cancelled("GET " + url);
        }

        if (response.error) {
            throw FundamentalsError::upstream("Request to " + url + " failed: " + response.error.message);
        }

        if (response.status_code == 404 && missing_is_empty) {
            // Registrant without XBRL financial data
            spdlog::warn("No company facts published at {}", url);
            return nlohmann::json{{"facts", nlohmann::json::object()}};
        }

        if (response.status_code == 429) {
            throw FundamentalsError::rate_limited("Rate limited by " + url, parse_retry_after(response));
        }

        if (response.status_code != 200) {
            bool retryable = util::is_retryable_status(static_cast<int>(response.status_code));
            throw FundamentalsError::upstream(
                "Unexpected status " + std::to_string(response.status_code) + " from " + url, retryable);
        }

        try {
            return nlohmann::json::parse(response.text);
        } catch (const nlohmann::json::parse_error& e) {
            throw FundamentalsError::malformed("Invalid JSON from " + url + ": " + e.what());
        }
    }

    static std::chrono::milliseconds parse_retry_after(const cpr::Response& response) {
        auto it = response.header.find("Retry-After");
        if (it != response.header.end()) {
            try {
                return std::chrono::seconds(std::stoi(it->second));
            } catch (const std::exception&) {
                spdlog::debug("Ignoring non-numeric Retry-After header '{}'", it->second);
            }
        }
        return std::chrono::seconds(1);
    }

    Config config_;
};

// Public interface implementation
EdgarClient::EdgarClient(const Config& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

EdgarClient::~EdgarClient() = default;

nlohmann::json EdgarClient::fetch_ticker_table(const CancellationToken& cancel) {
    return pImpl_->fetch_ticker_table(cancel);
}

nlohmann::json EdgarClient::fetch_company_facts(const std::string& cik, const CancellationToken& cancel) {
    return pImpl_->fetch_company_facts(cik, cancel);
}
