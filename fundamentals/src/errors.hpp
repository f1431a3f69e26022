#pragma once
#include <stdexcept>
#include <string>
#include <chrono>

enum class ErrorKind {
    UnknownTicker,
    UpstreamUnavailable,
    RateLimited,
    MalformedPayload,
    NoUsableData,
    Cancelled
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownTicker: return "UnknownTicker";
        case ErrorKind::UpstreamUnavailable: return "UpstreamUnavailable";
        case ErrorKind::RateLimited: return "RateLimited";
        case ErrorKind::MalformedPayload: return "MalformedPayload";
        case ErrorKind::NoUsableData: return "NoUsableData";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

class FundamentalsError : public std::runtime_error {
public:
    FundamentalsError(ErrorKind kind, const std::string& message,
                      bool retryable = false,
                      std::chrono::milliseconds retry_after = std::chrono::milliseconds(0))
        : std::runtime_error(message),
          kind_(kind),
          retryable_(retryable),
          retry_after_(retry_after) {}

    ErrorKind kind() const { return kind_; }
    bool retryable() const { return retryable_; }

    // Server-requested wait before the next attempt (RateLimited only)
    std::chrono::milliseconds retry_after() const { return retry_after_; }

    static FundamentalsError unknown_ticker(const std::string& ticker) {
        return FundamentalsError(ErrorKind::UnknownTicker, "Ticker " + ticker + " not found in SEC database");
    }

    static FundamentalsError upstream(const std::string& message, bool retryable = true) {
        return FundamentalsError(ErrorKind::UpstreamUnavailable, message, retryable);
    }

    static FundamentalsError rate_limited(const std::string& message, std::chrono::milliseconds retry_after) {
        return FundamentalsError(ErrorKind::RateLimited, message, true, retry_after);
    }

    static FundamentalsError malformed(const std::string& message) {
        return FundamentalsError(ErrorKind::MalformedPayload, message);
    }

    static FundamentalsError cancelled(const std::string& what) {
        return FundamentalsError(ErrorKind::Cancelled, what + " cancelled");
    }

private:
    ErrorKind kind_;
    bool retryable_;
    std::chrono::milliseconds retry_after_;
};
