#include "util.hpp"
#include "types.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <stdexcept>
#include <sstream>
#include <algorithm>
#include <random>
#include <iomanip>
#include <cctype>
#include <ctime>

namespace util {

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

int get_env_int(const std::string& name, int default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value || std::string(value).empty()) {
        return default_value;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Environment variable " + name + " is not an integer: " + value);
    }
}

double get_env_double(const std::string& name, double default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value || std::string(value).empty()) {
        return default_value;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Environment variable " + name + " is not a number: " + value);
    }
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_upper(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch() % std::chrono::seconds(1)).count();

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return ss.str();
}

std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string) {
    std::tm tm = {};
    std::istringstream ss(iso_string);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

    if (ss.fail()) {
        throw std::runtime_error("Failed to parse ISO8601 timestamp: " + iso_string);
    }

    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

Date today_utc() {
    return Date::from_time_point(std::chrono::system_clock::now());
}

long days_between(const Date& from, const Date& to) {
    return to.days_since_epoch() - from.days_since_epoch();
}

int months_between(const Date& from, const Date& to) {
    long days = days_between(from, to);
    if (days <= 0) return 0;
    return static_cast<int>(days / 30);
}

int effective_month(const Date& date, int rollback_days) {
    if (date.day <= rollback_days) {
        return date.month == 1 ? 12 : date.month - 1;
    }
    return date.month;
}

int effective_year(const Date& date, int rollback_days) {
    if (date.day <= rollback_days && date.month == 1) {
        return date.year - 1;
    }
    return date.year;
}

bool is_annual_form(const std::string& form_type) {
    return form_type == "10-K" || form_type == "10-K/A" ||
           form_type == "20-F" || form_type == "20-F/A" ||
           form_type == "40-F" || form_type == "40-F/A" ||
           form_type == "10-KT" || form_type == "10-KT/A";
}

bool is_quarterly_form(const std::string& form_type) {
    return form_type == "10-Q" || form_type == "10-Q/A";
}

double random_jitter(double base_value, double jitter_factor) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<> dis(-jitter_factor, jitter_factor);

    double jitter = dis(gen);
    return base_value * (1.0 + jitter);
}

void init_stderr_logging() {
    auto logger = spdlog::get("stderr");
    if (!logger) {
        logger = spdlog::stderr_color_mt("stderr");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
}

bool is_network_error(int http_status) {
    return http_status == 0 ||   // Connection failed
           http_status == 408 || // Request timeout
           http_status == 429 || // Too many requests
           http_status == 502 || // Bad gateway
           http_status == 503 || // Service unavailable
           http_status == 504;   // Gateway timeout
}

bool is_retryable_status(int http_status) {
    return is_network_error(http_status) ||
           (http_status >= 500 && http_status < 600);
}

} // namespace util
