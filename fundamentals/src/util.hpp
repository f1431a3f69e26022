#pragma once
#include <string>
#include <vector>
#include <chrono>

struct Date;

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);
double get_env_double(const std::string& name, double default_value);

// String utilities
std::string trim(const std::string& str);
std::string to_upper(const std::string& str);

// Time utilities
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string);
Date today_utc();

// Calendar arithmetic on report dates
long days_between(const Date& from, const Date& to);
int months_between(const Date& from, const Date& to); // 30-day months, floored

// Month a period end is attributed to. Ends within the first `rollback_days`
// of a month belong to the preceding month (52/53-week fiscal calendars).
int effective_month(const Date& date, int rollback_days);
int effective_year(const Date& date, int rollback_days);

// Filing form classification
bool is_annual_form(const std::string& form_type);    // 10-K, 10-K/A, 20-F, 40-F, 10-KT
bool is_quarterly_form(const std::string& form_type); // 10-Q, 10-Q/A

// Routes the default spdlog logger to stderr with the service pattern.
// Safe to call more than once.
void init_stderr_logging();

// Random utilities
double random_jitter(double base_value, double jitter_factor = 0.1);

// Network utilities
bool is_network_error(int http_status);
bool is_retryable_status(int http_status);

} // namespace util
