#pragma once
#include <string>
#include <vector>
#include <chrono>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);
bool get_env_bool(const std::string& name, bool default_value);

// String utilities
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);
std::string prefix_of(const std::string& str, size_t length);

// Time utilities
std::string current_iso8601();
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string);

// Random utilities
std::string generate_uuid();

// Math utilities
double clamp_percent(double value);

} // namespace util
