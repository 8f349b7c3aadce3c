#include "util.hpp"
#include <cstdlib>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <sstream>
#include <algorithm>
#include <random>
#include <iomanip>
#include <cctype>

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
        throw std::runtime_error("Invalid integer value for env var " + name + ": " + value);
    }
}

bool get_env_bool(const std::string& name, bool default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    std::string v = to_lower(trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::runtime_error("Invalid boolean value for env var " + name + ": " + value);
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.length() >= prefix.length() &&
           str.compare(0, prefix.length(), prefix) == 0;
}

std::string prefix_of(const std::string& str, size_t length) {
    return str.substr(0, std::min(length, str.size()));
}

std::string current_iso8601() {
    return format_timestamp(std::chrono::system_clock::now());
}

std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch() % std::chrono::seconds(1)).count();
    if (ms < 0) {
        ms += 1000;
        time_t -= 1;
    }

    std::tm tm = {};
    gmtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';

    return ss.str();
}

// Accepts "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH[:MM]]" and the space-separated form
// PostgreSQL emits for timestamptz columns.
std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char sep = 0;
    int consumed = 0;
    if (std::sscanf(iso_string.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                    &year, &month, &day, &sep, &hour, &minute, &second, &consumed) != 7 ||
        (sep != 'T' && sep != ' ')) {
        throw std::runtime_error("Failed to parse ISO8601 timestamp: " + iso_string);
    }

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

    size_t pos = static_cast<size_t>(consumed);
    if (pos < iso_string.size() && iso_string[pos] == '.') {
        ++pos;
        long micros = 0;
        int digits = 0;
        while (pos < iso_string.size() && std::isdigit(static_cast<unsigned char>(iso_string[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (iso_string[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        for (; digits < 6; ++digits) micros *= 10;
        tp += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::microseconds(micros));
    }

    if (pos < iso_string.size() && (iso_string[pos] == '+' || iso_string[pos] == '-')) {
        int sign = iso_string[pos] == '+' ? 1 : -1;
        int off_h = 0, off_m = 0;
        std::sscanf(iso_string.c_str() + pos + 1, "%2d:%2d", &off_h, &off_m);
        tp -= std::chrono::minutes(sign * (off_h * 60 + off_m));
    }

    return tp;
}

std::string generate_uuid() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    std::uniform_int_distribution<> dis2(8, 11);

    std::stringstream ss;
    ss << std::hex;

    for (int i = 0; i < 8; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 4; i++) ss << dis(gen);
    ss << "-4";
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-" << dis2(gen);
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 12; i++) ss << dis(gen);

    return ss.str();
}

double clamp_percent(double value) {
    return std::max(0.0, std::min(100.0, value));
}

} // namespace util
