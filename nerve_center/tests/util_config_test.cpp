#include "config.hpp"
#include "util.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <set>
#include <stdexcept>

namespace {

void TestStringHelpers() {
    assert(util::trim("  agent 7 \n") == "agent 7");
    assert(util::trim(" \t ").empty());
    assert(util::to_lower("CRITICAL") == "critical");
    assert(util::starts_with("event-threat-1", "event-"));
    assert(!util::starts_with("threat", "threat-"));
    assert(util::prefix_of("0123456789abcdef", 8) == "01234567");
    assert(util::prefix_of("abc", 8) == "abc");
}

void TestClampPercent() {
    assert(util::clamp_percent(150.0) == 100.0);
    assert(util::clamp_percent(-3.0) == 0.0);
    assert(util::clamp_percent(42.5) == 42.5);
}

void TestTimestampRoundTrip() {
    auto tp = util::parse_iso8601("2024-03-05T10:20:30.456Z");
    assert(util::format_timestamp(tp) == "2024-03-05T10:20:30.456Z");

    // PostgreSQL text form of a timestamptz in UTC
    auto pg = util::parse_iso8601("2024-03-05 10:20:30.456+00");
    assert(pg == tp);

    auto shifted = util::parse_iso8601("2024-03-05T12:20:30.456+02:00");
    assert(shifted == tp);

    bool threw = false;
    try {
        util::parse_iso8601("not a timestamp");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

void TestUuidShape() {
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        auto id = util::generate_uuid();
        assert(id.size() == 36);
        assert(id[8] == '-' && id[13] == '-' && id[14] == '4' && id[18] == '-' && id[23] == '-');
        seen.insert(id);
    }
    assert(seen.size() == 50);
}

void TestConfigFromEnv() {
    setenv("LISTEN_PORT", "9100", 1);
    setenv("DATABASE_URL", "sqlite://:memory:", 1);
    setenv("RANKING_PROMOTION_ENABLED", "yes", 1);
    setenv("METRICS_HISTORY_LIMIT", "25", 1);

    Config config = Config::from_env();
    assert(config.listen_port == 9100);
    assert(config.database_url == "sqlite://:memory:");
    assert(config.ranking_promotion_enabled);
    assert(config.metrics_history_limit == 25);
    assert(config.redis_url.empty());
    config.validate();

    unsetenv("LISTEN_PORT");
    unsetenv("DATABASE_URL");
    unsetenv("RANKING_PROMOTION_ENABLED");
    unsetenv("METRICS_HISTORY_LIMIT");
}

void TestConfigDefaults() {
    Config config = Config::from_env();
    assert(config.listen_port == 8000);
    assert(config.metrics_history_limit == 100);
    assert(!config.clean_database_on_startup);
    assert(!config.ranking_promotion_enabled);
    assert(util::starts_with(config.database_url, "postgresql://"));
}

void TestConfigRejectsBadValues() {
    setenv("LISTEN_PORT", "eighty", 1);
    bool threw = false;
    try {
        Config::from_env();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    unsetenv("LISTEN_PORT");

    Config config;
    config.listen_port = 70000;
    threw = false;
    try {
        config.validate();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    config = Config{};
    config.metrics_history_limit = 0;
    threw = false;
    try {
        config.validate();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main() {
    TestStringHelpers();
    TestClampPercent();
    TestTimestampRoundTrip();
    TestUuidShape();
    TestConfigFromEnv();
    TestConfigDefaults();
    TestConfigRejectsBadValues();

    std::cout << "nerve_center_unit_util_config: pass\n";
    return 0;
}
