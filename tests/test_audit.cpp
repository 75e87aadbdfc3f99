#include <catch2/catch_test_macros.hpp>
#include "kvlimit/audit.hpp"
#include "kvlimit/logging.hpp"
#include <spdlog/spdlog.h>

using namespace kvlimit;

TEST_CASE("DecisionEvent serializes to JSON", "[audit]")
{
    auto event = DecisionEvent::create(from_unix_seconds(1710528366), "check", "ratelimit/10.0.0.1", "deny",
                                       nlohmann::json{{"retry_after_seconds", 3}});
    auto j = event.to_json();
    REQUIRE(j["ts"] == "2024-03-15T18:46:06Z");
    REQUIRE(j["action"] == "check");
    REQUIRE(j["key"] == "ratelimit/10.0.0.1");
    REQUIRE(j["result"] == "deny");
    REQUIRE(j["details"]["retry_after_seconds"] == 3);
}

TEST_CASE("Logger level can be set by name", "[audit][logging]")
{
    REQUIRE(logging::set_level("debug").has_value());
    REQUIRE(logging::logger()->level() == spdlog::level::debug);

    REQUIRE(logging::set_level("off").has_value());
    REQUIRE(logging::logger()->level() == spdlog::level::off);

    auto bad = logging::set_level("verbose");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == ErrorCode::ConfigError);

    REQUIRE(logging::set_level("info").has_value());
}
