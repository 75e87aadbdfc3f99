#include <catch2/catch_test_macros.hpp>
#include "kvlimit/types.hpp"

using namespace kvlimit;

TEST_CASE("Millisecond clocks are truncated to whole seconds", "[types]")
{
    REQUIRE(from_unix_millis(1710528366999) == from_unix_seconds(1710528366));
    REQUIRE(from_unix_millis(1710528366000) == from_unix_seconds(1710528366));
    REQUIRE(from_unix_millis(999) == from_unix_seconds(0));
    REQUIRE(to_unix_seconds(from_unix_millis(1500)) == 1);
}

TEST_CASE("Error codes have stable names", "[types]")
{
    REQUIRE(error_code_name(ErrorCode::ConfigError) == "ConfigError");
    REQUIRE(error_code_name(ErrorCode::StorageError) == "StorageError");
    REQUIRE(error_code_name(ErrorCode::DecodeError) == "DecodeError");
    REQUIRE(error_code_name(ErrorCode::TicketRedeemed) == "TicketRedeemed");
    REQUIRE(error_code_name(ErrorCode::InvalidInput) == "InvalidInput");
    REQUIRE(error_code_name(ErrorCode::IOError) == "IOError");
    REQUIRE(error_code_name(ErrorCode::ParsingError) == "ParsingError");

    auto err = KvLimitError::io("disk gone");
    REQUIRE(err.code == ErrorCode::IOError);
    REQUIRE(std::string(err.what()) == "disk gone");
    REQUIRE(KvLimitError::parsing("bad").code == ErrorCode::ParsingError);
}
