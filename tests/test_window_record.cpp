#include <catch2/catch_test_macros.hpp>
#include "kvlimit/window_record.hpp"
#include <nlohmann/json.hpp>
#include <limits>

using namespace kvlimit;
using namespace std::chrono_literals;

namespace
{
    Timestamp at(std::int64_t s) { return from_unix_seconds(s); }
}

TEST_CASE("WindowRecord keeps an ordered multiset of timestamps", "[window_record]")
{
    WindowRecord record;
    REQUIRE(record.empty());

    record.add(at(1710528364));
    record.add(at(1710528362));
    record.add(at(1710528364));

    REQUIRE(record.total() == 3);
    REQUIRE(record.timestamps() == std::vector<Timestamp>{at(1710528362), at(1710528364), at(1710528364)});
    REQUIRE(record.count_since(at(1710528363)) == 2);
    REQUIRE(record.oldest_since(at(1710528363)) == at(1710528364));
    REQUIRE_FALSE(record.oldest_since(at(1710528365)).has_value());
}

TEST_CASE("WindowRecord counts saturate", "[window_record]")
{
    WindowRecord record;
    record.add(at(10), std::numeric_limits<std::uint64_t>::max());
    record.add(at(10));
    REQUIRE(record.buckets().at(at(10)) == std::numeric_limits<std::uint64_t>::max());
}

TEST_CASE("WindowRecord prune drops entries older than the horizon", "[window_record]")
{
    WindowRecord record;
    for (std::int64_t s : {1710550611, 1710550612, 1710550613, 1710550614, 1710550615})
        record.add(at(s));

    // 43 - 30 = 13: 1710550613 is exactly 30s old and stays
    auto dropped = record.prune(at(1710550643), 30s);
    REQUIRE(dropped == 2);
    REQUIRE(record.timestamps() == std::vector<Timestamp>{at(1710550613), at(1710550614), at(1710550615)});

    SECTION("Pruning again with the same inputs changes nothing")
    {
        auto before = record;
        REQUIRE(record.prune(at(1710550643), 30s) == 0);
        REQUIRE(record == before);
    }

    SECTION("Entries later than now survive a regressed clock")
    {
        REQUIRE(record.prune(at(1710550600), 30s) == 0);
        REQUIRE(record.total() == 3);
    }
}

TEST_CASE("Window record encoding matches the stored JSON layout", "[window_record][codec]")
{
    WindowRecord record;
    record.add(at(1710528362));
    record.add(at(1710528363), 2);

    auto encoded = encode(record);
    REQUIRE(nlohmann::json::parse(encoded) == nlohmann::json{{"1710528362", 1}, {"1710528363", 2}});

    auto decoded = try_decode(encoded);
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == record);

    REQUIRE(encode(WindowRecord{}) == "{}");
    REQUIRE(decode(std::optional<std::string_view>("{}")).empty());
}

TEST_CASE("Decoding an absent value yields an empty record", "[window_record][codec]")
{
    REQUIRE(decode(std::nullopt).empty());
}

TEST_CASE("Decoding garbage fails open", "[window_record][codec]")
{
    const std::vector<std::string> garbage = {
        "",
        "not json at all",
        "\x01\x02\xff",
        "[1710528362, 1710528363]",
        "{\"abc\": 1}",
        "{\"1710528362\": -1}",
        "{\"1710528362\": \"one\"}",
        "{\"1710528362\": 1.5}",
        "{\"17105x8362\": 1}",
        "42"};

    for (const auto &raw : garbage)
    {
        INFO("raw = " << raw);
        REQUIRE_FALSE(try_decode(raw).has_value());
        REQUIRE(try_decode(raw).error().code == ErrorCode::DecodeError);
        REQUIRE_NOTHROW(decode(std::optional<std::string_view>(raw)));
        REQUIRE(decode(std::optional<std::string_view>(raw)).empty());
    }
}

TEST_CASE("Zero counts are ignored on decode", "[window_record][codec]")
{
    auto decoded = try_decode("{\"1710528362\": 0, \"1710528363\": 1}");
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->timestamps() == std::vector<Timestamp>{at(1710528363)});
}

TEST_CASE("Expanding a huge decoded count is bounded", "[window_record]")
{
    auto record = try_decode("{\"10\":2,\"20\":9223372036854775808}");
    REQUIRE(record.has_value());
    REQUIRE(record->total() == 9223372036854775810ull);

    auto first = record->timestamps(3);
    REQUIRE(first == std::vector<Timestamp>{at(10), at(10), at(20)});

    auto all = record->timestamps();
    REQUIRE(all.size() == WindowRecord::kMaxExpanded);
    REQUIRE(all.back() == at(20));
}
