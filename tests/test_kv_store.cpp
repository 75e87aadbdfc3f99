#include <catch2/catch_test_macros.hpp>
#include "kvlimit/kv_store.hpp"
#include <filesystem>

using namespace kvlimit;
using namespace std::chrono_literals;

TEST_CASE("InMemoryKvStore get/put round trip", "[kv_store]") {
    InMemoryKvStore store;

    auto missing = store.get("ratelimit/a");
    REQUIRE(missing.has_value());
    REQUIRE_FALSE(missing->has_value());

    REQUIRE(store.put("ratelimit/a", "{\"1\":1}", PutOptions{}).has_value());
    auto found = store.get("ratelimit/a");
    REQUIRE(found.has_value());
    REQUIRE(found->value() == "{\"1\":1}");

    // Unconditional overwrite
    REQUIRE(store.put("ratelimit/a", "{}", PutOptions{}).has_value());
    REQUIRE(store.get("ratelimit/a")->value() == "{}");

    REQUIRE_FALSE(store.put("", "{}", PutOptions{}).has_value());
}

TEST_CASE("InMemoryKvStore expires values after their TTL", "[kv_store]") {
    Timestamp now = from_unix_seconds(1000);
    InMemoryKvStore store([&now] { return now; });

    PutOptions ttl;
    ttl.expiration_ttl = 6s;
    REQUIRE(store.put("ratelimit/a", "x", ttl).has_value());
    REQUIRE(store.put("ratelimit/b", "y", PutOptions{}).has_value());
    REQUIRE(store.size() == 2);

    now = from_unix_seconds(1005);
    REQUIRE(store.get("ratelimit/a")->has_value());

    now = from_unix_seconds(1006);
    REQUIRE_FALSE(store.get("ratelimit/a")->has_value());
    REQUIRE(store.get("ratelimit/b")->has_value());
    REQUIRE(store.size() == 1);
}

TEST_CASE("InMemoryKvStore lists live keys by prefix", "[kv_store]") {
    Timestamp now = from_unix_seconds(0);
    InMemoryKvStore store([&now] { return now; });

    PutOptions short_lived;
    short_lived.expiration_ttl = 1s;
    REQUIRE(store.put("login/10.0.0.2", "{}", PutOptions{}).has_value());
    REQUIRE(store.put("login/10.0.0.1", "{}", PutOptions{}).has_value());
    REQUIRE(store.put("login/10.0.0.3", "{}", short_lived).has_value());
    REQUIRE(store.put("loginx/10.0.0.9", "{}", PutOptions{}).has_value());
    REQUIRE(store.put("api/10.0.0.1", "{}", PutOptions{}).has_value());

    now = from_unix_seconds(5);
    auto keys = store.list("login/");
    REQUIRE(keys.has_value());
    REQUIRE(*keys == std::vector<std::string>{"login/10.0.0.1", "login/10.0.0.2"});
}

#ifdef KVLIMIT_HAVE_ROCKSDB
TEST_CASE("RocksDbKvStore persists values and honours TTLs", "[kv_store][rocksdb]") {
    auto dir = std::filesystem::temp_directory_path() / "kvlimit_rocksdb_test";
    std::filesystem::remove_all(dir);

    Timestamp now = from_unix_seconds(1000);
    StorageConfig cfg;
    cfg.rocksdb_path = dir.string();

    {
        RocksDbKvStore store(cfg, [&now] { return now; });
        PutOptions ttl;
        ttl.expiration_ttl = 10s;
        REQUIRE(store.put("ratelimit/a", "{\"1000\":1}", ttl).has_value());
        REQUIRE(store.put("ratelimit/b", "{}", PutOptions{}).has_value());
        REQUIRE(store.get("ratelimit/a")->value() == "{\"1000\":1}");
    }

    {
        RocksDbKvStore store(cfg, [&now] { return now; });
        REQUIRE(store.get("ratelimit/a")->value() == "{\"1000\":1}");

        now = from_unix_seconds(1010);
        REQUIRE_FALSE(store.get("ratelimit/a")->has_value());
        REQUIRE(*store.list("ratelimit/") == std::vector<std::string>{"ratelimit/b"});
    }

    std::filesystem::remove_all(dir);
}
#endif
