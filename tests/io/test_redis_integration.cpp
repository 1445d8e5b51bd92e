/**
 * test_redis_integration.cpp
 *
 * Runs against a live Redis 7+ named by TIERCACHE_TEST_REDIS_URL, e.g.
 *   TIERCACHE_TEST_REDIS_URL=redis://127.0.0.1:6379/15
 * Every test is skipped when the variable is unset.
 */

#include <catch2/catch_test_macros.hpp>

#include <jcailloux/tiercache/CacheService.h>
#include <jcailloux/tiercache/StoreProvider.h>
#include <jcailloux/tiercache/io/EpollIoContext.h>
#include <jcailloux/tiercache/io/redis/RedisClient.h>

#include "../fixtures/TestRunner.h"

#include <cstdlib>
#include <optional>
#include <string>
#include <unistd.h>

using namespace jcailloux::tiercache;
using namespace std::chrono_literals;
using test::runTask;

namespace {

std::optional<config::StoreUrl> liveUrl() {
    const char* raw = std::getenv("TIERCACHE_TEST_REDIS_URL");
    if (!raw || !*raw) return std::nullopt;
    auto url = config::parseStoreUrl(raw);
    if (!url) return std::nullopt;
    return *url;
}

std::string testPrefix() {
    return "tiercache-test:" + std::to_string(::getpid()) + ":";
}

}  // namespace

#define REQUIRE_LIVE_REDIS(url)                                              \
    auto url = liveUrl();                                                    \
    if (!url) SKIP("TIERCACHE_TEST_REDIS_URL not set")

// =============================================================================
// RedisClient
// =============================================================================

TEST_CASE("RedisClient SETEX, GET and PTTL", "[redis][integration]") {
    REQUIRE_LIVE_REDIS(url);
    io::EpollIoContext io;
    auto key = testPrefix() + "client";

    auto result = runTask(io, [](io::EpollIoContext& io, config::StoreUrl url,
                                 std::string key) -> io::Task<std::pair<std::string, int64_t>> {
        auto client = co_await io::RedisClient<io::EpollIoContext>::connect(io, url);
        co_await client->exec({"SETEX", key, "30", std::string("\x01\0\r\n", 4)});
        auto replies = co_await client->pipeline({{"GET", key}, {"PTTL", key}, {"UNLINK", key}});
        co_return std::pair{replies[0].asString(), replies[1].asInteger()};
    }(io, *url, key));

    REQUIRE(result.first == std::string("\x01\0\r\n", 4));
    REQUIRE(result.second > 29000);
    REQUIRE(result.second <= 30000);
}

TEST_CASE("RedisClient error replies", "[redis][integration]") {
    REQUIRE_LIVE_REDIS(url);
    io::EpollIoContext io;

    auto task = [](io::EpollIoContext& io, config::StoreUrl url) -> io::Task<void> {
        auto client = co_await io::RedisClient<io::EpollIoContext>::connect(io, url);
        auto replies = co_await client->pipeline({{"NOSUCHCOMMAND"}, {"PING"}});
        if (!replies[0].isError() || replies[1].asStringView() != "PONG")
            throw std::runtime_error("unexpected pipeline replies");
        co_await client->exec({"NOSUCHCOMMAND"});
    };

    REQUIRE_THROWS_AS(runTask(io, task(io, *url)), io::RedisError);
}

TEST_CASE("Redis supports EXPIRE NX and GT on sets", "[redis][integration]") {
    REQUIRE_LIVE_REDIS(url);
    io::EpollIoContext io;
    auto key = testPrefix() + "set";

    auto pttl = runTask(io, [](io::EpollIoContext& io, config::StoreUrl url,
                               std::string key) -> io::Task<int64_t> {
        auto store = co_await StoreProvider::connect(io, url, 1s);
        auto replies = co_await store.pipeline({
            {"SADD", key, "a"},
            {"EXPIRE", key, "100", "NX"},
            {"EXPIRE", key, "10", "GT"},
            {"PTTL", key},
            {"UNLINK", key},
        });
        for (const auto& r : replies)
            if (r.isError()) throw io::RedisError(r.errorMessage());
        co_return replies[3].asInteger();
    }(io, *url, key));

    REQUIRE(pttl > 99000);
}

// =============================================================================
// CacheService
// =============================================================================

TEST_CASE("CacheService against a live store", "[redis][integration][service]") {
    REQUIRE_LIVE_REDIS(url);
    io::EpollIoContext io;

    auto raw = std::getenv("TIERCACHE_TEST_REDIS_URL");
    CacheService cache(config::CacheConfig{}
        .with_backing_store_url(raw)
        .with_key_prefix(testPrefix())
        .with_batch_chunk_size(3));

    REQUIRE(runTask(io, cache.init(io)));
    REQUIRE(cache.storeAttached());
    REQUIRE(runTask(io, cache.ping()));

    SECTION("set, get, invalidate") {
        REQUIRE(runTask(io, cache.set("user:1", std::string("Ada"), 60s, {"user:1"})));
        REQUIRE(runTask(io, cache.get<std::string>("user:1")) == "Ada");
        REQUIRE(runTask(io, cache.invalidateByTag("user:1")) == 1);
        REQUIRE_FALSE(runTask(io, cache.get<std::string>("user:1")));
    }

    SECTION("read-through after L1 loss") {
        REQUIRE(runTask(io, cache.set("k", 42, 60s)));
        cache.l1().clear();
        REQUIRE(runTask(io, cache.get<int>("k")) == 42);
        REQUIRE(cache.metrics().l2_hits == 1);
    }

    SECTION("bulk in chunks") {
        std::vector<std::pair<std::string, int>> entries;
        for (int i = 0; i < 7; ++i) entries.emplace_back("n" + std::to_string(i), i);
        REQUIRE(runTask(io, cache.mset(entries, 60s)));
        cache.l1().clear();

        auto got = runTask(io, cache.mget<int>({"n0", "n3", "n6", "missing"}));
        REQUIRE(got.size() == 3);
        REQUIRE(got.at("n6") == 6);
    }

    SECTION("dependency cascade") {
        REQUIRE(runTask(io, cache.set("user:1", 1, 60s)));
        REQUIRE(runTask(io, cache.set("page:1", 2, 60s, {}, "", {"user:1"})));
        REQUIRE(runTask(io, cache.remove("user:1")));
        cache.l1().clear();
        REQUIRE_FALSE(runTask(io, cache.get<int>("page:1")));
    }

    runTask(io, cache.clear());
    cache.shutdown();
}
