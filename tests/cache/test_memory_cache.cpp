#include <catch2/catch_test_macros.hpp>

#include <jcailloux/tiercache/cache/MemoryCache.h>

#include "../fixtures/ManualClock.h"

#include <chrono>
#include <string>
#include <thread>

using namespace jcailloux::tiercache::cache;
using namespace std::chrono_literals;
using tiercache_test::ManualClock;

namespace {

using Cache = MemoryCache<ManualClock>;

std::string payload(std::string_view s) {
    return std::string(1, static_cast<char>(Encoding::Json)) + std::string(s);
}

}  // namespace

// =============================================================================
// Basic get / set / remove
// =============================================================================

TEST_CASE("MemoryCache: set then get returns the entry", "[l1]") {
    ManualClock::reset();
    Cache cache({.max_entries = 10, .default_ttl = 60s});

    REQUIRE_FALSE(cache.get("a"));
    REQUIRE(cache.set("a", payload("1"), Encoding::Json, 10s) == 0);

    auto hit = cache.get("a");
    REQUIRE(hit);
    REQUIRE(hit->bytes == payload("1"));
    REQUIRE(hit->encoding == Encoding::Json);
    REQUIRE(hit->expires_at - hit->created_at == 10s);
    REQUIRE(cache.size() == 1);
}

TEST_CASE("MemoryCache: overwrite replaces bytes and TTL", "[l1]") {
    ManualClock::reset();
    Cache cache({.max_entries = 10, .default_ttl = 60s});

    cache.set("a", payload("1"), Encoding::Json, 1s);
    cache.set("a", payload("2"), Encoding::Beve, 30s);

    ManualClock::advance(5s);
    auto hit = cache.get("a");
    REQUIRE(hit);
    REQUIRE(hit->bytes == payload("2"));
    REQUIRE(hit->encoding == Encoding::Beve);
    REQUIRE(cache.size() == 1);
}

TEST_CASE("MemoryCache: remove is idempotent", "[l1]") {
    ManualClock::reset();
    Cache cache;

    cache.set("a", payload("1"), Encoding::Json, 10s);
    REQUIRE(cache.remove("a"));
    REQUIRE_FALSE(cache.remove("a"));
    REQUIRE_FALSE(cache.remove("never-set"));
    REQUIRE_FALSE(cache.get("a"));
}

TEST_CASE("MemoryCache: zero TTL uses the default, negative TTL erases", "[l1]") {
    ManualClock::reset();
    Cache cache({.max_entries = 10, .default_ttl = 2s});

    cache.set("a", payload("1"), Encoding::Json, 0s);
    auto hit = cache.get("a");
    REQUIRE(hit);
    REQUIRE(hit->expires_at - hit->created_at == 2s);

    cache.set("a", payload("2"), Encoding::Json, -1s);
    REQUIRE_FALSE(cache.get("a"));
    REQUIRE(cache.size() == 0);
}

// =============================================================================
// Expiry
// =============================================================================

TEST_CASE("MemoryCache: entries expire at their TTL", "[l1][ttl]") {
    ManualClock::reset();
    Cache cache({.max_entries = 10, .default_ttl = 60s});

    cache.set("short", payload("s"), Encoding::Json, 1s);
    cache.set("long", payload("l"), Encoding::Json, 10s);

    ManualClock::advance(999ms);
    REQUIRE(cache.contains("short"));

    ManualClock::advance(1ms);
    REQUIRE_FALSE(cache.contains("short"));
    REQUIRE_FALSE(cache.get("short"));
    // get() purged it
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.get("long"));
}

TEST_CASE("MemoryCache: purgeExpired drops only expired entries", "[l1][ttl]") {
    ManualClock::reset();
    Cache cache({.max_entries = 10, .default_ttl = 60s});

    cache.set("a", payload("a"), Encoding::Json, 1s);
    cache.set("b", payload("b"), Encoding::Json, 1s);
    cache.set("c", payload("c"), Encoding::Json, 5s);

    ManualClock::advance(2s);
    REQUIRE(cache.size() == 3);
    REQUIRE(cache.purgeExpired() == 2);
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.contains("c"));
}

TEST_CASE("MemoryCache: remove reports an expired entry as present", "[l1][ttl]") {
    ManualClock::reset();
    Cache cache;

    cache.set("a", payload("a"), Encoding::Json, 1s);
    ManualClock::advance(2s);
    REQUIRE(cache.remove("a"));
}

// =============================================================================
// LRU eviction
// =============================================================================

TEST_CASE("MemoryCache: full cache evicts the least recently used entry", "[l1][lru]") {
    ManualClock::reset();
    Cache cache({.max_entries = 3, .default_ttl = 60s});

    cache.set("a", payload("a"), Encoding::Json, 0s);
    cache.set("b", payload("b"), Encoding::Json, 0s);
    cache.set("c", payload("c"), Encoding::Json, 0s);

    SECTION("insertion order without reads") {
        REQUIRE(cache.set("d", payload("d"), Encoding::Json, 0s) == 1);
        REQUIRE_FALSE(cache.contains("a"));
        REQUIRE(cache.contains("b"));
        REQUIRE(cache.contains("d"));
    }

    SECTION("a read protects the entry") {
        REQUIRE(cache.get("a"));
        REQUIRE(cache.set("d", payload("d"), Encoding::Json, 0s) == 1);
        REQUIRE(cache.contains("a"));
        REQUIRE_FALSE(cache.contains("b"));
    }

    SECTION("an overwrite protects the entry and evicts nothing") {
        REQUIRE(cache.set("a", payload("a2"), Encoding::Json, 0s) == 0);
        REQUIRE(cache.set("d", payload("d"), Encoding::Json, 0s) == 1);
        REQUIRE(cache.contains("a"));
        REQUIRE_FALSE(cache.contains("b"));
    }

    REQUIRE(cache.size() == 3);
}

TEST_CASE("MemoryCache: get refreshes last_access", "[l1][lru]") {
    ManualClock::reset();
    Cache cache;

    cache.set("a", payload("a"), Encoding::Json, 60s);
    ManualClock::advance(3s);
    auto hit = cache.get("a");
    REQUIRE(hit);
    REQUIRE(hit->last_access - hit->created_at == 3s);
}

TEST_CASE("MemoryCache: max_entries 0 disables storage", "[l1]") {
    ManualClock::reset();
    Cache cache({.max_entries = 0, .default_ttl = 60s});

    REQUIRE(cache.set("a", payload("a"), Encoding::Json, 10s) == 0);
    REQUIRE_FALSE(cache.get("a"));
    REQUIRE(cache.size() == 0);
}

// =============================================================================
// Bulk removal
// =============================================================================

TEST_CASE("MemoryCache: removePrefix and clear", "[l1]") {
    ManualClock::reset();
    Cache cache;

    cache.set("app:users:1", payload("1"), Encoding::Json, 10s);
    cache.set("app:users:2", payload("2"), Encoding::Json, 10s);
    cache.set("app:posts:1", payload("p"), Encoding::Json, 10s);

    REQUIRE(cache.removePrefix("app:users:") == 2);
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.contains("app:posts:1"));

    cache.clear();
    REQUIRE(cache.size() == 0);
}

TEST_CASE("MemoryCache: default clock tracks real time", "[l1][ttl]") {
    MemoryCache<> cache;
    cache.set("a", payload("a"), Encoding::Json, 50ms);
    REQUIRE(cache.get("a"));

    std::this_thread::sleep_for(120ms);
    REQUIRE_FALSE(cache.get("a"));
}

TEST_CASE("MemoryCache: default clock never serves an entry past its TTL", "[l1][ttl]") {
    using Steady = std::chrono::steady_clock;
    MemoryCache<> cache;

    int served_late = 0;
    for (int round = 0; round < 20; ++round) {
        cache.set("a", payload("a"), Encoding::Json, 20ms);
        const auto deadline = Steady::now() + 20ms;

        while (Steady::now() < deadline) {}
        if (cache.get("a")) ++served_late;
        if (cache.contains("a")) ++served_late;
    }
    REQUIRE(served_late == 0);
}
