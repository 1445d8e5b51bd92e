#include <catch2/catch_test_macros.hpp>

#include <jcailloux/tiercache/config/CacheConfig.h>

#include <cstdlib>

using namespace jcailloux::tiercache::config;
using namespace std::chrono_literals;

namespace {

constexpr const char* kVars[] = {
    "TIERCACHE_STORE_URL", "REDIS_URL", "TIERCACHE_KEY_PREFIX",
    "TIERCACHE_DEFAULT_TTL", "TIERCACHE_L1_TTL", "TIERCACHE_TAG_TTL_SLACK",
    "TIERCACHE_RECONNECT_INTERVAL", "TIERCACHE_COMPRESSION_THRESHOLD",
    "TIERCACHE_L1_MAX_ENTRIES", "TIERCACHE_BATCH_CHUNK",
};

/// Clears every variable fromEnvironment() reads, on entry and on exit.
struct CleanEnv {
    CleanEnv() { clear(); }
    ~CleanEnv() { clear(); }
    static void clear() {
        for (auto* name : kVars) ::unsetenv(name);
    }
};

}  // namespace

// =============================================================================
// Defaults and modifiers
// =============================================================================

TEST_CASE("CacheConfig defaults", "[config]") {
    CacheConfig cfg;
    REQUIRE(cfg.backing_store_url == "redis://127.0.0.1:6379");
    REQUIRE(cfg.default_ttl == 1h);
    REQUIRE(cfg.l1_ttl == 5min);
    REQUIRE(cfg.l1_max_entries == 1000);
    REQUIRE(cfg.compression_threshold_bytes == 1024);
    REQUIRE(cfg.key_prefix == "tiercache:");
    REQUIRE(cfg.tag_ttl_slack == 60s);
    REQUIRE(cfg.batch_chunk_size == 512);
}

TEST_CASE("CacheConfig with_* modifiers leave the original untouched", "[config]") {
    const CacheConfig base;
    auto cfg = base
        .with_key_prefix("docs:")
        .with_l1_max_entries(10)
        .with_default_ttl(30s)
        .with_batch_chunk_size(0);

    REQUIRE(cfg.key_prefix == "docs:");
    REQUIRE(cfg.l1_max_entries == 10);
    REQUIRE(cfg.default_ttl == 30s);
    REQUIRE(cfg.batch_chunk_size == 1);

    REQUIRE(base == CacheConfig{});
    REQUIRE_FALSE(cfg == base);
}

// =============================================================================
// fromEnvironment
// =============================================================================

TEST_CASE("CacheConfig::fromEnvironment with nothing set", "[config][env]") {
    CleanEnv env;
    REQUIRE(CacheConfig::fromEnvironment() == CacheConfig{});
}

TEST_CASE("CacheConfig::fromEnvironment reads overrides", "[config][env]") {
    CleanEnv env;
    ::setenv("TIERCACHE_STORE_URL", "redis://cache:6380/2", 1);
    ::setenv("TIERCACHE_KEY_PREFIX", "app:", 1);
    ::setenv("TIERCACHE_DEFAULT_TTL", "120", 1);
    ::setenv("TIERCACHE_L1_TTL", "15", 1);
    ::setenv("TIERCACHE_TAG_TTL_SLACK", "5", 1);
    ::setenv("TIERCACHE_RECONNECT_INTERVAL", "250", 1);
    ::setenv("TIERCACHE_COMPRESSION_THRESHOLD", "64", 1);
    ::setenv("TIERCACHE_L1_MAX_ENTRIES", "42", 1);
    ::setenv("TIERCACHE_BATCH_CHUNK", "8", 1);

    auto cfg = CacheConfig::fromEnvironment();
    REQUIRE(cfg.backing_store_url == "redis://cache:6380/2");
    REQUIRE(cfg.key_prefix == "app:");
    REQUIRE(cfg.default_ttl == 120s);
    REQUIRE(cfg.l1_ttl == 15s);
    REQUIRE(cfg.tag_ttl_slack == 5s);
    REQUIRE(cfg.reconnect_interval == 250ms);
    REQUIRE(cfg.compression_threshold_bytes == 64);
    REQUIRE(cfg.l1_max_entries == 42);
    REQUIRE(cfg.batch_chunk_size == 8);
}

TEST_CASE("CacheConfig::fromEnvironment falls back to REDIS_URL", "[config][env]") {
    CleanEnv env;
    ::setenv("REDIS_URL", "redis://legacy:6379", 1);
    REQUIRE(CacheConfig::fromEnvironment().backing_store_url == "redis://legacy:6379");

    ::setenv("TIERCACHE_STORE_URL", "redis://preferred:6379", 1);
    REQUIRE(CacheConfig::fromEnvironment().backing_store_url == "redis://preferred:6379");
}

TEST_CASE("CacheConfig::fromEnvironment ignores invalid values", "[config][env]") {
    CleanEnv env;
    ::setenv("TIERCACHE_DEFAULT_TTL", "ten", 1);
    ::setenv("TIERCACHE_L1_TTL", "-3", 1);
    ::setenv("TIERCACHE_L1_MAX_ENTRIES", "12abc", 1);
    ::setenv("TIERCACHE_BATCH_CHUNK", "0", 1);

    auto cfg = CacheConfig::fromEnvironment();
    REQUIRE(cfg.default_ttl == 1h);
    REQUIRE(cfg.l1_ttl == 5min);
    REQUIRE(cfg.l1_max_entries == 1000);
    REQUIRE(cfg.batch_chunk_size == 1);
}
