#ifndef JCX_TIERCACHE_CONFIG_CACHE_CONFIG_H
#define JCX_TIERCACHE_CONFIG_CACHE_CONFIG_H

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>

#include "jcailloux/tiercache/Log.h"

namespace jcailloux::tiercache::config {
    using namespace std::chrono_literals;

    // =========================================================================
    // CacheConfig — runtime configuration of a CacheService
    // =========================================================================
    //
    // Plain aggregate with chainable modifiers:
    //
    //   auto cfg = config::CacheConfig{}
    //       .with_key_prefix("docs:")
    //       .with_l1_max_entries(5000)
    //       .with_default_ttl(30min);
    //
    // or loaded from the process environment (see fromEnvironment()).

    struct CacheConfig {
        // L2 (backing store)
        std::string backing_store_url = "redis://127.0.0.1:6379";
        std::chrono::seconds default_ttl = 1h;
        std::chrono::milliseconds reconnect_interval = 1s;

        // Serialization
        size_t compression_threshold_bytes = 1024;

        // L1 (process memory)
        size_t l1_max_entries = 1000;
        std::chrono::seconds l1_ttl = 5min;

        // Keys and tags
        std::string key_prefix = "tiercache:";
        std::chrono::seconds tag_ttl_slack = 60s;

        // Bulk operations: commands or keys per pipeline round trip
        size_t batch_chunk_size = 512;

        CacheConfig with_backing_store_url(std::string v) const { auto c = *this; c.backing_store_url = std::move(v); return c; }
        CacheConfig with_default_ttl(std::chrono::seconds v) const { auto c = *this; c.default_ttl = v; return c; }
        CacheConfig with_reconnect_interval(std::chrono::milliseconds v) const { auto c = *this; c.reconnect_interval = v; return c; }
        CacheConfig with_compression_threshold(size_t v) const { auto c = *this; c.compression_threshold_bytes = v; return c; }
        CacheConfig with_l1_max_entries(size_t v) const { auto c = *this; c.l1_max_entries = v; return c; }
        CacheConfig with_l1_ttl(std::chrono::seconds v) const { auto c = *this; c.l1_ttl = v; return c; }
        CacheConfig with_key_prefix(std::string v) const { auto c = *this; c.key_prefix = std::move(v); return c; }
        CacheConfig with_tag_ttl_slack(std::chrono::seconds v) const { auto c = *this; c.tag_ttl_slack = v; return c; }
        CacheConfig with_batch_chunk_size(size_t v) const { auto c = *this; c.batch_chunk_size = v == 0 ? 1 : v; return c; }

        bool operator==(const CacheConfig&) const = default;

        /// Defaults overridden by TIERCACHE_* environment variables.
        /// Unparsable values are logged and ignored.
        static CacheConfig fromEnvironment();
    };

    namespace detail {

        inline const char* env(const char* name) noexcept {
            const char* v = std::getenv(name);
            return (v && *v) ? v : nullptr;
        }

        template<typename Int>
        bool parseEnvInt(const char* name, Int& out) {
            const char* v = env(name);
            if (!v) return false;
            std::string_view sv(v);
            Int parsed{};
            auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), parsed);
            if (ec != std::errc{} || ptr != sv.data() + sv.size() || parsed < 0) {
                TIERCACHE_LOG_WARN << "CacheConfig: ignoring " << name << "='" << sv
                                   << "' (expected a non-negative integer)";
                return false;
            }
            out = parsed;
            return true;
        }

        template<typename Duration>
        void loadDuration(const char* name, Duration& out) {
            long long raw = 0;
            if (parseEnvInt(name, raw)) out = Duration{raw};
        }

    }  // namespace detail

    inline CacheConfig CacheConfig::fromEnvironment() {
        CacheConfig cfg;

        if (auto url = detail::env("TIERCACHE_STORE_URL")) cfg.backing_store_url = url;
        else if (auto legacy = detail::env("REDIS_URL")) cfg.backing_store_url = legacy;

        if (auto prefix = detail::env("TIERCACHE_KEY_PREFIX")) cfg.key_prefix = prefix;

        detail::loadDuration("TIERCACHE_DEFAULT_TTL", cfg.default_ttl);
        detail::loadDuration("TIERCACHE_L1_TTL", cfg.l1_ttl);
        detail::loadDuration("TIERCACHE_TAG_TTL_SLACK", cfg.tag_ttl_slack);
        detail::loadDuration("TIERCACHE_RECONNECT_INTERVAL", cfg.reconnect_interval);
        detail::parseEnvInt("TIERCACHE_COMPRESSION_THRESHOLD", cfg.compression_threshold_bytes);
        detail::parseEnvInt("TIERCACHE_L1_MAX_ENTRIES", cfg.l1_max_entries);
        if (detail::parseEnvInt("TIERCACHE_BATCH_CHUNK", cfg.batch_chunk_size) && cfg.batch_chunk_size == 0)
            cfg.batch_chunk_size = 1;

        return cfg;
    }

}  // namespace jcailloux::tiercache::config

#endif  // JCX_TIERCACHE_CONFIG_CACHE_CONFIG_H
