#ifndef JCX_TIERCACHE_CACHE_SERVICE_H
#define JCX_TIERCACHE_CACHE_SERVICE_H

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "jcailloux/tiercache/Log.h"
#include "jcailloux/tiercache/StoreProvider.h"
#include "jcailloux/tiercache/cache/Errors.h"
#include "jcailloux/tiercache/cache/MemoryCache.h"
#include "jcailloux/tiercache/cache/Metrics.h"
#include "jcailloux/tiercache/cache/RemoteCache.h"
#include "jcailloux/tiercache/cache/Serializer.h"
#include "jcailloux/tiercache/cache/TagIndex.h"
#include "jcailloux/tiercache/config/CacheConfig.h"
#include "jcailloux/tiercache/config/CachedClock.h"
#include "jcailloux/tiercache/config/StoreUrl.h"
#include "jcailloux/tiercache/io/IoContext.h"
#include "jcailloux/tiercache/io/Task.h"

namespace jcailloux::tiercache {

// =============================================================================
// CacheService — two-tier read-through / write-through cache
//
//   get:  L1 ── hit ──────────────────────────────> value
//          └─ miss ─> L2 ── hit ─> promote to L1 ─> value
//                      └─ miss ──────────────────> nullopt
//
//   set:  encode ─> L1 ─> L2 ─> tag / dependency registration
//
// Values are stored encoded (see cache::Serializer). A payload that fails to
// decode is a miss and is purged from the tier that held it. Store failures
// never reach the caller: L2 degrades to a miss and writes stay visible in L1.
// The only exception that escapes is cache::SerializationError from the
// write path.
//
// Full keys are `key_prefix + [ns + ':'] + key`. Tags are global to the
// service; dependencies live in the namespace of the dependent key.
//
// Usage:
//   CacheService cache(config::CacheConfig::fromEnvironment());
//   co_await cache.init(io);
//   co_await cache.set("user:1", user, 60s, {"user:1"});
//   auto u = co_await cache.get<User>("user:1");
//   co_await cache.invalidateByTag("user:1");
//
// Thread-safety: operations may be awaited concurrently from any thread. L1,
// the local tag registry and metrics are internally locked; store round trips
// hop onto the store's event loop (StoreProvider::connect, onLoop), so a
// caller may resume on the loop thread after an L2 access. A provider passed
// to attach() that is not loop-bound must itself be thread-safe. init(),
// attach() and shutdown() must not overlap other calls.
// =============================================================================

template<typename Clock = config::CachedClock>
class BasicCacheService {
public:
    using L1 = cache::MemoryCache<Clock>;
    using Tags = cache::BasicTagIndex<Clock>;

    explicit BasicCacheService(config::CacheConfig config = {})
        : config_(std::move(config))
        , l1_(cache::MemoryCacheConfig{config_.l1_max_entries,
              std::chrono::duration_cast<std::chrono::milliseconds>(config_.l1_ttl)})
        , l2_(config_.batch_chunk_size, &metrics_.store_errors)
        , tags_(config_.key_prefix, config_.tag_ttl_slack)
    {}

    BasicCacheService(const BasicCacheService&) = delete;
    BasicCacheService& operator=(const BasicCacheService&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Connect to config().backing_store_url on `io`. On failure the service
    /// stays usable with L1 only and false is returned.
    template<io::IoContext Io>
    io::Task<bool> init(Io& io) {
        auto url = config::parseStoreUrl(config_.backing_store_url);
        if (!url) {
            TIERCACHE_LOG_ERROR << "CacheService: " << url.error().message;
            co_return false;
        }

        try {
            auto store = co_await StoreProvider::connect(io, *url, config_.reconnect_interval);
            attach(std::move(store));
            co_return true;
        } catch (const std::exception& e) {
            TIERCACHE_LOG_WARN << "CacheService: backing store " << url->redacted()
                               << " unavailable, running L1 only: " << e.what();
            co_return false;
        }
    }

    void attach(StoreProvider store) { l2_.attach(std::move(store)); }

    /// Detach the store and drop all process-local state.
    void shutdown() {
        l2_.detach();
        l1_.clear();
        tags_.clear();
    }

    [[nodiscard]] bool storeAttached() const noexcept { return l2_.attached(); }

    // =========================================================================
    // Single keys
    // =========================================================================

    template<typename T>
    io::Task<std::optional<T>> get(std::string key, std::string ns = "") {
        cache::MetricsCollector::LatencyTimer timer(metrics_);
        auto full = composeKey(key, ns);

        if (auto entry = l1_.get(full)) {
            auto value = cache::decode<T>(entry->bytes);
            if (value) {
                metrics_.l1_hits.increment();
                co_return std::move(*value);
            }
            decodeFailed("L1", full, value.error());
            l1_.remove(full);
        }

        if (auto remote = co_await l2_.getWithTtl(full)) {
            auto value = cache::decode<T>(remote->bytes);
            if (value) {
                promote(full, std::move(remote->bytes), remote->ttl);
                metrics_.l2_hits.increment();
                co_return std::move(*value);
            }
            decodeFailed("L2", full, value.error());
            co_await l2_.remove({full});
        }

        metrics_.misses.increment();
        co_return std::nullopt;
    }

    /// Store `value` in both tiers for `ttl` (zero: default_ttl), then
    /// register its tags and dependencies. Returns true once L1 holds the
    /// value, whether or not the store accepted it.
    /// @throws cache::SerializationError when the value cannot be encoded
    template<typename T>
    io::Task<bool> set(std::string key, T value, std::chrono::seconds ttl,
                       std::vector<std::string> tags = {}, std::string ns = "",
                       std::vector<std::string> dependencies = {}) {
        cache::MetricsCollector::LatencyTimer timer(metrics_);
        auto full = composeKey(key, ns);
        if (ttl <= std::chrono::seconds::zero()) ttl = config_.default_ttl;

        auto encoded = encodeOrThrow(value);
        metrics_.recordWrite(encoded.raw_size, encoded.bytes.size());

        storeL1(full, encoded.bytes, encoded.encoding, ttl);
        if (!co_await l2_.set(full, std::move(encoded.bytes), ttl) && l2_.attached())
            TIERCACHE_LOG_WARN << "CacheService: " << full << " cached in L1 only";

        co_await tags_.track(l2_, full, std::move(tags), ttl);

        if (!dependencies.empty()) {
            for (auto& dep : dependencies) dep = composeKey(dep, ns);
            co_await tags_.dependOn(l2_, full, std::move(dependencies), ttl);
        }
        co_return true;
    }

    /// Remove `key` and every key depending on it from both tiers.
    /// Idempotent; always true.
    io::Task<bool> remove(std::string key, std::string ns = "") {
        cache::MetricsCollector::LatencyTimer timer(metrics_);
        co_await removeCascading({composeKey(key, ns)});
        co_return true;
    }

    // =========================================================================
    // Bulk
    // =========================================================================

    /// Values found for `keys`, keyed by the caller's key. L1 is checked per
    /// key; the rest is fetched from L2 in chunked round trips and promoted.
    template<typename T>
    io::Task<std::unordered_map<std::string, T>> mget(std::vector<std::string> keys,
                                                      std::string ns = "") {
        cache::MetricsCollector::LatencyTimer timer(metrics_);
        std::unordered_map<std::string, T> found;
        found.reserve(keys.size());

        std::vector<std::string> pending_keys;
        std::vector<std::string> pending_full;

        for (auto& key : keys) {
            if (found.contains(key)) continue;
            auto full = composeKey(key, ns);
            if (auto entry = l1_.get(full)) {
                auto value = cache::decode<T>(entry->bytes);
                if (value) {
                    metrics_.l1_hits.increment();
                    found.emplace(std::move(key), std::move(*value));
                    continue;
                }
                decodeFailed("L1", full, value.error());
                l1_.remove(full);
            }
            if (std::find(pending_keys.begin(), pending_keys.end(), key) != pending_keys.end())
                continue;
            pending_keys.push_back(std::move(key));
            pending_full.push_back(std::move(full));
        }

        if (pending_full.empty()) co_return found;

        auto remote = co_await l2_.mgetWithTtl(pending_full);
        std::vector<std::string> corrupt;

        for (size_t i = 0; i < pending_keys.size(); ++i) {
            if (!remote || !(*remote)[i]) {
                metrics_.misses.increment();
                continue;
            }
            auto& hit = *(*remote)[i];
            auto value = cache::decode<T>(hit.bytes);
            if (!value) {
                decodeFailed("L2", pending_full[i], value.error());
                corrupt.push_back(pending_full[i]);
                metrics_.misses.increment();
                continue;
            }
            promote(pending_full[i], std::move(hit.bytes), hit.ttl);
            metrics_.l2_hits.increment();
            found.emplace(std::move(pending_keys[i]), std::move(*value));
        }

        if (!corrupt.empty()) co_await l2_.remove(std::move(corrupt));
        co_return found;
    }

    /// Encode every value first (nothing is written if one fails), then
    /// write L1 and pipeline the L2 writes. Returns true.
    /// @throws cache::SerializationError
    template<typename T>
    io::Task<bool> mset(std::vector<std::pair<std::string, T>> entries, std::chrono::seconds ttl,
                        std::string ns = "") {
        cache::MetricsCollector::LatencyTimer timer(metrics_);
        if (ttl <= std::chrono::seconds::zero()) ttl = config_.default_ttl;

        std::vector<std::pair<std::string, cache::EncodedValue>> encoded;
        encoded.reserve(entries.size());
        for (const auto& [key, value] : entries)
            encoded.emplace_back(composeKey(key, ns), encodeOrThrow(value));

        std::vector<std::pair<std::string, std::string>> remote;
        remote.reserve(encoded.size());
        for (auto& [full, enc] : encoded) {
            metrics_.recordWrite(enc.raw_size, enc.bytes.size());
            storeL1(full, enc.bytes, enc.encoding, ttl);
            remote.emplace_back(std::move(full), std::move(enc.bytes));
        }

        if (!co_await l2_.mset(std::move(remote), ttl) && l2_.attached())
            TIERCACHE_LOG_WARN << "CacheService: mset of " << encoded.size()
                               << " keys cached in L1 only";
        co_return true;
    }

    // =========================================================================
    // Invalidation and maintenance
    // =========================================================================

    /// Delete every key carrying `tag` (and their dependents) from both
    /// tiers. @return number of distinct keys that were present in at least
    /// one tier
    io::Task<size_t> invalidateByTag(std::string tag) {
        cache::MetricsCollector::LatencyTimer timer(metrics_);

        auto members = co_await tags_.members(l2_, tag);
        if (members.empty()) co_return 0;

        auto removed = co_await removeCascading(members);
        co_await tags_.release(l2_, tag, std::move(members));

        metrics_.invalidated_keys.add(removed);
        TIERCACHE_LOG_DEBUG << "CacheService: tag " << tag << " invalidated " << removed << " keys";
        co_return removed;
    }

    /// Drop every key of namespace `ns` (every key of the service when
    /// empty) from both tiers. @return number of keys deleted from L2, or
    /// from L1 when no store is attached
    io::Task<size_t> clear(std::string ns = "") {
        auto prefix = config_.key_prefix;
        if (!ns.empty()) prefix.append(ns).push_back(':');

        size_t local = 0;
        if (ns.empty()) {
            local = l1_.size();
            l1_.clear();
            tags_.clear();
        } else {
            local = l1_.removePrefix(prefix);
            tags_.forgetPrefix(prefix);
        }

        if (!l2_.attached()) co_return local;
        co_return co_await l2_.scanDelete(cache::escapeGlob(prefix) + "*");
    }

    io::Task<bool> ping() { return l2_.ping(); }

    [[nodiscard]] cache::MetricsSnapshot metrics() const noexcept { return metrics_.snapshot(); }
    void resetMetrics() noexcept { metrics_.reset(); }

    [[nodiscard]] const config::CacheConfig& config() const noexcept { return config_; }

    [[nodiscard]] std::string composeKey(std::string_view key, std::string_view ns = {}) const {
        std::string full;
        full.reserve(config_.key_prefix.size() + ns.size() + 1 + key.size());
        full.append(config_.key_prefix);
        if (!ns.empty()) full.append(ns).push_back(':');
        full.append(key);
        return full;
    }

    // Tier access for diagnostics and tests
    [[nodiscard]] L1& l1() noexcept { return l1_; }
    [[nodiscard]] cache::RemoteCache& l2() noexcept { return l2_; }
    [[nodiscard]] Tags& tagIndex() noexcept { return tags_; }

private:
    template<typename T>
    cache::EncodedValue encodeOrThrow(const T& value) {
        try {
            return cache::encodeValue(value, config_.compression_threshold_bytes);
        } catch (const cache::SerializationError& e) {
            metrics_.serialization_errors.increment();
            TIERCACHE_LOG_ERROR << "CacheService: " << e.what();
            throw;
        }
    }

    void storeL1(const std::string& full, std::string bytes, cache::Encoding encoding,
                 std::chrono::seconds ttl) {
        auto l1_ttl = std::min(config_.l1_ttl, ttl);
        metrics_.evictions.add(l1_.set(full, std::move(bytes), encoding, l1_ttl));
    }

    /// L1 TTL of a promoted entry never outlives its L2 copy.
    void promote(const std::string& full, std::string bytes,
                 std::optional<std::chrono::milliseconds> remaining) {
        auto encoding = cache::encodingOf(bytes);
        if (!encoding) return;

        std::chrono::milliseconds ttl = config_.l1_ttl;
        if (remaining) ttl = std::min(ttl, *remaining);
        if (ttl <= std::chrono::milliseconds::zero()) return;

        metrics_.evictions.add(l1_.set(full, std::move(bytes), *encoding, ttl));
    }

    void decodeFailed(std::string_view tier, std::string_view full, const cache::DecodeError& error) {
        metrics_.decode_errors.increment();
        TIERCACHE_LOG_DEBUG << "CacheService: purging undecodable " << tier << " entry " << full
                            << " (" << cache::kindName(error.kind) << ": " << error.message << ")";
    }

    /// Delete `roots` and their transitive dependents: L2 first, then L1, so
    /// a concurrent reader cannot promote a doomed L2 copy after the L1
    /// delete. @return number of keys present in at least one tier
    io::Task<size_t> removeCascading(std::vector<std::string> roots) {
        auto keys = co_await tags_.cascade(l2_, std::move(roots));

        std::vector<std::string> doomed = keys;
        doomed.reserve(keys.size() * 2);
        for (const auto& k : keys) doomed.push_back(tags_.depSetKey(k));

        auto remote = co_await l2_.remove(std::move(doomed));

        size_t present = 0;
        for (size_t i = 0; i < keys.size(); ++i) {
            bool in_l1 = l1_.remove(keys[i]);
            bool in_l2 = remote && (*remote)[i];
            if (in_l1 || in_l2) ++present;
        }

        tags_.forget(keys);
        metrics_.deletes.add(keys.size());
        co_return present;
    }

    config::CacheConfig config_;
    cache::MetricsCollector metrics_;
    L1 l1_;
    cache::RemoteCache l2_;
    Tags tags_;
};

using CacheService = BasicCacheService<>;

}  // namespace jcailloux::tiercache

#endif  // JCX_TIERCACHE_CACHE_SERVICE_H
