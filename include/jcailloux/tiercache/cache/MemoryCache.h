#ifndef JCX_TIERCACHE_CACHE_MEMORY_CACHE_H
#define JCX_TIERCACHE_CACHE_MEMORY_CACHE_H

#include <chrono>
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <variant>

#include "jcailloux/tiercache/cache/Serializer.h"
#include "jcailloux/tiercache/config/CachedClock.h"

namespace jcailloux::tiercache::cache {

struct MemoryCacheConfig {
    size_t max_entries = 1000;
    std::chrono::milliseconds default_ttl = std::chrono::minutes(5);
};

// =============================================================================
// MemoryCache<Clock> — bounded LRU map of encoded entries with per-entry TTL
//
// Entries hold the serialized payload, not the value: L1 and L2 therefore
// never share mutable state, and a hit is decoded by the caller.
//
// - get() returns a copy of the entry, refreshes last_access and moves the
//   key to the most-recently-used position. Expired entries are purged on
//   access and reported as misses.
// - set() evicts the least-recently-accessed entry when the map is full.
// - max_entries == 0 disables the cache: set() stores nothing.
//
// Thread-safe: one mutex guards the map and the recency list. No call blocks
// on anything but that mutex.
//
// Clock must expose time_point and a static now(); tests substitute a manual
// clock to drive expiry. With the default CachedClock, timestamps come from
// the cached value but expiry is checked against steady_clock itself, so an
// entry is never served past expires_at.
// =============================================================================

template<typename Clock = config::CachedClock>
class MemoryCache {
public:
    using time_point = typename Clock::time_point;
    using duration = typename Clock::duration;

    struct CacheEntry {
        std::string bytes;
        Encoding encoding = Encoding::Json;
        time_point created_at{};
        time_point expires_at{};
        time_point last_access{};
    };

    explicit MemoryCache(MemoryCacheConfig config = {}) : config_(config) {}

    MemoryCache(const MemoryCache&) = delete;
    MemoryCache& operator=(const MemoryCache&) = delete;

    [[nodiscard]] std::optional<CacheEntry> get(std::string_view key) {
        const auto now = expiryNow();
        std::lock_guard lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) return std::nullopt;

        auto node = it->second;
        if (now >= node->entry.expires_at) {
            lru_.erase(node);
            index_.erase(it);
            return std::nullopt;
        }

        node->entry.last_access = now;
        lru_.splice(lru_.begin(), lru_, node);
        return node->entry;
    }

    /// Insert or overwrite. A zero ttl means default_ttl; a negative ttl
    /// removes any existing entry and stores nothing.
    /// @return number of entries evicted to make room (0 or 1)
    template<typename Rep, typename Period>
    size_t set(std::string_view key, std::string bytes, Encoding encoding,
               std::chrono::duration<Rep, Period> ttl) {
        if (config_.max_entries == 0) return 0;

        auto lifetime = std::chrono::duration_cast<duration>(ttl);
        if (lifetime == duration::zero())
            lifetime = std::chrono::duration_cast<duration>(config_.default_ttl);

        const auto now = Clock::now();
        std::lock_guard lock(mutex_);

        if (lifetime < duration::zero()) {
            eraseLocked(key);
            return 0;
        }

        CacheEntry entry{std::move(bytes), encoding, now, now + lifetime, now};

        if (auto it = index_.find(key); it != index_.end()) {
            it->second->entry = std::move(entry);
            lru_.splice(lru_.begin(), lru_, it->second);
            return 0;
        }

        size_t evicted = 0;
        while (index_.size() >= config_.max_entries && !lru_.empty()) {
            auto& victim = lru_.back();
            index_.erase(std::string_view(victim.key));
            lru_.pop_back();
            ++evicted;
        }

        lru_.push_front(Node{std::string(key), std::move(entry)});
        index_.emplace(std::string_view(lru_.front().key), lru_.begin());
        return evicted;
    }

    /// Idempotent. @return true if an entry was present (expired or not).
    bool remove(std::string_view key) {
        std::lock_guard lock(mutex_);
        return eraseLocked(key);
    }

    /// Presence check without LRU effect. Expired entries count as absent.
    [[nodiscard]] bool contains(std::string_view key) const {
        const auto now = expiryNow();
        std::lock_guard lock(mutex_);
        auto it = index_.find(key);
        return it != index_.end() && now < it->second->entry.expires_at;
    }

    /// Drop every expired entry. @return number of entries removed
    size_t purgeExpired() {
        const auto now = expiryNow();
        std::lock_guard lock(mutex_);
        size_t removed = 0;
        for (auto it = lru_.begin(); it != lru_.end();) {
            if (now >= it->entry.expires_at) {
                index_.erase(std::string_view(it->key));
                it = lru_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    /// Remove every entry whose key starts with `prefix`.
    /// @return number of entries removed
    size_t removePrefix(std::string_view prefix) {
        std::lock_guard lock(mutex_);
        size_t removed = 0;
        for (auto it = lru_.begin(); it != lru_.end();) {
            if (std::string_view(it->key).starts_with(prefix)) {
                index_.erase(std::string_view(it->key));
                it = lru_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        index_.clear();
        lru_.clear();
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return index_.size();
    }

    [[nodiscard]] const MemoryCacheConfig& config() const noexcept { return config_; }

private:
    struct Node {
        std::string key;
        CacheEntry entry;
    };

    using LruList = std::list<Node>;

    // Index keys view into Node::key; list nodes never move in memory.
    using Index = std::unordered_map<std::string_view, typename LruList::iterator>;

    static time_point expiryNow() noexcept {
        if constexpr (std::is_same_v<Clock, config::CachedClock>)
            return config::CachedClock::Clock::now();
        else
            return Clock::now();
    }

    bool eraseLocked(std::string_view key) {
        auto it = index_.find(key);
        if (it == index_.end()) return false;
        auto node = it->second;
        index_.erase(it);
        lru_.erase(node);
        return true;
    }

    using ClockSubscription = std::conditional_t<
        std::is_same_v<Clock, config::CachedClock>,
        config::CachedClock::Subscription,
        std::monostate>;

    [[no_unique_address]] ClockSubscription clock_subscription_;
    MemoryCacheConfig config_;
    mutable std::mutex mutex_;
    LruList lru_;
    Index index_;
};

}  // namespace jcailloux::tiercache::cache

#endif  // JCX_TIERCACHE_CACHE_MEMORY_CACHE_H
