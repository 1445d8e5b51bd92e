#ifndef JCX_TIERCACHE_CONFIG_CACHED_CLOCK_H
#define JCX_TIERCACHE_CONFIG_CACHED_CLOCK_H

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

namespace jcailloux::tiercache::config {

/// CachedClock — background-refreshed steady_clock for the L1 hot path.
///
/// A jthread stores steady_clock::now() into an atomic every kInterval;
/// now() is a single relaxed load. The thread runs while at least one
/// Subscription is alive (every MemoryCache holds one), so the cached value
/// can never freeze under a live cache.
///
/// Precision is kInterval: the value lags steady_clock by up to kInterval.
/// Expiry decisions read steady_clock directly.
struct CachedClock {
    using Clock      = std::chrono::steady_clock;
    using time_point = Clock::time_point;
    using duration   = Clock::duration;
    using rep        = duration::rep;

    static constexpr auto kInterval = std::chrono::milliseconds{10};

    static time_point now() noexcept {
        return time_point{duration{rep_.load(std::memory_order_relaxed)}};
    }

    /// RAII handle keeping the refresh thread alive.
    class Subscription {
    public:
        Subscription() { acquire(); }
        ~Subscription() { release(); }
        Subscription(const Subscription&) : Subscription() {}
        Subscription& operator=(const Subscription&) { return *this; }
    };

private:
    static void acquire() {
        std::lock_guard lock(mutex_);
        if (subscribers_++ == 0) {
            rep_.store(Clock::now().time_since_epoch().count(), std::memory_order_relaxed);
            thread_ = std::jthread{[](std::stop_token st) {
                while (!st.stop_requested()) {
                    std::this_thread::sleep_for(kInterval);
                    rep_.store(Clock::now().time_since_epoch().count(),
                               std::memory_order_relaxed);
                }
            }};
        }
    }

    static void release() {
        std::jthread finished;
        {
            std::lock_guard lock(mutex_);
            if (--subscribers_ == 0) finished = std::move(thread_);
        }
        // finished joins here, outside the lock
    }

    alignas(64) static inline std::atomic<rep> rep_{
        Clock::now().time_since_epoch().count()};

    static inline std::mutex mutex_;
    static inline size_t subscribers_ = 0;
    static inline std::jthread thread_;
};

}  // namespace jcailloux::tiercache::config

#endif  // JCX_TIERCACHE_CONFIG_CACHED_CLOCK_H
