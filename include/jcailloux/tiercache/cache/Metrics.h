#ifndef JCX_TIERCACHE_CACHE_METRICS_H
#define JCX_TIERCACHE_CACHE_METRICS_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <thread>

namespace jcailloux::tiercache::cache {

/// Striped atomic counter: 8 cache-line-aligned slots.
/// Total footprint: ~512 bytes per counter.
struct StripedCounter {
    static constexpr unsigned kSlots = 8;
    static constexpr unsigned kMask = kSlots - 1;

    struct alignas(64) Slot {
        std::atomic<uint64_t> value{0};
    };

    Slot slots[kSlots];

    void add(uint64_t n) noexcept {
        auto idx = std::hash<std::thread::id>{}(std::this_thread::get_id()) & kMask;
        slots[idx].value.fetch_add(n, std::memory_order_relaxed);
    }

    void increment() noexcept { add(1); }

    [[nodiscard]] uint64_t load() const noexcept {
        uint64_t total = 0;
        for (unsigned i = 0; i < kSlots; ++i)
            total += slots[i].value.load(std::memory_order_relaxed);
        return total;
    }

    void reset() noexcept {
        for (unsigned i = 0; i < kSlots; ++i)
            slots[i].value.store(0, std::memory_order_relaxed);
    }
};

/// Immutable snapshot of a MetricsCollector.
struct MetricsSnapshot {
    uint64_t l1_hits = 0;
    uint64_t l2_hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t sets = 0;
    uint64_t deletes = 0;
    uint64_t invalidated_keys = 0;
    uint64_t decode_errors = 0;
    uint64_t store_errors = 0;
    uint64_t serialization_errors = 0;
    uint64_t bytes_in = 0;        ///< encoded size before compression
    uint64_t bytes_stored = 0;    ///< payload size actually stored
    uint64_t latency_samples = 0;
    double avg_latency_ms = 0.0;

    [[nodiscard]] uint64_t hits() const noexcept { return l1_hits + l2_hits; }

    [[nodiscard]] uint64_t requests() const noexcept { return hits() + misses; }

    [[nodiscard]] double hitRatio() const noexcept {
        auto total = requests();
        return total ? static_cast<double>(hits()) / static_cast<double>(total) : 0.0;
    }

    [[nodiscard]] double l1HitRatio() const noexcept {
        auto total = requests();
        return total ? static_cast<double>(l1_hits) / static_cast<double>(total) : 0.0;
    }

    /// bytes_stored / bytes_in; 1.0 when nothing was written.
    [[nodiscard]] double compressionRatio() const noexcept {
        return bytes_in ? static_cast<double>(bytes_stored) / static_cast<double>(bytes_in) : 1.0;
    }
};

// =============================================================================
// MetricsCollector — counters of one CacheService
//
// Counters are monotonic; the latency average is a running mean over every
// recorded sample. All members are safe to update from any thread.
// =============================================================================

class MetricsCollector {
public:
    StripedCounter l1_hits;
    StripedCounter l2_hits;
    StripedCounter misses;
    StripedCounter evictions;
    StripedCounter sets;
    StripedCounter deletes;
    StripedCounter invalidated_keys;
    StripedCounter decode_errors;
    StripedCounter store_errors;
    StripedCounter serialization_errors;
    StripedCounter bytes_in;
    StripedCounter bytes_stored;

    template<typename Rep, typename Period>
    void recordLatency(std::chrono::duration<Rep, Period> elapsed) noexcept {
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count();
        latency_ns_.add(ns > 0 ? static_cast<uint64_t>(ns) : 0);
        latency_samples_.increment();
    }

    void recordWrite(uint64_t raw_size, uint64_t stored_size) noexcept {
        sets.increment();
        bytes_in.add(raw_size);
        bytes_stored.add(stored_size);
    }

    [[nodiscard]] MetricsSnapshot snapshot() const noexcept {
        MetricsSnapshot s;
        s.l1_hits = l1_hits.load();
        s.l2_hits = l2_hits.load();
        s.misses = misses.load();
        s.evictions = evictions.load();
        s.sets = sets.load();
        s.deletes = deletes.load();
        s.invalidated_keys = invalidated_keys.load();
        s.decode_errors = decode_errors.load();
        s.store_errors = store_errors.load();
        s.serialization_errors = serialization_errors.load();
        s.bytes_in = bytes_in.load();
        s.bytes_stored = bytes_stored.load();
        s.latency_samples = latency_samples_.load();
        if (s.latency_samples)
            s.avg_latency_ms = static_cast<double>(latency_ns_.load())
                             / static_cast<double>(s.latency_samples) / 1e6;
        return s;
    }

    /// Zero every counter. Not atomic with respect to concurrent updates.
    void reset() noexcept {
        for (auto* c : {&l1_hits, &l2_hits, &misses, &evictions, &sets, &deletes,
                        &invalidated_keys, &decode_errors, &store_errors,
                        &serialization_errors, &bytes_in, &bytes_stored,
                        &latency_ns_, &latency_samples_})
            c->reset();
    }

    /// Records the time from construction to destruction as one sample.
    class LatencyTimer {
    public:
        explicit LatencyTimer(MetricsCollector& m) noexcept
            : metrics_(m), start_(std::chrono::steady_clock::now()) {}
        ~LatencyTimer() { metrics_.recordLatency(std::chrono::steady_clock::now() - start_); }

        LatencyTimer(const LatencyTimer&) = delete;
        LatencyTimer& operator=(const LatencyTimer&) = delete;

    private:
        MetricsCollector& metrics_;
        std::chrono::steady_clock::time_point start_;
    };

private:
    StripedCounter latency_ns_;
    StripedCounter latency_samples_;
};

}  // namespace jcailloux::tiercache::cache

#endif  // JCX_TIERCACHE_CACHE_METRICS_H
