/**
 * test_concurrency.cpp
 *
 * Concurrency stress tests for CacheService and its tiers.
 * Concurrent reads, writes and invalidations must not crash, deadlock or
 * corrupt the internal maps. Stale reads are expected and not checked.
 *
 * Catch2 assertions are not thread-safe: workers count failures in atomics
 * and the main thread checks them after join.
 */

#include <catch2/catch_test_macros.hpp>

#include <jcailloux/tiercache/CacheService.h>

#include "fixtures/FakeRedis.h"
#include "fixtures/LoopOnlyStore.h"
#include "fixtures/TestRunner.h"

#include <atomic>
#include <chrono>
#include <latch>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace jcailloux::tiercache;
using namespace std::chrono_literals;
using test::FakeRedis;
using test::sync;

// #############################################################################
//
//  Constants and helpers
//
// #############################################################################

static constexpr int NUM_THREADS = 8;
static constexpr int OPS_PER_THREAD = 200;

/// Run fn(thread_index) on N threads released together by a latch.
/// Exceptions inside threads are counted and checked in the main thread.
template<typename Fn>
void parallel(int num_threads, Fn&& fn) {
    std::latch start{num_threads};
    std::atomic<int> errors{0};
    std::vector<std::jthread> threads;
    threads.reserve(num_threads);

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i]() {
            start.arrive_and_wait();
            try {
                fn(i);
            } catch (...) {
                errors.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }

    for (auto& t : threads) t.join();
    REQUIRE(errors.load() == 0);
}

static std::string keyOf(int i) { return "k" + std::to_string(i % 16); }

// #############################################################################
//
//  1. L1 alone
//
// #############################################################################

TEST_CASE("Concurrency: MemoryCache under mixed load stays bounded", "[concurrency][l1]") {
    cache::MemoryCache<> l1({.max_entries = 32, .default_ttl = std::chrono::minutes(1)});

    parallel(NUM_THREADS, [&](int t) {
        for (int i = 0; i < OPS_PER_THREAD; ++i) {
            auto key = "k" + std::to_string((t * 31 + i) % 64);
            switch (i % 4) {
                case 0: l1.set(key, "\x01" "1", cache::Encoding::Json, std::chrono::seconds(10)); break;
                case 1: (void)l1.get(key); break;
                case 2: l1.remove(key); break;
                case 3: l1.purgeExpired(); break;
            }
        }
    });

    REQUIRE(l1.size() <= 32);
}

// #############################################################################
//
//  2. Full service
//
// #############################################################################

TEST_CASE("Concurrency: get/set/remove storm", "[concurrency][service]") {
    auto redis = std::make_shared<FakeRedis>();
    CacheService cache(config::CacheConfig{}.with_l1_max_entries(8));
    cache.attach(redis->provider());

    std::atomic<int> gets{0};

    parallel(NUM_THREADS, [&](int t) {
        for (int i = 0; i < OPS_PER_THREAD; ++i) {
            auto key = keyOf(t + i);
            switch ((t + i) % 3) {
                case 0: sync(cache.set(key, t * 1000 + i, 60s)); break;
                case 1: (void)sync(cache.get<int>(key)); gets.fetch_add(1); break;
                case 2: sync(cache.remove(key)); break;
            }
        }
    });

    auto m = cache.metrics();
    REQUIRE(m.requests() == static_cast<uint64_t>(gets.load()));
    REQUIRE(cache.l1().size() <= 8);

    // Still coherent afterwards
    REQUIRE(sync(cache.set("after", 7, 60s)));
    REQUIRE(sync(cache.get<int>("after")) == 7);
}

TEST_CASE("Concurrency: tag invalidation while writers tag keys", "[concurrency][tags]") {
    auto redis = std::make_shared<FakeRedis>();
    CacheService cache;
    cache.attach(redis->provider());

    std::atomic<size_t> invalidated{0};

    parallel(NUM_THREADS, [&](int t) {
        for (int i = 0; i < OPS_PER_THREAD; ++i) {
            if (t % 2 == 0) {
                sync(cache.set("t" + std::to_string(t) + ":" + std::to_string(i), i, 60s,
                               {"group:" + std::to_string(i % 4)}));
            } else {
                invalidated.fetch_add(sync(cache.invalidateByTag("group:" + std::to_string(i % 4))));
            }
        }
    });

    // Whatever survived is still reachable through its tag.
    size_t rest = 0;
    for (int g = 0; g < 4; ++g)
        rest += sync(cache.invalidateByTag("group:" + std::to_string(g)));

    // Two invalidators racing on the same key may both count it.
    const size_t written = (NUM_THREADS / 2) * OPS_PER_THREAD;
    REQUIRE(invalidated.load() + rest >= written);
    REQUIRE(cache.l1().size() == 0);
    REQUIRE(redis->keyCount() == 0);
}

TEST_CASE("Concurrency: store flapping while serving", "[concurrency][degraded]") {
    auto redis = std::make_shared<FakeRedis>();
    CacheService cache;
    cache.attach(redis->provider());

    parallel(NUM_THREADS, [&](int t) {
        for (int i = 0; i < OPS_PER_THREAD; ++i) {
            if (t == 0 && i % 10 == 0) redis->setOffline((i / 10) % 2 == 0);
            auto key = keyOf(i);
            if (i % 2 == 0) sync(cache.set(key, i, 60s, {"flap"}));
            else (void)sync(cache.get<int>(key));
        }
    });
    redis->setOffline(false);

    REQUIRE(sync(cache.ping()));
    REQUIRE(cache.metrics().store_errors > 0);
}

// #############################################################################
//
//  3. Store confined to its event loop
//
// #############################################################################

namespace {

struct RoundTrips {
    std::atomic<int> done{0};
    std::atomic<int> wrong{0};
};

/// set, drop the L1 copy, then read back through L2.
io::Task<void> writeThenReadThroughL2(CacheService& cache, std::string key, int value, RoundTrips& trips) {
    try {
        co_await cache.set(key, value, 60s);
        cache.l1().remove(cache.composeKey(key));
        auto got = co_await cache.get<int>(key);
        if (!got || *got != value) trips.wrong.fetch_add(1);
    } catch (const std::exception&) {
        trips.wrong.fetch_add(1);
    }
    trips.done.fetch_add(1);
}

}  // namespace

TEST_CASE("Concurrency: callers on many threads share one loop-bound store",
          "[concurrency][service][thread]") {
    io::EpollIoContext io;
    auto state = std::make_shared<test::LoopOnlyStore>(io);
    CacheService cache;
    cache.attach(StoreProvider::onLoop(io, test::LoopOnlyStore::direct(state)));

    RoundTrips trips;
    std::jthread loop([&] { io.run(); });

    parallel(NUM_THREADS, [&](int t) {
        for (int i = 0; i < OPS_PER_THREAD; ++i)
            test::spawn(writeThenReadThroughL2(cache, "t" + std::to_string(t) + ":" + std::to_string(i),
                                               t * OPS_PER_THREAD + i, trips));
    });

    const int total = NUM_THREADS * OPS_PER_THREAD;
    const auto deadline = std::chrono::steady_clock::now() + 10s;
    while (trips.done.load() < total && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(1ms);

    io.post([&] { io.stop(); });
    loop.join();

    REQUIRE(trips.done.load() == total);
    REQUIRE(trips.wrong.load() == 0);
    REQUIRE(state->off_loop_calls.load() == 0);
    REQUIRE(state->values.size() == static_cast<size_t>(total));
    REQUIRE(cache.metrics().l2_hits == static_cast<uint64_t>(total));
}
