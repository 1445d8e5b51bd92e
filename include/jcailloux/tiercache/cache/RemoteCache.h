#ifndef JCX_TIERCACHE_CACHE_REMOTE_CACHE_H
#define JCX_TIERCACHE_CACHE_REMOTE_CACHE_H

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "jcailloux/tiercache/Log.h"
#include "jcailloux/tiercache/StoreProvider.h"
#include "jcailloux/tiercache/cache/Metrics.h"
#include "jcailloux/tiercache/io/Task.h"
#include "jcailloux/tiercache/io/redis/RedisResult.h"

namespace jcailloux::tiercache::cache {

/// Value read together with its remaining store-side TTL.
struct RemoteValue {
    std::string bytes;
    /// nullopt when the key has no expiry.
    std::optional<std::chrono::milliseconds> ttl;
};

/// Escape glob metacharacters so `s` matches itself in a SCAN MATCH pattern.
[[nodiscard]] inline std::string escapeGlob(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

// =============================================================================
// RemoteCache — L2 adapter over the backing store
//
// Every operation catches store failures, logs a warning naming the command
// and degrades: reads return nullopt, writes return false, counts return 0.
// Nothing is rethrown. Without an attached store every call returns that
// degraded value immediately.
//
// Bulk operations are split into chunks of `chunk_size` keys or commands,
// one pipeline round trip per chunk.
//
// attach() and detach() must not run concurrently with other calls.
// =============================================================================

class RemoteCache {
public:
    explicit RemoteCache(size_t chunk_size = 512, StripedCounter* error_counter = nullptr)
        : chunk_size_(std::max<size_t>(chunk_size, 1)), errors_(error_counter) {}

    void attach(StoreProvider store) { store_ = std::move(store); }
    void detach() { store_ = StoreProvider{}; }

    [[nodiscard]] bool attached() const noexcept { return store_.attached(); }
    [[nodiscard]] size_t chunkSize() const noexcept { return chunk_size_; }

    // =========================================================================
    // Single keys
    // =========================================================================

    io::Task<std::optional<std::string>> get(std::string key) {
        if (!attached()) co_return std::nullopt;

        try {
            auto result = co_await store_.exec("GET", key);
            if (result.isNil()) co_return std::nullopt;
            co_return result.asString();
        } catch (const std::exception& e) {
            failed("GET", e);
            co_return std::nullopt;
        }
    }

    /// GET and PTTL in one round trip.
    io::Task<std::optional<RemoteValue>> getWithTtl(std::string key) {
        if (!attached()) co_return std::nullopt;

        try {
            std::vector<io::RedisCommand> cmds{{"GET", key}, {"PTTL", key}};
            auto replies = co_await store_.pipeline(std::move(cmds));
            if (replies.size() != 2 || !checkReplies("GET/PTTL", replies))
                co_return std::nullopt;
            if (replies[0].isNil()) co_return std::nullopt;

            auto pttl = replies[1].asInteger();
            // -2: the key expired between the two commands
            if (pttl == -2) co_return std::nullopt;

            RemoteValue value{replies[0].asString(), std::nullopt};
            if (pttl >= 0) value.ttl = std::chrono::milliseconds{pttl};
            co_return value;
        } catch (const std::exception& e) {
            failed("GET/PTTL", e);
            co_return std::nullopt;
        }
    }

    template<typename Rep, typename Period>
    io::Task<bool> set(std::string key, std::string bytes, std::chrono::duration<Rep, Period> ttl) {
        if (!attached()) co_return false;

        try {
            co_await store_.exec("SETEX", key, ttlSeconds(ttl), std::string_view(bytes));
            co_return true;
        } catch (const std::exception& e) {
            failed("SETEX", e);
            co_return false;
        }
    }

    template<typename Rep, typename Period>
    io::Task<bool> expire(std::string key, std::chrono::duration<Rep, Period> ttl) {
        if (!attached()) co_return false;

        try {
            auto result = co_await store_.exec("EXPIRE", key, ttlSeconds(ttl));
            co_return result.asInteger() == 1;
        } catch (const std::exception& e) {
            failed("EXPIRE", e);
            co_return false;
        }
    }

    /// UNLINK each key. @return per-key "was present" flags, in input order,
    /// or nullopt when the store could not be reached.
    io::Task<std::optional<std::vector<bool>>> remove(std::vector<std::string> keys) {
        if (!attached()) co_return std::nullopt;

        std::vector<bool> present;
        present.reserve(keys.size());
        try {
            for (size_t begin = 0; begin < keys.size(); begin += chunk_size_) {
                const size_t end = std::min(keys.size(), begin + chunk_size_);
                std::vector<io::RedisCommand> cmds;
                cmds.reserve(end - begin);
                for (size_t i = begin; i < end; ++i)
                    cmds.push_back({"UNLINK", keys[i]});

                auto replies = co_await store_.pipeline(std::move(cmds));
                if (!checkReplies("UNLINK", replies)) co_return std::nullopt;
                for (const auto& r : replies)
                    present.push_back(r.asInteger() > 0);
            }
            co_return present;
        } catch (const std::exception& e) {
            failed("UNLINK", e);
            co_return std::nullopt;
        }
    }

    io::Task<bool> ping() {
        if (!attached()) co_return false;

        try {
            auto result = co_await store_.exec("PING");
            co_return result.asStringView() == "PONG";
        } catch (const std::exception& e) {
            failed("PING", e);
            co_return false;
        }
    }

    // =========================================================================
    // Sets (tag and dependency registries)
    // =========================================================================

    /// SADD the members, then bound the set's lifetime: EXPIRE NX gives a new
    /// set its first TTL, EXPIRE GT only ever extends an existing one.
    template<typename Rep, typename Period>
    io::Task<bool> addToSet(std::string set_key, std::vector<std::string> members,
                            std::chrono::duration<Rep, Period> ttl) {
        if (!attached() || members.empty()) co_return false;

        try {
            io::RedisCommand sadd;
            sadd.reserve(members.size() + 2);
            sadd.push_back("SADD");
            sadd.push_back(set_key);
            for (auto& m : members) sadd.push_back(std::move(m));

            auto seconds = std::to_string(ttlSeconds(ttl));
            std::vector<io::RedisCommand> cmds;
            cmds.push_back(std::move(sadd));
            cmds.push_back({"EXPIRE", set_key, seconds, "NX"});
            cmds.push_back({"EXPIRE", set_key, seconds, "GT"});

            auto replies = co_await store_.pipeline(std::move(cmds));
            co_return checkReplies("SADD/EXPIRE", replies);
        } catch (const std::exception& e) {
            failed("SADD", e);
            co_return false;
        }
    }

    io::Task<std::optional<std::vector<std::string>>> setMembers(std::string set_key) {
        if (!attached()) co_return std::nullopt;

        try {
            auto result = co_await store_.exec("SMEMBERS", set_key);
            co_return result.asStringArray();
        } catch (const std::exception& e) {
            failed("SMEMBERS", e);
            co_return std::nullopt;
        }
    }

    /// SREM exactly `members`; an emptied set is deleted by the store.
    io::Task<bool> removeFromSet(std::string set_key, std::vector<std::string> members) {
        if (!attached()) co_return false;
        if (members.empty()) co_return true;

        try {
            std::vector<io::RedisCommand> cmds;
            for (size_t begin = 0; begin < members.size(); begin += chunk_size_) {
                const size_t end = std::min(members.size(), begin + chunk_size_);
                io::RedisCommand srem;
                srem.reserve(end - begin + 2);
                srem.push_back("SREM");
                srem.push_back(set_key);
                for (size_t i = begin; i < end; ++i) srem.push_back(std::move(members[i]));
                cmds.push_back(std::move(srem));
            }
            auto replies = co_await store_.pipeline(std::move(cmds));
            co_return checkReplies("SREM", replies);
        } catch (const std::exception& e) {
            failed("SREM", e);
            co_return false;
        }
    }

    // =========================================================================
    // Bulk
    // =========================================================================

    /// Values for `keys` in input order (nullopt per missing key), or nullopt
    /// when the store could not be reached.
    io::Task<std::optional<std::vector<std::optional<std::string>>>> mget(std::vector<std::string> keys) {
        if (!attached()) co_return std::nullopt;

        std::vector<std::optional<std::string>> values;
        values.reserve(keys.size());
        try {
            std::vector<io::RedisCommand> cmds;
            for (size_t begin = 0; begin < keys.size(); begin += chunk_size_) {
                const size_t end = std::min(keys.size(), begin + chunk_size_);
                io::RedisCommand mget;
                mget.reserve(end - begin + 1);
                mget.push_back("MGET");
                for (size_t i = begin; i < end; ++i) mget.push_back(keys[i]);
                cmds.push_back(std::move(mget));
            }
            if (cmds.empty()) co_return values;

            auto replies = co_await store_.pipeline(std::move(cmds));
            if (!checkReplies("MGET", replies)) co_return std::nullopt;
            for (const auto& reply : replies) {
                for (size_t i = 0; i < reply.arraySize(); ++i)
                    values.push_back(reply.at(i).asOptionalString());
            }
            if (values.size() != keys.size()) {
                TIERCACHE_LOG_WARN << "RemoteCache MGET: expected " << keys.size()
                                   << " values, got " << values.size();
                countError();
                co_return std::nullopt;
            }
            co_return values;
        } catch (const std::exception& e) {
            failed("MGET", e);
            co_return std::nullopt;
        }
    }

    /// mget() plus the remaining TTL of every key: each chunk pipelines one
    /// MGET and one PTTL per key, still one round trip per chunk.
    io::Task<std::optional<std::vector<std::optional<RemoteValue>>>> mgetWithTtl(
        std::vector<std::string> keys) {
        if (!attached()) co_return std::nullopt;

        std::vector<std::optional<RemoteValue>> values;
        values.reserve(keys.size());
        try {
            for (size_t begin = 0; begin < keys.size(); begin += chunk_size_) {
                const size_t end = std::min(keys.size(), begin + chunk_size_);
                std::vector<io::RedisCommand> cmds;
                cmds.reserve(end - begin + 1);

                io::RedisCommand mget;
                mget.reserve(end - begin + 1);
                mget.push_back("MGET");
                for (size_t i = begin; i < end; ++i) mget.push_back(keys[i]);
                cmds.push_back(std::move(mget));
                for (size_t i = begin; i < end; ++i) cmds.push_back({"PTTL", keys[i]});

                auto replies = co_await store_.pipeline(std::move(cmds));
                if (!checkReplies("MGET/PTTL", replies)) co_return std::nullopt;
                if (replies.size() != end - begin + 1 || replies[0].arraySize() != end - begin) {
                    TIERCACHE_LOG_WARN << "RemoteCache MGET/PTTL: unexpected reply shape";
                    countError();
                    co_return std::nullopt;
                }

                for (size_t i = 0; i < end - begin; ++i) {
                    auto bytes = replies[0].at(i).asOptionalString();
                    auto pttl = replies[i + 1].asInteger();
                    if (!bytes || pttl == -2) {
                        values.emplace_back(std::nullopt);
                        continue;
                    }
                    RemoteValue value{std::move(*bytes), std::nullopt};
                    if (pttl >= 0) value.ttl = std::chrono::milliseconds{pttl};
                    values.emplace_back(std::move(value));
                }
            }
            co_return values;
        } catch (const std::exception& e) {
            failed("MGET/PTTL", e);
            co_return std::nullopt;
        }
    }

    /// Pipelined SETEX of every entry with the same TTL.
    template<typename Rep, typename Period>
    io::Task<bool> mset(std::vector<std::pair<std::string, std::string>> entries,
                        std::chrono::duration<Rep, Period> ttl) {
        if (!attached()) co_return false;

        auto seconds = std::to_string(ttlSeconds(ttl));
        try {
            for (size_t begin = 0; begin < entries.size(); begin += chunk_size_) {
                const size_t end = std::min(entries.size(), begin + chunk_size_);
                std::vector<io::RedisCommand> cmds;
                cmds.reserve(end - begin);
                for (size_t i = begin; i < end; ++i)
                    cmds.push_back({"SETEX", std::move(entries[i].first), seconds,
                                    std::move(entries[i].second)});

                auto replies = co_await store_.pipeline(std::move(cmds));
                if (!checkReplies("SETEX", replies)) co_return false;
            }
            co_return true;
        } catch (const std::exception& e) {
            failed("SETEX", e);
            co_return false;
        }
    }

    /// Delete every key matching `pattern` using SCAN (non-blocking) and
    /// UNLINK. @return number of keys deleted
    io::Task<size_t> scanDelete(std::string pattern) {
        if (!attached()) co_return 0;

        size_t count = 0;
        try {
            std::string cursor = "0";
            do {
                auto result = co_await store_.exec(
                    "SCAN", cursor, "MATCH", pattern, "COUNT", chunk_size_);
                if (!result.isArray() || result.arraySize() < 2) break;

                cursor = result.at(0).asString();
                auto batch = result.at(1).asStringArray();
                std::erase_if(batch, [](const std::string& k) { return k.empty(); });
                if (batch.empty()) continue;

                io::RedisCommand unlink;
                unlink.reserve(batch.size() + 1);
                unlink.push_back("UNLINK");
                for (auto& k : batch) unlink.push_back(std::move(k));
                auto removed = co_await store_.execCommand(std::move(unlink));
                count += static_cast<size_t>(std::max<int64_t>(removed.asInteger(), 0));
            } while (cursor != "0");

            co_return count;
        } catch (const std::exception& e) {
            failed("SCAN/UNLINK", e);
            co_return count;
        }
    }

private:
    /// SETEX and EXPIRE take whole seconds; sub-second TTLs round up to 1.
    template<typename Rep, typename Period>
    static long long ttlSeconds(std::chrono::duration<Rep, Period> ttl) {
        auto s = std::chrono::ceil<std::chrono::seconds>(ttl).count();
        return s < 1 ? 1 : static_cast<long long>(s);
    }

    bool checkReplies(std::string_view command, const std::vector<io::RedisResult>& replies) {
        for (const auto& r : replies) {
            if (r.isError()) {
                TIERCACHE_LOG_WARN << "RemoteCache " << command << " error: " << r.errorMessage();
                countError();
                return false;
            }
        }
        return true;
    }

    void failed(std::string_view command, const std::exception& e) {
        TIERCACHE_LOG_WARN << "RemoteCache " << command << " error: " << e.what();
        countError();
    }

    void countError() noexcept {
        if (errors_) errors_->increment();
    }

    StoreProvider store_;
    size_t chunk_size_;
    StripedCounter* errors_;
};

}  // namespace jcailloux::tiercache::cache

#endif  // JCX_TIERCACHE_CACHE_REMOTE_CACHE_H
