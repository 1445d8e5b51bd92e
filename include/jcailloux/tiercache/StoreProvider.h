#ifndef JCX_TIERCACHE_STORE_PROVIDER_H
#define JCX_TIERCACHE_STORE_PROVIDER_H

#include <chrono>
#include <concepts>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "jcailloux/tiercache/Log.h"
#include "jcailloux/tiercache/io/Task.h"
#include "jcailloux/tiercache/io/IoContext.h"
#include "jcailloux/tiercache/io/redis/RedisClient.h"
#include "jcailloux/tiercache/io/redis/RedisError.h"
#include "jcailloux/tiercache/io/redis/RedisResult.h"
#include "jcailloux/tiercache/config/StoreUrl.h"

namespace jcailloux::tiercache {

// =============================================================================
// StoreProvider — type-erased handle on the backing store
//
// Wraps io::RedisClient<Io> behind std::function so the cache layer does not
// depend on the concrete IoContext type. Unlike a process-wide locator, each
// CacheService owns its own provider; copies share the same connection.
//
// Construction (in application startup):
//   auto store = co_await StoreProvider::connect(io, url, 1s);
//   service.attach(std::move(store));
//
// Usage in the cache layer:
//   auto reply = co_await store.exec("GET", key);
//   auto replies = co_await store.pipeline({{"GET", key}, {"PTTL", key}});
//
// A default-constructed provider is detached: every call throws
// io::RedisConnectionError.
//
// Providers built by connect() may be awaited from any thread: each call
// hops onto the event loop that owns the connection and completes there.
// onLoop() applies the same rule to any other provider.
// =============================================================================

class StoreProvider {
public:
    using ExecFn = std::function<io::Task<io::RedisResult>(io::RedisCommand)>;
    using PipelineFn = std::function<io::Task<std::vector<io::RedisResult>>(
        std::vector<io::RedisCommand>)>;

    StoreProvider() = default;

    StoreProvider(ExecFn exec, PipelineFn pipeline)
        : exec_(std::move(exec)), pipeline_(std::move(pipeline)) {}

    /// Execute one command. Arguments are converted to strings; binary data
    /// can be passed as std::string_view (RESP2 strings are length-prefixed).
    /// Error replies throw io::RedisError.
    template<typename... Args>
    io::Task<io::RedisResult> exec(Args&&... args) const {
        io::RedisCommand cmd;
        cmd.reserve(sizeof...(args));
        (cmd.push_back(toStr(std::forward<Args>(args))), ...);
        return execCommand(std::move(cmd));
    }

    io::Task<io::RedisResult> execCommand(io::RedisCommand cmd) const {
        if (!exec_) return detachedExec();
        return exec_(std::move(cmd));
    }

    /// Send all commands in one round trip; one reply per command, in order.
    /// Error replies are returned, not thrown.
    io::Task<std::vector<io::RedisResult>> pipeline(std::vector<io::RedisCommand> cmds) const {
        if (!pipeline_) return detachedPipeline();
        return pipeline_(std::move(cmds));
    }

    [[nodiscard]] bool attached() const noexcept { return exec_ != nullptr; }

    // =========================================================================
    // Factories
    // =========================================================================

    /// Bind to an already connected client. No reconnection.
    template<io::IoContext Io>
    static StoreProvider fromClient(std::shared_ptr<io::RedisClient<Io>> client) {
        return StoreProvider(
            [client](io::RedisCommand cmd) -> io::Task<io::RedisResult> {
                return execOn(client, std::move(cmd));
            },
            [client](std::vector<io::RedisCommand> cmds) -> io::Task<std::vector<io::RedisResult>> {
                return pipelineOn(client, std::move(cmds));
            });
    }

    /// Connect to `url` and return a provider that reconnects on demand.
    /// The first connection attempt is made here and its failure propagates.
    /// Afterwards a dropped connection is re-established by the next call,
    /// at most once per `retry_interval`; calls in between fail fast with
    /// io::RedisConnectionError.
    template<io::IoContext Io>
    static io::Task<StoreProvider> connect(Io& io, config::StoreUrl url,
                                           std::chrono::milliseconds retry_interval) {
        auto link = std::make_shared<Link<Io>>(io, std::move(url), retry_interval);
        co_await link->ensureClient();

        co_return onLoop(io, StoreProvider(
            [link](io::RedisCommand cmd) { return Link<Io>::exec(link, std::move(cmd)); },
            [link](std::vector<io::RedisCommand> cmds) { return Link<Io>::pipeline(link, std::move(cmds)); }));
    }

    /// Run every call of `inner` on the loop thread of `io`. The caller
    /// resumes on that thread. `io` must outlive the returned provider.
    template<io::IoContext Io>
    static StoreProvider onLoop(Io& io, StoreProvider inner) {
        std::shared_ptr<const StoreProvider> target = std::make_shared<StoreProvider>(std::move(inner));
        Io* loop = &io;
        return StoreProvider(
            [loop, target](io::RedisCommand cmd) { return execOnLoop(*loop, target, std::move(cmd)); },
            [loop, target](std::vector<io::RedisCommand> cmds) {
                return pipelineOnLoop(*loop, target, std::move(cmds));
            });
    }

private:
    // The coroutines below take their shared_ptr by value: the frame keeps
    // the client alive even if every provider copy is destroyed mid-call.

    template<io::IoContext Io>
    static io::Task<io::RedisResult> execOn(std::shared_ptr<io::RedisClient<Io>> client,
                                            io::RedisCommand cmd) {
        co_return co_await client->exec(std::move(cmd));
    }

    template<io::IoContext Io>
    static io::Task<std::vector<io::RedisResult>> pipelineOn(
        std::shared_ptr<io::RedisClient<Io>> client, std::vector<io::RedisCommand> cmds) {
        co_return co_await client->pipeline(std::move(cmds));
    }

    template<io::IoContext Io>
    static io::Task<io::RedisResult> execOnLoop(Io& io, std::shared_ptr<const StoreProvider> target,
                                                io::RedisCommand cmd) {
        co_await io::resumeOn(io);
        co_return co_await target->execCommand(std::move(cmd));
    }

    template<io::IoContext Io>
    static io::Task<std::vector<io::RedisResult>> pipelineOnLoop(
        Io& io, std::shared_ptr<const StoreProvider> target, std::vector<io::RedisCommand> cmds) {
        co_await io::resumeOn(io);
        co_return co_await target->pipeline(std::move(cmds));
    }

    // Loop-thread state: reached only through onLoop(), after connect().
    template<io::IoContext Io>
    struct Link {
        using Clock = std::chrono::steady_clock;

        Link(Io& io_, config::StoreUrl url_, std::chrono::milliseconds interval_)
            : io(&io_), url(std::move(url_)), interval(interval_) {}

        io::Task<void> ensureClient() {
            if (client && client->connected()) co_return;

            auto now = Clock::now();
            if (connecting || (attempted && now - last_attempt < interval))
                throw io::RedisConnectionError("backing store unavailable, reconnect pending");

            attempted = true;
            connecting = true;
            last_attempt = now;
            try {
                client = co_await io::RedisClient<Io>::connect(*io, url);
                connecting = false;
                TIERCACHE_LOG_INFO << "StoreProvider: connected to " << url.redacted();
            } catch (const std::exception& e) {
                connecting = false;
                client.reset();
                TIERCACHE_LOG_WARN << "StoreProvider: connect to " << url.redacted()
                                   << " failed: " << e.what();
                throw;
            }
        }

        static io::Task<io::RedisResult> exec(std::shared_ptr<Link> self, io::RedisCommand cmd) {
            co_await self->ensureClient();
            auto client = self->client;
            co_return co_await client->exec(std::move(cmd));
        }

        static io::Task<std::vector<io::RedisResult>> pipeline(
            std::shared_ptr<Link> self, std::vector<io::RedisCommand> cmds) {
            co_await self->ensureClient();
            auto client = self->client;
            co_return co_await client->pipeline(std::move(cmds));
        }

        Io* io;
        config::StoreUrl url;
        std::chrono::milliseconds interval;
        std::shared_ptr<io::RedisClient<Io>> client;
        Clock::time_point last_attempt{};
        bool attempted = false;
        bool connecting = false;
    };

    static io::Task<io::RedisResult> detachedExec() {
        throw io::RedisConnectionError("no backing store attached");
        co_return io::RedisResult{};
    }

    static io::Task<std::vector<io::RedisResult>> detachedPipeline() {
        throw io::RedisConnectionError("no backing store attached");
        co_return std::vector<io::RedisResult>{};
    }

    static std::string toStr(const char* s) { return s; }
    static std::string toStr(std::string_view s) { return std::string(s); }
    static std::string toStr(const std::string& s) { return s; }
    static std::string toStr(std::string&& s) { return std::move(s); }

    template<typename T> requires std::integral<T>
    static std::string toStr(T v) { return std::to_string(v); }

    ExecFn exec_;
    PipelineFn pipeline_;
};

}  // namespace jcailloux::tiercache

#endif  // JCX_TIERCACHE_STORE_PROVIDER_H
