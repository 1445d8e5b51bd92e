#ifndef JCX_TIERCACHE_IO_REDIS_CLIENT_H
#define JCX_TIERCACHE_IO_REDIS_CLIENT_H

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "jcailloux/tiercache/io/Task.h"
#include "jcailloux/tiercache/io/IoContext.h"
#include "jcailloux/tiercache/io/redis/RedisError.h"
#include "jcailloux/tiercache/io/redis/RedisResult.h"
#include "jcailloux/tiercache/io/redis/RedisConnection.h"
#include "jcailloux/tiercache/config/StoreUrl.h"

namespace jcailloux::tiercache::io {

/// One command as owned argument strings (binary-safe).
using RedisCommand = std::vector<std::string>;

// RedisClient — async client over a single RedisConnection.
//
// Callers may await from any thread: pipeline() first moves onto the loop
// thread, where a coroutine mutex serializes them. Each exec()/pipeline()
// owns the connection from first write to last reply, and the caller resumes
// on the loop thread.
// Any transport failure closes the connection; after that every call throws
// RedisConnectionError and the owner is expected to connect a new client.

template<IoContext Io>
class RedisClient {
public:
    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    /// Connect, authenticate and select the database named by `url`.
    static Task<std::shared_ptr<RedisClient>> connect(Io& io, config::StoreUrl url) {
        auto conn = url.isUnix()
            ? co_await RedisConnection<Io>::connectUnix(io, url.path)
            : co_await RedisConnection<Io>::connectTcp(io, url.host, url.port);

        std::shared_ptr<RedisClient> client(new RedisClient(io, std::move(conn)));

        if (!url.password.empty()) {
            if (url.username.empty())
                co_await client->exec({"AUTH", url.password});
            else
                co_await client->exec({"AUTH", url.username, url.password});
        }
        if (url.database != 0)
            co_await client->exec({"SELECT", std::to_string(url.database)});

        co_return client;
    }

    /// Execute one command. Error replies throw RedisError.
    Task<RedisResult> exec(RedisCommand cmd) {
        auto results = co_await pipeline({std::move(cmd)});
        auto& reply = results.front();
        if (reply.isError())
            throw RedisError(reply.errorMessage());
        co_return std::move(reply);
    }

    /// Execute commands as one pipeline: a single flush, then one reply per
    /// command in order. Error replies are returned, not thrown.
    Task<std::vector<RedisResult>> pipeline(std::vector<RedisCommand> cmds) {
        co_await resumeOn(*io_);
        co_await acquireLock();
        LockGuard guard{this};

        try {
            std::vector<std::string_view> argv;
            for (const auto& cmd : cmds) {
                argv.assign(cmd.begin(), cmd.end());
                conn_.queue(argv);
            }
            co_await conn_.flush();
            co_return co_await conn_.readReplies(cmds.size());
        } catch (const RedisProtocolError&) {
            // Reply stream is out of sync; the connection is unusable.
            conn_.close();
            throw;
        }
    }

    [[nodiscard]] bool connected() const noexcept { return conn_.connected(); }

private:
    explicit RedisClient(Io& io, RedisConnection<Io> conn) noexcept
        : io_(&io), conn_(std::move(conn)) {}

    struct LockAwaiter {
        RedisClient* self;

        bool await_ready() const noexcept { return !self->busy_; }

        void await_suspend(std::coroutine_handle<> h) {
            self->waiters_.push_back(h);
        }

        void await_resume() noexcept { self->busy_ = true; }
    };

    struct LockGuard {
        RedisClient* self;
        ~LockGuard() { self->releaseLock(); }
    };

    LockAwaiter acquireLock() { return {this}; }

    void releaseLock() {
        if (!waiters_.empty()) {
            auto next = waiters_.front();
            waiters_.pop_front();
            // busy_ stays true: ownership passes directly to the next waiter.
            // Resume via post to avoid deep stack recursion.
            io_->post([next] { next.resume(); });
        } else {
            busy_ = false;
        }
    }

    Io* io_;
    RedisConnection<Io> conn_;
    bool busy_ = false;
    std::deque<std::coroutine_handle<>> waiters_;
};

} // namespace jcailloux::tiercache::io

#endif // JCX_TIERCACHE_IO_REDIS_CLIENT_H
