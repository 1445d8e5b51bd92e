#ifndef JCX_TIERCACHE_IO_REDIS_CONNECTION_H
#define JCX_TIERCACHE_IO_REDIS_CONNECTION_H

#include <coroutine>
#include <cstring>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cerrno>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "jcailloux/tiercache/io/Task.h"
#include "jcailloux/tiercache/io/IoContext.h"
#include "jcailloux/tiercache/io/redis/RedisError.h"
#include "jcailloux/tiercache/io/redis/RedisResult.h"
#include "jcailloux/tiercache/io/redis/RespWriter.h"
#include "jcailloux/tiercache/io/redis/RespParser.h"

namespace jcailloux::tiercache::io {

// RedisConnection — non-blocking TCP/Unix socket speaking RESP2.
//
// Commands are queued into the write buffer, flushed together, and their
// replies read back in order. Once the peer closes the socket or an I/O
// error occurs the connection is marked broken and every further call
// throws RedisConnectionError.

template<IoContext Io>
class RedisConnection {
public:
    ~RedisConnection() { closeSocket(); }

    RedisConnection(RedisConnection&& o) noexcept
        : io_(o.io_)
        , fd_(std::exchange(o.fd_, -1))
        , watch_(std::exchange(o.watch_, {}))
        , watch_active_(std::exchange(o.watch_active_, false))
        , writer_(std::move(o.writer_))
        , readBuf_(std::move(o.readBuf_))
    {}

    RedisConnection& operator=(RedisConnection&& o) noexcept {
        if (this != &o) {
            closeSocket();
            io_ = o.io_;
            fd_ = std::exchange(o.fd_, -1);
            watch_ = std::exchange(o.watch_, {});
            watch_active_ = std::exchange(o.watch_active_, false);
            writer_ = std::move(o.writer_);
            readBuf_ = std::move(o.readBuf_);
        }
        return *this;
    }

    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    [[nodiscard]] bool connected() const noexcept { return fd_ >= 0; }

    static Task<RedisConnection> connectTcp(Io& io, std::string host, int port) {
        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        auto portStr = std::to_string(port);
        struct addrinfo* res = nullptr;
        int err = ::getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
        if (err != 0)
            throw RedisConnectionError(
                "getaddrinfo(" + host + ") failed: " + gai_strerror(err));

        struct AddrGuard {
            struct addrinfo* p;
            ~AddrGuard() { if (p) freeaddrinfo(p); }
        } guard{res};

        int fd = ::socket(res->ai_family,
            res->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, res->ai_protocol);
        if (fd < 0)
            throw RedisConnectionError("socket() failed: " + std::string(strerror(errno)));

        int ret = ::connect(fd, res->ai_addr, res->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            int saved = errno;
            ::close(fd);
            throw RedisConnectionError(
                "connect(" + host + ":" + portStr + ") failed: " + strerror(saved));
        }

        RedisConnection conn(io, fd);
        if (ret < 0)
            co_await conn.finishConnect();
        co_return std::move(conn);
    }

    static Task<RedisConnection> connectUnix(Io& io, std::string path) {
        int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (fd < 0)
            throw RedisConnectionError("socket() failed: " + std::string(strerror(errno)));

        struct sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

        int ret = ::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
        if (ret < 0 && errno != EINPROGRESS) {
            int saved = errno;
            ::close(fd);
            throw RedisConnectionError(
                "connect(unix:" + path + ") failed: " + strerror(saved));
        }

        RedisConnection conn(io, fd);
        if (ret < 0)
            co_await conn.finishConnect();
        co_return std::move(conn);
    }

    /// Queue one command; nothing is sent until flush().
    void queue(std::span<const std::string_view> args) {
        writer_.writeCommand(args);
    }

    Task<void> flush() {
        ensureOpen();
        while (!writer_.empty()) {
            ssize_t n = ::send(fd_, writer_.data(), writer_.size(), MSG_NOSIGNAL);
            if (n > 0) {
                writer_.consume(static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                co_await awaitEvent(IoEvent::Write);
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            fail("send failed: " + std::string(strerror(errno)));
        }
    }

    /// Read exactly one reply.
    Task<RedisResult> readReply() {
        ensureOpen();
        auto parser = std::make_shared<RespParser>();

        while (true) {
            if (!readBuf_.empty()) {
                size_t consumed = parser->parse(readBuf_.data(), readBuf_.size());
                if (consumed > 0) {
                    readBuf_.erase(0, consumed);
                    co_return RedisResult(std::move(parser));
                }
            }

            co_await awaitEvent(IoEvent::Read);

            char buf[8192];
            ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
            if (n == 0)
                fail("connection closed by peer");
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                fail("recv failed: " + std::string(strerror(errno)));
            }
            readBuf_.append(buf, static_cast<size_t>(n));
        }
    }

    Task<std::vector<RedisResult>> readReplies(size_t n) {
        std::vector<RedisResult> results;
        results.reserve(n);
        for (size_t i = 0; i < n; ++i)
            results.push_back(co_await readReply());
        co_return results;
    }

    /// Drop the socket; used when a command failed halfway through and the
    /// reply stream can no longer be trusted.
    void close() noexcept { closeSocket(); }

private:
    explicit RedisConnection(Io& io, int fd) noexcept : io_(&io), fd_(fd) {}

    Task<void> finishConnect() {
        co_await awaitEvent(IoEvent::Write);

        int so_err = 0;
        socklen_t len = sizeof(so_err);
        ::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_err, &len);
        if (so_err != 0)
            fail("async connect failed: " + std::string(strerror(so_err)));
    }

    void ensureOpen() const {
        if (fd_ < 0)
            throw RedisConnectionError("not connected");
    }

    [[noreturn]] void fail(const std::string& message) {
        closeSocket();
        throw RedisConnectionError(message);
    }

    void closeSocket() noexcept {
        if (fd_ < 0) return;
        removeCurrentWatch();
        ::close(fd_);
        fd_ = -1;
        writer_.clear();
        readBuf_.clear();
    }

    struct EventAwaiter {
        RedisConnection* self;
        IoEvent events;

        bool await_ready() const noexcept { return false; }

        void await_suspend(std::coroutine_handle<> h) {
            self->registerWatch(events, [s = self, h](IoEvent) {
                s->removeCurrentWatch();
                h.resume();
            });
        }

        void await_resume() const noexcept {}
    };

    EventAwaiter awaitEvent(IoEvent events) { return {this, events}; }

    void registerWatch(IoEvent events, std::function<void(IoEvent)> cb) {
        removeCurrentWatch();
        watch_ = io_->addWatch(fd_, events, std::move(cb));
        watch_active_ = true;
    }

    void removeCurrentWatch() noexcept {
        if (watch_active_) {
            io_->removeWatch(watch_);
            watch_active_ = false;
        }
    }

    Io* io_;
    int fd_ = -1;
    typename Io::WatchHandle watch_{};
    bool watch_active_ = false;

    RespWriter writer_;
    std::string readBuf_;
};

} // namespace jcailloux::tiercache::io

#endif // JCX_TIERCACHE_IO_REDIS_CONNECTION_H
