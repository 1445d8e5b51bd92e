#ifndef JCX_TIERCACHE_IO_CONTEXT_H
#define JCX_TIERCACHE_IO_CONTEXT_H

#include <concepts>
#include <coroutine>
#include <cstdint>
#include <functional>

namespace jcailloux::tiercache::io {

enum class IoEvent : uint8_t {
    None    = 0,
    Read    = 1 << 0,
    Write   = 1 << 1,
    Error   = 1 << 2,
};

[[nodiscard]] constexpr IoEvent operator|(IoEvent a, IoEvent b) noexcept {
    return static_cast<IoEvent>(
        static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

[[nodiscard]] constexpr IoEvent operator&(IoEvent a, IoEvent b) noexcept {
    return static_cast<IoEvent>(
        static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

constexpr IoEvent& operator|=(IoEvent& a, IoEvent b) noexcept {
    return a = a | b;
}

[[nodiscard]] constexpr bool hasEvent(IoEvent set, IoEvent flag) noexcept {
    return (set & flag) != IoEvent::None;
}

// IoContext — what the store connection needs from an event loop:
// readiness watches on a socket and deferred callbacks on the loop thread.
// EpollIoContext is the bundled implementation; an application already
// running another loop adapts it to this concept.

template<typename T>
concept IoContext = requires(
    T& ctx,
    int fd,
    IoEvent events,
    std::function<void(IoEvent)> io_cb,
    std::function<void()> cb,
    typename T::WatchHandle handle
) {
    { ctx.addWatch(fd, events, std::move(io_cb)) } -> std::same_as<typename T::WatchHandle>;
    { ctx.removeWatch(handle) } -> std::same_as<void>;
    { ctx.post(std::move(cb)) } -> std::same_as<void>;
};

// resumeOn(io) — continue the awaiting coroutine on the loop thread of `io`.
//
// The store connection and its lock are loop-thread state; every entry point
// that touches them awaits this first. Contexts that can tell whether the
// caller already runs the loop (runningInThisThread()) skip the hop.

template<IoContext Io>
struct ResumeOn {
    Io* io;

    [[nodiscard]] bool await_ready() const noexcept {
        if constexpr (requires(const Io& c) { { c.runningInThisThread() } -> std::convertible_to<bool>; })
            return io->runningInThisThread();
        else
            return false;
    }

    void await_suspend(std::coroutine_handle<> h) {
        io->post([h] { h.resume(); });
    }

    void await_resume() const noexcept {}
};

template<IoContext Io>
[[nodiscard]] ResumeOn<Io> resumeOn(Io& io) noexcept { return {&io}; }

} // namespace jcailloux::tiercache::io

#endif // JCX_TIERCACHE_IO_CONTEXT_H
