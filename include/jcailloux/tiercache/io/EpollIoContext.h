#ifndef JCX_TIERCACHE_IO_EPOLL_IO_CONTEXT_H
#define JCX_TIERCACHE_IO_EPOLL_IO_CONTEXT_H

#include <jcailloux/tiercache/io/IoContext.h>

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>

#include <fcntl.h>
#include <sys/epoll.h>
#include <unistd.h>

namespace jcailloux::tiercache::io {

// EpollIoContext — epoll-based event loop driving the store connection.
//
// Thread-safety model:
// - post() and stop() are safe to call from any thread
// - addWatch()/removeWatch() and the run*() family belong to the loop thread
// - a self-pipe wakes epoll_wait() when another thread posts
// - the thread that last ran an iteration is the loop thread

class EpollIoContext {
public:
    using WatchHandle = int;

    EpollIoContext() {
        epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd_ < 0)
            throw std::runtime_error("epoll_create1 failed");

        int fds[2];
        if (pipe2(fds, O_NONBLOCK | O_CLOEXEC) < 0) {
            ::close(epoll_fd_);
            throw std::runtime_error("pipe2 failed");
        }
        pipe_read_ = fds[0];
        pipe_write_ = fds[1];

        epoll_event ev{};
        ev.events = EPOLLIN;
        ev.data.fd = pipe_read_;
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, pipe_read_, &ev) < 0) {
            ::close(pipe_read_);
            ::close(pipe_write_);
            ::close(epoll_fd_);
            throw std::runtime_error("epoll_ctl pipe failed");
        }
    }

    ~EpollIoContext() {
        if (pipe_read_ >= 0) ::close(pipe_read_);
        if (pipe_write_ >= 0) ::close(pipe_write_);
        if (epoll_fd_ >= 0) ::close(epoll_fd_);
    }

    EpollIoContext(const EpollIoContext&) = delete;
    EpollIoContext& operator=(const EpollIoContext&) = delete;

    WatchHandle addWatch(int fd, IoEvent events, std::function<void(IoEvent)> cb) {
        epoll_event ev{};
        ev.events = toEpoll(events);
        ev.data.fd = fd;

        watches_[fd] = std::move(cb);

        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) < 0) {
                watches_.erase(fd);
                throw std::runtime_error("epoll_ctl ADD/MOD failed");
            }
        }
        return fd;
    }

    void removeWatch(WatchHandle handle) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, handle, nullptr);
        watches_.erase(handle);
    }

    /// Thread-safe: run cb on the loop thread during the next iteration.
    void post(std::function<void()> cb) {
        {
            std::lock_guard lock(post_mutex_);
            post_queue_.push_back(std::move(cb));
        }
        wakeup();
    }

    /// Run the event loop until stop() is called.
    void run() {
        stopped_.store(false, std::memory_order_relaxed);
        while (!stopped_.load(std::memory_order_relaxed)) {
            runOnce(computeTimeout());
        }
    }

    /// Run until a predicate evaluated on the loop thread is satisfied.
    template<typename Pred>
    void runUntil(Pred&& pred) {
        while (!pred()) {
            runOnce(computeTimeout());
        }
    }

    /// Thread-safe.
    void stop() {
        stopped_.store(true, std::memory_order_relaxed);
        wakeup();
    }

    /// True on the thread currently driving the loop.
    [[nodiscard]] bool runningInThisThread() const noexcept {
        return loop_thread_.load(std::memory_order_acquire) == std::this_thread::get_id();
    }

    void runOnce(int timeout_ms = 0) {
        loop_thread_.store(std::this_thread::get_id(), std::memory_order_release);
        drainPosted();

        static constexpr int MAX_EVENTS = 64;
        epoll_event events[MAX_EVENTS];
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, timeout_ms);

        for (int i = 0; i < n; ++i) {
            int fd = events[i].data.fd;

            if (fd == pipe_read_) {
                char buf[64];
                while (::read(pipe_read_, buf, sizeof(buf)) > 0) {}
                continue;
            }

            auto it = watches_.find(fd);
            if (it != watches_.end()) {
                // The callback may remove its own watch; keep it alive for the call.
                auto cb = it->second;
                cb(fromEpoll(events[i].events));
            }
        }

        drainPosted();
    }

private:
    static uint32_t toEpoll(IoEvent events) {
        uint32_t e = 0;
        if (hasEvent(events, IoEvent::Read))  e |= EPOLLIN;
        if (hasEvent(events, IoEvent::Write)) e |= EPOLLOUT;
        if (hasEvent(events, IoEvent::Error)) e |= EPOLLERR;
        return e;
    }

    static IoEvent fromEpoll(uint32_t events) {
        IoEvent e = IoEvent::None;
        if (events & EPOLLIN)  e |= IoEvent::Read;
        if (events & EPOLLOUT) e |= IoEvent::Write;
        if (events & (EPOLLERR | EPOLLHUP)) e |= IoEvent::Error;
        return e;
    }

    void wakeup() {
        char byte = 1;
        [[maybe_unused]] auto _ = ::write(pipe_write_, &byte, 1);
    }

    void drainPosted() {
        std::deque<std::function<void()>> local;
        {
            std::lock_guard lock(post_mutex_);
            local.swap(post_queue_);
        }
        for (auto& cb : local) {
            cb();
        }
    }

    int computeTimeout() const {
        std::lock_guard lock(post_mutex_);
        return post_queue_.empty() ? 100 : 0;
    }

    int epoll_fd_ = -1;
    int pipe_read_ = -1;
    int pipe_write_ = -1;

    std::unordered_map<int, std::function<void(IoEvent)>> watches_;

    mutable std::mutex post_mutex_;
    std::deque<std::function<void()>> post_queue_;
    std::atomic<bool> stopped_{false};
    std::atomic<std::thread::id> loop_thread_{};
};

static_assert(IoContext<EpollIoContext>);

} // namespace jcailloux::tiercache::io

#endif // JCX_TIERCACHE_IO_EPOLL_IO_CONTEXT_H
