#ifndef JCX_TIERCACHE_IO_TASK_H
#define JCX_TIERCACHE_IO_TASK_H

#include <coroutine>
#include <exception>
#include <utility>
#include <variant>

namespace jcailloux::tiercache::io {

template<typename T = void>
class Task;

namespace detail {

/// Shared by every Task promise: lazy start, and a final suspend that hands
/// control back to the awaiting coroutine (symmetric transfer, no stack growth
/// across long await chains).
struct PromiseBase {
    std::coroutine_handle<> continuation_ = std::noop_coroutine();

    struct FinalAwaiter {
        [[nodiscard]] bool await_ready() const noexcept { return false; }

        template<typename Promise>
        [[nodiscard]] std::coroutine_handle<>
        await_suspend(std::coroutine_handle<Promise> h) noexcept {
            return h.promise().continuation_;
        }

        void await_resume() noexcept {}
    };

    [[nodiscard]] std::suspend_always initial_suspend() noexcept { return {}; }
    [[nodiscard]] FinalAwaiter final_suspend() noexcept { return {}; }
};

template<typename T>
struct TaskPromise : PromiseBase {
    std::variant<std::monostate, T, std::exception_ptr> outcome_;

    Task<T> get_return_object() noexcept;

    void return_value(T value) {
        outcome_.template emplace<1>(std::move(value));
    }

    void unhandled_exception() noexcept {
        outcome_.template emplace<2>(std::current_exception());
    }

    T take() {
        if (auto* ex = std::get_if<2>(&outcome_))
            std::rethrow_exception(*ex);
        return std::move(std::get<1>(outcome_));
    }
};

template<>
struct TaskPromise<void> : PromiseBase {
    std::exception_ptr exception_;

    Task<void> get_return_object() noexcept;

    void return_void() noexcept {}

    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
    }

    void take() {
        if (exception_) std::rethrow_exception(exception_);
    }
};

} // namespace detail

// Task<T> — lazy, awaitable, move-only coroutine
//
// The body starts when the Task is co_awaited and resumes the awaiter when it
// finishes. An exception escaping the body is rethrown to the awaiter.
// Every store round trip in tiercache is a Task; tests drive them with
// test::sync() or test::runTask().

template<typename T>
class Task {
public:
    using promise_type = detail::TaskPromise<T>;

    Task() noexcept = default;
    explicit Task(std::coroutine_handle<promise_type> h) noexcept : handle_(h) {}
    ~Task() { release(); }

    Task(Task&& o) noexcept : handle_(std::exchange(o.handle_, nullptr)) {}
    Task& operator=(Task&& o) noexcept {
        if (this != &o) {
            release();
            handle_ = std::exchange(o.handle_, nullptr);
        }
        return *this;
    }
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
        handle_.promise().continuation_ = awaiting;
        return handle_;
    }

    T await_resume() { return handle_.promise().take(); }

private:
    void release() noexcept {
        if (handle_) std::exchange(handle_, nullptr).destroy();
    }

    std::coroutine_handle<promise_type> handle_ = nullptr;
};

namespace detail {

template<typename T>
Task<T> TaskPromise<T>::get_return_object() noexcept {
    return Task<T>{std::coroutine_handle<TaskPromise>::from_promise(*this)};
}

inline Task<void> TaskPromise<void>::get_return_object() noexcept {
    return Task<void>{std::coroutine_handle<TaskPromise>::from_promise(*this)};
}

} // namespace detail

} // namespace jcailloux::tiercache::io

#endif // JCX_TIERCACHE_IO_TASK_H
