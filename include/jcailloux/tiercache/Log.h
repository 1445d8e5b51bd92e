#ifndef JCX_TIERCACHE_LOG_H
#define JCX_TIERCACHE_LOG_H

#include <atomic>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace jcailloux::tiercache::log {

// =============================================================================
// Log — callback-routed logging for tiercache
//
// tiercache never writes to stdout/stderr on its own. The application
// installs a callback at startup and routes messages to its own logger;
// without a callback every log statement is a no-op.
//
// Usage:
//   TIERCACHE_LOG_WARN  << "RemoteCache SETEX error: " << e.what();
//   TIERCACHE_LOG_DEBUG << "CacheService: promoted " << key << " to L1";
//
// Configuration (in application startup):
//   jcailloux::tiercache::log::setCallback([](Level level, const char* msg, size_t len) {
//       spdlog::log(toSpdlog(level), std::string_view(msg, len));
//   });
// =============================================================================

enum class Level : uint8_t { Debug, Info, Warn, Error };

/// Log callback type. The application provides this to route logs.
using Callback = void(*)(Level level, const char* msg, size_t len);

[[nodiscard]] constexpr std::string_view levelName(Level level) noexcept {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
    }
    return "unknown";
}

namespace detail {
    inline std::atomic<Callback>& ref() noexcept {
        static std::atomic<Callback> cb{nullptr};
        return cb;
    }

    inline std::atomic<Level>& threshold() noexcept {
        static std::atomic<Level> level{Level::Debug};
        return level;
    }
}  // namespace detail

/// Set the log callback. Pass nullptr to disable logging.
inline void setCallback(Callback cb) noexcept {
    detail::ref().store(cb, std::memory_order_release);
}

/// Get the current log callback.
inline Callback getCallback() noexcept {
    return detail::ref().load(std::memory_order_acquire);
}

/// Messages below this level are dropped before formatting reaches the callback.
inline void setMinLevel(Level level) noexcept {
    detail::threshold().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline bool enabled(Level level) noexcept {
    return getCallback() != nullptr
        && level >= detail::threshold().load(std::memory_order_relaxed);
}

// =============================================================================
// LogStream — accumulates a log message and dispatches on destruction
// =============================================================================

class LogStream {
public:
    explicit LogStream(Level level) noexcept
        : level_(level), active_(enabled(level)) {}

    ~LogStream() {
        if (!active_) return;
        if (auto cb = getCallback()) {
            cb(level_, buf_.data(), buf_.size());
        }
    }

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    LogStream& operator<<(const char* s) {
        if (active_ && s) buf_ += s;
        return *this;
    }

    LogStream& operator<<(std::string_view s) {
        if (active_) buf_.append(s.data(), s.size());
        return *this;
    }

    LogStream& operator<<(const std::string& s) {
        if (active_) buf_ += s;
        return *this;
    }

    LogStream& operator<<(char c) {
        if (active_) buf_ += c;
        return *this;
    }

    template<typename T> requires std::integral<T> && (!std::same_as<T, char>)
    LogStream& operator<<(T val) {
        if (active_) buf_ += std::to_string(val);
        return *this;
    }

    LogStream& operator<<(double val) {
        if (active_) buf_ += std::to_string(val);
        return *this;
    }

private:
    Level level_;
    bool active_;
    std::string buf_;
};

}  // namespace jcailloux::tiercache::log

// =============================================================================
// Macros
// =============================================================================

#define TIERCACHE_LOG_ERROR ::jcailloux::tiercache::log::LogStream(::jcailloux::tiercache::log::Level::Error)
#define TIERCACHE_LOG_WARN  ::jcailloux::tiercache::log::LogStream(::jcailloux::tiercache::log::Level::Warn)
#define TIERCACHE_LOG_INFO  ::jcailloux::tiercache::log::LogStream(::jcailloux::tiercache::log::Level::Info)
#define TIERCACHE_LOG_DEBUG ::jcailloux::tiercache::log::LogStream(::jcailloux::tiercache::log::Level::Debug)

#endif  // JCX_TIERCACHE_LOG_H
